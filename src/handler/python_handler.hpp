#pragma once

// ---------------------------------------------------------------------------
// python_handler.hpp
//
// python / python3 / python3.N 실행. 스크립트 파일은 analyze_python_file
// 로 정적 분석해 안전하다고 증명되면 Allow 한다.
//
// [판정 흐름]
// 1. 인자 없음                 -> Ask "<python> interactive"
// 2. -V --version -h --help -VV -> Allow
// 3. -c                         -> Ask (인라인 코드는 분석하지 않는다)
// 4. -m calendar                -> Allow, 그 외 -m 은 Ask
// 5. -i                         -> Ask (스크립트 후 대화형)
// 6. 스크립트 경로를 cwd 기준으로 해석해 분석.
//    통과 -> Allow "<python> <script> (analyzed)"
//    실패 -> Ask "<python> <script>: <사유>"
// 7. 스크립트 없음              -> Ask "python (REPL)"
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class PythonHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override;
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
    [[nodiscard]] std::string describe(const std::vector<std::string>& tokens) const override;
};
