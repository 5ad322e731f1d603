#pragma once

// ---------------------------------------------------------------------------
// curl_handler.hpp
//
// GET/HEAD 조회는 허용하고 데이터를 보내는 요청은 묻는다.
//
// Ask 조건:
// - 데이터/업로드 플래그 (-d, --data*, -F, --form*, -T, --upload-file, --json)
// - 설정 파일/메일/FTP 디렉토리 생성 플래그 (-K, --config, --mail-*, ...)
// - -X / --request / -XMETHOD / --request=METHOD 의 메서드가
//   GET HEAD OPTIONS TRACE 가 아닐 때
// - -Q / --quote 의 FTP 명령이 읽기 전용 목록에 없을 때
//
// [알려진 한계]
// - -o / --output 으로 응답을 파일에 쓰는 것은 Ask 대상이 아니다.
//   다운로드는 읽기 전용 조회로 본다.
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class CurlHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"curl"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};
