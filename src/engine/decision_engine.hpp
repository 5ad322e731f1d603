#pragma once

// ---------------------------------------------------------------------------
// decision_engine.hpp
//
// 셸 명령 문자열 하나에 대해 Allow / Ask / Deny 를 결정하는 재귀 판정기.
//
// [처리 흐름]
// 1. 공백뿐인 입력 -> Ask("empty command")
// 2. ShellParser::parse 실패 -> Ask("parse error: ...")
// 3. 최상위 노드마다 재귀 판정 후 조합 (deny > ask > allow)
//
// [노드별 규칙 요약]
// - Command   : 단어 안의 명령/프로세스 치환을 먼저 판정한다. Allow 가 아닌
//               치환은 명령 전체를 그 판정으로 끝낸다. 핸들러가 있는 명령의
//               인자가 순수 치환이면 인젝션 위험으로 Ask. 그 다음 리다이렉트,
//               마지막으로 단어 목록 분류 (운영자 규칙 -> 래퍼 -> 무조건 안전
//               -> help/version -> 핸들러 -> 위험 패턴 -> Ask).
// - 복합 명령 : 본문, 반복 단어/산술식 안의 치환, 자신의 리다이렉트를 조합.
// - List      : 첫 부분이 `cd <리터럴>` 이면 나머지를 그 디렉토리 기준으로 본다.
//
// [설계 원칙]
// - 분석 실패는 모두 Ask 로 수렴한다. 기본 허용은 없다.
// - 내장 로직은 Deny 를 만들지 않는다. Deny 는 운영자 규칙에서만 나온다.
// - 치환/위임/복합 중첩 깊이가 kMaxNestingDepth 를 넘으면 Ask.
// - 핸들러 예외는 std::exception 으로 잡아 Ask("<cmd>: handler error").
//
// [알려진 한계]
// - 변수 값은 추적하지 않는다. `$CMD args` 는 리터럴 "$CMD" 명령으로
//   분류되어 Ask 가 된다.
// ---------------------------------------------------------------------------

#include <filesystem>
#include <memory>
#include <string_view>

#include "engine/decision.hpp"
#include "handler/handler_registry.hpp"
#include "policy/rule.hpp"

class DecisionEngine {
public:
    // config 가 nullptr 이면 규칙 없는 빈 설정으로 동작한다.
    explicit DecisionEngine(std::shared_ptr<const RuleConfig> config,
                            const HandlerRegistry& registry = HandlerRegistry::builtin());

    ~DecisionEngine() = default;

    DecisionEngine(const DecisionEngine&)            = default;
    DecisionEngine& operator=(const DecisionEngine&) = default;
    DecisionEngine(DecisionEngine&&)                 = default;
    DecisionEngine& operator=(DecisionEngine&&)      = default;

    // analyze
    //   command 를 파싱하고 판정한다. 예외를 던지지 않는 것이 목표이며,
    //   내부 실패는 모두 Ask 로 보고된다.
    [[nodiscard]] Decision analyze(std::string_view             command,
                                   const std::filesystem::path& cwd) const;

    [[nodiscard]] const RuleConfig& config() const noexcept { return *config_; }

private:
    std::shared_ptr<const RuleConfig> config_;
    const HandlerRegistry*            registry_;
};

// 내장 레지스트리를 쓰는 단발성 분석
[[nodiscard]] Decision analyze(std::string_view             command,
                               const RuleConfig&            config,
                               const std::filesystem::path& cwd);
