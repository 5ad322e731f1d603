#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 운영자 규칙 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config.yaml / .cmdgate.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다.
// - 이 구조체 자체는 판정 로직을 포함하지 않는다. 매칭은 rule_matcher,
//   판정 조합은 DecisionEngine 소관이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RuleAction
//   규칙 한 줄이 결정하는 판정. 여러 규칙이 동시에 매칭되면
//   kDeny > kAsk > kAllow 순으로 우선한다.
// ---------------------------------------------------------------------------
enum class RuleAction : std::uint8_t {
    kAllow = 0,
    kAsk   = 1,
    kDeny  = 2,
};

// ---------------------------------------------------------------------------
// Rule
//   pattern 형식 (명령 규칙):
//     "re:<regex>"   공백으로 이은 토큰 문자열의 시작에서 매칭
//     "./deploy.sh"  스크립트 경로 ('/' 포함 또는 스크립트 확장자)
//     "git stash"    토큰 접두 매칭 (토큰마다 fnmatch glob)
//   pattern 형식 (리다이렉트 규칙): "re:<regex>" 또는 경로 glob
// ---------------------------------------------------------------------------
struct Rule {
    RuleAction  action{RuleAction::kAsk};
    std::string pattern{};
    std::string message{};  // 비어 있으면 pattern 을 사유로 쓴다
    std::string source{};   // 규칙을 정의한 파일 (진단용)
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error" (빈 문자열 = 미설정)
//   log_path:  감사 로그 파일 경로 (빈 문자열 = 비활성)
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{};
    std::string log_path{};
};

// ---------------------------------------------------------------------------
// RuleConfig
//   전체 설정의 루트 구조체.
//   PolicyLoader::load / load_scopes 가 반환하는 최종 결과물.
//   DecisionEngine 이 생성 시 주입받아 읽기 전용으로 참조한다.
//
//   project_root: 프로젝트 범위 설정 파일이 있는 디렉토리.
//                 비어 있으면 상대 경로 규칙은 cwd 기준으로 해석한다.
// ---------------------------------------------------------------------------
struct RuleConfig {
    GlobalConfig                       global{};
    std::vector<Rule>                  rules{};
    std::vector<Rule>                  redirect_rules{};
    std::map<std::string, std::string> aliases{};
    std::filesystem::path              project_root{};
    std::vector<std::filesystem::path> sources{};  // 병합된 파일 (로드 순서)
};

// ---------------------------------------------------------------------------
// RuleMatch
//   rule_matcher 의 매칭 결과. 사유 문자열은 display() 로 얻는다.
// ---------------------------------------------------------------------------
struct RuleMatch {
    RuleAction  action{RuleAction::kAsk};
    std::string pattern{};
    std::string message{};

    [[nodiscard]] const std::string& display() const noexcept {
        return message.empty() ? pattern : message;
    }
};
