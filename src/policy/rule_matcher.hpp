#pragma once

// ---------------------------------------------------------------------------
// rule_matcher.hpp
//
// RuleConfig 의 운영자 규칙을 명령 토큰 / 리다이렉트 대상에 매칭한다.
//
// [우선순위]
// - 매칭된 규칙이 여럿이면 deny > ask > allow. 같은 수준 안에서는
//   설정 순서상 첫 번째 규칙이 사유를 제공한다.
//
// [명령 패턴]
// - "re:<regex>"  : 토큰을 공백 하나로 이은 문자열의 시작에서 매칭
//                   (std::regex_search + match_continuous)
// - 스크립트 경로 : '/' 포함 또는 .sh .bash .py .rb .pl 로 끝남.
//                   패턴은 project_root, 명령의 첫 토큰은 cwd 기준으로
//                   해석한 뒤 fnmatch(FNM_PATHNAME) 로 비교한다.
//                   project_root 가 없으면 상대 패턴은 매칭하지 않는다.
// - 그 외         : 토큰 접두 매칭. 패턴 토큰마다 fnmatch glob.
//
// [리다이렉트 패턴]
// - "re:<regex>" 는 정규화된 절대 경로 전체에 regex_search.
// - 그 외는 glob. '~' 는 $HOME 으로, 상대 패턴은 project_root(없으면 cwd)
//   기준으로 펼친 뒤 대상의 정규화된 절대 경로와 fnmatch 로 비교한다.
//   FNM_PATHNAME 을 쓰지 않으므로 '*' 는 디렉토리 경계를 넘는다
//   ("/tmp/*" 는 /tmp 아래 전체).
//
// [알려진 한계]
// - 경로 정규화는 lexically_normal 기반이다. 심볼릭 링크를 따라가지
//   않으므로 링크를 통한 우회 쓰기는 규칙으로 막을 수 없다.
// ---------------------------------------------------------------------------

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "policy/rule.hpp"

// 명령 토큰 목록에 매칭되는 규칙 (deny > ask > allow)
[[nodiscard]] std::optional<RuleMatch> match_command(const std::vector<std::string>& tokens,
                                                     const RuleConfig&               config,
                                                     const std::filesystem::path&    cwd);

// 리다이렉트 대상 경로에 매칭되는 redirect_rules 규칙 (deny > ask > allow)
[[nodiscard]] std::optional<RuleMatch> match_redirect(std::string_view             target,
                                                      const RuleConfig&            config,
                                                      const std::filesystem::path& cwd);

// 단일 명령 패턴 검사
[[nodiscard]] bool command_pattern_matches(std::string_view                pattern,
                                           const std::vector<std::string>& tokens,
                                           const std::filesystem::path&    project_root,
                                           const std::filesystem::path&    cwd);

// 사용자 경로 해석: '~' 펼침 -> base 기준 절대 경로 -> lexically_normal
[[nodiscard]] std::filesystem::path resolve_user_path(std::string_view             raw,
                                                      const std::filesystem::path& base);
