#pragma once

// ---------------------------------------------------------------------------
// token_scan.hpp
//
// 핸들러들이 공유하는 토큰 탐색 헬퍼.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

using TokenSet = std::unordered_set<std::string_view>;

// tokens[from..] 에 token 과 정확히 같은 원소가 있는지
[[nodiscard]] bool has_token(const std::vector<std::string>& tokens, std::string_view token,
                             std::size_t from = 0);

// tokens[from..] 중 set 에 속한 원소가 있는지
[[nodiscard]] bool has_any(const std::vector<std::string>& tokens, const TokenSet& set,
                           std::size_t from = 0);

// tokens[from..] 에서 '-' 로 시작하지 않는 첫 토큰의 인덱스
[[nodiscard]] std::optional<std::size_t> first_positional(const std::vector<std::string>& tokens,
                                                          std::size_t                     from);

// "--flag=value" 이면서 flag 가 set 에 있는지
[[nodiscard]] bool is_assigned_flag(std::string_view token, const TokenSet& set);

// 대문자 변환 (ASCII)
[[nodiscard]] std::string to_upper_ascii(std::string_view text);
