#pragma once

// ---------------------------------------------------------------------------
// allowlists.hpp
//
// 핸들러 없이 판정하는 명령 목록.
//
// - 무조건 안전 목록: 인자와 관계없이 읽기만 하는 명령 (cat, ls, grep ...).
//   출력 리다이렉트는 별도로 검사되므로 여기서는 고려하지 않는다.
// - 래퍼 목록: 다른 명령을 실행하는 투명 래퍼 (time, timeout, nice ...).
//   엔진은 래퍼를 벗기고 내부 명령을 분류한다.
// - 위험 패턴: 핸들러가 없는 명령의 공백 결합 문자열에서 찾는 정규식.
//   판정을 바꾸지 않고 Ask 사유에 "(unsafe pattern)" 을 붙인다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

[[nodiscard]] bool is_simple_safe(std::string_view command) noexcept;

[[nodiscard]] bool is_wrapper(std::string_view command) noexcept;

// "10", "2.5", "30s" 처럼 래퍼가 받는 수치 인자인지
[[nodiscard]] bool is_numeric_argument(std::string_view token) noexcept;

// 정확히 두 토큰이고 두 번째가 help/version/--version/--help/-h 이거나,
// 토큰 4개 이하이면서 마지막이 --help/-h
[[nodiscard]] bool is_version_or_help(const std::vector<std::string>& tokens);

[[nodiscard]] bool matches_unsafe_pattern(const std::string& command_text);
