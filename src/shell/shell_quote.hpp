#pragma once

// ---------------------------------------------------------------------------
// shell_quote.hpp
//
// 토큰을 bash 가 다시 같은 토큰으로 읽을 수 있는 문자열로 되돌린다.
// env / xargs 핸들러가 내부 명령을 재구성해 엔진에 위임할 때 쓴다.
//
// - 영숫자와 -_./=@:,+% 만으로 된 토큰은 그대로 둔다.
// - 빈 토큰은 ''.
// - 그 외는 작은따옴표로 감싸고 내부 ' 는 '"'"' 로 바꾼다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

[[nodiscard]] std::string bash_quote(std::string_view token);

// 각 토큰을 bash_quote 한 뒤 공백 하나로 잇는다.
[[nodiscard]] std::string bash_join(const std::vector<std::string>& tokens);
