#include "shell/shell_ast.hpp"

#include <array>

const char* node_kind_name(const Node& node) {
    // Node::value 의 대안 순서와 일치해야 한다
    static constexpr std::array<const char*, 19> kNames = {
        "command",  "pipeline", "list",       "if",       "while",    "for",     "for-arith",
        "select",   "case",     "function",   "subshell", "brace-group", "time", "negation",
        "coproc",   "cond-expr", "arith-cmd", "comment",  "empty",
    };
    static_assert(kNames.size() == std::variant_size_v<decltype(Node::value)>);

    if (const auto* loop = std::get_if<WhileLoop>(&node.value); loop != nullptr && loop->until) {
        return "until";
    }
    return kNames[node.value.index()];
}
