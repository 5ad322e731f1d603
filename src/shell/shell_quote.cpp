#include "shell/shell_quote.hpp"

#include <cctype>

namespace {

[[nodiscard]] bool is_safe_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
        return true;
    }
    switch (c) {
        case '-': case '_': case '.': case '/': case '=':
        case '@': case ':': case ',': case '+': case '%':
            return true;
        default:
            return false;
    }
}

}  // namespace

std::string bash_quote(std::string_view token) {
    if (token.empty()) {
        return "''";
    }
    bool safe = true;
    for (const char c : token) {
        if (!is_safe_char(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return std::string{token};
    }

    std::string out;
    out.reserve(token.size() + 2);
    out += '\'';
    for (const char c : token) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string bash_join(const std::vector<std::string>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += bash_quote(tokens[i]);
    }
    return out;
}
