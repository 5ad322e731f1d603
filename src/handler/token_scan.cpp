#include "handler/token_scan.hpp"

#include <algorithm>
#include <cctype>

bool has_token(const std::vector<std::string>& tokens, std::string_view token, std::size_t from) {
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (tokens[i] == token) {
            return true;
        }
    }
    return false;
}

bool has_any(const std::vector<std::string>& tokens, const TokenSet& set, std::size_t from) {
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (set.contains(tokens[i])) {
            return true;
        }
    }
    return false;
}

std::optional<std::size_t> first_positional(const std::vector<std::string>& tokens,
                                            std::size_t                     from) {
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (!tokens[i].starts_with('-')) {
            return i;
        }
    }
    return std::nullopt;
}

bool is_assigned_flag(std::string_view token, const TokenSet& set) {
    const auto eq = token.find('=');
    if (eq == std::string_view::npos || !token.starts_with('-')) {
        return false;
    }
    return set.contains(token.substr(0, eq));
}

std::string to_upper_ascii(std::string_view text) {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}
