// ---------------------------------------------------------------------------
// rule_matcher.cpp
//
// 운영자 규칙 매칭 구현.
//
// [오탐/미탐 트레이드오프]
// - 잘못된 re: 패턴은 로더가 이미 거부한다. 코드에서 직접 만든 RuleConfig
//   에 잘못된 패턴이 있으면 해당 규칙만 건너뛰고 경고한다 (미탐 방향).
// - 토큰 접두 매칭은 따옴표 제거 후의 토큰 값을 비교한다. 따라서
//   `git "push"` 와 `git push` 는 같은 규칙에 걸린다.
// ---------------------------------------------------------------------------

#include "policy/rule_matcher.hpp"

#include <fnmatch.h>

#include <array>
#include <cstdlib>
#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {

constexpr std::array<std::string_view, 5> kScriptExtensions = {".sh", ".bash", ".py", ".rb", ".pl"};

// ---------------------------------------------------------------------------
// 내부 헬퍼: "re:" 패턴 매칭
//   anchored = true 이면 문자열 시작에서만 매칭 (match_continuous)
// ---------------------------------------------------------------------------
[[nodiscard]] bool regex_matches(std::string_view pattern, const std::string& subject,
                                 bool anchored) {
    try {
        const std::regex re(std::string{pattern.substr(3)}, std::regex_constants::ECMAScript);
        const auto flags = anchored ? std::regex_constants::match_continuous
                                    : std::regex_constants::match_default;
        return std::regex_search(subject, re, flags);
    } catch (const std::regex_error& e) {
        spdlog::warn("rule_matcher: skipping invalid regex '{}': {}", pattern, e.what());
        return false;
    }
}

[[nodiscard]] bool glob_matches(const std::string& pattern, const std::string& subject,
                                int flags) {
    return ::fnmatch(pattern.c_str(), subject.c_str(), flags) == 0;
}

[[nodiscard]] bool is_script_pattern(std::string_view pattern) {
    if (pattern.find('/') != std::string_view::npos) {
        return true;
    }
    for (const auto ext : kScriptExtensions) {
        if (pattern.ends_with(ext)) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> out;
    std::istringstream       in{std::string{text}};
    std::string              token;
    while (in >> token) {
        out.push_back(token);
    }
    return out;
}

[[nodiscard]] std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string joined;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            joined += ' ';
        }
        joined += tokens[i];
    }
    return joined;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스크립트 경로 패턴
// ---------------------------------------------------------------------------
[[nodiscard]] bool script_matches(std::string_view                pattern,
                                  const std::vector<std::string>& tokens,
                                  const std::filesystem::path&    project_root,
                                  const std::filesystem::path&    cwd) {
    if (tokens.empty()) {
        return false;
    }
    const bool pattern_absolute = pattern.starts_with('/') || pattern.starts_with('~');
    if (!pattern_absolute && project_root.empty()) {
        return false;
    }
    const auto pattern_path = resolve_user_path(pattern, project_root);
    const auto command_path = resolve_user_path(tokens.front(), cwd);
    return glob_matches(pattern_path.string(), command_path.string(), FNM_PATHNAME);
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 우선순위 선택
//   이미 고른 규칙보다 강한 수준의 규칙만 검사한다. 같은 수준에서는
//   먼저 나온 규칙이 이긴다.
// ---------------------------------------------------------------------------
template <typename Pred>
[[nodiscard]] std::optional<RuleMatch> pick_strongest(const std::vector<Rule>& rules,
                                                      Pred&&                   matches) {
    const Rule* best = nullptr;
    for (const auto& rule : rules) {
        if (best != nullptr && rule.action <= best->action) {
            continue;
        }
        if (matches(rule.pattern)) {
            best = &rule;
            if (best->action == RuleAction::kDeny) {
                break;
            }
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return RuleMatch{best->action, best->pattern, best->message};
}

}  // namespace

// ---------------------------------------------------------------------------
// resolve_user_path
// ---------------------------------------------------------------------------
std::filesystem::path resolve_user_path(std::string_view raw, const std::filesystem::path& base) {
    std::string text{raw};
    if (text == "~" || text.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            text = std::string{home} + text.substr(1);
        }
    }
    std::filesystem::path path{text};
    if (path.is_relative()) {
        path = base / path;
    }
    return path.lexically_normal();
}

// ---------------------------------------------------------------------------
// command_pattern_matches
// ---------------------------------------------------------------------------
bool command_pattern_matches(std::string_view                pattern,
                             const std::vector<std::string>& tokens,
                             const std::filesystem::path&    project_root,
                             const std::filesystem::path&    cwd) {
    if (tokens.empty() || pattern.empty()) {
        return false;
    }

    // 1. 정규식
    if (pattern.starts_with("re:")) {
        return regex_matches(pattern, join_tokens(tokens), /*anchored=*/true);
    }

    // 2. 스크립트 경로
    if (is_script_pattern(pattern)) {
        return script_matches(pattern, tokens, project_root, cwd);
    }

    // 3. 토큰 접두 (토큰마다 glob)
    const auto pattern_tokens = split_whitespace(pattern);
    if (pattern_tokens.empty() || pattern_tokens.size() > tokens.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern_tokens.size(); ++i) {
        if (!glob_matches(pattern_tokens[i], tokens[i], 0)) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// match_command
// ---------------------------------------------------------------------------
std::optional<RuleMatch> match_command(const std::vector<std::string>& tokens,
                                       const RuleConfig&               config,
                                       const std::filesystem::path&    cwd) {
    if (tokens.empty() || config.rules.empty()) {
        return std::nullopt;
    }
    auto match = pick_strongest(config.rules, [&](const std::string& pattern) {
        return command_pattern_matches(pattern, tokens, config.project_root, cwd);
    });
    if (match) {
        spdlog::debug("rule_matcher: command '{}' matched rule '{}'", tokens.front(), match->pattern);
    }
    return match;
}

// ---------------------------------------------------------------------------
// match_redirect
// ---------------------------------------------------------------------------
std::optional<RuleMatch> match_redirect(std::string_view             target,
                                        const RuleConfig&            config,
                                        const std::filesystem::path& cwd) {
    if (target.empty() || config.redirect_rules.empty()) {
        return std::nullopt;
    }
    const auto target_path = resolve_user_path(target, cwd).string();
    const auto& pattern_base = config.project_root.empty() ? cwd : config.project_root;

    auto match = pick_strongest(config.redirect_rules, [&](const std::string& pattern) {
        if (pattern.starts_with("re:")) {
            return regex_matches(pattern, target_path, /*anchored=*/false);
        }
        return glob_matches(resolve_user_path(pattern, pattern_base).string(), target_path, 0);
    });
    if (match) {
        spdlog::debug("rule_matcher: redirect '{}' matched rule '{}'", target_path, match->pattern);
    }
    return match;
}
