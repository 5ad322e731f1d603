#include "handler/git_handler.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "handler/token_scan.hpp"

namespace {

// 읽기만 하는 action (하위 명령 검사 불필요)
const TokenSet kSafeActions = {
    // 상태/이력
    "status", "log", "show", "diff", "blame", "annotate", "shortlog", "describe", "rev-parse",
    "rev-list", "reflog", "whatchanged",
    // 비교
    "diff-tree", "diff-files", "diff-index", "range-diff", "format-patch", "difftool",
    // 검색/조회
    "grep", "ls-files", "ls-tree", "ls-remote", "cat-file", "verify-commit", "verify-tag",
    "name-rev", "merge-base", "show-ref", "show-branch", "check-ignore", "cherry",
    "for-each-ref", "count-objects", "fsck", "var", "request-pull",
    // 저장소 내용으로 아카이브 생성, 원격에서 내려받기
    "archive", "fetch",
};

// 이름만으로는 위험이 드러나지 않는 action 의 부연 설명
const std::map<std::string_view, std::string_view> kUnclearContext = {
    {"gc",            "garbage collect"},
    {"prune",         "remove unreachable objects"},
    {"filter-branch", "rewrite history"},
    {"filter-repo",   "rewrite history"},
};

const TokenSet kGlobalFlagsWithArg = {
    "-C", "-c", "--git-dir", "--work-tree", "--namespace", "--super-prefix", "--config-env",
};

const TokenSet kGlobalFlagsNoArg = {
    "--no-pager", "--paginate", "-p", "--no-replace-objects", "--bare", "--literal-pathspecs",
    "--glob-pathspecs", "--noglob-pathspecs", "--icase-pathspecs", "--no-optional-locks",
};

// -c 로 덮어써도 명령 실행이나 파일 쓰기로 이어지지 않는 설정 키
const TokenSet kSafeConfigKeys = {
    "core.quotepath", "core.abbrev", "diff.noprefix", "diff.mnemonicprefix", "diff.renames",
    "log.showsignature", "log.decorate", "log.date", "init.defaultbranch",
};

const std::vector<std::string_view> kSafeConfigPrefixes = {
    "color.", "advice.", "column.", "i18n.", "user.",
};

using Rest = std::vector<std::string>;

// ---------------------------------------------------------------------------
// 내부 헬퍼: 전역 플래그를 건너뛰고 action 위치를 찾는다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::size_t> find_action(const std::vector<std::string>& tokens) {
    std::size_t i = 1;
    while (i < tokens.size()) {
        const auto& token = tokens[i];
        if (kGlobalFlagsWithArg.contains(token)) {
            i += 2;
            continue;
        }
        if (is_assigned_flag(token, kGlobalFlagsWithArg)) {
            ++i;
            continue;
        }
        if (kGlobalFlagsNoArg.contains(token)) {
            ++i;
            continue;
        }
        if (!token.starts_with('-')) {
            return i;
        }
        // action 전용일 수 있는 모르는 플래그
        break;
    }
    return std::nullopt;
}

[[nodiscard]] std::string lower_ascii(std::string_view text) {
    std::string out{text};
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

[[nodiscard]] bool is_safe_config_key(std::string_view key) {
    const auto lowered = lower_ascii(key);
    if (kSafeConfigKeys.contains(lowered)) {
        return true;
    }
    return std::any_of(kSafeConfigPrefixes.begin(), kSafeConfigPrefixes.end(),
                       [&](std::string_view prefix) { return lowered.starts_with(prefix); });
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: action 앞의 -c / --config-env 중 허용하지 않는 첫 항목.
// core.pager, alias.*, core.sshCommand 처럼 명령을 실행하는 키가 있다.
// --config-env 는 값이 환경 변수에 있어 보이지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> find_config_override(
    const std::vector<std::string>& tokens, std::size_t action_idx) {
    for (std::size_t i = 1; i < action_idx; ++i) {
        const auto& token = tokens[i];
        if (token == "--config-env" || token.starts_with("--config-env=")) {
            return std::string{"--config-env"};
        }
        if (token == "-c" && i + 1 < action_idx) {
            const auto& setting = tokens[i + 1];
            const auto  key     = std::string_view{setting}.substr(0, setting.find('='));
            if (!is_safe_config_key(key)) {
                return "-c " + std::string{key};
            }
            ++i;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 읽기 action 이 파일로 내보내는 대상 (diff --output, archive -o)
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> output_targets(const std::string& action,
                                                      const Rest&        rest) {
    std::vector<std::string> targets;
    const bool short_o = action == "archive" || action == "format-patch";
    for (std::size_t i = 0; i < rest.size(); ++i) {
        const auto& t = rest[i];
        if (t == "--") {
            break;
        }
        if ((t == "--output" || t == "--output-directory" || (short_o && t == "-o")) &&
            i + 1 < rest.size()) {
            targets.push_back(rest[i + 1]);
            ++i;
        } else if (t.starts_with("--output=")) {
            targets.push_back(t.substr(9));
        } else if (t.starts_with("--output-directory=")) {
            targets.push_back(t.substr(19));
        } else if (short_o && t.starts_with("-o") && t.size() > 2) {
            targets.push_back(t.substr(2));
        }
    }
    return targets;
}

[[nodiscard]] bool check_branch(const Rest& rest) {
    const TokenSet unsafe = {"-d", "-D", "--delete", "-m", "-M", "--move", "-c", "-C", "--copy",
                             "-u"};
    const TokenSet listing = {"--list", "-l", "--contains", "--no-contains", "--merged",
                              "--no-merged", "--points-at"};
    for (const auto& t : rest) {
        if (unsafe.contains(t) || t.starts_with("--set-upstream-to")) {
            return false;
        }
    }
    for (const auto& t : rest) {
        if (listing.contains(t) || t.starts_with("--list")) {
            return true;
        }
    }
    // 위치 인자가 있으면 브랜치 생성
    return !first_positional(rest, 0).has_value();
}

[[nodiscard]] bool check_tag(const Rest& rest) {
    const TokenSet listing = {"-l", "--list", "--contains", "--no-contains", "--merged",
                              "--no-merged", "--points-at"};
    if (has_token(rest, "-d") || has_token(rest, "--delete")) {
        return false;
    }
    for (const auto& t : rest) {
        if (listing.contains(t) || t.starts_with("--list")) {
            return true;
        }
    }
    return !first_positional(rest, 0).has_value();
}

[[nodiscard]] bool check_remote(const Rest& rest) {
    if (rest.empty()) {
        return true;
    }
    const TokenSet unsafe = {"add", "remove", "rm", "rename", "set-url", "prune", "set-head",
                             "set-branches"};
    // show, -v, get-url 및 원격 이름 조회는 허용
    return !unsafe.contains(rest.front());
}

[[nodiscard]] bool check_stash(const Rest& rest) {
    // 인자 없는 stash 는 stash 생성
    if (rest.empty()) {
        return false;
    }
    return rest.front() == "list" || rest.front() == "show";
}

[[nodiscard]] bool check_config(const Rest& rest) {
    const TokenSet unsafe = {"-e", "--edit", "--unset", "--unset-all", "--add", "--replace-all",
                             "--remove-section", "--rename-section"};
    const TokenSet reading = {"--get", "--get-all", "--list", "-l", "--get-regexp",
                              "--get-urlmatch"};
    if (has_any(rest, unsafe)) {
        return false;
    }
    if (has_any(rest, reading)) {
        return true;
    }
    // key 하나면 읽기, key value 면 쓰기
    const auto positional = std::count_if(rest.begin(), rest.end(), [](const std::string& t) {
        return !t.starts_with('-');
    });
    return positional <= 1;
}

[[nodiscard]] bool check_notes(const Rest& rest) {
    if (rest.empty()) {
        return true;
    }
    const TokenSet unsafe = {"add", "copy", "append", "edit", "merge", "remove", "prune"};
    return !unsafe.contains(rest.front());
}

[[nodiscard]] bool first_in(const Rest& rest, const TokenSet& safe) {
    return !rest.empty() && safe.contains(rest.front());
}

[[nodiscard]] bool check_symbolic_ref(const Rest& rest) {
    const auto positional = std::count_if(rest.begin(), rest.end(), [](const std::string& t) {
        return !t.starts_with('-');
    });
    return positional <= 1;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: action 별 안전 여부
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_safe_action(const std::string& action, const Rest& rest) {
    if (action == "branch")          return check_branch(rest);
    if (action == "tag")             return check_tag(rest);
    if (action == "remote")          return check_remote(rest);
    if (action == "stash")           return check_stash(rest);
    if (action == "config")          return check_config(rest);
    if (action == "notes")           return check_notes(rest);
    if (action == "bisect")          return first_in(rest, {"log", "visualize", "view"});
    if (action == "worktree")        return first_in(rest, {"list"});
    if (action == "submodule")       return first_in(rest, {"status", "summary", "foreach"});
    if (action == "apply")           return has_token(rest, "--check");
    if (action == "sparse-checkout") return first_in(rest, {"list"});
    if (action == "bundle")          return first_in(rest, {"verify", "list-heads"});
    if (action == "lfs") {
        return first_in(rest, {"fetch", "ls-files", "status", "env", "version"});
    }
    if (action == "hash-object") {
        return !has_token(rest, "-w") && !has_token(rest, "--write");
    }
    if (action == "symbolic-ref")    return check_symbolic_ref(rest);
    if (action == "replace") {
        return rest.empty() || has_token(rest, "-l") || has_token(rest, "--list");
    }
    if (action == "rerere")          return rest.empty() || first_in(rest, {"status", "diff"});
    return kSafeActions.contains(action);
}

[[nodiscard]] std::string describe_action(const std::vector<std::string>& tokens,
                                          bool                            with_context) {
    const auto idx = find_action(tokens);
    if (!idx) {
        return "git";
    }
    const auto& action = tokens[*idx];
    if (with_context) {
        if (const auto it = kUnclearContext.find(action); it != kUnclearContext.end()) {
            return "git " + action + " (" + std::string{it->second} + ")";
        }
    }
    return "git " + action;
}

}  // namespace

Classification GitHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    if (tokens.size() < 2) {
        return Classification::ask("git");
    }
    const auto idx = find_action(tokens);
    if (!idx) {
        return Classification::ask("git");
    }

    if (const auto override_flag = find_config_override(tokens, *idx)) {
        return Classification::ask("git " + *override_flag);
    }

    const Rest rest(tokens.begin() + static_cast<std::ptrdiff_t>(*idx) + 1, tokens.end());
    const bool safe = is_safe_action(tokens[*idx], rest);
    auto desc = describe_action(tokens, /*with_context=*/!safe);
    if (!safe) {
        return Classification::ask(std::move(desc));
    }

    auto result  = Classification::allow(std::move(desc));
    auto targets = output_targets(tokens[*idx], rest);
    if (!targets.empty()) {
        result.redirect_targets = std::move(targets);
    }
    return result;
}

std::string GitHandler::describe(const std::vector<std::string>& tokens) const {
    return describe_action(tokens, /*with_context=*/false);
}
