#include "handler/delegating_handlers.hpp"

#include <map>
#include <optional>

#include "handler/token_scan.hpp"
#include "shell/shell_quote.hpp"

namespace {

const TokenSet kEnvFlagsWithArg = {"-u", "--unset", "-C", "--chdir"};

// env -S: 인자 문자열이 곧 실행할 명령줄
const TokenSet kEnvSplitFlags = {"-S", "--split-string"};

// set -o / shopt -O 처럼 다음 토큰을 값으로 받는 셸 옵션
const TokenSet kShellOptionsWithArg = {"-o", "+o", "-O", "+O", "--rcfile", "--init-file"};

const TokenSet kXargsFlagsWithArg = {
    "-a", "--arg-file", "-d", "--delimiter", "-E", "-e", "--eof", "-I", "-J", "--replace",
    "-L", "-l", "--max-lines", "-n", "--max-args", "-P", "--max-procs", "-R", "-s", "-S",
    "--max-chars", "--process-slot-var",
};

const std::map<std::string_view, std::string_view> kXargsUnsafeFlags = {
    {"-p",            "prompt before execute"},
    {"--interactive", ""},
    {"-o",            "open tty"},
    {"--open-tty",    ""},
};

[[nodiscard]] std::vector<std::string> tail(const std::vector<std::string>& tokens,
                                            std::size_t                     from) {
    return {tokens.begin() + static_cast<std::ptrdiff_t>(from), tokens.end()};
}

// xargs 플래그를 건너뛴 첫 내부 명령 토큰의 인덱스
[[nodiscard]] std::size_t skip_xargs_flags(const std::vector<std::string>& tokens) {
    std::size_t i = 1;
    while (i < tokens.size()) {
        const auto& token = tokens[i];
        if (token == "--") {
            return i + 1;
        }
        if (!token.starts_with('-')) {
            return i;
        }
        if (kXargsFlagsWithArg.contains(token)) {
            i += 2;
            continue;
        }
        // -n1, -I{} 처럼 값이 붙은 짧은 플래그와 --flag=value 는 토큰 하나
        ++i;
    }
    return i;
}

}  // namespace

// ---------------------------------------------------------------------------
// ShellHandler
// ---------------------------------------------------------------------------
Classification ShellHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    const std::string base = tokens.empty() ? std::string{"shell"} : tokens.front();

    // -c 또는 -lc, -xc 같은 결합형 짧은 플래그. 첫 피연산자(스크립트) 뒤는
    // 스크립트 인자이므로 보지 않는다.
    std::optional<std::size_t> c_idx;
    std::optional<std::size_t> script_idx;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok == "--") {
            if (i + 1 < tokens.size()) {
                script_idx = i + 1;
            }
            break;
        }
        if (tok == "-") {
            break;
        }
        if (kShellOptionsWithArg.contains(tok)) {
            ++i;
            continue;
        }
        if (tok.starts_with("--")) {
            continue;
        }
        if (tok.starts_with('-') || tok.starts_with('+')) {
            if (tok.starts_with('-') && tok.find('c') != std::string::npos) {
                c_idx = i;
                break;
            }
            continue;
        }
        script_idx = i;
        break;
    }
    if (!c_idx) {
        if (script_idx) {
            return Classification::ask(base + " " + tokens[*script_idx]);
        }
        return Classification::ask(base + " interactive");
    }
    if (*c_idx + 1 >= tokens.size() || tokens[*c_idx + 1].empty()) {
        return Classification::ask(base + " -c (no command)");
    }
    return Classification::delegate(tokens[*c_idx + 1], base + " -c");
}

// ---------------------------------------------------------------------------
// EnvHandler
// ---------------------------------------------------------------------------
Classification EnvHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    std::size_t i = 1;
    while (i < tokens.size()) {
        const auto& token = tokens[i];
        if (token == "--") {
            ++i;
            break;
        }
        if (kEnvFlagsWithArg.contains(token)) {
            i += 2;
            continue;
        }
        // -S 'cmd args', --split-string=..., -S'cmd args'
        std::optional<std::string> split;
        if (kEnvSplitFlags.contains(token)) {
            if (i + 1 >= tokens.size()) {
                return Classification::ask("env -S (no command)");
            }
            split = tokens[i + 1];
            i += 2;
        } else if (is_assigned_flag(token, kEnvSplitFlags)) {
            split = token.substr(token.find('=') + 1);
            ++i;
        } else if (token.starts_with("-S") && token.size() > 2) {
            split = token.substr(2);
            ++i;
        }
        if (split) {
            const auto rest = tail(tokens, i);
            return Classification::delegate(rest.empty() ? *split : *split + " " + bash_join(rest),
                                            "env -S");
        }
        if (token.starts_with('-')) {
            ++i;
            continue;
        }
        if (token.find('=') != std::string::npos) {
            ++i;
            continue;
        }
        break;
    }

    // 인자 없는 env 는 환경 변수 출력
    if (i >= tokens.size()) {
        return Classification::allow("env");
    }
    return Classification::delegate(bash_join(tail(tokens, i)), "env");
}

// ---------------------------------------------------------------------------
// XargsHandler
// ---------------------------------------------------------------------------
Classification XargsHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    if (tokens.size() < 2) {
        return Classification::ask("xargs (no command)");
    }

    // 1. 대화형 플래그
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token == "--") {
            break;
        }
        if (const auto it = kXargsUnsafeFlags.find(token); it != kXargsUnsafeFlags.end()) {
            if (it->second.empty()) {
                return Classification::ask("xargs " + token);
            }
            return Classification::ask("xargs " + token + " (" + std::string{it->second} + ")");
        }
        if (token.starts_with("--interactive") || token.starts_with("--open-tty")) {
            return Classification::ask("xargs " + token.substr(0, token.find('=')));
        }
    }

    // 2. 내부 명령
    const auto start = skip_xargs_flags(tokens);
    if (start >= tokens.size()) {
        return Classification::ask("xargs (no command)");
    }
    return Classification::delegate(bash_join(tail(tokens, start)), "xargs");
}
