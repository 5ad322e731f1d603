#include "handler/python_handler.hpp"

#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "handler/token_scan.hpp"
#include "python/python_analyzer.hpp"

namespace {

const TokenSet kSafeFlags = {"-V", "--version", "-h", "--help", "-VV"};

const TokenSet kFlagsWithArg = {"-W", "-X", "--check-hash-based-pycs"};

// 인터프리터 옵션 해석 결과. 스크립트 뒤의 토큰은 스크립트 인자라 보지 않는다.
struct PythonInvocation {
    std::optional<std::size_t> safe_flag{};   // --version, -h ...
    std::optional<std::size_t> inline_code{}; // -c
    std::optional<std::size_t> module{};      // -m
    std::optional<std::size_t> script{};
    bool                       interactive{false};
    bool                       stdin_program{false};
};

[[nodiscard]] PythonInvocation scan_invocation(const std::vector<std::string>& tokens) {
    PythonInvocation inv;
    std::size_t i = 1;
    while (i < tokens.size()) {
        const auto& token = tokens[i];
        if (token == "--") {
            if (i + 1 < tokens.size()) {
                inv.script = i + 1;
            }
            return inv;
        }
        if (token == "-") {
            inv.stdin_program = true;
            return inv;
        }
        if (kSafeFlags.contains(token)) {
            inv.safe_flag = i;
            return inv;
        }
        if (kFlagsWithArg.contains(token)) {
            i += 2;
            continue;
        }
        if (token.starts_with("--")) {
            ++i;
            continue;
        }
        if (token.starts_with('-')) {
            // -Bc 'code', -Wignore 처럼 묶인 짧은 옵션
            for (std::size_t k = 1; k < token.size(); ++k) {
                const char flag = token[k];
                if (flag == 'c') {
                    inv.inline_code = i;
                    return inv;
                }
                if (flag == 'm') {
                    inv.module = i;
                    return inv;
                }
                if (flag == 'i') {
                    inv.interactive = true;
                }
                if (flag == 'W' || flag == 'X') {
                    if (k + 1 == token.size()) {
                        ++i;
                    }
                    break;
                }
            }
            ++i;
            continue;
        }
        inv.script = i;
        return inv;
    }
    return inv;
}

}  // namespace

std::vector<std::string> PythonHandler::names() const {
    std::vector<std::string> out = {"python", "python3"};
    for (int minor = 8; minor < 20; ++minor) {
        out.push_back(fmt::format("python3.{}", minor));
    }
    return out;
}

std::string PythonHandler::describe(const std::vector<std::string>& tokens) const {
    if (tokens.size() < 2) {
        return tokens.empty() ? std::string{"python"} : tokens.front();
    }
    const auto& base = tokens.front();
    const auto  inv  = scan_invocation(tokens);
    if (inv.safe_flag) {
        return base + " " + tokens[*inv.safe_flag];
    }
    if (inv.inline_code) {
        return base + " -c";
    }
    if (inv.module) {
        const auto& flag = tokens[*inv.module];
        const auto  m    = flag.find('m');
        if (m + 1 < flag.size()) {
            return base + " -m " + flag.substr(m + 1);
        }
        return *inv.module + 1 < tokens.size() ? base + " -m " + tokens[*inv.module + 1]
                                               : base + " -m";
    }
    if (inv.script) {
        return base + " " + std::filesystem::path{tokens[*inv.script]}.filename().string();
    }
    return base;
}

Classification PythonHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    if (tokens.size() < 2) {
        return Classification::ask(tokens.front() + " interactive");
    }
    const auto desc = describe(tokens);
    const auto inv  = scan_invocation(tokens);

    if (inv.safe_flag) {
        return Classification::allow(desc);
    }
    if (inv.inline_code || inv.stdin_program) {
        return Classification::ask(desc);
    }
    if (inv.module) {
        // calendar 는 출력만 하는 유일한 무해 모듈
        const auto i = *inv.module;
        if (tokens[i] == "-m" && i + 1 < tokens.size() && tokens[i + 1] == "calendar") {
            return Classification::allow(desc);
        }
        return Classification::ask(desc);
    }
    if (inv.interactive) {
        return Classification::ask(desc);
    }

    const auto script_idx = inv.script;
    if (!script_idx) {
        return Classification::ask("python (REPL)");
    }

    std::filesystem::path script{tokens[*script_idx]};
    if (script.is_relative()) {
        script = ctx.cwd / script;
    }
    script = script.lexically_normal();

    const auto verdict = analyze_python_file(script);
    spdlog::debug("python_handler: '{}' -> {} ({})", script.string(),
                  verdict.safe ? "safe" : "unsafe", verdict.reason);
    if (verdict.safe) {
        return Classification::allow(desc + " (analyzed)");
    }
    return Classification::ask(desc + ": " + verdict.reason);
}
