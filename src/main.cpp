#include "engine/decision_engine.hpp"
#include "logger/decision_logger.hpp"
#include "policy/policy_loader.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace {

namespace fs = std::filesystem;

constexpr int kExitUsage = 2;

enum class OutputFormat : std::uint8_t {
    kHook  = 0,
    kPlain = 1,
};

struct CliOptions {
    std::optional<std::string> command{};
    std::optional<fs::path>    cwd{};
    OutputFormat               format{OutputFormat::kHook};
};

constexpr std::string_view kUsage =
    "usage: cmdgate [--cwd DIR] [--format hook|plain] [-c COMMAND]\n"
    "  reads the command from stdin when -c is not given\n";

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

// ---------------------------------------------------------------------------
// Helper: 명령행 파싱. 실패 시 오류 메시지.
// ---------------------------------------------------------------------------
std::expected<CliOptions, std::string> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            return std::string{argv[++i]};
        };

        if (arg == "-c") {
            auto value = next_value();
            if (!value) {
                return std::unexpected(std::string{"-c requires a command"});
            }
            opts.command = std::move(*value);
        } else if (arg == "--cwd") {
            auto value = next_value();
            if (!value) {
                return std::unexpected(std::string{"--cwd requires a directory"});
            }
            opts.cwd = fs::path{*value};
        } else if (arg == "--format") {
            auto value = next_value();
            if (!value) {
                return std::unexpected(std::string{"--format requires hook or plain"});
            }
            if (*value == "hook") {
                opts.format = OutputFormat::kHook;
            } else if (*value == "plain") {
                opts.format = OutputFormat::kPlain;
            } else {
                return std::unexpected("unknown format '" + *value + "'");
            }
        } else {
            return std::unexpected("unknown argument '" + std::string{arg} + "'");
        }
    }
    return opts;
}

// ---------------------------------------------------------------------------
// Helper: 진단 로거 (stderr). stdout 은 판정 출력 전용이다.
// ---------------------------------------------------------------------------
void init_diagnostics(LogLevel level) {
    auto sink   = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("cmdgate", std::move(sink));
    logger->set_pattern("cmdgate: [%l] %v");
    spdlog::set_default_logger(std::move(logger));
    switch (level) {
        case LogLevel::kDebug: spdlog::set_level(spdlog::level::debug); break;
        case LogLevel::kInfo:  spdlog::set_level(spdlog::level::info);  break;
        case LogLevel::kWarn:  spdlog::set_level(spdlog::level::warn);  break;
        case LogLevel::kError: spdlog::set_level(spdlog::level::err);   break;
    }
}

void print_decision(const Decision& decision, OutputFormat format) {
    if (format == OutputFormat::kPlain) {
        std::cout << action_name(decision.action) << '\t' << decision.reason << '\n';
        return;
    }
    std::cout << R"({"hookSpecificOutput":{"hookEventName":"PreToolUse","permissionDecision":")"
              << action_name(decision.action) << R"(","permissionDecisionReason":")"
              << escape_json_string(decision.reason) << R"("}})" << '\n';
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 명령행 ──────────────────────────────────────────────────────────
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << kUsage;
            return EXIT_SUCCESS;
        }
    }
    auto opts = parse_args(argc, argv);
    if (!opts) {
        std::cerr << "cmdgate: " << opts.error() << '\n' << kUsage;
        return kExitUsage;
    }

    // ── 진단 로깅 (환경변수 우선, 설정 파일은 로드 후 반영) ─────────────
    const std::string env_level = env_str("CMDGATE_LOG_LEVEL", "");
    init_diagnostics(parse_log_level(env_level).value_or(LogLevel::kWarn));

    // ── 작업 디렉터리 ───────────────────────────────────────────────────
    fs::path cwd;
    if (opts->cwd) {
        cwd = *opts->cwd;
    } else {
        std::error_code ec;
        cwd = fs::current_path(ec);
        if (ec) {
            spdlog::warn("main: cannot determine current directory: {}", ec.message());
        }
    }

    // ── 명령 원문 ───────────────────────────────────────────────────────
    std::string command;
    if (opts->command) {
        command = std::move(*opts->command);
    } else {
        command.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    auto config = PolicyLoader::load_scopes(cwd);
    std::string log_path = env_str("CMDGATE_LOG_PATH", "");

    if (!config) {
        spdlog::error("main: configuration rejected: {}", config.error());
        const auto decision = Decision::ask(config.error());
        if (!log_path.empty()) {
            try {
                DecisionLogger audit{LogLevel::kError, log_path};
                audit.log_config_error({config.error(), std::chrono::system_clock::now()});
            } catch (const std::runtime_error& e) {
                spdlog::error("main: {}", e.what());
            }
        }
        print_decision(decision, opts->format);
        return EXIT_SUCCESS;
    }

    if (env_level.empty() && !config->global.log_level.empty()) {
        init_diagnostics(parse_log_level(config->global.log_level).value_or(LogLevel::kWarn));
    }
    if (log_path.empty()) {
        log_path = config->global.log_path;
    }

    // ── 판정 ────────────────────────────────────────────────────────────
    const DecisionEngine engine{std::make_shared<const RuleConfig>(std::move(*config))};
    const auto started  = std::chrono::steady_clock::now();
    const auto decision = engine.analyze(command, cwd);
    const auto elapsed  = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    // ── 감사 로그 (실패해도 판정은 그대로) ──────────────────────────────
    if (!log_path.empty()) {
        try {
            DecisionLogger audit{LogLevel::kInfo, log_path};
            audit.log_decision({command, cwd.string(), std::string{action_name(decision.action)},
                                decision.reason, std::chrono::system_clock::now(), elapsed});
        } catch (const std::runtime_error& e) {
            spdlog::error("main: {}", e.what());
        }
    }

    print_decision(decision, opts->format);
    return EXIT_SUCCESS;
}
