// ---------------------------------------------------------------------------
// decision_logger.cpp
//
// spdlog 기반 감사 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/decision_logger.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;  // 10MB
constexpr std::size_t kMaxFiles    = 3;

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_log_level
// ---------------------------------------------------------------------------
std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug") return LogLevel::kDebug;
    if (text == "info")  return LogLevel::kInfo;
    if (text == "warn")  return LogLevel::kWarn;
    if (text == "error") return LogLevel::kError;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// DecisionLogger 생성자
// ---------------------------------------------------------------------------
DecisionLogger::DecisionLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles);

        logger_ = std::make_shared<spdlog::logger>("cmdgate_audit", std::move(file_sink));
        logger_->set_level(to_spdlog_level(min_level_));

        // 한 줄 = JSON 객체 하나. 타임스탬프는 JSON 필드로 들어간다.
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("audit log initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("audit log initialization failed: ") + ex.what());
    }
}

DecisionLogger::~DecisionLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void DecisionLogger::log_decision(const DecisionLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"decision","command":")" << escape_json_string(entry.command)
         << R"(","cwd":")" << escape_json_string(entry.cwd)
         << R"(","action":")" << escape_json_string(entry.action)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_config_error: JSON 직렬화
// ---------------------------------------------------------------------------
void DecisionLogger::log_config_error(const ConfigErrorLog& entry) {
    if (!logger_) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"config_error","message":")" << escape_json_string(entry.message)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->error(json.str());
}
