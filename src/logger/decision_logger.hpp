#pragma once

// ---------------------------------------------------------------------------
// decision_logger.hpp
//
// spdlog 기반 감사(audit) JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 레지스트리에도 등록하지 않는다.
// - 진단 로그(spdlog 기본 로거, stderr)와 감사 로그(파일)는 분리한다.
//   감사 로그 한 줄은 JSON 객체 하나다.
// - 로그 파일을 열지 못해도 판정에는 영향을 주지 않는다. 생성자가
//   std::runtime_error 를 던지며 호출자가 stderr 에 보고하고 계속한다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

// JSON 문자열 값 이스케이프 (따옴표는 붙이지 않는다)
[[nodiscard]] std::string escape_json_string(std::string_view str);

// 2026-01-02T03:04:05.678Z
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// ---------------------------------------------------------------------------
// DecisionLogger
//   DecisionLog / ConfigErrorLog 를 JSON 포맷으로 기록한다.
//   파일은 10MB 단위로 회전하며 3개까지 유지한다.
// ---------------------------------------------------------------------------
class DecisionLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로. 상위 디렉터리는 없으면 만든다.
    explicit DecisionLogger(LogLevel min_level, const std::filesystem::path& log_path);

    ~DecisionLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    DecisionLogger(const DecisionLogger&)            = delete;
    DecisionLogger& operator=(const DecisionLogger&) = delete;

    DecisionLogger(DecisionLogger&&)            = default;
    DecisionLogger& operator=(DecisionLogger&&) = default;

    // log_decision
    //   판정 한 건을 info 레벨 JSON 으로 기록한다.
    void log_decision(const DecisionLog& entry);

    // log_config_error
    //   설정 로드 실패를 error 레벨 JSON 으로 기록한다.
    void log_config_error(const ConfigErrorLog& entry);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
