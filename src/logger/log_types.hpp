#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - engine/decision.hpp 를 include 하지 않는다.
// - action 은 호출자가 action_name(decision.action) 으로 변환해 넘긴다.
//
// [민감정보 취급 주의]
// - command 는 명령 원문 전체를 포함한다. 환경 변수 대입 등으로 비밀값이
//   섞일 수 있으므로 로그 파일 권한을 별도로 관리할 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 의 global.log_level 또는 CMDGATE_LOG_LEVEL.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error" -> LogLevel. 그 외는 nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// ---------------------------------------------------------------------------
// DecisionLog
//   명령 하나에 대한 판정 로그.
//   action: "allow" | "ask" | "deny"
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::string                           command{};   // 명령 원문 (민감정보 주의)
    std::string                           cwd{};
    std::string                           action{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};  // 판정 소요 시간
};

// ---------------------------------------------------------------------------
// ConfigErrorLog
//   설정 로드 실패 로그. 이 경우 판정은 항상 Ask 로 응답된다.
// ---------------------------------------------------------------------------
struct ConfigErrorLog {
    std::string                           message{};
    std::chrono::system_clock::time_point timestamp{};
};
