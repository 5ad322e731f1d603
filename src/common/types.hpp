#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// ParseErrorCode
//   셸/파이썬 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kUnexpectedToken = 0,  // 문법상 올 수 없는 토큰
    kUnterminated    = 1,  // 따옴표/괄호/치환이 닫히지 않음
    kTooDeep         = 2,  // 중첩 깊이 상한 초과
    kInvalidSyntax   = 3,  // 그 밖의 문법 오류
    kInternalError   = 4,  // 파서 내부 오류
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
//   line/column 은 1-based, 알 수 없으면 0.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
    std::uint32_t  line{0};
    std::uint32_t  column{0};
};

// 분석기 전체가 공유하는 재귀 깊이 상한.
// 적대적 입력($( $( $( ... ))) 등)으로 스택이 무한히 자라는 것을 막는다.
inline constexpr int kMaxNestingDepth = 64;
