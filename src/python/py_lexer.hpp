#pragma once

// ---------------------------------------------------------------------------
// py_lexer.hpp
//
// Python 3 토크나이저. 물리 행을 논리 행으로 묶고 들여쓰기를
// INDENT / DEDENT 토큰으로 바꾼다 (CPython tokenize 모듈과 같은 토큰 흐름).
//
// [f-string]
// f"..." 리터럴의 {식} 부분은 토큰화 단계에서 원문 그대로 잘라 fields 에
// 담는다. 파서가 각 식을 다시 토큰화/파싱하므로 f"{os.system('x')}" 안의
// 호출도 분석 대상이 된다.
//
// [알려진 한계]
// - 식별자의 유니코드 정규화(NFKC)는 하지 않는다. 0x80 이상 바이트는
//   식별자 문자로 취급한다.
// - f-string 안에서 바깥과 같은 따옴표를 재사용하는 3.12 문법은 지원하지
//   않는다 (문자열이 일찍 닫히고 구문 오류가 된다).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ParseError

enum class PyTokenType : std::uint8_t {
    kName      = 0,  // 식별자와 키워드
    kNumber    = 1,
    kString    = 2,
    kOp        = 3,
    kNewline   = 4,
    kIndent    = 5,
    kDedent    = 6,
    kEndMarker = 7,
};

// f-string 치환 필드 하나. line/col 은 식 첫 글자의 위치.
struct FStringField {
    std::string   expression{};
    std::uint32_t line{0};
    std::uint32_t col{0};
};

struct PyToken {
    PyTokenType               type{PyTokenType::kEndMarker};
    std::string               text{};
    std::uint32_t             line{0};
    std::uint32_t             col{0};
    bool                      is_fstring{false};
    std::vector<FStringField> fields{};
};

// tokenize_python
//   성공 시 마지막 토큰은 항상 kEndMarker.
//   실패 시 ParseError (line/column 은 오류 위치).
[[nodiscard]] std::expected<std::vector<PyToken>, ParseError>
tokenize_python(std::string_view source);
