#pragma once

// ---------------------------------------------------------------------------
// py_parser.hpp
//
// Python 3 소스를 PyNode 트리로 변환하는 재귀 하강 파서.
//
// [지원 범위]
// - 문: 식/대입(연쇄, 증강, 주석), return, raise [from], global, nonlocal,
//   del, assert, import, from-import(상대 포함), pass/break/continue,
//   if/elif/else, while/else, for/else, try/except[*]/else/finally,
//   with(괄호 묶음 포함), def/class(데코레이터, 기본값, 주석, / * **),
//   async def / async for / async with
// - 식: lambda, 조건식, :=, or/and/not, 비교 연쇄, 비트/산술 연산, **,
//   await, yield [from], 호출/속성/첨자/슬라이스, 리터럴, 컴프리헨션,
//   제너레이터 식, f-string 치환 필드
//
// [알려진 한계]
// - match 문(3.10)과 type 별칭 문(3.12)은 지원하지 않는다. 구문 오류로
//   보고되며 호출자는 이를 안전하지 않은 것으로 취급한다.
// - 대입 대상의 유효성(f() = 1 등)은 검사하지 않는다. 분석 대상 범위를
//   넓힐 뿐 안전성 판정을 약화시키지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"  // ParseError
#include "python/py_ast.hpp"

class PyParser {
public:
    PyParser()  = default;
    ~PyParser() = default;

    PyParser(const PyParser&)            = default;
    PyParser& operator=(const PyParser&) = default;
    PyParser(PyParser&&)                 = default;
    PyParser& operator=(PyParser&&)      = default;

    // parse
    //   성공 시 kModule 노드. 실패 시 첫 번째 구문 오류 하나.
    [[nodiscard]] std::expected<PyNode, ParseError> parse(std::string_view source) const;
};
