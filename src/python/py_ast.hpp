#pragma once

// ---------------------------------------------------------------------------
// py_ast.hpp
//
// Python 소스의 구문 트리 (헤더만, 구현 없음).
// PyParser 가 생성하고 PythonSafetyAnalyzer 가 순회한다.
//
// [설계 원칙]
// - 안전성 분석에 필요한 정보만 남기는 균일한 트리.
//   노드 종류는 PyNodeKind 로 구분하고, 자식은 소스 순서대로 children 에 둔다.
// - 분석기가 보는 필드:
//     kName          text = 식별자
//     kAttribute     text = 속성 이름, children[0] = 대상 식
//     kCall          children[0] = 호출 대상, 나머지 = 인자
//     kImport        names = 모듈 이름 목록 ("a.b.c")
//     kImportFrom    text = 모듈 이름 (없으면 빈 문자열), level = 선행 점 개수
//     kWithItem      children[0] = 컨텍스트 식, children[1] = as 대상 (선택)
//   그 밖의 노드는 자식 순회만 필요하다.
// - line/col 은 1-based 행, 0-based 열 (CPython ast 와 같은 관례).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

enum class PyNodeKind : std::uint8_t {
    // 모듈 / 문
    kModule,
    kExpr,              // 식 문장
    kAssign,
    kAugAssign,
    kAnnAssign,
    kReturn,
    kDelete,
    kPass,
    kBreak,
    kContinue,
    kRaise,
    kGlobal,
    kNonlocal,
    kAssert,
    kImport,
    kImportFrom,
    kIf,
    kWhile,
    kFor,
    kAsyncFor,
    kWith,
    kAsyncWith,
    kWithItem,
    kTry,
    kExceptHandler,
    kFunctionDef,
    kAsyncFunctionDef,
    kClassDef,
    kArg,               // 함수/람다 매개변수 (text = 이름)

    // 식
    kLambda,
    kBoolOp,
    kBinOp,
    kUnaryOp,
    kCompare,
    kIfExp,
    kNamedExpr,
    kAwait,
    kYield,
    kYieldFrom,
    kCall,
    kKeyword,           // 키워드 인자 (text = 이름, 없으면 **kwargs)
    kAttribute,
    kSubscript,
    kSlice,
    kStarred,
    kName,
    kConstant,
    kJoinedStr,         // f-string
    kList,
    kTuple,
    kSet,
    kDict,
    kListComp,
    kSetComp,
    kDictComp,
    kGeneratorExp,
    kComprehension,     // for ... in ... if ...  (level = 1 이면 async for)
};

struct PyNode {
    PyNodeKind               kind{PyNodeKind::kModule};
    std::uint32_t            line{0};
    std::uint32_t            col{0};
    std::string              text{};
    std::vector<std::string> names{};
    int                      level{0};
    std::vector<PyNode>      children{};
};
