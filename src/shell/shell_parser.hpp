#pragma once

// ---------------------------------------------------------------------------
// shell_parser.hpp
//
// bash 계열 명령 문자열을 shell_ast.hpp 의 구문 트리로 변환하는 파서.
// 문자 단위 렉서 + 재귀 하강 파서.
//
// [지원 범위]
// - 단순 명령, 파이프라인(| |&), 리스트(&& || ; &), 부정(!), time [-p]
// - ( ) 서브셸, { } 그룹, if/elif/else, while/until, for/for ((;;)), select,
//   case, 함수 정의(name () / function name), coproc, [[ ]], (( ))
// - 따옴표: '...', "...", $'...', $"...", 백슬래시 이스케이프, 줄 연속
// - 치환: $(...), `...`, $((...)), ${...}, <(...), >(...)
//   단어 내부 어디에 있든(큰따옴표, ${...} 기본값, 산술식 첨자) 치환은
//   WordPart 로 추출된다.
// - 리다이렉트: < > >> >| <> &> &>> >& <& << <<- <<<, fd 접두사
// - heredoc 본문은 해당 행의 개행 이후에서 읽어 Redirect 에 채운다.
//
// [알려진 한계]
// - alias 확장, 히스토리 확장(!!), {a,b} 중괄호 확장은 하지 않는다.
//   분석 대상은 "셸이 실행할 구조" 이지 확장 결과가 아니다.
// - {fd}> 형태의 변수 fd 리다이렉트는 지원하지 않는다 (파싱 오류 → Ask).
// - 파싱 실패는 절대 안전으로 취급되지 않는다. 호출자는 Ask 로 처리한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ParseError
#include "shell/shell_ast.hpp"

// ---------------------------------------------------------------------------
// ShellParser
//   상태 없는 파서. parse() 호출마다 내부 상태를 새로 만든다.
// ---------------------------------------------------------------------------
class ShellParser {
public:
    ShellParser()  = default;
    ~ShellParser() = default;

    ShellParser(const ShellParser&)            = default;
    ShellParser& operator=(const ShellParser&) = default;
    ShellParser(ShellParser&&)                 = default;
    ShellParser& operator=(ShellParser&&)      = default;

    // parse
    //   source: 명령 문자열 (여러 줄 가능)
    //   반환: 최상위 노드 목록 (개행으로 구분된 명령마다 하나)
    //         주석만 있는 입력은 Comment 노드 하나.
    //         실패 시 ParseError (message 는 사용자에게 노출 가능한 수준)
    [[nodiscard]] std::expected<std::vector<Node>, ParseError>
    parse(std::string_view source) const;
};
