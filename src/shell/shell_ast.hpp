#pragma once

// ---------------------------------------------------------------------------
// shell_ast.hpp
//
// bash 계열 셸 명령의 구문 트리 정의 (헤더만, 구현 없음).
// ShellParser 가 생성하고 DecisionEngine 이 재귀적으로 순회한다.
//
// [설계 원칙]
// - 노드 종류마다 하나의 구조체, Node 는 std::variant 태그드 유니온.
//   새 구문을 추가하면 DecisionEngine 의 std::visit 가 컴파일 단계에서
//   누락을 알려준다 (런타임 "unrecognized construct" 에 기대지 않음).
// - 자식 노드 소유권은 std::unique_ptr / std::vector<Node> 로 표현한다.
//   트리는 이동만 가능하며 복사하지 않는다.
// - 모든 노드는 분석 호출 한 번 동안만 존재한다.
//
// [순환 의존성]
// shell_ast.hpp 는 다른 프로젝트 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Node;
using NodePtr = std::unique_ptr<Node>;

// ---------------------------------------------------------------------------
// WordPart
//   Literal  : 치환이 아닌 원문 조각
//   CmdSub   : $(...) 또는 `...`, 내부 명령은 그 자체로 AST 노드
//   ProcSub  : <(...) 또는 >(...)
// ---------------------------------------------------------------------------
struct LiteralPart {
    std::string text{};
};

struct CmdSubPart {
    NodePtr command{};
    bool    backtick{false};
};

struct ProcSubPart {
    char    direction{'<'};  // '<' 또는 '>'
    NodePtr command{};
};

struct WordPart {
    std::variant<LiteralPart, CmdSubPart, ProcSubPart> value{};
};

// ---------------------------------------------------------------------------
// Word
//   text  : 원문 표기 그대로 (따옴표 포함)
//   value : 따옴표 제거/이스케이프 처리된 값. 치환 부분은 원문 표기 유지.
//   parts : 리터럴과 치환 조각. 큰따옴표, ${...}, $((...)) 내부의 치환도
//           모두 여기에 나타난다.
// ---------------------------------------------------------------------------
struct Word {
    std::string           text{};
    std::string           value{};
    std::vector<WordPart> parts{};

    // 단어 전체가 명령 치환 하나로만 이루어졌는지 ("$(cmd)", "`cmd`").
    // 인젝션 위험 판정에 사용한다.
    [[nodiscard]] bool is_pure_substitution() const {
        return parts.size() == 1 && std::holds_alternative<CmdSubPart>(parts.front().value);
    }

    // 치환이 하나라도 포함되어 있는지
    [[nodiscard]] bool has_substitution() const {
        for (const auto& part : parts) {
            if (!std::holds_alternative<LiteralPart>(part.value)) {
                return true;
            }
        }
        return false;
    }
};

// ---------------------------------------------------------------------------
// Redirect
// ---------------------------------------------------------------------------
enum class RedirectKind : std::uint8_t {
    kInput      = 0,   // <
    kOutput     = 1,   // >
    kAppend     = 2,   // >>
    kClobber    = 3,   // >|
    kReadWrite  = 4,   // <>
    kOutputBoth = 5,   // &>
    kAppendBoth = 6,   // &>>
    kDupOutput  = 7,   // >&
    kDupInput   = 8,   // <&
    kHereDoc    = 9,   // << / <<-
    kHereString = 10,  // <<<
};

struct Redirect {
    std::string        op{};           // fd 접두사 포함 원문 연산자 ("2>", ">>", "<<-")
    std::optional<int> fd{};           // 명시된 fd 번호
    RedirectKind       kind{RedirectKind::kOutput};
    Word               target{};       // heredoc 의 경우 구분자 단어

    // heredoc 전용. 본문은 구분자 행이 나온 뒤에 채워지므로 공유 포인터로 둔다.
    bool                         heredoc_quoted{false};
    std::shared_ptr<std::string> heredoc_body{};
};

// 리다이렉트를 가질 수 있는 복합 명령의 공통 베이스
struct Compound {
    std::vector<Redirect> redirects{};
};

// ---------------------------------------------------------------------------
// 조건식 [[ ... ]]
// ---------------------------------------------------------------------------
struct CondTerm;
using CondPtr = std::unique_ptr<CondTerm>;

struct UnaryTest {
    std::string op{};       // -f, -z, ... (피연산자만 있으면 "-n")
    Word        operand{};
};

struct BinaryTest {
    std::string op{};       // ==, !=, =~, -eq, <, ...
    Word        left{};
    Word        right{};
};

struct CondAnd {
    CondPtr left{};
    CondPtr right{};
};

struct CondOr {
    CondPtr left{};
    CondPtr right{};
};

struct CondNot {
    CondPtr operand{};
};

struct CondParen {
    CondPtr inner{};
};

struct CondTerm {
    std::variant<UnaryTest, BinaryTest, CondAnd, CondOr, CondNot, CondParen> value{};
};

// ---------------------------------------------------------------------------
// 명령 노드
// ---------------------------------------------------------------------------
struct Command {
    std::vector<Word>     words{};
    std::vector<Redirect> redirects{};
};

struct Pipeline {
    std::vector<Node> commands{};
};

// parts 사이의 연산자(&&, ||, ;, &)는 operators 에 별도로 보관한다.
// operators.size() + 1 == parts.size() 또는 끝에 ';'/'&' 가 붙은 경우 같다.
struct List {
    std::vector<Node>        parts{};
    std::vector<std::string> operators{};
};

struct If : Compound {
    NodePtr condition{};
    NodePtr then_body{};
    NodePtr else_body{};  // elif 는 중첩 If 로 표현, 없으면 nullptr
};

struct WhileLoop : Compound {
    bool    until{false};
    NodePtr condition{};
    NodePtr body{};
};

struct For : Compound {
    std::string       variable{};
    std::vector<Word> words{};
    NodePtr           body{};
};

// for (( init; cond; incr )): 각 식은 치환 탐지를 위해 Word 로 보관
struct ForArith : Compound {
    Word    init{};
    Word    cond{};
    Word    incr{};
    NodePtr body{};
};

struct Select : Compound {
    std::string       variable{};
    std::vector<Word> words{};
    NodePtr           body{};
};

struct CaseItem {
    std::vector<Word> patterns{};
    NodePtr           body{};        // 비어있는 분기는 nullptr
    std::string       terminator{};  // ;; ;& ;;&
};

struct Case : Compound {
    Word                  word{};
    std::vector<CaseItem> items{};
};

struct Function : Compound {
    std::string name{};
    NodePtr     body{};
};

struct Subshell : Compound {
    NodePtr body{};
};

struct BraceGroup : Compound {
    NodePtr body{};
};

struct Time {
    bool    posix{false};  // time -p
    NodePtr pipeline{};
};

struct Negation {
    NodePtr pipeline{};
};

struct Coproc {
    std::string name{};
    NodePtr     command{};
};

struct CondExpr : Compound {
    CondPtr body{};
};

// (( expr )): 산술식 안의 $(...) / `...` 는 expression.parts 에 나타난다
struct ArithCmd : Compound {
    Word expression{};
};

struct Comment {
    std::string text{};
};

struct Empty {};

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------
struct Node {
    std::variant<Command, Pipeline, List, If, WhileLoop, For, ForArith, Select, Case,
                 Function, Subshell, BraceGroup, Time, Negation, Coproc, CondExpr,
                 ArithCmd, Comment, Empty>
        value{};
};

// 진단/로그용 노드 종류 이름 ("command", "pipeline", ...)
[[nodiscard]] const char* node_kind_name(const Node& node);
