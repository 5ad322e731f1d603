#include "python/py_parser.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "python/py_lexer.hpp"

namespace {

// CPython 파서의 중첩 한도와 비슷한 수준
constexpr int kMaxPyDepth = 200;

class PySyntaxError : public std::runtime_error {
public:
    PySyntaxError(ParseErrorCode code, const std::string& message, std::uint32_t line,
                  std::uint32_t col)
        : std::runtime_error(message)
        , code_(code)
        , line_(line)
        , col_(col) {}

    [[nodiscard]] ParseErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::uint32_t line() const noexcept { return line_; }
    [[nodiscard]] std::uint32_t col() const noexcept { return col_; }

private:
    ParseErrorCode code_;
    std::uint32_t  line_;
    std::uint32_t  col_;
};

bool is_keyword(std::string_view w) {
    static constexpr std::array<std::string_view, 35> kKeywords = {
        "False", "None",   "True",    "and",      "as",       "assert", "async",
        "await", "break",  "class",   "continue", "def",      "del",    "elif",
        "else",  "except", "finally", "for",      "from",     "global", "if",
        "import", "in",    "is",      "lambda",   "nonlocal", "not",    "or",
        "pass",  "raise",  "return",  "try",      "while",    "with",   "yield",
    };
    return std::find(kKeywords.begin(), kKeywords.end(), w) != kKeywords.end();
}

bool is_augassign_op(std::string_view op) {
    static constexpr std::array<std::string_view, 13> kOps = {
        "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**=",
    };
    return std::find(kOps.begin(), kOps.end(), op) != kOps.end();
}

void append(PyNode& owner, std::vector<PyNode>&& nodes) {
    for (auto& n : nodes) {
        owner.children.push_back(std::move(n));
    }
}

// f-string 필드는 "(식)" 으로 감싸 따로 파싱하므로 위치를 원본 기준으로 옮긴다
void shift_positions(PyNode& node, std::uint32_t line, std::uint32_t col) {
    if (node.line == 1) {
        node.col = node.col > 0 ? node.col - 1 + col : col;
    }
    node.line = node.line == 0 ? line : node.line + line - 1;
    for (auto& child : node.children) {
        shift_positions(child, line, col);
    }
}

class PyParserState {
public:
    PyParserState(std::vector<PyToken> tokens, int depth)
        : tokens_(std::move(tokens))
        , depth_(depth) {}

    PyNode parse_module();
    PyNode parse_fstring_body();

private:
    class DepthGuard {
    public:
        explicit DepthGuard(PyParserState& state)
            : state_(state) {
            if (++state_.depth_ > kMaxPyDepth) {
                const PyToken& t = state_.peek();
                throw PySyntaxError(ParseErrorCode::kTooDeep, "too many nested blocks or parentheses",
                                    t.line, t.col);
            }
        }
        ~DepthGuard() { --state_.depth_; }

        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        PyParserState& state_;
    };

    // ── 토큰 접근 ───────────────────────────────────────────────────────
    [[nodiscard]] const PyToken& peek(std::size_t ahead = 0) const {
        return tokens_[std::min(pos_ + ahead, tokens_.size() - 1)];
    }
    const PyToken& take() {
        const PyToken& t = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return t;
    }
    [[nodiscard]] bool is_op(std::string_view op, std::size_t ahead = 0) const {
        const PyToken& t = peek(ahead);
        return t.type == PyTokenType::kOp && t.text == op;
    }
    [[nodiscard]] bool is_kw(std::string_view kw, std::size_t ahead = 0) const {
        const PyToken& t = peek(ahead);
        return t.type == PyTokenType::kName && t.text == kw;
    }
    bool accept_op(std::string_view op) {
        if (!is_op(op)) {
            return false;
        }
        take();
        return true;
    }
    bool accept_kw(std::string_view kw) {
        if (!is_kw(kw)) {
            return false;
        }
        take();
        return true;
    }
    void expect_op(std::string_view op) {
        if (!accept_op(op)) {
            fail(peek(), fmt::format("expected '{}'", op));
        }
    }
    void expect_kw(std::string_view kw) {
        if (!accept_kw(kw)) {
            fail(peek(), fmt::format("expected '{}'", kw));
        }
    }
    void expect_newline() {
        const PyToken& t = peek();
        if (t.type != PyTokenType::kNewline) {
            fail(t);
        }
        take();
    }
    std::string expect_identifier() {
        const PyToken& t = peek();
        if (t.type != PyTokenType::kName || is_keyword(t.text)) {
            fail(t);
        }
        return take().text;
    }

    [[noreturn]] void fail(const PyToken& at, const std::string& message = "invalid syntax") const {
        throw PySyntaxError(ParseErrorCode::kInvalidSyntax, message, at.line, at.col);
    }

    [[nodiscard]] static PyNode make(PyNodeKind kind, const PyToken& at) {
        PyNode n;
        n.kind = kind;
        n.line = at.line;
        n.col  = at.col;
        return n;
    }
    [[nodiscard]] static PyNode make(PyNodeKind kind, const PyNode& at) {
        PyNode n;
        n.kind = kind;
        n.line = at.line;
        n.col  = at.col;
        return n;
    }

    [[nodiscard]] bool starts_expression() const;
    [[nodiscard]] bool at_comprehension() const {
        return is_kw("for") || (is_kw("async") && is_kw("for", 1));
    }

    // ── 문 ──────────────────────────────────────────────────────────────
    void                parse_statement(std::vector<PyNode>& out);
    void                parse_simple_statements(std::vector<PyNode>& out);
    PyNode              parse_simple_statement();
    PyNode              parse_assignment_value();
    std::vector<PyNode> parse_block();
    PyNode              parse_if();
    PyNode              parse_while();
    PyNode              parse_for(bool is_async, const PyToken& start);
    PyNode              parse_try();
    PyNode              parse_with(bool is_async, const PyToken& start);
    PyNode              parse_with_item();
    PyNode              parse_funcdef(std::vector<PyNode> decorators, bool is_async, const PyToken& start);
    PyNode              parse_classdef(std::vector<PyNode> decorators, const PyToken& start);
    PyNode              parse_decorated();
    void                parse_type_params(PyNode& owner);
    void                parse_parameters(PyNode& owner, std::string_view closing, bool annotations);
    PyNode              parse_import();
    PyNode              parse_from_import();
    std::string         parse_dotted_name();

    // ── 식 ──────────────────────────────────────────────────────────────
    PyNode parse_star_expressions();
    PyNode parse_star_expression();
    PyNode parse_named_expression();
    PyNode parse_expression();
    PyNode parse_lambda();
    PyNode parse_disjunction();
    PyNode parse_conjunction();
    PyNode parse_inversion();
    PyNode parse_comparison();
    PyNode parse_binary(PyNode (PyParserState::*next)(), std::initializer_list<std::string_view> ops);
    PyNode parse_bitor();
    PyNode parse_bitxor();
    PyNode parse_bitand();
    PyNode parse_shift();
    PyNode parse_sum();
    PyNode parse_term();
    PyNode parse_factor();
    PyNode parse_power();
    PyNode parse_await_primary();
    PyNode parse_primary();
    PyNode parse_atom();
    PyNode parse_paren_atom();
    PyNode parse_list_atom();
    PyNode parse_brace_atom();
    PyNode parse_strings();
    PyNode parse_fstring_field(const FStringField& field);
    PyNode parse_yield();
    PyNode parse_star_targets();
    PyNode parse_star_target();
    PyNode parse_slices();
    PyNode parse_slice();
    void   parse_call_arguments(PyNode& call);
    void   parse_comprehension_clauses(PyNode& owner);

    std::vector<PyToken> tokens_;
    std::size_t          pos_{0};
    int                  depth_{0};
};

bool PyParserState::starts_expression() const {
    const PyToken& t = peek();
    switch (t.type) {
        case PyTokenType::kName:
            return !is_keyword(t.text) || t.text == "not" || t.text == "lambda" || t.text == "await"
                || t.text == "None" || t.text == "True" || t.text == "False";
        case PyTokenType::kNumber:
        case PyTokenType::kString:
            return true;
        case PyTokenType::kOp:
            return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" || t.text == "+"
                || t.text == "~" || t.text == "*" || t.text == "...";
        default:
            return false;
    }
}

// ===========================================================================
// 문
// ===========================================================================

PyNode PyParserState::parse_module() {
    PyNode module;
    module.kind = PyNodeKind::kModule;
    while (peek().type != PyTokenType::kEndMarker) {
        const PyToken& t = peek();
        if (t.type == PyTokenType::kNewline) {
            take();
            continue;
        }
        if (t.type == PyTokenType::kIndent) {
            fail(t, "unexpected indent");
        }
        if (t.type == PyTokenType::kDedent) {
            fail(t, "unindent does not match any outer indentation level");
        }
        parse_statement(module.children);
    }
    return module;
}

// f-string 필드 "(식)" 토큰열 전용 진입점
PyNode PyParserState::parse_fstring_body() {
    PyNode expr = parse_star_expressions();
    expect_newline();
    if (peek().type != PyTokenType::kEndMarker) {
        fail(peek());
    }
    return expr;
}

void PyParserState::parse_statement(std::vector<PyNode>& out) {
    DepthGuard guard(*this);

    const PyToken& t = peek();
    if (t.type == PyTokenType::kOp && t.text == "@") {
        out.push_back(parse_decorated());
        return;
    }
    if (t.type == PyTokenType::kName) {
        if (t.text == "if") {
            out.push_back(parse_if());
            return;
        }
        if (t.text == "while") {
            out.push_back(parse_while());
            return;
        }
        if (t.text == "for") {
            out.push_back(parse_for(false, t));
            return;
        }
        if (t.text == "try") {
            out.push_back(parse_try());
            return;
        }
        if (t.text == "with") {
            out.push_back(parse_with(false, t));
            return;
        }
        if (t.text == "def") {
            out.push_back(parse_funcdef({}, false, t));
            return;
        }
        if (t.text == "class") {
            out.push_back(parse_classdef({}, t));
            return;
        }
        if (t.text == "async") {
            take();
            if (is_kw("def")) {
                out.push_back(parse_funcdef({}, true, t));
            } else if (is_kw("for")) {
                out.push_back(parse_for(true, t));
            } else if (is_kw("with")) {
                out.push_back(parse_with(true, t));
            } else {
                fail(peek());
            }
            return;
        }
    }
    parse_simple_statements(out);
}

void PyParserState::parse_simple_statements(std::vector<PyNode>& out) {
    out.push_back(parse_simple_statement());
    while (accept_op(";")) {
        if (peek().type == PyTokenType::kNewline) {
            break;
        }
        out.push_back(parse_simple_statement());
    }
    expect_newline();
}

PyNode PyParserState::parse_assignment_value() {
    return is_kw("yield") ? parse_yield() : parse_star_expressions();
}

PyNode PyParserState::parse_simple_statement() {
    const PyToken& t = peek();
    const auto     at_end = [this] {
        const PyToken& n = peek();
        return n.type == PyTokenType::kNewline || n.type == PyTokenType::kEndMarker
            || (n.type == PyTokenType::kOp && n.text == ";");
    };

    if (t.type == PyTokenType::kName) {
        if (t.text == "pass" || t.text == "break" || t.text == "continue") {
            const PyNodeKind kind = t.text == "pass"    ? PyNodeKind::kPass
                                  : t.text == "break"   ? PyNodeKind::kBreak
                                                        : PyNodeKind::kContinue;
            return make(kind, take());
        }
        if (t.text == "return") {
            PyNode n = make(PyNodeKind::kReturn, take());
            if (!at_end()) {
                n.children.push_back(parse_star_expressions());
            }
            return n;
        }
        if (t.text == "raise") {
            PyNode n = make(PyNodeKind::kRaise, take());
            if (!at_end()) {
                n.children.push_back(parse_expression());
                if (accept_kw("from")) {
                    n.children.push_back(parse_expression());
                }
            }
            return n;
        }
        if (t.text == "global" || t.text == "nonlocal") {
            PyNode n = make(t.text == "global" ? PyNodeKind::kGlobal : PyNodeKind::kNonlocal, take());
            do {
                n.names.push_back(expect_identifier());
            } while (accept_op(","));
            return n;
        }
        if (t.text == "del") {
            PyNode n = make(PyNodeKind::kDelete, take());
            n.children.push_back(parse_star_targets());
            return n;
        }
        if (t.text == "assert") {
            PyNode n = make(PyNodeKind::kAssert, take());
            n.children.push_back(parse_expression());
            if (accept_op(",")) {
                n.children.push_back(parse_expression());
            }
            return n;
        }
        if (t.text == "import") {
            return parse_import();
        }
        if (t.text == "from") {
            return parse_from_import();
        }
    }

    // 식 문장 / 대입
    PyNode first = parse_assignment_value();

    if (is_op("=")) {
        PyNode n = make(PyNodeKind::kAssign, first);
        n.children.push_back(std::move(first));
        while (accept_op("=")) {
            n.children.push_back(parse_assignment_value());
        }
        return n;
    }
    if (peek().type == PyTokenType::kOp && is_augassign_op(peek().text)) {
        PyNode n = make(PyNodeKind::kAugAssign, first);
        n.text   = take().text;
        n.children.push_back(std::move(first));
        n.children.push_back(parse_assignment_value());
        return n;
    }
    if (accept_op(":")) {
        PyNode n = make(PyNodeKind::kAnnAssign, first);
        n.children.push_back(std::move(first));
        n.children.push_back(parse_expression());
        if (accept_op("=")) {
            n.children.push_back(parse_assignment_value());
        }
        return n;
    }

    PyNode n = make(PyNodeKind::kExpr, first);
    n.children.push_back(std::move(first));
    return n;
}

std::vector<PyNode> PyParserState::parse_block() {
    expect_op(":");
    std::vector<PyNode> body;
    if (peek().type != PyTokenType::kNewline) {
        parse_simple_statements(body);
        return body;
    }
    take();
    if (peek().type != PyTokenType::kIndent) {
        fail(peek(), "expected an indented block");
    }
    take();
    while (peek().type != PyTokenType::kDedent && peek().type != PyTokenType::kEndMarker) {
        parse_statement(body);
    }
    if (peek().type == PyTokenType::kDedent) {
        take();
    }
    return body;
}

// if / elif 공용. elif 는 else 자리에 중첩된 If 로 표현한다.
PyNode PyParserState::parse_if() {
    PyNode n = make(PyNodeKind::kIf, take());
    n.children.push_back(parse_named_expression());
    append(n, parse_block());
    if (is_kw("elif")) {
        n.children.push_back(parse_if());
    } else if (accept_kw("else")) {
        append(n, parse_block());
    }
    return n;
}

PyNode PyParserState::parse_while() {
    PyNode n = make(PyNodeKind::kWhile, take());
    n.children.push_back(parse_named_expression());
    append(n, parse_block());
    if (accept_kw("else")) {
        append(n, parse_block());
    }
    return n;
}

PyNode PyParserState::parse_for(bool is_async, const PyToken& start) {
    PyNode n = make(is_async ? PyNodeKind::kAsyncFor : PyNodeKind::kFor, start);
    expect_kw("for");
    n.children.push_back(parse_star_targets());
    expect_kw("in");
    n.children.push_back(parse_star_expressions());
    append(n, parse_block());
    if (accept_kw("else")) {
        append(n, parse_block());
    }
    return n;
}

PyNode PyParserState::parse_try() {
    PyNode n = make(PyNodeKind::kTry, take());
    append(n, parse_block());

    bool has_handler = false;
    while (is_kw("except")) {
        has_handler = true;
        PyNode handler = make(PyNodeKind::kExceptHandler, take());
        accept_op("*");
        if (!is_op(":")) {
            handler.children.push_back(parse_expression());
            if (accept_kw("as")) {
                handler.text = expect_identifier();
            }
        }
        append(handler, parse_block());
        n.children.push_back(std::move(handler));
    }
    if (has_handler && accept_kw("else")) {
        append(n, parse_block());
    }
    if (accept_kw("finally")) {
        append(n, parse_block());
    } else if (!has_handler) {
        fail(peek(), "expected 'except' or 'finally' block");
    }
    return n;
}

PyNode PyParserState::parse_with_item() {
    PyNode item = make(PyNodeKind::kWithItem, peek());
    item.children.push_back(parse_expression());
    if (accept_kw("as")) {
        item.children.push_back(parse_star_target());
    }
    return item;
}

PyNode PyParserState::parse_with(bool is_async, const PyToken& start) {
    PyNode n = make(is_async ? PyNodeKind::kAsyncWith : PyNodeKind::kWith, start);
    expect_kw("with");

    // with (a as x, b as y): 형태를 먼저 시도하고, 아니면 일반 식으로 되돌린다
    bool parenthesized = false;
    if (is_op("(")) {
        const std::size_t saved = pos_;
        try {
            take();
            std::vector<PyNode> items;
            while (!is_op(")")) {
                items.push_back(parse_with_item());
                if (!accept_op(",")) {
                    break;
                }
            }
            expect_op(")");
            if (!is_op(":") || items.empty()) {
                fail(peek());
            }
            append(n, std::move(items));
            parenthesized = true;
        } catch (const PySyntaxError&) {
            pos_ = saved;
            n.children.clear();
        }
    }
    if (!parenthesized) {
        do {
            n.children.push_back(parse_with_item());
        } while (accept_op(","));
    }
    append(n, parse_block());
    return n;
}

PyNode PyParserState::parse_decorated() {
    std::vector<PyNode> decorators;
    while (accept_op("@")) {
        decorators.push_back(parse_named_expression());
        expect_newline();
    }
    const PyToken& t = peek();
    if (t.type == PyTokenType::kName) {
        if (t.text == "def") {
            return parse_funcdef(std::move(decorators), false, t);
        }
        if (t.text == "class") {
            return parse_classdef(std::move(decorators), t);
        }
        if (t.text == "async" && is_kw("def", 1)) {
            take();
            return parse_funcdef(std::move(decorators), true, t);
        }
    }
    fail(t);
}

// def f[T: int, *Ts, **P]
void PyParserState::parse_type_params(PyNode& owner) {
    if (!accept_op("[")) {
        return;
    }
    while (!is_op("]")) {
        if (!accept_op("**")) {
            accept_op("*");
        }
        PyNode param = make(PyNodeKind::kArg, peek());
        param.text   = expect_identifier();
        if (accept_op(":")) {
            param.children.push_back(parse_expression());
        }
        if (accept_op("=")) {
            param.children.push_back(parse_expression());
        }
        owner.children.push_back(std::move(param));
        if (!accept_op(",")) {
            break;
        }
    }
    expect_op("]");
}

void PyParserState::parse_parameters(PyNode& owner, std::string_view closing, bool annotations) {
    while (!is_op(closing)) {
        if (accept_op("/")) {
            if (!accept_op(",")) {
                break;
            }
            continue;
        }
        const bool starred = accept_op("*") || accept_op("**");
        if (starred && (is_op(",") || is_op(closing))) {
            // 키워드 전용 구분자 '*'
            if (!accept_op(",")) {
                break;
            }
            continue;
        }
        PyNode arg = make(PyNodeKind::kArg, peek());
        arg.text   = expect_identifier();
        if (annotations && accept_op(":")) {
            arg.children.push_back(is_op("*") ? parse_star_expression() : parse_expression());
        }
        if (!starred && accept_op("=")) {
            arg.children.push_back(parse_expression());
        }
        owner.children.push_back(std::move(arg));
        if (!accept_op(",")) {
            break;
        }
    }
}

PyNode PyParserState::parse_funcdef(std::vector<PyNode> decorators, bool is_async, const PyToken& start) {
    PyNode n = make(is_async ? PyNodeKind::kAsyncFunctionDef : PyNodeKind::kFunctionDef, start);
    expect_kw("def");
    n.text = expect_identifier();
    append(n, std::move(decorators));
    parse_type_params(n);
    expect_op("(");
    parse_parameters(n, ")", true);
    expect_op(")");
    if (accept_op("->")) {
        n.children.push_back(parse_expression());
    }
    append(n, parse_block());
    return n;
}

PyNode PyParserState::parse_classdef(std::vector<PyNode> decorators, const PyToken& start) {
    PyNode n = make(PyNodeKind::kClassDef, start);
    expect_kw("class");
    n.text = expect_identifier();
    append(n, std::move(decorators));
    parse_type_params(n);
    if (accept_op("(")) {
        parse_call_arguments(n);
        expect_op(")");
    }
    append(n, parse_block());
    return n;
}

std::string PyParserState::parse_dotted_name() {
    std::string name = expect_identifier();
    while (accept_op(".")) {
        name += '.';
        name += expect_identifier();
    }
    return name;
}

PyNode PyParserState::parse_import() {
    PyNode n = make(PyNodeKind::kImport, take());
    do {
        n.names.push_back(parse_dotted_name());
        if (accept_kw("as")) {
            (void)expect_identifier();
        }
    } while (accept_op(","));
    return n;
}

PyNode PyParserState::parse_from_import() {
    PyNode n = make(PyNodeKind::kImportFrom, take());

    // 선행 점: "." 또는 "..." 토큰
    for (;;) {
        if (accept_op(".")) {
            n.level += 1;
        } else if (accept_op("...")) {
            n.level += 3;
        } else {
            break;
        }
    }
    if (!is_kw("import")) {
        n.text = parse_dotted_name();
    } else if (n.level == 0) {
        fail(peek());
    }
    expect_kw("import");

    if (accept_op("*")) {
        n.names.emplace_back("*");
        return n;
    }
    const bool parenthesized = accept_op("(");
    do {
        if (parenthesized && is_op(")")) {
            break;
        }
        n.names.push_back(expect_identifier());
        if (accept_kw("as")) {
            (void)expect_identifier();
        }
    } while (accept_op(","));
    if (parenthesized) {
        expect_op(")");
    }
    return n;
}

// ===========================================================================
// 식
// ===========================================================================

PyNode PyParserState::parse_star_expressions() {
    PyNode first = parse_star_expression();
    if (!is_op(",")) {
        return first;
    }
    PyNode tuple = make(PyNodeKind::kTuple, first);
    tuple.children.push_back(std::move(first));
    while (accept_op(",")) {
        if (!starts_expression()) {
            break;
        }
        tuple.children.push_back(parse_star_expression());
    }
    return tuple;
}

PyNode PyParserState::parse_star_expression() {
    if (is_op("*")) {
        PyNode n = make(PyNodeKind::kStarred, take());
        n.children.push_back(parse_bitor());
        return n;
    }
    return parse_expression();
}

PyNode PyParserState::parse_named_expression() {
    const PyToken& t = peek();
    if (t.type == PyTokenType::kName && !is_keyword(t.text) && is_op(":=", 1)) {
        PyNode n      = make(PyNodeKind::kNamedExpr, t);
        PyNode target = make(PyNodeKind::kName, take());
        target.text   = t.text;
        take();  // :=
        n.children.push_back(std::move(target));
        n.children.push_back(parse_expression());
        return n;
    }
    return parse_expression();
}

PyNode PyParserState::parse_expression() {
    if (is_kw("lambda")) {
        return parse_lambda();
    }
    PyNode body = parse_disjunction();
    if (!accept_kw("if")) {
        return body;
    }
    PyNode n = make(PyNodeKind::kIfExp, body);
    n.children.push_back(std::move(body));
    n.children.push_back(parse_disjunction());
    expect_kw("else");
    n.children.push_back(parse_expression());
    return n;
}

PyNode PyParserState::parse_lambda() {
    DepthGuard guard(*this);
    PyNode     n = make(PyNodeKind::kLambda, take());
    parse_parameters(n, ":", false);
    expect_op(":");
    n.children.push_back(parse_expression());
    return n;
}

PyNode PyParserState::parse_disjunction() {
    PyNode left = parse_conjunction();
    if (!is_kw("or")) {
        return left;
    }
    PyNode n = make(PyNodeKind::kBoolOp, left);
    n.text   = "or";
    n.children.push_back(std::move(left));
    while (accept_kw("or")) {
        n.children.push_back(parse_conjunction());
    }
    return n;
}

PyNode PyParserState::parse_conjunction() {
    PyNode left = parse_inversion();
    if (!is_kw("and")) {
        return left;
    }
    PyNode n = make(PyNodeKind::kBoolOp, left);
    n.text   = "and";
    n.children.push_back(std::move(left));
    while (accept_kw("and")) {
        n.children.push_back(parse_inversion());
    }
    return n;
}

PyNode PyParserState::parse_inversion() {
    if (is_kw("not")) {
        DepthGuard guard(*this);
        PyNode     n = make(PyNodeKind::kUnaryOp, take());
        n.text       = "not";
        n.children.push_back(parse_inversion());
        return n;
    }
    return parse_comparison();
}

PyNode PyParserState::parse_comparison() {
    PyNode left = parse_bitor();

    std::vector<std::string> ops;
    std::vector<PyNode>      operands;
    for (;;) {
        const PyToken& t = peek();
        std::string    op;
        if (t.type == PyTokenType::kOp
            && (t.text == "<" || t.text == ">" || t.text == "==" || t.text == ">=" || t.text == "<="
                || t.text == "!=")) {
            op = take().text;
        } else if (is_kw("in")) {
            take();
            op = "in";
        } else if (is_kw("not") && is_kw("in", 1)) {
            take();
            take();
            op = "not in";
        } else if (is_kw("is")) {
            take();
            op = accept_kw("not") ? "is not" : "is";
        } else {
            break;
        }
        ops.push_back(std::move(op));
        operands.push_back(parse_bitor());
    }
    if (ops.empty()) {
        return left;
    }
    PyNode n = make(PyNodeKind::kCompare, left);
    n.names  = std::move(ops);
    n.children.push_back(std::move(left));
    append(n, std::move(operands));
    return n;
}

PyNode PyParserState::parse_binary(PyNode (PyParserState::*next)(),
                                   std::initializer_list<std::string_view> ops) {
    PyNode left = (this->*next)();
    for (;;) {
        const PyToken& t = peek();
        if (t.type != PyTokenType::kOp
            || std::find(ops.begin(), ops.end(), std::string_view(t.text)) == ops.end()) {
            return left;
        }
        PyNode n = make(PyNodeKind::kBinOp, left);
        n.text   = take().text;
        n.children.push_back(std::move(left));
        n.children.push_back((this->*next)());
        left = std::move(n);
    }
}

PyNode PyParserState::parse_bitor() { return parse_binary(&PyParserState::parse_bitxor, {"|"}); }
PyNode PyParserState::parse_bitxor() { return parse_binary(&PyParserState::parse_bitand, {"^"}); }
PyNode PyParserState::parse_bitand() { return parse_binary(&PyParserState::parse_shift, {"&"}); }
PyNode PyParserState::parse_shift() { return parse_binary(&PyParserState::parse_sum, {"<<", ">>"}); }
PyNode PyParserState::parse_sum() { return parse_binary(&PyParserState::parse_term, {"+", "-"}); }
PyNode PyParserState::parse_term() {
    return parse_binary(&PyParserState::parse_factor, {"*", "/", "//", "%", "@"});
}

PyNode PyParserState::parse_factor() {
    if (is_op("+") || is_op("-") || is_op("~")) {
        DepthGuard guard(*this);
        PyNode     n = make(PyNodeKind::kUnaryOp, peek());
        n.text       = take().text;
        n.children.push_back(parse_factor());
        return n;
    }
    return parse_power();
}

PyNode PyParserState::parse_power() {
    PyNode base = parse_await_primary();
    if (!is_op("**")) {
        return base;
    }
    PyNode n = make(PyNodeKind::kBinOp, base);
    n.text   = take().text;
    n.children.push_back(std::move(base));
    n.children.push_back(parse_factor());
    return n;
}

PyNode PyParserState::parse_await_primary() {
    if (is_kw("await")) {
        PyNode n = make(PyNodeKind::kAwait, take());
        n.children.push_back(parse_primary());
        return n;
    }
    return parse_primary();
}

PyNode PyParserState::parse_primary() {
    PyNode n = parse_atom();
    for (;;) {
        if (accept_op(".")) {
            PyNode attr = make(PyNodeKind::kAttribute, n);
            attr.text   = expect_identifier();
            attr.children.push_back(std::move(n));
            n = std::move(attr);
            continue;
        }
        if (accept_op("(")) {
            PyNode call = make(PyNodeKind::kCall, n);
            call.children.push_back(std::move(n));
            parse_call_arguments(call);
            expect_op(")");
            n = std::move(call);
            continue;
        }
        if (accept_op("[")) {
            PyNode sub = make(PyNodeKind::kSubscript, n);
            sub.children.push_back(std::move(n));
            sub.children.push_back(parse_slices());
            expect_op("]");
            n = std::move(sub);
            continue;
        }
        return n;
    }
}

void PyParserState::parse_call_arguments(PyNode& call) {
    while (!is_op(")")) {
        const PyToken& t = peek();
        if (is_op("*")) {
            PyNode star = make(PyNodeKind::kStarred, take());
            star.children.push_back(parse_expression());
            call.children.push_back(std::move(star));
        } else if (is_op("**")) {
            PyNode kw = make(PyNodeKind::kKeyword, take());
            kw.children.push_back(parse_expression());
            call.children.push_back(std::move(kw));
        } else if (t.type == PyTokenType::kName && !is_keyword(t.text) && is_op("=", 1)) {
            PyNode kw = make(PyNodeKind::kKeyword, t);
            kw.text   = take().text;
            take();  // =
            kw.children.push_back(parse_expression());
            call.children.push_back(std::move(kw));
        } else {
            PyNode arg = parse_named_expression();
            if (at_comprehension()) {
                PyNode gen = make(PyNodeKind::kGeneratorExp, arg);
                gen.children.push_back(std::move(arg));
                parse_comprehension_clauses(gen);
                arg = std::move(gen);
            }
            call.children.push_back(std::move(arg));
        }
        if (!accept_op(",")) {
            break;
        }
    }
}

PyNode PyParserState::parse_slices() {
    PyNode first = parse_slice();
    if (!is_op(",")) {
        return first;
    }
    PyNode tuple = make(PyNodeKind::kTuple, first);
    tuple.children.push_back(std::move(first));
    while (accept_op(",")) {
        if (is_op("]")) {
            break;
        }
        tuple.children.push_back(parse_slice());
    }
    return tuple;
}

PyNode PyParserState::parse_slice() {
    if (is_op("*")) {
        return parse_star_expression();
    }
    const PyToken&        start = peek();
    std::optional<PyNode> lower;
    if (!is_op(":")) {
        lower = parse_named_expression();
        if (!is_op(":")) {
            return std::move(*lower);
        }
    }
    PyNode s = make(PyNodeKind::kSlice, start);
    if (lower) {
        s.children.push_back(std::move(*lower));
    }
    expect_op(":");
    if (starts_expression()) {
        s.children.push_back(parse_expression());
    }
    if (accept_op(":") && starts_expression()) {
        s.children.push_back(parse_expression());
    }
    return s;
}

PyNode PyParserState::parse_atom() {
    DepthGuard guard(*this);

    const PyToken& t = peek();
    switch (t.type) {
        case PyTokenType::kName: {
            if (t.text == "True" || t.text == "False" || t.text == "None") {
                PyNode n = make(PyNodeKind::kConstant, take());
                n.text   = t.text;
                return n;
            }
            if (is_keyword(t.text)) {
                fail(t);
            }
            PyNode n = make(PyNodeKind::kName, take());
            n.text   = t.text;
            return n;
        }
        case PyTokenType::kNumber: {
            PyNode n = make(PyNodeKind::kConstant, take());
            n.text   = t.text;
            return n;
        }
        case PyTokenType::kString:
            return parse_strings();
        case PyTokenType::kOp:
            if (t.text == "...") {
                PyNode n = make(PyNodeKind::kConstant, take());
                n.text   = t.text;
                return n;
            }
            if (t.text == "(") {
                return parse_paren_atom();
            }
            if (t.text == "[") {
                return parse_list_atom();
            }
            if (t.text == "{") {
                return parse_brace_atom();
            }
            fail(t);
        default:
            fail(t);
    }
}

PyNode PyParserState::parse_paren_atom() {
    const PyToken& open = take();
    if (accept_op(")")) {
        return make(PyNodeKind::kTuple, open);
    }
    if (is_kw("yield")) {
        PyNode y = parse_yield();
        expect_op(")");
        return y;
    }

    PyNode first = is_op("*") ? parse_star_expression() : parse_named_expression();
    if (at_comprehension()) {
        PyNode gen = make(PyNodeKind::kGeneratorExp, open);
        gen.children.push_back(std::move(first));
        parse_comprehension_clauses(gen);
        expect_op(")");
        return gen;
    }
    if (is_op(",")) {
        PyNode tuple = make(PyNodeKind::kTuple, open);
        tuple.children.push_back(std::move(first));
        while (accept_op(",")) {
            if (is_op(")")) {
                break;
            }
            tuple.children.push_back(is_op("*") ? parse_star_expression() : parse_named_expression());
        }
        expect_op(")");
        return tuple;
    }
    expect_op(")");
    return first;
}

PyNode PyParserState::parse_list_atom() {
    PyNode list = make(PyNodeKind::kList, take());
    if (accept_op("]")) {
        return list;
    }
    PyNode first = is_op("*") ? parse_star_expression() : parse_named_expression();
    if (at_comprehension()) {
        list.kind = PyNodeKind::kListComp;
        list.children.push_back(std::move(first));
        parse_comprehension_clauses(list);
        expect_op("]");
        return list;
    }
    list.children.push_back(std::move(first));
    while (accept_op(",")) {
        if (is_op("]")) {
            break;
        }
        list.children.push_back(is_op("*") ? parse_star_expression() : parse_named_expression());
    }
    expect_op("]");
    return list;
}

PyNode PyParserState::parse_brace_atom() {
    PyNode n = make(PyNodeKind::kDict, take());
    if (accept_op("}")) {
        return n;
    }

    // dict 항목 하나: **mapping 또는 key: value
    const auto dict_entry = [this](PyNode& dict) {
        if (accept_op("**")) {
            dict.children.push_back(parse_bitor());
            return;
        }
        dict.children.push_back(parse_expression());
        expect_op(":");
        dict.children.push_back(parse_expression());
    };

    if (is_op("**")) {
        dict_entry(n);
    } else {
        PyNode first = is_op("*") ? parse_star_expression() : parse_named_expression();
        if (accept_op(":")) {
            n.children.push_back(std::move(first));
            n.children.push_back(parse_expression());
            if (at_comprehension()) {
                n.kind = PyNodeKind::kDictComp;
                parse_comprehension_clauses(n);
                expect_op("}");
                return n;
            }
        } else {
            n.kind = PyNodeKind::kSet;
            n.children.push_back(std::move(first));
            if (at_comprehension()) {
                n.kind = PyNodeKind::kSetComp;
                parse_comprehension_clauses(n);
                expect_op("}");
                return n;
            }
            while (accept_op(",")) {
                if (is_op("}")) {
                    break;
                }
                n.children.push_back(is_op("*") ? parse_star_expression() : parse_named_expression());
            }
            expect_op("}");
            return n;
        }
    }

    while (accept_op(",")) {
        if (is_op("}")) {
            break;
        }
        dict_entry(n);
    }
    expect_op("}");
    return n;
}

// 인접한 문자열 리터럴은 하나로 이어진다. f-string 이 섞이면 JoinedStr.
PyNode PyParserState::parse_strings() {
    const PyToken& first = peek();
    PyNode         n     = make(PyNodeKind::kConstant, first);
    while (peek().type == PyTokenType::kString) {
        const PyToken& t = take();
        if (!t.is_fstring) {
            continue;
        }
        n.kind = PyNodeKind::kJoinedStr;
        for (const auto& field : t.fields) {
            n.children.push_back(parse_fstring_field(field));
        }
    }
    return n;
}

PyNode PyParserState::parse_fstring_field(const FStringField& field) {
    auto tokens = tokenize_python("(" + field.expression + ")");
    if (!tokens) {
        throw PySyntaxError(ParseErrorCode::kInvalidSyntax,
                            fmt::format("f-string: {}", tokens.error().message), field.line, field.col);
    }
    PyParserState nested(std::move(*tokens), depth_ + 1);
    PyNode        expr;
    try {
        expr = nested.parse_fstring_body();
    } catch (const PySyntaxError& e) {
        throw PySyntaxError(e.code(), fmt::format("f-string: {}", e.what()), field.line, field.col);
    }
    shift_positions(expr, field.line, field.col);
    return expr;
}

PyNode PyParserState::parse_yield() {
    const PyToken& t = take();
    if (accept_kw("from")) {
        PyNode n = make(PyNodeKind::kYieldFrom, t);
        n.children.push_back(parse_expression());
        return n;
    }
    PyNode n = make(PyNodeKind::kYield, t);
    if (starts_expression()) {
        n.children.push_back(parse_star_expressions());
    }
    return n;
}

// for 대상 / del 대상: 'in' 을 비교 연산자로 먹지 않도록 비트 OR 수준까지만 읽는다
PyNode PyParserState::parse_star_targets() {
    PyNode first = parse_star_target();
    if (!is_op(",")) {
        return first;
    }
    PyNode tuple = make(PyNodeKind::kTuple, first);
    tuple.children.push_back(std::move(first));
    while (accept_op(",")) {
        if (!starts_expression()) {
            break;
        }
        tuple.children.push_back(parse_star_target());
    }
    return tuple;
}

PyNode PyParserState::parse_star_target() {
    if (is_op("*")) {
        PyNode n = make(PyNodeKind::kStarred, take());
        n.children.push_back(parse_star_target());
        return n;
    }
    return parse_bitor();
}

void PyParserState::parse_comprehension_clauses(PyNode& owner) {
    while (at_comprehension()) {
        PyNode clause = make(PyNodeKind::kComprehension, peek());
        if (accept_kw("async")) {
            clause.level = 1;
        }
        expect_kw("for");
        clause.children.push_back(parse_star_targets());
        expect_kw("in");
        clause.children.push_back(parse_disjunction());
        while (accept_kw("if")) {
            clause.children.push_back(parse_disjunction());
        }
        owner.children.push_back(std::move(clause));
    }
}

}  // namespace

std::expected<PyNode, ParseError> PyParser::parse(std::string_view source) const {
    auto tokens = tokenize_python(source);
    if (!tokens) {
        spdlog::debug("py_parser: tokenize failed: {} (line {})", tokens.error().message,
                      tokens.error().line);
        return std::unexpected(tokens.error());
    }

    try {
        PyParserState state(std::move(*tokens), 0);
        return state.parse_module();
    } catch (const PySyntaxError& e) {
        ParseError err;
        err.code    = e.code();
        err.message = e.what();
        err.line    = e.line();
        err.column  = e.col();
        spdlog::debug("py_parser: {} (line {})", err.message, err.line);
        return std::unexpected(std::move(err));
    }
}
