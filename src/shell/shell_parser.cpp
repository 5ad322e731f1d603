// ---------------------------------------------------------------------------
// shell_parser.cpp
//
// bash 계열 명령 파서 구현.
//
// [구조]
// - ParserState 하나가 렉서와 파서를 겸한다. 렉서는 토큰 하나를 미리 읽어
//   cache_ 에 보관하며(1-토큰 lookahead), 토큰을 읽는 시점에 pos_ 가 전진한다.
// - $(...) / <(...) 는 단어를 읽는 도중 같은 ParserState 로 재귀 파싱한다.
//   재진입 시점에 cache_ 는 항상 비어 있다 (바깥 peek 가 토큰을 만드는 중).
// - `...` 는 이스케이프를 푼 본문을 별도의 ParserState 로 파싱한다.
// - 개행 토큰을 소비하는 순간 대기 중인 heredoc 본문을 읽는다.
//
// [오류 처리]
// 내부에서는 SyntaxError 예외로 즉시 빠져나오고, ShellParser::parse 경계에서
// std::unexpected(ParseError) 로 변환한다. 예외가 parse() 밖으로 새지 않는다.
// ---------------------------------------------------------------------------

#include "shell/shell_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

// 파서 재귀 한도. 파서는 명령 하나당 여러 단계를 재귀하므로
// 엔진의 중첩 한도보다 넉넉하게 잡는다.
constexpr int kMaxParseDepth = kMaxNestingDepth * 4;

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(ParseErrorCode code, const std::string& message, std::size_t offset)
        : std::runtime_error(message)
        , code_(code)
        , offset_(offset) {}

    [[nodiscard]] ParseErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

private:
    ParseErrorCode code_;
    std::size_t    offset_;
};

enum class TokenType : std::uint8_t {
    kWord     = 0,
    kOperator = 1,  // ; ;; ;& ;;& & && | || |& ( )
    kRedirect = 2,
    kNewline  = 3,
    kEof      = 4,
};

struct Token {
    TokenType          type{TokenType::kEof};
    std::string        text{};
    Word               word{};
    RedirectKind       redirect_kind{RedirectKind::kOutput};
    std::optional<int> fd{};
    bool               strip_tabs{false};  // <<-
    std::size_t        offset{0};
};

// [[ ... ]] 내부 전용 토큰
struct CondToken {
    bool        op{false};  // && || ( )
    std::string text{};
    Word        word{};
};

// 단어 스캔 모드: 종료 조건과 따옴표 해석이 달라진다
enum class ScanMode : std::uint8_t {
    kWord,         // 일반 단어: 메타문자에서 종료
    kRegex,        // [[ x =~ re ]] 의 우변: 깊이 0 의 공백에서 종료
    kDoubleQuote,  // "..." 내부: " 에서 종료
    kParam,        // ${...} 내부: 깊이 0 의 } 에서 종료
    kArith,        // $((...)) / ((...)) 내부: 깊이 0 의 ) 에서 종료
    kArithFor,     // for ((a; b; c)) 의 각 절: 깊이 0 의 ; 또는 ) 에서 종료
};

struct PendingHeredoc {
    std::string                  delimiter{};
    bool                         strip_tabs{false};
    std::shared_ptr<std::string> body{};
};

bool is_metachar(char c) {
    switch (c) {
        case ' ': case '\t': case '\r': case '\n':
        case ';': case '&': case '|': case '(': case ')': case '<': case '>':
            return true;
        default:
            return false;
    }
}

bool is_reserved_word(std::string_view w) {
    static constexpr std::string_view kReserved[] = {
        "if", "then", "else", "elif", "fi", "do", "done", "case", "esac", "while", "until",
        "for", "select", "in", "function", "time", "coproc", "{", "}", "!", "[[", "]]",
    };
    return std::find(std::begin(kReserved), std::end(kReserved), w) != std::end(kReserved);
}

// 목록(list)을 끝내는 예약어
bool is_list_terminator_word(std::string_view w) {
    return w == "then" || w == "else" || w == "elif" || w == "fi" || w == "do"
        || w == "done" || w == "esac" || w == "}";
}

bool is_unary_test_op(std::string_view w) {
    static constexpr std::string_view kOps[] = {
        "-a", "-b", "-c", "-d", "-e", "-f", "-g", "-h", "-k", "-p", "-r", "-s", "-t",
        "-u", "-w", "-x", "-G", "-L", "-N", "-O", "-S", "-z", "-n", "-o", "-v", "-R",
    };
    return std::find(std::begin(kOps), std::end(kOps), w) != std::end(kOps);
}

bool is_binary_test_op(std::string_view w) {
    static constexpr std::string_view kOps[] = {
        "==", "=", "!=", "=~", "<", ">", "-eq", "-ne", "-lt", "-le", "-gt", "-ge",
        "-nt", "-ot", "-ef",
    };
    return std::find(std::begin(kOps), std::end(kOps), w) != std::end(kOps);
}

// 따옴표나 치환 없이 그대로 쓰인 단어인지 (함수 이름, coproc 이름 판정용)
bool is_plain_word(const Word& w) {
    return !w.text.empty() && w.text == w.value && !w.has_substitution()
        && w.text.find_first_of("'\"\\$`") == std::string::npos;
}

NodePtr box(Node&& node) {
    return std::make_unique<Node>(std::move(node));
}

CondPtr box_cond(CondTerm&& term) {
    return std::make_unique<CondTerm>(std::move(term));
}

// ---------------------------------------------------------------------------
// WordBuilder
//   text(원문) / value(따옴표 제거) / parts(리터럴·치환) 를 동시에 누적한다.
// ---------------------------------------------------------------------------
class WordBuilder {
public:
    struct Snapshot {
        std::size_t text_size{0};
        std::size_t value_size{0};
        std::size_t pending_size{0};
        std::size_t parts_size{0};
    };

    void raw(std::string_view s) { word_.text.append(s); }

    void literal(std::string_view raw_text, std::string_view value_text) {
        word_.text.append(raw_text);
        word_.value.append(value_text);
        pending_.append(value_text);
    }

    void literal(std::string_view text) { literal(text, text); }

    void substitution(std::string_view raw_text, WordPart part) {
        flush();
        word_.text.append(raw_text);
        word_.value.append(raw_text);
        word_.parts.push_back(std::move(part));
    }

    [[nodiscard]] bool empty() const { return word_.text.empty(); }

    // NAME= / NAME+= / NAME[sub]= 직후인지 (배열 대입 name=(a b c) 판정)
    [[nodiscard]] bool is_assignment_prefix() const {
        const std::string& t = word_.text;
        if (t.size() < 2 || t.back() != '=' || !word_.parts.empty() || t != word_.value) {
            return false;
        }
        if (std::isalpha(static_cast<unsigned char>(t[0])) == 0 && t[0] != '_') {
            return false;
        }
        std::size_t i = 1;
        while (i < t.size() && (std::isalnum(static_cast<unsigned char>(t[i])) != 0 || t[i] == '_')) {
            ++i;
        }
        if (i < t.size() && t[i] == '[') {
            const auto close = t.find(']', i);
            if (close == std::string::npos) {
                return false;
            }
            i = close + 1;
        }
        if (i < t.size() && t[i] == '+') {
            ++i;
        }
        return i == t.size() - 1;
    }

    [[nodiscard]] Snapshot snapshot() const {
        return Snapshot{word_.text.size(), word_.value.size(), pending_.size(), word_.parts.size()};
    }

    void restore(const Snapshot& s) {
        word_.text.resize(s.text_size);
        word_.value.resize(s.value_size);
        pending_.resize(s.pending_size);
        word_.parts.erase(word_.parts.begin() + static_cast<std::ptrdiff_t>(s.parts_size),
                          word_.parts.end());
    }

    Word finish() {
        flush();
        return std::move(word_);
    }

private:
    void flush() {
        if (!pending_.empty()) {
            word_.parts.push_back(WordPart{LiteralPart{std::move(pending_)}});
            pending_.clear();
        }
    }

    Word        word_{};
    std::string pending_{};
};

// ---------------------------------------------------------------------------
// ParserState
// ---------------------------------------------------------------------------
class ParserState {
public:
    ParserState(std::string_view src, int depth)
        : src_(src)
        , depth_(depth) {}

    std::vector<Node> parse_program();

private:
    class DepthGuard {
    public:
        explicit DepthGuard(ParserState& state)
            : state_(state) {
            if (++state_.depth_ > kMaxParseDepth) {
                state_.fail(ParseErrorCode::kTooDeep, "nesting too deep");
            }
        }
        ~DepthGuard() { --state_.depth_; }

        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        ParserState& state_;
    };

    // ── 렉서 ────────────────────────────────────────────────────────────
    [[nodiscard]] char at(std::size_t i) const { return i < src_.size() ? src_[i] : '\0'; }

    [[noreturn]] void fail(ParseErrorCode code, const std::string& message) const {
        throw SyntaxError(code, message, pos_);
    }

    [[noreturn]] void fail_unexpected(const Token& t) const {
        switch (t.type) {
            case TokenType::kEof:
                fail(ParseErrorCode::kUnterminated, "unexpected end of input");
            case TokenType::kNewline:
                fail(ParseErrorCode::kUnexpectedToken, "syntax error near unexpected token 'newline'");
            default:
                fail(ParseErrorCode::kUnexpectedToken,
                     fmt::format("syntax error near unexpected token '{}'", t.text));
        }
    }

    void  skip_blanks();
    Token lex_token();
    void  lex_redirect_op(Token& tok);

    const Token& peek();
    Token        take();
    void         advance() { (void)take(); }
    void         skip_newlines();
    void         read_heredoc_bodies();

    [[nodiscard]] bool peek_is_op(std::string_view op) {
        const Token& t = peek();
        return t.type == TokenType::kOperator && t.text == op;
    }
    [[nodiscard]] bool peek_is_reserved(std::string_view w) {
        const Token& t = peek();
        return t.type == TokenType::kWord && t.word.text == w;
    }
    void expect_op(std::string_view op) {
        if (!peek_is_op(op)) {
            fail_unexpected(peek());
        }
        advance();
    }
    void expect_reserved(std::string_view w) {
        if (!peek_is_reserved(w)) {
            const Token& t = peek();
            if (t.type == TokenType::kEof) {
                fail(ParseErrorCode::kUnterminated, fmt::format("unexpected end of input (expected '{}')", w));
            }
            fail_unexpected(t);
        }
        advance();
    }

    // ── 단어 스캐너 ─────────────────────────────────────────────────────
    Word scan_word(ScanMode mode) {
        WordBuilder b;
        scan_into(b, mode);
        return b.finish();
    }
    void scan_into(WordBuilder& b, ScanMode mode);
    void scan_single_quoted(WordBuilder& b);
    void scan_double_quoted(WordBuilder& b);
    void scan_ansi_c_quoted(WordBuilder& b);
    void scan_dollar(WordBuilder& b, ScanMode mode);
    bool try_scan_arith_expansion(WordBuilder& b);
    void scan_command_substitution(WordBuilder& b);
    void scan_process_substitution(WordBuilder& b, char direction);
    void scan_backtick(WordBuilder& b);
    void scan_extglob(WordBuilder& b);
    void scan_array_literal(WordBuilder& b);

    NodePtr parse_substitution_body();
    NodePtr parse_nested_source(const std::string& content);

    // ── 문법 ────────────────────────────────────────────────────────────
    bool    at_list_end();
    bool    at_pipeline_end();
    Node    parse_list(bool stop_at_newline);
    Node    parse_pipeline();
    Node    parse_command();
    Node    parse_simple_command(std::optional<Word> first);
    Node    parse_function_definition(Word name);
    NodePtr parse_compound_body();
    NodePtr parse_do_group();
    void    parse_redirect(std::vector<Redirect>& out);
    void    parse_redirects(std::vector<Redirect>& out);
    bool    starts_compound_command();

    std::optional<Node> try_parse_arith_command();
    Node parse_brace_group();
    Node parse_if();
    If   parse_if_rest();
    Node parse_while(bool until);
    Node parse_for(bool is_select);
    Node parse_for_arith();
    Node parse_case();
    Node parse_function_keyword();
    Node parse_coproc();

    // [[ ... ]]
    Node             parse_cond_command();
    const CondToken& cond_peek();
    CondToken        cond_take();
    CondToken        lex_cond_token();
    Word             take_cond_word();
    Word             take_cond_regex();
    CondTerm         parse_cond_or();
    CondTerm         parse_cond_and();
    CondTerm         parse_cond_not();
    CondTerm         parse_cond_primary();

    std::string_view            src_;
    std::size_t                 pos_{0};
    int                         depth_{0};
    std::optional<Token>        cache_{};
    std::optional<CondToken>    cond_cache_{};
    std::vector<PendingHeredoc> pending_heredocs_{};
    bool                        saw_comment_{false};
    std::string                 last_comment_{};
};

// ===========================================================================
// 렉서
// ===========================================================================

void ParserState::skip_blanks() {
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (c == ' ' || c == '\t' || c == '\r') {
            ++pos_;
            continue;
        }
        if (c == '\\' && at(pos_ + 1) == '\n') {
            pos_ += 2;
            continue;
        }
        if (c == '#') {
            const std::size_t start = pos_;
            while (pos_ < src_.size() && src_[pos_] != '\n') {
                ++pos_;
            }
            saw_comment_  = true;
            last_comment_ = std::string(src_.substr(start, pos_ - start));
            continue;
        }
        break;
    }
}

void ParserState::lex_redirect_op(Token& tok) {
    tok.type = TokenType::kRedirect;
    const char c  = at(pos_);
    const char n  = at(pos_ + 1);
    const char n2 = at(pos_ + 2);

    auto set = [&](std::string_view text, RedirectKind kind) {
        tok.text          = std::string(text);
        tok.redirect_kind = kind;
        pos_ += text.size();
    };

    if (c == '<') {
        if (n == '<' && n2 == '<') {
            set("<<<", RedirectKind::kHereString);
        } else if (n == '<' && n2 == '-') {
            set("<<-", RedirectKind::kHereDoc);
            tok.strip_tabs = true;
        } else if (n == '<') {
            set("<<", RedirectKind::kHereDoc);
        } else if (n == '>') {
            set("<>", RedirectKind::kReadWrite);
        } else if (n == '&') {
            set("<&", RedirectKind::kDupInput);
        } else {
            set("<", RedirectKind::kInput);
        }
    } else if (c == '>') {
        if (n == '>') {
            set(">>", RedirectKind::kAppend);
        } else if (n == '|') {
            set(">|", RedirectKind::kClobber);
        } else if (n == '&') {
            set(">&", RedirectKind::kDupOutput);
        } else {
            set(">", RedirectKind::kOutput);
        }
    } else {
        // '&' 로 시작: &> 또는 &>>
        if (n2 == '>') {
            set("&>>", RedirectKind::kAppendBoth);
        } else {
            set("&>", RedirectKind::kOutputBoth);
        }
    }
}

Token ParserState::lex_token() {
    skip_blanks();

    Token tok;
    tok.offset = pos_;
    if (pos_ >= src_.size()) {
        tok.type = TokenType::kEof;
        return tok;
    }

    const char c = src_[pos_];
    const char n = at(pos_ + 1);

    if (c == '\n') {
        ++pos_;
        tok.type = TokenType::kNewline;
        tok.text = "\n";
        return tok;
    }

    // 2>file, 10>&1 처럼 숫자 바로 뒤에 붙은 리다이렉트
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
        std::size_t j = pos_;
        while (j < src_.size() && std::isdigit(static_cast<unsigned char>(src_[j])) != 0) {
            ++j;
        }
        if ((at(j) == '<' || at(j) == '>') && at(j + 1) != '(') {
            int fd = 0;
            const auto [ptr, ec] = std::from_chars(src_.data() + pos_, src_.data() + j, fd);
            if (ec == std::errc{}) {
                pos_ = j;
                lex_redirect_op(tok);
                tok.fd = fd;
                return tok;
            }
        }
    }

    if ((c == '<' || c == '>') && n != '(') {
        lex_redirect_op(tok);
        return tok;
    }

    auto op = [&](std::string_view text) {
        tok.type = TokenType::kOperator;
        tok.text = std::string(text);
        pos_ += text.size();
        return std::move(tok);
    };

    switch (c) {
        case '&':
            if (n == '&') {
                return op("&&");
            }
            if (n == '>') {
                lex_redirect_op(tok);
                return tok;
            }
            return op("&");
        case '|':
            if (n == '|') {
                return op("||");
            }
            if (n == '&') {
                return op("|&");
            }
            return op("|");
        case ';':
            if (n == ';' && at(pos_ + 2) == '&') {
                return op(";;&");
            }
            if (n == ';') {
                return op(";;");
            }
            if (n == '&') {
                return op(";&");
            }
            return op(";");
        case '(':
            return op("(");
        case ')':
            return op(")");
        default:
            break;
    }

    tok.type = TokenType::kWord;
    tok.word = scan_word(ScanMode::kWord);
    if (tok.word.text.empty()) {
        fail(ParseErrorCode::kInvalidSyntax, fmt::format("unexpected character '{}'", c));
    }
    tok.text = tok.word.text;
    return tok;
}

const Token& ParserState::peek() {
    if (!cache_) {
        // lex_token 은 $(...) 를 만나면 재귀 파싱하며 cache_ 를 잠시 사용한다.
        // 재귀가 끝나면 cache_ 는 다시 비어 있다.
        Token tok = lex_token();
        cache_.emplace(std::move(tok));
    }
    return *cache_;
}

Token ParserState::take() {
    peek();
    Token tok = std::move(*cache_);
    cache_.reset();
    if (tok.type == TokenType::kNewline && !pending_heredocs_.empty()) {
        read_heredoc_bodies();
    }
    return tok;
}

void ParserState::skip_newlines() {
    while (peek().type == TokenType::kNewline) {
        advance();
    }
}

void ParserState::read_heredoc_bodies() {
    for (auto& heredoc : pending_heredocs_) {
        std::string body;
        bool        terminated = false;
        while (pos_ < src_.size()) {
            const auto       eol  = src_.find('\n', pos_);
            std::string_view line = (eol == std::string_view::npos)
                                        ? src_.substr(pos_)
                                        : src_.substr(pos_, eol - pos_);
            pos_ = (eol == std::string_view::npos) ? src_.size() : eol + 1;

            if (heredoc.strip_tabs) {
                while (!line.empty() && line.front() == '\t') {
                    line.remove_prefix(1);
                }
            }
            std::string_view cmp = line;
            if (!cmp.empty() && cmp.back() == '\r') {
                cmp.remove_suffix(1);
            }
            if (cmp == heredoc.delimiter) {
                terminated = true;
                break;
            }
            body.append(line);
            body.push_back('\n');
        }
        if (!terminated) {
            spdlog::debug("shell_parser: here-document '{}' delimited by end of input",
                          heredoc.delimiter);
        }
        *heredoc.body = std::move(body);
    }
    pending_heredocs_.clear();
}

// ===========================================================================
// 단어 스캐너
// ===========================================================================

void ParserState::scan_into(WordBuilder& b, ScanMode mode) {
    int depth = 0;

    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        const char n = at(pos_ + 1);

        // 메타문자보다 먼저 봐야 하는 단어 시작 구문
        if (mode == ScanMode::kWord) {
            if ((c == '<' || c == '>') && n == '(' && b.empty()) {
                scan_process_substitution(b, c);
                continue;
            }
            if (c == '(' && b.is_assignment_prefix()) {
                scan_array_literal(b);
                continue;
            }
        }

        // 종료 조건
        bool stop = false;
        switch (mode) {
            case ScanMode::kWord:
                stop = is_metachar(c);
                break;
            case ScanMode::kRegex:
                stop = depth == 0 && (c == ' ' || c == '\t' || c == '\n');
                break;
            case ScanMode::kDoubleQuote:
                stop = c == '"';
                break;
            case ScanMode::kParam:
                stop = depth == 0 && c == '}';
                break;
            case ScanMode::kArith:
                stop = depth == 0 && c == ')';
                break;
            case ScanMode::kArithFor:
                stop = depth == 0 && (c == ')' || c == ';');
                break;
        }
        if (stop) {
            return;
        }

        if (c == '\\') {
            if (n == '\n') {
                pos_ += 2;  // 줄 연속
                continue;
            }
            if (mode == ScanMode::kDoubleQuote) {
                if (n == '$' || n == '`' || n == '"' || n == '\\') {
                    b.literal(src_.substr(pos_, 2), src_.substr(pos_ + 1, 1));
                    pos_ += 2;
                } else {
                    b.literal("\\");
                    ++pos_;
                }
                continue;
            }
            if (pos_ + 1 >= src_.size()) {
                b.literal("\\");
                ++pos_;
                continue;
            }
            b.literal(src_.substr(pos_, 2), src_.substr(pos_ + 1, 1));
            pos_ += 2;
            continue;
        }
        if (c == '\'' && mode != ScanMode::kDoubleQuote) {
            scan_single_quoted(b);
            continue;
        }
        if (c == '"' && mode != ScanMode::kDoubleQuote) {
            scan_double_quoted(b);
            continue;
        }
        if (c == '$') {
            scan_dollar(b, mode);
            continue;
        }
        if (c == '`') {
            scan_backtick(b);
            continue;
        }
        if (mode == ScanMode::kWord && n == '('
            && (c == '?' || c == '*' || c == '+' || c == '@' || c == '!')) {
            scan_extglob(b);
            continue;
        }

        switch (mode) {
            case ScanMode::kRegex:
            case ScanMode::kArith:
            case ScanMode::kArithFor:
                if (c == '(') {
                    ++depth;
                } else if (c == ')') {
                    --depth;
                }
                break;
            case ScanMode::kParam:
                if (c == '{') {
                    ++depth;
                } else if (c == '}') {
                    --depth;
                }
                break;
            default:
                break;
        }
        b.literal(src_.substr(pos_, 1));
        ++pos_;
    }
}

void ParserState::scan_single_quoted(WordBuilder& b) {
    const std::size_t start = pos_;
    const auto        close = src_.find('\'', pos_ + 1);
    if (close == std::string_view::npos) {
        fail(ParseErrorCode::kUnterminated, "unterminated single quote");
    }
    b.literal(src_.substr(start, close + 1 - start), src_.substr(start + 1, close - start - 1));
    pos_ = close + 1;
}

void ParserState::scan_double_quoted(WordBuilder& b) {
    b.raw("\"");
    ++pos_;
    scan_into(b, ScanMode::kDoubleQuote);
    if (at(pos_) != '"') {
        fail(ParseErrorCode::kUnterminated, "unterminated double quote");
    }
    b.raw("\"");
    ++pos_;
}

void ParserState::scan_ansi_c_quoted(WordBuilder& b) {
    const std::size_t start = pos_;
    pos_ += 2;  // $'
    std::string value;
    bool        closed = false;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (c == '\\' && pos_ + 1 < src_.size()) {
            const char e = src_[pos_ + 1];
            switch (e) {
                case 'n':  value.push_back('\n'); break;
                case 't':  value.push_back('\t'); break;
                case 'r':  value.push_back('\r'); break;
                case 'a':  value.push_back('\a'); break;
                case 'b':  value.push_back('\b'); break;
                case 'e':
                case 'E':  value.push_back('\x1b'); break;
                case 'f':  value.push_back('\f'); break;
                case 'v':  value.push_back('\v'); break;
                case '\\': value.push_back('\\'); break;
                case '\'': value.push_back('\''); break;
                case '"':  value.push_back('"'); break;
                default:
                    value.push_back('\\');
                    value.push_back(e);
                    break;
            }
            pos_ += 2;
            continue;
        }
        if (c == '\'') {
            closed = true;
            ++pos_;
            break;
        }
        value.push_back(c);
        ++pos_;
    }
    if (!closed) {
        fail(ParseErrorCode::kUnterminated, "unterminated $'...' string");
    }
    b.literal(src_.substr(start, pos_ - start), value);
}

void ParserState::scan_dollar(WordBuilder& b, ScanMode mode) {
    const char n = at(pos_ + 1);

    if (n == '(') {
        if (at(pos_ + 2) == '(' && try_scan_arith_expansion(b)) {
            return;
        }
        scan_command_substitution(b);
        return;
    }
    if (n == '{') {
        b.literal("${");
        pos_ += 2;
        scan_into(b, ScanMode::kParam);
        if (at(pos_) != '}') {
            fail(ParseErrorCode::kUnterminated, "unterminated parameter expansion");
        }
        b.literal("}");
        ++pos_;
        return;
    }
    if (n == '\'' && mode != ScanMode::kDoubleQuote) {
        scan_ansi_c_quoted(b);
        return;
    }
    if (n == '"' && mode != ScanMode::kDoubleQuote) {
        // $"..." (로케일 번역 문자열) 은 큰따옴표와 같이 취급
        b.raw("$");
        ++pos_;
        scan_double_quoted(b);
        return;
    }
    b.literal("$");
    ++pos_;
}

// $(( ... )) 산술 확장. 짝이 맞지 않으면 $( (...) ) 명령 치환으로 되돌린다.
bool ParserState::try_scan_arith_expansion(WordBuilder& b) {
    const auto        snap  = b.snapshot();
    const std::size_t saved = pos_;

    b.literal("$((");
    pos_ += 3;
    try {
        scan_into(b, ScanMode::kArith);
    } catch (const SyntaxError&) {
        b.restore(snap);
        pos_ = saved;
        return false;
    }
    if (at(pos_) == ')' && at(pos_ + 1) == ')') {
        b.literal("))");
        pos_ += 2;
        return true;
    }
    b.restore(snap);
    pos_ = saved;
    return false;
}

void ParserState::scan_command_substitution(WordBuilder& b) {
    const std::size_t start = pos_;
    pos_ += 2;  // $(
    NodePtr inner = parse_substitution_body();
    b.substitution(src_.substr(start, pos_ - start), WordPart{CmdSubPart{std::move(inner), false}});
}

void ParserState::scan_process_substitution(WordBuilder& b, char direction) {
    const std::size_t start = pos_;
    pos_ += 2;  // <( 또는 >(
    NodePtr inner = parse_substitution_body();
    b.substitution(src_.substr(start, pos_ - start), WordPart{ProcSubPart{direction, std::move(inner)}});
}

void ParserState::scan_backtick(WordBuilder& b) {
    const std::size_t start = pos_;
    ++pos_;
    std::string content;
    bool        closed = false;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        const char n = at(pos_ + 1);
        if (c == '\\' && (n == '`' || n == '\\' || n == '$')) {
            content.push_back(n);
            pos_ += 2;
            continue;
        }
        if (c == '`') {
            closed = true;
            ++pos_;
            break;
        }
        content.push_back(c);
        ++pos_;
    }
    if (!closed) {
        fail(ParseErrorCode::kUnterminated, "unterminated backquote substitution");
    }
    NodePtr inner = parse_nested_source(content);
    b.substitution(src_.substr(start, pos_ - start), WordPart{CmdSubPart{std::move(inner), true}});
}

// @(a|b), !(x), *(y) ... 확장 글롭. 괄호 짝만 맞춰 리터럴로 취급한다.
void ParserState::scan_extglob(WordBuilder& b) {
    const std::size_t start = pos_;
    pos_ += 2;
    int depth = 1;
    while (pos_ < src_.size() && depth > 0) {
        const char c = src_[pos_];
        if (c == '\\') {
            pos_ += 2;
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            --depth;
        }
        ++pos_;
    }
    if (depth > 0) {
        fail(ParseErrorCode::kUnterminated, "unterminated extended glob pattern");
    }
    pos_ = std::min(pos_, src_.size());
    b.literal(src_.substr(start, pos_ - start));
}

// name=(a b "c d" $(cmd)) 배열 대입. 원소 단어들을 같은 빌더에 이어 붙인다.
void ParserState::scan_array_literal(WordBuilder& b) {
    b.literal("(");
    ++pos_;
    for (;;) {
        while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t' || src_[pos_] == '\n')) {
            b.literal(src_.substr(pos_, 1));
            ++pos_;
        }
        if (pos_ >= src_.size()) {
            fail(ParseErrorCode::kUnterminated, "unterminated array assignment");
        }
        if (src_[pos_] == ')') {
            b.literal(")");
            ++pos_;
            return;
        }
        if (is_metachar(src_[pos_])) {
            fail(ParseErrorCode::kUnexpectedToken,
                 fmt::format("syntax error near unexpected token '{}'", src_[pos_]));
        }
        scan_into(b, ScanMode::kWord);
    }
}

NodePtr ParserState::parse_substitution_body() {
    DepthGuard guard(*this);
    skip_newlines();
    if (peek_is_op(")")) {
        advance();
        return box(Node{Empty{}});
    }
    Node body = parse_list(false);
    if (!peek_is_op(")")) {
        const Token& t = peek();
        if (t.type == TokenType::kEof) {
            fail(ParseErrorCode::kUnterminated, "unterminated substitution (expected ')')");
        }
        fail_unexpected(t);
    }
    advance();
    return box(std::move(body));
}

NodePtr ParserState::parse_nested_source(const std::string& content) {
    if (depth_ + 1 > kMaxParseDepth) {
        fail(ParseErrorCode::kTooDeep, "nesting too deep");
    }
    ParserState       nested(content, depth_ + 1);
    std::vector<Node> nodes = nested.parse_program();
    if (nodes.empty()) {
        return box(Node{Empty{}});
    }
    if (nodes.size() == 1) {
        return box(std::move(nodes.front()));
    }
    List list;
    list.operators.assign(nodes.size() - 1, ";");
    list.parts = std::move(nodes);
    return box(Node{std::move(list)});
}

// ===========================================================================
// 문법
// ===========================================================================

std::vector<Node> ParserState::parse_program() {
    std::vector<Node> nodes;
    for (;;) {
        skip_newlines();
        if (peek().type == TokenType::kEof) {
            break;
        }
        if (at_list_end()) {
            fail_unexpected(peek());
        }
        nodes.push_back(parse_list(true));
        const Token& after = peek();
        if (after.type != TokenType::kNewline && after.type != TokenType::kEof) {
            fail_unexpected(after);
        }
    }
    if (!pending_heredocs_.empty()) {
        read_heredoc_bodies();
    }
    if (nodes.empty() && saw_comment_) {
        nodes.push_back(Node{Comment{last_comment_}});
    }
    return nodes;
}

bool ParserState::at_list_end() {
    const Token& t = peek();
    switch (t.type) {
        case TokenType::kEof:
            return true;
        case TokenType::kOperator:
            return t.text == ")" || t.text == ";;" || t.text == ";&" || t.text == ";;&";
        case TokenType::kWord:
            return is_list_terminator_word(t.word.text);
        default:
            return false;
    }
}

bool ParserState::at_pipeline_end() {
    const Token& t = peek();
    if (t.type == TokenType::kNewline) {
        return true;
    }
    if (t.type == TokenType::kOperator) {
        return t.text != "(";
    }
    return at_list_end();
}

Node ParserState::parse_list(bool stop_at_newline) {
    List list;
    list.parts.push_back(parse_pipeline());

    for (;;) {
        const Token& t = peek();
        if (t.type == TokenType::kOperator && (t.text == "&&" || t.text == "||")) {
            list.operators.push_back(t.text);
            advance();
            skip_newlines();
            list.parts.push_back(parse_pipeline());
            continue;
        }
        if (t.type == TokenType::kOperator && (t.text == ";" || t.text == "&")) {
            list.operators.push_back(t.text);
            advance();
            if (stop_at_newline) {
                const Token& next = peek();
                if (next.type == TokenType::kNewline || next.type == TokenType::kEof) {
                    break;
                }
            } else {
                skip_newlines();
            }
            if (at_list_end()) {
                break;
            }
            list.parts.push_back(parse_pipeline());
            continue;
        }
        if (t.type == TokenType::kNewline && !stop_at_newline) {
            skip_newlines();
            if (at_list_end()) {
                break;
            }
            list.operators.emplace_back(";");
            list.parts.push_back(parse_pipeline());
            continue;
        }
        break;
    }

    if (list.parts.size() == 1 && list.operators.empty()) {
        return std::move(list.parts.front());
    }
    return Node{std::move(list)};
}

Node ParserState::parse_pipeline() {
    DepthGuard guard(*this);

    if (peek_is_reserved("time")) {
        advance();
        Time time;
        const Token& t = peek();
        if (t.type == TokenType::kWord && t.word.text == "-p") {
            time.posix = true;
            advance();
        }
        time.pipeline = at_pipeline_end() ? box(Node{Empty{}}) : box(parse_pipeline());
        return Node{std::move(time)};
    }
    if (peek_is_reserved("!")) {
        advance();
        Negation negation;
        negation.pipeline = box(parse_pipeline());
        return Node{std::move(negation)};
    }

    Pipeline pipeline;
    pipeline.commands.push_back(parse_command());
    while (peek_is_op("|") || peek_is_op("|&")) {
        advance();
        skip_newlines();
        pipeline.commands.push_back(parse_command());
    }
    if (pipeline.commands.size() == 1) {
        return std::move(pipeline.commands.front());
    }
    return Node{std::move(pipeline)};
}

bool ParserState::starts_compound_command() {
    const Token& t = peek();
    if (t.type == TokenType::kOperator) {
        return t.text == "(";
    }
    if (t.type != TokenType::kWord) {
        return false;
    }
    const std::string& w = t.word.text;
    return w == "{" || w == "if" || w == "while" || w == "until" || w == "for"
        || w == "select" || w == "case" || w == "[[";
}

Node ParserState::parse_command() {
    DepthGuard guard(*this);

    const Token& t = peek();
    if (t.type == TokenType::kOperator && t.text == "(") {
        if (at(t.offset + 1) == '(') {
            if (auto arith = try_parse_arith_command()) {
                return std::move(*arith);
            }
        }
        advance();
        Subshell subshell;
        subshell.body = parse_compound_body();
        expect_op(")");
        parse_redirects(subshell.redirects);
        return Node{std::move(subshell)};
    }

    if (t.type == TokenType::kWord) {
        const std::string& w = t.word.text;
        if (w == "{") {
            return parse_brace_group();
        }
        if (w == "if") {
            return parse_if();
        }
        if (w == "while" || w == "until") {
            return parse_while(w == "until");
        }
        if (w == "for" || w == "select") {
            return parse_for(w == "select");
        }
        if (w == "case") {
            return parse_case();
        }
        if (w == "function") {
            return parse_function_keyword();
        }
        if (w == "[[") {
            return parse_cond_command();
        }
        if (w == "coproc") {
            return parse_coproc();
        }
        if (is_list_terminator_word(w) || w == "then" || w == "in" || w == "]]") {
            fail_unexpected(t);
        }
    }
    return parse_simple_command(std::nullopt);
}

Node ParserState::parse_simple_command(std::optional<Word> first) {
    Command command;
    if (first) {
        command.words.push_back(std::move(*first));
    }

    for (;;) {
        const Token& t = peek();
        if (t.type == TokenType::kRedirect) {
            parse_redirect(command.redirects);
            continue;
        }
        if (t.type != TokenType::kWord) {
            break;
        }
        Word word = take().word;
        // name () compound: 함수 정의
        if (command.words.empty() && command.redirects.empty() && is_plain_word(word)
            && peek_is_op("(")) {
            return parse_function_definition(std::move(word));
        }
        command.words.push_back(std::move(word));
    }

    if (command.words.empty() && command.redirects.empty()) {
        fail_unexpected(peek());
    }
    return Node{std::move(command)};
}

Node ParserState::parse_function_definition(Word name) {
    expect_op("(");
    expect_op(")");
    skip_newlines();
    Function function;
    function.name = name.value;
    function.body = box(parse_command());
    return Node{std::move(function)};
}

NodePtr ParserState::parse_compound_body() {
    skip_newlines();
    if (at_list_end()) {
        fail_unexpected(peek());
    }
    return box(parse_list(false));
}

NodePtr ParserState::parse_do_group() {
    if (peek_is_reserved("do")) {
        advance();
        NodePtr body = parse_compound_body();
        expect_reserved("done");
        return body;
    }
    if (peek_is_reserved("{")) {
        advance();
        NodePtr body = parse_compound_body();
        expect_reserved("}");
        return body;
    }
    const Token& t = peek();
    if (t.type == TokenType::kEof) {
        fail(ParseErrorCode::kUnterminated, "unexpected end of input (expected 'do')");
    }
    fail_unexpected(t);
}

void ParserState::parse_redirect(std::vector<Redirect>& out) {
    Token op = take();

    Redirect redirect;
    redirect.op   = (op.fd ? std::to_string(*op.fd) : std::string{}) + op.text;
    redirect.fd   = op.fd;
    redirect.kind = op.redirect_kind;

    if (peek().type != TokenType::kWord) {
        fail_unexpected(peek());
    }
    redirect.target = take().word;

    if (redirect.kind == RedirectKind::kHereDoc) {
        redirect.heredoc_quoted = redirect.target.text.find_first_of("'\"\\") != std::string::npos;
        redirect.heredoc_body   = std::make_shared<std::string>();
        pending_heredocs_.push_back(
            PendingHeredoc{redirect.target.value, op.strip_tabs, redirect.heredoc_body});
    }
    out.push_back(std::move(redirect));
}

void ParserState::parse_redirects(std::vector<Redirect>& out) {
    while (peek().type == TokenType::kRedirect) {
        parse_redirect(out);
    }
}

// (( expr )) 산술 명령. "((" 뒤에 짝이 맞는 "))" 가 없으면 중첩 서브셸로 본다.
std::optional<Node> ParserState::try_parse_arith_command() {
    const std::size_t open = cache_->offset;
    cache_.reset();
    pos_ = open + 2;

    WordBuilder b;
    try {
        scan_into(b, ScanMode::kArith);
    } catch (const SyntaxError&) {
        pos_ = open;
        return std::nullopt;
    }
    if (at(pos_) != ')' || at(pos_ + 1) != ')') {
        pos_ = open;
        return std::nullopt;
    }
    pos_ += 2;

    ArithCmd arith;
    arith.expression = b.finish();
    parse_redirects(arith.redirects);
    return Node{std::move(arith)};
}

Node ParserState::parse_brace_group() {
    advance();  // {
    BraceGroup group;
    group.body = parse_compound_body();
    expect_reserved("}");
    parse_redirects(group.redirects);
    return Node{std::move(group)};
}

Node ParserState::parse_if() {
    advance();  // if
    If node = parse_if_rest();
    expect_reserved("fi");
    parse_redirects(node.redirects);
    return Node{std::move(node)};
}

If ParserState::parse_if_rest() {
    If node;
    node.condition = parse_compound_body();
    expect_reserved("then");
    node.then_body = parse_compound_body();
    if (peek_is_reserved("elif")) {
        advance();
        node.else_body = box(Node{parse_if_rest()});
    } else if (peek_is_reserved("else")) {
        advance();
        node.else_body = parse_compound_body();
    }
    return node;
}

Node ParserState::parse_while(bool until) {
    advance();  // while / until
    WhileLoop loop;
    loop.until     = until;
    loop.condition = parse_compound_body();
    loop.body      = parse_do_group();
    parse_redirects(loop.redirects);
    return Node{std::move(loop)};
}

Node ParserState::parse_for(bool is_select) {
    advance();  // for / select

    if (!is_select) {
        std::size_t p = pos_;
        while (at(p) == ' ' || at(p) == '\t') {
            ++p;
        }
        if (at(p) == '(' && at(p + 1) == '(') {
            pos_ = p + 2;
            return parse_for_arith();
        }
    }

    if (peek().type != TokenType::kWord) {
        fail_unexpected(peek());
    }
    std::string variable = take().word.value;
    skip_newlines();

    std::vector<Word> words;
    if (peek_is_reserved("in")) {
        advance();
        while (peek().type == TokenType::kWord) {
            words.push_back(take().word);
        }
        if (peek_is_op(";")) {
            advance();
        } else if (peek().type != TokenType::kNewline) {
            fail_unexpected(peek());
        }
    } else if (peek_is_op(";")) {
        advance();
    }
    skip_newlines();
    NodePtr body = parse_do_group();

    if (is_select) {
        Select select;
        select.variable = std::move(variable);
        select.words    = std::move(words);
        select.body     = std::move(body);
        parse_redirects(select.redirects);
        return Node{std::move(select)};
    }
    For loop;
    loop.variable = std::move(variable);
    loop.words    = std::move(words);
    loop.body     = std::move(body);
    parse_redirects(loop.redirects);
    return Node{std::move(loop)};
}

Node ParserState::parse_for_arith() {
    ForArith loop;

    auto clause = [&](char terminator) {
        WordBuilder b;
        scan_into(b, ScanMode::kArithFor);
        if (at(pos_) != terminator) {
            fail(ParseErrorCode::kInvalidSyntax, "malformed arithmetic for loop");
        }
        ++pos_;
        return b.finish();
    };
    loop.init = clause(';');
    loop.cond = clause(';');
    loop.incr = clause(')');
    if (at(pos_) != ')') {
        fail(ParseErrorCode::kInvalidSyntax, "malformed arithmetic for loop (expected '))')");
    }
    ++pos_;

    if (peek_is_op(";")) {
        advance();
    }
    skip_newlines();
    loop.body = parse_do_group();
    parse_redirects(loop.redirects);
    return Node{std::move(loop)};
}

Node ParserState::parse_case() {
    advance();  // case
    Case node;
    if (peek().type != TokenType::kWord) {
        fail_unexpected(peek());
    }
    node.word = take().word;
    skip_newlines();
    expect_reserved("in");
    skip_newlines();

    while (!peek_is_reserved("esac")) {
        if (peek().type == TokenType::kEof) {
            fail(ParseErrorCode::kUnterminated, "unexpected end of input (expected 'esac')");
        }
        CaseItem item;
        if (peek_is_op("(")) {
            advance();
        }
        for (;;) {
            if (peek().type != TokenType::kWord) {
                fail_unexpected(peek());
            }
            item.patterns.push_back(take().word);
            if (!peek_is_op("|")) {
                break;
            }
            advance();
        }
        expect_op(")");
        skip_newlines();
        if (!at_list_end()) {
            item.body = box(parse_list(false));
        }

        const Token& t = peek();
        if (t.type == TokenType::kOperator && (t.text == ";;" || t.text == ";&" || t.text == ";;&")) {
            item.terminator = t.text;
            advance();
            skip_newlines();
        } else if (!peek_is_reserved("esac")) {
            fail_unexpected(t);
        }
        node.items.push_back(std::move(item));
    }
    advance();  // esac
    parse_redirects(node.redirects);
    return Node{std::move(node)};
}

Node ParserState::parse_function_keyword() {
    advance();  // function
    if (peek().type != TokenType::kWord) {
        fail_unexpected(peek());
    }
    Function function;
    function.name = take().word.value;
    if (peek_is_op("(")) {
        advance();
        expect_op(")");
    }
    skip_newlines();
    function.body = box(parse_command());
    return Node{std::move(function)};
}

// coproc [NAME] command
//   NAME 은 뒤따르는 명령이 복합 명령일 때만 이름으로 해석된다 (bash 규칙).
Node ParserState::parse_coproc() {
    advance();  // coproc
    Coproc coproc;

    const Token& t = peek();
    if (t.type == TokenType::kWord && is_plain_word(t.word) && !is_reserved_word(t.word.text)) {
        Word first = take().word;
        if (starts_compound_command()) {
            coproc.name    = first.value;
            coproc.command = box(parse_command());
        } else {
            coproc.command = box(parse_simple_command(std::move(first)));
        }
    } else {
        coproc.command = box(parse_command());
    }
    return Node{std::move(coproc)};
}

// ===========================================================================
// [[ ... ]]
// ===========================================================================

CondToken ParserState::lex_cond_token() {
    for (;;) {
        skip_blanks();
        if (at(pos_) == '\n') {
            ++pos_;
            continue;
        }
        break;
    }
    if (pos_ >= src_.size()) {
        fail(ParseErrorCode::kUnterminated, "unexpected end of input (expected ']]')");
    }

    CondToken tok;
    const char c = src_[pos_];
    const char n = at(pos_ + 1);
    if ((c == '&' && n == '&') || (c == '|' && n == '|')) {
        tok.op   = true;
        tok.text = std::string(src_.substr(pos_, 2));
        pos_ += 2;
        return tok;
    }
    if (c == '(' || c == ')') {
        tok.op   = true;
        tok.text = std::string(1, c);
        ++pos_;
        return tok;
    }
    if ((c == '<' || c == '>') && n != '(') {
        tok.text       = std::string(1, c);
        tok.word.text  = tok.text;
        tok.word.value = tok.text;
        ++pos_;
        return tok;
    }
    tok.word = scan_word(ScanMode::kWord);
    if (tok.word.text.empty()) {
        fail(ParseErrorCode::kUnexpectedToken,
             fmt::format("syntax error in conditional expression near '{}'", c));
    }
    tok.text = tok.word.text;
    return tok;
}

const CondToken& ParserState::cond_peek() {
    if (!cond_cache_) {
        CondToken tok = lex_cond_token();
        cond_cache_.emplace(std::move(tok));
    }
    return *cond_cache_;
}

CondToken ParserState::cond_take() {
    cond_peek();
    CondToken tok = std::move(*cond_cache_);
    cond_cache_.reset();
    return tok;
}

Word ParserState::take_cond_word() {
    CondToken t = cond_take();
    if (t.op || t.text == "]]") {
        fail(ParseErrorCode::kUnexpectedToken,
             fmt::format("syntax error in conditional expression near '{}'", t.text));
    }
    return std::move(t.word);
}

// =~ 우변: 괄호와 | 를 포함하는 정규식을 한 단어로 읽는다
Word ParserState::take_cond_regex() {
    skip_blanks();
    Word word = scan_word(ScanMode::kRegex);
    if (word.text.empty()) {
        fail(ParseErrorCode::kUnexpectedToken, "expected regular expression after '=~'");
    }
    return word;
}

Node ParserState::parse_cond_command() {
    advance();  // [[
    CondExpr expr;
    expr.body = box_cond(parse_cond_or());
    const CondToken end = cond_take();
    if (end.op || end.text != "]]") {
        fail(ParseErrorCode::kUnexpectedToken,
             fmt::format("syntax error in conditional expression near '{}' (expected ']]')", end.text));
    }
    parse_redirects(expr.redirects);
    return Node{std::move(expr)};
}

CondTerm ParserState::parse_cond_or() {
    CondTerm left = parse_cond_and();
    while (cond_peek().op && cond_peek().text == "||") {
        cond_take();
        CondTerm right = parse_cond_and();
        left = CondTerm{CondOr{box_cond(std::move(left)), box_cond(std::move(right))}};
    }
    return left;
}

CondTerm ParserState::parse_cond_and() {
    CondTerm left = parse_cond_not();
    while (cond_peek().op && cond_peek().text == "&&") {
        cond_take();
        CondTerm right = parse_cond_not();
        left = CondTerm{CondAnd{box_cond(std::move(left)), box_cond(std::move(right))}};
    }
    return left;
}

CondTerm ParserState::parse_cond_not() {
    if (!cond_peek().op && cond_peek().text == "!") {
        cond_take();
        return CondTerm{CondNot{box_cond(parse_cond_not())}};
    }
    return parse_cond_primary();
}

CondTerm ParserState::parse_cond_primary() {
    DepthGuard guard(*this);

    CondToken t = cond_take();
    if (t.op) {
        if (t.text == "(") {
            CondTerm  inner = parse_cond_or();
            CondToken close = cond_take();
            if (!close.op || close.text != ")") {
                fail(ParseErrorCode::kUnexpectedToken, "expected ')' in conditional expression");
            }
            return CondTerm{CondParen{box_cond(std::move(inner))}};
        }
        fail(ParseErrorCode::kUnexpectedToken,
             fmt::format("syntax error in conditional expression near '{}'", t.text));
    }
    if (t.text == "]]") {
        fail(ParseErrorCode::kUnexpectedToken, "empty conditional expression");
    }

    if (is_unary_test_op(t.text)) {
        const CondToken& next = cond_peek();
        if (!next.op && next.text != "]]" && !is_binary_test_op(next.text)) {
            return CondTerm{UnaryTest{t.text, take_cond_word()}};
        }
    }

    const CondToken& next = cond_peek();
    if (!next.op && is_binary_test_op(next.text)) {
        std::string op    = cond_take().text;
        Word        right = (op == "=~") ? take_cond_regex() : take_cond_word();
        return CondTerm{BinaryTest{std::move(op), std::move(t.word), std::move(right)}};
    }
    return CondTerm{UnaryTest{"-n", std::move(t.word)}};
}

}  // namespace

// ---------------------------------------------------------------------------
// ShellParser::parse
// ---------------------------------------------------------------------------
std::expected<std::vector<Node>, ParseError> ShellParser::parse(std::string_view source) const {
    try {
        ParserState state(source, 0);
        return state.parse_program();
    } catch (const SyntaxError& e) {
        ParseError err;
        err.code    = e.code();
        err.message = e.what();

        // 1-based 행/열 계산 (중첩 백틱 내부 오류는 근사값)
        const std::size_t offset = std::min(e.offset(), source.size());
        err.line   = 1;
        err.column = 1;
        for (std::size_t i = 0; i < offset; ++i) {
            if (source[i] == '\n') {
                ++err.line;
                err.column = 1;
            } else {
                ++err.column;
            }
        }
        const std::size_t begin = offset > 20 ? offset - 20 : 0;
        err.context             = std::string(source.substr(begin, 40));

        spdlog::debug("shell_parser: {} (line {}, col {})", err.message, err.line, err.column);
        return std::unexpected(std::move(err));
    }
}
