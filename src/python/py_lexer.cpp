#include "python/py_lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

#include <fmt/format.h>

namespace {

class LexError : public std::runtime_error {
public:
    LexError(const std::string& message, std::uint32_t line, std::uint32_t col)
        : std::runtime_error(message)
        , line_(line)
        , col_(col) {}

    [[nodiscard]] std::uint32_t line() const noexcept { return line_; }
    [[nodiscard]] std::uint32_t col() const noexcept { return col_; }

private:
    std::uint32_t line_;
    std::uint32_t col_;
};

// 길이 내림차순: 가장 긴 연산자부터 대조한다
constexpr std::array<std::string_view, 47> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", ">>", "<<", "<=",
    ">=",  "==",  "!=",  "+=",  "-=",  "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+",   "-",   "*",   "/",   "%",   "@",  "&",  "|",  "^",  "~",  "<",  ">",
    "(",   ")",   "[",   "]",   "{",   "}",  ",",  ":",  ";",  ".",  "=",
};

bool is_ident_start(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) != 0 || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || c == '_' || u >= 0x80;
}

bool is_string_prefix(std::string_view p) {
    static constexpr std::array<std::string_view, 8> kPrefixes = {
        "r", "u", "b", "f", "br", "rb", "fr", "rf",
    };
    std::string lower(p);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kPrefixes.begin(), kPrefixes.end(), lower) != kPrefixes.end();
}

// ---------------------------------------------------------------------------
// FStringScanner
//   f-string 본문에서 {식} 필드를 추출한다. 위치는 본문 시작 위치 기준으로
//   앞으로만 진행하며 누적 계산한다.
// ---------------------------------------------------------------------------
class FStringScanner {
public:
    FStringScanner(std::string_view body, bool raw, std::uint32_t line, std::uint32_t col)
        : body_(body)
        , raw_(raw)
        , line_(line)
        , col_(col) {}

    std::vector<FStringField> run() {
        std::size_t i = 0;
        while (i < body_.size()) {
            const char c = body_[i];
            if (c == '\\' && !raw_) {
                // \N{NAME} 의 중괄호는 필드가 아니다
                if (at(i + 1) == 'N' && at(i + 2) == '{') {
                    const auto close = body_.find('}', i + 3);
                    i = (close == std::string_view::npos) ? body_.size() : close + 1;
                } else {
                    i += 2;
                }
                continue;
            }
            if (c == '{') {
                if (at(i + 1) == '{') {
                    i += 2;
                    continue;
                }
                i = scan_field(i);
                continue;
            }
            if (c == '}') {
                if (at(i + 1) == '}') {
                    i += 2;
                    continue;
                }
                fail(i, "f-string: single '}' is not allowed");
            }
            ++i;
        }
        return std::move(fields_);
    }

private:
    [[nodiscard]] char at(std::size_t i) const { return i < body_.size() ? body_[i] : '\0'; }

    // 본문 내 위치 → 원본 행/열
    std::pair<std::uint32_t, std::uint32_t> position(std::size_t target) {
        while (cursor_ < target && cursor_ < body_.size()) {
            if (body_[cursor_] == '\n') {
                ++line_;
                col_ = 0;
            } else {
                ++col_;
            }
            ++cursor_;
        }
        return {line_, col_};
    }

    [[noreturn]] void fail(std::size_t where, const std::string& message) {
        const auto [line, col] = position(where);
        throw LexError(message, line, col);
    }

    // open 은 '{' 위치. 닫는 '}' 다음 위치를 반환한다.
    std::size_t scan_field(std::size_t open) {
        const std::size_t start = open + 1;
        std::size_t       j     = start;
        int               depth = 0;
        char              quote = '\0';

        for (; j < body_.size(); ++j) {
            const char ch = body_[j];
            if (quote != '\0') {
                if (ch == quote) {
                    quote = '\0';
                }
                continue;
            }
            if (ch == '\'' || ch == '"') {
                quote = ch;
            } else if (ch == '(' || ch == '[' || ch == '{') {
                ++depth;
            } else if (ch == ')' || ch == ']') {
                --depth;
            } else if (ch == '}') {
                if (depth == 0) {
                    break;
                }
                --depth;
            } else if (depth == 0 && ch == '!' && at(j + 1) != '=') {
                break;
            } else if (depth == 0 && ch == ':') {
                break;
            } else if (depth == 0 && ch == '=' && is_debug_equals(j)) {
                break;
            }
        }
        if (j >= body_.size()) {
            fail(open, "f-string: expecting '}'");
        }

        std::string_view expr = body_.substr(start, j - start);
        if (expr.find_first_not_of(" \t\r\n") == std::string_view::npos) {
            fail(open, "f-string: empty expression not allowed");
        }
        const auto [line, col] = position(start);
        fields_.push_back(FStringField{std::string(expr), line, col});

        // f"{x=}" 디버그 표기
        if (body_[j] == '=') {
            ++j;
            while (at(j) == ' ') {
                ++j;
            }
        }
        // !r / !s / !a
        if (at(j) == '!') {
            j += 2;
        }
        // 서식 지정자. 중첩 필드 f"{x:{width}}" 도 식이다.
        if (at(j) == ':') {
            ++j;
            while (j < body_.size() && body_[j] != '}') {
                if (body_[j] == '{') {
                    j = scan_field(j);
                    continue;
                }
                ++j;
            }
        }
        if (at(j) != '}') {
            fail(open, "f-string: expecting '}'");
        }
        return j + 1;
    }

    // '=' 가 비교 연산자의 일부가 아니고 뒤에 '}' '!' ':' 가 오는지
    [[nodiscard]] bool is_debug_equals(std::size_t j) const {
        const char prev = j > 0 ? body_[j - 1] : '\0';
        if (prev == '=' || prev == '!' || prev == '<' || prev == '>' || at(j + 1) == '=') {
            return false;
        }
        std::size_t k = j + 1;
        while (at(k) == ' ') {
            ++k;
        }
        const char next = at(k);
        return next == '}' || next == '!' || next == ':';
    }

    std::string_view          body_;
    bool                      raw_;
    std::uint32_t             line_;
    std::uint32_t             col_;
    std::size_t               cursor_{0};
    std::vector<FStringField> fields_{};
};

// ---------------------------------------------------------------------------
// PyLexer
// ---------------------------------------------------------------------------
class PyLexer {
public:
    explicit PyLexer(std::string_view src)
        : src_(src) {}

    std::vector<PyToken> run();

private:
    [[nodiscard]] char at(std::size_t i) const { return i < src_.size() ? src_[i] : '\0'; }
    [[nodiscard]] std::uint32_t col() const { return static_cast<std::uint32_t>(pos_ - line_start_); }

    [[noreturn]] void fail(const std::string& message) const { throw LexError(message, line_, col()); }

    void new_line(std::size_t next_pos) {
        ++line_;
        pos_        = next_pos;
        line_start_ = next_pos;
    }

    void emit(PyTokenType type, std::string text, std::uint32_t line, std::uint32_t col) {
        PyToken tok;
        tok.type = type;
        tok.text = std::move(text);
        tok.line = line;
        tok.col  = col;
        tokens_.push_back(std::move(tok));
    }

    bool handle_indentation();
    void lex_name_or_string();
    void lex_number();
    void lex_string(std::size_t token_start, std::size_t quote_pos);
    void lex_operator();

    std::string_view           src_;
    std::size_t                pos_{0};
    std::size_t                line_start_{0};
    std::uint32_t              line_{1};
    bool                       at_line_start_{true};
    std::vector<std::uint32_t> indents_{0};
    std::vector<char>          brackets_{};
    std::vector<PyToken>       tokens_{};
};

// 행 시작에서 들여쓰기를 측정하고 INDENT/DEDENT 를 낸다.
// 빈 행 / 주석 행이면 그 행을 건너뛰고 false.
bool PyLexer::handle_indentation() {
    std::uint32_t width = 0;
    std::size_t   p     = pos_;
    while (p < src_.size()) {
        const char c = src_[p];
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (c == '\f') {
            width = 0;
        } else {
            break;
        }
        ++p;
    }
    pos_ = p;
    if (p >= src_.size()) {
        return false;
    }

    const char c = src_[p];
    if (c == '#' || c == '\n' || c == '\r') {
        const auto eol = src_.find('\n', p);
        if (eol == std::string_view::npos) {
            pos_ = src_.size();
        } else {
            new_line(eol + 1);
        }
        return false;
    }

    at_line_start_ = false;
    if (width > indents_.back()) {
        indents_.push_back(width);
        emit(PyTokenType::kIndent, "", line_, 0);
        return true;
    }
    while (width < indents_.back()) {
        indents_.pop_back();
        emit(PyTokenType::kDedent, "", line_, col());
    }
    if (width != indents_.back()) {
        fail("unindent does not match any outer indentation level");
    }
    return true;
}

std::vector<PyToken> PyLexer::run() {
    while (pos_ < src_.size()) {
        if (at_line_start_ && brackets_.empty()) {
            if (!handle_indentation()) {
                continue;
            }
        }
        if (pos_ >= src_.size()) {
            break;
        }

        const char c = src_[pos_];
        if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
            ++pos_;
            continue;
        }
        if (c == '#') {
            while (pos_ < src_.size() && src_[pos_] != '\n') {
                ++pos_;
            }
            continue;
        }
        if (c == '\\') {
            std::size_t next = pos_ + 1;
            if (at(next) == '\r') {
                ++next;
            }
            if (at(next) != '\n') {
                fail("unexpected character after line continuation character");
            }
            new_line(next + 1);
            continue;
        }
        if (c == '\n') {
            if (brackets_.empty()) {
                if (!tokens_.empty() && tokens_.back().type != PyTokenType::kNewline) {
                    emit(PyTokenType::kNewline, "\n", line_, col());
                }
                at_line_start_ = true;
            }
            new_line(pos_ + 1);
            continue;
        }
        if (is_ident_start(c)) {
            lex_name_or_string();
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) != 0
            || (c == '.' && std::isdigit(static_cast<unsigned char>(at(pos_ + 1))) != 0)) {
            lex_number();
            continue;
        }
        if (c == '\'' || c == '"') {
            lex_string(pos_, pos_);
            continue;
        }
        lex_operator();
    }

    if (!brackets_.empty()) {
        fail(fmt::format("'{}' was never closed", brackets_.back()));
    }
    if (!tokens_.empty() && tokens_.back().type != PyTokenType::kNewline
        && tokens_.back().type != PyTokenType::kDedent) {
        emit(PyTokenType::kNewline, "", line_, col());
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(PyTokenType::kDedent, "", line_, 0);
    }
    emit(PyTokenType::kEndMarker, "", line_, 0);
    return std::move(tokens_);
}

void PyLexer::lex_name_or_string() {
    const std::size_t start = pos_;
    std::size_t       end   = pos_;
    while (end < src_.size() && is_ident_char(src_[end])) {
        ++end;
    }
    // rb"..." / f'...' 등 문자열 접두사
    if ((at(end) == '\'' || at(end) == '"') && end - start <= 2
        && is_string_prefix(src_.substr(start, end - start))) {
        lex_string(start, end);
        return;
    }
    emit(PyTokenType::kName, std::string(src_.substr(start, end - start)), line_, col());
    pos_ = end;
}

void PyLexer::lex_number() {
    const std::size_t   start     = pos_;
    const std::uint32_t start_col = col();
    const bool          hex       = src_[pos_] == '0' && (at(pos_ + 1) == 'x' || at(pos_ + 1) == 'X');
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.') {
            ++pos_;
            continue;
        }
        // 1e-5, 2E+10
        if ((c == '+' || c == '-') && !hex && (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')) {
            ++pos_;
            continue;
        }
        break;
    }
    emit(PyTokenType::kNumber, std::string(src_.substr(start, pos_ - start)), line_, start_col);
}

void PyLexer::lex_string(std::size_t token_start, std::size_t quote_pos) {
    const std::uint32_t start_line = line_;
    const std::uint32_t start_col  = static_cast<std::uint32_t>(token_start - line_start_);

    std::string prefix(src_.substr(token_start, quote_pos - token_start));
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const bool raw    = prefix.find('r') != std::string::npos;
    const bool fstr   = prefix.find('f') != std::string::npos;
    const char quote  = src_[quote_pos];
    const bool triple = at(quote_pos + 1) == quote && at(quote_pos + 2) == quote;

    const std::size_t   body_start = quote_pos + (triple ? 3 : 1);
    const std::uint32_t body_line  = line_;
    const std::uint32_t body_col   = static_cast<std::uint32_t>(body_start - line_start_);

    pos_ = body_start;
    std::size_t body_end = std::string_view::npos;
    while (pos_ < src_.size()) {
        const char c = src_[pos_];
        if (c == '\\') {
            if (at(pos_ + 1) == '\n') {
                new_line(pos_ + 2);
            } else {
                pos_ += 2;
            }
            continue;
        }
        if (c == '\n') {
            if (!triple) {
                throw LexError(fmt::format("unterminated string literal (detected at line {})", line_),
                               start_line, start_col);
            }
            new_line(pos_ + 1);
            continue;
        }
        if (c == quote) {
            if (!triple) {
                body_end = pos_;
                ++pos_;
                break;
            }
            if (at(pos_ + 1) == quote && at(pos_ + 2) == quote) {
                body_end = pos_;
                pos_ += 3;
                break;
            }
        }
        ++pos_;
    }
    if (body_end == std::string_view::npos) {
        throw LexError(triple ? fmt::format("unterminated triple-quoted string literal (detected at line {})", line_)
                              : fmt::format("unterminated string literal (detected at line {})", line_),
                       start_line, start_col);
    }

    PyToken tok;
    tok.type = PyTokenType::kString;
    tok.text = std::string(src_.substr(token_start, pos_ - token_start));
    tok.line = start_line;
    tok.col  = start_col;
    if (fstr) {
        tok.is_fstring = true;
        FStringScanner scanner(src_.substr(body_start, body_end - body_start), raw, body_line, body_col);
        tok.fields = scanner.run();
    }
    tokens_.push_back(std::move(tok));
}

void PyLexer::lex_operator() {
    const std::string_view rest = src_.substr(pos_);
    for (const auto op : kOperators) {
        if (rest.substr(0, op.size()) != op) {
            continue;
        }
        if (op == "(" || op == "[" || op == "{") {
            brackets_.push_back(op[0]);
        } else if (op == ")" || op == "]" || op == "}") {
            const char open = op == ")" ? '(' : (op == "]" ? '[' : '{');
            if (brackets_.empty()) {
                fail(fmt::format("unmatched '{}'", op));
            }
            if (brackets_.back() != open) {
                fail(fmt::format("closing parenthesis '{}' does not match opening parenthesis '{}'",
                                 op, brackets_.back()));
            }
            brackets_.pop_back();
        }
        emit(PyTokenType::kOp, std::string(op), line_, col());
        pos_ += op.size();
        return;
    }
    fail(fmt::format("invalid character '{}'", src_[pos_]));
}

}  // namespace

std::expected<std::vector<PyToken>, ParseError> tokenize_python(std::string_view source) {
    try {
        PyLexer lexer(source);
        return lexer.run();
    } catch (const LexError& e) {
        ParseError err;
        err.code    = ParseErrorCode::kInvalidSyntax;
        err.message = e.what();
        err.line    = e.line();
        err.column  = e.col();
        return std::unexpected(std::move(err));
    }
}
