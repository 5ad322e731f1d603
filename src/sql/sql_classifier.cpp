// ---------------------------------------------------------------------------
// sql_classifier.cpp
//
// 방언 비의존 SQL 읽기 전용 분류 구현.
//
// [처리 순서]
// 1. strip_sql_literals: 리터럴/식별자/주석 제거 (상태 머신, 한 번의 패스)
// 2. 복수 구문 감지: 첫 번째 ';' 이후 내용 검사
// 3. 선두 키워드 추출, WITH 이면 CTE 정의를 건너뛰어 본문 키워드 탐색
// 4. 키워드 집합 비교 (SELECT 는 INTO 추가 검사)
//
// [알려진 한계]
// - MySQL 의 백슬래시 이스케이프('\'')는 표준 SQL 이 아니므로 처리하지 않는다.
//   'it\'s' 같은 입력은 따옴표가 닫히지 않은 것으로 보고 nullopt 가 된다
//   (보수적 방향의 오탐).
// - # 해시 주석은 MySQL 전용이므로 주석으로 보지 않는다. # 이 선두에 오면
//   키워드가 아니므로 nullopt.
// ---------------------------------------------------------------------------

#include "sql/sql_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

const SqlKeywordSet kReadonlyKeywords = {"SELECT", "SHOW", "DESCRIBE", "EXPLAIN"};

const SqlKeywordSet kWriteKeywords = {
    "INSERT", "CREATE", "ALTER", "DROP",  "TRUNCATE", "DELETE",
    "UPDATE", "MERGE",  "GRANT", "REVOKE", "REPLACE",
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_keyword_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_keyword_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::size_t skip_whitespace(std::string_view sql, std::size_t pos) {
    while (pos < sql.size() && is_space(sql[pos])) {
        ++pos;
    }
    return pos;
}

// pos 에서 시작하는 [A-Za-z_]\w* 키워드의 끝 위치. 키워드가 아니면 pos 그대로.
std::size_t match_keyword(std::string_view sql, std::size_t pos) {
    if (pos >= sql.size() || !is_keyword_start(sql[pos])) {
        return pos;
    }
    std::size_t end = pos + 1;
    while (end < sql.size() && is_keyword_char(sql[end])) {
        ++end;
    }
    return end;
}

// 첫 번째 ';' 이후에 다른 구문이 존재하는지 검사한다.
//   "SELECT 1;"     → false
//   "SELECT 1;;;"   → false (연속 세미콜론은 빈 구문)
//   "SELECT 1; ;"   → true  (공백을 사이에 둔 세미콜론은 모호함)
//   "SELECT 1; X"   → true
bool has_multiple_statements(std::string_view stripped) {
    const auto first_semi = stripped.find(';');
    if (first_semi == std::string_view::npos) {
        return false;
    }
    bool seen_space = false;
    for (std::size_t i = first_semi + 1; i < stripped.size(); ++i) {
        const char c = stripped[i];
        if (is_space(c)) {
            seen_space = true;
            continue;
        }
        if (c == ';' && !seen_space) {
            continue;
        }
        return true;
    }
    return false;
}

// WITH 뒤의 CTE 정의들을 건너뛰고 본문 키워드 위치를 반환한다.
//
// 상태:
//   expect_as = true  : 이름(선택적으로 RECURSIVE 선행) 다음 AS 를 기다림
//   expect_as = false : 괄호 본문 또는 ',' (다음 CTE) 를 기다림.
//                       이때 나타나는 키워드가 본문의 선두 키워드다.
std::size_t skip_cte(std::string_view sql, std::size_t pos) {
    bool expect_as = true;
    while (pos < sql.size()) {
        pos = skip_whitespace(sql, pos);
        if (pos >= sql.size()) {
            break;
        }
        if (sql[pos] == '(') {
            int depth = 1;
            ++pos;
            while (pos < sql.size() && depth > 0) {
                if (sql[pos] == '(') {
                    ++depth;
                } else if (sql[pos] == ')') {
                    --depth;
                }
                ++pos;
            }
            expect_as = false;
            continue;
        }
        if (sql[pos] == ',') {
            ++pos;
            expect_as = true;
            continue;
        }
        const auto end = match_keyword(sql, pos);
        if (end != pos) {
            // name(col, ...) AS (...) 처럼 컬럼 목록 뒤에 오는 AS 도 허용
            if (to_upper(sql.substr(pos, end - pos)) == "AS") {
                expect_as = false;
                pos = end;
                continue;
            }
            if (!expect_as) {
                return pos;
            }
            pos = end;
            continue;
        }
        ++pos;
    }
    return pos;
}

// SELECT 뒤에서 FROM 이전에 INTO 가 나오면 true (SELECT ... INTO t 는 테이블 생성).
bool select_has_into(std::string_view sql, std::size_t pos) {
    while (pos < sql.size()) {
        pos = skip_whitespace(sql, pos);
        if (pos >= sql.size()) {
            break;
        }
        const auto end = match_keyword(sql, pos);
        if (end == pos) {
            ++pos;
            continue;
        }
        const auto kw = to_upper(sql.substr(pos, end - pos));
        if (kw == "INTO") {
            return true;
        }
        if (kw == "FROM") {
            return false;
        }
        pos = end;
    }
    return false;
}

}  // namespace

// ---------------------------------------------------------------------------
// strip_sql_literals
//   문자 단위 상태 머신. 닫히지 않은 상태로 입력이 끝나면 실패.
// ---------------------------------------------------------------------------
std::optional<std::string> strip_sql_literals(std::string_view sql) {
    enum class State : std::uint8_t {
        kNormal,
        kSingleQuote,    // '...'
        kDoubleQuote,    // "..."
        kBacktick,       // `...`  (MySQL 식별자)
        kBracket,        // [...]  (SQL Server 식별자)
        kBlockComment,   // /* ... */
        kLineComment,    // -- ... \n
    };

    std::string result;
    result.reserve(sql.size());

    State state = State::kNormal;
    const std::size_t len = sql.size();

    for (std::size_t i = 0; i < len; ++i) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case State::kNormal:
                if (c == '\'') {
                    state = State::kSingleQuote;
                } else if (c == '"') {
                    state = State::kDoubleQuote;
                } else if (c == '`') {
                    state = State::kBacktick;
                } else if (c == '[') {
                    state = State::kBracket;
                } else if (c == '/' && next == '*') {
                    state = State::kBlockComment;
                    ++i;
                } else if (c == '-' && next == '-') {
                    state = State::kLineComment;
                    ++i;
                } else {
                    result.push_back(c);
                }
                break;

            case State::kSingleQuote:
                if (c == '\'') {
                    if (next == '\'') {
                        ++i;  // '' 이스케이프
                    } else {
                        result.push_back(' ');
                        state = State::kNormal;
                    }
                }
                break;

            case State::kDoubleQuote:
                if (c == '"') {
                    if (next == '"') {
                        ++i;
                    } else {
                        result.push_back(' ');
                        state = State::kNormal;
                    }
                }
                break;

            case State::kBacktick:
                if (c == '`') {
                    result.push_back(' ');
                    state = State::kNormal;
                }
                break;

            case State::kBracket:
                if (c == ']') {
                    result.push_back(' ');
                    state = State::kNormal;
                }
                break;

            case State::kBlockComment:
                if (c == '*' && next == '/') {
                    result.push_back(' ');
                    state = State::kNormal;
                    ++i;
                }
                break;

            case State::kLineComment:
                if (c == '\n') {
                    result.push_back(' ');
                    state = State::kNormal;
                }
                break;
        }
    }

    if (state == State::kLineComment) {
        result.push_back(' ');
        return result;
    }
    if (state != State::kNormal) {
        return std::nullopt;
    }
    return result;
}

// ---------------------------------------------------------------------------
// is_readonly_sql
// ---------------------------------------------------------------------------
std::optional<bool> is_readonly_sql(std::string_view sql,
                                    const SqlKeywordSet& extra_readonly,
                                    const SqlKeywordSet& extra_write) {
    // 1. 리터럴/주석 제거
    const auto stripped_opt = strip_sql_literals(sql);
    if (!stripped_opt) {
        spdlog::debug("sql_classifier: unterminated literal or comment");
        return std::nullopt;
    }
    const std::string_view stripped = *stripped_opt;

    // 2. 복수 구문은 판정하지 않는다
    if (has_multiple_statements(stripped)) {
        spdlog::debug("sql_classifier: multiple statements");
        return std::nullopt;
    }

    // 3. 선두 키워드 (WITH 는 CTE 를 건너뛴 뒤 다시 판정)
    std::size_t pos = 0;
    while (pos < stripped.size()) {
        pos = skip_whitespace(stripped, pos);
        if (pos >= stripped.size()) {
            break;
        }
        const auto end = match_keyword(stripped, pos);
        if (end == pos) {
            return std::nullopt;
        }
        const auto kw = to_upper(stripped.substr(pos, end - pos));

        if (kw == "WITH") {
            pos = skip_cte(stripped, end);
            continue;
        }

        // 4. 키워드 분류
        if (kw == "SELECT") {
            return !select_has_into(stripped, end);
        }
        if (kReadonlyKeywords.contains(kw) || extra_readonly.contains(kw)) {
            return true;
        }
        if (kWriteKeywords.contains(kw) || extra_write.contains(kw)) {
            return false;
        }
        spdlog::debug("sql_classifier: unknown leading keyword '{}'", kw);
        return std::nullopt;
    }
    return std::nullopt;
}
