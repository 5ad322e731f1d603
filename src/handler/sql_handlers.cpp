#include "handler/sql_handlers.hpp"

#include <spdlog/spdlog.h>

#include "handler/token_scan.hpp"
#include "sql/sql_classifier.hpp"

namespace {

const SqlKeywordSet kSqliteWrite   = {"PRAGMA", "ATTACH", "DETACH", "VACUUM", "REINDEX", "ANALYZE"};
const SqlKeywordSet kPostgresWrite = {"COPY", "VACUUM", "CLUSTER", "REINDEX", "ANALYZE"};
const SqlKeywordSet kMysqlWrite    = {"LOAD"};

const TokenSet kSqliteFlagsNoArg = {
    "-append", "-ascii", "-bail", "-batch", "-box", "-column", "-csv", "-deserialize", "-echo",
    "-header", "-noheader", "-help", "-html", "-interactive", "-json", "-line", "-list",
    "-markdown", "-memtrace", "-nofollow", "-quote", "-readonly", "-safe", "-stats", "-table",
    "-tabs", "-version", "-vfstrace",
};

const TokenSet kSqliteFlagsWithArg = {
    "-cmd", "-init", "-key", "-hexkey", "-textkey", "-lookaside", "-maxsize", "-newline",
    "-nonce", "-nullvalue", "-pagecache", "-separator", "-vfs", "-escape", "-A",
};

// 분류 결과 -> Classification
[[nodiscard]] Classification from_verdict(const std::string& tool, std::optional<bool> readonly) {
    if (!readonly) {
        return Classification::ask(tool + " (unknown query)");
    }
    if (*readonly) {
        return Classification::allow(tool + " (read-only query)");
    }
    return Classification::ask(tool + " (write query)");
}

// "--command='SELECT 1'" 처럼 값 양끝에 같은 따옴표가 남아 있으면 벗긴다
[[nodiscard]] std::string strip_matching_quotes(std::string value) {
    if (value.size() >= 2 && (value.front() == '\'' || value.front() == '"') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace

// ---------------------------------------------------------------------------
// Sqlite3Handler
// ---------------------------------------------------------------------------
Classification Sqlite3Handler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;

    if (has_any(tokens, {"-help", "--help", "-version"}, 1)) {
        return Classification::allow("sqlite3 help/version");
    }
    if (has_token(tokens, "-readonly", 1) || has_token(tokens, "-safe", 1)) {
        return Classification::allow("sqlite3 (read-only mode)");
    }
    if (has_token(tokens, "-init", 1)) {
        return Classification::ask("sqlite3 (init script)");
    }

    // sqlite3 [OPTIONS] [FILENAME [SQL...]]
    std::vector<std::string> sql_parts;
    bool filename_seen = false;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (kSqliteFlagsNoArg.contains(token)) {
            continue;
        }
        if (kSqliteFlagsWithArg.contains(token)) {
            if (token == "-cmd" && i + 1 < tokens.size()) {
                sql_parts.push_back(tokens[i + 1]);
            }
            ++i;
            continue;
        }
        if (token.starts_with('-')) {
            continue;
        }
        if (!filename_seen) {
            filename_seen = true;
            continue;
        }
        sql_parts.push_back(token);
    }

    if (sql_parts.empty()) {
        return Classification::ask("sqlite3 (interactive)");
    }

    // 인자 여러 개는 각각 별도 구문이다
    std::string sql;
    for (const auto& part : sql_parts) {
        if (!sql.empty()) {
            sql += ' ';
        }
        sql += part;
    }
    spdlog::debug("sql_handlers: sqlite3 classifying {} byte(s) of SQL", sql.size());
    return from_verdict("sqlite3", is_readonly_sql(sql, {}, kSqliteWrite));
}

// ---------------------------------------------------------------------------
// PsqlHandler
// ---------------------------------------------------------------------------
Classification PsqlHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;

    if (has_any(tokens, {"--help", "--version", "-V"}, 1)) {
        return Classification::allow("psql help/version");
    }
    if (has_any(tokens, {"-l", "--list"}, 1)) {
        return Classification::allow("psql --list");
    }
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (t == "--file" || t.starts_with("--file=") || (t.starts_with("-f") && !t.starts_with("--"))) {
            return Classification::ask("psql (file input)");
        }
    }

    std::vector<std::string> statements;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if ((t == "-c" || t == "--command") && i + 1 < tokens.size()) {
            statements.push_back(tokens[++i]);
        } else if (t.starts_with("--command=")) {
            statements.push_back(strip_matching_quotes(t.substr(10)));
        }
    }
    if (statements.empty()) {
        return Classification::ask("psql (interactive)");
    }

    // 모든 -c 가 읽기 전용이어야 한다
    for (const auto& sql : statements) {
        const auto readonly = is_readonly_sql(sql, {}, kPostgresWrite);
        if (!readonly || !*readonly) {
            return from_verdict("psql", readonly);
        }
    }
    return from_verdict("psql", true);
}

// ---------------------------------------------------------------------------
// MysqlHandler
// ---------------------------------------------------------------------------
Classification MysqlHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;

    if (has_any(tokens, {"--help", "-?", "--version", "-V"}, 1)) {
        return Classification::allow("mysql help/version");
    }

    std::optional<std::string> sql;
    for (std::size_t i = 1; i < tokens.size() && !sql; ++i) {
        const auto& t = tokens[i];
        if ((t == "-e" || t == "--execute") && i + 1 < tokens.size()) {
            sql = tokens[i + 1];
        } else if (t.starts_with("--execute=")) {
            sql = strip_matching_quotes(t.substr(10));
        } else if (t.starts_with("-e") && t.size() > 2) {
            sql = t.substr(2);
        }
    }
    if (!sql) {
        return Classification::ask("mysql (interactive)");
    }
    return from_verdict("mysql", is_readonly_sql(*sql, {}, kMysqlWrite));
}
