// ---------------------------------------------------------------------------
// test_sql_classifier.cpp
//
// is_readonly_sql / strip_sql_literals 단위 테스트.
//
// [테스트 범위]
// - 읽기 전용 키워드 (SELECT/SHOW/DESCRIBE/EXPLAIN) → true
// - 쓰기 키워드 → false
// - CTE (WITH ... AS (...)) 본문 키워드 판정
// - SELECT ... INTO → false
// - 복수 구문, 닫히지 않은 리터럴, 알 수 없는 키워드 → nullopt
// - 리터럴/주석 안의 쓰기 키워드는 무시
// - 방언별 추가 키워드 집합
// ---------------------------------------------------------------------------

#include "sql/sql_classifier.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// 기본 키워드
// ---------------------------------------------------------------------------
TEST(SqlClassifier, SelectIsReadonly) {
    EXPECT_EQ(is_readonly_sql("SELECT * FROM users"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("select id from t where x = 1"), std::optional<bool>{true});
}

TEST(SqlClassifier, ShowDescribeExplainAreReadonly) {
    EXPECT_EQ(is_readonly_sql("SHOW TABLES"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("DESCRIBE users"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("EXPLAIN SELECT 1"), std::optional<bool>{true});
}

TEST(SqlClassifier, WriteKeywordsAreNotReadonly) {
    for (const char* sql : {"INSERT INTO t VALUES (1)", "UPDATE t SET a = 1", "DELETE FROM t",
                            "DROP TABLE t", "CREATE TABLE t (id INT)", "ALTER TABLE t ADD c INT",
                            "TRUNCATE t", "GRANT ALL ON t TO u", "REVOKE ALL ON t FROM u",
                            "REPLACE INTO t VALUES (1)", "MERGE INTO t USING s ON 1 = 1"}) {
        EXPECT_EQ(is_readonly_sql(sql), std::optional<bool>{false}) << sql;
    }
}

TEST(SqlClassifier, UnknownLeadingKeywordIsUnknown) {
    EXPECT_EQ(is_readonly_sql("VACUUM"), std::nullopt);
    EXPECT_EQ(is_readonly_sql("PRAGMA table_info(t)"), std::nullopt);
}

TEST(SqlClassifier, EmptyInputIsUnknown) {
    EXPECT_EQ(is_readonly_sql(""), std::nullopt);
    EXPECT_EQ(is_readonly_sql("   \n\t"), std::nullopt);
    EXPECT_EQ(is_readonly_sql("-- only a comment"), std::nullopt);
}

TEST(SqlClassifier, NonKeywordStartIsUnknown) {
    EXPECT_EQ(is_readonly_sql("(SELECT 1)"), std::nullopt);
    EXPECT_EQ(is_readonly_sql("# comment\nSELECT 1"), std::nullopt);
}

// ---------------------------------------------------------------------------
// CTE
// ---------------------------------------------------------------------------
TEST(SqlClassifier, CteWithSelectBodyIsReadonly) {
    EXPECT_EQ(is_readonly_sql("WITH c AS (SELECT 1) SELECT * FROM c"), std::optional<bool>{true});
}

TEST(SqlClassifier, MultipleCtesWithColumnList) {
    EXPECT_EQ(is_readonly_sql("WITH a(x) AS (SELECT 1), b AS (SELECT x FROM a) SELECT * FROM b"),
              std::optional<bool>{true});
}

TEST(SqlClassifier, RecursiveCte) {
    EXPECT_EQ(is_readonly_sql("WITH RECURSIVE r AS (SELECT 1 UNION ALL SELECT n + 1 FROM r) "
                              "SELECT * FROM r"),
              std::optional<bool>{true});
}

TEST(SqlClassifier, CteWithWriteBodyIsNotReadonly) {
    EXPECT_EQ(is_readonly_sql("WITH old AS (SELECT id FROM t) DELETE FROM t"),
              std::optional<bool>{false});
}

// ---------------------------------------------------------------------------
// SELECT INTO
// ---------------------------------------------------------------------------
TEST(SqlClassifier, SelectIntoIsWrite) {
    EXPECT_EQ(is_readonly_sql("SELECT * INTO backup FROM users"), std::optional<bool>{false});
}

TEST(SqlClassifier, IntoAfterFromIsIgnored) {
    EXPECT_EQ(is_readonly_sql("SELECT a FROM t WHERE b = 'into'"), std::optional<bool>{true});
}

// ---------------------------------------------------------------------------
// 복수 구문
// ---------------------------------------------------------------------------
TEST(SqlClassifier, MultipleStatementsAreUnknown) {
    EXPECT_EQ(is_readonly_sql("SELECT 1; DROP TABLE x"), std::nullopt);
    EXPECT_EQ(is_readonly_sql("SELECT 1; SELECT 2"), std::nullopt);
}

TEST(SqlClassifier, TrailingSemicolonsAreAllowed) {
    EXPECT_EQ(is_readonly_sql("SELECT 1;"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("SELECT 1;;;"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("SELECT 1;  \n"), std::optional<bool>{true});
}

TEST(SqlClassifier, SemicolonInsideLiteralIsNotASeparator) {
    EXPECT_EQ(is_readonly_sql("SELECT 'a; DROP TABLE x'"), std::optional<bool>{true});
}

// ---------------------------------------------------------------------------
// 리터럴과 주석
// ---------------------------------------------------------------------------
TEST(SqlClassifier, WriteKeywordInsideLiteralIsIgnored) {
    EXPECT_EQ(is_readonly_sql("SELECT * FROM logs WHERE msg = 'DELETE FROM users'"),
              std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("SELECT \"DROP\" FROM t"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("SELECT `insert` FROM t"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("SELECT [update] FROM t"), std::optional<bool>{true});
}

TEST(SqlClassifier, LeadingCommentsAreSkipped) {
    EXPECT_EQ(is_readonly_sql("/* DROP */ SELECT 1"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("-- DELETE\nSELECT 1"), std::optional<bool>{true});
    EXPECT_EQ(is_readonly_sql("SELECT 1 -- trailing"), std::optional<bool>{true});
}

TEST(SqlClassifier, InvariantUnderWhitespace) {
    const auto base = is_readonly_sql("SELECT a FROM t");
    EXPECT_EQ(is_readonly_sql("  \n SELECT   a\tFROM t \n"), base);
}

TEST(SqlClassifier, UnterminatedLiteralIsUnknown) {
    EXPECT_EQ(is_readonly_sql("SELECT 'abc"), std::nullopt);
    EXPECT_EQ(is_readonly_sql("SELECT /* open"), std::nullopt);
}

TEST(SqlClassifier, DoubledQuoteEscapeStaysInsideLiteral) {
    EXPECT_EQ(is_readonly_sql("SELECT 'it''s; DROP'"), std::optional<bool>{true});
}

// ---------------------------------------------------------------------------
// 방언 추가 키워드
// ---------------------------------------------------------------------------
TEST(SqlClassifier, ExtraWriteKeywords) {
    EXPECT_EQ(is_readonly_sql("PRAGMA journal_mode = WAL", {}, {"PRAGMA"}),
              std::optional<bool>{false});
    EXPECT_EQ(is_readonly_sql("vacuum", {}, {"VACUUM"}), std::optional<bool>{false});
}

TEST(SqlClassifier, ExtraReadonlyKeywords) {
    EXPECT_EQ(is_readonly_sql("VALUES (1)", {"VALUES"}), std::optional<bool>{true});
}

// ---------------------------------------------------------------------------
// strip_sql_literals
// ---------------------------------------------------------------------------
TEST(StripSqlLiterals, RemovesLiteralsAndComments) {
    const auto stripped = strip_sql_literals("SELECT 'x' /* c */ FROM t -- tail");
    ASSERT_TRUE(stripped.has_value());
    EXPECT_EQ(stripped->find('x'), std::string::npos);
    EXPECT_EQ(stripped->find("tail"), std::string::npos);
    EXPECT_NE(stripped->find("SELECT"), std::string::npos);
    EXPECT_NE(stripped->find("FROM t"), std::string::npos);
}

TEST(StripSqlLiterals, UnterminatedStateFails) {
    EXPECT_FALSE(strip_sql_literals("'abc").has_value());
    EXPECT_FALSE(strip_sql_literals("\"abc").has_value());
    EXPECT_FALSE(strip_sql_literals("[abc").has_value());
    EXPECT_TRUE(strip_sql_literals("SELECT 1 -- no newline").has_value());
}
