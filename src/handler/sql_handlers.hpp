#pragma once

// ---------------------------------------------------------------------------
// sql_handlers.hpp
//
// 명령줄에 SQL 을 실어 보내는 DB 클라이언트. 인자에서 SQL 을 꺼내
// is_readonly_sql 로 분류하고, 방언별 쓰기 키워드를 extra_write 로 넘긴다.
//
// - Sqlite3Handler : sqlite3 [옵션] [파일 [SQL...]], -cmd SQL.
//                    -readonly / -safe 는 Allow, -init 은 Ask.
//                    추가 쓰기 키워드: PRAGMA ATTACH DETACH VACUUM REINDEX ANALYZE
// - PsqlHandler    : -c / --command. -l 은 Allow, -f 는 Ask.
//                    추가 쓰기 키워드: COPY VACUUM CLUSTER REINDEX ANALYZE
// - MysqlHandler   : -e / --execute / -eSQL.
//                    추가 쓰기 키워드: LOAD
//
// SQL 이 없으면 대화형 세션이므로 Ask. 분류 결과 nullopt 도 Ask.
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class Sqlite3Handler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"sqlite3"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class PsqlHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"psql"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class MysqlHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"mysql"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};
