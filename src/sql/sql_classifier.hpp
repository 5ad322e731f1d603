#pragma once

// ---------------------------------------------------------------------------
// sql_classifier.hpp
//
// 셸 명령에 포함된 SQL 문(sqlite3/psql/mysql 인자 등)이 읽기 전용인지
// 판정하는 방언 비의존 분류기.
//
// [설계 원칙]
// - 결과는 세 가지 상태뿐이다: true(읽기 전용), false(쓰기), std::nullopt(모름).
//   "모름" 은 오류가 아니라 정상 결과이며, 호출자는 이를 Ask 로 취급한다.
// - 키워드 스캔 전에 문자열 리터럴/인용 식별자/주석을 한 번에 제거한다.
//   'DELETE' 같은 리터럴 값이 실행 키워드로 오인되지 않도록 하기 위함이다.
// - 방언별 추가 키워드(PRAGMA, COPY, LOAD ...)는 하드코딩하지 않고
//   호출 지점에서 extra_readonly / extra_write 로 전달한다.
//
// [오탐/미탐 트레이드오프]
// - 복수 구문(SELECT 1; DROP TABLE x)은 항상 nullopt. 자동 승인하지 않는다.
// - 닫히지 않은 따옴표/주석도 nullopt (입력 자체가 모호함).
// - writefile() 같은 부수효과 함수 호출은 탐지하지 않는다 (알려진 한계).
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

// 대문자 키워드 집합. 호출자는 대문자로 채워서 전달한다.
using SqlKeywordSet = std::unordered_set<std::string>;

// ---------------------------------------------------------------------------
// is_readonly_sql
//   sql            : 분류 대상 SQL 원문
//   extra_readonly : 읽기 전용으로 취급할 방언별 추가 키워드
//   extra_write    : 쓰기로 취급할 방언별 추가 키워드
//
//   반환:
//     true         : 읽기 전용 (SELECT/SHOW/DESCRIBE/EXPLAIN, CTE 포함)
//     false        : 쓰기 (INSERT/UPDATE/..., SELECT ... INTO 포함)
//     std::nullopt : 판정 불가 (복수 구문, 알 수 없는 선두 키워드)
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<bool>
is_readonly_sql(std::string_view sql,
                const SqlKeywordSet& extra_readonly = {},
                const SqlKeywordSet& extra_write    = {});

// ---------------------------------------------------------------------------
// strip_sql_literals
//   문자열 리터럴('..', "..", 이중 따옴표 이스케이프 포함), 백틱/대괄호 식별자,
//   -- 라인 주석, /* */ 블록 주석을 각각 공백 하나로 치환한다.
//   닫히지 않은 리터럴/주석이 있으면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string> strip_sql_literals(std::string_view sql);
