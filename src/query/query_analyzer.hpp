#pragma once

// ---------------------------------------------------------------------------
// query_analyzer.hpp
//
// 실행 전 쿼리 구조 검증 + 복잡도 추정.
//
// [구문 오류]
// - 빈 쿼리, 최대 길이 초과 (이 경우 토큰화하지 않고 즉시 반환)
// - 괄호 () [] {} 불일치 / 닫히지 않음
// - 닫히지 않은 문자열 리터럴, 닫히지 않은 블록 주석
//
// [복잡도 휴리스틱]
//   nesting_depth : 괄호 중첩 최대 깊이 (세 종류 합산)
//   join_count    : JOIN 키워드 수 + (MATCH 절 수 - 1)
//   estimated_cost: 절별 가중치 합 + 가변 길이 관계([*..]) 50 + 깊이 * 5
//   exceeds_limits: 세 값 중 하나라도 QueryLimits 를 넘으면 true
//
// exceeds_limits 는 구문 오류가 아니다. is_valid 와 별개로 호출자가 판단한다.
// ---------------------------------------------------------------------------

#include <string_view>

#include "query/query_types.hpp"

class QueryAnalyzer {
public:
    explicit QueryAnalyzer(QueryLimits limits = {}) : limits_(limits) {}

    [[nodiscard]] QueryValidationResult validate_structure(std::string_view query) const;

    [[nodiscard]] const QueryLimits& limits() const noexcept { return limits_; }

private:
    QueryLimits limits_;
};
