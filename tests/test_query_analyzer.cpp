// ---------------------------------------------------------------------------
// test_query_analyzer.cpp
//
// QueryAnalyzer 구조 검증 / 복잡도 추정 단위 테스트
// ---------------------------------------------------------------------------

#include "query/query_analyzer.hpp"
#include "query/query_lexer.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>

namespace {

bool has_error(const QueryValidationResult& r, QueryErrorCode code) {
    return std::any_of(r.errors.begin(), r.errors.end(),
                       [&](const QuerySyntaxError& e) { return e.code == code; });
}

}  // namespace

// ---------------------------------------------------------------------------
// Test: 즉시 반환 오류
// ---------------------------------------------------------------------------
TEST(QueryAnalyzer, EmptyQueryRejected) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("  \n\t ");
    EXPECT_FALSE(r.is_valid);
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, QueryErrorCode::kEmptyQuery);
}

TEST(QueryAnalyzer, TooLongRejectedBeforeTokenizing) {
    QueryLimits limits{};
    limits.max_length = 10;
    const QueryAnalyzer analyzer(limits);

    const auto r = analyzer.validate_structure("MATCH (n RETURN n");
    EXPECT_FALSE(r.is_valid);
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, QueryErrorCode::kTooLong);
    EXPECT_EQ(r.complexity.clause_count, 0);
}

// ---------------------------------------------------------------------------
// Test: 구문 오류
// ---------------------------------------------------------------------------
TEST(QueryAnalyzer, UnclosedDelimiterReportedAtOpenPosition) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("MATCH (n RETURN n");
    EXPECT_FALSE(r.is_valid);
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, QueryErrorCode::kUnbalancedDelimiter);
    EXPECT_EQ(r.errors[0].position, 6U);
}

TEST(QueryAnalyzer, UnexpectedCloseReported) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("MATCH (n)) RETURN n");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, QueryErrorCode::kUnbalancedDelimiter);
    EXPECT_EQ(r.errors[0].position, 9U);
}

TEST(QueryAnalyzer, MismatchedDelimiterKinds) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("RETURN [1, 2)");
    EXPECT_FALSE(r.is_valid);
    EXPECT_TRUE(has_error(r, QueryErrorCode::kUnbalancedDelimiter));
}

TEST(QueryAnalyzer, UnterminatedStringReported) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("MATCH (n {name: 'abc}) RETURN n");
    EXPECT_FALSE(r.is_valid);
    EXPECT_TRUE(has_error(r, QueryErrorCode::kUnterminatedString));
}

TEST(QueryAnalyzer, UnterminatedBlockCommentReported) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("MATCH (n) RETURN n /* trailing");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, QueryErrorCode::kUnterminatedComment);
    EXPECT_EQ(r.errors[0].position, 19U);
}

TEST(QueryAnalyzer, DelimitersInsideStringsIgnored) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("RETURN ')(' AS s, \"[\" AS t");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.complexity.nesting_depth, 0);
}

// ---------------------------------------------------------------------------
// Test: 복잡도 휴리스틱
// ---------------------------------------------------------------------------
TEST(QueryAnalyzer, VariableLengthPathCost) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("MATCH (a)-[:KNOWS*1..3]->(b) RETURN b");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.complexity.nesting_depth, 1);
    EXPECT_EQ(r.complexity.clause_count, 2);
    EXPECT_EQ(r.complexity.join_count, 0);
    // MATCH 10 + RETURN 1 + 가변 길이 50 + 깊이 1 * 5
    EXPECT_DOUBLE_EQ(r.complexity.estimated_cost, 66.0);
    EXPECT_FALSE(r.complexity.exceeds_limits);
}

TEST(QueryAnalyzer, RepeatedMatchCountsAsJoins) {
    QueryLimits limits{};
    limits.max_joins = 1;
    const QueryAnalyzer analyzer(limits);

    const auto r = analyzer.validate_structure("MATCH (a) MATCH (b) MATCH (c) RETURN a, b, c");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.complexity.join_count, 2);
    EXPECT_TRUE(r.complexity.exceeds_limits);
}

TEST(QueryAnalyzer, DeepNestingExceedsLimitButStaysValid) {
    QueryLimits limits{};
    limits.max_nesting_depth = 5;
    const QueryAnalyzer analyzer(limits);

    const auto r = analyzer.validate_structure("RETURN ((((((1))))))");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.complexity.nesting_depth, 6);
    EXPECT_TRUE(r.complexity.exceeds_limits);
}

TEST(QueryAnalyzer, KeywordsInsideLiteralsNotCounted) {
    const QueryAnalyzer analyzer;
    const auto r = analyzer.validate_structure("RETURN 'MATCH MATCH CALL' AS s");
    EXPECT_EQ(r.complexity.clause_count, 1);
    EXPECT_DOUBLE_EQ(r.complexity.estimated_cost, 1.0);
}

TEST(QueryAnalyzer, CostLimit) {
    QueryLimits limits{};
    limits.max_cost = 50.0;
    const QueryAnalyzer analyzer(limits);
    EXPECT_TRUE(analyzer.validate_structure("CALL db.labels() YIELD label CALL db.labels() YIELD l2 RETURN 1")
                    .complexity.exceeds_limits);
}

// ---------------------------------------------------------------------------
// Test: 렉서
// ---------------------------------------------------------------------------
TEST(QueryLexer, RelationshipDashesAreNotComments) {
    for (const char* q : {"MATCH (a)--(b) RETURN a", "MATCH (a)-->(b) RETURN a",
                          "MATCH (a)<--(b) RETURN a"}) {
        const auto tokens = tokenize_query(q);
        EXPECT_TRUE(std::none_of(tokens.begin(), tokens.end(),
                                 [](const QueryToken& t) { return t.kind == TokenKind::kLineComment; }))
            << q;
    }
}

TEST(QueryLexer, TokensCoverInputExactly) {
    const std::string q = "MATCH (n {k: 'v\\'x'}) // note\nRETURN $p";
    std::string rebuilt;
    for (const auto& t : tokenize_query(q)) {
        rebuilt += t.text;
    }
    EXPECT_EQ(rebuilt, q);
}

TEST(QueryLexer, QuoteRecoveryModes) {
    const std::string q = "' OR 1=1 --";
    const auto extended = tokenize_query(q, QuoteRecovery::kExtendToEnd);
    ASSERT_EQ(extended.size(), 1U);
    EXPECT_EQ(extended[0].kind, TokenKind::kString);
    EXPECT_FALSE(extended[0].terminated);

    const auto as_code = tokenize_query(q, QuoteRecovery::kTreatAsCode);
    EXPECT_EQ(as_code.front().kind, TokenKind::kPunct);
    EXPECT_EQ(as_code.back().kind, TokenKind::kLineComment);
}
