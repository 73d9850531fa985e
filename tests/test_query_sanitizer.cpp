// ---------------------------------------------------------------------------
// test_query_sanitizer.cpp
//
// QuerySanitizer 방어 모드(sanitize) / 권장 모드(create_parameterized) 테스트
// ---------------------------------------------------------------------------

#include "query/query_sanitizer.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace {

bool has_warning(const SanitizedQuery& q, const std::string& rule) {
    return std::any_of(q.warnings.begin(), q.warnings.end(),
                       [&](const SecurityWarning& w) { return w.rule == rule; });
}

}  // namespace

// ---------------------------------------------------------------------------
// Test: 규칙 표
// ---------------------------------------------------------------------------
TEST(QuerySanitizerRules, OrderedByDescendingPriority) {
    const auto& rules = QuerySanitizer::default_rules();
    ASSERT_EQ(rules.size(), 9U);
    EXPECT_TRUE(std::is_sorted(rules.begin(), rules.end(),
                               [](const SanitizationRule& a, const SanitizationRule& b) {
                                   return a.priority > b.priority;
                               }));
    EXPECT_EQ(rules.front().name, "strip_block_comment");
    EXPECT_EQ(rules.back().name, "warn_bulk_load");
}

// ---------------------------------------------------------------------------
// Test: 방어 모드
// ---------------------------------------------------------------------------
TEST(QuerySanitizer, QuoteBreakoutDropTable) {
    auto audit = std::make_shared<RecordingAuditSink>();
    const QuerySanitizer sanitizer({}, audit);

    const auto q = sanitizer.sanitize("'; DROP TABLE users; --");

    EXPECT_TRUE(q.was_modified);
    EXPECT_FALSE(q.blocked);
    ASSERT_EQ(q.actions.size(), 1U);
    EXPECT_EQ(q.actions[0].rule, "strip_line_comment");
    EXPECT_EQ(q.actions[0].original, "--");
    EXPECT_EQ(q.actions[0].position, 21U);

    ASSERT_EQ(q.warnings.size(), 1U);
    EXPECT_EQ(q.warnings[0].rule, "warn_destructive_keyword");
    EXPECT_EQ(q.warnings[0].severity, ThreatLevel::kCritical);

    EXPECT_EQ(q.query, "'; DROP TABLE users; ");
    EXPECT_EQ(q.original, "'; DROP TABLE users; --");

    EXPECT_EQ(audit->count(audit_event::kQuerySanitized), 1U);
    ASSERT_EQ(audit->count(audit_event::kQueryWarning), 1U);
    EXPECT_EQ(field_of(audit->last(audit_event::kQueryWarning), "max_severity"), "critical");
}

TEST(QuerySanitizer, SafeQueryUnchanged) {
    auto audit = std::make_shared<RecordingAuditSink>();
    const QuerySanitizer sanitizer({}, audit);
    const std::string in = "MATCH (a:Person {name: $name})-->(b) RETURN b.title ORDER BY b.title";

    const auto q = sanitizer.sanitize(in);
    EXPECT_EQ(q.query, in);
    EXPECT_FALSE(q.was_modified);
    EXPECT_TRUE(q.actions.empty());
    EXPECT_TRUE(q.warnings.empty());
    EXPECT_TRUE(audit->events().empty());
}

TEST(QuerySanitizer, CommentMarkersInsideClosedLiteralKept) {
    const QuerySanitizer sanitizer;
    const std::string in = "MATCH (n) WHERE n.url = 'http://x.org/a--b' RETURN n";
    const auto q = sanitizer.sanitize(in);
    EXPECT_EQ(q.query, in);
    EXPECT_FALSE(q.was_modified);
}

TEST(QuerySanitizer, BlockCommentReplacedWithSpace) {
    const QuerySanitizer sanitizer;
    const auto q = sanitizer.sanitize("MATCH/**/(n) RETURN n");
    EXPECT_EQ(q.query, "MATCH (n) RETURN n");
    ASSERT_EQ(q.actions.size(), 1U);
    EXPECT_EQ(q.actions[0].rule, "strip_block_comment");
    EXPECT_EQ(q.actions[0].original, "/**/");
    EXPECT_EQ(q.actions[0].replacement, " ");
}

TEST(QuerySanitizer, StatementSeparatorRemovedOutsideLiterals) {
    const QuerySanitizer sanitizer;
    const auto q = sanitizer.sanitize("MATCH (n {tag: 'a;b'}) RETURN n; MATCH (m) DETACH DELETE m");
    EXPECT_EQ(q.query, "MATCH (n {tag: 'a;b'}) RETURN n MATCH (m) DETACH DELETE m");
    ASSERT_EQ(q.actions.size(), 1U);
    EXPECT_EQ(q.actions[0].rule, "remove_statement_separator");
    EXPECT_TRUE(has_warning(q, "warn_destructive_keyword"));
}

TEST(QuerySanitizer, EvenBackslashRunClosesLiteralUntouched) {
    const QuerySanitizer sanitizer;
    const auto q = sanitizer.sanitize(R"(MATCH (n) WHERE n.path = 'C:\\' RETURN n; MATCH (m) RETURN m)");
    EXPECT_EQ(q.query, R"(MATCH (n) WHERE n.path = 'C:\\' RETURN n MATCH (m) RETURN m)");
    ASSERT_EQ(q.actions.size(), 1U);
    EXPECT_EQ(q.actions[0].rule, "remove_statement_separator");
}

TEST(QuerySanitizer, DoubledBackslashBeforeClosingQuoteKeepsTautologyWarning) {
    const QuerySanitizer sanitizer;
    const auto q = sanitizer.sanitize(R"(MATCH (n) WHERE n.name = 'x\\' OR 1=1 RETURN n)");
    EXPECT_TRUE(q.actions.empty());
    EXPECT_TRUE(has_warning(q, "warn_tautology"));
}

TEST(QuerySanitizer, OddBackslashRunBeforeQuoteCollapsed) {
    const QuerySanitizer sanitizer;
    const auto q = sanitizer.sanitize(R"(MATCH (n) WHERE n.name = 'a\\\'b' RETURN n)");
    EXPECT_EQ(q.query, R"(MATCH (n) WHERE n.name = 'a\'b' RETURN n)");
    ASSERT_EQ(q.actions.size(), 1U);
    EXPECT_EQ(q.actions[0].rule, "normalize_escaped_quote");
    EXPECT_EQ(q.actions[0].position, 27U);
    EXPECT_EQ(q.actions[0].original, R"(\\\')");
    EXPECT_EQ(q.actions[0].replacement, R"(\')");
}

TEST(QuerySanitizer, QuotedTautologyFlagged) {
    const QuerySanitizer sanitizer;
    EXPECT_TRUE(has_warning(sanitizer.sanitize("MATCH (u) WHERE u.name = 'x' OR 'a'='a' RETURN u"),
                            "warn_tautology"));
    EXPECT_TRUE(has_warning(sanitizer.sanitize(R"(MATCH (u) WHERE u.name = "x" or "k" = "k" RETURN u)"),
                            "warn_tautology"));
    EXPECT_FALSE(has_warning(sanitizer.sanitize("MATCH (u) WHERE u.name = 'x' OR 'a'='b' RETURN u"),
                             "warn_tautology"));
}

TEST(QuerySanitizer, AdminProcedureBlocksWithoutEditing) {
    const QuerySanitizer sanitizer;
    const std::string in = "CALL dbms.security.listUsers()";
    const auto q = sanitizer.sanitize(in);
    EXPECT_TRUE(q.blocked);
    EXPECT_FALSE(q.was_modified);
    EXPECT_EQ(q.query, in);
    ASSERT_EQ(q.warnings.size(), 1U);
    EXPECT_EQ(q.warnings[0].rule, "block_admin_procedure");
    EXPECT_EQ(q.warnings[0].severity, ThreatLevel::kCritical);
}

TEST(QuerySanitizer, DynamicApocExecutionBlocked) {
    const QuerySanitizer sanitizer;
    EXPECT_TRUE(sanitizer.sanitize("CALL apoc.cypher.run('MATCH (n) RETURN n', {})").blocked);
    EXPECT_FALSE(sanitizer.sanitize("RETURN apoc.text.join(['a'], ',')").blocked);
}

TEST(QuerySanitizer, WarningRules) {
    const QuerySanitizer sanitizer;
    EXPECT_TRUE(has_warning(sanitizer.sanitize("MATCH (n) RETURN n UNION ALL MATCH (m) RETURN m"),
                            "warn_union_select"));
    EXPECT_TRUE(has_warning(sanitizer.sanitize("MATCH (n) WHERE n.k = 'x' OR 'a'='a' RETURN n"),
                            "warn_tautology"));
    EXPECT_TRUE(has_warning(sanitizer.sanitize("LOAD CSV FROM 'https://x/y.csv' AS row RETURN row"),
                            "warn_bulk_load"));
    EXPECT_FALSE(has_warning(sanitizer.sanitize("MATCH (n) WHERE n.color = 'red' OR n.size = 2 RETURN n"),
                             "warn_tautology"));
}

TEST(QuerySanitizer, DeterministicAndStable) {
    const QuerySanitizer sanitizer;
    const std::string in = "MATCH (n) /* x */ WHERE n.a = 1 OR 1=1; DROP INDEX idx -- tail";

    const auto first  = sanitizer.sanitize(in);
    const auto second = sanitizer.sanitize(in);
    EXPECT_EQ(first.query, second.query);
    ASSERT_EQ(first.actions.size(), second.actions.size());
    for (std::size_t i = 0; i < first.actions.size(); ++i) {
        EXPECT_EQ(first.actions[i].rule, second.actions[i].rule);
        EXPECT_EQ(first.actions[i].position, second.actions[i].position);
    }
    ASSERT_EQ(first.warnings.size(), second.warnings.size());
    for (std::size_t i = 0; i < first.warnings.size(); ++i) {
        EXPECT_EQ(first.warnings[i].rule, second.warnings[i].rule);
    }

    // 이미 정제된 출력은 더 이상 편집되지 않는다
    EXPECT_FALSE(sanitizer.sanitize(first.query).was_modified);
}

// ---------------------------------------------------------------------------
// Test: 권장 모드 (파라미터화)
// ---------------------------------------------------------------------------
TEST(QueryParameterization, ValuesNeverEnterTemplate) {
    const QuerySanitizer sanitizer;
    const std::string tmpl = "MATCH (u:User {email: $email}) WHERE u.age > $age RETURN u";
    const std::string hostile = "a@b.c' OR '1'='1";

    const auto p = sanitizer.create_parameterized(
        tmpl, ParameterMap{{"email", hostile}, {"age", std::int64_t{30}}});
    ASSERT_TRUE(p.has_value()) << p.error().message;

    EXPECT_EQ(p->template_text, tmpl);
    EXPECT_EQ(p->template_text.find(hostile), std::string::npos);
    EXPECT_EQ(p->placeholders, (std::vector<std::string>{"email", "age"}));
    EXPECT_EQ(std::get<std::string>(p->parameters.at("email")), hostile);
    EXPECT_EQ(p->compiled_for_display,
              R"(MATCH (u:User {email: 'a@b.c\' OR \'1\'=\'1'}) WHERE u.age > 30 RETURN u)");
    EXPECT_TRUE(p->warnings.empty());
}

TEST(QueryParameterization, RepeatedPlaceholderListedOnce) {
    const QuerySanitizer sanitizer;
    const auto p = sanitizer.create_parameterized("RETURN $a + $a, '$notparam'",
                                                  ParameterMap{{"a", std::int64_t{2}}});
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->placeholders, (std::vector<std::string>{"a"}));
    EXPECT_EQ(p->compiled_for_display, "RETURN 2 + 2, '$notparam'");
}

TEST(QueryParameterization, MissingParameterRejected) {
    const QuerySanitizer sanitizer;
    const auto p = sanitizer.create_parameterized("MATCH (n) WHERE n.id = $id RETURN n", ParameterMap{});
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ParameterErrorCode::kMissingParameter);
    EXPECT_EQ(p.error().name, "id");
}

TEST(QueryParameterization, InvalidNameRejected) {
    const QuerySanitizer sanitizer;
    const auto p = sanitizer.create_parameterized("RETURN 1", ParameterMap{{"1bad", nullptr}});
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ParameterErrorCode::kInvalidName);
}

TEST(QueryParameterization, EmptyTemplateRejected) {
    const QuerySanitizer sanitizer;
    const auto p = sanitizer.create_parameterized("   ", ParameterMap{});
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ParameterErrorCode::kEmptyTemplate);
}

TEST(QueryParameterization, UnusedParameterWarns) {
    const QuerySanitizer sanitizer;
    const auto p = sanitizer.create_parameterized(
        "RETURN $x", ParameterMap{{"x", true}, {"extra", 1.5}});
    ASSERT_TRUE(p.has_value());
    ASSERT_EQ(p->warnings.size(), 1U);
    EXPECT_EQ(p->warnings[0].rule, "unused_parameter");
    EXPECT_EQ(p->compiled_for_display, "RETURN true");
}

TEST(QueryParameterization, RenderParameterDisplayForms) {
    EXPECT_EQ(QuerySanitizer::render_parameter(nullptr), "null");
    EXPECT_EQ(QuerySanitizer::render_parameter(false), "false");
    EXPECT_EQ(QuerySanitizer::render_parameter(std::int64_t{-5}), "-5");
    EXPECT_EQ(QuerySanitizer::render_parameter(1.5), "1.5");
    EXPECT_EQ(QuerySanitizer::render_parameter(std::string("it's")), R"('it\'s')");
    EXPECT_EQ(QuerySanitizer::render_parameter(std::vector<std::string>{"a", "b\\c"}),
              R"(['a', 'b\\c'])");
}

TEST(QueryParameterization, ParameterNameRules) {
    EXPECT_TRUE(QuerySanitizer::is_valid_parameter_name("user_id"));
    EXPECT_TRUE(QuerySanitizer::is_valid_parameter_name("_x1"));
    EXPECT_FALSE(QuerySanitizer::is_valid_parameter_name(""));
    EXPECT_FALSE(QuerySanitizer::is_valid_parameter_name("9lives"));
    EXPECT_FALSE(QuerySanitizer::is_valid_parameter_name("a-b"));
    EXPECT_FALSE(QuerySanitizer::is_valid_parameter_name(std::string(65, 'a')));
}

TEST(QueryParameterization, TypeNames) {
    EXPECT_EQ(parameter_type_name(ParameterValue{nullptr}), "null");
    EXPECT_EQ(parameter_type_name(ParameterValue{std::int64_t{1}}), "integer");
    EXPECT_EQ(parameter_type_name(ParameterValue{std::vector<std::string>{}}), "string_list");
}
