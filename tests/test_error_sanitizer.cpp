// ---------------------------------------------------------------------------
// test_error_sanitizer.cpp
//
// ErrorSanitizer 매핑 / 마스킹 / correlation id / 감사 이벤트 테스트
// ---------------------------------------------------------------------------

#include "error/error_sanitizer.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* kLeakyMessage =
    "connection failed: Server=db01;User Id=sa;Password=secret123";

class ErrorSanitizerTest : public ::testing::Test {
protected:
    ErrorSanitizerTest()
        : audit_(std::make_shared<RecordingAuditSink>())
        , prod_(false, audit_, {}, clock_.fn())
        , dev_(true, audit_, {}, clock_.fn())
    {}

    ManualClock                         clock_;
    std::shared_ptr<RecordingAuditSink> audit_;
    ErrorSanitizer                      prod_;
    ErrorSanitizer                      dev_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Test: 운영 모드
// ---------------------------------------------------------------------------
TEST_F(ErrorSanitizerTest, ProductionNeverLeaksRawMessage) {
    const auto r = prod_.sanitize(Failure::make(ErrorKind::kDatabase, kLeakyMessage, "pool=primary"));

    EXPECT_EQ(r.error, "database");
    EXPECT_EQ(r.code, "DATABASE_ERROR");
    EXPECT_EQ(r.message, "A data access error occurred.");
    EXPECT_EQ(r.status_code, 500);
    EXPECT_FALSE(r.debug.has_value());

    const auto json = r.to_json();
    EXPECT_EQ(json.find("secret123"), std::string::npos);
    EXPECT_EQ(json.find("db01"), std::string::npos);
    EXPECT_EQ(json.find("primary"), std::string::npos);
}

TEST_F(ErrorSanitizerTest, AuditKeepsRawFailureUnderSameId) {
    const auto r = prod_.sanitize(Failure::make(ErrorKind::kDatabase, kLeakyMessage));

    ASSERT_EQ(audit_->count(audit_event::kErrorSanitized), 1U);
    const auto ev = audit_->last(audit_event::kErrorSanitized);
    EXPECT_EQ(ev.correlation_id, r.correlation_id);
    EXPECT_EQ(ev.level, LogLevel::kError);
    EXPECT_EQ(field_of(ev, "kind"), "database");
    EXPECT_EQ(field_of(ev, "code"), "DATABASE_ERROR");
    EXPECT_EQ(field_of(ev, "message"), kLeakyMessage);
}

TEST_F(ErrorSanitizerTest, ValidationCarriesSafeDetailsDatabaseDoesNot) {
    auto validation = Failure::make(ErrorKind::kValidation, "limit out of range");
    validation.with_safe_detail("field", "$.limit");
    const auto v = prod_.sanitize(validation);
    EXPECT_EQ(v.status_code, 400);
    ASSERT_EQ(v.safe_details.size(), 1U);
    EXPECT_EQ(v.safe_details[0].second, "$.limit");
    EXPECT_NE(v.to_json().find(R"("details":{"field":"$.limit"})"), std::string::npos);

    auto database = Failure::make(ErrorKind::kDatabase, "x");
    database.with_safe_detail("table", "users");
    const auto d = prod_.sanitize(database);
    EXPECT_TRUE(d.safe_details.empty());
    EXPECT_EQ(d.to_json().find("details"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: 매핑 해석
// ---------------------------------------------------------------------------
TEST(ErrorSanitizerResolve, UnmappedKindUsesNearestAncestor) {
    const ErrorSanitizer sanitizer;
    EXPECT_EQ(sanitizer.resolve(ErrorKind::kQuery).first, ErrorKind::kDatabase);
    EXPECT_EQ(sanitizer.resolve(ErrorKind::kConfiguration).first, ErrorKind::kInternal);
    EXPECT_EQ(sanitizer.resolve(ErrorKind::kConflict).first, ErrorKind::kConflict);
    EXPECT_EQ(sanitizer.resolve(ErrorKind::kTimeout).second.status_code, 504);
}

TEST(ErrorSanitizerResolve, OverrideTakesPrecedence) {
    std::map<ErrorKind, ErrorMapping> overrides{
        {ErrorKind::kQuery, ErrorMapping{"QUERY_REJECTED", "The query could not be executed.", 422,
                                         LogLevel::kWarn, false}},
    };
    const ErrorSanitizer sanitizer(false, nullptr, overrides);
    const auto r = sanitizer.sanitize(Failure::make(ErrorKind::kQuery, "syntax error near MATCH"));
    EXPECT_EQ(r.error, "query");
    EXPECT_EQ(r.code, "QUERY_REJECTED");
    EXPECT_EQ(r.status_code, 422);
}

TEST(ErrorKindHierarchy, Parents) {
    EXPECT_EQ(*parent_of(ErrorKind::kQuery), ErrorKind::kDatabase);
    EXPECT_EQ(*parent_of(ErrorKind::kDatabase), ErrorKind::kInternal);
    EXPECT_FALSE(parent_of(ErrorKind::kInternal).has_value());
    EXPECT_FALSE(parent_of(ErrorKind::kRateLimited).has_value());
}

// ---------------------------------------------------------------------------
// Test: 개발 모드
// ---------------------------------------------------------------------------
TEST_F(ErrorSanitizerTest, DevelopmentDebugIsRedacted) {
    const auto r = dev_.sanitize(Failure::make(ErrorKind::kDatabase, kLeakyMessage));
    ASSERT_TRUE(r.debug.has_value());
    EXPECT_EQ(r.debug->kind, "database");
    EXPECT_EQ(r.debug->message, "connection failed: Server=***;User Id=***;Password=***");
    EXPECT_EQ(r.to_json().find("secret123"), std::string::npos);
}

TEST_F(ErrorSanitizerTest, CauseChainRedactedRecursively) {
    const auto inner  = Failure::make(ErrorKind::kDatabase, "auth failed for postgres://admin:hunter2@db:5432/app");
    const auto middle = inner.wrap(ErrorKind::kQuery, "query failed with token=abc.def");
    const auto outer  = middle.wrap(ErrorKind::kInternal, "request failed");

    const auto r = dev_.sanitize(outer);
    ASSERT_TRUE(r.debug.has_value());
    ASSERT_EQ(r.debug->causes.size(), 2U);
    EXPECT_EQ(r.debug->causes[0].kind, "query");
    EXPECT_EQ(r.debug->causes[0].message, "query failed with token=***");
    EXPECT_EQ(r.debug->causes[1].kind, "database");
    EXPECT_EQ(r.debug->causes[1].message, "auth failed for postgres://***:***@db:5432/app");

    const auto json = r.to_json();
    EXPECT_EQ(json.find("hunter2"), std::string::npos);
    EXPECT_EQ(json.find("abc.def"), std::string::npos);

    const auto ev = audit_->last(audit_event::kErrorSanitized);
    EXPECT_NE(field_of(ev, "cause_chain").find("query: query failed"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: correlation id
// ---------------------------------------------------------------------------
TEST_F(ErrorSanitizerTest, CorrelationIdFormatAndUniqueness) {
    const auto a = prod_.sanitize(Failure::make(ErrorKind::kNotFound, "no such entity"));
    const auto b = prod_.sanitize(Failure::make(ErrorKind::kNotFound, "no such entity"));

    const std::regex format(R"(^ERR-\d{8}-[0-9a-f]{16}$)");
    EXPECT_TRUE(std::regex_match(a.correlation_id, format)) << a.correlation_id;
    EXPECT_EQ(a.correlation_id.substr(0, 13), "ERR-20251009-");
    EXPECT_NE(a.correlation_id, b.correlation_id);
}

TEST_F(ErrorSanitizerTest, ExistingCorrelationIdPreserved) {
    auto failure           = Failure::make(ErrorKind::kTimeout, "upstream timed out");
    failure.correlation_id = "ERR-20250101-00000000000000ff";
    EXPECT_EQ(prod_.sanitize(failure).correlation_id, "ERR-20250101-00000000000000ff");
    EXPECT_EQ(failure.wrap(ErrorKind::kInternal, "outer").correlation_id, failure.correlation_id);
}

// ---------------------------------------------------------------------------
// Test: 예외 경계 / JSON
// ---------------------------------------------------------------------------
TEST_F(ErrorSanitizerTest, ExceptionSanitized) {
    const std::runtime_error ex("open /etc/inputgate/secret.key: permission denied");
    const auto r = prod_.sanitize_exception(ex, ErrorKind::kConfiguration);
    EXPECT_EQ(r.code, "INTERNAL_ERROR");
    EXPECT_EQ(r.to_json().find("/etc/inputgate"), std::string::npos);
    EXPECT_EQ(field_of(audit_->last(audit_event::kErrorSanitized), "kind"), "configuration");
}

TEST_F(ErrorSanitizerTest, JsonShape) {
    const auto r    = prod_.sanitize(Failure::make(ErrorKind::kRateLimited, "bucket empty"));
    const auto json = r.to_json();
    EXPECT_EQ(json.rfind(R"({"error":"rate_limited","message":"Too many requests. Please try again later.")", 0),
              0U);
    EXPECT_NE(json.find(R"("code":"RATE_LIMITED")"), std::string::npos);
    EXPECT_NE(json.find(R"("correlationId":"ERR-)"), std::string::npos);
    EXPECT_NE(json.find(R"("statusCode":429)"), std::string::npos);
    EXPECT_NE(json.find(R"("timestamp":"2025-10-09T08:53:20.000Z")"), std::string::npos);
}

TEST(ErrorSanitizerRedact, MasksCredentialFragments) {
    EXPECT_EQ(ErrorSanitizer::redact("api_key: sk_live_123"), "api_key:***");
    EXPECT_EQ(ErrorSanitizer::redact("Authorization: Bearer eyJhbGciOi.x.y"), "Authorization: Bearer ***");
    EXPECT_EQ(ErrorSanitizer::redact("plain failure"), "plain failure");
    EXPECT_EQ(ErrorSanitizer::redact(""), "");
}
