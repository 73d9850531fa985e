// ---------------------------------------------------------------------------
// test_schema_validator.cpp
//
// SchemaValidator / SchemaRegistry 단위 테스트
// 내장 스키마(entity / relationship / search_query)를 기준으로 검증한다.
// ---------------------------------------------------------------------------

#include "schema/schema_registry.hpp"
#include "schema/schema_validator.hpp"

#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

using namespace std::chrono_literals;

namespace {

class SchemaValidatorTest : public ::testing::Test {
protected:
    SchemaValidatorTest()
        : registry_(std::make_shared<SchemaRegistry>())
        , validator_(registry_)
    {}

    ValidationResult run(const std::string& json, const std::string& schema) const {
        return validator_.validate(YAML::Load(json), schema);
    }

    std::shared_ptr<SchemaRegistry> registry_;
    SchemaValidator                 validator_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Test: 유효한 문서
// ---------------------------------------------------------------------------
TEST_F(SchemaValidatorTest, ValidSearchQuery) {
    const auto r = run(R"({"query": "graph databases", "limit": 20, "mode": "hybrid"})", "search_query");
    EXPECT_TRUE(r.is_valid());
    EXPECT_TRUE(r.schema_found);
    EXPECT_EQ(r.schema_name, "search_query");
    EXPECT_EQ(r.properties_checked, 3U);
    EXPECT_TRUE(r.warnings.empty());
}

TEST_F(SchemaValidatorTest, NumberAcceptsInteger) {
    const auto r = run(R"({"source_id": "a1", "target_id": "b2", "type": "KNOWS", "weight": 1})",
                       "relationship");
    EXPECT_TRUE(r.is_valid());
}

// ---------------------------------------------------------------------------
// Test: 오류 누적과 순서
// ---------------------------------------------------------------------------
TEST_F(SchemaValidatorTest, CollectsEveryViolation) {
    const auto r = run(R"({"limit": 500, "extra": true})", "search_query");
    ASSERT_EQ(r.errors.size(), 3U);

    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kMissingRequiredField);
    EXPECT_EQ(r.errors[0].path, "$.query");

    EXPECT_EQ(r.errors[1].code, ValidationErrorCode::kValueTooLarge);
    EXPECT_EQ(r.errors[1].path, "$.limit");
    EXPECT_EQ(r.errors[1].expected, "100");
    EXPECT_EQ(r.errors[1].actual, "500");

    EXPECT_EQ(r.errors[2].code, ValidationErrorCode::kAdditionalProperty);
    EXPECT_EQ(r.errors[2].path, "$.extra");
}

TEST_F(SchemaValidatorTest, TypeMismatchReportsExpectedAndActual) {
    const auto r = run(R"({"query": 42})", "search_query");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kInvalidType);
    EXPECT_EQ(r.errors[0].expected, "string");
    EXPECT_EQ(r.errors[0].actual, "integer");
}

TEST_F(SchemaValidatorTest, QuotedNumberIsString) {
    EXPECT_TRUE(run(R"({"query": "42"})", "search_query").is_valid());
}

TEST_F(SchemaValidatorTest, EnumViolation) {
    const auto r = run(R"({"query": "x", "mode": "fuzzy"})", "search_query");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kInvalidEnumValue);
    EXPECT_EQ(r.errors[0].expected, "semantic|keyword|hybrid");
}

TEST_F(SchemaValidatorTest, PatternMismatchDoesNotEchoValue) {
    const auto r = run(R"({"name": "Ada", "type": "1-secret-value"})", "entity");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kPatternMismatch);
    EXPECT_EQ(r.errors[0].path, "$.type");
    EXPECT_TRUE(r.errors[0].actual.empty());
    EXPECT_EQ(r.errors[0].message.find("secret"), std::string::npos);
}

TEST_F(SchemaValidatorTest, ArrayItemsValidatedWithIndexPath) {
    const auto r = run(R"({"name": "Ada", "type": "Person", "tags": ["ok", ""]})", "entity");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kStringTooShort);
    EXPECT_EQ(r.errors[0].path, "$.tags[1]");
}

TEST_F(SchemaValidatorTest, NullRequiredFieldIsMissing) {
    const auto r = run(R"({"name": null, "type": "Person"})", "entity");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kMissingRequiredField);
    EXPECT_EQ(r.errors[0].path, "$.name");
}

TEST_F(SchemaValidatorTest, RootMustBeObject) {
    const auto r = run("[1, 2, 3]", "entity");
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kInvalidType);
    EXPECT_EQ(r.errors[0].path, "$");
    EXPECT_EQ(r.errors[0].actual, "array");
}

// ---------------------------------------------------------------------------
// Test: additional_properties 정책
// ---------------------------------------------------------------------------
TEST_F(SchemaValidatorTest, WarnPolicyKeepsDocumentValid) {
    const auto r = run(R"({"name": "Ada", "type": "Person", "color": "red"})", "entity");
    EXPECT_TRUE(r.is_valid());
    ASSERT_EQ(r.warnings.size(), 1U);
    EXPECT_EQ(r.warnings[0].code, ValidationErrorCode::kUnknownProperty);
    EXPECT_EQ(r.warnings[0].severity, ValidationSeverity::kWarning);
    EXPECT_EQ(r.warnings[0].path, "$.color");
}

TEST(SchemaValidator, AllowPolicyIgnoresUnknownProperties) {
    JsonSchema schema{};
    schema.name                  = "open";
    schema.additional_properties = AdditionalProperties::kAllow;

    const SchemaValidator validator;
    const auto r = validator.validate(YAML::Load(R"({"anything": 1})"), schema);
    EXPECT_TRUE(r.is_valid());
    EXPECT_TRUE(r.warnings.empty());
}

// ---------------------------------------------------------------------------
// Test: 중첩 객체와 코드포인트 길이
// ---------------------------------------------------------------------------
TEST(SchemaValidator, NestedObjectPaths) {
    auto inner = std::make_shared<JsonSchema>();
    inner->required = {"city"};
    PropertySchema zip{};
    zip.type                   = SchemaType::kString;
    zip.constraints.max_length = 5;
    inner->properties.emplace("zip", zip);

    PropertySchema address{};
    address.type          = SchemaType::kObject;
    address.object_schema = inner;

    JsonSchema schema{};
    schema.name = "person";
    schema.properties.emplace("address", address);

    const SchemaValidator validator;
    const auto r = validator.validate(YAML::Load(R"({"address": {"zip": "1234567"}})"), schema);
    ASSERT_EQ(r.errors.size(), 2U);
    EXPECT_EQ(r.errors[0].path, "$.address.city");
    EXPECT_EQ(r.errors[1].path, "$.address.zip");
    EXPECT_EQ(r.errors[1].code, ValidationErrorCode::kStringTooLong);
}

TEST(SchemaValidator, StringLengthCountsCodePoints) {
    PropertySchema word{};
    word.type                   = SchemaType::kString;
    word.constraints.max_length = 2;

    JsonSchema schema{};
    schema.name = "word";
    schema.properties.emplace("w", word);

    const SchemaValidator validator;
    EXPECT_TRUE(validator.validate(YAML::Load("{\"w\": \"\xED\x95\x9C\xEA\xB8\x80\"}"), schema).is_valid());
    EXPECT_FALSE(validator.validate(YAML::Load("{\"w\": \"\xED\x95\x9C\xEA\xB8\x80!\"}"), schema).is_valid());
}

TEST(SchemaValidator, InferType) {
    const auto doc = YAML::Load(R"({"b": true, "i": -3, "n": 2.5, "s": "true", "p": hello, "z": null})");
    EXPECT_EQ(SchemaValidator::infer_type(doc["b"]), SchemaType::kBoolean);
    EXPECT_EQ(SchemaValidator::infer_type(doc["i"]), SchemaType::kInteger);
    EXPECT_EQ(SchemaValidator::infer_type(doc["n"]), SchemaType::kNumber);
    EXPECT_EQ(SchemaValidator::infer_type(doc["s"]), SchemaType::kString);
    EXPECT_EQ(SchemaValidator::infer_type(doc["p"]), SchemaType::kString);
    EXPECT_EQ(SchemaValidator::infer_type(doc["z"]), SchemaType::kNull);
}

// ---------------------------------------------------------------------------
// Test: 레지스트리
// ---------------------------------------------------------------------------
TEST_F(SchemaValidatorTest, UnknownSchemaNameReported) {
    const auto r = run(R"({"a": 1})", "does_not_exist");
    EXPECT_FALSE(r.schema_found);
    ASSERT_EQ(r.errors.size(), 1U);
    EXPECT_EQ(r.errors[0].code, ValidationErrorCode::kSchemaNotFound);
}

TEST(SchemaRegistry, BuiltinsPresentAndSorted) {
    SchemaRegistry registry;
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"entity", "relationship", "search_query"}));
}

TEST(SchemaRegistry, DynamicSchemaExpiresBuiltinsDoNot) {
    ManualClock    clock;
    SchemaRegistry registry(60s, clock.fn());

    JsonSchema custom{};
    custom.name = "custom";
    ASSERT_TRUE(registry.register_schema(custom));
    ASSERT_NE(registry.find("custom"), nullptr);

    clock.advance(61s);
    EXPECT_EQ(registry.find("custom"), nullptr);
    EXPECT_NE(registry.find("entity"), nullptr);
}

TEST(SchemaRegistry, RejectsEmptyNameAndRemoves) {
    SchemaRegistry registry;
    EXPECT_FALSE(registry.register_schema(JsonSchema{}));

    EXPECT_TRUE(registry.remove("entity"));
    EXPECT_EQ(registry.find("entity"), nullptr);
    EXPECT_FALSE(registry.remove("entity"));
}
