// ---------------------------------------------------------------------------
// test_schema_loader.cpp
//
// SchemaLoader YAML → JsonSchema 변환 단위 테스트
// ---------------------------------------------------------------------------

#include "schema/schema_loader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Fixture: 임시 스키마 파일
// ---------------------------------------------------------------------------
class SchemaLoaderFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "inputgate_test_schemas" / info->name();
        fs::create_directories(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path write(const std::string& name, const std::string& content) const {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

// ---------------------------------------------------------------------------
// Test: parse_text
// ---------------------------------------------------------------------------
TEST(SchemaLoader, ParsesFullSchema) {
    const auto schema = SchemaLoader::parse_text(R"(
name: article
required: [title]
additional_properties: false
properties:
  title:  { type: string, min_length: 1, max_length: 200, pattern: "^[^<>]*$" }
  rating: { type: number, minimum: 0, maximum: 5 }
  status: { type: string, enum: [draft, published] }
  tags:
    type: array
    max_items: 3
    items: { type: string, max_length: 16 }
  author:
    type: object
    required: [id]
    properties:
      id: { type: integer, minimum: 1 }
)");
    ASSERT_TRUE(schema.has_value()) << schema.error();
    EXPECT_EQ(schema->name, "article");
    EXPECT_EQ(schema->type, SchemaType::kObject);
    EXPECT_EQ(schema->additional_properties, AdditionalProperties::kDisallow);
    EXPECT_EQ(schema->required, (std::vector<std::string>{"title"}));
    ASSERT_EQ(schema->properties.size(), 5U);

    const auto& title = schema->properties.at("title");
    EXPECT_EQ(title.type, SchemaType::kString);
    EXPECT_EQ(*title.constraints.max_length, 200U);
    EXPECT_NE(title.constraints.compiled_pattern, nullptr);

    const auto& rating = schema->properties.at("rating");
    EXPECT_DOUBLE_EQ(*rating.constraints.maximum, 5.0);

    const auto& status = schema->properties.at("status");
    EXPECT_EQ(status.constraints.enum_values, (std::vector<std::string>{"draft", "published"}));

    const auto& tags = schema->properties.at("tags");
    ASSERT_NE(tags.items, nullptr);
    EXPECT_EQ(*tags.items->constraints.max_length, 16U);

    const auto& author = schema->properties.at("author");
    ASSERT_NE(author.object_schema, nullptr);
    EXPECT_EQ(author.object_schema->required, (std::vector<std::string>{"id"}));
    EXPECT_EQ(author.object_schema->properties.at("id").type, SchemaType::kInteger);
}

TEST(SchemaLoader, AdditionalPropertiesDefaultsToAllow) {
    const auto schema = SchemaLoader::parse_text("name: loose\n");
    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->additional_properties, AdditionalProperties::kAllow);
    EXPECT_TRUE(schema->properties.empty());
}

TEST(SchemaLoader, ExplicitNameOverridesDocument) {
    const auto schema = SchemaLoader::parse(YAML::Load("name: inner\n"), "outer");
    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->name, "outer");
}

// ---------------------------------------------------------------------------
// Test: 전체 거부 (all-or-nothing)
// ---------------------------------------------------------------------------
TEST(SchemaLoader, RejectsUnknownType) {
    const auto schema = SchemaLoader::parse_text(R"(
name: bad
properties:
  when: { type: datetime }
)");
    ASSERT_FALSE(schema.has_value());
    EXPECT_NE(schema.error().find("unknown type 'datetime'"), std::string::npos);
    EXPECT_NE(schema.error().find("bad.when"), std::string::npos);
}

TEST(SchemaLoader, RejectsInvalidPattern) {
    const auto schema = SchemaLoader::parse_text(R"(
name: bad
properties:
  code: { type: string, pattern: "([a-z" }
)");
    ASSERT_FALSE(schema.has_value());
    EXPECT_NE(schema.error().find("invalid pattern"), std::string::npos);
}

TEST(SchemaLoader, RejectsInvertedBounds) {
    EXPECT_FALSE(SchemaLoader::parse_text(R"(
name: bad
properties:
  s: { type: string, min_length: 10, max_length: 2 }
)").has_value());
    EXPECT_FALSE(SchemaLoader::parse_text(R"(
name: bad
properties:
  n: { type: number, minimum: 5, maximum: 1 }
)").has_value());
}

TEST(SchemaLoader, RejectsMissingNameAndBadAdditional) {
    EXPECT_FALSE(SchemaLoader::parse_text("properties: {}\n").has_value());
    EXPECT_FALSE(SchemaLoader::parse_text("name: x\nadditional_properties: sometimes\n").has_value());
    EXPECT_FALSE(SchemaLoader::parse_text("- not\n- a map\n").has_value());
}

TEST(SchemaLoader, ReportsYamlSyntaxErrorLine) {
    const auto schema = SchemaLoader::parse_text("name: x\nproperties: { a: [\n");
    ASSERT_FALSE(schema.has_value());
    EXPECT_NE(schema.error().find("YAML parse error"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Test: load_file
// ---------------------------------------------------------------------------
TEST_F(SchemaLoaderFileTest, LoadsSchemasKey) {
    const auto path = write("schemas.yaml", R"(
schemas:
  - name: one
    properties: { a: { type: string } }
  - name: two
    type: object
)");
    const auto schemas = SchemaLoader::load_file(path);
    ASSERT_TRUE(schemas.has_value()) << schemas.error();
    ASSERT_EQ(schemas->size(), 2U);
    EXPECT_EQ((*schemas)[0].name, "one");
    EXPECT_EQ((*schemas)[1].name, "two");
}

TEST_F(SchemaLoaderFileTest, LoadsTopLevelSequence) {
    const auto path = write("list.yaml", "- name: only\n");
    const auto schemas = SchemaLoader::load_file(path);
    ASSERT_TRUE(schemas.has_value());
    EXPECT_EQ(schemas->size(), 1U);
}

TEST_F(SchemaLoaderFileTest, OneBadSchemaRejectsFile) {
    const auto path = write("mixed.yaml", R"(
- name: good
- name: broken
  properties:
    x: { type: nope }
)");
    EXPECT_FALSE(SchemaLoader::load_file(path).has_value());
}

TEST_F(SchemaLoaderFileTest, MissingFileIsError) {
    const auto schemas = SchemaLoader::load_file(dir_ / "absent.yaml");
    ASSERT_FALSE(schemas.has_value());
    EXPECT_NE(schemas.error().find("cannot resolve path"), std::string::npos);
}

TEST_F(SchemaLoaderFileTest, FileWithoutSequenceIsError) {
    const auto path = write("empty.yaml", "version: 1\n");
    EXPECT_FALSE(SchemaLoader::load_file(path).has_value());
}
