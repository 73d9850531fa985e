#pragma once

// ---------------------------------------------------------------------------
// schema_loader.hpp
//
// YAML 문서 → JsonSchema 변환.
//
// [형식]
//   name: entity
//   type: object                        # 생략 시 object
//   required: [name, type]
//   additional_properties: warn         # allow | warn | disallow | true | false
//   properties:
//     name: { type: string, min_length: 1, max_length: 256, pattern: "^[a-z]+$" }
//     mode: { type: string, enum: [a, b] }
//     tags: { type: array, max_items: 10, items: { type: string } }
//     meta: { type: object, required: [k], properties: { k: { type: integer } } }
//
// [설계 원칙]
// - All-or-nothing: 알 수 없는 type, 잘못된 pattern, 과도한 중첩은 스키마
//   전체를 거부한다 (부분 스키마로 검증하면 제약이 조용히 빠진다).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "schema/json_schema.hpp"

class SchemaLoader {
public:
    // name 이 비어 있으면 node["name"] 을 사용한다.
    [[nodiscard]] static std::expected<JsonSchema, std::string>
    parse(const YAML::Node& node, std::string name = {});

    [[nodiscard]] static std::expected<JsonSchema, std::string>
    parse_text(std::string_view yaml_text);

    // 최상위가 스키마 sequence 이거나 "schemas:" 키 아래 sequence 인 파일
    [[nodiscard]] static std::expected<std::vector<JsonSchema>, std::string>
    load_file(const std::filesystem::path& path);
};
