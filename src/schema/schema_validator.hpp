#pragma once

// ---------------------------------------------------------------------------
// schema_validator.hpp
//
// YAML/JSON 문서를 JsonSchema 에 대해 재귀 검증한다.
// 입력 문서는 YAML::Node (JSON 은 YAML flow 스타일의 부분집합이므로
// YAML::Load 로 그대로 읽힌다).
//
// [검증 순서: 객체 하나 기준]
// 1. 루트 타입 확인 (불일치 시 INVALID_TYPE 1건 후 하위 검증 중단)
// 2. required 목록 중 없는 필드마다 MISSING_REQUIRED_FIELD 1건
// 3. 존재하는 선언 속성: 타입 → 제약(길이/범위/패턴/enum/원소 수) → 중첩 객체/배열
// 4. 선언되지 않은 속성: additional_properties 정책에 따라 오류/경고
//
// [스칼라 타입 판정]
// - 따옴표로 감싼 스칼라(태그 "!")는 항상 string
// - plain 스칼라: true/false → boolean, 정수 → integer, 실수 → number, 그 외 string
//
// [오류 처리]
// 구조적 실패는 ValidationResult 에만 기록하며 예외를 던지지 않는다.
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "schema/json_schema.hpp"
#include "schema/schema_registry.hpp"

class SchemaValidator {
public:
    explicit SchemaValidator(std::shared_ptr<const SchemaRegistry> registry = nullptr);

    ~SchemaValidator() = default;

    SchemaValidator(const SchemaValidator&)            = default;
    SchemaValidator& operator=(const SchemaValidator&) = default;
    SchemaValidator(SchemaValidator&&)                 = default;
    SchemaValidator& operator=(SchemaValidator&&)      = default;

    [[nodiscard]] ValidationResult validate(const YAML::Node& document,
                                            const JsonSchema& schema) const;

    // 레지스트리 조회 후 검증. 없으면 schema_found == false + SCHEMA_NOT_FOUND.
    [[nodiscard]] ValidationResult validate(const YAML::Node& document,
                                            std::string_view schema_name) const;

    // 문서 노드의 실제 타입 (테스트/진단용)
    [[nodiscard]] static SchemaType infer_type(const YAML::Node& node);

private:
    std::shared_ptr<const SchemaRegistry> registry_;
};
