#pragma once

// ---------------------------------------------------------------------------
// json_schema.hpp
//
// 재귀 스키마 트리와 검증 결과 타입 정의.
//
// [구조]
//   JsonSchema
//     ├─ type / required / additional_properties
//     └─ properties: name → PropertySchema
//                          ├─ type + ValidationConstraints
//                          ├─ object_schema (type == kObject, 중첩 JsonSchema)
//                          └─ items         (type == kArray, 원소 PropertySchema)
//
// [불변식]
// - ValidationResult::is_valid() ⇔ errors.empty()
// - 경고(warnings)는 유효성에 영향을 주지 않는다.
// - 스키마 객체는 등록 후 불변 (shared_ptr<const>), 교체만 허용.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

struct JsonSchema;

// ---------------------------------------------------------------------------
// SchemaType
// ---------------------------------------------------------------------------
enum class SchemaType : std::uint8_t {
    kAny     = 0,
    kObject  = 1,
    kArray   = 2,
    kString  = 3,
    kInteger = 4,
    kNumber  = 5,  // 정수 포함
    kBoolean = 6,
    kNull    = 7,
};

[[nodiscard]] inline std::string_view to_string(SchemaType type) noexcept {
    switch (type) {
        case SchemaType::kAny:     return "any";
        case SchemaType::kObject:  return "object";
        case SchemaType::kArray:   return "array";
        case SchemaType::kString:  return "string";
        case SchemaType::kInteger: return "integer";
        case SchemaType::kNumber:  return "number";
        case SchemaType::kBoolean: return "boolean";
        case SchemaType::kNull:    return "null";
    }
    return "any";
}

[[nodiscard]] inline std::optional<SchemaType> schema_type_from_string(std::string_view s) noexcept {
    if (s == "any")     { return SchemaType::kAny; }
    if (s == "object")  { return SchemaType::kObject; }
    if (s == "array")   { return SchemaType::kArray; }
    if (s == "string" || s == "text") { return SchemaType::kString; }
    if (s == "integer") { return SchemaType::kInteger; }
    if (s == "number")  { return SchemaType::kNumber; }
    if (s == "boolean") { return SchemaType::kBoolean; }
    if (s == "null")    { return SchemaType::kNull; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ValidationConstraints
//   pattern 은 생성 시 컴파일해 둔다 (set_pattern). compiled 가 없으면
//   검증기가 호출 시점에 컴파일한다.
// ---------------------------------------------------------------------------
struct ValidationConstraints {
    std::optional<std::size_t>   min_length{};
    std::optional<std::size_t>   max_length{};
    std::optional<double>        minimum{};
    std::optional<double>        maximum{};
    std::optional<std::string>   pattern{};
    std::shared_ptr<const std::regex> compiled_pattern{};
    std::vector<std::string>     enum_values{};
    std::optional<std::size_t>   min_items{};
    std::optional<std::size_t>   max_items{};

    // 예외: 잘못된 정규식이면 std::regex_error
    void set_pattern(std::string source) {
        compiled_pattern = std::make_shared<const std::regex>(source, std::regex_constants::ECMAScript);
        pattern          = std::move(source);
    }
};

// ---------------------------------------------------------------------------
// PropertySchema
// ---------------------------------------------------------------------------
struct PropertySchema {
    SchemaType                            type{SchemaType::kAny};
    ValidationConstraints                 constraints{};
    std::shared_ptr<const JsonSchema>     object_schema{};  // type == kObject
    std::shared_ptr<const PropertySchema> items{};          // type == kArray
    std::string                           description{};
};

// ---------------------------------------------------------------------------
// AdditionalProperties
//   kAllow   : 선언되지 않은 속성 허용 (보고 없음)
//   kWarn    : 허용하되 UNKNOWN_PROPERTY 경고
//   kDisallow: 속성마다 ADDITIONAL_PROPERTY 오류 1건
// ---------------------------------------------------------------------------
enum class AdditionalProperties : std::uint8_t {
    kAllow    = 0,
    kWarn     = 1,
    kDisallow = 2,
};

struct JsonSchema {
    std::string                           name{};
    SchemaType                            type{SchemaType::kObject};
    std::vector<std::string>              required{};
    std::map<std::string, PropertySchema> properties{};
    AdditionalProperties                  additional_properties{AdditionalProperties::kAllow};
    std::string                           description{};
};

// ---------------------------------------------------------------------------
// ValidationErrorCode
// ---------------------------------------------------------------------------
enum class ValidationErrorCode : std::uint8_t {
    kInvalidType          = 0,
    kMissingRequiredField = 1,
    kStringTooShort       = 2,
    kStringTooLong        = 3,
    kPatternMismatch      = 4,
    kValueTooSmall        = 5,
    kValueTooLarge        = 6,
    kInvalidEnumValue     = 7,
    kArrayTooShort        = 8,
    kArrayTooLong         = 9,
    kAdditionalProperty   = 10,
    kUnknownProperty      = 11,  // 경고 전용
    kSchemaNotFound       = 12,
    kInvalidSchema        = 13,
    kMaxDepthExceeded     = 14,
};

[[nodiscard]] inline std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::kInvalidType:          return "INVALID_TYPE";
        case ValidationErrorCode::kMissingRequiredField: return "MISSING_REQUIRED_FIELD";
        case ValidationErrorCode::kStringTooShort:       return "STRING_TOO_SHORT";
        case ValidationErrorCode::kStringTooLong:        return "STRING_TOO_LONG";
        case ValidationErrorCode::kPatternMismatch:      return "PATTERN_MISMATCH";
        case ValidationErrorCode::kValueTooSmall:        return "VALUE_TOO_SMALL";
        case ValidationErrorCode::kValueTooLarge:        return "VALUE_TOO_LARGE";
        case ValidationErrorCode::kInvalidEnumValue:     return "INVALID_ENUM_VALUE";
        case ValidationErrorCode::kArrayTooShort:        return "ARRAY_TOO_SHORT";
        case ValidationErrorCode::kArrayTooLong:         return "ARRAY_TOO_LONG";
        case ValidationErrorCode::kAdditionalProperty:   return "ADDITIONAL_PROPERTY";
        case ValidationErrorCode::kUnknownProperty:      return "UNKNOWN_PROPERTY";
        case ValidationErrorCode::kSchemaNotFound:       return "SCHEMA_NOT_FOUND";
        case ValidationErrorCode::kInvalidSchema:        return "INVALID_SCHEMA";
        case ValidationErrorCode::kMaxDepthExceeded:     return "MAX_DEPTH_EXCEEDED";
    }
    return "INVALID_SCHEMA";
}

enum class ValidationSeverity : std::uint8_t {
    kError   = 0,
    kWarning = 1,
};

struct ValidationError {
    std::string         path{};      // "$", "$.name", "$.tags[2]"
    std::string         message{};
    ValidationErrorCode code{ValidationErrorCode::kInvalidType};
    std::string         expected{};
    std::string         actual{};
    ValidationSeverity  severity{ValidationSeverity::kError};
};

struct ValidationResult {
    std::string                  schema_name{};
    bool                         schema_found{true};
    std::vector<ValidationError> errors{};
    std::vector<ValidationError> warnings{};
    std::size_t                  properties_checked{0};

    [[nodiscard]] bool is_valid() const noexcept { return errors.empty(); }
};
