// ---------------------------------------------------------------------------
// schema_validator.cpp
//
// [알려진 한계]
// - 문자열 길이는 UTF-8 코드포인트 수 기준 (결합 문자는 별도 집계).
// - pattern 은 ECMAScript regex_search 의미 (앵커는 패턴에 명시할 것).
// - 값이 null 인 선택 속성은 "없음" 으로 취급한다. 필수 속성의 null 은
//   MISSING_REQUIRED_FIELD.
// ---------------------------------------------------------------------------

#include "schema/schema_validator.hpp"

#include <charconv>
#include <cmath>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kMaxDepth = 64;

std::size_t utf8_length(std::string_view s) {
    std::size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool is_integer_text(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    std::size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (i == s.size()) {
        return false;
    }
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
    }
    return true;
}

std::optional<double> parse_double(std::string_view s) {
    if (!s.empty() && s[0] == '+') {
        s.remove_prefix(1);
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool type_compatible(SchemaType declared, SchemaType actual) {
    if (declared == SchemaType::kAny || declared == actual) {
        return true;
    }
    return declared == SchemaType::kNumber && actual == SchemaType::kInteger;
}

std::string format_number(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        return fmt::format("{}", static_cast<long long>(v));
    }
    return fmt::format("{}", v);
}

// ---------------------------------------------------------------------------
// SchemaWalker: 한 번의 validate 호출 동안 결과를 누적한다.
// ---------------------------------------------------------------------------
class SchemaWalker {
public:
    explicit SchemaWalker(ValidationResult& result) : result_(result) {}

    void walk_object(const YAML::Node& node, const JsonSchema& schema,
                     const std::string& path, int depth) {
        if (depth > kMaxDepth) {
            error(path, ValidationErrorCode::kMaxDepthExceeded, "document nesting too deep",
                  std::to_string(kMaxDepth), std::to_string(depth));
            return;
        }
        const SchemaType actual = SchemaValidator::infer_type(node);
        if (schema.type != SchemaType::kObject) {
            if (!type_compatible(schema.type, actual)) {
                type_error(path, schema.type, actual);
            }
            return;
        }
        if (actual != SchemaType::kObject) {
            type_error(path, SchemaType::kObject, actual);
            return;
        }

        for (const auto& field : schema.required) {
            const YAML::Node child = node[field];
            if (!child || child.IsNull()) {
                error(join(path, field), ValidationErrorCode::kMissingRequiredField,
                      fmt::format("required field '{}' is missing", field), field, "");
            }
        }

        for (const auto& kv : node) {
            const std::string key = kv.first.Scalar();
            const auto it = schema.properties.find(key);
            if (it == schema.properties.end()) {
                unknown_property(join(path, key), key, schema.additional_properties);
                continue;
            }
            ++result_.properties_checked;
            const YAML::Node& value = kv.second;
            if (value.IsNull() && it->second.type != SchemaType::kNull &&
                it->second.type != SchemaType::kAny) {
                continue;
            }
            walk_value(value, it->second, join(path, key), depth + 1);
        }
    }

    void walk_value(const YAML::Node& node, const PropertySchema& prop,
                    const std::string& path, int depth) {
        if (depth > kMaxDepth) {
            error(path, ValidationErrorCode::kMaxDepthExceeded, "document nesting too deep",
                  std::to_string(kMaxDepth), std::to_string(depth));
            return;
        }
        const SchemaType actual = SchemaValidator::infer_type(node);
        if (!type_compatible(prop.type, actual)) {
            type_error(path, prop.type, actual);
            return;
        }
        const auto& c = prop.constraints;

        switch (actual) {
            case SchemaType::kString: {
                const std::string& text = node.Scalar();
                check_string(text, c, path);
                check_enum(text, c, path);
                break;
            }
            case SchemaType::kInteger:
            case SchemaType::kNumber: {
                const auto value = parse_double(node.Scalar());
                if (value) {
                    check_range(*value, c, path);
                }
                check_enum(node.Scalar(), c, path);
                break;
            }
            case SchemaType::kBoolean:
                check_enum(node.Scalar(), c, path);
                break;
            case SchemaType::kArray: {
                check_items_count(node.size(), c, path);
                if (prop.items) {
                    for (std::size_t i = 0; i < node.size(); ++i) {
                        walk_value(node[i], *prop.items, fmt::format("{}[{}]", path, i), depth + 1);
                    }
                }
                break;
            }
            case SchemaType::kObject:
                if (prop.object_schema) {
                    walk_object(node, *prop.object_schema, path, depth + 1);
                }
                break;
            case SchemaType::kNull:
            case SchemaType::kAny:
                break;
        }
    }

private:
    static std::string join(const std::string& path, const std::string& key) {
        return path + "." + key;
    }

    void error(std::string path, ValidationErrorCode code, std::string message,
               std::string expected, std::string actual) {
        result_.errors.push_back(ValidationError{
            std::move(path), std::move(message), code,
            std::move(expected), std::move(actual), ValidationSeverity::kError});
    }

    void type_error(const std::string& path, SchemaType expected, SchemaType actual) {
        error(path, ValidationErrorCode::kInvalidType,
              fmt::format("expected {} but found {}", to_string(expected), to_string(actual)),
              std::string(to_string(expected)), std::string(to_string(actual)));
    }

    void unknown_property(const std::string& path, const std::string& key, AdditionalProperties mode) {
        switch (mode) {
            case AdditionalProperties::kAllow:
                break;
            case AdditionalProperties::kWarn:
                result_.warnings.push_back(ValidationError{
                    path, fmt::format("property '{}' is not declared in the schema", key),
                    ValidationErrorCode::kUnknownProperty, "", key, ValidationSeverity::kWarning});
                break;
            case AdditionalProperties::kDisallow:
                error(path, ValidationErrorCode::kAdditionalProperty,
                      fmt::format("property '{}' is not allowed", key), "", key);
                break;
        }
    }

    void check_string(const std::string& text, const ValidationConstraints& c, const std::string& path) {
        const auto len = utf8_length(text);
        if (c.min_length && len < *c.min_length) {
            error(path, ValidationErrorCode::kStringTooShort,
                  fmt::format("string shorter than {} characters", *c.min_length),
                  std::to_string(*c.min_length), std::to_string(len));
        }
        if (c.max_length && len > *c.max_length) {
            error(path, ValidationErrorCode::kStringTooLong,
                  fmt::format("string longer than {} characters", *c.max_length),
                  std::to_string(*c.max_length), std::to_string(len));
        }
        if (c.pattern) {
            std::shared_ptr<const std::regex> re = c.compiled_pattern;
            if (!re) {
                try {
                    re = std::make_shared<const std::regex>(*c.pattern, std::regex_constants::ECMAScript);
                } catch (const std::regex_error& e) {
                    spdlog::warn("schema_validator: invalid pattern '{}' at {}: {}", *c.pattern, path, e.what());
                    error(path, ValidationErrorCode::kInvalidSchema,
                          "schema pattern could not be compiled", *c.pattern, "");
                    return;
                }
            }
            if (!std::regex_search(text, *re)) {
                // 실제 값은 에코하지 않는다 (민감 입력 노출 방지)
                error(path, ValidationErrorCode::kPatternMismatch,
                      "string does not match the required pattern", *c.pattern, "");
            }
        }
    }

    void check_range(double value, const ValidationConstraints& c, const std::string& path) {
        if (c.minimum && value < *c.minimum) {
            error(path, ValidationErrorCode::kValueTooSmall,
                  fmt::format("value below minimum {}", format_number(*c.minimum)),
                  format_number(*c.minimum), format_number(value));
        }
        if (c.maximum && value > *c.maximum) {
            error(path, ValidationErrorCode::kValueTooLarge,
                  fmt::format("value above maximum {}", format_number(*c.maximum)),
                  format_number(*c.maximum), format_number(value));
        }
    }

    void check_enum(const std::string& text, const ValidationConstraints& c, const std::string& path) {
        if (c.enum_values.empty()) {
            return;
        }
        for (const auto& allowed : c.enum_values) {
            if (allowed == text) {
                return;
            }
        }
        error(path, ValidationErrorCode::kInvalidEnumValue, "value is not one of the allowed values",
              fmt::format("{}", fmt::join(c.enum_values, "|")), text);
    }

    void check_items_count(std::size_t n, const ValidationConstraints& c, const std::string& path) {
        if (c.min_items && n < *c.min_items) {
            error(path, ValidationErrorCode::kArrayTooShort,
                  fmt::format("array has fewer than {} items", *c.min_items),
                  std::to_string(*c.min_items), std::to_string(n));
        }
        if (c.max_items && n > *c.max_items) {
            error(path, ValidationErrorCode::kArrayTooLong,
                  fmt::format("array has more than {} items", *c.max_items),
                  std::to_string(*c.max_items), std::to_string(n));
        }
    }

    ValidationResult& result_;
};

}  // namespace

SchemaValidator::SchemaValidator(std::shared_ptr<const SchemaRegistry> registry)
    : registry_(std::move(registry))
{}

// ---------------------------------------------------------------------------
// infer_type
// ---------------------------------------------------------------------------
SchemaType SchemaValidator::infer_type(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return SchemaType::kNull;
    }
    if (node.IsMap()) {
        return SchemaType::kObject;
    }
    if (node.IsSequence()) {
        return SchemaType::kArray;
    }
    if (!node.IsScalar()) {
        return SchemaType::kAny;
    }
    // 따옴표 스칼라 → string
    if (node.Tag() == "!") {
        return SchemaType::kString;
    }
    const std::string& text = node.Scalar();
    if (text == "true" || text == "false" || text == "True" || text == "False" ||
        text == "TRUE" || text == "FALSE") {
        return SchemaType::kBoolean;
    }
    if (is_integer_text(text)) {
        return SchemaType::kInteger;
    }
    if (parse_double(text)) {
        return SchemaType::kNumber;
    }
    return SchemaType::kString;
}

ValidationResult SchemaValidator::validate(const YAML::Node& document, const JsonSchema& schema) const {
    ValidationResult result{};
    result.schema_name = schema.name;
    SchemaWalker walker(result);
    walker.walk_object(document, schema, "$", 0);
    if (!result.is_valid()) {
        spdlog::debug("schema_validator: '{}' failed with {} error(s)", schema.name, result.errors.size());
    }
    return result;
}

ValidationResult SchemaValidator::validate(const YAML::Node& document, std::string_view schema_name) const {
    std::shared_ptr<const JsonSchema> schema;
    if (registry_) {
        schema = registry_->find(schema_name);
    }
    if (!schema) {
        ValidationResult result{};
        result.schema_name  = std::string(schema_name);
        result.schema_found = false;
        result.errors.push_back(ValidationError{
            "$", fmt::format("schema '{}' is not registered", schema_name),
            ValidationErrorCode::kSchemaNotFound, std::string(schema_name), "",
            ValidationSeverity::kError});
        spdlog::warn("schema_validator: schema '{}' not found", schema_name);
        return result;
    }
    return validate(document, *schema);
}
