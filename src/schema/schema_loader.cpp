// ---------------------------------------------------------------------------
// schema_loader.cpp
// ---------------------------------------------------------------------------

#include "schema/schema_loader.hpp"

#include <regex>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/yaml_read.hpp"

namespace {

constexpr int kMaxSchemaDepth = 32;

using ParseError = std::unexpected<std::string>;

std::expected<JsonSchema, std::string> parse_object(const YAML::Node& node, std::string name,
                                                    const std::string& where, int depth);

std::expected<AdditionalProperties, std::string> parse_additional(const YAML::Node& node,
                                                                  const std::string& where) {
    if (!node) {
        return AdditionalProperties::kAllow;
    }
    const std::string raw = read_string(node, "");
    if (raw == "allow" || raw == "true") {
        return AdditionalProperties::kAllow;
    }
    if (raw == "warn") {
        return AdditionalProperties::kWarn;
    }
    if (raw == "disallow" || raw == "false") {
        return AdditionalProperties::kDisallow;
    }
    return ParseError(fmt::format("{}: invalid additional_properties '{}'", where, raw));
}

std::expected<PropertySchema, std::string> parse_property(const YAML::Node& node,
                                                          const std::string& where, int depth) {
    if (depth > kMaxSchemaDepth) {
        return ParseError(fmt::format("{}: schema nesting exceeds {}", where, kMaxSchemaDepth));
    }
    if (!node || !node.IsMap()) {
        return ParseError(fmt::format("{}: property definition must be a map", where));
    }

    PropertySchema prop{};
    const std::string type_name = read_string(node["type"], "any");
    const auto type = schema_type_from_string(type_name);
    if (!type) {
        return ParseError(fmt::format("{}: unknown type '{}'", where, type_name));
    }
    prop.type        = *type;
    prop.description = read_string(node["description"], "");

    auto& c        = prop.constraints;
    c.min_length   = read_optional_size(node["min_length"]);
    c.max_length   = read_optional_size(node["max_length"]);
    c.minimum      = read_optional_double(node["minimum"]);
    c.maximum      = read_optional_double(node["maximum"]);
    c.min_items    = read_optional_size(node["min_items"]);
    c.max_items    = read_optional_size(node["max_items"]);
    c.enum_values  = read_string_sequence(node["enum"]);

    if (c.min_length && c.max_length && *c.min_length > *c.max_length) {
        return ParseError(fmt::format("{}: min_length > max_length", where));
    }
    if (c.minimum && c.maximum && *c.minimum > *c.maximum) {
        return ParseError(fmt::format("{}: minimum > maximum", where));
    }

    if (const auto pattern = read_string(node["pattern"], ""); !pattern.empty()) {
        try {
            c.set_pattern(pattern);
        } catch (const std::regex_error& e) {
            return ParseError(fmt::format("{}: invalid pattern '{}': {}", where, pattern, e.what()));
        }
    }

    if (prop.type == SchemaType::kObject && (node["properties"] || node["required"])) {
        auto nested = parse_object(node, "", where, depth + 1);
        if (!nested) {
            return ParseError(nested.error());
        }
        prop.object_schema = std::make_shared<const JsonSchema>(std::move(*nested));
    }
    if (prop.type == SchemaType::kArray && node["items"]) {
        auto items = parse_property(node["items"], where + "[]", depth + 1);
        if (!items) {
            return ParseError(items.error());
        }
        prop.items = std::make_shared<const PropertySchema>(std::move(*items));
    }
    return prop;
}

std::expected<JsonSchema, std::string> parse_object(const YAML::Node& node, std::string name,
                                                    const std::string& where, int depth) {
    JsonSchema schema{};
    schema.name        = std::move(name);
    schema.description = read_string(node["description"], "");

    const std::string type_name = read_string(node["type"], "object");
    const auto type = schema_type_from_string(type_name);
    if (!type) {
        return ParseError(fmt::format("{}: unknown type '{}'", where, type_name));
    }
    schema.type     = *type;
    schema.required = read_string_sequence(node["required"]);

    auto additional = parse_additional(node["additional_properties"], where);
    if (!additional) {
        return ParseError(additional.error());
    }
    schema.additional_properties = *additional;

    const YAML::Node props = node["properties"];
    if (props && !props.IsMap()) {
        return ParseError(fmt::format("{}: 'properties' must be a map", where));
    }
    if (props) {
        for (const auto& kv : props) {
            const std::string key = kv.first.as<std::string>();
            auto prop = parse_property(kv.second, where + "." + key, depth + 1);
            if (!prop) {
                return ParseError(prop.error());
            }
            schema.properties.emplace(key, std::move(*prop));
        }
    }
    return schema;
}

}  // namespace

std::expected<JsonSchema, std::string> SchemaLoader::parse(const YAML::Node& node, std::string name) {
    if (!node || !node.IsMap()) {
        return ParseError("schema_loader: schema document must be a map");
    }
    if (name.empty()) {
        name = read_string(node["name"], "");
    }
    if (name.empty()) {
        return ParseError("schema_loader: schema has no name");
    }
    try {
        auto schema = parse_object(node, name, name, 0);
        if (!schema) {
            return ParseError(fmt::format("schema_loader: {}", schema.error()));
        }
        return schema;
    } catch (const YAML::Exception& e) {
        return ParseError(fmt::format("schema_loader: error parsing schema '{}': {}", name, e.what()));
    }
}

std::expected<JsonSchema, std::string> SchemaLoader::parse_text(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        return ParseError(fmt::format("schema_loader: YAML parse error at line {}, col {}: {}",
                                      e.mark.line + 1, e.mark.column + 1, e.what()));
    }
    return parse(root);
}

std::expected<std::vector<JsonSchema>, std::string>
SchemaLoader::load_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        const std::string err = fmt::format("schema_loader: cannot resolve path '{}': {}",
                                            path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format("schema_loader: cannot open file '{}': {}",
                                            canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "schema_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    const YAML::Node list = (root && root.IsMap()) ? root["schemas"] : root;
    if (!list || !list.IsSequence()) {
        const std::string err = fmt::format("schema_loader: '{}' has no schema sequence",
                                            canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    std::vector<JsonSchema> schemas;
    schemas.reserve(list.size());
    for (const auto& item : list) {
        auto schema = parse(item);
        if (!schema) {
            spdlog::error("{}", schema.error());
            return std::unexpected(schema.error());
        }
        schemas.push_back(std::move(*schema));
    }
    spdlog::info("schema_loader: loaded {} schema(s) from '{}'", schemas.size(),
                 canonical_path.string());
    return schemas;
}
