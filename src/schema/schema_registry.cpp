// ---------------------------------------------------------------------------
// schema_registry.cpp
// ---------------------------------------------------------------------------

#include "schema/schema_registry.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

PropertySchema string_prop(std::size_t min_len, std::size_t max_len) {
    PropertySchema p{};
    p.type                   = SchemaType::kString;
    p.constraints.min_length = min_len;
    p.constraints.max_length = max_len;
    return p;
}

PropertySchema integer_prop(double min, double max) {
    PropertySchema p{};
    p.type                = SchemaType::kInteger;
    p.constraints.minimum = min;
    p.constraints.maximum = max;
    return p;
}

PropertySchema free_object_prop() {
    PropertySchema p{};
    p.type = SchemaType::kObject;
    return p;
}

constexpr const char* kIdPattern   = "^[A-Za-z0-9][A-Za-z0-9_.:-]{0,127}$";
constexpr const char* kTypePattern = "^[A-Za-z][A-Za-z0-9_]*$";

// entity: 지식 그래프 노드
JsonSchema entity_schema() {
    JsonSchema s{};
    s.name        = "entity";
    s.description = "knowledge graph entity";
    s.required    = {"name", "type"};

    auto id = string_prop(1, 128);
    id.constraints.set_pattern(kIdPattern);
    auto type = string_prop(1, 64);
    type.constraints.set_pattern(kTypePattern);

    PropertySchema tags{};
    tags.type                  = SchemaType::kArray;
    tags.constraints.max_items = 50;
    tags.items = std::make_shared<const PropertySchema>(string_prop(1, 64));

    s.properties = {
        {"id", std::move(id)},
        {"name", string_prop(1, 256)},
        {"type", std::move(type)},
        {"description", string_prop(0, 4096)},
        {"properties", free_object_prop()},
        {"tags", std::move(tags)},
    };
    s.additional_properties = AdditionalProperties::kWarn;
    return s;
}

// relationship: 두 엔티티 사이의 방향성 간선
JsonSchema relationship_schema() {
    JsonSchema s{};
    s.name        = "relationship";
    s.description = "directed edge between two entities";
    s.required    = {"source_id", "target_id", "type"};

    auto source = string_prop(1, 128);
    source.constraints.set_pattern(kIdPattern);
    auto target = string_prop(1, 128);
    target.constraints.set_pattern(kIdPattern);
    auto type = string_prop(1, 64);
    type.constraints.set_pattern(kTypePattern);

    PropertySchema weight{};
    weight.type                = SchemaType::kNumber;
    weight.constraints.minimum = 0.0;
    weight.constraints.maximum = 1.0;

    s.properties = {
        {"source_id", std::move(source)},
        {"target_id", std::move(target)},
        {"type", std::move(type)},
        {"weight", std::move(weight)},
        {"properties", free_object_prop()},
    };
    s.additional_properties = AdditionalProperties::kWarn;
    return s;
}

// search_query: 검색 요청 본문
JsonSchema search_query_schema() {
    JsonSchema s{};
    s.name        = "search_query";
    s.description = "search request body";
    s.required    = {"query"};

    auto mode = string_prop(1, 16);
    mode.constraints.enum_values = {"semantic", "keyword", "hybrid"};

    s.properties = {
        {"query", string_prop(1, 1000)},
        {"limit", integer_prop(1, 100)},
        {"offset", integer_prop(0, 10000)},
        {"mode", std::move(mode)},
        {"filters", free_object_prop()},
    };
    s.additional_properties = AdditionalProperties::kDisallow;
    return s;
}

}  // namespace

SchemaRegistry::SchemaRegistry(std::chrono::seconds ttl, Clock clock)
    : cache_(ttl, std::move(clock))
{
    for (auto& schema : builtin_schemas()) {
        const std::string name = schema.name;
        cache_.put(name, std::make_shared<const JsonSchema>(std::move(schema)), true);
    }
}

std::vector<JsonSchema> SchemaRegistry::builtin_schemas() {
    return {entity_schema(), relationship_schema(), search_query_schema()};
}

bool SchemaRegistry::register_schema(JsonSchema schema, bool pinned) {
    if (schema.name.empty()) {
        spdlog::warn("schema_registry: ignoring schema with empty name");
        return false;
    }
    const std::string name = schema.name;
    cache_.put(name, std::make_shared<const JsonSchema>(std::move(schema)), pinned);
    spdlog::info("schema_registry: registered schema '{}'{}", name, pinned ? " (pinned)" : "");
    return true;
}

std::shared_ptr<const JsonSchema> SchemaRegistry::find(std::string_view name) const {
    return cache_.get(std::string(name));
}

bool SchemaRegistry::remove(std::string_view name) {
    return cache_.erase(std::string(name));
}

std::vector<std::string> SchemaRegistry::names() const {
    auto result = cache_.keys();
    std::sort(result.begin(), result.end());
    return result;
}
