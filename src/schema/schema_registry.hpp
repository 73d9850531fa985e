#pragma once

// ---------------------------------------------------------------------------
// schema_registry.hpp
//
// 이름 → JsonSchema 캐시 레지스트리.
//
// - 내장 스키마(entity / relationship / search_query)는 pinned 로 등록되어
//   만료되지 않는다.
// - register_schema() 는 같은 이름의 항목을 통째로 교체한다.
// - find() 는 없으면 nullptr 를 반환한다. "스키마 없음" 과 "제약이 없는
//   스키마" 는 구분된다 (후자는 properties 가 빈 유효한 객체).
// ---------------------------------------------------------------------------

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/ttl_cache.hpp"
#include "schema/json_schema.hpp"

class SchemaRegistry {
public:
    using Clock = TtlCache<JsonSchema>::Clock;

    explicit SchemaRegistry(std::chrono::seconds ttl = std::chrono::minutes(5),
                            Clock clock = [] { return std::chrono::system_clock::now(); });

    ~SchemaRegistry() = default;

    SchemaRegistry(const SchemaRegistry&)            = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    [[nodiscard]] static std::vector<JsonSchema> builtin_schemas();

    // 이름이 비어 있으면 무시하고 false
    bool register_schema(JsonSchema schema, bool pinned = false);

    [[nodiscard]] std::shared_ptr<const JsonSchema> find(std::string_view name) const;

    bool remove(std::string_view name);

    [[nodiscard]] std::vector<std::string> names() const;

private:
    TtlCache<JsonSchema> cache_;
};
