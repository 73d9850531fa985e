#pragma once

// ---------------------------------------------------------------------------
// yaml_read.hpp
//
// yaml-cpp 노드 읽기 헬퍼. 노드가 없거나 스칼라가 아니거나 변환에 실패하면
// fallback 을 반환한다 (설정 누락 시 구조체 기본값 적용).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

[[nodiscard]] std::string   read_string(const YAML::Node& node, const std::string& fallback);
[[nodiscard]] bool          read_bool(const YAML::Node& node, bool fallback);
[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback);
[[nodiscard]] double        read_double(const YAML::Node& node, double fallback);

// 값이 없으면 nullopt (스키마 제약처럼 "지정 안 됨" 이 의미 있는 경우)
[[nodiscard]] std::optional<double>      read_optional_double(const YAML::Node& node);
[[nodiscard]] std::optional<std::size_t> read_optional_size(const YAML::Node& node);

// sequence 가 아니면 빈 벡터. 스칼라 원소만 수집한다.
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node);
