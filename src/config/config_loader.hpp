#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 로드하여 PipelineConfig 로 파싱한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분 설정을
//   반환하지 않는다. 호출자는 기동을 중단해야 한다.
// - 필드 누락 시 구조체 기본값 적용.
// - 설정 파일 전체를 로그에 출력하지 않는다 (접속 정보 등 민감 정보 보호).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "config/pipeline_config.hpp"

class ConfigLoader {
public:
    [[nodiscard]] static std::expected<PipelineConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 파일 대신 문자열 (테스트, 내장 기본 설정)
    [[nodiscard]] static std::expected<PipelineConfig, std::string>
    parse_text(std::string_view yaml_text);
};
