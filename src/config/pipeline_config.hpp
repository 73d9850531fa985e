#pragma once

// ---------------------------------------------------------------------------
// pipeline_config.hpp
//
// 파이프라인 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/inputgate.yaml 에서 로드된다 (ConfigLoader).
//
// [설계 원칙]
// - 각 단계가 이미 갖고 있는 옵션 구조체를 그대로 묶는다. 기본값은
//   각 옵션 구조체의 기본값과 같다.
// - 이 구조체 자체는 판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <string>
#include <vector>

#include "normalizer/html_sanitizer.hpp"
#include "normalizer/input_normalizer.hpp"
#include "query/query_types.hpp"
#include "ratelimit/rate_limit_types.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "scanner/threat_types.hpp"
#include "schema/json_schema.hpp"

// ---------------------------------------------------------------------------
// GlobalConfig
//   development_mode: ErrorResponse 에 debug 정보 포함 여부.
//   운영 배포에서는 반드시 false.
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/var/log/inputgate/audit.log"};
    bool        development_mode{false};
};

// ---------------------------------------------------------------------------
// RateLimitConfig
//   policies 에 operation == "default" 항목이 있으면 내장 폴백을 교체한다.
// ---------------------------------------------------------------------------
struct RateLimitConfig {
    RateLimiterOptions           limiter{};
    std::chrono::seconds         policy_cache_ttl{std::chrono::minutes(5)};
    std::vector<RateLimitPolicy> policies{};
};

struct PipelineConfig {
    GlobalConfig            global{};
    RateLimitConfig         rate_limits{};
    ScanOptions             scanner{};
    NormalizeOptions        normalization{NormalizeOptions::defaults()};
    HtmlSanitizeOptions     html{};
    QueryLimits             query{};
    std::vector<JsonSchema> schemas{};
};
