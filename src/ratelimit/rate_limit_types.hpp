#pragma once

// ---------------------------------------------------------------------------
// rate_limit_types.hpp
//
// 속도 제한(admission control) 설정/결과 구조체 정의.
// 판정 로직은 포함하지 않는다 (rate_limiter.cpp / rate_limit_algorithms.cpp).
//
// [불변식]
// - 0 <= RateLimitResult::remaining <= RateLimitResult::limit
// - allowed == false 이면 retry_after > 0
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// RateLimitScope
//   카운터를 어떤 주체 단위로 나눌지.
// ---------------------------------------------------------------------------
enum class RateLimitScope : std::uint8_t {
    kGlobal    = 0,
    kUser      = 1,
    kTenant    = 2,
    kIpAddress = 3,
    kApiKey    = 4,
};

[[nodiscard]] inline std::string_view to_string(RateLimitScope scope) noexcept {
    switch (scope) {
        case RateLimitScope::kGlobal:    return "global";
        case RateLimitScope::kUser:      return "user";
        case RateLimitScope::kTenant:    return "tenant";
        case RateLimitScope::kIpAddress: return "ip";
        case RateLimitScope::kApiKey:    return "apikey";
    }
    return "global";
}

// ---------------------------------------------------------------------------
// RateLimitAlgorithm
//   kFixedWindow  : 주기 경계에서 카운터 리셋. 경계에서 최대 2배 허용 가능.
//   kSlidingWindow: 요청 타임스탬프 로그. 정확하지만 키당 O(entries).
//   kTokenBucket  : limit/window 속도로 연속 충전, 순간 버스트 허용.
//   kLeakyBucket  : 고정 배출 속도, 버스트 대신 평탄화.
// ---------------------------------------------------------------------------
enum class RateLimitAlgorithm : std::uint8_t {
    kFixedWindow   = 0,
    kSlidingWindow = 1,
    kTokenBucket   = 2,
    kLeakyBucket   = 3,
};

[[nodiscard]] inline std::string_view to_string(RateLimitAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case RateLimitAlgorithm::kFixedWindow:   return "fixed_window";
        case RateLimitAlgorithm::kSlidingWindow: return "sliding_window";
        case RateLimitAlgorithm::kTokenBucket:   return "token_bucket";
        case RateLimitAlgorithm::kLeakyBucket:   return "leaky_bucket";
    }
    return "sliding_window";
}

// ---------------------------------------------------------------------------
// RateLimitKey
//   (scope, identifier, operation) → 결정적 캐시 키.
//   "ratelimit:<scope>:<identifier>:<operation>"
// ---------------------------------------------------------------------------
struct RateLimitKey {
    RateLimitScope scope{RateLimitScope::kUser};
    std::string    identifier{};
    std::string    operation{};

    [[nodiscard]] std::string cache_key() const {
        std::string key = "ratelimit:";
        key += to_string(scope);
        key += ':';
        key += identifier;
        key += ':';
        key += operation;
        return key;
    }
};

// ---------------------------------------------------------------------------
// CallerContext
//   예외 배수(multiplier) 매칭에 쓰이는 호출자 속성.
// ---------------------------------------------------------------------------
struct CallerContext {
    std::string role{};          // 예: "admin", "service"
    std::string license_tier{};  // 예: "core", "writer_pro", "teams", "enterprise"
};

// ---------------------------------------------------------------------------
// PolicyException
//   role 또는 license_tier 중 하나로 매칭되는 한도 배수.
//   둘 다 비어 있는 항목은 매칭되지 않는다.
// ---------------------------------------------------------------------------
struct PolicyException {
    std::string role{};
    std::string license_tier{};
    double      multiplier{1.0};
};

// ---------------------------------------------------------------------------
// RateLimitPolicy
//   operation 단위 정책. operation == "default" 는 폴백 정책.
// ---------------------------------------------------------------------------
struct RateLimitPolicy {
    std::string                  operation{"default"};
    std::uint32_t                requests_per_window{100};
    std::chrono::milliseconds    window{std::chrono::minutes(1)};
    RateLimitAlgorithm           algorithm{RateLimitAlgorithm::kSlidingWindow};
    std::vector<PolicyException> exceptions{};  // 순서 = 매칭 우선순위
};

// ---------------------------------------------------------------------------
// RateLimitResult
//   check/record/get_status 결과. 요청마다 새로 생성된다.
//   degraded == true 이면 카운터 저장소에 접근하지 못해 fail-open/closed
//   정책에 따라 판정한 값이다 (remaining/current_count 는 추정치 아님).
// ---------------------------------------------------------------------------
struct RateLimitResult {
    bool                      allowed{true};
    std::uint32_t             limit{0};
    std::uint32_t             remaining{0};
    std::uint32_t             current_count{0};
    std::chrono::milliseconds retry_after{0};
    SystemTimePoint           window_reset_at{};
    RateLimitAlgorithm        algorithm{RateLimitAlgorithm::kSlidingWindow};
    std::string               policy{};
    bool                      degraded{false};

    // 응답 메타데이터 (X-RateLimit-*, Retry-After)
    [[nodiscard]] std::map<std::string, std::string> headers() const {
        std::map<std::string, std::string> h;
        h["X-RateLimit-Limit"]     = std::to_string(limit);
        h["X-RateLimit-Remaining"] = std::to_string(remaining);
        h["X-RateLimit-Reset"]     = std::to_string(
            std::chrono::duration_cast<std::chrono::seconds>(window_reset_at.time_since_epoch()).count());
        if (!allowed) {
            // 초 단위 올림, 최소 1
            const auto secs = (retry_after.count() + 999) / 1000;
            h["Retry-After"] = std::to_string(secs > 0 ? secs : 1);
        }
        return h;
    }
};
