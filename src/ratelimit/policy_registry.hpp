#pragma once

// ---------------------------------------------------------------------------
// policy_registry.hpp
//
// operation 이름 → RateLimitPolicy 해석기.
//
// [해석 순서]
// 1. operation 과 정확히 일치하는 정책 (만료되지 않은 것)
// 2. "default" 폴백 정책 (항상 존재, 만료되지 않음)
//
// [유효 한도]
//   effective = floor(requests_per_window * multiplier)
//   multiplier = 첫 번째 role 일치 예외 → 없으면 첫 번째 license 일치 예외 → 1.0
//
// [Hot Reload]
// - register_policy() 는 기존 항목을 교체한다 (TtlCache 스냅샷 교체).
//   진행 중인 check() 는 이전 정책 객체를 끝까지 사용한다.
// - 동적으로 등록한 정책은 TTL 경과 후 기본 정책으로 되돌아간다.
//   시작 시 로드된 정책(pinned)은 만료되지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/ttl_cache.hpp"
#include "ratelimit/rate_limit_types.hpp"

class PolicyRegistry {
public:
    using Clock = TtlCache<RateLimitPolicy>::Clock;

    explicit PolicyRegistry(std::chrono::seconds ttl = std::chrono::minutes(5),
                            Clock clock = [] { return std::chrono::system_clock::now(); });

    ~PolicyRegistry() = default;

    PolicyRegistry(const PolicyRegistry&)            = delete;
    PolicyRegistry& operator=(const PolicyRegistry&) = delete;

    // 내장 정책: default / search / ingest / auth.login
    [[nodiscard]] static std::vector<RateLimitPolicy> builtin_policies();

    // policy.operation == "default" 이면 폴백 정책을 교체한다 (항상 pinned).
    void register_policy(RateLimitPolicy policy, bool pinned = false);

    // 항상 non-null (폴백 포함)
    [[nodiscard]] std::shared_ptr<const RateLimitPolicy> resolve(std::string_view operation) const;

    [[nodiscard]] static double multiplier_for(const RateLimitPolicy& policy,
                                               const CallerContext& caller);

    [[nodiscard]] static std::uint32_t effective_limit(const RateLimitPolicy& policy,
                                                       const CallerContext& caller);

private:
    TtlCache<RateLimitPolicy> cache_;
};
