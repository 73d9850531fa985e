// ---------------------------------------------------------------------------
// policy_registry.cpp
// ---------------------------------------------------------------------------

#include "ratelimit/policy_registry.hpp"

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

constexpr const char* kDefaultOperation = "default";

}  // namespace

PolicyRegistry::PolicyRegistry(std::chrono::seconds ttl, Clock clock)
    : cache_(ttl, std::move(clock))
{
    for (auto& policy : builtin_policies()) {
        const std::string op = policy.operation;
        cache_.put(op, std::make_shared<const RateLimitPolicy>(std::move(policy)), true);
    }
}

// ---------------------------------------------------------------------------
// 내장 정책
//   default    : 100/min sliding window
//   search     : 60/min token bucket (버스트 허용)
//   ingest     : 20/min leaky bucket (평탄화)
//   auth.login : 5/min fixed window
// ---------------------------------------------------------------------------
std::vector<RateLimitPolicy> PolicyRegistry::builtin_policies() {
    using std::chrono::minutes;
    return {
        RateLimitPolicy{
            .operation           = kDefaultOperation,
            .requests_per_window = 100,
            .window              = minutes(1),
            .algorithm           = RateLimitAlgorithm::kSlidingWindow,
            .exceptions          = {{.role = "admin", .multiplier = 10.0},
                                    {.license_tier = "enterprise", .multiplier = 5.0},
                                    {.license_tier = "teams", .multiplier = 2.0}},
        },
        RateLimitPolicy{
            .operation           = "search",
            .requests_per_window = 60,
            .window              = minutes(1),
            .algorithm           = RateLimitAlgorithm::kTokenBucket,
            .exceptions          = {{.license_tier = "enterprise", .multiplier = 4.0}},
        },
        RateLimitPolicy{
            .operation           = "ingest",
            .requests_per_window = 20,
            .window              = minutes(1),
            .algorithm           = RateLimitAlgorithm::kLeakyBucket,
            .exceptions          = {{.role = "service", .multiplier = 5.0}},
        },
        RateLimitPolicy{
            .operation           = "auth.login",
            .requests_per_window = 5,
            .window              = minutes(1),
            .algorithm           = RateLimitAlgorithm::kFixedWindow,
            .exceptions          = {},
        },
    };
}

void PolicyRegistry::register_policy(RateLimitPolicy policy, bool pinned) {
    if (policy.operation.empty()) {
        spdlog::warn("policy_registry: ignoring policy with empty operation name");
        return;
    }
    if (policy.window.count() <= 0) {
        spdlog::warn("policy_registry: policy '{}' has non-positive window, ignoring",
                     policy.operation);
        return;
    }
    const bool is_default = policy.operation == kDefaultOperation;
    const std::string op  = policy.operation;
    spdlog::info("policy_registry: registered '{}' ({} per {}ms, {})",
                 op, policy.requests_per_window, policy.window.count(),
                 to_string(policy.algorithm));
    cache_.put(op, std::make_shared<const RateLimitPolicy>(std::move(policy)), pinned || is_default);
}

std::shared_ptr<const RateLimitPolicy>
PolicyRegistry::resolve(std::string_view operation) const {
    if (auto exact = cache_.get(std::string(operation))) {
        return exact;
    }
    if (auto fallback = cache_.get(kDefaultOperation)) {
        return fallback;
    }
    // 기본 정책은 pinned 이므로 도달하지 않지만, 레지스트리 손상 시에도 null 을 돌려주지 않는다.
    spdlog::error("policy_registry: default policy missing, using built-in default");
    return std::make_shared<const RateLimitPolicy>(builtin_policies().front());
}

double PolicyRegistry::multiplier_for(const RateLimitPolicy& policy, const CallerContext& caller) {
    if (!caller.role.empty()) {
        for (const auto& ex : policy.exceptions) {
            if (!ex.role.empty() && iequals(ex.role, caller.role)) {
                return ex.multiplier;
            }
        }
    }
    if (!caller.license_tier.empty()) {
        for (const auto& ex : policy.exceptions) {
            if (!ex.license_tier.empty() && iequals(ex.license_tier, caller.license_tier)) {
                return ex.multiplier;
            }
        }
    }
    return 1.0;
}

std::uint32_t PolicyRegistry::effective_limit(const RateLimitPolicy& policy,
                                              const CallerContext& caller) {
    const double scaled = std::floor(static_cast<double>(policy.requests_per_window) *
                                     multiplier_for(policy, caller));
    if (!(scaled > 0.0)) {
        return 0;
    }
    constexpr double kMax = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
    return scaled >= kMax ? std::numeric_limits<std::uint32_t>::max()
                          : static_cast<std::uint32_t>(scaled);
}
