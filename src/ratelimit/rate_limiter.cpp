// ---------------------------------------------------------------------------
// rate_limiter.cpp
//
// [판정 순서]
// 1. operation → 정책 해석 (정확 일치 → default)
// 2. 유효 한도 = base * multiplier (role → license → 1.0)
// 3. 저장소에서 상태 읽기 (deadline = store_timeout)
// 4. 알고리즘 판정 (+ consume 이면 새 상태 저장)
// 5. 거부 시 감사 이벤트 rate_limit.exceeded
//
// 3/4 단계 저장소 오류 → degraded_result (fail-open 또는 fail-closed).
// ---------------------------------------------------------------------------

#include "ratelimit/rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include "ratelimit/rate_limit_algorithms.hpp"

namespace {

std::string_view to_string(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::kUnavailable: return "unavailable";
        case StoreErrorCode::kTimeout:     return "timeout";
        case StoreErrorCode::kCorrupt:     return "corrupt";
    }
    return "unavailable";
}

std::int64_t to_epoch_ms(SystemTimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

SystemTimePoint from_epoch_ms(std::int64_t ms) {
    return SystemTimePoint(std::chrono::duration_cast<SystemTimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

}  // namespace

RateLimiter::RateLimiter(std::shared_ptr<CounterStore>   store,
                         std::shared_ptr<PolicyRegistry> policies,
                         RateLimiterOptions              options,
                         std::shared_ptr<AuditSink>      audit,
                         Clock                           clock)
    : store_(std::move(store))
    , policies_(std::move(policies))
    , options_(options)
    , audit_(std::move(audit))
    , clock_(std::move(clock))
{
    if (!policies_) {
        policies_ = std::make_shared<PolicyRegistry>();
    }
}

RateLimitResult RateLimiter::check(const RateLimitKey& key, const CallerContext& caller) const {
    return evaluate(key, caller, false, true);
}

RateLimitResult RateLimiter::record(const RateLimitKey& key, const CallerContext& caller) {
    return evaluate(key, caller, true, true);
}

RateLimitResult RateLimiter::get_status(const RateLimitKey& key, const CallerContext& caller) const {
    return evaluate(key, caller, false, false);
}

RateLimitResult RateLimiter::check_and_record(const RateLimitKey& key, const CallerContext& caller) {
    auto checked = check(key, caller);
    if (!checked.allowed || checked.degraded) {
        return checked;
    }
    return record(key, caller);
}

std::expected<void, StoreError> RateLimiter::reset(const RateLimitKey& key) {
    if (!store_) {
        return std::unexpected(StoreError{StoreErrorCode::kUnavailable, "no counter store configured"});
    }
    auto removed = store_->remove(key.cache_key(), Deadline::after(options_.store_timeout));
    if (!removed) {
        spdlog::warn("rate_limiter: reset failed for '{}': {}", key.cache_key(), removed.error().message);
        return removed;
    }
    spdlog::info("rate_limiter: reset '{}'", key.cache_key());
    return {};
}

// ---------------------------------------------------------------------------
// evaluate
// ---------------------------------------------------------------------------
RateLimitResult RateLimiter::evaluate(const RateLimitKey& key, const CallerContext& caller,
                                      bool consume, bool emit_audit) const {
    const auto policy   = policies_->resolve(key.operation);
    const auto limit    = PolicyRegistry::effective_limit(*policy, caller);
    const auto cache_key = key.cache_key();

    if (!store_) {
        return degraded_result(key, *policy, limit,
                               StoreError{StoreErrorCode::kUnavailable, "no counter store configured"});
    }

    const Deadline deadline = Deadline::after(options_.store_timeout);
    auto state = store_->get(cache_key, deadline);
    if (!state) {
        return degraded_result(key, *policy, limit, state.error());
    }

    const auto now_ms   = to_epoch_ms(clock_());
    const auto decision = evaluate_algorithm(policy->algorithm, *state, limit, policy->window,
                                             now_ms, consume);
    if (decision.state_was_corrupt) {
        spdlog::warn("rate_limiter: corrupt counter state for '{}', treating as empty", cache_key);
    }

    if (consume && decision.new_state) {
        auto stored = store_->set(cache_key, *decision.new_state, decision.state_ttl, deadline);
        if (!stored) {
            return degraded_result(key, *policy, limit, stored.error());
        }
    }

    RateLimitResult result{};
    result.allowed         = decision.allowed;
    result.limit           = limit;
    result.remaining       = std::min(decision.remaining, limit);
    result.current_count   = decision.current_count;
    result.retry_after     = decision.retry_after;
    result.window_reset_at = from_epoch_ms(decision.reset_at_ms);
    result.algorithm       = policy->algorithm;
    result.policy          = policy->operation;

    if (!result.allowed && emit_audit) {
        spdlog::debug("rate_limiter: '{}' exceeded ({}/{}), retry after {}ms",
                      cache_key, result.current_count, limit, result.retry_after.count());
        if (audit_) {
            SecurityEvent ev{};
            ev.event = audit_event::kRateLimitExceeded;
            ev.level = LogLevel::kWarn;
            ev.with("key", cache_key)
              .with("policy", policy->operation)
              .with("algorithm", std::string(to_string(policy->algorithm)))
              .with("limit", std::to_string(limit))
              .with("current_count", std::to_string(result.current_count))
              .with("retry_after_ms", std::to_string(result.retry_after.count()));
            audit_->emit(ev);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// degraded_result
//   저장소 장애 시 판정. fail-open 이면 허용(remaining = limit),
//   fail-closed 이면 거부(retry_after = store_timeout 이상 1초).
// ---------------------------------------------------------------------------
RateLimitResult RateLimiter::degraded_result(const RateLimitKey& key,
                                             const RateLimitPolicy& policy,
                                             std::uint32_t limit,
                                             const StoreError& error) const {
    const bool allow = !options_.fail_closed;
    spdlog::warn("rate_limiter: counter store {} for '{}' ({}), failing {}",
                 to_string(error.code), key.cache_key(), error.message,
                 allow ? "open" : "closed");

    if (audit_) {
        SecurityEvent ev{};
        ev.event = audit_event::kRateLimitStoreError;
        ev.level = LogLevel::kError;
        ev.with("key", key.cache_key())
          .with("error", std::string(to_string(error.code)))
          .with("message", error.message)
          .with("decision", allow ? "fail_open" : "fail_closed");
        audit_->emit(ev);
    }

    RateLimitResult result{};
    result.allowed         = allow;
    result.limit           = limit;
    result.remaining       = allow ? limit : 0;
    result.current_count   = 0;
    result.retry_after     = allow ? std::chrono::milliseconds(0) : std::chrono::milliseconds(1000);
    result.window_reset_at = clock_() + policy.window;
    result.algorithm       = policy.algorithm;
    result.policy          = policy.operation;
    result.degraded        = true;
    return result;
}
