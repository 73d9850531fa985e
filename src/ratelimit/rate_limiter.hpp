#pragma once

// ---------------------------------------------------------------------------
// rate_limiter.hpp
//
// 요청 입장 제어(admission control). 파이프라인의 첫 단계.
//
// [연산]
// - check(key)       : 읽기 전용. 다음 요청이 허용될지 판정.
// - record(key)      : 요청 1건 소비를 커밋.
// - get_status(key)  : 현재 카운터 상태 조회 (check 와 동일 계산, 감사 이벤트 없음).
// - reset(key)       : 키의 카운터 상태 삭제.
//
// [저장소 장애 시: fail-open 기본]
// 카운터 저장소에 닿지 못하면 기본적으로 요청을 허용하고 진단 로그를 남긴다.
// RateLimiterOptions::fail_closed = true 로 엄격 모드 전환 가능.
//
// [동시성: 알려진 한계]
// check() 와 record() 는 두 번의 독립된 저장소 호출이다. 같은 키에 대해
// 동시에 경합하면 명목 한도보다 많이 허용될 수 있다 (근사적 집행).
// check_and_record() 도 같은 경합을 가진다 (원자적 증가 아님).
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <functional>
#include <memory>

#include "common/types.hpp"
#include "logger/audit_sink.hpp"
#include "ratelimit/counter_store.hpp"
#include "ratelimit/policy_registry.hpp"
#include "ratelimit/rate_limit_types.hpp"

struct RateLimiterOptions {
    bool                      fail_closed{false};
    std::chrono::milliseconds store_timeout{std::chrono::milliseconds(50)};
};

class RateLimiter {
public:
    using Clock = std::function<SystemTimePoint()>;

    RateLimiter(std::shared_ptr<CounterStore>   store,
                std::shared_ptr<PolicyRegistry> policies,
                RateLimiterOptions              options = {},
                std::shared_ptr<AuditSink>      audit   = nullptr,
                Clock clock = [] { return std::chrono::system_clock::now(); });

    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&)                 = default;
    RateLimiter& operator=(RateLimiter&&)      = default;

    [[nodiscard]] RateLimitResult check(const RateLimitKey& key,
                                        const CallerContext& caller = {}) const;

    // 반환값: 소비 반영 이후 상태. allowed == false 이면 소비는 기록되지 않았다.
    RateLimitResult record(const RateLimitKey& key, const CallerContext& caller = {});

    [[nodiscard]] RateLimitResult get_status(const RateLimitKey& key,
                                             const CallerContext& caller = {}) const;

    [[nodiscard]] std::expected<void, StoreError> reset(const RateLimitKey& key);

    // check 후 허용이면 record. 두 호출 사이 경합은 위 [동시성] 참조.
    RateLimitResult check_and_record(const RateLimitKey& key, const CallerContext& caller = {});

    [[nodiscard]] const RateLimiterOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] RateLimitResult evaluate(const RateLimitKey& key, const CallerContext& caller,
                                           bool consume, bool emit_audit) const;

    [[nodiscard]] RateLimitResult degraded_result(const RateLimitKey& key,
                                                  const RateLimitPolicy& policy,
                                                  std::uint32_t limit,
                                                  const StoreError& error) const;

    std::shared_ptr<CounterStore>   store_;
    std::shared_ptr<PolicyRegistry> policies_;
    RateLimiterOptions              options_;
    std::shared_ptr<AuditSink>      audit_;
    Clock                           clock_;
};
