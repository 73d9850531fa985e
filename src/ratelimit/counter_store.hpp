#pragma once

// ---------------------------------------------------------------------------
// counter_store.hpp
//
// 분산 카운터/캐시 저장소 경계 (get / set-with-expiry / remove).
// 실제 분산 캐시는 외부 협력자이며, 파이프라인은 이 인터페이스만 사용한다.
//
// [설계 원칙]
// - 모든 호출은 Deadline 을 받는다. 만료되면 즉시 StoreErrorCode::kTimeout.
// - 실패는 예외가 아니라 std::expected 로 돌려준다. 호출자(RateLimiter)가
//   fail-open/closed 를 결정한다.
// - 값은 불투명 문자열. 직렬화 형식은 알고리즘 레이어 소관.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// StoreError
// ---------------------------------------------------------------------------
enum class StoreErrorCode : std::uint8_t {
    kUnavailable = 0,  // 연결 불가 / 백엔드 장애
    kTimeout     = 1,  // deadline 초과
    kCorrupt     = 2,  // 저장된 값 해석 불가
};

struct StoreError {
    StoreErrorCode code{StoreErrorCode::kUnavailable};
    std::string    message{};
};

// ---------------------------------------------------------------------------
// CounterStore
// ---------------------------------------------------------------------------
class CounterStore {
public:
    virtual ~CounterStore() = default;

    // 없으면 std::nullopt (오류 아님)
    [[nodiscard]] virtual std::expected<std::optional<std::string>, StoreError>
    get(const std::string& key, const Deadline& deadline) = 0;

    // ttl 이 지나면 값은 사라진다.
    [[nodiscard]] virtual std::expected<void, StoreError>
    set(const std::string& key, const std::string& value,
        std::chrono::milliseconds ttl, const Deadline& deadline) = 0;

    [[nodiscard]] virtual std::expected<void, StoreError>
    remove(const std::string& key, const Deadline& deadline) = 0;

protected:
    CounterStore()                               = default;
    CounterStore(const CounterStore&)            = default;
    CounterStore& operator=(const CounterStore&) = default;
};

// ---------------------------------------------------------------------------
// InMemoryCounterStore
//   단일 프로세스용 구현. 테스트와 단독 실행(CLI)에서 사용한다.
//   set_available(false) 로 백엔드 장애를 흉내낼 수 있다.
//
//   [스레드 안전성] 내부 mutex 로 직렬화.
// ---------------------------------------------------------------------------
class InMemoryCounterStore final : public CounterStore {
public:
    using Clock = std::function<SystemTimePoint()>;

    explicit InMemoryCounterStore(Clock clock = [] { return std::chrono::system_clock::now(); });

    [[nodiscard]] std::expected<std::optional<std::string>, StoreError>
    get(const std::string& key, const Deadline& deadline) override;

    [[nodiscard]] std::expected<void, StoreError>
    set(const std::string& key, const std::string& value,
        std::chrono::milliseconds ttl, const Deadline& deadline) override;

    [[nodiscard]] std::expected<void, StoreError>
    remove(const std::string& key, const Deadline& deadline) override;

    void set_available(bool available);

    // 만료되지 않은 항목 수 (만료 항목은 이 시점에 정리)
    [[nodiscard]] std::size_t size();

private:
    struct Entry {
        std::string     value;
        SystemTimePoint expires_at;
    };

    [[nodiscard]] std::optional<StoreError> precheck(const Deadline& deadline) const;

    Clock                                  clock_;
    bool                                   available_{true};
    mutable std::mutex                     mutex_;
    std::unordered_map<std::string, Entry> entries_;
};
