// ---------------------------------------------------------------------------
// counter_store.cpp
//
// InMemoryCounterStore 구현.
// 만료 항목은 접근 시점(get/size)에 지연 정리한다.
// ---------------------------------------------------------------------------

#include "ratelimit/counter_store.hpp"

#include <spdlog/spdlog.h>

InMemoryCounterStore::InMemoryCounterStore(Clock clock)
    : clock_(std::move(clock))
{}

// mutex_ 보유 상태에서 호출
std::optional<StoreError> InMemoryCounterStore::precheck(const Deadline& deadline) const {
    if (!available_) {
        return StoreError{StoreErrorCode::kUnavailable, "counter store unavailable"};
    }
    if (deadline.expired()) {
        return StoreError{StoreErrorCode::kTimeout, "counter store deadline exceeded"};
    }
    return std::nullopt;
}

std::expected<std::optional<std::string>, StoreError>
InMemoryCounterStore::get(const std::string& key, const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto err = precheck(deadline)) {
        return std::unexpected(std::move(*err));
    }

    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::string>{};
    }
    if (it->second.expires_at <= clock_()) {
        entries_.erase(it);
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second.value};
}

std::expected<void, StoreError>
InMemoryCounterStore::set(const std::string& key, const std::string& value,
                          std::chrono::milliseconds ttl, const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto err = precheck(deadline)) {
        return std::unexpected(std::move(*err));
    }

    if (ttl.count() <= 0) {
        // 즉시 만료 = 삭제
        entries_.erase(key);
        return {};
    }
    entries_[key] = Entry{value, clock_() + ttl};
    return {};
}

std::expected<void, StoreError>
InMemoryCounterStore::remove(const std::string& key, const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto err = precheck(deadline)) {
        return std::unexpected(std::move(*err));
    }
    entries_.erase(key);
    return {};
}

void InMemoryCounterStore::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ != available) {
        spdlog::info("counter_store: availability changed to {}", available);
    }
    available_ = available;
}

std::size_t InMemoryCounterStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    std::erase_if(entries_, [&](const auto& kv) { return kv.second.expires_at <= now; });
    return entries_.size();
}
