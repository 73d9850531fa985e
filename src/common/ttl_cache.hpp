#pragma once

// ---------------------------------------------------------------------------
// ttl_cache.hpp
//
// 읽기 위주 레지스트리(정책/스키마)를 위한 TTL 스냅샷 캐시. 헤더 전용.
//
// [설계 원칙]
// - 교체만 하고 변경하지 않는다: put() 은 전체 테이블을 복사한 새 스냅샷을
//   만들어 std::atomic<std::shared_ptr> 로 교체한다. 동시 독자는 항상
//   완전한 이전 값 또는 완전한 새 값만 관찰한다.
// - 값은 shared_ptr<const V> 로 보관하여 독자가 참조를 유지하는 동안
//   교체가 일어나도 수명이 보장된다.
// - 만료된 항목은 get() 에서 "없음"으로 처리된다. 실제 제거는 다음 put() 의
//   스냅샷 재구성 시점에 수행된다.
// - pinned 항목(내장 기본값)은 만료되지 않는다.
//
// [스레드 안전성]
// - get(): lock-free 스냅샷 로드.
// - put()/erase(): 쓰기 간에는 mutex 로 직렬화 (쓰기 빈도는 낮음).
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"

template <typename V>
class TtlCache {
public:
    using Clock = std::function<SystemTimePoint()>;

    explicit TtlCache(std::chrono::seconds ttl,
                      Clock clock = [] { return std::chrono::system_clock::now(); })
        : ttl_(ttl)
        , clock_(std::move(clock))
        , table_(std::make_shared<const Table>())
    {}

    ~TtlCache() = default;

    TtlCache(const TtlCache&)            = delete;
    TtlCache& operator=(const TtlCache&) = delete;
    TtlCache(TtlCache&&)                 = delete;
    TtlCache& operator=(TtlCache&&)      = delete;

    // put
    //   key 의 값을 교체한다. pinned == true 이면 TTL 만료 대상이 아니다.
    void put(const std::string& key, std::shared_ptr<const V> value, bool pinned = false) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        const auto now  = clock_();
        auto       next = std::make_shared<Table>();
        for (const auto& [k, entry] : *table_.load()) {
            if (entry.pinned || entry.expires_at > now) {
                next->emplace(k, entry);
            }
        }
        (*next)[key] = Entry{std::move(value), pinned ? SystemTimePoint::max() : now + ttl_, pinned};
        table_.store(std::shared_ptr<const Table>(std::move(next)));
    }

    // get
    //   없거나 만료되었으면 nullptr.
    [[nodiscard]] std::shared_ptr<const V> get(const std::string& key) const {
        const auto snapshot = table_.load();
        const auto it       = snapshot->find(key);
        if (it == snapshot->end()) {
            return nullptr;
        }
        if (!it->second.pinned && it->second.expires_at <= clock_()) {
            return nullptr;
        }
        return it->second.value;
    }

    bool erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = table_.load();
        if (current->find(key) == current->end()) {
            return false;
        }
        auto next = std::make_shared<Table>(*current);
        next->erase(key);
        table_.store(std::shared_ptr<const Table>(std::move(next)));
        return true;
    }

    // 만료되지 않은 키 목록 (진단용)
    [[nodiscard]] std::vector<std::string> keys() const {
        const auto snapshot = table_.load();
        const auto now      = clock_();
        std::vector<std::string> result;
        result.reserve(snapshot->size());
        for (const auto& [k, entry] : *snapshot) {
            if (entry.pinned || entry.expires_at > now) {
                result.push_back(k);
            }
        }
        return result;
    }

private:
    struct Entry {
        std::shared_ptr<const V> value;
        SystemTimePoint          expires_at{};
        bool                     pinned{false};
    };
    using Table = std::unordered_map<std::string, Entry>;

    std::chrono::seconds                      ttl_;
    Clock                                     clock_;
    std::atomic<std::shared_ptr<const Table>> table_;
    std::mutex                                write_mutex_;
};
