// ---------------------------------------------------------------------------
// rate_limit_algorithms.cpp
//
// 알고리즘별 판정/상태 전이 구현.
//
// [오탐/미탐 트레이드오프]
// - fixed_window: 구현이 가장 싸지만 경계 직전/직후에 2 * limit 까지 허용.
// - sliding_window: 경계 문제 없음. 대신 키당 최대 limit 개 타임스탬프 저장.
// - token_bucket: 장기 평균은 limit/window, 단기적으로 limit 만큼 버스트.
// - leaky_bucket: 버스트 없이 평탄화. 짧은 폭주 트래픽은 거부율이 높다.
//
// [상태 손상]
// 해석 불가 상태는 "없음" 으로 간주한다 (fail-open 방향). 호출자는
// state_was_corrupt 로 진단 로그를 남긴다.
// ---------------------------------------------------------------------------

#include "ratelimit/rate_limit_algorithms.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

constexpr double kEpsilon = 1e-9;

template <typename T>
[[nodiscard]] bool parse_number(std::string_view text, T& out) {
    const char* begin = text.data();
    const char* end   = text.data() + text.size();
    auto [ptr, ec]    = std::from_chars(begin, end, out);
    return ec == std::errc{} && ptr == end;
}

// "<a>|<b>" 형식 분리
template <typename A>
[[nodiscard]] bool parse_pair(const std::string& state, A& first, std::int64_t& second) {
    const auto sep = state.find('|');
    if (sep == std::string::npos) {
        return false;
    }
    const std::string_view sv(state);
    return parse_number(sv.substr(0, sep), first) && parse_number(sv.substr(sep + 1), second);
}

[[nodiscard]] std::chrono::milliseconds ceil_ms(double value) {
    const auto ms = static_cast<std::int64_t>(std::ceil(value));
    return std::chrono::milliseconds(std::max<std::int64_t>(ms, 1));
}

[[nodiscard]] std::uint32_t floor_u32(double value, std::uint32_t cap) {
    if (value <= 0.0) {
        return 0;
    }
    const double floored = std::floor(value + kEpsilon);
    return floored >= static_cast<double>(cap) ? cap : static_cast<std::uint32_t>(floored);
}

// ---------------------------------------------------------------------------
// Fixed Window
// ---------------------------------------------------------------------------
AlgorithmDecision fixed_window(const std::optional<std::string>& state, std::uint32_t limit,
                               std::int64_t window_ms, std::int64_t now_ms, bool consume) {
    AlgorithmDecision d{};
    const std::int64_t window_start = now_ms - (now_ms % window_ms);
    const std::int64_t window_end   = window_start + window_ms;

    std::uint32_t count = 0;
    if (state) {
        std::int64_t stored_start = 0;
        std::uint32_t stored_count = 0;
        if (!parse_pair(*state, stored_count, stored_start)) {
            d.state_was_corrupt = true;
        } else if (stored_start == window_start) {
            count = stored_count;
        }
    }

    d.allowed = count < limit;
    if (consume && d.allowed) {
        ++count;
        d.new_state = fmt::format("{}|{}", count, window_start);
    }

    d.current_count = count;
    d.remaining     = count >= limit ? 0 : limit - count;
    d.reset_at_ms   = window_end;
    d.state_ttl     = std::chrono::milliseconds(window_end - now_ms);
    if (!d.allowed) {
        d.retry_after = std::chrono::milliseconds(std::max<std::int64_t>(window_end - now_ms, 1));
    }
    return d;
}

// ---------------------------------------------------------------------------
// Sliding Window (timestamp log)
// ---------------------------------------------------------------------------
AlgorithmDecision sliding_window(const std::optional<std::string>& state, std::uint32_t limit,
                                 std::int64_t window_ms, std::int64_t now_ms, bool consume) {
    AlgorithmDecision d{};
    std::vector<std::int64_t> log;

    if (state && !state->empty()) {
        std::string_view rest(*state);
        while (!rest.empty()) {
            const auto comma = rest.find(',');
            const auto token = rest.substr(0, comma);
            std::int64_t ts  = 0;
            if (!parse_number(token, ts)) {
                d.state_was_corrupt = true;
                log.clear();
                break;
            }
            log.push_back(ts);
            if (comma == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(comma + 1);
        }
    }

    // 윈도우 밖 항목 제거
    const std::int64_t horizon = now_ms - window_ms;
    std::erase_if(log, [&](std::int64_t ts) { return ts <= horizon; });
    std::sort(log.begin(), log.end());

    d.allowed = log.size() < limit;
    if (consume && d.allowed) {
        log.push_back(now_ms);
        d.new_state = fmt::format("{}", fmt::join(log, ","));
    }

    const auto count = static_cast<std::uint32_t>(log.size());
    d.current_count  = count;
    d.remaining      = count >= limit ? 0 : limit - count;
    d.reset_at_ms    = log.empty() ? now_ms + window_ms : log.front() + window_ms;
    d.state_ttl      = std::chrono::milliseconds(window_ms);
    if (!d.allowed) {
        const std::int64_t wait = log.empty() ? window_ms : log.front() + window_ms - now_ms;
        d.retry_after = std::chrono::milliseconds(std::max<std::int64_t>(wait, 1));
    }
    return d;
}

// ---------------------------------------------------------------------------
// Token Bucket
//   rate = limit / window (토큰/ms), 용량 = limit
// ---------------------------------------------------------------------------
AlgorithmDecision token_bucket(const std::optional<std::string>& state, std::uint32_t limit,
                               std::int64_t window_ms, std::int64_t now_ms, bool consume) {
    AlgorithmDecision d{};
    const double capacity = static_cast<double>(limit);
    const double rate     = capacity / static_cast<double>(window_ms);

    double       tokens      = capacity;
    std::int64_t last_refill = now_ms;
    if (state) {
        if (!parse_pair(*state, tokens, last_refill)) {
            d.state_was_corrupt = true;
            tokens      = capacity;
            last_refill = now_ms;
        }
    }

    const auto elapsed = std::max<std::int64_t>(now_ms - last_refill, 0);
    tokens = std::clamp(tokens + static_cast<double>(elapsed) * rate, 0.0, capacity);

    d.allowed = tokens + kEpsilon >= 1.0;
    if (consume && d.allowed) {
        tokens -= 1.0;
        d.new_state = fmt::format("{:.6f}|{}", tokens, now_ms);
    }

    d.remaining     = floor_u32(tokens, limit);
    d.current_count = limit - d.remaining;
    d.state_ttl     = std::chrono::milliseconds(window_ms);
    d.reset_at_ms   = rate > 0.0
        ? now_ms + static_cast<std::int64_t>(std::ceil((capacity - tokens) / rate))
        : now_ms + window_ms;
    if (!d.allowed) {
        d.retry_after = rate > 0.0 ? ceil_ms((1.0 - tokens) / rate)
                                   : std::chrono::milliseconds(window_ms);
    }
    return d;
}

// ---------------------------------------------------------------------------
// Leaky Bucket
//   배출 속도 = limit / window, 수위 상한 = limit
// ---------------------------------------------------------------------------
AlgorithmDecision leaky_bucket(const std::optional<std::string>& state, std::uint32_t limit,
                               std::int64_t window_ms, std::int64_t now_ms, bool consume) {
    AlgorithmDecision d{};
    const double capacity = static_cast<double>(limit);
    const double rate     = capacity / static_cast<double>(window_ms);

    double       level     = 0.0;
    std::int64_t last_leak = now_ms;
    if (state) {
        if (!parse_pair(*state, level, last_leak)) {
            d.state_was_corrupt = true;
            level     = 0.0;
            last_leak = now_ms;
        }
    }

    const auto elapsed = std::max<std::int64_t>(now_ms - last_leak, 0);
    level = std::max(level - static_cast<double>(elapsed) * rate, 0.0);

    d.allowed = level + 1.0 <= capacity + kEpsilon;
    if (consume && d.allowed) {
        level += 1.0;
        d.new_state = fmt::format("{:.6f}|{}", level, now_ms);
    }

    d.remaining     = floor_u32(capacity - level, limit);
    d.current_count = limit - d.remaining;
    d.state_ttl     = std::chrono::milliseconds(window_ms);
    d.reset_at_ms   = rate > 0.0
        ? now_ms + static_cast<std::int64_t>(std::ceil(level / rate))
        : now_ms + window_ms;
    if (!d.allowed) {
        d.retry_after = rate > 0.0 ? ceil_ms((level + 1.0 - capacity) / rate)
                                   : std::chrono::milliseconds(window_ms);
    }
    return d;
}

}  // namespace

AlgorithmDecision evaluate_algorithm(RateLimitAlgorithm algorithm,
                                     const std::optional<std::string>& previous_state,
                                     std::uint32_t limit,
                                     std::chrono::milliseconds window,
                                     std::int64_t now_ms,
                                     bool consume) {
    const std::int64_t window_ms = std::max<std::int64_t>(window.count(), 1);
    switch (algorithm) {
        case RateLimitAlgorithm::kFixedWindow:
            return fixed_window(previous_state, limit, window_ms, now_ms, consume);
        case RateLimitAlgorithm::kSlidingWindow:
            return sliding_window(previous_state, limit, window_ms, now_ms, consume);
        case RateLimitAlgorithm::kTokenBucket:
            return token_bucket(previous_state, limit, window_ms, now_ms, consume);
        case RateLimitAlgorithm::kLeakyBucket:
            return leaky_bucket(previous_state, limit, window_ms, now_ms, consume);
    }
    return sliding_window(previous_state, limit, window_ms, now_ms, consume);
}
