#pragma once

// ---------------------------------------------------------------------------
// pipeline_stats.hpp
//
// 파이프라인 판정 통계. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request / on_query_sanitized: 요청 경로에서 concurrent 호출 안전.
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 atomic 로드로 분리한다.
//   필드별로 따로 읽으므로 스냅샷 내부 합계가 순간적으로 어긋날 수 있다.
//
// [격리 원칙]
// - 통계 갱신 실패가 요청 실패로 전파되지 않도록 모든 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>

// 요청 하나의 최종 판정
enum class RequestOutcome : std::uint8_t {
    kAllowed          = 0,
    kRateLimited      = 1,
    kValidationFailed = 2,
    kThreatBlocked    = 3,
    kError            = 4,
};

[[nodiscard]] inline std::string_view to_string(RequestOutcome outcome) noexcept {
    switch (outcome) {
        case RequestOutcome::kAllowed:          return "allowed";
        case RequestOutcome::kRateLimited:      return "rate_limited";
        case RequestOutcome::kValidationFailed: return "validation_failed";
        case RequestOutcome::kThreatBlocked:    return "threat_blocked";
        case RequestOutcome::kError:            return "error";
    }
    return "error";
}

// ---------------------------------------------------------------------------
// StatsSnapshot
//   rps        : 수집기 생성 이후 평균 초당 요청 수
//   block_rate : (total - allowed) / total (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         allowed{0};
    std::uint64_t                         rate_limited{0};
    std::uint64_t                         validation_failures{0};
    std::uint64_t                         threats_blocked{0};
    std::uint64_t                         errors{0};
    std::uint64_t                         queries_sanitized{0};
    double                                rps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};

    [[nodiscard]] std::string to_json() const {
        return fmt::format(
            R"({{"total_requests":{},"allowed":{},"rate_limited":{},"validation_failures":{},)"
            R"("threats_blocked":{},"errors":{},"queries_sanitized":{},"rps":{:.3f},"block_rate":{:.4f}}})",
            total_requests, allowed, rate_limited, validation_failures, threats_blocked, errors,
            queries_sanitized, rps, block_rate);
    }
};

class PipelineStats {
public:
    PipelineStats() noexcept : started_at_(std::chrono::system_clock::now()) {}

    ~PipelineStats() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    PipelineStats(const PipelineStats&)            = delete;
    PipelineStats& operator=(const PipelineStats&) = delete;
    PipelineStats(PipelineStats&&)                 = delete;
    PipelineStats& operator=(PipelineStats&&)      = delete;

    void on_request(RequestOutcome outcome) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        switch (outcome) {
            case RequestOutcome::kAllowed:
                allowed_.fetch_add(1, std::memory_order_relaxed);
                break;
            case RequestOutcome::kRateLimited:
                rate_limited_.fetch_add(1, std::memory_order_relaxed);
                break;
            case RequestOutcome::kValidationFailed:
                validation_failures_.fetch_add(1, std::memory_order_relaxed);
                break;
            case RequestOutcome::kThreatBlocked:
                threats_blocked_.fetch_add(1, std::memory_order_relaxed);
                break;
            case RequestOutcome::kError:
                errors_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    void on_query_sanitized() noexcept {
        queries_sanitized_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now   = std::chrono::system_clock::now();
        const auto total = total_requests_.load(std::memory_order_relaxed);
        const auto ok    = allowed_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0 && total >= ok) {
            block_rate = static_cast<double>(total - ok) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_requests      = total,
            .allowed             = ok,
            .rate_limited        = rate_limited_.load(std::memory_order_relaxed),
            .validation_failures = validation_failures_.load(std::memory_order_relaxed),
            .threats_blocked     = threats_blocked_.load(std::memory_order_relaxed),
            .errors              = errors_.load(std::memory_order_relaxed),
            .queries_sanitized   = queries_sanitized_.load(std::memory_order_relaxed),
            .rps                 = rps,
            .block_rate          = block_rate,
            .captured_at         = now,
        };
    }

private:
    std::atomic<std::uint64_t>                  total_requests_{0};
    std::atomic<std::uint64_t>                  allowed_{0};
    std::atomic<std::uint64_t>                  rate_limited_{0};
    std::atomic<std::uint64_t>                  validation_failures_{0};
    std::atomic<std::uint64_t>                  threats_blocked_{0};
    std::atomic<std::uint64_t>                  errors_{0};
    std::atomic<std::uint64_t>                  queries_sanitized_{0};
    const std::chrono::system_clock::time_point started_at_;
};
