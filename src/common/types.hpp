#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// 파이프라인 전 단계가 공유하는 기본 타입.
// ratelimit/normalizer/schema/scanner/query/error 레이어가 const-ref 로
// 주고받으며, 이 헤더는 프로젝트 내 다른 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ThreatLevel
//   탐지 위험도 서열. 값의 대소 비교가 곧 심각도 비교이다.
//   ScanResult::threat_level = max(보고된 위협의 severity).
// ---------------------------------------------------------------------------
enum class ThreatLevel : std::uint8_t {
    kNone     = 0,
    kLow      = 1,
    kMedium   = 2,
    kHigh     = 3,
    kCritical = 4,
};

[[nodiscard]] inline std::string_view to_string(ThreatLevel level) noexcept {
    switch (level) {
        case ThreatLevel::kNone:     return "none";
        case ThreatLevel::kLow:      return "low";
        case ThreatLevel::kMedium:   return "medium";
        case ThreatLevel::kHigh:     return "high";
        case ThreatLevel::kCritical: return "critical";
    }
    return "none";
}

// 설정 문자열 → ThreatLevel. 알 수 없는 값은 fallback.
[[nodiscard]] inline ThreatLevel threat_level_from_string(std::string_view s,
                                                          ThreatLevel fallback) noexcept {
    if (s == "none")     { return ThreatLevel::kNone; }
    if (s == "low")      { return ThreatLevel::kLow; }
    if (s == "medium")   { return ThreatLevel::kMedium; }
    if (s == "high")     { return ThreatLevel::kHigh; }
    if (s == "critical") { return ThreatLevel::kCritical; }
    return fallback;
}

// ---------------------------------------------------------------------------
// Clock
//   시각 공급 함수 타입. 테스트에서 수동 시계를 주입하기 위해 사용한다.
// ---------------------------------------------------------------------------
using SystemTimePoint = std::chrono::system_clock::time_point;

// ---------------------------------------------------------------------------
// Deadline
//   호출 단위 시간 예산. 패턴 매칭 루프와 저장소 I/O 가 주기적으로
//   expired() 를 확인하여 무한 대기/폭주를 막는다.
//
//   [한계]
//   - 협조적(cooperative) 방식이다. 단일 std::regex_search 호출 내부는
//     중단할 수 없으므로 패턴 매칭은 고정 크기 창 단위로 호출한다
//     (scanner/pattern_rule.hpp).
// ---------------------------------------------------------------------------
class Deadline {
public:
    using SteadyClock = std::chrono::steady_clock;

    // 만료 없음
    Deadline() noexcept : at_(SteadyClock::time_point::max()) {}

    explicit Deadline(SteadyClock::time_point at) noexcept : at_(at) {}

    [[nodiscard]] static Deadline after(std::chrono::milliseconds budget) noexcept {
        return Deadline{SteadyClock::now() + budget};
    }

    [[nodiscard]] static Deadline never() noexcept { return Deadline{}; }

    [[nodiscard]] bool expired() const noexcept {
        return at_ != SteadyClock::time_point::max() && SteadyClock::now() >= at_;
    }

    [[nodiscard]] SteadyClock::time_point at() const noexcept { return at_; }

private:
    SteadyClock::time_point at_;
};
