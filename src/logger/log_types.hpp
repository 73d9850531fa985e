#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사(audit) 서브시스템에서 사용하는 구조화 이벤트 타입 정의.
//
// [순환 의존성 방지 설계]
// - ratelimit/scanner/query/error 헤더를 include 하지 않는다.
//   각 레이어가 자신의 결과를 SecurityEvent::fields 로 평탄화해서 전달한다.
//
// [민감정보 취급 주의]
// - error.sanitized 이벤트만 원문 실패 정보(unredacted)를 담는다.
//   이 이벤트는 감사 저장소로만 흘러가며 응답 경로로 되돌아가지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug" | "info" | "warn" | "error" → LogLevel. 알 수 없으면 kInfo.
[[nodiscard]] inline LogLevel log_level_from_string(std::string_view s) noexcept {
    if (s == "debug") { return LogLevel::kDebug; }
    if (s == "warn" || s == "warning") { return LogLevel::kWarn; }
    if (s == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// 이벤트 이름 상수
// ---------------------------------------------------------------------------
namespace audit_event {
inline constexpr const char* kRateLimitExceeded   = "rate_limit.exceeded";
inline constexpr const char* kRateLimitStoreError = "rate_limit.store_failure";
inline constexpr const char* kThreatDetected      = "content.threat_detected";
inline constexpr const char* kContentOversize     = "content.rejected_oversize";
inline constexpr const char* kQuerySanitized      = "query.sanitized";
inline constexpr const char* kQueryWarning        = "query.warning";
inline constexpr const char* kErrorSanitized      = "error.sanitized";
}  // namespace audit_event

// ---------------------------------------------------------------------------
// SecurityEvent
//   감사 싱크로 전달되는 이벤트 하나.
//   fields 는 삽입 순서를 유지하는 key/value 목록 (JSON 직렬화 순서 = 삽입 순서).
// ---------------------------------------------------------------------------
struct SecurityEvent {
    std::string                                      event{};
    LogLevel                                         level{LogLevel::kInfo};
    std::string                                      correlation_id{};  // 없으면 빈 문자열
    std::vector<std::pair<std::string, std::string>> fields{};
    std::chrono::system_clock::time_point            timestamp{std::chrono::system_clock::now()};

    SecurityEvent& with(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }
};
