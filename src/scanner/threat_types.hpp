#pragma once

// ---------------------------------------------------------------------------
// threat_types.hpp
//
// 콘텐츠 스캐너의 결과 타입 정의.
//
// [불변식]
// - ScanResult::threat_level == max(threats[i].severity), threats 가 비면 kNone
// - threats 에는 report_threshold 미만 severity 가 남지 않는다.
// - DetectedThreat::confidence ∈ [0, 1]
// - matched_pattern 은 규칙 식별자이며 입력 원문 조각을 담지 않는다
//   (민감 데이터가 감사 로그로 새지 않도록).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

enum class ThreatType : std::uint8_t {
    kSqlInjection     = 0,
    kXss              = 1,
    kLdapInjection    = 2,
    kCommandInjection = 3,
    kQueryComment     = 4,
    kMalware          = 5,
    kObfuscation      = 6,
    kPhishing         = 7,
    kSensitiveData    = 8,
};

[[nodiscard]] inline std::string_view to_string(ThreatType type) noexcept {
    switch (type) {
        case ThreatType::kSqlInjection:     return "sql_injection";
        case ThreatType::kXss:              return "xss";
        case ThreatType::kLdapInjection:    return "ldap_injection";
        case ThreatType::kCommandInjection: return "command_injection";
        case ThreatType::kQueryComment:     return "query_comment";
        case ThreatType::kMalware:          return "malware";
        case ThreatType::kObfuscation:      return "obfuscation";
        case ThreatType::kPhishing:         return "phishing";
        case ThreatType::kSensitiveData:    return "sensitive_data";
    }
    return "sql_injection";
}

// ---------------------------------------------------------------------------
// ScanEngine
//   엔진 비트 플래그. ScanOptions::enabled_engines 로 조합한다.
// ---------------------------------------------------------------------------
enum class ScanEngine : std::uint8_t {
    kInjection     = 1U << 0,
    kMalware       = 1U << 1,
    kPhishing      = 1U << 2,
    kSensitiveData = 1U << 3,
};

inline constexpr std::uint8_t kAllScanEngines = 0x0F;

[[nodiscard]] constexpr bool engine_enabled(std::uint8_t flags, ScanEngine engine) noexcept {
    return (flags & static_cast<std::uint8_t>(engine)) != 0;
}

[[nodiscard]] inline std::string_view to_string(ScanEngine engine) noexcept {
    switch (engine) {
        case ScanEngine::kInjection:     return "injection";
        case ScanEngine::kMalware:       return "malware";
        case ScanEngine::kPhishing:      return "phishing";
        case ScanEngine::kSensitiveData: return "sensitive_data";
    }
    return "injection";
}

// ---------------------------------------------------------------------------
// ScanAction
//   none → allow, low → allow-with-warning, medium → require-review,
//   high/critical → sanitize(제거 가능한 위협만) 또는 block
// ---------------------------------------------------------------------------
enum class ScanAction : std::uint8_t {
    kAllow            = 0,
    kAllowWithWarning = 1,
    kRequireReview    = 2,
    kSanitize         = 3,
    kBlock            = 4,
};

[[nodiscard]] inline std::string_view to_string(ScanAction action) noexcept {
    switch (action) {
        case ScanAction::kAllow:            return "allow";
        case ScanAction::kAllowWithWarning: return "allow_with_warning";
        case ScanAction::kRequireReview:    return "require_review";
        case ScanAction::kSanitize:         return "sanitize";
        case ScanAction::kBlock:            return "block";
    }
    return "block";
}

struct Location {
    std::size_t offset{0};  // 바이트 오프셋
    std::size_t length{0};
    std::size_t line{1};    // 1-based
};

struct DetectedThreat {
    ThreatType  type{ThreatType::kSqlInjection};
    Location    location{};
    std::string matched_pattern{};  // 규칙 이름
    double      confidence{0.0};
    ThreatLevel severity{ThreatLevel::kLow};
    std::string recommendation{};
    std::string engine{};
    bool        remediable{false};  // 제자리 제거/마스킹 가능 여부
};

struct ScanOptions {
    ThreatLevel               report_threshold{ThreatLevel::kLow};
    std::chrono::milliseconds timeout{100};
    std::size_t               max_content_size{1024 * 1024};
    std::uint8_t              enabled_engines{kAllScanEngines};
};

struct ScanResult {
    std::vector<DetectedThreat> threats{};
    ThreatLevel                 threat_level{ThreatLevel::kNone};
    ScanAction                  recommended_action{ScanAction::kAllow};
    std::vector<std::string>    engines_run{};
    bool                        timed_out{false};
    std::chrono::microseconds   scan_duration{0};
    std::size_t                 content_size{0};

    [[nodiscard]] bool is_clean() const noexcept { return threats.empty() && !timed_out; }
};

enum class ScanErrorCode : std::uint8_t {
    kContentTooLarge = 0,
};

struct ScanError {
    ScanErrorCode code{ScanErrorCode::kContentTooLarge};
    std::string   message{};
    std::size_t   content_size{0};
    std::size_t   limit{0};
};
