// ---------------------------------------------------------------------------
// content_scanner.cpp
// ---------------------------------------------------------------------------

#include "scanner/content_scanner.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "scanner/injection_detector.hpp"
#include "scanner/malware_detector.hpp"
#include "scanner/phishing_detector.hpp"
#include "scanner/sensitive_data_detector.hpp"

ContentScanner::ContentScanner(ScanOptions options, std::shared_ptr<AuditSink> audit)
    : options_(options)
    , audit_(std::move(audit))
{
    engines_.push_back(std::make_unique<InjectionDetector>());
    engines_.push_back(std::make_unique<MalwareDetector>());
    engines_.push_back(std::make_unique<PhishingDetector>());
    engines_.push_back(std::make_unique<SensitiveDataDetector>());
}

ScanAction ContentScanner::action_for(ThreatLevel level, bool remediable) noexcept {
    switch (level) {
        case ThreatLevel::kNone:     return ScanAction::kAllow;
        case ThreatLevel::kLow:      return ScanAction::kAllowWithWarning;
        case ThreatLevel::kMedium:   return ScanAction::kRequireReview;
        case ThreatLevel::kHigh:
        case ThreatLevel::kCritical: return remediable ? ScanAction::kSanitize : ScanAction::kBlock;
    }
    return ScanAction::kBlock;
}

std::expected<ScanResult, ScanError> ContentScanner::scan(std::string_view content) const {
    return scan(content, options_);
}

std::optional<ScanError> ContentScanner::check_size(std::string_view   content,
                                                   const ScanOptions& options) const {
    if (content.size() <= options.max_content_size) {
        return std::nullopt;
    }
    spdlog::warn("content_scanner: rejected oversize content ({} > {} bytes)",
                 content.size(), options.max_content_size);
    if (audit_) {
        SecurityEvent event{};
        event.event = audit_event::kContentOversize;
        event.level = LogLevel::kWarn;
        event.with("size", std::to_string(content.size()))
             .with("limit", std::to_string(options.max_content_size));
        audit_->emit(event);
    }
    return ScanError{
        ScanErrorCode::kContentTooLarge,
        fmt::format("content size {} exceeds limit {}", content.size(), options.max_content_size),
        content.size(),
        options.max_content_size,
    };
}

std::expected<ScanResult, ScanError> ContentScanner::scan(std::string_view   content,
                                                          const ScanOptions& options) const {
    if (auto oversize = check_size(content, options)) {
        return std::unexpected(std::move(*oversize));
    }

    const auto started  = std::chrono::steady_clock::now();
    const auto deadline = Deadline::after(options.timeout);

    ScanResult result{};
    result.content_size = content.size();

    for (const auto& engine : engines_) {
        if (!engine_enabled(options.enabled_engines, engine->kind())) {
            continue;
        }
        if (deadline.expired()) {
            result.timed_out = true;
            break;
        }
        auto outcome = engine->scan(content, deadline);
        result.engines_run.emplace_back(engine->id());
        result.timed_out = result.timed_out || outcome.timed_out;
        for (auto& threat : outcome.threats) {
            if (threat.severity >= options.report_threshold) {
                result.threats.push_back(std::move(threat));
            }
        }
    }

    std::stable_sort(result.threats.begin(), result.threats.end(),
                     [](const DetectedThreat& a, const DetectedThreat& b) {
                         return a.location.offset < b.location.offset;
                     });

    // 최고 심각도 위협이 모두 제거 가능할 때만 sanitize
    bool remediable = true;
    for (const auto& threat : result.threats) {
        if (threat.severity > result.threat_level) {
            result.threat_level = threat.severity;
            remediable          = threat.remediable;
        } else if (threat.severity == result.threat_level) {
            remediable = remediable && threat.remediable;
        }
    }
    result.recommended_action = action_for(result.threat_level, remediable);
    if (result.timed_out && result.recommended_action < ScanAction::kRequireReview) {
        result.recommended_action = ScanAction::kRequireReview;
    }

    result.scan_duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (result.timed_out) {
        spdlog::warn("content_scanner: scan exceeded {}ms budget, {} partial finding(s)",
                     options.timeout.count(), result.threats.size());
    }

    if (audit_ && (result.threat_level >= ThreatLevel::kMedium || result.timed_out)) {
        std::vector<std::string_view> types;
        for (const auto& threat : result.threats) {
            const auto t = to_string(threat.type);
            if (std::find(types.begin(), types.end(), t) == types.end()) {
                types.push_back(t);
            }
        }
        SecurityEvent event{};
        event.event = audit_event::kThreatDetected;
        event.level = result.threat_level >= ThreatLevel::kHigh ? LogLevel::kWarn : LogLevel::kInfo;
        event.with("threat_level", std::string(to_string(result.threat_level)))
             .with("action", std::string(to_string(result.recommended_action)))
             .with("threat_count", std::to_string(result.threats.size()))
             .with("threat_types", fmt::format("{}", fmt::join(types, ",")))
             .with("timed_out", result.timed_out ? "true" : "false");
        audit_->emit(event);
    }
    return result;
}
