#pragma once

// ---------------------------------------------------------------------------
// content_scanner.hpp
//
// 네 개의 탐지 엔진(injection / malware / phishing / sensitive_data)을 같은
// 입력에 실행하고 결과를 하나의 ScanResult 로 병합한다.
//
// [처리 순서]
// 1. 크기 검사: content.size() > max_content_size 이면 스캔 없이
//    ScanError(kContentTooLarge). 부분 스캔은 하지 않는다.
// 2. Deadline = now + timeout 을 모든 엔진이 공유한다.
// 3. 활성 엔진 실행 → report_threshold 미만 위협 제거 → offset 순 정렬
// 4. threat_level = max(severity)
// 5. recommended_action = 심각도→조치 표 (action_for)
// 6. 타임아웃이 났으면 찾은 위협은 유지하고 조치를 require_review 이상으로 올린다.
//
// [감사 이벤트]
// - content.threat_detected : threat_level >= medium
// - content.rejected_oversize
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "logger/audit_sink.hpp"
#include "scanner/detection_engine.hpp"
#include "scanner/threat_types.hpp"

class ContentScanner {
public:
    explicit ContentScanner(ScanOptions options = {}, std::shared_ptr<AuditSink> audit = nullptr);

    ~ContentScanner() = default;

    ContentScanner(const ContentScanner&)            = delete;
    ContentScanner& operator=(const ContentScanner&) = delete;
    ContentScanner(ContentScanner&&)                 = default;
    ContentScanner& operator=(ContentScanner&&)      = default;

    [[nodiscard]] std::expected<ScanResult, ScanError> scan(std::string_view content) const;

    // 호출 단위로 옵션을 바꿔 실행 (엔진 인스턴스는 공유)
    [[nodiscard]] std::expected<ScanResult, ScanError> scan(std::string_view   content,
                                                            const ScanOptions& options) const;

    // 크기 제한만 확인 (초과 시 audit 이벤트 기록). scan() 도 같은 검사를 먼저 수행한다.
    [[nodiscard]] std::optional<ScanError> check_size(std::string_view content) const {
        return check_size(content, options_);
    }
    [[nodiscard]] std::optional<ScanError> check_size(std::string_view   content,
                                                      const ScanOptions& options) const;

    // 심각도 → 조치 표.
    //   none → allow, low → allow_with_warning, medium → require_review,
    //   high/critical → remediable 이면 sanitize, 아니면 block
    [[nodiscard]] static ScanAction action_for(ThreatLevel level, bool remediable) noexcept;

    [[nodiscard]] const ScanOptions& options() const noexcept { return options_; }

private:
    ScanOptions                                   options_;
    std::shared_ptr<AuditSink>                    audit_;
    std::vector<std::unique_ptr<DetectionEngine>> engines_;
};
