#pragma once

// ---------------------------------------------------------------------------
// phishing_detector.hpp
//
// 피싱 문구 + 의심 링크 탐지 엔진.
//
// [탐지 규칙]
// - 긴급/인증 요구 문구 사전 (verify your account, account suspended, ...)
// - 링크 휴리스틱: IP 리터럴 호스트, userinfo(@) 포함 URL, punycode(xn--),
//   남용이 잦은 TLD, 비보안 http:// 링크
// - 결합 규칙: 긴급 문구 2개 이상 + 링크 1개 이상이면 high severity 의
//   phishing_campaign 위협을 추가한다.
//
// [오탐/미탐 트레이드오프]
// - 문구 하나만으로는 medium. 정상 보안 안내 메일도 같은 문구를 쓴다.
// ---------------------------------------------------------------------------

#include "scanner/detection_engine.hpp"

class PhishingDetector final : public DetectionEngine {
public:
    PhishingDetector() = default;

    [[nodiscard]] ScanEngine    kind() const noexcept override { return ScanEngine::kPhishing; }
    [[nodiscard]] EngineOutcome scan(std::string_view content,
                                     const Deadline&  deadline) const override;
};
