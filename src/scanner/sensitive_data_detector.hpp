#pragma once

// ---------------------------------------------------------------------------
// sensitive_data_detector.hpp
//
// 민감 데이터 노출 탐지 엔진.
//
// - 결제 카드 번호: 13~19자리 (공백/하이픈 구분 허용) + Luhn 체크섬 통과
// - 국가 식별 번호: 미국 SSN (000/666/9xx 지역 번호 제외)
// - 이메일 주소
// - 자격 증명 형태 key=value (password, api_key, secret, token ...)
// - 연결 문자열 조각 (scheme://user:pass@, Server=...;Password=...)
//
// 민감 데이터는 제자리 마스킹이 가능하므로 remediable=true 로 보고된다.
// ---------------------------------------------------------------------------

#include "scanner/detection_engine.hpp"

class SensitiveDataDetector final : public DetectionEngine {
public:
    SensitiveDataDetector() = default;

    [[nodiscard]] ScanEngine    kind() const noexcept override { return ScanEngine::kSensitiveData; }
    [[nodiscard]] EngineOutcome scan(std::string_view content,
                                     const Deadline&  deadline) const override;

    // 숫자 이외 문자는 무시한다. 13~19자리가 아니면 false.
    [[nodiscard]] static bool luhn_valid(std::string_view digits) noexcept;
};
