#pragma once

// ---------------------------------------------------------------------------
// malware_detector.hpp
//
// 동적 실행/난독화 탐지 엔진.
//
// - 동적 실행 키워드: eval(, new Function(, exec(, system(, fromCharCode(,
//   document.write(, Runtime.getRuntime().exec, powershell -enc
// - 인코딩 휴리스틱: 연속 \xNN / \uNNNN 이스케이프, base64 디코딩 호출,
//   data:*;base64, URI, 100자 이상 base64 덩어리
//
// [한계]
// - 시그니처가 아니라 징후 탐지이므로 정상 코드 스니펫에도 걸린다.
//   malware 유형은 제거 불가(remediable=false)로 보고된다.
// ---------------------------------------------------------------------------

#include "scanner/detection_engine.hpp"

class MalwareDetector final : public DetectionEngine {
public:
    MalwareDetector() = default;

    [[nodiscard]] ScanEngine    kind() const noexcept override { return ScanEngine::kMalware; }
    [[nodiscard]] EngineOutcome scan(std::string_view content,
                                     const Deadline&  deadline) const override;
};
