#pragma once

// ---------------------------------------------------------------------------
// detection_engine.hpp
//
// 콘텐츠 스캐너 탐지 엔진 인터페이스.
//
// [설계 원칙]
// - 엔진은 입력에 대한 순수 함수다. 상태를 갖지 않으므로 여러 스레드가
//   같은 인스턴스를 동시에 사용할 수 있다.
// - 엔진 간 실행 순서는 결과에 영향을 주지 않는다 (병합은 ContentScanner).
// ---------------------------------------------------------------------------

#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "scanner/threat_types.hpp"

struct EngineOutcome {
    std::vector<DetectedThreat> threats{};
    bool                        timed_out{false};
};

class DetectionEngine {
public:
    virtual ~DetectionEngine() = default;

    [[nodiscard]] virtual ScanEngine    kind() const noexcept = 0;
    [[nodiscard]] virtual EngineOutcome scan(std::string_view content,
                                             const Deadline&  deadline) const = 0;

    [[nodiscard]] std::string_view id() const noexcept { return to_string(kind()); }

protected:
    DetectionEngine()                                  = default;
    DetectionEngine(const DetectionEngine&)            = default;
    DetectionEngine& operator=(const DetectionEngine&) = default;
};
