#pragma once

// ---------------------------------------------------------------------------
// injection_detector.hpp
//
// 정규식 패턴 기반 인젝션 탐지 엔진.
//
// [탐지 대상]
// - SQL 계열: UNION SELECT, tautology(' OR 1=1), stacked query(; DROP ...)
// - XSS: <script, on*= 이벤트 핸들러, javascript: 스킴
// - LDAP 필터 조작: )(|, *)( 등 와일드카드/연산자 결합
// - 명령 구분자: ; | && ` $( ) 뒤의 쉘 명령
// - 쿼리 언어 주석 꼬리: -- , /* */
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 주석 분할: UN/**/ION 은 /* */ 주석 규칙으로만 잡힌다 (UNION 규칙은 미탐).
// 2. 인코딩 우회: URL/HTML 엔티티 인코딩은 정규화 단계 이후에만 잡힌다.
//    스캐너는 InputNormalizer 뒤에서 실행할 것.
//
// [오탐/미탐 트레이드오프]
// - on*= 규칙은 "onboarding=true" 같은 일반 텍스트에서 오탐 가능.
//   severity 를 medium 으로 낮춰 block 대신 review 로 이어지게 한다.
// - 주석 규칙은 산문 속 "--" 에서도 걸릴 수 있어 low 로 둔다.
// ---------------------------------------------------------------------------

#include "scanner/detection_engine.hpp"

class InjectionDetector final : public DetectionEngine {
public:
    InjectionDetector() = default;

    [[nodiscard]] ScanEngine    kind() const noexcept override { return ScanEngine::kInjection; }
    [[nodiscard]] EngineOutcome scan(std::string_view content,
                                     const Deadline&  deadline) const override;
};
