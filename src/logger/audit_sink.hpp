#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// 구조화 보안 이벤트를 받는 감사 싱크 인터페이스.
// 실제 저장소(감사 DB, SIEM 등)는 외부 협력자이며 파이프라인은 이 경계만 안다.
//
// [설계 원칙]
// - emit() 은 noexcept: 감사 실패가 요청 처리 경로로 전파되지 않는다.
//   구현체는 내부에서 예외를 잡아 spdlog 로 진단만 남긴다.
// - 호출 스레드에서 동기 실행된다. 느린 저장소는 구현체가 큐잉할 것.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void emit(const SecurityEvent& event) noexcept = 0;

protected:
    AuditSink()                            = default;
    AuditSink(const AuditSink&)            = default;
    AuditSink& operator=(const AuditSink&) = default;
};
