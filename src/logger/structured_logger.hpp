#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거. AuditSink 의 기본 구현.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 파이프라인 각 단계에 전달한다.
// - 이벤트 하나 = JSON 한 줄. 키는 snake_case 로 통일한다.
// - emit() 은 noexcept. spdlog 내부 오류는 삼키지 않고 stderr 진단으로 남긴다.
// ---------------------------------------------------------------------------

#include "logger/audit_sink.hpp"
#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   SecurityEvent 를 JSON 포맷으로 stdout + rotating file 에 기록한다.
// ---------------------------------------------------------------------------
class StructuredLogger final : public AuditSink {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 이벤트는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   예외: 싱크 생성 실패 시 std::runtime_error
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path);

    ~StructuredLogger() override;

    // 복사/이동 금지 (spdlog 레지스트리 이름 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    void emit(const SecurityEvent& event) noexcept override;

    // JSON 직렬화 (테스트/CLI 출력 공용)
    [[nodiscard]] static std::string to_json(const SecurityEvent& event);

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
