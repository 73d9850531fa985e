#pragma once

// ---------------------------------------------------------------------------
// error_sanitizer.hpp
//
// Failure → 외부 공개용 ErrorResponse 변환.
//
// [불변식]
// - 운영 모드(development_mode == false)에서는 원문 kind/message/detail/cause 가
//   응답에 절대 포함되지 않는다. 설정으로 바꿀 수 있는 기본값이 아니다.
// - 개발 모드에서도 debug 정보는 redact() 를 거친다. cause 체인은 재귀적으로
//   같은 처리를 받는다 (안쪽 실패가 바깥 래퍼를 통해 새지 않는다).
// - 모든 응답은 correlation id 를 갖는다. 같은 id 로 감사 이벤트
//   (error.sanitized) 에 원문 실패 전체가 기록된다.
//
// [correlation id 형식]
//   ERR-YYYYMMDD-<16 hex>  (UTC 날짜 + 난수 32bit + 프로세스 내 순번 32bit)
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "error/error_kind.hpp"
#include "error/failure.hpp"
#include "logger/audit_sink.hpp"

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// 개발 모드 전용 진단 정보 (모든 문자열은 redact 완료 상태)
struct DebugCause {
    std::string kind{};
    std::string message{};
};

struct DebugDetails {
    std::string             kind{};
    std::string             message{};
    std::string             detail{};
    std::vector<DebugCause> causes{};  // 바깥 → 안쪽 순
};

struct ErrorResponse {
    std::string                                      error{};    // kind 이름 (매핑이 적용된 kind)
    std::string                                      message{};  // safe message
    std::string                                      code{};
    std::string                                      correlation_id{};
    int                                              status_code{500};
    SystemTimePoint                                  timestamp{};
    std::vector<std::pair<std::string, std::string>> safe_details{};
    std::optional<DebugDetails>                      debug{};

    // {"error","message","code","correlationId","statusCode","timestamp","details"?}
    [[nodiscard]] std::string to_json() const;
};

class ErrorSanitizer {
public:
    using Clock = std::function<SystemTimePoint()>;

    explicit ErrorSanitizer(bool                                development_mode = false,
                            std::shared_ptr<AuditSink>          audit            = nullptr,
                            std::map<ErrorKind, ErrorMapping>   overrides        = {},
                            Clock                               clock            = {});

    [[nodiscard]] ErrorResponse sanitize(const Failure& failure) const;

    // 경계에서 잡은 예외를 kind 로 태깅해 sanitize
    [[nodiscard]] ErrorResponse sanitize_exception(const std::exception& ex,
                                                   ErrorKind             kind = ErrorKind::kInternal) const;

    // 정확 일치 → 가장 가까운 조상 → internal 순으로 찾은 매핑과 그 kind
    [[nodiscard]] std::pair<ErrorKind, ErrorMapping> resolve(ErrorKind kind) const;

    [[nodiscard]] bool development_mode() const noexcept { return development_mode_; }

    // 자격 증명/접속 문자열 조각 마스킹
    [[nodiscard]] static std::string redact(std::string_view text);

    [[nodiscard]] static std::string make_correlation_id(SystemTimePoint now);

private:
    void audit_failure(const Failure& failure, const ErrorResponse& response, LogLevel level) const;

    bool                              development_mode_;
    std::shared_ptr<AuditSink>        audit_;
    std::map<ErrorKind, ErrorMapping> overrides_;
    Clock                             clock_;
};
