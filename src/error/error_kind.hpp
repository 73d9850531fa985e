#pragma once

// ---------------------------------------------------------------------------
// error_kind.hpp
//
// 실패 분류 태그와 외부 공개용 매핑 표.
//
// 실패는 발생 지점에서 ErrorKind 태그를 달고 만들어진다. 외부로 나가는
// 코드/메시지/상태 코드는 이 표에서만 결정된다.
//
// [계층]
//   internal ─┬─ database ── query
//             ├─ configuration
//             └─ external_service ── timeout
//   validation ── conflict
//   not_found, unauthorized, forbidden, rate_limited  (루트)
//
// 매핑이 없는 kind 는 가장 가까운 조상의 매핑을 쓴다. 조상에도 없으면 internal.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

enum class ErrorKind : std::uint8_t {
    kValidation      = 0,
    kNotFound        = 1,
    kUnauthorized    = 2,
    kForbidden       = 3,
    kRateLimited     = 4,
    kConflict        = 5,
    kTimeout         = 6,
    kQuery           = 7,
    kDatabase        = 8,
    kConfiguration   = 9,
    kExternalService = 10,
    kInternal        = 11,
};

[[nodiscard]] inline std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::kValidation:      return "validation";
        case ErrorKind::kNotFound:        return "not_found";
        case ErrorKind::kUnauthorized:    return "unauthorized";
        case ErrorKind::kForbidden:       return "forbidden";
        case ErrorKind::kRateLimited:     return "rate_limited";
        case ErrorKind::kConflict:        return "conflict";
        case ErrorKind::kTimeout:         return "timeout";
        case ErrorKind::kQuery:           return "query";
        case ErrorKind::kDatabase:        return "database";
        case ErrorKind::kConfiguration:   return "configuration";
        case ErrorKind::kExternalService: return "external_service";
        case ErrorKind::kInternal:        return "internal";
    }
    return "internal";
}

// 직계 부모. 루트면 nullopt.
[[nodiscard]] inline std::optional<ErrorKind> parent_of(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::kConflict:        return ErrorKind::kValidation;
        case ErrorKind::kQuery:           return ErrorKind::kDatabase;
        case ErrorKind::kTimeout:         return ErrorKind::kExternalService;
        case ErrorKind::kDatabase:
        case ErrorKind::kConfiguration:
        case ErrorKind::kExternalService: return ErrorKind::kInternal;
        default:                          return std::nullopt;
    }
}

// ---------------------------------------------------------------------------
// ErrorMapping
//   code               : 외부 공개 코드 (예: "VALIDATION_ERROR")
//   safe_message       : 사용자에게 보여도 되는 고정 문구
//   status_code        : HTTP 상태 코드
//   log_level          : error.sanitized 감사 이벤트 레벨
//   allow_safe_details : Failure::safe_details 를 응답에 붙여도 되는지
// ---------------------------------------------------------------------------
struct ErrorMapping {
    std::string_view code{};
    std::string_view safe_message{};
    int              status_code{500};
    LogLevel         log_level{LogLevel::kError};
    bool             allow_safe_details{false};
};

// 기본 표에 kind 자신의 항목이 있으면 반환 (조상 탐색 없음)
[[nodiscard]] inline std::optional<ErrorMapping> builtin_mapping(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::kValidation:
            return ErrorMapping{"VALIDATION_ERROR", "The request contains invalid data.",
                                400, LogLevel::kInfo, true};
        case ErrorKind::kNotFound:
            return ErrorMapping{"NOT_FOUND", "The requested resource was not found.",
                                404, LogLevel::kInfo, false};
        case ErrorKind::kUnauthorized:
            return ErrorMapping{"UNAUTHORIZED", "Authentication is required.",
                                401, LogLevel::kWarn, false};
        case ErrorKind::kForbidden:
            return ErrorMapping{"FORBIDDEN", "You do not have permission to perform this action.",
                                403, LogLevel::kWarn, false};
        case ErrorKind::kRateLimited:
            return ErrorMapping{"RATE_LIMITED", "Too many requests. Please try again later.",
                                429, LogLevel::kWarn, true};
        case ErrorKind::kConflict:
            return ErrorMapping{"CONFLICT", "The request conflicts with the current state of the resource.",
                                409, LogLevel::kInfo, false};
        case ErrorKind::kTimeout:
            return ErrorMapping{"TIMEOUT", "The operation timed out. Please try again.",
                                504, LogLevel::kWarn, false};
        case ErrorKind::kDatabase:
            return ErrorMapping{"DATABASE_ERROR", "A data access error occurred.",
                                500, LogLevel::kError, false};
        case ErrorKind::kExternalService:
            return ErrorMapping{"SERVICE_UNAVAILABLE", "A dependent service is unavailable.",
                                503, LogLevel::kError, false};
        case ErrorKind::kInternal:
            return ErrorMapping{"INTERNAL_ERROR", "An unexpected error occurred.",
                                500, LogLevel::kError, false};
        case ErrorKind::kQuery:
        case ErrorKind::kConfiguration:
            return std::nullopt;
    }
    return std::nullopt;
}
