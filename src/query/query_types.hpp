#pragma once

// ---------------------------------------------------------------------------
// query_types.hpp
//
// 쿼리 정제기/파라미터화/구조 검증의 결과 타입.
//
// [불변식]
// - ParameterizedQuery::compiled_for_display 는 감사/표시 전용이다.
//   실행 경로는 template_text + parameters 를 분리된 채널로 전달해야 한다.
// - template_text 에는 파라미터 값이 절대 삽입되지 않는다.
// - SanitizedQuery::was_modified ⇔ !actions.empty()
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// RuleAction
//   정제 규칙의 닫힌 조치 집합. QuerySanitizer::apply_rule 의 switch 한 곳에서
//   분기한다.
// ---------------------------------------------------------------------------
enum class RuleAction : std::uint8_t {
    kRemove  = 0,  // 매치 삭제
    kReplace = 1,  // 매치 치환
    kBlock   = 2,  // 쿼리 전체 차단 (텍스트 변경 없음)
    kWarn    = 3,  // 경고만 (텍스트 변경 없음)
};

[[nodiscard]] inline std::string_view to_string(RuleAction action) noexcept {
    switch (action) {
        case RuleAction::kRemove:  return "remove";
        case RuleAction::kReplace: return "replace";
        case RuleAction::kBlock:   return "block";
        case RuleAction::kWarn:    return "warn";
    }
    return "warn";
}

// 문자열 리터럴 내부 매치를 규칙이 어떻게 다루는지
enum class LiteralScope : std::uint8_t {
    kAnywhere             = 0,
    kOutsideClosedLiteral = 1,  // 닫힌 리터럴 내부만 제외 (닫히지 않은 따옴표 뒤는 코드로 본다)
    kOutsideAnyLiteral    = 2,  // 닫히지 않은 리터럴(입력 끝까지)도 제외
};

struct SanitizationAction {
    std::string rule{};
    std::size_t position{0};  // 적용 시점 텍스트 기준 바이트 오프셋
    std::string original{};
    std::string replacement{};
    std::string reason{};
};

struct SecurityWarning {
    std::string rule{};
    std::string message{};
    ThreatLevel severity{ThreatLevel::kLow};
    std::size_t position{0};
};

struct SanitizedQuery {
    std::string                     query{};
    std::string                     original{};
    bool                            was_modified{false};
    bool                            blocked{false};
    std::vector<SanitizationAction> actions{};
    std::vector<SecurityWarning>    warnings{};
};

// ---------------------------------------------------------------------------
// 파라미터
// ---------------------------------------------------------------------------
using ParameterValue =
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, std::vector<std::string>>;

using ParameterMap = std::map<std::string, ParameterValue>;

[[nodiscard]] std::string_view parameter_type_name(const ParameterValue& value) noexcept;

struct ParameterizedQuery {
    std::string                  template_text{};
    ParameterMap                 parameters{};
    std::string                  compiled_for_display{};
    std::vector<std::string>     placeholders{};  // 템플릿 등장 순서, 중복 제거
    std::vector<SecurityWarning> warnings{};
};

enum class ParameterErrorCode : std::uint8_t {
    kEmptyTemplate    = 0,
    kInvalidName      = 1,
    kMissingParameter = 2,
};

struct ParameterError {
    ParameterErrorCode code{ParameterErrorCode::kEmptyTemplate};
    std::string        name{};
    std::string        message{};
};

// ---------------------------------------------------------------------------
// 구조 검증
// ---------------------------------------------------------------------------
struct QueryLimits {
    int         max_nesting_depth{10};
    int         max_joins{8};
    double      max_cost{1000.0};
    std::size_t max_length{10000};
};

struct QueryComplexity {
    int    nesting_depth{0};
    int    join_count{0};
    int    clause_count{0};
    double estimated_cost{0.0};
    bool   exceeds_limits{false};
};

enum class QueryErrorCode : std::uint8_t {
    kEmptyQuery          = 0,
    kTooLong             = 1,
    kUnbalancedDelimiter = 2,
    kUnterminatedString  = 3,
    kUnterminatedComment = 4,
};

[[nodiscard]] inline std::string_view to_string(QueryErrorCode code) noexcept {
    switch (code) {
        case QueryErrorCode::kEmptyQuery:          return "EMPTY_QUERY";
        case QueryErrorCode::kTooLong:             return "QUERY_TOO_LONG";
        case QueryErrorCode::kUnbalancedDelimiter: return "UNBALANCED_DELIMITER";
        case QueryErrorCode::kUnterminatedString:  return "UNTERMINATED_STRING";
        case QueryErrorCode::kUnterminatedComment: return "UNTERMINATED_COMMENT";
    }
    return "EMPTY_QUERY";
}

struct QuerySyntaxError {
    QueryErrorCode code{QueryErrorCode::kEmptyQuery};
    std::size_t    position{0};
    std::string    message{};
};

struct QueryValidationResult {
    bool                          is_valid{true};
    std::vector<QuerySyntaxError> errors{};
    QueryComplexity               complexity{};
};
