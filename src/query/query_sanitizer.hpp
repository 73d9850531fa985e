#pragma once

// ---------------------------------------------------------------------------
// query_sanitizer.hpp
//
// 쿼리 정제기. 두 가지 모드를 제공한다.
//
// 1. 방어 모드 sanitize(raw)
//    우선순위 내림차순으로 정렬된 규칙 표를 고정 순서로 적용한다.
//    텍스트를 바꾸는 편집(remove/replace)은 모두 SanitizationAction 으로 기록되고,
//    block/warn 규칙은 텍스트를 바꾸지 않고 SecurityWarning 만 남긴다.
//
// 2. 권장 모드 create_parameterized(template, params)
//    $name 플레이스홀더에 값을 바인딩한다. 값은 템플릿에 절대 삽입되지 않으며,
//    compiled_for_display 는 감사/표시 전용이다.
//
// [기본 규칙 표: 우선순위 순]
//   100 strip_block_comment      block comment      replace " "
//    90 strip_line_comment       // 또는 -- 주석    remove
//    80 normalize_escaped_quote  \\ 홀수 3개 이상 + ' replace "\'"
//    70 remove_statement_separator ; (리터럴 밖)    remove
//    60 block_admin_procedure    dbms./apoc 실행    block   critical
//    50 warn_destructive_keyword DROP/DELETE/...    warn    critical
//    40 warn_union_select        UNION [ALL] SELECT warn    critical
//    30 warn_tautology           OR 1=1, OR 'a'='a' warn    critical
//    20 warn_bulk_load           LOAD CSV           warn    high
//
// [리터럴 처리]
// - 주석 규칙: 닫힌 문자열 안의 // 나 -- 는 건드리지 않는다. 닫히지 않은
//   따옴표 뒤는 따옴표 탈출 공격으로 보고 코드로 취급한다.
// - 구분자 규칙: 닫히지 않은 리터럴(입력 끝까지) 안의 ; 도 건드리지 않는다.
// - 경고 규칙: 리터럴 여부와 무관하게 전체 텍스트에서 찾는다.
// - 이스케이프 규칙: 짝수 길이 백슬래시 뒤의 ' 는 리터럴을 닫는 정상 따옴표이므로
//   건드리지 않는다. 홀수 길이만 \' 로 줄여 리터럴 경계를 유지한다.
//
// [결정성]
// 같은 입력은 항상 같은 actions/warnings 를 만든다 (규칙 표와 순서 고정).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "logger/audit_sink.hpp"
#include "query/query_analyzer.hpp"
#include "query/query_types.hpp"

// 규칙이 매치를 찾는 방법
enum class RuleKind : std::uint8_t {
    kPattern      = 0,  // 정규식
    kLineComment  = 1,  // 렉서 토큰
    kBlockComment = 2,  // 렉서 토큰
    kSeparator    = 3,  // 리터럴/주석 밖 ';'
    kEscapedQuote = 4,  // ' 앞의 홀수 길이(3 이상) 백슬래시 연속
};

struct SanitizationRule {
    std::string                       name{};
    int                               priority{0};
    RuleKind                          kind{RuleKind::kPattern};
    std::shared_ptr<const std::regex> pattern{};  // kind == kPattern
    RuleAction                        action{RuleAction::kWarn};
    std::string                       replacement{};
    ThreatLevel                       severity{ThreatLevel::kLow};
    LiteralScope                      scope{LiteralScope::kAnywhere};
    std::string                       reason{};
};

class QuerySanitizer {
public:
    explicit QuerySanitizer(QueryLimits limits = {}, std::shared_ptr<AuditSink> audit = nullptr);

    ~QuerySanitizer() = default;

    QuerySanitizer(const QuerySanitizer&)            = default;
    QuerySanitizer& operator=(const QuerySanitizer&) = default;
    QuerySanitizer(QuerySanitizer&&)                 = default;
    QuerySanitizer& operator=(QuerySanitizer&&)      = default;

    // 우선순위 내림차순으로 정렬된 기본 규칙 표 (프로세스당 한 번 컴파일)
    [[nodiscard]] static const std::vector<SanitizationRule>& default_rules();

    [[nodiscard]] SanitizedQuery sanitize(std::string_view raw_query) const;

    [[nodiscard]] std::expected<ParameterizedQuery, ParameterError>
    create_parameterized(std::string_view template_text, ParameterMap parameters) const;

    [[nodiscard]] QueryValidationResult validate_structure(std::string_view query) const {
        return analyzer_.validate_structure(query);
    }

    // [A-Za-z_][A-Za-z0-9_]{0,63}
    [[nodiscard]] static bool is_valid_parameter_name(std::string_view name) noexcept;

    // 표시용 리터럴 렌더링 (문자열은 작은따옴표 + 백슬래시 이스케이프)
    [[nodiscard]] static std::string render_parameter(const ParameterValue& value);

private:
    QueryAnalyzer              analyzer_;
    std::shared_ptr<AuditSink> audit_;
};
