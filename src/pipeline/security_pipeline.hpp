#pragma once

// ---------------------------------------------------------------------------
// security_pipeline.hpp
//
// 요청 하나를 단계 순서대로 통과시키는 오케스트레이터.
//
//   1. admission      RateLimiter::check_and_record
//      size           ContentScanner::check_size (원문 기준, 정규화/파싱 전)
//   2. normalization  normalize_string (설정의 NormalizeOptions)
//   3. schema         SchemaValidator (schema 이름이 지정된 경우, 본문은 JSON/YAML)
//   4. scanning       ContentScanner
//   5. query          create_parameterized (템플릿) 또는 sanitize (원문 쿼리)
//
// [설계 원칙]
// - 첫 번째 차단 단계에서 멈춘다. 이후 단계는 실행하지 않는다.
// - 차단/실패는 모두 Failure 로 태깅되어 ErrorSanitizer 를 거친 ErrorResponse
//   로만 바깥에 나간다. 원문 오류 메시지는 응답에 실리지 않는다.
// - 단계 내부 예외는 process() 경계에서 잡아 internal 실패로 변환한다.
//
// [스캔 조치]
//   block          → 차단 (kThreatBlocked)
//   sanitize       → 제거 가능한 위협 구간을 [REDACTED] 로 치환 후 통과
//   require_review → 통과 + review_required 표시
// ---------------------------------------------------------------------------

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "common/types.hpp"
#include "config/pipeline_config.hpp"
#include "error/error_sanitizer.hpp"
#include "logger/audit_sink.hpp"
#include "query/query_sanitizer.hpp"
#include "ratelimit/counter_store.hpp"
#include "ratelimit/policy_registry.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "scanner/content_scanner.hpp"
#include "schema/schema_registry.hpp"
#include "schema/schema_validator.hpp"
#include "stats/pipeline_stats.hpp"

struct PipelineRequest {
    std::string    operation{"default"};
    RateLimitScope scope{RateLimitScope::kUser};
    std::string    identifier{"anonymous"};
    CallerContext  caller{};
    std::string    body{};
    std::string    schema{};  // 비어 있으면 스키마 검증 생략

    // 둘 중 하나만 지정. 둘 다 있으면 template 우선.
    std::optional<std::string> query_template{};
    ParameterMap               parameters{};
    std::optional<std::string> raw_query{};
};

struct PipelineResponse {
    RequestOutcome                    outcome{RequestOutcome::kAllowed};
    bool                              review_required{false};
    std::string                       body{};  // 정규화(및 필요 시 마스킹)된 본문
    std::optional<RateLimitResult>    rate_limit{};
    std::optional<ValidationResult>   validation{};
    std::optional<ScanResult>         scan{};
    std::optional<ParameterizedQuery> parameterized{};
    std::optional<SanitizedQuery>     sanitized_query{};
    std::optional<ErrorResponse>      error{};

    [[nodiscard]] bool allowed() const noexcept { return outcome == RequestOutcome::kAllowed; }

    // CLI 출력용 판정 요약 한 줄
    [[nodiscard]] std::string to_json() const;
};

class SecurityPipeline {
public:
    using Clock = std::function<SystemTimePoint()>;

    // store 가 nullptr 이면 InMemoryCounterStore 를 만든다.
    explicit SecurityPipeline(const PipelineConfig&         config,
                              std::shared_ptr<AuditSink>    audit = nullptr,
                              std::shared_ptr<CounterStore> store = nullptr,
                              Clock clock = [] { return std::chrono::system_clock::now(); });

    ~SecurityPipeline() = default;

    SecurityPipeline(const SecurityPipeline&)            = delete;
    SecurityPipeline& operator=(const SecurityPipeline&) = delete;
    SecurityPipeline(SecurityPipeline&&)                 = delete;
    SecurityPipeline& operator=(SecurityPipeline&&)      = delete;

    [[nodiscard]] PipelineResponse process(const PipelineRequest& request);

    // 런타임 정책/스키마 교체용
    [[nodiscard]] PolicyRegistry& policies() noexcept { return *policies_; }
    [[nodiscard]] SchemaRegistry& schemas() noexcept { return *schemas_; }

    [[nodiscard]] const PipelineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const ErrorSanitizer& errors() const noexcept { return error_sanitizer_; }

private:
    // 단계 실패를 응답에 기록. 항상 false 를 반환해 호출부에서 바로 return 한다.
    bool reject(PipelineResponse& response, RequestOutcome outcome, const Failure& failure);

    bool run_stages(const PipelineRequest& request, PipelineResponse& response);

    PipelineConfig                  config_;
    std::shared_ptr<PolicyRegistry> policies_;
    std::shared_ptr<SchemaRegistry> schemas_;
    RateLimiter                     limiter_;
    SchemaValidator                 validator_;
    ContentScanner                  scanner_;
    QuerySanitizer                  query_sanitizer_;
    ErrorSanitizer                  error_sanitizer_;
    PipelineStats                   stats_;
};
