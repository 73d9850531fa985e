// ---------------------------------------------------------------------------
// security_pipeline.cpp
// ---------------------------------------------------------------------------

#include "pipeline/security_pipeline.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "logger/json_format.hpp"
#include "normalizer/input_normalizer.hpp"

namespace {

// 응답에 실을 스키마 오류 경로 수 상한
constexpr std::size_t kMaxReportedFieldErrors = 10;

constexpr std::string_view kRedactedMarker = "[REDACTED]";

// 제거 가능한 위협 구간을 마스킹. 겹치는 구간은 합친다.
std::string mask_remediable(const std::string& body, const std::vector<DetectedThreat>& threats) {
    std::vector<std::pair<std::size_t, std::size_t>> spans;  // [begin, end)
    for (const auto& t : threats) {
        if (t.remediable && t.location.length > 0 && t.location.offset < body.size()) {
            const auto end = std::min(body.size(), t.location.offset + t.location.length);
            spans.emplace_back(t.location.offset, end);
        }
    }
    if (spans.empty()) {
        return body;
    }
    std::sort(spans.begin(), spans.end());

    std::vector<std::pair<std::size_t, std::size_t>> merged;
    for (const auto& span : spans) {
        if (!merged.empty() && span.first <= merged.back().second) {
            merged.back().second = std::max(merged.back().second, span.second);
        } else {
            merged.push_back(span);
        }
    }

    std::string out = body;
    for (auto it = merged.rbegin(); it != merged.rend(); ++it) {
        out.replace(it->first, it->second - it->first, kRedactedMarker);
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// PipelineResponse::to_json
// ---------------------------------------------------------------------------
std::string PipelineResponse::to_json() const {
    std::ostringstream oss;
    oss << "{\"allowed\":" << (allowed() ? "true" : "false")
        << ",\"outcome\":\"" << to_string(outcome) << "\""
        << ",\"review_required\":" << (review_required ? "true" : "false");

    if (rate_limit.has_value()) {
        oss << ",\"rate_limit\":{\"limit\":" << rate_limit->limit
            << ",\"remaining\":" << rate_limit->remaining
            << ",\"policy\":\"" << escape_json_string(rate_limit->policy) << "\""
            << ",\"degraded\":" << (rate_limit->degraded ? "true" : "false") << "}";
    }
    if (validation.has_value()) {
        oss << ",\"validation\":{\"schema\":\"" << escape_json_string(validation->schema_name) << "\""
            << ",\"errors\":" << validation->errors.size()
            << ",\"warnings\":" << validation->warnings.size() << "}";
    }
    if (scan.has_value()) {
        oss << ",\"scan\":{\"threat_level\":\"" << to_string(scan->threat_level) << "\""
            << ",\"action\":\"" << to_string(scan->recommended_action) << "\""
            << ",\"timed_out\":" << (scan->timed_out ? "true" : "false")
            << ",\"threats\":[";
        for (std::size_t i = 0; i < scan->threats.size(); ++i) {
            const auto& t = scan->threats[i];
            oss << (i == 0 ? "" : ",") << "{\"type\":\"" << to_string(t.type) << "\""
                << ",\"rule\":\"" << escape_json_string(t.matched_pattern) << "\""
                << ",\"severity\":\"" << to_string(t.severity) << "\""
                << ",\"offset\":" << t.location.offset << "}";
        }
        oss << "]}";
    }
    if (parameterized.has_value()) {
        oss << ",\"query\":{\"template\":\"" << escape_json_string(parameterized->template_text) << "\""
            << ",\"parameters\":" << parameterized->parameters.size()
            << ",\"warnings\":" << parameterized->warnings.size() << "}";
    } else if (sanitized_query.has_value()) {
        oss << ",\"query\":{\"sanitized\":\"" << escape_json_string(sanitized_query->query) << "\""
            << ",\"modified\":" << (sanitized_query->was_modified ? "true" : "false")
            << ",\"actions\":" << sanitized_query->actions.size()
            << ",\"warnings\":" << sanitized_query->warnings.size() << "}";
    }
    if (error.has_value()) {
        oss << ",\"error\":" << error->to_json();
    } else {
        oss << ",\"body\":\"" << escape_json_string(body) << "\"";
    }
    oss << "}";
    return oss.str();
}

// ---------------------------------------------------------------------------
// SecurityPipeline
// ---------------------------------------------------------------------------
SecurityPipeline::SecurityPipeline(const PipelineConfig&         config,
                                   std::shared_ptr<AuditSink>    audit,
                                   std::shared_ptr<CounterStore> store,
                                   Clock                         clock)
    : config_(config)
    , policies_(std::make_shared<PolicyRegistry>(config.rate_limits.policy_cache_ttl, clock))
    , schemas_(std::make_shared<SchemaRegistry>(std::chrono::minutes(5), clock))
    , limiter_(store ? std::move(store)
                     : std::shared_ptr<CounterStore>(std::make_shared<InMemoryCounterStore>(clock)),
               policies_, config.rate_limits.limiter, audit, clock)
    , validator_(schemas_)
    , scanner_(config.scanner, audit)
    , query_sanitizer_(config.query, audit)
    , error_sanitizer_(config.global.development_mode, audit, {}, clock)
{
    for (const auto& policy : config_.rate_limits.policies) {
        policies_->register_policy(policy, true);
    }
    for (const auto& schema : config_.schemas) {
        if (!schemas_->register_schema(schema, true)) {
            spdlog::warn("security_pipeline: skipped unnamed schema from configuration");
        }
    }
    spdlog::info("security_pipeline: ready ({} configured policies, {} schemas registered)",
                 config_.rate_limits.policies.size(), schemas_->names().size());
}

PipelineResponse SecurityPipeline::process(const PipelineRequest& request) {
    PipelineResponse response;
    try {
        if (run_stages(request, response)) {
            response.outcome = RequestOutcome::kAllowed;
        }
    } catch (const std::exception& ex) {
        spdlog::error("security_pipeline: unexpected failure in operation '{}'", request.operation);
        response.outcome = RequestOutcome::kError;
        response.error   = error_sanitizer_.sanitize_exception(ex, ErrorKind::kInternal);
    }
    stats_.on_request(response.outcome);
    return response;
}

bool SecurityPipeline::reject(PipelineResponse& response, RequestOutcome outcome, const Failure& failure) {
    response.outcome = outcome;
    response.error   = error_sanitizer_.sanitize(failure);
    return false;
}

bool SecurityPipeline::run_stages(const PipelineRequest& request, PipelineResponse& response) {
    // 1. admission
    const RateLimitKey key{request.scope, request.identifier, request.operation};
    response.rate_limit = limiter_.check_and_record(key, request.caller);
    if (!response.rate_limit->allowed) {
        auto failure = Failure::make(ErrorKind::kRateLimited,
                                     fmt::format("rate limit exceeded for key '{}'", key.cache_key()));
        for (const auto& [name, value] : response.rate_limit->headers()) {
            failure.with_safe_detail(name, value);
        }
        return reject(response, RequestOutcome::kRateLimited, failure);
    }

    // 크기 제한은 정규화/파싱 전에 원문 기준으로 확인한다
    if (auto oversize = scanner_.check_size(request.body)) {
        auto failure = Failure::make(ErrorKind::kValidation, oversize->message);
        failure.with_safe_detail("max_content_size", std::to_string(oversize->limit));
        return reject(response, RequestOutcome::kValidationFailed, failure);
    }

    // 2. normalization
    response.body = normalize_string(request.body, config_.normalization);

    // 3. schema
    if (!request.schema.empty()) {
        YAML::Node document;
        try {
            document = YAML::Load(response.body);
        } catch (const YAML::ParserException& e) {
            auto failure = Failure::make(ErrorKind::kValidation,
                                         fmt::format("request body is not valid JSON: {}", e.what()));
            failure.with_safe_detail("$", "MALFORMED_BODY");
            return reject(response, RequestOutcome::kValidationFailed, failure);
        }

        auto result = validator_.validate(document, request.schema);
        if (!result.schema_found) {
            response.validation = std::move(result);
            return reject(response, RequestOutcome::kError,
                          Failure::make(ErrorKind::kConfiguration,
                                        fmt::format("schema '{}' is not registered", request.schema)));
        }
        if (!result.is_valid()) {
            auto failure = Failure::make(
                ErrorKind::kValidation,
                fmt::format("{} schema violations against '{}'", result.errors.size(), request.schema));
            const auto n = std::min(result.errors.size(), kMaxReportedFieldErrors);
            for (std::size_t i = 0; i < n; ++i) {
                failure.with_safe_detail(result.errors[i].path, std::string(to_string(result.errors[i].code)));
            }
            response.validation = std::move(result);
            return reject(response, RequestOutcome::kValidationFailed, failure);
        }
        response.validation = std::move(result);
    }

    // 4. scanning
    auto scanned = scanner_.scan(response.body);
    if (!scanned) {
        auto failure = Failure::make(ErrorKind::kValidation, scanned.error().message);
        failure.with_safe_detail("max_content_size", std::to_string(scanned.error().limit));
        return reject(response, RequestOutcome::kValidationFailed, failure);
    }
    response.scan = std::move(*scanned);
    switch (response.scan->recommended_action) {
        case ScanAction::kBlock:
            return reject(response, RequestOutcome::kThreatBlocked,
                          Failure::make(ErrorKind::kForbidden,
                                        fmt::format("content blocked: threat level {}",
                                                    to_string(response.scan->threat_level))));
        case ScanAction::kSanitize:
            response.body = mask_remediable(response.body, response.scan->threats);
            break;
        case ScanAction::kRequireReview:
            response.review_required = true;
            break;
        case ScanAction::kAllow:
        case ScanAction::kAllowWithWarning:
            break;
    }

    // 5. query
    if (request.query_template.has_value()) {
        const auto structure = query_sanitizer_.validate_structure(*request.query_template);
        if (!structure.is_valid) {
            auto failure = Failure::make(ErrorKind::kQuery, "query template failed structural validation");
            failure.detail = structure.errors.front().message;
            return reject(response, RequestOutcome::kValidationFailed,
                          failure.wrap(ErrorKind::kValidation, "invalid query"));
        }
        if (structure.complexity.exceeds_limits) {
            return reject(response, RequestOutcome::kValidationFailed,
                          Failure::make(ErrorKind::kValidation,
                                        fmt::format("query too complex (cost {:.1f})",
                                                    structure.complexity.estimated_cost)));
        }
        auto parameterized = query_sanitizer_.create_parameterized(*request.query_template, request.parameters);
        if (!parameterized) {
            auto failure = Failure::make(ErrorKind::kValidation, parameterized.error().message);
            if (!parameterized.error().name.empty()) {
                failure.with_safe_detail("parameter", parameterized.error().name);
            }
            return reject(response, RequestOutcome::kValidationFailed, failure);
        }
        response.parameterized = std::move(*parameterized);
    } else if (request.raw_query.has_value()) {
        auto sanitized = query_sanitizer_.sanitize(*request.raw_query);
        if (sanitized.was_modified) {
            stats_.on_query_sanitized();
        }
        const bool blocked = sanitized.blocked;
        response.sanitized_query = std::move(sanitized);
        if (blocked) {
            return reject(response, RequestOutcome::kThreatBlocked,
                          Failure::make(ErrorKind::kForbidden, "query blocked by sanitization rule"));
        }
    }
    return true;
}
