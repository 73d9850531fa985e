// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 PipelineConfig 구조체로 파싱한다.
//
// [형식]
//   global:        { log_level, log_path, development_mode }
//   rate_limits:   { fail_closed, store_timeout_ms, policy_cache_ttl, policies: [...] }
//   scanner:       { report_threshold, timeout_ms, max_content_size, engines: [...] }
//   normalization: { trim, unicode_normalize, strip_control, collapse_whitespace,
//                    strip_html, case_fold, max_length }
//   html:          { allowed_tags, allowed_attributes, allow_data_attributes,
//                    fail_closed_on_parse_error }
//   query:         { max_nesting_depth, max_joins, max_cost, max_length }
//   schemas:       [ SchemaLoader 형식 문서 ... ]
//
// [검증]
// - 알 수 없는 algorithm / engine / report_threshold, 0 인 한도/윈도,
//   0 이하 multiplier 는 파일 전체를 거부한다.
//   조용히 기본값으로 떨어지면 운영자가 의도한 제한이 빠진다.
//
// [알려진 한계]
// - policy_cache_ttl 은 초 단위 정수만 받는다 ("5m" 같은 단위 표기 미지원).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <optional>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/yaml_read.hpp"
#include "schema/schema_loader.hpp"

namespace {

[[nodiscard]] std::unexpected<std::string> fail(std::string err) {
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

[[nodiscard]] std::optional<RateLimitAlgorithm> algorithm_from_string(const std::string& s) {
    if (s == "fixed_window")   { return RateLimitAlgorithm::kFixedWindow; }
    if (s == "sliding_window") { return RateLimitAlgorithm::kSlidingWindow; }
    if (s == "token_bucket")   { return RateLimitAlgorithm::kTokenBucket; }
    if (s == "leaky_bucket")   { return RateLimitAlgorithm::kLeakyBucket; }
    return std::nullopt;
}

[[nodiscard]] std::optional<ScanEngine> engine_from_string(const std::string& s) {
    if (s == "injection")      { return ScanEngine::kInjection; }
    if (s == "malware")        { return ScanEngine::kMalware; }
    if (s == "phishing")       { return ScanEngine::kPhishing; }
    if (s == "sensitive_data") { return ScanEngine::kSensitiveData; }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// global
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level        = read_string(node["log_level"], cfg.log_level);
    cfg.log_path         = read_string(node["log_path"], cfg.log_path);
    cfg.development_mode = read_bool(node["development_mode"], cfg.development_mode);
    if (cfg.development_mode) {
        spdlog::warn("config_loader: development_mode is enabled");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// rate_limits.policies[]
//   - operation: search
//     requests: 60
//     window_seconds: 60
//     algorithm: token_bucket
//     exceptions:
//       - { role: admin, multiplier: 10 }
//       - { license: enterprise, multiplier: 5 }
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<RateLimitPolicy, std::string> parse_policy(const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::unexpected(std::string("policy entry is not a map"));
    }
    RateLimitPolicy policy{};
    policy.operation = read_string(node["operation"], "");
    if (policy.operation.empty()) {
        return std::unexpected(std::string("policy entry without 'operation'"));
    }

    policy.requests_per_window = read_uint32(node["requests"], policy.requests_per_window);
    if (policy.requests_per_window == 0) {
        return std::unexpected(fmt::format("policy '{}': requests must be > 0", policy.operation));
    }

    const auto window_sec = read_uint32(node["window_seconds"], 60);
    if (window_sec == 0) {
        return std::unexpected(fmt::format("policy '{}': window_seconds must be > 0", policy.operation));
    }
    policy.window = std::chrono::seconds(window_sec);

    if (node["algorithm"]) {
        const auto name = read_string(node["algorithm"], "");
        const auto algo = algorithm_from_string(name);
        if (!algo) {
            return std::unexpected(fmt::format("policy '{}': unknown algorithm '{}'", policy.operation, name));
        }
        policy.algorithm = *algo;
    }

    const YAML::Node& exceptions = node["exceptions"];
    if (exceptions && exceptions.IsSequence()) {
        for (const auto& item : exceptions) {
            PolicyException ex{};
            ex.role         = read_string(item["role"], "");
            ex.license_tier = read_string(item["license"], "");
            ex.multiplier   = read_double(item["multiplier"], 1.0);
            if (ex.role.empty() && ex.license_tier.empty()) {
                return std::unexpected(fmt::format(
                    "policy '{}': exception needs 'role' or 'license'", policy.operation));
            }
            if (ex.multiplier <= 0.0) {
                return std::unexpected(fmt::format(
                    "policy '{}': multiplier must be > 0", policy.operation));
            }
            policy.exceptions.push_back(std::move(ex));
        }
    }
    return policy;
}

[[nodiscard]] std::expected<RateLimitConfig, std::string> parse_rate_limits(const YAML::Node& node) {
    RateLimitConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.limiter.fail_closed   = read_bool(node["fail_closed"], cfg.limiter.fail_closed);
    cfg.limiter.store_timeout = std::chrono::milliseconds(read_uint32(
        node["store_timeout_ms"], static_cast<std::uint32_t>(cfg.limiter.store_timeout.count())));
    cfg.policy_cache_ttl = std::chrono::seconds(read_uint32(
        node["policy_cache_ttl"], static_cast<std::uint32_t>(cfg.policy_cache_ttl.count())));

    const YAML::Node& policies = node["policies"];
    if (policies && policies.IsSequence()) {
        cfg.policies.reserve(policies.size());
        for (const auto& item : policies) {
            auto policy = parse_policy(item);
            if (!policy) {
                return std::unexpected(policy.error());
            }
            cfg.policies.push_back(std::move(*policy));
        }
    }
    if (cfg.limiter.fail_closed) {
        spdlog::info("config_loader: rate limiter configured fail-closed");
    }
    return cfg;
}

[[nodiscard]] std::expected<ScanOptions, std::string> parse_scanner(const YAML::Node& node) {
    ScanOptions opts{};
    if (!node || !node.IsMap()) {
        return opts;
    }
    if (node["report_threshold"]) {
        const auto name  = read_string(node["report_threshold"], "");
        const auto level = threat_level_from_string(name, ThreatLevel::kNone);
        if (level == ThreatLevel::kNone && name != "none") {
            return std::unexpected(fmt::format("unknown report_threshold '{}'", name));
        }
        opts.report_threshold = level;
    }
    opts.timeout = std::chrono::milliseconds(
        read_uint32(node["timeout_ms"], static_cast<std::uint32_t>(opts.timeout.count())));
    opts.max_content_size = read_optional_size(node["max_content_size"]).value_or(opts.max_content_size);

    if (node["engines"]) {
        opts.enabled_engines = 0;
        for (const auto& name : read_string_sequence(node["engines"])) {
            const auto engine = engine_from_string(name);
            if (!engine) {
                return std::unexpected(fmt::format("unknown scan engine '{}'", name));
            }
            opts.enabled_engines |= static_cast<std::uint8_t>(*engine);
        }
        if (opts.enabled_engines == 0) {
            spdlog::warn("config_loader: scanner.engines is empty, content scanning is disabled");
        }
    }
    return opts;
}

[[nodiscard]] NormalizeOptions parse_normalization(const YAML::Node& node) {
    NormalizeOptions opts = NormalizeOptions::defaults();
    if (!node || !node.IsMap()) {
        return opts;
    }
    opts.trim                = read_bool(node["trim"], opts.trim);
    opts.unicode_normalize   = read_bool(node["unicode_normalize"], opts.unicode_normalize);
    opts.strip_control       = read_bool(node["strip_control"], opts.strip_control);
    opts.collapse_whitespace = read_bool(node["collapse_whitespace"], opts.collapse_whitespace);
    opts.strip_html          = read_bool(node["strip_html"], opts.strip_html);
    opts.case_fold           = read_bool(node["case_fold"], opts.case_fold);
    opts.max_length          = read_optional_size(node["max_length"]).value_or(opts.max_length);
    return opts;
}

[[nodiscard]] HtmlSanitizeOptions parse_html(const YAML::Node& node) {
    HtmlSanitizeOptions opts{};
    if (!node || !node.IsMap()) {
        return opts;
    }
    // 목록을 지정하면 기본 허용 목록을 통째로 교체한다 (병합 아님)
    if (node["allowed_tags"]) {
        const auto tags = read_string_sequence(node["allowed_tags"]);
        opts.allowed_tags = std::set<std::string>(tags.begin(), tags.end());
    }
    if (node["allowed_attributes"]) {
        const auto attrs = read_string_sequence(node["allowed_attributes"]);
        opts.allowed_attributes = std::set<std::string>(attrs.begin(), attrs.end());
    }
    opts.allow_data_attributes = read_bool(node["allow_data_attributes"], opts.allow_data_attributes);
    opts.fail_closed_on_parse_error =
        read_bool(node["fail_closed_on_parse_error"], opts.fail_closed_on_parse_error);
    if (!opts.fail_closed_on_parse_error) {
        spdlog::warn("config_loader: html.fail_closed_on_parse_error is disabled");
    }
    return opts;
}

[[nodiscard]] QueryLimits parse_query(const YAML::Node& node) {
    QueryLimits limits{};
    if (!node || !node.IsMap()) {
        return limits;
    }
    limits.max_nesting_depth = static_cast<int>(
        read_uint32(node["max_nesting_depth"], static_cast<std::uint32_t>(limits.max_nesting_depth)));
    limits.max_joins = static_cast<int>(
        read_uint32(node["max_joins"], static_cast<std::uint32_t>(limits.max_joins)));
    limits.max_cost   = read_double(node["max_cost"], limits.max_cost);
    limits.max_length = read_optional_size(node["max_length"]).value_or(limits.max_length);
    return limits;
}

[[nodiscard]] std::expected<std::vector<JsonSchema>, std::string> parse_schemas(const YAML::Node& node) {
    std::vector<JsonSchema> schemas;
    if (!node || !node.IsSequence()) {
        return schemas;
    }
    schemas.reserve(node.size());
    for (const auto& item : node) {
        auto schema = SchemaLoader::parse(item);
        if (!schema) {
            return std::unexpected(schema.error());
        }
        schemas.push_back(std::move(*schema));
    }
    return schemas;
}

// ---------------------------------------------------------------------------
// 섹션별 파싱. 섹션마다 YAML 예외를 잡아 섹션 이름을 붙인다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PipelineConfig, std::string>
parse_root(const YAML::Node& root, const std::string& origin) {
    if (!root || !root.IsMap()) {
        return fail(fmt::format("config_loader: '{}' is not a valid YAML map (top-level)", origin));
    }

    PipelineConfig cfg{};
    std::string    section;
    try {
        section    = "global";
        cfg.global = parse_global(root["global"]);

        section = "rate_limits";
        auto rate_limits = parse_rate_limits(root["rate_limits"]);
        if (!rate_limits) {
            return fail(fmt::format("config_loader: error in 'rate_limits' section: {}", rate_limits.error()));
        }
        cfg.rate_limits = std::move(*rate_limits);

        section = "scanner";
        auto scanner = parse_scanner(root["scanner"]);
        if (!scanner) {
            return fail(fmt::format("config_loader: error in 'scanner' section: {}", scanner.error()));
        }
        cfg.scanner = *scanner;

        section           = "normalization";
        cfg.normalization = parse_normalization(root["normalization"]);

        section  = "html";
        cfg.html = parse_html(root["html"]);

        section   = "query";
        cfg.query = parse_query(root["query"]);

        section = "schemas";
        auto schemas = parse_schemas(root["schemas"]);
        if (!schemas) {
            return fail(fmt::format("config_loader: error in 'schemas' section: {}", schemas.error()));
        }
        cfg.schemas = std::move(*schemas);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("config_loader: error parsing '{}' section: {}", section, e.what()));
    }

    spdlog::info("config_loader: loaded {} rate limit policies, {} schemas from '{}'",
                 cfg.rate_limits.policies.size(), cfg.schemas.size(), origin);
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<PipelineConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(fmt::format("config_loader: cannot resolve config path '{}': {}",
                                config_path.string(), ec.message()));
    }

    spdlog::info("config_loader: loading configuration from '{}'", canonical_path.string());

    // 2. YAML 파일 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(fmt::format("config_loader: cannot open file '{}': {}", canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format("config_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("config_loader: YAML error in '{}': {}", canonical_path.string(), e.what()));
    }

    // 3. 섹션 파싱
    return parse_root(root, canonical_path.string());
}

std::expected<PipelineConfig, std::string>
ConfigLoader::parse_text(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format("config_loader: YAML parse error at line {}, col {}: {}",
                                e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("config_loader: YAML error: {}", e.what()));
    }
    return parse_root(root, "<inline>");
}
