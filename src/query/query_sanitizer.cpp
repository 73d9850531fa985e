// ---------------------------------------------------------------------------
// query_sanitizer.cpp
//
// [편집 적용 방식]
// - 규칙 하나의 매치를 모두 찾은 뒤 뒤에서부터 치환한다 (앞쪽 오프셋 보존).
// - SanitizationAction::position 은 해당 규칙 적용 직전 텍스트 기준이다.
// - 치환 결과가 원문과 같은 매치(예: 이미 정상인 \')는 기록하지 않는다.
// ---------------------------------------------------------------------------

#include "query/query_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"
#include "query/query_lexer.hpp"

namespace {

struct Match {
    std::size_t position;
    std::size_t length;
};

std::shared_ptr<const std::regex> compile(const char* pattern) {
    return std::make_shared<const std::regex>(
        pattern, std::regex_constants::icase | std::regex_constants::ECMAScript);
}

std::vector<SanitizationRule> build_default_rules() {
    std::vector<SanitizationRule> rules{
        {"strip_block_comment", 100, RuleKind::kBlockComment, nullptr, RuleAction::kReplace, " ",
         ThreatLevel::kLow, LiteralScope::kOutsideClosedLiteral,
         "block comments can hide or split keywords"},
        {"strip_line_comment", 90, RuleKind::kLineComment, nullptr, RuleAction::kRemove, "",
         ThreatLevel::kLow, LiteralScope::kOutsideClosedLiteral,
         "line comments can truncate the remainder of a query"},
        {"normalize_escaped_quote", 80, RuleKind::kEscapedQuote, nullptr, RuleAction::kReplace,
         "\\'", ThreatLevel::kMedium, LiteralScope::kAnywhere,
         "redundant escaped backslashes before an escaped quote"},
        {"remove_statement_separator", 70, RuleKind::kSeparator, nullptr, RuleAction::kRemove, "",
         ThreatLevel::kMedium, LiteralScope::kOutsideAnyLiteral,
         "statement separators enable stacked queries"},
        {"block_admin_procedure", 60, RuleKind::kPattern,
         compile(R"(\bcall\s+dbms\.|\bapoc\.(cypher\.(run|doit)|load\.|periodic\.|trigger\.))"),
         RuleAction::kBlock, "", ThreatLevel::kCritical, LiteralScope::kAnywhere,
         "administrative or dynamic-execution procedure call"},
        {"warn_destructive_keyword", 50, RuleKind::kPattern,
         compile(R"(\b(drop|detach\s+delete|delete|remove|truncate)\b)"),
         RuleAction::kWarn, "", ThreatLevel::kCritical, LiteralScope::kAnywhere,
         "destructive keyword in query"},
        {"warn_union_select", 40, RuleKind::kPattern,
         compile(R"(\bunion\b(\s+all)?\s+(select|match|call)\b)"),
         RuleAction::kWarn, "", ThreatLevel::kCritical, LiteralScope::kAnywhere,
         "union-based query extension"},
        {"warn_tautology", 30, RuleKind::kPattern,
         compile(R"re(\bor\b\s+(1\s*=\s*1\b|true\b|'([^']{0,64})'\s*=\s*'\2'?|"([^"]{0,64})"\s*=\s*"\3"?|(\d+)\s*=\s*\4\b))re"),
         RuleAction::kWarn, "", ThreatLevel::kCritical, LiteralScope::kAnywhere,
         "always-true predicate"},
        {"warn_bulk_load", 20, RuleKind::kPattern, compile(R"(\bload\s+csv\b)"),
         RuleAction::kWarn, "", ThreatLevel::kHigh, LiteralScope::kAnywhere,
         "bulk load from external source"},
    };
    std::stable_sort(rules.begin(), rules.end(),
                     [](const SanitizationRule& a, const SanitizationRule& b) {
                         return a.priority > b.priority;
                     });
    return rules;
}

bool inside(const std::vector<LiteralSpan>& spans, std::size_t pos, LiteralScope scope) {
    for (const auto& span : spans) {
        if (pos >= span.begin && pos < span.end) {
            return scope == LiteralScope::kOutsideAnyLiteral || span.terminated;
        }
    }
    return false;
}

std::vector<Match> find_matches(const SanitizationRule& rule, const std::string& text) {
    std::vector<Match> matches;
    const auto recovery = rule.scope == LiteralScope::kOutsideAnyLiteral
                              ? QuoteRecovery::kExtendToEnd
                              : QuoteRecovery::kTreatAsCode;
    switch (rule.kind) {
        case RuleKind::kLineComment:
        case RuleKind::kBlockComment:
        case RuleKind::kSeparator: {
            for (const auto& token : tokenize_query(text, recovery)) {
                const bool hit =
                    (rule.kind == RuleKind::kLineComment && token.kind == TokenKind::kLineComment) ||
                    (rule.kind == RuleKind::kBlockComment && token.kind == TokenKind::kBlockComment) ||
                    (rule.kind == RuleKind::kSeparator && token.kind == TokenKind::kPunct &&
                     token.text == ";");
                if (hit) {
                    matches.push_back(Match{token.offset, token.length});
                }
            }
            break;
        }
        case RuleKind::kEscapedQuote: {
            std::size_t i = 0;
            while (i < text.size()) {
                if (text[i] != '\\') {
                    ++i;
                    continue;
                }
                const auto begin = i;
                while (i < text.size() && text[i] == '\\') {
                    ++i;
                }
                const auto run = i - begin;
                if (i < text.size() && text[i] == '\'' && run >= 3 && run % 2 == 1) {
                    matches.push_back(Match{begin, run + 1});
                }
            }
            break;
        }
        case RuleKind::kPattern: {
            if (!rule.pattern) {
                break;
            }
            std::vector<LiteralSpan> spans;
            if (rule.scope != LiteralScope::kAnywhere) {
                spans = literal_spans(text);
            }
            auto it = std::sregex_iterator(text.begin(), text.end(), *rule.pattern);
            for (; it != std::sregex_iterator(); ++it) {
                const auto pos = static_cast<std::size_t>(it->position(0));
                if (rule.scope != LiteralScope::kAnywhere && inside(spans, pos, rule.scope)) {
                    continue;
                }
                matches.push_back(Match{pos, static_cast<std::size_t>(it->length(0))});
            }
            break;
        }
    }
    return matches;
}

// 규칙 하나 적용. 조치 종류는 이 switch 한 곳에서만 분기한다.
void apply_rule(const SanitizationRule& rule, SanitizedQuery& out) {
    const auto matches = find_matches(rule, out.query);
    if (matches.empty()) {
        return;
    }

    switch (rule.action) {
        case RuleAction::kRemove:
        case RuleAction::kReplace: {
            const std::string replacement = rule.action == RuleAction::kRemove ? "" : rule.replacement;
            std::vector<SanitizationAction> recorded;
            std::vector<Match>              edits;
            for (const auto& m : matches) {
                std::string original = out.query.substr(m.position, m.length);
                if (original == replacement) {
                    continue;
                }
                recorded.push_back(SanitizationAction{rule.name, m.position, std::move(original),
                                                      replacement, rule.reason});
                edits.push_back(m);
            }
            for (auto it = edits.rbegin(); it != edits.rend(); ++it) {
                out.query.replace(it->position, it->length, replacement);
            }
            out.actions.insert(out.actions.end(), recorded.begin(), recorded.end());
            break;
        }
        case RuleAction::kBlock:
            out.blocked = true;
            out.warnings.push_back(SecurityWarning{
                rule.name, fmt::format("query blocked: {}", rule.reason), rule.severity,
                matches.front().position});
            break;
        case RuleAction::kWarn:
            out.warnings.push_back(SecurityWarning{
                rule.name, rule.reason, rule.severity, matches.front().position});
            break;
    }
}

std::string quote_display(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\\' || c == '\'') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

}  // namespace

std::string_view parameter_type_name(const ParameterValue& value) noexcept {
    switch (value.index()) {
        case 0:  return "null";
        case 1:  return "boolean";
        case 2:  return "integer";
        case 3:  return "double";
        case 4:  return "string";
        default: return "string_list";
    }
}

QuerySanitizer::QuerySanitizer(QueryLimits limits, std::shared_ptr<AuditSink> audit)
    : analyzer_(limits)
    , audit_(std::move(audit))
{}

const std::vector<SanitizationRule>& QuerySanitizer::default_rules() {
    static const std::vector<SanitizationRule> rules = build_default_rules();
    return rules;
}

SanitizedQuery QuerySanitizer::sanitize(std::string_view raw_query) const {
    SanitizedQuery out{};
    out.original = std::string(raw_query);
    out.query    = out.original;

    for (const auto& rule : default_rules()) {
        apply_rule(rule, out);
    }
    out.was_modified = !out.actions.empty();

    if (out.was_modified) {
        spdlog::debug("query_sanitizer: {} edit(s) applied", out.actions.size());
    }
    if (audit_ && out.was_modified) {
        std::set<std::string_view> rules;
        for (const auto& a : out.actions) {
            rules.insert(a.rule);
        }
        SecurityEvent event{};
        event.event = audit_event::kQuerySanitized;
        event.with("action_count", std::to_string(out.actions.size()))
             .with("rules", fmt::format("{}", fmt::join(rules, ",")));
        audit_->emit(event);
    }
    if (audit_ && !out.warnings.empty()) {
        ThreatLevel max_level = ThreatLevel::kNone;
        std::vector<std::string_view> rules;
        for (const auto& w : out.warnings) {
            max_level = std::max(max_level, w.severity);
            rules.push_back(w.rule);
        }
        SecurityEvent event{};
        event.event = audit_event::kQueryWarning;
        event.level = max_level >= ThreatLevel::kHigh ? LogLevel::kWarn : LogLevel::kInfo;
        event.with("warning_count", std::to_string(out.warnings.size()))
             .with("max_severity", std::string(to_string(max_level)))
             .with("rules", fmt::format("{}", fmt::join(rules, ",")))
             .with("blocked", out.blocked ? "true" : "false");
        audit_->emit(event);
    }
    return out;
}

bool QuerySanitizer::is_valid_parameter_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && name.front() != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

std::string QuerySanitizer::render_parameter(const ParameterValue& value) {
    struct Renderer {
        std::string operator()(std::nullptr_t) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return fmt::format("{}", d); }
        std::string operator()(const std::string& s) const { return quote_display(s); }
        std::string operator()(const std::vector<std::string>& list) const {
            std::vector<std::string> quoted;
            quoted.reserve(list.size());
            for (const auto& s : list) {
                quoted.push_back(quote_display(s));
            }
            return fmt::format("[{}]", fmt::join(quoted, ", "));
        }
    };
    return std::visit(Renderer{}, value);
}

std::expected<ParameterizedQuery, ParameterError>
QuerySanitizer::create_parameterized(std::string_view template_text, ParameterMap parameters) const {
    if (trim(template_text).empty()) {
        return std::unexpected(ParameterError{ParameterErrorCode::kEmptyTemplate, "", "template is empty"});
    }
    for (const auto& [name, value] : parameters) {
        if (!is_valid_parameter_name(name)) {
            return std::unexpected(ParameterError{
                ParameterErrorCode::kInvalidName, name,
                fmt::format("invalid parameter name '{}'", name)});
        }
    }

    ParameterizedQuery result{};
    result.template_text = std::string(template_text);

    const auto tokens = tokenize_query(template_text);
    for (const auto& token : tokens) {
        if (token.kind != TokenKind::kParameter) {
            continue;
        }
        const std::string name(token.text.substr(1));
        if (std::find(result.placeholders.begin(), result.placeholders.end(), name) ==
            result.placeholders.end()) {
            result.placeholders.push_back(name);
        }
    }
    for (const auto& name : result.placeholders) {
        if (parameters.find(name) == parameters.end()) {
            return std::unexpected(ParameterError{
                ParameterErrorCode::kMissingParameter, name,
                fmt::format("no value bound for placeholder '${}'", name)});
        }
    }
    for (const auto& [name, value] : parameters) {
        if (std::find(result.placeholders.begin(), result.placeholders.end(), name) ==
            result.placeholders.end()) {
            result.warnings.push_back(SecurityWarning{
                "unused_parameter", fmt::format("parameter '{}' is not referenced by the template", name),
                ThreatLevel::kLow, 0});
        }
    }

    // 표시 전용 문자열. 실행 경로로 보내지 않는다.
    std::string display;
    display.reserve(template_text.size());
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::kParameter) {
            display += render_parameter(parameters.at(std::string(token.text.substr(1))));
        } else {
            display += token.text;
        }
    }
    result.compiled_for_display = std::move(display);
    result.parameters           = std::move(parameters);
    return result;
}
