// ---------------------------------------------------------------------------
// injection_detector.cpp
//
// [규칙 표]
//  이름                 | 유형        | severity | confidence | 제거 가능
//  sql_union_select     | sql         | high     | 0.90       | no
//  sql_tautology        | sql         | high     | 0.85       | no
//  sql_stacked_query    | sql         | critical | 0.90       | no
//  sql_time_based       | sql         | high     | 0.80       | no
//  xss_script_tag       | xss         | high     | 0.95       | yes
//  xss_event_handler    | xss         | medium   | 0.70       | yes
//  xss_javascript_uri   | xss         | high     | 0.90       | yes
//  ldap_filter_injection| ldap        | medium   | 0.60       | no
//  command_separator    | command     | high     | 0.80       | no
//  command_substitution | command     | high     | 0.75       | no
//  comment_line_tail    | comment     | low      | 0.40       | yes
//  comment_block        | comment     | low      | 0.50       | yes
// ---------------------------------------------------------------------------

#include "scanner/injection_detector.hpp"

#include "scanner/pattern_rule.hpp"

namespace {

const std::vector<CompiledRule>& rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        {"sql_union_select", R"(\bunion\b(\s+all)?\s+select\b)",
         ThreatType::kSqlInjection, ThreatLevel::kHigh, 0.90, false,
         "reject input or bind it as a query parameter"},
        {"sql_tautology", R"(['"]\s*\bor\b\s+(['"]?\w+['"]?)\s*=\s*(['"]?\w+['"]?))",
         ThreatType::kSqlInjection, ThreatLevel::kHigh, 0.85, false,
         "reject input or bind it as a query parameter"},
        {"sql_stacked_query", R"(;\s*\b(drop|delete|truncate|alter|insert|update|create|exec)\b)",
         ThreatType::kSqlInjection, ThreatLevel::kCritical, 0.90, false,
         "reject input"},
        {"sql_time_based", R"(\b(sleep|benchmark|pg_sleep|waitfor\s+delay)\s*[\('])",
         ThreatType::kSqlInjection, ThreatLevel::kHigh, 0.80, false,
         "reject input"},
        {"xss_script_tag", R"(<\s*/?\s*script\b)",
         ThreatType::kXss, ThreatLevel::kHigh, 0.95, true,
         "strip script elements with the HTML sanitizer"},
        {"xss_event_handler", R"(<[^>]{0,512}\bon[a-z]{3,}\s*=)",
         ThreatType::kXss, ThreatLevel::kMedium, 0.70, true,
         "strip event handler attributes with the HTML sanitizer"},
        {"xss_javascript_uri", R"(\b(javascript|vbscript)\s*:)",
         ThreatType::kXss, ThreatLevel::kHigh, 0.90, true,
         "remove script URLs"},
        {"ldap_filter_injection", R"(\)\s*\(\s*[|&!]|\*\s*\)\s*\(|\(\s*[|&]\s*\(\s*\w+\s*=\s*\*)",
         ThreatType::kLdapInjection, ThreatLevel::kMedium, 0.60, false,
         "escape LDAP filter metacharacters"},
        {"command_separator",
         R"((;|\|\||&&|\|)\s*\b(rm|cat|curl|wget|nc|ncat|bash|sh|zsh|powershell|cmd|chmod|chown|whoami|id|uname)\b)",
         ThreatType::kCommandInjection, ThreatLevel::kHigh, 0.80, false,
         "reject input"},
        {"command_substitution", R"(\$\([^)]{1,200}\)|`[^`]{1,200}`)",
         ThreatType::kCommandInjection, ThreatLevel::kHigh, 0.75, false,
         "reject input"},
        {"comment_line_tail", R"(--[ \t]*(\r?\n|$))",
         ThreatType::kQueryComment, ThreatLevel::kLow, 0.40, true,
         "strip trailing comment markers"},
        {"comment_block", R"(/\*[\s\S]{0,512}?\*/)",
         ThreatType::kQueryComment, ThreatLevel::kLow, 0.50, true,
         "strip inline comments"},
    }, "injection_detector");
    return compiled;
}

}  // namespace

EngineOutcome InjectionDetector::scan(std::string_view content, const Deadline& deadline) const {
    EngineOutcome outcome{};
    outcome.timed_out = match_rules(content, rules(), id(), deadline, outcome.threats);
    return outcome;
}
