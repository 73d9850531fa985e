// ---------------------------------------------------------------------------
// malware_detector.cpp
// ---------------------------------------------------------------------------

#include "scanner/malware_detector.hpp"

#include "scanner/pattern_rule.hpp"

namespace {

const std::vector<CompiledRule>& rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        // 동적 실행
        {"dynamic_eval", R"(\beval\s*\()",
         ThreatType::kMalware, ThreatLevel::kHigh, 0.80, false, "block dynamic code execution"},
        {"dynamic_function_ctor", R"(\bnew\s+Function\s*\()",
         ThreatType::kMalware, ThreatLevel::kHigh, 0.85, false, "block dynamic code execution"},
        {"dynamic_exec", R"(\b(exec|execfile|system|popen|shell_exec|passthru)\s*\()",
         ThreatType::kMalware, ThreatLevel::kHigh, 0.75, false, "block dynamic code execution"},
        {"runtime_exec", R"(Runtime\s*\.\s*getRuntime\s*\(\s*\)\s*\.\s*exec)",
         ThreatType::kMalware, ThreatLevel::kCritical, 0.90, false, "block dynamic code execution"},
        {"string_timer_exec", R"(\bset(Timeout|Interval)\s*\(\s*['"])",
         ThreatType::kMalware, ThreatLevel::kMedium, 0.70, false, "block dynamic code execution"},
        {"document_write", R"(\bdocument\s*\.\s*write(ln)?\s*\()",
         ThreatType::kMalware, ThreatLevel::kMedium, 0.65, false, "review embedded script"},
        {"powershell_encoded", R"(\bpowershell(\.exe)?\b[^\n]{0,80}\s-e(nc(odedcommand)?)?\s)",
         ThreatType::kMalware, ThreatLevel::kCritical, 0.90, false, "block encoded shell payload"},
        // 인코딩 휴리스틱
        {"char_code_assembly", R"(\bfromCharCode\s*\()",
         ThreatType::kObfuscation, ThreatLevel::kMedium, 0.70, false, "review obfuscated content"},
        {"hex_escape_run", R"((\\x[0-9a-f]{2}){4})",
         ThreatType::kObfuscation, ThreatLevel::kMedium, 0.70, false, "review obfuscated content"},
        {"unicode_escape_run", R"((\\u[0-9a-f]{4}){4})",
         ThreatType::kObfuscation, ThreatLevel::kMedium, 0.65, false, "review obfuscated content"},
        {"base64_decode_call", R"(\b(atob|base64_decode|b64decode|FromBase64String)\s*\()",
         ThreatType::kObfuscation, ThreatLevel::kHigh, 0.75, false, "block decoded payload execution"},
        {"base64_data_uri", R"(\bdata:[a-z0-9.+-]+/[a-z0-9.+-]+;base64,)",
         ThreatType::kObfuscation, ThreatLevel::kMedium, 0.60, false, "review embedded payload"},
        {"base64_blob", R"([A-Za-z0-9+/]{100})",
         ThreatType::kObfuscation, ThreatLevel::kLow, 0.40, false, "review embedded payload"},
    }, "malware_detector");
    return compiled;
}

}  // namespace

EngineOutcome MalwareDetector::scan(std::string_view content, const Deadline& deadline) const {
    EngineOutcome outcome{};
    outcome.timed_out = match_rules(content, rules(), id(), deadline, outcome.threats);
    return outcome;
}
