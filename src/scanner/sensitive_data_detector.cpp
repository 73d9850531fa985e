// ---------------------------------------------------------------------------
// sensitive_data_detector.cpp
// ---------------------------------------------------------------------------

#include "scanner/sensitive_data_detector.hpp"

#include "scanner/pattern_rule.hpp"

namespace {

constexpr const char* kMaskRecommendation = "mask or remove the sensitive value";

const std::vector<CompiledRule>& card_rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        {"payment_card_number", R"(\b\d(?:[ -]?\d){12,18}\b)",
         ThreatType::kSensitiveData, ThreatLevel::kHigh, 0.90, true, kMaskRecommendation},
    }, "sensitive_data_detector");
    return compiled;
}

const std::vector<CompiledRule>& ssn_rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        {"national_id_us_ssn", R"(\b(?!000|666|9\d\d)\d{3}-(?!00)\d{2}-(?!0000)\d{4}\b)",
         ThreatType::kSensitiveData, ThreatLevel::kHigh, 0.80, true, kMaskRecommendation},
    }, "sensitive_data_detector");
    return compiled;
}

const std::vector<CompiledRule>& other_rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        {"email_address", R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24}\b)",
         ThreatType::kSensitiveData, ThreatLevel::kLow, 0.90, true, kMaskRecommendation},
        {"credential_assignment",
         R"(\b(password|passwd|pwd|secret|api[_-]?key|access[_-]?token|auth[_-]?token|client[_-]?secret|private[_-]?key)\b\s*[:=]\s*['"]?[^\s'",;]{3,})",
         ThreatType::kSensitiveData, ThreatLevel::kHigh, 0.85, true, kMaskRecommendation},
        {"connection_string_credentials",
         R"(\b[a-z][a-z0-9+.-]{1,20}://[^:/\s@]{1,64}:[^@/\s]{1,128}@)",
         ThreatType::kSensitiveData, ThreatLevel::kCritical, 0.90, true, kMaskRecommendation},
        {"connection_string_keyvalue",
         R"(\b(server|data\s+source|host)\s*=[^;\n]{1,200};[^\n]{0,400}\b(password|pwd)\s*=)",
         ThreatType::kSensitiveData, ThreatLevel::kCritical, 0.85, true, kMaskRecommendation},
    }, "sensitive_data_detector");
    return compiled;
}

}  // namespace

bool SensitiveDataDetector::luhn_valid(std::string_view digits) noexcept {
    int sum = 0;
    int count = 0;
    bool double_it = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (*it < '0' || *it > '9') {
            continue;
        }
        int d = *it - '0';
        if (double_it) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        double_it = !double_it;
        ++count;
    }
    return count >= 13 && count <= 19 && sum % 10 == 0;
}

EngineOutcome SensitiveDataDetector::scan(std::string_view content, const Deadline& deadline) const {
    EngineOutcome outcome{};
    // Luhn 을 통과하지 못한 숫자열(주문 번호, 전화번호 등)은 보고하지 않는다
    outcome.timed_out = match_rules(content, card_rules(), id(), deadline, outcome.threats,
                                    [](std::string_view m) { return luhn_valid(m); });
    if (!outcome.timed_out) {
        outcome.timed_out = match_rules(content, ssn_rules(), id(), deadline, outcome.threats);
    }
    if (!outcome.timed_out) {
        outcome.timed_out = match_rules(content, other_rules(), id(), deadline, outcome.threats);
    }
    return outcome;
}
