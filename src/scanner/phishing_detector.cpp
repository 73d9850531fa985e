// ---------------------------------------------------------------------------
// phishing_detector.cpp
// ---------------------------------------------------------------------------

#include "scanner/phishing_detector.hpp"

#include <algorithm>

#include "scanner/pattern_rule.hpp"

namespace {

constexpr const char* kLexiconRecommendation = "review message for social engineering";
constexpr const char* kLinkRecommendation    = "verify link destination before delivery";

const std::vector<CompiledRule>& lexicon_rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        {"urgency_verify_account", R"(\bverify\s+your\s+(account|identity|email)\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.60, false, kLexiconRecommendation},
        {"urgency_account_suspended",
         R"(\baccount\s+(has\s+been|will\s+be|is)\s+(suspended|locked|disabled|closed|terminated)\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.65, false, kLexiconRecommendation},
        {"urgency_action_required", R"(\b(urgent|immediate)\s+action\s+(is\s+)?required\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.60, false, kLexiconRecommendation},
        {"urgency_confirm_credentials",
         R"(\bconfirm\s+your\s+(password|credentials|login|banking\s+details|identity)\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.70, false, kLexiconRecommendation},
        {"urgency_click_now", R"(\bclick\s+(here|below|the\s+link)\s+(immediately|now|to\s+avoid)\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.60, false, kLexiconRecommendation},
        {"urgency_update_payment",
         R"(\bupdate\s+your\s+(payment|billing|card)\s+(information|details|method)\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.65, false, kLexiconRecommendation},
        {"urgency_unusual_activity", R"(\bunusual\s+(sign[- ]?in|login|account)\s+activity\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.55, false, kLexiconRecommendation},
        {"urgency_deadline", R"(\bwithin\s+(24|48|12)\s+hours\b)",
         ThreatType::kPhishing, ThreatLevel::kLow, 0.40, false, kLexiconRecommendation},
        {"urgency_password_expiry", R"(\byour\s+password\s+(has\s+)?expire[sd]?\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.60, false, kLexiconRecommendation},
    }, "phishing_detector");
    return compiled;
}

const std::vector<CompiledRule>& link_rules() {
    static const std::vector<CompiledRule> compiled = compile_rules({
        {"link_ip_literal_host", R"(\bhttps?://\d{1,3}(\.\d{1,3}){3}\b)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.70, false, kLinkRecommendation},
        {"link_userinfo_host", R"(\bhttps?://[^/\s@]{1,128}@)",
         ThreatType::kPhishing, ThreatLevel::kHigh, 0.80, false, kLinkRecommendation},
        {"link_punycode_host", R"(\bhttps?://[^/\s]{0,128}\bxn--)",
         ThreatType::kPhishing, ThreatLevel::kMedium, 0.60, false, kLinkRecommendation},
        {"link_abused_tld", R"(\bhttps?://[a-z0-9.-]{1,200}\.(zip|mov|tk|top|xyz|click|gq|cf|ml)\b)",
         ThreatType::kPhishing, ThreatLevel::kLow, 0.50, false, kLinkRecommendation},
        {"link_insecure_scheme", R"(\bhttp://)",
         ThreatType::kPhishing, ThreatLevel::kLow, 0.30, false, kLinkRecommendation},
    }, "phishing_detector");
    return compiled;
}

const std::regex& any_link() {
    static const std::regex re(R"(\bhttps?://)", std::regex_constants::icase | std::regex_constants::ECMAScript);
    return re;
}

}  // namespace

EngineOutcome PhishingDetector::scan(std::string_view content, const Deadline& deadline) const {
    EngineOutcome outcome{};
    outcome.timed_out = match_rules(content, lexicon_rules(), id(), deadline, outcome.threats);
    const auto urgency_hits = outcome.threats.size();
    if (!outcome.timed_out) {
        outcome.timed_out = match_rules(content, link_rules(), id(), deadline, outcome.threats);
    }

    // 결합 규칙: 서로 다른 긴급 문구 2종 이상 + 링크
    std::vector<std::string_view> distinct;
    for (std::size_t i = 0; i < urgency_hits; ++i) {
        const std::string_view name = outcome.threats[i].matched_pattern;
        if (std::find(distinct.begin(), distinct.end(), name) == distinct.end()) {
            distinct.push_back(name);
        }
    }
    std::cmatch link;
    if (!outcome.timed_out && distinct.size() >= 2 &&
        std::regex_search(content.data(), content.data() + content.size(), link, any_link())) {
        const auto offset = static_cast<std::size_t>(link.position(0));
        outcome.threats.push_back(DetectedThreat{
            ThreatType::kPhishing,
            Location{offset, static_cast<std::size_t>(link.length(0)), line_of(content, offset)},
            "phishing_campaign",
            0.85,
            ThreatLevel::kHigh,
            "block message: urgency language combined with an embedded link",
            std::string(id()),
            false,
        });
    }
    return outcome;
}
