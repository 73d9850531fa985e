// ---------------------------------------------------------------------------
// test_content_scanner.cpp
//
// ContentScanner 및 탐지 엔진 단위 테스트
// ---------------------------------------------------------------------------

#include "scanner/content_scanner.hpp"
#include "scanner/pattern_rule.hpp"
#include "scanner/sensitive_data_detector.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

bool has_rule(const ScanResult& result, const std::string& rule) {
    return std::any_of(result.threats.begin(), result.threats.end(),
                       [&](const DetectedThreat& t) { return t.matched_pattern == rule; });
}

class ContentScannerTest : public ::testing::Test {
protected:
    ContentScannerTest()
        : audit_(std::make_shared<RecordingAuditSink>())
        , scanner_(ScanOptions{}, audit_)
    {}

    std::shared_ptr<RecordingAuditSink> audit_;
    ContentScanner                      scanner_;
};

}  // namespace

// ---------------------------------------------------------------------------
// Test: 정상 입력
// ---------------------------------------------------------------------------
TEST_F(ContentScannerTest, CleanContentAllowed) {
    const auto r = scanner_.scan("The quarterly report is attached for review.");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_clean());
    EXPECT_EQ(r->threat_level, ThreatLevel::kNone);
    EXPECT_EQ(r->recommended_action, ScanAction::kAllow);
    EXPECT_EQ(r->engines_run,
              (std::vector<std::string>{"injection", "malware", "phishing", "sensitive_data"}));
    EXPECT_EQ(audit_->events().size(), 0U);
}

// ---------------------------------------------------------------------------
// Test: 주입 공격
// ---------------------------------------------------------------------------
TEST_F(ContentScannerTest, UnionSelectBlocked) {
    const auto r = scanner_.scan("1 UNION SELECT username FROM users");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "sql_union_select"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kHigh);
    EXPECT_EQ(r->recommended_action, ScanAction::kBlock);

    ASSERT_EQ(audit_->count(audit_event::kThreatDetected), 1U);
    const auto ev = audit_->last(audit_event::kThreatDetected);
    EXPECT_EQ(field_of(ev, "threat_level"), "high");
    EXPECT_EQ(field_of(ev, "action"), "block");
    EXPECT_EQ(field_of(ev, "threat_types"), "sql_injection");
}

TEST_F(ContentScannerTest, StackedDropIsCritical) {
    const auto r = scanner_.scan("'; DROP TABLE users; --");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "sql_stacked_query"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kCritical);
    EXPECT_EQ(r->recommended_action, ScanAction::kBlock);
}

TEST_F(ContentScannerTest, ScriptTagIsRemediable) {
    const auto r = scanner_.scan("hello <script>alert(1)</script>");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "xss_script_tag"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kHigh);
    EXPECT_EQ(r->recommended_action, ScanAction::kSanitize);

    const auto& first = r->threats.front();
    EXPECT_EQ(first.location.offset, 6U);
    EXPECT_EQ(first.location.line, 1U);
    EXPECT_EQ(first.engine, "injection");
}

TEST_F(ContentScannerTest, CommandSubstitutionDetected) {
    const auto r = scanner_.scan("name=$(whoami)");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "command_substitution"));
    EXPECT_EQ(r->recommended_action, ScanAction::kBlock);
}

// ---------------------------------------------------------------------------
// Test: 악성 코드 / 난독화
// ---------------------------------------------------------------------------
TEST_F(ContentScannerTest, DocumentWriteRequiresReview) {
    const auto r = scanner_.scan("document.write(banner)");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "document_write"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kMedium);
    EXPECT_EQ(r->recommended_action, ScanAction::kRequireReview);
}

TEST_F(ContentScannerTest, DecodedPayloadExecutionBlocked) {
    const auto r = scanner_.scan("eval(atob(payload))");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "dynamic_eval"));
    EXPECT_TRUE(has_rule(*r, "base64_decode_call"));
    EXPECT_EQ(r->recommended_action, ScanAction::kBlock);
}

// ---------------------------------------------------------------------------
// Test: 피싱
// ---------------------------------------------------------------------------
TEST_F(ContentScannerTest, UrgencyPlusLinkIsPhishingCampaign) {
    const auto r = scanner_.scan(
        "Urgent action required: verify your account at https://login.example.tk today");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "urgency_action_required"));
    EXPECT_TRUE(has_rule(*r, "urgency_verify_account"));
    EXPECT_TRUE(has_rule(*r, "phishing_campaign"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kHigh);
    EXPECT_EQ(r->recommended_action, ScanAction::kBlock);
}

TEST_F(ContentScannerTest, SingleUrgencyPhraseWithoutCampaign) {
    const auto r = scanner_.scan("Please verify your email to finish signing up.");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "urgency_verify_account"));
    EXPECT_FALSE(has_rule(*r, "phishing_campaign"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kMedium);
}

// ---------------------------------------------------------------------------
// Test: 민감 데이터
// ---------------------------------------------------------------------------
TEST_F(ContentScannerTest, LuhnValidCardSanitized) {
    const auto r = scanner_.scan("card: 4111 1111 1111 1111");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "payment_card_number"));
    EXPECT_EQ(r->recommended_action, ScanAction::kSanitize);
}

TEST_F(ContentScannerTest, LuhnInvalidNumberIgnored) {
    const auto r = scanner_.scan("order 4111 1111 1111 1112");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(has_rule(*r, "payment_card_number"));
}

TEST(SensitiveDataDetector, LuhnCheck) {
    EXPECT_TRUE(SensitiveDataDetector::luhn_valid("4111111111111111"));
    EXPECT_TRUE(SensitiveDataDetector::luhn_valid("5500-0000-0000-0004"));
    EXPECT_FALSE(SensitiveDataDetector::luhn_valid("4111111111111112"));
    EXPECT_FALSE(SensitiveDataDetector::luhn_valid("0000"));
}

TEST_F(ContentScannerTest, FindingsNeverCarryMatchedText) {
    const auto r = scanner_.scan("password=hunter2secret");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(has_rule(*r, "credential_assignment"));
    for (const auto& t : r->threats) {
        EXPECT_EQ(t.matched_pattern.find("hunter2"), std::string::npos);
        EXPECT_EQ(t.recommendation.find("hunter2"), std::string::npos);
        EXPECT_GE(t.confidence, 0.0);
        EXPECT_LE(t.confidence, 1.0);
    }
    for (const auto& ev : audit_->events()) {
        for (const auto& [k, v] : ev.fields) {
            EXPECT_EQ(v.find("hunter2"), std::string::npos) << k;
        }
    }
}

TEST_F(ContentScannerTest, LowSeverityAllowedWithWarningNoAudit) {
    const auto r = scanner_.scan("reach me at ada@example.com");
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(has_rule(*r, "email_address"));
    EXPECT_EQ(r->threat_level, ThreatLevel::kLow);
    EXPECT_EQ(r->recommended_action, ScanAction::kAllowWithWarning);
    EXPECT_EQ(audit_->count(audit_event::kThreatDetected), 0U);
}

// ---------------------------------------------------------------------------
// Test: 옵션
// ---------------------------------------------------------------------------
TEST_F(ContentScannerTest, ReportThresholdDropsLowerSeverities) {
    ScanOptions opts{};
    opts.report_threshold = ThreatLevel::kHigh;
    const auto r = scanner_.scan("reach me at ada@example.com", opts);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->threats.empty());
    EXPECT_EQ(r->recommended_action, ScanAction::kAllow);
}

TEST_F(ContentScannerTest, OnlyEnabledEnginesRun) {
    ScanOptions opts{};
    opts.enabled_engines = static_cast<std::uint8_t>(ScanEngine::kInjection);
    const auto r = scanner_.scan("reach me at ada@example.com", opts);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->engines_run, (std::vector<std::string>{"injection"}));
    EXPECT_TRUE(r->threats.empty());
}

TEST_F(ContentScannerTest, OversizeRejectedWithoutScanning) {
    ScanOptions opts{};
    opts.max_content_size = 8;
    const auto r = scanner_.scan("<script>alert(1)</script>", opts);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ScanErrorCode::kContentTooLarge);
    EXPECT_EQ(r.error().limit, 8U);
    EXPECT_EQ(r.error().content_size, 25U);
    EXPECT_EQ(audit_->count(audit_event::kContentOversize), 1U);
    EXPECT_EQ(audit_->count(audit_event::kThreatDetected), 0U);
}

TEST_F(ContentScannerTest, ExhaustedBudgetEscalatesToReview) {
    ScanOptions opts{};
    opts.timeout = 0ms;
    const auto r = scanner_.scan("plain text", opts);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->timed_out);
    EXPECT_FALSE(r->is_clean());
    EXPECT_GE(r->recommended_action, ScanAction::kRequireReview);
}

TEST_F(ContentScannerTest, LargeBodyStopsNearBudget) {
    ScanOptions opts{};
    opts.timeout          = 20ms;
    opts.max_content_size = 4 * 1024 * 1024;

    std::string body;
    body.reserve(2 * 1024 * 1024);
    while (body.size() < 2 * 1024 * 1024) {
        body += "/*";
    }

    const auto started = std::chrono::steady_clock::now();
    const auto r       = scanner_.scan(body, opts);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->timed_out);
    EXPECT_GE(r->recommended_action, ScanAction::kRequireReview);
    EXPECT_LT(elapsed, opts.timeout + 200ms);
}

TEST_F(ContentScannerTest, MatchAcrossWindowBoundaryReportedOnce) {
    const std::string straddling = std::string(kScanWindow - 5, ' ') + "1 UNION SELECT name";
    const auto r = scanner_.scan(straddling);
    ASSERT_TRUE(r.has_value());
    const auto hits = std::count_if(r->threats.begin(), r->threats.end(), [](const DetectedThreat& t) {
        return t.matched_pattern == "sql_union_select";
    });
    ASSERT_EQ(hits, 1);
    const auto it = std::find_if(r->threats.begin(), r->threats.end(), [](const DetectedThreat& t) {
        return t.matched_pattern == "sql_union_select";
    });
    EXPECT_EQ(it->location.offset, kScanWindow - 3);

    const std::string second = std::string(kScanWindow + 100, ' ') + "x UNION SELECT y";
    const auto r2 = scanner_.scan(second);
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(std::count_if(r2->threats.begin(), r2->threats.end(), [](const DetectedThreat& t) {
                  return t.matched_pattern == "sql_union_select";
              }),
              1);
}

TEST_F(ContentScannerTest, ThreatsOrderedByOffset) {
    const auto r = scanner_.scan("ada@example.com then 1 UNION SELECT x then <script>");
    ASSERT_TRUE(r.has_value());
    ASSERT_GE(r->threats.size(), 3U);
    EXPECT_TRUE(std::is_sorted(r->threats.begin(), r->threats.end(),
                               [](const DetectedThreat& a, const DetectedThreat& b) {
                                   return a.location.offset < b.location.offset;
                               }));
}

TEST(ContentScanner, ActionTable) {
    EXPECT_EQ(ContentScanner::action_for(ThreatLevel::kNone, false), ScanAction::kAllow);
    EXPECT_EQ(ContentScanner::action_for(ThreatLevel::kLow, false), ScanAction::kAllowWithWarning);
    EXPECT_EQ(ContentScanner::action_for(ThreatLevel::kMedium, true), ScanAction::kRequireReview);
    EXPECT_EQ(ContentScanner::action_for(ThreatLevel::kHigh, true), ScanAction::kSanitize);
    EXPECT_EQ(ContentScanner::action_for(ThreatLevel::kCritical, false), ScanAction::kBlock);
}
