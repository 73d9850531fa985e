// ---------------------------------------------------------------------------
// pattern_rule.cpp
// ---------------------------------------------------------------------------

#include "scanner/pattern_rule.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

std::vector<CompiledRule> compile_rules(const std::vector<RuleSpec>& specs,
                                        std::string_view engine_id) {
    std::vector<CompiledRule> rules;
    rules.reserve(specs.size());
    for (const auto& spec : specs) {
        try {
            auto re = std::make_shared<const std::regex>(
                spec.pattern, std::regex_constants::icase | std::regex_constants::ECMAScript);
            rules.push_back(CompiledRule{spec, std::move(re)});
        } catch (const std::regex_error& e) {
            // 건너뛴 규칙만큼 미탐이 늘어난다
            spdlog::warn("{}: invalid rule '{}' skipped: {}", engine_id, spec.name, e.what());
        }
    }
    if (rules.empty()) {
        spdlog::error("{}: no valid rules compiled, engine will report nothing", engine_id);
    }
    return rules;
}

std::size_t line_of(std::string_view content, std::size_t offset) noexcept {
    const auto end = std::min(offset, content.size());
    return 1 + static_cast<std::size_t>(
                   std::count(content.begin(), content.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
}

bool match_rules(std::string_view                 content,
                 const std::vector<CompiledRule>& rules,
                 std::string_view                 engine_id,
                 const Deadline&                  deadline,
                 std::vector<DetectedThreat>&     out,
                 const MatchFilter&               filter) {
    const auto end = std::cregex_iterator();
    for (const auto& rule : rules) {
        if (deadline.expired()) {
            spdlog::warn("{}: deadline exceeded before rule '{}'", engine_id, rule.spec.name);
            return true;
        }
        std::size_t reported   = 0;
        std::size_t next_free  = 0;  // 직전 보고 매치의 끝 (겹침 중복 방지)
        for (std::size_t window = 0; window < content.size() && reported < kMaxMatchesPerRule;
             window += kScanWindow) {
            if (deadline.expired()) {
                spdlog::warn("{}: deadline exceeded while matching rule '{}'", engine_id, rule.spec.name);
                return true;
            }
            const auto limit = std::min(content.size(), window + kScanWindow + kScanOverlap);
            auto flags = std::regex_constants::match_default;
            if (window > 0) {
                flags |= std::regex_constants::match_prev_avail;
            }
            if (limit < content.size()) {
                flags |= std::regex_constants::match_not_eol | std::regex_constants::match_not_eow;
            }

            auto it = std::cregex_iterator(content.data() + window, content.data() + limit,
                                           *rule.regex, flags);
            for (; it != end && reported < kMaxMatchesPerRule; ++it) {
                if (deadline.expired()) {
                    spdlog::warn("{}: deadline exceeded while matching rule '{}'", engine_id,
                                 rule.spec.name);
                    return true;
                }
                const auto& m = *it;
                const auto offset = window + static_cast<std::size_t>(m.position(0));
                const auto length = static_cast<std::size_t>(m.length(0));
                if (offset >= window + kScanWindow) {
                    break;  // 다음 창에서 처리
                }
                if (offset < next_free) {
                    continue;
                }
                if (filter && !filter(content.substr(offset, length))) {
                    continue;
                }
                out.push_back(DetectedThreat{
                    rule.spec.type,
                    Location{offset, length, line_of(content, offset)},
                    rule.spec.name,
                    rule.spec.confidence,
                    rule.spec.severity,
                    rule.spec.recommendation,
                    std::string(engine_id),
                    rule.spec.remediable,
                });
                ++reported;
                next_free = offset + std::max<std::size_t>(length, 1);
            }
        }
    }
    return false;
}
