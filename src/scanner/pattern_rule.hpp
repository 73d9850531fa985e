#pragma once

// ---------------------------------------------------------------------------
// pattern_rule.hpp
//
// 정규식 규칙 테이블과 마감 시간 인지 매칭 루프.
//
// [CompiledRule]
// - 규칙 테이블은 엔진별 static 지역 변수로 프로세스당 한 번만 컴파일된다.
// - 잘못된 패턴은 컴파일 단계에서 경고 후 건너뛴다 (나머지 규칙은 유지).
//
// [매칭 루프]
// - 입력을 kScanWindow 크기 창으로 나눠 창마다 따로 검색한다. 창 끝에는
//   kScanOverlap 만큼 겹침을 두어 경계에 걸친 매치를 잡는다. 매치는 시작 위치가
//   속한 창에서만 보고한다. 규칙 패턴의 매치 길이는 겹침 이하여야 한다.
// - 규칙마다, 창마다, 매치마다(필터에 걸러진 매치 포함) Deadline 을 확인한다.
//   만료되면 그때까지 찾은 결과를 유지하고 timed_out = true 로 반환한다.
//   정규식 호출 하나의 비용은 창 크기로 묶인다.
// - 규칙당 보고 매치 수는 kMaxMatchesPerRule 로 묶는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "scanner/threat_types.hpp"

struct RuleSpec {
    const char* name;
    const char* pattern;
    ThreatType  type;
    ThreatLevel severity;
    double      confidence;
    bool        remediable;
    const char* recommendation;
};

struct CompiledRule {
    RuleSpec                          spec;
    std::shared_ptr<const std::regex> regex;
};

// 매치 하나를 받아 보고 여부를 결정한다 (예: Luhn 검증). 기본은 항상 보고.
using MatchFilter = std::function<bool(std::string_view matched)>;

[[nodiscard]] std::vector<CompiledRule> compile_rules(const std::vector<RuleSpec>& specs,
                                                      std::string_view engine_id);

// 반환: 마감 시간 만료 여부 (true 이면 결과가 부분적)
bool match_rules(std::string_view                   content,
                 const std::vector<CompiledRule>&   rules,
                 std::string_view                   engine_id,
                 const Deadline&                    deadline,
                 std::vector<DetectedThreat>&       out,
                 const MatchFilter&                 filter = nullptr);

[[nodiscard]] std::size_t line_of(std::string_view content, std::size_t offset) noexcept;

inline constexpr std::size_t kMaxMatchesPerRule = 16;
inline constexpr std::size_t kScanWindow        = 16 * 1024;
inline constexpr std::size_t kScanOverlap       = 1024;
