#pragma once

// ---------------------------------------------------------------------------
// query_lexer.hpp
//
// Cypher 계열 쿼리 텍스트를 토큰 열로 나누는 상태 머신.
// 정제 규칙의 리터럴 판정, 플레이스홀더 추출, 구조 검증이 공유한다.
//
// [인식 규칙]
// - 문자열: '...', "..." (백슬래시 이스케이프, 같은 따옴표 두 번 연속 허용)
//   식별자 인용: `...`
// - 주석: // ..., -- ... (줄 끝까지), /* ... */ (중첩 미지원)
//   단, 관계 패턴 (a)--(b), (a)-->(b), (a)<--(b) 의 "--" 는 주석이 아니다.
//   직전 비공백 문자가 ) ] < - 이거나 다음 문자가 > ( [ 이면 구두점으로 본다.
// - 파라미터: $name ([A-Za-z_][A-Za-z0-9_]*)
// - 단어: [A-Za-z_][A-Za-z0-9_]*, 숫자는 단어와 별도로 구분하지 않는다
//
// [한계]
// - 닫히지 않은 주석은 입력 끝까지 이어진 토큰 (terminated == false).
// - 닫히지 않은 문자열은 QuoteRecovery 에 따라 처리한다.
//   kExtendToEnd : 입력 끝까지 이어진 문자열 토큰 (terminated == false)
//   kTreatAsCode : 여는 따옴표만 구두점으로 내보내고 그 뒤를 코드로 계속 분석
//                  (따옴표 탈출 뒤에 붙은 주석/키워드를 찾기 위한 모드)
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

enum class TokenKind : std::uint8_t {
    kWord         = 0,
    kParameter    = 1,
    kString       = 2,
    kQuotedIdent  = 3,
    kLineComment  = 4,
    kBlockComment = 5,
    kPunct        = 6,
    kWhitespace   = 7,
};

struct QueryToken {
    TokenKind        kind{TokenKind::kPunct};
    std::size_t      offset{0};
    std::size_t      length{0};
    std::string_view text{};
    bool             terminated{true};
};

enum class QuoteRecovery : std::uint8_t {
    kExtendToEnd = 0,
    kTreatAsCode = 1,
};

[[nodiscard]] std::vector<QueryToken> tokenize_query(std::string_view query,
                                                     QuoteRecovery recovery = QuoteRecovery::kExtendToEnd);

// 리터럴(문자열) 구간. 반열린 구간 [begin, end)
struct LiteralSpan {
    std::size_t begin{0};
    std::size_t end{0};
    bool        terminated{true};
};

[[nodiscard]] std::vector<LiteralSpan> literal_spans(std::string_view query,
                                                     QuoteRecovery recovery = QuoteRecovery::kExtendToEnd);
