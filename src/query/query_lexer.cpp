// ---------------------------------------------------------------------------
// query_lexer.cpp
// ---------------------------------------------------------------------------

#include "query/query_lexer.hpp"

#include <cctype>

namespace {

bool is_word_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "--" 가 관계 패턴의 일부인지
bool is_relationship_dash(std::string_view query, std::size_t pos) {
    const char after = (pos + 2 < query.size()) ? query[pos + 2] : '\0';
    if (after == '>' || after == '(' || after == '[') {
        return true;
    }
    std::size_t j = pos;
    while (j > 0 && is_space(query[j - 1])) {
        --j;
    }
    if (j == 0) {
        return false;
    }
    const char before = query[j - 1];
    return before == ')' || before == ']' || before == '<' || before == '-';
}

// 따옴표 위치에서 시작하는 리터럴의 끝. closed 에 닫힘 여부.
std::size_t scan_quoted(std::string_view query, std::size_t start, bool& closed) {
    const char        quote = query[start];
    const std::size_t len   = query.size();
    std::size_t       i     = start + 1;
    closed = false;
    while (i < len) {
        if (query[i] == '\\' && quote != '`') {
            i += 2;  // 이스케이프: 다음 문자 건너뜀
            continue;
        }
        if (query[i] == quote) {
            if (i + 1 < len && query[i + 1] == quote) {
                i += 2;  // '' 이스케이프
                continue;
            }
            closed = true;
            return i + 1;
        }
        ++i;
    }
    return len;
}

}  // namespace

std::vector<QueryToken> tokenize_query(std::string_view query, QuoteRecovery recovery) {
    std::vector<QueryToken> tokens;
    const std::size_t len = query.size();
    std::size_t i = 0;

    auto push = [&](TokenKind kind, std::size_t begin, std::size_t end, bool terminated) {
        tokens.push_back(QueryToken{kind, begin, end - begin, query.substr(begin, end - begin), terminated});
    };

    while (i < len) {
        const char c    = query[i];
        const char next = (i + 1 < len) ? query[i + 1] : '\0';
        const std::size_t start = i;

        if (is_space(c)) {
            while (i < len && is_space(query[i])) {
                ++i;
            }
            push(TokenKind::kWhitespace, start, i, true);
            continue;
        }

        // 문자열 / 인용 식별자
        if (c == '\'' || c == '"' || c == '`') {
            bool closed = false;
            const std::size_t end = scan_quoted(query, start, closed);
            if (!closed && recovery == QuoteRecovery::kTreatAsCode) {
                i = start + 1;
                push(TokenKind::kPunct, start, i, true);
                continue;
            }
            i = end;
            push(c == '`' ? TokenKind::kQuotedIdent : TokenKind::kString, start, i, closed);
            continue;
        }

        // 주석
        if ((c == '/' && next == '/') || (c == '-' && next == '-' && !is_relationship_dash(query, i))) {
            while (i < len && query[i] != '\n') {
                ++i;
            }
            push(TokenKind::kLineComment, start, i, true);
            continue;
        }
        if (c == '/' && next == '*') {
            bool closed = false;
            i += 2;
            while (i + 1 < len) {
                if (query[i] == '*' && query[i + 1] == '/') {
                    i += 2;
                    closed = true;
                    break;
                }
                ++i;
            }
            if (!closed) {
                i = len;
            }
            push(TokenKind::kBlockComment, start, i, closed);
            continue;
        }

        // 파라미터
        if (c == '$' && is_word_start(next)) {
            i += 2;
            while (i < len && is_word_char(query[i])) {
                ++i;
            }
            push(TokenKind::kParameter, start, i, true);
            continue;
        }

        if (is_word_char(c)) {
            while (i < len && is_word_char(query[i])) {
                ++i;
            }
            push(TokenKind::kWord, start, i, true);
            continue;
        }

        ++i;
        push(TokenKind::kPunct, start, i, true);
    }
    return tokens;
}

std::vector<LiteralSpan> literal_spans(std::string_view query, QuoteRecovery recovery) {
    std::vector<LiteralSpan> spans;
    for (const auto& token : tokenize_query(query, recovery)) {
        if (token.kind == TokenKind::kString) {
            spans.push_back(LiteralSpan{token.offset, token.offset + token.length, token.terminated});
        }
    }
    return spans;
}
