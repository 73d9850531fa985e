// ---------------------------------------------------------------------------
// query_analyzer.cpp
// ---------------------------------------------------------------------------

#include "query/query_analyzer.hpp"

#include <algorithm>
#include <array>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"
#include "query/query_lexer.hpp"

namespace {

struct ClauseWeight {
    std::string_view keyword;
    double           weight;
};

// 절별 비용 가중치
constexpr std::array<ClauseWeight, 17> kClauseWeights{{
    {"MATCH", 10.0},
    {"OPTIONAL", 5.0},
    {"WHERE", 2.0},
    {"WITH", 3.0},
    {"RETURN", 1.0},
    {"ORDER", 5.0},
    {"UNWIND", 8.0},
    {"MERGE", 20.0},
    {"CREATE", 10.0},
    {"DELETE", 10.0},
    {"SET", 3.0},
    {"CALL", 25.0},
    {"JOIN", 20.0},
    {"UNION", 15.0},
    {"FOREACH", 15.0},
    {"LOAD", 30.0},
    {"SELECT", 5.0},
}};

constexpr double kVariableLengthCost = 50.0;
constexpr double kDepthCost          = 5.0;

char closing_for(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

}  // namespace

QueryValidationResult QueryAnalyzer::validate_structure(std::string_view query) const {
    QueryValidationResult result{};

    if (trim(query).empty()) {
        result.errors.push_back(QuerySyntaxError{QueryErrorCode::kEmptyQuery, 0, "query is empty"});
        result.is_valid = false;
        return result;
    }
    if (query.size() > limits_.max_length) {
        result.errors.push_back(QuerySyntaxError{
            QueryErrorCode::kTooLong, limits_.max_length,
            fmt::format("query length {} exceeds limit {}", query.size(), limits_.max_length)});
        result.is_valid = false;
        return result;
    }

    std::vector<std::pair<char, std::size_t>> open;
    int         depth          = 0;
    int         match_clauses  = 0;
    int         join_keywords  = 0;
    int         variable_paths = 0;
    double      clause_cost    = 0.0;
    auto&       cx             = result.complexity;

    for (const auto& token : tokenize_query(query)) {
        switch (token.kind) {
            case TokenKind::kString:
            case TokenKind::kQuotedIdent:
                if (!token.terminated) {
                    result.errors.push_back(QuerySyntaxError{
                        QueryErrorCode::kUnterminatedString, token.offset, "unterminated string literal"});
                }
                break;
            case TokenKind::kBlockComment:
                if (!token.terminated) {
                    result.errors.push_back(QuerySyntaxError{
                        QueryErrorCode::kUnterminatedComment, token.offset, "unterminated block comment"});
                }
                break;
            case TokenKind::kWord:
                for (const auto& cw : kClauseWeights) {
                    if (iequals(token.text, cw.keyword)) {
                        clause_cost += cw.weight;
                        ++cx.clause_count;
                        if (cw.keyword == "MATCH") {
                            ++match_clauses;
                        } else if (cw.keyword == "JOIN") {
                            ++join_keywords;
                        }
                        break;
                    }
                }
                break;
            case TokenKind::kPunct: {
                const char c = token.text.front();
                if (c == '(' || c == '[' || c == '{') {
                    open.emplace_back(c, token.offset);
                    ++depth;
                    cx.nesting_depth = std::max(cx.nesting_depth, depth);
                } else if (c == ')' || c == ']' || c == '}') {
                    if (open.empty() || closing_for(open.back().first) != c) {
                        result.errors.push_back(QuerySyntaxError{
                            QueryErrorCode::kUnbalancedDelimiter, token.offset,
                            fmt::format("unexpected '{}'", c)});
                    } else {
                        open.pop_back();
                        --depth;
                    }
                } else if (c == '*' && !open.empty() && open.back().first == '[') {
                    ++variable_paths;
                }
                break;
            }
            case TokenKind::kParameter:
            case TokenKind::kLineComment:
            case TokenKind::kWhitespace:
                break;
        }
    }

    for (const auto& [c, pos] : open) {
        result.errors.push_back(QuerySyntaxError{
            QueryErrorCode::kUnbalancedDelimiter, pos, fmt::format("unclosed '{}'", c)});
    }

    cx.join_count     = join_keywords + std::max(0, match_clauses - 1);
    cx.estimated_cost = clause_cost + kVariableLengthCost * variable_paths + kDepthCost * cx.nesting_depth;
    cx.exceeds_limits = cx.nesting_depth > limits_.max_nesting_depth ||
                        cx.join_count > limits_.max_joins ||
                        cx.estimated_cost > limits_.max_cost;
    result.is_valid = result.errors.empty();

    if (cx.exceeds_limits) {
        spdlog::info("query_analyzer: query exceeds limits (depth={}, joins={}, cost={:.1f})",
                     cx.nesting_depth, cx.join_count, cx.estimated_cost);
    }
    return result;
}
