#pragma once

// ---------------------------------------------------------------------------
// string_util.hpp
//
// ASCII 대소문자 변환/비교, 공백 trim 등 여러 레이어가 공유하는 문자열 헬퍼.
// 헤더 전용. 로케일 독립 (std::toupper 에 unsigned char 로 전달).
//
// [한계]
// - ASCII 범위만 변환한다. 유니코드 case fold 는 normalizer 의
//   Boost.Locale 경로를 사용할 것.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

[[nodiscard]] inline std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

[[nodiscard]] inline std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

[[nodiscard]] inline bool istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}
