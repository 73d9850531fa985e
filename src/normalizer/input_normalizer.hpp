#pragma once

// ---------------------------------------------------------------------------
// input_normalizer.hpp
//
// 외부 입력 문자열 정규화.
//
// [파이프라인 순서: 순서 변경 금지]
// 1. HTML 태그 제거 (strip_html)
// 2. 유니코드 NFC 합성 (unicode_normalize)
// 3. 제어 문자 제거 (strip_control)
// 4. 공백 축약 (collapse_whitespace)
// 5. 앞뒤 공백 제거 (trim)
// 6. case fold (case_fold)
// 7. 최대 길이 절단 (max_length, 코드포인트 기준)
//
// [불변식]
// - 모든 옵션 비활성 → 항등 함수.
// - 고정 옵션에 대해 멱등: normalize(normalize(x)) == normalize(x).
//   이를 위해 절단 후 trim 이 켜져 있으면 꼬리 공백을 다시 제거하고,
//   case fold 후 NFC 가 켜져 있으면 재합성한다.
//
// [한계]
// - NFC/case fold 는 Boost.Locale(ICU 백엔드)에 의존한다. 백엔드가 없거나
//   입력이 잘못된 UTF-8 이면 해당 단계만 건너뛰고 경고 로그를 남긴다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

struct NormalizeOptions {
    bool        strip_html{false};
    bool        unicode_normalize{false};
    bool        strip_control{false};
    bool        collapse_whitespace{false};
    bool        trim{false};
    bool        case_fold{false};
    std::size_t max_length{0};  // 0 = 제한 없음 (코드포인트 수)

    // 모든 단계 비활성 (항등)
    [[nodiscard]] static NormalizeOptions none() { return NormalizeOptions{}; }

    // 일반 텍스트 필드 기본값: NFC + 제어문자 제거 + 공백 축약 + trim
    [[nodiscard]] static NormalizeOptions defaults() {
        NormalizeOptions o{};
        o.unicode_normalize   = true;
        o.strip_control       = true;
        o.collapse_whitespace = true;
        o.trim                = true;
        return o;
    }
};

[[nodiscard]] std::string normalize_string(std::string_view input, const NormalizeOptions& options);

// 개별 단계 (테스트/재사용용)
[[nodiscard]] std::string strip_html_tags(std::string_view input);
[[nodiscard]] std::string remove_control_characters(std::string_view input);
[[nodiscard]] std::string collapse_whitespace(std::string_view input);
[[nodiscard]] std::string truncate_code_points(std::string_view input, std::size_t max_code_points);
