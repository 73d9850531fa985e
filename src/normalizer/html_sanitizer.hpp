#pragma once

// ---------------------------------------------------------------------------
// html_sanitizer.hpp
//
// 허용 목록(allow-list) 기반 HTML 정화기.
//
// [처리 규칙]
// 1. 입력을 노드 트리로 파싱한다 (텍스트 / 요소 / 주석).
// 2. script, style 요소는 내용까지 무조건 제거. 주석, <!DOCTYPE>, <?...?> 제거.
// 3. 허용 목록에 없는 요소는 태그만 제거하고 자식은 부모로 승격 (텍스트 보존).
// 4. 허용 목록에 없는 속성 제거. on* 이벤트 핸들러는 허용 목록과 무관하게 제거.
// 5. href/src 값이 javascript:/vbscript: 스킴이면 허용 여부와 무관하게 속성 제거.
// 6. 출력은 엔티티를 재인코딩한 정규 HTML.
//
// [파싱 실패: 닫히지 않은 태그/주석/스크립트, 중첩 깊이 초과]
// - fail_closed_on_parse_error == true (기본값): 모든 마크업을 제거한
//   텍스트만 이스케이프해서 반환한다.
// - false: 입력을 수정 없이 그대로 반환한다 (fail-safe, 보안상 위험).
//
// [불변식]
// - 출력에는 "<script", "javascript:" 가 나타나지 않는다 (대소문자 무관).
//   텍스트 안의 "javascript:" 는 콜론을 &#58; 로 인코딩한다.
// ---------------------------------------------------------------------------

#include <set>
#include <string>
#include <string_view>
#include <vector>

struct HtmlSanitizeOptions {
    std::set<std::string> allowed_tags{
        "a", "b", "blockquote", "br", "code", "div", "em", "h1", "h2", "h3", "h4", "h5", "h6",
        "hr", "i", "img", "li", "ol", "p", "pre", "span", "strong", "sub", "sup", "table",
        "tbody", "td", "th", "thead", "tr", "u", "ul",
    };
    std::set<std::string> allowed_attributes{
        "alt", "class", "colspan", "height", "href", "rowspan", "src", "title", "width",
    };
    bool allow_data_attributes{false};
    bool fail_closed_on_parse_error{true};
};

struct HtmlSanitizeResult {
    std::string              html{};
    bool                     modified{false};
    bool                     parse_error{false};
    std::vector<std::string> removed_elements{};    // 제거/승격된 요소 이름 (발생 순)
    std::size_t              removed_attributes{0};
};

[[nodiscard]] HtmlSanitizeResult sanitize_html(std::string_view html,
                                               const HtmlSanitizeOptions& options = {});

// 텍스트를 HTML 본문/속성에 안전하게 넣기 위한 이스케이프
[[nodiscard]] std::string escape_html(std::string_view text);
