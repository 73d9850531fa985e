// ---------------------------------------------------------------------------
// html_sanitizer.cpp
//
// 경량 HTML 토크나이저 + 트리 빌더 + 허용 목록 직렬화기.
//
// [파서 상태]
// - 텍스트, 시작 태그(속성 포함), 종료 태그, 주석(<!-- -->),
//   선언(<!...>, <?...?>), raw text(script/style) 를 구분한다.
// - 종료 태그가 열린 요소와 맞지 않으면 무시한다. 스택 위쪽에서 일치하는
//   요소를 찾으면 그 사이 요소는 암묵적으로 닫는다.
// - EOF 에서 열린 요소는 암묵적으로 닫는다 (파싱 실패 아님).
//
// [파싱 실패로 간주]
// - 닫히지 않은 태그(속성 따옴표 포함), 주석, 선언, script/style 블록
// - 중첩 깊이 kMaxDepth 초과
//
// [알려진 한계]
// - 명명 엔티티는 &amp; &lt; &gt; &quot; &apos; &nbsp; 만 디코드한다.
//   그 외 명명 엔티티는 '&' 가 재인코딩되어 문자 그대로 표시된다.
// - 브라우저의 오류 복구 규칙(테이블 재배치 등)은 재현하지 않는다.
// ---------------------------------------------------------------------------

#include "normalizer/html_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

constexpr std::size_t kMaxDepth = 256;

const std::set<std::string_view> kVoidElements{
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr",
};

// 내용까지 통째로 버리는 요소
const std::set<std::string_view> kDroppedWithContent{"script", "style"};

// 값이 URL 로 해석되는 속성
const std::set<std::string_view> kUrlAttributes{
    "action", "background", "formaction", "href", "lowsrc", "poster", "src", "xlink:href",
};

struct Node {
    enum class Kind : std::uint8_t { kText, kElement };

    Kind                                             kind{Kind::kText};
    std::string                                      text{};   // kText
    std::string                                      name{};   // kElement (소문자)
    std::vector<std::pair<std::string, std::string>> attrs{};  // 이름 소문자, 값 디코드됨
    std::vector<std::unique_ptr<Node>>               children{};
};

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// ---------------------------------------------------------------------------
// decode_entities: 숫자 엔티티(&#NN; &#xHH;) + 기본 명명 엔티티
// ---------------------------------------------------------------------------
std::string decode_entities(std::string_view in) {
    static const std::pair<std::string_view, std::string_view> kNamed[] = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"}, {"nbsp", "\xC2\xA0"},
    };

    std::string out;
    out.reserve(in.size());
    std::size_t i = 0;
    while (i < in.size()) {
        if (in[i] != '&') {
            out.push_back(in[i++]);
            continue;
        }
        const auto semi = in.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 12) {
            out.push_back(in[i++]);
            continue;
        }
        const auto body = in.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (body.size() > 1 && body[0] == '#') {
            const bool hex    = body[1] == 'x' || body[1] == 'X';
            const auto digits = body.substr(hex ? 2 : 1);
            std::uint32_t cp  = 0;
            bool ok = !digits.empty();
            for (char c : digits) {
                const auto uc = static_cast<unsigned char>(c);
                if (hex ? std::isxdigit(uc) == 0 : std::isdigit(uc) == 0) {
                    ok = false;
                    break;
                }
                const std::uint32_t v = std::isdigit(uc) != 0 ? uc - '0'
                                                              : (std::tolower(uc) - 'a' + 10);
                cp = cp * (hex ? 16 : 10) + v;
                if (cp > 0x10FFFF) {
                    cp = 0x110000;
                }
            }
            if (ok) {
                append_utf8(out, cp);
                decoded = true;
            }
        } else {
            for (const auto& [name, value] : kNamed) {
                if (iequals(body, name)) {
                    out.append(value);
                    decoded = true;
                    break;
                }
            }
        }
        if (decoded) {
            i = semi + 1;
        } else {
            out.push_back(in[i++]);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// encode: 텍스트/속성 값 재인코딩
// ---------------------------------------------------------------------------
std::string encode(const std::string& raw) {
    std::string out;
    out.reserve(raw.size() + 16);
    for (const char c : raw) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// neutralize_script_schemes: 최종 출력 전체에서 "javascript:" / "vbscript:" 의
//   ':' 를 &#58; 로 바꾼다. 승격된 텍스트 노드가 이어 붙어 스킴이 다시
//   만들어지는 경우도 직렬화가 끝난 문자열 기준이므로 함께 잡힌다.
// ---------------------------------------------------------------------------
std::string neutralize_script_schemes(std::string html) {
    constexpr std::string_view kSchemes[] = {"javascript", "vbscript"};
    std::string out;
    out.reserve(html.size());
    for (std::size_t i = 0; i < html.size(); ++i) {
        if (html[i] == ':') {
            const std::string_view before(out);
            const bool scheme = std::any_of(std::begin(kSchemes), std::end(kSchemes),
                                            [&](std::string_view word) {
                                                return before.size() >= word.size() &&
                                                       iequals(before.substr(before.size() - word.size()), word);
                                            });
            if (scheme) {
                out += "&#58;";
                continue;
            }
        }
        out.push_back(html[i]);
    }
    return out;
}

// URL 속성 값이 스크립트 스킴인지 (공백/제어문자 제거 후 소문자 비교)
bool is_script_url(const std::string& value) {
    std::string compact;
    compact.reserve(value.size());
    for (unsigned char c : value) {
        if (c > 0x20) {
            compact.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return compact.starts_with("javascript:") || compact.starts_with("vbscript:");
}

bool is_name_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '-' || c == '_' || c == ':';
}

// ---------------------------------------------------------------------------
// HtmlTreeBuilder
// ---------------------------------------------------------------------------
class HtmlTreeBuilder {
public:
    HtmlTreeBuilder(std::string_view input, std::vector<std::string>& removed)
        : in_(input), removed_(removed) {}

    // 실패 시 false (root 내용은 무의미)
    bool build(Node& root) {
        stack_.clear();
        stack_.push_back(&root);
        while (pos_ < in_.size()) {
            if (in_[pos_] == '<' && !consume_markup()) {
                return false;
            }
            if (pos_ < in_.size() && in_[pos_] != '<') {
                consume_text();
            }
            if (failed_) {
                return false;
            }
        }
        return !failed_;
    }

private:
    Node& current() { return *stack_.back(); }

    void add_text(std::string text) {
        if (text.empty()) {
            return;
        }
        auto& kids = current().children;
        if (!kids.empty() && kids.back()->kind == Node::Kind::kText) {
            kids.back()->text += text;
            return;
        }
        auto node  = std::make_unique<Node>();
        node->kind = Node::Kind::kText;
        node->text = std::move(text);
        kids.push_back(std::move(node));
    }

    void consume_text() {
        const auto next = in_.find('<', pos_);
        const auto end  = next == std::string_view::npos ? in_.size() : next;
        add_text(decode_entities(in_.substr(pos_, end - pos_)));
        pos_ = end;
    }

    // '<' 위치에서 호출. 실패 시 false.
    bool consume_markup() {
        const auto rest = in_.substr(pos_);
        if (rest.starts_with("<!--")) {
            const auto end = in_.find("-->", pos_ + 4);
            if (end == std::string_view::npos) {
                return fail("unterminated comment");
            }
            removed_.emplace_back("#comment");
            pos_ = end + 3;
            return true;
        }
        if (rest.starts_with("<!") || rest.starts_with("<?")) {
            const auto end = in_.find('>', pos_ + 2);
            if (end == std::string_view::npos) {
                return fail("unterminated declaration");
            }
            removed_.emplace_back("#declaration");
            pos_ = end + 1;
            return true;
        }
        if (rest.starts_with("</")) {
            return consume_end_tag();
        }
        if (rest.size() > 1 && std::isalpha(static_cast<unsigned char>(rest[1])) != 0) {
            return consume_start_tag();
        }
        // "< 3" 같은 리터럴 '<'
        add_text("<");
        ++pos_;
        return true;
    }

    std::string read_name() {
        const auto start = pos_;
        while (pos_ < in_.size() && is_name_char(in_[pos_])) {
            ++pos_;
        }
        return to_lower(in_.substr(start, pos_ - start));
    }

    void skip_space() {
        while (pos_ < in_.size() && std::isspace(static_cast<unsigned char>(in_[pos_])) != 0) {
            ++pos_;
        }
    }

    bool consume_end_tag() {
        pos_ += 2;
        const std::string name = read_name();
        const auto end = in_.find('>', pos_);
        if (end == std::string_view::npos) {
            return fail("unterminated end tag");
        }
        pos_ = end + 1;
        // 스택 위에서부터 일치 요소 탐색 (root 제외)
        for (std::size_t i = stack_.size(); i-- > 1;) {
            if (stack_[i]->name == name) {
                stack_.resize(i);
                return true;
            }
        }
        return true;
    }

    bool consume_start_tag() {
        ++pos_;
        const std::string name = read_name();
        std::vector<std::pair<std::string, std::string>> attrs;
        bool self_closing = false;

        while (true) {
            skip_space();
            if (pos_ >= in_.size()) {
                return fail("unterminated start tag");
            }
            const char c = in_[pos_];
            if (c == '>') {
                ++pos_;
                break;
            }
            if (c == '/') {
                ++pos_;
                if (pos_ < in_.size() && in_[pos_] == '>') {
                    self_closing = true;
                    ++pos_;
                    break;
                }
                continue;
            }
            const auto attr_start = pos_;
            while (pos_ < in_.size() && in_[pos_] != '=' && in_[pos_] != '>' && in_[pos_] != '/' &&
                   std::isspace(static_cast<unsigned char>(in_[pos_])) == 0) {
                ++pos_;
            }
            if (pos_ == attr_start) {
                // '=' 등 이름 없는 문자: 건너뜀
                ++pos_;
                continue;
            }
            std::string attr_name = to_lower(in_.substr(attr_start, pos_ - attr_start));
            std::string value;
            skip_space();
            if (pos_ < in_.size() && in_[pos_] == '=') {
                ++pos_;
                skip_space();
                if (pos_ >= in_.size()) {
                    return fail("unterminated attribute");
                }
                const char q = in_[pos_];
                if (q == '"' || q == '\'') {
                    const auto close = in_.find(q, pos_ + 1);
                    if (close == std::string_view::npos) {
                        return fail("unterminated attribute value");
                    }
                    value = decode_entities(in_.substr(pos_ + 1, close - pos_ - 1));
                    pos_  = close + 1;
                } else {
                    const auto vstart = pos_;
                    while (pos_ < in_.size() && in_[pos_] != '>' &&
                           std::isspace(static_cast<unsigned char>(in_[pos_])) == 0) {
                        ++pos_;
                    }
                    value = decode_entities(in_.substr(vstart, pos_ - vstart));
                }
            }
            attrs.emplace_back(std::move(attr_name), std::move(value));
        }

        if (kDroppedWithContent.contains(name)) {
            removed_.push_back(name);
            if (self_closing) {
                return true;
            }
            return skip_raw_text(name);
        }

        auto node   = std::make_unique<Node>();
        node->kind  = Node::Kind::kElement;
        node->name  = name;
        node->attrs = std::move(attrs);
        Node* raw   = node.get();
        current().children.push_back(std::move(node));

        if (!self_closing && !kVoidElements.contains(name)) {
            if (stack_.size() > kMaxDepth) {
                return fail("nesting depth exceeded");
            }
            stack_.push_back(raw);
        }
        return true;
    }

    // </name ...> 까지 건너뜀 (대소문자 무관)
    bool skip_raw_text(const std::string& name) {
        const std::string closing = "</" + name;
        std::size_t search = pos_;
        while (true) {
            const auto lt = in_.find("</", search);
            if (lt == std::string_view::npos) {
                return fail("unterminated raw text element");
            }
            if (istarts_with(in_.substr(lt), closing)) {
                const auto end = in_.find('>', lt);
                if (end == std::string_view::npos) {
                    return fail("unterminated raw text element");
                }
                pos_ = end + 1;
                return true;
            }
            search = lt + 2;
        }
    }

    bool fail(std::string_view reason) {
        spdlog::debug("html_sanitizer: parse error at offset {}: {}", pos_, reason);
        failed_ = true;
        return false;
    }

    std::string_view          in_;
    std::vector<std::string>& removed_;
    std::vector<Node*>        stack_;
    std::size_t               pos_{0};
    bool                      failed_{false};
};

// ---------------------------------------------------------------------------
// 직렬화
// ---------------------------------------------------------------------------
bool attribute_allowed(const std::string& name, const HtmlSanitizeOptions& options) {
    if (name.starts_with("on")) {
        return false;
    }
    if (options.allowed_attributes.contains(name)) {
        return true;
    }
    return options.allow_data_attributes && name.starts_with("data-") && name.size() > 5;
}

void serialize(const Node& node, const HtmlSanitizeOptions& options,
               HtmlSanitizeResult& result, std::string& out) {
    if (node.kind == Node::Kind::kText) {
        out += encode(node.text);
        return;
    }

    const bool keep = options.allowed_tags.contains(node.name) &&
                      !kDroppedWithContent.contains(node.name);
    if (!keep) {
        result.removed_elements.push_back(node.name);
        for (const auto& child : node.children) {
            serialize(*child, options, result, out);
        }
        return;
    }

    out += '<';
    out += node.name;
    for (const auto& [name, value] : node.attrs) {
        if (!attribute_allowed(name, options) ||
            (kUrlAttributes.contains(name) && is_script_url(value))) {
            ++result.removed_attributes;
            continue;
        }
        out += ' ';
        out += name;
        out += "=\"";
        out += encode(value);
        out += '"';
    }
    out += '>';

    if (kVoidElements.contains(node.name)) {
        return;
    }
    for (const auto& child : node.children) {
        serialize(*child, options, result, out);
    }
    out += "</";
    out += node.name;
    out += '>';
}

// 파싱 실패 시 강화 경로: 태그로 보이는 구간을 모두 지우고 텍스트만 남긴다.
std::string text_only(std::string_view in) {
    std::string text;
    text.reserve(in.size());
    std::size_t i = 0;
    while (i < in.size()) {
        if (in[i] == '<' && i + 1 < in.size()) {
            const char n = in[i + 1];
            if (std::isalpha(static_cast<unsigned char>(n)) != 0 || n == '/' || n == '!' || n == '?') {
                const auto close = in.find('>', i + 1);
                if (close == std::string_view::npos) {
                    break;
                }
                i = close + 1;
                continue;
            }
        }
        text.push_back(in[i++]);
    }
    return neutralize_script_schemes(encode(decode_entities(text)));
}

}  // namespace

std::string escape_html(std::string_view text) {
    return neutralize_script_schemes(encode(std::string(text)));
}

// ---------------------------------------------------------------------------
// sanitize_html
// ---------------------------------------------------------------------------
HtmlSanitizeResult sanitize_html(std::string_view html, const HtmlSanitizeOptions& options) {
    HtmlSanitizeResult result{};

    Node root{};
    root.kind = Node::Kind::kElement;
    HtmlTreeBuilder builder(html, result.removed_elements);

    if (!builder.build(root)) {
        result.parse_error = true;
        if (options.fail_closed_on_parse_error) {
            spdlog::warn("html_sanitizer: parse error, stripping all markup ({} bytes)", html.size());
            result.html = text_only(html);
        } else {
            spdlog::warn("html_sanitizer: parse error, returning input unmodified ({} bytes)",
                         html.size());
            result.html = std::string(html);
        }
        result.modified = result.html != html;
        return result;
    }

    std::string out;
    out.reserve(html.size());
    for (const auto& child : root.children) {
        serialize(*child, options, result, out);
    }
    result.html     = neutralize_script_schemes(std::move(out));
    result.modified = result.html != html;
    return result;
}
