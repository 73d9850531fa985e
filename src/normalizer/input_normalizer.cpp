// ---------------------------------------------------------------------------
// input_normalizer.cpp
//
// [제어 문자 제거 대상]
// - C0 (U+0000-U+001F) 중 \t \n \r 를 제외한 전부, DEL (U+007F)
// - C1 (U+0080-U+009F)
// - 보이지 않는 서식 문자: U+200B-U+200F, U+202A-U+202E, U+2060-U+2064,
//   U+2066-U+2069, U+FEFF
//   (zero-width/bidi override 는 키워드 분할 우회와 표시 위장에 쓰인다)
// ---------------------------------------------------------------------------

#include "normalizer/input_normalizer.hpp"

#include <cctype>
#include <cstdint>
#include <locale>
#include <optional>

#include <boost/locale.hpp>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

// Boost.Locale 는 변환마다 std::locale 을 요구한다. 생성 비용이 커서 한 번만 만든다.
const std::locale& utf8_locale() {
    static const std::locale loc = [] {
        boost::locale::generator gen;
        return gen("en_US.UTF-8");
    }();
    return loc;
}

// 다음 UTF-8 시퀀스 길이. 잘못된 선두 바이트는 1.
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) { return 1; }
    if ((lead & 0xE0) == 0xC0) { return 2; }
    if ((lead & 0xF0) == 0xE0) { return 3; }
    if ((lead & 0xF8) == 0xF0) { return 4; }
    return 1;
}

// 위치 i 의 코드포인트 디코드. 잘못된 시퀀스는 nullopt.
std::optional<std::uint32_t> decode_at(std::string_view s, std::size_t i, std::size_t len) {
    if (i + len > s.size()) {
        return std::nullopt;
    }
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (len == 1) {
        return b0;
    }
    std::uint32_t cp = (len == 2) ? (b0 & 0x1F) : (len == 3) ? (b0 & 0x0F) : (b0 & 0x07);
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) {
            return std::nullopt;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    return cp;
}

bool is_invisible_or_control(std::uint32_t cp) {
    if (cp < 0x20) {
        return cp != '\t' && cp != '\n' && cp != '\r';
    }
    if (cp == 0x7F || (cp >= 0x80 && cp <= 0x9F)) {
        return true;
    }
    return (cp >= 0x200B && cp <= 0x200F) || (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2060 && cp <= 0x2064) || (cp >= 0x2066 && cp <= 0x2069) || cp == 0xFEFF;
}

std::string to_nfc(const std::string& input) {
    try {
        return boost::locale::normalize(input, boost::locale::norm_nfc, utf8_locale());
    } catch (const std::exception& e) {
        spdlog::warn("input_normalizer: NFC normalization skipped: {}", e.what());
        return input;
    }
}

std::string fold_case(const std::string& input) {
    try {
        return boost::locale::fold_case(input, utf8_locale());
    } catch (const std::exception& e) {
        spdlog::warn("input_normalizer: unicode case fold unavailable, using ASCII fold: {}", e.what());
        return to_lower(input);
    }
}

std::string rtrim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
        s.pop_back();
    }
    return s;
}

}  // namespace

// ---------------------------------------------------------------------------
// strip_html_tags
//   '<' 부터 다음 '>' 까지를 제거한다. 닫히지 않은 '<' 는 텍스트로 남긴다.
//   결과에는 '<' 뒤에 '>' 가 오는 구간이 없으므로 재적용해도 변하지 않는다.
// ---------------------------------------------------------------------------
std::string strip_html_tags(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '<') {
            const auto close = input.find('>', i + 1);
            if (close == std::string_view::npos) {
                out.append(input.substr(i));
                break;
            }
            i = close + 1;
            continue;
        }
        out.push_back(input[i]);
        ++i;
    }
    return out;
}

std::string remove_control_characters(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        const auto len = utf8_sequence_length(static_cast<unsigned char>(input[i]));
        const auto cp  = decode_at(input, i, len);
        if (!cp) {
            // 잘못된 바이트는 그대로 유지 (NFC 단계가 책임)
            out.push_back(input[i]);
            ++i;
            continue;
        }
        if (!is_invisible_or_control(*cp)) {
            out.append(input.substr(i, len));
        }
        i += len;
    }
    return out;
}

std::string collapse_whitespace(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    bool in_space = false;
    for (char c : input) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

std::string truncate_code_points(std::string_view input, std::size_t max_code_points) {
    std::size_t i     = 0;
    std::size_t count = 0;
    while (i < input.size() && count < max_code_points) {
        const auto len = utf8_sequence_length(static_cast<unsigned char>(input[i]));
        i += (i + len <= input.size()) ? len : 1;
        ++count;
    }
    return std::string(input.substr(0, i));
}

// ---------------------------------------------------------------------------
// normalize_string
// ---------------------------------------------------------------------------
std::string normalize_string(std::string_view input, const NormalizeOptions& options) {
    std::string s(input);

    if (options.strip_html) {
        s = strip_html_tags(s);
    }
    if (options.unicode_normalize) {
        s = to_nfc(s);
    }
    if (options.strip_control) {
        const auto before = s.size();
        s = remove_control_characters(s);
        // ZWJ 등이 빠지면 결합 문자가 인접해져 NFC 가 다시 합성할 수 있다.
        if (options.unicode_normalize && s.size() != before) {
            s = to_nfc(s);
        }
    }
    if (options.collapse_whitespace) {
        s = collapse_whitespace(s);
    }
    if (options.trim) {
        s = std::string(trim(s));
    }
    if (options.case_fold) {
        s = fold_case(s);
        if (options.unicode_normalize) {
            s = to_nfc(s);
        }
    }
    if (options.max_length > 0) {
        s = truncate_code_points(s, options.max_length);
        if (options.trim) {
            s = rtrim(std::move(s));
        }
    }
    return s;
}
