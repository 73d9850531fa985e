// ---------------------------------------------------------------------------
// url_validator.cpp
//
// [정규화 규칙]
// - 스킴/호스트 소문자화, 호스트 끝의 '.' 제거
// - 스킴 기본 포트(http 80, https 443)는 canonical 에서 생략
// - path/query/fragment 의 공백·비 ASCII·제어 바이트는 %XX 로 인코딩
//   (이미 인코딩된 %XX 는 유지)
// - path 가 비어 있으면 canonical 에도 붙이지 않는다 (result.path 는 "/")
// ---------------------------------------------------------------------------

#include "normalizer/url_validator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <cctype>
#include <charconv>
#include <cstring>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

constexpr std::array<std::string_view, 5> kForbiddenSchemes{
    "javascript", "data", "vbscript", "file", "about",
};

// IPv4 (network byte order) CIDR 포함 여부
bool ipv4_in(const in_addr& addr, const char* network, int prefix_len) {
    in_addr net{};
    if (inet_pton(AF_INET, network, &net) != 1) {
        return false;
    }
    const std::uint32_t mask =
        (prefix_len == 0) ? 0u : htonl(~0u << (32 - static_cast<unsigned>(prefix_len)));
    return (addr.s_addr & mask) == (net.s_addr & mask);
}

std::optional<UrlError> check_ipv4(const in_addr& addr, std::string_view host) {
    if (ipv4_in(addr, "127.0.0.0", 8)) {
        return UrlError{UrlErrorCode::kLoopbackHost, fmt::format("loopback host '{}'", host)};
    }
    if (ipv4_in(addr, "10.0.0.0", 8) || ipv4_in(addr, "172.16.0.0", 12) ||
        ipv4_in(addr, "192.168.0.0", 16) || ipv4_in(addr, "169.254.0.0", 16) ||
        ipv4_in(addr, "0.0.0.0", 8)) {
        return UrlError{UrlErrorCode::kPrivateHost, fmt::format("private network host '{}'", host)};
    }
    return std::nullopt;
}

std::optional<UrlError> check_ipv6(const in6_addr& addr, std::string_view host) {
    const auto* b = addr.s6_addr;
    if (IN6_IS_ADDR_LOOPBACK(&addr)) {
        return UrlError{UrlErrorCode::kLoopbackHost, fmt::format("loopback host '{}'", host)};
    }
    // ::ffff:a.b.c.d (v4-mapped), ::a.b.c.d (v4-compatible)
    if (IN6_IS_ADDR_V4MAPPED(&addr) || IN6_IS_ADDR_V4COMPAT(&addr)) {
        in_addr v4{};
        std::memcpy(&v4.s_addr, b + 12, 4);
        return check_ipv4(v4, host);
    }
    const bool unspecified = IN6_IS_ADDR_UNSPECIFIED(&addr);
    const bool unique_local = (b[0] & 0xFE) == 0xFC;                   // fc00::/7
    const bool link_local   = b[0] == 0xFE && (b[1] & 0xC0) == 0x80;   // fe80::/10
    if (unspecified || unique_local || link_local) {
        return UrlError{UrlErrorCode::kPrivateHost, fmt::format("private network host '{}'", host)};
    }
    return std::nullopt;
}

// 숫자/점/x 로만 이뤄진 호스트 (브라우저가 IPv4 로 해석할 수 있는 모호한 표기)
bool looks_numeric(std::string_view host) {
    if (host.empty()) {
        return false;
    }
    for (char c : host) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isxdigit(uc) == 0 && c != '.' && c != 'x' && c != 'X') {
            return false;
        }
    }
    // 마지막 라벨이 숫자로 시작해야 IPv4 후보 (예: "cafe.be" 제외)
    const auto last_dot = host.rfind('.');
    const auto last     = last_dot == std::string_view::npos ? host : host.substr(last_dot + 1);
    return !last.empty() && std::isdigit(static_cast<unsigned char>(last[0])) != 0;
}

bool valid_hostname(std::string_view host) {
    if (host.empty() || host.size() > 253) {
        return false;
    }
    std::size_t label_len = 0;
    for (char c : host) {
        if (c == '.') {
            if (label_len == 0) {
                return false;
            }
            label_len = 0;
            continue;
        }
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '-' && c != '_') {
            return false;
        }
        if (++label_len > 63) {
            return false;
        }
    }
    return label_len > 0;
}

// path/query/fragment 인코딩
std::string encode_component(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) != 0 &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2])) != 0) {
            out.push_back('%');
            continue;
        }
        if (c <= 0x20 || c >= 0x7F || c == '"' || c == '<' || c == '>' || c == '`' ||
            c == '%') {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::expected<UrlValidationResult, UrlError> reject(UrlErrorCode code, std::string message) {
    spdlog::debug("url_validator: rejected: {}", message);
    return std::unexpected(UrlError{code, std::move(message)});
}

}  // namespace

// ---------------------------------------------------------------------------
// validate_url
// ---------------------------------------------------------------------------
std::expected<UrlValidationResult, UrlError> validate_url(std::string_view url) {
    const auto input = trim(url);
    if (input.empty()) {
        return reject(UrlErrorCode::kEmpty, "empty url");
    }

    // 1. 스킴
    const auto colon = input.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return reject(UrlErrorCode::kMalformed, "missing scheme");
    }
    const std::string scheme = to_lower(input.substr(0, colon));
    if (std::isalpha(static_cast<unsigned char>(scheme[0])) == 0) {
        return reject(UrlErrorCode::kMalformed, "invalid scheme");
    }
    for (char c : scheme) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '+' && c != '-' && c != '.') {
            return reject(UrlErrorCode::kMalformed, "invalid scheme");
        }
    }
    for (const auto forbidden : kForbiddenSchemes) {
        if (scheme == forbidden) {
            return reject(UrlErrorCode::kForbiddenScheme, fmt::format("forbidden scheme '{}'", scheme));
        }
    }
    if (scheme != "http" && scheme != "https") {
        return reject(UrlErrorCode::kUnsupportedScheme, fmt::format("unsupported scheme '{}'", scheme));
    }

    auto rest = input.substr(colon + 1);
    if (!rest.starts_with("//")) {
        return reject(UrlErrorCode::kMalformed, "missing authority");
    }
    rest.remove_prefix(2);

    // 2. authority 분리
    const auto auth_end  = rest.find_first_of("/?#");
    auto       authority = rest.substr(0, auth_end);
    auto       tail      = auth_end == std::string_view::npos ? std::string_view{} : rest.substr(auth_end);

    if (authority.find('@') != std::string_view::npos) {
        return reject(UrlErrorCode::kCredentialsPresent, "credentials in url");
    }
    if (authority.empty()) {
        return reject(UrlErrorCode::kMalformed, "missing host");
    }

    UrlValidationResult result{};
    result.scheme    = scheme;
    result.is_secure = scheme == "https";
    const std::uint16_t default_port = result.is_secure ? 443 : 80;
    result.port = default_port;

    std::string_view host_part = authority;
    std::string_view port_part{};
    bool             ipv6_literal = false;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return reject(UrlErrorCode::kMalformed, "unterminated ipv6 literal");
        }
        host_part    = authority.substr(1, close - 1);
        ipv6_literal = true;
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return reject(UrlErrorCode::kMalformed, "unexpected characters after ipv6 literal");
            }
            port_part = after.substr(1);
        }
    } else {
        const auto pc = authority.rfind(':');
        if (pc != std::string_view::npos) {
            host_part = authority.substr(0, pc);
            port_part = authority.substr(pc + 1);
        }
    }

    bool explicit_port = false;
    if (!port_part.empty()) {
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), port);
        if (ec != std::errc{} || ptr != port_part.data() + port_part.size() || port == 0 || port > 65535) {
            return reject(UrlErrorCode::kMalformed, "invalid port");
        }
        result.port   = static_cast<std::uint16_t>(port);
        explicit_port = result.port != default_port;
    }

    // 3. 호스트 검사
    std::string host = to_lower(host_part);
    if (ipv6_literal) {
        in6_addr addr6{};
        if (inet_pton(AF_INET6, host.c_str(), &addr6) != 1) {
            return reject(UrlErrorCode::kMalformed, "invalid ipv6 literal");
        }
        if (auto err = check_ipv6(addr6, host)) {
            return reject(err->code, err->message);
        }
    } else {
        if (!host.empty() && host.back() == '.') {
            host.pop_back();
        }
        if (!valid_hostname(host)) {
            return reject(UrlErrorCode::kMalformed, "invalid host");
        }
        in_addr addr4{};
        if (inet_pton(AF_INET, host.c_str(), &addr4) == 1) {
            if (auto err = check_ipv4(addr4, host)) {
                return reject(err->code, err->message);
            }
        } else if (looks_numeric(host)) {
            return reject(UrlErrorCode::kMalformed, fmt::format("ambiguous numeric host '{}'", host));
        } else if (host == "localhost" || host.ends_with(".localhost")) {
            return reject(UrlErrorCode::kLoopbackHost, fmt::format("loopback host '{}'", host));
        }
    }
    result.host = host;

    // 4. path / query / fragment
    std::string_view path_part = tail;
    std::string_view query_part{};
    std::string_view fragment_part{};
    bool has_query    = false;
    bool has_fragment = false;
    if (const auto hash = path_part.find('#'); hash != std::string_view::npos) {
        fragment_part = path_part.substr(hash + 1);
        path_part     = path_part.substr(0, hash);
        has_fragment  = true;
    }
    if (const auto q = path_part.find('?'); q != std::string_view::npos) {
        query_part = path_part.substr(q + 1);
        path_part  = path_part.substr(0, q);
        has_query  = true;
    }

    const std::string path = encode_component(path_part);
    result.path     = path.empty() ? "/" : path;
    result.query    = encode_component(query_part);
    result.fragment = encode_component(fragment_part);

    std::string canonical = scheme + "://" + (ipv6_literal ? "[" + host + "]" : host);
    if (explicit_port) {
        canonical += ':' + std::to_string(result.port);
    }
    canonical += path;
    if (has_query) {
        canonical += '?' + result.query;
    }
    if (has_fragment) {
        canonical += '#' + result.fragment;
    }
    result.canonical_url = std::move(canonical);
    return result;
}
