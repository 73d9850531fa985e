#pragma once

// ---------------------------------------------------------------------------
// url_validator.hpp
//
// 외부에서 받은 URL 의 구문/스킴/호스트 검증 및 정규화.
//
// [거부 규칙]
// - 금지 스킴: javascript, data, vbscript, file, about → kForbiddenScheme
// - http/https 이외 스킴 → kUnsupportedScheme
// - userinfo(user:pass@) 포함 → kCredentialsPresent
// - 루프백: localhost, *.localhost, 127.0.0.0/8, ::1 → kLoopbackHost
// - 사설/링크로컬/미지정: 10/8, 172.16/12, 192.168/16, 169.254/16, 0/8,
//   fc00::/7, fe80::/10, :: → kPrivateHost (IPv4-mapped IPv6 포함)
// - 숫자만으로 된 비표준 IPv4 표기(2130706433, 0x7f.1 등) → kMalformed
//
// [한계]
// - DNS 조회를 하지 않는다. 공개 도메인이 사설 IP 로 해석되는 경우
//   (DNS rebinding)는 요청을 실제로 보내는 쪽에서 다시 검사해야 한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

enum class UrlErrorCode : std::uint8_t {
    kEmpty              = 0,
    kMalformed          = 1,
    kForbiddenScheme    = 2,
    kUnsupportedScheme  = 3,
    kCredentialsPresent = 4,
    kLoopbackHost       = 5,
    kPrivateHost        = 6,
};

struct UrlError {
    UrlErrorCode code{UrlErrorCode::kMalformed};
    std::string  message{};
};

struct UrlValidationResult {
    std::string   canonical_url{};
    std::string   scheme{};
    std::string   host{};
    std::uint16_t port{0};  // 명시 포트 없으면 스킴 기본값
    std::string   path{"/"};
    std::string   query{};     // '?' 제외
    std::string   fragment{};  // '#' 제외
    bool          is_secure{false};
};

[[nodiscard]] std::expected<UrlValidationResult, UrlError> validate_url(std::string_view url);
