#pragma once

// ---------------------------------------------------------------------------
// failure.hpp
//
// 파이프라인 경계에서 쓰는 실패 값. 발생 지점에서 kind 를 태깅해 만든다.
//
//   message      : 원문 메시지. 내부 정보(경로, 접속 문자열 등)를 담을 수 있다.
//   detail       : 추가 진단 (스택 요약, 원인 설명 등)
//   safe_details : 외부 공개가 허용된 key/value (필드 경로, 재시도 시각 등).
//                  매핑의 allow_safe_details 가 true 일 때만 응답에 붙는다.
//   cause        : 감싼 하위 실패 (체인)
//   correlation_id : 이미 발급된 id 를 이어받을 때만 채운다.
// ---------------------------------------------------------------------------

#include "error/error_kind.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

struct Failure {
    ErrorKind                                        kind{ErrorKind::kInternal};
    std::string                                      message{};
    std::string                                      detail{};
    std::vector<std::pair<std::string, std::string>> safe_details{};
    std::shared_ptr<const Failure>                   cause{};
    std::string                                      correlation_id{};

    [[nodiscard]] static Failure make(ErrorKind kind, std::string message, std::string detail = {}) {
        Failure f;
        f.kind    = kind;
        f.message = std::move(message);
        f.detail  = std::move(detail);
        return f;
    }

    // 이 실패를 cause 로 감싼 새 실패
    [[nodiscard]] Failure wrap(ErrorKind outer, std::string outer_message) const {
        Failure f = make(outer, std::move(outer_message));
        f.cause          = std::make_shared<const Failure>(*this);
        f.correlation_id = correlation_id;
        return f;
    }

    Failure& with_safe_detail(std::string key, std::string value) {
        safe_details.emplace_back(std::move(key), std::move(value));
        return *this;
    }
};
