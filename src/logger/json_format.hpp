#pragma once

// ---------------------------------------------------------------------------
// json_format.hpp
//
// 구조화 로그/응답 직렬화에 쓰는 최소 JSON 텍스트 헬퍼.
// 감사 이벤트와 ErrorResponse 가 같은 이스케이프 규칙과 타임스탬프 형식을
// 사용하도록 한 곳에 모은다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <string>
#include <string_view>

// JSON 문자열 이스케이프 (따옴표 미포함)
[[nodiscard]] std::string escape_json_string(std::string_view str);

// ISO-8601 UTC, 밀리초 포함 (예: 2026-10-19T09:15:02.123Z)
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
