#pragma once

// ---------------------------------------------------------------------------
// rate_limit_algorithms.hpp
//
// 네 가지 속도 제한 알고리즘의 순수 판정 함수.
// 저장소 I/O 는 하지 않는다: 직렬화된 이전 상태 + 현재 시각을 받아
// 판정 결과와 (consume 시) 새 상태를 돌려준다.
//
// [상태 직렬화 형식]
//   fixed_window   : "<count>|<window_start_ms>"
//   sliding_window : "<t1_ms>,<t2_ms>,..." (오름차순)
//   token_bucket   : "<tokens>|<last_refill_ms>"
//   leaky_bucket   : "<level>|<last_leak_ms>"
//
// [불변식]
// - 상태 없음 = 한도가 가득 찬(아무것도 소비하지 않은) 상태.
// - state_ttl 이 지나면 상태는 "없음" 과 동치가 된다.
// - 한도 초과 상태에서의 consume 은 상태를 바꾸지 않는다
//   (거부된 요청은 소비로 기록하지 않음).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "ratelimit/rate_limit_types.hpp"

struct AlgorithmDecision {
    bool                       allowed{true};
    std::uint32_t              current_count{0};
    std::uint32_t              remaining{0};
    std::chrono::milliseconds  retry_after{0};
    std::int64_t               reset_at_ms{0};   // epoch ms
    std::optional<std::string> new_state{};      // consume 시에만 설정
    std::chrono::milliseconds  state_ttl{0};
    bool                       state_was_corrupt{false};
};

// evaluate_algorithm
//   previous_state: 저장소에서 읽은 값 (없으면 nullopt)
//   limit         : 유효 한도 (배수 적용 후)
//   window        : 정책 윈도우
//   now_ms        : epoch 밀리초
//   consume       : true 면 요청 1건을 반영한 new_state 를 만든다
//                   (판정 필드는 반영 이후 기준)
[[nodiscard]] AlgorithmDecision evaluate_algorithm(RateLimitAlgorithm algorithm,
                                                   const std::optional<std::string>& previous_state,
                                                   std::uint32_t limit,
                                                   std::chrono::milliseconds window,
                                                   std::int64_t now_ms,
                                                   bool consume);
