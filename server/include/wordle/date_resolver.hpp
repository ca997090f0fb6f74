/*
 * 설명: 메시지 시각과 코퍼스로 라운드 날짜/번호를 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/date_resolver_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "wordle/calendar_date.hpp"

namespace wordle {

struct RoundKey {
  int round_id;
  CalendarDate round_date;
};

class DateResolver {
 public:
  // 1번 라운드 전날(0번)이 2021-06-19
  static constexpr CalendarDate kDefaultEpoch{2021, 6, 19};

  explicit DateResolver(CalendarDate epoch = kDefaultEpoch);

  // 라운드 번호를 얻을 수 없으면 std::nullopt
  std::optional<RoundKey> Resolve(std::chrono::system_clock::time_point message_timestamp,
                                  const std::string& corpus) const;

  std::optional<int> DeriveRoundId(const CalendarDate& round_date) const;
  const CalendarDate& Epoch() const { return epoch_; }

 private:
  CalendarDate epoch_;
};

}  // namespace wordle
