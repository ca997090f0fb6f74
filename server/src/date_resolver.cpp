/*
 * 설명: 요약 메시지는 항상 전날 라운드를 보고하므로 메시지 날짜 - 1일을 라운드 날짜로 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/date_resolver_test.cpp
 */
#include "wordle/date_resolver.hpp"

#include <limits>

#include "wordle/result_detector.hpp"

namespace wordle {

DateResolver::DateResolver(CalendarDate epoch) : epoch_(epoch) {}

std::optional<RoundKey> DateResolver::Resolve(std::chrono::system_clock::time_point message_timestamp,
                                              const std::string& corpus) const {
  CalendarDate round_date = UtcDateOf(message_timestamp).AddDays(-1);
  if (auto marker = FindRoundNumber(corpus)) {
    return RoundKey{*marker, round_date};
  }
  auto derived = DeriveRoundId(round_date);
  if (!derived) {
    return std::nullopt;
  }
  return RoundKey{*derived, round_date};
}

std::optional<int> DateResolver::DeriveRoundId(const CalendarDate& round_date) const {
  long days = round_date.ToDays() - epoch_.ToDays();
  if (days < 0 || days > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(days);
}

}  // namespace wordle
