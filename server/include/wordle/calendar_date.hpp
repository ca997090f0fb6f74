/*
 * 설명: 라운드 날짜와 통계 기간 계산에 쓰는 UTC 기준 달력 날짜 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/date_resolver_test.cpp, server/tests/unit/stats_window_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace wordle {

struct CalendarDate {
  int year;
  unsigned month;
  unsigned day;

  // 1970-01-01 기준 일수. 음수 가능.
  long ToDays() const;
  static CalendarDate FromDays(long days);
  static std::optional<CalendarDate> Parse(const std::string& text);

  CalendarDate AddDays(long delta) const { return FromDays(ToDays() + delta); }
  // 0 = 월요일, 6 = 일요일
  unsigned Weekday() const;
  std::string ToString() const;
};

inline bool operator==(const CalendarDate& a, const CalendarDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CalendarDate& a, const CalendarDate& b) { return !(a == b); }
inline bool operator<(const CalendarDate& a, const CalendarDate& b) { return a.ToDays() < b.ToDays(); }

struct DateRange {
  CalendarDate from;
  CalendarDate to;
};

CalendarDate UtcDateOf(std::chrono::system_clock::time_point tp);
CalendarDate UtcToday();

}  // namespace wordle
