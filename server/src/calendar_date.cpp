/*
 * 설명: 그레고리력 날짜와 일수 간 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/date_resolver_test.cpp, server/tests/unit/stats_window_test.cpp
 */
#include "wordle/calendar_date.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace wordle {
namespace {
constexpr long kSecondsPerDay = 86400;

bool IsLeap(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

unsigned DaysInMonth(int year, unsigned month) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeap(year)) {
    return 29;
  }
  return kDays[month - 1];
}
}  // namespace

long CalendarDate::ToDays() const {
  // 3월 시작 연도로 바꿔 윤일을 연말에 둔다.
  const int y = year - (month <= 2 ? 1 : 0);
  const long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned mp = month > 2 ? month - 3 : month + 9;
  const unsigned doy = (153 * mp + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long>(doe) - 719468;
}

CalendarDate CalendarDate::FromDays(long days) {
  days += 719468;
  const long era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const long y = static_cast<long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
  return CalendarDate{static_cast<int>(y), m, d};
}

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text) {
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  char tail = 0;
  if (std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
    return std::nullopt;
  }
  if (m < 1 || m > 12 || d < 1 || d > DaysInMonth(y, m)) {
    return std::nullopt;
  }
  return CalendarDate{y, m, d};
}

unsigned CalendarDate::Weekday() const {
  // 1970-01-01은 목요일(3)
  long shifted = (ToDays() + 3) % 7;
  if (shifted < 0) {
    shifted += 7;
  }
  return static_cast<unsigned>(shifted);
}

std::string CalendarDate::ToString() const {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month << "-" << std::setw(2) << day;
  return oss.str();
}

CalendarDate UtcDateOf(std::chrono::system_clock::time_point tp) {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  long days = static_cast<long>(seconds / kSecondsPerDay);
  if (seconds % kSecondsPerDay < 0) {
    --days;
  }
  return CalendarDate::FromDays(days);
}

CalendarDate UtcToday() { return UtcDateOf(std::chrono::system_clock::now()); }

}  // namespace wordle
