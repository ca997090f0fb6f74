/*
 * 설명: 주간/월간/전체 기간 통계, 연속 기록, 리더보드와 순위를 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/streak_test.cpp, server/tests/unit/standings_test.cpp,
 *         server/tests/unit/stats_window_test.cpp, server/tests/it/stats_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wordle/calendar_date.hpp"
#include "wordle/participant.hpp"
#include "wordle/round_result_repository.hpp"

namespace wordle {

enum class StatsWindow { kWeekly, kMonthly, kAllTime };

std::optional<StatsWindow> ParseWindow(const std::string& name);
std::string WindowName(StatsWindow window);

// 전체 기간 시작일. 모든 데이터보다 이르다.
constexpr CalendarDate kAllTimeStart{2020, 1, 1};

DateRange ResolveWindow(StatsWindow window, const CalendarDate& today);

struct ParticipantStats {
  int games_played{0};
  int total_score{0};
  double average_score{0.0};
  int successful_games{0};
  std::optional<CalendarDate> first_game_date;
  std::optional<CalendarDate> last_game_date;
};

struct StreakSummary {
  int current_streak{0};
  int longest_streak{0};
};

struct LeaderboardEntry {
  ParticipantRef participant;
  int games_played;
  int total_score;
  double average_score;
  int successful_games;
  int current_streak;
  int longest_streak;
};

double AverageOf(const AggregateRow& row);

// 날짜 순서/중복과 무관하게 계산한다.
StreakSummary ComputeStreak(std::vector<CalendarDate> play_dates);

// 총점 내림차순, 평균 내림차순, participant_id 오름차순. 경기 0건 행은 제외된다.
std::vector<AggregateRow> RankStandings(std::vector<AggregateRow> rows);

class StatsEngine {
 public:
  explicit StatsEngine(std::shared_ptr<RoundResultRepository> repository,
                       std::function<CalendarDate()> today = UtcToday);

  ParticipantStats GetStats(std::uint64_t participant_id, StatsWindow window) const;
  std::vector<LeaderboardEntry> GetLeaderboard(StatsWindow window, std::size_t limit) const;
  std::optional<std::size_t> GetRank(std::uint64_t participant_id, StatsWindow window) const;
  StreakSummary GetStreak(std::uint64_t participant_id) const;

  DateRange WindowRange(StatsWindow window) const { return ResolveWindow(window, today_()); }

 private:
  std::shared_ptr<RoundResultRepository> repository_;
  std::function<CalendarDate()> today_;
};

}  // namespace wordle
