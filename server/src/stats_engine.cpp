/*
 * 설명: 추가 전용 결과 장부에서 매 조회마다 통계와 연속 기록을 다시 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/streak_test.cpp, server/tests/unit/standings_test.cpp,
 *         server/tests/unit/stats_window_test.cpp, server/tests/it/stats_it_test.cpp
 */
#include "wordle/stats_engine.hpp"

#include <algorithm>

namespace wordle {

std::optional<StatsWindow> ParseWindow(const std::string& name) {
  if (name == "weekly") {
    return StatsWindow::kWeekly;
  }
  if (name == "monthly") {
    return StatsWindow::kMonthly;
  }
  if (name == "alltime") {
    return StatsWindow::kAllTime;
  }
  return std::nullopt;
}

std::string WindowName(StatsWindow window) {
  switch (window) {
    case StatsWindow::kWeekly:
      return "weekly";
    case StatsWindow::kMonthly:
      return "monthly";
    case StatsWindow::kAllTime:
      return "alltime";
  }
  return "alltime";
}

DateRange ResolveWindow(StatsWindow window, const CalendarDate& today) {
  switch (window) {
    case StatsWindow::kWeekly:
      return DateRange{today.AddDays(-static_cast<long>(today.Weekday())), today};
    case StatsWindow::kMonthly:
      return DateRange{CalendarDate{today.year, today.month, 1}, today};
    case StatsWindow::kAllTime:
      break;
  }
  return DateRange{kAllTimeStart, today};
}

double AverageOf(const AggregateRow& row) {
  if (row.games_played == 0) {
    return 0.0;
  }
  return static_cast<double>(row.total_score) / static_cast<double>(row.games_played);
}

StreakSummary ComputeStreak(std::vector<CalendarDate> play_dates) {
  StreakSummary summary;
  if (play_dates.empty()) {
    return summary;
  }
  std::vector<long> days;
  days.reserve(play_dates.size());
  for (const auto& date : play_dates) {
    days.push_back(date.ToDays());
  }
  std::sort(days.begin(), days.end());
  days.erase(std::unique(days.begin(), days.end()), days.end());

  int run = 1;
  summary.longest_streak = 1;
  for (std::size_t i = 1; i < days.size(); ++i) {
    run = days[i] - days[i - 1] == 1 ? run + 1 : 1;
    summary.longest_streak = std::max(summary.longest_streak, run);
  }
  // 루프가 끝난 시점의 run이 마지막 플레이 날짜로 끝나는 연속 구간이다.
  summary.current_streak = run;
  return summary;
}

std::vector<AggregateRow> RankStandings(std::vector<AggregateRow> rows) {
  rows.erase(std::remove_if(rows.begin(), rows.end(), [](const AggregateRow& row) { return row.games_played <= 0; }),
             rows.end());
  std::sort(rows.begin(), rows.end(), [](const AggregateRow& a, const AggregateRow& b) {
    if (a.total_score != b.total_score) {
      return a.total_score > b.total_score;
    }
    // a.total / a.games > b.total / b.games 를 교차곱으로 비교한다.
    long long lhs = static_cast<long long>(a.total_score) * b.games_played;
    long long rhs = static_cast<long long>(b.total_score) * a.games_played;
    if (lhs != rhs) {
      return lhs > rhs;
    }
    return a.participant.participant_id < b.participant.participant_id;
  });
  return rows;
}

StatsEngine::StatsEngine(std::shared_ptr<RoundResultRepository> repository, std::function<CalendarDate()> today)
    : repository_(std::move(repository)), today_(std::move(today)) {}

ParticipantStats StatsEngine::GetStats(std::uint64_t participant_id, StatsWindow window) const {
  auto row = repository_->AggregateParticipant(participant_id, WindowRange(window));
  ParticipantStats stats;
  if (row.games_played == 0) {
    return stats;
  }
  stats.games_played = row.games_played;
  stats.total_score = row.total_score;
  stats.average_score = AverageOf(row);
  stats.successful_games = row.successful_games;
  stats.first_game_date = row.first_game;
  stats.last_game_date = row.last_game;
  return stats;
}

std::vector<LeaderboardEntry> StatsEngine::GetLeaderboard(StatsWindow window, std::size_t limit) const {
  auto standings = RankStandings(repository_->AggregateAll(WindowRange(window)));
  if (standings.size() > limit) {
    standings.resize(limit);
  }

  std::vector<std::uint64_t> ids;
  ids.reserve(standings.size());
  for (const auto& row : standings) {
    ids.push_back(row.participant.participant_id);
  }
  auto play_dates = repository_->PlayDatesFor(ids);

  std::vector<LeaderboardEntry> entries;
  entries.reserve(standings.size());
  for (const auto& row : standings) {
    auto it = play_dates.find(row.participant.participant_id);
    StreakSummary streak = it == play_dates.end() ? StreakSummary{} : ComputeStreak(it->second);
    entries.push_back(LeaderboardEntry{row.participant, row.games_played, row.total_score, AverageOf(row),
                                       row.successful_games, streak.current_streak, streak.longest_streak});
  }
  return entries;
}

std::optional<std::size_t> StatsEngine::GetRank(std::uint64_t participant_id, StatsWindow window) const {
  auto standings = RankStandings(repository_->AggregateAll(WindowRange(window)));
  for (std::size_t i = 0; i < standings.size(); ++i) {
    if (standings[i].participant.participant_id == participant_id) {
      return i + 1;
    }
  }
  return std::nullopt;
}

StreakSummary StatsEngine::GetStreak(std::uint64_t participant_id) const {
  return ComputeStreak(repository_->PlayDates(participant_id));
}

}  // namespace wordle
