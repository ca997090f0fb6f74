#include <cstdlib>

#include <gtest/gtest.h>

#include "wordle/ingestion_gate.hpp"
#include "wordle/participant_repository.hpp"
#include "wordle/round_result_repository.hpp"
#include "wordle/schema.hpp"
#include "wordle/stats_engine.hpp"

namespace {

using wordle::CalendarDate;
using wordle::StatsWindow;

wordle::DbConfig TestDbConfig() {
  wordle::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

// 오늘은 2024-05-15(수). 주간 = 05-13..05-15, 월간 = 05-01..05-15
constexpr CalendarDate kToday{2024, 5, 15};

class StatsItFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<wordle::MariaDbClient>(TestDbConfig());
    wordle::ApplySchema(*db_client_);
    participants_ = std::make_shared<wordle::ParticipantRepository>(db_client_);
    results_ = std::make_shared<wordle::RoundResultRepository>(db_client_);
    participants_->ClearAll();
    gate_ = std::make_shared<wordle::IngestionGate>(db_client_, participants_, results_);
    engine_ = std::make_shared<wordle::StatsEngine>(results_, [] { return kToday; });

    // 1번: 주간 5+6, 월간 +1(X), 전체 +4
    Play(1, "one", CalendarDate{2024, 5, 14}, 3, true);
    Play(1, "one", CalendarDate{2024, 5, 15}, 2, true);
    Play(1, "one", CalendarDate{2024, 5, 1}, 6, false);
    Play(1, "one", CalendarDate{2024, 3, 10}, 4, true);
    // 2번: 주간 5+5+1 (총점은 같고 평균이 낮다)
    Play(2, "two", CalendarDate{2024, 5, 13}, 3, true);
    Play(2, "two", CalendarDate{2024, 5, 14}, 3, true);
    Play(2, "two", CalendarDate{2024, 5, 15}, 6, false);
    // 3번: 전체 기간 시작 전 기록만 있다.
    Play(3, "three", CalendarDate{2019, 12, 31}, 1, true);
  }

  void Play(std::uint64_t id, const std::string& handle, const CalendarDate& date, int attempts, bool succeeded) {
    wordle::ParsedRecord record{wordle::ParticipantRef{id, handle, ""}, attempts, succeeded, ""};
    auto result = gate_->Ingest({record}, static_cast<int>(date.ToDays()), date, "g1");
    ASSERT_EQ(result.accepted_count, 1);
  }

  std::shared_ptr<wordle::MariaDbClient> db_client_;
  std::shared_ptr<wordle::ParticipantRepository> participants_;
  std::shared_ptr<wordle::RoundResultRepository> results_;
  std::shared_ptr<wordle::IngestionGate> gate_;
  std::shared_ptr<wordle::StatsEngine> engine_;
};

}  // namespace

TEST_F(StatsItFixture, ParticipantStatsPerWindow) {
  auto weekly = engine_->GetStats(1, StatsWindow::kWeekly);
  EXPECT_EQ(weekly.games_played, 2);
  EXPECT_EQ(weekly.total_score, 11);
  EXPECT_DOUBLE_EQ(weekly.average_score, 5.5);
  EXPECT_EQ(weekly.successful_games, 2);
  ASSERT_TRUE(weekly.first_game_date.has_value());
  EXPECT_EQ(*weekly.first_game_date, (CalendarDate{2024, 5, 14}));
  EXPECT_EQ(*weekly.last_game_date, (CalendarDate{2024, 5, 15}));

  auto monthly = engine_->GetStats(1, StatsWindow::kMonthly);
  EXPECT_EQ(monthly.games_played, 3);
  EXPECT_EQ(monthly.total_score, 12);
  EXPECT_EQ(monthly.successful_games, 2);

  auto alltime = engine_->GetStats(1, StatsWindow::kAllTime);
  EXPECT_EQ(alltime.games_played, 4);
  EXPECT_EQ(alltime.total_score, 16);
}

TEST_F(StatsItFixture, EmptyWindowIsZeroed) {
  auto stats = engine_->GetStats(3, StatsWindow::kAllTime);
  EXPECT_EQ(stats.games_played, 0);
  EXPECT_EQ(stats.total_score, 0);
  EXPECT_DOUBLE_EQ(stats.average_score, 0.0);
  EXPECT_FALSE(stats.first_game_date.has_value());

  auto unknown = engine_->GetStats(404, StatsWindow::kWeekly);
  EXPECT_EQ(unknown.games_played, 0);
}

TEST_F(StatsItFixture, LeaderboardBreaksTieByAverage) {
  auto weekly = engine_->GetLeaderboard(StatsWindow::kWeekly, 10);
  ASSERT_EQ(weekly.size(), 2u);
  EXPECT_EQ(weekly[0].participant.participant_id, 1u);
  EXPECT_EQ(weekly[0].participant.handle, "one");
  EXPECT_EQ(weekly[0].total_score, 11);
  EXPECT_EQ(weekly[1].participant.participant_id, 2u);
  EXPECT_EQ(weekly[1].total_score, 11);
  EXPECT_LT(weekly[1].average_score, weekly[0].average_score);
}

TEST_F(StatsItFixture, LeaderboardExcludesEmptyAndTruncates) {
  auto alltime = engine_->GetLeaderboard(StatsWindow::kAllTime, 10);
  ASSERT_EQ(alltime.size(), 2u);
  for (const auto& entry : alltime) {
    EXPECT_NE(entry.participant.participant_id, 3u);
  }
  auto top = engine_->GetLeaderboard(StatsWindow::kAllTime, 1);
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].participant.participant_id, 1u);
}

TEST_F(StatsItFixture, LeaderboardCarriesStreaks) {
  auto weekly = engine_->GetLeaderboard(StatsWindow::kWeekly, 10);
  ASSERT_EQ(weekly.size(), 2u);
  EXPECT_EQ(weekly[0].current_streak, 2);
  EXPECT_EQ(weekly[0].longest_streak, 2);
  EXPECT_EQ(weekly[1].current_streak, 3);
  EXPECT_EQ(weekly[1].longest_streak, 3);
}

TEST_F(StatsItFixture, RankIsOneBased) {
  EXPECT_EQ(engine_->GetRank(1, StatsWindow::kWeekly), std::optional<std::size_t>(1));
  EXPECT_EQ(engine_->GetRank(2, StatsWindow::kWeekly), std::optional<std::size_t>(2));
  EXPECT_FALSE(engine_->GetRank(3, StatsWindow::kAllTime).has_value());
}

TEST_F(StatsItFixture, StreakOverWholeHistory) {
  auto streak = engine_->GetStreak(2);
  EXPECT_EQ(streak.current_streak, 3);
  EXPECT_EQ(streak.longest_streak, 3);
  auto none = engine_->GetStreak(404);
  EXPECT_EQ(none.current_streak, 0);
}
