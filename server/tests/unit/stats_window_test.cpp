#include <gtest/gtest.h>

#include "wordle/stats_engine.hpp"

using wordle::CalendarDate;
using wordle::StatsWindow;

TEST(StatsWindowTest, WeeklyStartsMonday) {
  auto range = wordle::ResolveWindow(StatsWindow::kWeekly, CalendarDate{2024, 5, 1});
  EXPECT_EQ(range.from, (CalendarDate{2024, 4, 29}));
  EXPECT_EQ(range.to, (CalendarDate{2024, 5, 1}));

  auto monday = wordle::ResolveWindow(StatsWindow::kWeekly, CalendarDate{2024, 4, 29});
  EXPECT_EQ(monday.from, (CalendarDate{2024, 4, 29}));

  auto sunday = wordle::ResolveWindow(StatsWindow::kWeekly, CalendarDate{2024, 5, 5});
  EXPECT_EQ(sunday.from, (CalendarDate{2024, 4, 29}));
}

TEST(StatsWindowTest, MonthlyStartsOnFirst) {
  auto range = wordle::ResolveWindow(StatsWindow::kMonthly, CalendarDate{2024, 2, 29});
  EXPECT_EQ(range.from, (CalendarDate{2024, 2, 1}));
  EXPECT_EQ(range.to, (CalendarDate{2024, 2, 29}));
}

TEST(StatsWindowTest, AllTimeStartsBeforeAnyData) {
  auto range = wordle::ResolveWindow(StatsWindow::kAllTime, CalendarDate{2024, 5, 1});
  EXPECT_EQ(range.from, (CalendarDate{2020, 1, 1}));
}

TEST(StatsWindowTest, ParseAndName) {
  EXPECT_EQ(wordle::ParseWindow("weekly"), StatsWindow::kWeekly);
  EXPECT_EQ(wordle::ParseWindow("monthly"), StatsWindow::kMonthly);
  EXPECT_EQ(wordle::ParseWindow("alltime"), StatsWindow::kAllTime);
  EXPECT_FALSE(wordle::ParseWindow("yearly").has_value());
  EXPECT_EQ(wordle::WindowName(StatsWindow::kAllTime), "alltime");
}

TEST(StatsWindowTest, EngineUsesInjectedToday) {
  wordle::StatsEngine engine(nullptr, [] { return CalendarDate{2024, 5, 15}; });
  auto range = engine.WindowRange(StatsWindow::kMonthly);
  EXPECT_EQ(range.from, (CalendarDate{2024, 5, 1}));
  EXPECT_EQ(range.to, (CalendarDate{2024, 5, 15}));
}
