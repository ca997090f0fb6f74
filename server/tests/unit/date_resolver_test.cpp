#include <gtest/gtest.h>

#include "wordle/date_resolver.hpp"
#include "wordle/message.hpp"

namespace {

std::chrono::system_clock::time_point At(const std::string& iso) {
  std::chrono::system_clock::time_point tp;
  EXPECT_TRUE(wordle::ParseIsoTimestamp(iso, tp));
  return tp;
}

}  // namespace

TEST(DateResolverTest, RoundDateIsPreviousUtcDay) {
  wordle::DateResolver resolver;
  auto key = resolver.Resolve(At("2024-05-01T00:30:00Z"), "No. 1046");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->round_id, 1046);
  EXPECT_EQ(key->round_date, (wordle::CalendarDate{2024, 4, 30}));
}

TEST(DateResolverTest, DerivesRoundFromEpoch) {
  wordle::DateResolver resolver;
  // 기준일 + 100일이 라운드 날짜가 되도록 다음 날 게시한다.
  auto key = resolver.Resolve(At("2021-09-28T07:00:00Z"), "<@1> 3/6");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->round_id, 100);
  EXPECT_EQ(key->round_date, (wordle::CalendarDate{2021, 9, 27}));
}

TEST(DateResolverTest, EpochDayIsRoundZero) {
  wordle::DateResolver resolver;
  EXPECT_EQ(resolver.DeriveRoundId(wordle::DateResolver::kDefaultEpoch), 0);
}

TEST(DateResolverTest, BeforeEpochFails) {
  wordle::DateResolver resolver;
  EXPECT_FALSE(resolver.Resolve(At("2021-06-19T12:00:00Z"), "3/6").has_value());
  EXPECT_FALSE(resolver.DeriveRoundId(wordle::CalendarDate{2020, 1, 1}).has_value());
}

TEST(DateResolverTest, CustomEpoch) {
  wordle::DateResolver resolver(wordle::CalendarDate{2024, 1, 1});
  EXPECT_EQ(resolver.DeriveRoundId(wordle::CalendarDate{2024, 1, 11}), 10);
  EXPECT_EQ(resolver.Epoch(), (wordle::CalendarDate{2024, 1, 1}));
}

TEST(DateResolverTest, MarkerWinsOverEpoch) {
  wordle::DateResolver resolver;
  auto key = resolver.Resolve(At("2021-09-28T07:00:00Z"), "Wordle No. 5");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->round_id, 5);
}
