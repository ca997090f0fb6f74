#include <gtest/gtest.h>

#include "wordle/message.hpp"
#include "wordle/message_ingestor.hpp"

namespace {

std::chrono::system_clock::time_point At(const std::string& iso) {
  std::chrono::system_clock::time_point tp;
  EXPECT_TRUE(wordle::ParseIsoTimestamp(iso, tp));
  return tp;
}

wordle::ChatMessage BotMessage(const std::string& body, const std::string& created_at) {
  wordle::ChatMessage message;
  message.message_id = "m1";
  message.group_id = "g1";
  message.content = body;
  message.author_name = "Wordle";
  message.author_is_bot = true;
  message.created_at = At(created_at);
  return message;
}

// 저장소에 닿기 전에 끝나는 경로만 검사하므로 게이트 없이 만든다.
wordle::MessageIngestor MakeIngestor() {
  wordle::MessageIngestor ingestor(wordle::ResultDetector(), wordle::DateResolver(), nullptr, nullptr, nullptr);
  ingestor.SetClock([] { return At("2024-05-15T12:00:00Z"); });
  return ingestor;
}

}  // namespace

TEST(MessageIngestorTest, RoundDateBeforeAllTimeStartRejected) {
  auto ingestor = MakeIngestor();
  auto outcome = ingestor.IngestMessage(BotMessage("Here are yesterday's results: No. 12\n3/6: <@1>",
                                                   "2019-03-02T07:00:00Z"));
  EXPECT_FALSE(outcome.ingested);
  EXPECT_EQ(outcome.status, wordle::IngestStatus::kOutOfRange);
  ASSERT_TRUE(outcome.round.has_value());
  EXPECT_EQ(outcome.round->round_date, (wordle::CalendarDate{2019, 3, 1}));
  EXPECT_STREQ(wordle::IngestStatusName(outcome.status), "out_of_range");
}

TEST(MessageIngestorTest, RoundDateAfterTodayRejected) {
  auto ingestor = MakeIngestor();
  auto outcome = ingestor.IngestMessage(BotMessage("Here are yesterday's results: No. 1300\n3/6: <@1>",
                                                   "2024-05-17T07:00:00Z"));
  EXPECT_FALSE(outcome.ingested);
  EXPECT_EQ(outcome.status, wordle::IngestStatus::kOutOfRange);
  EXPECT_EQ(outcome.accepted_results, 0);
}

TEST(MessageIngestorTest, NonResultsAndUnparseableReportedWithoutStore) {
  auto ingestor = MakeIngestor();
  auto chatter = BotMessage("good morning", "2024-05-15T07:00:00Z");
  chatter.author_is_bot = false;
  EXPECT_EQ(ingestor.IngestMessage(chatter).status, wordle::IngestStatus::kNotResults);

  auto unparseable = ingestor.IngestMessage(BotMessage("Here are yesterday's results: No. 5\nnobody played",
                                                       "2024-05-15T07:00:00Z"));
  EXPECT_FALSE(unparseable.ingested);
  EXPECT_EQ(unparseable.status, wordle::IngestStatus::kUnparseable);
}
