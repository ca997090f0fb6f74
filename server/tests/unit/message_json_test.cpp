#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "wordle/message.hpp"

TEST(MessageJsonTest, ParsesFullMessage) {
  auto body = nlohmann::json::parse(R"({
    "id": "1100",
    "groupId": 555,
    "content": "Here are yesterday's results:",
    "authorName": "Wordle",
    "authorIsBot": true,
    "createdAt": "2024-05-01T07:00:00.123Z",
    "embeds": [{"title": "No. 1046", "fields": [{"name": "3/6", "value": "<@42>"}]}],
    "members": [{"id": "42", "handle": "kim", "displayName": "Kim J"}, {"id": 7}]
  })");
  auto message = wordle::ParseChatMessage(body);
  EXPECT_EQ(message.message_id, "1100");
  EXPECT_EQ(message.group_id, "555");
  EXPECT_TRUE(message.author_is_bot);
  ASSERT_EQ(message.blocks.size(), 1u);
  EXPECT_EQ(message.blocks[0].title, "No. 1046");
  ASSERT_EQ(message.blocks[0].fields.size(), 1u);
  EXPECT_EQ(message.blocks[0].fields[0].value, "<@42>");
  ASSERT_EQ(message.roster.size(), 2u);
  EXPECT_EQ(message.roster[0].participant_id, 42u);
  EXPECT_EQ(message.roster[0].display_name, "Kim J");
  EXPECT_EQ(message.roster[1].participant_id, 7u);
  EXPECT_EQ(wordle::ToIsoString(message.created_at), "2024-05-01T07:00:00Z");
}

TEST(MessageJsonTest, MissingCreatedAtRejected) {
  auto body = nlohmann::json::parse(R"({"content": "hi"})");
  EXPECT_THROW(wordle::ParseChatMessage(body), std::invalid_argument);
}

TEST(MessageJsonTest, WrongFieldTypesRejected) {
  EXPECT_THROW(wordle::ParseChatMessage(nlohmann::json::array()), std::invalid_argument);
  EXPECT_THROW(wordle::ParseChatMessage(nlohmann::json::parse(
                   R"({"createdAt": "2024-05-01T07:00:00Z", "content": 5})")),
               std::invalid_argument);
  EXPECT_THROW(wordle::ParseChatMessage(nlohmann::json::parse(
                   R"({"createdAt": "2024-05-01T07:00:00Z", "embeds": {}})")),
               std::invalid_argument);
  EXPECT_THROW(wordle::ParseChatMessage(nlohmann::json::parse(
                   R"({"createdAt": "2024-05-01T07:00:00Z", "members": [{"id": "abc"}]})")),
               std::invalid_argument);
}

TEST(MessageJsonTest, TimestampOffsets) {
  std::chrono::system_clock::time_point utc;
  std::chrono::system_clock::time_point shifted;
  ASSERT_TRUE(wordle::ParseIsoTimestamp("2024-05-01T07:00:00Z", utc));
  ASSERT_TRUE(wordle::ParseIsoTimestamp("2024-05-01T16:00:00+09:00", shifted));
  EXPECT_EQ(utc, shifted);
  EXPECT_FALSE(wordle::ParseIsoTimestamp("2024-05-01 07:00", utc));
  EXPECT_FALSE(wordle::ParseIsoTimestamp("2024-05-01T07:00:00 UTC", utc));
}

TEST(MessageJsonTest, IsoFormattingIsStableAcrossThreads) {
  const std::vector<std::string> expected{"2024-05-01T07:00:00Z", "1999-12-31T23:59:59Z", "2030-01-02T03:04:05Z",
                                          "2021-06-19T00:00:00Z"};
  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (const auto& iso : expected) {
    threads.emplace_back([&mismatches, iso]() {
      std::chrono::system_clock::time_point tp;
      if (!wordle::ParseIsoTimestamp(iso, tp)) {
        ++mismatches;
        return;
      }
      for (int i = 0; i < 2000; ++i) {
        if (wordle::ToIsoString(tp) != iso) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(mismatches.load(), 0);
}
