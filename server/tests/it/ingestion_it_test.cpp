#include <atomic>
#include <chrono>
#include <cstdlib>
#include <sstream>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "wordle/ingestion_gate.hpp"
#include "wordle/message.hpp"
#include "wordle/message_ingestor.hpp"
#include "wordle/participant_repository.hpp"
#include "wordle/round_result_repository.hpp"
#include "wordle/schema.hpp"

namespace {

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

std::chrono::system_clock::time_point At(const std::string& iso) {
  std::chrono::system_clock::time_point tp;
  EXPECT_TRUE(wordle::ParseIsoTimestamp(iso, tp));
  return tp;
}

wordle::ChatMessage ResultsMessage(const std::string& body, const std::string& created_at,
                                   const std::string& group_id = "g1") {
  wordle::ChatMessage message;
  message.message_id = "m-" + created_at;
  message.group_id = group_id;
  message.content = body;
  message.author_name = "Wordle";
  message.author_is_bot = true;
  message.created_at = At(created_at);
  return message;
}

class IngestionItFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<wordle::MariaDbClient>(TestDbConfig());
    wordle::ApplySchema(*db_client_);
    participants_ = std::make_shared<wordle::ParticipantRepository>(db_client_);
    results_ = std::make_shared<wordle::RoundResultRepository>(db_client_);
    participants_->ClearAll();
    gate_ = std::make_shared<wordle::IngestionGate>(db_client_, participants_, results_);
    observability_ = std::make_shared<wordle::Observability>(wordle::LogLevel::kError, &log_sink_);
    ingestor_ = std::make_shared<wordle::MessageIngestor>(wordle::ResultDetector(), wordle::DateResolver(), gate_,
                                                          participants_, observability_);
  }

  std::ostringstream log_sink_;
  std::shared_ptr<wordle::MariaDbClient> db_client_;
  std::shared_ptr<wordle::ParticipantRepository> participants_;
  std::shared_ptr<wordle::RoundResultRepository> results_;
  std::shared_ptr<wordle::IngestionGate> gate_;
  std::shared_ptr<wordle::Observability> observability_;
  std::shared_ptr<wordle::MessageIngestor> ingestor_;
};

}  // namespace

TEST_F(IngestionItFixture, SameMessageTwiceStoresOneRow) {
  auto message = ResultsMessage("Here are yesterday's results: No. 1234\n3/6: <@!42>", "2024-05-01T07:00:00Z");

  auto first = ingestor_->IngestMessage(message);
  EXPECT_TRUE(first.ingested);
  EXPECT_EQ(first.accepted_results, 1);
  EXPECT_EQ(first.rejected_results, 0);

  auto second = ingestor_->IngestMessage(message);
  EXPECT_TRUE(second.ingested);
  EXPECT_EQ(second.accepted_results, 0);
  EXPECT_EQ(second.rejected_results, 1);

  auto rows = results_->FindByParticipant(42);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].round_id, 1234);
  EXPECT_EQ(rows[0].round_date, (wordle::CalendarDate{2024, 4, 30}));
  EXPECT_EQ(rows[0].attempt_count, 3);
  EXPECT_TRUE(rows[0].succeeded);
  EXPECT_EQ(rows[0].score, 5);
  EXPECT_EQ(results_->Count(), 1u);
}

TEST_F(IngestionItFixture, FailureStoredWithScoreOne) {
  auto outcome = ingestor_->IngestMessage(ResultsMessage("<@!7> X/6", "2024-05-02T07:00:00Z"));
  ASSERT_TRUE(outcome.ingested);
  auto rows = results_->FindByParticipant(7);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].attempt_count, 6);
  EXPECT_FALSE(rows[0].succeeded);
  EXPECT_EQ(rows[0].score, 1);
}

TEST_F(IngestionItFixture, NonResultsLeaveNoTrace) {
  auto chatter = ResultsMessage("good morning", "2024-05-02T07:00:00Z");
  chatter.author_is_bot = false;
  auto outcome = ingestor_->IngestMessage(chatter);
  EXPECT_FALSE(outcome.ingested);
  EXPECT_EQ(outcome.status, wordle::IngestStatus::kNotResults);

  auto unparseable = ingestor_->IngestMessage(ResultsMessage("Here are yesterday's results: No. 5\nnobody played",
                                                             "2024-05-02T07:00:00Z"));
  EXPECT_FALSE(unparseable.ingested);
  EXPECT_EQ(unparseable.status, wordle::IngestStatus::kUnparseable);

  auto early = ingestor_->IngestMessage(ResultsMessage("<@1> 3/6", "2021-06-01T07:00:00Z"));
  EXPECT_FALSE(early.ingested);
  EXPECT_EQ(early.status, wordle::IngestStatus::kNoRoundId);

  EXPECT_EQ(results_->Count(), 0u);
  EXPECT_EQ(participants_->Count(), 0u);
}

TEST_F(IngestionItFixture, ConcurrentDeliveriesInsertOnce) {
  // 기본 설정(DB_MAX_ATTEMPTS=1) 그대로 동시 수집한다.
  ASSERT_EQ(TestDbConfig().max_attempts, 1u);
  auto& ingestor = *ingestor_;

  auto message = ResultsMessage("Here are yesterday's results: No. 900\n2/6: <@11> <@12>", "2024-05-03T07:00:00Z");
  std::atomic<int> accepted{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&]() {
      auto outcome = ingestor.IngestMessage(message);
      accepted += outcome.accepted_results;
      rejected += outcome.rejected_results;
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(accepted.load(), 2);
  EXPECT_EQ(rejected.load(), 10);
  EXPECT_EQ(results_->Count(), 2u);
}

TEST_F(IngestionItFixture, RepeatedLineInOneMessageRejectedAsDuplicate) {
  auto outcome = ingestor_->IngestMessage(ResultsMessage(
      "Here are yesterday's results: Wordle No. 1234\n<@!42> 3/6\n<@!42> 3/6", "2024-05-01T07:00:00Z"));
  EXPECT_TRUE(outcome.ingested);
  EXPECT_EQ(outcome.accepted_results, 1);
  EXPECT_EQ(outcome.rejected_results, 1);

  auto rows = results_->FindByParticipant(42);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].round_id, 1234);
  EXPECT_EQ(rows[0].round_date, (wordle::CalendarDate{2024, 4, 30}));
  EXPECT_EQ(rows[0].attempt_count, 3);
  EXPECT_TRUE(rows[0].succeeded);
  EXPECT_EQ(rows[0].score, 5);
  EXPECT_EQ(results_->Count(), 1u);
}

TEST_F(IngestionItFixture, LockConflictRerunsRecordWithoutClientRetry) {
  std::atomic<int> runs{0};
  db_client_->SetTransientInjector([&runs](std::size_t) { return runs.fetch_add(1) == 0; });

  auto outcome = ingestor_->IngestMessage(ResultsMessage("Here are yesterday's results: No. 77\n4/6: <@8>",
                                                         "2024-05-02T07:00:00Z"));
  EXPECT_TRUE(outcome.ingested);
  EXPECT_EQ(outcome.accepted_results, 1);
  EXPECT_EQ(runs.load(), 2);
  EXPECT_EQ(results_->FindByParticipant(8).size(), 1u);
}

TEST_F(IngestionItFixture, PersistentLockConflictPropagates) {
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  try {
    ingestor_->IngestMessage(ResultsMessage("4/6: <@8>", "2024-05-02T07:00:00Z"));
    FAIL() << "DbException이 전파되어야 한다";
  } catch (const wordle::DbException& ex) {
    EXPECT_EQ(ex.code, wordle::kDeadlock);
  }
  db_client_->SetTransientInjector(nullptr);
  EXPECT_EQ(results_->Count(), 0u);
}

TEST_F(IngestionItFixture, RosterNamesCachedAndEmptyNamesKeepCache) {
  auto message = ResultsMessage("4/6: <@42>", "2024-05-04T07:00:00Z");
  message.roster.push_back(wordle::ParticipantRef{42, "kim", "Kim J"});
  ASSERT_TRUE(ingestor_->IngestMessage(message).ingested);

  // 구성원 정보 없이 다시 관찰되어도 저장된 이름을 유지한다.
  ASSERT_TRUE(ingestor_->IngestMessage(ResultsMessage("5/6: <@42>", "2024-05-05T07:00:00Z")).ingested);
  auto stored = participants_->Find(42);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->handle, "kim");
  EXPECT_EQ(stored->display_name, "Kim J");
}

TEST_F(IngestionItFixture, BareNamesResolvedThroughGroupDirectory) {
  auto seed = ResultsMessage("4/6: <@42>", "2024-05-04T07:00:00Z", "g1");
  seed.roster.push_back(wordle::ParticipantRef{42, "kim", "Kim J"});
  ASSERT_TRUE(ingestor_->IngestMessage(seed).ingested);

  auto same_group = ingestor_->IngestMessage(ResultsMessage("3/6: @Kim", "2024-05-05T07:00:00Z", "g1"));
  EXPECT_TRUE(same_group.ingested);
  EXPECT_EQ(same_group.accepted_results, 1);

  auto other_group = ingestor_->IngestMessage(ResultsMessage("3/6: @kim", "2024-05-06T07:00:00Z", "g2"));
  EXPECT_FALSE(other_group.ingested);
  EXPECT_EQ(other_group.status, wordle::IngestStatus::kUnparseable);

  EXPECT_EQ(results_->FindByParticipant(42).size(), 2u);
}

TEST_F(IngestionItFixture, BackfillSkipsOldMessagesAndIsIdempotent) {
  auto now = At("2024-05-10T12:00:00Z");
  std::vector<wordle::ChatMessage> history{
      ResultsMessage("No. 1050 here are yesterday's results\n2/6: <@1>", "2024-05-09T07:00:00Z"),
      ResultsMessage("2/6: <@1>", "2024-05-08T07:00:00Z"),
      ResultsMessage("just chatting", "2024-05-08T08:00:00Z"),
      ResultsMessage("2/6: <@1>", "2024-04-01T07:00:00Z"),
  };
  history[2].author_is_bot = false;

  auto report = ingestor_->Backfill(history, 7, now);
  EXPECT_EQ(report.scanned, 3);
  EXPECT_EQ(report.processed_messages, 2);
  EXPECT_EQ(report.added_results, 2);

  auto again = ingestor_->Backfill(history, 7, now);
  EXPECT_EQ(again.processed_messages, 2);
  EXPECT_EQ(again.added_results, 0);
  EXPECT_EQ(results_->Count(), 2u);
}

TEST_F(IngestionItFixture, BackfillDaysClamped) {
  auto now = At("2024-05-10T12:00:00Z");
  std::vector<wordle::ChatMessage> history{ResultsMessage("2/6: <@1>", "2024-03-20T07:00:00Z")};
  EXPECT_EQ(ingestor_->Backfill(history, 1000, now).scanned, 1);
  EXPECT_EQ(ingestor_->Backfill(history, 0, now).scanned, 0);
}

TEST_F(IngestionItFixture, UnreachableStoreRaises) {
  auto cfg = TestDbConfig();
  cfg.port = 1;
  auto broken = std::make_shared<wordle::MariaDbClient>(cfg);
  auto broken_participants = std::make_shared<wordle::ParticipantRepository>(broken);
  auto broken_results = std::make_shared<wordle::RoundResultRepository>(broken);
  auto broken_gate = std::make_shared<wordle::IngestionGate>(broken, broken_participants, broken_results);
  wordle::MessageIngestor ingestor(wordle::ResultDetector(), wordle::DateResolver(), broken_gate, broken_participants,
                                   observability_);
  EXPECT_THROW(ingestor.IngestMessage(ResultsMessage("3/6: <@5>", "2024-05-02T07:00:00Z")), wordle::DbException);
}
