/*
 * 설명: 메시지 수집 파이프라인과 백필을 구현한다. 판별/파싱 실패는 예외가 아닌 결과로 보고한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ingestion_it_test.cpp, server/tests/e2e/api_flow_test.cpp, server/tests/unit/message_ingestor_test.cpp
 */
#include "wordle/message_ingestor.hpp"

#include <algorithm>

#include "wordle/result_parser.hpp"
#include "wordle/roster_resolver.hpp"
#include "wordle/stats_engine.hpp"
#include "wordle/text_extractor.hpp"

namespace wordle {

const char* IngestStatusName(IngestStatus status) {
  switch (status) {
    case IngestStatus::kNotResults:
      return "not_results";
    case IngestStatus::kUnparseable:
      return "unparseable";
    case IngestStatus::kNoRoundId:
      return "no_round_id";
    case IngestStatus::kOutOfRange:
      return "out_of_range";
    case IngestStatus::kIngested:
      return "ingested";
  }
  return "not_results";
}

MessageIngestor::MessageIngestor(ResultDetector detector, DateResolver date_resolver,
                                 std::shared_ptr<IngestionGate> gate, std::shared_ptr<ParticipantRepository> directory,
                                 std::shared_ptr<Observability> observability)
    : detector_(std::move(detector)),
      date_resolver_(date_resolver),
      gate_(std::move(gate)),
      directory_(std::move(directory)),
      observability_(std::move(observability)),
      clock_([] { return std::chrono::system_clock::now(); }) {}

IngestOutcome MessageIngestor::IngestMessage(const ChatMessage& message) {
  IngestOutcome outcome;
  const std::string corpus = BuildCorpus(message);
  if (!detector_.IsResultMessage(corpus, message.author_is_bot, message.author_name)) {
    if (observability_) {
      observability_->RecordMessage(false, 0, 0);
    }
    LogOutcome(message, outcome, LogLevel::kDebug);
    return outcome;
  }

  RosterResolver resolver(message.roster, directory_);
  auto records = ParseResults(corpus, resolver, message.group_id);
  if (records.empty()) {
    outcome.status = IngestStatus::kUnparseable;
    if (observability_) {
      observability_->RecordMessage(false, 0, 0);
    }
    LogOutcome(message, outcome, LogLevel::kWarn);
    return outcome;
  }

  auto round = date_resolver_.Resolve(message.created_at, corpus);
  if (!round) {
    outcome.status = IngestStatus::kNoRoundId;
    if (observability_) {
      observability_->RecordMessage(false, 0, 0);
    }
    LogOutcome(message, outcome, LogLevel::kWarn);
    return outcome;
  }

  // 통계 창(전체 기간 시작일..오늘)에 들어오지 않는 날짜는 저장하지 않는다.
  if (round->round_date < kAllTimeStart || UtcDateOf(clock_()) < round->round_date) {
    outcome.status = IngestStatus::kOutOfRange;
    outcome.round = round;
    if (observability_) {
      observability_->RecordMessage(false, 0, 0);
    }
    LogOutcome(message, outcome, LogLevel::kWarn);
    return outcome;
  }

  auto result = gate_->Ingest(records, round->round_id, round->round_date, message.group_id);
  outcome.ingested = true;
  outcome.status = IngestStatus::kIngested;
  outcome.accepted_results = result.accepted_count;
  outcome.rejected_results = result.rejected_count;
  outcome.round = round;
  if (observability_) {
    observability_->RecordMessage(true, result.accepted_count, result.rejected_count);
  }
  LogOutcome(message, outcome, result.accepted_count > 0 ? LogLevel::kInfo : LogLevel::kWarn);
  return outcome;
}

BackfillReport MessageIngestor::Backfill(const std::vector<ChatMessage>& messages, int days,
                                         std::chrono::system_clock::time_point now) {
  const int clamped = std::max(kMinBackfillDays, std::min(days, kMaxBackfillDays));
  const auto after = now - std::chrono::hours(24 * clamped);

  BackfillReport report;
  for (const auto& message : messages) {
    if (message.created_at < after) {
      continue;
    }
    ++report.scanned;
    auto outcome = IngestMessage(message);
    if (outcome.ingested) {
      ++report.processed_messages;
      report.added_results += outcome.accepted_results;
    }
  }
  if (observability_) {
    observability_->Log(LogContext{observability_->NextTraceId(), std::nullopt, std::nullopt, "backfill.completed", 0,
                                   LogLevel::kInfo,
                                   {{"days", clamped},
                                    {"scanned", report.scanned},
                                    {"processedMessages", report.processed_messages},
                                    {"addedResults", report.added_results}}});
  }
  return report;
}

void MessageIngestor::LogOutcome(const ChatMessage& message, const IngestOutcome& outcome, LogLevel level) const {
  if (!observability_) {
    return;
  }
  nlohmann::json detail{{"status", IngestStatusName(outcome.status)},
                        {"accepted", outcome.accepted_results},
                        {"rejected", outcome.rejected_results}};
  if (outcome.round) {
    detail["roundId"] = outcome.round->round_id;
    detail["roundDate"] = outcome.round->round_date.ToString();
  }
  if (!message.group_id.empty()) {
    detail["groupId"] = message.group_id;
  }
  observability_->Log(LogContext{observability_->NextTraceId(), message.message_id, std::nullopt, "ingest.message", 0,
                                 level, detail});
}

}  // namespace wordle
