/*
 * 설명: 참가자 보장 -> 점수 계산 -> 결과 삽입을 한 트랜잭션으로 수행한다. 중복 키는 DB 제약이 판정한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/scoring_test.cpp, server/tests/it/ingestion_it_test.cpp
 */
#include "wordle/ingestion_gate.hpp"

#include <thread>

namespace wordle {

int ScoreFor(int attempt_count, bool succeeded) {
  if (!succeeded) {
    return kFailureScore;
  }
  return kScoreBase - attempt_count;
}

IngestionGate::IngestionGate(std::shared_ptr<MariaDbClient> db_client,
                             std::shared_ptr<ParticipantRepository> participants,
                             std::shared_ptr<RoundResultRepository> results)
    : db_client_(std::move(db_client)),
      participants_(std::move(participants)),
      results_(std::move(results)),
      clock_([] { return std::chrono::system_clock::now(); }) {}

IngestResult IngestionGate::Ingest(const std::vector<ParsedRecord>& records, int round_id,
                                   const CalendarDate& round_date, const std::string& group_id) {
  IngestResult result;
  for (const auto& record : records) {
    if (IngestOne(record, round_id, round_date, group_id)) {
      ++result.accepted_count;
    } else {
      ++result.rejected_count;
    }
  }
  return result;
}

bool IngestionGate::IngestOne(const ParsedRecord& record, int round_id, const CalendarDate& round_date,
                              const std::string& group_id) {
  // 같은 키를 동시에 수집하면 참가자 upsert끼리 교착할 수 있다.
  // 유니크 키가 레코드 단위 작업을 멱등으로 만들므로 다시 실행하면 중복으로 판정된다.
  for (int run = 1;; ++run) {
    try {
      return RunRecordTransaction(record, round_id, round_date, group_id);
    } catch (const DbException& ex) {
      if (!IsLockConflict(ex) || run >= kMaxLockConflictRuns) {
        throw;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10 * run));
    }
  }
}

bool IngestionGate::RunRecordTransaction(const ParsedRecord& record, int round_id, const CalendarDate& round_date,
                                         const std::string& group_id) {
  bool inserted = false;
  const bool committed = db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    participants_->UpsertInTx(conn, record.participant);
    participants_->RecordMembershipInTx(conn, group_id, record.participant.participant_id);

    RoundResultRecord row{record.participant.participant_id,
                          round_id,
                          round_date,
                          record.attempt_count,
                          record.succeeded,
                          ScoreFor(record.attempt_count, record.succeeded),
                          clock_()};
    inserted = results_->InsertIfAbsent(conn, row);
    // 중복이어도 참가자 갱신은 커밋한다.
    return true;
  });
  return committed && inserted;
}

}  // namespace wordle
