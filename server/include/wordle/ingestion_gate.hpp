/*
 * 설명: 파싱된 결과에 점수를 매기고 참가자 upsert와 결과 저장을 레코드 단위 트랜잭션으로 묶는다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/scoring_test.cpp, server/tests/it/ingestion_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "wordle/calendar_date.hpp"
#include "wordle/db_client.hpp"
#include "wordle/participant_repository.hpp"
#include "wordle/result_parser.hpp"
#include "wordle/round_result_repository.hpp"

namespace wordle {

constexpr int kFailureScore = 1;
// 레코드 하나를 락 충돌로 다시 실행하는 최대 횟수. DB_MAX_ATTEMPTS와 별개다.
constexpr int kMaxLockConflictRuns = 5;
constexpr int kScoreBase = 8;

// 성공: 8 - 시도 횟수, 실패(X): 1
int ScoreFor(int attempt_count, bool succeeded);

struct IngestResult {
  int accepted_count{0};
  int rejected_count{0};
};

class IngestionGate {
 public:
  IngestionGate(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<ParticipantRepository> participants,
                std::shared_ptr<RoundResultRepository> results);

  // DB 오류는 DbException으로 전파된다. 중복은 rejected_count로 집계된다.
  IngestResult Ingest(const std::vector<ParsedRecord>& records, int round_id, const CalendarDate& round_date,
                      const std::string& group_id = "");

  void SetClock(std::function<std::chrono::system_clock::time_point()> clock) { clock_ = std::move(clock); }

 private:
  bool IngestOne(const ParsedRecord& record, int round_id, const CalendarDate& round_date, const std::string& group_id);
  bool RunRecordTransaction(const ParsedRecord& record, int round_id, const CalendarDate& round_date,
                            const std::string& group_id);

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<ParticipantRepository> participants_;
  std::shared_ptr<RoundResultRepository> results_;
  std::function<std::chrono::system_clock::time_point()> clock_;
};

}  // namespace wordle
