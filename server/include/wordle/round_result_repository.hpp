/*
 * 설명: 라운드 결과를 추가 전용으로 저장하고 중복을 DB 유니크 제약으로 차단하며 통계 집계를 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/migrations/001_init.sql
 * 테스트: server/tests/it/ingestion_it_test.cpp, server/tests/it/stats_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <mariadb/mysql.h>

#include "wordle/calendar_date.hpp"
#include "wordle/db_client.hpp"
#include "wordle/participant.hpp"

namespace wordle {

struct RoundResultRecord {
  std::uint64_t participant_id;
  int round_id;
  CalendarDate round_date;
  int attempt_count;
  bool succeeded;
  int score;
  std::chrono::system_clock::time_point created_at;
};

// 참가자 한 명의 기간 내 집계
struct AggregateRow {
  ParticipantRef participant;
  int games_played;
  int total_score;
  int successful_games;
  std::optional<CalendarDate> first_game;
  std::optional<CalendarDate> last_game;
};

class RoundResultRepository {
 public:
  explicit RoundResultRepository(std::shared_ptr<MariaDbClient> db_client);

  // 같은 (participant_id, round_id, round_date)가 이미 있으면 false
  bool InsertIfAbsent(MYSQL* conn, const RoundResultRecord& record);

  std::size_t Count() const;
  std::vector<RoundResultRecord> FindByParticipant(std::uint64_t participant_id) const;

  AggregateRow AggregateParticipant(std::uint64_t participant_id, const DateRange& range) const;
  std::vector<AggregateRow> AggregateAll(const DateRange& range) const;

  // 오름차순, 중복 없는 플레이 날짜
  std::vector<CalendarDate> PlayDates(std::uint64_t participant_id) const;
  std::unordered_map<std::uint64_t, std::vector<CalendarDate>> PlayDatesFor(
      const std::vector<std::uint64_t>& participant_ids) const;

 private:
  RoundResultRecord BuildRecord(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace wordle
