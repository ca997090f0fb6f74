/*
 * 설명: round_results 테이블 저장과 기간별 집계 쿼리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/migrations/001_init.sql
 * 테스트: server/tests/it/ingestion_it_test.cpp, server/tests/it/stats_it_test.cpp
 */
#include "wordle/round_result_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "wordle/message.hpp"

namespace wordle {
namespace {
int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
std::uint64_t ToId(const char* value) { return value ? std::stoull(value) : 0; }

std::optional<CalendarDate> ToDate(const char* value) {
  if (!value) {
    return std::nullopt;
  }
  return CalendarDate::Parse(value);
}

std::chrono::system_clock::time_point ParseTimestamp(const char* value) {
  std::chrono::system_clock::time_point tp{};
  if (!value) {
    return tp;
  }
  std::string text = value;
  if (text.size() > 10 && text[10] == ' ') {
    text[10] = 'T';
  }
  if (!ParseIsoTimestamp(text, tp)) {
    return std::chrono::system_clock::time_point{};
  }
  return tp;
}

std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string RangeClause(const DateRange& range) {
  return "round_date BETWEEN '" + range.from.ToString() + "' AND '" + range.to.ToString() + "'";
}

constexpr unsigned int kDuplicateEntry = 1062;
}  // namespace

RoundResultRepository::RoundResultRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

bool RoundResultRepository::InsertIfAbsent(MYSQL* conn, const RoundResultRecord& record) {
  std::ostringstream oss;
  oss << "INSERT INTO round_results(participant_id, round_id, round_date, attempt_count, succeeded, score, created_at)"
      << " VALUES(" << record.participant_id << ", " << record.round_id << ", '" << record.round_date.ToString()
      << "', " << record.attempt_count << ", " << (record.succeeded ? 1 : 0) << ", " << record.score << ", '"
      << ToTimestamp(record.created_at) << "');";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "라운드 결과 저장 실패");
  }
  return true;
}

std::size_t RoundResultRepository::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "SELECT COUNT(*) FROM round_results;", "결과 카운트 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "카운트 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      count = static_cast<std::size_t>(std::stoull(row[0]));
    }
    mysql_free_result(res);
  });
  return count;
}

std::vector<RoundResultRecord> RoundResultRepository::FindByParticipant(std::uint64_t participant_id) const {
  std::vector<RoundResultRecord> records;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT participant_id, round_id, round_date, attempt_count, succeeded, score, created_at"
        << " FROM round_results WHERE participant_id=" << participant_id << " ORDER BY round_date ASC, round_id ASC;";
    db_client_->Execute(conn, oss.str(), "결과 조회 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "결과 조회 결과 없음");
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
      records.push_back(BuildRecord(row));
    }
    mysql_free_result(res);
  });
  return records;
}

AggregateRow RoundResultRepository::AggregateParticipant(std::uint64_t participant_id, const DateRange& range) const {
  AggregateRow aggregate{ParticipantRef{participant_id, "", ""}, 0, 0, 0, std::nullopt, std::nullopt};
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COUNT(*), COALESCE(SUM(score), 0), COALESCE(SUM(succeeded), 0), MIN(round_date), MAX(round_date)"
        << " FROM round_results WHERE participant_id=" << participant_id << " AND " << RangeClause(range) << ";";
    db_client_->Execute(conn, oss.str(), "참가자 집계 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "참가자 집계 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      aggregate.games_played = ToInt(row[0]);
      aggregate.total_score = ToInt(row[1]);
      aggregate.successful_games = ToInt(row[2]);
      aggregate.first_game = ToDate(row[3]);
      aggregate.last_game = ToDate(row[4]);
    }
    mysql_free_result(res);
  });
  return aggregate;
}

std::vector<AggregateRow> RoundResultRepository::AggregateAll(const DateRange& range) const {
  std::vector<AggregateRow> rows;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT p.participant_id, p.handle, p.display_name, COUNT(*), SUM(r.score), SUM(r.succeeded),"
        << " MIN(r.round_date), MAX(r.round_date)"
        << " FROM round_results r JOIN participants p ON p.participant_id = r.participant_id"
        << " WHERE r." << RangeClause(range)
        << " GROUP BY p.participant_id, p.handle, p.display_name;";
    db_client_->Execute(conn, oss.str(), "리더보드 집계 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "리더보드 집계 결과 없음");
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
      rows.push_back(AggregateRow{ParticipantRef{ToId(row[0]), row[1] ? row[1] : "", row[2] ? row[2] : ""},
                                  ToInt(row[3]), ToInt(row[4]), ToInt(row[5]), ToDate(row[6]), ToDate(row[7])});
    }
    mysql_free_result(res);
  });
  return rows;
}

std::vector<CalendarDate> RoundResultRepository::PlayDates(std::uint64_t participant_id) const {
  auto by_participant = PlayDatesFor({participant_id});
  auto it = by_participant.find(participant_id);
  if (it == by_participant.end()) {
    return {};
  }
  return it->second;
}

std::unordered_map<std::uint64_t, std::vector<CalendarDate>> RoundResultRepository::PlayDatesFor(
    const std::vector<std::uint64_t>& participant_ids) const {
  std::unordered_map<std::uint64_t, std::vector<CalendarDate>> dates;
  if (participant_ids.empty()) {
    return dates;
  }
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT DISTINCT participant_id, round_date FROM round_results WHERE participant_id IN (";
    for (std::size_t i = 0; i < participant_ids.size(); ++i) {
      oss << (i == 0 ? "" : ",") << participant_ids[i];
    }
    oss << ") ORDER BY participant_id ASC, round_date ASC;";
    db_client_->Execute(conn, oss.str(), "플레이 날짜 조회 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "플레이 날짜 결과 없음");
    }
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
      if (auto date = ToDate(row[1])) {
        dates[ToId(row[0])].push_back(*date);
      }
    }
    mysql_free_result(res);
  });
  return dates;
}

RoundResultRecord RoundResultRepository::BuildRecord(MYSQL_ROW row) const {
  auto date = ToDate(row[2]);
  return RoundResultRecord{ToId(row[0]),
                           ToInt(row[1]),
                           date.value_or(CalendarDate{1970, 1, 1}),
                           ToInt(row[3]),
                           ToInt(row[4]) != 0,
                           ToInt(row[5]),
                           ParseTimestamp(row[6])};
}

}  // namespace wordle
