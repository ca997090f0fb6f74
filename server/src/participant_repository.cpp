/*
 * 설명: participants/group_members 테이블 접근을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/migrations/001_init.sql
 * 테스트: server/tests/it/ingestion_it_test.cpp
 */
#include "wordle/participant_repository.hpp"

#include <sstream>

namespace wordle {
namespace {
std::uint64_t ToId(const char* value) { return value ? std::stoull(value) : 0; }
}  // namespace

ParticipantRepository::ParticipantRepository(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void ParticipantRepository::UpsertInTx(MYSQL* conn, const ParticipantRef& participant) {
  std::ostringstream oss;
  std::string handle = db_client_->Escape(conn, participant.handle);
  std::string display = db_client_->Escape(conn, participant.display_name);
  std::string handle_expr = participant.handle.empty() ? "handle" : "VALUES(handle)";
  std::string display_expr = participant.display_name.empty() ? "display_name" : "VALUES(display_name)";
  oss << "INSERT INTO participants(participant_id, handle, display_name, first_seen, updated_at) VALUES ("
      << participant.participant_id << ", '" << handle << "', "
      << (participant.display_name.empty() ? std::string("NULL") : "'" + display + "'")
      << ", NOW(6), NOW(6)) ON DUPLICATE KEY UPDATE handle = " << handle_expr << ", display_name = " << display_expr
      << ", updated_at = NOW(6);";
  db_client_->Execute(conn, oss.str(), "참가자 upsert 실패");
}

void ParticipantRepository::RecordMembershipInTx(MYSQL* conn, const std::string& group_id,
                                                 std::uint64_t participant_id) {
  if (group_id.empty()) {
    return;
  }
  std::ostringstream oss;
  oss << "INSERT INTO group_members(group_id, participant_id, last_seen) VALUES ('"
      << db_client_->Escape(conn, group_id) << "', " << participant_id
      << ", NOW(6)) ON DUPLICATE KEY UPDATE last_seen = NOW(6);";
  db_client_->Execute(conn, oss.str(), "그룹 구성원 기록 실패");
}

std::optional<ParticipantRef> ParticipantRepository::Find(std::uint64_t participant_id) const {
  std::optional<ParticipantRef> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT participant_id, handle, display_name FROM participants WHERE participant_id=" << participant_id
        << ";";
    db_client_->Execute(conn, oss.str(), "참가자 조회 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "참가자 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      result = BuildRef(row);
    }
    mysql_free_result(res);
  });
  return result;
}

std::optional<ParticipantRef> ParticipantRepository::FindByNameInGroup(const std::string& name,
                                                                      const std::string& group_id) const {
  std::optional<ParticipantRef> result;
  if (name.empty() || group_id.empty()) {
    return result;
  }
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string escaped_name = db_client_->Escape(conn, name);
    std::ostringstream oss;
    oss << "SELECT p.participant_id, p.handle, p.display_name FROM participants p"
        << " JOIN group_members g ON g.participant_id = p.participant_id"
        << " WHERE g.group_id='" << db_client_->Escape(conn, group_id) << "'"
        << " AND (LOWER(p.handle)=LOWER('" << escaped_name << "') OR LOWER(p.display_name)=LOWER('" << escaped_name
        << "')) ORDER BY g.last_seen DESC, p.participant_id ASC LIMIT 1;";
    db_client_->Execute(conn, oss.str(), "이름 기반 참가자 조회 실패");
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "이름 조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      result = BuildRef(row);
    }
    mysql_free_result(res);
  });
  return result;
}

std::size_t ParticipantRepository::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "SELECT COUNT(*) FROM participants;", "참가자 카운트 실패");
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

void ParticipantRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM round_results;", "결과 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM group_members;", "그룹 구성원 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM participants;", "참가자 삭제 실패");
  });
}

ParticipantRef ParticipantRepository::BuildRef(MYSQL_ROW row) const {
  return ParticipantRef{ToId(row[0]), row[1] ? row[1] : "", row[2] ? row[2] : ""};
}

}  // namespace wordle
