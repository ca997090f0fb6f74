/*
 * 설명: participants, group_members, round_results 테이블을 보장한다.
 * 버전: v1.0.0
 * 관련 문서: server/migrations/001_init.sql
 */
#include "wordle/schema.hpp"

namespace wordle {
namespace {
const char* const kStatements[] = {
    "CREATE TABLE IF NOT EXISTS participants ("
    " participant_id BIGINT UNSIGNED NOT NULL PRIMARY KEY,"
    " handle VARCHAR(128) NOT NULL,"
    " display_name VARCHAR(128) NULL,"
    " first_seen DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " updated_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",

    "CREATE TABLE IF NOT EXISTS group_members ("
    " group_id VARCHAR(64) NOT NULL,"
    " participant_id BIGINT UNSIGNED NOT NULL,"
    " last_seen DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " PRIMARY KEY (group_id, participant_id),"
    " CONSTRAINT fk_group_members_participant FOREIGN KEY (participant_id) REFERENCES participants(participant_id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",

    "CREATE TABLE IF NOT EXISTS round_results ("
    " id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY,"
    " participant_id BIGINT UNSIGNED NOT NULL,"
    " round_id INT NOT NULL,"
    " round_date DATE NOT NULL,"
    " attempt_count TINYINT UNSIGNED NOT NULL,"
    " succeeded TINYINT(1) NOT NULL,"
    " score TINYINT UNSIGNED NOT NULL,"
    " created_at DATETIME(6) NOT NULL DEFAULT CURRENT_TIMESTAMP(6),"
    " UNIQUE KEY uq_round_results_key (participant_id, round_id, round_date),"
    " KEY idx_round_results_participant_date (participant_id, round_date),"
    " KEY idx_round_results_date (round_date),"
    " CONSTRAINT fk_round_results_participant FOREIGN KEY (participant_id) REFERENCES participants(participant_id)"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;",
};
}  // namespace

void ApplySchema(const MariaDbClient& db_client) {
  db_client.WithConnectionRetry([&](MYSQL* conn) {
    for (const char* statement : kStatements) {
      db_client.Execute(conn, statement, "스키마 적용 실패");
    }
  });
}

}  // namespace wordle
