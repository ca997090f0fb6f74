/*
 * 설명: 참가자 정보를 MariaDB에 upsert하고 그룹 범위 이름 조회를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/migrations/001_init.sql
 * 테스트: server/tests/it/ingestion_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "wordle/db_client.hpp"
#include "wordle/participant.hpp"

namespace wordle {

class ParticipantRepository {
 public:
  explicit ParticipantRepository(std::shared_ptr<MariaDbClient> db_client);

  // 빈 이름은 저장된 값을 유지한다.
  void UpsertInTx(MYSQL* conn, const ParticipantRef& participant);
  void RecordMembershipInTx(MYSQL* conn, const std::string& group_id, std::uint64_t participant_id);

  std::optional<ParticipantRef> Find(std::uint64_t participant_id) const;
  std::optional<ParticipantRef> FindByNameInGroup(const std::string& name, const std::string& group_id) const;
  std::size_t Count() const;
  void ClearAll() const;

 private:
  ParticipantRef BuildRef(MYSQL_ROW row) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace wordle
