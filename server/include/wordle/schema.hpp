/*
 * 설명: 기동 시 필요한 테이블을 생성한다. DDL은 server/migrations/001_init.sql과 동일하다.
 * 버전: v1.0.0
 * 관련 문서: server/migrations/001_init.sql
 */
#pragma once

#include "wordle/db_client.hpp"

namespace wordle {

void ApplySchema(const MariaDbClient& db_client);

}  // namespace wordle
