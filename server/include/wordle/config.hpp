/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/api_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "wordle/calendar_date.hpp"

namespace wordle {

struct AppConfig {
  unsigned short port;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::size_t db_max_attempts;
  std::string log_level;
  std::string ops_token;
  std::string bot_name_token;
  CalendarDate round_epoch;
  std::size_t leaderboard_default_limit;
  std::size_t backfill_max_days;
};

// 잘못된 값은 std::invalid_argument
AppConfig LoadConfigFromEnv();

}  // namespace wordle
