/*
 * 설명: MariaDB 연결과 트랜잭션/재시도 로직을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ingestion_it_test.cpp, server/tests/it/stats_it_test.cpp
 */
#include "wordle/db_client.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <mariadb/errmsg.h>

namespace wordle {

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  config_.max_attempts = std::max<std::size_t>(1, config_.max_attempts);
}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0) ||
      mysql_query(conn, "SET SESSION innodb_lock_wait_timeout=2;") != 0) {
    const unsigned int code = mysql_errno(conn);
    const std::string message = std::string("연결 준비 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code, IsRetryable(code));
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      conn = Connect();
      if (mysql_autocommit(conn, 0) != 0) {
        RaiseError(conn, "autocommit 해제 실패");
      }
      InjectTransient(attempt);
      const bool commit = work(conn);
      if (!commit) {
        mysql_rollback(conn);
      } else if (mysql_commit(conn) != 0) {
        RaiseError(conn, "커밋 실패");
      }
      mysql_close(conn);
      return commit;
    } catch (const DbException& ex) {
      Release(conn, true);
      if (!ShouldRetry(ex, attempt)) {
        throw;
      }
    } catch (...) {
      Release(conn, true);
      throw;
    }
  }
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      conn = Connect();
      InjectTransient(attempt);
      work(conn);
      mysql_close(conn);
      return;
    } catch (const DbException& ex) {
      Release(conn, false);
      if (!ShouldRetry(ex, attempt)) {
        throw;
      }
    } catch (...) {
      Release(conn, false);
      throw;
    }
  }
}

void MariaDbClient::InjectTransient(std::size_t attempt) const {
  if (transient_injector_ && transient_injector_(attempt)) {
    throw DbException("주입된 일시 오류", kDeadlock, true);
  }
}

// 재시도하면 백오프까지 마치고 true를 돌려준다.
bool MariaDbClient::ShouldRetry(const DbException& ex, std::size_t attempt) const {
  if (!ex.retryable || attempt >= config_.max_attempts) {
    return false;
  }
  Backoff(attempt);
  return true;
}

void MariaDbClient::Release(MYSQL* conn, bool rollback) const {
  if (!conn) {
    return;
  }
  if (rollback) {
    mysql_rollback(conn);
  }
  mysql_close(conn);
}

void MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace wordle
