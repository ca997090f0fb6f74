/*
 * 설명: MariaDB 연결과 트랜잭션 경계, 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ingestion_it_test.cpp, server/tests/it/stats_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace wordle {

constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  // 1이면 재시도하지 않는다. 재시도 정책은 호출 측이 정한다.
  std::size_t max_attempts{1};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// 교착/락 대기 초과. 같은 작업을 다시 실행하면 풀리는 충돌이다.
inline bool IsLockConflict(const DbException& ex) { return ex.code == kDeadlock || ex.code == kLockWaitTimeout; }

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  void Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;
  void InjectTransient(std::size_t attempt) const;
  bool ShouldRetry(const DbException& ex, std::size_t attempt) const;
  void Release(MYSQL* conn, bool rollback) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace wordle
