/*
 * 설명: 구조화 로그와 요청/수집 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/api_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace wordle {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& name);
const char* LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::string> message_id;
  std::optional<std::uint64_t> participant_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  nlohmann::json detail;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t messages_seen{0};
  std::uint64_t messages_ingested{0};
  std::uint64_t results_accepted{0};
  std::uint64_t results_rejected{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordMessage(bool ingested, int accepted, int rejected);
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> messages_seen_{0};
  std::atomic<std::uint64_t> messages_ingested_{0};
  std::atomic<std::uint64_t> results_accepted_{0};
  std::atomic<std::uint64_t> results_rejected_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace wordle
