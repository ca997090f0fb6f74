/*
 * 설명: 구조화 로그(JSON 한 줄)와 메트릭 카운터를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/api_flow_test.cpp
 */
#include "wordle/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wordle {
namespace {
std::mutex& LogMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& name) {
  if (name == "debug") {
    return LogLevel::kDebug;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::kWarn;
  }
  if (name == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordMessage(bool ingested, int accepted, int rejected) {
  messages_seen_.fetch_add(1);
  if (ingested) {
    messages_ingested_.fetch_add(1);
  }
  results_accepted_.fetch_add(static_cast<std::uint64_t>(accepted));
  results_rejected_.fetch_add(static_cast<std::uint64_t>(rejected));
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.messages_seen = messages_seen_.load();
  snapshot.messages_ingested = messages_ingested_.load();
  snapshot.results_accepted = results_accepted_.load();
  snapshot.results_rejected = results_rejected_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.message_id) {
    log_json["messageId"] = *ctx.message_id;
  }
  if (ctx.participant_id) {
    log_json["participantId"] = *ctx.participant_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(LogMutex());
  *sink_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace wordle
