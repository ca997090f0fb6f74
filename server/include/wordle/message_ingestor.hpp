/*
 * 설명: 메시지 하나를 추출 -> 판별 -> 파싱 -> 날짜 결정 -> 저장 순으로 처리하고 백필을 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/ingestion_it_test.cpp, server/tests/e2e/api_flow_test.cpp, server/tests/unit/message_ingestor_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wordle/date_resolver.hpp"
#include "wordle/ingestion_gate.hpp"
#include "wordle/message.hpp"
#include "wordle/observability.hpp"
#include "wordle/participant_repository.hpp"
#include "wordle/result_detector.hpp"

namespace wordle {

enum class IngestStatus { kNotResults, kUnparseable, kNoRoundId, kOutOfRange, kIngested };

const char* IngestStatusName(IngestStatus status);

struct IngestOutcome {
  bool ingested{false};
  int accepted_results{0};
  int rejected_results{0};
  IngestStatus status{IngestStatus::kNotResults};
  std::optional<RoundKey> round;
};

struct BackfillReport {
  int scanned{0};
  int processed_messages{0};
  int added_results{0};
};

class MessageIngestor {
 public:
  static constexpr int kMinBackfillDays = 1;
  static constexpr int kMaxBackfillDays = 60;

  MessageIngestor(ResultDetector detector, DateResolver date_resolver, std::shared_ptr<IngestionGate> gate,
                  std::shared_ptr<ParticipantRepository> directory, std::shared_ptr<Observability> observability);

  // 결과 메시지가 아니거나 파싱 불가면 효과 없는 결과를 돌려준다. DB 오류만 예외로 전파된다.
  IngestOutcome IngestMessage(const ChatMessage& message);

  BackfillReport Backfill(const std::vector<ChatMessage>& messages, int days,
                          std::chrono::system_clock::time_point now);

  void SetClock(std::function<std::chrono::system_clock::time_point()> clock) { clock_ = std::move(clock); }

 private:
  void LogOutcome(const ChatMessage& message, const IngestOutcome& outcome, LogLevel level) const;

  ResultDetector detector_;
  DateResolver date_resolver_;
  std::shared_ptr<IngestionGate> gate_;
  std::shared_ptr<ParticipantRepository> directory_;
  std::shared_ptr<Observability> observability_;
  std::function<std::chrono::system_clock::time_point()> clock_;
};

}  // namespace wordle
