/*
 * 설명: 서버 전체 수명주기와 서비스 조립을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/api_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "wordle/config.hpp"
#include "wordle/db_client.hpp"
#include "wordle/ingestion_gate.hpp"
#include "wordle/message_ingestor.hpp"
#include "wordle/observability.hpp"
#include "wordle/participant_repository.hpp"
#include "wordle/round_result_repository.hpp"
#include "wordle/stats_engine.hpp"

namespace wordle {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  std::shared_ptr<ParticipantRepository> GetParticipantRepository() { return participant_repository_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }
  std::size_t DebugResultCount() const { return round_result_repository_->Count(); }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<ParticipantRepository> participant_repository_;
  std::shared_ptr<RoundResultRepository> round_result_repository_;
  std::shared_ptr<IngestionGate> ingestion_gate_;
  std::shared_ptr<StatsEngine> stats_engine_;
  std::shared_ptr<MessageIngestor> ingestor_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace wordle
