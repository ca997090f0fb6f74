/*
 * 설명: 서버 수명주기, 리스닝 스레드, 환경설정 로딩을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/api_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "wordle/app.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "wordle/date_resolver.hpp"
#include "wordle/http_session.hpp"
#include "wordle/result_detector.hpp"
#include "wordle/schema.hpp"

namespace wordle {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<MessageIngestor> ingestor, std::shared_ptr<StatsEngine> stats_engine,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), ingestor_(std::move(ingestor)),
        stats_engine_(std::move(stats_engine)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->ingestor_, self->stats_engine_,
                                          self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<MessageIngestor> ingestor_;
  std::shared_ptr<StatsEngine> stats_engine_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name,
                     config.db_max_attempts};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  participant_repository_ = std::make_shared<ParticipantRepository>(db_client_);
  round_result_repository_ = std::make_shared<RoundResultRepository>(db_client_);
  ingestion_gate_ = std::make_shared<IngestionGate>(db_client_, participant_repository_, round_result_repository_);
  stats_engine_ = std::make_shared<StatsEngine>(round_result_repository_);
  ingestor_ = std::make_shared<MessageIngestor>(ResultDetector(config.bot_name_token), DateResolver(config.round_epoch),
                                                ingestion_gate_, participant_repository_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    ApplySchema(*db_client_);
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, ingestor_, stats_engine_, observability_);
    listener_->Run();
    observability_->Log(LogContext{observability_->NextTraceId(), std::nullopt, std::nullopt, "server.started", 0,
                                   LogLevel::kInfo, {{"port", config_.port}}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_unsigned = [&](const char* key, const char* def, unsigned long min, unsigned long max) -> unsigned long {
    auto raw = get_env(key, def);
    if (raw.empty() || !std::all_of(raw.begin(), raw.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) {
      throw std::invalid_argument(std::string(key) + " 값이 숫자가 아닙니다: " + raw);
    }
    unsigned long value = 0;
    try {
      value = std::stoul(raw);
    } catch (const std::out_of_range&) {
      throw std::invalid_argument(std::string(key) + " 값이 범위를 벗어났습니다: " + raw);
    }
    if (value < min || value > max) {
      throw std::invalid_argument(std::string(key) + " 값이 범위를 벗어났습니다: " + raw);
    }
    return value;
  };
  constexpr unsigned long kPortMax = std::numeric_limits<unsigned short>::max();

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(get_unsigned("SERVER_PORT", "8080", 1, kPortMax));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(get_unsigned("DB_PORT", "3306", 1, kPortMax));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.db_max_attempts = static_cast<std::size_t>(get_unsigned("DB_MAX_ATTEMPTS", "1", 1, 10));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ops_token = get_env("OPS_TOKEN", "");
  cfg.bot_name_token = get_env("BOT_NAME_TOKEN", "wordle");
  if (cfg.bot_name_token.empty()) {
    throw std::invalid_argument("BOT_NAME_TOKEN 값이 비어 있습니다");
  }
  auto epoch_raw = get_env("ROUND_EPOCH", "2021-06-19");
  auto epoch = CalendarDate::Parse(epoch_raw);
  if (!epoch) {
    throw std::invalid_argument("ROUND_EPOCH 값이 YYYY-MM-DD 형식이 아닙니다: " + epoch_raw);
  }
  cfg.round_epoch = *epoch;
  cfg.leaderboard_default_limit = static_cast<std::size_t>(get_unsigned("LEADERBOARD_DEFAULT_LIMIT", "10", 1, 50));
  cfg.backfill_max_days = static_cast<std::size_t>(
      get_unsigned("BACKFILL_MAX_DAYS", "60", MessageIngestor::kMinBackfillDays, MessageIngestor::kMaxBackfillDays));
  return cfg;
}

}  // namespace wordle
