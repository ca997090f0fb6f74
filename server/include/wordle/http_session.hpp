/*
 * 설명: HTTP 연결을 처리하고 메시지 수집/백필/통계 조회 엔드포인트를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/api_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "wordle/config.hpp"
#include "wordle/message_ingestor.hpp"
#include "wordle/observability.hpp"
#include "wordle/stats_engine.hpp"

namespace wordle {

using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<MessageIngestor> ingestor, std::shared_ptr<StatsEngine> stats_engine,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleIngestMessage(std::shared_ptr<HttpResponse> res);
  void HandleBackfill(std::shared_ptr<HttpResponse> res);
  void HandleLeaderboard(std::shared_ptr<HttpResponse> res, const std::unordered_map<std::string, std::string>& params);
  void HandleParticipant(std::shared_ptr<HttpResponse> res, const std::string& path,
                         const std::unordered_map<std::string, std::string>& params);
  void Respond(std::shared_ptr<HttpResponse> res, boost::beast::http::status status, const nlohmann::json& envelope);
  void RespondStorageError(std::shared_ptr<HttpResponse> res, const std::exception& ex);
  void SendResponse(std::shared_ptr<HttpResponse> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<MessageIngestor> ingestor_;
  std::shared_ptr<StatsEngine> stats_engine_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace wordle
