/*
 * 설명: HTTP 요청을 경로/메서드로 분기해 수집기와 통계 엔진을 호출한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/api_flow_test.cpp
 */
#include "wordle/http_session.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/beast/version.hpp>

#include "wordle/api_response.hpp"
#include "wordle/db_client.hpp"
#include "wordle/message.hpp"

namespace wordle {

namespace {
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && eq + 1 <= pair.size()) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

bool IsAllDigits(const std::string& value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (!IsAllDigits(value)) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoul(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<std::uint64_t> ParseParticipantId(const std::string& value) {
  if (!IsAllDigits(value)) {
    return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    auto segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<MessageIngestor> ingestor, std::shared_ptr<StatsEngine> stats_engine,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), ingestor_(std::move(ingestor)),
      stats_engine_(std::move(stats_engine)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<HttpResponse>();
  res->version(req_.version());
  res->set(http::field::server, "wordle-ledger");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }
  auto params = ParseQueryParams(query);

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.1.0"}};
    return Respond(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"messages", {{"seen", snapshot.messages_seen}, {"ingested", snapshot.messages_ingested}}},
                        {"results", {{"accepted", snapshot.results_accepted}, {"rejected", snapshot.results_rejected}}}};
    return Respond(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::post && path == "/api/messages") {
    return HandleIngestMessage(res);
  }

  if (req_.method() == http::verb::post && path == "/ops/backfill") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (config_.ops_token.empty() || header_token != config_.ops_token) {
      return Respond(res, http::status::unauthorized,
                     MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    return HandleBackfill(res);
  }

  if (req_.method() == http::verb::get && path == "/api/leaderboard") {
    return HandleLeaderboard(res, params);
  }

  if (req_.method() == http::verb::get && path.rfind("/api/participants/", 0) == 0) {
    return HandleParticipant(res, path, params);
  }

  Respond(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleIngestMessage(std::shared_ptr<HttpResponse> res) {
  using boost::beast::http::status;
  ChatMessage message;
  try {
    message = ParseChatMessage(nlohmann::json::parse(req_.body()));
  } catch (const std::exception& ex) {
    return Respond(res, status::bad_request, MakeErrorEnvelope("bad_request", ex.what()));
  }

  try {
    auto outcome = ingestor_->IngestMessage(message);
    Respond(res, status::ok, MakeSuccessEnvelope(ToJson(outcome)));
  } catch (const DbException& ex) {
    RespondStorageError(res, ex);
  }
}

void HttpSession::HandleBackfill(std::shared_ptr<HttpResponse> res) {
  using boost::beast::http::status;
  int days = 1;
  std::vector<ChatMessage> messages;
  try {
    auto body_json = nlohmann::json::parse(req_.body());
    if (!body_json.contains("days") || !body_json["days"].is_number_integer() || !body_json.contains("messages") ||
        !body_json["messages"].is_array()) {
      throw std::invalid_argument("days와 messages 배열이 필요합니다");
    }
    auto requested = body_json["days"].get<long long>();
    auto upper = static_cast<long long>(config_.backfill_max_days);
    days = static_cast<int>(std::max(1LL, std::min(requested, upper)));
    for (const auto& item : body_json["messages"]) {
      messages.push_back(ParseChatMessage(item));
    }
  } catch (const std::exception& ex) {
    return Respond(res, status::bad_request, MakeErrorEnvelope("bad_request", ex.what()));
  }

  try {
    auto report = ingestor_->Backfill(messages, days, std::chrono::system_clock::now());
    auto data = ToJson(report);
    data["days"] = days;
    Respond(res, status::ok, MakeSuccessEnvelope(data));
  } catch (const DbException& ex) {
    RespondStorageError(res, ex);
  }
}

void HttpSession::HandleLeaderboard(std::shared_ptr<HttpResponse> res,
                                    const std::unordered_map<std::string, std::string>& params) {
  using boost::beast::http::status;
  StatsWindow window = StatsWindow::kWeekly;
  auto window_it = params.find("window");
  if (window_it != params.end()) {
    auto parsed = ParseWindow(window_it->second);
    if (!parsed) {
      return Respond(res, status::bad_request,
                     MakeErrorEnvelope("invalid_window", "window는 weekly, monthly, alltime 중 하나여야 합니다"));
    }
    window = *parsed;
  }

  std::size_t limit = config_.leaderboard_default_limit;
  auto limit_it = params.find("limit");
  if (limit_it != params.end()) {
    auto parsed = ParsePositiveInt(limit_it->second);
    if (!parsed || *parsed < 1 || *parsed > 50) {
      return Respond(res, status::bad_request,
                     MakeErrorEnvelope("leaderboard_range", "limit 값이 허용 범위를 벗어났습니다"));
    }
    limit = *parsed;
  }

  try {
    auto entries = stats_engine_->GetLeaderboard(window, limit);
    auto range = stats_engine_->WindowRange(window);
    nlohmann::json rows = nlohmann::json::array();
    for (std::size_t i = 0; i < entries.size(); ++i) {
      rows.push_back(ToJson(entries[i], i + 1));
    }
    nlohmann::json data{{"window", WindowName(window)},
                        {"from", range.from.ToString()},
                        {"to", range.to.ToString()},
                        {"limit", limit},
                        {"entries", rows}};
    Respond(res, status::ok, MakeSuccessEnvelope(data));
  } catch (const DbException& ex) {
    RespondStorageError(res, ex);
  }
}

void HttpSession::HandleParticipant(std::shared_ptr<HttpResponse> res, const std::string& path,
                                    const std::unordered_map<std::string, std::string>& params) {
  using boost::beast::http::status;
  // /api/participants/{id}/{stats|rank|streak}
  auto segments = SplitPath(path);
  if (segments.size() != 4) {
    return Respond(res, status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  const std::string& view = segments[3];
  if (view != "stats" && view != "rank" && view != "streak") {
    return Respond(res, status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  auto participant_id = ParseParticipantId(segments[2]);
  if (!participant_id) {
    return Respond(res, status::bad_request, MakeErrorEnvelope("bad_request", "참가자 ID가 올바르지 않습니다"));
  }

  StatsWindow window = StatsWindow::kAllTime;
  auto window_it = params.find("window");
  if (window_it != params.end()) {
    auto parsed = ParseWindow(window_it->second);
    if (!parsed) {
      return Respond(res, status::bad_request,
                     MakeErrorEnvelope("invalid_window", "window는 weekly, monthly, alltime 중 하나여야 합니다"));
    }
    window = *parsed;
  }

  try {
    nlohmann::json data{{"participantId", std::to_string(*participant_id)}};
    if (view == "streak") {
      data.update(ToJson(stats_engine_->GetStreak(*participant_id)));
      return Respond(res, status::ok, MakeSuccessEnvelope(data));
    }

    data["window"] = WindowName(window);
    auto rank = stats_engine_->GetRank(*participant_id, window);
    data["rank"] = rank ? nlohmann::json(*rank) : nlohmann::json(nullptr);
    if (view == "stats") {
      data.update(ToJson(stats_engine_->GetStats(*participant_id, window)));
      data["streak"] = ToJson(stats_engine_->GetStreak(*participant_id));
    }
    Respond(res, status::ok, MakeSuccessEnvelope(data));
  } catch (const DbException& ex) {
    RespondStorageError(res, ex);
  }
}

void HttpSession::Respond(std::shared_ptr<HttpResponse> res, boost::beast::http::status status,
                          const nlohmann::json& envelope) {
  auto body = envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->result(status);
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::RespondStorageError(std::shared_ptr<HttpResponse> res, const std::exception& ex) {
  if (observability_) {
    observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, "storage.error", 0, LogLevel::kError,
                                   {{"target", std::string(req_.target())}, {"error", ex.what()}}});
  }
  Respond(res, boost::beast::http::status::service_unavailable,
          MakeErrorEnvelope("storage_unavailable", "저장소에 접근할 수 없습니다"));
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()),
                                   static_cast<long>(latency), LogLevel::kInfo,
                                   {{"status", res->result_int()}}});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace wordle
