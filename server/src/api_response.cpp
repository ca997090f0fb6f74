/*
 * 설명: JSON 응답 엔벨로프를 생성하고 통계/수집 결과를 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "wordle/api_response.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wordle {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

nlohmann::json DateOrNull(const std::optional<CalendarDate>& date) {
  return date ? nlohmann::json(date->ToString()) : nlohmann::json(nullptr);
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

double RoundAverage(double value) { return std::round(value * 100.0) / 100.0; }

nlohmann::json ToJson(const IngestOutcome& outcome) {
  nlohmann::json j{{"ingested", outcome.ingested},
                   {"acceptedResults", outcome.accepted_results},
                   {"rejectedResults", outcome.rejected_results},
                   {"status", IngestStatusName(outcome.status)}};
  if (outcome.round) {
    j["roundId"] = outcome.round->round_id;
    j["roundDate"] = outcome.round->round_date.ToString();
  } else {
    j["roundId"] = nullptr;
    j["roundDate"] = nullptr;
  }
  return j;
}

nlohmann::json ToJson(const BackfillReport& report) {
  return nlohmann::json{{"scanned", report.scanned},
                        {"processedMessages", report.processed_messages},
                        {"addedResults", report.added_results}};
}

nlohmann::json ToJson(const ParticipantStats& stats) {
  return nlohmann::json{{"gamesPlayed", stats.games_played},
                        {"totalScore", stats.total_score},
                        {"averageScore", RoundAverage(stats.average_score)},
                        {"successfulGames", stats.successful_games},
                        {"firstGameDate", DateOrNull(stats.first_game_date)},
                        {"lastGameDate", DateOrNull(stats.last_game_date)}};
}

nlohmann::json ToJson(const StreakSummary& streak) {
  return nlohmann::json{{"currentStreak", streak.current_streak}, {"longestStreak", streak.longest_streak}};
}

nlohmann::json ToJson(const LeaderboardEntry& entry, std::size_t rank) {
  return nlohmann::json{{"rank", rank},
                        {"participantId", std::to_string(entry.participant.participant_id)},
                        {"handle", entry.participant.handle},
                        {"displayName", entry.participant.Label()},
                        {"gamesPlayed", entry.games_played},
                        {"totalScore", entry.total_score},
                        {"averageScore", RoundAverage(entry.average_score)},
                        {"successfulGames", entry.successful_games},
                        {"currentStreak", entry.current_streak},
                        {"longestStreak", entry.longest_streak}};
}

}  // namespace wordle
