/*
 * 설명: REST 응답 엔벨로프 생성과 도메인 객체의 JSON 표현을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "wordle/message_ingestor.hpp"
#include "wordle/stats_engine.hpp"

namespace wordle {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 평균은 소수 둘째 자리에서 반올림한다.
double RoundAverage(double value);

nlohmann::json ToJson(const IngestOutcome& outcome);
nlohmann::json ToJson(const BackfillReport& report);
nlohmann::json ToJson(const ParticipantStats& stats);
nlohmann::json ToJson(const StreakSummary& streak);
nlohmann::json ToJson(const LeaderboardEntry& entry, std::size_t rank);

}  // namespace wordle
