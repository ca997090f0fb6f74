/*
 * 설명: 연동 계층이 전달하는 채팅 메시지와 리치 블록(embed) 모델, JSON 디코딩을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_json_test.cpp, server/tests/unit/text_extractor_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "wordle/participant.hpp"

namespace wordle {

struct RichBlockField {
  std::string name;
  std::string value;
};

struct RichBlock {
  std::string title;
  std::string description;
  std::string author_name;
  std::string footer_text;
  std::vector<RichBlockField> fields;
};

struct ChatMessage {
  std::string message_id;
  std::string group_id;
  std::string content;
  std::vector<RichBlock> blocks;
  std::string author_name;
  bool author_is_bot{false};
  std::chrono::system_clock::time_point created_at;
  // 연동 계층이 알고 있는 그룹 구성원과 멘션 메타데이터
  std::vector<ParticipantRef> roster;
};

// 본문 형식이 잘못되면 std::invalid_argument를 던진다.
ChatMessage ParseChatMessage(const nlohmann::json& body);

// ISO-8601 UTC("2024-05-01T07:00:00Z", 소수 초, +hh:mm 오프셋 허용)
bool ParseIsoTimestamp(const std::string& text, std::chrono::system_clock::time_point& out);
std::string ToIsoString(std::chrono::system_clock::time_point tp);

}  // namespace wordle
