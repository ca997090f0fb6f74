/*
 * 설명: 연동 계층 JSON을 ChatMessage로 변환하고 ISO 타임스탬프를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_json_test.cpp
 */
#include "wordle/message.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "wordle/calendar_date.hpp"

namespace wordle {
namespace {
std::string OptionalString(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string(key) + " 필드는 문자열이어야 합니다");
  }
  return it->get<std::string>();
}

std::string IdString(const nlohmann::json& value, const char* key) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_unsigned()) {
    return std::to_string(value.get<std::uint64_t>());
  }
  throw std::invalid_argument(std::string(key) + " 필드는 문자열 또는 양의 정수여야 합니다");
}

std::uint64_t ParticipantId(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  if (value.is_string()) {
    const auto text = value.get<std::string>();
    std::size_t idx = 0;
    std::uint64_t parsed = 0;
    try {
      parsed = std::stoull(text, &idx);
    } catch (const std::logic_error&) {
      throw std::invalid_argument("members[].id 값이 올바르지 않습니다");
    }
    if (idx == text.size() && !text.empty() && text[0] != '-') {
      return parsed;
    }
  }
  throw std::invalid_argument("members[].id 값이 올바르지 않습니다");
}

RichBlock ParseBlock(const nlohmann::json& obj) {
  if (!obj.is_object()) {
    throw std::invalid_argument("embeds 항목은 객체여야 합니다");
  }
  RichBlock block;
  block.title = OptionalString(obj, "title");
  block.description = OptionalString(obj, "description");
  block.author_name = OptionalString(obj, "authorName");
  block.footer_text = OptionalString(obj, "footerText");
  auto fields_it = obj.find("fields");
  if (fields_it != obj.end() && !fields_it->is_null()) {
    if (!fields_it->is_array()) {
      throw std::invalid_argument("fields는 배열이어야 합니다");
    }
    for (const auto& field : *fields_it) {
      if (!field.is_object()) {
        throw std::invalid_argument("fields 항목은 객체여야 합니다");
      }
      block.fields.push_back(RichBlockField{OptionalString(field, "name"), OptionalString(field, "value")});
    }
  }
  return block;
}
}  // namespace

ChatMessage ParseChatMessage(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw std::invalid_argument("메시지 본문은 JSON 객체여야 합니다");
  }
  ChatMessage message;
  if (body.contains("id") && !body["id"].is_null()) {
    message.message_id = IdString(body["id"], "id");
  }
  if (body.contains("groupId") && !body["groupId"].is_null()) {
    message.group_id = IdString(body["groupId"], "groupId");
  }
  message.content = OptionalString(body, "content");
  message.author_name = OptionalString(body, "authorName");
  if (body.contains("authorIsBot")) {
    if (!body["authorIsBot"].is_boolean()) {
      throw std::invalid_argument("authorIsBot 필드는 불리언이어야 합니다");
    }
    message.author_is_bot = body["authorIsBot"].get<bool>();
  }

  if (!body.contains("createdAt") || !body["createdAt"].is_string() ||
      !ParseIsoTimestamp(body["createdAt"].get<std::string>(), message.created_at)) {
    throw std::invalid_argument("createdAt 필드가 없거나 ISO-8601 형식이 아닙니다");
  }

  auto embeds_it = body.find("embeds");
  if (embeds_it != body.end() && !embeds_it->is_null()) {
    if (!embeds_it->is_array()) {
      throw std::invalid_argument("embeds는 배열이어야 합니다");
    }
    for (const auto& embed : *embeds_it) {
      message.blocks.push_back(ParseBlock(embed));
    }
  }

  auto members_it = body.find("members");
  if (members_it != body.end() && !members_it->is_null()) {
    if (!members_it->is_array()) {
      throw std::invalid_argument("members는 배열이어야 합니다");
    }
    for (const auto& member : *members_it) {
      if (!member.is_object() || !member.contains("id")) {
        throw std::invalid_argument("members 항목에는 id가 필요합니다");
      }
      message.roster.push_back(
          ParticipantRef{ParticipantId(member["id"]), OptionalString(member, "handle"), OptionalString(member, "displayName")});
    }
  }
  return message;
}

bool ParseIsoTimestamp(const std::string& text, std::chrono::system_clock::time_point& out) {
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2u-%2uT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                  &consumed) != 6) {
    return false;
  }
  auto date = CalendarDate::Parse(text.substr(0, 10));
  if (!date || hour > 23 || minute > 59 || second > 60) {
    return false;
  }

  std::size_t pos = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
  }

  long offset_seconds = 0;
  if (pos < text.size()) {
    const std::string zone = text.substr(pos);
    if (zone == "Z" || zone == "z") {
      offset_seconds = 0;
    } else {
      int off_h = 0;
      int off_m = 0;
      char sign = 0;
      char tail = 0;
      if (std::sscanf(zone.c_str(), "%c%2d:%2d%c", &sign, &off_h, &off_m, &tail) != 3 || (sign != '+' && sign != '-')) {
        return false;
      }
      offset_seconds = (off_h * 3600L + off_m * 60L) * (sign == '-' ? -1 : 1);
    }
  }

  long long epoch_seconds = static_cast<long long>(date->ToDays()) * 86400LL + hour * 3600LL + minute * 60LL + second -
                            offset_seconds;
  out = std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds));
  return true;
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

}  // namespace wordle
