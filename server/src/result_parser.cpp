/*
 * 설명: 구조화 멘션 우선, 없으면 "@이름" 토큰으로 참가자를 찾아 결과 레코드를 만든다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/result_parser_test.cpp
 */
#include "wordle/result_parser.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

#include "wordle/result_detector.hpp"

namespace wordle {
namespace {
const std::regex& MentionPattern() {
  static const std::regex pattern(R"(<@!?(\d{1,20})>)");
  return pattern;
}

const std::regex& BareNamePattern() {
  // 상한을 넘는 이름은 잘라 읽지 않고 통째로 버린다.
  static const std::regex pattern(R"((?:^|[^<\w])@([^\s@<>,:;!?()\[\]]{1,64})(?![^\s@<>,:;!?()\[\]]))");
  return pattern;
}

std::vector<std::string> CollectGroup(const std::string& line, const std::regex& pattern) {
  std::vector<std::string> found;
  for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it) {
    found.push_back((*it)[1].str());
  }
  return found;
}

std::vector<ParticipantRef> ResolveParticipants(const std::string& line, ParticipantResolver& resolver,
                                                const std::string& group_id) {
  std::vector<ParticipantRef> resolved;
  auto tokens = FindMentionTokens(line);
  if (!tokens.empty()) {
    for (const auto& token : tokens) {
      if (auto ref = resolver.ResolveByMentionToken(token)) {
        resolved.push_back(*ref);
      }
    }
    return resolved;
  }
  for (const auto& name : FindBareNames(line)) {
    if (auto ref = resolver.ResolveByDisplayName(name, group_id)) {
      resolved.push_back(*ref);
    }
  }
  return resolved;
}
}  // namespace

std::vector<std::string> FindMentionTokens(const std::string& line) { return CollectGroup(line, MentionPattern()); }

std::vector<std::string> FindBareNames(const std::string& line) {
  auto names = CollectGroup(line, BareNamePattern());
  for (auto& name : names) {
    while (!name.empty() && name.back() == '.') {
      name.pop_back();
    }
  }
  names.erase(std::remove_if(names.begin(), names.end(), [](const std::string& n) { return n.empty(); }), names.end());
  return names;
}

std::vector<ParsedRecord> ParseResults(const std::string& corpus, ParticipantResolver& resolver,
                                       const std::string& group_id) {
  std::vector<ParsedRecord> records;
  std::istringstream stream(corpus);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    auto attempt = FindAttemptToken(line);
    if (!attempt) {
      continue;
    }
    for (auto& participant : ResolveParticipants(line, resolver, group_id)) {
      records.push_back(ParsedRecord{std::move(participant), attempt->attempt_count, attempt->succeeded, line});
    }
  }
  return records;
}

}  // namespace wordle
