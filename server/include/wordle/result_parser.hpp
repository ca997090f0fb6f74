/*
 * 설명: 결과 코퍼스에서 참가자별 시도 횟수/성공 여부를 줄 단위로 추출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/result_parser_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wordle/participant.hpp"

namespace wordle {

struct ParsedRecord {
  ParticipantRef participant;
  int attempt_count;
  bool succeeded;
  std::string raw_line;
};

// 참가자 참조를 안정 식별자로 바꾸는 연동 계층 기능
class ParticipantResolver {
 public:
  virtual ~ParticipantResolver() = default;

  // token은 "<@!123>"에서 추출한 숫자 문자열
  virtual std::optional<ParticipantRef> ResolveByMentionToken(const std::string& token) = 0;
  virtual std::optional<ParticipantRef> ResolveByDisplayName(const std::string& name, const std::string& group_id) = 0;
};

std::vector<ParsedRecord> ParseResults(const std::string& corpus, ParticipantResolver& resolver,
                                       const std::string& group_id);

// 테스트 및 진단용
std::vector<std::string> FindMentionTokens(const std::string& line);
std::vector<std::string> FindBareNames(const std::string& line);

}  // namespace wordle
