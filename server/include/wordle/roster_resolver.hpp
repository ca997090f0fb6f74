/*
 * 설명: 메시지에 실린 구성원 목록과 DB 그룹 디렉터리로 참가자 참조를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/result_parser_test.cpp, server/tests/it/ingestion_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "wordle/participant.hpp"
#include "wordle/participant_repository.hpp"
#include "wordle/result_parser.hpp"

namespace wordle {

class RosterResolver : public ParticipantResolver {
 public:
  // directory가 nullptr이면 구성원 목록만 사용한다.
  RosterResolver(std::vector<ParticipantRef> roster, std::shared_ptr<ParticipantRepository> directory);

  std::optional<ParticipantRef> ResolveByMentionToken(const std::string& token) override;
  std::optional<ParticipantRef> ResolveByDisplayName(const std::string& name, const std::string& group_id) override;

 private:
  std::vector<ParticipantRef> roster_;
  std::shared_ptr<ParticipantRepository> directory_;
};

}  // namespace wordle
