/*
 * 설명: 멘션 토큰은 숫자 ID로, "@이름"은 대소문자 무시 비교로 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/result_parser_test.cpp, server/tests/it/ingestion_it_test.cpp
 */
#include "wordle/roster_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wordle {
namespace {
bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}
}  // namespace

RosterResolver::RosterResolver(std::vector<ParticipantRef> roster, std::shared_ptr<ParticipantRepository> directory)
    : roster_(std::move(roster)), directory_(std::move(directory)) {}

std::optional<ParticipantRef> RosterResolver::ResolveByMentionToken(const std::string& token) {
  if (token.empty() || !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  std::uint64_t participant_id = 0;
  try {
    participant_id = std::stoull(token);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  auto it = std::find_if(roster_.begin(), roster_.end(),
                         [&](const ParticipantRef& member) { return member.participant_id == participant_id; });
  if (it != roster_.end()) {
    return *it;
  }
  // 이름을 모르면 빈 값으로 두고 저장된 캐시를 유지한다.
  return ParticipantRef{participant_id, "", ""};
}

std::optional<ParticipantRef> RosterResolver::ResolveByDisplayName(const std::string& name,
                                                                   const std::string& group_id) {
  if (name.empty()) {
    return std::nullopt;
  }
  auto it = std::find_if(roster_.begin(), roster_.end(), [&](const ParticipantRef& member) {
    return EqualsIgnoreCase(member.handle, name) || EqualsIgnoreCase(member.display_name, name);
  });
  if (it != roster_.end()) {
    return *it;
  }
  if (!directory_) {
    return std::nullopt;
  }
  return directory_->FindByNameInGroup(name, group_id);
}

}  // namespace wordle
