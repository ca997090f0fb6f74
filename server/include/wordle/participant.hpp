/*
 * 설명: 참가자 식별자와 표시용 이름 캐시를 담는 공용 타입.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <cstdint>
#include <string>

namespace wordle {

struct ParticipantRef {
  std::uint64_t participant_id;
  std::string handle;
  std::string display_name;

  const std::string& Label() const { return display_name.empty() ? handle : display_name; }
};

}  // namespace wordle
