/*
 * 설명: 메시지 본문과 리치 블록의 텍스트를 하나의 코퍼스로 평탄화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/text_extractor_test.cpp
 */
#pragma once

#include <string>

#include "wordle/message.hpp"

namespace wordle {

// 본문 -> 블록별 제목/설명/작성자/푸터/필드(name, value) 순서로 줄바꿈 결합. 빈 항목은 생략한다.
std::string BuildCorpus(const ChatMessage& message);

}  // namespace wordle
