/*
 * 설명: 메시지의 여러 텍스트 면을 순서대로 결합한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/text_extractor_test.cpp
 */
#include "wordle/text_extractor.hpp"

#include <vector>

namespace wordle {
namespace {
void AppendPart(std::vector<const std::string*>& parts, const std::string& text) {
  if (!text.empty()) {
    parts.push_back(&text);
  }
}
}  // namespace

std::string BuildCorpus(const ChatMessage& message) {
  std::vector<const std::string*> parts;
  AppendPart(parts, message.content);
  for (const auto& block : message.blocks) {
    AppendPart(parts, block.title);
    AppendPart(parts, block.description);
    AppendPart(parts, block.author_name);
    AppendPart(parts, block.footer_text);
    for (const auto& field : block.fields) {
      AppendPart(parts, field.name);
      AppendPart(parts, field.value);
    }
  }

  std::string corpus;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      corpus.push_back('\n');
    }
    corpus += *parts[i];
  }
  return corpus;
}

}  // namespace wordle
