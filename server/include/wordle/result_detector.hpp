/*
 * 설명: 코퍼스가 "어제 결과" 요약 메시지인지 판별하고 공통 패턴(라운드 번호, 시도 횟수)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/result_detector_test.cpp
 */
#pragma once

#include <optional>
#include <string>

namespace wordle {

struct AttemptToken {
  int attempt_count;
  bool succeeded;
};

// 곡선/백틱 아포스트로피를 ASCII 아포스트로피로 치환한다.
std::string NormalizeApostrophes(const std::string& text);

// "No. 1234", "No 1,234", "Wordle #1234" 형태의 라운드 번호
std::optional<int> FindRoundNumber(const std::string& corpus);

// 첫 번째 "<0-6|X>/6" 토큰. X는 실패(시도 6회)로 본다.
std::optional<AttemptToken> FindAttemptToken(const std::string& text);

class ResultDetector {
 public:
  explicit ResultDetector(std::string bot_name_token = "wordle");

  bool IsResultMessage(const std::string& corpus, bool author_is_bot, const std::string& author_name) const;

  bool HasResultsHeader(const std::string& corpus) const;
  bool MatchesBotFallback(const std::string& corpus, bool author_is_bot, const std::string& author_name) const;

 private:
  std::string bot_name_token_;
};

}  // namespace wordle
