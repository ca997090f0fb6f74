/*
 * 설명: 결과 요약 메시지의 헤더/라운드 번호/봇 작성자 휴리스틱을 판별한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/result_detector_test.cpp
 */
#include "wordle/result_detector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace wordle {
namespace {
// std::regex는 반복 한 글자마다 재귀하므로 모든 반복 횟수에 상한을 둔다.
const std::regex& HeaderPattern() {
  static const std::regex pattern(R"(here\s{1,8}are\s{1,8}yesterday's\s{1,8}results\s{0,8}:?)", std::regex::icase);
  return pattern;
}

const std::regex& RoundPattern() {
  static const std::regex pattern(
      R"((?:\bno\s{0,8}[.:]?\s{0,8}#?|\bwordle\s{0,8}#)\s{0,8}(\d{1,3}(?:,\d{3}){1,3}|\d{1,12}))", std::regex::icase);
  return pattern;
}

const std::regex& AttemptPattern() {
  static const std::regex pattern(R"((?:^|[^0-9])([0-6xX])/6(?![0-9]))");
  return pattern;
}

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}
}  // namespace

std::string NormalizeApostrophes(const std::string& text) {
  std::string normalized = text;
  ReplaceAll(normalized, "\xE2\x80\x99", "'");  // U+2019
  ReplaceAll(normalized, "\xE2\x80\x98", "'");  // U+2018
  ReplaceAll(normalized, "`", "'");
  return normalized;
}

std::optional<int> FindRoundNumber(const std::string& corpus) {
  std::smatch match;
  if (!std::regex_search(corpus, match, RoundPattern())) {
    return std::nullopt;
  }
  std::string digits = match[1].str();
  digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
  if (digits.empty() || digits.size() > 9) {
    return std::nullopt;
  }
  return std::stoi(digits);
}

std::optional<AttemptToken> FindAttemptToken(const std::string& text) {
  std::smatch match;
  if (!std::regex_search(text, match, AttemptPattern())) {
    return std::nullopt;
  }
  const char value = match[1].str()[0];
  if (value == 'x' || value == 'X') {
    return AttemptToken{6, false};
  }
  return AttemptToken{value - '0', true};
}

ResultDetector::ResultDetector(std::string bot_name_token) : bot_name_token_(ToLower(std::move(bot_name_token))) {}

bool ResultDetector::IsResultMessage(const std::string& corpus, bool author_is_bot,
                                     const std::string& author_name) const {
  if (corpus.empty()) {
    return false;
  }
  if (HasResultsHeader(corpus) && FindRoundNumber(corpus).has_value()) {
    return true;
  }
  return MatchesBotFallback(corpus, author_is_bot, author_name);
}

bool ResultDetector::HasResultsHeader(const std::string& corpus) const {
  return std::regex_search(NormalizeApostrophes(corpus), HeaderPattern());
}

bool ResultDetector::MatchesBotFallback(const std::string& corpus, bool author_is_bot,
                                        const std::string& author_name) const {
  if (!author_is_bot || bot_name_token_.empty()) {
    return false;
  }
  if (ToLower(author_name).find(bot_name_token_) == std::string::npos) {
    return false;
  }
  return FindAttemptToken(corpus).has_value();
}

}  // namespace wordle
