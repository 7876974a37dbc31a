#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

// Pure per-message feature extractors. All inputs are UTF-8; malformed bytes
// are passed through as single code points instead of failing.

// Polish + English stopwords filtered out of word / phrase statistics.
extern const std::unordered_set<std::string> STOP_WORDS;

// Number of whitespace separated words.
long long countWords(const std::string& text);

// Number of Unicode code points.
std::size_t codepointLength(const std::string& text);

// True when the text has no non-whitespace character.
bool isBlank(const std::string& text);

// Emoji_Presentation / Extended_Pictographic code points, in order of
// appearance. ZWJ sequences are reported component by component.
std::vector<std::string> extractEmojis(const std::string& text);
bool isEmojiCodepoint(char32_t cp);

// Lowercase tokens with at least 2 code points and one letter, emoji removed,
// split on whitespace and ASCII punctuation, stopwords excluded.
std::vector<std::string> tokenizeWords(const std::string& text);

// "a b" pairs / "a b c" triples of adjacent tokens.
std::vector<std::string> adjacentBigrams(const std::vector<std::string>& tokens);
std::vector<std::string> adjacentTrigrams(const std::vector<std::string>& tokens);

// '?' anywhere in the text once http(s) URLs are stripped.
bool containsQuestion(const std::string& text);

// Lowercase for ASCII, Latin-1, Latin Extended-A, Greek and Cyrillic.
std::string toLowerUtf8(const std::string& text);
