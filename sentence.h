#pragma once

#include <string>
#include <vector>

#include "letters.h"

enum class SentenceMode { Partial, FullMatch };

constexpr const char* NO_SENTENCE = "No sentence possible.";
constexpr const char* NO_FULL_MATCH = "No full-match sentence possible.";

// Up to three words, longest first, that fit together in 'remaining'.
std::vector<std::string> greedySentence(const std::vector<std::string>& candidates, const LetterPool& remaining);

// Depth-first search for words that use up 'remaining' exactly. Each candidate
// is used at most once, in list order. Returns the first solution found.
bool fullMatchSentence(const std::vector<std::string>& candidates, const LetterPool& remaining,
		std::vector<std::string>& sentence);

// "Word1 word2 word3." An empty list gives NO_SENTENCE.
std::string sentenceText(const std::vector<std::string>& words);

std::string composeSentence(const std::vector<std::string>& candidates, const LetterPool& remaining, SentenceMode mode);
