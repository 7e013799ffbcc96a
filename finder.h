#pragma once

#include <string>
#include <vector>

#include "letters.h"
#include "wordlist.h"

struct AnagramResult {
	std::vector<std::string> words;
	LetterPool remaining;
	// Set when an excluded word could not be taken out of the letters. In that
	// case 'words' is empty and 'remaining' is the pool before that word.
	std::string error;
};

// Takes the excluded words out of 'pool' one at a time, in order. Stops at the
// first word that does not fit, leaving 'pool' as it was before that word.
bool applyExclusions(LetterPool& pool, const std::vector<std::string>& exclude, std::string& error);

// Words that can be built from 'pool', at least 'minLength' long. Longest
// first, alphabetical among equal lengths.
std::vector<std::string> matchWords(const LetterPool& pool, const WordSet& words, int minLength);

AnagramResult findAnagrams(const std::string& letters, const WordSet& words, int minLength = 1,
		const std::vector<std::string>& exclude = {});
