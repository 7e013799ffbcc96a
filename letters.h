#pragma once

#include <map>
#include <stdexcept>
#include <string>

// UTF-8 text as code points. A byte that is not part of a valid sequence
// decodes to U+DC80..U+DCFF and encodes back to that same byte.
std::u32string decodeUtf8(const std::string& s);
std::string encodeUtf8(char32_t c);
int utf8Length(const std::string& s);

struct InsufficientLetters : std::runtime_error {
	std::string word;
	std::string letter;
	InsufficientLetters(const std::string& word, const std::string& letter);
};

// Multiset of characters. Only counts above zero are stored.
struct LetterPool {
	std::map<char32_t, int> freq;

	// Ignores whitespace and folds ASCII to lowercase.
	static LetterPool fromText(const std::string& text);
	// Lowercases and counts every character of a single word.
	static LetterPool fromWord(const std::string& word);

	int count(char32_t c) const;
	int total() const;
	bool empty() const { return freq.empty(); }

	bool covers(const LetterPool& other) const;
	bool covers(const std::string& word) const { return covers(fromWord(word)); }

	// Throws InsufficientLetters naming the first character of 'word' that
	// the pool is short of. *this is left untouched either way.
	LetterPool minus(const std::string& word) const;
	LetterPool minus(const LetterPool& other, const std::string& word) const;

	LetterPool& operator+=(const LetterPool& other);

	// "a(2)ct": ascending order, count shown only when above one.
	std::string display() const;
};

bool operator==(const LetterPool& a, const LetterPool& b);
