#include "letters.h"

#include <cctype>
using namespace std;

constexpr char32_t RAW_BYTE = 0xdc00;

u32string decodeUtf8(const string& s) {
	u32string out;
	for (size_t i = 0; i < s.size(); ) {
		unsigned char c = s[i];
		int len = 0;
		char32_t cp = 0;
		if (c < 0x80) { len = 1; cp = c; }
		else if ((c & 0xe0) == 0xc0 && c >= 0xc2) { len = 2; cp = c & 0x1f; }
		else if ((c & 0xf0) == 0xe0) { len = 3; cp = c & 0x0f; }
		else if ((c & 0xf8) == 0xf0 && c <= 0xf4) { len = 4; cp = c & 0x07; }
		bool ok = len != 0 && i + len <= s.size();
		for (int j = 1; ok && j < len; j++) {
			unsigned char d = s[i + j];
			if ((d & 0xc0) != 0x80) ok = false;
			cp = (cp << 6) | (d & 0x3f);
		}
		// Reject overlong forms, surrogates and values past U+10FFFF.
		if (ok && len == 3 && (cp < 0x800 || (cp >= 0xd800 && cp <= 0xdfff))) ok = false;
		if (ok && len == 4 && (cp < 0x10000 || cp > 0x10ffff)) ok = false;
		if (!ok) {
			out.push_back(RAW_BYTE + c);
			i++;
		} else {
			out.push_back(cp);
			i += len;
		}
	}
	return out;
}

string encodeUtf8(char32_t c) {
	string out;
	if (c >= RAW_BYTE + 0x80 && c <= RAW_BYTE + 0xff) {
		out += (char) (c - RAW_BYTE);
	} else if (c < 0x80) {
		out += (char) c;
	} else if (c < 0x800) {
		out += (char) (0xc0 | (c >> 6));
		out += (char) (0x80 | (c & 0x3f));
	} else if (c < 0x10000) {
		out += (char) (0xe0 | (c >> 12));
		out += (char) (0x80 | ((c >> 6) & 0x3f));
		out += (char) (0x80 | (c & 0x3f));
	} else {
		out += (char) (0xf0 | (c >> 18));
		out += (char) (0x80 | ((c >> 12) & 0x3f));
		out += (char) (0x80 | ((c >> 6) & 0x3f));
		out += (char) (0x80 | (c & 0x3f));
	}
	return out;
}

int utf8Length(const string& s) {
	return (int) decodeUtf8(s).size();
}

static char32_t lower(char32_t c) {
	if (c < 0x80) return (char32_t) tolower((int) c);
	return c;
}

InsufficientLetters::InsufficientLetters(const string& word, const string& letter)
	: runtime_error("Word '" + word + "' uses more '" + letter + "' than available"),
	word(word), letter(letter) {}

LetterPool LetterPool::fromText(const string& text) {
	LetterPool ret;
	for (char32_t c : decodeUtf8(text)) {
		if (c < 0x80 && isspace((int) c)) continue;
		ret.freq[lower(c)]++;
	}
	return ret;
}

LetterPool LetterPool::fromWord(const string& word) {
	LetterPool ret;
	for (char32_t c : decodeUtf8(word))
		ret.freq[lower(c)]++;
	return ret;
}

int LetterPool::count(char32_t c) const {
	auto it = freq.find(c);
	return it == freq.end() ? 0 : it->second;
}

int LetterPool::total() const {
	int n = 0;
	for (auto& pa : freq)
		n += pa.second;
	return n;
}

bool LetterPool::covers(const LetterPool& other) const {
	for (auto& pa : other.freq) {
		if (pa.second > count(pa.first)) return false;
	}
	return true;
}

LetterPool LetterPool::minus(const string& word) const {
	return minus(fromWord(word), word);
}

LetterPool LetterPool::minus(const LetterPool& other, const string& word) const {
	if (!covers(other)) {
		for (char32_t c : decodeUtf8(word)) {
			c = lower(c);
			if (other.count(c) > count(c))
				throw InsufficientLetters(word, encodeUtf8(c));
		}
		// 'other' was not built from 'word'; name its smallest short letter.
		for (auto& pa : other.freq) {
			if (pa.second > count(pa.first))
				throw InsufficientLetters(word, encodeUtf8(pa.first));
		}
	}
	LetterPool ret = *this;
	for (auto& pa : other.freq) {
		if (pa.second == 0) continue;
		auto it = ret.freq.find(pa.first);
		it->second -= pa.second;
		if (it->second == 0)
			ret.freq.erase(it);
	}
	return ret;
}

LetterPool& LetterPool::operator+=(const LetterPool& other) {
	for (auto& pa : other.freq)
		freq[pa.first] += pa.second;
	return *this;
}

string LetterPool::display() const {
	string out;
	for (auto& pa : freq) {
		out += encodeUtf8(pa.first);
		if (pa.second > 1)
			out += "(" + to_string(pa.second) + ")";
	}
	return out;
}

bool operator==(const LetterPool& a, const LetterPool& b) {
	return a.freq == b.freq;
}
