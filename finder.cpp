#include "finder.h"

#include <algorithm>
using namespace std;

bool applyExclusions(LetterPool& pool, const vector<string>& exclude, string& error) {
	for (const string& word : exclude) {
		try {
			pool = pool.minus(word);
		}
		catch (const InsufficientLetters& exc) {
			error = exc.what();
			return false;
		}
	}
	return true;
}

vector<string> matchWords(const LetterPool& pool, const WordSet& words, int minLength) {
	int avail = pool.total();
	vector<string> out;
	for (const string& word : words) {
		int len = utf8Length(word);
		if (len <= avail && len >= minLength && pool.covers(word))
			out.push_back(word);
	}
	// Byte order of UTF-8 strings is code point order.
	sort(out.begin(), out.end(), [](const string& a, const string& b) {
		int la = utf8Length(a), lb = utf8Length(b);
		if (la != lb) return la > lb;
		return a < b;
	});
	return out;
}

AnagramResult findAnagrams(const string& letters, const WordSet& words, int minLength,
		const vector<string>& exclude) {
	AnagramResult res;
	res.remaining = LetterPool::fromText(letters);
	if (!applyExclusions(res.remaining, exclude, res.error))
		return res;
	res.words = matchWords(res.remaining, words, minLength);
	return res;
}
