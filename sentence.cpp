#include "sentence.h"

#include <algorithm>
#include <cctype>
using namespace std;

static vector<string> byLength(const vector<string>& words) {
	vector<string> out = words;
	stable_sort(out.begin(), out.end(), [](const string& a, const string& b) {
		return utf8Length(a) > utf8Length(b);
	});
	return out;
}

vector<string> greedySentence(const vector<string>& candidates, const LetterPool& remaining) {
	vector<string> sentence;
	LetterPool used;
	for (const string& word : byLength(candidates)) {
		LetterPool next = used;
		next += LetterPool::fromWord(word);
		if (remaining.covers(next)) {
			sentence.push_back(word);
			used = next;
		}
		if (sentence.size() >= 3) break;
	}
	return sentence;
}

namespace {

struct FullMatchSearch {
	vector<string> words;
	vector<LetterPool> pools;
	vector<string> sentence;

	bool rec(const LetterPool& residual, size_t from) {
		if (residual.empty() && !sentence.empty())
			return true;
		for (size_t i = from; i < words.size(); i++) {
			if (!residual.covers(pools[i])) continue;
			sentence.push_back(words[i]);
			if (rec(residual.minus(pools[i], words[i]), i + 1))
				return true;
			sentence.pop_back();
		}
		return false;
	}
};

}

bool fullMatchSentence(const vector<string>& candidates, const LetterPool& remaining, vector<string>& sentence) {
	FullMatchSearch s;
	s.words = byLength(candidates);
	for (const string& w : s.words)
		s.pools.push_back(LetterPool::fromWord(w));
	if (!s.rec(remaining, 0))
		return false;
	sentence = move(s.sentence);
	return true;
}

string sentenceText(const vector<string>& words) {
	if (words.empty())
		return NO_SENTENCE;
	string out;
	for (const string& w : words) {
		if (!out.empty()) out += ' ';
		out += w;
	}
	out[0] = (char) toupper((unsigned char) out[0]);
	return out + ".";
}

string composeSentence(const vector<string>& candidates, const LetterPool& remaining, SentenceMode mode) {
	if (candidates.empty())
		return NO_SENTENCE;
	vector<string> sentence;
	if (mode == SentenceMode::FullMatch) {
		if (!fullMatchSentence(candidates, remaining, sentence))
			return NO_FULL_MATCH;
	} else {
		sentence = greedySentence(candidates, remaining);
	}
	if (sentence.empty())
		return NO_SENTENCE;
	return sentenceText(sentence);
}
