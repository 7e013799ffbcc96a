#include "wordlist.h"

#include <cctype>
#include <fstream>
using namespace std;

WordListUnavailable::WordListUnavailable(const string& path)
	: runtime_error("Word list file '" + path + "' not found."), path(path) {}

static string trim(const string& s) {
	size_t a = 0, b = s.size();
	while (a < b && isspace((unsigned char) s[a])) a++;
	while (b > a && isspace((unsigned char) s[b - 1])) b--;
	return s.substr(a, b - a);
}

WordSet readWordList(const string& filename) {
	ifstream fin(filename);
	if (!fin)
		throw WordListUnavailable(filename);
	WordSet words;
	string line;
	while (getline(fin, line)) {
		string word = trim(line);
		if (word.empty()) continue;
		for (char& c : word)
			c = (char) tolower((unsigned char) c);
		words.insert(move(word));
	}
	return words;
}
