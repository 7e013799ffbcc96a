#include "cli.h"

#include <cstdlib>
#include <ostream>

#include "finder.h"
#include "wordlist.h"
using namespace std;

const char* const ABOUT_TEXT =
	"\n"
	"Anagram Finder\n"
	"Version: 1.0\n"
	"Created: March 14, 2025\n"
	"Author: [@asymmetry1]\n"
	"Description: A command-line tool to find anagrams from given letters, with options to exclude words, "
	"set minimum word length, and generate sentences (partial or full-match).\n"
	"Dependencies: C++14 standard library\n"
	"License: MIT\n";

Options parseArgs(const vector<string>& args) {
	Options opts;
	bool partial = false, full = false;
	bool noMoreFlags = false;
	vector<string> nonflags;

	auto isFlag = [&](const string& s) {
		return !noMoreFlags && !s.empty() && s[0] == '-';
	};
	for (size_t i = 0; i < args.size(); i++) {
		const string& a = args[i];
		if (!isFlag(a)) {
			nonflags.push_back(a);
			continue;
		}
		auto hasNext = [&]() {
			return i + 1 != args.size() && !isFlag(args[i + 1]);
		};
		if (a == "--") {
			noMoreFlags = true;
		} else if (a == "-h" || a == "--help") {
			opts.action = Options::Action::Help;
			return opts;
		} else if (a == "--about") {
			opts.action = Options::Action::About;
			return opts;
		} else if (a == "-w" || a == "--wordlist") {
			if (!hasNext()) throw InvalidArguments("Missing argument parameter for " + a);
			opts.wordlist = args[++i];
		} else if (a == "-m" || a == "--min-length") {
			if (i + 1 == args.size()) throw InvalidArguments("Missing argument parameter for " + a);
			const string& x = args[++i];
			char* end = nullptr;
			long n = strtol(x.c_str(), &end, 10);
			if (x.empty() || *end != '\0' || n < 1 || n > 1000000)
				throw InvalidArguments("Minimum length must be a positive integer, got '" + x + "'");
			opts.minLength = (int) n;
		} else if (a == "-e" || a == "--exclude") {
			if (!hasNext()) throw InvalidArguments("Missing argument parameter for " + a);
			while (hasNext())
				opts.exclude.push_back(args[++i]);
		} else if (a == "-s" || a == "--sentence") {
			partial = true;
		} else if (a == "-f" || a == "--full-sentence") {
			full = true;
		} else {
			throw InvalidArguments("Unrecognized flag " + a);
		}
	}

	if (nonflags.size() > 1)
		throw InvalidArguments("Too many arguments; quote letters that contain spaces.");
	if (nonflags.empty() || nonflags[0].empty() || opts.wordlist.empty())
		throw InvalidArguments("Both letters and --wordlist are required unless using --about");
	opts.letters = nonflags[0];
	opts.sentence = partial || full;
	opts.mode = full ? SentenceMode::FullMatch : SentenceMode::Partial;
	return opts;
}

void usage(ostream& out, const string& program) {
	out << "Usage:" << endl;
	out << program << " --help | --about |"
		" -w <wordlist.txt>"
		" [-m <N>]"
		" [-e <word>...]"
		" [-s | -f]"
		" <letters>"
		<< endl;
	out << "  -w, --wordlist <file>    word list, one word per line" << endl;
	out << "  -m, --min-length <N>     minimum length of words to find (default: 1)" << endl;
	out << "  -e, --exclude <word>...  take these words' letters out first" << endl;
	out << "  -s, --sentence           build a sentence from the results (partial match)" << endl;
	out << "  -f, --full-sentence      build a sentence using every remaining letter" << endl;
}

static string joined(const vector<string>& words) {
	string out;
	for (const string& w : words) {
		if (!out.empty()) out += ' ';
		out += w;
	}
	return out;
}

int run(const Options& opts, ostream& out, ostream& err) {
	WordSet words;
	try {
		words = readWordList(opts.wordlist);
	}
	catch (const WordListUnavailable& exc) {
		err << "Error: " << exc.what() << endl;
		return 1;
	}

	AnagramResult res = findAnagrams(opts.letters, words, opts.minLength, opts.exclude);
	if (!res.error.empty())
		err << "Error: " << res.error << endl;

	if (!opts.exclude.empty()) {
		out << endl << "After excluding: " << joined(opts.exclude) << endl;
		string rem = res.remaining.display();
		out << "Remaining letters: " << (rem.empty() ? "none" : rem) << endl;
	}

	if (!res.words.empty()) {
		out << endl << "Found " << res.words.size() << " anagrams:" << endl;
		if (!opts.exclude.empty())
			out << "(After excluding: " << joined(opts.exclude) << ")" << endl;
		for (const string& w : res.words)
			out << w << endl;
	} else {
		out << "No anagrams found." << endl;
	}

	if (opts.sentence) {
		string sentence = composeSentence(res.words, res.remaining, opts.mode);
		out << endl << (opts.mode == SentenceMode::FullMatch ? "Full-match" : "Partial")
			<< " sentence: " << sentence << endl;
	}
	return 0;
}
