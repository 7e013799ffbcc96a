#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include "sentence.h"

extern const char* const ABOUT_TEXT;

struct InvalidArguments : std::runtime_error {
	explicit InvalidArguments(const std::string& msg) : std::runtime_error(msg) {}
};

struct Options {
	enum class Action { Run, Help, About };
	Action action = Action::Run;
	std::string letters;
	std::string wordlist;
	int minLength = 1;
	std::vector<std::string> exclude;
	bool sentence = false;
	// -f wins over -s when both are given.
	SentenceMode mode = SentenceMode::Partial;
};

// 'args' excludes the program name. Throws InvalidArguments.
Options parseArgs(const std::vector<std::string>& args);

void usage(std::ostream& out, const std::string& program);

// Loads the word list and prints the results. Returns the exit status.
int run(const Options& opts, std::ostream& out, std::ostream& err);
