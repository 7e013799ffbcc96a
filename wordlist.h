#pragma once

#include <set>
#include <stdexcept>
#include <string>

using WordSet = std::set<std::string>;

struct WordListUnavailable : std::runtime_error {
	std::string path;
	explicit WordListUnavailable(const std::string& path);
};

// One word per line, trimmed and lowercased. Blank lines are skipped.
WordSet readWordList(const std::string& filename);
