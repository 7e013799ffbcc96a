#include <iostream>
#include <string>
#include <vector>

#include "cli.h"
using namespace std;

int main(int argc, char** argv) {
	vector<string> args(argv + 1, argv + argc);
	Options opts;
	try {
		opts = parseArgs(args);
	}
	catch (const InvalidArguments& exc) {
		cerr << "Error: " << exc.what() << endl;
		usage(cerr, argv[0]);
		return 1;
	}

	switch (opts.action) {
	case Options::Action::Help:
		usage(cout, argv[0]);
		return 0;
	case Options::Action::About:
		cout << ABOUT_TEXT << endl;
		return 0;
	case Options::Action::Run:
		break;
	}
	return run(opts, cout, cerr);
}
