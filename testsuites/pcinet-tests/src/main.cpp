#include <fnmatch.h>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <pcinet/debug.hpp>

#include "testsuite.hpp"

namespace {

bool verbose = false;

} // anonymous namespace

namespace pcinet {

// Driver logs are only shown with --verbose.
void debugPrintChar(char c) {
	if (verbose)
		std::cout.put(c);
}

void halt() {
	std::cout.flush();
	abort();
}

} // namespace pcinet

std::vector<abstract_test_case *> &test_case_ptrs() {
	static std::vector<abstract_test_case *> singleton;
	return singleton;
}

void abstract_test_case::register_case(abstract_test_case *tcp) {
	test_case_ptrs().push_back(tcp);
}

int main(int argc, char **argv) {
	CLI::App app{"Host testsuite for the pcinet drivers"};

	std::vector<std::string> globs;
	bool list = false;
	app.add_option("globs", globs, "tests to run");
	app.add_flag("--list", list, "list tests instead of running them");
	app.add_flag("-v,--verbose", verbose, "show driver log output");

	CLI11_PARSE(app, argc, argv);

	auto selected = [&] (abstract_test_case *tcp) {
		if (globs.empty())
			return true;
		for (const auto &glob : globs) {
			if (fnmatch(glob.c_str(), tcp->name(), 0) == 0)
				return true;
		}
		return false;
	};

	int count = 0;
	for (abstract_test_case *tcp : test_case_ptrs()) {
		if (!selected(tcp))
			continue;
		if (list) {
			std::cout << tcp->name() << std::endl;
			continue;
		}
		std::cout << "pcinet-tests: Running " << tcp->name() << std::endl;
		tcp->run();
		count++;
	}

	if (!list)
		std::cout << "pcinet-tests: " << count << " tests passed" << std::endl;
	return EXIT_SUCCESS;
}
