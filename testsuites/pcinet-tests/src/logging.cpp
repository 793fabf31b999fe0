#include <assert.h>
#include <string>
#include <string.h>
#include <vector>

#include <pcinet/debug.hpp>
#include <pcinet/error.hpp>

#include "testsuite.hpp"

namespace {

struct CollectingHandler final : pcinet::LogHandler {
	void emit(frg::string_view line) override {
		lines.emplace_back(line.data(), line.size());
	}

	std::vector<std::string> lines;
};

} // anonymous namespace

DEFINE_TEST(log_handler_receives_lines, ([] {
	CollectingHandler handler;
	pcinet::enableLogHandler(&handler);
	// Enabling twice has no effect.
	pcinet::enableLogHandler(&handler);

	pcinet::infoLogger() << "rtl8125: ring " << 3 << " at 0x"
			<< frg::hex_fmt{0x50200000u} << frg::endlog;
	pcinet::warningLogger() << "pci: " << pcinet::toString(pcinet::Error::noBar) << frg::endlog;

	pcinet::disableLogHandler(&handler);
	pcinet::infoLogger() << "not seen" << frg::endlog;

	assert(handler.lines.size() == 2);
	assert(handler.lines[0] == "rtl8125: ring 3 at 0x50200000");
	assert(handler.lines[1] == "pci: BAR not implemented");
	assert(!handler.active);
}))

DEFINE_TEST(error_names, ([] {
	assert(!strcmp(pcinet::toString(pcinet::Error::timeout), "ATU enable timeout"));
	assert(!strcmp(pcinet::toString(pcinet::Error::rxTimeout), "RX timeout"));
	assert(!strcmp(pcinet::toString(pcinet::Error::malformedFrame), "malformed frame"));
}))
