#pragma once

#include <frg/formatting.hpp>
#include <frg/list.hpp>
#include <frg/logging.hpp>

namespace pcinet {

constexpr size_t logLineLength = 256;

struct OutputSink {
	void print(char c);
	void print(const char *c);
};

struct LogSink {
	void operator()(const char *c);
};

struct WarningSink {
	void operator()(const char *c);
};

struct PanicSink {
	void operator()(const char *c);
	void finalize(bool);
};

extern frg::stack_buffer_logger<LogSink, logLineLength> infoLogger;
extern frg::stack_buffer_logger<WarningSink, logLineLength> warningLogger;
extern frg::stack_buffer_logger<PanicSink, logLineLength> panicLogger;

// Receives every complete log line in addition to the platform output.
// Note that lines are not newline-terminated.
struct LogHandler {
	virtual void emit(frg::string_view line) = 0;

	frg::default_list_hook<LogHandler> hook;
	bool active{false};

protected:
	~LogHandler() = default;
};

void enableLogHandler(LogHandler *handler);
void disableLogHandler(LogHandler *handler);

// Provided by the platform (board UART, or the host test runner).
void debugPrintChar(char c);

// Provided by the platform; called once a panic message has been written.
[[noreturn]] void halt();

} // namespace pcinet
