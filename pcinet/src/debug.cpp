#include <frg/eternal.hpp>
#include <pcinet/debug.hpp>

namespace pcinet {

constinit OutputSink infoSink;

namespace {

using HandlerList = frg::intrusive_list<
    LogHandler,
    frg::locate_member<LogHandler, frg::default_list_hook<LogHandler>, &LogHandler::hook>>;

HandlerList &accessHandlerList() {
	static frg::eternal<HandlerList> singleton;
	return *singleton;
}

// Handlers see the bare line. The platform output gets the prefix and a newline.
void emitLine(const char *prefix, const char *line) {
	for (auto *handler : accessHandlerList())
		handler->emit(line);

	if (prefix)
		infoSink.print(prefix);
	infoSink.print(line);
	infoSink.print('\n');
}

} // anonymous namespace

constinit frg::stack_buffer_logger<LogSink, logLineLength> infoLogger;
constinit frg::stack_buffer_logger<WarningSink, logLineLength> warningLogger;
constinit frg::stack_buffer_logger<PanicSink, logLineLength> panicLogger;

extern "C" void frg_panic(const char *cstring) {
	panicLogger() << "frg: Panic! " << cstring << frg::endlog;
}

void OutputSink::print(char c) {
	debugPrintChar(c);
}

void OutputSink::print(const char *str) {
	while (*str)
		print(*(str++));
}

void LogSink::operator()(const char *c) { emitLine(nullptr, c); }

void WarningSink::operator()(const char *c) { emitLine("warning: ", c); }

// The panic logger may flush partial lines; they are not forwarded to handlers.
void PanicSink::operator()(const char *c) { infoSink.print(c); }

void PanicSink::finalize(bool) {
	infoSink.print('\n');
	halt();
}

void enableLogHandler(LogHandler *handler) {
	if (handler->active)
		return;

	auto &handlerList = accessHandlerList();
	handlerList.push_back(handler);
	handler->active = true;
}

void disableLogHandler(LogHandler *handler) {
	if (!handler->active)
		return;

	auto &handlerList = accessHandlerList();
	auto it = handlerList.iterator_to(handler);
	handlerList.erase(it);
	handler->active = false;
}

} // namespace pcinet
