#include <frg/manual_box.hpp>
#include <pcinet/config.hpp>
#include <pcinet/debug.hpp>
#include <rk3588/dw-apb-uart.hpp>
#include <rk3588/generic-timer.hpp>
#include <rk3588/main.hpp>

namespace pcinet {

namespace {

frg::manual_box<rk3588::DwApbUart> debugUart;
frg::manual_box<rk3588::GenericTimer> timer;

} // anonymous namespace

void debugPrintChar(char c) {
	if (c == '\n')
		debugUart->write('\r');
	debugUart->write(c);
}

void halt() {
	while (true)
		asm volatile ("wfe");
}

} // namespace pcinet

extern "C" [[noreturn]] void pcinetEntry() {
	using namespace pcinet;

	debugUart.initialize(arch::mem_space{rk3588Config.uartBase});
	timer.initialize();

	infoLogger() << "pcinet: RK3588 PCIe NIC bring-up" << frg::endlog;
	rk3588::pcinetMain(rk3588Config, timer.get());

	panicLogger() << "pcinet: bring-up failed" << frg::endlog;
	__builtin_unreachable();
}

extern "C" void
__assert_fail(const char *assertion, const char *file, unsigned int line, const char *function) {
	pcinet::panicLogger() << "Assertion failed: " << assertion << "\n"
	                      << "In function " << function << " at " << file << ":" << line
	                      << frg::endlog;
	__builtin_unreachable();
}

extern "C" void __cxa_pure_virtual() { pcinet::panicLogger() << "Pure virtual call" << frg::endlog; }
