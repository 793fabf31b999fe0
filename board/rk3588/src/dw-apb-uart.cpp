#include <arch/bits.hpp>
#include <arch/register.hpp>
#include <rk3588/dw-apb-uart.hpp>

namespace pcinet::rk3588 {

namespace {

constexpr arch::scalar_register<uint32_t> data(0x00);
constexpr arch::scalar_register<uint32_t> interruptEnable(0x04);
constexpr arch::bit_register<uint32_t> lineStatus(0x14);

constexpr arch::field<uint32_t, bool> txReady(5, 1);

} // anonymous namespace

DwApbUart::DwApbUart(arch::mem_space regs) : regs_{regs} {
	// We poll; the console must never raise interrupts.
	regs_.store(interruptEnable, 0);
}

void DwApbUart::write(char c) {
	while (!(regs_.load(lineStatus) & txReady)) {
		// Do nothing until the UART is ready to transmit.
	}
	regs_.store(data, static_cast<uint8_t>(c));
}

} // namespace pcinet::rk3588
