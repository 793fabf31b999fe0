#pragma once

#include <arch/mem_space.hpp>

namespace pcinet::rk3588 {

// Synopsys dw-apb-uart: an NS16550 register file with 32-bit registers
// at a 4 byte stride. Firmware has already set up the line parameters.
struct DwApbUart {
	explicit DwApbUart(arch::mem_space regs);

	DwApbUart(const DwApbUart &) = delete;
	DwApbUart &operator=(const DwApbUart &) = delete;

	void write(char c);

private:
	arch::mem_space regs_;
};

} // namespace pcinet::rk3588
