#pragma once

#include <stddef.h>
#include <stdint.h>

namespace pcinet {

// Physical addresses of the PCIe 3.0 x1 controller and the memory this
// firmware runs with. RAM and MMIO are identity mapped.
struct BoardConfig {
	// DesignWare controller registers (DBI).
	uintptr_t dbiBase = 0xa40c00000;

	// CPU window that is retargeted to config space.
	uintptr_t configWindow = 0xf3000000;
	size_t configWindowSize = 0x100000;

	// CPU window through which the NIC's BAR is reached after enumeration.
	uintptr_t barWindow = 0x9c0100000;
	size_t barWindowSize = 0x10000;

	// iATU outbound region shared by config and BAR accesses.
	unsigned int configRegion = 1;

	// BAR that holds the NIC's memory-mapped registers.
	unsigned int registerBar = 2;

	// Write-once DMA region handed to us by system init.
	uintptr_t dmaRegion = 0x50200000;
	size_t dmaRegionSize = 0x200000;

	// dw-apb-uart used for the console.
	uintptr_t uartBase = 0xfeb50000;
};

inline constexpr BoardConfig rk3588Config{};

} // namespace pcinet
