#pragma once

#include <stdint.h>

#include <frg/expected.hpp>
#include <pcinet/error.hpp>
#include <pcinet/mac.hpp>
#include <pci/dw/config.hpp>

namespace pcinet::pci {

namespace cfg {
	inline constexpr uint16_t vendorDevice = 0x00;
	inline constexpr uint16_t commandStatus = 0x04;
	inline constexpr uint16_t classRevision = 0x08;
	inline constexpr uint16_t bar0 = 0x10;

	inline constexpr int numBars = 6;

	namespace command {
		inline constexpr uint32_t ioSpace = 1 << 0;
		inline constexpr uint32_t memorySpace = 1 << 1;
		inline constexpr uint32_t busMaster = 1 << 2;
		inline constexpr uint32_t interruptDisable = 1 << 10;
	} // namespace command
} // namespace cfg

inline constexpr uint16_t vendorRealtek = 0x10EC;

struct DeviceId {
	uint16_t vendor;
	uint16_t device;
	uint32_t classCode;
	uint8_t revision;
};

enum class BarType {
	none,
	io,
	memory32,
	memory64,
};

struct BarInfo {
	BarType type = BarType::none;
	uint64_t address = 0;
	uint64_t size = 0;
	bool prefetchable = false;
};

// Everything known about the device behind the root port.
// Filled in by the enumeration steps below, in order; the NIC driver adds
// the MAC address once it has read it from the chip.
struct DeviceContext {
	// CPU address of the BAR window.
	uintptr_t mmioBase = 0;
	DeviceId id{};
	unsigned int barIndex = 0;
	BarInfo bar{};
	MacAddress mac{};
	bool enabled = false;
};

// Reads vendor, device, class and revision.
frg::expected<Error, DeviceId> scanDevice(ConfigAccessor *io);

// Human readable model name.
const char *identifyDevice(const DeviceId &id);

// Sizes BAR n by the usual all-ones probe; the BAR's original value is
// written back before returning.
frg::expected<Error, BarInfo> probeBar(ConfigAccessor *io, unsigned int n);

// Turns on I/O and memory decoding as well as bus mastering.
// The translation region is restored to the BAR afterwards.
frg::expected<Error> enableDevice(ConfigAccessor *io, uint64_t barPhys);

// Runs the three steps above and records the results in ctx.
frg::expected<Error> enumerateDevice(ConfigAccessor *io, unsigned int barIndex,
		DeviceContext &ctx);

} // namespace pcinet::pci
