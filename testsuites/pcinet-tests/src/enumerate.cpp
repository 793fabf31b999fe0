#include <assert.h>
#include <map>
#include <string.h>
#include <vector>

#include <pci/dw/enumerate.hpp>

#include "testsuite.hpp"

using pcinet::Error;
namespace pci = pcinet::pci;

namespace {

// Config space of a single function that behaves like hardware: BARs only
// take the bits they decode, the command register may refuse to enable.
struct MockConfigSpace final : pci::ConfigAccessor {
	struct Bar {
		uint32_t writable;
		uint32_t fixed;
	};

	frg::expected<Error, uint32_t> readDword(uint64_t barPhys, uint16_t offset,
			bool restore) override {
		if (restore && barPhys)
			restoredTo.push_back(barPhys);
		return dwords[offset];
	}

	frg::expected<Error> writeDword(uint64_t barPhys, uint16_t offset,
			uint32_t value, bool restore) override {
		writes.push_back({offset, value});
		if (restore && barPhys)
			restoredTo.push_back(barPhys);

		if (auto it = bars.find(offset); it != bars.end()) {
			dwords[offset] = (value & it->second.writable) | it->second.fixed;
		} else if (offset == pci::cfg::commandStatus) {
			uint32_t command = value & 0xFFFF;
			if (!commandSticks)
				command &= ~pci::cfg::command::memorySpace;
			dwords[offset] = (dwords[offset] & 0xFFFF0000) | command;
		} else {
			dwords[offset] = value;
		}
		return frg::success;
	}

	void addBar(uint16_t offset, uint32_t value, uint32_t writable) {
		uint32_t fixed = value & ~writable;
		bars[offset] = Bar{writable, fixed};
		dwords[offset] = value;
	}

	std::map<uint16_t, uint32_t> dwords;
	std::map<uint16_t, Bar> bars;
	std::vector<std::pair<uint16_t, uint32_t>> writes;
	std::vector<uint64_t> restoredTo;
	bool commandSticks = true;
};

// What the board sees behind its root port.
MockConfigSpace makeRtl8125() {
	MockConfigSpace space;
	space.dwords[0x00] = 0x812510EC;
	space.dwords[0x04] = 0x00100400;
	space.dwords[0x08] = 0x02000005;
	// BAR0: I/O, 256 bytes.
	space.addBar(0x10, 0x00001001, 0xFFFFFF00);
	// BAR2/3: 64-bit memory, 64 KiB.
	space.addBar(0x18, 0xf0200004, 0xFFFF0000);
	space.addBar(0x1C, 0x00000000, 0xFFFFFFFF);
	// BAR4/5: 64-bit memory, 16 KiB.
	space.addBar(0x20, 0xf0210004, 0xFFFFC000);
	space.addBar(0x24, 0x00000000, 0xFFFFFFFF);
	return space;
}

} // anonymous namespace

DEFINE_TEST(enumerate_scan_realtek, ([] {
	auto space = makeRtl8125();

	auto id = pci::scanDevice(&space);
	assert(id);
	assert(id.value().vendor == 0x10EC);
	assert(id.value().device == 0x8125);
	assert(id.value().classCode == 0x020000);
	assert(id.value().revision == 0x05);
	assert(!strcmp(pci::identifyDevice(id.value()), "RTL8125 2.5GbE Controller"));
}))

DEFINE_TEST(enumerate_scan_no_device, ([] {
	const uint32_t absent[] = {0xFFFFFFFF, 0x0000FFFF, 0x00000000, 0x12340000};

	for (auto value : absent) {
		MockConfigSpace space;
		space.dwords[0x00] = value;

		auto id = pci::scanDevice(&space);
		assert(!id);
		assert(id.error() == Error::noDevice);
	}
}))

DEFINE_TEST(enumerate_identify_names, ([] {
	assert(!strcmp(pci::identifyDevice({0x10EC, 0x8169, 0, 0}), "RTL8169 GbE Controller"));
	assert(!strcmp(pci::identifyDevice({0x10EC, 0x8168, 0, 0}), "Unknown Realtek device"));
	assert(!strcmp(pci::identifyDevice({0x8086, 0x8125, 0, 0}), "Unknown device"));
}))

DEFINE_TEST(enumerate_probe_memory32_bar, ([] {
	MockConfigSpace space;
	space.addBar(0x10, 0xf0200000, 0xFFFF0000);

	auto bar = pci::probeBar(&space, 0);
	assert(bar);
	assert(bar.value().type == pci::BarType::memory32);
	assert(bar.value().address == 0xf0200000);
	assert(bar.value().size == 0x10000);
	assert(!bar.value().prefetchable);

	// The original value is back in place.
	assert(space.dwords[0x10] == 0xf0200000);
}))

DEFINE_TEST(enumerate_probe_memory64_bar, ([] {
	auto space = makeRtl8125();

	auto bar = pci::probeBar(&space, 2);
	assert(bar);
	assert(bar.value().type == pci::BarType::memory64);
	assert(bar.value().address == 0xf0200000);
	assert(bar.value().size == 0x10000);
	assert(space.dwords[0x18] == 0xf0200004);
	assert(space.dwords[0x1C] == 0);

	auto second = pci::probeBar(&space, 4);
	assert(second);
	assert(second.value().size == 0x4000);
}))

DEFINE_TEST(enumerate_probe_prefetchable_bar, ([] {
	MockConfigSpace space;
	space.addBar(0x14, 0xe0000008, 0xFFF00000);

	auto bar = pci::probeBar(&space, 1);
	assert(bar);
	assert(bar.value().prefetchable);
	assert(bar.value().size == 0x100000);
}))

DEFINE_TEST(enumerate_probe_io_bar, ([] {
	auto space = makeRtl8125();

	auto bar = pci::probeBar(&space, 0);
	assert(bar);
	assert(bar.value().type == pci::BarType::io);
	assert(bar.value().address == 0x1000);
	assert(bar.value().size == 0x100);
	assert(space.dwords[0x10] == 0x00001001);
}))

DEFINE_TEST(enumerate_probe_io_bar_16bit_decode, ([] {
	// Reads back 0x0000FF01: the upper half of the port address is not decoded.
	MockConfigSpace space;
	space.addBar(0x14, 0x0000E001, 0x0000FF00);

	auto bar = pci::probeBar(&space, 1);
	assert(bar);
	assert(bar.value().type == pci::BarType::io);
	assert(bar.value().address == 0xE000);
	assert(bar.value().size == 0x100);
	assert(space.dwords[0x14] == 0x0000E001);
}))

DEFINE_TEST(enumerate_probe_missing_bar, ([] {
	auto space = makeRtl8125();
	space.addBar(0x14, 0, 0);

	auto bar = pci::probeBar(&space, 1);
	assert(!bar);
	assert(bar.error() == Error::noBar);

	// A 64-bit BAR in the last slot has no upper half.
	space.addBar(0x24, 0xf0300004, 0xFFFF0000);
	auto last = pci::probeBar(&space, 5);
	assert(!last);
	assert(last.error() == Error::noBar);
}))

DEFINE_TEST(enumerate_enable_device, ([] {
	auto space = makeRtl8125();

	assert_success(pci::enableDevice(&space, 0xf0200000));

	auto command = space.dwords[0x04] & 0xFFFF;
	assert(command & pci::cfg::command::ioSpace);
	assert(command & pci::cfg::command::memorySpace);
	assert(command & pci::cfg::command::busMaster);
	assert(!(command & pci::cfg::command::interruptDisable));

	// The RW1C status half is written as zero.
	assert(space.writes.size() == 1);
	assert(space.writes[0].first == 0x04);
	assert((space.writes[0].second >> 16) == 0);

	// The final read-back switches the window back to the BAR.
	assert(space.restoredTo.size() == 1);
	assert(space.restoredTo[0] == 0xf0200000);
}))

DEFINE_TEST(enumerate_enable_fails, ([] {
	auto space = makeRtl8125();
	space.commandSticks = false;

	auto outcome = pci::enableDevice(&space, 0xf0200000);
	assert(!outcome);
	assert(outcome.error() == Error::enableFailed);
}))

DEFINE_TEST(enumerate_fills_context, ([] {
	auto space = makeRtl8125();
	pci::DeviceContext ctx;

	assert_success(pci::enumerateDevice(&space, 2, ctx));
	assert(ctx.id.device == 0x8125);
	assert(ctx.barIndex == 2);
	assert(ctx.bar.type == pci::BarType::memory64);
	assert(ctx.bar.address == 0xf0200000);
	assert(ctx.bar.size == 0x10000);
	assert(ctx.enabled);
	assert(!ctx.mac);
}))
