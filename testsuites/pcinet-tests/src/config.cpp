#include <assert.h>

#include <pci/dw/config.hpp>

#include "fakes.hpp"
#include "testsuite.hpp"

using pcinet::BoardConfig;
using pcinet::pci::dw::Atu;
using pcinet::pci::dw::AtuRegionType;
using pcinet::pci::dw::DwConfigAccessor;

namespace {

// DBI space up to and including the unrolled region registers of region 1.
constexpr size_t dbiSize = 0x300000 + 2 * 0x200;
constexpr ptrdiff_t region1 = 0x300000 + 0x200;

struct ConfigFixture {
	ConfigFixture()
	: atu{dbi.space(), &clock}, io{&atu, window.space(), config} { }

	BoardConfig config;
	FakeClock clock;
	RegisterFile dbi{dbiSize};
	RegisterFile window{0x1000};
	Atu<arch::mem_space> atu;
	DwConfigAccessor io;
};

} // anonymous namespace

DEFINE_TEST(config_read_maps_config_space, ([] {
	ConfigFixture f;
	f.window.write<uint32_t>(0x00, 0x812510EC);

	auto value = f.io.readDword(0xf0200000, 0x00, false);
	assert(value);
	assert(value.value() == 0x812510EC);

	// Without restore, the region keeps pointing at config space.
	assert(f.dbi.read<uint32_t>(region1 + 0x00) == 4);
	assert(f.dbi.read<uint32_t>(region1 + 0x04) == 0x80000000);
	assert(f.dbi.read<uint32_t>(region1 + 0x08) == 0xf3000000);
	assert(f.dbi.read<uint32_t>(region1 + 0x10) == 0xf30fffff);
	assert(f.dbi.read<uint32_t>(region1 + 0x18) == 0);
	assert(f.dbi.read<uint32_t>(region1 + 0x1C) == 0);
}))

DEFINE_TEST(config_read_restores_bar_window, ([] {
	ConfigFixture f;
	f.window.write<uint32_t>(0x04, 0x00100007);

	auto value = f.io.readDword(0xf0200000, 0x04, true);
	assert(value);
	assert(value.value() == 0x00100007);

	assert(f.dbi.read<uint32_t>(region1 + 0x00) == 0);
	assert(f.dbi.read<uint32_t>(region1 + 0x08) == 0xc0100000);
	assert(f.dbi.read<uint32_t>(region1 + 0x0C) == 0x9);
	assert(f.dbi.read<uint32_t>(region1 + 0x10) == 0xc010ffff);
	assert(f.dbi.read<uint32_t>(region1 + 0x14) == 0x9);
	assert(f.dbi.read<uint32_t>(region1 + 0x18) == 0xf0200000);
	assert(f.dbi.read<uint32_t>(region1 + 0x1C) == 0);
}))

DEFINE_TEST(config_restore_needs_bar_address, ([] {
	ConfigFixture f;

	assert(f.io.readDword(0, 0x00, true));
	assert(f.dbi.read<uint32_t>(region1 + 0x00) == 4);
}))

DEFINE_TEST(config_write_reaches_window, ([] {
	ConfigFixture f;

	assert_success(f.io.writeDword(0xf0200000, 0x10, 0xFFFFFFFF, false));
	assert(f.window.read<uint32_t>(0x10) == 0xFFFFFFFF);
	assert(f.dbi.read<uint32_t>(region1 + 0x00) == 4);

	assert_success(f.io.writeDword(0xf0200000, 0x10, 0xf0200004, true));
	assert(f.window.read<uint32_t>(0x10) == 0xf0200004);
	assert(f.dbi.read<uint32_t>(region1 + 0x00) == 0);
}))

DEFINE_TEST(config_map_bar, ([] {
	ConfigFixture f;

	assert_success(f.io.mapBar(0xf0300000));
	assert(f.dbi.read<uint32_t>(region1 + 0x00) == 0);
	assert(f.dbi.read<uint32_t>(region1 + 0x18) == 0xf0300000);
	assert(f.clock.sleeps == 0);
}))
