#include <assert.h>
#include <vector>

#include <pci/dw/atu.hpp>

#include "fakes.hpp"
#include "testsuite.hpp"

using pcinet::Error;
using pcinet::pci::dw::Atu;
using pcinet::pci::dw::AtuRegionType;

namespace {

constexpr ptrdiff_t regionBase(unsigned int index) {
	return 0x300000 + index * 0x200;
}

} // anonymous namespace

DEFINE_TEST(atu_program_writes_region, ([] {
	MockAtuSpace::State state;
	FakeClock clock;
	Atu<MockAtuSpace> atu{MockAtuSpace{&state}, &clock};

	assert_success(atu.program(1, AtuRegionType::memory, 0x9c0100000, 0xf0200000, 0x10000));

	auto base = regionBase(1);
	assert(state.values[base + 0x08] == 0xc0100000);
	assert(state.values[base + 0x0C] == 0x9);
	assert(state.values[base + 0x10] == 0xc010ffff);
	assert(state.values[base + 0x14] == 0x9);
	assert(state.values[base + 0x18] == 0xf0200000);
	assert(state.values[base + 0x1C] == 0);
	assert(state.values[base + 0x00] == 0);
	assert(state.values[base + 0x04] == 0x80000000);

	// Addresses and limit first, type next, enable last.
	std::vector<ptrdiff_t> order{base + 0x08, base + 0x0C, base + 0x10, base + 0x14,
			base + 0x18, base + 0x1C, base + 0x00, base + 0x04};
	assert(state.writeOrder == order);

	assert(state.ctrl2Loads == 1);
	assert(clock.sleeps == 0);
}))

DEFINE_TEST(atu_program_config_type, ([] {
	MockAtuSpace::State state;
	FakeClock clock;
	Atu<MockAtuSpace> atu{MockAtuSpace{&state}, &clock};

	assert_success(atu.program(0, AtuRegionType::config0, 0xf3000000, 0, 0x100000));
	assert(state.values[regionBase(0)] == 4);
	assert(state.values[regionBase(0) + 0x10] == 0xf30fffff);

	assert_success(atu.program(2, AtuRegionType::io, 0xf3100000, 0, 0x100000));
	assert(state.values[regionBase(2)] == 2);
}))

DEFINE_TEST(atu_enable_after_retries, ([] {
	for (int k = 1; k <= 5; k++) {
		MockAtuSpace::State state;
		state.enableAfterLoads = k;
		FakeClock clock;
		Atu<MockAtuSpace> atu{MockAtuSpace{&state}, &clock};

		assert_success(atu.program(1, AtuRegionType::memory, 0x9c0100000, 0xf0200000, 0x10000));
		assert(state.ctrl2Loads == k);
		assert(clock.sleeps == static_cast<uint64_t>(k - 1));
		assert(clock.now == (k - 1) * pcinet::nanosPerMilli);
	}
}))

DEFINE_TEST(atu_enable_timeout, ([] {
	const int delays[] = {-1, 6};

	for (auto delay : delays) {
		MockAtuSpace::State state;
		state.enableAfterLoads = delay;
		FakeClock clock;
		Atu<MockAtuSpace> atu{MockAtuSpace{&state}, &clock};

		auto outcome = atu.program(1, AtuRegionType::config0, 0xf3000000, 0, 0x100000);
		assert(!outcome);
		assert(outcome.error() == Error::timeout);
		// Five polls, 1 ms apart.
		assert(clock.sleeps == 5);
		assert(clock.now == 5 * pcinet::nanosPerMilli);
	}
}))

DEFINE_TEST(atu_region_type_names, ([] {
	using pcinet::pci::dw::toString;
	assert(!strcmp(toString(AtuRegionType::memory), "memory"));
	assert(!strcmp(toString(AtuRegionType::config0), "config type 0"));
	assert(!strcmp(toString(AtuRegionType::config1), "config type 1"));
	assert(!strcmp(toString(AtuRegionType::io), "I/O"));
}))
