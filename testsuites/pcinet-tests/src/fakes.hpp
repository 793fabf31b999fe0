#pragma once

#include <functional>
#include <map>
#include <memory>
#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <vector>

#include <arch/dma_pool.hpp>
#include <arch/mem_space.hpp>
#include <pcinet/timer.hpp>

// Time only moves when the code under test sleeps. Every sleep gives the
// simulated device a chance to act.
struct FakeClock final : pcinet::ClockSource {
	uint64_t currentNanos() override {
		return now;
	}

	void sleepFor(uint64_t nanos) override {
		now += nanos;
		sleeps++;
		if (onSleep)
			onSleep();
	}

	uint64_t now = 0;
	uint64_t sleeps = 0;
	std::function<void()> onSleep;
};

// Host memory standing in for a device's register file.
struct RegisterFile {
	explicit RegisterFile(size_t size)
	: bytes_(size, 0) { }

	arch::mem_space space() {
		return arch::mem_space{bytes_.data()};
	}

	template<typename T>
	T read(ptrdiff_t offset) const {
		T value;
		memcpy(&value, bytes_.data() + offset, sizeof(T));
		return value;
	}

	template<typename T>
	void write(ptrdiff_t offset, T value) {
		memcpy(bytes_.data() + offset, &value, sizeof(T));
	}

private:
	std::vector<uint8_t> bytes_;
};

// A DMA region in host memory that pretends to live at a different bus
// address, so that missing address translations show up.
struct HostDmaRegion {
	static constexpr uintptr_t busBase = 0x50200000;

	explicit HostDmaRegion(size_t size = 0x10000)
	: memory_{new uint8_t[size + 4096]}, size_{size},
	  pool{aligned(), busBase, size} { }

	void *translate(uint64_t bus) {
		return aligned() + (bus - busBase);
	}

	template<typename T>
	T read(uint64_t bus) {
		T value;
		memcpy(&value, translate(bus), sizeof(T));
		return value;
	}

	template<typename T>
	void write(uint64_t bus, T value) {
		memcpy(translate(bus), &value, sizeof(T));
	}

private:
	uint8_t *aligned() {
		auto p = reinterpret_cast<uintptr_t>(memory_.get());
		return reinterpret_cast<uint8_t *>((p + 4095) & ~uintptr_t{4095});
	}

	std::unique_ptr<uint8_t[]> memory_;
	size_t size_;

public:
	arch::contiguous_pool pool;
};

// Register space that records every access and only reports an ATU region
// as enabled after a configurable number of reads of its CTRL2 register.
struct MockAtuSpace {
	struct State {
		std::map<ptrdiff_t, uint32_t> values;
		std::vector<ptrdiff_t> writeOrder;
		int ctrl2Loads = 0;
		// -1: the enable bit never sticks.
		int enableAfterLoads = 1;
	};

	explicit MockAtuSpace(State *state)
	: state_{state} { }

	template<typename RT>
	void store(RT r, typename RT::rep_type value) {
		state_->values[r.offset()] = static_cast<uint32_t>(value);
		state_->writeOrder.push_back(r.offset());
	}

	template<typename RT>
	typename RT::rep_type load(RT r) const {
		auto value = state_->values[r.offset()];
		if ((r.offset() & 0x1FF) == 0x04) {
			state_->ctrl2Loads++;
			if (state_->enableAfterLoads < 0 || state_->ctrl2Loads < state_->enableAfterLoads)
				value &= ~(uint32_t{1} << 31);
		}
		return typename RT::rep_type(value);
	}

private:
	State *state_;
};
