#pragma once

#include <pcinet/timer.hpp>

namespace pcinet::rk3588 {

// ARM generic timer, virtual count.
struct GenericTimer final : ClockSource {
	GenericTimer();

	uint64_t currentNanos() override;

private:
	uint64_t freqHz_;
};

} // namespace pcinet::rk3588
