#include <rk3588/generic-timer.hpp>

namespace pcinet::rk3588 {

namespace {

uint64_t getRawTimestampCounter() {
	uint64_t cnt;
	asm volatile ("mrs %0, cntvct_el0" : "=r"(cnt));
	return cnt;
}

} // anonymous namespace

GenericTimer::GenericTimer() {
	asm volatile ("mrs %0, cntfrq_el0" : "=r"(freqHz_));
}

uint64_t GenericTimer::currentNanos() {
	constexpr uint64_t nanosPerSecond = 1'000'000'000;
	auto ticks = static_cast<unsigned __int128>(getRawTimestampCounter());
	return static_cast<uint64_t>(ticks * nanosPerSecond / freqHz_);
}

} // namespace pcinet::rk3588
