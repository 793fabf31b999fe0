#pragma once

#include <stdint.h>

namespace pcinet {

constexpr uint64_t nanosPerMicro = 1'000;
constexpr uint64_t nanosPerMilli = 1'000'000;

struct ClockSource {
	virtual uint64_t currentNanos() = 0;

	// Busy-waits by default; nothing else can run on this core anyway.
	virtual void sleepFor(uint64_t nanos);

protected:
	~ClockSource() = default;
};

// Polls functor up to loopTimes times, sleeping loopDelay nanoseconds after
// every unsuccessful check. Returns whether the condition became true.
template<typename ConditionFunctor>
bool busyWaitFor(ClockSource *clock, ConditionFunctor &&functor, const int loopTimes,
		const uint64_t loopDelay) {
	for(int i = 0; i < loopTimes; i++) {
		if(functor())
			return true;
		clock->sleepFor(loopDelay);
	}

	return false;
}

} // namespace pcinet
