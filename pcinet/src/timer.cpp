#include <pcinet/timer.hpp>

namespace pcinet {

void ClockSource::sleepFor(uint64_t nanos) {
	auto deadline = currentNanos() + nanos;
	while(currentNanos() < deadline)
		asm volatile ("" : : : "memory");
}

} // namespace pcinet
