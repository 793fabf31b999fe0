#pragma once

#include <pcinet/config.hpp>
#include <pcinet/timer.hpp>

namespace pcinet::rk3588 {

// Brings up the PCIe link partner and pings the remote end, then keeps
// answering requests. Only returns if bring-up fails.
void pcinetMain(const BoardConfig &config, ClockSource *clock);

} // namespace pcinet::rk3588

// Jumped to by the boot code once the MMU, caches and the stack are set up.
extern "C" [[noreturn]] void pcinetEntry();
