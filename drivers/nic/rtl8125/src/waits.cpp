#include <nic/rtl8125/regs.hpp>
#include <nic/rtl8125/rtl8125.hpp>

namespace pcinet::nic::rtl8125 {

bool Rtl8125::waitResetDone() {
	return busyWaitFor(_clock, [this] () { return !(_mmio.load(regs::cmd) & flags::cmd::reset); },
		timing::resetAttempts, timing::resetDelay);
}

bool Rtl8125::waitTxDescriptorReleased() {
	return busyWaitFor(_clock, [this] () { return !_txQueue.checkOwnerOfCurrentDescriptor(); },
		timing::txAttempts, timing::txDelay);
}

bool Rtl8125::waitMdioReadReady() {
	return busyWaitFor(_clock, [this] () { return _mmio.load(regs::phy_access) & flags::phy_access::flag; },
		timing::mdioAttempts, timing::mdioDelay);
}

bool Rtl8125::waitMdioWriteDone() {
	return busyWaitFor(_clock, [this] () { return !(_mmio.load(regs::phy_access) & flags::phy_access::flag); },
		timing::mdioAttempts, timing::mdioDelay);
}

} // namespace pcinet::nic::rtl8125
