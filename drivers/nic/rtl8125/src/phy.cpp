#include <nic/rtl8125/regs.hpp>
#include <nic/rtl8125/rtl8125.hpp>
#include <pcinet/debug.hpp>

namespace pcinet::nic::rtl8125 {

frg::optional<uint16_t> Rtl8125::readPhy(uint8_t reg) {
	_mmio.store(regs::phy_access, flags::phy_access::addr(reg));
	_clock->sleepFor(timing::mdioSettleDelay);

	if(!waitMdioReadReady())
		return frg::null_opt;
	return _mmio.load(regs::phy_access) & flags::phy_access::data;
}

bool Rtl8125::writePhy(uint8_t reg, uint16_t value) {
	_mmio.store(regs::phy_access, flags::phy_access::flag(true)
			| flags::phy_access::addr(reg)
			| flags::phy_access::data(value));
	_clock->sleepFor(timing::mdioSettleDelay);

	return waitMdioWriteDone();
}

void Rtl8125::initializePhy() {
	auto status = _mmio.load(regs::phy_status);

	if(status & flags::phy_status::tbi_enable) {
		infoLogger() << "rtl8125: TBI mode, leaving PHY alone" << frg::endlog;
		return;
	}

	if(status & flags::phy_status::link) {
		infoLogger() << "rtl8125: link is up"
				<< ((status & flags::phy_status::speed_1000) ? ", 1000 Mbps"
					: (status & flags::phy_status::speed_100) ? ", 100 Mbps" : ", 10 Mbps")
				<< ((status & flags::phy_status::full_duplex) ? ", full duplex" : ", half duplex")
				<< frg::endlog;
		return;
	}

	infoLogger() << "rtl8125: link is down, restarting auto-negotiation" << frg::endlog;

	auto advertise = readPhy(mii::advertise);
	if(!advertise) {
		warningLogger() << "rtl8125: timeout while reading the PHY advertisement" << frg::endlog;
		return;
	}

	// Keep the selector field, advertise all 10/100 modes.
	uint16_t modes = (*advertise & 0x1F)
			| mii::advertise_10_half | mii::advertise_10_full
			| mii::advertise_100_half | mii::advertise_100_full;
	if(!writePhy(mii::advertise, modes)
			|| !writePhy(mii::ctrl1000, mii::advertise_1000_full)
			|| !writePhy(mii::bmcr, mii::bmcr_enable_autoneg | mii::bmcr_restart_autoneg)) {
		warningLogger() << "rtl8125: timeout while writing PHY registers" << frg::endlog;
		return;
	}

	bool complete = busyWaitFor(_clock, [this] () {
		auto bmsr = readPhy(mii::bmsr);
		return bmsr && (*bmsr & mii::bmsr_autoneg_complete);
	}, timing::autonegAttempts, timing::autonegDelay);

	if(!complete) {
		warningLogger() << "rtl8125: auto-negotiation did not complete" << frg::endlog;
		return;
	}

	infoLogger() << "rtl8125: auto-negotiation complete, PHY status "
			<< frg::hex_fmt{static_cast<unsigned int>(static_cast<uint8_t>(_mmio.load(regs::phy_status)))}
			<< frg::endlog;
}

} // namespace pcinet::nic::rtl8125
