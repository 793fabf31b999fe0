#include <nic/rtl8125/regs.hpp>
#include <nic/rtl8125/rtl8125.hpp>
#include <pcinet/debug.hpp>

namespace pcinet::nic::rtl8125 {

void Rtl8125::printRegisters() {
	infoLogger() << "rtl8125: dumping registers:" << frg::endlog;
	infoLogger() << frg::fmt("\t cmd: 0x{:02x}",
			static_cast<unsigned int>(static_cast<uint8_t>(_mmio.load(regs::cmd)))) << frg::endlog;
	infoLogger() << frg::fmt("\t interrupt_mask: 0x{:08x}",
			_mmio.load(regs::interrupt_mask)) << frg::endlog;
	infoLogger() << frg::fmt("\t interrupt_status: 0x{:08x}",
			_mmio.load(regs::interrupt_status)) << frg::endlog;
	infoLogger() << frg::fmt("\t transmit_config: 0x{:08x}",
			static_cast<uint32_t>(_mmio.load(regs::transmit_config))) << frg::endlog;
	infoLogger() << frg::fmt("\t receive_config: 0x{:08x}",
			static_cast<uint32_t>(_mmio.load(regs::receive_config))) << frg::endlog;
	infoLogger() << frg::fmt("\t rx_missed: 0x{:08x}",
			_mmio.load(regs::rx_missed)) << frg::endlog;
	infoLogger() << frg::fmt("\t cr9346: 0x{:02x}",
			static_cast<unsigned int>(static_cast<uint8_t>(_mmio.load(regs::cr9346)))) << frg::endlog;
	infoLogger() << frg::fmt("\t phy_status: 0x{:02x}",
			static_cast<unsigned int>(static_cast<uint8_t>(_mmio.load(regs::phy_status)))) << frg::endlog;
	infoLogger() << frg::fmt("\t rx_max_size: 0x{:04x}",
			static_cast<unsigned int>(_mmio.load(regs::rx_max_size))) << frg::endlog;
	infoLogger() << frg::fmt("\t tnpds: 0x{:08x}:{:08x}",
			_mmio.load(regs::tnpds_high), _mmio.load(regs::tnpds_low)) << frg::endlog;
	infoLogger() << frg::fmt("\t rdsar: 0x{:08x}:{:08x}",
			_mmio.load(regs::rdsar_high), _mmio.load(regs::rdsar_low)) << frg::endlog;
	infoLogger() << frg::fmt("\t misc: 0x{:08x}",
			static_cast<uint32_t>(_mmio.load(regs::misc))) << frg::endlog;
}

} // namespace pcinet::nic::rtl8125
