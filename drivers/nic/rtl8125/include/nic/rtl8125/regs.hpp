#pragma once

#include <arch/register.hpp>
#include <arch/variable.hpp>

namespace pcinet::nic::rtl8125 {

namespace regs {
	constexpr arch::scalar_register<uint8_t> mac0{0x00};
	constexpr arch::scalar_register<uint32_t> mar0{0x08};
	constexpr arch::scalar_register<uint32_t> mar4{0x0C};
	constexpr arch::scalar_register<uint32_t> tnpds_low{0x20};
	constexpr arch::scalar_register<uint32_t> tnpds_high{0x24};
	constexpr arch::bit_register<uint8_t> cmd{0x37};
	// On the 8125, the interrupt registers are 32 bits wide and moved down.
	constexpr arch::scalar_register<uint32_t> interrupt_mask{0x38};
	constexpr arch::scalar_register<uint32_t> interrupt_status{0x3C};
	constexpr arch::bit_register<uint32_t> transmit_config{0x40};
	constexpr arch::bit_register<uint32_t> receive_config{0x44};
	constexpr arch::scalar_register<uint32_t> rx_missed{0x4C};
	constexpr arch::bit_register<uint8_t> cr9346{0x50};
	constexpr arch::scalar_register<uint16_t> multi_intr{0x5C};
	constexpr arch::bit_register<uint32_t> phy_access{0x60};
	constexpr arch::bit_register<uint8_t> phy_status{0x6C};
	constexpr arch::bit_register<uint8_t> tppoll{0x90};
	constexpr arch::scalar_register<uint16_t> rx_max_size{0xDA};
	constexpr arch::scalar_register<uint32_t> rdsar_low{0xE4};
	constexpr arch::scalar_register<uint32_t> rdsar_high{0xE8};
	constexpr arch::scalar_register<uint8_t> early_tx_threshold{0xEC};
	constexpr arch::bit_register<uint32_t> misc{0xF0};
} // namespace regs

namespace flags {

namespace cmd {
	constexpr arch::field<uint8_t, bool> transmitter{2, 1};
	constexpr arch::field<uint8_t, bool> receiver{3, 1};
	constexpr arch::field<uint8_t, bool> reset{4, 1};
} // namespace cmd

namespace tppoll {
	// The 8169 family uses bit 6 at 0x38 instead.
	constexpr arch::field<uint8_t, bool> poll_normal_prio{0, 1};
} // namespace tppoll

namespace cr9346 {
	constexpr arch::field<uint8_t, uint8_t> operating_mode{6, 2};
	constexpr uint8_t lock_regs = 0;
	constexpr uint8_t unlock_regs = 3;
} // namespace cr9346

namespace transmit_config {
	constexpr arch::field<uint32_t, uint8_t> mxdma{8, 3};
	constexpr uint8_t mxdma_1024 = 0b110;

	constexpr arch::field<uint32_t, uint8_t> ifg{24, 2};
	constexpr uint8_t ifg_normal = 0b11;
} // namespace transmit_config

namespace receive_config {
	constexpr arch::field<uint32_t, uint8_t> mxdma{8, 3};
	constexpr uint8_t mxdma_1024 = 0b110;

	constexpr arch::field<uint32_t, uint8_t> rxfth{13, 3};
	constexpr uint8_t rxfth_none = 0b111;

	constexpr arch::field<uint32_t, bool> accept_all_physical{0, 1};
	constexpr arch::field<uint32_t, bool> accept_physical_match{1, 1};
	constexpr arch::field<uint32_t, bool> accept_multicast{2, 1};
	constexpr arch::field<uint32_t, bool> accept_broadcast{3, 1};

	// Bits that survive when the receive mode is rewritten.
	constexpr uint32_t mode_preserve_mask = 0xFF7E1880;
} // namespace receive_config

namespace phy_access {
	constexpr arch::field<uint32_t, uint16_t> data{0, 16};
	constexpr arch::field<uint32_t, uint8_t> addr{16, 5};
	// Set by software for writes and cleared by the chip when done;
	// set by the chip once read data is valid.
	constexpr arch::field<uint32_t, bool> flag{31, 1};
} // namespace phy_access

namespace phy_status {
	constexpr arch::field<uint8_t, bool> full_duplex{0, 1};
	constexpr arch::field<uint8_t, bool> link{1, 1};
	constexpr arch::field<uint8_t, bool> speed_10{2, 1};
	constexpr arch::field<uint8_t, bool> speed_100{3, 1};
	constexpr arch::field<uint8_t, bool> speed_1000{4, 1};
	constexpr arch::field<uint8_t, bool> tbi_enable{7, 1};
} // namespace phy_status

namespace misc {
	constexpr arch::field<uint32_t, bool> rxdv_gate{19, 1};
} // namespace misc

} // namespace flags

// Registers of the integrated PHY, reached through phy_access.
namespace mii {
	constexpr uint8_t bmcr = 0x00;
	constexpr uint8_t bmsr = 0x01;
	constexpr uint8_t advertise = 0x04;
	constexpr uint8_t ctrl1000 = 0x09;

	constexpr uint16_t bmcr_restart_autoneg = 0x0200;
	constexpr uint16_t bmcr_enable_autoneg = 0x1000;
	constexpr uint16_t bmsr_autoneg_complete = 0x0020;

	constexpr uint16_t advertise_10_half = 0x0020;
	constexpr uint16_t advertise_10_full = 0x0040;
	constexpr uint16_t advertise_100_half = 0x0080;
	constexpr uint16_t advertise_100_full = 0x0100;
	constexpr uint16_t advertise_1000_full = 0x0200;
} // namespace mii

} // namespace pcinet::nic::rtl8125
