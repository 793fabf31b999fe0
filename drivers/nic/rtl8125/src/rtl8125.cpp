#include <nic/rtl8125/debug_options.hpp>
#include <nic/rtl8125/regs.hpp>
#include <nic/rtl8125/rtl8125.hpp>
#include <pcinet/debug.hpp>

namespace pcinet::nic::rtl8125 {

Rtl8125::Rtl8125(arch::mem_space mmio, arch::dma_pool *pool, ClockSource *clock,
		arch::dma_barrier barrier)
: _mmio{mmio}, _clock{clock}, _barrier{barrier},
  _rxQueue{pool, barrier}, _txQueue{pool, barrier} { }

void Rtl8125::unlockConfigRegisters() {
	_mmio.store(regs::cr9346, flags::cr9346::operating_mode(flags::cr9346::unlock_regs));
}

void Rtl8125::lockConfigRegisters() {
	_mmio.store(regs::cr9346, flags::cr9346::operating_mode(flags::cr9346::lock_regs));
}

void Rtl8125::forcePCICommit() {
	constexpr arch::scalar_register<uint32_t> a_register{0x00};
	[[maybe_unused]] volatile auto c = _mmio.load(a_register);
}

frg::expected<Error> Rtl8125::reset() {
	_mmio.store(regs::cmd, flags::cmd::reset(true));

	if(!waitResetDone()) {
		warningLogger() << "rtl8125: chip did not leave reset" << frg::endlog;
		return Error::resetTimeout;
	}

	if constexpr (logDriverStart)
		infoLogger() << "rtl8125: reset card" << frg::endlog;
	return frg::success;
}

MacAddress Rtl8125::readMacAddress() {
	for(size_t i = 0; i < 6; i++)
		_mac[i] = _mmio.load(regs::mac0 + i);

	infoLogger() << "rtl8125: MAC address " << toString(_mac).str << frg::endlog;
	return _mac;
}

// These two functions write the high uint32_t first; this is intentional:
// some boards have problems if the low half is written first.
void Rtl8125::setupRxDescriptors() {
	_mmio.store(regs::rdsar_high, (_rxQueue.getBase() >> 32) & 0xFFFFFFFF);
	__sync_synchronize();
	_mmio.store(regs::rdsar_low, _rxQueue.getBase() & 0xFFFFFFFF);
}

void Rtl8125::setupTxDescriptors() {
	_mmio.store(regs::tnpds_high, (_txQueue.getBase() >> 32) & 0xFFFFFFFF);
	__sync_synchronize();
	_mmio.store(regs::tnpds_low, _txQueue.getBase() & 0xFFFFFFFF);
}

frg::expected<Error> Rtl8125::configure() {
	_txQueue.reset();
	_rxQueue.reset();
	if constexpr (logDriverStart)
		infoLogger() << "rtl8125: rings at TX " << frg::hex_fmt{_txQueue.getBase()}
				<< ", RX " << frg::hex_fmt{_rxQueue.getBase()} << frg::endlog;

	unlockConfigRegisters();

	_mmio.store(regs::early_tx_threshold, 0x3F);
	setRxConfigRegisters();
	setTxConfigRegisters();

	setupRxDescriptors();
	setupTxDescriptors();

	forcePCICommit();
	_mmio.store(regs::cmd, flags::cmd::transmitter(true) | flags::cmd::receiver(true));

	lockConfigRegisters();

	_mmio.store(regs::rx_missed, 0);
	setRxMode();

	// Only the bits above 11 are defined on this family.
	_mmio.store(regs::multi_intr, _mmio.load(regs::multi_intr) & 0xF000);
	_mmio.store(regs::misc, _mmio.load(regs::misc) / flags::misc::rxdv_gate(false));
	forcePCICommit();

	_configured = true;
	if constexpr (logDriverStart)
		infoLogger() << "rtl8125: started card" << frg::endlog;
	if constexpr (logRegisterDump)
		printRegisters();
	return frg::success;
}

void Rtl8125::stop() {
	_mmio.store(regs::cmd, arch::bit_value<uint8_t>{0});
	_mmio.store(regs::interrupt_mask, 0);
	_mmio.store(regs::rx_missed, 0);
	forcePCICommit();

	_configured = false;
	if constexpr (logDriverStart)
		infoLogger() << "rtl8125: stopped card" << frg::endlog;
}

} // namespace pcinet::nic::rtl8125
