#pragma once

#include <arch/barrier.hpp>
#include <arch/dma_structs.hpp>
#include <arch/mem_space.hpp>
#include <frg/expected.hpp>
#include <frg/optional.hpp>
#include <nic/rtl8125/rx.hpp>
#include <nic/rtl8125/tx.hpp>
#include <pcinet/error.hpp>
#include <pcinet/link.hpp>
#include <pcinet/mac.hpp>
#include <pcinet/timer.hpp>

namespace pcinet::nic::rtl8125 {

namespace timing {
	constexpr int resetAttempts = 1000;
	constexpr uint64_t resetDelay = 10 * nanosPerMicro;

	constexpr int txAttempts = 10000;
	constexpr uint64_t txDelay = 10 * nanosPerMicro;

	// recv() polls every 10 us, i.e. 100 times per millisecond of timeout.
	constexpr uint64_t rxDelay = 10 * nanosPerMicro;
	constexpr uint64_t rxPollsPerMilli = nanosPerMilli / rxDelay;

	constexpr int mdioAttempts = 2000;
	constexpr uint64_t mdioDelay = 100 * nanosPerMicro;
	constexpr uint64_t mdioSettleDelay = 1000 * nanosPerMicro;

	constexpr int autonegAttempts = 10000;
	constexpr uint64_t autonegDelay = 100 * nanosPerMicro;
} // namespace timing

// Polled driver for the RTL8125 family. All operations run to completion
// on the calling core; no interrupts are used.
struct Rtl8125 final : Link {
	Rtl8125(arch::mem_space mmio, arch::dma_pool *pool, ClockSource *clock,
			arch::dma_barrier barrier = arch::dma_barrier{false});

	Rtl8125(const Rtl8125 &) = delete;
	Rtl8125 &operator= (const Rtl8125 &) = delete;

	frg::expected<Error> reset();

	MacAddress readMacAddress();

	// Restarts auto-negotiation if the link is down. Failures are logged only.
	void initializePhy();

	frg::expected<Error> configure();

	frg::expected<Error> send(std::span<const uint8_t> frame) override;

	frg::expected<Error, size_t> recv(std::span<uint8_t> buffer, uint64_t timeoutMs);

	frg::expected<Error, size_t> receive(std::span<uint8_t> buffer,
			uint64_t timeoutMs) override {
		return recv(buffer, timeoutMs);
	}

	MacAddress deviceMac() override {
		return _mac;
	}

	void stop();

	void printRegisters();

	RxQueue &rxQueue() {
		return _rxQueue;
	}

	TxQueue &txQueue() {
		return _txQueue;
	}

private:
	// The core configuration registers have a hardware lock
	void unlockConfigRegisters();
	void lockConfigRegisters();

	void setupRxDescriptors();
	void setupTxDescriptors();

	void setRxConfigRegisters();
	void setTxConfigRegisters();
	void setRxMode();

	void ringDoorbell();

	// This function loads something from PCI, forcing some
	// less-cooperative PCI controllers to commit writes
	void forcePCICommit();

	// Busy wait loops
	bool waitResetDone();
	bool waitTxDescriptorReleased();
	bool waitMdioReadReady();
	bool waitMdioWriteDone();

	frg::optional<uint16_t> readPhy(uint8_t reg);
	bool writePhy(uint8_t reg, uint16_t value);

	arch::mem_space _mmio;
	ClockSource *_clock;
	arch::dma_barrier _barrier;

	RxQueue _rxQueue;
	TxQueue _txQueue;

	MacAddress _mac;
	bool _configured = false;
};

} // namespace pcinet::nic::rtl8125
