#pragma once

#include <arch/barrier.hpp>
#include <arch/mem_space.hpp>
#include <arch/register.hpp>
#include <frg/expected.hpp>
#include <frg/formatting.hpp>
#include <pcinet/debug.hpp>
#include <pcinet/error.hpp>
#include <pcinet/timer.hpp>
#include <pci/dw/debug_options.hpp>

namespace pcinet::pci::dw {

enum class AtuRegionType : uint8_t {
	memory = 0x0,
	io = 0x2,
	config0 = 0x4,
	config1 = 0x5,
};

constexpr const char *toString(AtuRegionType type) {
	switch (type) {
		case AtuRegionType::memory: return "memory";
		case AtuRegionType::io: return "I/O";
		case AtuRegionType::config0: return "config type 0";
		case AtuRegionType::config1: return "config type 1";
	}
	return "unknown";
}

namespace atu {
	// Outbound regions in unrolled layout, relative to DBI.
	inline constexpr ptrdiff_t unrollBase = 0x300000;
	inline constexpr ptrdiff_t regionStride = 0x200;

	inline constexpr int enableRetries = 5;
	inline constexpr uint64_t enableRetryDelay = 1 * nanosPerMilli;

	struct RegionRegisters {
		explicit constexpr RegionRegisters(unsigned int index)
		: ctrl1{offset(index, 0x00)}, ctrl2{offset(index, 0x04)},
		  lowerBase{offset(index, 0x08)}, upperBase{offset(index, 0x0C)},
		  lowerLimit{offset(index, 0x10)}, upperLimit{offset(index, 0x14)},
		  lowerTarget{offset(index, 0x18)}, upperTarget{offset(index, 0x1C)} { }

		arch::bit_register<uint32_t> ctrl1;
		arch::bit_register<uint32_t> ctrl2;
		arch::scalar_register<uint32_t> lowerBase;
		arch::scalar_register<uint32_t> upperBase;
		arch::scalar_register<uint32_t> lowerLimit;
		arch::scalar_register<uint32_t> upperLimit;
		arch::scalar_register<uint32_t> lowerTarget;
		arch::scalar_register<uint32_t> upperTarget;

	private:
		static constexpr ptrdiff_t offset(unsigned int index, ptrdiff_t reg) {
			return unrollBase + index * regionStride + reg;
		}
	};

	namespace ctrl1 {
		inline constexpr arch::field<uint32_t, AtuRegionType> type{0, 5};
	} // namespace ctrl1

	namespace ctrl2 {
		inline constexpr arch::field<uint32_t, bool> barMode{30, 1};
		inline constexpr arch::field<uint32_t, bool> enable{31, 1};
	} // namespace ctrl2
} // namespace atu

// Programs the outbound iATU of a DesignWare PCIe controller.
// Space is the DBI register space (arch::mem_space on hardware).
template<typename Space>
struct Atu {
	Atu(Space dbi, ClockSource *clock)
	: _dbi{dbi}, _clock{clock} { }

	// Maps [cpuAddr, cpuAddr + size) to pciAddr with the given transaction
	// type. Any previous mapping of the region is replaced.
	frg::expected<Error> program(unsigned int index, AtuRegionType type,
			uint64_t cpuAddr, uint64_t pciAddr, uint64_t size);

	void dumpRegion(unsigned int index);

private:
	// Every write must have landed before the next one is issued:
	// a half-programmed region can route config reads to the wrong place.
	template<typename RT, typename V>
	void storeSynchronized(RT reg, V value) {
		_dbi.store(reg, value);
		arch::data_sync_barrier();
	}

	Space _dbi;
	ClockSource *_clock;
};

template<typename Space>
frg::expected<Error> Atu<Space>::program(unsigned int index, AtuRegionType type,
		uint64_t cpuAddr, uint64_t pciAddr, uint64_t size) {
	atu::RegionRegisters regs{index};
	uint64_t limit = cpuAddr + size - 1;

	if constexpr (logAtuPrograms)
		infoLogger() << "dw-pcie: Programming iATU region " << index
				<< " as " << toString(type)
				<< ", CPU " << frg::hex_fmt{cpuAddr}
				<< "-" << frg::hex_fmt{limit}
				<< " -> PCI " << frg::hex_fmt{pciAddr} << frg::endlog;

	storeSynchronized(regs.lowerBase, static_cast<uint32_t>(cpuAddr));
	storeSynchronized(regs.upperBase, static_cast<uint32_t>(cpuAddr >> 32));
	storeSynchronized(regs.lowerLimit, static_cast<uint32_t>(limit));
	storeSynchronized(regs.upperLimit, static_cast<uint32_t>(limit >> 32));
	storeSynchronized(regs.lowerTarget, static_cast<uint32_t>(pciAddr));
	storeSynchronized(regs.upperTarget, static_cast<uint32_t>(pciAddr >> 32));
	storeSynchronized(regs.ctrl1, atu::ctrl1::type(type));
	storeSynchronized(regs.ctrl2, atu::ctrl2::enable(true));

	int polls = 0;
	bool enabled = busyWaitFor(_clock, [&] {
		polls++;
		arch::data_sync_barrier();
		return _dbi.load(regs.ctrl2) & atu::ctrl2::enable;
	}, atu::enableRetries, atu::enableRetryDelay);

	if (!enabled) {
		warningLogger() << "dw-pcie: iATU region " << index
				<< " did not become enabled" << frg::endlog;
		if constexpr (dumpAtuOnFailure)
			dumpRegion(index);
		return Error::timeout;
	}

	if (polls > 1)
		infoLogger() << "dw-pcie: iATU region " << index << " enabled after "
				<< polls - 1 << " retries" << frg::endlog;
	return frg::success;
}

template<typename Space>
void Atu<Space>::dumpRegion(unsigned int index) {
	atu::RegionRegisters regs{index};

	auto ctrl1 = _dbi.load(regs.ctrl1);
	auto ctrl2 = _dbi.load(regs.ctrl2);
	infoLogger() << "dw-pcie: iATU region " << index << ": type "
			<< toString(ctrl1 & atu::ctrl1::type)
			<< ((ctrl2 & atu::ctrl2::enable) ? ", enabled" : ", disabled") << frg::endlog;
	infoLogger() << "dw-pcie:   base   " << frg::fmt("{:08x}:{:08x}",
			_dbi.load(regs.upperBase), _dbi.load(regs.lowerBase)) << frg::endlog;
	infoLogger() << "dw-pcie:   limit  " << frg::fmt("{:08x}:{:08x}",
			_dbi.load(regs.upperLimit), _dbi.load(regs.lowerLimit)) << frg::endlog;
	infoLogger() << "dw-pcie:   target " << frg::fmt("{:08x}:{:08x}",
			_dbi.load(regs.upperTarget), _dbi.load(regs.lowerTarget)) << frg::endlog;
}

extern template struct Atu<arch::mem_space>;

} // namespace pcinet::pci::dw
