#pragma once

#include <stdint.h>

#include <arch/mem_space.hpp>
#include <frg/expected.hpp>
#include <pcinet/config.hpp>
#include <pcinet/error.hpp>
#include <pci/dw/atu.hpp>

namespace pcinet::pci {

// 32-bit access to the configuration space of the device below the root port.
//
// After a config access, the shared translation region is left pointing at
// config space unless restore is set; in that case it is switched back to a
// memory mapping of barPhys (if barPhys is non-zero) so that MMIO through the
// BAR window works again.
struct ConfigAccessor {
	virtual frg::expected<Error, uint32_t> readDword(uint64_t barPhys, uint16_t offset,
			bool restore) = 0;
	virtual frg::expected<Error> writeDword(uint64_t barPhys, uint16_t offset,
			uint32_t value, bool restore) = 0;

protected:
	~ConfigAccessor() = default;
};

} // namespace pcinet::pci

namespace pcinet::pci::dw {

// The controller has no ECAM; every config access goes through an iATU
// region that is retargeted to config space on demand.
struct DwConfigAccessor final : ConfigAccessor {
	// configWindow is the CPU-side view of BoardConfig::configWindow.
	DwConfigAccessor(Atu<arch::mem_space> *atu, arch::mem_space configWindow,
			const BoardConfig &config);

	frg::expected<Error, uint32_t> readDword(uint64_t barPhys, uint16_t offset,
			bool restore) override;
	frg::expected<Error> writeDword(uint64_t barPhys, uint16_t offset,
			uint32_t value, bool restore) override;

	// Points the shared region at the device's BAR.
	frg::expected<Error> mapBar(uint64_t barPhys);

private:
	frg::expected<Error> mapConfig_();
	frg::expected<Error> restore_(uint64_t barPhys, bool restore);

	Atu<arch::mem_space> *_atu;
	arch::mem_space _configWindow;
	const BoardConfig &_config;
};

} // namespace pcinet::pci::dw
