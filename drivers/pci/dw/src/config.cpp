#include <pci/dw/config.hpp>
#include <pci/dw/debug_options.hpp>

namespace pcinet::pci::dw {

DwConfigAccessor::DwConfigAccessor(Atu<arch::mem_space> *atu, arch::mem_space configWindow,
		const BoardConfig &config)
: _atu{atu}, _configWindow{configWindow}, _config{config} { }

frg::expected<Error> DwConfigAccessor::mapConfig_() {
	// The device sits directly below the root port, i.e. bus 1, device 0,
	// function 0; the controller routes type 0 requests there at target 0.
	return _atu->program(_config.configRegion, AtuRegionType::config0,
			_config.configWindow, 0, _config.configWindowSize);
}

frg::expected<Error> DwConfigAccessor::mapBar(uint64_t barPhys) {
	return _atu->program(_config.configRegion, AtuRegionType::memory,
			_config.barWindow, barPhys, _config.barWindowSize);
}

frg::expected<Error> DwConfigAccessor::restore_(uint64_t barPhys, bool restore) {
	if (!restore || !barPhys)
		return frg::success;
	return mapBar(barPhys);
}

frg::expected<Error, uint32_t> DwConfigAccessor::readDword(uint64_t barPhys, uint16_t offset,
		bool restore) {
	FRG_TRY(mapConfig_());

	auto value = arch::scalar_load<uint32_t>(_configWindow, offset);
	if constexpr (logConfigAccesses)
		infoLogger() << "dw-pcie: Config read at " << frg::hex_fmt{unsigned{offset}}
				<< ": " << frg::hex_fmt{value} << frg::endlog;

	FRG_TRY(restore_(barPhys, restore));
	return value;
}

frg::expected<Error> DwConfigAccessor::writeDword(uint64_t barPhys, uint16_t offset,
		uint32_t value, bool restore) {
	FRG_TRY(mapConfig_());

	if constexpr (logConfigAccesses)
		infoLogger() << "dw-pcie: Config write at " << frg::hex_fmt{unsigned{offset}}
				<< ": " << frg::hex_fmt{value} << frg::endlog;
	arch::scalar_store<uint32_t>(_configWindow, offset, value);
	arch::data_sync_barrier();

	return restore_(barPhys, restore);
}

} // namespace pcinet::pci::dw
