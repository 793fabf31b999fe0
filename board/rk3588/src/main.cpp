#include <arch/barrier.hpp>
#include <arch/dma_pool.hpp>
#include <arch/mem_space.hpp>
#include <net/config.hpp>
#include <net/ping.hpp>
#include <nic/rtl8125/rtl8125.hpp>
#include <pci/dw/atu.hpp>
#include <pci/dw/config.hpp>
#include <pci/dw/enumerate.hpp>
#include <pcinet/debug.hpp>
#include <rk3588/main.hpp>

namespace pcinet::rk3588 {

namespace {

// Receive attempts per call to PingSession::respond().
constexpr int respondRounds = 16;

frg::expected<Error> pingAndServe(Link *link, const net::NetConfig &netConfig) {
	net::PingSession session{link, netConfig};

	int replies = 0;
	for (int seq = 1; seq <= netConfig.pingCount; seq++) {
		if (FRG_TRY(session.ping(seq)))
			replies++;
	}
	infoLogger() << "pcinet: " << replies << "/" << netConfig.pingCount
			<< " echo replies received" << frg::endlog;

	while (true)
		FRG_TRY(session.respond(respondRounds));
}

frg::expected<Error> bringUp(const BoardConfig &config, ClockSource *clock) {
	pci::dw::Atu<arch::mem_space> atu{arch::mem_space{config.dbiBase}, clock};
	pci::dw::DwConfigAccessor io{&atu, arch::mem_space{config.configWindow}, config};

	pci::DeviceContext ctx;
	FRG_TRY(pci::enumerateDevice(&io, config.registerBar, ctx));
	if (ctx.bar.size > config.barWindowSize)
		warningLogger() << "pcinet: BAR is larger than the window, only "
				<< frg::hex_fmt{config.barWindowSize} << " bytes are reachable" << frg::endlog;
	ctx.mmioBase = config.barWindow;

	// The DMA region is identity mapped and the PCIe bus does not snoop.
	arch::contiguous_pool pool{reinterpret_cast<void *>(config.dmaRegion),
			config.dmaRegion, config.dmaRegionSize};
	nic::rtl8125::Rtl8125 nic{arch::mem_space{ctx.mmioBase}, &pool, clock,
			arch::dma_barrier{false}};

	FRG_TRY(nic.reset());
	ctx.mac = nic.readMacAddress();
	nic.initializePhy();
	FRG_TRY(nic.configure());

	net::NetConfig netConfig;
	infoLogger() << "pcinet: local " << net::formatIp4(netConfig.localIp).str
			<< ", remote " << net::formatIp4(netConfig.remoteIp).str << frg::endlog;
	if (ctx.mac)
		infoLogger() << "pcinet: using chip MAC " << toString(ctx.mac).str << frg::endlog;
	else
		warningLogger() << "pcinet: chip reports no MAC, using "
				<< toString(netConfig.localMac).str << frg::endlog;

	auto outcome = pingAndServe(&nic, netConfig);
	nic.stop();
	return outcome;
}

} // anonymous namespace

void pcinetMain(const BoardConfig &config, ClockSource *clock) {
	auto outcome = bringUp(config, clock);
	if (!outcome)
		warningLogger() << "pcinet: " << toString(outcome.error()) << frg::endlog;
}

} // namespace pcinet::rk3588
