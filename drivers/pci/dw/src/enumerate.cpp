#include <frg/formatting.hpp>
#include <pcinet/debug.hpp>
#include <pci/dw/enumerate.hpp>

namespace pcinet::pci {

frg::expected<Error, DeviceId> scanDevice(ConfigAccessor *io) {
	auto ids = FRG_TRY(io->readDword(0, cfg::vendorDevice, false));

	DeviceId id{};
	id.vendor = ids & 0xFFFF;
	id.device = ids >> 16;
	if (id.vendor == 0xFFFF || id.vendor == 0x0000) {
		infoLogger() << "pci: No device present (vendor "
				<< frg::hex_fmt{unsigned{id.vendor}} << ")" << frg::endlog;
		return Error::noDevice;
	}

	auto classRev = FRG_TRY(io->readDword(0, cfg::classRevision, false));
	id.classCode = classRev >> 8;
	id.revision = classRev & 0xFF;

	infoLogger() << frg::fmt("pci: Found {:04x}:{:04x}, class {:06x}, revision {:02x}",
			unsigned{id.vendor}, unsigned{id.device}, id.classCode, unsigned{id.revision}) << frg::endlog;
	return id;
}

const char *identifyDevice(const DeviceId &id) {
	if (id.vendor != vendorRealtek)
		return "Unknown device";

	switch (id.device) {
		case 0x8125: return "RTL8125 2.5GbE Controller";
		case 0x8169: return "RTL8169 GbE Controller";
		default: return "Unknown Realtek device";
	}
}

frg::expected<Error, BarInfo> probeBar(ConfigAccessor *io, unsigned int n) {
	uint16_t offset = cfg::bar0 + n * 4;
	auto bar = FRG_TRY(io->readDword(0, offset, false));

	// Write all 1s to the BAR and read it back to determine its length.
	FRG_TRY(io->writeDword(0, offset, 0xFFFFFFFF, false));
	auto readback = FRG_TRY(io->readDword(0, offset, false));
	FRG_TRY(io->writeDword(0, offset, bar, false));

	BarInfo info;
	uint64_t mask;
	if (readback & 1) {
		info.type = BarType::io;
		info.address = bar & 0xFFFFFFFC;
		mask = readback & 0xFFFFFFFC;
	} else if (((bar >> 1) & 3) == 2) {
		if (n + 1 >= cfg::numBars) {
			warningLogger() << "pci: 64-bit BAR #" << n << " has no upper half" << frg::endlog;
			return Error::noBar;
		}

		auto high = FRG_TRY(io->readDword(0, offset + 4, false));
		FRG_TRY(io->writeDword(0, offset + 4, 0xFFFFFFFF, false));
		auto highReadback = FRG_TRY(io->readDword(0, offset + 4, false));
		FRG_TRY(io->writeDword(0, offset + 4, high, false));

		info.type = BarType::memory64;
		info.address = (uint64_t{high} << 32) | (bar & 0xFFFFFFF0);
		mask = (uint64_t{highReadback} << 32) | (readback & 0xFFFFFFF0);
	} else {
		info.type = BarType::memory32;
		info.address = bar & 0xFFFFFFF0;
		mask = readback & 0xFFFFFFF0;
	}
	info.prefetchable = info.type != BarType::io && (bar & (1 << 3));

	// Device doesn't decode any address bits from this BAR.
	if (!mask) {
		infoLogger() << "pci: BAR #" << n << " is not implemented" << frg::endlog;
		return Error::noBar;
	}
	// The lowest writable bit gives the size. Upper bits may read back as
	// zero, e.g. for I/O BARs that only decode 16 bits.
	info.size = uint64_t{1} << __builtin_ctzll(mask);

	infoLogger() << "pci: "
			<< (info.type == BarType::io ? "I/O"
				: info.type == BarType::memory64 ? "64-bit memory" : "32-bit memory")
			<< " BAR #" << n
			<< " at 0x" << frg::hex_fmt{info.address}
			<< ", length: " << info.size << " bytes"
			<< (info.prefetchable ? " (prefetchable)" : "")
			<< frg::endlog;
	return info;
}

frg::expected<Error> enableDevice(ConfigAccessor *io, uint64_t barPhys) {
	auto commandStatus = FRG_TRY(io->readDword(barPhys, cfg::commandStatus, false));
	uint32_t command = commandStatus & 0xFFFF;

	command |= cfg::command::ioSpace | cfg::command::memorySpace | cfg::command::busMaster;
	command &= ~cfg::command::interruptDisable;

	// The status half is RW1C; writing zeros leaves it untouched.
	FRG_TRY(io->writeDword(barPhys, cfg::commandStatus, command, false));

	auto readback = FRG_TRY(io->readDword(barPhys, cfg::commandStatus, true));
	infoLogger() << "pci: Command register is now "
			<< frg::hex_fmt{readback & 0xFFFF} << frg::endlog;

	if (!(readback & cfg::command::memorySpace)) {
		warningLogger() << "pci: Memory space enable did not stick" << frg::endlog;
		return Error::enableFailed;
	}
	return frg::success;
}

frg::expected<Error> enumerateDevice(ConfigAccessor *io, unsigned int barIndex,
		DeviceContext &ctx) {
	ctx.id = FRG_TRY(scanDevice(io));
	infoLogger() << "pci: Device is a " << identifyDevice(ctx.id) << frg::endlog;

	ctx.barIndex = barIndex;
	ctx.bar = FRG_TRY(probeBar(io, barIndex));

	FRG_TRY(enableDevice(io, ctx.bar.address));
	ctx.enabled = true;
	return frg::success;
}

} // namespace pcinet::pci
