#include <assert.h>
#include <map>
#include <string.h>
#include <vector>

#include <arch/barrier.hpp>
#include <nic/rtl8125/rtl8125.hpp>

#include "fakes.hpp"
#include "testsuite.hpp"

using pcinet::Error;
using pcinet::nic::rtl8125::Rtl8125;
namespace rtl = pcinet::nic::rtl8125;

namespace {

constexpr uint32_t ownBit = uint32_t{1} << 31;
constexpr uint32_t eorBit = uint32_t{1} << 30;
constexpr uint32_t firstBit = uint32_t{1} << 29;
constexpr uint32_t lastBit = uint32_t{1} << 28;
constexpr uint32_t errorBit = uint32_t{1} << 21;

// Takes the place of dc cvac / dc ivac for a non-coherent NIC and records
// every request, together with the state of the TX doorbell at that moment.
struct CacheLog final : arch::cache_maintenance {
	enum class Op { writeback, invalidate };

	struct Entry {
		Op op;
		const void *pointer;
		size_t size;
		bool doorbell;
		// Contents of watched at the time of the call.
		uint32_t watchedValue;
	};

	explicit CacheLog(RegisterFile *regs)
	: regs_{regs} { }

	void writeback(const void *pointer, size_t size) override {
		record(Op::writeback, pointer, size);
	}

	void invalidate(const void *pointer, size_t size) override {
		record(Op::invalidate, pointer, size);
	}

	size_t count(Op op, const void *pointer, size_t size) const {
		size_t n = 0;
		for (auto &entry : entries)
			if (entry.op == op && entry.pointer == pointer && entry.size == size)
				n++;
		return n;
	}

	// Index of the first matching entry, or entries.size().
	size_t find(Op op, const void *pointer, size_t size, size_t from = 0) const {
		for (size_t i = from; i < entries.size(); i++)
			if (entries[i].op == op && entries[i].pointer == pointer && entries[i].size == size)
				return i;
		return entries.size();
	}

	std::vector<Entry> entries;
	const uint32_t *watched = nullptr;

private:
	void record(Op op, const void *pointer, size_t size) {
		entries.push_back({op, pointer, size, (regs_->read<uint8_t>(0x90) & 1) != 0,
				watched ? *watched : 0});
	}

	RegisterFile *regs_;
};

// Just enough of an RTL8125 to run the driver against: registers in host
// memory, descriptor rings in a HostDmaRegion. The chip acts whenever the
// driver sleeps.
struct NicModel {
	// The model reads memory directly, like a snooping bus master. A
	// non-coherent NIC gets its cache maintenance recorded in cache.
	explicit NicModel(bool coherent = true)
	: nic{regs.space(), &dma.pool, &clock,
			coherent ? arch::dma_barrier{true} : arch::dma_barrier{&cache}} {
		clock.onSleep = [this] { step(); };
	}

	// Sleeps before the reset bit clears; -1 keeps the chip in reset.
	int resetSleeps = 0;
	// Leaves TX descriptors owned by the NIC.
	bool txHangs = false;

	std::vector<std::vector<uint8_t>> sentFrames;
	std::vector<uint32_t> sentFlags;
	int doorbells = 0;

	std::map<uint8_t, uint16_t> phyRegs;
	std::vector<std::pair<uint8_t, uint16_t>> phyWrites;

	uint64_t txBase() {
		return regs.read<uint32_t>(0x20) | (uint64_t{regs.read<uint32_t>(0x24)} << 32);
	}

	uint64_t rxBase() {
		return regs.read<uint32_t>(0xE4) | (uint64_t{regs.read<uint32_t>(0xE8)} << 32);
	}

	uint32_t rxFlags(size_t index) {
		return dma.read<uint32_t>(rxBase() + index * 16);
	}

	void *rxDescriptor(size_t index) {
		return dma.translate(rxBase() + index * 16);
	}

	void *txDescriptor(size_t index) {
		return dma.translate(txBase() + index * 16);
	}

	void *rxBuffer(size_t index) {
		return bufferOf(rxBase() + index * 16);
	}

	void *txBuffer(size_t index) {
		return bufferOf(txBase() + index * 16);
	}

	void *bufferOf(uint64_t desc) {
		return dma.translate(dma.read<uint32_t>(desc + 8)
				| (uint64_t{dma.read<uint32_t>(desc + 12)} << 32));
	}

	// Puts a received frame into slot index and hands the slot to the driver.
	void inject(size_t index, const std::vector<uint8_t> &frame, bool error = false) {
		uint64_t desc = rxBase() + index * 16;
		uint64_t buffer = dma.read<uint32_t>(desc + 8)
				| (uint64_t{dma.read<uint32_t>(desc + 12)} << 32);
		memcpy(dma.translate(buffer), frame.data(), frame.size());

		uint32_t flags = (dma.read<uint32_t>(desc) & eorBit)
				| firstBit | lastBit | (frame.size() + 4);
		if (error)
			flags |= errorBit;
		dma.write<uint32_t>(desc, flags);
	}

	void step() {
		auto cmd = regs.read<uint8_t>(0x37);
		if (cmd & 0x10) {
			if (resetSleeps == 0)
				regs.write<uint8_t>(0x37, cmd & ~0x10);
			else if (resetSleeps > 0)
				resetSleeps--;
		}

		if ((regs.read<uint8_t>(0x90) & 1) && !txHangs) {
			regs.write<uint8_t>(0x90, 0);
			doorbells++;
			for (size_t i = 0; i < rtl::numTxDescriptors; i++) {
				uint64_t desc = txBase() + i * 16;
				auto flags = dma.read<uint32_t>(desc);
				if (!(flags & ownBit))
					continue;
				uint64_t buffer = dma.read<uint32_t>(desc + 8)
						| (uint64_t{dma.read<uint32_t>(desc + 12)} << 32);
				auto data = static_cast<uint8_t *>(dma.translate(buffer));
				sentFrames.emplace_back(data, data + (flags & 0xFFFF));
				sentFlags.push_back(flags);
				dma.write<uint32_t>(desc, flags & ~ownBit);
			}
		}

		// PHY access: the chip completes whatever the driver last asked for.
		auto access = regs.read<uint32_t>(0x60);
		if (access != phySeen) {
			uint8_t reg = (access >> 16) & 0x1F;
			if (access & ownBit) {
				phyRegs[reg] = access & 0xFFFF;
				phyWrites.push_back({reg, static_cast<uint16_t>(access & 0xFFFF)});
				phySeen = access & ~ownBit;
			} else {
				phySeen = ownBit | (uint32_t{reg} << 16) | phyRegs[reg];
			}
			regs.write<uint32_t>(0x60, phySeen);
		}
	}

	RegisterFile regs{0x100};
	HostDmaRegion dma;
	FakeClock clock;
	CacheLog cache{&regs};
	Rtl8125 nic;

private:
	uint32_t phySeen = 0;
};

// A configured NIC whose clock and cache log have been reset.
struct RunningNic : NicModel {
	explicit RunningNic(bool coherent = true)
	: NicModel{coherent} {
		assert_success(nic.reset());
		assert_success(nic.configure());
		clock.now = 0;
		clock.sleeps = 0;
		cache.entries.clear();
	}
};

std::vector<uint8_t> pattern(size_t size, uint8_t seed) {
	std::vector<uint8_t> bytes(size);
	for (size_t i = 0; i < size; i++)
		bytes[i] = seed + i;
	return bytes;
}

} // anonymous namespace

DEFINE_TEST(rtl8125_reset_completes, ([] {
	NicModel model;
	model.resetSleeps = 3;

	assert_success(model.nic.reset());
	assert(model.clock.sleeps == 4);
	assert(!(model.regs.read<uint8_t>(0x37) & 0x10));
}))

DEFINE_TEST(rtl8125_reset_timeout, ([] {
	NicModel model;
	model.resetSleeps = -1;

	auto outcome = model.nic.reset();
	assert(!outcome);
	assert(outcome.error() == Error::resetTimeout);
	assert(model.clock.sleeps == 1000);
	assert(model.clock.now == 1000 * 10 * pcinet::nanosPerMicro);
}))

DEFINE_TEST(rtl8125_configure_registers, ([] {
	NicModel model;
	model.regs.write<uint16_t>(0x5C, 0xABCD);
	model.regs.write<uint32_t>(0xF0, 0xFFFFFFFF);
	model.regs.write<uint32_t>(0x4C, 0x1234);

	assert_success(model.nic.reset());
	assert_success(model.nic.configure());

	auto &regs = model.regs;
	assert(regs.read<uint8_t>(0x37) == 0x0C);
	assert(regs.read<uint8_t>(0x50) == 0x00);
	assert(regs.read<uint8_t>(0xEC) == 0x3F);
	assert(regs.read<uint32_t>(0x40) == 0x03000600);
	assert(regs.read<uint16_t>(0xDA) == 2048);
	assert(regs.read<uint32_t>(0x4C) == 0);
	assert(regs.read<uint32_t>(0x08) == 0xFFFFFFFF);
	assert(regs.read<uint32_t>(0x0C) == 0xFFFFFFFF);
	assert((regs.read<uint32_t>(0x44) & 0x0F) == 0x0E);
	assert(regs.read<uint16_t>(0x5C) == 0xA000);
	assert(regs.read<uint32_t>(0xF0) == (0xFFFFFFFF & ~(uint32_t{1} << 19)));

	// Rings are programmed with bus addresses.
	assert(model.rxBase() == model.nic.rxQueue().getBase());
	assert(model.txBase() == model.nic.txQueue().getBase());
	assert(model.rxBase() >= HostDmaRegion::busBase);
	assert(model.rxBase() % 64 == 0);
	assert(model.txBase() % 64 == 0);
}))

DEFINE_TEST(rtl8125_configure_resets_rings, ([] {
	RunningNic model;

	for (size_t i = 0; i < rtl::numRxDescriptors; i++) {
		uint32_t expected = ownBit | 2048;
		if (i == rtl::numRxDescriptors - 1)
			expected |= eorBit;
		assert(model.rxFlags(i) == expected);
	}
	for (size_t i = 0; i < rtl::numTxDescriptors; i++) {
		auto flags = model.dma.read<uint32_t>(model.txBase() + i * 16);
		assert(!(flags & ownBit));
		assert(!!(flags & eorBit) == (i == rtl::numTxDescriptors - 1));
	}
	assert(model.nic.rxQueue().currentIndex() == 0);
	assert(model.nic.txQueue().currentIndex() == 0);
}))

DEFINE_TEST(rtl8125_send_frame, ([] {
	RunningNic model;
	auto frame = pattern(74, 0x10);

	assert_success(model.nic.send(frame));
	assert(model.doorbells == 1);
	assert(model.sentFrames.size() == 1);
	assert(model.sentFrames[0] == frame);
	assert(model.sentFlags[0] == (ownBit | firstBit | lastBit | 74));
	assert(model.nic.txQueue().currentIndex() == 1);
	assert(model.clock.sleeps == 1);
}))

DEFINE_TEST(rtl8125_send_pads_short_frames, ([] {
	RunningNic model;

	// Dirty every buffer first.
	for (size_t i = 0; i < rtl::numTxDescriptors; i++)
		assert_success(model.nic.send(std::vector<uint8_t>(100, 0xAA)));
	assert(model.sentFlags.back() & eorBit);
	assert(model.nic.txQueue().currentIndex() == 0);

	auto frame = pattern(20, 0x01);
	assert_success(model.nic.send(frame));

	auto &wire = model.sentFrames.back();
	assert(wire.size() == 60);
	assert(!memcmp(wire.data(), frame.data(), 20));
	for (size_t i = 20; i < 60; i++)
		assert(wire[i] == 0);
}))

DEFINE_TEST(rtl8125_send_rejects_oversized, ([] {
	RunningNic model;

	auto outcome = model.nic.send(std::vector<uint8_t>(2049, 0x55));
	assert(!outcome);
	assert(outcome.error() == Error::oversizedPacket);
	assert(model.regs.read<uint8_t>(0x90) == 0);
	assert(model.clock.sleeps == 0);
	assert(model.nic.txQueue().currentIndex() == 0);

	// A full buffer is fine.
	assert_success(model.nic.send(std::vector<uint8_t>(2048, 0x55)));
	assert(model.sentFrames.back().size() == 2048);
}))

DEFINE_TEST(rtl8125_send_timeout, ([] {
	RunningNic model;
	model.txHangs = true;

	auto outcome = model.nic.send(pattern(64, 0));
	assert(!outcome);
	assert(outcome.error() == Error::txTimeout);
	assert(model.clock.sleeps == 10000);
	assert(model.nic.txQueue().currentIndex() == 0);
}))

DEFINE_TEST(rtl8125_receive_frame, ([] {
	RunningNic model;
	auto frame = pattern(74, 0x40);
	model.inject(0, frame);

	std::vector<uint8_t> buffer(2048);
	auto length = model.nic.recv(buffer, 10);
	assert(length);
	assert(length.value() == 74);
	assert(!memcmp(buffer.data(), frame.data(), 74));

	// The slot is back with the NIC and the cursor has moved on.
	assert(model.rxFlags(0) == (ownBit | 2048));
	assert(model.nic.rxQueue().currentIndex() == 1);
	assert(model.clock.sleeps == 0);
}))

DEFINE_TEST(rtl8125_receive_wraps_ring, ([] {
	RunningNic model;
	std::vector<uint8_t> buffer(2048);

	// A completed slot is found wherever it is.
	model.inject(3, pattern(60, 0));
	auto length = model.nic.recv(buffer, 10);
	assert(length);
	assert(length.value() == 60);
	assert(model.rxFlags(3) == (ownBit | eorBit | 2048));
	assert(model.nic.rxQueue().currentIndex() == 0);

	for (size_t round = 0; round < 2 * rtl::numRxDescriptors; round++) {
		auto index = model.nic.rxQueue().currentIndex();
		auto frame = pattern(64 + round, round);
		model.inject(index, frame);

		auto got = model.nic.recv(buffer, 10);
		assert(got);
		assert(got.value() == frame.size());
		assert(!memcmp(buffer.data(), frame.data(), frame.size()));
	}
}))

DEFINE_TEST(rtl8125_receive_same_slot_twice, ([] {
	RunningNic model;
	std::vector<uint8_t> buffer(2048);

	// The chip may fill the slot it just got back instead of the next one.
	for (int round = 0; round < 2; round++) {
		auto frame = pattern(70, round);
		model.inject(0, frame);

		auto length = model.nic.recv(buffer, 10);
		assert(length);
		assert(length.value() == 70);
		assert(!memcmp(buffer.data(), frame.data(), 70));
		assert(model.rxFlags(0) == (ownBit | 2048));
	}
	assert(model.nic.rxQueue().currentIndex() == 1);
}))

DEFINE_TEST(rtl8125_receive_arrives_later, ([] {
	RunningNic model;
	auto frame = pattern(90, 7);

	model.clock.onSleep = [&model, &frame] {
		if (model.clock.sleeps == 25)
			model.inject(0, frame);
	};

	std::vector<uint8_t> buffer(2048);
	auto length = model.nic.recv(buffer, 1);
	assert(length);
	assert(length.value() == 90);
	assert(model.clock.sleeps == 25);
}))

DEFINE_TEST(rtl8125_receive_error, ([] {
	RunningNic model;
	model.inject(0, pattern(74, 0), true);

	std::vector<uint8_t> buffer(2048);
	auto outcome = model.nic.recv(buffer, 10);
	assert(!outcome);
	assert(outcome.error() == Error::rxError);
	assert(model.rxFlags(0) == (ownBit | 2048));
	assert(model.nic.rxQueue().currentIndex() == 1);
}))

DEFINE_TEST(rtl8125_receive_buffer_too_small, ([] {
	RunningNic model;
	model.inject(0, pattern(74, 0));

	std::vector<uint8_t> buffer(32);
	auto outcome = model.nic.recv(buffer, 10);
	assert(!outcome);
	assert(outcome.error() == Error::bufferTooSmall);
	assert(model.rxFlags(0) == (ownBit | 2048));
}))

DEFINE_TEST(rtl8125_receive_timeout, ([] {
	RunningNic model;
	std::vector<uint8_t> buffer(2048);

	auto outcome = model.nic.recv(buffer, 1);
	assert(!outcome);
	assert(outcome.error() == Error::rxTimeout);
	assert(model.clock.sleeps == 100);
	assert(model.clock.now == pcinet::nanosPerMilli);

	auto immediate = model.nic.recv(buffer, 0);
	assert(!immediate);
	assert(immediate.error() == Error::rxTimeout);
	assert(model.clock.sleeps == 100);
}))

DEFINE_TEST(rtl8125_read_mac_address, ([] {
	NicModel model;
	const uint8_t bytes[] = {0x2e, 0xc3, 0x69, 0x34, 0x7d, 0x31};
	for (size_t i = 0; i < 6; i++)
		model.regs.write<uint8_t>(i, bytes[i]);

	auto mac = model.nic.readMacAddress();
	assert(mac == pcinet::MacAddress({0x2e, 0xc3, 0x69, 0x34, 0x7d, 0x31}));
	assert(model.nic.deviceMac() == mac);
}))

DEFINE_TEST(rtl8125_stop, ([] {
	RunningNic model;
	model.regs.write<uint32_t>(0x38, 0xFFFF);

	model.nic.stop();
	assert(model.regs.read<uint8_t>(0x37) == 0);
	assert(model.regs.read<uint32_t>(0x38) == 0);
	assert(model.regs.read<uint32_t>(0x4C) == 0);

	// Configuring again brings the card back.
	assert_success(model.nic.configure());
	assert(model.regs.read<uint8_t>(0x37) == 0x0C);
}))

DEFINE_TEST(rtl8125_phy_link_up, ([] {
	NicModel model;
	model.regs.write<uint8_t>(0x6C, 0x13);

	model.nic.initializePhy();
	assert(model.clock.sleeps == 0);
	assert(model.phyWrites.empty());
}))

DEFINE_TEST(rtl8125_phy_tbi, ([] {
	NicModel model;
	model.regs.write<uint8_t>(0x6C, 0x80);

	model.nic.initializePhy();
	assert(model.clock.sleeps == 0);
}))

DEFINE_TEST(rtl8125_phy_restarts_autoneg, ([] {
	NicModel model;
	model.phyRegs[rtl::mii::advertise] = 0x0001;
	model.phyRegs[rtl::mii::bmsr] = 0x0020;

	model.nic.initializePhy();
	assert(model.phyWrites.size() == 3);
	assert(model.phyWrites[0] == std::make_pair(rtl::mii::advertise, uint16_t{0x01E1}));
	assert(model.phyWrites[1] == std::make_pair(rtl::mii::ctrl1000, uint16_t{0x0200}));
	assert(model.phyWrites[2] == std::make_pair(rtl::mii::bmcr, uint16_t{0x1200}));
}))

DEFINE_TEST(rtl8125_configure_invalidates_rx_buffers_once, ([] {
	NicModel model{false};
	assert_success(model.nic.reset());
	assert_success(model.nic.configure());

	using Op = CacheLog::Op;
	auto ringWriteback = model.cache.find(Op::writeback, model.rxDescriptor(0), 64);
	assert(ringWriteback < model.cache.entries.size());
	for (size_t i = 0; i < rtl::numRxDescriptors; i++) {
		assert(model.cache.count(Op::invalidate, model.rxBuffer(i), 2048) == 1);
		assert(model.cache.find(Op::invalidate, model.rxBuffer(i), 2048) < ringWriteback);
	}
}))

DEFINE_TEST(rtl8125_send_cleans_before_doorbell, ([] {
	RunningNic model{false};
	auto &cache = model.cache;
	using Op = CacheLog::Op;
	cache.watched = static_cast<const uint32_t *>(model.txDescriptor(0));

	assert_success(model.nic.send(pattern(74, 0x10)));

	// Frame first, then OWN, then the descriptor, and only then the doorbell.
	auto frame = cache.find(Op::writeback, model.txBuffer(0), 74);
	auto desc = cache.find(Op::writeback, model.txDescriptor(0), 16);
	assert(frame < desc && desc < cache.entries.size());
	assert(!(cache.entries[frame].watchedValue & ownBit));
	assert(!cache.entries[frame].doorbell);
	assert(cache.entries[desc].watchedValue & ownBit);
	assert(!cache.entries[desc].doorbell);

	// OWN is re-read from memory on every poll.
	assert(model.clock.sleeps == 1);
	assert(cache.count(Op::invalidate, model.txDescriptor(0), 16) == 2);
	assert(cache.find(Op::invalidate, model.txDescriptor(0), 16) > desc);
	assert(cache.entries[cache.find(Op::invalidate, model.txDescriptor(0), 16)].doorbell);
}))

DEFINE_TEST(rtl8125_receive_invalidates_every_poll, ([] {
	RunningNic model{false};
	auto frame = pattern(90, 7);
	using Op = CacheLog::Op;

	model.clock.onSleep = [&model, &frame] {
		if (model.clock.sleeps == 25)
			model.inject(0, frame);
	};

	std::vector<uint8_t> buffer(2048);
	auto length = model.nic.recv(buffer, 1);
	assert(length);
	assert(length.value() == 90);
	assert(!memcmp(buffer.data(), frame.data(), 90));

	assert(model.cache.count(Op::invalidate, model.rxDescriptor(0), 64) == 26);

	// The whole buffer, not just the frame, after the last look at the ring.
	size_t lastRing = 0;
	for (size_t i = 0; i < model.cache.entries.size(); i++)
		if (model.cache.entries[i].pointer == model.rxDescriptor(0)
				&& model.cache.entries[i].size == 64)
			lastRing = i;
	auto copy = model.cache.find(Op::invalidate, model.rxBuffer(0), 2048);
	assert(copy < model.cache.entries.size());
	assert(copy > lastRing);
}))

DEFINE_TEST(rtl8125_receive_holds_back_shared_line, ([] {
	// All four descriptors share one cache line.
	assert(arch::dcache_line_size() >= 64);

	RunningNic model{false};
	using Op = CacheLog::Op;
	std::vector<uint8_t> buffer(2048);

	for (size_t i = 0; i < rtl::numRxDescriptors - 1; i++) {
		auto frame = pattern(64 + i, i);
		model.inject(i, frame);
		auto length = model.nic.recv(buffer, 1);
		assert(length);
		assert(length.value() == frame.size());
		assert(!memcmp(buffer.data(), frame.data(), frame.size()));

		// Cleaning the line now would overwrite the slots the NIC still owns.
		assert(model.nic.rxQueue().isHeldBack(i));
		assert(!(model.rxFlags(i) & ownBit));
		for (auto &entry : model.cache.entries)
			assert(entry.op != Op::writeback);
	}

	// A consumed slot is not returned a second time.
	auto again = model.nic.recv(buffer, 1);
	assert(!again);
	assert(again.error() == Error::rxTimeout);

	model.inject(3, pattern(80, 3));
	auto last = model.nic.recv(buffer, 1);
	assert(last);
	assert(last.value() == 80);

	// The last slot of the line completes the batch; one clean hands all back.
	assert(model.cache.count(Op::writeback, model.rxDescriptor(0), 64) == 1);
	for (size_t i = 0; i < rtl::numRxDescriptors; i++) {
		assert(!model.nic.rxQueue().isHeldBack(i));
		uint32_t expected = ownBit | 2048;
		if (i == rtl::numRxDescriptors - 1)
			expected |= eorBit;
		assert(model.rxFlags(i) == expected);
	}
	assert(model.nic.rxQueue().currentIndex() == 0);
}))
