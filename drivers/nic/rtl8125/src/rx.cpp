#include <algorithm>
#include <nic/rtl8125/debug_options.hpp>
#include <nic/rtl8125/descriptor.hpp>
#include <nic/rtl8125/regs.hpp>
#include <nic/rtl8125/rtl8125.hpp>
#include <nic/rtl8125/rx.hpp>
#include <pcinet/debug.hpp>
#include <string.h>

namespace pcinet::nic::rtl8125 {

void Rtl8125::setRxConfigRegisters() {
	_mmio.store(regs::receive_config,
		flags::receive_config::rxfth(flags::receive_config::rxfth_none) |
		flags::receive_config::mxdma(flags::receive_config::mxdma_1024) |
		flags::receive_config::accept_physical_match(true) |
		flags::receive_config::accept_multicast(true) |
		flags::receive_config::accept_broadcast(true));

	_mmio.store(regs::rx_max_size, bufferSize);
}

// Broadcast, multicast and frames to our own address; all multicast groups.
void Rtl8125::setRxMode() {
	auto config = _mmio.load(regs::receive_config)
			& arch::bit_mask<uint32_t>{flags::receive_config::mode_preserve_mask};
	config |= flags::receive_config::accept_physical_match(true)
			| flags::receive_config::accept_multicast(true)
			| flags::receive_config::accept_broadcast(true);

	_mmio.store(regs::mar0, 0xFFFF'FFFF);
	_mmio.store(regs::mar4, 0xFFFF'FFFF);
	_mmio.store(regs::receive_config, config);
}

frg::expected<Error, size_t> Rtl8125::recv(std::span<uint8_t> buffer, uint64_t timeoutMs) {
	if(!_configured)
		panicLogger() << "rtl8125: recv() before configure()" << frg::endlog;

	uint64_t polls = timeoutMs * timing::rxPollsPerMilli;
	for(uint64_t i = 0; i < polls; i++) {
		auto index = _rxQueue.findCompletedDescriptor();
		if(index) {
			if constexpr (logRXDescriptor)
				_rxQueue.dumpDescriptor(*index);
			return _rxQueue.consumeDescriptor(*index, buffer);
		}
		_clock->sleepFor(timing::rxDelay);
	}

	return Error::rxTimeout;
}

RxQueue::RxQueue(arch::dma_pool *pool, arch::dma_barrier barrier)
: _barrier{barrier} {
	_descriptors = arch::dma_array<Descriptor>(pool, numRxDescriptors);
	for(auto &buf : _descriptor_buffers)
		buf = arch::dma_buffer(pool, bufferSize);
}

void RxQueue::reset() {
	for(size_t i = 0; i < numRxDescriptors; i++) {
		arch::dma_buffer_view buf = _descriptor_buffers[i];
		uintptr_t addr = buf.physical();

		auto &desc = _descriptors[i];
		desc.vlan.store(0);
		desc.base_low.store(addr & 0xFFFF'FFFF);
		desc.base_high.store((addr >> 32) & 0xFFFF'FFFF);
		desc.flags.store(flags::rx::ownership(flags::rx::owner_nic)
				| flags::rx::eor(i == numRxDescriptors - 1)
				| flags::rx::frame_length(bufferSize));

		_barrier.invalidate(buf);
	}

	_barrier.writeback(_descriptors.view_buffer());
	_held_back = {};
	_next_index = 0;
}

frg::optional<size_t> RxQueue::findCompletedDescriptor() {
	_barrier.invalidate(_descriptors.view_buffer());

	for(size_t k = 0; k < numRxDescriptors; k++) {
		auto i = (_next_index + k) % numRxDescriptors;
		if(_held_back[i])
			continue;
		if((_descriptors[i].flags.load() & flags::rx::ownership) == flags::rx::owner_driver)
			return i;
	}
	return frg::null_opt;
}

namespace {

size_t payloadLength(arch::bit_value<uint32_t> status) {
	size_t length = status & flags::rx::frame_length;
	if(length < fcsLength)
		return 0;
	return std::min(length - fcsLength, bufferSize);
}

} // anonymous namespace

frg::expected<Error, size_t> RxQueue::consumeDescriptor(size_t index, std::span<uint8_t> buffer) {
	auto status = _descriptors[index].flags.load();

	if(status & flags::rx::receive_error) {
		warningLogger() << "rtl8125: RX descriptor " << index << " reports an error, flags "
				<< frg::hex_fmt{static_cast<uint32_t>(status)} << frg::endlog;
		recycleDescriptor(index);
		return Error::rxError;
	}

	arch::dma_buffer_view buf = _descriptor_buffers[index];
	_barrier.invalidate(buf);

	// The NIC may have updated the descriptor while we were invalidating.
	_barrier.invalidate(_descriptors.view_element(index));
	status = _descriptors[index].flags.load();
	auto length = payloadLength(status);

	if(buffer.size() < length) {
		warningLogger() << "rtl8125: dropping " << length << " byte frame, buffer holds "
				<< buffer.size() << frg::endlog;
		recycleDescriptor(index);
		return Error::bufferTooSmall;
	}

	memcpy(buffer.data(), buf.data(), length);
	recycleDescriptor(index);
	return length;
}

// Cleaning a descriptor writes back its whole cache line, including the
// CPU's stale copy of the neighbouring slots. Without coherency a slot is
// therefore only handed back once no slot in its line belongs to the NIC.
void RxQueue::recycleDescriptor(size_t index) {
	_next_index = (index + 1) % numRxDescriptors;

	if(_barrier.is_coherent()) {
		returnDescriptors(index, 1);
		return;
	}

	auto perLine = std::clamp<size_t>(arch::dcache_line_size() / sizeof(Descriptor),
			1, numRxDescriptors);
	auto first = index - index % perLine;
	auto count = std::min(perLine, numRxDescriptors - first);

	_held_back[index] = true;
	for(size_t i = first; i < first + count; i++)
		if(!_held_back[i])
			return;
	returnDescriptors(first, count);
}

void RxQueue::returnDescriptors(size_t first, size_t count) {
	for(size_t i = first; i < first + count; i++) {
		arch::dma_buffer_view buf = _descriptor_buffers[i];
		uintptr_t addr = buf.physical();
		auto &desc = _descriptors[i];

		desc.base_low.store(addr & 0xFFFF'FFFF);
		desc.base_high.store((addr >> 32) & 0xFFFF'FFFF);
		arch::data_sync_barrier();
		desc.flags.store(flags::rx::ownership(flags::rx::owner_nic)
				| flags::rx::eor(i == numRxDescriptors - 1)
				| flags::rx::frame_length(bufferSize));
		_held_back[i] = false;
	}

	_barrier.writeback(_descriptors.view_buffer().subview(first * sizeof(Descriptor),
			count * sizeof(Descriptor)));
}

void RxQueue::dumpDescriptor(size_t index) {
	auto value = _descriptors[index].flags.load();

	infoLogger() << "rtl8125: RX descriptor " << index << ": flags "
			<< frg::hex_fmt{static_cast<uint32_t>(value)}
			<< ", length " << static_cast<unsigned int>(value & flags::rx::frame_length)
			<< ((value & flags::rx::first_segment) ? ", first" : "")
			<< ((value & flags::rx::last_segment) ? ", last" : "")
			<< ((value & flags::rx::receive_error) ? ", error" : "")
			<< ((value & flags::rx::eor) ? ", eor" : "") << frg::endlog;
}

} // namespace pcinet::nic::rtl8125
