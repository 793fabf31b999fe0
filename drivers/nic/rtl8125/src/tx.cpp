#include <algorithm>
#include <nic/rtl8125/debug_options.hpp>
#include <nic/rtl8125/descriptor.hpp>
#include <nic/rtl8125/regs.hpp>
#include <nic/rtl8125/rtl8125.hpp>
#include <nic/rtl8125/tx.hpp>
#include <pcinet/debug.hpp>
#include <string.h>

namespace pcinet::nic::rtl8125 {

void Rtl8125::setTxConfigRegisters() {
	_mmio.store(regs::transmit_config,
		flags::transmit_config::ifg(flags::transmit_config::ifg_normal) |
		flags::transmit_config::mxdma(flags::transmit_config::mxdma_1024));
}

// The 8125 polls its normal priority queue on bit 0, not on bit 6 as the 8169 does.
void Rtl8125::ringDoorbell() {
	_mmio.store(regs::tppoll, flags::tppoll::poll_normal_prio(true));
}

frg::expected<Error> Rtl8125::send(std::span<const uint8_t> frame) {
	if(frame.size() > bufferSize) {
		warningLogger() << "rtl8125: refusing to send " << frame.size()
				<< " byte frame" << frg::endlog;
		return Error::oversizedPacket;
	}
	if(!_configured)
		panicLogger() << "rtl8125: send() before configure()" << frg::endlog;

	auto index = _txQueue.currentIndex();
	_txQueue.postDescriptor(frame);
	if constexpr (logTXDescriptor)
		_txQueue.dumpDescriptor(index);
	ringDoorbell();

	if(!waitTxDescriptorReleased()) {
		warningLogger() << "rtl8125: TX descriptor " << index
				<< " was not released" << frg::endlog;
		if constexpr (logTXDescriptor)
			_txQueue.dumpDescriptor(index);
		return Error::txTimeout;
	}

	_txQueue.advance();
	return frg::success;
}

TxQueue::TxQueue(arch::dma_pool *pool, arch::dma_barrier barrier)
: _barrier{barrier} {
	_descriptors = arch::dma_array<Descriptor>(pool, numTxDescriptors);
	for(auto &buf : _descriptor_buffers)
		buf = arch::dma_buffer(pool, bufferSize);
}

void TxQueue::reset() {
	for(size_t i = 0; i < numTxDescriptors; i++) {
		arch::dma_buffer_view buf = _descriptor_buffers[i];
		uintptr_t addr = buf.physical();

		memset(buf.data(), 0, buf.size());
		_barrier.writeback(buf);

		auto &desc = _descriptors[i];
		desc.vlan.store(0);
		desc.base_low.store(addr & 0xFFFF'FFFF);
		desc.base_high.store((addr >> 32) & 0xFFFF'FFFF);
		desc.flags.store(flags::tx::eor(i == numTxDescriptors - 1));
	}

	_barrier.writeback(_descriptors.view_buffer());
	_tx_index = 0;
}

void TxQueue::postDescriptor(std::span<const uint8_t> frame) {
	auto &buf = _descriptor_buffers[_tx_index];
	auto desc = &_descriptors[_tx_index];

	// Short frames are padded by hand; not every revision does it reliably.
	auto actual_size = std::max(frame.size(), minFrameSize);

	memcpy(buf.data(), frame.data(), frame.size());
	if(actual_size != frame.size())
		memset(static_cast<uint8_t *>(buf.data()) + frame.size(), 0, actual_size - frame.size());
	_barrier.writeback(buf.data(), actual_size);

	auto value = flags::tx::ownership(flags::tx::owner_nic)
			| flags::tx::first_segment(true)
			| flags::tx::last_segment(true)
			| flags::tx::frame_length(actual_size);
	if(_tx_index == numTxDescriptors - 1)
		value |= flags::tx::eor(true);
	desc->flags.store(value);

	_barrier.writeback(_descriptors.view_element(_tx_index));
}

bool TxQueue::checkOwnerOfCurrentDescriptor() {
	_barrier.invalidate(_descriptors.view_element(_tx_index));
	return (_descriptors[_tx_index].flags.load() & flags::tx::ownership) == flags::tx::owner_nic;
}

void TxQueue::dumpDescriptor(size_t index) {
	auto &desc = _descriptors[index];
	auto value = desc.flags.load();

	infoLogger() << "rtl8125: TX descriptor " << index << ": flags "
			<< frg::hex_fmt{static_cast<uint32_t>(value)}
			<< ", length " << static_cast<unsigned int>(value & flags::tx::frame_length)
			<< ((value & flags::tx::ownership) ? ", owned by NIC" : ", owned by driver")
			<< ((value & flags::tx::eor) ? ", eor" : "") << frg::endlog;
}

} // namespace pcinet::nic::rtl8125
