#pragma once

#include <arch/barrier.hpp>
#include <arch/dma_structs.hpp>
#include <array>
#include <nic/rtl8125/descriptor.hpp>
#include <span>

namespace pcinet::nic::rtl8125 {

struct TxQueue {
	TxQueue(arch::dma_pool *pool, arch::dma_barrier barrier);

	uintptr_t getBase() {
		return _descriptors.view_buffer().physical();
	}

	// Returns every slot to the driver, idle, and cleans the ring.
	void reset();

	// Copies the frame into the current slot, padding it to the minimum
	// frame size, and hands the slot to the NIC. The caller has checked
	// that the frame fits into a buffer.
	void postDescriptor(std::span<const uint8_t> frame);

	// Re-reads the current slot from memory.
	bool checkOwnerOfCurrentDescriptor();

	void advance() {
		_tx_index = (_tx_index + 1) % numTxDescriptors;
	}

	size_t currentIndex() const {
		return _tx_index;
	}

	Descriptor &descriptor(size_t index) {
		return _descriptors[index];
	}

	void dumpDescriptor(size_t index);

private:
	arch::dma_barrier _barrier;
	arch::dma_array<Descriptor> _descriptors;
	std::array<arch::dma_buffer, numTxDescriptors> _descriptor_buffers;
	size_t _tx_index = 0;
};

} // namespace pcinet::nic::rtl8125
