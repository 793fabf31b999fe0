#pragma once

#include <arch/barrier.hpp>
#include <arch/dma_structs.hpp>
#include <array>
#include <frg/expected.hpp>
#include <frg/optional.hpp>
#include <nic/rtl8125/descriptor.hpp>
#include <pcinet/error.hpp>
#include <span>

namespace pcinet::nic::rtl8125 {

struct RxQueue {
	RxQueue(arch::dma_pool *pool, arch::dma_barrier barrier);

	uintptr_t getBase() {
		return _descriptors.view_buffer().physical();
	}

	// Hands every slot to the NIC and invalidates all buffers once,
	// so that no dirty line can later be evicted over received data.
	void reset();

	// Invalidates all slots and returns the first one, starting at the
	// cursor, that the NIC has handed back and that was not consumed yet.
	frg::optional<size_t> findCompletedDescriptor();

	// Copies the frame of a completed slot into buffer and recycles the slot.
	// On a non-coherent bus a slot goes back to the NIC only together with
	// every other slot in its cache line, see recycleDescriptor().
	frg::expected<Error, size_t> consumeDescriptor(size_t index, std::span<uint8_t> buffer);

	// Whether the slot was consumed but is still held back from the NIC.
	bool isHeldBack(size_t index) const {
		return _held_back[index];
	}

	size_t currentIndex() const {
		return _next_index;
	}

	Descriptor &descriptor(size_t index) {
		return _descriptors[index];
	}

	arch::dma_buffer_view buffer(size_t index) {
		return _descriptor_buffers[index];
	}

	void dumpDescriptor(size_t index);

private:
	void recycleDescriptor(size_t index);
	void returnDescriptors(size_t first, size_t count);

	arch::dma_barrier _barrier;
	arch::dma_array<Descriptor> _descriptors;
	std::array<arch::dma_buffer, numRxDescriptors> _descriptor_buffers;
	std::array<bool, numRxDescriptors> _held_back = {};
	size_t _next_index = 0;
};

} // namespace pcinet::nic::rtl8125
