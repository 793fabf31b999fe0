#ifndef LIBARCH_OS_NONE_DMA_POOL_HPP
#define LIBARCH_OS_NONE_DMA_POOL_HPP

#include <stddef.h>
#include <stdint.h>
#include <arch/dma_structs.hpp>

namespace arch {
namespace os {

// Carves allocations out of a physically contiguous region.
// The region is write-once: deallocate() does not make memory reusable.
// Every allocation starts on its own cache line, so cache maintenance on
// one buffer never touches bytes of another.
struct contiguous_pool final : dma_pool {
	contiguous_pool(void *base, uintptr_t physical, size_t size);

	contiguous_pool(const contiguous_pool &) = delete;
	contiguous_pool &operator= (const contiguous_pool &) = delete;

	void *allocate(size_t size, size_t count, size_t align) override;
	void deallocate(void *pointer, size_t size, size_t count, size_t align) override;
	uintptr_t physical(const void *pointer) const override;

	size_t remaining() const {
		return _size - _offset;
	}

private:
	uintptr_t _base;
	uintptr_t _physical;
	size_t _size;
	size_t _offset = 0;
};

} } // namespace arch::os

#endif // LIBARCH_OS_NONE_DMA_POOL_HPP
