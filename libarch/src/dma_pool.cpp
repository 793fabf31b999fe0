#include <assert.h>

#include <frg/macros.hpp>
#include <arch/barrier.hpp>
#include <arch/dma_pool.hpp>

namespace arch {
namespace os {

contiguous_pool::contiguous_pool(void *base, uintptr_t physical, size_t size)
: _base{reinterpret_cast<uintptr_t>(base)}, _physical{physical}, _size{size} { }

void *contiguous_pool::allocate(size_t size, size_t count, size_t align) {
	size_t line = dcache_line_size();
	if(align < line)
		align = line;
	assert(!(align & (align - 1)));

	size_t bytes;
	if(__builtin_mul_overflow(size, count, &bytes))
		frg_panic("libarch: DMA allocation size overflows");

	// The region is sized once by system init; running out is a bug.
	auto start = (_base + _offset + align - 1) & ~(align - 1);
	if(start + bytes > _base + _size)
		frg_panic("libarch: contiguous DMA region exhausted");
	_offset = start + bytes - _base;
	return reinterpret_cast<void *>(start);
}

void contiguous_pool::deallocate(void *, size_t, size_t, size_t) {
	// The region is write-once.
}

uintptr_t contiguous_pool::physical(const void *pointer) const {
	auto address = reinterpret_cast<uintptr_t>(pointer);
	assert(address >= _base && address < _base + _size);
	return _physical + (address - _base);
}

} } // namespace arch::os
