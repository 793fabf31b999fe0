#ifndef LIBARCH_BARRIER_HPP
#define LIBARCH_BARRIER_HPP

#include <stddef.h>
#include <stdint.h>

#include <arch/dma_structs.hpp>

namespace arch {

// Range of whole cache lines, [start, end).
struct cache_span {
	uintptr_t start;
	uintptr_t end;

	size_t size() const {
		return end - start;
	}
};

// Smallest line-aligned span that covers [addr, addr + size).
// line must be a power of two.
inline cache_span align_to_cache_lines(uintptr_t addr, size_t size, size_t line) {
	if(!size)
		return {addr & ~(line - 1), addr & ~(line - 1)};
	return {addr & ~(line - 1), (addr + size + line - 1) & ~(line - 1)};
}

// Size of the smallest data cache line of this CPU.
size_t dcache_line_size();

// Full system data synchronization barrier.
void data_sync_barrier();

// Cache maintenance that is not done by CPU instructions, e.g. by a model
// of a non-coherent bus master that wants to see every clean and invalidate.
struct cache_maintenance {
	virtual void writeback(const void *pointer, size_t size) = 0;
	virtual void invalidate(const void *pointer, size_t size) = 0;

protected:
	~cache_maintenance() = default;
};

// Keeps the CPU's view of DMA memory consistent with the device's view.
//
// writeback() must be called after the CPU wrote memory that the device
// is going to read, invalidate() before the CPU reads memory that the device
// has written. Both act on every cache line that overlaps the range and
// complete with a full barrier.
// If the device is coherent with the CPU caches, only the barrier is issued.
struct dma_barrier {
	explicit dma_barrier(bool is_coherent)
	: _is_coherent{is_coherent} { }

	// Non-coherent barrier that delegates the per-range work to ops.
	explicit dma_barrier(cache_maintenance *ops)
	: _is_coherent{false}, _ops{ops} { }

	void writeback(const void *pointer, size_t size) const;
	void invalidate(const void *pointer, size_t size) const;

	void writeback(dma_buffer_view view) const {
		writeback(view.data(), view.size());
	}

	void invalidate(dma_buffer_view view) const {
		invalidate(view.data(), view.size());
	}

	bool is_coherent() const {
		return _is_coherent;
	}

private:
	bool _is_coherent;
	cache_maintenance *_ops = nullptr;
};

} // namespace arch

#endif // LIBARCH_BARRIER_HPP
