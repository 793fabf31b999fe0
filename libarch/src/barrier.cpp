#include <arch/barrier.hpp>

namespace arch {

namespace {

#if defined(__aarch64__)

size_t read_line_size() {
	uint64_t ctr;
	asm volatile ("mrs %0, ctr_el0" : "=r"(ctr));
	// CTR_EL0.DminLine is log2 of the number of words.
	return size_t{4} << ((ctr >> 16) & 0xF);
}

// Clean to the point of coherency: dirty lines reach memory, lines stay valid.
void clean_line(uintptr_t addr) {
	asm volatile ("dc cvac, %0" : : "r"(addr) : "memory");
}

// Invalidate to the point of coherency: the next load goes to memory.
void invalidate_line(uintptr_t addr) {
	asm volatile ("dc ivac, %0" : : "r"(addr) : "memory");
}

#else

// Hosts we build for are cache coherent with their bus masters.
size_t read_line_size() {
	return 64;
}

void clean_line(uintptr_t) { }
void invalidate_line(uintptr_t) { }

#endif

template<typename F>
void for_each_line(const void *pointer, size_t size, F op) {
	auto line = dcache_line_size();
	auto span = align_to_cache_lines(reinterpret_cast<uintptr_t>(pointer), size, line);
	for(uintptr_t addr = span.start; addr < span.end; addr += line)
		op(addr);
}

} // anonymous namespace

size_t dcache_line_size() {
	static size_t line = read_line_size();
	return line;
}

void data_sync_barrier() {
#if defined(__aarch64__)
	asm volatile ("dsb sy" : : : "memory");
#else
	__sync_synchronize();
#endif
}

void dma_barrier::writeback(const void *pointer, size_t size) const {
	if(_ops)
		_ops->writeback(pointer, size);
	else if(!_is_coherent)
		for_each_line(pointer, size, clean_line);
	data_sync_barrier();
}

void dma_barrier::invalidate(const void *pointer, size_t size) const {
	if(_ops)
		_ops->invalidate(pointer, size);
	else if(!_is_coherent)
		for_each_line(pointer, size, invalidate_line);
	data_sync_barrier();
}

} // namespace arch
