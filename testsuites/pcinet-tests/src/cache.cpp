#include <assert.h>

#include <arch/barrier.hpp>
#include <arch/dma_pool.hpp>

#include "fakes.hpp"
#include "testsuite.hpp"

DEFINE_TEST(cache_span_covers_request, ([] {
	const size_t lines[] = {32, 64, 128};
	const uintptr_t addrs[] = {0, 1, 63, 64, 65, 0x50200000, 0x502000FF};
	const size_t sizes[] = {1, 2, 16, 63, 64, 65, 2048, 4097};

	for (auto line : lines) {
		for (auto addr : addrs) {
			for (auto size : sizes) {
				auto span = arch::align_to_cache_lines(addr, size, line);
				assert(span.start % line == 0);
				assert(span.end % line == 0);
				assert(span.start <= addr);
				assert(span.end >= addr + size);
				// No more than one extra line on either side.
				assert(addr - span.start < line);
				assert(span.end - (addr + size) < line);
			}
		}
	}
}))

DEFINE_TEST(cache_span_empty_request, ([] {
	auto span = arch::align_to_cache_lines(0x1234, 0, 64);
	assert(span.size() == 0);
	assert(span.start == 0x1200);
	assert(span.end == 0x1200);
}))

DEFINE_TEST(cache_span_exact_lines, ([] {
	auto span = arch::align_to_cache_lines(0x1000, 0x80, 64);
	assert(span.start == 0x1000);
	assert(span.end == 0x1080);
	assert(span.size() == 0x80);
}))

DEFINE_TEST(cache_line_size_is_sane, ([] {
	auto line = arch::dcache_line_size();
	assert(line >= 16);
	assert((line & (line - 1)) == 0);
}))

DEFINE_TEST(dma_barrier_keeps_data, ([] {
	// On hosts the maintenance itself is a no-op; the data must survive either way.
	uint8_t buffer[256];
	for (size_t i = 0; i < sizeof(buffer); i++)
		buffer[i] = i;

	arch::dma_barrier coherent{true};
	arch::dma_barrier noncoherent{false};
	assert(coherent.is_coherent());
	assert(!noncoherent.is_coherent());

	coherent.writeback(buffer, sizeof(buffer));
	coherent.invalidate(buffer, sizeof(buffer));
	noncoherent.writeback(buffer + 3, 0);
	noncoherent.writeback(buffer + 1, 100);

	for (size_t i = 0; i < sizeof(buffer); i++)
		assert(buffer[i] == i);
}))

DEFINE_TEST(dma_pool_aligns_to_cache_lines, ([] {
	HostDmaRegion region;
	auto line = arch::dcache_line_size();

	arch::dma_buffer small{&region.pool, 3};
	arch::dma_buffer other{&region.pool, 5};
	arch::dma_array<uint32_t> array{&region.pool, 4};

	auto a = reinterpret_cast<uintptr_t>(small.data());
	auto b = reinterpret_cast<uintptr_t>(other.data());
	auto c = reinterpret_cast<uintptr_t>(array.data());
	assert(a % line == 0);
	assert(b % line == 0);
	assert(c % line == 0);
	assert(b - a >= line);
	assert(c - b >= line);
}))

DEFINE_TEST(dma_pool_translates_addresses, ([] {
	HostDmaRegion region;

	arch::dma_buffer first{&region.pool, 100};
	arch::dma_buffer second{&region.pool, 100};
	arch::dma_buffer_view view = second;

	assert(arch::dma_buffer_view{first}.physical() == HostDmaRegion::busBase);
	assert(view.physical() > HostDmaRegion::busBase);
	assert(region.translate(view.physical()) == second.data());
	assert(view.subview(10, 20).physical() == view.physical() + 10);
}))

DEFINE_TEST(dma_pool_is_write_once, ([] {
	HostDmaRegion region{0x1000};
	auto before = region.pool.remaining();
	{
		arch::dma_buffer temporary{&region.pool, 512};
	}
	assert(region.pool.remaining() <= before - 512);
}))

DEFINE_TEST(dma_array_element_views, ([] {
	HostDmaRegion region;
	arch::dma_array<uint64_t> array{&region.pool, 4};

	auto whole = array.view_buffer();
	auto third = array.view_element(2);
	assert(whole.size() == 4 * sizeof(uint64_t));
	assert(third.size() == sizeof(uint64_t));
	assert(third.data() == &array[2]);
	assert(third.physical() == whole.physical() + 2 * sizeof(uint64_t));
}))
