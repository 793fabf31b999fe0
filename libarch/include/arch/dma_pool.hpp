#ifndef LIBARCH_DMA_POOL_HPP
#define LIBARCH_DMA_POOL_HPP

// There is no OS underneath us: DMA memory is a region handed over by
// system init (or, in tests, any sufficiently large host buffer).
#include <arch/os-none/dma_pool.hpp>

namespace arch {
	using os::contiguous_pool;
}

#endif // LIBARCH_DMA_POOL_HPP
