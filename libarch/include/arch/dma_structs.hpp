#ifndef LIBARCH_DMA_HPP
#define LIBARCH_DMA_HPP

#include <assert.h>
#include <stddef.h>
#include <stdint.h>
#include <new>
#include <type_traits>
#include <utility>

namespace arch {

// ----------------------------------------------------------------------------
// DMA pool infrastructure.
// ----------------------------------------------------------------------------

// Source of memory that a bus master can reach. There is no general purpose
// heap underneath us, so every DMA object comes from a pool.
struct dma_pool {
	virtual void *allocate(size_t size, size_t count, size_t align) = 0;
	virtual void deallocate(void *pointer, size_t size, size_t count, size_t align) = 0;

	// Returns the bus address that a device has to use to reach pointer.
	virtual uintptr_t physical(const void *pointer) const = 0;

protected:
	~dma_pool() = default;
};

// ----------------------------------------------------------------------------
// View classes.
// ----------------------------------------------------------------------------

// Non-owning reference to a range of pool memory.
struct dma_buffer_view {
	dma_buffer_view() = default;

	explicit dma_buffer_view(dma_pool *pool, void *data, size_t size)
	: _pool{pool}, _data{data}, _size{size} { }

	dma_pool *pool() const {
		return _pool;
	}

	void *data() const {
		return _data;
	}

	size_t size() const {
		return _size;
	}

	uintptr_t physical() const {
		assert(_pool);
		return _pool->physical(_data);
	}

	dma_buffer_view subview(size_t offset, size_t chunk) const {
		assert(offset + chunk <= _size);
		return dma_buffer_view{_pool, static_cast<char *>(_data) + offset, chunk};
	}

private:
	dma_pool *_pool = nullptr;
	void *_data = nullptr;
	size_t _size = 0;
};

// ----------------------------------------------------------------------------
// Actual storage classes.
// ----------------------------------------------------------------------------

// Owning, untyped DMA memory. Move-only.
struct dma_buffer {
	friend void swap(dma_buffer &a, dma_buffer &b) {
		using std::swap;
		swap(a._view, b._view);
	}

	dma_buffer() = default;

	explicit dma_buffer(dma_pool *pool, size_t size)
	: _view{pool, pool->allocate(size, 1, 1), size} { }

	dma_buffer(dma_buffer &&other)
	: dma_buffer() {
		swap(*this, other);
	}

	~dma_buffer() {
		if(_view.data())
			_view.pool()->deallocate(_view.data(), _view.size(), 1, 1);
	}

	dma_buffer &operator= (dma_buffer other) {
		swap(*this, other);
		return *this;
	}

	operator dma_buffer_view () const {
		return _view;
	}

	void *data() const {
		return _view.data();
	}

	size_t size() const {
		return _view.size();
	}

	dma_buffer_view subview(size_t offset, size_t chunk) const {
		return _view.subview(offset, chunk);
	}

private:
	dma_buffer_view _view;
};

// Owning array of n default-initialized T in DMA memory. Move-only.
// T must be trivially destructible: the device, not a destructor, decides
// when its contents are dead.
template<typename T>
struct dma_array {
	static_assert(std::is_trivially_destructible_v<T>);

	friend void swap(dma_array &a, dma_array &b) {
		using std::swap;
		swap(a._pool, b._pool);
		swap(a._data, b._data);
		swap(a._size, b._size);
	}

	dma_array() = default;

	explicit dma_array(dma_pool *pool, size_t size)
	: _pool{pool}, _size{size} {
		void *p = _pool->allocate(sizeof(T), _size, alignof(T));
		_data = static_cast<T *>(p);
		for(size_t i = 0; i < _size; ++i)
			new (&_data[i]) T;
	}

	dma_array(dma_array &&other)
	: dma_array() {
		swap(*this, other);
	}

	~dma_array() {
		if(_data)
			_pool->deallocate(_data, sizeof(T), _size, alignof(T));
	}

	dma_array &operator= (dma_array other) {
		swap(*this, other);
		return *this;
	}

	size_t size() const {
		return _size;
	}

	T *data() {
		return _data;
	}

	T &operator[] (size_t n) {
		return _data[n];
	}

	dma_buffer_view view_buffer() const {
		return dma_buffer_view{_pool, _data, sizeof(T) * _size};
	}

	// View of the n-th element only, for per-slot cache maintenance.
	dma_buffer_view view_element(size_t n) const {
		assert(n < _size);
		return view_buffer().subview(sizeof(T) * n, sizeof(T));
	}

private:
	dma_pool *_pool = nullptr;
	T *_data = nullptr;
	size_t _size = 0;
};

} // namespace arch

#endif // LIBARCH_DMA_HPP
