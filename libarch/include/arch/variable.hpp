#ifndef LIBARCH_VARIABLE_HPP
#define LIBARCH_VARIABLE_HPP

#include <arch/bits.hpp>
#include <arch/mem_space.hpp>

namespace arch {

// A value in memory that a device reads and writes behind our back,
// e.g. a field of a DMA descriptor. Every access is a single load or store
// of the full width; nothing is cached in registers.
template<typename R, typename B>
struct basic_variable {
	using rep_type = R;
	using bits_type = B;

	basic_variable() = default;

	explicit constexpr basic_variable(R r)
	: _embedded{static_cast<B>(r)} { }

	basic_variable(const basic_variable &) = delete;
	basic_variable &operator= (const basic_variable &) = delete;

	R load() const {
		return static_cast<R>(_detail::mem_ops<B>::load(&_embedded));
	}

	void store(R r) {
		_detail::mem_ops<B>::store(&_embedded, static_cast<B>(r));
	}

private:
	B _embedded;
};

template<typename T>
using scalar_variable = basic_variable<T, T>;

template<typename B>
using bit_variable = basic_variable<bit_value<B>, B>;

} // namespace arch

#endif // LIBARCH_VARIABLE_HPP
