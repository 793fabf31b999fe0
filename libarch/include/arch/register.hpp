#ifndef LIBARCH_REGISTER_HPP
#define LIBARCH_REGISTER_HPP

#include <stddef.h>

#include <arch/bits.hpp>

namespace arch {

template<typename R, typename B>
struct basic_register {
	using rep_type = R;
	using bits_type = B;

	explicit constexpr basic_register(ptrdiff_t offset)
	: _offset(offset) { }

	constexpr ptrdiff_t offset() const {
		return _offset;
	}

	// Register of the same type at a fixed distance, e.g. an element of
	// a register array such as a MAC address.
	constexpr basic_register operator+ (ptrdiff_t distance) const {
		return basic_register{_offset + distance};
	}

private:
	ptrdiff_t _offset;
};

template<typename T>
using scalar_register = basic_register<T, T>;

template<typename B>
using bit_register = basic_register<bit_value<B>, B>;

// Untyped accesses for spaces that are indexed by plain offsets,
// e.g. PCI configuration space.
// Space is second because otherwise you can't do scalar_load<uint32_t> etc
template<typename T, typename Space>
T scalar_load(Space &s, ptrdiff_t offset) {
	return s.load(scalar_register<T>(offset));
}

// Same as above
template<typename T, typename Space>
void scalar_store(Space &s, ptrdiff_t offset, T val) {
	s.store(scalar_register<T>(offset), val);
}

} // namespace arch

#endif // LIBARCH_REGISTER_HPP
