#ifndef LIBARCH_BIT_HPP
#define LIBARCH_BIT_HPP

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <type_traits>

namespace arch {

enum class endian {
	little = __ORDER_LITTLE_ENDIAN__,
	big    = __ORDER_BIG_ENDIAN__,
	native = __BYTE_ORDER__
};

static_assert(endian::native == endian::little || endian::native == endian::big,
		"only little and big endian are supported");

template<typename T>
inline T bswap(T val) {
	static_assert(std::is_integral_v<T>, "T must be an integral type");
	static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
			"unsupported swap size");
	if constexpr (sizeof(T) == 1) {
		return val;
	} else if constexpr (sizeof(T) == 2) {
		return __builtin_bswap16(val);
	} else if constexpr (sizeof(T) == 4) {
		return __builtin_bswap32(val);
	} else {
		return __builtin_bswap64(val);
	}
}

template<endian NewEndian, endian OldEndian = endian::native, typename T>
inline T convert_endian(T native) {
	static_assert(std::is_integral_v<T>, "T must be an integral type");
	if constexpr (NewEndian != OldEndian) {
		return bswap(native);
	} else {
		return native;
	}
}

// Unaligned accessors for values stored in a given byte order,
// e.g. fields of a received frame.
template<typename T, endian Order>
inline T load_unaligned(const void *pointer) {
	T value;
	memcpy(&value, pointer, sizeof(T));
	return convert_endian<endian::native, Order>(value);
}

template<typename T, endian Order>
inline void store_unaligned(void *pointer, T value) {
	value = convert_endian<Order>(value);
	memcpy(pointer, &value, sizeof(T));
}

} // namespace arch

#endif // LIBARCH_BIT_HPP
