
#ifndef LIBARCH_BITS_HPP
#define LIBARCH_BITS_HPP

namespace arch {

template<typename B>
struct bit_mask {
	explicit constexpr bit_mask(B bits)
	: _bits(bits) { }

	explicit constexpr operator B () const {
		return _bits;
	}

private:
	B _bits;
};

// represents a fixed size vector of bits.
template<typename B>
struct bit_value {
	explicit constexpr bit_value(B bits)
	: _bits(bits) { }

	explicit constexpr operator B () const {
		return _bits;
	}

	// allow building a value from multiple bit vectors.
	constexpr bit_value operator| (bit_value other) const {
		return bit_value(_bits | other._bits);
	}
	constexpr bit_value &operator|= (bit_value other) {
		*this = *this | other;
		return *this;
	}

	// allow masking out individual bits.
	constexpr bit_value operator& (bit_mask<B> other) const {
		return bit_value(_bits & static_cast<B>(other));
	}
	constexpr bit_value &operator&= (bit_mask<B> other) {
		*this = *this & other;
		return *this;
	}

	friend constexpr bool operator== (bit_value a, bit_value b) {
		return a._bits == b._bits;
	}

private:
	B _bits;
};

// Value of a single field. Unlike a plain bit_value, it remembers which bits
// the field covers, so that v / f(x) replaces the field f inside v.
template<typename B>
struct field_value {
	constexpr field_value(B bits, B mask)
	: _bits(bits), _mask(mask) { }

	constexpr operator bit_value<B> () const {
		return bit_value<B>(_bits);
	}

	friend constexpr bit_value<B> operator| (field_value a, field_value b) {
		return bit_value<B>(a._bits | b._bits);
	}
	friend constexpr bit_value<B> operator| (field_value a, bit_value<B> b) {
		return bit_value<B>(a._bits | static_cast<B>(b));
	}

	// replace the bits of this field in an existing bit vector.
	friend constexpr bit_value<B> operator/ (bit_value<B> bv, field_value f) {
		return bit_value<B>((static_cast<B>(bv) & ~f._mask) | f._bits);
	}
	friend constexpr bit_value<B> &operator/= (bit_value<B> &bv, field_value f) {
		bv = bv / f;
		return bv;
	}

private:
	B _bits;
	B _mask;
};

template<typename B, typename T>
struct field {
	// allow extraction of individual fields from bit vectors.
	friend constexpr T operator& (bit_value<B> bv, field f) {
		return static_cast<T>((static_cast<B>(bv) >> f._shift) & f._mask);
	}

	explicit constexpr field(int shift, int num_bits)
	: _shift(shift), _mask((B(1) << num_bits) - 1) { }

	// allow construction of bit vectors from fields.
	constexpr field_value<B> operator() (T value) const {
		return field_value<B>((static_cast<B>(value) & _mask) << _shift, _mask << _shift);
	}

	// allow inversion of this field to a bit mask.
	constexpr bit_mask<B> operator~ () const {
		return bit_mask<B>(~(_mask << _shift));
	}

private:
	int _shift;
	B _mask;
};

} // namespace arch

#endif // LIBARCH_BITS_HPP
