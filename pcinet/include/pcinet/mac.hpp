#pragma once

#include <array>
#include <stddef.h>
#include <stdint.h>

namespace pcinet {

struct MacAddress {
	constexpr MacAddress() = default;
	explicit constexpr MacAddress(std::array<uint8_t, 6> data) : mac_{data} {}

	uint8_t &operator[](size_t idx) {
		return mac_[idx];
	}
	const uint8_t &operator[](size_t idx) const {
		return mac_[idx];
	}
	uint8_t *data() {
		return mac_.data();
	}
	const uint8_t *data() const {
		return mac_.data();
	}

	friend bool operator==(const MacAddress &l, const MacAddress &r) = default;

	explicit operator bool() const {
		for (auto b : mac_)
			if (b)
				return true;
		return false;
	}

private:
	std::array<uint8_t, 6> mac_ = {};
};

// Textual form aa:bb:cc:dd:ee:ff, for log lines.
struct MacString {
	char str[18];
};

inline MacString toString(const MacAddress &mac) {
	constexpr const char *digits = "0123456789abcdef";
	MacString out{};
	for (size_t i = 0; i < 6; i++) {
		out.str[i * 3] = digits[mac[i] >> 4];
		out.str[i * 3 + 1] = digits[mac[i] & 0xF];
		out.str[i * 3 + 2] = (i == 5) ? '\0' : ':';
	}
	return out;
}

} // namespace pcinet
