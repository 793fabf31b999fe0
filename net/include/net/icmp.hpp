#pragma once

#include <arch/bit.hpp>
#include <stdint.h>

namespace pcinet::net {

enum IcmpType : uint8_t {
	icmpEchoReply = 0,
	icmpEchoRequest = 8,
};

struct IcmpHeader {
	uint8_t type;
	uint8_t code;
	uint16_t checksum;
	uint16_t identifier;
	uint16_t sequence;

	void ensureEndian() {
		auto nendian = [] (auto &x) {
			x = arch::convert_endian<
				arch::endian::big,
				arch::endian::native>(x);
		};
		nendian(checksum);
		nendian(identifier);
		nendian(sequence);
	}
};
static_assert(sizeof(IcmpHeader) == 8, "bad header size");

} // namespace pcinet::net
