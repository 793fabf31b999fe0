#pragma once

#include <arch/bit.hpp>
#include <pcinet/mac.hpp>
#include <stdint.h>

namespace pcinet::net {

enum EtherType : uint16_t {
	etherTypeIp4 = 0x0800,
	etherTypeArp = 0x0806,
};

struct EthernetHeader {
	MacAddress destination;
	MacAddress source;
	uint16_t etherType;

	void ensureEndian() {
		etherType = arch::convert_endian<arch::endian::big, arch::endian::native>(etherType);
	}
};
static_assert(sizeof(EthernetHeader) == 14, "bad header size");

} // namespace pcinet::net
