#pragma once

#include <arch/bit.hpp>
#include <stddef.h>
#include <stdint.h>

namespace pcinet::net {

// IPv4 addresses are kept in host order; 192.168.0.1 is 0xC0A80001.
using Ip4Address = uint32_t;

constexpr Ip4Address makeIp4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
	return (uint32_t{a} << 24) | (uint32_t{b} << 16) | (uint32_t{c} << 8) | d;
}

struct Ip4String {
	char str[16];
};

Ip4String formatIp4(Ip4Address address);

constexpr uint8_t ip4Version = 4;
constexpr uint8_t defaultTtl = 64;

enum IpProtocol : uint8_t {
	ipProtocolIcmp = 1,
};

struct Ip4Header {
	uint8_t versionIhl;
	uint8_t tos;
	uint16_t length;

	uint16_t ident;
	uint16_t flagsOffset;

	uint8_t ttl;
	uint8_t protocol;
	uint16_t checksum;

	Ip4Address source;
	Ip4Address destination;

	size_t headerLength() const {
		return (versionIhl & 0x0F) * 4;
	}

	uint8_t version() const {
		return versionIhl >> 4;
	}

	void ensureEndian() {
		auto nendian = [] (auto &x) {
			x = arch::convert_endian<
				arch::endian::big,
				arch::endian::native>(x);
		};
		nendian(length);
		nendian(ident);
		nendian(flagsOffset);
		nendian(checksum);
		nendian(source);
		nendian(destination);
	}
};
static_assert(sizeof(Ip4Header) == 20, "bad header size");

} // namespace pcinet::net
