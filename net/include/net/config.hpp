#pragma once

#include <net/ip4.hpp>
#include <pcinet/mac.hpp>
#include <stdint.h>

namespace pcinet::net {

// Identity of the two ends of the point-to-point test link.
struct NetConfig {
	Ip4Address localIp = makeIp4(192, 168, 22, 102);
	Ip4Address remoteIp = makeIp4(192, 168, 22, 101);
	MacAddress localMac = MacAddress{{0x2e, 0xc3, 0x69, 0x34, 0x7d, 0x31}};
	MacAddress remoteMac = MacAddress{{0x38, 0xf7, 0xcd, 0xc8, 0xd9, 0x32}};

	int pingCount = 10;
	// Frames examined per ping before giving up; ARP traffic often comes first.
	int maxReceives = 5;
	uint64_t replyTimeoutMs = 2000;
};

} // namespace pcinet::net
