#pragma once

#include <arch/bit.hpp>
#include <net/ip4.hpp>
#include <pcinet/mac.hpp>
#include <stdint.h>

namespace pcinet::net {

constexpr uint16_t arpHardwareEthernet = 1;

enum ArpOperation : uint16_t {
	arpRequest = 1,
	arpReply = 2,
};

// Ethernet/IPv4 ARP packet. The protocol addresses are not naturally aligned.
struct [[gnu::packed]] ArpPacket {
	uint16_t hardwareType;
	uint16_t protocolType;
	uint8_t hardwareSize;
	uint8_t protocolSize;
	uint16_t operation;

	MacAddress senderMac;
	Ip4Address senderIp;
	MacAddress targetMac;
	Ip4Address targetIp;

	void ensureEndian() {
		using arch::convert_endian, arch::endian;
		hardwareType = convert_endian<endian::big, endian::native>(hardwareType);
		protocolType = convert_endian<endian::big, endian::native>(protocolType);
		operation = convert_endian<endian::big, endian::native>(operation);
		senderIp = convert_endian<endian::big, endian::native>(senderIp);
		targetIp = convert_endian<endian::big, endian::native>(targetIp);
	}
};
static_assert(sizeof(ArpPacket) == 28, "ARP packet must be 28 bytes");

} // namespace pcinet::net
