#pragma once

#include <frg/expected.hpp>
#include <net/arp.hpp>
#include <net/ethernet.hpp>
#include <net/icmp.hpp>
#include <net/ip4.hpp>
#include <pcinet/error.hpp>
#include <pcinet/mac.hpp>
#include <span>

namespace pcinet::net {

// Fields of the echo requests that we originate.
constexpr uint16_t echoIpIdent = 0x1234;
constexpr uint16_t echoIdentifier = 0x5678;
constexpr size_t echoPayloadSize = 32;
constexpr size_t echoRequestSize = sizeof(EthernetHeader) + sizeof(Ip4Header)
		+ sizeof(IcmpHeader) + echoPayloadSize;
static_assert(echoRequestSize == 74);

constexpr size_t arpFrameSize = sizeof(EthernetHeader) + sizeof(ArpPacket);

enum class FrameKind {
	// Some header does not fit into the frame.
	truncated,
	// An IPv4 header with bad version or lengths.
	malformed,
	arp,
	ip4,
	other,
};

enum class IcmpKind {
	none,
	echoRequest,
	echoReply,
	other,
};

// Decoded headers in host order. Which members are meaningful depends on kind.
struct ParsedFrame {
	FrameKind kind = FrameKind::truncated;
	EthernetHeader ethernet{};

	ArpPacket arp{};

	Ip4Header ip{};
	std::span<const uint8_t> ipPayload;

	IcmpKind icmpKind = IcmpKind::none;
	IcmpHeader icmp{};
	std::span<const uint8_t> icmpPayload;
};

ParsedFrame parseFrame(std::span<const uint8_t> frame);

// Logs the interesting headers of a frame.
void logFrame(const ParsedFrame &parsed);

// ICMP echo request with a 32 byte payload 0, 1, ..., 31.
// Returns the frame length.
frg::expected<Error, size_t> buildEchoRequest(const MacAddress &dstMac,
		const MacAddress &srcMac, Ip4Address srcIp, Ip4Address dstIp,
		uint16_t sequence, std::span<uint8_t> out);

// Answers an echo request: addresses swapped, identifier, sequence
// and payload kept.
frg::expected<Error, size_t> buildEchoReply(std::span<const uint8_t> request,
		std::span<uint8_t> out);

// Answers an ARP request that asks for ourIp.
frg::expected<Error, size_t> buildArpReply(std::span<const uint8_t> request,
		const MacAddress &ourMac, Ip4Address ourIp, std::span<uint8_t> out);

} // namespace pcinet::net
