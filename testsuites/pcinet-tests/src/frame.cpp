#include <array>
#include <assert.h>
#include <string.h>
#include <vector>

#include <arch/bit.hpp>
#include <net/checksum.hpp>
#include <net/config.hpp>
#include <net/frame.hpp>

#include "testsuite.hpp"

using namespace pcinet::net;
using pcinet::Error;
using pcinet::MacAddress;

namespace {

uint16_t be16(const uint8_t *p) {
	return arch::load_unaligned<uint16_t, arch::endian::big>(p);
}

uint32_t be32(const uint8_t *p) {
	return arch::load_unaligned<uint32_t, arch::endian::big>(p);
}

bool sameMac(const uint8_t *p, const MacAddress &mac) {
	return !memcmp(p, mac.data(), 6);
}

// Echo request from the remote end to us, as a peer would send it.
std::vector<uint8_t> incomingEchoRequest(const NetConfig &config, uint16_t sequence) {
	std::vector<uint8_t> frame(echoRequestSize);
	auto size = buildEchoRequest(config.localMac, config.remoteMac,
			config.remoteIp, config.localIp, sequence, frame);
	assert(size);
	assert(size.value() == echoRequestSize);
	return frame;
}

std::vector<uint8_t> arpRequest(const MacAddress &senderMac, Ip4Address senderIp,
		Ip4Address targetIp) {
	std::vector<uint8_t> frame(arpFrameSize);
	auto p = frame.data();
	memset(p, 0xFF, 6);
	memcpy(p + 6, senderMac.data(), 6);
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 12, 0x0806);
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 14, 1);
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 16, 0x0800);
	p[18] = 6;
	p[19] = 4;
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 20, 1);
	memcpy(p + 22, senderMac.data(), 6);
	arch::store_unaligned<uint32_t, arch::endian::big>(p + 28, senderIp);
	memset(p + 32, 0, 6);
	arch::store_unaligned<uint32_t, arch::endian::big>(p + 38, targetIp);
	return frame;
}

} // anonymous namespace

DEFINE_TEST(checksum_reference_values, ([] {
	const uint8_t words[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
	assert(checksum(words, sizeof(words)) == 0x220d);

	// The odd byte is padded with a zero low byte.
	const uint8_t odd[] = {0x01};
	assert(checksum(odd, 1) == 0xfeff);

	Checksum chk;
	chk.update(uint16_t{0xffff});
	chk.update(uint16_t{0x0001});
	assert(chk.finalize() == 0xfffe);

	assert(checksum(nullptr, 0) == 0xffff);
}))

DEFINE_TEST(checksum_fills_header_fields, ([] {
	// 192.168.0.1 -> 192.168.0.199, UDP; the field holds garbage beforehand.
	std::array<uint8_t, 20> ip = {0x45, 0x00, 0x00, 0x73, 0x00, 0x00, 0x40, 0x00,
			0x40, 0x11, 0xde, 0xad, 0xc0, 0xa8, 0x00, 0x01, 0xc0, 0xa8, 0x00, 0xc7};
	fillIp4HeaderChecksum(ip);
	assert(ip[10] == 0xb8 && ip[11] == 0x61);
	assert(checksum(ip.data(), ip.size()) == 0);

	// Odd-sized ICMP message: type, code, checksum, id, sequence, one byte.
	std::array<uint8_t, 9> icmp = {0x08, 0x00, 0xff, 0xff, 0x10, 0xad, 0x00, 0x01, 0x41};
	fillIcmpChecksum(icmp);
	assert(checksum(icmp.data(), icmp.size()) == 0);
	assert(icmp[0] == 0x08 && icmp[8] == 0x41);
}))

DEFINE_TEST(format_ip4_addresses, ([] {
	assert(!strcmp(formatIp4(makeIp4(192, 168, 22, 102)).str, "192.168.22.102"));
	assert(!strcmp(formatIp4(0).str, "0.0.0.0"));
	assert(!strcmp(formatIp4(makeIp4(10, 0, 100, 9)).str, "10.0.100.9"));
	assert(!strcmp(formatIp4(0xFFFFFFFF).str, "255.255.255.255"));
}))

DEFINE_TEST(echo_request_layout, ([] {
	NetConfig config;
	std::array<uint8_t, 128> out;
	out.fill(0xEE);

	auto size = buildEchoRequest(config.remoteMac, config.localMac,
			config.localIp, config.remoteIp, 7, out);
	assert(size);
	assert(size.value() == 74);

	auto p = out.data();
	assert(sameMac(p, config.remoteMac));
	assert(sameMac(p + 6, config.localMac));
	assert(be16(p + 12) == 0x0800);

	assert(p[14] == 0x45);
	assert(p[15] == 0);
	assert(be16(p + 16) == 60);
	assert(be16(p + 18) == 0x1234);
	assert(be16(p + 20) == 0);
	assert(p[22] == 64);
	assert(p[23] == 1);
	assert(be32(p + 26) == makeIp4(192, 168, 22, 102));
	assert(be32(p + 30) == makeIp4(192, 168, 22, 101));

	assert(p[34] == 8);
	assert(p[35] == 0);
	assert(be16(p + 38) == 0x5678);
	assert(be16(p + 40) == 7);
	for (size_t i = 0; i < 32; i++)
		assert(p[42 + i] == i);

	// Nothing beyond the frame is touched.
	assert(p[74] == 0xEE);

	assert(checksum(p + 14, 20) == 0);
	assert(checksum(p + 34, 40) == 0);
}))

DEFINE_TEST(echo_request_buffer_too_small, ([] {
	NetConfig config;
	std::array<uint8_t, 73> out;

	auto size = buildEchoRequest(config.remoteMac, config.localMac,
			config.localIp, config.remoteIp, 1, out);
	assert(!size);
	assert(size.error() == Error::bufferTooSmall);
}))

DEFINE_TEST(parse_echo_request, ([] {
	NetConfig config;
	auto frame = incomingEchoRequest(config, 0x0102);

	auto parsed = parseFrame(frame);
	assert(parsed.kind == FrameKind::ip4);
	assert(parsed.ethernet.etherType == etherTypeIp4);
	assert(parsed.ethernet.source == config.remoteMac);
	assert(parsed.ip.source == config.remoteIp);
	assert(parsed.ip.destination == config.localIp);
	assert(parsed.ip.length == 60);
	assert(parsed.ip.ttl == 64);
	assert(parsed.ipPayload.size() == 40);
	assert(parsed.icmpKind == IcmpKind::echoRequest);
	assert(parsed.icmp.identifier == echoIdentifier);
	assert(parsed.icmp.sequence == 0x0102);
	assert(parsed.icmpPayload.size() == echoPayloadSize);
}))

DEFINE_TEST(parse_ignores_ethernet_padding, ([] {
	NetConfig config;
	auto frame = incomingEchoRequest(config, 1);
	frame.resize(100, 0);

	auto parsed = parseFrame(frame);
	assert(parsed.kind == FrameKind::ip4);
	assert(parsed.ipPayload.size() == 40);
	assert(parsed.icmpPayload.size() == 32);
}))

DEFINE_TEST(parse_rejects_bad_frames, ([] {
	NetConfig config;

	std::vector<uint8_t> tiny(13, 0);
	assert(parseFrame(tiny).kind == FrameKind::truncated);

	auto ipv6 = incomingEchoRequest(config, 1);
	ipv6[12] = 0x86;
	ipv6[13] = 0xDD;
	assert(parseFrame(ipv6).kind == FrameKind::other);

	auto version = incomingEchoRequest(config, 1);
	version[14] = 0x65;
	assert(parseFrame(version).kind == FrameKind::malformed);

	auto ihl = incomingEchoRequest(config, 1);
	ihl[14] = 0x44;
	assert(parseFrame(ihl).kind == FrameKind::malformed);

	auto shortLength = incomingEchoRequest(config, 1);
	arch::store_unaligned<uint16_t, arch::endian::big>(shortLength.data() + 16, 16);
	assert(parseFrame(shortLength).kind == FrameKind::malformed);

	auto cut = incomingEchoRequest(config, 1);
	cut.resize(60);
	assert(parseFrame(cut).kind == FrameKind::truncated);

	auto arp = arpRequest(config.remoteMac, config.remoteIp, config.localIp);
	arp.resize(30);
	assert(parseFrame(arp).kind == FrameKind::truncated);
}))

DEFINE_TEST(parse_other_icmp, ([] {
	NetConfig config;
	auto frame = incomingEchoRequest(config, 1);
	frame[34] = 3;

	auto parsed = parseFrame(frame);
	assert(parsed.kind == FrameKind::ip4);
	assert(parsed.icmpKind == IcmpKind::other);
}))

DEFINE_TEST(echo_reply_swaps_addresses, ([] {
	NetConfig config;
	auto request = incomingEchoRequest(config, 0x0042);

	// Arrived after a few hops.
	request[22] = 5;
	request[24] = 0;
	request[25] = 0;
	arch::store_unaligned<uint16_t, arch::endian::big>(request.data() + 24,
			checksum(request.data() + 14, 20));

	std::array<uint8_t, 2048> out;
	auto size = buildEchoReply(request, out);
	assert(size);
	assert(size.value() == 74);

	auto p = out.data();
	assert(sameMac(p, config.remoteMac));
	assert(sameMac(p + 6, config.localMac));
	assert(be32(p + 26) == config.localIp);
	assert(be32(p + 30) == config.remoteIp);
	assert(p[22] == 64);
	assert(p[34] == 0);
	assert(p[35] == 0);
	assert(be16(p + 38) == 0x5678);
	assert(be16(p + 40) == 0x0042);
	assert(!memcmp(p + 42, request.data() + 42, 32));

	assert(checksum(p + 14, 20) == 0);
	assert(checksum(p + 34, 40) == 0);

	auto parsed = parseFrame(std::span<const uint8_t>{p, size.value()});
	assert(parsed.icmpKind == IcmpKind::echoReply);
}))

DEFINE_TEST(echo_reply_rejects_non_requests, ([] {
	NetConfig config;
	std::array<uint8_t, 2048> out;

	auto arp = arpRequest(config.remoteMac, config.remoteIp, config.localIp);
	auto fromArp = buildEchoReply(arp, out);
	assert(!fromArp);
	assert(fromArp.error() == Error::malformedFrame);

	auto request = incomingEchoRequest(config, 1);
	std::array<uint8_t, 40> small;
	auto tooSmall = buildEchoReply(request, small);
	assert(!tooSmall);
	assert(tooSmall.error() == Error::bufferTooSmall);
}))

DEFINE_TEST(arp_reply_layout, ([] {
	NetConfig config;
	auto request = arpRequest(config.remoteMac, config.remoteIp, config.localIp);

	std::array<uint8_t, 64> out;
	auto size = buildArpReply(request, config.localMac, config.localIp, out);
	assert(size);
	assert(size.value() == 42);

	auto p = out.data();
	assert(sameMac(p, config.remoteMac));
	assert(sameMac(p + 6, config.localMac));
	assert(be16(p + 12) == 0x0806);
	assert(be16(p + 14) == 1);
	assert(be16(p + 16) == 0x0800);
	assert(p[18] == 6);
	assert(p[19] == 4);
	assert(be16(p + 20) == 2);
	assert(sameMac(p + 22, config.localMac));
	assert(be32(p + 28) == config.localIp);
	assert(sameMac(p + 32, config.remoteMac));
	assert(be32(p + 38) == config.remoteIp);

	auto parsed = parseFrame(std::span<const uint8_t>{p, size.value()});
	assert(parsed.kind == FrameKind::arp);
	assert(parsed.arp.operation == arpReply);
	assert(parsed.arp.targetIp == config.remoteIp);
}))

DEFINE_TEST(arp_reply_only_for_our_address, ([] {
	NetConfig config;
	auto request = arpRequest(config.remoteMac, config.remoteIp, makeIp4(192, 168, 22, 1));

	std::array<uint8_t, 64> out;
	auto size = buildArpReply(request, config.localMac, config.localIp, out);
	assert(!size);
	assert(size.error() == Error::malformedFrame);
}))
