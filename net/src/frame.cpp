#include <net/checksum.hpp>
#include <net/frame.hpp>
#include <pcinet/debug.hpp>
#include <string.h>

namespace pcinet::net {

Ip4String formatIp4(Ip4Address address) {
	Ip4String out{};
	char *p = out.str;
	for (int shift = 24; shift >= 0; shift -= 8) {
		unsigned int octet = (address >> shift) & 0xFF;
		if (octet >= 100)
			*p++ = '0' + octet / 100;
		if (octet >= 10)
			*p++ = '0' + (octet / 10) % 10;
		*p++ = '0' + octet % 10;
		if (shift)
			*p++ = '.';
	}
	*p = '\0';
	return out;
}

namespace {

// Sequential writer for outgoing frames.
struct FrameWriter {
	explicit FrameWriter(std::span<uint8_t> out)
	: out_{out} { }

	template<typename T>
	void append(T data) {
		memcpy(out_.data() + offset_, &data, sizeof(data));
		offset_ += sizeof(data);
	}

	void append(std::span<const uint8_t> data) {
		memcpy(out_.data() + offset_, data.data(), data.size());
		offset_ += data.size();
	}

	size_t offset() const {
		return offset_;
	}

private:
	std::span<uint8_t> out_;
	size_t offset_ = 0;
};

void parseIcmp(ParsedFrame &parsed) {
	if (parsed.ipPayload.size() < sizeof(IcmpHeader)) {
		parsed.kind = FrameKind::truncated;
		return;
	}

	memcpy(&parsed.icmp, parsed.ipPayload.data(), sizeof(IcmpHeader));
	parsed.icmp.ensureEndian();
	parsed.icmpPayload = parsed.ipPayload.subspan(sizeof(IcmpHeader));

	switch (parsed.icmp.type) {
	case icmpEchoRequest:
		parsed.icmpKind = IcmpKind::echoRequest;
		break;
	case icmpEchoReply:
		parsed.icmpKind = IcmpKind::echoReply;
		break;
	default:
		parsed.icmpKind = IcmpKind::other;
	}
}

void parseIp4(ParsedFrame &parsed, std::span<const uint8_t> packet) {
	if (packet.size() < sizeof(Ip4Header)) {
		parsed.kind = FrameKind::truncated;
		return;
	}

	memcpy(&parsed.ip, packet.data(), sizeof(Ip4Header));
	parsed.ip.ensureEndian();

	auto headerLength = parsed.ip.headerLength();
	if (parsed.ip.version() != ip4Version || headerLength < sizeof(Ip4Header)
			|| parsed.ip.length < headerLength) {
		parsed.kind = FrameKind::malformed;
		return;
	}
	// Ethernet padding may follow the datagram, but it must not be cut short.
	if (parsed.ip.length > packet.size()) {
		parsed.kind = FrameKind::truncated;
		return;
	}

	parsed.kind = FrameKind::ip4;
	parsed.ipPayload = packet.subspan(headerLength, parsed.ip.length - headerLength);

	if (parsed.ip.protocol == ipProtocolIcmp)
		parseIcmp(parsed);
}

} // anonymous namespace

ParsedFrame parseFrame(std::span<const uint8_t> frame) {
	ParsedFrame parsed;

	if (frame.size() < sizeof(EthernetHeader))
		return parsed;

	memcpy(&parsed.ethernet, frame.data(), sizeof(EthernetHeader));
	parsed.ethernet.ensureEndian();
	auto payload = frame.subspan(sizeof(EthernetHeader));

	switch (parsed.ethernet.etherType) {
	case etherTypeArp:
		if (payload.size() < sizeof(ArpPacket))
			return parsed;
		memcpy(&parsed.arp, payload.data(), sizeof(ArpPacket));
		parsed.arp.ensureEndian();
		parsed.kind = FrameKind::arp;
		break;
	case etherTypeIp4:
		parseIp4(parsed, payload);
		break;
	default:
		parsed.kind = FrameKind::other;
	}

	return parsed;
}

void logFrame(const ParsedFrame &parsed) {
	if (parsed.kind == FrameKind::truncated || parsed.kind == FrameKind::malformed) {
		infoLogger() << "net: " << (parsed.kind == FrameKind::truncated ? "truncated" : "malformed")
				<< " frame" << frg::endlog;
		return;
	}

	infoLogger() << "net: " << toString(parsed.ethernet.source).str
			<< " -> " << toString(parsed.ethernet.destination).str
			<< ", EtherType " << frg::hex_fmt{static_cast<unsigned int>(parsed.ethernet.etherType)}
			<< frg::endlog;

	if (parsed.kind == FrameKind::arp) {
		infoLogger() << "net:   ARP " << (parsed.arp.operation == arpRequest ? "request" : "reply")
				<< ", " << formatIp4(parsed.arp.senderIp).str
				<< " asks for " << formatIp4(parsed.arp.targetIp).str << frg::endlog;
	} else if (parsed.kind == FrameKind::ip4) {
		infoLogger() << "net:   IPv4 " << formatIp4(parsed.ip.source).str
				<< " -> " << formatIp4(parsed.ip.destination).str
				<< ", protocol " << static_cast<unsigned int>(parsed.ip.protocol) << frg::endlog;

		if (parsed.icmpKind != IcmpKind::none)
			infoLogger() << "net:   ICMP "
					<< (parsed.icmpKind == IcmpKind::echoRequest ? "echo request"
						: parsed.icmpKind == IcmpKind::echoReply ? "echo reply" : "other")
					<< ", id " << frg::hex_fmt{static_cast<unsigned int>(parsed.icmp.identifier)}
					<< ", sequence " << static_cast<unsigned int>(parsed.icmp.sequence)
					<< frg::endlog;
	}
}

frg::expected<Error, size_t> buildEchoRequest(const MacAddress &dstMac,
		const MacAddress &srcMac, Ip4Address srcIp, Ip4Address dstIp,
		uint16_t sequence, std::span<uint8_t> out) {
	if (out.size() < echoRequestSize)
		return Error::bufferTooSmall;

	EthernetHeader eth{dstMac, srcMac, etherTypeIp4};
	eth.ensureEndian();

	uint8_t payload[echoPayloadSize];
	for (size_t i = 0; i < echoPayloadSize; i++)
		payload[i] = i;

	IcmpHeader icmp{icmpEchoRequest, 0, 0, echoIdentifier, sequence};
	icmp.ensureEndian();

	Ip4Header hdr;
	hdr.versionIhl = 0x45;
	hdr.tos = 0;
	hdr.length = sizeof(Ip4Header) + sizeof(IcmpHeader) + echoPayloadSize;
	hdr.ident = echoIpIdent;
	hdr.flagsOffset = 0;
	hdr.ttl = defaultTtl;
	hdr.protocol = ipProtocolIcmp;
	hdr.checksum = 0;
	hdr.source = srcIp;
	hdr.destination = dstIp;
	hdr.ensureEndian();

	FrameWriter writer{out};
	writer.append(eth);
	writer.append(hdr);
	writer.append(icmp);
	writer.append(std::span<const uint8_t>{payload});

	fillIp4HeaderChecksum(out.subspan(sizeof(EthernetHeader), sizeof(Ip4Header)));
	fillIcmpChecksum(out.subspan(sizeof(EthernetHeader) + sizeof(Ip4Header),
			sizeof(IcmpHeader) + echoPayloadSize));
	return writer.offset();
}

frg::expected<Error, size_t> buildEchoReply(std::span<const uint8_t> request,
		std::span<uint8_t> out) {
	auto parsed = parseFrame(request);
	if (parsed.kind != FrameKind::ip4 || parsed.icmpKind != IcmpKind::echoRequest)
		return Error::malformedFrame;

	auto headerLength = parsed.ip.headerLength();
	size_t size = sizeof(EthernetHeader) + parsed.ip.length;
	if (out.size() < size)
		return Error::bufferTooSmall;

	// Start from a copy so that IP options and the payload carry over.
	memcpy(out.data(), request.data(), size);

	EthernetHeader eth{parsed.ethernet.source, parsed.ethernet.destination, etherTypeIp4};
	eth.ensureEndian();
	memcpy(out.data(), &eth, sizeof(eth));

	auto ipOffset = sizeof(EthernetHeader);
	Ip4Header hdr = parsed.ip;
	hdr.source = parsed.ip.destination;
	hdr.destination = parsed.ip.source;
	hdr.ttl = defaultTtl;
	hdr.ensureEndian();
	memcpy(out.data() + ipOffset, &hdr, sizeof(hdr));
	fillIp4HeaderChecksum(out.subspan(ipOffset, headerLength));

	auto icmpOffset = ipOffset + headerLength;
	IcmpHeader icmp = parsed.icmp;
	icmp.type = icmpEchoReply;
	icmp.code = 0;
	icmp.ensureEndian();
	memcpy(out.data() + icmpOffset, &icmp, sizeof(icmp));
	fillIcmpChecksum(out.subspan(icmpOffset, parsed.ip.length - headerLength));

	return size;
}

frg::expected<Error, size_t> buildArpReply(std::span<const uint8_t> request,
		const MacAddress &ourMac, Ip4Address ourIp, std::span<uint8_t> out) {
	auto parsed = parseFrame(request);
	if (parsed.kind != FrameKind::arp || parsed.arp.operation != arpRequest
			|| parsed.arp.targetIp != ourIp)
		return Error::malformedFrame;
	if (out.size() < arpFrameSize)
		return Error::bufferTooSmall;

	EthernetHeader eth{parsed.arp.senderMac, ourMac, etherTypeArp};
	eth.ensureEndian();

	ArpPacket arp;
	arp.hardwareType = arpHardwareEthernet;
	arp.protocolType = etherTypeIp4;
	arp.hardwareSize = sizeof(MacAddress);
	arp.protocolSize = sizeof(Ip4Address);
	arp.operation = arpReply;
	arp.senderMac = ourMac;
	arp.senderIp = ourIp;
	arp.targetMac = parsed.arp.senderMac;
	arp.targetIp = parsed.arp.senderIp;
	arp.ensureEndian();

	FrameWriter writer{out};
	writer.append(eth);
	writer.append(arp);
	return writer.offset();
}

} // namespace pcinet::net
