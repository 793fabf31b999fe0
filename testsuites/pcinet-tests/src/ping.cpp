#include <array>
#include <assert.h>
#include <deque>
#include <string.h>
#include <vector>

#include <net/ping.hpp>
#include <pcinet/link.hpp>

#include "testsuite.hpp"

using namespace pcinet::net;
using pcinet::Error;

namespace {

// Link that plays the remote end: it answers echo requests to the remote
// address on its own, and otherwise delivers a scripted list of frames.
struct ScriptedLink final : pcinet::Link {
	struct Incoming {
		Error error = Error::none;
		std::vector<uint8_t> frame;
	};

	explicit ScriptedLink(const NetConfig &config)
	: mac{config.localMac}, config_{config} { }

	frg::expected<Error> send(std::span<const uint8_t> frame) override {
		if (sendError != Error::none)
			return sendError;
		sent.emplace_back(frame.begin(), frame.end());

		auto parsed = parseFrame(frame);
		if (peerAnswers && parsed.kind == FrameKind::ip4
				&& parsed.icmpKind == IcmpKind::echoRequest
				&& parsed.ip.destination == config_.remoteIp) {
			std::vector<uint8_t> reply(frame.size());
			auto size = buildEchoReply(frame, reply);
			assert(size);
			incoming.push_back({Error::none, std::move(reply)});
		}
		return frg::success;
	}

	frg::expected<Error, size_t> receive(std::span<uint8_t> buffer,
			uint64_t timeoutMs) override {
		receives++;
		lastTimeout = timeoutMs;
		if (incoming.empty())
			return Error::rxTimeout;

		auto next = std::move(incoming.front());
		incoming.pop_front();
		if (next.error != Error::none)
			return next.error;
		assert(next.frame.size() <= buffer.size());
		memcpy(buffer.data(), next.frame.data(), next.frame.size());
		return next.frame.size();
	}

	pcinet::MacAddress deviceMac() override {
		return mac;
	}

	void push(std::vector<uint8_t> frame) {
		incoming.push_back({Error::none, std::move(frame)});
	}

	void pushError(Error error) {
		incoming.push_back({error, {}});
	}

	pcinet::MacAddress mac;
	bool peerAnswers = true;
	Error sendError = Error::none;
	std::deque<Incoming> incoming;
	std::vector<std::vector<uint8_t>> sent;
	int receives = 0;
	uint64_t lastTimeout = 0;

private:
	NetConfig config_;
};

std::vector<uint8_t> echoRequest(const NetConfig &config, Ip4Address from, Ip4Address to,
		uint16_t sequence) {
	std::vector<uint8_t> frame(echoRequestSize);
	auto size = buildEchoRequest(config.localMac, config.remoteMac, from, to, sequence, frame);
	assert(size);
	return frame;
}

std::vector<uint8_t> arpRequestFor(const NetConfig &config, Ip4Address target) {
	std::vector<uint8_t> frame(arpFrameSize, 0);
	auto p = frame.data();
	memset(p, 0xFF, 6);
	memcpy(p + 6, config.remoteMac.data(), 6);
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 12, etherTypeArp);
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 14, arpHardwareEthernet);
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 16, etherTypeIp4);
	p[18] = 6;
	p[19] = 4;
	arch::store_unaligned<uint16_t, arch::endian::big>(p + 20, arpRequest);
	memcpy(p + 22, config.remoteMac.data(), 6);
	arch::store_unaligned<uint32_t, arch::endian::big>(p + 28, config.remoteIp);
	arch::store_unaligned<uint32_t, arch::endian::big>(p + 38, target);
	return frame;
}

} // anonymous namespace

DEFINE_TEST(ping_gets_reply, ([] {
	NetConfig config;
	ScriptedLink link{config};
	PingSession session{&link, config};

	auto outcome = session.ping(1);
	assert(outcome);
	assert(outcome.value());
	assert(link.sent.size() == 1);
	assert(link.receives == 1);
	assert(link.lastTimeout == 2000);

	auto request = parseFrame(link.sent[0]);
	assert(request.icmpKind == IcmpKind::echoRequest);
	assert(request.icmp.sequence == 1);
	assert(request.ethernet.destination == config.remoteMac);
}))

DEFINE_TEST(ping_answers_arp_while_waiting, ([] {
	NetConfig config;
	ScriptedLink link{config};
	link.push(arpRequestFor(config, config.localIp));
	PingSession session{&link, config};

	auto outcome = session.ping(2);
	assert(outcome);
	assert(outcome.value());
	assert(session.repliesAnswered() == 1);
	assert(link.sent.size() == 2);

	auto arp = parseFrame(link.sent[1]);
	assert(arp.kind == FrameKind::arp);
	assert(arp.arp.operation == arpReply);
	assert(arp.arp.senderMac == config.localMac);
	assert(arp.arp.targetIp == config.remoteIp);
}))

DEFINE_TEST(ping_skips_unrelated_frames, ([] {
	NetConfig config;
	ScriptedLink link{config};

	// A stale reply with another sequence number and an ARP for someone else.
	auto stale = echoRequest(config, config.localIp, config.remoteIp, 99);
	std::vector<uint8_t> staleReply(stale.size());
	auto staleSize = buildEchoReply(stale, staleReply);
	assert(staleSize);
	link.push(staleReply);
	link.push(arpRequestFor(config, pcinet::net::makeIp4(192, 168, 22, 1)));
	link.pushError(Error::rxError);

	PingSession session{&link, config};
	auto outcome = session.ping(3);
	assert(outcome);
	assert(outcome.value());
	assert(link.receives == 4);
	assert(session.repliesAnswered() == 0);
	assert(link.sent.size() == 1);
}))

DEFINE_TEST(ping_without_reply, ([] {
	NetConfig config;
	ScriptedLink link{config};
	link.peerAnswers = false;
	PingSession session{&link, config};

	auto outcome = session.ping(4);
	assert(outcome);
	assert(!outcome.value());
	assert(link.receives == config.maxReceives);
}))

DEFINE_TEST(ping_reports_link_errors, ([] {
	NetConfig config;

	ScriptedLink sendFails{config};
	sendFails.sendError = Error::txTimeout;
	PingSession first{&sendFails, config};
	auto sendOutcome = first.ping(5);
	assert(!sendOutcome);
	assert(sendOutcome.error() == Error::txTimeout);
	assert(sendFails.receives == 0);

	ScriptedLink receiveFails{config};
	receiveFails.peerAnswers = false;
	receiveFails.pushError(Error::noDevice);
	PingSession second{&receiveFails, config};
	auto receiveOutcome = second.ping(6);
	assert(!receiveOutcome);
	assert(receiveOutcome.error() == Error::noDevice);
}))

DEFINE_TEST(respond_answers_requests_for_us, ([] {
	NetConfig config;
	ScriptedLink link{config};
	link.peerAnswers = false;
	link.push(echoRequest(config, config.remoteIp, config.localIp, 0x0A0B));
	link.push(echoRequest(config, config.remoteIp, pcinet::net::makeIp4(192, 168, 22, 7), 1));
	link.push(arpRequestFor(config, config.localIp));
	link.pushError(Error::bufferTooSmall);

	PingSession session{&link, config};
	assert_success(session.respond(6));
	assert(link.receives == 6);
	assert(session.repliesAnswered() == 2);
	assert(link.sent.size() == 2);

	auto reply = parseFrame(link.sent[0]);
	assert(reply.icmpKind == IcmpKind::echoReply);
	assert(reply.icmp.sequence == 0x0A0B);
	assert(reply.ip.source == config.localIp);
	assert(reply.ip.destination == config.remoteIp);

	auto arp = parseFrame(link.sent[1]);
	assert(arp.kind == FrameKind::arp);
	assert(arp.arp.operation == arpReply);
}))

DEFINE_TEST(ping_sends_from_device_mac, ([] {
	NetConfig config;
	ScriptedLink link{config};
	link.mac = pcinet::MacAddress{{0xaa, 0x00, 0x11, 0x22, 0x33, 0x44}};
	assert(link.mac != config.localMac);
	link.push(arpRequestFor(config, config.localIp));
	PingSession session{&link, config};
	assert(session.localMac() == link.mac);

	auto outcome = session.ping(7);
	assert(outcome);
	assert(outcome.value());
	assert(link.sent.size() == 2);

	auto request = parseFrame(link.sent[0]);
	assert(request.icmpKind == IcmpKind::echoRequest);
	assert(request.ethernet.source == link.mac);

	auto arp = parseFrame(link.sent[1]);
	assert(arp.kind == FrameKind::arp);
	assert(arp.arp.senderMac == link.mac);
	assert(arp.ethernet.source == link.mac);
}))

DEFINE_TEST(ping_without_device_mac_uses_configured, ([] {
	NetConfig config;
	ScriptedLink link{config};
	link.mac = pcinet::MacAddress{};
	PingSession session{&link, config};
	assert(session.localMac() == config.localMac);

	auto outcome = session.ping(8);
	assert(outcome);
	assert(outcome.value());
	assert(parseFrame(link.sent[0]).ethernet.source == config.localMac);
}))
