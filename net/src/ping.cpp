#include <net/debug_options.hpp>
#include <net/ping.hpp>
#include <pcinet/debug.hpp>

namespace pcinet::net {

PingSession::PingSession(Link *link, const NetConfig &config)
: _link{link}, _config{config}, _localMac{link->deviceMac()} {
	// The NIC only accepts unicast frames to its own address.
	if (!_localMac)
		_localMac = _config.localMac;
}

frg::expected<Error, bool> PingSession::answerRequest(const ParsedFrame &parsed,
		std::span<const uint8_t> frame) {
	size_t size;

	if (parsed.kind == FrameKind::arp && parsed.arp.operation == arpRequest
			&& parsed.arp.targetIp == _config.localIp) {
		size = FRG_TRY(buildArpReply(frame, _localMac, _config.localIp, _txBuffer));
	} else if (parsed.kind == FrameKind::ip4 && parsed.icmpKind == IcmpKind::echoRequest
			&& parsed.ip.destination == _config.localIp) {
		size = FRG_TRY(buildEchoReply(frame, _txBuffer));
	} else {
		return false;
	}

	FRG_TRY(_link->send(std::span<const uint8_t>{_txBuffer.data(), size}));
	_answered++;
	return true;
}

frg::expected<Error, bool> PingSession::ping(uint16_t sequence) {
	auto size = FRG_TRY(buildEchoRequest(_config.remoteMac, _localMac,
			_config.localIp, _config.remoteIp, sequence, _txBuffer));

	infoLogger() << "net: ping " << formatIp4(_config.remoteIp).str
			<< ", sequence " << static_cast<unsigned int>(sequence) << frg::endlog;
	FRG_TRY(_link->send(std::span<const uint8_t>{_txBuffer.data(), size}));

	for (int i = 0; i < _config.maxReceives; i++) {
		auto received = _link->receive(_rxBuffer, _config.replyTimeoutMs);
		if (!received) {
			// A lost or broken frame only costs this attempt.
			if (received.error() == Error::rxTimeout
					|| received.error() == Error::rxError
					|| received.error() == Error::bufferTooSmall)
				continue;
			return received.error();
		}

		std::span<const uint8_t> frame{_rxBuffer.data(), received.value()};
		auto parsed = parseFrame(frame);
		if constexpr (logReceivedFrames)
			logFrame(parsed);

		if (parsed.kind == FrameKind::ip4 && parsed.icmpKind == IcmpKind::echoReply
				&& parsed.icmp.identifier == echoIdentifier
				&& parsed.icmp.sequence == sequence) {
			infoLogger() << "net: echo reply from " << formatIp4(parsed.ip.source).str
					<< ", sequence " << static_cast<unsigned int>(sequence) << ", TTL "
					<< static_cast<unsigned int>(parsed.ip.ttl) << frg::endlog;
			return true;
		}

		FRG_TRY(answerRequest(parsed, frame));
	}

	warningLogger() << "net: no echo reply for sequence " << static_cast<unsigned int>(sequence) << frg::endlog;
	return false;
}

frg::expected<Error> PingSession::respond(int rounds) {
	for (int i = 0; i < rounds; i++) {
		auto received = _link->receive(_rxBuffer, _config.replyTimeoutMs);
		if (!received) {
			if (received.error() == Error::rxTimeout
					|| received.error() == Error::rxError
					|| received.error() == Error::bufferTooSmall)
				continue;
			return received.error();
		}

		std::span<const uint8_t> frame{_rxBuffer.data(), received.value()};
		auto parsed = parseFrame(frame);
		if constexpr (logReceivedFrames)
			logFrame(parsed);

		FRG_TRY(answerRequest(parsed, frame));
	}
	return frg::success;
}

} // namespace pcinet::net
