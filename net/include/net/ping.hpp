#pragma once

#include <array>
#include <frg/expected.hpp>
#include <net/config.hpp>
#include <net/frame.hpp>
#include <pcinet/error.hpp>
#include <pcinet/link.hpp>

namespace pcinet::net {

// Large enough for anything a NIC hands us, FCS excluded.
constexpr size_t frameBufferSize = 2048;

struct PingSession {
	// Frames go out from the link's own MAC address; the configured one is
	// only used if the link does not report any.
	PingSession(Link *link, const NetConfig &config);

	// Sends one echo request to the remote end and waits for the matching
	// reply. ARP and echo requests for us are answered while waiting.
	// Returns whether the reply arrived.
	frg::expected<Error, bool> ping(uint16_t sequence);

	// Serves ARP and echo requests for the given number of receive attempts.
	frg::expected<Error> respond(int rounds);

	int repliesAnswered() const {
		return _answered;
	}

	const MacAddress &localMac() const {
		return _localMac;
	}

private:
	// Returns whether the frame was a request for us that got answered.
	frg::expected<Error, bool> answerRequest(const ParsedFrame &parsed,
			std::span<const uint8_t> frame);

	Link *_link;
	NetConfig _config;
	MacAddress _localMac;
	int _answered = 0;

	std::array<uint8_t, frameBufferSize> _rxBuffer;
	std::array<uint8_t, frameBufferSize> _txBuffer;
};

} // namespace pcinet::net
