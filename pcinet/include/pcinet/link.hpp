#pragma once

#include <frg/expected.hpp>
#include <pcinet/error.hpp>
#include <pcinet/mac.hpp>
#include <span>
#include <stddef.h>
#include <stdint.h>

namespace pcinet {

// A device that moves whole Ethernet frames (without FCS).
struct Link {
	// Sends an entire frame and waits until the device has consumed it.
	virtual frg::expected<Error> send(std::span<const uint8_t> frame) = 0;

	// Waits up to timeoutMs for one frame and copies it into buffer.
	// Returns the frame length.
	virtual frg::expected<Error, size_t> receive(std::span<uint8_t> buffer,
			uint64_t timeoutMs) = 0;

	virtual MacAddress deviceMac() = 0;

protected:
	~Link() = default;
};

} // namespace pcinet
