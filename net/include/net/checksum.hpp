#pragma once

#include <span>
#include <stddef.h>
#include <stdint.h>

namespace pcinet::net {

// Internet checksum (RFC 1071): one's complement of the one's complement
// sum of all 16-bit words in network order.
struct Checksum {
	void update(uint16_t word);
	// An odd trailing byte is padded with a zero low byte.
	void update(const void *mem, size_t size);
	void update(std::span<const uint8_t> area);

	uint16_t finalize() const;

private:
	// Carries are folded only once, in finalize().
	uint64_t sum_ = 0;
};

// Checksum of a single buffer. Over a header whose checksum field is
// already filled in, this yields zero.
uint16_t checksum(const void *mem, size_t size);

// Compute the checksum of a finished IPv4 header (options included) and
// store it into its checksum field.
void fillIp4HeaderChecksum(std::span<uint8_t> header);

// Same for an ICMP message, header and payload.
void fillIcmpChecksum(std::span<uint8_t> message);

} // namespace pcinet::net
