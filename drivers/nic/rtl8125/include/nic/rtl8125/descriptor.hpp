#pragma once

#include <arch/variable.hpp>
#include <stddef.h>
#include <stdint.h>

namespace pcinet::nic::rtl8125 {

// Shared with the NIC. All accesses go through arch::*_variable so that the
// compiler never caches or merges them; cache maintenance is up to the queues.
struct Descriptor {
	arch::bit_variable<uint32_t> flags;
	arch::scalar_variable<uint32_t> vlan;
	arch::scalar_variable<uint32_t> base_low;
	arch::scalar_variable<uint32_t> base_high;
};

static_assert(sizeof(Descriptor) == 16);

constexpr size_t numTxDescriptors = 4;
constexpr size_t numRxDescriptors = 4;
constexpr size_t bufferSize = 2048;

// Shortest frame that we hand to the wire, FCS excluded.
constexpr size_t minFrameSize = 60;
constexpr size_t fcsLength = 4;

namespace flags {

namespace tx {
	constexpr arch::field<uint32_t, bool> ownership(31, 1);
	constexpr bool owner_nic = true;
	constexpr bool owner_driver = false;
	constexpr arch::field<uint32_t, bool> eor(30, 1);
	constexpr arch::field<uint32_t, bool> first_segment(29, 1);
	constexpr arch::field<uint32_t, bool> last_segment(28, 1);
	constexpr arch::field<uint32_t, uint16_t> frame_length(0, 16);
} // namespace tx

namespace rx {
	constexpr arch::field<uint32_t, bool> ownership(31, 1);
	constexpr bool owner_nic = true;
	constexpr bool owner_driver = false;
	constexpr arch::field<uint32_t, bool> eor(30, 1);
	constexpr arch::field<uint32_t, bool> first_segment(29, 1);
	constexpr arch::field<uint32_t, bool> last_segment(28, 1);
	constexpr arch::field<uint32_t, bool> receive_error(21, 1);
	// Buffer size when owned by the NIC, frame length including FCS afterwards.
	constexpr arch::field<uint32_t, uint16_t> frame_length(0, 14);
} // namespace rx

} // namespace flags

} // namespace pcinet::nic::rtl8125
