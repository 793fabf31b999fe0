#include <arch/bit.hpp>
#include <net/checksum.hpp>

namespace pcinet::net {

namespace {

constexpr size_t ip4ChecksumOffset = 10;
constexpr size_t icmpChecksumOffset = 2;

void storeChecksum(std::span<uint8_t> area, size_t fieldOffset) {
	auto field = area.data() + fieldOffset;
	arch::store_unaligned<uint16_t, arch::endian::big>(field, 0);
	arch::store_unaligned<uint16_t, arch::endian::big>(field,
			checksum(area.data(), area.size()));
}

} // anonymous namespace

void Checksum::update(uint16_t word) {
	sum_ += word;
}

void Checksum::update(const void *mem, size_t size) {
	auto bytes = static_cast<const uint8_t *>(mem);
	size_t i = 0;
	for (; i + 1 < size; i += 2)
		sum_ += arch::load_unaligned<uint16_t, arch::endian::big>(bytes + i);
	if (i < size)
		sum_ += uint32_t{bytes[i]} << 8;
}

void Checksum::update(std::span<const uint8_t> area) {
	update(area.data(), area.size());
}

uint16_t Checksum::finalize() const {
	auto folded = sum_;
	while (folded >> 16)
		folded = (folded & 0xFFFF) + (folded >> 16);
	return static_cast<uint16_t>(~folded);
}

uint16_t checksum(const void *mem, size_t size) {
	Checksum sum;
	sum.update(mem, size);
	return sum.finalize();
}

void fillIp4HeaderChecksum(std::span<uint8_t> header) {
	storeChecksum(header, ip4ChecksumOffset);
}

void fillIcmpChecksum(std::span<uint8_t> message) {
	storeChecksum(message, icmpChecksumOffset);
}

} // namespace pcinet::net
