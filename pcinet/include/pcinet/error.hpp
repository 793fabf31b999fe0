#pragma once

namespace pcinet {

enum class [[nodiscard]] Error {
	none,
	// An ATU region did not report itself as enabled.
	timeout,
	// The NIC did not leave reset.
	resetTimeout,
	// The NIC did not release a transmit descriptor.
	txTimeout,
	// No receive descriptor was released in time.
	rxTimeout,
	// Config space returned an invalid vendor ID.
	noDevice,
	// Memory space enable did not stick in the command register.
	enableFailed,
	// The probed BAR is not implemented.
	noBar,
	// Frame does not fit into a DMA buffer.
	oversizedPacket,
	// The NIC flagged a received frame as broken.
	rxError,
	// Caller-provided buffer is too small for the received frame.
	bufferTooSmall,
	// A frame handed to a builder is not the kind of frame it answers.
	malformedFrame,
};

const char *toString(Error error);

} // namespace pcinet
