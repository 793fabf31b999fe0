#include <pcinet/error.hpp>

namespace pcinet {

const char *toString(Error error) {
	switch (error) {
		case Error::none: return "none";
		case Error::timeout: return "ATU enable timeout";
		case Error::resetTimeout: return "reset timeout";
		case Error::txTimeout: return "TX timeout";
		case Error::rxTimeout: return "RX timeout";
		case Error::noDevice: return "no device";
		case Error::enableFailed: return "enable failed";
		case Error::noBar: return "BAR not implemented";
		case Error::oversizedPacket: return "oversized packet";
		case Error::rxError: return "RX error";
		case Error::bufferTooSmall: return "buffer too small";
		case Error::malformedFrame: return "malformed frame";
	}
	return "unknown error";
}

} // namespace pcinet
