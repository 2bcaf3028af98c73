/// \file  error.cpp
/// \brief Tunnel error codes
///
/// UNCLASSIFIED
#include "error.hpp"

namespace muxtun {

std::string
error_category::message(int ev) const
{
	using namespace muxtun::error;
	switch (ev) {
	case malformed_frame:
		return string("frame header is incomplete");
	case truncated_frame:
		return string("frame payload is shorter than its declared size");
	case oversized_payload:
		return string("frame payload exceeds the maximum size");
	case unknown_flag:
		return string("frame flag is not recognized");
	case write_queue_overflow:
		return string("local socket write queue overflow");
	case invalid_url:
		return string("relay URL is not a valid ws:// or wss:// URL");
	case not_connected:
		return string("the relay connection is not active");
	default:
		return string("unknown muxtun error");
	}
}

const boost::system::error_category &
get_muxtun_category()
{
	static const error_category ecat;
	return ecat;
}

}      // namespace muxtun
