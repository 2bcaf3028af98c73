/// \file frame-stream.cpp
///
/// UNCLASSIFIED
#include "frame-stream.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

#include <boost/uuid/uuid_io.hpp>

namespace muxtun {

std::string
flag_name(const unsigned int flag)
{
	switch (flag) {
	case NEW:
		return "NEW";
	case DATA:
		return "DATA";
	case CLOSE:
		return "CLOSE";
	case PING:
		return "PING";
	case PONG:
		return "PONG";
	case PAUSE:
		return "PAUSE";
	case RESUME:
		return "RESUME";
	default:
		{
			std::ostringstream strm;
			strm << "0x" << std::hex << std::setw(2) << std::setfill('0') << flag;
			return strm.str();
		}
	}
}

std::string
to_string(const channel_id &channel)
{
	return boost::uuids::to_string(channel);
}

std::ostream &
operator<<(std::ostream &stream, const frame &aFrame)
{
	if (stream) {
		stream << flag_name(aFrame.flag) << ' '
			   << muxtun::to_string(aFrame.channel) << ' '
			   << aFrame.payload.size();
	}
	return stream;
}

}      // namespace muxtun
