/// \file  frame.hpp
/// \brief Multiplexer frame
///
/// UNCLASSIFIED
#ifndef MUXTUN_FRAME_HEAD
#define MUXTUN_FRAME_HEAD 1

#include <cstddef>
#include <string>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/nil_generator.hpp>

namespace muxtun {

/// Relay-assigned channel identifier (16 opaque octets).
typedef boost::uuids::uuid channel_id;

/// The values are fixed by the relay; do not renumber.
enum frame_flag : unsigned char {
	NEW    = 0x01,
	DATA   = 0x02,
	CLOSE  = 0x04,
	PING   = 0x08,
	PONG   = 0x09,
	PAUSE  = 0x16,
	RESUME = 0x32,
};

typedef std::string string_type;

/// channel_id(16) + flag(1) + size(4, big-endian) + extra(1)
static const std::size_t header_size = 22;

/// Upper bound on the payload of a single frame.
static const std::size_t max_payload_size = 1024u * 1024u;

/// The reserved all-zero identifier used by connection-level control frames.
inline channel_id control_channel() { return boost::uuids::nil_uuid(); }

inline bool is_known_flag(const unsigned int value)
{
	switch (value) {
	case NEW:
	case DATA:
	case CLOSE:
	case PING:
	case PONG:
	case PAUSE:
	case RESUME:
		return true;
	default:
		return false;
	}
}

struct frame {
	frame()
		: channel(control_channel())
		, flag(DATA)
		, payload()
	{
	}

	frame(const channel_id &c, const frame_flag f)
		: channel(c)
		, flag(f)
		, payload()
	{
	}

	frame(const channel_id &c, const frame_flag f, const string_type &p)
		: channel(c)
		, flag(f)
		, payload(p)
	{
	}

	channel_id  channel;
	frame_flag  flag;
	string_type payload;

	bool
	operator==(const frame &rhs) const
	{
		return this->channel == rhs.channel &&
			this->flag == rhs.flag &&
			this->payload == rhs.payload;
	}

	bool operator!=(const frame &rhs) const { return !(*this == rhs); }
};     // struct frame

}      // namespace muxtun
#endif // MUXTUN_FRAME_HEAD
