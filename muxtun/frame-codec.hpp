/// \file  frame-codec.hpp
/// \brief Binary frame encoder and decoder implemented with boost spirit
///
/// UNCLASSIFIED
#ifndef MUXTUN_FRAME_CODEC_HEAD
#define MUXTUN_FRAME_CODEC_HEAD 1

#include <cstddef>
#include <boost/cstdint.hpp>
#include <boost/system/error_code.hpp>
#include "frame.hpp"

namespace muxtun {

/// The fixed header, as found on the wire. The flag is kept raw so that
/// values outside the protocol can still be reported.
struct frame_header {
	frame_header()
		: channel(control_channel())
		, flag(0)
		, size(0)
	{
	}

	channel_id      channel;
	unsigned int    flag;
	boost::uint32_t size;
};     // struct frame_header

/// \return false if fewer than header_size bytes are available
bool parse_header(const char *first, const char *last, frame_header &header);

/// \brief serialize a frame header and its payload
///
/// Sets \em ec to error::oversized_payload, and returns an empty string, if
/// the payload is larger than \em max_size.
string_type encode_frame(const channel_id &channel, const frame_flag flag,
						 const string_type &payload,
						 boost::system::error_code &ec,
						 const std::size_t max_size = max_payload_size);

/// \throw boost::system::system_error if the payload is too large
string_type encode_frame(const frame &aFrame,
						 const std::size_t max_size = max_payload_size);

/// \brief decode the frame at the front of [first, last)
///
/// \return the number of bytes consumed; the remainder starts at first + result.
///
/// On error, \em ec is one of:
/// \li error::malformed_frame   - fewer than header_size bytes; nothing consumed
/// \li error::oversized_payload - declared size exceeds \em max_size; nothing consumed,
///                                out.channel names the offending channel
/// \li error::truncated_frame   - declared size runs past \em last; nothing consumed
/// \li error::unknown_flag      - the whole frame is consumed so the caller may skip it
std::size_t decode_frame(const char *first, const char *last, frame &out,
						 boost::system::error_code &ec,
						 const std::size_t max_size = max_payload_size);

/// \throw boost::system::system_error on any decode error
frame decode_frame(const string_type &content);

}      // namespace muxtun
#endif // MUXTUN_FRAME_CODEC_HEAD
