/// \file frame-stream.hpp
///
/// UNCLASSIFIED
#ifndef MUXTUN_FRAME_STREAM_HEAD
#define MUXTUN_FRAME_STREAM_HEAD 1

#include <iosfwd>
#include <string>
#include "frame.hpp"

namespace muxtun {

/// \return "NEW", "DATA", ... or "0x??" for values outside the protocol
std::string flag_name(const unsigned int flag);

std::string to_string(const channel_id &channel);

/// Human readable summary; the payload is not printed, only its size.
std::ostream &operator<<(std::ostream &stream, const frame &aFrame);

}      // namespace muxtun
#endif // MUXTUN_FRAME_STREAM_HEAD
