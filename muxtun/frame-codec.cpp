/// \file  frame-codec.cpp
/// \brief Binary frame encoder and decoder implemented with boost spirit
///
/// UNCLASSIFIED
#include "frame-codec.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/qi_binary.hpp>
#include <boost/spirit/include/karma.hpp>
#include <boost/spirit/include/karma_binary.hpp>
#include <boost/system/system_error.hpp>

#include "error.hpp"

namespace muxtun {
namespace qi = boost::spirit::qi;
namespace karma = boost::spirit::karma;

namespace {

typedef std::vector<unsigned char> octets;

static const std::size_t channel_id_size = 16;

}      // namespace

bool
parse_header(const char *first, const char *last, frame_header &header)
{
	using qi::byte_;
	using qi::big_dword;
	using qi::repeat;

	if (last - first < static_cast<std::ptrdiff_t>(header_size)) {
		return false;
	}
	octets          id;
	unsigned char   flag = 0;
	boost::uint32_t size = 0;
	unsigned char   extra = 0; // reserved, ignored on receipt

	const char *iter = first;
	const bool ok =
		qi::parse(iter, first + header_size,
				  repeat(channel_id_size)[byte_] >> byte_ >> big_dword >> byte_,
				  id, flag, size, extra);
	if (!ok || id.size() != channel_id_size) {
		return false;
	}
	std::copy(id.begin(), id.end(), header.channel.begin());
	header.flag = flag;
	header.size = size;
	return true;
}

string_type
encode_frame(const channel_id &channel, const frame_flag flag,
			 const string_type &payload,
			 boost::system::error_code &ec,
			 const std::size_t max_size)
{
	using karma::byte_;
	using karma::big_dword;
	using karma::repeat;

	string_type out;
	if (payload.size() > max_size) {
		ec = error::oversized_payload;
		return out;
	}
	out.reserve(header_size + payload.size());

	const octets          id(channel.begin(), channel.end());
	const unsigned char   raw_flag = static_cast<unsigned char>(flag);
	const boost::uint32_t size = static_cast<boost::uint32_t>(payload.size());
	const unsigned char   extra = 0;

	std::back_insert_iterator<string_type> sink(out);
	if (!karma::generate(sink,
						 repeat(channel_id_size)[byte_] << byte_ << big_dword << byte_,
						 id, raw_flag, size, extra)) {
		using namespace boost::system::errc;
		ec = make_error_code(invalid_argument);
		return string_type();
	}
	out.append(payload);
	ec = boost::system::error_code();
	return out;
}

string_type
encode_frame(const frame &aFrame, const std::size_t max_size)
{
	boost::system::error_code ec;
	string_type out = encode_frame(aFrame.channel, aFrame.flag, aFrame.payload, ec, max_size);
	if (ec) {
		throw boost::system::system_error(ec, "encode_frame");
	}
	return out;
}

std::size_t
decode_frame(const char *first, const char *last, frame &out,
			 boost::system::error_code &ec,
			 const std::size_t max_size)
{
	frame_header header;
	if (!parse_header(first, last, header)) {
		ec = error::malformed_frame;
		return 0;
	}
	out.channel = header.channel;
	if (header.size > max_size) {
		ec = error::oversized_payload;
		return 0;
	}
	const std::size_t available = static_cast<std::size_t>(last - first) - header_size;
	if (header.size > available) {
		ec = error::truncated_frame;
		return 0;
	}
	const std::size_t consumed = header_size + header.size;
	if (!is_known_flag(header.flag)) {
		ec = error::unknown_flag;
		return consumed;
	}
	out.flag = static_cast<frame_flag>(header.flag);
	out.payload.assign(first + header_size, first + consumed);
	ec = boost::system::error_code();
	return consumed;
}

frame
decode_frame(const string_type &content)
{
	frame out;
	boost::system::error_code ec;
	const char * const first = content.data();
	decode_frame(first, first + content.size(), out, ec);
	if (ec) {
		throw boost::system::system_error(ec, "decode_frame");
	}
	return out;
}

}      // namespace muxtun
