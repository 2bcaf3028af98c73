/// \file test-frame-codec.cpp
///
/// UNCLASSIFIED
#include <gtest/gtest.h>

#include <string>
#include <sstream>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "muxtun/error.hpp"
#include "muxtun/frame.hpp"
#include "muxtun/frame-codec.hpp"
#include "muxtun/frame-stream.hpp"

using muxtun::frame;
using muxtun::channel_id;
using muxtun::string_type;

static channel_id
make_id(const unsigned char seed)
{
	channel_id id;
	for (std::size_t i = 0; i < id.size(); ++i) {
		id.data[i] = static_cast<unsigned char>(seed + i);
	}
	return id;
}

static string_type
raw_header(const channel_id &id, const unsigned char flag, const unsigned int size)
{
	string_type header(id.begin(), id.end());
	header += static_cast<char>(flag);
	header += static_cast<char>((size >> 24) & 0xff);
	header += static_cast<char>((size >> 16) & 0xff);
	header += static_cast<char>((size >> 8) & 0xff);
	header += static_cast<char>(size & 0xff);
	header += '\0';
	return header;
}

TEST(FrameEncoder, HeaderLayout)
{
	const channel_id id = make_id(1);
	const string_type bytes = muxtun::encode_frame(frame(id, muxtun::DATA, "abc"));

	ASSERT_EQ(muxtun::header_size + 3, bytes.size());
	EXPECT_EQ(string_type(id.begin(), id.end()), bytes.substr(0, 16));
	EXPECT_EQ(0x02, static_cast<unsigned char>(bytes[16]));
	EXPECT_EQ(0, bytes[17]);
	EXPECT_EQ(0, bytes[18]);
	EXPECT_EQ(0, bytes[19]);
	EXPECT_EQ(3, bytes[20]);
	EXPECT_EQ(0, bytes[21]);
	EXPECT_EQ("abc", bytes.substr(22));
}

TEST(FrameEncoder, BigEndianSize)
{
	const string_type payload(0x010203, 'x');
	const string_type bytes = muxtun::encode_frame(frame(make_id(0), muxtun::DATA, payload));
	EXPECT_EQ(0x00, static_cast<unsigned char>(bytes[17]));
	EXPECT_EQ(0x01, static_cast<unsigned char>(bytes[18]));
	EXPECT_EQ(0x02, static_cast<unsigned char>(bytes[19]));
	EXPECT_EQ(0x03, static_cast<unsigned char>(bytes[20]));
}

TEST(FrameEncoder, FlagValues)
{
	const channel_id id = make_id(7);
	EXPECT_EQ(0x01, static_cast<unsigned char>(muxtun::encode_frame(frame(id, muxtun::NEW))[16]));
	EXPECT_EQ(0x04, static_cast<unsigned char>(muxtun::encode_frame(frame(id, muxtun::CLOSE))[16]));
	EXPECT_EQ(0x08, static_cast<unsigned char>(muxtun::encode_frame(frame(id, muxtun::PING))[16]));
	EXPECT_EQ(0x09, static_cast<unsigned char>(muxtun::encode_frame(frame(id, muxtun::PONG))[16]));
	EXPECT_EQ(0x16, static_cast<unsigned char>(muxtun::encode_frame(frame(id, muxtun::PAUSE))[16]));
	EXPECT_EQ(0x32, static_cast<unsigned char>(muxtun::encode_frame(frame(id, muxtun::RESUME))[16]));
}

TEST(FrameEncoder, OversizedPayload)
{
	boost::system::error_code ec;
	const string_type bytes =
		muxtun::encode_frame(make_id(0), muxtun::DATA, string_type(11, 'x'), ec, 10);
	EXPECT_EQ(muxtun::error::oversized_payload, ec);
	EXPECT_TRUE(bytes.empty());

	EXPECT_THROW(muxtun::encode_frame(frame(make_id(0), muxtun::DATA, string_type(11, 'x')), 10),
				 boost::system::system_error);
	EXPECT_NO_THROW(muxtun::encode_frame(frame(make_id(0), muxtun::DATA, string_type(10, 'x')), 10));
}

TEST(FrameDecoder, RoundTrip)
{
	const unsigned char flags[] = { muxtun::NEW, muxtun::DATA, muxtun::CLOSE, muxtun::PING,
									muxtun::PONG, muxtun::PAUSE, muxtun::RESUME };
	for (std::size_t i = 0; i < sizeof(flags); ++i) {
		const frame original(make_id(static_cast<unsigned char>(i)),
							 static_cast<muxtun::frame_flag>(flags[i]),
							 string_type(i * 3, 'a' + static_cast<char>(i)));
		frame decoded;
		EXPECT_NO_THROW(decoded = muxtun::decode_frame(muxtun::encode_frame(original)));
		EXPECT_EQ(original, decoded) << original;
	}
}

TEST(FrameDecoder, BinaryPayload)
{
	string_type payload;
	for (int i = 0; i < 256; ++i) {
		payload += static_cast<char>(i);
	}
	const frame original(make_id(9), muxtun::DATA, payload);
	EXPECT_EQ(original, muxtun::decode_frame(muxtun::encode_frame(original)));
}

TEST(FrameDecoder, ShortBufferIsMalformed)
{
	const string_type bytes = muxtun::encode_frame(frame(make_id(2), muxtun::DATA, "abc"));
	for (std::size_t n = 0; n < muxtun::header_size; ++n) {
		frame out;
		boost::system::error_code ec;
		const std::size_t consumed = muxtun::decode_frame(bytes.data(), bytes.data() + n, out, ec);
		EXPECT_EQ(muxtun::error::malformed_frame, ec) << n;
		EXPECT_EQ(0u, consumed);
	}
	EXPECT_THROW(muxtun::decode_frame(string_type("short")), boost::system::system_error);
}

TEST(FrameDecoder, TruncatedPayload)
{
	const string_type bytes = raw_header(make_id(3), muxtun::DATA, 10) + "12345";
	frame out;
	boost::system::error_code ec;
	const std::size_t consumed = muxtun::decode_frame(bytes.data(), bytes.data() + bytes.size(), out, ec);
	EXPECT_EQ(muxtun::error::truncated_frame, ec);
	EXPECT_EQ(0u, consumed);
	EXPECT_TRUE(out.payload.empty());
}

TEST(FrameDecoder, OversizedDeclaration)
{
	const channel_id id = make_id(4);
	const string_type bytes = raw_header(id, muxtun::DATA, 0xffffffffu);
	frame out;
	boost::system::error_code ec;
	const std::size_t consumed = muxtun::decode_frame(bytes.data(), bytes.data() + bytes.size(), out, ec);
	EXPECT_EQ(muxtun::error::oversized_payload, ec);
	EXPECT_EQ(0u, consumed);
	EXPECT_EQ(id, out.channel);
}

TEST(FrameDecoder, UnknownFlagIsSkippable)
{
	const string_type first = raw_header(make_id(5), 0x77, 2) + "zz";
	const string_type second = muxtun::encode_frame(frame(make_id(6), muxtun::DATA, "ok"));
	const string_type bytes = first + second;

	frame out;
	boost::system::error_code ec;
	const std::size_t consumed = muxtun::decode_frame(bytes.data(), bytes.data() + bytes.size(), out, ec);
	EXPECT_EQ(muxtun::error::unknown_flag, ec);
	EXPECT_EQ(first.size(), consumed);

	const char *rest = bytes.data() + consumed;
	EXPECT_EQ(second.size(),
			  muxtun::decode_frame(rest, bytes.data() + bytes.size(), out, ec));
	EXPECT_FALSE(ec);
	EXPECT_EQ(frame(make_id(6), muxtun::DATA, "ok"), out);
}

TEST(FrameDecoder, SeveralFramesInOneBuffer)
{
	const frame a(make_id(10), muxtun::NEW);
	const frame b(make_id(10), muxtun::DATA, "x");
	const frame c(make_id(10), muxtun::DATA, "y");
	const string_type bytes = muxtun::encode_frame(a) + muxtun::encode_frame(b) + muxtun::encode_frame(c);

	const char *first = bytes.data();
	const char *const last = first + bytes.size();
	frame out;
	boost::system::error_code ec;

	first += muxtun::decode_frame(first, last, out, ec);
	EXPECT_EQ(a, out);
	first += muxtun::decode_frame(first, last, out, ec);
	EXPECT_EQ(b, out);
	first += muxtun::decode_frame(first, last, out, ec);
	EXPECT_EQ(c, out);
	EXPECT_FALSE(ec);
	EXPECT_EQ(last, first);
}

TEST(FrameDecoder, ExtraByteIgnored)
{
	string_type bytes = muxtun::encode_frame(frame(make_id(11), muxtun::CLOSE));
	bytes[21] = '\x5a';
	EXPECT_EQ(frame(make_id(11), muxtun::CLOSE), muxtun::decode_frame(bytes));
}

TEST(FrameHeader, Parse)
{
	const string_type bytes = raw_header(make_id(12), 0x32, 258);
	muxtun::frame_header header;
	ASSERT_TRUE(muxtun::parse_header(bytes.data(), bytes.data() + bytes.size(), header));
	EXPECT_EQ(make_id(12), header.channel);
	EXPECT_EQ(0x32u, header.flag);
	EXPECT_EQ(258u, header.size);
	EXPECT_FALSE(muxtun::parse_header(bytes.data(), bytes.data() + 21, header));
}

TEST(FrameStream, Names)
{
	EXPECT_EQ("PAUSE", muxtun::flag_name(muxtun::PAUSE));
	EXPECT_EQ("RESUME", muxtun::flag_name(muxtun::RESUME));
	EXPECT_EQ("0x77", muxtun::flag_name(0x77));
	EXPECT_EQ("00000000-0000-0000-0000-000000000000", muxtun::to_string(muxtun::control_channel()));

	std::ostringstream strm;
	strm << frame(muxtun::control_channel(), muxtun::DATA, "abcd");
	EXPECT_EQ("DATA 00000000-0000-0000-0000-000000000000 4", strm.str());
}

TEST(FrameErrors, TransportErrorsEndTheConnection)
{
	using namespace muxtun::error;
	EXPECT_TRUE(is_transport_error(make_error_code(malformed_frame)));
	EXPECT_TRUE(is_transport_error(make_error_code(truncated_frame)));
	EXPECT_FALSE(is_transport_error(make_error_code(oversized_payload)));
	EXPECT_FALSE(is_transport_error(make_error_code(unknown_flag)));
	EXPECT_FALSE(is_transport_error(boost::system::error_code()));
	EXPECT_FALSE(is_transport_error(boost::asio::error::connection_reset));
}
