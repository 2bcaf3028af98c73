/// \file test-channel.cpp
///
/// UNCLASSIFIED
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <boost/array.hpp>
#include <boost/bind.hpp>
#include <boost/asio.hpp>
#include <boost/date_time.hpp>
#include <boost/function.hpp>
#include <boost/lexical_cast.hpp>

#include "muxtun/channel.hpp"
#include "muxtun/frame.hpp"

using muxtun::channel;
using muxtun::channel_id;
using muxtun::channel_pointer;
using muxtun::frame;

///////////////////////////////////////////////////////////////////////////////
// Bridge a channel to a loopback "local service"
///////////////////////////////////////////////////////////////////////////////
class ChannelBridge : public testing::Test {
public:
	typedef boost::function<bool ()> predicate;

	ChannelBridge()
		: testing::Test()
		, service()
		, acceptor(service)
		, server(service)
		, chan()
		, id(muxtun::control_channel())
		, sent()
		, accepted(false)
		, open_done(false)
		, open_error()
		, received()
		, server_eof(false)
		, server_buffer()
		, closed_count(0)
	{
		for (std::size_t i = 0; i < id.size(); ++i) {
			id.data[i] = static_cast<unsigned char>(0xa0 + i);
		}
	}

	virtual void SetUp()
	{
		using namespace boost::asio::ip;
		using boost::bind;
		tcp::endpoint ep(address::from_string("127.0.0.1"), 0);
		acceptor.open(ep.protocol());
		acceptor.set_option(tcp::socket::reuse_address(true));
		acceptor.bind(ep);
		acceptor.listen(1);
		acceptor.async_accept(server,
							  bind(&ChannelBridge::handle_accept,
								   this,
								   boost::asio::placeholders::error));
	}

	virtual void TearDown()
	{
		if (chan) {
			chan->stop();
		}
		boost::system::error_code error;
		server.close(error);
		acceptor.close(error);
		service.poll();
	}

	boost::asio::io_service        service;
	boost::asio::ip::tcp::acceptor acceptor;
	boost::asio::ip::tcp::socket   server;
	channel_pointer                chan;
	channel_id                     id;
	std::vector<frame>             sent;
	bool                           accepted;
	bool                           open_done;
	boost::system::error_code      open_error;
	std::string                    received;
	bool                           server_eof;
	boost::array<char, 1024>       server_buffer;
	int                            closed_count;

	std::string port() const
	{
		return boost::lexical_cast<std::string>(acceptor.local_endpoint().port());
	}

	void make_channel(const muxtun::flow_control_options &flow = muxtun::flow_control_options())
	{
		using boost::bind;
		chan.reset(new channel(service, id, 4096, flow));
		chan->set_send_function(bind(&ChannelBridge::record_frame, this, _1, _2));
		chan->set_closed_function(bind(&ChannelBridge::channel_closed, this, _1, _2));
	}

	void open(const std::string &target_port)
	{
		using boost::bind;
		chan->async_open("127.0.0.1", target_port,
						 bind(&ChannelBridge::handle_open, this, boost::asio::placeholders::error));
	}

	void open_and_wait()
	{
		make_channel();
		open(port());
		ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::is_connected, this)));
		ASSERT_FALSE(open_error);
	}

	bool run_until(const predicate &done)
	{
		const boost::posix_time::ptime start = boost::posix_time::microsec_clock::local_time();
		boost::posix_time::ptime now = start;
		while (!done() && (now - start) < boost::posix_time::seconds(5)) {
			service.poll();
			service.reset();
			now = boost::posix_time::microsec_clock::local_time();
		}
		return done();
	}

	void run_for(const boost::posix_time::time_duration &span)
	{
		const boost::posix_time::ptime start = boost::posix_time::microsec_clock::local_time();
		while (boost::posix_time::microsec_clock::local_time() - start < span) {
			service.poll();
			service.reset();
		}
	}

	bool is_connected() const { return accepted && open_done; }
	bool is_open_done() const { return open_done; }
	bool is_server_eof() const { return server_eof; }
	bool sent_at_least(const std::size_t n) const { return sent.size() >= n; }
	bool received_at_least(const std::size_t n) const { return received.size() >= n; }

	void record_frame(const frame &aFrame, const channel::completion_handler &handler)
	{
		sent.push_back(aFrame);
		if (handler) {
			service.post(boost::bind(handler, boost::system::error_code()));
		}
	}

	void channel_closed(const channel_id &which, const channel_pointer &ptr)
	{
		EXPECT_EQ(id, which);
		EXPECT_EQ(chan, ptr);
		++closed_count;
	}

	void handle_accept(const boost::system::error_code &error)
	{
		if (!error) {
			accepted = true;
			start_server_read();
		}
	}

	void handle_open(const boost::system::error_code &error)
	{
		open_done = true;
		open_error = error;
	}

	void start_server_read()
	{
		using boost::bind;
		server.async_read_some(boost::asio::buffer(server_buffer),
							   bind(&ChannelBridge::handle_server_read,
									this,
									boost::asio::placeholders::error,
									boost::asio::placeholders::bytes_transferred));
	}

	void handle_server_read(const boost::system::error_code &error, const std::size_t bytes_transferred)
	{
		if (error) {
			server_eof = true;
			return;
		}
		received.append(server_buffer.data(), bytes_transferred);
		start_server_read();
	}
};

TEST_F(ChannelBridge, Opens)
{
	open_and_wait();
	EXPECT_EQ(channel::open, chan->state());
	EXPECT_TRUE(sent.empty());
}

TEST_F(ChannelBridge, UnreachableTarget)
{
	boost::asio::ip::tcp::acceptor unused(service,
										  boost::asio::ip::tcp::endpoint(
											  boost::asio::ip::address::from_string("127.0.0.1"), 0));
	const std::string dead_port = boost::lexical_cast<std::string>(unused.local_endpoint().port());
	unused.close();

	make_channel();
	open(dead_port);
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::is_open_done, this)));
	EXPECT_TRUE(open_error);
	EXPECT_EQ(channel::closed, chan->state());
	EXPECT_TRUE(sent.empty());
	EXPECT_EQ(0, closed_count);
}

TEST_F(ChannelBridge, RemoteBytesReachLocalSocketInOrder)
{
	open_and_wait();
	chan->feed_remote("x");
	chan->feed_remote("y");
	chan->feed_remote("zz");
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::received_at_least, this, 4)));
	EXPECT_EQ("xyzz", received);
	EXPECT_EQ(0u, chan->queued_bytes());
}

TEST_F(ChannelBridge, LocalBytesBecomeDataFrames)
{
	open_and_wait();
	boost::asio::write(server, boost::asio::buffer(std::string("hello")));
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::sent_at_least, this, 1)));
	EXPECT_EQ(frame(id, muxtun::DATA, "hello"), sent[0]);
}

TEST_F(ChannelBridge, LocalEndSendsClose)
{
	open_and_wait();
	server.shutdown(boost::asio::ip::tcp::socket::shutdown_send);
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::sent_at_least, this, 1)));
	EXPECT_EQ(frame(id, muxtun::CLOSE), sent[0]);
	EXPECT_EQ(1, closed_count);
	EXPECT_EQ(channel::closed, chan->state());

	// further remote bytes are ignored once closed
	chan->feed_remote("late");
	chan->shutdown();
	chan->stop();
	run_for(boost::posix_time::milliseconds(50));
	EXPECT_EQ(1u, sent.size());
}

TEST_F(ChannelBridge, PauseSuspendsReadingUntilResume)
{
	open_and_wait();
	chan->pause();
	EXPECT_EQ(channel::paused, chan->state());

	// the read already in progress still completes
	boost::asio::write(server, boost::asio::buffer(std::string("one")));
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::sent_at_least, this, 1)));
	EXPECT_EQ("one", sent[0].payload);

	boost::asio::write(server, boost::asio::buffer(std::string("two")));
	run_for(boost::posix_time::milliseconds(200));
	EXPECT_EQ(1u, sent.size());

	chan->resume();
	EXPECT_EQ(channel::open, chan->state());
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::sent_at_least, this, 2)));
	EXPECT_EQ("two", sent[1].payload);
	EXPECT_EQ(2u, sent.size());
}

TEST_F(ChannelBridge, ShutdownDrainsQueuedBytes)
{
	open_and_wait();
	chan->feed_remote("abc");
	chan->shutdown();
	chan->shutdown();
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::is_server_eof, this)));
	EXPECT_EQ("abc", received);
	EXPECT_EQ(channel::closed, chan->state());
	EXPECT_TRUE(sent.empty());
	EXPECT_EQ(0, closed_count);
}

TEST_F(ChannelBridge, ShutdownWhileOpening)
{
	make_channel();
	open(port());
	chan->feed_remote("early");
	chan->shutdown();
	EXPECT_EQ(channel::closing, chan->state());
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::is_server_eof, this)));
	EXPECT_EQ("early", received);
	EXPECT_FALSE(open_error);
	EXPECT_EQ(channel::closed, chan->state());
}

TEST_F(ChannelBridge, StopIsImmediateAndSilent)
{
	open_and_wait();
	chan->stop();
	chan->stop();
	EXPECT_EQ(channel::closed, chan->state());
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::is_server_eof, this)));
	EXPECT_TRUE(sent.empty());
	EXPECT_EQ(0, closed_count);
}

TEST_F(ChannelBridge, BacklogPausesAndResumesTheRelay)
{
	muxtun::flow_control_options flow;
	flow.high_watermark = 8;
	flow.low_watermark = 2;
	flow.hard_limit = 1024;
	make_channel(flow);
	open(port());

	// nothing is written before the connection is up, so the queue grows
	chan->feed_remote("0123456789");
	EXPECT_TRUE(chan->remote_paused());
	ASSERT_EQ(1u, sent.size());
	EXPECT_EQ(frame(id, muxtun::PAUSE), sent[0]);

	chan->feed_remote("ab");
	EXPECT_EQ(1u, sent.size());

	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::received_at_least, this, 12)));
	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::sent_at_least, this, 2)));
	EXPECT_EQ(frame(id, muxtun::RESUME), sent[1]);
	EXPECT_FALSE(chan->remote_paused());
	EXPECT_EQ("0123456789ab", received);
}

TEST_F(ChannelBridge, BacklogOverflowClosesTheChannel)
{
	muxtun::flow_control_options flow;
	flow.high_watermark = 4;
	flow.low_watermark = 2;
	flow.hard_limit = 8;
	make_channel(flow);
	open(port());

	chan->feed_remote("12345");
	chan->feed_remote("6789");
	ASSERT_EQ(2u, sent.size());
	EXPECT_EQ(frame(id, muxtun::PAUSE), sent[0]);
	EXPECT_EQ(frame(id, muxtun::CLOSE), sent[1]);
	EXPECT_EQ(1, closed_count);
	EXPECT_EQ(channel::closed, chan->state());

	ASSERT_TRUE(run_until(boost::bind(&ChannelBridge::is_open_done, this)));
	EXPECT_EQ(boost::asio::error::operation_aborted, open_error);
}
