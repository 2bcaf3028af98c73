/// \file  channel.cpp
/// \brief Bridge one local TCP connection onto the multiplexed stream
///
/// UNCLASSIFIED
#include "channel.hpp"

#include <boost/bind.hpp>

#include "error.hpp"
#include "frame-stream.hpp"
#include "log.hpp"

namespace muxtun {

const char *
state_name(const channel::state_type state)
{
	switch (state) {
	case channel::opening: return "opening";
	case channel::open:    return "open";
	case channel::paused:  return "paused";
	case channel::closing: return "closing";
	case channel::closed:  return "closed";
	}
	return "unknown";
}

channel::channel(service_reference service, const channel_id &id,
				 const std::size_t read_chunk, const flow_control_options &flow)
	: resolver_(service)
	, socket_(service)
	, id_(id)
	, state_(opening)
	, read_buffer_(read_chunk)
	, flow_(flow)
	, write_queue_()
	, queued_bytes_(0)
	, writing_(false)
	, reading_(false)
	, waiting_send_(false)
	, remote_paused_(false)
	, pause_pending_(false)
	, send_()
	, on_closed_()
{
}

channel::~channel()
{
}

void
channel::async_open(const std::string &host, const std::string &port,
					const completion_handler &handler)
{
	using boost::bind;
	resolver_.async_resolve(host, port,
							bind(&channel::handle_resolve,
								 shared_from_this(),
								 handler,
								 boost::asio::placeholders::error,
								 boost::asio::placeholders::results));
}

void
channel::handle_resolve(const completion_handler handler,
						const boost::system::error_code &error,
						const resolver_type::results_type &results)
{
	using boost::bind;
	if (state_ == closed) {
		handler(boost::asio::error::operation_aborted);
		return;
	}
	if (error) {
		state_ = closed;
		handler(error);
		return;
	}
	boost::asio::async_connect(socket_, results,
							   bind(&channel::handle_connect,
									shared_from_this(),
									handler,
									boost::asio::placeholders::error));
}

void
channel::handle_connect(const completion_handler handler,
						const boost::system::error_code &error)
{
	if (state_ == closed) {
		handler(boost::asio::error::operation_aborted);
		return;
	}
	if (error) {
		state_ = closed;
		close_socket();
		handler(error);
		return;
	}
	// a CLOSE that arrived while connecting still lets queued data through
	const bool closing_already = state_ == closing;
	handler(error);
	if (closing_already) {
		if (!write_queue_.empty()) {
			start_write();
		} else {
			close_socket();
		}
		return;
	}
	start();
}

void
channel::start()
{
	if (state_ == opening) {
		state_ = pause_pending_ ? paused : open;
		pause_pending_ = false;
	}
	if (!write_queue_.empty() && !writing_) {
		start_write();
	}
	start_read();
}

void
channel::send(const frame_flag flag, const string_type &payload,
			  const completion_handler &handler)
{
	if (send_) {
		send_(frame(id_, flag, payload), handler);
	}
}

void
channel::start_read()
{
	using boost::bind;
	if (state_ != open || reading_ || waiting_send_) return;
	reading_ = true;
	socket_.async_read_some(boost::asio::buffer(read_buffer_),
							bind(&channel::handle_read,
								 shared_from_this(),
								 boost::asio::placeholders::error,
								 boost::asio::placeholders::bytes_transferred));
}

void
channel::handle_read(const boost::system::error_code &error, const std::size_t bytes_transferred)
{
	using boost::bind;
	reading_ = false;
	if (state_ == closing || state_ == closed) return;
	if (error) {
		if (error == boost::asio::error::eof) {
			log()->debug("channel {} local end closed", muxtun::to_string(id_));
		} else {
			log()->warn("channel {} local read failed: {}", muxtun::to_string(id_), error.message());
		}
		finish(error);
		return;
	}
	// bytes already read are forwarded even if the relay paused us meanwhile
	waiting_send_ = true;
	send(DATA, string_type(read_buffer_.begin(), read_buffer_.begin() + bytes_transferred),
		 bind(&channel::handle_sent, shared_from_this(), boost::asio::placeholders::error));
}

void
channel::handle_sent(const boost::system::error_code &error)
{
	waiting_send_ = false;
	if (error) {
		// the relay connection is gone; its owner tears us down
		return;
	}
	start_read();
}

void
channel::feed_remote(const string_type &payload)
{
	if (state_ == closing || state_ == closed || payload.empty()) return;
	write_queue_.push_back(payload);
	queued_bytes_ += payload.size();

	if (queued_bytes_ > flow_.hard_limit) {
		log()->warn("channel {} has {} bytes queued for the local service; closing",
					muxtun::to_string(id_), queued_bytes_);
		finish(error::make_error_code(error::write_queue_overflow));
		return;
	}
	if (!remote_paused_ && queued_bytes_ > flow_.high_watermark) {
		remote_paused_ = true;
		log()->debug("channel {} asks the relay to pause ({} bytes queued)", muxtun::to_string(id_), queued_bytes_);
		send(PAUSE, string_type(), completion_handler());
	}
	if (state_ != opening && !writing_) {
		start_write();
	}
}

void
channel::start_write()
{
	using boost::bind;
	writing_ = true;
	boost::asio::async_write(socket_, boost::asio::buffer(write_queue_.front()),
							 bind(&channel::handle_write,
								  shared_from_this(),
								  boost::asio::placeholders::error,
								  boost::asio::placeholders::bytes_transferred));
}

void
channel::handle_write(const boost::system::error_code &error, const std::size_t /*bytes_transferred*/)
{
	writing_ = false;
	if (state_ == closed) return;
	if (error) {
		log()->warn("channel {} local write failed: {}", muxtun::to_string(id_), error.message());
		finish(error);
		return;
	}
	queued_bytes_ -= write_queue_.front().size();
	write_queue_.pop_front();

	if (remote_paused_ && queued_bytes_ <= flow_.low_watermark && state_ != closing) {
		remote_paused_ = false;
		log()->debug("channel {} asks the relay to resume", muxtun::to_string(id_));
		send(RESUME, string_type(), completion_handler());
	}
	if (!write_queue_.empty()) {
		start_write();
	} else if (state_ == closing) {
		close_socket();
	}
}

void
channel::pause()
{
	if (state_ == open) {
		state_ = paused;
	} else if (state_ == opening) {
		pause_pending_ = true;
	}
}

void
channel::resume()
{
	if (state_ == paused) {
		state_ = open;
		start_read();
	} else if (state_ == opening) {
		pause_pending_ = false;
	}
}

void
channel::shutdown()
{
	if (state_ == closing || state_ == closed) return;
	const state_type previous = state_;
	state_ = closing;
	send_.clear();
	on_closed_.clear();
	if (previous == opening) {
		// handle_connect drains the queue once connected
		return;
	}
	if (!writing_) {
		close_socket();
	}
}

void
channel::stop()
{
	if (state_ == closed) return;
	state_ = closed;
	send_.clear();
	on_closed_.clear();
	resolver_.cancel();
	// an outstanding async_write still refers to the front buffer
	if (!writing_) {
		write_queue_.clear();
	}
	queued_bytes_ = 0;
	boost::system::error_code ignored;
	socket_.shutdown(socket_type::shutdown_both, ignored);
	socket_.close(ignored);
}

void
channel::finish(const boost::system::error_code &reason)
{
	log()->debug("channel {} finished: {}", muxtun::to_string(id_), reason.message());
	send(CLOSE, string_type(), completion_handler());
	const closed_function notify = on_closed_;
	stop();
	if (notify) {
		notify(id_, shared_from_this());
	}
}

void
channel::close_socket()
{
	state_ = closed;
	write_queue_.clear();
	queued_bytes_ = 0;
	boost::system::error_code ignored;
	socket_.shutdown(socket_type::shutdown_send, ignored);
	socket_.close(ignored);
}

}      // namespace muxtun
