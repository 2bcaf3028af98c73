/// \file  session.cpp
/// \brief One connection epoch: the relay socket and the channels riding on it
///
/// UNCLASSIFIED
#include "session.hpp"

#include <vector>
#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>

#include "error.hpp"
#include "frame-codec.hpp"
#include "frame-stream.hpp"
#include "log.hpp"

namespace muxtun {

const char *
state_name(const relay_session::state_type state)
{
	switch (state) {
	case relay_session::connecting:     return "connecting";
	case relay_session::authenticating: return "authenticating";
	case relay_session::active:         return "active";
	case relay_session::closed:         return "closed";
	}
	return "unknown";
}

relay_session::relay_session(service_reference service,
							 const relay_connection_pointer &connection,
							 const client_options &options)
	: service_(service)
	, connection_(connection)
	, options_(options)
	, local_port_(boost::lexical_cast<std::string>(options.local_port))
	, state_(connecting)
	, exchanged_(false)
	, writing_(false)
	, write_queue_()
	, registry_()
	, draining_()
	, on_state_()
	, on_exchange_()
	, on_closed_()
{
}

relay_session::~relay_session()
{
}

void
relay_session::set_state(const state_type state)
{
	state_ = state;
	if (on_state_) {
		on_state_(state);
	}
}

void
relay_session::start(const relay_url &url)
{
	using boost::bind;
	log()->info("connecting to {}", url.str());
	set_state(connecting);
	connection_->async_connect(url,
							   bind(&relay_session::handle_connect,
									shared_from_this(),
									boost::asio::placeholders::error));
}

void
relay_session::handle_connect(const boost::system::error_code &error)
{
	using boost::bind;
	if (state_ == closed) return;
	if (error) {
		end(error, true);
		return;
	}
	set_state(authenticating);
	// the credential always goes first, as a text message
	enqueue(options_.token, false,
			bind(&relay_session::handle_authenticated,
				 shared_from_this(),
				 boost::asio::placeholders::error));
}

void
relay_session::handle_authenticated(const boost::system::error_code &error)
{
	if (state_ == closed || error) return;
	log()->info("tunnel established");
	set_state(active);
	start_read();
}

void
relay_session::start_read()
{
	using boost::bind;
	connection_->async_read(bind(&relay_session::handle_read,
								 shared_from_this(),
								 _1, _2, _3));
}

void
relay_session::handle_read(const boost::system::error_code &error,
						   const string_type &message, const bool binary)
{
	if (state_ == closed) return;
	if (error) {
		end(error, true);
		return;
	}
	if (!binary) {
		log()->debug("ignoring a text message of {} bytes from the relay", message.size());
	} else if (!dispatch_message(message)) {
		return;
	}
	start_read();
}

bool
relay_session::dispatch_message(const string_type &message)
{
	const char *first = message.data();
	const char *const last = first + message.size();
	while (first != last) {
		frame current;
		boost::system::error_code ec;
		const std::size_t consumed = decode_frame(first, last, current, ec, options_.max_payload);
		if (error::is_transport_error(ec)) {
			log()->warn("bad frame from the relay: {}", ec.message());
			end(ec, true);
			return false;
		}
		if (ec == error::unknown_flag) {
			frame_header header;
			parse_header(first, last, header);
			log()->warn("dropping a frame with unknown flag {} for channel {}",
						flag_name(header.flag), muxtun::to_string(header.channel));
			first += consumed;
			continue;
		}
		if (ec == error::oversized_payload) {
			// the declared size cannot be trusted, so nothing after it can be framed
			log()->warn("channel {} sent an oversized frame; closing it", muxtun::to_string(current.channel));
			const channel_pointer chan = registry_.erase(current.channel);
			if (chan) {
				chan->stop();
			}
			send_frame(frame(current.channel, CLOSE), completion_handler());
			return true;
		}
		if (ec) {
			log()->error("cannot decode frames from the relay: {}", ec.message());
			end(ec, true);
			return false;
		}
		first += consumed;
		if (!exchanged_) {
			exchanged_ = true;
			if (on_exchange_) {
				on_exchange_();
			}
		}
		dispatch(current);
		if (state_ == closed) return false;
	}
	return true;
}

void
relay_session::dispatch(const frame &aFrame)
{
	if (log()->should_log(spdlog::level::trace)) {
		log()->trace("received {}", boost::lexical_cast<std::string>(aFrame));
	}
	channel_pointer chan;
	switch (aFrame.flag) {
	case NEW:
		open_channel(aFrame.channel);
		break;
	case DATA:
		chan = registry_.find(aFrame.channel);
		if (chan) {
			chan->feed_remote(aFrame.payload);
		} else {
			log()->debug("DATA for unknown channel {}", muxtun::to_string(aFrame.channel));
		}
		break;
	case CLOSE:
		chan = registry_.erase(aFrame.channel);
		if (chan) {
			log()->info("channel {} closed by the relay", muxtun::to_string(aFrame.channel));
			drain_channel(chan);
		} else {
			log()->debug("CLOSE for unknown channel {}", muxtun::to_string(aFrame.channel));
		}
		break;
	case PAUSE:
		chan = registry_.find(aFrame.channel);
		if (chan) {
			chan->pause();
		} else {
			log()->debug("PAUSE for unknown channel {}", muxtun::to_string(aFrame.channel));
		}
		break;
	case RESUME:
		chan = registry_.find(aFrame.channel);
		if (chan) {
			chan->resume();
		} else {
			log()->debug("RESUME for unknown channel {}", muxtun::to_string(aFrame.channel));
		}
		break;
	case PING:
		send_frame(frame(control_channel(), PONG), completion_handler());
		break;
	case PONG:
		log()->debug("PONG from the relay");
		break;
	}
}

void
relay_session::open_channel(const channel_id &id)
{
	using boost::bind;
	const channel_pointer chan(new channel(service_, id, options_.read_chunk, options_.flow));
	chan->set_send_function(bind(&relay_session::send_frame, shared_from_this(), _1, _2));
	chan->set_closed_function(bind(&relay_session::handle_channel_closed, shared_from_this(), _1, _2));

	const channel_pointer replaced = registry_.insert(chan);
	if (replaced) {
		log()->info("channel {} reused by the relay; dropping the old connection", muxtun::to_string(id));
		replaced->stop();
	}
	chan->async_open(options_.local_host, local_port_,
					 bind(&relay_session::handle_channel_open,
						  shared_from_this(),
						  chan,
						  boost::asio::placeholders::error));
}

void
relay_session::handle_channel_open(const channel_pointer chan, const boost::system::error_code &error)
{
	if (!error) {
		log()->info("channel {} connected to {}:{}", muxtun::to_string(chan->id()),
					options_.local_host, options_.local_port);
		return;
	}
	if (error == boost::asio::error::operation_aborted) return;
	log()->error("channel {} cannot reach {}:{}: {}", muxtun::to_string(chan->id()),
				 options_.local_host, options_.local_port, error.message());
	// only the registered instance answers; a CLOSE from the relay already removed it otherwise
	if (registry_.erase(chan->id(), chan)) {
		send_frame(frame(chan->id(), CLOSE), completion_handler());
	}
}

void
relay_session::handle_channel_closed(const channel_id &id, const channel_pointer &chan)
{
	if (registry_.erase(id, chan)) {
		log()->info("channel {} closed locally", muxtun::to_string(id));
	}
}

void
relay_session::drain_channel(const channel_pointer &chan)
{
	for (channel_set::iterator i = draining_.begin(); i != draining_.end(); ) {
		if ((*i)->state() == channel::closed) {
			draining_.erase(i++);
		} else {
			++i;
		}
	}
	chan->shutdown();
	if (chan->state() != channel::closed) {
		draining_.insert(chan);
	}
}

std::size_t
relay_session::draining_count() const
{
	std::size_t count = 0;
	for (channel_set::const_iterator i = draining_.begin(); i != draining_.end(); ++i) {
		if ((*i)->state() != channel::closed) {
			++count;
		}
	}
	return count;
}

void
relay_session::send_frame(const frame &aFrame, const completion_handler &handler)
{
	if (state_ == closed) {
		if (handler) {
			service_.post(boost::bind(handler, error::make_error_code(error::not_connected)));
		}
		return;
	}
	boost::system::error_code ec;
	const string_type data = encode_frame(aFrame.channel, aFrame.flag, aFrame.payload, ec,
										  options_.max_payload);
	if (ec) {
		log()->warn("cannot send {}: {}", boost::lexical_cast<std::string>(aFrame), ec.message());
		if (handler) {
			service_.post(boost::bind(handler, ec));
		}
		return;
	}
	enqueue(data, true, handler);
}

void
relay_session::enqueue(const string_type &data, const bool binary, const completion_handler &handler)
{
	outbound_message message;
	message.data = data;
	message.binary = binary;
	message.handler = handler;
	write_queue_.push_back(message);
	if (!writing_) {
		start_write();
	}
}

void
relay_session::start_write()
{
	using boost::bind;
	writing_ = true;
	const outbound_message &next = write_queue_.front();
	connection_->async_write(next.data, next.binary,
							 bind(&relay_session::handle_write,
								  shared_from_this(),
								  boost::asio::placeholders::error));
}

void
relay_session::handle_write(const boost::system::error_code &error)
{
	writing_ = false;
	const completion_handler handler = write_queue_.front().handler;
	write_queue_.pop_front();
	if (state_ == closed) return;
	if (error) {
		if (handler) {
			handler(error);
		}
		end(error, true);
		return;
	}
	if (handler) {
		handler(error);
	}
	if (state_ != closed && !writing_ && !write_queue_.empty()) {
		start_write();
	}
}

void
relay_session::stop()
{
	end(boost::asio::error::operation_aborted, false);
}

void
relay_session::end(const boost::system::error_code &error, const bool report)
{
	if (state_ == closed) return;
	const bool was_active = state_ == active;
	set_state(closed);
	if (report) {
		if (was_active) {
			log()->warn("tunnel lost: {}", error.message());
		} else {
			log()->warn("cannot establish the tunnel: {}", error.message());
		}
	}

	registry_.stop_all();
	channel_set draining;
	draining.swap(draining_);
	for (channel_set::iterator i = draining.begin(); i != draining.end(); ++i) {
		(*i)->stop();
	}
	connection_->close();

	// the message being written must outlive the write; the rest fail now
	std::vector<completion_handler> pending;
	for (write_queue_type::iterator i = write_queue_.begin(); i != write_queue_.end(); ++i) {
		if (i->handler) {
			pending.push_back(i->handler);
			i->handler.clear();
		}
	}
	if (writing_) {
		write_queue_.erase(write_queue_.begin() + 1, write_queue_.end());
	} else {
		write_queue_.clear();
	}
	const boost::system::error_code not_connected = error::make_error_code(error::not_connected);
	for (std::vector<completion_handler>::const_iterator i = pending.begin(); i != pending.end(); ++i) {
		service_.post(boost::bind(*i, not_connected));
	}

	const closed_function notify = on_closed_;
	on_state_.clear();
	on_exchange_.clear();
	on_closed_.clear();
	if (report && notify) {
		notify(error, exchanged_);
	}
}

}      // namespace muxtun
