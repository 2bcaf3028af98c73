/// \file  tunnel-client.cpp
/// \brief Keep a tunnel to the relay open, reconnecting with backoff
///
/// UNCLASSIFIED
#include "tunnel-client.hpp"

#include <boost/bind.hpp>

#include "log.hpp"

namespace muxtun {

const char *
state_name(const tunnel_client::state_type state)
{
	switch (state) {
	case tunnel_client::disconnected:   return "disconnected";
	case tunnel_client::connecting:     return "connecting";
	case tunnel_client::authenticating: return "authenticating";
	case tunnel_client::active:         return "active";
	case tunnel_client::stopped:        return "stopped";
	}
	return "unknown";
}

tunnel_client::tunnel_client(service_reference service, const client_options &options)
	: service_(service)
	, options_(options)
	, url_()
	, tls_(boost::asio::ssl::context::tls_client)
	, connector_()
	, timer_(service)
	, backoff_(options.backoff_floor, options.backoff_ceiling, options.backoff_unit)
	, session_()
	, state_(disconnected)
	, started_(false)
	, stopping_(false)
	, reached_active_(false)
	, silent_epochs_(0)
	, state_signal_()
	, auth_failure_signal_()
{
	connector_ = boost::bind(&tunnel_client::make_connection, this, _1);
	initialize();
}

tunnel_client::tunnel_client(service_reference service, const client_options &options,
							 const connector_type &connector)
	: service_(service)
	, options_(options)
	, url_()
	, tls_(boost::asio::ssl::context::tls_client)
	, connector_(connector)
	, timer_(service)
	, backoff_(options.backoff_floor, options.backoff_ceiling, options.backoff_unit)
	, session_()
	, state_(disconnected)
	, started_(false)
	, stopping_(false)
	, reached_active_(false)
	, silent_epochs_(0)
	, state_signal_()
	, auth_failure_signal_()
{
	initialize();
}

tunnel_client::~tunnel_client()
{
	boost::system::error_code ignored;
	timer_.cancel(ignored);
	if (session_) {
		session_->stop();
	}
}

void
tunnel_client::initialize()
{
	options_.validate();
	url_ = parse_relay_url(options_.relay_url);
	if (url_.secure) {
		configure_client_tls(tls_);
	}
}

relay_connection_pointer
tunnel_client::make_connection(const relay_url &url)
{
	relay_stream_options stream;
	stream.handshake_timeout = options_.handshake_timeout;
	stream.heartbeat = options_.heartbeat;
	stream.max_message_size = 4 * (header_size + options_.max_payload);
	return make_relay_connection(service_, tls_, url, stream);
}

std::size_t
tunnel_client::channel_count() const
{
	return session_ ? session_->channels().size() : 0;
}

void
tunnel_client::set_state(const state_type state)
{
	if (state_ == state) return;
	log()->debug("tunnel {} -> {}", state_name(state_), state_name(state));
	state_ = state;
	state_signal_(state);
}

void
tunnel_client::start()
{
	if (started_ || stopping_) return;
	started_ = true;
	connect();
}

void
tunnel_client::stop()
{
	service_.post(boost::bind(&tunnel_client::do_stop, this));
}

void
tunnel_client::connect()
{
	using boost::bind;
	reached_active_ = false;
	session_.reset(new relay_session(service_, connector_(url_), options_));
	session_->set_state_function(bind(&tunnel_client::handle_session_state, this, _1));
	session_->set_exchange_function(bind(&tunnel_client::handle_exchange, this));
	session_->set_closed_function(bind(&tunnel_client::handle_session_closed, this, _1, _2));
	session_->start(url_);
}

void
tunnel_client::handle_session_state(const relay_session::state_type state)
{
	switch (state) {
	case relay_session::connecting:
		set_state(connecting);
		break;
	case relay_session::authenticating:
		set_state(authenticating);
		break;
	case relay_session::active:
		reached_active_ = true;
		set_state(active);
		break;
	case relay_session::closed:
		// reported through handle_session_closed
		break;
	}
}

void
tunnel_client::handle_exchange()
{
	backoff_.reset();
	silent_epochs_ = 0;
}

void
tunnel_client::handle_session_closed(const boost::system::error_code &/*error*/, const bool exchanged)
{
	using boost::bind;
	if (stopping_) return;
	set_state(disconnected);

	if (reached_active_ && !exchanged) {
		++silent_epochs_;
		if (silent_epochs_ == options_.auth_failure_threshold) {
			log()->warn("the relay closed {} tunnels in a row before sending anything; "
						"the token is probably rejected", silent_epochs_);
			auth_failure_signal_(silent_epochs_);
		}
	}

	const unsigned int units = backoff_.failure();
	const boost::posix_time::time_duration delay = backoff_.to_duration(units);
	log()->warn("reconnecting in {} ms", delay.total_milliseconds());
	timer_.expires_from_now(delay);
	timer_.async_wait(bind(&tunnel_client::handle_timer, this, boost::asio::placeholders::error));
}

void
tunnel_client::handle_timer(const boost::system::error_code &error)
{
	if (error == boost::asio::error::operation_aborted || stopping_) return;
	if (error) {
		log()->error("reconnect timer failed: {}", error.message());
	}
	connect();
}

void
tunnel_client::do_stop()
{
	if (stopping_) return;
	stopping_ = true;
	log()->info("stopping the tunnel");
	boost::system::error_code ignored;
	timer_.cancel(ignored);
	if (session_) {
		session_->stop();
	}
	set_state(stopped);
}

}      // namespace muxtun
