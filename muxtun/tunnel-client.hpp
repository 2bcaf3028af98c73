/// \file  tunnel-client.hpp
/// \brief Keep a tunnel to the relay open, reconnecting with backoff
///
/// UNCLASSIFIED
#ifndef MUXTUN_TUNNEL_CLIENT_HEAD
#define MUXTUN_TUNNEL_CLIENT_HEAD 1

#include <cstddef>

#include <boost/noncopyable.hpp>
#include <boost/function.hpp>
#include <boost/signals2.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/system/error_code.hpp>

#include "backoff.hpp"
#include "client-options.hpp"
#include "relay-connection.hpp"
#include "relay-url.hpp"
#include "session.hpp"

namespace muxtun {

/// \brief The connection supervisor
///
/// Runs one relay_session per connection epoch. Whenever an epoch ends the
/// client waits for the current backoff delay, doubles it, and connects
/// again; the delay drops back to its floor as soon as a frame arrives.
/// Only stop() ends the loop.
///
/// \note Handlers are bound to \em this; destroy the client only once its
///       io_service no longer runs.
class tunnel_client : private boost::noncopyable {
public:
	enum state_type {
		disconnected,
		connecting,
		authenticating,
		active,
		stopped,
	};

	typedef boost::asio::io_service service_type;
	typedef service_type&           service_reference;

	/// creates the transport for each epoch
	typedef boost::function<relay_connection_pointer (const relay_url&)> connector_type;

	typedef boost::signals2::connection                           signal_connection;
	typedef boost::signals2::signal<void (state_type)>            state_signal_t;
	/// carries the number of consecutive epochs without a frame exchanged
	typedef boost::signals2::signal<void (unsigned int)>          auth_failure_signal_t;

	/// \throw std::invalid_argument if the options do not validate
	tunnel_client(service_reference service, const client_options &options);
	tunnel_client(service_reference service, const client_options &options,
				  const connector_type &connector);
	~tunnel_client();

	signal_connection install_state_handler(const state_signal_t::slot_type slot)
	{
		return state_signal_.connect(slot);
	}

	signal_connection install_auth_failure_handler(const auth_failure_signal_t::slot_type slot)
	{
		return auth_failure_signal_.connect(slot);
	}

	void start();

	/// \brief end the retry loop and tear down the current epoch
	///
	/// May be called from any thread; the work is posted to the io_service.
	void stop();

	state_type state() const { return state_; }
	bool stopping() const { return stopping_; }

	/// time units the next failed epoch will wait
	unsigned int current_delay() const { return backoff_.current_delay(); }
	const reconnect_backoff &backoff() const { return backoff_; }

	std::size_t channel_count() const;
	unsigned int silent_epochs() const { return silent_epochs_; }
	const relay_url &url() const { return url_; }
private:
	service_reference         service_;
	client_options            options_;
	relay_url                 url_;
	boost::asio::ssl::context tls_;
	connector_type            connector_;
	boost::asio::deadline_timer timer_;
	reconnect_backoff         backoff_;
	session_pointer           session_;
	state_type                state_;
	bool                      started_;
	bool                      stopping_;
	bool                      reached_active_; // in the current epoch
	unsigned int              silent_epochs_;
	state_signal_t            state_signal_;
	auth_failure_signal_t     auth_failure_signal_;

	void initialize();
	relay_connection_pointer make_connection(const relay_url &url);
	void set_state(const state_type state);

	void connect();
	void handle_session_state(const relay_session::state_type state);
	void handle_exchange();
	void handle_session_closed(const boost::system::error_code &error, const bool exchanged);
	void handle_timer(const boost::system::error_code &error);
	void do_stop();
};     // class tunnel_client

const char *state_name(const tunnel_client::state_type state);

}      // namespace muxtun
#endif // MUXTUN_TUNNEL_CLIENT_HEAD
