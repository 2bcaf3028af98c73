/// \file  session.hpp
/// \brief One connection epoch: the relay socket and the channels riding on it
///
/// UNCLASSIFIED
#ifndef MUXTUN_SESSION_HEAD
#define MUXTUN_SESSION_HEAD 1

#include <cstddef>
#include <deque>
#include <set>
#include <string>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/asio/io_service.hpp>
#include <boost/system/error_code.hpp>

#include "frame.hpp"
#include "channel.hpp"
#include "channel-registry.hpp"
#include "client-options.hpp"
#include "relay-connection.hpp"
#include "relay-url.hpp"

namespace muxtun {

/// \brief Drive a single relay connection from handshake to close
///
/// The session connects, sends the bearer credential as the first (text)
/// message, and then dispatches every inbound frame. It owns the only
/// writer of the connection: frames from the dispatcher and from every
/// channel pump are queued and written one at a time, whole.
///
/// A session is used once. When the connection fails the channels are
/// stopped, the registry is cleared and the closed function runs; a new
/// epoch needs a new session.
class relay_session
	: public boost::enable_shared_from_this<relay_session>
	, private boost::noncopyable {
public:
	enum state_type {
		connecting,
		authenticating,
		active,
		closed,
	};

	typedef boost::system::error_code                      error_code_type;
	typedef boost::function<void (const error_code_type&)> completion_handler;
	typedef boost::function<void (state_type)>             state_function;
	/// runs once, on the first frame received from the relay
	typedef boost::function<void ()>                       exchange_function;
	/// the epoch ended; the flag tells whether any frame was exchanged
	typedef boost::function<void (const error_code_type&, bool)> closed_function;

	typedef boost::asio::io_service service_type;
	typedef service_type&           service_reference;

	relay_session(service_reference service,
				  const relay_connection_pointer &connection,
				  const client_options &options);
	~relay_session();

	void set_state_function(const state_function &fn) { on_state_ = fn; }
	void set_exchange_function(const exchange_function &fn) { on_exchange_ = fn; }
	void set_closed_function(const closed_function &fn) { on_closed_ = fn; }

	void start(const relay_url &url);

	/// \brief end the epoch without reporting it
	///
	/// Closes the connection and stops every channel. Idempotent.
	void stop();

	/// \brief queue a frame for the relay
	///
	/// The handler, which may be empty, runs after the frame was written.
	/// Once the epoch has ended it gets error::not_connected.
	void send_frame(const frame &aFrame, const completion_handler &handler);

	state_type state() const { return state_; }
	bool exchanged() const { return exchanged_; }
	const channel_registry &channels() const { return registry_; }
	/// channels closed by the relay that are still flushing to the local socket
	std::size_t draining_count() const;
private:
	struct outbound_message {
		string_type        data;
		bool               binary;
		completion_handler handler;
	};     // struct outbound_message

	typedef std::deque<outbound_message> write_queue_type;
	typedef std::set<channel_pointer>    channel_set;

	service_reference        service_;
	relay_connection_pointer connection_;
	client_options           options_;
	std::string              local_port_;
	state_type               state_;
	bool                     exchanged_;
	bool                     writing_;
	write_queue_type         write_queue_;
	channel_registry         registry_;
	channel_set              draining_; // closed by the relay, still writing locally
	state_function           on_state_;
	exchange_function        on_exchange_;
	closed_function          on_closed_;

	void set_state(const state_type state);
	void enqueue(const string_type &data, const bool binary, const completion_handler &handler);
	void start_write();

	void handle_connect(const boost::system::error_code &error);
	void handle_authenticated(const boost::system::error_code &error);
	void start_read();
	void handle_read(const boost::system::error_code &error,
					 const string_type &message, const bool binary);
	void handle_write(const boost::system::error_code &error);

	/// \return false once the epoch ended inside a handler
	bool dispatch_message(const string_type &message);
	void dispatch(const frame &aFrame);
	void open_channel(const channel_id &id);
	void handle_channel_open(const channel_pointer chan, const boost::system::error_code &error);
	void handle_channel_closed(const channel_id &id, const channel_pointer &chan);
	void drain_channel(const channel_pointer &chan);

	void end(const boost::system::error_code &error, const bool report);
};     // class relay_session

typedef boost::shared_ptr<relay_session> session_pointer;

const char *state_name(const relay_session::state_type state);

}      // namespace muxtun
#endif // MUXTUN_SESSION_HEAD
