/// \file  channel.hpp
/// \brief Bridge one local TCP connection onto the multiplexed stream
///
/// UNCLASSIFIED
#ifndef MUXTUN_CHANNEL_HEAD
#define MUXTUN_CHANNEL_HEAD 1

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "frame.hpp"
#include "client-options.hpp"

namespace muxtun {

/// \brief One logical byte stream
///
/// A channel owns its local socket. Bytes from the relay are queued with
/// feed_remote and written in order; bytes read from the local socket are
/// handed to the send function one chunk at a time, and the next read is
/// only started once the previous chunk was written to the relay.
///
/// All member functions must be called from the thread running the
/// io_service.
class channel
	: public boost::enable_shared_from_this<channel>
	, private boost::noncopyable {
public:
	enum state_type {
		opening, ///< connecting to the local service
		open,
		paused,  ///< the relay asked us to stop reading
		closing, ///< draining queued writes before the local socket is closed
		closed,
	};

	typedef boost::system::error_code                      error_code_type;
	typedef boost::function<void (const error_code_type&)> completion_handler;
	/// Queue a frame for the relay. The handler, which may be empty, runs once
	/// the frame was written or the connection failed.
	typedef boost::function<void (const frame&, const completion_handler&)> send_function;
	/// The channel ended by itself (local EOF, local error, overflow).
	typedef boost::function<void (const channel_id&, const boost::shared_ptr<channel>&)> closed_function;

	typedef boost::asio::io_service   service_type;
	typedef service_type&             service_reference;
	typedef boost::asio::ip::tcp::socket socket_type;

	channel(service_reference service, const channel_id &id,
			const std::size_t read_chunk, const flow_control_options &flow);
	~channel();

	void set_send_function(const send_function &fn) { send_ = fn; }
	void set_closed_function(const closed_function &fn) { on_closed_ = fn; }

	const channel_id &id() const { return id_; }
	state_type state() const { return state_; }

	/// bytes accepted from the relay and not yet written to the local socket
	std::size_t queued_bytes() const { return queued_bytes_; }

	/// true while this side has asked the relay to PAUSE
	bool remote_paused() const { return remote_paused_; }

	socket_type &socket() { return socket_; }

	/// \brief resolve and connect to the local service, then start pumping
	///
	/// The handler gets operation_aborted if the channel was stopped while
	/// connecting. Data fed in the meantime is written once connected.
	void async_open(const std::string &host, const std::string &port,
					const completion_handler &handler);

	/// \brief start pumping an already connected socket
	void start();

	/// Queue bytes from the relay; ignored once the channel is closing.
	void feed_remote(const string_type &payload);

	/// Stop reading the local socket. A PAUSE received while connecting
	/// takes effect once connected.
	void pause();
	void resume();

	/// \brief the relay is done with this channel
	///
	/// Queued bytes are written first, then the write side is shut down and
	/// the socket closed. Idempotent.
	void shutdown();

	/// \brief close the local socket now, discarding queued bytes
	///
	/// Does not notify the relay or the closed function. Idempotent.
	void stop();
private:
	typedef boost::asio::ip::tcp::resolver resolver_type;
	typedef std::deque<string_type>        write_queue_type;

	resolver_type        resolver_;
	socket_type          socket_;
	channel_id           id_;
	state_type           state_;
	std::vector<char>    read_buffer_;
	flow_control_options flow_;
	write_queue_type     write_queue_;
	std::size_t          queued_bytes_;
	bool                 writing_;
	bool                 reading_;       // async_read_some outstanding
	bool                 waiting_send_;  // last chunk not yet written to the relay
	bool                 remote_paused_; // PAUSE sent, RESUME not yet
	bool                 pause_pending_; // PAUSE received while connecting
	send_function        send_;
	closed_function      on_closed_;

	void send(const frame_flag flag, const string_type &payload,
			  const completion_handler &handler);

	void handle_resolve(const completion_handler handler,
						const boost::system::error_code &error,
						const resolver_type::results_type &results);
	void handle_connect(const completion_handler handler,
						const boost::system::error_code &error);

	void start_read();
	void handle_read(const boost::system::error_code &error, const std::size_t bytes_transferred);
	void handle_sent(const boost::system::error_code &error);

	void start_write();
	void handle_write(const boost::system::error_code &error, const std::size_t bytes_transferred);

	/// report the end of the channel to the relay and the registry, then stop
	void finish(const boost::system::error_code &reason);
	void close_socket();
};     // class channel

typedef boost::shared_ptr<channel> channel_pointer;

const char *state_name(const channel::state_type state);

}      // namespace muxtun
#endif // MUXTUN_CHANNEL_HEAD
