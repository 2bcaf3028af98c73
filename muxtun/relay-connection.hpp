/// \file  relay-connection.hpp
/// \brief One WebSocket connection to the relay
///
/// UNCLASSIFIED
#ifndef MUXTUN_RELAY_CONNECTION_HEAD
#define MUXTUN_RELAY_CONNECTION_HEAD 1

#include <cstddef>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>
#include <boost/asio/io_service.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/system/error_code.hpp>

#include "frame.hpp"
#include "relay-url.hpp"

namespace muxtun {

struct relay_stream_options {
	relay_stream_options()
		: handshake_timeout(boost::posix_time::seconds(30))
		, heartbeat(boost::posix_time::seconds(30))
		, max_message_size(4 * (header_size + max_payload_size))
	{
	}

	/// limit on resolving, connecting and the WebSocket handshake
	boost::posix_time::time_duration handshake_timeout;
	/// idle interval after which a ping is sent; a second silent interval drops the connection
	boost::posix_time::time_duration heartbeat;
	std::size_t max_message_size;
};     // struct relay_stream_options

/// \brief Message-oriented transport to the relay
///
/// The tunnel only needs to connect, exchange whole messages and close.
/// Implementations run their handlers on the io_service they were created
/// with. At most one read and one write may be outstanding at a time.
class relay_connection : private boost::noncopyable {
public:
	typedef boost::system::error_code                                       error_code_type;
	typedef boost::function<void (const error_code_type&)>                  completion_handler;
	typedef boost::function<void (const error_code_type&, const string_type&, bool)> message_handler;

	virtual ~relay_connection() {}

	/// resolve the host, connect, and perform the WebSocket handshake
	virtual void async_connect(const relay_url &url, const completion_handler &handler) = 0;

	/// \note \em data must remain valid until the handler runs
	virtual void async_write(const string_type &data, const bool binary,
							 const completion_handler &handler) = 0;

	/// The handler receives the message and whether it was binary.
	virtual void async_read(const message_handler &handler) = 0;

	/// Close without a closing handshake; outstanding operations fail.
	virtual void close() = 0;
};     // class relay_connection

typedef boost::shared_ptr<relay_connection> relay_connection_pointer;

/// \brief create a plain or TLS connection, depending on the URL scheme
///
/// \em tls is only used for wss:// URLs and must outlive the connection.
relay_connection_pointer make_relay_connection(boost::asio::io_service &service,
											   boost::asio::ssl::context &tls,
											   const relay_url &url,
											   const relay_stream_options &options);

/// A client TLS context that verifies peers against the system trust store.
void configure_client_tls(boost::asio::ssl::context &tls);

}      // namespace muxtun
#endif // MUXTUN_RELAY_CONNECTION_HEAD
