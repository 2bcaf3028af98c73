/// \file  relay-stream.hpp
/// \brief Map the relay connection onto a Beast WebSocket stream
///
/// UNCLASSIFIED
#ifndef MUXTUN_RELAY_STREAM_HEAD
#define MUXTUN_RELAY_STREAM_HEAD 1

#include <string>
#include <chrono>

#include <boost/enable_shared_from_this.hpp>
#include <boost/bind.hpp>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "relay-connection.hpp"

namespace muxtun {
namespace detail {

inline
std::chrono::steady_clock::duration
to_steady_duration(const boost::posix_time::time_duration &d)
{
	return std::chrono::milliseconds(d.total_milliseconds());
}

inline
void
set_user_agent(boost::beast::websocket::request_type &req)
{
	req.set(boost::beast::http::field::user_agent, "muxtun");
}

/// \brief Relay connection over a WebSocket stream
///
/// NextLayerT is boost::beast::tcp_stream for ws:// and
/// boost::beast::ssl_stream<boost::beast::tcp_stream> for wss://.
template <class NextLayerT>
class basic_relay_stream
	: public relay_connection
	, public boost::enable_shared_from_this<basic_relay_stream<NextLayerT> > {
public:
	typedef NextLayerT                                    next_layer_type;
	typedef boost::beast::websocket::stream<next_layer_type> stream_type;
	typedef boost::asio::io_service                       service_type;
	typedef service_type&                                 service_reference;

	basic_relay_stream(service_reference service, const relay_stream_options &options)
		: resolver_(service)
		, ws_(service)
		, buffer_()
		, url_()
		, options_(options)
		, closed_(false)
	{
	}

	basic_relay_stream(service_reference service, boost::asio::ssl::context &tls,
					   const relay_stream_options &options)
		: resolver_(service)
		, ws_(service, tls)
		, buffer_()
		, url_()
		, options_(options)
		, closed_(false)
	{
	}

	virtual ~basic_relay_stream() {}

	virtual void async_connect(const relay_url &url, const completion_handler &handler)
	{
		using boost::bind;
		url_ = url;
		resolver_.async_resolve(url_.host, url_.port,
								bind(&basic_relay_stream::handle_resolve,
									 this->shared_from_this(),
									 handler,
									 boost::asio::placeholders::error,
									 boost::asio::placeholders::results));
	}

	virtual void async_write(const string_type &data, const bool binary,
							 const completion_handler &handler)
	{
		using boost::bind;
		if (binary) {
			ws_.binary(true);
		} else {
			ws_.text(true);
		}
		ws_.async_write(boost::asio::buffer(data),
						bind(&basic_relay_stream::handle_write,
							 this->shared_from_this(),
							 handler,
							 boost::asio::placeholders::error));
	}

	virtual void async_read(const message_handler &handler)
	{
		using boost::bind;
		ws_.async_read(buffer_,
					   bind(&basic_relay_stream::handle_read,
							this->shared_from_this(),
							handler,
							boost::asio::placeholders::error));
	}

	virtual void close()
	{
		if (closed_) return;
		closed_ = true;
		resolver_.cancel();
		boost::beast::error_code ignored;
		boost::beast::get_lowest_layer(ws_).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
		boost::beast::get_lowest_layer(ws_).close();
	}
private:
	typedef boost::asio::ip::tcp::resolver resolver_type;

	resolver_type        resolver_;
	stream_type          ws_;
	boost::beast::flat_buffer buffer_;
	relay_url            url_;
	relay_stream_options options_;
	bool                 closed_;

	static boost::system::error_code aborted()
	{
		return boost::system::error_code(boost::asio::error::operation_aborted);
	}

	void handle_resolve(const completion_handler handler,
						const boost::system::error_code &error,
						const resolver_type::results_type &results)
	{
		using boost::bind;
		if (error || closed_) {
			handler(error ? error : aborted());
			return;
		}
		boost::beast::get_lowest_layer(ws_).expires_after(to_steady_duration(options_.handshake_timeout));
		boost::beast::get_lowest_layer(ws_)
			.async_connect(results,
						   bind(&basic_relay_stream::handle_connect,
								this->shared_from_this(),
								handler,
								boost::asio::placeholders::error));
	}

	void handle_connect(const completion_handler handler,
						const boost::system::error_code &error)
	{
		if (error || closed_) {
			handler(error ? error : aborted());
			return;
		}
		start_secure_layer(ws_.next_layer(), handler);
	}

	/// ws:// has no layer between TCP and the WebSocket
	void start_secure_layer(boost::beast::tcp_stream &/*stream*/, const completion_handler &handler)
	{
		start_websocket_handshake(handler);
	}

	void start_secure_layer(boost::beast::ssl_stream<boost::beast::tcp_stream> &stream,
							const completion_handler &handler)
	{
		using boost::bind;
		// SNI, so that virtual hosts behind the relay pick the right certificate
		if (!SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str())) {
			handler(boost::system::error_code(static_cast<int>(::ERR_get_error()),
											  boost::asio::error::get_ssl_category()));
			return;
		}
		stream.set_verify_callback(boost::asio::ssl::host_name_verification(url_.host));
		stream.async_handshake(boost::asio::ssl::stream_base::client,
							   bind(&basic_relay_stream::handle_tls_handshake,
									this->shared_from_this(),
									handler,
									boost::asio::placeholders::error));
	}

	void handle_tls_handshake(const completion_handler handler,
							  const boost::system::error_code &error)
	{
		if (error || closed_) {
			handler(error ? error : aborted());
			return;
		}
		start_websocket_handshake(handler);
	}

	void start_websocket_handshake(const completion_handler &handler)
	{
		using boost::bind;
		namespace websocket = boost::beast::websocket;

		// the websocket stream has its own timeouts from here on
		boost::beast::get_lowest_layer(ws_).expires_never();

		websocket::stream_base::timeout opt =
			websocket::stream_base::timeout::suggested(boost::beast::role_type::client);
		opt.handshake_timeout = to_steady_duration(options_.handshake_timeout);
		opt.idle_timeout = to_steady_duration(options_.heartbeat);
		opt.keep_alive_pings = true;
		ws_.set_option(opt);
		ws_.set_option(websocket::stream_base::decorator(&set_user_agent));
		ws_.read_message_max(options_.max_message_size);

		const bool default_port = url_.port == (url_.secure ? "443" : "80");
		const std::string host = default_port ? url_.host : url_.host + ":" + url_.port;
		ws_.async_handshake(host, url_.target,
							bind(&basic_relay_stream::handle_handshake,
								 this->shared_from_this(),
								 handler,
								 boost::asio::placeholders::error));
	}

	void handle_handshake(const completion_handler handler,
						  const boost::system::error_code &error)
	{
		if (!error && closed_) {
			handler(aborted());
			return;
		}
		handler(error);
	}

	void handle_write(const completion_handler handler,
					  const boost::system::error_code &error)
	{
		handler(error);
	}

	void handle_read(const message_handler handler,
					 const boost::system::error_code &error)
	{
		if (error) {
			handler(error, string_type(), false);
			return;
		}
		const string_type message = boost::beast::buffers_to_string(buffer_.data());
		buffer_.consume(buffer_.size());
		handler(error, message, ws_.got_binary());
	}
};     // class basic_relay_stream

}      // namespace detail

typedef detail::basic_relay_stream<boost::beast::tcp_stream>                                plain_relay_stream;
typedef detail::basic_relay_stream<boost::beast::ssl_stream<boost::beast::tcp_stream> >  tls_relay_stream;

}      // namespace muxtun
#endif // MUXTUN_RELAY_STREAM_HEAD
