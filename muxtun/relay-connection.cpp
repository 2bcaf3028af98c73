/// \file  relay-connection.cpp
/// \brief One WebSocket connection to the relay
///
/// UNCLASSIFIED
#include "relay-connection.hpp"
#include "relay-stream.hpp"

namespace muxtun {

relay_connection_pointer
make_relay_connection(boost::asio::io_service &service,
					  boost::asio::ssl::context &tls,
					  const relay_url &url,
					  const relay_stream_options &options)
{
	if (url.secure) {
		return relay_connection_pointer(new tls_relay_stream(service, tls, options));
	}
	return relay_connection_pointer(new plain_relay_stream(service, options));
}

void
configure_client_tls(boost::asio::ssl::context &tls)
{
	tls.set_options(boost::asio::ssl::context::default_workarounds
					| boost::asio::ssl::context::no_sslv2
					| boost::asio::ssl::context::no_sslv3
					| boost::asio::ssl::context::no_tlsv1
					| boost::asio::ssl::context::no_tlsv1_1);
	tls.set_default_verify_paths();
	tls.set_verify_mode(boost::asio::ssl::verify_peer);
}

}      // namespace muxtun
