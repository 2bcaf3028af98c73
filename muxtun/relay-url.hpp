/// \file  relay-url.hpp
/// \brief ws:// and wss:// relay addresses
///
/// UNCLASSIFIED
#ifndef MUXTUN_RELAY_URL_HEAD
#define MUXTUN_RELAY_URL_HEAD 1

#include <string>
#include <boost/system/error_code.hpp>

namespace muxtun {

struct relay_url {
	relay_url()
		: secure(false)
		, host()
		, port()
		, target("/")
	{
	}

	bool        secure; ///< wss://
	std::string host;
	std::string port;   ///< numeric service; defaults to 80 or 443
	std::string target; ///< path and query sent in the handshake

	std::string str() const;
};     // struct relay_url

relay_url parse_relay_url(const std::string &text, boost::system::error_code &ec);

/// \throw boost::system::system_error with error::invalid_url
relay_url parse_relay_url(const std::string &text);

/// The cloud API endpoint used when none is configured.
const std::string &default_api_endpoint();

/// \brief tunnel address for a cloud API endpoint
///
/// https://api.example.cloud -> wss://tun.example.cloud/ws/tunnel
///
/// The first label of the endpoint host is dropped when the host has more
/// than two labels. An endpoint without a usable host maps to the default
/// cloud domain.
std::string derive_tunnel_url(const std::string &api_endpoint);

}      // namespace muxtun
#endif // MUXTUN_RELAY_URL_HEAD
