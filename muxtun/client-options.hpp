/// \file  client-options.hpp
/// \brief Tunnel client configuration
///
/// UNCLASSIFIED
#ifndef MUXTUN_CLIENT_OPTIONS_HEAD
#define MUXTUN_CLIENT_OPTIONS_HEAD 1

#include <cstddef>
#include <iosfwd>
#include <string>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace muxtun {

/// Watermarks for the bytes queued towards one channel's local socket.
struct flow_control_options {
	flow_control_options()
		: high_watermark(256u * 1024u)
		, low_watermark(64u * 1024u)
		, hard_limit(4u * 1024u * 1024u)
	{
	}

	std::size_t high_watermark; ///< send PAUSE to the relay above this
	std::size_t low_watermark;  ///< send RESUME once drained below this
	std::size_t hard_limit;     ///< close the channel above this
};     // struct flow_control_options

struct client_options {
	client_options();

	std::string relay_url;
	std::string token;
	std::string local_host;
	unsigned short local_port;

	std::size_t max_payload;
	std::size_t read_chunk;

	unsigned int backoff_floor;
	unsigned int backoff_ceiling;
	boost::posix_time::time_duration backoff_unit;

	boost::posix_time::time_duration handshake_timeout;
	boost::posix_time::time_duration heartbeat;

	flow_control_options flow;

	/// consecutive epochs without any frame exchanged before auth_failure fires
	unsigned int auth_failure_threshold;

	std::string log_level;

	/// \throw std::invalid_argument when a value is out of range or missing
	void validate() const;
};     // struct client_options

/// \brief the outcome of parsing a command line
struct parse_result {
	parse_result() : options(), help(false), usage() {}

	client_options options;
	bool           help;  ///< --help was given; options are defaults
	std::string    usage;
};

/// \brief parse command-line options, an optional --config file, and the
///        MUXTUN_TOKEN environment variable
///
/// Command-line values take precedence over the configuration file. When
/// no --relay-url is given it is derived from --endpoint.
///
/// \throw std::invalid_argument or boost::program_options::error on bad input
parse_result parse_client_options(int argc, const char * const argv[]);

std::ostream &operator<<(std::ostream &stream, const client_options &options);

}      // namespace muxtun
#endif // MUXTUN_CLIENT_OPTIONS_HEAD
