/// \file  client-options.cpp
/// \brief Tunnel client configuration parsed with boost program_options
///
/// UNCLASSIFIED
#include "client-options.hpp"

#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <boost/program_options.hpp>

#include "frame.hpp"
#include "log.hpp"
#include "relay-url.hpp"

namespace muxtun {
namespace po = boost::program_options;

client_options::client_options()
	: relay_url(derive_tunnel_url(default_api_endpoint()))
	, token()
	, local_host("127.0.0.1")
	, local_port(8123)
	, max_payload(max_payload_size)
	, read_chunk(4096)
	, backoff_floor(1)
	, backoff_ceiling(60)
	, backoff_unit(boost::posix_time::seconds(1))
	, handshake_timeout(boost::posix_time::seconds(30))
	, heartbeat(boost::posix_time::seconds(30))
	, flow()
	, auth_failure_threshold(5)
	, log_level("info")
{
}

void
client_options::validate() const
{
	boost::system::error_code ec;
	parse_relay_url(relay_url, ec);
	if (ec) {
		throw std::invalid_argument("invalid relay URL '" + relay_url + "': " + ec.message());
	}
	if (token.empty()) {
		throw std::invalid_argument("a bearer token is required (--token or MUXTUN_TOKEN)");
	}
	if (local_host.empty() || local_port == 0) {
		throw std::invalid_argument("the local target needs a host and a non-zero port");
	}
	if (max_payload == 0 || max_payload > max_payload_size) {
		throw std::invalid_argument("the maximum payload must be between 1 byte and 1 MiB");
	}
	if (read_chunk == 0 || read_chunk > max_payload) {
		throw std::invalid_argument("the read chunk must be positive and fit in one frame");
	}
	if (backoff_floor == 0 || backoff_ceiling < backoff_floor) {
		throw std::invalid_argument("the backoff floor must be positive and no larger than the ceiling");
	}
	if (flow.low_watermark > flow.high_watermark || flow.high_watermark > flow.hard_limit) {
		throw std::invalid_argument("flow control needs low <= high <= hard limit");
	}
	if (!is_log_level(log_level)) {
		throw std::invalid_argument("unknown log level '" + log_level + "'");
	}
}

static std::string
environment_to_option(const std::string &variable)
{
	if (variable == "MUXTUN_TOKEN") {
		return "token";
	}
	return std::string();
}

parse_result
parse_client_options(int argc, const char * const argv[])
{
	parse_result result;
	client_options &opts = result.options;

	std::string endpoint;
	unsigned int heartbeat = 30;
	unsigned int handshake = 30;

	po::options_description generic("Generic options");
	generic.add_options()
		("help,h", "print this message")
		("config,c", po::value<std::string>(), "read options from an INI file")
		;

	po::options_description tunnel("Tunnel options");
	tunnel.add_options()
		("endpoint", po::value<std::string>(&endpoint)->default_value(default_api_endpoint()),
		 "cloud API endpoint; the relay URL is derived from it")
		("relay-url", po::value<std::string>(), "ws:// or wss:// relay URL (overrides --endpoint)")
		("token", po::value<std::string>(), "bearer token sent after the handshake")
		("local-host", po::value<std::string>(&opts.local_host)->default_value(opts.local_host),
		 "host of the local service")
		("local-port", po::value<unsigned short>(&opts.local_port)->default_value(opts.local_port),
		 "port of the local service")
		("backoff-ceiling", po::value<unsigned int>(&opts.backoff_ceiling)->default_value(opts.backoff_ceiling),
		 "longest reconnect delay, in seconds")
		("heartbeat", po::value<unsigned int>(&heartbeat)->default_value(heartbeat),
		 "WebSocket keep-alive interval, in seconds")
		("handshake-timeout", po::value<unsigned int>(&handshake)->default_value(handshake),
		 "limit on connecting and the WebSocket handshake, in seconds")
		("auth-failure-threshold",
		 po::value<unsigned int>(&opts.auth_failure_threshold)->default_value(opts.auth_failure_threshold),
		 "silent epochs before a repeated authentication failure is reported")
		("log-level", po::value<std::string>(&opts.log_level)->default_value(opts.log_level),
		 "trace, debug, info, warn, error, critical or off")
		;

	po::options_description cmdline;
	cmdline.add(generic).add(tunnel);

	std::ostringstream usage;
	usage << "Usage: " << (argc > 0 ? argv[0] : "muxtun-client") << " [options]\n" << cmdline;
	result.usage = usage.str();

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, cmdline), vm);

	po::options_description environment;
	environment.add_options()("token", po::value<std::string>(), "");
	po::store(po::parse_environment(environment, &environment_to_option), vm);

	if (vm.count("config")) {
		const std::string path = vm["config"].as<std::string>();
		std::ifstream file(path.c_str());
		if (!file) {
			throw std::invalid_argument("cannot open configuration file '" + path + "'");
		}
		po::store(po::parse_config_file(file, tunnel), vm);
	}
	if (vm.count("help")) {
		result.help = true;
		result.options = client_options();
		return result;
	}
	po::notify(vm);

	// the token may come from the environment, whose description has no notifier
	if (vm.count("token")) {
		opts.token = vm["token"].as<std::string>();
	}
	opts.relay_url = vm.count("relay-url") ?
		vm["relay-url"].as<std::string>() : derive_tunnel_url(endpoint);
	opts.heartbeat = boost::posix_time::seconds(heartbeat);
	opts.handshake_timeout = boost::posix_time::seconds(handshake);
	opts.validate();
	return result;
}

std::ostream &
operator<<(std::ostream &stream, const client_options &options)
{
	if (stream) {
		stream << "relay=" << options.relay_url
			   << " local=" << options.local_host << ':' << options.local_port
			   << " token=" << (options.token.empty() ? "<none>" : "<set>")
			   << " backoff=" << options.backoff_floor << ".." << options.backoff_ceiling
			   << " heartbeat=" << options.heartbeat.total_seconds() << 's';
	}
	return stream;
}

}      // namespace muxtun
