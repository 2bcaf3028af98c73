/// \file  muxtun-client.cpp
/// \brief Run the tunnel client until interrupted
///
/// UNCLASSIFIED
#include "muxtun/client-options.hpp"
#include "muxtun/log.hpp"
#include "muxtun/tunnel-client.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
using namespace std;

#include <boost/asio.hpp>
#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>

static void
handle_signal(const boost::system::error_code &error, const int signal_number,
			  muxtun::tunnel_client &client)
{
	if (!error) {
		muxtun::log()->info("caught signal {}", signal_number);
		client.stop();
	}
}

static void
handle_auth_failure(const unsigned int epochs)
{
	muxtun::log()->error("authentication keeps failing ({} attempts); check the token", epochs);
}

int
main(int argc, char **argv)
{
	using boost::bind;
	using boost::ref;
	try {
		const muxtun::parse_result parsed = muxtun::parse_client_options(argc, argv);
		if (parsed.help) {
			cout << parsed.usage << endl;
			return 0;
		}
		muxtun::set_log_level(parsed.options.log_level);
		muxtun::log()->info("starting: {}", boost::lexical_cast<std::string>(parsed.options));

		boost::asio::io_service service;
		muxtun::tunnel_client client(service, parsed.options);
		client.install_auth_failure_handler(&handle_auth_failure);

		boost::asio::signal_set signals(service, SIGINT, SIGTERM);
		signals.async_wait(bind(handle_signal, _1, _2, ref(client)));

		client.start();
		service.run();
	} catch (const exception &ex) {
		cerr << "Fatal Error: " << ex.what() << endl;
		return 1;
	}
	return 0;
}
