/// \file  muxtun-relay-demo.cpp
/// \brief Serve the tunnel locally, for trying out the client
///
/// UNCLASSIFIED
#include "muxtun/demo-relay.hpp"
#include "muxtun/log.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
using namespace std;

#include <boost/asio.hpp>
#include <boost/bind.hpp>
#include <boost/program_options.hpp>

static void
handle_signal(const boost::system::error_code &error, muxtun::demo_relay &relay)
{
	if (!error) {
		relay.stop();
	}
}

int
main(int argc, char **argv)
{
	namespace po = boost::program_options;
	using namespace boost::asio;
	using boost::bind;
	using boost::ref;
	try {
		unsigned short tunnel_port = 8765;
		unsigned short public_port = 9000;
		std::string token;
		std::string level;

		po::options_description desc("Options");
		desc.add_options()
			("help,h", "print this message")
			("tunnel-port", po::value<unsigned short>(&tunnel_port)->default_value(tunnel_port),
			 "port the tunnel client connects to (ws://)")
			("public-port", po::value<unsigned short>(&public_port)->default_value(public_port),
			 "port whose connections are sent through the tunnel")
			("token", po::value<std::string>(&token), "refuse clients presenting another token")
			("log-level", po::value<std::string>(&level)->default_value("info"), "log level")
			;
		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);
		if (vm.count("help")) {
			cout << desc << endl;
			return 0;
		}
		po::notify(vm);
		muxtun::set_log_level(level);

		io_service service;
		muxtun::demo_relay relay(service,
								 ip::tcp::endpoint(ip::tcp::v4(), tunnel_port),
								 ip::tcp::endpoint(ip::tcp::v4(), public_port),
								 token);
		signal_set signals(service, SIGINT, SIGTERM);
		signals.async_wait(bind(handle_signal, _1, ref(relay)));

		relay.start();
		service.run();
	} catch (const exception &ex) {
		cerr << "Fatal Error: " << ex.what() << endl;
		return 1;
	}
	return 0;
}
