/// \file test-client-options.cpp
///
/// UNCLASSIFIED
#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "muxtun/client-options.hpp"
#include "muxtun/log.hpp"

using muxtun::client_options;
using muxtun::parse_result;

class ClientOptions : public testing::Test {
public:
	ClientOptions()
		: testing::Test()
		, config_path()
	{
	}

	virtual void SetUp()
	{
		::unsetenv("MUXTUN_TOKEN");
		config_path = testing::TempDir() + "muxtun-test.ini";
	}

	virtual void TearDown()
	{
		::unsetenv("MUXTUN_TOKEN");
		std::remove(config_path.c_str());
	}

	std::string config_path;

	template <std::size_t N>
	parse_result parse(const char *(&argv)[N])
	{
		return muxtun::parse_client_options(static_cast<int>(N), argv);
	}
};

TEST_F(ClientOptions, Defaults)
{
	const client_options opts;
	EXPECT_EQ("wss://tun.jethome.cloud/ws/tunnel", opts.relay_url);
	EXPECT_EQ("127.0.0.1", opts.local_host);
	EXPECT_EQ(8123, opts.local_port);
	EXPECT_EQ(4096u, opts.read_chunk);
	EXPECT_EQ(1024u * 1024u, opts.max_payload);
	EXPECT_EQ(1u, opts.backoff_floor);
	EXPECT_EQ(60u, opts.backoff_ceiling);
	EXPECT_EQ(boost::posix_time::seconds(30), opts.heartbeat);
	EXPECT_EQ(256u * 1024u, opts.flow.high_watermark);
	EXPECT_EQ(64u * 1024u, opts.flow.low_watermark);
	EXPECT_EQ(5u, opts.auth_failure_threshold);
	EXPECT_THROW(opts.validate(), std::invalid_argument);
}

TEST_F(ClientOptions, TokenOnCommandLine)
{
	const char *argv[] = { "muxtun-client", "--token", "secret" };
	const parse_result result = parse(argv);
	EXPECT_FALSE(result.help);
	EXPECT_EQ("secret", result.options.token);
	EXPECT_EQ("wss://tun.jethome.cloud/ws/tunnel", result.options.relay_url);
}

TEST_F(ClientOptions, MissingToken)
{
	const char *argv[] = { "muxtun-client" };
	EXPECT_THROW(parse(argv), std::invalid_argument);
}

TEST_F(ClientOptions, TokenFromEnvironment)
{
	::setenv("MUXTUN_TOKEN", "from-env", 1);
	const char *argv[] = { "muxtun-client" };
	EXPECT_EQ("from-env", parse(argv).options.token);

	const char *override_argv[] = { "muxtun-client", "--token", "from-cmdline" };
	EXPECT_EQ("from-cmdline", parse(override_argv).options.token);
}

TEST_F(ClientOptions, EndpointDerivesRelay)
{
	const char *argv[] = { "muxtun-client", "--token", "t", "--endpoint", "https://api.example.org" };
	EXPECT_EQ("wss://tun.example.org/ws/tunnel", parse(argv).options.relay_url);
}

TEST_F(ClientOptions, ExplicitRelay)
{
	const char *argv[] = { "muxtun-client", "--token", "t",
						   "--endpoint", "https://api.example.org",
						   "--relay-url", "ws://127.0.0.1:8765/tunnel" };
	EXPECT_EQ("ws://127.0.0.1:8765/tunnel", parse(argv).options.relay_url);
}

TEST_F(ClientOptions, InvalidRelay)
{
	const char *argv[] = { "muxtun-client", "--token", "t", "--relay-url", "http://nope" };
	EXPECT_THROW(parse(argv), std::invalid_argument);
}

TEST_F(ClientOptions, LocalTargetAndTimers)
{
	const char *argv[] = { "muxtun-client", "--token", "t",
						   "--local-host", "192.168.1.5", "--local-port", "80",
						   "--heartbeat", "10", "--handshake-timeout", "5",
						   "--backoff-ceiling", "30", "--auth-failure-threshold", "3" };
	const client_options opts = parse(argv).options;
	EXPECT_EQ("192.168.1.5", opts.local_host);
	EXPECT_EQ(80, opts.local_port);
	EXPECT_EQ(boost::posix_time::seconds(10), opts.heartbeat);
	EXPECT_EQ(boost::posix_time::seconds(5), opts.handshake_timeout);
	EXPECT_EQ(30u, opts.backoff_ceiling);
	EXPECT_EQ(3u, opts.auth_failure_threshold);
}

TEST_F(ClientOptions, ConfigurationFile)
{
	{
		std::ofstream file(config_path.c_str());
		file << "token = from-file\n"
			 << "local-port = 9000\n"
			 << "log-level = debug\n";
	}
	const char *argv[] = { "muxtun-client", "--config", config_path.c_str(), "--local-port", "9100" };
	const client_options opts = parse(argv).options;
	EXPECT_EQ("from-file", opts.token);
	EXPECT_EQ(9100, opts.local_port);
	EXPECT_EQ("debug", opts.log_level);
}

TEST_F(ClientOptions, MissingConfigurationFile)
{
	const char *argv[] = { "muxtun-client", "--token", "t", "--config", "/nonexistent/muxtun.ini" };
	EXPECT_THROW(parse(argv), std::invalid_argument);
}

TEST_F(ClientOptions, Help)
{
	const char *argv[] = { "muxtun-client", "--help" };
	const parse_result result = parse(argv);
	EXPECT_TRUE(result.help);
	EXPECT_NE(std::string::npos, result.usage.find("--local-port"));
}

TEST_F(ClientOptions, BadLogLevel)
{
	const char *argv[] = { "muxtun-client", "--token", "t", "--log-level", "chatty" };
	EXPECT_THROW(parse(argv), std::invalid_argument);
	EXPECT_FALSE(muxtun::is_log_level("chatty"));
	EXPECT_TRUE(muxtun::is_log_level("off"));
	EXPECT_THROW(muxtun::set_log_level("chatty"), std::invalid_argument);
}

TEST_F(ClientOptions, TokenIsNotPrinted)
{
	client_options opts;
	opts.token = "very-secret";
	std::ostringstream strm;
	strm << opts;
	EXPECT_EQ(std::string::npos, strm.str().find("very-secret"));
	EXPECT_NE(std::string::npos, strm.str().find("<set>"));
}
