/// \file  relay-url.cpp
/// \brief ws:// and wss:// relay addresses parsed with boost spirit
///
/// UNCLASSIFIED
#include "relay-url.hpp"

#include <sstream>
#include <vector>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/spirit/include/qi.hpp>
#include <boost/system/system_error.hpp>

#include "error.hpp"

namespace muxtun {
namespace qi = boost::spirit::qi;

namespace {

struct scheme_symbols_ : qi::symbols<char, bool> {
	scheme_symbols_()
	{
		add
			("ws", false)
			("wss", true)
			;
	}
};     // struct scheme_symbols_

typedef std::string::const_iterator iterator_type;

const std::string &
default_cloud_domain()
{
	static const std::string domain("jethome.cloud");
	return domain;
}

}      // namespace

std::string
relay_url::str() const
{
	std::ostringstream strm;
	strm << (secure ? "wss://" : "ws://");
	if (host.find(':') != std::string::npos) {
		strm << '[' << host << ']';
	} else {
		strm << host;
	}
	strm << ':' << port << target;
	return strm.str();
}

relay_url
parse_relay_url(const std::string &text, boost::system::error_code &ec)
{
	using qi::char_;
	using qi::no_case;

	static scheme_symbols_ scheme_symbols;
	static const qi::uint_parser<unsigned short, 10, 1, 5> port_number;

	relay_url url;
	ec = error::invalid_url;

	iterator_type iter = text.begin();
	const iterator_type end = text.end();
	if (!qi::parse(iter, end, no_case[scheme_symbols] >> "://", url.secure)) {
		return relay_url();
	}

	bool have_host = false;
	if (iter != end && *iter == '[') {
		have_host = qi::parse(iter, end, '[' >> +(char_ - ']') >> ']', url.host);
	} else {
		have_host = qi::parse(iter, end, +(char_ - char_(":/?#@")), url.host);
	}
	if (!have_host) {
		return relay_url();
	}

	unsigned short port = 0;
	if (iter != end && *iter == ':') {
		if (!qi::parse(iter, end, ':' >> port_number, port) || port == 0) {
			return relay_url();
		}
	} else {
		port = url.secure ? 443 : 80;
	}
	std::ostringstream pstrm;
	pstrm << port;
	url.port = pstrm.str();

	std::string rest(iter, end);
	const std::string::size_type fragment = rest.find('#');
	if (fragment != std::string::npos) {
		rest.erase(fragment);
	}
	if (rest.empty()) {
		url.target = "/";
	} else if (rest[0] == '/') {
		url.target = rest;
	} else if (rest[0] == '?') {
		url.target = "/" + rest;
	} else {
		return relay_url();
	}
	ec = boost::system::error_code();
	return url;
}

relay_url
parse_relay_url(const std::string &text)
{
	boost::system::error_code ec;
	const relay_url url = parse_relay_url(text, ec);
	if (ec) {
		throw boost::system::system_error(ec, text);
	}
	return url;
}

const std::string &
default_api_endpoint()
{
	static const std::string endpoint("https://api.jethome.cloud");
	return endpoint;
}

std::string
derive_tunnel_url(const std::string &api_endpoint)
{
	using qi::char_;
	using qi::alnum;
	using qi::omit;

	std::string host;
	iterator_type iter = api_endpoint.begin();
	const iterator_type end = api_endpoint.end();
	const bool ok =
		qi::parse(iter, end,
				  -omit[+(alnum | char_("+.-")) >> "://"]
				  >> -omit[+(char_ - char_("@/?#")) >> '@']
				  >> +(char_ - char_(":/?#[]@")),
				  host);

	std::string domain = default_cloud_domain();
	if (ok && !host.empty()) {
		boost::algorithm::to_lower(host);
		std::vector<std::string> labels;
		boost::algorithm::split(labels, host, boost::algorithm::is_any_of("."));
		if (labels.size() > 2) {
			labels.erase(labels.begin());
		}
		domain = boost::algorithm::join(labels, ".");
	}
	return "wss://tun." + domain + "/ws/tunnel";
}

}      // namespace muxtun
