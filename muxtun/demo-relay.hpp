/// \file  demo-relay.hpp
/// \brief A minimal relay for development and end-to-end tests
///
/// UNCLASSIFIED
#ifndef MUXTUN_DEMO_RELAY_HEAD
#define MUXTUN_DEMO_RELAY_HEAD 1

#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/uuid/random_generator.hpp>

#include "frame.hpp"

namespace muxtun {

/// \brief Plain ws:// relay serving one tunnel client at a time
///
/// The tunnel client connects to the tunnel endpoint and sends its token.
/// Every TCP connection accepted on the public endpoint then becomes a
/// channel: a fresh random id, a NEW frame, and DATA/CLOSE frames in both
/// directions. PING is answered with PONG; PAUSE/RESUME stop and restart
/// reading from the public connection.
class demo_relay : private boost::noncopyable {
public:
	typedef boost::asio::io_service        service_type;
	typedef service_type&                  service_reference;
	typedef boost::asio::ip::tcp::endpoint endpoint_type;

	/// \param expected_token when not empty, any other token is refused
	demo_relay(service_reference service,
			   const endpoint_type &tunnel_ep,
			   const endpoint_type &public_ep,
			   const std::string &expected_token = std::string());
	~demo_relay();

	/// bound addresses; useful when the requested ports were 0
	endpoint_type tunnel_endpoint() const;
	endpoint_type public_endpoint() const;

	void start();
	void stop();

	bool client_connected() const;
	std::size_t connection_count() const { return connections_.size(); }

	/// the token presented by the most recent tunnel client
	const std::string &last_token() const { return token_; }

	/// send a frame to the tunnel client, if one is connected
	void send_frame(const frame &aFrame);
private:
	typedef boost::asio::ip::tcp::socket                   socket_type;
	typedef boost::beast::websocket::stream<socket_type>  websocket_type;

	struct tunnel_peer {
		explicit tunnel_peer(service_reference service)
			: ws(service)
			, buffer()
			, outbound()
			, writing(false)
			, authenticated(false)
		{
		}

		websocket_type            ws;
		boost::beast::flat_buffer buffer;
		std::deque<string_type>   outbound;
		bool                      writing;
		bool                      authenticated;
	};     // struct tunnel_peer

	struct public_connection {
		explicit public_connection(service_reference service)
			: socket(service)
			, id()
			, buffer(4096)
			, outbound()
			, writing(false)
			, reading(false)
			, paused(false)
			, closing(false)
		{
		}

		socket_type             socket;
		channel_id              id;
		std::vector<char>       buffer;
		std::deque<string_type> outbound;
		bool                    writing;
		bool                    reading;
		bool                    paused;
		bool                    closing; ///< close once outbound drains
	};     // struct public_connection

	typedef boost::shared_ptr<tunnel_peer>               peer_pointer;
	typedef boost::shared_ptr<public_connection>         connection_pointer;
	typedef std::map<channel_id, connection_pointer>     connection_map;
	typedef boost::asio::ip::tcp::acceptor               acceptor_type;

	service_reference               service_;
	acceptor_type                   tunnel_acceptor_;
	acceptor_type                   public_acceptor_;
	std::string                     expected_token_;
	std::string                     token_;
	peer_pointer                    peer_;
	connection_map                  connections_;
	boost::uuids::random_generator  generate_id_;
	bool                            stopped_;

	static void listen(acceptor_type &acceptor, const endpoint_type &ep);

	void accept_tunnel();
	void handle_tunnel_accept(const peer_pointer peer, const boost::system::error_code &error);
	void handle_websocket_accept(const peer_pointer peer, const boost::system::error_code &error);
	void handle_token(const peer_pointer peer, const boost::system::error_code &error);
	void read_frames(const peer_pointer peer);
	void handle_frames(const peer_pointer peer, const boost::system::error_code &error);
	void dispatch(const frame &aFrame);
	void write_peer(const peer_pointer peer);
	void handle_peer_write(const peer_pointer peer, const boost::system::error_code &error);
	void drop_peer(const peer_pointer peer, const boost::system::error_code &error);

	void accept_public();
	void handle_public_accept(const connection_pointer conn, const boost::system::error_code &error);
	void read_public(const connection_pointer conn);
	void handle_public_read(const connection_pointer conn, const boost::system::error_code &error,
							const std::size_t bytes_transferred);
	void write_public(const connection_pointer conn);
	void handle_public_write(const connection_pointer conn, const boost::system::error_code &error);
	bool is_current(const connection_pointer &conn) const;
	void close_public(const connection_pointer conn);
};     // class demo_relay

}      // namespace muxtun
#endif // MUXTUN_DEMO_RELAY_HEAD
