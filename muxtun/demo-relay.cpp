/// \file  demo-relay.cpp
/// \brief A minimal relay for development and end-to-end tests
///
/// UNCLASSIFIED
#include "demo-relay.hpp"

#include <boost/bind.hpp>

#include "error.hpp"
#include "frame-codec.hpp"
#include "frame-stream.hpp"
#include "log.hpp"

namespace muxtun {

demo_relay::demo_relay(service_reference service,
					   const endpoint_type &tunnel_ep,
					   const endpoint_type &public_ep,
					   const std::string &expected_token)
	: service_(service)
	, tunnel_acceptor_(service)
	, public_acceptor_(service)
	, expected_token_(expected_token)
	, token_()
	, peer_()
	, connections_()
	, generate_id_()
	, stopped_(false)
{
	listen(tunnel_acceptor_, tunnel_ep);
	listen(public_acceptor_, public_ep);
}

demo_relay::~demo_relay()
{
	stop();
}

void
demo_relay::listen(acceptor_type &acceptor, const endpoint_type &ep)
{
	acceptor.open(ep.protocol());
	acceptor.set_option(acceptor_type::reuse_address(true));
	acceptor.bind(ep);
	acceptor.listen(5);
}

demo_relay::endpoint_type
demo_relay::tunnel_endpoint() const
{
	return tunnel_acceptor_.local_endpoint();
}

demo_relay::endpoint_type
demo_relay::public_endpoint() const
{
	return public_acceptor_.local_endpoint();
}

bool
demo_relay::client_connected() const
{
	return peer_ && peer_->authenticated;
}

void
demo_relay::start()
{
	log()->info("relay: tunnel on {}, public on {}",
				tunnel_endpoint().port(), public_endpoint().port());
	accept_tunnel();
	accept_public();
}

void
demo_relay::stop()
{
	if (stopped_) return;
	stopped_ = true;
	boost::system::error_code ignored;
	tunnel_acceptor_.close(ignored);
	public_acceptor_.close(ignored);
	drop_peer(peer_, boost::asio::error::operation_aborted);
}

void
demo_relay::accept_tunnel()
{
	using boost::bind;
	const peer_pointer next(new tunnel_peer(service_));
	tunnel_acceptor_.async_accept(next->ws.next_layer(),
								  bind(&demo_relay::handle_tunnel_accept,
									   this,
									   next,
									   boost::asio::placeholders::error));
}

void
demo_relay::handle_tunnel_accept(const peer_pointer peer, const boost::system::error_code &error)
{
	using boost::bind;
	if (error == boost::asio::error::operation_aborted || stopped_) return;
	accept_tunnel();
	if (error) {
		log()->warn("relay: tunnel accept failed: {}", error.message());
		return;
	}
	if (peer_) {
		log()->warn("relay: refusing a second tunnel client");
		boost::system::error_code ignored;
		peer->ws.next_layer().close(ignored);
		return;
	}
	peer_ = peer;
	peer->ws.async_accept(bind(&demo_relay::handle_websocket_accept,
							   this,
							   peer,
							   boost::asio::placeholders::error));
}

void
demo_relay::handle_websocket_accept(const peer_pointer peer, const boost::system::error_code &error)
{
	using boost::bind;
	if (peer != peer_) return;
	if (error) {
		drop_peer(peer, error);
		return;
	}
	peer->ws.async_read(peer->buffer,
						bind(&demo_relay::handle_token,
							 this,
							 peer,
							 boost::asio::placeholders::error));
}

void
demo_relay::handle_token(const peer_pointer peer, const boost::system::error_code &error)
{
	if (peer != peer_) return;
	if (error) {
		drop_peer(peer, error);
		return;
	}
	token_ = boost::beast::buffers_to_string(peer->buffer.data());
	peer->buffer.consume(peer->buffer.size());
	if (!expected_token_.empty() && token_ != expected_token_) {
		log()->warn("relay: refusing a tunnel client with a wrong token");
		drop_peer(peer, boost::asio::error::access_denied);
		return;
	}
	log()->info("relay: tunnel client authenticated");
	peer->authenticated = true;
	read_frames(peer);
}

void
demo_relay::read_frames(const peer_pointer peer)
{
	using boost::bind;
	peer->ws.async_read(peer->buffer,
						bind(&demo_relay::handle_frames,
							 this,
							 peer,
							 boost::asio::placeholders::error));
}

void
demo_relay::handle_frames(const peer_pointer peer, const boost::system::error_code &error)
{
	if (peer != peer_) return;
	if (error) {
		drop_peer(peer, error);
		return;
	}
	const string_type message = boost::beast::buffers_to_string(peer->buffer.data());
	peer->buffer.consume(peer->buffer.size());

	const char *first = message.data();
	const char *const last = first + message.size();
	while (first != last) {
		frame current;
		boost::system::error_code ec;
		const std::size_t consumed = decode_frame(first, last, current, ec);
		if (ec == error::unknown_flag) {
			first += consumed;
			continue;
		}
		if (ec) {
			drop_peer(peer, ec);
			return;
		}
		first += consumed;
		dispatch(current);
		if (peer != peer_) return;
	}
	read_frames(peer);
}

void
demo_relay::dispatch(const frame &aFrame)
{
	if (aFrame.flag == PING) {
		send_frame(frame(control_channel(), PONG));
		return;
	}
	const connection_map::iterator i = connections_.find(aFrame.channel);
	if (i == connections_.end()) {
		log()->debug("relay: {} for unknown channel {}", flag_name(aFrame.flag), muxtun::to_string(aFrame.channel));
		return;
	}
	const connection_pointer conn = i->second;
	switch (aFrame.flag) {
	case DATA:
		conn->outbound.push_back(aFrame.payload);
		if (!conn->writing) {
			write_public(conn);
		}
		break;
	case CLOSE:
		connections_.erase(i);
		conn->closing = true;
		if (!conn->writing) {
			close_public(conn);
		}
		break;
	case PAUSE:
		conn->paused = true;
		break;
	case RESUME:
		conn->paused = false;
		read_public(conn);
		break;
	default:
		log()->debug("relay: ignoring {} from the tunnel client", flag_name(aFrame.flag));
		break;
	}
}

void
demo_relay::send_frame(const frame &aFrame)
{
	if (!peer_ || !peer_->authenticated) return;
	peer_->outbound.push_back(encode_frame(aFrame));
	if (!peer_->writing) {
		write_peer(peer_);
	}
}

void
demo_relay::write_peer(const peer_pointer peer)
{
	using boost::bind;
	peer->writing = true;
	peer->ws.binary(true);
	peer->ws.async_write(boost::asio::buffer(peer->outbound.front()),
						 bind(&demo_relay::handle_peer_write,
							  this,
							  peer,
							  boost::asio::placeholders::error));
}

void
demo_relay::handle_peer_write(const peer_pointer peer, const boost::system::error_code &error)
{
	peer->writing = false;
	if (peer != peer_) return;
	if (error) {
		drop_peer(peer, error);
		return;
	}
	peer->outbound.pop_front();
	if (!peer->outbound.empty()) {
		write_peer(peer);
	}
}

void
demo_relay::drop_peer(const peer_pointer peer, const boost::system::error_code &error)
{
	if (!peer || peer != peer_) return;
	log()->info("relay: tunnel client gone: {}", error.message());
	peer_.reset();
	boost::system::error_code ignored;
	peer->ws.next_layer().shutdown(socket_type::shutdown_both, ignored);
	peer->ws.next_layer().close(ignored);

	connection_map doomed;
	doomed.swap(connections_);
	for (connection_map::iterator i = doomed.begin(); i != doomed.end(); ++i) {
		close_public(i->second);
	}
}

void
demo_relay::accept_public()
{
	using boost::bind;
	const connection_pointer next(new public_connection(service_));
	public_acceptor_.async_accept(next->socket,
								  bind(&demo_relay::handle_public_accept,
									   this,
									   next,
									   boost::asio::placeholders::error));
}

void
demo_relay::handle_public_accept(const connection_pointer conn, const boost::system::error_code &error)
{
	if (error == boost::asio::error::operation_aborted || stopped_) return;
	accept_public();
	if (error) {
		log()->warn("relay: public accept failed: {}", error.message());
		return;
	}
	if (!client_connected()) {
		log()->warn("relay: no tunnel client; dropping a public connection");
		close_public(conn);
		return;
	}
	conn->id = generate_id_();
	connections_[conn->id] = conn;
	log()->info("relay: new channel {}", muxtun::to_string(conn->id));
	send_frame(frame(conn->id, NEW));
	read_public(conn);
}

bool
demo_relay::is_current(const connection_pointer &conn) const
{
	const connection_map::const_iterator i = connections_.find(conn->id);
	return i != connections_.end() && i->second == conn;
}

void
demo_relay::read_public(const connection_pointer conn)
{
	using boost::bind;
	if (conn->paused || conn->reading) return;
	conn->reading = true;
	conn->socket.async_read_some(boost::asio::buffer(conn->buffer),
								 bind(&demo_relay::handle_public_read,
									  this,
									  conn,
									  boost::asio::placeholders::error,
									  boost::asio::placeholders::bytes_transferred));
}

void
demo_relay::handle_public_read(const connection_pointer conn, const boost::system::error_code &error,
							   const std::size_t bytes_transferred)
{
	conn->reading = false;
	if (!is_current(conn)) return;
	if (error) {
		send_frame(frame(conn->id, CLOSE));
		connections_.erase(conn->id);
		close_public(conn);
		return;
	}
	send_frame(frame(conn->id, DATA,
					 string_type(conn->buffer.begin(), conn->buffer.begin() + bytes_transferred)));
	read_public(conn);
}

void
demo_relay::write_public(const connection_pointer conn)
{
	using boost::bind;
	conn->writing = true;
	boost::asio::async_write(conn->socket, boost::asio::buffer(conn->outbound.front()),
							 bind(&demo_relay::handle_public_write,
								  this,
								  conn,
								  boost::asio::placeholders::error));
}

void
demo_relay::handle_public_write(const connection_pointer conn, const boost::system::error_code &error)
{
	conn->writing = false;
	if (error) {
		if (is_current(conn)) {
			send_frame(frame(conn->id, CLOSE));
			connections_.erase(conn->id);
		}
		close_public(conn);
		return;
	}
	conn->outbound.pop_front();
	if (!conn->outbound.empty()) {
		write_public(conn);
	} else if (conn->closing) {
		close_public(conn);
	}
}

void
demo_relay::close_public(const connection_pointer conn)
{
	boost::system::error_code ignored;
	conn->socket.shutdown(socket_type::shutdown_both, ignored);
	conn->socket.close(ignored);
}

}      // namespace muxtun
