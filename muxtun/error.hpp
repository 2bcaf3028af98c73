/// \file  error.hpp
/// \brief Tunnel error codes
///
/// UNCLASSIFIED
#ifndef MUXTUN_ERROR_HEAD
#define MUXTUN_ERROR_HEAD 1

#include <string>
#include <boost/system/error_code.hpp>

namespace muxtun {
namespace error {

enum errc {
	malformed_frame      = 1, ///< \note fewer than header_size bytes available
	truncated_frame      = 2, ///< \note declared size runs past the end of the buffer
	oversized_payload    = 3, ///< \note declared size exceeds the maximum frame payload
	unknown_flag         = 4,
	write_queue_overflow = 5, ///< \note local socket is not draining, even after PAUSE
	invalid_url          = 6,
	not_connected        = 7, ///< \note the connection epoch has already ended
};

}      // namespace error

class error_category : public boost::system::error_category {
public:
	typedef std::string string;
	virtual ~error_category() { }

	virtual const char *name() const BOOST_NOEXCEPT { return "muxtun"; }
	virtual string message(int ev) const;
};

const boost::system::error_category &get_muxtun_category();

namespace error {

inline
boost::system::error_code make_error_code(const errc e)
{
	return boost::system::error_code(static_cast<int>(e), get_muxtun_category());
}

/// Transport-level errors end the connection epoch; the others are scoped to
/// one frame or one channel.
inline
bool is_transport_error(const boost::system::error_code &ec)
{
	return ec.category() == get_muxtun_category() &&
		(ec.value() == malformed_frame || ec.value() == truncated_frame);
}

}      // namespace error
}      // namespace muxtun

namespace boost {
namespace system {

template <>
struct is_error_code_enum<muxtun::error::errc> {
	static const bool value = true;
};

}      // namespace system
}      // namespace boost
#endif // MUXTUN_ERROR_HEAD
