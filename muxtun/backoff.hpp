/// \file  backoff.hpp
/// \brief Exponential reconnect delay
///
/// UNCLASSIFIED
#ifndef MUXTUN_BACKOFF_HEAD
#define MUXTUN_BACKOFF_HEAD 1

#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace muxtun {

/// \brief Reconnect delay, counted in whole time units
///
/// The delay starts at the floor, doubles on every consecutive failure and
/// is capped at the ceiling. Any successful frame exchange resets it.
class reconnect_backoff {
public:
	typedef boost::posix_time::time_duration duration_type;

	reconnect_backoff();
	reconnect_backoff(const unsigned int floor, const unsigned int ceiling,
					  const duration_type &unit = boost::posix_time::seconds(1));

	/// Number of time units the next failure will wait.
	unsigned int current_delay() const { return current_; }

	unsigned int consecutive_failures() const { return failures_; }

	/// \brief record a failed connection
	/// \return the number of time units to wait before the next attempt
	unsigned int failure();

	/// Convert a number of time units into a duration for a timer.
	duration_type to_duration(const unsigned int units) const;

	void reset();
private:
	unsigned int  floor_;
	unsigned int  ceiling_;
	duration_type unit_;
	unsigned int  current_;
	unsigned int  failures_;
};     // class reconnect_backoff

}      // namespace muxtun
#endif // MUXTUN_BACKOFF_HEAD
