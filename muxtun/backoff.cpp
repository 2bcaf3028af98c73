/// \file  backoff.cpp
/// \brief Exponential reconnect delay
///
/// UNCLASSIFIED
#include "backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace muxtun {

reconnect_backoff::reconnect_backoff()
	: floor_(1)
	, ceiling_(60)
	, unit_(boost::posix_time::seconds(1))
	, current_(1)
	, failures_(0)
{
}

reconnect_backoff::reconnect_backoff(const unsigned int floor, const unsigned int ceiling,
									 const duration_type &unit)
	: floor_(floor)
	, ceiling_(ceiling)
	, unit_(unit)
	, current_(floor)
	, failures_(0)
{
	if (floor_ == 0 || ceiling_ < floor_) {
		throw std::invalid_argument("the backoff floor must be positive and no larger than the ceiling");
	}
}

unsigned int
reconnect_backoff::failure()
{
	const unsigned int delay = current_;
	// compare against half the ceiling so the doubling cannot overflow
	current_ = (current_ > ceiling_ / 2) ? ceiling_ : std::min(current_ * 2, ceiling_);
	failures_ += 1;
	return delay;
}

reconnect_backoff::duration_type
reconnect_backoff::to_duration(const unsigned int units) const
{
	return unit_ * static_cast<int>(units);
}

void
reconnect_backoff::reset()
{
	current_ = floor_;
	failures_ = 0;
}

}      // namespace muxtun
