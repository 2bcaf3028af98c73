/// \file  channel-registry.cpp
/// \brief Map channel identifiers onto live channels
///
/// UNCLASSIFIED
#include "channel-registry.hpp"

#include <stdexcept>
#include <utility>

namespace muxtun {

channel_registry::channel_registry()
	: channels_()
{
}

channel_pointer
channel_registry::insert(const channel_pointer &chan)
{
	if (!chan) {
		throw std::invalid_argument("cannot register an empty channel");
	}
	channel_pointer &slot = channels_[chan->id()];
	channel_pointer previous = slot;
	slot = chan;
	return previous;
}

channel_pointer
channel_registry::find(const channel_id &id) const
{
	const map_type::const_iterator i = channels_.find(id);
	if (i == channels_.end()) return channel_pointer();
	return i->second;
}

channel_pointer
channel_registry::erase(const channel_id &id)
{
	const map_type::iterator i = channels_.find(id);
	if (i == channels_.end()) return channel_pointer();
	const channel_pointer removed = i->second;
	channels_.erase(i);
	return removed;
}

bool
channel_registry::erase(const channel_id &id, const channel_pointer &chan)
{
	const map_type::iterator i = channels_.find(id);
	if (i == channels_.end() || i->second != chan) return false;
	channels_.erase(i);
	return true;
}

void
channel_registry::stop_all()
{
	// emptied first so that lookups made during the teardown find nothing
	map_type doomed;
	doomed.swap(channels_);
	for (map_type::iterator i = doomed.begin(); i != doomed.end(); ++i) {
		i->second->stop();
	}
}

}      // namespace muxtun
