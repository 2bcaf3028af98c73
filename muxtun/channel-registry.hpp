/// \file  channel-registry.hpp
/// \brief Map channel identifiers onto live channels
///
/// UNCLASSIFIED
#ifndef MUXTUN_CHANNEL_REGISTRY_HEAD
#define MUXTUN_CHANNEL_REGISTRY_HEAD 1

#include <cstddef>
#include <map>
#include <boost/noncopyable.hpp>

#include "frame.hpp"
#include "channel.hpp"

namespace muxtun {

/// \brief The channels of one connection epoch
///
/// Lookups and removals by identifier; removal is idempotent. The registry
/// holds the owning reference, so erasing an entry lets the channel go away
/// once its outstanding operations complete.
class channel_registry : private boost::noncopyable {
public:
	typedef std::map<channel_id, channel_pointer> map_type;
	typedef map_type::const_iterator              const_iterator;

	channel_registry();

	/// \return the channel previously registered under the same id, if any
	channel_pointer insert(const channel_pointer &chan);

	/// \return an empty pointer when \em id is unknown
	channel_pointer find(const channel_id &id) const;

	/// \return the removed channel, or an empty pointer
	channel_pointer erase(const channel_id &id);

	/// Remove \em id only while it still maps to \em chan.
	bool erase(const channel_id &id, const channel_pointer &chan);

	/// stop every channel and forget them
	void stop_all();

	std::size_t size() const { return channels_.size(); }
	bool empty() const { return channels_.empty(); }

	const_iterator begin() const { return channels_.begin(); }
	const_iterator end() const { return channels_.end(); }
private:
	map_type channels_;
};     // class channel_registry

}      // namespace muxtun
#endif // MUXTUN_CHANNEL_REGISTRY_HEAD
