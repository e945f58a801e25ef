/*
 * PeerRoom
 * Local view of room membership
 */

#include "peerroom-roster.h"

#include <algorithm>

namespace peerroom
{

bool Roster::add(const Participant &participant)
{
	if (participant.id.empty() || contains(participant.id)) {
		return false;
	}
	participants_.push_back(participant);
	return true;
}

bool Roster::remove(const PeerId &peerId)
{
	auto it = std::find_if(participants_.begin(), participants_.end(),
	                       [&peerId](const Participant &p) { return p.id == peerId; });
	if (it == participants_.end()) {
		return false;
	}
	participants_.erase(it);
	return true;
}

bool Roster::contains(const PeerId &peerId) const
{
	return find(peerId) != nullptr;
}

const Participant *Roster::find(const PeerId &peerId) const
{
	for (const auto &participant : participants_) {
		if (participant.id == peerId) {
			return &participant;
		}
	}
	return nullptr;
}

Roster::const_iterator Roster::begin() const
{
	return participants_.begin();
}

Roster::const_iterator Roster::end() const
{
	return participants_.end();
}

std::vector<Participant> Roster::list() const
{
	return participants_;
}

std::vector<PeerId> Roster::ids() const
{
	std::vector<PeerId> result;
	result.reserve(participants_.size());
	for (const auto &participant : participants_) {
		result.push_back(participant.id);
	}
	return result;
}

size_t Roster::size() const
{
	return participants_.size();
}

bool Roster::empty() const
{
	return participants_.empty();
}

void Roster::clear()
{
	participants_.clear();
}

} // namespace peerroom
