/*
 * PeerRoom
 * Local view of room membership
 */

#pragma once

#include <vector>

#include "peerroom-transport.h"

namespace peerroom
{

struct Participant {
	PeerId id;
	bool isCreator = false;
	MediaStreamPtr stream;
};

class Roster
{
public:
	using const_iterator = std::vector<Participant>::const_iterator;

	// Returns false, leaving the roster untouched, when the id is already present.
	bool add(const Participant &participant);
	bool remove(const PeerId &peerId);

	bool contains(const PeerId &peerId) const;
	const Participant *find(const PeerId &peerId) const;

	// Insertion order; carries no meaning beyond that.
	const_iterator begin() const;
	const_iterator end() const;
	std::vector<Participant> list() const;
	std::vector<PeerId> ids() const;

	size_t size() const;
	bool empty() const;
	void clear();

private:
	std::vector<Participant> participants_;
};

} // namespace peerroom
