/*
 * PeerRoom
 * Connection topology policy
 */

#pragma once

#include "peerroom-common.h"

namespace peerroom
{

// What the session must do to converge after a topology switch.
struct TopologyPlan {
	bool changed = false;
	bool pruneNonCreatorPeers = false;
	bool requestPeerList = false;
	bool redialCreator = false;
};

class TopologyController
{
public:
	TopologyController(PeerRole role, Topology initial);

	Topology mode() const;
	PeerRole role() const;

	// Whether peer-list and new-peer announcements may trigger a dial.
	bool permitsDial() const;

	// Whether an established link to peerId violates the current shape.
	bool shouldPrune(const PeerId &peerId) const;

	TopologyPlan switchTo(Topology mode, bool creatorLinkOpen);

private:
	PeerRole role_;
	Topology mode_;
};

} // namespace peerroom
