/*
 * PeerRoom
 * Connection topology policy
 */

#include "peerroom-topology.h"

#include "peerroom-utils.h"

namespace peerroom
{

TopologyController::TopologyController(PeerRole role, Topology initial) : role_(role), mode_(initial) {}

Topology TopologyController::mode() const
{
	return mode_;
}

PeerRole TopologyController::role() const
{
	return role_;
}

bool TopologyController::permitsDial() const
{
	return mode_ == Topology::Mesh || role_ == PeerRole::Creator;
}

bool TopologyController::shouldPrune(const PeerId &peerId) const
{
	return mode_ == Topology::Star && role_ == PeerRole::Joiner && !isCreatorPeerId(peerId);
}

TopologyPlan TopologyController::switchTo(Topology mode, bool creatorLinkOpen)
{
	TopologyPlan plan;
	if (mode == mode_) {
		return plan;
	}

	logInfo("Topology %s -> %s", topologyName(mode_), topologyName(mode));
	mode_ = mode;
	plan.changed = true;

	// The creator answers everyone in either mode; only joiners reshape their links.
	if (role_ == PeerRole::Creator) {
		return plan;
	}

	if (mode == Topology::Star) {
		plan.pruneNonCreatorPeers = true;
	} else if (creatorLinkOpen) {
		plan.requestPeerList = true;
	} else {
		plan.redialCreator = true;
	}
	return plan;
}

} // namespace peerroom
