/*
 * PeerRoom
 * Room session coordinator: roster, links, topology and room signaling
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "peerroom-common.h"
#include "peerroom-connection-registry.h"
#include "peerroom-event-loop.h"
#include "peerroom-room-messages.h"
#include "peerroom-roster.h"
#include "peerroom-topology.h"
#include "peerroom-transport.h"

namespace peerroom
{

// One instance per room session. Transport events are marshalled onto the
// event loop; every public method must be called on the loop thread. The
// loop and transport must outlive the coordinator.
class PeerRoomCoordinator
{
public:
	using OnParticipantJoinedCallback = std::function<void(const Participant &participant)>;
	using OnParticipantLeftCallback = std::function<void(const PeerId &peerId)>;
	using OnChatMessageCallback =
	    std::function<void(const std::string &sender, const std::string &text, int64_t timestamp)>;
	using OnConnectionErrorCallback = std::function<void(const std::string &error)>;

	PeerRoomCoordinator(EventLoop &loop, PeerTransport &transport, RoomSettings settings,
	                    MediaStreamPtr localStream);
	~PeerRoomCoordinator();

	PeerRoomCoordinator(const PeerRoomCoordinator &) = delete;
	PeerRoomCoordinator &operator=(const PeerRoomCoordinator &) = delete;

	// Session lifecycle
	bool start();
	void leave();

	// Operations exposed to the UI layer
	void switchTopology(Topology mode);
	void reconnectAll();
	size_t sendToAll(const std::string &message);
	std::string sendChatMessage(const std::string &text);
	bool toggleAudio();
	bool toggleVideo();

	// Dials peerId unless it is self or a media link to it already exists.
	void establishPeerConnection(const PeerId &peerId);

	// State
	const Roster &roster() const;
	std::vector<Participant> participants() const;
	size_t participantCount() const;
	const ConnectionRegistry &registry() const;
	const std::vector<PeerId> &knownPeerIds() const;
	const PeerId &localId() const;
	PeerId creatorId() const;
	bool isCreator() const;
	Topology topology() const;
	SessionState state() const;
	const std::optional<std::string> &connectionError() const;

	void setOnParticipantJoined(OnParticipantJoinedCallback callback);
	void setOnParticipantLeft(OnParticipantLeftCallback callback);
	void setOnChatMessage(OnChatMessageCallback callback);
	void setOnConnectionError(OnConnectionErrorCallback callback);

private:
	void wireTransport();

	// Transport events, on the loop thread
	void handleOpen(const PeerId &localId);
	void handleTransportError(const std::string &kind);
	void handleIncomingCall(const LinkPtr &link);
	void handleIncomingDataLink(const LinkPtr &link);
	void handleLinkOpen(const LinkPtr &link);
	void handleStream(const LinkPtr &link, const MediaStreamPtr &stream);
	void handleMessage(const LinkPtr &link, const std::string &raw);
	void handleLinkClosed(const LinkPtr &link);
	void handleLinkError(const LinkPtr &link, const std::string &kind);

	// Room messages
	void onPeerList(const std::vector<PeerId> &peers);
	void onNewPeer(const PeerId &peerId);
	void onRequestPeerList(const LinkPtr &link);
	void onPeerDisconnect(const PeerId &peerId);

	std::vector<PeerId> currentPeerList() const;
	void announceNewcomer(const LinkPtr &link);
	void sendPeerList(const LinkPtr &link);
	void broadcastPeerList();
	void requestPeerList();
	void redialCreator();
	void pruneToStar();
	void applyTopologyPlan(const TopologyPlan &plan);

	void rememberPeer(const PeerId &peerId);
	void forgetPeer(const PeerId &peerId);
	void keepDuplicate(const LinkPtr &link);
	bool dropDuplicate(const LinkPtr &link);
	bool promoteDuplicate(const LinkPtr &closed);
	void replaceStaleLink(const LinkPtr &link);
	void closeDuplicates(const PeerId &peerId);
	void removePeer(const PeerId &peerId, const char *reason);

	void startRebroadcast();
	void stopRebroadcast();
	void failSession(const std::string &error);

	EventLoop &loop_;
	PeerTransport &transport_;
	RoomSettings settings_;
	MediaStreamPtr localStream_;
	PeerId localId_;

	ConnectionRegistry registry_;
	Roster roster_;
	TopologyController topology_;

	// Ids announced by the creator; bookkeeping only, not membership.
	std::vector<PeerId> knownPeers_;
	// Links that lost a dial race: answered but never registered.
	std::map<PeerId, std::vector<LinkPtr>> duplicateLinks_;

	SessionState state_ = SessionState::Idle;
	std::optional<std::string> connectionError_;
	EventLoop::TimerId rebroadcastTimer_ = 0;

	// Guards tasks still queued on the loop after destruction.
	std::shared_ptr<bool> alive_;

	OnParticipantJoinedCallback onParticipantJoined_;
	OnParticipantLeftCallback onParticipantLeft_;
	OnChatMessageCallback onChatMessage_;
	OnConnectionErrorCallback onConnectionError_;
};

} // namespace peerroom
