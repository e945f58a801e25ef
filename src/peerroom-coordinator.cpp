/*
 * PeerRoom
 * Room session coordinator: roster, links, topology and room signaling
 */

#include "peerroom-coordinator.h"

#include <algorithm>
#include <utility>

#include "peerroom-utils.h"

namespace peerroom
{

namespace
{

const char *channelKindName(ChannelKind kind)
{
	return kind == ChannelKind::Data ? "data" : "media";
}

} // namespace

PeerRoomCoordinator::PeerRoomCoordinator(EventLoop &loop, PeerTransport &transport, RoomSettings settings,
                                         MediaStreamPtr localStream)
    : loop_(loop),
      transport_(transport),
      settings_(std::move(settings)),
      localStream_(std::move(localStream)),
      topology_(settings_.role, settings_.topology),
      alive_(std::make_shared<bool>(true))
{
	wireTransport();
}

PeerRoomCoordinator::~PeerRoomCoordinator()
{
	transport_.clearCallbacks();
	leave();
	alive_.reset();
}

void PeerRoomCoordinator::wireTransport()
{
	// Captured once here so transport threads never touch alive_ itself.
	std::weak_ptr<bool> alive = alive_;
	auto dispatch = [this, alive](EventLoop::Task task) {
		loop_.post([alive, task = std::move(task)]() {
			if (alive.lock()) {
				task();
			}
		});
	};

	transport_.setOnOpen([this, dispatch](const PeerId &localId) { dispatch([this, localId]() { handleOpen(localId); }); });
	transport_.setOnError([this, dispatch](const std::string &kind) { dispatch([this, kind]() { handleTransportError(kind); }); });
	transport_.setOnIncomingCall([this, dispatch](const LinkPtr &link) { dispatch([this, link]() { handleIncomingCall(link); }); });
	transport_.setOnIncomingDataLink(
	    [this, dispatch](const LinkPtr &link) { dispatch([this, link]() { handleIncomingDataLink(link); }); });
	transport_.setOnLinkOpen([this, dispatch](const LinkPtr &link) { dispatch([this, link]() { handleLinkOpen(link); }); });
	transport_.setOnLinkStream([this, dispatch](const LinkPtr &link, const MediaStreamPtr &stream) {
		dispatch([this, link, stream]() { handleStream(link, stream); });
	});
	transport_.setOnLinkMessage([this, dispatch](const LinkPtr &link, const std::string &message) {
		dispatch([this, link, message]() { handleMessage(link, message); });
	});
	transport_.setOnLinkClosed([this, dispatch](const LinkPtr &link) { dispatch([this, link]() { handleLinkClosed(link); }); });
	transport_.setOnLinkError([this, dispatch](const LinkPtr &link, const std::string &kind) {
		dispatch([this, link, kind]() { handleLinkError(link, kind); });
	});
}

bool PeerRoomCoordinator::start()
{
	if (state_ != SessionState::Idle) {
		logWarning("Session for room %s already started", settings_.roomId.c_str());
		return false;
	}

	std::string error;
	if (!isValidRoomId(settings_.roomId, &error)) {
		failSession("Invalid room id: " + error);
		return false;
	}

	localId_ = isCreator() ? makeCreatorPeerId(settings_.roomId)
	                       : generateJoinerPeerId(settings_.roomId, []() { return generatePeerSuffix(); });
	state_ = SessionState::Opening;

	logInfo("Opening %s %s in room %s (%s)", isCreator() ? "creator" : "joiner", localId_.c_str(),
	        settings_.roomId.c_str(), topologyName(topology_.mode()));

	if (!transport_.createPeer(localId_, settings_.transport)) {
		failSession("Connection error: could not register " + localId_);
		return false;
	}
	return true;
}

void PeerRoomCoordinator::leave()
{
	if (state_ == SessionState::Closed) {
		return;
	}

	const bool wasOpen = state_ == SessionState::Open;
	stopRebroadcast();

	if (wasOpen) {
		const std::string goodbye = createPeerDisconnectMessage(localId_, loop_.now());
		for (const auto &link : registry_.openDataLinks()) {
			transport_.send(link, goodbye);
		}
	}

	std::vector<LinkPtr> links;
	registry_.forEach([&links](const PeerId &, const LinkEntry &entry) {
		if (entry.dataLink) {
			links.push_back(entry.dataLink);
		}
		if (entry.mediaLink) {
			links.push_back(entry.mediaLink);
		}
	});
	registry_.clear();
	for (const auto &link : links) {
		transport_.close(link);
	}
	for (const auto &pair : duplicateLinks_) {
		for (const auto &link : pair.second) {
			transport_.close(link);
		}
	}
	duplicateLinks_.clear();
	roster_.clear();
	knownPeers_.clear();

	if (state_ != SessionState::Idle) {
		transport_.destroy();
	}
	state_ = SessionState::Closed;
	logInfo("Left room %s", settings_.roomId.c_str());
}

void PeerRoomCoordinator::switchTopology(Topology mode)
{
	const bool creatorLinkOpen = registry_.isOpen(creatorId(), ChannelKind::Data);
	const TopologyPlan plan = topology_.switchTo(mode, creatorLinkOpen);
	if (!plan.changed) {
		return;
	}
	if (state_ != SessionState::Open) {
		logDebug("Topology recorded; session not open yet");
		return;
	}
	applyTopologyPlan(plan);
}

void PeerRoomCoordinator::reconnectAll()
{
	if (state_ != SessionState::Open) {
		logWarning("Cannot reconnect: session is not open");
		return;
	}

	logInfo("Reconnecting to room %s", settings_.roomId.c_str());
	if (isCreator()) {
		broadcastPeerList();
	} else if (registry_.isOpen(creatorId(), ChannelKind::Data)) {
		requestPeerList();
	} else {
		redialCreator();
	}
}

size_t PeerRoomCoordinator::sendToAll(const std::string &message)
{
	size_t sent = 0;
	for (const auto &link : registry_.openDataLinks()) {
		if (transport_.send(link, message)) {
			sent++;
		} else {
			logWarning("Failed to send to %s", link->peerId().c_str());
		}
	}
	return sent;
}

std::string PeerRoomCoordinator::sendChatMessage(const std::string &text)
{
	const std::string envelope = createChatMessage(localId_, text, loop_.now());
	const size_t sent = sendToAll(envelope);
	logDebug("Chat message delivered to %zu peers", sent);
	return envelope;
}

bool PeerRoomCoordinator::toggleAudio()
{
	if (!localStream_) {
		logWarning("No local stream to toggle audio on");
		return false;
	}
	const bool enabled = !localStream_->audioEnabled();
	localStream_->setAudioEnabled(enabled);
	logInfo("Local audio %s", enabled ? "on" : "muted");
	return enabled;
}

bool PeerRoomCoordinator::toggleVideo()
{
	if (!localStream_) {
		logWarning("No local stream to toggle video on");
		return false;
	}
	const bool enabled = !localStream_->videoEnabled();
	localStream_->setVideoEnabled(enabled);
	logInfo("Local video %s", enabled ? "on" : "off");
	return enabled;
}

void PeerRoomCoordinator::establishPeerConnection(const PeerId &peerId)
{
	if (state_ != SessionState::Open) {
		logDebug("Not dialing %s: session is not open", peerId.c_str());
		return;
	}
	if (peerId.empty() || peerId == localId_) {
		return;
	}
	if (registry_.has(peerId, ChannelKind::Media)) {
		return;
	}

	logInfo("Dialing %s", peerId.c_str());
	const int64_t now = loop_.now();

	if (!registry_.has(peerId, ChannelKind::Data)) {
		LinkPtr data = transport_.connect(peerId);
		if (data) {
			registry_.upsertDataChannel(peerId, data, now);
		} else {
			logWarning("Could not open data link to %s", peerId.c_str());
		}
	}

	LinkPtr media = transport_.call(peerId, localStream_);
	if (media) {
		registry_.upsertMediaChannel(peerId, media, now);
	} else {
		logWarning("Could not place call to %s", peerId.c_str());
	}
}

const Roster &PeerRoomCoordinator::roster() const
{
	return roster_;
}

std::vector<Participant> PeerRoomCoordinator::participants() const
{
	return roster_.list();
}

size_t PeerRoomCoordinator::participantCount() const
{
	return roster_.size() + 1;
}

const ConnectionRegistry &PeerRoomCoordinator::registry() const
{
	return registry_;
}

const std::vector<PeerId> &PeerRoomCoordinator::knownPeerIds() const
{
	return knownPeers_;
}

const PeerId &PeerRoomCoordinator::localId() const
{
	return localId_;
}

PeerId PeerRoomCoordinator::creatorId() const
{
	return makeCreatorPeerId(settings_.roomId);
}

bool PeerRoomCoordinator::isCreator() const
{
	return settings_.role == PeerRole::Creator;
}

Topology PeerRoomCoordinator::topology() const
{
	return topology_.mode();
}

SessionState PeerRoomCoordinator::state() const
{
	return state_;
}

const std::optional<std::string> &PeerRoomCoordinator::connectionError() const
{
	return connectionError_;
}

void PeerRoomCoordinator::setOnParticipantJoined(OnParticipantJoinedCallback callback)
{
	onParticipantJoined_ = std::move(callback);
}

void PeerRoomCoordinator::setOnParticipantLeft(OnParticipantLeftCallback callback)
{
	onParticipantLeft_ = std::move(callback);
}

void PeerRoomCoordinator::setOnChatMessage(OnChatMessageCallback callback)
{
	onChatMessage_ = std::move(callback);
}

void PeerRoomCoordinator::setOnConnectionError(OnConnectionErrorCallback callback)
{
	onConnectionError_ = std::move(callback);
}

void PeerRoomCoordinator::handleOpen(const PeerId &localId)
{
	if (state_ != SessionState::Opening) {
		logDebug("Ignoring open event in state %d", static_cast<int>(state_));
		return;
	}
	if (localId != localId_) {
		logWarning("Transport opened as %s, expected %s", localId.c_str(), localId_.c_str());
	}

	state_ = SessionState::Open;
	logInfo("Registered as %s", localId_.c_str());

	if (isCreator()) {
		startRebroadcast();
	} else {
		establishPeerConnection(creatorId());
	}
}

void PeerRoomCoordinator::handleTransportError(const std::string &kind)
{
	if (state_ != SessionState::Opening && state_ != SessionState::Open) {
		logDebug("Ignoring transport error after session end: %s", kind.c_str());
		return;
	}
	failSession("Connection error: " + kind);
}

void PeerRoomCoordinator::handleIncomingCall(const LinkPtr &link)
{
	const PeerId &peerId = link->peerId();
	if (state_ != SessionState::Open || peerId == localId_) {
		logDebug("Rejecting call from %s", peerId.c_str());
		transport_.close(link);
		return;
	}

	if (!registry_.upsertMediaChannel(peerId, link, loop_.now(), true)) {
		if (registry_.isInbound(peerId, ChannelKind::Media)) {
			replaceStaleLink(link);
		} else {
			logDebug("Answering duplicate call from %s", peerId.c_str());
			keepDuplicate(link);
		}
	}
	transport_.answer(link, localStream_);
}

void PeerRoomCoordinator::handleIncomingDataLink(const LinkPtr &link)
{
	const PeerId &peerId = link->peerId();
	if (state_ != SessionState::Open || peerId == localId_) {
		logDebug("Rejecting data link from %s", peerId.c_str());
		transport_.close(link);
		return;
	}

	if (!registry_.upsertDataChannel(peerId, link, loop_.now(), true)) {
		if (registry_.isInbound(peerId, ChannelKind::Data)) {
			replaceStaleLink(link);
		} else {
			logDebug("Accepting duplicate data link from %s", peerId.c_str());
			keepDuplicate(link);
		}
	}
}

void PeerRoomCoordinator::handleLinkOpen(const LinkPtr &link)
{
	if (state_ != SessionState::Open) {
		return;
	}

	registry_.touch(link->peerId(), loop_.now());
	logDebug("%s link open with %s", channelKindName(link->kind()), link->peerId().c_str());

	if (link->kind() == ChannelKind::Data && isCreator() && registry_.holds(link)) {
		announceNewcomer(link);
	}
}

void PeerRoomCoordinator::handleStream(const LinkPtr &link, const MediaStreamPtr &stream)
{
	if (state_ != SessionState::Open) {
		return;
	}

	const PeerId &peerId = link->peerId();
	if (peerId == localId_ || !registry_.contains(peerId)) {
		logDebug("Ignoring stream from unregistered peer %s", peerId.c_str());
		return;
	}
	registry_.touch(peerId, loop_.now());

	Participant participant;
	participant.id = peerId;
	participant.isCreator = isCreatorPeerId(peerId);
	participant.stream = stream;

	if (!roster_.add(participant)) {
		logDebug("Stream from %s already in roster", peerId.c_str());
		return;
	}

	logInfo("Participant joined: %s (%zu in room)", peerId.c_str(), participantCount());
	if (onParticipantJoined_) {
		onParticipantJoined_(participant);
	}
}

void PeerRoomCoordinator::handleMessage(const LinkPtr &link, const std::string &raw)
{
	if (state_ != SessionState::Open) {
		return;
	}

	registry_.touch(link->peerId(), loop_.now());

	RoomMessage message;
	std::string error;
	if (!parseRoomMessage(raw, message, &error)) {
		logDebug("Ignoring malformed message from %s: %s", link->peerId().c_str(), error.c_str());
		return;
	}

	switch (message.kind) {
	case RoomMessageKind::PeerList:
		onPeerList(message.peers);
		break;
	case RoomMessageKind::NewPeer:
		onNewPeer(message.peerId);
		break;
	case RoomMessageKind::RequestPeerList:
		onRequestPeerList(link);
		break;
	case RoomMessageKind::PeerDisconnect:
		onPeerDisconnect(message.peerId);
		break;
	case RoomMessageKind::ChatMessage:
		if (onChatMessage_) {
			onChatMessage_(message.sender.empty() ? link->peerId() : message.sender, message.text,
			               message.timestamp);
		}
		break;
	case RoomMessageKind::Unknown:
		logDebug("Ignoring message of type '%s' from %s", message.type.c_str(), link->peerId().c_str());
		break;
	}
}

void PeerRoomCoordinator::handleLinkClosed(const LinkPtr &link)
{
	if (dropDuplicate(link)) {
		logDebug("Duplicate %s link with %s closed", channelKindName(link->kind()), link->peerId().c_str());
		return;
	}
	if (!registry_.holds(link)) {
		return;
	}
	if (promoteDuplicate(link)) {
		return;
	}
	removePeer(link->peerId(), "link closed");
}

void PeerRoomCoordinator::handleLinkError(const LinkPtr &link, const std::string &kind)
{
	logWarning("%s link error with %s: %s", channelKindName(link->kind()), link->peerId().c_str(), kind.c_str());
	transport_.close(link);
	handleLinkClosed(link);
}

void PeerRoomCoordinator::onPeerList(const std::vector<PeerId> &peers)
{
	knownPeers_.clear();
	for (const auto &peerId : peers) {
		if (peerId.empty() || peerId == localId_) {
			continue;
		}
		rememberPeer(peerId);

		if (registry_.contains(peerId) || !topology_.permitsDial()) {
			continue;
		}
		establishPeerConnection(peerId);
	}

	if (topology_.mode() == Topology::Star && !isCreator()) {
		pruneToStar();
	}
}

void PeerRoomCoordinator::onNewPeer(const PeerId &peerId)
{
	if (peerId.empty() || peerId == localId_) {
		return;
	}
	rememberPeer(peerId);

	if (!topology_.permitsDial()) {
		logDebug("Not dialing %s in %s topology", peerId.c_str(), topologyName(topology_.mode()));
		return;
	}
	establishPeerConnection(peerId);
}

void PeerRoomCoordinator::onRequestPeerList(const LinkPtr &link)
{
	if (!isCreator()) {
		logDebug("Ignoring peer list request from %s", link->peerId().c_str());
		return;
	}
	sendPeerList(link);
}

void PeerRoomCoordinator::onPeerDisconnect(const PeerId &peerId)
{
	if (peerId.empty() || peerId == localId_) {
		return;
	}
	forgetPeer(peerId);
	removePeer(peerId, "peer disconnected");
}

std::vector<PeerId> PeerRoomCoordinator::currentPeerList() const
{
	std::vector<PeerId> peers;
	peers.push_back(localId_);
	auto append = [&peers](const PeerId &peerId) {
		if (std::find(peers.begin(), peers.end(), peerId) == peers.end()) {
			peers.push_back(peerId);
		}
	};
	for (const auto &participant : roster_) {
		append(participant.id);
	}
	for (const auto &peerId : registry_.peerIds()) {
		append(peerId);
	}
	return peers;
}

void PeerRoomCoordinator::announceNewcomer(const LinkPtr &link)
{
	const PeerId &newcomer = link->peerId();
	sendPeerList(link);

	const std::string announcement = createNewPeerMessage(newcomer, loop_.now());
	for (const auto &other : registry_.openDataLinks()) {
		if (other->peerId() != newcomer) {
			transport_.send(other, announcement);
		}
	}
	logInfo("Announced %s to the room", newcomer.c_str());
}

void PeerRoomCoordinator::sendPeerList(const LinkPtr &link)
{
	const std::string message = createPeerListMessage(currentPeerList(), loop_.now());
	if (!transport_.send(link, message)) {
		logWarning("Failed to send peer list to %s", link->peerId().c_str());
	}
}

void PeerRoomCoordinator::broadcastPeerList()
{
	const std::vector<PeerId> peers = currentPeerList();
	const size_t sent = sendToAll(createPeerListMessage(peers, loop_.now()));
	logDebug("Broadcast peer list (%zu peers) to %zu links", peers.size(), sent);
}

void PeerRoomCoordinator::requestPeerList()
{
	LinkPtr link = registry_.dataLink(creatorId());
	if (!link || !link->isOpen()) {
		redialCreator();
		return;
	}
	if (!transport_.send(link, createRequestPeerListMessage(loop_.now()))) {
		logWarning("Failed to request peer list from %s", link->peerId().c_str());
	}
}

void PeerRoomCoordinator::redialCreator()
{
	const PeerId creator = creatorId();
	logInfo("Redialing creator %s", creator.c_str());
	removePeer(creator, "redial");
	establishPeerConnection(creator);
}

void PeerRoomCoordinator::pruneToStar()
{
	for (const auto &peerId : registry_.peerIds()) {
		if (topology_.shouldPrune(peerId)) {
			removePeer(peerId, "star topology");
		}
	}
}

void PeerRoomCoordinator::applyTopologyPlan(const TopologyPlan &plan)
{
	if (plan.pruneNonCreatorPeers) {
		pruneToStar();
	}
	if (plan.requestPeerList) {
		requestPeerList();
	}
	if (plan.redialCreator) {
		redialCreator();
	}
}

void PeerRoomCoordinator::rememberPeer(const PeerId &peerId)
{
	if (std::find(knownPeers_.begin(), knownPeers_.end(), peerId) == knownPeers_.end()) {
		knownPeers_.push_back(peerId);
	}
}

void PeerRoomCoordinator::forgetPeer(const PeerId &peerId)
{
	knownPeers_.erase(std::remove(knownPeers_.begin(), knownPeers_.end(), peerId), knownPeers_.end());
}

void PeerRoomCoordinator::keepDuplicate(const LinkPtr &link)
{
	duplicateLinks_[link->peerId()].push_back(link);
}

bool PeerRoomCoordinator::dropDuplicate(const LinkPtr &link)
{
	auto it = duplicateLinks_.find(link->peerId());
	if (it == duplicateLinks_.end()) {
		return false;
	}
	auto &links = it->second;
	auto pos = std::find(links.begin(), links.end(), link);
	if (pos == links.end()) {
		return false;
	}
	links.erase(pos);
	if (links.empty()) {
		duplicateLinks_.erase(it);
	}
	return true;
}

// A peer only dials us again after dropping the link it dialed before, so
// the older inbound link is dead even if its close has not reached us yet.
void PeerRoomCoordinator::replaceStaleLink(const LinkPtr &link)
{
	LinkPtr stale = registry_.replace(link->peerId(), link, loop_.now(), true);
	logInfo("%s re-dialed; replacing its %s link", link->peerId().c_str(), channelKindName(link->kind()));
	if (stale) {
		transport_.close(stale);
	}
}

bool PeerRoomCoordinator::promoteDuplicate(const LinkPtr &closed)
{
	auto it = duplicateLinks_.find(closed->peerId());
	if (it == duplicateLinks_.end()) {
		return false;
	}

	auto &links = it->second;
	auto pick = links.end();
	for (auto pos = links.begin(); pos != links.end(); ++pos) {
		if ((*pos)->kind() != closed->kind()) {
			continue;
		}
		if (pick == links.end() || (!(*pick)->isOpen() && (*pos)->isOpen())) {
			pick = pos;
		}
	}
	if (pick == links.end()) {
		return false;
	}

	LinkPtr promoted = *pick;
	links.erase(pick);
	if (links.empty()) {
		duplicateLinks_.erase(it);
	}

	registry_.replace(promoted->peerId(), promoted, loop_.now(), true);
	logInfo("%s link with %s closed; keeping its duplicate", channelKindName(promoted->kind()),
	        promoted->peerId().c_str());

	// A duplicate that is still connecting gets its fan-out from handleLinkOpen.
	if (promoted->kind() == ChannelKind::Data && promoted->isOpen() && isCreator()) {
		announceNewcomer(promoted);
	}
	return true;
}

void PeerRoomCoordinator::closeDuplicates(const PeerId &peerId)
{
	auto it = duplicateLinks_.find(peerId);
	if (it == duplicateLinks_.end()) {
		return;
	}
	std::vector<LinkPtr> links = std::move(it->second);
	duplicateLinks_.erase(it);
	for (const auto &link : links) {
		transport_.close(link);
	}
}

void PeerRoomCoordinator::removePeer(const PeerId &peerId, const char *reason)
{
	LinkEntry entry;
	const bool hadLinks = registry_.remove(peerId, &entry);
	if (entry.dataLink) {
		transport_.close(entry.dataLink);
	}
	if (entry.mediaLink) {
		transport_.close(entry.mediaLink);
	}
	closeDuplicates(peerId);

	const bool wasParticipant = roster_.remove(peerId);
	if (hadLinks || wasParticipant) {
		logInfo("Removed %s (%s)", peerId.c_str(), reason);
	}
	if (wasParticipant && onParticipantLeft_) {
		onParticipantLeft_(peerId);
	}
}

void PeerRoomCoordinator::startRebroadcast()
{
	stopRebroadcast();

	std::weak_ptr<bool> alive = alive_;
	rebroadcastTimer_ = loop_.scheduleRepeating(settings_.rebroadcastIntervalMs, [this, alive]() {
		if (alive.lock()) {
			broadcastPeerList();
		}
	});
}

void PeerRoomCoordinator::stopRebroadcast()
{
	if (rebroadcastTimer_ != 0) {
		loop_.cancelTimer(rebroadcastTimer_);
		rebroadcastTimer_ = 0;
	}
}

void PeerRoomCoordinator::failSession(const std::string &error)
{
	if (connectionError_) {
		return;
	}

	connectionError_ = error;
	state_ = SessionState::Failed;
	stopRebroadcast();
	logError("%s", error.c_str());

	if (onConnectionError_) {
		onConnectionError_(error);
	}
}

} // namespace peerroom
