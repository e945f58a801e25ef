/*
 * PeerRoom
 * PeerTransport over libdatachannel, negotiated through the rendezvous server
 */

#include "peerroom-rtc-transport.h"

#include <rtc/rtc.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <random>

#include "peerroom-utils.h"

namespace peerroom
{

struct RtcLink : public TransportLink {
	RtcLink(PeerId peer, ChannelKind channel, std::string id)
	    : peerId_(std::move(peer)), kind_(channel), connectionId_(std::move(id))
	{
	}

	const PeerId &peerId() const override { return peerId_; }
	ChannelKind kind() const override { return kind_; }
	const std::string &connectionId() const override { return connectionId_; }
	bool isOpen() const override { return open.load(); }

	PeerId peerId_;
	ChannelKind kind_;
	std::string connectionId_;

	std::shared_ptr<rtc::PeerConnection> pc;
	std::shared_ptr<rtc::DataChannel> dataChannel;
	std::shared_ptr<rtc::Track> audioTrack;
	std::shared_ptr<rtc::Track> videoTrack;
	MediaStreamPtr remoteStream;

	std::atomic<bool> open{false};
	std::atomic<bool> closed{false};

	std::mutex candidateMutex;
	bool remoteDescriptionSet = false;
	std::vector<rtc::Candidate> pendingCandidates;
};

namespace
{

constexpr int kOpusPayloadType = 111;
constexpr int kH264PayloadType = 96;

void initRtcLogging()
{
	static std::once_flag once;
	std::call_once(once, []() {
		rtc::InitLogger(rtc::LogLevel::Warning, [](rtc::LogLevel level, std::string message) {
			switch (level) {
			case rtc::LogLevel::Fatal:
			case rtc::LogLevel::Error:
				logError("rtc: %s", message.c_str());
				break;
			case rtc::LogLevel::Warning:
				logWarning("rtc: %s", message.c_str());
				break;
			default:
				logDebug("rtc: %s", message.c_str());
				break;
			}
		});
	});
}

uint32_t randomSsrc()
{
	thread_local std::mt19937 gen{std::random_device{}()};
	std::uniform_int_distribution<uint32_t> dis(1, 0xFFFFFFFF);
	return dis(gen);
}

// The callback that is currently running the close is left in place; it
// cannot be reset from inside itself.
void clearLinkCallbacks(const std::shared_ptr<RtcLink> &link, LinkCloseOrigin origin)
{
	if (!link || !link->pc) {
		return;
	}

	try {
		if (origin != LinkCloseOrigin::StateChange) {
			link->pc->onStateChange(nullptr);
		}
		link->pc->onLocalCandidate(nullptr);
		link->pc->onGatheringStateChange(nullptr);
		link->pc->onTrack(nullptr);
		link->pc->onDataChannel(nullptr);
	} catch (const std::exception &e) {
		logDebug("Failed to clear callbacks for %s: %s", link->connectionId().c_str(), e.what());
	}

	if (link->dataChannel) {
		try {
			link->dataChannel->onOpen(nullptr);
			if (origin != LinkCloseOrigin::ChannelClosed) {
				link->dataChannel->onClosed(nullptr);
			}
			link->dataChannel->onMessage(nullptr);
		} catch (const std::exception &e) {
			logDebug("Failed to clear data channel callbacks for %s: %s", link->connectionId().c_str(),
			         e.what());
		}
	}
}

} // namespace

PeerRoomRtcTransport::PeerRoomRtcTransport()
{
	initRtcLogging();
	rendezvous_.setOnOpen([this](const PeerId &localId) { emitOpen(localId); });
	rendezvous_.setOnError([this](const std::string &kind, const std::string &detail) {
		logDebug("Rendezvous failure detail: %s", detail.c_str());
		emitError(kind);
	});
	rendezvous_.setOnSignal([this](const RendezvousMessage &message) { onSignal(message); });
}

PeerRoomRtcTransport::~PeerRoomRtcTransport()
{
	clearCallbacks();
	destroy();
	rendezvous_.setOnOpen(nullptr);
	rendezvous_.setOnError(nullptr);
	rendezvous_.setOnSignal(nullptr);
}

bool PeerRoomRtcTransport::createPeer(const PeerId &localId, const TransportConfig &config)
{
	if (localId.empty()) {
		logError("Cannot register an empty peer id");
		return false;
	}

	shuttingDown_ = false;
	localId_ = localId;
	config_ = config;
	return rendezvous_.connect(config_.rendezvousUrl, config_.rendezvousKey, localId_);
}

rtc::Configuration PeerRoomRtcTransport::getRtcConfig() const
{
	rtc::Configuration config;
	config.disableAutoNegotiation = true;
	bool hasTurnServer = false;

	auto hasTurnScheme = [](const std::string &url) {
		const std::string lower = asciiLower(url);
		return lower.rfind("turn:", 0) == 0 || lower.rfind("turns:", 0) == 0;
	};

	if (config_.iceServers.empty()) {
		for (const auto &stun : DEFAULT_STUN_SERVERS) {
			config.iceServers.emplace_back(stun);
		}
	} else {
		for (const auto &server : config_.iceServers) {
			rtc::IceServer iceServer(server.urls);
			if (!server.username.empty()) {
				iceServer.username = server.username;
				iceServer.password = server.credential;
			}
			config.iceServers.push_back(iceServer);
			if (hasTurnScheme(server.urls)) {
				hasTurnServer = true;
			}
		}
	}

	if (config_.forceTurn) {
		config.iceTransportPolicy = rtc::TransportPolicy::Relay;
		if (!hasTurnServer) {
			logWarning("Force TURN is enabled but no TURN servers are configured; connections may fail.");
		}
	}

	return config;
}

std::shared_ptr<RtcLink> PeerRoomRtcTransport::createLink(const PeerId &peerId, ChannelKind kind,
                                                          const std::string &connectionId)
{
	auto link = std::make_shared<RtcLink>(peerId, kind, connectionId);
	link->pc = std::make_shared<rtc::PeerConnection>(getRtcConfig());
	setupPeerConnectionCallbacks(link);

	{
		std::lock_guard<std::mutex> lock(linksMutex_);
		links_[connectionId] = link;
	}

	logDebug("Created %s link %s to %s", kind == ChannelKind::Data ? "data" : "media", connectionId.c_str(),
	         peerId.c_str());
	return link;
}

void PeerRoomRtcTransport::setupPeerConnectionCallbacks(const std::shared_ptr<RtcLink> &link)
{
	std::weak_ptr<RtcLink> weakLink = link;

	link->pc->onStateChange([this, weakLink](rtc::PeerConnection::State state) {
		if (shuttingDown_) {
			return;
		}
		auto link = weakLink.lock();
		if (!link) {
			return;
		}

		switch (state) {
		case rtc::PeerConnection::State::Connected:
			logInfo("Link %s to %s connected", link->connectionId().c_str(), link->peerId().c_str());
			if (link->kind() == ChannelKind::Media) {
				markOpen(link);
			}
			break;
		case rtc::PeerConnection::State::Failed:
			logWarning("Link %s to %s failed", link->connectionId().c_str(), link->peerId().c_str());
			emitLinkError(link, "connection-failed");
			closeLink(link, LinkCloseOrigin::StateChange);
			break;
		case rtc::PeerConnection::State::Disconnected:
		case rtc::PeerConnection::State::Closed:
			closeLink(link, LinkCloseOrigin::StateChange);
			break;
		default:
			break;
		}
	});

	link->pc->onLocalCandidate([this, weakLink](rtc::Candidate candidate) {
		if (shuttingDown_) {
			return;
		}
		auto link = weakLink.lock();
		if (!link) {
			return;
		}
		rendezvous_.sendCandidate(link->peerId(), link->kind(), link->connectionId(), std::string(candidate),
		                          candidate.mid());
	});

	link->pc->onTrack([weakLink](std::shared_ptr<rtc::Track> track) {
		auto link = weakLink.lock();
		if (!link) {
			return;
		}
		if (track->description().type() == "audio") {
			link->audioTrack = track;
		} else {
			link->videoTrack = track;
		}
		logDebug("Received %s track on %s", track->description().type().c_str(), link->connectionId().c_str());
	});

	link->pc->onDataChannel([this, weakLink](std::shared_ptr<rtc::DataChannel> dc) {
		if (shuttingDown_) {
			return;
		}
		auto link = weakLink.lock();
		if (!link) {
			return;
		}
		link->dataChannel = dc;
		setupDataChannel(link);
		if (dc->isOpen()) {
			markOpen(link);
		}
	});
}

void PeerRoomRtcTransport::setupDataChannel(const std::shared_ptr<RtcLink> &link)
{
	std::weak_ptr<RtcLink> weakLink = link;

	link->dataChannel->onOpen([this, weakLink]() {
		if (auto link = weakLink.lock()) {
			markOpen(link);
		}
	});

	link->dataChannel->onClosed([this, weakLink]() {
		if (shuttingDown_) {
			return;
		}
		if (auto link = weakLink.lock()) {
			closeLink(link, LinkCloseOrigin::ChannelClosed);
		}
	});

	link->dataChannel->onMessage([this, weakLink](auto data) {
		if (shuttingDown_) {
			return;
		}
		auto link = weakLink.lock();
		if (!link) {
			return;
		}
		if (std::holds_alternative<std::string>(data)) {
			emitLinkMessage(link, std::get<std::string>(data));
		} else {
			logDebug("Ignoring binary message on %s", link->connectionId().c_str());
		}
	});
}

void PeerRoomRtcTransport::addMediaTracks(const std::shared_ptr<RtcLink> &link)
{
	rtc::Description::Audio audioDesc("audio", rtc::Description::Direction::SendRecv);
	audioDesc.addOpusCodec(kOpusPayloadType);
	audioDesc.addSSRC(randomSsrc(), "audio-" + link->connectionId());
	link->audioTrack = link->pc->addTrack(audioDesc);

	rtc::Description::Video videoDesc("video", rtc::Description::Direction::SendRecv);
	videoDesc.addH264Codec(kH264PayloadType);
	videoDesc.addSSRC(randomSsrc(), "video-" + link->connectionId());
	link->videoTrack = link->pc->addTrack(videoDesc);
}

void PeerRoomRtcTransport::sendLocalDescription(const std::shared_ptr<RtcLink> &link)
{
	auto localDesc = link->pc->localDescription();
	if (!localDesc) {
		logError("No local description for %s", link->connectionId().c_str());
		return;
	}

	if (localDesc->type() == rtc::Description::Type::Offer) {
		rendezvous_.sendOffer(link->peerId(), link->kind(), link->connectionId(), std::string(*localDesc));
	} else {
		rendezvous_.sendAnswer(link->peerId(), link->kind(), link->connectionId(), std::string(*localDesc));
	}
}

void PeerRoomRtcTransport::flushPendingCandidates(const std::shared_ptr<RtcLink> &link)
{
	std::vector<rtc::Candidate> pending;
	{
		std::lock_guard<std::mutex> lock(link->candidateMutex);
		link->remoteDescriptionSet = true;
		pending.swap(link->pendingCandidates);
	}

	for (const auto &candidate : pending) {
		try {
			link->pc->addRemoteCandidate(candidate);
		} catch (const std::exception &e) {
			logWarning("Failed to add candidate on %s: %s", link->connectionId().c_str(), e.what());
		}
	}
}

void PeerRoomRtcTransport::markOpen(const std::shared_ptr<RtcLink> &link)
{
	if (link->closed || link->open.exchange(true)) {
		return;
	}

	emitLinkOpen(link);
	if (link->kind() == ChannelKind::Media) {
		link->remoteStream = std::make_shared<MediaStream>(link->connectionId());
		emitLinkStream(link, link->remoteStream);
	}
}

void PeerRoomRtcTransport::closeLink(const std::shared_ptr<RtcLink> &link, LinkCloseOrigin origin)
{
	if (link->closed.exchange(true)) {
		return;
	}

	{
		std::lock_guard<std::mutex> lock(linksMutex_);
		links_.erase(link->connectionId());
	}

	link->open = false;
	clearLinkCallbacks(link, origin);
	try {
		if (link->dataChannel) {
			link->dataChannel->close();
		}
		link->pc->close();
	} catch (const std::exception &e) {
		logDebug("Error closing %s: %s", link->connectionId().c_str(), e.what());
	}

	logInfo("Link %s to %s closed", link->connectionId().c_str(), link->peerId().c_str());
	if (!shuttingDown_) {
		emitLinkClosed(link);
	}
}

std::shared_ptr<RtcLink> PeerRoomRtcTransport::findLink(const std::string &connectionId) const
{
	std::lock_guard<std::mutex> lock(linksMutex_);
	auto it = links_.find(connectionId);
	return it == links_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<RtcLink>> PeerRoomRtcTransport::linksTo(const PeerId &peerId) const
{
	std::vector<std::shared_ptr<RtcLink>> result;
	std::lock_guard<std::mutex> lock(linksMutex_);
	for (const auto &pair : links_) {
		if (pair.second->peerId() == peerId) {
			result.push_back(pair.second);
		}
	}
	return result;
}

LinkPtr PeerRoomRtcTransport::connect(const PeerId &peerId)
{
	if (!rendezvous_.isRegistered()) {
		logWarning("Cannot connect to %s before registration", peerId.c_str());
		return nullptr;
	}

	try {
		auto link = createLink(peerId, ChannelKind::Data, generateConnectionId(ChannelKind::Data));
		rtc::DataChannelInit init;
		init.reliability.unordered = false;
		link->dataChannel = link->pc->createDataChannel(link->connectionId(), init);
		setupDataChannel(link);
		link->pc->setLocalDescription(rtc::Description::Type::Offer);
		sendLocalDescription(link);
		return link;
	} catch (const std::exception &e) {
		logError("Failed to open data link to %s: %s", peerId.c_str(), e.what());
		return nullptr;
	}
}

LinkPtr PeerRoomRtcTransport::call(const PeerId &peerId, const MediaStreamPtr &localStream)
{
	if (!rendezvous_.isRegistered()) {
		logWarning("Cannot call %s before registration", peerId.c_str());
		return nullptr;
	}

	try {
		auto link = createLink(peerId, ChannelKind::Media, generateConnectionId(ChannelKind::Media));
		addMediaTracks(link);
		link->pc->setLocalDescription(rtc::Description::Type::Offer);
		sendLocalDescription(link);
		logDebug("Calling %s with stream %s", peerId.c_str(), localStream ? localStream->id().c_str() : "(none)");
		return link;
	} catch (const std::exception &e) {
		logError("Failed to call %s: %s", peerId.c_str(), e.what());
		return nullptr;
	}
}

void PeerRoomRtcTransport::answer(const LinkPtr &link, const MediaStreamPtr &localStream)
{
	auto rtcLink = findLink(link->connectionId());
	if (!rtcLink || rtcLink->kind() != ChannelKind::Media) {
		logWarning("No pending call %s to answer", link->connectionId().c_str());
		return;
	}

	try {
		rtcLink->pc->setLocalDescription(rtc::Description::Type::Answer);
		sendLocalDescription(rtcLink);
		logDebug("Answered %s with stream %s", link->connectionId().c_str(),
		         localStream ? localStream->id().c_str() : "(none)");
	} catch (const std::exception &e) {
		logError("Failed to answer %s: %s", link->connectionId().c_str(), e.what());
		emitLinkError(rtcLink, "negotiation-failed");
		closeLink(rtcLink);
	}
}

bool PeerRoomRtcTransport::send(const LinkPtr &link, const std::string &message)
{
	auto rtcLink = findLink(link->connectionId());
	if (!rtcLink || !rtcLink->dataChannel || !rtcLink->dataChannel->isOpen()) {
		return false;
	}

	try {
		return rtcLink->dataChannel->send(message);
	} catch (const std::exception &e) {
		logWarning("Failed to send on %s: %s", link->connectionId().c_str(), e.what());
		return false;
	}
}

void PeerRoomRtcTransport::close(const LinkPtr &link)
{
	if (auto rtcLink = findLink(link->connectionId())) {
		closeLink(rtcLink);
	}
}

void PeerRoomRtcTransport::destroy()
{
	shuttingDown_ = true;

	std::map<std::string, std::shared_ptr<RtcLink>> links;
	{
		std::lock_guard<std::mutex> lock(linksMutex_);
		links.swap(links_);
	}

	std::vector<PeerId> notified;
	for (auto &pair : links) {
		const PeerId &peerId = pair.second->peerId();
		if (rendezvous_.isRegistered() && std::find(notified.begin(), notified.end(), peerId) == notified.end()) {
			rendezvous_.sendLeave(peerId);
			notified.push_back(peerId);
		}
		closeLink(pair.second);
	}

	rendezvous_.disconnect();
}

size_t PeerRoomRtcTransport::linkCount() const
{
	std::lock_guard<std::mutex> lock(linksMutex_);
	return links_.size();
}

void PeerRoomRtcTransport::onSignal(const RendezvousMessage &message)
{
	if (shuttingDown_) {
		return;
	}

	switch (message.kind) {
	case RendezvousMessageKind::Offer:
		onRemoteOffer(message);
		break;
	case RendezvousMessageKind::Answer:
		onRemoteAnswer(message);
		break;
	case RendezvousMessageKind::Candidate:
		onRemoteCandidate(message);
		break;
	case RendezvousMessageKind::Leave:
		onRemoteGone(message.src, false);
		break;
	case RendezvousMessageKind::Expire:
		onRemoteGone(message.src, true);
		break;
	default:
		break;
	}
}

void PeerRoomRtcTransport::onRemoteOffer(const RendezvousMessage &message)
{
	if (findLink(message.connectionId)) {
		logWarning("Ignoring renegotiation offer on %s", message.connectionId.c_str());
		return;
	}

	std::shared_ptr<RtcLink> link;
	try {
		link = createLink(message.src, message.channel, message.connectionId);
		link->pc->setRemoteDescription(rtc::Description(message.sdp, rtc::Description::Type::Offer));
		flushPendingCandidates(link);
	} catch (const std::exception &e) {
		logError("Failed to accept offer %s from %s: %s", message.connectionId.c_str(), message.src.c_str(),
		         e.what());
		if (link) {
			closeLink(link);
		}
		return;
	}

	if (message.channel == ChannelKind::Data) {
		emitIncomingDataLink(link);
		try {
			link->pc->setLocalDescription(rtc::Description::Type::Answer);
			sendLocalDescription(link);
		} catch (const std::exception &e) {
			logError("Failed to answer data link %s: %s", message.connectionId.c_str(), e.what());
			emitLinkError(link, "negotiation-failed");
			closeLink(link);
		}
	} else {
		// Media offers wait for answer().
		emitIncomingCall(link);
	}
}

void PeerRoomRtcTransport::onRemoteAnswer(const RendezvousMessage &message)
{
	auto link = findLink(message.connectionId);
	if (!link) {
		logDebug("Answer for unknown link %s", message.connectionId.c_str());
		return;
	}

	try {
		link->pc->setRemoteDescription(rtc::Description(message.sdp, rtc::Description::Type::Answer));
		flushPendingCandidates(link);
	} catch (const std::exception &e) {
		logError("Failed to apply answer on %s: %s", message.connectionId.c_str(), e.what());
		emitLinkError(link, "negotiation-failed");
		closeLink(link);
	}
}

void PeerRoomRtcTransport::onRemoteCandidate(const RendezvousMessage &message)
{
	auto link = findLink(message.connectionId);
	if (!link) {
		logDebug("Candidate for unknown link %s", message.connectionId.c_str());
		return;
	}

	rtc::Candidate candidate(message.candidate, message.mid);
	{
		std::lock_guard<std::mutex> lock(link->candidateMutex);
		if (!link->remoteDescriptionSet) {
			link->pendingCandidates.push_back(candidate);
			return;
		}
	}

	try {
		link->pc->addRemoteCandidate(candidate);
	} catch (const std::exception &e) {
		logWarning("Failed to add candidate on %s: %s", message.connectionId.c_str(), e.what());
	}
}

void PeerRoomRtcTransport::onRemoteGone(const PeerId &peerId, bool expired)
{
	for (const auto &link : linksTo(peerId)) {
		if (expired) {
			emitLinkError(link, "peer-unavailable");
		}
		closeLink(link);
	}
}

} // namespace peerroom
