/*
 * PeerRoom
 * PeerTransport over libdatachannel, negotiated through the rendezvous server
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "peerroom-rendezvous.h"
#include "peerroom-transport.h"

namespace rtc
{
struct Configuration;
}

namespace peerroom
{

struct RtcLink;

// Which libdatachannel callback, if any, is closing the link.
enum class LinkCloseOrigin { Local, StateChange, ChannelClosed };

// Each link owns its own rtc::PeerConnection, keyed by connection id.
class PeerRoomRtcTransport : public PeerTransport
{
public:
	PeerRoomRtcTransport();
	~PeerRoomRtcTransport() override;

	bool createPeer(const PeerId &localId, const TransportConfig &config) override;

	LinkPtr connect(const PeerId &peerId) override;
	LinkPtr call(const PeerId &peerId, const MediaStreamPtr &localStream) override;
	void answer(const LinkPtr &link, const MediaStreamPtr &localStream) override;
	bool send(const LinkPtr &link, const std::string &message) override;
	void close(const LinkPtr &link) override;
	void destroy() override;

	size_t linkCount() const;

private:
	rtc::Configuration getRtcConfig() const;

	std::shared_ptr<RtcLink> createLink(const PeerId &peerId, ChannelKind kind, const std::string &connectionId);
	void setupPeerConnectionCallbacks(const std::shared_ptr<RtcLink> &link);
	void setupDataChannel(const std::shared_ptr<RtcLink> &link);
	void addMediaTracks(const std::shared_ptr<RtcLink> &link);
	void sendLocalDescription(const std::shared_ptr<RtcLink> &link);
	void flushPendingCandidates(const std::shared_ptr<RtcLink> &link);
	void markOpen(const std::shared_ptr<RtcLink> &link);
	void closeLink(const std::shared_ptr<RtcLink> &link, LinkCloseOrigin origin = LinkCloseOrigin::Local);

	std::shared_ptr<RtcLink> findLink(const std::string &connectionId) const;
	std::vector<std::shared_ptr<RtcLink>> linksTo(const PeerId &peerId) const;

	void onSignal(const RendezvousMessage &message);
	void onRemoteOffer(const RendezvousMessage &message);
	void onRemoteAnswer(const RendezvousMessage &message);
	void onRemoteCandidate(const RendezvousMessage &message);
	void onRemoteGone(const PeerId &peerId, bool expired);

	PeerRoomRendezvous rendezvous_;
	TransportConfig config_;
	PeerId localId_;

	mutable std::mutex linksMutex_;
	std::map<std::string, std::shared_ptr<RtcLink>> links_;

	std::atomic<bool> shuttingDown_{false};
};

} // namespace peerroom
