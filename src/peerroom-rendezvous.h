/*
 * PeerRoom
 * WebSocket client for the rendezvous server
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "peerroom-signaling-protocol.h"

namespace rtc
{
class WebSocket;
}

namespace peerroom
{

// Registers a peer id with the rendezvous server and relays offers, answers
// and candidates addressed by peer id. Callbacks run on the WebSocket thread.
class PeerRoomRendezvous
{
public:
	using OnOpenCallback = std::function<void(const PeerId &localId)>;
	// kind is one of unavailable-id, invalid-key, server-error, socket-error, socket-closed.
	using OnErrorCallback = std::function<void(const std::string &kind, const std::string &detail)>;
	using OnSignalCallback = std::function<void(const RendezvousMessage &message)>;

	PeerRoomRendezvous();
	~PeerRoomRendezvous();

	PeerRoomRendezvous(const PeerRoomRendezvous &) = delete;
	PeerRoomRendezvous &operator=(const PeerRoomRendezvous &) = delete;

	// Non-blocking; completion is reported through onOpen or onError.
	bool connect(const std::string &serverUrl, const std::string &key, const PeerId &localId);
	void disconnect();

	bool isRegistered() const;
	const PeerId &localId() const;

	void sendOffer(const PeerId &dst, ChannelKind channel, const std::string &connectionId, const std::string &sdp);
	void sendAnswer(const PeerId &dst, ChannelKind channel, const std::string &connectionId, const std::string &sdp);
	void sendCandidate(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
	                   const std::string &candidate, const std::string &mid);
	void sendLeave(const PeerId &dst);

	void setOnOpen(OnOpenCallback callback);
	void setOnError(OnErrorCallback callback);
	void setOnSignal(OnSignalCallback callback);

private:
	void wsThreadFunc();
	void processMessage(const std::string &message);
	void sendMessage(const std::string &message);
	void reportError(const std::string &kind, const std::string &detail);

	PeerId localId_;
	std::string url_;
	std::shared_ptr<rtc::WebSocket> ws_;
	std::thread wsThread_;

	std::atomic<bool> connected_{false};
	std::atomic<bool> registered_{false};
	std::atomic<bool> shouldRun_{false};
	std::atomic<bool> errorReported_{false};

	std::mutex sendMutex_;
	std::condition_variable sendCv_;
	std::queue<std::string> sendQueue_;

	std::mutex callbackMutex_;
	OnOpenCallback onOpen_;
	OnErrorCallback onError_;
	OnSignalCallback onSignal_;
};

} // namespace peerroom
