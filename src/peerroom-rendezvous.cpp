/*
 * PeerRoom
 * WebSocket client for the rendezvous server
 */

#include "peerroom-rendezvous.h"

#include <rtc/rtc.hpp>

#include <chrono>

#include "peerroom-utils.h"

namespace peerroom
{

PeerRoomRendezvous::PeerRoomRendezvous() = default;

PeerRoomRendezvous::~PeerRoomRendezvous()
{
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		onOpen_ = nullptr;
		onError_ = nullptr;
		onSignal_ = nullptr;
	}
	disconnect();
}

bool PeerRoomRendezvous::connect(const std::string &serverUrl, const std::string &key, const PeerId &localId)
{
	if (shouldRun_) {
		logWarning("Already connected to rendezvous server");
		return true;
	}

	localId_ = localId;
	url_ = buildRendezvousUrl(serverUrl, key, localId, generatePeerSuffix(10));
	registered_ = false;
	errorReported_ = false;
	shouldRun_ = true;

	wsThread_ = std::thread(&PeerRoomRendezvous::wsThreadFunc, this);
	return true;
}

void PeerRoomRendezvous::disconnect()
{
	const bool wasRunning = shouldRun_.exchange(false);
	{
		std::lock_guard<std::mutex> lock(sendMutex_);
		sendCv_.notify_all();
	}

	if (wsThread_.joinable()) {
		wsThread_.join();
	}

	if (ws_) {
		ws_->resetCallbacks();
		ws_->close();
		ws_.reset();
	}

	{
		std::lock_guard<std::mutex> lock(sendMutex_);
		std::queue<std::string>().swap(sendQueue_);
	}

	connected_ = false;
	registered_ = false;
	if (wasRunning) {
		logInfo("Disconnected from rendezvous server");
	}
}

bool PeerRoomRendezvous::isRegistered() const
{
	return registered_;
}

const PeerId &PeerRoomRendezvous::localId() const
{
	return localId_;
}

void PeerRoomRendezvous::wsThreadFunc()
{
	logInfo("Connecting to rendezvous server as %s", localId_.c_str());

	try {
		ws_ = std::make_shared<rtc::WebSocket>();

		ws_->onOpen([this]() {
			logInfo("WebSocket connected to rendezvous server");
			connected_ = true;
		});

		ws_->onClosed([this]() {
			connected_ = false;
			if (shouldRun_) {
				reportError("socket-closed", "Rendezvous connection closed");
			}
		});

		ws_->onError([this](const std::string &error) { reportError("socket-error", error); });

		ws_->onMessage([this](auto data) {
			if (std::holds_alternative<std::string>(data)) {
				processMessage(std::get<std::string>(data));
			}
		});

		ws_->open(url_);

		auto lastHeartbeat = std::chrono::steady_clock::now();
		while (shouldRun_) {
			std::unique_lock<std::mutex> lock(sendMutex_);
			sendCv_.wait_for(lock, std::chrono::milliseconds(100),
			                 [this] { return !sendQueue_.empty() || !shouldRun_; });

			const auto now = std::chrono::steady_clock::now();
			if (registered_ && now - lastHeartbeat >= std::chrono::milliseconds(RENDEZVOUS_HEARTBEAT_INTERVAL_MS)) {
				sendQueue_.push(createHeartbeatMessage());
				lastHeartbeat = now;
			}

			while (!sendQueue_.empty() && connected_) {
				std::string msg = sendQueue_.front();
				sendQueue_.pop();
				lock.unlock();

				try {
					ws_->send(msg);
					logDebug("Sent: %s", msg.c_str());
				} catch (const std::exception &e) {
					logError("Failed to send message: %s", e.what());
				}

				lock.lock();
			}
		}
	} catch (const std::exception &e) {
		logError("WebSocket thread error: %s", e.what());
		connected_ = false;
		reportError("socket-error", e.what());
	}
}

void PeerRoomRendezvous::processMessage(const std::string &message)
{
	logDebug("Received: %s", message.c_str());

	RendezvousMessage parsed;
	std::string error;
	if (!parseRendezvousMessage(message, parsed, &error)) {
		logWarning("Ignoring rendezvous message: %s", error.c_str());
		return;
	}

	switch (parsed.kind) {
	case RendezvousMessageKind::Open: {
		registered_ = true;
		logInfo("Registered with rendezvous server as %s", localId_.c_str());
		OnOpenCallback cb;
		{
			std::lock_guard<std::mutex> lock(callbackMutex_);
			cb = onOpen_;
		}
		if (cb) {
			cb(localId_);
		}
		break;
	}
	case RendezvousMessageKind::IdTaken:
		reportError("unavailable-id", "ID \"" + localId_ + "\" is taken");
		break;
	case RendezvousMessageKind::InvalidKey:
		reportError("invalid-key", "API key is invalid");
		break;
	case RendezvousMessageKind::Error:
		reportError("server-error", parsed.error);
		break;
	case RendezvousMessageKind::Offer:
	case RendezvousMessageKind::Answer:
	case RendezvousMessageKind::Candidate:
	case RendezvousMessageKind::Leave:
	case RendezvousMessageKind::Expire: {
		logDebug("%s from %s (%s)", rendezvousMessageTypeName(parsed.kind), parsed.src.c_str(),
		         parsed.connectionId.c_str());
		OnSignalCallback cb;
		{
			std::lock_guard<std::mutex> lock(callbackMutex_);
			cb = onSignal_;
		}
		if (cb) {
			cb(parsed);
		}
		break;
	}
	case RendezvousMessageKind::Heartbeat:
		break;
	case RendezvousMessageKind::Unknown:
		logDebug("Unknown rendezvous message type: %s", parsed.type.c_str());
		break;
	}
}

void PeerRoomRendezvous::sendMessage(const std::string &message)
{
	if (!shouldRun_) {
		logWarning("Cannot send message - not connected");
		return;
	}

	std::lock_guard<std::mutex> lock(sendMutex_);
	sendQueue_.push(message);
	sendCv_.notify_one();
}

void PeerRoomRendezvous::reportError(const std::string &kind, const std::string &detail)
{
	logError("Rendezvous error (%s): %s", kind.c_str(), detail.c_str());

	// Only the first failure of a registration is reported.
	if (errorReported_.exchange(true)) {
		return;
	}

	OnErrorCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onError_;
	}
	if (cb) {
		cb(kind, detail);
	}
}

void PeerRoomRendezvous::sendOffer(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                   const std::string &sdp)
{
	sendMessage(createOfferMessage(dst, channel, connectionId, sdp));
	logDebug("Sent offer to %s (%s)", dst.c_str(), connectionId.c_str());
}

void PeerRoomRendezvous::sendAnswer(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                    const std::string &sdp)
{
	sendMessage(createAnswerMessage(dst, channel, connectionId, sdp));
	logDebug("Sent answer to %s (%s)", dst.c_str(), connectionId.c_str());
}

void PeerRoomRendezvous::sendCandidate(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                       const std::string &candidate, const std::string &mid)
{
	sendMessage(createCandidateMessage(dst, channel, connectionId, candidate, mid));
}

void PeerRoomRendezvous::sendLeave(const PeerId &dst)
{
	sendMessage(createLeaveMessage(dst));
}

void PeerRoomRendezvous::setOnOpen(OnOpenCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onOpen_ = std::move(callback);
}

void PeerRoomRendezvous::setOnError(OnErrorCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onError_ = std::move(callback);
}

void PeerRoomRendezvous::setOnSignal(OnSignalCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onSignal_ = std::move(callback);
}

} // namespace peerroom
