/*
 * PeerRoom
 * Peer transport callback plumbing
 */

#include "peerroom-transport.h"

#include <utility>

namespace peerroom
{

MediaStream::MediaStream(std::string id) : id_(std::move(id)) {}

const std::string &MediaStream::id() const
{
	return id_;
}

bool MediaStream::audioEnabled() const
{
	return audioEnabled_;
}

void MediaStream::setAudioEnabled(bool enabled)
{
	audioEnabled_ = enabled;
}

bool MediaStream::videoEnabled() const
{
	return videoEnabled_;
}

void MediaStream::setVideoEnabled(bool enabled)
{
	videoEnabled_ = enabled;
}

void PeerTransport::setOnOpen(OnOpenCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onOpen_ = std::move(callback);
}
void PeerTransport::setOnError(OnErrorCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onError_ = std::move(callback);
}
void PeerTransport::setOnIncomingCall(OnIncomingLinkCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onIncomingCall_ = std::move(callback);
}
void PeerTransport::setOnIncomingDataLink(OnIncomingLinkCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onIncomingDataLink_ = std::move(callback);
}
void PeerTransport::setOnLinkOpen(OnLinkOpenCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onLinkOpen_ = std::move(callback);
}
void PeerTransport::setOnLinkStream(OnLinkStreamCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onLinkStream_ = std::move(callback);
}
void PeerTransport::setOnLinkMessage(OnLinkMessageCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onLinkMessage_ = std::move(callback);
}
void PeerTransport::setOnLinkClosed(OnLinkClosedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onLinkClosed_ = std::move(callback);
}
void PeerTransport::setOnLinkError(OnLinkErrorCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onLinkError_ = std::move(callback);
}

void PeerTransport::clearCallbacks()
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onOpen_ = nullptr;
	onError_ = nullptr;
	onIncomingCall_ = nullptr;
	onIncomingDataLink_ = nullptr;
	onLinkOpen_ = nullptr;
	onLinkStream_ = nullptr;
	onLinkMessage_ = nullptr;
	onLinkClosed_ = nullptr;
	onLinkError_ = nullptr;
}

// Callbacks are copied under the lock and invoked outside it so a handler may
// call back into the transport.

void PeerTransport::emitOpen(const PeerId &localId)
{
	OnOpenCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onOpen_;
	}
	if (cb) {
		cb(localId);
	}
}

void PeerTransport::emitError(const std::string &kind)
{
	OnErrorCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onError_;
	}
	if (cb) {
		cb(kind);
	}
}

void PeerTransport::emitIncomingCall(const LinkPtr &link)
{
	OnIncomingLinkCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onIncomingCall_;
	}
	if (cb) {
		cb(link);
	}
}

void PeerTransport::emitIncomingDataLink(const LinkPtr &link)
{
	OnIncomingLinkCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onIncomingDataLink_;
	}
	if (cb) {
		cb(link);
	}
}

void PeerTransport::emitLinkOpen(const LinkPtr &link)
{
	OnLinkOpenCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onLinkOpen_;
	}
	if (cb) {
		cb(link);
	}
}

void PeerTransport::emitLinkStream(const LinkPtr &link, const MediaStreamPtr &stream)
{
	OnLinkStreamCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onLinkStream_;
	}
	if (cb) {
		cb(link, stream);
	}
}

void PeerTransport::emitLinkMessage(const LinkPtr &link, const std::string &message)
{
	OnLinkMessageCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onLinkMessage_;
	}
	if (cb) {
		cb(link, message);
	}
}

void PeerTransport::emitLinkClosed(const LinkPtr &link)
{
	OnLinkClosedCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onLinkClosed_;
	}
	if (cb) {
		cb(link);
	}
}

void PeerTransport::emitLinkError(const LinkPtr &link, const std::string &kind)
{
	OnLinkErrorCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onLinkError_;
	}
	if (cb) {
		cb(link, kind);
	}
}

} // namespace peerroom
