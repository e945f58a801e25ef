/*
 * PeerRoom
 * Peer transport abstraction
 *
 * A transport opens and accepts links to other peers by id. Each link is
 * either a data link (ordered, reliable text messages) or a media link
 * (audio/video). Events may be raised from any thread; consumers are expected
 * to marshal them onto their own event loop.
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "peerroom-common.h"

namespace peerroom
{

class MediaStream
{
public:
	explicit MediaStream(std::string id);
	virtual ~MediaStream() = default;

	const std::string &id() const;

	bool audioEnabled() const;
	void setAudioEnabled(bool enabled);
	bool videoEnabled() const;
	void setVideoEnabled(bool enabled);

private:
	std::string id_;
	std::atomic<bool> audioEnabled_{true};
	std::atomic<bool> videoEnabled_{true};
};

using MediaStreamPtr = std::shared_ptr<MediaStream>;

class TransportLink
{
public:
	virtual ~TransportLink() = default;

	virtual const PeerId &peerId() const = 0;
	virtual ChannelKind kind() const = 0;
	virtual const std::string &connectionId() const = 0;
	virtual bool isOpen() const = 0;
};

using LinkPtr = std::shared_ptr<TransportLink>;

class PeerTransport
{
public:
	using OnOpenCallback = std::function<void(const PeerId &localId)>;
	using OnErrorCallback = std::function<void(const std::string &kind)>;
	using OnIncomingLinkCallback = std::function<void(const LinkPtr &link)>;
	using OnLinkOpenCallback = std::function<void(const LinkPtr &link)>;
	using OnLinkStreamCallback = std::function<void(const LinkPtr &link, const MediaStreamPtr &stream)>;
	using OnLinkMessageCallback = std::function<void(const LinkPtr &link, const std::string &message)>;
	using OnLinkClosedCallback = std::function<void(const LinkPtr &link)>;
	using OnLinkErrorCallback = std::function<void(const LinkPtr &link, const std::string &kind)>;

	virtual ~PeerTransport() = default;

	// Registers the local peer id. Completion is reported through onOpen or onError.
	virtual bool createPeer(const PeerId &localId, const TransportConfig &config) = 0;

	virtual LinkPtr connect(const PeerId &peerId) = 0;
	virtual LinkPtr call(const PeerId &peerId, const MediaStreamPtr &localStream) = 0;
	virtual void answer(const LinkPtr &link, const MediaStreamPtr &localStream) = 0;
	virtual bool send(const LinkPtr &link, const std::string &message) = 0;
	virtual void close(const LinkPtr &link) = 0;

	// Closes every link and releases the local peer registration.
	virtual void destroy() = 0;

	void setOnOpen(OnOpenCallback callback);
	void setOnError(OnErrorCallback callback);
	void setOnIncomingCall(OnIncomingLinkCallback callback);
	void setOnIncomingDataLink(OnIncomingLinkCallback callback);
	void setOnLinkOpen(OnLinkOpenCallback callback);
	void setOnLinkStream(OnLinkStreamCallback callback);
	void setOnLinkMessage(OnLinkMessageCallback callback);
	void setOnLinkClosed(OnLinkClosedCallback callback);
	void setOnLinkError(OnLinkErrorCallback callback);
	void clearCallbacks();

protected:
	void emitOpen(const PeerId &localId);
	void emitError(const std::string &kind);
	void emitIncomingCall(const LinkPtr &link);
	void emitIncomingDataLink(const LinkPtr &link);
	void emitLinkOpen(const LinkPtr &link);
	void emitLinkStream(const LinkPtr &link, const MediaStreamPtr &stream);
	void emitLinkMessage(const LinkPtr &link, const std::string &message);
	void emitLinkClosed(const LinkPtr &link);
	void emitLinkError(const LinkPtr &link, const std::string &kind);

private:
	mutable std::mutex callbackMutex_;
	OnOpenCallback onOpen_;
	OnErrorCallback onError_;
	OnIncomingLinkCallback onIncomingCall_;
	OnIncomingLinkCallback onIncomingDataLink_;
	OnLinkOpenCallback onLinkOpen_;
	OnLinkStreamCallback onLinkStream_;
	OnLinkMessageCallback onLinkMessage_;
	OnLinkClosedCallback onLinkClosed_;
	OnLinkErrorCallback onLinkError_;
};

} // namespace peerroom
