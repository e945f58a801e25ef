/*
 * PeerRoom
 * Active links per peer
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

#include "peerroom-transport.h"

namespace peerroom
{

struct LinkEntry {
	LinkPtr dataLink;
	LinkPtr mediaLink;
	int64_t lastSeenMs = 0;
	// Set when the remote side dialed the link rather than us.
	bool dataInbound = false;
	bool mediaInbound = false;
};

// Owned by one room session and only touched from its event loop thread.
class ConnectionRegistry
{
public:
	using Visitor = std::function<void(const PeerId &peerId, const LinkEntry &entry)>;

	// Both return false without replacing anything when a link of that kind is already registered.
	bool upsertDataChannel(const PeerId &peerId, const LinkPtr &link, int64_t nowMs = 0, bool inbound = false);
	bool upsertMediaChannel(const PeerId &peerId, const LinkPtr &link, int64_t nowMs = 0, bool inbound = false);

	// Swaps in `link` for its kind and returns the link it displaced, if any.
	LinkPtr replace(const PeerId &peerId, const LinkPtr &link, int64_t nowMs, bool inbound);

	bool contains(const PeerId &peerId) const;
	bool has(const PeerId &peerId, ChannelKind kind) const;
	bool isOpen(const PeerId &peerId, ChannelKind kind) const;
	bool isComplete(const PeerId &peerId) const;
	bool isInbound(const PeerId &peerId, ChannelKind kind) const;

	// True when `link` is the exact link registered for its peer and kind.
	bool holds(const LinkPtr &link) const;

	LinkPtr dataLink(const PeerId &peerId) const;
	LinkPtr mediaLink(const PeerId &peerId) const;

	// Removes the entry and hands it back so the caller can close its links.
	bool remove(const PeerId &peerId, LinkEntry *removed = nullptr);

	void touch(const PeerId &peerId, int64_t nowMs);
	int64_t lastSeen(const PeerId &peerId) const;

	void forEach(const Visitor &visitor) const;
	std::vector<PeerId> peerIds() const;
	std::vector<LinkPtr> openDataLinks() const;
	size_t size() const;
	bool empty() const;
	void clear();

private:
	const LinkEntry *find(const PeerId &peerId) const;
	bool upsert(const PeerId &peerId, const LinkPtr &link, ChannelKind kind, int64_t nowMs, bool inbound);

	std::map<PeerId, LinkEntry> entries_;
};

} // namespace peerroom
