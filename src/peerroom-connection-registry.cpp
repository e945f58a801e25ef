/*
 * PeerRoom
 * Active links per peer
 */

#include "peerroom-connection-registry.h"

#include <utility>

namespace peerroom
{

bool ConnectionRegistry::upsert(const PeerId &peerId, const LinkPtr &link, ChannelKind kind, int64_t nowMs,
				bool inbound)
{
	if (peerId.empty() || !link) {
		return false;
	}

	LinkEntry &entry = entries_[peerId];
	LinkPtr &slot = kind == ChannelKind::Data ? entry.dataLink : entry.mediaLink;
	if (slot) {
		return false;
	}

	slot = link;
	(kind == ChannelKind::Data ? entry.dataInbound : entry.mediaInbound) = inbound;
	if (nowMs > entry.lastSeenMs) {
		entry.lastSeenMs = nowMs;
	}
	return true;
}

bool ConnectionRegistry::upsertDataChannel(const PeerId &peerId, const LinkPtr &link, int64_t nowMs, bool inbound)
{
	return upsert(peerId, link, ChannelKind::Data, nowMs, inbound);
}

bool ConnectionRegistry::upsertMediaChannel(const PeerId &peerId, const LinkPtr &link, int64_t nowMs, bool inbound)
{
	return upsert(peerId, link, ChannelKind::Media, nowMs, inbound);
}

LinkPtr ConnectionRegistry::replace(const PeerId &peerId, const LinkPtr &link, int64_t nowMs, bool inbound)
{
	if (peerId.empty() || !link) {
		return nullptr;
	}

	LinkEntry &entry = entries_[peerId];
	const bool data = link->kind() == ChannelKind::Data;
	LinkPtr previous = std::move(data ? entry.dataLink : entry.mediaLink);
	(data ? entry.dataLink : entry.mediaLink) = link;
	(data ? entry.dataInbound : entry.mediaInbound) = inbound;
	if (nowMs > entry.lastSeenMs) {
		entry.lastSeenMs = nowMs;
	}
	return previous;
}

const LinkEntry *ConnectionRegistry::find(const PeerId &peerId) const
{
	auto it = entries_.find(peerId);
	return it == entries_.end() ? nullptr : &it->second;
}

bool ConnectionRegistry::contains(const PeerId &peerId) const
{
	return find(peerId) != nullptr;
}

bool ConnectionRegistry::has(const PeerId &peerId, ChannelKind kind) const
{
	const LinkEntry *entry = find(peerId);
	if (!entry) {
		return false;
	}
	return kind == ChannelKind::Data ? entry->dataLink != nullptr : entry->mediaLink != nullptr;
}

bool ConnectionRegistry::isOpen(const PeerId &peerId, ChannelKind kind) const
{
	const LinkEntry *entry = find(peerId);
	if (!entry) {
		return false;
	}
	const LinkPtr &link = kind == ChannelKind::Data ? entry->dataLink : entry->mediaLink;
	return link && link->isOpen();
}

bool ConnectionRegistry::isComplete(const PeerId &peerId) const
{
	return isOpen(peerId, ChannelKind::Data) && isOpen(peerId, ChannelKind::Media);
}

bool ConnectionRegistry::isInbound(const PeerId &peerId, ChannelKind kind) const
{
	const LinkEntry *entry = find(peerId);
	if (!entry) {
		return false;
	}
	return kind == ChannelKind::Data ? entry->dataInbound : entry->mediaInbound;
}

bool ConnectionRegistry::holds(const LinkPtr &link) const
{
	if (!link) {
		return false;
	}
	const LinkEntry *entry = find(link->peerId());
	if (!entry) {
		return false;
	}
	return entry->dataLink == link || entry->mediaLink == link;
}

LinkPtr ConnectionRegistry::dataLink(const PeerId &peerId) const
{
	const LinkEntry *entry = find(peerId);
	return entry ? entry->dataLink : nullptr;
}

LinkPtr ConnectionRegistry::mediaLink(const PeerId &peerId) const
{
	const LinkEntry *entry = find(peerId);
	return entry ? entry->mediaLink : nullptr;
}

bool ConnectionRegistry::remove(const PeerId &peerId, LinkEntry *removed)
{
	auto it = entries_.find(peerId);
	if (it == entries_.end()) {
		return false;
	}
	if (removed) {
		*removed = std::move(it->second);
	}
	entries_.erase(it);
	return true;
}

void ConnectionRegistry::touch(const PeerId &peerId, int64_t nowMs)
{
	auto it = entries_.find(peerId);
	if (it != entries_.end() && nowMs > it->second.lastSeenMs) {
		it->second.lastSeenMs = nowMs;
	}
}

int64_t ConnectionRegistry::lastSeen(const PeerId &peerId) const
{
	const LinkEntry *entry = find(peerId);
	return entry ? entry->lastSeenMs : 0;
}

void ConnectionRegistry::forEach(const Visitor &visitor) const
{
	for (const auto &pair : entries_) {
		visitor(pair.first, pair.second);
	}
}

std::vector<PeerId> ConnectionRegistry::peerIds() const
{
	std::vector<PeerId> ids;
	ids.reserve(entries_.size());
	for (const auto &pair : entries_) {
		ids.push_back(pair.first);
	}
	return ids;
}

std::vector<LinkPtr> ConnectionRegistry::openDataLinks() const
{
	std::vector<LinkPtr> links;
	for (const auto &pair : entries_) {
		if (pair.second.dataLink && pair.second.dataLink->isOpen()) {
			links.push_back(pair.second.dataLink);
		}
	}
	return links;
}

size_t ConnectionRegistry::size() const
{
	return entries_.size();
}

bool ConnectionRegistry::empty() const
{
	return entries_.empty();
}

void ConnectionRegistry::clear()
{
	entries_.clear();
}

} // namespace peerroom
