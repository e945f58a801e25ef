/*
 * PeerRoom
 * Room signaling messages exchanged over peer data links
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "peerroom-common.h"

namespace peerroom
{

enum class RoomMessageKind { Unknown, PeerList, NewPeer, RequestPeerList, PeerDisconnect, ChatMessage };

struct RoomMessage {
	RoomMessageKind kind = RoomMessageKind::Unknown;
	std::string type;
	int64_t timestamp = 0;

	// peer-list
	std::vector<PeerId> peers;
	// new-peer, peer-disconnect
	PeerId peerId;
	// chat-message
	std::string sender;
	std::string text;
};

// Fails on malformed JSON, a missing type, or a known type missing its fields.
// Unrecognized types parse successfully as RoomMessageKind::Unknown.
bool parseRoomMessage(const std::string &raw, RoomMessage &message, std::string *error = nullptr);

std::string createPeerListMessage(const std::vector<PeerId> &peers, int64_t timestamp);
std::string createNewPeerMessage(const PeerId &peerId, int64_t timestamp);
std::string createRequestPeerListMessage(int64_t timestamp);
std::string createPeerDisconnectMessage(const PeerId &peerId, int64_t timestamp);
std::string createChatMessage(const std::string &sender, const std::string &text, int64_t timestamp);

const char *roomMessageTypeName(RoomMessageKind kind);

} // namespace peerroom
