/*
 * PeerRoom
 * Room signaling message codec
 */

#include "peerroom-room-messages.h"

#include "peerroom-utils.h"

namespace peerroom
{

namespace
{

constexpr const char *TYPE_PEER_LIST = "peer-list";
constexpr const char *TYPE_NEW_PEER = "new-peer";
constexpr const char *TYPE_REQUEST_PEER_LIST = "request-peer-list";
constexpr const char *TYPE_PEER_DISCONNECT = "peer-disconnect";
constexpr const char *TYPE_CHAT_MESSAGE = "chat-message";

bool setError(std::string *error, const std::string &reason)
{
	if (error) {
		*error = reason;
	}
	return false;
}

bool readPeerId(const JsonParser &json, RoomMessage &message, std::string *error)
{
	if (!json.isString("peerId") || json.getString("peerId").empty()) {
		return setError(error, message.type + " without peerId");
	}
	message.peerId = json.getString("peerId");
	return true;
}

} // namespace

bool parseRoomMessage(const std::string &raw, RoomMessage &message, std::string *error)
{
	try {
		JsonParser json(raw);

		if (!json.isString("type")) {
			return setError(error, "Missing message type");
		}

		message = RoomMessage{};
		message.type = json.getString("type");
		message.timestamp = json.getInt64("timestamp");

		if (message.type == TYPE_PEER_LIST) {
			message.kind = RoomMessageKind::PeerList;
			if (!json.getStringArray("peers", message.peers)) {
				return setError(error, "peer-list without a string array of peers");
			}
			return true;
		}

		if (message.type == TYPE_NEW_PEER) {
			message.kind = RoomMessageKind::NewPeer;
			return readPeerId(json, message, error);
		}

		if (message.type == TYPE_REQUEST_PEER_LIST) {
			message.kind = RoomMessageKind::RequestPeerList;
			return true;
		}

		if (message.type == TYPE_PEER_DISCONNECT) {
			message.kind = RoomMessageKind::PeerDisconnect;
			return readPeerId(json, message, error);
		}

		if (message.type == TYPE_CHAT_MESSAGE) {
			message.kind = RoomMessageKind::ChatMessage;
			if (!json.isString("text")) {
				return setError(error, "chat-message without text");
			}
			message.sender = json.getString("sender");
			message.text = json.getString("text");
			return true;
		}

		message.kind = RoomMessageKind::Unknown;
		return true;
	} catch (const std::exception &ex) {
		return setError(error, ex.what());
	}
}

std::string createPeerListMessage(const std::vector<PeerId> &peers, int64_t timestamp)
{
	JsonBuilder builder;
	builder.add("type", TYPE_PEER_LIST);
	builder.addStringArray("peers", peers);
	builder.add("timestamp", timestamp);
	return builder.build();
}

std::string createNewPeerMessage(const PeerId &peerId, int64_t timestamp)
{
	JsonBuilder builder;
	builder.add("type", TYPE_NEW_PEER);
	builder.add("peerId", peerId);
	builder.add("timestamp", timestamp);
	return builder.build();
}

std::string createRequestPeerListMessage(int64_t timestamp)
{
	JsonBuilder builder;
	builder.add("type", TYPE_REQUEST_PEER_LIST);
	builder.add("timestamp", timestamp);
	return builder.build();
}

std::string createPeerDisconnectMessage(const PeerId &peerId, int64_t timestamp)
{
	JsonBuilder builder;
	builder.add("type", TYPE_PEER_DISCONNECT);
	builder.add("peerId", peerId);
	builder.add("timestamp", timestamp);
	return builder.build();
}

std::string createChatMessage(const std::string &sender, const std::string &text, int64_t timestamp)
{
	JsonBuilder builder;
	builder.add("type", TYPE_CHAT_MESSAGE);
	builder.add("sender", sender);
	builder.add("text", text);
	builder.add("timestamp", timestamp);
	return builder.build();
}

const char *roomMessageTypeName(RoomMessageKind kind)
{
	switch (kind) {
	case RoomMessageKind::PeerList:
		return TYPE_PEER_LIST;
	case RoomMessageKind::NewPeer:
		return TYPE_NEW_PEER;
	case RoomMessageKind::RequestPeerList:
		return TYPE_REQUEST_PEER_LIST;
	case RoomMessageKind::PeerDisconnect:
		return TYPE_PEER_DISCONNECT;
	case RoomMessageKind::ChatMessage:
		return TYPE_CHAT_MESSAGE;
	case RoomMessageKind::Unknown:
	default:
		return "unknown";
	}
}

} // namespace peerroom
