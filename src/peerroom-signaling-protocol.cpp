/*
 * PeerRoom
 * Rendezvous server protocol: envelopes relayed between peer ids
 */

#include "peerroom-signaling-protocol.h"

#include <cctype>
#include <cstdio>
#include <initializer_list>
#include <stdexcept>

#include "peerroom-utils.h"

namespace peerroom
{

namespace
{

std::string getAnyString(const JsonParser &json, const std::initializer_list<const char *> &keys)
{
	for (const char *key : keys) {
		if (json.isString(key)) {
			return json.getString(key);
		}
	}
	return "";
}

const char *channelName(ChannelKind channel)
{
	return channel == ChannelKind::Media ? "media" : "data";
}

RendezvousMessageKind kindFromType(const std::string &type)
{
	if (type == "OPEN") {
		return RendezvousMessageKind::Open;
	}
	if (type == "ID-TAKEN") {
		return RendezvousMessageKind::IdTaken;
	}
	if (type == "INVALID-KEY") {
		return RendezvousMessageKind::InvalidKey;
	}
	if (type == "ERROR") {
		return RendezvousMessageKind::Error;
	}
	if (type == "OFFER") {
		return RendezvousMessageKind::Offer;
	}
	if (type == "ANSWER") {
		return RendezvousMessageKind::Answer;
	}
	if (type == "CANDIDATE") {
		return RendezvousMessageKind::Candidate;
	}
	if (type == "LEAVE") {
		return RendezvousMessageKind::Leave;
	}
	if (type == "EXPIRE") {
		return RendezvousMessageKind::Expire;
	}
	if (type == "HEARTBEAT") {
		return RendezvousMessageKind::Heartbeat;
	}
	return RendezvousMessageKind::Unknown;
}

void parsePayload(const JsonParser &payload, RendezvousMessage &message)
{
	message.channel = asciiLower(getAnyString(payload, {"type"})) == "media" ? ChannelKind::Media : ChannelKind::Data;
	message.connectionId = getAnyString(payload, {"connectionId"});

	if (payload.isObject("sdp")) {
		JsonParser sdp(payload.getObject("sdp"));
		message.sdpType = getAnyString(sdp, {"type"});
		message.sdp = getAnyString(sdp, {"sdp"});
	} else {
		message.sdp = getAnyString(payload, {"sdp"});
	}

	if (payload.isObject("candidate")) {
		JsonParser candidate(payload.getObject("candidate"));
		message.candidate = getAnyString(candidate, {"candidate"});
		message.mid = getAnyString(candidate, {"sdpMid", "mid"});
	} else {
		message.candidate = getAnyString(payload, {"candidate"});
		message.mid = getAnyString(payload, {"sdpMid", "mid"});
	}

	message.error = getAnyString(payload, {"msg", "message"});
}

std::string buildSdpMessage(const char *type, const char *sdpType, const PeerId &dst, ChannelKind channel,
                            const std::string &connectionId, const std::string &sdp)
{
	const std::string description = JsonBuilder().add("type", sdpType).add("sdp", sdp).build();

	JsonBuilder payload;
	payload.addRaw("sdp", description).add("type", channelName(channel)).add("connectionId", connectionId);
	if (channel == ChannelKind::Data) {
		payload.add("label", connectionId).add("reliable", true).add("serialization", "raw");
	}

	return JsonBuilder().add("type", type).add("dst", dst).addRaw("payload", payload.build()).build();
}

std::string urlEncode(const std::string &value)
{
	std::string encoded;
	for (unsigned char c : value) {
		if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
			encoded += static_cast<char>(c);
		} else {
			char buffer[4];
			std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
			encoded += buffer;
		}
	}
	return encoded;
}

} // namespace

bool parseRendezvousMessage(const std::string &raw, RendezvousMessage &message, std::string *error)
{
	try {
		JsonParser json(raw);

		if (!json.isString("type")) {
			if (error) {
				*error = "missing type";
			}
			return false;
		}

		message.type = json.getString("type");
		message.kind = kindFromType(message.type);
		message.src = getAnyString(json, {"src"});
		message.dst = getAnyString(json, {"dst"});

		if (json.isObject("payload")) {
			parsePayload(JsonParser(json.getObject("payload")), message);
		}

		switch (message.kind) {
		case RendezvousMessageKind::Offer:
		case RendezvousMessageKind::Answer:
			if (message.src.empty() || message.connectionId.empty() || message.sdp.empty()) {
				if (error) {
					*error = message.type + " without src, connectionId or sdp";
				}
				return false;
			}
			break;
		case RendezvousMessageKind::Candidate:
			if (message.src.empty() || message.connectionId.empty()) {
				if (error) {
					*error = "CANDIDATE without src or connectionId";
				}
				return false;
			}
			break;
		default:
			break;
		}
		return true;
	} catch (const std::exception &ex) {
		if (error) {
			*error = ex.what();
		}
		return false;
	}
}

std::string createOfferMessage(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                               const std::string &sdp)
{
	return buildSdpMessage("OFFER", "offer", dst, channel, connectionId, sdp);
}

std::string createAnswerMessage(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                const std::string &sdp)
{
	return buildSdpMessage("ANSWER", "answer", dst, channel, connectionId, sdp);
}

std::string createCandidateMessage(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                   const std::string &candidate, const std::string &mid)
{
	const std::string candidateJson = JsonBuilder().add("candidate", candidate).add("sdpMid", mid).build();
	const std::string payload = JsonBuilder()
	                                .addRaw("candidate", candidateJson)
	                                .add("type", channelName(channel))
	                                .add("connectionId", connectionId)
	                                .build();
	return JsonBuilder().add("type", "CANDIDATE").add("dst", dst).addRaw("payload", payload).build();
}

std::string createLeaveMessage(const PeerId &dst)
{
	return JsonBuilder().add("type", "LEAVE").add("dst", dst).build();
}

std::string createHeartbeatMessage()
{
	return JsonBuilder().add("type", "HEARTBEAT").build();
}

std::string buildRendezvousUrl(const std::string &baseUrl, const std::string &key, const PeerId &localId,
                               const std::string &token)
{
	const char separator = baseUrl.find('?') == std::string::npos ? '?' : '&';
	return baseUrl + separator + "key=" + urlEncode(key) + "&id=" + urlEncode(localId) + "&token=" + urlEncode(token);
}

std::string generateConnectionId(ChannelKind channel)
{
	return std::string(channel == ChannelKind::Media ? "mc_" : "dc_") + generatePeerSuffix(12);
}

const char *rendezvousMessageTypeName(RendezvousMessageKind kind)
{
	switch (kind) {
	case RendezvousMessageKind::Open:
		return "OPEN";
	case RendezvousMessageKind::IdTaken:
		return "ID-TAKEN";
	case RendezvousMessageKind::InvalidKey:
		return "INVALID-KEY";
	case RendezvousMessageKind::Error:
		return "ERROR";
	case RendezvousMessageKind::Offer:
		return "OFFER";
	case RendezvousMessageKind::Answer:
		return "ANSWER";
	case RendezvousMessageKind::Candidate:
		return "CANDIDATE";
	case RendezvousMessageKind::Leave:
		return "LEAVE";
	case RendezvousMessageKind::Expire:
		return "EXPIRE";
	case RendezvousMessageKind::Heartbeat:
		return "HEARTBEAT";
	case RendezvousMessageKind::Unknown:
		break;
	}
	return "UNKNOWN";
}

} // namespace peerroom
