/*
 * PeerRoom
 * Rendezvous server protocol: envelopes relayed between peer ids
 */

#pragma once

#include <string>

#include "peerroom-common.h"

namespace peerroom
{

enum class RendezvousMessageKind {
	Unknown,
	Open,
	IdTaken,
	InvalidKey,
	Error,
	Offer,
	Answer,
	Candidate,
	Leave,
	Expire,
	Heartbeat
};

struct RendezvousMessage {
	RendezvousMessageKind kind = RendezvousMessageKind::Unknown;
	std::string type;
	PeerId src;
	PeerId dst;

	// Offer, Answer and Candidate payload
	ChannelKind channel = ChannelKind::Data;
	std::string connectionId;
	std::string sdpType;
	std::string sdp;
	std::string candidate;
	std::string mid;

	// Error, IdTaken, InvalidKey
	std::string error;
};

bool parseRendezvousMessage(const std::string &raw, RendezvousMessage &message, std::string *error = nullptr);

std::string createOfferMessage(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                               const std::string &sdp);
std::string createAnswerMessage(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                const std::string &sdp);
std::string createCandidateMessage(const PeerId &dst, ChannelKind channel, const std::string &connectionId,
                                   const std::string &candidate, const std::string &mid);
std::string createLeaveMessage(const PeerId &dst);
std::string createHeartbeatMessage();

// "{url}?key={key}&id={id}&token={token}", with url-encoded query values.
std::string buildRendezvousUrl(const std::string &baseUrl, const std::string &key, const PeerId &localId,
                               const std::string &token);

// "dc_" or "mc_" followed by a random suffix.
std::string generateConnectionId(ChannelKind channel);

const char *rendezvousMessageTypeName(RendezvousMessageKind kind);

} // namespace peerroom
