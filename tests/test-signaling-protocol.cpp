/*
 * Unit tests for the rendezvous signaling protocol
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "peerroom-signaling-protocol.h"
#include "peerroom-utils.h"

using namespace peerroom;

TEST(SignalingProtocolTest, ParsesOpen)
{
	RendezvousMessage parsed;
	std::string error;

	EXPECT_TRUE(parseRendezvousMessage(R"({"type":"OPEN"})", parsed, &error));
	EXPECT_EQ(parsed.kind, RendezvousMessageKind::Open);
	EXPECT_EQ(parsed.type, "OPEN");
}

TEST(SignalingProtocolTest, ParsesIdTakenWithMessage)
{
	const std::string raw = R"({"type":"ID-TAKEN","payload":{"msg":"ID is taken"}})";
	RendezvousMessage parsed;
	std::string error;

	EXPECT_TRUE(parseRendezvousMessage(raw, parsed, &error));
	EXPECT_EQ(parsed.kind, RendezvousMessageKind::IdTaken);
	EXPECT_EQ(parsed.error, "ID is taken");
}

TEST(SignalingProtocolTest, ParsesMediaOffer)
{
	const std::string raw = R"({
		"type":"OFFER",
		"src":"standup-creator",
		"dst":"standup-k3j9x0aa",
		"payload":{"sdp":{"type":"offer","sdp":"v=0\r\na=mid:0"},"type":"media","connectionId":"mc_abc"}
	})";
	RendezvousMessage parsed;
	std::string error;

	EXPECT_TRUE(parseRendezvousMessage(raw, parsed, &error)) << error;
	EXPECT_EQ(parsed.kind, RendezvousMessageKind::Offer);
	EXPECT_EQ(parsed.src, "standup-creator");
	EXPECT_EQ(parsed.dst, "standup-k3j9x0aa");
	EXPECT_EQ(parsed.channel, ChannelKind::Media);
	EXPECT_EQ(parsed.connectionId, "mc_abc");
	EXPECT_EQ(parsed.sdpType, "offer");
	EXPECT_NE(parsed.sdp.find("a=mid:0"), std::string::npos);
}

TEST(SignalingProtocolTest, ParsesCandidateObjectPayload)
{
	const std::string raw = R"({
		"type":"CANDIDATE",
		"src":"peer-c",
		"payload":{
			"candidate":{"candidate":"candidate:1 1 UDP 2122260223 192.0.2.1 54400 typ host","sdpMid":"0"},
			"type":"data",
			"connectionId":"dc_1"
		}
	})";
	RendezvousMessage parsed;
	std::string error;

	EXPECT_TRUE(parseRendezvousMessage(raw, parsed, &error)) << error;
	EXPECT_EQ(parsed.kind, RendezvousMessageKind::Candidate);
	EXPECT_EQ(parsed.channel, ChannelKind::Data);
	EXPECT_NE(parsed.candidate.find("candidate:1 1 UDP"), std::string::npos);
	EXPECT_EQ(parsed.mid, "0");
}

TEST(SignalingProtocolTest, ParsesLeaveAndExpire)
{
	RendezvousMessage leave;
	EXPECT_TRUE(parseRendezvousMessage(R"({"type":"LEAVE","src":"peer-l"})", leave));
	EXPECT_EQ(leave.kind, RendezvousMessageKind::Leave);
	EXPECT_EQ(leave.src, "peer-l");

	RendezvousMessage expire;
	EXPECT_TRUE(parseRendezvousMessage(R"({"type":"EXPIRE","src":"peer-e"})", expire));
	EXPECT_EQ(expire.kind, RendezvousMessageKind::Expire);
}

TEST(SignalingProtocolTest, UnknownTypeParsesAsUnknown)
{
	RendezvousMessage parsed;
	EXPECT_TRUE(parseRendezvousMessage(R"({"type":"SOMETHING-NEW"})", parsed));
	EXPECT_EQ(parsed.kind, RendezvousMessageKind::Unknown);
	EXPECT_EQ(parsed.type, "SOMETHING-NEW");
}

TEST(SignalingProtocolTest, RejectsMalformedEnvelopes)
{
	RendezvousMessage parsed;
	std::string error;

	EXPECT_FALSE(parseRendezvousMessage("not json", parsed, &error));
	EXPECT_FALSE(error.empty());

	error.clear();
	EXPECT_FALSE(parseRendezvousMessage(R"({"src":"x"})", parsed, &error));
	EXPECT_EQ(error, "missing type");

	error.clear();
	EXPECT_FALSE(parseRendezvousMessage(R"({"type":"OFFER","src":"x","payload":{"type":"data"}})", parsed, &error));
	EXPECT_FALSE(error.empty());

	EXPECT_FALSE(parseRendezvousMessage(R"({"type":"CANDIDATE","payload":{"connectionId":"dc_1"}})", parsed));
}

TEST(SignalingProtocolTest, BuildsDataOfferReadableByPeers)
{
	const std::string raw = createOfferMessage("standup-creator", ChannelKind::Data, "dc_xyz", "v=0\r\n");
	JsonParser json(raw);
	EXPECT_EQ(json.getString("type"), "OFFER");
	EXPECT_EQ(json.getString("dst"), "standup-creator");

	JsonParser payload(json.getObject("payload"));
	EXPECT_EQ(payload.getString("type"), "data");
	EXPECT_EQ(payload.getString("connectionId"), "dc_xyz");
	EXPECT_EQ(payload.getString("label"), "dc_xyz");
	EXPECT_TRUE(payload.getBool("reliable"));

	JsonParser sdp(payload.getObject("sdp"));
	EXPECT_EQ(sdp.getString("type"), "offer");
	EXPECT_EQ(sdp.getString("sdp"), "v=0\r\n");
}

TEST(SignalingProtocolTest, BuildsAnswerAsSeenByTheServer)
{
	// The server stamps src before relaying; the rest must survive as sent.
	std::string raw = createAnswerMessage("peer-a", ChannelKind::Media, "mc_1", "v=0");
	raw.insert(1, R"("src":"peer-b",)");

	RendezvousMessage parsed;
	std::string error;
	ASSERT_TRUE(parseRendezvousMessage(raw, parsed, &error)) << error;
	EXPECT_EQ(parsed.kind, RendezvousMessageKind::Answer);
	EXPECT_EQ(parsed.channel, ChannelKind::Media);
	EXPECT_EQ(parsed.sdpType, "answer");
	EXPECT_EQ(parsed.connectionId, "mc_1");
}

TEST(SignalingProtocolTest, BuildsCandidateLeaveAndHeartbeat)
{
	JsonParser candidate(createCandidateMessage("peer-a", ChannelKind::Data, "dc_1", "candidate:1", "0"));
	EXPECT_EQ(candidate.getString("type"), "CANDIDATE");
	JsonParser payload(candidate.getObject("payload"));
	JsonParser inner(payload.getObject("candidate"));
	EXPECT_EQ(inner.getString("candidate"), "candidate:1");
	EXPECT_EQ(inner.getString("sdpMid"), "0");

	EXPECT_EQ(createLeaveMessage("peer-a"), R"({"type":"LEAVE","dst":"peer-a"})");
	EXPECT_EQ(createHeartbeatMessage(), R"({"type":"HEARTBEAT"})");
}

TEST(SignalingProtocolTest, BuildsRegistrationUrl)
{
	EXPECT_EQ(buildRendezvousUrl("wss://0.peerjs.com/peerjs", "peerjs", "standup-creator", "tok1"),
	          "wss://0.peerjs.com/peerjs?key=peerjs&id=standup-creator&token=tok1");
	EXPECT_EQ(buildRendezvousUrl("ws://localhost:9000/peerjs?v=1", "my key", "a", "t"),
	          "ws://localhost:9000/peerjs?v=1&key=my%20key&id=a&token=t");
}

TEST(SignalingProtocolTest, ConnectionIdsCarryChannelPrefix)
{
	const std::string data = generateConnectionId(ChannelKind::Data);
	const std::string media = generateConnectionId(ChannelKind::Media);
	EXPECT_EQ(data.rfind("dc_", 0), 0u);
	EXPECT_EQ(media.rfind("mc_", 0), 0u);
	EXPECT_NE(generateConnectionId(ChannelKind::Data), data);
}

TEST(SignalingProtocolTest, TypeNamesMatchWire)
{
	EXPECT_STREQ(rendezvousMessageTypeName(RendezvousMessageKind::IdTaken), "ID-TAKEN");
	EXPECT_STREQ(rendezvousMessageTypeName(RendezvousMessageKind::Candidate), "CANDIDATE");
	EXPECT_STREQ(rendezvousMessageTypeName(RendezvousMessageKind::Unknown), "UNKNOWN");
}
