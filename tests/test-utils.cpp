/*
 * Unit tests for peerroom-utils
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <regex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "peerroom-utils.h"

using namespace peerroom;

// Peer id helpers
class PeerIdTest : public ::testing::Test
{
};

TEST_F(PeerIdTest, SuffixHasRequestedLengthAndAlphabet)
{
	std::string suffix = generatePeerSuffix();
	EXPECT_EQ(suffix.length(), PEER_SUFFIX_LENGTH);

	std::regex suffixRegex("^[0-9a-z]+$");
	EXPECT_TRUE(std::regex_match(suffix, suffixRegex)) << "Suffix '" << suffix << "' has unexpected characters";

	EXPECT_EQ(generatePeerSuffix(3).length(), 3u);
}

TEST_F(PeerIdTest, SuffixesAreUnique)
{
	std::set<std::string> suffixes;
	const int numSuffixes = 1000;

	for (int i = 0; i < numSuffixes; i++) {
		suffixes.insert(generatePeerSuffix());
	}

	EXPECT_EQ(suffixes.size(), static_cast<size_t>(numSuffixes));
}

TEST_F(PeerIdTest, SuffixesAreUniqueAcrossThreads)
{
	const int numThreads = 4;
	const int perThread = 250;
	std::vector<std::vector<std::string>> results(numThreads);
	std::vector<std::thread> threads;

	for (int t = 0; t < numThreads; t++) {
		threads.emplace_back([&results, t]() {
			for (int i = 0; i < perThread; i++) {
				results[t].push_back(generatePeerSuffix());
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	std::set<std::string> all;
	for (const auto &batch : results) {
		all.insert(batch.begin(), batch.end());
	}
	EXPECT_EQ(all.size(), static_cast<size_t>(numThreads * perThread));
}

TEST_F(PeerIdTest, BuildsCreatorAndJoinerIds)
{
	EXPECT_EQ(makeCreatorPeerId("standup"), "standup-creator");
	EXPECT_EQ(makeJoinerPeerId("standup", "k3j9x0aa"), "standup-k3j9x0aa");
}

TEST_F(PeerIdTest, JoinerIdNeverCarriesTheCreatorMarker)
{
	std::vector<std::string> suffixes = {"creator1", "creatorz", "k3j9x0aa"};
	size_t drawn = 0;
	PeerId peerId = generateJoinerPeerId("standup", [&suffixes, &drawn]() { return suffixes[drawn++]; });

	EXPECT_EQ(peerId, "standup-k3j9x0aa");
	EXPECT_EQ(drawn, 3u);
	EXPECT_FALSE(isCreatorPeerId(peerId));
}

TEST_F(PeerIdTest, RecognisesCreatorIds)
{
	EXPECT_TRUE(isCreatorPeerId("standup-creator"));
	EXPECT_FALSE(isCreatorPeerId("standup-k3j9x0aa"));
	EXPECT_FALSE(isCreatorPeerId(""));
}

// Room id validation
class RoomIdTest : public ::testing::Test
{
};

TEST_F(RoomIdTest, AcceptsPlainIds)
{
	EXPECT_TRUE(isValidRoomId("standup"));
	EXPECT_TRUE(isValidRoomId("Team_42-daily"));
}

TEST_F(RoomIdTest, RejectsEmptyId)
{
	std::string error;
	EXPECT_FALSE(isValidRoomId("", &error));
	EXPECT_FALSE(error.empty());
}

TEST_F(RoomIdTest, RejectsReservedCharacters)
{
	EXPECT_FALSE(isValidRoomId("room with spaces"));
	EXPECT_FALSE(isValidRoomId("room/one"));
	EXPECT_FALSE(isValidRoomId("r\xC3\xA9union"));
}

TEST_F(RoomIdTest, RejectsCreatorMarker)
{
	std::string error;
	EXPECT_FALSE(isValidRoomId("x-creator", &error));
	EXPECT_NE(error.find("creator"), std::string::npos);
}

TEST_F(RoomIdTest, RejectsOverlongIds)
{
	EXPECT_TRUE(isValidRoomId(std::string(64, 'a')));
	EXPECT_FALSE(isValidRoomId(std::string(65, 'a')));
}

// JSON Builder Tests
class JsonBuilderTest : public ::testing::Test
{
};

TEST_F(JsonBuilderTest, BuildsEmptyObject)
{
	EXPECT_EQ(JsonBuilder().build(), "{}");
}

TEST_F(JsonBuilderTest, BuildsMixedValues)
{
	JsonBuilder builder;
	builder.add("type", "peer-list").add("count", 2).add("ok", true).add("timestamp", static_cast<int64_t>(1700000000123));

	EXPECT_EQ(builder.build(), R"({"type":"peer-list","count":2,"ok":true,"timestamp":1700000000123})");
}

TEST_F(JsonBuilderTest, BuildsStringArraysAndRawValues)
{
	JsonBuilder builder;
	builder.addStringArray("peers", {"a", "b"}).addRaw("nested", R"({"x":1})");

	EXPECT_EQ(builder.build(), R"({"peers":["a","b"],"nested":{"x":1}})");
}

TEST_F(JsonBuilderTest, EscapesSpecialCharacters)
{
	EXPECT_EQ(JsonBuilder::quote("say \"hi\"\n"), R"("say \"hi\"\n")");
	EXPECT_EQ(JsonBuilder::quote("back\\slash"), R"("back\\slash")");
	EXPECT_EQ(JsonBuilder::quote(std::string("\x01", 1)), R"("\u0001")");
}

// JSON Parser Tests
class JsonParserTest : public ::testing::Test
{
};

TEST_F(JsonParserTest, ReadsScalars)
{
	JsonParser json(R"({"name":"alice","age":42,"ts":1700000000123,"admin":false,"nothing":null})");

	EXPECT_TRUE(json.hasKey("name"));
	EXPECT_TRUE(json.isString("name"));
	EXPECT_EQ(json.getString("name"), "alice");
	EXPECT_EQ(json.getInt("age"), 42);
	EXPECT_EQ(json.getInt64("ts"), 1700000000123LL);
	EXPECT_FALSE(json.getBool("admin", true));
	EXPECT_TRUE(json.hasKey("nothing"));
	EXPECT_FALSE(json.isString("nothing"));
	EXPECT_EQ(json.getString("missing", "fallback"), "fallback");
}

TEST_F(JsonParserTest, DecodesEscapes)
{
	JsonParser json(R"({"text":"line\nbreak \"quoted\" é 😀"})");
	EXPECT_EQ(json.getString("text"), "line\nbreak \"quoted\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST_F(JsonParserTest, KeepsNestedObjectsRaw)
{
	JsonParser json(R"({"payload":{"sdp":{"type":"offer"}},"list":[1,2]})");

	EXPECT_TRUE(json.isObject("payload"));
	EXPECT_TRUE(json.isArray("list"));

	JsonParser payload(json.getObject("payload"));
	JsonParser sdp(payload.getObject("sdp"));
	EXPECT_EQ(sdp.getString("type"), "offer");
}

TEST_F(JsonParserTest, ReadsStringArrays)
{
	JsonParser json(R"({"peers":["a","b\"c"],"mixed":["a",1],"scalar":"x"})");

	std::vector<std::string> peers;
	ASSERT_TRUE(json.getStringArray("peers", peers));
	ASSERT_EQ(peers.size(), 2u);
	EXPECT_EQ(peers[0], "a");
	EXPECT_EQ(peers[1], "b\"c");

	std::vector<std::string> other;
	EXPECT_FALSE(json.getStringArray("mixed", other));
	EXPECT_FALSE(json.getStringArray("scalar", other));
	EXPECT_FALSE(json.getStringArray("missing", other));
}

TEST_F(JsonParserTest, ParsesWhatTheBuilderWrites)
{
	const std::string text = "tab\there \"q\" \\ done";
	JsonParser json(JsonBuilder().add("text", text).build());
	EXPECT_EQ(json.getString("text"), text);
}

TEST_F(JsonParserTest, ThrowsOnMalformedInput)
{
	EXPECT_THROW(JsonParser("not json"), std::runtime_error);
	EXPECT_THROW(JsonParser(R"({"a":)"), std::runtime_error);
	EXPECT_THROW(JsonParser(R"({"a":"unterminated})"), std::runtime_error);
	EXPECT_THROW(JsonParser(R"({"a":1} trailing)"), std::runtime_error);
	EXPECT_THROW(JsonParser(R"(["array"])"), std::runtime_error);
}

// String Trim Tests
class TrimTest : public ::testing::Test
{
};

TEST_F(TrimTest, TrimsBothEnds)
{
	EXPECT_EQ(trim("   hello   "), "hello");
}

TEST_F(TrimTest, TrimsTabsAndNewlines)
{
	EXPECT_EQ(trim("\t\nhello\r\n"), "hello");
}

TEST_F(TrimTest, HandlesOnlyWhitespace)
{
	EXPECT_EQ(trim("   \t\n   "), "");
	EXPECT_EQ(trim(""), "");
}

TEST_F(TrimTest, PreservesInternalSpaces)
{
	EXPECT_EQ(trim("  hello world  "), "hello world");
}

// String Split Tests
class SplitTest : public ::testing::Test
{
};

TEST_F(SplitTest, SplitsOnDelimiter)
{
	auto result = split("a;b;c", ';');
	ASSERT_EQ(result.size(), 3u);
	EXPECT_EQ(result[0], "a");
	EXPECT_EQ(result[1], "b");
	EXPECT_EQ(result[2], "c");
}

TEST_F(SplitTest, HandlesEmptyString)
{
	auto result = split("", ',');
	ASSERT_EQ(result.size(), 1u);
	EXPECT_EQ(result[0], "");
}

TEST_F(SplitTest, HandlesEmptySegments)
{
	auto result = split("a,,b", ',');
	ASSERT_EQ(result.size(), 3u);
	EXPECT_EQ(result[1], "");
}

TEST_F(SplitTest, LowercasesAscii)
{
	EXPECT_EQ(asciiLower("MeSh"), "mesh");
}

// ICE Server Parser Tests
class ParseIceServersTest : public ::testing::Test
{
};

TEST_F(ParseIceServersTest, ParsesPipeSeparatedTurnServer)
{
	auto servers = parseIceServers("turn:turn.example.com:3478|alice|secret");
	ASSERT_EQ(servers.size(), 1u);
	EXPECT_EQ(servers[0].urls, "turn:turn.example.com:3478");
	EXPECT_EQ(servers[0].username, "alice");
	EXPECT_EQ(servers[0].credential, "secret");
}

TEST_F(ParseIceServersTest, ParsesWhitespaceAndKeyValueFormats)
{
	const std::string config = "stun:stun.example.com:3478\n"
	                           "turns:turn.example.com:5349 username=bob credential=hunter2";
	auto servers = parseIceServers(config);
	ASSERT_EQ(servers.size(), 2u);
	EXPECT_EQ(servers[0].urls, "stun:stun.example.com:3478");
	EXPECT_TRUE(servers[0].username.empty());
	EXPECT_EQ(servers[1].urls, "turns:turn.example.com:5349");
	EXPECT_EQ(servers[1].username, "bob");
	EXPECT_EQ(servers[1].credential, "hunter2");
}

TEST_F(ParseIceServersTest, IgnoresCommentsBlankAndInvalidLines)
{
	const std::string config = "# comment\n"
	                           " \n"
	                           "// another comment\n"
	                           "https://not-ice.example.com\n"
	                           "turn:turn.example.com:3478|user|pass";
	auto servers = parseIceServers(config);
	ASSERT_EQ(servers.size(), 1u);
	EXPECT_EQ(servers[0].urls, "turn:turn.example.com:3478");
	EXPECT_EQ(servers[0].username, "user");
}

TEST_F(ParseIceServersTest, ParsesSemicolonSeparatedEntries)
{
	const std::string config = "stun:stun.l.google.com:19302; turn:turn.example.com:3478|alice|secret";
	auto servers = parseIceServers(config);
	ASSERT_EQ(servers.size(), 2u);
	EXPECT_EQ(servers[0].urls, "stun:stun.l.google.com:19302");
	EXPECT_EQ(servers[1].urls, "turn:turn.example.com:3478");
	EXPECT_EQ(servers[1].credential, "secret");
}

TEST_F(ParseIceServersTest, EmptyConfigYieldsNoServers)
{
	EXPECT_TRUE(parseIceServers("").empty());
}

// Topology names
TEST(TopologyNameTest, ParsesKnownNames)
{
	Topology topology = Topology::Mesh;
	EXPECT_TRUE(parseTopology("STAR", topology));
	EXPECT_EQ(topology, Topology::Star);
	EXPECT_TRUE(parseTopology(" mesh ", topology));
	EXPECT_EQ(topology, Topology::Mesh);
	EXPECT_FALSE(parseTopology("ring", topology));
	EXPECT_STREQ(topologyName(Topology::Star), "star");
}

// Time Utilities Tests
TEST(TimeUtilsTest, CurrentTimeMsIncreases)
{
	int64_t time1 = currentTimeMs();
	EXPECT_GT(time1, 0);
	for (volatile int i = 0; i < 100000; i++) {
	}
	EXPECT_GE(currentTimeMs(), time1);
}
