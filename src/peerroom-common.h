/*
 * PeerRoom
 * Shared types and constants
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#define PEERROOM_VERSION "1.0.0"

namespace peerroom
{

using PeerId = std::string;

// Peer id naming convention: creator is "{room}-creator", joiners "{room}-{suffix}".
constexpr const char *CREATOR_MARKER = "-creator";

constexpr int64_t DEFAULT_REBROADCAST_INTERVAL_MS = 10000;
constexpr int64_t RENDEZVOUS_HEARTBEAT_INTERVAL_MS = 5000;
constexpr size_t PEER_SUFFIX_LENGTH = 8;

constexpr const char *DEFAULT_RENDEZVOUS_URL = "wss://0.peerjs.com/peerjs";
constexpr const char *DEFAULT_RENDEZVOUS_KEY = "peerjs";

const std::vector<std::string> DEFAULT_STUN_SERVERS = {"stun:stun.l.google.com:19302",
                                                       "stun:global.stun.twilio.com:3478"};

enum class Topology { Mesh, Star };

enum class PeerRole { Creator, Joiner };

enum class ChannelKind { Data, Media };

enum class ConnectionState { New, Connecting, Connected, Disconnected, Failed, Closed };

enum class SessionState { Idle, Opening, Open, Failed, Closed };

struct IceServer {
	std::string urls;
	std::string username;
	std::string credential;
};

struct TransportConfig {
	std::vector<IceServer> iceServers;
	bool forceTurn = false;
	std::string rendezvousUrl = DEFAULT_RENDEZVOUS_URL;
	std::string rendezvousKey = DEFAULT_RENDEZVOUS_KEY;
};

struct RoomSettings {
	std::string roomId;
	PeerRole role = PeerRole::Joiner;
	Topology topology = Topology::Mesh;
	int64_t rebroadcastIntervalMs = DEFAULT_REBROADCAST_INTERVAL_MS;
	TransportConfig transport;
};

const char *topologyName(Topology topology);
bool parseTopology(const std::string &value, Topology &topology);

} // namespace peerroom
