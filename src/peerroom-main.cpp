/*
 * PeerRoom
 * Console host: loads settings, runs one room session on the event loop
 */

#include <util/base.h>
#include <util/config-file.h>

#include <atomic>
#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "peerroom-coordinator.h"
#include "peerroom-rtc-transport.h"
#include "peerroom-utils.h"

using namespace peerroom;

namespace
{

constexpr const char *kSection = "PeerRoom";
constexpr int64_t kSignalPollMs = 200;

std::atomic<bool> gStopRequested{false};
int gLogLevel = LOG_INFO;

void onSignal(int)
{
	gStopRequested = true;
}

void stderrLogHandler(int level, const char *format, va_list args, void *)
{
	if (level > gLogLevel) {
		return;
	}

	char buffer[4096];
	vsnprintf(buffer, sizeof(buffer), format, args);

	const char *tag = "info";
	switch (level) {
	case LOG_ERROR:
		tag = "error";
		break;
	case LOG_WARNING:
		tag = "warning";
		break;
	case LOG_DEBUG:
		tag = "debug";
		break;
	default:
		break;
	}
	std::fprintf(stderr, "%s: %s\n", tag, buffer);
}

bool parseLogLevel(const std::string &value, int &level)
{
	const std::string lower = asciiLower(trim(value));
	if (lower == "debug") {
		level = LOG_DEBUG;
	} else if (lower == "info") {
		level = LOG_INFO;
	} else if (lower == "warning" || lower == "warn") {
		level = LOG_WARNING;
	} else if (lower == "error") {
		level = LOG_ERROR;
	} else {
		return false;
	}
	return true;
}

void setConfigDefaults(config_t *config)
{
	config_set_default_string(config, kSection, "RoomID", "");
	config_set_default_bool(config, kSection, "Creator", false);
	config_set_default_string(config, kSection, "Topology", "mesh");
	config_set_default_string(config, kSection, "RendezvousURL", DEFAULT_RENDEZVOUS_URL);
	config_set_default_string(config, kSection, "RendezvousKey", DEFAULT_RENDEZVOUS_KEY);
	config_set_default_string(config, kSection, "IceServers", "");
	config_set_default_int(config, kSection, "RebroadcastIntervalMs", DEFAULT_REBROADCAST_INTERVAL_MS);
	config_set_default_bool(config, kSection, "ForceTurn", false);
	config_set_default_string(config, kSection, "LogLevel", "info");
}

const char *findConfigPath(int argc, char **argv)
{
	for (int i = 1; i + 1 < argc; i++) {
		if (std::strcmp(argv[i], "--config") == 0) {
			return argv[i + 1];
		}
	}
	return nullptr;
}

config_t *openConfig(const char *path)
{
	config_t *config = nullptr;
	if (path) {
		const int result = config_open(&config, path, CONFIG_OPEN_EXISTING);
		if (result != CONFIG_SUCCESS) {
			logError("Could not read config file %s (error %d)", path, result);
			return nullptr;
		}
	} else if (config_open_string(&config, "") != CONFIG_SUCCESS) {
		logError("Could not create in-memory config");
		return nullptr;
	}
	if (config) {
		setConfigDefaults(config);
	}
	return config;
}

void printUsage(const char *program)
{
	std::fprintf(stderr,
	             "Usage: %s [--config FILE] --room ID [--create] [--topology mesh|star]\n"
	             "          [--server URL] [--key KEY] [--ice SERVERS] [--interval MS]\n"
	             "          [--force-turn] [--log-level debug|info|warning|error]\n",
	             program);
}

// Applies command line overrides on top of the config file values.
bool applyArguments(int argc, char **argv, config_t *config)
{
	for (int i = 1; i < argc; i++) {
		const std::string arg = argv[i];
		auto value = [&](const char *name) -> const char * {
			if (i + 1 >= argc) {
				logError("Missing value for %s", name);
				return nullptr;
			}
			return argv[++i];
		};

		if (arg == "--create") {
			config_set_bool(config, kSection, "Creator", true);
		} else if (arg == "--force-turn") {
			config_set_bool(config, kSection, "ForceTurn", true);
		} else if (arg == "--config") {
			i++;
		} else if (arg == "--room" || arg == "--topology" || arg == "--server" || arg == "--key" ||
		           arg == "--ice" || arg == "--interval" || arg == "--log-level") {
			const char *v = value(arg.c_str());
			if (!v) {
				return false;
			}
			if (arg == "--room") {
				config_set_string(config, kSection, "RoomID", v);
			} else if (arg == "--topology") {
				config_set_string(config, kSection, "Topology", v);
			} else if (arg == "--server") {
				config_set_string(config, kSection, "RendezvousURL", v);
			} else if (arg == "--key") {
				config_set_string(config, kSection, "RendezvousKey", v);
			} else if (arg == "--ice") {
				config_set_string(config, kSection, "IceServers", v);
			} else if (arg == "--interval") {
				config_set_string(config, kSection, "RebroadcastIntervalMs", v);
			} else {
				config_set_string(config, kSection, "LogLevel", v);
			}
		} else {
			logError("Unknown argument: %s", arg.c_str());
			return false;
		}
	}
	return true;
}

bool loadSettings(config_t *config, RoomSettings &settings)
{
	const char *logLevel = config_get_string(config, kSection, "LogLevel");
	if (logLevel && !parseLogLevel(logLevel, gLogLevel)) {
		logWarning("Unknown log level '%s', using info", logLevel);
		gLogLevel = LOG_INFO;
	}

	const char *roomId = config_get_string(config, kSection, "RoomID");
	settings.roomId = roomId ? trim(roomId) : "";
	settings.role = config_get_bool(config, kSection, "Creator") ? PeerRole::Creator : PeerRole::Joiner;

	const char *topology = config_get_string(config, kSection, "Topology");
	if (topology && !parseTopology(topology, settings.topology)) {
		logError("Unknown topology '%s' (expected mesh or star)", topology);
		return false;
	}

	settings.rebroadcastIntervalMs = config_get_int(config, kSection, "RebroadcastIntervalMs");
	if (settings.rebroadcastIntervalMs <= 0) {
		logWarning("Invalid rebroadcast interval, using %lld ms",
		           static_cast<long long>(DEFAULT_REBROADCAST_INTERVAL_MS));
		settings.rebroadcastIntervalMs = DEFAULT_REBROADCAST_INTERVAL_MS;
	}

	const char *url = config_get_string(config, kSection, "RendezvousURL");
	const char *key = config_get_string(config, kSection, "RendezvousKey");
	const char *ice = config_get_string(config, kSection, "IceServers");
	settings.transport.rendezvousUrl = url ? url : DEFAULT_RENDEZVOUS_URL;
	settings.transport.rendezvousKey = key ? key : DEFAULT_RENDEZVOUS_KEY;
	settings.transport.iceServers = parseIceServers(ice ? ice : "");
	settings.transport.forceTurn = config_get_bool(config, kSection, "ForceTurn");
	return true;
}

void printRoster(const PeerRoomCoordinator &session, const PeerRoomRtcTransport &transport)
{
	std::printf("%zu in room (%s, %s, %zu links):\n", session.participantCount(), session.localId().c_str(),
	            topologyName(session.topology()), transport.linkCount());
	for (const auto &participant : session.roster()) {
		std::printf("  %s%s\n", participant.id.c_str(), participant.isCreator ? " (creator)" : "");
	}
	std::fflush(stdout);
}

void handleCommand(const std::string &line, PeerRoomCoordinator &session, const PeerRoomRtcTransport &transport,
                   EventLoop &loop)
{
	const std::string command = trim(line);
	if (command.empty()) {
		return;
	}

	if (command == "/quit") {
		session.leave();
		loop.stop();
	} else if (command == "/mesh") {
		session.switchTopology(Topology::Mesh);
	} else if (command == "/star") {
		session.switchTopology(Topology::Star);
	} else if (command == "/reconnect") {
		session.reconnectAll();
	} else if (command == "/who") {
		printRoster(session, transport);
	} else if (command == "/audio") {
		std::printf("audio %s\n", session.toggleAudio() ? "on" : "muted");
	} else if (command == "/video") {
		std::printf("video %s\n", session.toggleVideo() ? "on" : "off");
	} else if (command[0] == '/') {
		std::printf("unknown command %s\n", command.c_str());
	} else {
		session.sendChatMessage(command);
	}
	std::fflush(stdout);
}

} // namespace

int main(int argc, char **argv)
{
	base_set_log_handler(stderrLogHandler, nullptr);

	for (int i = 1; i < argc; i++) {
		if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
			printUsage(argv[0]);
			return 0;
		}
	}

	config_t *config = openConfig(findConfigPath(argc, argv));
	if (!config) {
		return 1;
	}

	RoomSettings settings;
	const bool configured = applyArguments(argc, argv, config) && loadSettings(config, settings);
	config_close(config);
	if (!configured) {
		printUsage(argv[0]);
		return 1;
	}

	logInfo("PeerRoom %s", PEERROOM_VERSION);

	auto loop = std::make_shared<EventLoop>();
	PeerRoomRtcTransport transport;
	auto localStream = std::make_shared<MediaStream>("local");
	PeerRoomCoordinator session(*loop, transport, settings, localStream);

	session.setOnParticipantJoined([](const Participant &participant) {
		std::printf("* %s joined\n", participant.id.c_str());
		std::fflush(stdout);
	});
	session.setOnParticipantLeft([](const PeerId &peerId) {
		std::printf("* %s left\n", peerId.c_str());
		std::fflush(stdout);
	});
	session.setOnChatMessage([](const std::string &sender, const std::string &text, int64_t) {
		std::printf("<%s> %s\n", sender.c_str(), text.c_str());
		std::fflush(stdout);
	});
	session.setOnConnectionError([loop](const std::string &error) {
		std::fprintf(stderr, "%s\n", error.c_str());
		loop->stop();
	});

	std::signal(SIGINT, onSignal);
	std::signal(SIGTERM, onSignal);
	loop->scheduleRepeating(kSignalPollMs, [&session, loop]() {
		if (gStopRequested) {
			session.leave();
			loop->stop();
		}
	});

	if (!session.start()) {
		return 1;
	}

	// Owns a reference to the loop so a late line never posts into a destroyed queue.
	std::thread input([loop, &session, &transport]() {
		std::string line;
		while (std::getline(std::cin, line)) {
			loop->post([line, &session, &transport, loop]() { handleCommand(line, session, transport, *loop); });
		}
		loop->post([&session, &transport, loop]() { handleCommand("/quit", session, transport, *loop); });
	});
	input.detach();

	loop->run();
	session.leave();
	return session.connectionError() ? 1 : 0;
}
