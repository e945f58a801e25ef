/*
 * PeerRoom
 * Utility functions: ids, JSON helpers, ICE server parsing, logging
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "peerroom-common.h"

namespace peerroom
{

// Peer ids
std::string generatePeerSuffix(size_t length = PEER_SUFFIX_LENGTH);
PeerId makeCreatorPeerId(const std::string &roomId);
PeerId makeJoinerPeerId(const std::string &roomId, const std::string &suffix);
// Draws suffixes until the id cannot be mistaken for the creator's.
PeerId generateJoinerPeerId(const std::string &roomId, const std::function<std::string()> &nextSuffix);
bool isCreatorPeerId(const PeerId &peerId);
bool isValidRoomId(const std::string &roomId, std::string *error = nullptr);

// JSON builder for outbound envelopes
class JsonBuilder
{
public:
	JsonBuilder &add(const std::string &key, const std::string &value);
	JsonBuilder &add(const std::string &key, const char *value);
	JsonBuilder &add(const std::string &key, int value);
	JsonBuilder &add(const std::string &key, int64_t value);
	JsonBuilder &add(const std::string &key, bool value);
	JsonBuilder &addStringArray(const std::string &key, const std::vector<std::string> &values);
	JsonBuilder &addRaw(const std::string &key, const std::string &rawJson);
	std::string build() const;

	static std::string quote(const std::string &value);

private:
	std::vector<std::pair<std::string, std::string>> entries_;
};

// Flat JSON object reader. Nested objects and arrays are kept as raw text and
// can be fed to another JsonParser or read with getStringArray().
// Throws std::runtime_error when the input is not a well-formed object.
class JsonParser
{
public:
	enum class ValueType { String, Number, Bool, Null, Object, Array };

	explicit JsonParser(const std::string &json);

	bool hasKey(const std::string &key) const;
	bool isString(const std::string &key) const;
	bool isArray(const std::string &key) const;
	bool isObject(const std::string &key) const;

	std::string getString(const std::string &key, const std::string &defaultValue = "") const;
	int getInt(const std::string &key, int defaultValue = 0) const;
	int64_t getInt64(const std::string &key, int64_t defaultValue = 0) const;
	bool getBool(const std::string &key, bool defaultValue = false) const;
	std::string getObject(const std::string &key) const;

	// Returns false when the key is missing, not an array, or holds a non-string element.
	bool getStringArray(const std::string &key, std::vector<std::string> &values) const;

private:
	struct Value {
		ValueType type = ValueType::Null;
		std::string text;
	};

	void parse();

	std::string json_;
	std::map<std::string, Value> values_;
};

// String utilities
std::string trim(const std::string &str);
std::vector<std::string> split(const std::string &str, char delimiter);
std::string asciiLower(std::string value);

// ICE server configuration ("url|username|credential" entries separated by ';' or newlines)
std::vector<IceServer> parseIceServers(const std::string &config);

// Time utilities
int64_t currentTimeMs();

// Logging
void logInfo(const char *format, ...);
void logWarning(const char *format, ...);
void logError(const char *format, ...);
void logDebug(const char *format, ...);

} // namespace peerroom
