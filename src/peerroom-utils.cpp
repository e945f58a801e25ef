/*
 * PeerRoom
 * Utility function implementations
 */

#include "peerroom-utils.h"

#include <util/base.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <random>
#include <sstream>
#include <stdexcept>

namespace peerroom
{

namespace
{

[[noreturn]] void failParse(const char *what, size_t pos)
{
	throw std::runtime_error(std::string(what) + " at offset " + std::to_string(pos));
}

void skipWhitespace(const std::string &text, size_t &pos)
{
	while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
		pos++;
}

uint32_t readHex4(const std::string &text, size_t pos)
{
	if (pos + 4 > text.size()) {
		failParse("Truncated unicode escape", pos);
	}

	uint32_t value = 0;
	for (size_t i = pos; i < pos + 4; ++i) {
		const char c = text[i];
		value <<= 4;
		if (c >= '0' && c <= '9') {
			value |= static_cast<uint32_t>(c - '0');
		} else if (c >= 'a' && c <= 'f') {
			value |= static_cast<uint32_t>(c - 'a' + 10);
		} else if (c >= 'A' && c <= 'F') {
			value |= static_cast<uint32_t>(c - 'A' + 10);
		} else {
			failParse("Invalid unicode escape", i);
		}
	}
	return value;
}

void appendUtf8(std::string &out, uint32_t cp)
{
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

// Expects pos on the opening quote; leaves pos after the closing quote.
std::string readString(const std::string &text, size_t &pos)
{
	pos++;
	std::string value;
	while (true) {
		if (pos >= text.size()) {
			failParse("Unterminated string", pos);
		}

		const char c = text[pos++];
		if (c == '"') {
			break;
		}
		if (c != '\\') {
			value += c;
			continue;
		}

		if (pos >= text.size()) {
			failParse("Unterminated escape", pos);
		}
		const char esc = text[pos++];
		switch (esc) {
		case '"':
			value += '"';
			break;
		case '\\':
			value += '\\';
			break;
		case '/':
			value += '/';
			break;
		case 'b':
			value += '\b';
			break;
		case 'f':
			value += '\f';
			break;
		case 'n':
			value += '\n';
			break;
		case 'r':
			value += '\r';
			break;
		case 't':
			value += '\t';
			break;
		case 'u': {
			uint32_t cp = readHex4(text, pos);
			pos += 4;
			// Surrogate pair
			if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 <= text.size() && text[pos] == '\\' &&
			    text[pos + 1] == 'u') {
				const uint32_t low = readHex4(text, pos + 2);
				if (low >= 0xDC00 && low <= 0xDFFF) {
					cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
					pos += 6;
				}
			}
			appendUtf8(value, cp);
			break;
		}
		default:
			failParse("Invalid escape", pos - 1);
		}
	}
	return value;
}

JsonParser::ValueType scanValue(const std::string &text, size_t &pos, std::string &out);

void skipComposite(const std::string &text, size_t &pos, char open, char close)
{
	pos++;
	skipWhitespace(text, pos);
	if (pos < text.size() && text[pos] == close) {
		pos++;
		return;
	}

	while (true) {
		skipWhitespace(text, pos);
		if (open == '{') {
			if (pos >= text.size() || text[pos] != '"') {
				failParse("Expected key", pos);
			}
			readString(text, pos);
			skipWhitespace(text, pos);
			if (pos >= text.size() || text[pos] != ':') {
				failParse("Expected ':'", pos);
			}
			pos++;
			skipWhitespace(text, pos);
		}

		std::string ignored;
		scanValue(text, pos, ignored);
		skipWhitespace(text, pos);

		if (pos >= text.size()) {
			failParse("Unterminated container", pos);
		}
		if (text[pos] == ',') {
			pos++;
			continue;
		}
		if (text[pos] == close) {
			pos++;
			return;
		}
		failParse("Expected ',' or closing bracket", pos);
	}
}

// Reads one value at pos. Strings come back unescaped, containers and literals as raw text.
JsonParser::ValueType scanValue(const std::string &text, size_t &pos, std::string &out)
{
	if (pos >= text.size()) {
		failParse("Missing value", pos);
	}

	const size_t start = pos;
	const char c = text[pos];
	if (c == '"') {
		out = readString(text, pos);
		return JsonParser::ValueType::String;
	}
	if (c == '{' || c == '[') {
		skipComposite(text, pos, c, c == '{' ? '}' : ']');
		out = text.substr(start, pos - start);
		return c == '{' ? JsonParser::ValueType::Object : JsonParser::ValueType::Array;
	}

	while (pos < text.size() && text[pos] != ',' && text[pos] != '}' && text[pos] != ']' &&
	       !std::isspace(static_cast<unsigned char>(text[pos]))) {
		pos++;
	}
	out = text.substr(start, pos - start);

	if (out == "true" || out == "false") {
		return JsonParser::ValueType::Bool;
	}
	if (out == "null") {
		return JsonParser::ValueType::Null;
	}
	if (out.empty() || out.find_first_not_of("0123456789+-.eE") != std::string::npos ||
	    !(std::isdigit(static_cast<unsigned char>(out[0])) || out[0] == '-')) {
		failParse("Invalid literal", start);
	}
	return JsonParser::ValueType::Number;
}

bool startsWithInsensitive(const std::string &value, const char *prefix)
{
	size_t idx = 0;
	for (; prefix[idx] != '\0'; ++idx) {
		if (idx >= value.size()) {
			return false;
		}
		const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(value[idx])));
		const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[idx])));
		if (a != b) {
			return false;
		}
	}
	return true;
}

bool isIceUrl(const std::string &url)
{
	return startsWithInsensitive(url, "stun:") || startsWithInsensitive(url, "stuns:") ||
	       startsWithInsensitive(url, "turn:") || startsWithInsensitive(url, "turns:");
}

void logWithLevel(int level, const char *format, va_list args)
{
	char buffer[1024];
	vsnprintf(buffer, sizeof(buffer), format, args);
	blog(level, "[PeerRoom] %s", buffer);
}

} // namespace

const char *topologyName(Topology topology)
{
	return topology == Topology::Star ? "star" : "mesh";
}

bool parseTopology(const std::string &value, Topology &topology)
{
	const std::string normalized = asciiLower(trim(value));
	if (normalized == "mesh") {
		topology = Topology::Mesh;
		return true;
	}
	if (normalized == "star") {
		topology = Topology::Star;
		return true;
	}
	return false;
}

// Peer ids
std::string generatePeerSuffix(size_t length)
{
	static const char alphanum[] = "0123456789"
	                               "abcdefghijklmnopqrstuvwxyz";
	thread_local std::random_device rd;
	thread_local std::mt19937 gen(rd());
	thread_local std::uniform_int_distribution<> dis(0, sizeof(alphanum) - 2);

	std::string result;
	result.reserve(length);
	for (size_t i = 0; i < length; i++) {
		result += alphanum[dis(gen)];
	}
	return result;
}

PeerId makeCreatorPeerId(const std::string &roomId)
{
	return roomId + CREATOR_MARKER;
}

PeerId makeJoinerPeerId(const std::string &roomId, const std::string &suffix)
{
	return roomId + "-" + suffix;
}

bool isCreatorPeerId(const PeerId &peerId)
{
	return peerId.find(CREATOR_MARKER) != std::string::npos;
}

PeerId generateJoinerPeerId(const std::string &roomId, const std::function<std::string()> &nextSuffix)
{
	PeerId peerId;
	do {
		peerId = makeJoinerPeerId(roomId, nextSuffix());
	} while (isCreatorPeerId(peerId));
	return peerId;
}

bool isValidRoomId(const std::string &roomId, std::string *error)
{
	auto reject = [error](const char *reason) {
		if (error) {
			*error = reason;
		}
		return false;
	};

	if (roomId.empty()) {
		return reject("Room id is empty");
	}
	if (roomId.size() > 64) {
		return reject("Room id is longer than 64 characters");
	}
	for (char c : roomId) {
		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
			return reject("Room id may only contain letters, digits, '-' and '_'");
		}
	}
	if (isCreatorPeerId(roomId)) {
		return reject("Room id must not contain the creator marker");
	}
	return true;
}

// JSON Builder implementation
std::string JsonBuilder::quote(const std::string &value)
{
	std::string escaped;
	escaped.reserve(value.size() + 2);
	escaped += '"';
	for (char c : value) {
		switch (c) {
		case '"':
			escaped += "\\\"";
			break;
		case '\\':
			escaped += "\\\\";
			break;
		case '\b':
			escaped += "\\b";
			break;
		case '\f':
			escaped += "\\f";
			break;
		case '\n':
			escaped += "\\n";
			break;
		case '\r':
			escaped += "\\r";
			break;
		case '\t':
			escaped += "\\t";
			break;
		default:
			if (static_cast<unsigned char>(c) < 0x20) {
				char unicode[8];
				snprintf(unicode, sizeof(unicode), "\\u%04x", static_cast<unsigned>(c));
				escaped += unicode;
			} else {
				escaped += c;
			}
			break;
		}
	}
	escaped += '"';
	return escaped;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const std::string &value)
{
	entries_.emplace_back(key, quote(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const char *value)
{
	return add(key, std::string(value ? value : ""));
}

JsonBuilder &JsonBuilder::add(const std::string &key, int value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, int64_t value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, bool value)
{
	entries_.emplace_back(key, value ? "true" : "false");
	return *this;
}

JsonBuilder &JsonBuilder::addStringArray(const std::string &key, const std::vector<std::string> &values)
{
	std::string array = "[";
	for (size_t i = 0; i < values.size(); i++) {
		if (i > 0)
			array += ",";
		array += quote(values[i]);
	}
	array += "]";
	entries_.emplace_back(key, array);
	return *this;
}

JsonBuilder &JsonBuilder::addRaw(const std::string &key, const std::string &rawJson)
{
	entries_.emplace_back(key, rawJson);
	return *this;
}

std::string JsonBuilder::build() const
{
	std::stringstream ss;
	ss << "{";
	for (size_t i = 0; i < entries_.size(); i++) {
		if (i > 0)
			ss << ",";
		ss << quote(entries_[i].first) << ":" << entries_[i].second;
	}
	ss << "}";
	return ss.str();
}

// JSON Parser implementation
JsonParser::JsonParser(const std::string &json) : json_(json)
{
	parse();
}

void JsonParser::parse()
{
	size_t pos = 0;
	skipWhitespace(json_, pos);
	if (pos >= json_.size() || json_[pos] != '{') {
		failParse("Expected object", pos);
	}
	pos++;

	skipWhitespace(json_, pos);
	if (pos < json_.size() && json_[pos] == '}') {
		pos++;
	} else {
		while (true) {
			skipWhitespace(json_, pos);
			if (pos >= json_.size() || json_[pos] != '"') {
				failParse("Expected key", pos);
			}
			std::string key = readString(json_, pos);

			skipWhitespace(json_, pos);
			if (pos >= json_.size() || json_[pos] != ':') {
				failParse("Expected ':'", pos);
			}
			pos++;
			skipWhitespace(json_, pos);

			Value value;
			value.type = scanValue(json_, pos, value.text);
			values_[key] = std::move(value);

			skipWhitespace(json_, pos);
			if (pos >= json_.size()) {
				failParse("Unterminated object", pos);
			}
			if (json_[pos] == ',') {
				pos++;
				continue;
			}
			if (json_[pos] == '}') {
				pos++;
				break;
			}
			failParse("Expected ',' or '}'", pos);
		}
	}

	skipWhitespace(json_, pos);
	if (pos != json_.size()) {
		failParse("Trailing characters", pos);
	}
}

bool JsonParser::hasKey(const std::string &key) const
{
	return values_.find(key) != values_.end();
}

bool JsonParser::isString(const std::string &key) const
{
	auto it = values_.find(key);
	return it != values_.end() && it->second.type == ValueType::String;
}

bool JsonParser::isArray(const std::string &key) const
{
	auto it = values_.find(key);
	return it != values_.end() && it->second.type == ValueType::Array;
}

bool JsonParser::isObject(const std::string &key) const
{
	auto it = values_.find(key);
	return it != values_.end() && it->second.type == ValueType::Object;
}

std::string JsonParser::getString(const std::string &key, const std::string &defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end() && it->second.type != ValueType::Null) {
		return it->second.text;
	}
	return defaultValue;
}

int JsonParser::getInt(const std::string &key, int defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end() && it->second.type == ValueType::Number) {
		try {
			return std::stoi(it->second.text);
		} catch (const std::exception &) {
			return defaultValue;
		}
	}
	return defaultValue;
}

int64_t JsonParser::getInt64(const std::string &key, int64_t defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end() && it->second.type == ValueType::Number) {
		try {
			// Browsers emit millisecond timestamps as doubles.
			return static_cast<int64_t>(std::stod(it->second.text));
		} catch (const std::exception &) {
			return defaultValue;
		}
	}
	return defaultValue;
}

bool JsonParser::getBool(const std::string &key, bool defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end() && it->second.type == ValueType::Bool) {
		return it->second.text == "true";
	}
	return defaultValue;
}

std::string JsonParser::getObject(const std::string &key) const
{
	auto it = values_.find(key);
	if (it != values_.end() && it->second.type == ValueType::Object) {
		return it->second.text;
	}
	return "";
}

bool JsonParser::getStringArray(const std::string &key, std::vector<std::string> &values) const
{
	auto it = values_.find(key);
	if (it == values_.end() || it->second.type != ValueType::Array) {
		return false;
	}

	const std::string &arr = it->second.text;
	std::vector<std::string> result;
	try {
		size_t pos = 1;
		skipWhitespace(arr, pos);
		while (pos < arr.size() && arr[pos] != ']') {
			std::string element;
			if (scanValue(arr, pos, element) != ValueType::String) {
				return false;
			}
			result.push_back(std::move(element));

			skipWhitespace(arr, pos);
			if (pos < arr.size() && arr[pos] == ',') {
				pos++;
				skipWhitespace(arr, pos);
			}
		}
	} catch (const std::runtime_error &) {
		return false;
	}

	values = std::move(result);
	return true;
}

// String utilities
std::string trim(const std::string &str)
{
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos)
		return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
	std::vector<std::string> result;
	if (str.empty()) {
		result.push_back("");
		return result;
	}
	std::stringstream ss(str);
	std::string item;
	while (std::getline(ss, item, delimiter)) {
		result.push_back(item);
	}
	return result;
}

std::string asciiLower(std::string value)
{
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return value;
}

std::vector<IceServer> parseIceServers(const std::string &config)
{
	std::vector<IceServer> servers;
	std::stringstream lines(config);
	std::string rawLine;

	auto parseEntry = [&servers](const std::string &entryValue) {
		const std::string line = trim(entryValue);
		if (line.empty() || line[0] == '#' || line.rfind("//", 0) == 0) {
			return;
		}

		IceServer server;
		if (line.find('|') != std::string::npos) {
			const std::vector<std::string> parts = split(line, '|');
			server.urls = trim(parts[0]);
			if (parts.size() > 1) {
				server.username = trim(parts[1]);
			}
			if (parts.size() > 2) {
				server.credential = trim(parts[2]);
			}
		} else {
			// "turn:host:3478 username=alice credential=secret"
			std::stringstream tokenStream(line);
			std::string token;
			tokenStream >> server.urls;
			while (tokenStream >> token) {
				const size_t equalsPos = token.find('=');
				const std::string key = asciiLower(token.substr(0, equalsPos));
				const std::string value = equalsPos == std::string::npos ? "" : token.substr(equalsPos + 1);
				if (key == "username" || key == "user") {
					server.username = value;
				} else if (key == "credential" || key == "password") {
					server.credential = value;
				}
			}
		}

		if (!server.urls.empty() && isIceUrl(server.urls)) {
			servers.push_back(std::move(server));
		} else {
			logWarning("Ignoring ICE server entry '%s'", line.c_str());
		}
	};

	while (std::getline(lines, rawLine)) {
		for (const auto &entry : split(rawLine, ';')) {
			parseEntry(entry);
		}
	}

	return servers;
}

// Time utilities
int64_t currentTimeMs()
{
	using namespace std::chrono;
	return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Logging
void logInfo(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logWithLevel(LOG_INFO, format, args);
	va_end(args);
}

void logWarning(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logWithLevel(LOG_WARNING, format, args);
	va_end(args);
}

void logError(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logWithLevel(LOG_ERROR, format, args);
	va_end(args);
}

void logDebug(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logWithLevel(LOG_DEBUG, format, args);
	va_end(args);
}

} // namespace peerroom
