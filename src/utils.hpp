#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::vector<unsigned char> sha1_bytes(const std::string &data);

std::string base64_encode(const std::vector<unsigned char>& data);
std::vector<unsigned char> random_bytes(std::size_t count);

// RFC 4122 identifiers
std::string uuid_v4();
std::string uuid_v5(const std::string& namespace_uuid, const std::string& name);
bool is_uuid(const std::string& value);

using SystemTime = std::chrono::system_clock::time_point;
using Clock = std::function<SystemTime()>;

// RFC 3339 / ISO 8601 in UTC, millisecond precision ("2024-05-01T12:00:00.000Z")
std::string format_timestamp(SystemTime tp);
std::optional<SystemTime> parse_timestamp(const std::string& text);

// Replaces every byte that does not start a well-formed UTF-8 sequence with U+FFFD.
std::string to_valid_utf8(const std::string& text);

std::string to_lower(std::string value);
std::string to_upper(std::string value);
std::string trim_copy(std::string value);
bool iequals(const std::string& a, const std::string& b);

std::string local_hostname();
