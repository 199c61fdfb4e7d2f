#pragma once

#include <chrono>
#include <string>

namespace slugline {
namespace db {

/**
 * Random RFC 4122 UUID rendered as 36-character text
 */
std::string newId();

/**
 * Current UTC time in ISO 8601 format with milliseconds
 * (YYYY-MM-DDTHH:MM:SS.mmmZ)
 */
std::string currentTimestamp();

std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace db
} // namespace slugline
