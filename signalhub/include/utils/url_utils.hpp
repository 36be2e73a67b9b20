#ifndef SIGNALHUB_URL_UTILS_HPP
#define SIGNALHUB_URL_UTILS_HPP

#include <string>
#include <map>

namespace signalhub {

// Percent-decoding; '+' becomes a space. Malformed escapes are kept literally.
std::string urlDecode(const std::string& value);

// Parses "a=1&b=2". Keys and values are decoded; a key without '=' maps to "".
std::map<std::string, std::string> parseQueryString(const std::string& query);

// Splits a request target into path and query ("/ws?room_id=x" -> "/ws", "room_id=x").
void splitTarget(const std::string& target, std::string& path, std::string& query);

} // namespace signalhub

#endif // SIGNALHUB_URL_UTILS_HPP
