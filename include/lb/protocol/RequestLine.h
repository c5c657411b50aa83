#pragma once

#include <cstddef>
#include <string>

namespace lb {
namespace protocol {

// Best-effort request path from the first bytes of a connection: the second
// whitespace-separated token of the first line, or "/" when there is none.
// Works on arbitrary bytes; nothing here requires the stream to be HTTP.
std::string ExtractRequestPath(const char* data, size_t len);

inline std::string ExtractRequestPath(const std::string& chunk) {
    return ExtractRequestPath(chunk.data(), chunk.size());
}

} // namespace protocol
} // namespace lb
