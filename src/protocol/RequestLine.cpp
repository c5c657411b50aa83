#include "lb/protocol/RequestLine.h"

namespace lb {
namespace protocol {

namespace {

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

std::string ExtractRequestPath(const char* data, size_t len) {
    size_t end = 0;
    while (end < len && data[end] != '\n') ++end;

    size_t pos = 0;
    for (int token = 0; token < 2; ++token) {
        while (pos < end && IsSpace(data[pos])) ++pos;
        if (pos == end) return "/";
        const size_t start = pos;
        while (pos < end && !IsSpace(data[pos])) ++pos;
        if (token == 1) return std::string(data + start, pos - start);
    }
    return "/";
}

} // namespace protocol
} // namespace lb
