#include "lb/protocol/HttpResponse.h"

#include <cstdio>

namespace lb {
namespace protocol {

std::string FormatResponse(int statusCode, const std::string& reason, const std::string& body) {
    char head[64];
    std::snprintf(head, sizeof head, "HTTP/1.1 %d ", statusCode);
    std::string out(head);
    out += reason;
    std::snprintf(head, sizeof head, "\r\nContent-Length: %zu\r\n\r\n", body.size());
    out += head;
    out += body;
    return out;
}

const std::string& ServiceUnavailableResponse() {
    static const std::string response = FormatResponse(503, "Service Unavailable", "Service Unavailable\n");
    return response;
}

} // namespace protocol
} // namespace lb
