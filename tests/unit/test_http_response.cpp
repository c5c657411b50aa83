#include "lb/protocol/HttpResponse.h"
#include "lb/common/Logger.h"

#include <cassert>
#include <string>

using namespace lb;

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);

    const std::string& unavailable = protocol::ServiceUnavailableResponse();
    assert(unavailable ==
           "HTTP/1.1 503 Service Unavailable\r\n"
           "Content-Length: 20\r\n"
           "\r\n"
           "Service Unavailable\n");

    // Declared length equals the bytes after the blank line.
    const size_t bodyStart = unavailable.find("\r\n\r\n") + 4;
    assert(unavailable.size() - bodyStart == 20);

    // Same object every call.
    assert(&protocol::ServiceUnavailableResponse() == &unavailable);

    assert(protocol::FormatResponse(502, "Bad Gateway", "") ==
           "HTTP/1.1 502 Bad Gateway\r\n"
           "Content-Length: 0\r\n"
           "\r\n");

    LOG_INFO << "HttpResponse: PASS";
    return 0;
}
