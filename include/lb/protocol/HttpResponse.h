#pragma once

#include <string>

namespace lb {
namespace protocol {

// "HTTP/1.1 {code} {reason}", a Content-Length matching `body`, then the body.
std::string FormatResponse(int statusCode, const std::string& reason, const std::string& body);

// The reply sent when no backend can take a connection.
const std::string& ServiceUnavailableResponse();

} // namespace protocol
} // namespace lb
