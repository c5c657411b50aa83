#pragma once

#include "lb/balancer/Topology.h"
#include "lb/common/Config.h"
#include "lb/common/Logger.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lb {

// Everything the server reads from its INI file, validated.
struct ServerOptions {
    uint16_t listenPort = 80;
    int threads = 0;
    common::LogLevel logLevel = common::LogLevel::INFO;

    double healthCheckIntervalSec = 5.0;
    double healthCheckTimeoutSec = 2.0;

    size_t peekBytes = 1024;
    double connectTimeoutSec = 0;
    size_t highWaterMarkBytes = 8 * 1024 * 1024;

    std::vector<balancer::Backend> backends;
    std::vector<balancer::PathRoute> routes;

    // Fills *out from parsed settings. On failure *out is untouched and
    // *error names the offending section and key.
    static bool FromConfig(const common::Config& conf, ServerOptions* out, std::string* error);
    static bool LoadFile(const std::string& path, ServerOptions* out, std::string* error);
};

} // namespace lb
