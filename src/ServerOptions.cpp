#include "lb/ServerOptions.h"
#include "lb/network/InetAddress.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace lb {

namespace {

const char kBackendPrefix[] = "backend:";
const char kRoutePrefix[] = "route:";

bool ParseLong(const std::string& text, long* out) {
    try {
        size_t used = 0;
        const long v = std::stol(text, &used);
        if (used != text.size()) return false;
        *out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool ParseDouble(const std::string& text, double* out) {
    try {
        size_t used = 0;
        const double v = std::stod(text, &used);
        if (used != text.size()) return false;
        *out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// Reads an optional integer knob, enforcing [minVal, maxVal].
bool ReadLong(const common::Config& conf, const std::string& section, const std::string& key,
              long minVal, long maxVal, long* value, std::string* error) {
    auto raw = conf.Find(section, key);
    if (!raw) return true;
    long v = 0;
    if (!ParseLong(*raw, &v) || v < minVal || v > maxVal) {
        *error = "[" + section + "] " + key + " = '" + *raw + "': expected an integer in "
                 + std::to_string(minVal) + ".." + std::to_string(maxVal);
        return false;
    }
    *value = v;
    return true;
}

bool ReadSeconds(const common::Config& conf, const std::string& section, const std::string& key,
                 bool allowZero, double* value, std::string* error) {
    auto raw = conf.Find(section, key);
    if (!raw) return true;
    double v = 0;
    if (!ParseDouble(*raw, &v) || !(v >= 0) || (!allowZero && v == 0) || v > 86400) {
        *error = "[" + section + "] " + key + " = '" + *raw + "': expected seconds "
                 + (allowZero ? ">= 0" : "> 0");
        return false;
    }
    *value = v;
    return true;
}

bool RequireKey(const std::string& section, const common::Config::Section& kv,
                const std::string& key, std::string* value, std::string* error) {
    auto it = kv.find(key);
    if (it == kv.end() || it->second.empty()) {
        *error = "[" + section + "] missing '" + key + "'";
        return false;
    }
    *value = it->second;
    return true;
}

bool CheckAddress(const std::string& section, const std::string& address, std::string* error) {
    std::string host;
    uint16_t port = 0;
    if (!network::InetAddress::SplitHostPort(address, &host, &port)) {
        *error = "[" + section + "] address '" + address + "' is not host:port";
        return false;
    }
    return true;
}

bool CheckPath(const std::string& section, const std::string& key, const std::string& path, std::string* error) {
    if (path.empty() || path[0] != '/') {
        *error = "[" + section + "] " + key + " '" + path + "' must start with '/'";
        return false;
    }
    return true;
}

// Every section and key must be one FromConfig reads; a misspelt header
// would otherwise drop a backend without a word.
bool CheckLayout(const common::Config& conf, std::string* error) {
    static const std::map<std::string, std::set<std::string>> kFixed = {
        {"global", {"listen_port", "threads", "log_level"}},
        {"health_check", {"interval", "timeout"}},
        {"proxy", {"peek_bytes", "connect_timeout", "high_water_mark"}},
    };
    static const std::map<std::string, std::set<std::string>> kIndexed = {
        {kBackendPrefix, {"address", "health_check_path"}},
        {kRoutePrefix, {"path_prefix", "address"}},
    };

    for (const auto& item : conf.GetSectionsWithPrefix("")) {
        const std::string& name = item.first;
        const std::set<std::string>* keys = nullptr;
        auto fixed = kFixed.find(name);
        if (fixed != kFixed.end()) {
            keys = &fixed->second;
        } else {
            for (const auto& indexed : kIndexed) {
                if (name.compare(0, indexed.first.size(), indexed.first) == 0) {
                    keys = &indexed.second;
                    break;
                }
            }
        }
        if (!keys) {
            *error = "unknown section [" + name + "]; expected [global], [health_check], [proxy], "
                     "[backend:N] or [route:N]";
            return false;
        }
        for (const auto& kv : item.second) {
            if (!keys->count(kv.first)) {
                *error = "[" + name + "] unknown key '" + kv.first + "'";
                return false;
            }
        }
    }
    return true;
}

// Orders "[prefixN]" sections by the integer N.
bool IndexedSections(const common::Config& conf, const std::string& prefix,
                     std::map<long, std::pair<std::string, common::Config::Section>>* out,
                     std::string* error) {
    for (auto& item : conf.GetSectionsWithPrefix(prefix)) {
        const std::string suffix = item.first.substr(prefix.size());
        long index = 0;
        if (suffix.empty() || !ParseLong(suffix, &index)) {
            *error = "section [" + item.first + "]: index after '" + prefix + "' must be an integer";
            return false;
        }
        if (out->count(index)) {
            *error = "section [" + item.first + "] duplicates [" + (*out)[index].first + "]";
            return false;
        }
        (*out)[index] = std::move(item);
    }
    return true;
}

} // namespace

bool ServerOptions::FromConfig(const common::Config& conf, ServerOptions* out, std::string* error) {
    ServerOptions opts;
    if (!CheckLayout(conf, error)) return false;

    long port = opts.listenPort;
    if (!ReadLong(conf, "global", "listen_port", 1, 65535, &port, error)) return false;
    opts.listenPort = static_cast<uint16_t>(port);

    long threads = opts.threads;
    if (!ReadLong(conf, "global", "threads", 0, 1024, &threads, error)) return false;
    opts.threads = static_cast<int>(threads);

    if (auto level = conf.Find("global", "log_level")) {
        if (!common::Logger::ParseLevel(*level, &opts.logLevel)) {
            *error = "[global] log_level = '" + *level + "': expected DEBUG, INFO, WARN, ERROR or FATAL";
            return false;
        }
    }

    if (!ReadSeconds(conf, "health_check", "interval", false, &opts.healthCheckIntervalSec, error)) return false;
    if (!ReadSeconds(conf, "health_check", "timeout", false, &opts.healthCheckTimeoutSec, error)) return false;

    long peek = static_cast<long>(opts.peekBytes);
    if (!ReadLong(conf, "proxy", "peek_bytes", 1, 65536, &peek, error)) return false;
    opts.peekBytes = static_cast<size_t>(peek);

    if (!ReadSeconds(conf, "proxy", "connect_timeout", true, &opts.connectTimeoutSec, error)) return false;

    long hwm = static_cast<long>(opts.highWaterMarkBytes);
    if (!ReadLong(conf, "proxy", "high_water_mark", 4096, 1L << 30, &hwm, error)) return false;
    opts.highWaterMarkBytes = static_cast<size_t>(hwm);

    std::map<long, std::pair<std::string, common::Config::Section>> backendSections;
    if (!IndexedSections(conf, kBackendPrefix, &backendSections, error)) return false;
    for (const auto& item : backendSections) {
        const std::string& name = item.second.first;
        const auto& kv = item.second.second;
        balancer::Backend b;
        if (!RequireKey(name, kv, "address", &b.address, error)) return false;
        if (!CheckAddress(name, b.address, error)) return false;
        if (!RequireKey(name, kv, "health_check_path", &b.healthCheckPath, error)) return false;
        if (!CheckPath(name, "health_check_path", b.healthCheckPath, error)) return false;
        opts.backends.push_back(std::move(b));
    }

    std::map<long, std::pair<std::string, common::Config::Section>> routeSections;
    if (!IndexedSections(conf, kRoutePrefix, &routeSections, error)) return false;
    for (const auto& item : routeSections) {
        const std::string& name = item.second.first;
        const auto& kv = item.second.second;
        balancer::PathRoute r;
        if (!RequireKey(name, kv, "path_prefix", &r.pathPrefix, error)) return false;
        if (!CheckPath(name, "path_prefix", r.pathPrefix, error)) return false;
        if (!RequireKey(name, kv, "address", &r.address, error)) return false;
        if (!CheckAddress(name, r.address, error)) return false;
        opts.routes.push_back(std::move(r));
    }

    *out = std::move(opts);
    return true;
}

bool ServerOptions::LoadFile(const std::string& path, ServerOptions* out, std::string* error) {
    common::Config conf;
    if (!conf.Load(path, error)) return false;
    return FromConfig(conf, out, error);
}

} // namespace lb
