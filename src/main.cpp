#include "lb/LoadBalancerServer.h"
#include "lb/ServerOptions.h"
#include "lb/network/EventLoop.h"
#include "lb/common/Logger.h"

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <string>

namespace {

void PrintUsage(const char* prog) {
    std::printf("Usage: %s [-c config_file] [-p listen_port] [-C] [-h]\n", prog);
    std::printf("  -c  config file (default lb.conf)\n");
    std::printf("  -p  override [global] listen_port\n");
    std::printf("  -C  check config and exit\n");
    std::printf("  -h  show this help\n");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace lb;

    std::string configFile = "lb.conf";
    std::string portOverride;
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:p:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'p':
                portOverride = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            default:
                PrintUsage(argv[0]);
                return 1;
        }
    }

    common::Config conf;
    std::string error;
    ServerOptions options;
    bool ok = conf.Load(configFile, &error);
    if (ok && !portOverride.empty()) {
        std::string merged = conf.DumpIni() + "[global]\nlisten_port = " + portOverride + "\n";
        ok = conf.LoadFromString(merged, &error);
    }
    if (ok) ok = ServerOptions::FromConfig(conf, &options, &error);

    if (!ok) {
        LOG_ERROR << "Invalid configuration: " << error;
        if (checkOnly) std::printf("%s\n", error.c_str());
        return 1;
    }
    if (checkOnly) {
        std::printf("OK\n");
        return 0;
    }

    common::Logger::Instance().SetLevel(options.logLevel);

    // Peer resets surface as EPIPE from write(2) instead of killing the process.
    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    LoadBalancerServer server(&loop, options);
    if (!server.Start()) {
        LOG_FATAL << "Failed to start load balancer on port " << options.listenPort;
        return 1;
    }

    loop.Loop();
    return 0;
}
