#include "streamux/relay/ForwardingRelay.h"
#include "streamux/relay/OriginResolver.h"
#include "streamux/server/MultiplexServer.h"
#include "streamux/network/EventLoop.h"
#include "streamux/network/InetAddress.h"
#include "streamux/protocol/StreamFramer.h"
#include "streamux/common/Config.h"
#include "streamux/common/Logger.h"

#include <getopt.h>
#include <unistd.h>

#include <cstdio>
#include <memory>
#include <optional>

int main(int argc, char* argv[]) {
    using namespace streamux;

    std::string configFile = "../config/proxy.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }

    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(conf.GetString("global", "log_level", "INFO")));
    const std::string logFile = conf.GetString("global", "log_file", "");
    if (!logFile.empty() && !logger.SetOutputFile(logFile)) {
        LOG_ERROR << "Cannot open log file " << logFile << ", logging to stdout";
    }

    const std::string originHost = conf.GetString("proxy", "origin_host", "");
    const std::optional<uint16_t> originPort =
        conf.GetPort("proxy", "origin_port", relay::OriginResolver::kDefaultPort);
    const std::optional<uint16_t> port = conf.GetPort("global", "listen_port", 8081);
    const int upstreamTimeoutMs = conf.GetInt("proxy", "upstream_timeout_ms", 5000);
    const std::string framing = conf.GetString("framing", "format", "length");

    if (checkOnly) {
        bool ok = true;
        if (!port) {
            printf("[global] listen_port must be in 1..65535\n");
            ok = false;
        }
        if (!originPort) {
            printf("[proxy] origin_port must be in 1..65535\n");
            ok = false;
        }
        if (upstreamTimeoutMs <= 0) {
            printf("[proxy] upstream_timeout_ms must be positive\n");
            ok = false;
        }
        if (!protocol::FrameCodec::ParseFormat(framing)) {
            printf("[framing] format '%s' must be 'length' or 'delimited'\n", framing.c_str());
            ok = false;
        }
        printf("%s\n", ok ? "OK" : "FAILED");
        return ok ? 0 : 1;
    }

    if (!port || !originPort) {
        LOG_FATAL << "Invalid [global] listen_port or [proxy] origin_port, refusing to start";
        return 1;
    }

    relay::OriginResolver resolver;
    if (!originHost.empty()) {
        relay::OriginResolver::Origin pinned;
        pinned.host = originHost;
        pinned.port = *originPort;
        resolver = relay::OriginResolver(pinned);
        LOG_INFO << "All requests go to origin " << originHost << ":" << *originPort;
    } else {
        LOG_INFO << "Origins are taken from the Host header";
    }

    auto handler = std::make_shared<relay::ForwardingRelay>(resolver, upstreamTimeoutMs);

    const auto options = server::MultiplexServer::Options::FromConfig(conf, "proxy", 32);

    network::EventLoop loop;
    server::MultiplexServer proxy(&loop, network::InetAddress(*port), "StreamuxProxy", handler, options);
    proxy.Start();

    loop.Loop();
    return 0;
}
