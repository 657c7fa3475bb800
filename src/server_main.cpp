#include "streamux/server/FileRequestHandler.h"
#include "streamux/server/MultiplexServer.h"
#include "streamux/server/ResourceStore.h"
#include "streamux/server/StatusEngine.h"
#include "streamux/network/EventLoop.h"
#include "streamux/network/InetAddress.h"
#include "streamux/protocol/StreamFramer.h"
#include "streamux/common/Config.h"
#include "streamux/common/Logger.h"

#include <getopt.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <memory>
#include <optional>
#include <set>

int main(int argc, char* argv[]) {
    using namespace streamux;

    std::string configFile = "../config/server.conf";
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

    const std::string root = conf.GetString("server", "root", "./www");
    const std::string framing = conf.GetString("framing", "format", "length");
    const std::optional<uint16_t> port = conf.GetPort("global", "listen_port", 8080);

    if (checkOnly) {
        bool ok = true;
        if (!port) {
            printf("[global] listen_port must be in 1..65535\n");
            ok = false;
        }
        struct stat st;
        if (::stat(root.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            printf("[server] root '%s' is not a directory\n", root.c_str());
            ok = false;
        }
        if (!protocol::FrameCodec::ParseFormat(framing)) {
            printf("[framing] format '%s' must be 'length' or 'delimited'\n", framing.c_str());
            ok = false;
        }
        printf("%s\n", ok ? "OK" : "FAILED");
        return ok ? 0 : 1;
    }

    if (!port) {
        LOG_FATAL << "Invalid [global] listen_port, refusing to start";
        return 1;
    }

    std::set<std::string> restricted = {"private.html"};
    if (conf.HasKey("server", "restricted")) {
        const auto items = conf.GetList("server", "restricted");
        restricted = std::set<std::string>(items.begin(), items.end());
    }

    server::StatusEngine::Options engineOpts;
    engineOpts.defaultFile = conf.GetString("server", "default_file", "test.html");
    engineOpts.gzip = conf.GetInt("server", "gzip", 0) != 0;

    auto store = std::make_shared<server::FileResourceStore>(root, restricted);
    auto handler = std::make_shared<server::FileRequestHandler>(
        server::StatusEngine(store, engineOpts));

    const auto options = server::MultiplexServer::Options::FromConfig(conf, "server", 8);

    LOG_INFO << "Serving " << root << " (default " << engineOpts.defaultFile << ", "
             << restricted.size() << " restricted, gzip " << (engineOpts.gzip ? "on" : "off") << ")";

    network::EventLoop loop;
    server::MultiplexServer server(&loop, network::InetAddress(*port), "StreamuxServer", handler, options);
    server.Start();

    loop.Loop();
    return 0;
}
