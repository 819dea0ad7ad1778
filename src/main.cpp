// src/main.cpp

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "Config/ArchetypeCatalog.h"
#include "Config/ConfigManager.h"
#include "Config/MatchConfig.h"
#include "Game/HostServer.h"
#include "Game/MapDefinition.h"
#include "Utils/Logger.h"

static HostServer* g_server = nullptr;

// Signal handler for graceful shutdown
void SignalHandler(int signal)
{
    (void)signal;
    if (g_server)
        g_server->RequestShutdown();
}

void SetupSignalHandlers()
{
    std::signal(SIGINT,  SignalHandler);
    std::signal(SIGTERM, SignalHandler);
}

void PrintUsage(const char* prog)
{
    std::cout << "Frontline authoritative host\n\n"
                 "Usage: " << prog << " [options]\n\n"
                 "Options:\n"
                 "  -c, --config <file>    Config file (default: config/server.ini)\n"
                 "  -p, --port <port>      Override server port\n"
                 "  -h, --help             Show help\n\n";
}

struct CmdArgs {
    std::string configFile = "config/server.ini";
    int         port       = 0;
    bool        help       = false;
};

CmdArgs ParseArgs(int argc, char* argv[])
{
    CmdArgs a;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") a.help = true;
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) a.configFile = argv[++i];
        else if ((arg == "-p" || arg == "--port") && i + 1 < argc) a.port = std::atoi(argv[++i]);
        else {
            std::cerr << "Unknown argument: " << arg << "\n";
            a.help = true;
        }
    }
    return a;
}

int main(int argc, char* argv[])
{
    auto args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    auto cfgMgr = std::make_shared<ConfigManager>();
    bool configLoaded = cfgMgr->LoadConfiguration(args.configFile);
    MatchConfig config(cfgMgr);

    Logger::Initialize(config.GetLogFile(), config.IsConsoleLogging());
    Logger::SetLevel(Logger::ParseLevel(config.GetLogLevel()));
    Logger::Info("========================================");
    Logger::Info("%s starting", config.GetServerName().c_str());
    Logger::Info("Configuration: %s%s", args.configFile.c_str(), configLoaded ? "" : " (missing, defaults)");
    Logger::Info("========================================");

    MatchSettings settings = config.ToSettings();
    if (args.port > 0 && args.port <= 65535) {
        settings.port = static_cast<uint16_t>(args.port);
    }

    ArchetypeCatalog catalog = ArchetypeCatalog::BuiltIn();
    if (!catalog.LoadFromFile(config.GetArchetypeFile())) {
        Logger::Warn("Using built-in archetypes");
    }

    MapDefinition map;
    if (!map.LoadFromFile(config.GetMapFile())) {
        Logger::Warn("Using default map");
        map = MapDefinition::Default();
    }

    auto server = std::make_unique<HostServer>(settings, std::move(catalog), std::move(map));
    if (!server->Initialize()) {
        Logger::Fatal("Host failed to initialize");
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    g_server = server.get();
    SetupSignalHandlers();
    server->Run();

    Logger::Info("Shutting down");
    g_server = nullptr;
    server->Shutdown();
    server.reset();
    Logger::Shutdown();
    return EXIT_SUCCESS;
}
