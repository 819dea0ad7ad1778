// src/Config/MatchConfig.h

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Config/ConfigManager.h"
#include "Protocol/CompressionHandler.h"

// Resolved tuning values handed to the simulation and protocol layers.
// Defaults here are the documented defaults of config/server.ini.
struct MatchSettings {
    // Simulation
    uint32_t tickRate              = 30;
    uint32_t broadcastInterval     = 3;      // ticks between snapshots

    // Capture & victory
    float    captureRate           = 0.2f;   // value per second per unit of advantage
    float    victoryPollSeconds    = 5.0f;
    std::vector<std::string> victoryConditions{"ControlQuota", "KeyPoint", "Perimeter"};
    uint32_t victoryPointQuota     = 0;      // 0 = strict majority of points
    uint32_t keyPointId            = 0;      // 0 = highest strategic value
    uint32_t keyPointExtraQuota    = 1;

    // Units
    bool     respawnEnabled        = true;
    float    respawnDelaySeconds   = 30.0f;
    float    invulnerabilitySeconds = 3.0f;
    bool     acquireWhileMoving    = true;
    float    stealthRevealRadius   = 4.0f;
    std::vector<std::string> squadComposition{"rifleman", "rifleman", "scout", "heavy"};

    // Vision
    float    visionCellSize        = 2.0f;
    float    fogResendThreshold    = 0.01f;  // fraction of cells

    // Commands
    float    commandRateLimit      = 10.0f;  // commands per second
    uint32_t commandBurst          = 20;
    uint32_t maxUnitsPerCommand    = 32;

    // AI bridge
    uint32_t aiWorkerThreads       = 2;
    uint32_t aiTimeoutMs           = 8000;

    // Network
    uint16_t port                  = 7777;
    uint32_t reliableResendMs      = 200;
    uint32_t reliableMaxRetries    = 25;
    uint32_t idleTimeoutMs         = 10000;
    CompressionAlgorithm fogCompression = CompressionAlgorithm::ZLIB;

    float TickSeconds() const { return tickRate ? 1.0f / static_cast<float>(tickRate) : 0.0f; }
};

class MatchConfig {
public:
    explicit MatchConfig(std::shared_ptr<ConfigManager> mgr);

    // Server
    std::string GetServerName() const;
    int         GetPort() const;
    int         GetTickRate() const;
    int         GetBroadcastInterval() const;

    // Logging
    std::string GetLogLevel() const;
    std::string GetLogFile() const;
    bool        IsConsoleLogging() const;

    // Data files
    std::string GetArchetypeFile() const;
    std::string GetMapFile() const;

    // Capture & victory
    float       GetCaptureRate() const;
    float       GetVictoryPollSeconds() const;
    std::vector<std::string> GetVictoryConditions() const;
    int         GetVictoryPointQuota() const;
    int         GetKeyPointId() const;
    int         GetKeyPointExtraQuota() const;

    // Units
    bool        IsRespawnEnabled() const;
    float       GetRespawnDelaySeconds() const;
    float       GetInvulnerabilitySeconds() const;
    bool        IsAcquireWhileMoving() const;
    float       GetStealthRevealRadius() const;
    std::vector<std::string> GetSquadComposition() const;

    // Vision
    float       GetVisionCellSize() const;
    float       GetFogResendThreshold() const;

    // Commands
    float       GetCommandRateLimit() const;
    int         GetCommandBurst() const;
    int         GetMaxUnitsPerCommand() const;

    // AI
    int         GetAIWorkerThreads() const;
    int         GetAITimeoutMs() const;

    // Network
    int         GetReliableResendMs() const;
    int         GetReliableMaxRetries() const;
    int         GetIdleTimeoutMs() const;
    CompressionAlgorithm GetFogCompression() const;

    MatchSettings ToSettings() const;

private:
    std::shared_ptr<ConfigManager> m_mgr;
};
