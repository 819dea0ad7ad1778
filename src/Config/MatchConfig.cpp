// src/Config/MatchConfig.cpp

#include "Config/MatchConfig.h"
#include "Utils/Logger.h"
#include "Utils/StringUtils.h"
#include <algorithm>

namespace {
const MatchSettings kDefaults;
}

MatchConfig::MatchConfig(std::shared_ptr<ConfigManager> mgr)
    : m_mgr(std::move(mgr))
{
    if (!m_mgr) {
        m_mgr = std::make_shared<ConfigManager>();
    }
}

std::string MatchConfig::GetServerName() const { return m_mgr->GetString("Server.Name", "Frontline"); }
int  MatchConfig::GetPort() const              { return m_mgr->GetInt("Server.Port", kDefaults.port); }
int  MatchConfig::GetTickRate() const          { return m_mgr->GetInt("Server.TickRate", static_cast<int>(kDefaults.tickRate)); }
int  MatchConfig::GetBroadcastInterval() const { return m_mgr->GetInt("Server.BroadcastInterval", static_cast<int>(kDefaults.broadcastInterval)); }

std::string MatchConfig::GetLogLevel() const   { return m_mgr->GetString("Logging.Level", "INFO"); }
std::string MatchConfig::GetLogFile() const    { return m_mgr->GetString("Logging.File", ""); }
bool MatchConfig::IsConsoleLogging() const     { return m_mgr->GetBool("Logging.Console", true); }

std::string MatchConfig::GetArchetypeFile() const { return m_mgr->GetString("Units.ArchetypeFile", "config/archetypes.json"); }
std::string MatchConfig::GetMapFile() const       { return m_mgr->GetString("Map.File", "config/map.json"); }

float MatchConfig::GetCaptureRate() const        { return m_mgr->GetFloat("Capture.CaptureRate", kDefaults.captureRate); }
float MatchConfig::GetVictoryPollSeconds() const { return m_mgr->GetFloat("Capture.VictoryPollSeconds", kDefaults.victoryPollSeconds); }

std::vector<std::string> MatchConfig::GetVictoryConditions() const {
    auto raw = m_mgr->GetString("Capture.VictoryConditions", "");
    if (raw.empty()) return kDefaults.victoryConditions;
    return StringUtils::SplitList(raw);
}

int MatchConfig::GetVictoryPointQuota() const  { return m_mgr->GetInt("Capture.VictoryPointQuota", 0); }
int MatchConfig::GetKeyPointId() const         { return m_mgr->GetInt("Capture.KeyPointId", 0); }
int MatchConfig::GetKeyPointExtraQuota() const { return m_mgr->GetInt("Capture.KeyPointExtraQuota", static_cast<int>(kDefaults.keyPointExtraQuota)); }

bool  MatchConfig::IsRespawnEnabled() const          { return m_mgr->GetBool("Units.RespawnEnabled", kDefaults.respawnEnabled); }
float MatchConfig::GetRespawnDelaySeconds() const    { return m_mgr->GetFloat("Units.RespawnDelaySeconds", kDefaults.respawnDelaySeconds); }
float MatchConfig::GetInvulnerabilitySeconds() const { return m_mgr->GetFloat("Units.InvulnerabilitySeconds", kDefaults.invulnerabilitySeconds); }
bool  MatchConfig::IsAcquireWhileMoving() const      { return m_mgr->GetBool("Units.AcquireWhileMoving", kDefaults.acquireWhileMoving); }
float MatchConfig::GetStealthRevealRadius() const    { return m_mgr->GetFloat("Units.StealthRevealRadius", kDefaults.stealthRevealRadius); }

std::vector<std::string> MatchConfig::GetSquadComposition() const {
    auto raw = m_mgr->GetString("Units.SquadComposition", "");
    if (raw.empty()) return kDefaults.squadComposition;
    return StringUtils::SplitList(raw);
}

float MatchConfig::GetVisionCellSize() const     { return m_mgr->GetFloat("Vision.CellSize", kDefaults.visionCellSize); }
float MatchConfig::GetFogResendThreshold() const { return m_mgr->GetFloat("Vision.FogResendThreshold", kDefaults.fogResendThreshold); }

float MatchConfig::GetCommandRateLimit() const   { return m_mgr->GetFloat("Commands.RateLimit", kDefaults.commandRateLimit); }
int   MatchConfig::GetCommandBurst() const       { return m_mgr->GetInt("Commands.Burst", static_cast<int>(kDefaults.commandBurst)); }
int   MatchConfig::GetMaxUnitsPerCommand() const { return m_mgr->GetInt("Commands.MaxUnitsPerCommand", static_cast<int>(kDefaults.maxUnitsPerCommand)); }

int MatchConfig::GetAIWorkerThreads() const { return m_mgr->GetInt("AI.WorkerThreads", static_cast<int>(kDefaults.aiWorkerThreads)); }
int MatchConfig::GetAITimeoutMs() const     { return m_mgr->GetInt("AI.TimeoutMs", static_cast<int>(kDefaults.aiTimeoutMs)); }

int MatchConfig::GetReliableResendMs() const   { return m_mgr->GetInt("Network.ReliableResendMs", static_cast<int>(kDefaults.reliableResendMs)); }
int MatchConfig::GetReliableMaxRetries() const { return m_mgr->GetInt("Network.ReliableMaxRetries", static_cast<int>(kDefaults.reliableMaxRetries)); }
int MatchConfig::GetIdleTimeoutMs() const      { return m_mgr->GetInt("Network.IdleTimeoutMs", static_cast<int>(kDefaults.idleTimeoutMs)); }

CompressionAlgorithm MatchConfig::GetFogCompression() const {
    auto name = StringUtils::ToLower(m_mgr->GetString("Network.FogCompression", "zlib"));
    if (name == "none") return CompressionAlgorithm::NONE;
    if (name == "lz4")  return CompressionAlgorithm::LZ4;
    if (name != "zlib") {
        Logger::Warn("Unknown Network.FogCompression '%s', using zlib", name.c_str());
    }
    return CompressionAlgorithm::ZLIB;
}

MatchSettings MatchConfig::ToSettings() const {
    MatchSettings s;
    s.tickRate               = static_cast<uint32_t>(GetTickRate());
    s.broadcastInterval      = static_cast<uint32_t>(GetBroadcastInterval());
    s.captureRate            = GetCaptureRate();
    s.victoryPollSeconds     = GetVictoryPollSeconds();
    s.victoryConditions      = GetVictoryConditions();
    s.victoryPointQuota      = static_cast<uint32_t>(std::max(0, GetVictoryPointQuota()));
    s.keyPointId             = static_cast<uint32_t>(std::max(0, GetKeyPointId()));
    s.keyPointExtraQuota     = static_cast<uint32_t>(std::max(0, GetKeyPointExtraQuota()));
    s.respawnEnabled         = IsRespawnEnabled();
    s.respawnDelaySeconds    = GetRespawnDelaySeconds();
    s.invulnerabilitySeconds = GetInvulnerabilitySeconds();
    s.acquireWhileMoving     = IsAcquireWhileMoving();
    s.stealthRevealRadius    = GetStealthRevealRadius();
    s.squadComposition       = GetSquadComposition();
    s.visionCellSize         = GetVisionCellSize();
    s.fogResendThreshold     = GetFogResendThreshold();
    s.commandRateLimit       = GetCommandRateLimit();
    s.commandBurst           = static_cast<uint32_t>(std::max(1, GetCommandBurst()));
    s.maxUnitsPerCommand     = static_cast<uint32_t>(std::max(1, GetMaxUnitsPerCommand()));
    s.aiWorkerThreads        = static_cast<uint32_t>(std::max(1, GetAIWorkerThreads()));
    s.aiTimeoutMs            = static_cast<uint32_t>(std::max(1, GetAITimeoutMs()));
    s.port                   = static_cast<uint16_t>(GetPort());
    s.reliableResendMs       = static_cast<uint32_t>(GetReliableResendMs());
    s.reliableMaxRetries     = static_cast<uint32_t>(GetReliableMaxRetries());
    s.idleTimeoutMs          = static_cast<uint32_t>(std::max(0, GetIdleTimeoutMs()));
    s.fogCompression         = GetFogCompression();

    Logger::Info("Match settings: tick=%uHz broadcast/%u capture=%.2f respawn=%s(%.0fs) cell=%.1f",
                 s.tickRate, s.broadcastInterval, s.captureRate,
                 s.respawnEnabled ? "on" : "off", s.respawnDelaySeconds, s.visionCellSize);
    return s;
}
