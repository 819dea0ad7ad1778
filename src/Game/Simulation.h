// src/Game/Simulation.h – One authoritative match: world, sessions and the ordered tick

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Config/ArchetypeCatalog.h"
#include "Config/MatchConfig.h"
#include "Game/AICommandBridge.h"
#include "Game/CaptureEngine.h"
#include "Game/CommandPipeline.h"
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"
#include "Game/MapDefinition.h"
#include "Game/SessionManager.h"
#include "Game/UnitSystem.h"
#include "Game/VictoryConditions.h"
#include "Game/VisibilityEngine.h"

class Simulation {
public:
    Simulation(const MatchSettings& settings, ArchetypeCatalog catalog, MapDefinition map);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    void SetAITranslator(std::shared_ptr<IAICommandTranslator> translator);

    // Lobby / session front
    SessionResult Host(ConnectionId conn, const std::string& name, TeamId preferred = TEAM_NONE);
    SessionResult Join(ConnectionId conn, const std::string& name, TeamId preferred = TEAM_NONE);
    SessionResult SetReady(ConnectionId conn, bool ready);
    // Spawns both teams' squads and moves everyone InMatch
    SessionResult StartMatch();
    void Disconnect(ConnectionId conn);

    // Inputs, applied on the next Tick
    bool SubmitCommand(ConnectionId conn, Command command);
    bool RequestAICommand(ConnectionId conn, const std::string& text,
                          const std::vector<UnitId>& selected);

    // commands → units → capture & victory → visibility → events
    std::vector<GameEvent> Tick();

    uint32_t GetTick() const { return m_tick; }
    float    GetTickSeconds() const { return m_settings.TickSeconds(); }
    bool     IsMatchRunning() const { return m_sessions.IsMatchRunning(); }

    const MatchSettings&    GetSettings() const { return m_settings; }
    const MapDefinition&    GetMap() const { return m_map; }
    const ArchetypeCatalog& GetCatalog() const { return m_catalog; }
    EntityStore&            GetStore() { return m_store; }
    const EntityStore&      GetStore() const { return m_store; }
    const VisibilityEngine& GetVisibility() const { return *m_visibility; }
    SessionManager&         GetSessions() { return m_sessions; }
    const SessionManager&   GetSessions() const { return m_sessions; }
    EventQueue&             GetEvents() { return m_events; }
    UnitSystem&             GetUnitSystem() { return m_units; }
    CommandPipeline&        GetCommands() { return m_commands; }
    CaptureEngine&          GetCapture() { return m_capture; }

private:
    void SetupWorld();
    void SpawnSquad(ConnectionId owner, TeamId team, size_t slot);
    void ProcessAICompletions();
    void EvaluateVictory(bool captureChanged, float dt);

    MatchSettings     m_settings;
    ArchetypeCatalog  m_catalog;
    MapDefinition     m_map;

    EventQueue        m_events;
    EntityStore       m_store;
    SessionManager    m_sessions;
    std::unique_ptr<VisibilityEngine> m_visibility;
    UnitSystem        m_units;
    CaptureEngine     m_capture;
    VictoryEvaluator  m_victory;
    CommandPipeline   m_commands;
    std::unique_ptr<AICommandBridge> m_ai;

    uint32_t          m_tick;
    float             m_victoryPollTimer;
};
