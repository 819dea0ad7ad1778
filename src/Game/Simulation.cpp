// src/Game/Simulation.cpp

#include "Game/Simulation.h"
#include "Utils/Logger.h"

namespace {
constexpr float kSquadSpacing = 1.5f;
}

Simulation::Simulation(const MatchSettings& settings, ArchetypeCatalog catalog, MapDefinition map)
    : m_settings(settings)
    , m_catalog(std::move(catalog))
    , m_map(std::move(map))
    , m_sessions(m_events)
    , m_visibility(std::make_unique<VisibilityEngine>(m_map.GetWidth(), m_map.GetHeight(),
                                                      settings.visionCellSize,
                                                      settings.stealthRevealRadius))
    , m_units(m_store, m_events, m_settings)
    , m_capture(m_store, m_events, settings.captureRate)
    , m_victory(VictoryEvaluator::FromSettings(settings))
    , m_commands(m_store, m_units, m_sessions, m_events, m_settings)
    , m_tick(0)
    , m_victoryPollTimer(0.0f)
{
    m_units.SetNavigation(&m_map.GetNavigation());
    m_units.SetVisibility(m_visibility.get());
    SetupWorld();
    Logger::Info("Simulation ready: map '%s' %.0fx%.0f, %zu control points, %zu archetypes",
                 m_map.GetName().c_str(), m_map.GetWidth(), m_map.GetHeight(),
                 m_store.ControlPointCount(), m_catalog.Size());
}

Simulation::~Simulation() = default;

void Simulation::SetAITranslator(std::shared_ptr<IAICommandTranslator> translator) {
    m_ai = std::make_unique<AICommandBridge>(std::move(translator), m_settings.aiWorkerThreads,
                                             std::chrono::milliseconds(m_settings.aiTimeoutMs));
}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------

SessionResult Simulation::Host(ConnectionId conn, const std::string& name, TeamId preferred) {
    return m_sessions.Host(conn, name, preferred);
}

SessionResult Simulation::Join(ConnectionId conn, const std::string& name, TeamId preferred) {
    return m_sessions.Join(conn, name, preferred);
}

SessionResult Simulation::SetReady(ConnectionId conn, bool ready) {
    return m_sessions.SetReady(conn, ready);
}

SessionResult Simulation::StartMatch() {
    SessionResult check = m_sessions.CanStartMatch();
    if (check != SessionResult::Ok) {
        return check;
    }

    SetupWorld();
    for (TeamId team : {TEAM_A, TEAM_B}) {
        auto members = m_sessions.GetTeamMembers(team);
        for (size_t slot = 0; slot < members.size(); ++slot) {
            SpawnSquad(members[slot], team, slot);
        }
    }
    m_visibility->Recompute(m_store);
    m_victoryPollTimer = 0.0f;
    return m_sessions.StartMatch(m_tick, m_map.Digest());
}

void Simulation::Disconnect(ConnectionId conn) {
    m_commands.RemoveConnection(conn);
    if (m_ai) {
        m_ai->CancelConnection(conn);
    }
    DisconnectOutcome outcome = m_sessions.Disconnect(conn, m_tick);
    if (outcome.endedMatch) {
        Logger::Info("Connection %u left mid-match, team %u wins", conn, outcome.winner);
    }
}

void Simulation::SetupWorld() {
    m_store.Clear();
    for (const auto& def : m_map.GetControlPoints()) {
        m_store.AddControlPoint(def);
    }
    m_store.SetSpawnPoint(TEAM_A, m_map.GetSpawnPoint(TEAM_A));
    m_store.SetSpawnPoint(TEAM_B, m_map.GetSpawnPoint(TEAM_B));
}

void Simulation::SpawnSquad(ConnectionId owner, TeamId team, size_t slot) {
    const Vector3 base = m_map.GetSpawnPoint(team);
    // Team B squads fan out the other way so both stay inside the map
    const float dir = team == TEAM_A ? 1.0f : -1.0f;

    size_t index = 0;
    for (const auto& name : m_settings.squadComposition) {
        const UnitArchetype* arch = m_catalog.Find(name);
        if (!arch) {
            Logger::Warn("Squad archetype '%s' not in catalog, skipped", name.c_str());
            continue;
        }
        Vector3 pos(base.x + dir * static_cast<float>(index) * kSquadSpacing,
                    base.y + dir * static_cast<float>(slot) * kSquadSpacing * 2.0f, 0.0f);
        m_store.SpawnUnit(team, owner, *arch, pos);
        ++index;
    }
    Logger::Info("Spawned %zu units for connection %u on team %u", index, owner, team);
}

// ---------------------------------------------------------------------------
// Inputs
// ---------------------------------------------------------------------------

bool Simulation::SubmitCommand(ConnectionId conn, Command command) {
    return m_commands.Submit(conn, std::move(command));
}

bool Simulation::RequestAICommand(ConnectionId conn, const std::string& text,
                                  const std::vector<UnitId>& selected) {
    const PlayerSession* session = m_sessions.Find(conn);
    if (!session || session->state != SessionState::InMatch) {
        GameEvent ev;
        ev.type = GameEventType::CommandRejected;
        ev.tick = m_tick;
        ev.recipient = conn;
        ev.detail = "not in match";
        m_events.Push(ev);
        return false;
    }

    AITranslationRequest request;
    request.connection = conn;
    request.sessionToken = session->token;
    request.text = text;
    request.selectedUnits = selected;
    request.stateSummary = AICommandCodec::BuildStateSummary(m_store, *m_visibility,
                                                             session->team, selected);

    if (!m_ai || !m_ai->Dispatch(std::move(request))) {
        GameEvent ev;
        ev.type = GameEventType::AIServiceError;
        ev.tick = m_tick;
        ev.recipient = conn;
        ev.detail = "AI translation unavailable";
        m_events.Push(ev);
        return false;
    }
    return true;
}

void Simulation::ProcessAICompletions() {
    if (!m_ai) return;
    for (auto& done : m_ai->Poll()) {
        if (!m_sessions.IsInMatch(done.connection)) {
            Logger::Debug("AI result for %u discarded, no longer in match", done.connection);
            continue;
        }
        if (!done.ok) {
            GameEvent ev;
            ev.type = GameEventType::AIServiceError;
            ev.tick = m_tick;
            ev.recipient = done.connection;
            ev.detail = done.error;
            m_events.Push(ev);
            continue;
        }
        for (auto& cmd : done.commands) {
            m_commands.Submit(done.connection, std::move(cmd));
        }
    }
}

// ---------------------------------------------------------------------------
// Tick
// ---------------------------------------------------------------------------

std::vector<GameEvent> Simulation::Tick() {
    const float dt = m_settings.TickSeconds();

    ProcessAICompletions();
    m_commands.AdvanceClock(dt);
    m_commands.ApplyPending(m_tick);

    if (m_sessions.IsMatchRunning()) {
        m_units.Update(dt, m_tick);
        bool captureChanged = m_capture.Update(dt, m_tick);
        EvaluateVictory(captureChanged, dt);
    }

    m_visibility->Recompute(m_store);
    auto events = m_events.Drain();
    ++m_tick;
    return events;
}

void Simulation::EvaluateVictory(bool captureChanged, float dt) {
    m_victoryPollTimer += dt;
    const bool pollDue = m_settings.victoryPollSeconds > 0.0f &&
                         m_victoryPollTimer >= m_settings.victoryPollSeconds;
    if (!captureChanged && !pollDue) return;
    if (pollDue) m_victoryPollTimer = 0.0f;

    auto result = m_victory.Evaluate(m_store);
    if (!result) return;

    Logger::Info("Team %u wins by %s", result->team, result->condition.c_str());
    GameEvent ev;
    ev.type = GameEventType::Victory;
    ev.tick = m_tick;
    ev.team = result->team;
    ev.detail = result->condition;
    m_events.Push(ev);
    m_sessions.EndMatch(result->team, result->condition, m_tick);
}
