// src/Game/AICommandBridge.cpp

#include "Game/AICommandBridge.h"
#include "Utils/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// How long shutdown waits for a translator call before abandoning it
constexpr std::chrono::milliseconds kShutdownGrace(500);

Vector3 ReadPoint(const json& j) {
    if (j.is_array() && j.size() >= 2) {
        return Vector3(j[0].get<float>(), j[1].get<float>(), 0.0f);
    }
    if (j.is_object()) {
        return Vector3(j.at("x").get<float>(), j.at("y").get<float>(), 0.0f);
    }
    throw std::invalid_argument("point must be [x, y] or {x, y}");
}

json UnitToJson(const Unit& u) {
    return json{
        {"id", u.GetId()},
        {"archetype", u.GetArchetype().name},
        {"x", u.GetPosition().x},
        {"y", u.GetPosition().y},
        {"health", u.GetHealth()},
        {"maxHealth", u.GetMaxHealth()},
        {"state", ToString(u.GetState())}
    };
}

}

// ---------------------------------------------------------------------------
// AICommandCodec
// ---------------------------------------------------------------------------

std::string AICommandCodec::BuildStateSummary(const EntityStore& store, const VisibilityEngine& visibility,
                                              TeamId team, const std::vector<UnitId>& selected) {
    json root;
    root["team"] = team;
    root["selected"] = selected;

    json friendly = json::array();
    json enemies = json::array();
    for (const Unit* u : store.GetAllUnits()) {
        if (!u->IsAlive()) continue;
        if (u->GetTeam() == team) {
            friendly.push_back(UnitToJson(*u));
        } else if (visibility.CanObserve(store, team, *u)) {
            enemies.push_back(UnitToJson(*u));
        }
    }
    root["units"] = friendly;
    root["enemies"] = enemies;

    json points = json::array();
    for (const ControlPoint* p : store.GetControlPoints()) {
        points.push_back({
            {"id", p->GetId()},
            {"name", p->GetName()},
            {"x", p->GetPosition().x},
            {"y", p->GetPosition().y},
            {"value", p->GetCaptureValue()},
            {"owner", p->GetControllingTeam()},
            {"strategicValue", p->GetStrategicValue()}
        });
    }
    root["controlPoints"] = points;
    return root.dump();
}

bool AICommandCodec::ParseResponse(const std::string& text, const std::vector<UnitId>& defaultUnits,
                                   std::vector<Command>& out, std::string& error) {
    std::vector<Command> parsed;
    try {
        auto root = json::parse(text);
        if (root.contains("error")) {
            error = root.at("error").get<std::string>();
            return false;
        }
        for (const auto& entry : root.at("commands")) {
            Command cmd;
            cmd.source = CommandSource::AI;

            auto type = ParseCommandType(entry.at("type").get<std::string>());
            if (!type) {
                error = "unknown command type '" + entry.at("type").get<std::string>() + "'";
                return false;
            }
            cmd.type = *type;
            cmd.units = entry.contains("units") ? entry.at("units").get<std::vector<UnitId>>()
                                                : defaultUnits;

            switch (cmd.type) {
                case CommandType::Move:
                    cmd.position = ReadPoint(entry.at("target"));
                    break;
                case CommandType::Attack:
                    cmd.targetUnit = entry.at("targetId").get<UnitId>();
                    break;
                case CommandType::Formation: {
                    auto layout = ParseFormationLayout(entry.value("layout", std::string("line")));
                    if (!layout) {
                        error = "unknown formation layout";
                        return false;
                    }
                    cmd.layout = *layout;
                    cmd.position = ReadPoint(entry.at("center"));
                    cmd.spacing = entry.value("spacing", cmd.spacing);
                    break;
                }
                case CommandType::UseAbility:
                    cmd.targetUnit = entry.value("targetId", kInvalidUnit);
                    if (entry.contains("target")) cmd.position = ReadPoint(entry.at("target"));
                    break;
                case CommandType::Stop:
                    break;
            }
            parsed.push_back(std::move(cmd));
        }
    } catch (const json::exception& e) {
        error = std::string("malformed translator response: ") + e.what();
        return false;
    } catch (const std::invalid_argument& e) {
        error = std::string("malformed translator response: ") + e.what();
        return false;
    }

    out = std::move(parsed);
    return true;
}

// ---------------------------------------------------------------------------
// AICommandBridge
// ---------------------------------------------------------------------------

AICommandBridge::AICommandBridge(std::shared_ptr<IAICommandTranslator> translator,
                                 size_t workerThreads, std::chrono::milliseconds timeout)
    : m_translator(std::move(translator))
    , m_pool(workerThreads > 0 ? workerThreads : 1)
    , m_timeout(timeout)
    , m_calls(std::make_shared<std::atomic<size_t>>(0))
{
    Logger::Info("AICommandBridge: %zu workers, timeout %lldms",
                 m_pool.GetWorkerCount(), static_cast<long long>(m_timeout.count()));
}

AICommandBridge::~AICommandBridge() {
    for (auto& p : m_pending) p.cancelled->store(true);
    m_pending.clear();
    if (!m_pool.Shutdown(kShutdownGrace)) {
        Logger::Warn("AICommandBridge: translator calls still running at shutdown were abandoned");
    }
}

bool AICommandBridge::Dispatch(AITranslationRequest request, Clock::time_point now) {
    if (!m_translator) {
        Logger::Warn("AI request from %u dropped: no translator configured", request.connection);
        return false;
    }

    Pending pending;
    pending.connection = request.connection;
    pending.selected = request.selectedUnits;
    pending.deadline = now + m_timeout;
    pending.cancelled = std::make_shared<std::atomic<bool>>(false);
    request.deadline = pending.deadline;

    auto translator = m_translator;
    auto cancelled = pending.cancelled;
    auto calls = m_calls;
    try {
        pending.result = m_pool.Enqueue([translator, cancelled, calls, req = std::move(request)]() {
            AITranslationResult skipped;
            if (cancelled->load()) {
                skipped.error = "cancelled";
                return skipped;
            }
            calls->fetch_add(1);
            try {
                return translator->Translate(req);
            } catch (const std::exception& e) {
                AITranslationResult failed;
                failed.error = std::string("translator failure: ") + e.what();
                return failed;
            }
        });
    } catch (const std::runtime_error& e) {
        Logger::Error("AI dispatch failed: %s", e.what());
        return false;
    }

    Logger::Debug("AI request from %u dispatched (%zu in flight)", pending.connection, m_pending.size() + 1);
    m_pending.push_back(std::move(pending));
    return true;
}

std::vector<AICompletion> AICommandBridge::Poll(Clock::time_point now) {
    std::vector<AICompletion> done;
    auto it = m_pending.begin();
    while (it != m_pending.end()) {
        const bool ready = it->result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        if (!ready && now < it->deadline) {
            ++it;
            continue;
        }

        AICompletion completion;
        completion.connection = it->connection;
        if (!ready) {
            it->cancelled->store(true);
            completion.error = "translation timed out";
            Logger::Warn("AI request from %u timed out", it->connection);
        } else {
            AITranslationResult result = it->result.get();
            if (!result.ok) {
                completion.error = result.error.empty() ? "translation failed" : result.error;
            } else if (AICommandCodec::ParseResponse(result.responseJson, it->selected,
                                                     completion.commands, completion.error)) {
                completion.ok = true;
            }
            if (!completion.ok) {
                Logger::Warn("AI request from %u failed: %s", it->connection, completion.error.c_str());
            }
        }
        done.push_back(std::move(completion));
        it = m_pending.erase(it);
    }
    return done;
}

void AICommandBridge::CancelConnection(ConnectionId conn) {
    auto before = m_pending.size();
    for (auto& p : m_pending) {
        if (p.connection == conn) p.cancelled->store(true);
    }
    m_pending.erase(std::remove_if(m_pending.begin(), m_pending.end(),
                                   [conn](const Pending& p) { return p.connection == conn; }),
                    m_pending.end());
    if (before != m_pending.size()) {
        Logger::Info("Cancelled %zu AI requests of connection %u", before - m_pending.size(), conn);
    }
}
