// src/Game/CommandPipeline.cpp

#include "Game/CommandPipeline.h"
#include "Utils/Logger.h"

#include <algorithm>

namespace {

RejectReason FromOrderResult(OrderResult r) {
    switch (r) {
        case OrderResult::Accepted:           return RejectReason::None;
        case OrderResult::UnknownUnit:        return RejectReason::UnknownUnit;
        case OrderResult::UnitNotAlive:       return RejectReason::UnitNotAlive;
        case OrderResult::InvalidTarget:      return RejectReason::InvalidTarget;
        case OrderResult::AbilityUnavailable: return RejectReason::AbilityUnavailable;
        case OrderResult::NoRoute:            return RejectReason::NoRoute;
    }
    return RejectReason::InvalidTarget;
}

}

const char* ToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::None:               return "none";
        case RejectReason::NotInMatch:         return "not in match";
        case RejectReason::RateLimited:        return "rate limited";
        case RejectReason::NoUnits:            return "no units selected";
        case RejectReason::TooManyUnits:       return "too many units";
        case RejectReason::UnknownUnit:        return "unknown unit";
        case RejectReason::NotOwner:           return "unit not owned";
        case RejectReason::UnitNotAlive:       return "unit not alive";
        case RejectReason::InvalidTarget:      return "invalid target";
        case RejectReason::AbilityUnavailable: return "ability unavailable";
        case RejectReason::NoRoute:            return "no route";
    }
    return "unknown";
}

CommandPipeline::CommandPipeline(EntityStore& store, UnitSystem& units, const SessionManager& sessions,
                                 EventQueue& events, const MatchSettings& settings)
    : m_store(store)
    , m_units(units)
    , m_sessions(sessions)
    , m_events(events)
    , m_settings(settings)
    , m_clock(0.0)
    , m_tick(0)
{
}

bool CommandPipeline::Submit(ConnectionId sender, Command command) {
    if (!m_sessions.IsInMatch(sender)) {
        Reject(sender, command, RejectReason::NotInMatch);
        return false;
    }
    if (command.units.empty()) {
        Reject(sender, command, RejectReason::NoUnits);
        return false;
    }
    if (command.units.size() > m_settings.maxUnitsPerCommand) {
        Reject(sender, command, RejectReason::TooManyUnits);
        return false;
    }
    if (!ConsumeToken(sender)) {
        Reject(sender, command, RejectReason::RateLimited);
        return false;
    }

    Logger::Trace("Command %s from %u queued (%zu units)", ToString(command.type), sender,
                  command.units.size());
    m_queue.push_back(QueuedCommand{sender, std::move(command)});
    return true;
}

size_t CommandPipeline::ApplyPending(uint32_t tick) {
    m_tick = tick;
    size_t applied = 0;
    while (!m_queue.empty()) {
        QueuedCommand item = std::move(m_queue.front());
        m_queue.pop_front();

        RejectReason reason = Apply(item.sender, item.command);
        if (reason == RejectReason::None) {
            ++applied;
        } else {
            Reject(item.sender, item.command, reason);
        }
    }
    return applied;
}

RejectReason CommandPipeline::Apply(ConnectionId sender, const Command& command) {
    if (!m_sessions.IsInMatch(sender)) return RejectReason::NotInMatch;

    // Resolve the selection; bad entries are dropped individually
    std::vector<UnitId> ids = command.units;
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    std::vector<Unit*> selected;
    RejectReason lastFailure = RejectReason::NoUnits;
    for (UnitId id : ids) {
        Unit* unit = m_store.FindUnit(id);
        if (!unit) {
            Logger::Debug("Command from %u names missing unit %u", sender, id);
            lastFailure = RejectReason::UnknownUnit;
            continue;
        }
        if (unit->GetOwner() != sender) {
            Logger::Warn("Connection %u tried to command unit %u it does not own", sender, id);
            lastFailure = RejectReason::NotOwner;
            continue;
        }
        if (!unit->IsAlive()) {
            lastFailure = RejectReason::UnitNotAlive;
            continue;
        }
        selected.push_back(unit);
    }
    if (selected.empty()) return lastFailure;

    if (command.type == CommandType::Formation) {
        return ApplyFormation(selected, command);
    }

    size_t accepted = 0;
    for (Unit* unit : selected) {
        OrderResult r = OrderResult::Accepted;
        switch (command.type) {
            case CommandType::Move:
                r = m_units.OrderMove(unit->GetId(), command.position);
                break;
            case CommandType::Attack:
                r = m_units.OrderAttack(unit->GetId(), command.targetUnit);
                break;
            case CommandType::Stop:
                r = m_units.OrderStop(unit->GetId());
                break;
            case CommandType::UseAbility:
                r = m_units.OrderAbility(unit->GetId(), command.targetUnit, command.position);
                break;
            case CommandType::Formation:
                break;
        }
        if (r == OrderResult::Accepted) {
            ++accepted;
        } else {
            Logger::Debug("Unit %u rejected %s: %s", unit->GetId(), ToString(command.type), ToString(r));
            lastFailure = FromOrderResult(r);
        }
    }
    return accepted > 0 ? RejectReason::None : lastFailure;
}

RejectReason CommandPipeline::ApplyFormation(const std::vector<Unit*>& units, const Command& command) {
    Vector3 centroid;
    for (const Unit* u : units) centroid += u->GetPosition();
    centroid = centroid / static_cast<float>(units.size());

    float facing = centroid.Distance2D(command.position) > 1e-3f ? centroid.YawTo(command.position) : 0.0f;
    float spacing = command.spacing > 0.0f ? command.spacing : 2.0f;
    auto slots = ComputeFormationSlots(command.layout, command.position, facing, units.size(), spacing);

    size_t accepted = 0;
    RejectReason lastFailure = RejectReason::NoRoute;
    for (size_t i = 0; i < units.size(); ++i) {
        OrderResult r = m_units.OrderMove(units[i]->GetId(), slots[i]);
        if (r == OrderResult::Accepted) {
            ++accepted;
        } else {
            lastFailure = FromOrderResult(r);
        }
    }
    Logger::Debug("Formation %s: %zu/%zu units moving", ToString(command.layout), accepted, units.size());
    return accepted > 0 ? RejectReason::None : lastFailure;
}

void CommandPipeline::Reject(ConnectionId sender, const Command& command, RejectReason reason) {
    Logger::Info("Command %s from connection %u rejected: %s",
                 ToString(command.type), sender, ToString(reason));
    GameEvent ev;
    ev.type = GameEventType::CommandRejected;
    ev.tick = m_tick;
    ev.recipient = sender;
    ev.unitId = command.units.empty() ? kInvalidUnit : command.units.front();
    ev.detail = ToString(reason);
    m_events.Push(ev);
}

bool CommandPipeline::ConsumeToken(ConnectionId conn) {
    auto [it, inserted] = m_buckets.try_emplace(conn);
    RateBucket& bucket = it->second;
    if (inserted) {
        bucket.tokens = static_cast<double>(m_settings.commandBurst);
        bucket.lastRefill = m_clock;
    }
    Refill(bucket);
    if (bucket.tokens < 1.0) return false;
    bucket.tokens -= 1.0;
    return true;
}

void CommandPipeline::Refill(RateBucket& bucket) {
    double elapsed = m_clock - bucket.lastRefill;
    if (elapsed > 0.0) {
        bucket.tokens = std::min(static_cast<double>(m_settings.commandBurst),
                                 bucket.tokens + elapsed * m_settings.commandRateLimit);
        bucket.lastRefill = m_clock;
    }
}

double CommandPipeline::GetAvailableTokens(ConnectionId conn) {
    auto it = m_buckets.find(conn);
    if (it == m_buckets.end()) return static_cast<double>(m_settings.commandBurst);
    Refill(it->second);
    return it->second.tokens;
}

void CommandPipeline::RemoveConnection(ConnectionId conn) {
    m_buckets.erase(conn);
    auto before = m_queue.size();
    m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
                                 [conn](const QueuedCommand& q) { return q.sender == conn; }),
                  m_queue.end());
    if (before != m_queue.size()) {
        Logger::Debug("Dropped %zu queued commands of connection %u", before - m_queue.size(), conn);
    }
}
