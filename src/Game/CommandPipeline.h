// src/Game/CommandPipeline.h – Validated, rate-limited command ingress

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include "Config/MatchConfig.h"
#include "Game/Command.h"
#include "Game/EntityStore.h"
#include "Game/GameEvents.h"
#include "Game/SessionManager.h"
#include "Game/UnitSystem.h"

enum class RejectReason {
    None,
    NotInMatch,
    RateLimited,
    NoUnits,
    TooManyUnits,
    UnknownUnit,
    NotOwner,
    UnitNotAlive,
    InvalidTarget,
    AbilityUnavailable,
    NoRoute
};

const char* ToString(RejectReason reason);

class CommandPipeline {
public:
    CommandPipeline(EntityStore& store, UnitSystem& units, const SessionManager& sessions,
                    EventQueue& events, const MatchSettings& settings);

    // Session gate, rate limit and shape checks. Accepted commands are
    // queued for the next ApplyPending; rejections notify the sender.
    bool Submit(ConnectionId sender, Command command);

    // Applies queued commands in submission order; returns how many took effect
    size_t ApplyPending(uint32_t tick);

    // Simulation clock used for token refill
    void AdvanceClock(float deltaSeconds) { m_clock += deltaSeconds; }

    // Forget rate state and queued commands of a departed connection
    void RemoveConnection(ConnectionId conn);

    size_t PendingCount() const { return m_queue.size(); }
    double GetAvailableTokens(ConnectionId conn);

private:
    struct RateBucket {
        double tokens = 0.0;
        double lastRefill = 0.0;
    };

    struct QueuedCommand {
        ConnectionId sender;
        Command      command;
    };

    bool         ConsumeToken(ConnectionId conn);
    void         Refill(RateBucket& bucket);
    RejectReason Apply(ConnectionId sender, const Command& command);
    RejectReason ApplyFormation(const std::vector<Unit*>& units, const Command& command);
    void         Reject(ConnectionId sender, const Command& command, RejectReason reason);

    EntityStore&           m_store;
    UnitSystem&            m_units;
    const SessionManager&  m_sessions;
    EventQueue&            m_events;
    MatchSettings          m_settings;

    std::deque<QueuedCommand>          m_queue;
    std::map<ConnectionId, RateBucket> m_buckets;
    double                             m_clock;
    uint32_t                           m_tick;
};
