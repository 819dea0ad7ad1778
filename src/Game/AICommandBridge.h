// src/Game/AICommandBridge.h – Asynchronous hand-off to the external AI translator

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "Game/Command.h"
#include "Game/EntityStore.h"
#include "Game/VisibilityEngine.h"
#include "Utils/ThreadPool.h"

struct AITranslationRequest {
    ConnectionId        connection = kInvalidConnection;
    std::string         sessionToken;
    std::string         text;
    std::vector<UnitId> selectedUnits;
    std::string         stateSummary;   // JSON from AICommandCodec
    // The host stops waiting at this point; translators should give up too
    std::chrono::steady_clock::time_point deadline;
};

struct AITranslationResult {
    bool        ok = false;
    std::string responseJson;
    std::string error;
};

// Implemented by the translation service client. Called on a worker
// thread. A call that outlives request.deadline only delays later
// requests; its result is discarded.
class IAICommandTranslator {
public:
    virtual ~IAICommandTranslator() = default;
    virtual AITranslationResult Translate(const AITranslationRequest& request) = 0;
};

class AICommandCodec {
public:
    // Compact JSON view of what the team can see, handed to the translator
    static std::string BuildStateSummary(const EntityStore& store, const VisibilityEngine& visibility,
                                         TeamId team, const std::vector<UnitId>& selected);

    // {"commands":[{"type":"move","units":[1],"target":[x,y]}, ...]} or {"error":"..."}.
    // Commands without "units" apply to defaultUnits.
    static bool ParseResponse(const std::string& text, const std::vector<UnitId>& defaultUnits,
                              std::vector<Command>& out, std::string& error);
};

struct AICompletion {
    ConnectionId         connection = kInvalidConnection;
    bool                 ok = false;
    std::vector<Command> commands;
    std::string          error;
};

class AICommandBridge {
public:
    using Clock = std::chrono::steady_clock;

    AICommandBridge(std::shared_ptr<IAICommandTranslator> translator,
                    size_t workerThreads, std::chrono::milliseconds timeout);
    ~AICommandBridge();

    AICommandBridge(const AICommandBridge&) = delete;
    AICommandBridge& operator=(const AICommandBridge&) = delete;

    bool Dispatch(AITranslationRequest request, Clock::time_point now = Clock::now());

    // Finished and timed-out requests; never blocks
    std::vector<AICompletion> Poll(Clock::time_point now = Clock::now());

    // Drops in-flight requests of conn. Requests still queued never reach
    // the translator; running ones are discarded on arrival.
    void CancelConnection(ConnectionId conn);

    size_t InFlight() const { return m_pending.size(); }
    // Translator calls actually started, for diagnostics
    size_t TranslatorCalls() const { return m_calls->load(); }

private:
    using CancelFlag = std::shared_ptr<std::atomic<bool>>;

    struct Pending {
        ConnectionId                     connection;
        std::vector<UnitId>              selected;
        std::future<AITranslationResult> result;
        Clock::time_point                deadline;
        CancelFlag                       cancelled;
    };

    std::shared_ptr<IAICommandTranslator> m_translator;
    ThreadPool                            m_pool;
    std::chrono::milliseconds             m_timeout;
    std::vector<Pending>                  m_pending;
    std::shared_ptr<std::atomic<size_t>>  m_calls;
};
