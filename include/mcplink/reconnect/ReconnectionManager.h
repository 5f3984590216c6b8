//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReconnectionManager.h
// Purpose: Per-provider reconnection state machine with bounded exponential backoff and jitter
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace reconnect {

//==========================================================================================================
// ReconnectionStrategy
// Purpose: Backoff parameters. delay(n) = min(maxDelayMs, baseDelayMs * backoffMultiplier^n), then
//          perturbed by up to +/-25% when jitter is set.
//==========================================================================================================
struct ReconnectionStrategy {
    int maxRetries{5};
    int64_t baseDelayMs{1000};
    int64_t maxDelayMs{30000};
    double backoffMultiplier{2.0};
    bool jitter{true};
};

// Partial update for SetStrategy; unset fields keep their current value.
struct ReconnectionStrategyUpdate {
    std::optional<int> maxRetries;
    std::optional<int64_t> baseDelayMs;
    std::optional<int64_t> maxDelayMs;
    std::optional<double> backoffMultiplier;
    std::optional<bool> jitter;
};

enum class ReconnectionStatus {
    Scheduled,
    Attempting,
    Exhausted
};

const char* toString(ReconnectionStatus status);

//==========================================================================================================
// ReconnectionState
// Purpose: Snapshot of one provider's reconnection. Times are milliseconds since the Unix epoch.
// Fields:
//   attempts: Failed attempts so far.
//   nextAttemptMs: 0 unless Scheduled.
//==========================================================================================================
struct ReconnectionState {
    std::string serverName;
    ReconnectionStatus status{ReconnectionStatus::Scheduled};
    int attempts{0};
    int64_t nextAttemptMs{0};
    int64_t lastAttemptMs{0};
    std::optional<std::string> lastError;
};

enum class ReconnectionEventType {
    Scheduled,
    Attempt,
    Success,
    Failed,
    MaxRetriesReached,
    Cancelled
};

//==========================================================================================================
// ReconnectionEvent
// Purpose: Payload delivered to observers. Fields not meaningful for a type are left at their defaults:
//   Scheduled:          attempt (1-based), maxAttempts, delayMs
//   Attempt:            attempt, maxAttempts
//   Success:            totalAttempts
//   Failed:             attempt, maxAttempts, error
//   MaxRetriesReached:  attempts
//   Cancelled:          serverName only
//==========================================================================================================
struct ReconnectionEvent {
    ReconnectionEventType type{ReconnectionEventType::Scheduled};
    std::string serverName;
    int attempt{0};
    int maxAttempts{0};
    int64_t delayMs{0};
    int totalAttempts{0};
    int attempts{0};
    std::string error;

    // "reconnection-scheduled", "reconnection-attempt", ... "max-retries-reached"
    const char* name() const;
};

class ReconnectionManager {
public:
    using ReconnectFn = std::function<std::future<void>(const JSONValue& config)>;
    using Observer = std::function<void(const ReconnectionEvent&)>;

    explicit ReconnectionManager(const ReconnectionStrategy& strategy = ReconnectionStrategy());
    ~ReconnectionManager();
    ReconnectionManager(const ReconnectionManager&) = delete;
    ReconnectionManager& operator=(const ReconnectionManager&) = delete;

    //==========================================================================================================
    // ScheduleReconnection
    // Purpose: Starts the backoff loop for serverName. Idempotent: when a state already exists (scheduled,
    //          attempting or exhausted) nothing changes and the existing snapshot is returned.
    // Args:
    //   config: Opaque provider configuration handed back to reconnectFn (deep-copied).
    //   reconnectFn: Called after each delay on a thread of its own; attempts for different names run
    //                concurrently. Failure is an exception thrown by the call itself or by the returned
    //                future's get().
    // Returns:
    //   Snapshot of the state for serverName after the call.
    //==========================================================================================================
    ReconnectionState ScheduleReconnection(const std::string& serverName, const JSONValue& config,
                                           ReconnectFn reconnectFn);

    // Removes the state, stops its timer and emits reconnection-cancelled. An in-flight attempt
    // finishes but its outcome is discarded.
    void CancelReconnection(const std::string& serverName);
    void CancelAll();

    // attempts = 0 when a state exists; otherwise a no-op.
    void ResetRetries(const std::string& serverName);

    std::optional<ReconnectionState> GetState(const std::string& serverName) const;
    std::vector<ReconnectionState> GetAllStates() const;
    // Scheduled or attempting.
    std::size_t GetActiveReconnections() const;
    bool IsReconnecting(const std::string& serverName) const;

    void SetStrategy(const ReconnectionStrategyUpdate& update);
    ReconnectionStrategy GetStrategy() const;

    // Truncated to whole milliseconds, never negative.
    int64_t CalculateDelay(int attempt) const;

    //==========================================================================================================
    // FormatNextAttempt
    // Purpose: Human-readable time until nextAttemptMs: "now", "<s>s" or "<m>m <s>s".
    // Args:
    //   nowMs: Reference time; the current wall clock when unset.
    //==========================================================================================================
    static std::string FormatNextAttempt(int64_t nextAttemptMs, std::optional<int64_t> nowMs = std::nullopt);

    uint64_t Subscribe(Observer observer);
    void Unsubscribe(uint64_t id);

    // Stops every timer, clears state and drops all observers. Safe to call more than once.
    void Dispose();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace reconnect
} // namespace mcplink
