//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReconnectionManager.cpp
// Purpose: Per-provider reconnection state machine with bounded exponential backoff and jitter
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "mcplink/reconnect/ReconnectionManager.h"

namespace mcplink {
namespace reconnect {
namespace net = boost::asio;

namespace {
int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
} // namespace

const char* toString(ReconnectionStatus status) {
    switch (status) {
        case ReconnectionStatus::Scheduled: return "scheduled";
        case ReconnectionStatus::Attempting: return "attempting";
        case ReconnectionStatus::Exhausted:
        default: return "exhausted";
    }
}

const char* ReconnectionEvent::name() const {
    switch (type) {
        case ReconnectionEventType::Scheduled: return "reconnection-scheduled";
        case ReconnectionEventType::Attempt: return "reconnection-attempt";
        case ReconnectionEventType::Success: return "reconnection-success";
        case ReconnectionEventType::Failed: return "reconnection-failed";
        case ReconnectionEventType::MaxRetriesReached: return "max-retries-reached";
        case ReconnectionEventType::Cancelled:
        default: return "reconnection-cancelled";
    }
}

////////////////////////////////////////// Impl //////////////////////////////////////////
class ReconnectionManager::Impl : public std::enable_shared_from_this<Impl> {
public:
    struct Tracked {
        ReconnectionState state;
        JSONValue config;
        ReconnectFn fn;
        std::shared_ptr<net::steady_timer> timer;
        uint64_t generation{0};
    };

    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread worker;

    mutable std::mutex mtx;
    ReconnectionStrategy strategy;
    std::unordered_map<std::string, Tracked> tracked;
    uint64_t nextGeneration{1};
    std::mt19937 rng{std::random_device{}()};

    std::mutex observerMutex;
    std::map<uint64_t, Observer> observers;
    uint64_t nextObserverId{1};

    explicit Impl(const ReconnectionStrategy& s) : strategy(s) {}

    // The worker keeps the Impl alive until ioc.run() returns, so stop() may be called from a handler.
    void start() {
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        worker = std::thread([self = shared_from_this()]() { self->ioc.run(); });
    }

    void stop() {
        if (workGuard) {
            workGuard.reset();
        }
        ioc.stop();
        if (worker.joinable()) {
            if (worker.get_id() == std::this_thread::get_id()) {
                worker.detach();
            } else {
                worker.join();
            }
        }
    }

    void emit(const ReconnectionEvent& ev) {
        std::vector<Observer> copy;
        {
            std::lock_guard<std::mutex> lock(observerMutex);
            copy.reserve(observers.size());
            for (const auto& kv : observers) {
                copy.push_back(kv.second);
            }
        }
        for (const auto& obs : copy) {
            try {
                obs(ev);
            } catch (const std::exception& e) {
                LOG_WARN("ReconnectionManager: observer threw on {}: {}", ev.name(), e.what());
            }
        }
    }

    // Caller holds mtx.
    int64_t calculateDelayLocked(int attempt) {
        double delay = static_cast<double>(strategy.baseDelayMs) * std::pow(strategy.backoffMultiplier, attempt);
        delay = std::min(delay, static_cast<double>(strategy.maxDelayMs));
        if (strategy.jitter) {
            std::uniform_real_distribution<double> dist(-1.0, 1.0);
            delay += dist(rng) * delay * 0.25;
        }
        delay = std::max(delay, 0.0);
        return static_cast<int64_t>(delay);
    }

    // Caller holds mtx. Arms the timer for the next attempt and returns the scheduled event.
    ReconnectionEvent armLocked(const std::string& name, Tracked& t) {
        int64_t delay = calculateDelayLocked(t.state.attempts);
        t.state.status = ReconnectionStatus::Scheduled;
        t.state.nextAttemptMs = nowEpochMs() + delay;

        t.timer = std::make_shared<net::steady_timer>(ioc);
        t.timer->expires_after(std::chrono::milliseconds(delay));
        std::weak_ptr<Impl> weak = shared_from_this();
        uint64_t gen = t.generation;
        t.timer->async_wait([weak, name, gen](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto self = weak.lock()) {
                self->onTimer(name, gen);
            }
        });

        ReconnectionEvent ev;
        ev.type = ReconnectionEventType::Scheduled;
        ev.serverName = name;
        ev.attempt = t.state.attempts + 1;
        ev.maxAttempts = strategy.maxRetries;
        ev.delayMs = delay;
        LOG_INFO("Reconnection for '{}' scheduled: attempt {}/{} in {} ms", name, ev.attempt, ev.maxAttempts, delay);
        return ev;
    }

    // Runs on the worker thread.
    void onTimer(const std::string& name, uint64_t gen) {
        FUNC_SCOPE();
        ReconnectFn fn;
        JSONValue config;
        ReconnectionEvent attemptEv;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = tracked.find(name);
            if (it == tracked.end() || it->second.generation != gen ||
                it->second.state.status != ReconnectionStatus::Scheduled) {
                return;
            }
            Tracked& t = it->second;
            t.state.status = ReconnectionStatus::Attempting;
            t.state.nextAttemptMs = 0;
            t.state.lastAttemptMs = nowEpochMs();
            t.timer.reset();
            fn = t.fn;
            config = DeepCopyJSON(t.config);
            attemptEv.type = ReconnectionEventType::Attempt;
            attemptEv.serverName = name;
            attemptEv.attempt = t.state.attempts + 1;
            attemptEv.maxAttempts = strategy.maxRetries;
        }
        emit(attemptEv);

        // The attempt runs on its own thread; its outcome is posted back so state changes stay on the
        // io thread and other providers' timers keep firing meanwhile.
        std::weak_ptr<Impl> weak = weak_from_this();
        const int attempt = attemptEv.attempt;
        std::thread([weak, fn = std::move(fn), config = std::move(config), name, gen, attempt]() {
            std::optional<std::string> failure;
            try {
                std::future<void> fut = fn(config);
                fut.get();
            } catch (const std::exception& e) {
                failure = std::string(e.what());
            } catch (...) {
                failure = std::string("Unknown error");
            }
            if (auto self = weak.lock()) {
                net::post(self->ioc, [weak, name, gen, attempt, failure]() {
                    if (auto s = weak.lock()) {
                        s->finishAttempt(name, gen, attempt, failure);
                    }
                });
            }
        }).detach();
    }

    // Runs on the worker thread once an attempt has completed.
    void finishAttempt(const std::string& name, uint64_t gen, int attempt, const std::optional<std::string>& failure) {
        std::vector<ReconnectionEvent> events;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = tracked.find(name);
            if (it == tracked.end() || it->second.generation != gen) {
                LOG_DEBUG("Reconnection attempt for '{}' finished after cancellation; result discarded", name);
                return;
            }
            Tracked& t = it->second;
            if (!failure.has_value()) {
                ReconnectionEvent ev;
                ev.type = ReconnectionEventType::Success;
                ev.serverName = name;
                ev.totalAttempts = attempt;
                tracked.erase(it);
                events.push_back(std::move(ev));
            } else {
                t.state.attempts += 1;
                t.state.lastError = *failure;
                ReconnectionEvent failed;
                failed.type = ReconnectionEventType::Failed;
                failed.serverName = name;
                failed.attempt = attempt;
                failed.maxAttempts = strategy.maxRetries;
                failed.error = *failure;
                events.push_back(std::move(failed));
                if (t.state.attempts < strategy.maxRetries) {
                    events.push_back(armLocked(name, t));
                } else {
                    t.state.status = ReconnectionStatus::Exhausted;
                    t.state.nextAttemptMs = 0;
                    ReconnectionEvent exhausted;
                    exhausted.type = ReconnectionEventType::MaxRetriesReached;
                    exhausted.serverName = name;
                    exhausted.attempts = t.state.attempts;
                    events.push_back(std::move(exhausted));
                }
            }
        }
        if (failure.has_value()) {
            LOG_WARN("Reconnection attempt {} for '{}' failed: {}", attempt, name, *failure);
        } else {
            LOG_INFO("Reconnected '{}' after {} attempt(s)", name, attempt);
        }
        for (const auto& ev : events) {
            emit(ev);
        }
    }

    // Caller holds mtx. Returns whether a state existed.
    bool cancelLocked(const std::string& name) {
        auto it = tracked.find(name);
        if (it == tracked.end()) {
            return false;
        }
        if (it->second.timer) {
            it->second.timer->cancel();
        }
        tracked.erase(it);
        return true;
    }
};

////////////////////////////////////////// ReconnectionManager //////////////////////////////////////////
ReconnectionManager::ReconnectionManager(const ReconnectionStrategy& strategy)
    : pImpl(std::make_shared<Impl>(strategy)) {
    pImpl->start();
}

ReconnectionManager::~ReconnectionManager() {
    Dispose();
    pImpl->stop();
}

ReconnectionState ReconnectionManager::ScheduleReconnection(const std::string& serverName, const JSONValue& config,
                                                            ReconnectFn reconnectFn) {
    FUNC_SCOPE();
    ReconnectionEvent ev;
    ReconnectionState snapshot;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto existing = pImpl->tracked.find(serverName);
        if (existing != pImpl->tracked.end()) {
            LOG_DEBUG("Reconnection for '{}' already {}; not rescheduling", serverName,
                      toString(existing->second.state.status));
            return existing->second.state;
        }
        Impl::Tracked& t = pImpl->tracked[serverName];
        t.state.serverName = serverName;
        t.config = DeepCopyJSON(config);
        t.fn = std::move(reconnectFn);
        t.generation = pImpl->nextGeneration++;
        if (pImpl->strategy.maxRetries <= 0) {
            t.state.status = ReconnectionStatus::Exhausted;
            ev.type = ReconnectionEventType::MaxRetriesReached;
            ev.serverName = serverName;
            ev.attempts = 0;
        } else {
            ev = pImpl->armLocked(serverName, t);
        }
        snapshot = t.state;
    }
    pImpl->emit(ev);
    return snapshot;
}

void ReconnectionManager::CancelReconnection(const std::string& serverName) {
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        existed = pImpl->cancelLocked(serverName);
    }
    if (!existed) {
        return;
    }
    LOG_INFO("Reconnection for '{}' cancelled", serverName);
    ReconnectionEvent ev;
    ev.type = ReconnectionEventType::Cancelled;
    ev.serverName = serverName;
    pImpl->emit(ev);
}

void ReconnectionManager::CancelAll() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        for (const auto& kv : pImpl->tracked) {
            names.push_back(kv.first);
        }
    }
    for (const auto& n : names) {
        CancelReconnection(n);
    }
}

void ReconnectionManager::ResetRetries(const std::string& serverName) {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto it = pImpl->tracked.find(serverName);
    if (it != pImpl->tracked.end()) {
        it->second.state.attempts = 0;
    }
}

std::optional<ReconnectionState> ReconnectionManager::GetState(const std::string& serverName) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto it = pImpl->tracked.find(serverName);
    if (it == pImpl->tracked.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::vector<ReconnectionState> ReconnectionManager::GetAllStates() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    std::vector<ReconnectionState> out;
    out.reserve(pImpl->tracked.size());
    for (const auto& kv : pImpl->tracked) {
        out.push_back(kv.second.state);
    }
    return out;
}

std::size_t ReconnectionManager::GetActiveReconnections() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return static_cast<std::size_t>(std::count_if(pImpl->tracked.begin(), pImpl->tracked.end(), [](const auto& kv) {
        return kv.second.state.status != ReconnectionStatus::Exhausted;
    }));
}

bool ReconnectionManager::IsReconnecting(const std::string& serverName) const {
    auto state = GetState(serverName);
    return state.has_value() && state->status != ReconnectionStatus::Exhausted;
}

void ReconnectionManager::SetStrategy(const ReconnectionStrategyUpdate& update) {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    ReconnectionStrategy& s = pImpl->strategy;
    if (update.maxRetries) s.maxRetries = *update.maxRetries;
    if (update.baseDelayMs) s.baseDelayMs = *update.baseDelayMs;
    if (update.maxDelayMs) s.maxDelayMs = *update.maxDelayMs;
    if (update.backoffMultiplier) s.backoffMultiplier = *update.backoffMultiplier;
    if (update.jitter) s.jitter = *update.jitter;
}

ReconnectionStrategy ReconnectionManager::GetStrategy() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return pImpl->strategy;
}

int64_t ReconnectionManager::CalculateDelay(int attempt) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return pImpl->calculateDelayLocked(attempt);
}

std::string ReconnectionManager::FormatNextAttempt(int64_t nextAttemptMs, std::optional<int64_t> nowMs) {
    int64_t diff = nextAttemptMs - nowMs.value_or(nowEpochMs());
    if (diff <= 0) {
        return "now";
    }
    int64_t seconds = diff / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
}

uint64_t ReconnectionManager::Subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(pImpl->observerMutex);
    uint64_t id = pImpl->nextObserverId++;
    pImpl->observers.emplace(id, std::move(observer));
    return id;
}

void ReconnectionManager::Unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(pImpl->observerMutex);
    pImpl->observers.erase(id);
}

void ReconnectionManager::Dispose() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        for (auto& kv : pImpl->tracked) {
            if (kv.second.timer) {
                kv.second.timer->cancel();
            }
        }
        pImpl->tracked.clear();
    }
    std::lock_guard<std::mutex> lock(pImpl->observerMutex);
    pImpl->observers.clear();
}

} // namespace reconnect
} // namespace mcplink
