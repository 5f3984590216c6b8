//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyedMutex.cpp
// Purpose: Per-key FIFO mutual exclusion with direct ownership handoff and diagnostics
//==========================================================================================================

#include "mcplink/sync/KeyedMutex.h"
#include "logging/Logger.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace mcplink {
namespace sync {

struct KeyedMutex::Entry {
    struct Ticket {
        uint64_t id{0};
        std::string holder;
        bool granted{false};
        std::condition_variable cv;
    };

    bool locked{false};
    uint64_t holderTicket{0};
    std::string holder;
    std::chrono::steady_clock::time_point acquiredAt{};
    std::deque<std::shared_ptr<Ticket>> waiters;
};

////////////////////////////////////////// Impl //////////////////////////////////////////
class KeyedMutex::Impl {
public:
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    uint64_t nextTicket{1};

    // Caller holds mtx.
    std::shared_ptr<Entry> findEntry(const std::string& key) const {
        auto it = entries.find(key);
        if (it == entries.end()) {
            return nullptr;
        }
        return it->second;
    }

    // Caller holds mtx. Hands the lock to the oldest waiter or marks the entry free.
    void handoff(Entry& entry) {
        if (entry.waiters.empty()) {
            entry.locked = false;
            entry.holderTicket = 0;
            entry.holder.clear();
            return;
        }
        std::shared_ptr<Entry::Ticket> next = std::move(entry.waiters.front());
        entry.waiters.pop_front();
        entry.holderTicket = next->id;
        entry.holder = next->holder;
        entry.acquiredAt = std::chrono::steady_clock::now();
        next->granted = true;
        next->cv.notify_one();
    }

    void release(Entry& entry, uint64_t ticket) {
        std::lock_guard<std::mutex> lock(mtx);
        if (!entry.locked || entry.holderTicket != ticket) {
            // Force-released by Clear(); ownership already moved on.
            return;
        }
        handoff(entry);
    }

    void clearLocked(const std::string& key) {
        auto it = entries.find(key);
        if (it == entries.end()) {
            return;
        }
        std::shared_ptr<Entry> entry = it->second;
        entries.erase(it);
        if (entry->locked) {
            LOG_DEBUG("KeyedMutex: force-releasing '{}' ({} waiter(s))", key, entry->waiters.size());
            handoff(*entry);
        }
    }
};

////////////////////////////////////////// ReleaseHandle //////////////////////////////////////////
KeyedMutex::ReleaseHandle::ReleaseHandle(std::shared_ptr<Impl> owner, std::shared_ptr<Entry> entry,
                                         uint64_t ticket, std::string key)
    : owner(std::move(owner)), entry(std::move(entry)), ticket(ticket), key(std::move(key)) {}

KeyedMutex::ReleaseHandle::ReleaseHandle(ReleaseHandle&& other) noexcept
    : owner(std::move(other.owner)), entry(std::move(other.entry)), ticket(other.ticket), key(std::move(other.key)) {
    other.owner.reset();
    other.entry.reset();
}

KeyedMutex::ReleaseHandle& KeyedMutex::ReleaseHandle::operator=(ReleaseHandle&& other) noexcept {
    if (this != &other) {
        Release();
        owner = std::move(other.owner);
        entry = std::move(other.entry);
        ticket = other.ticket;
        key = std::move(other.key);
        other.owner.reset();
        other.entry.reset();
    }
    return *this;
}

KeyedMutex::ReleaseHandle::~ReleaseHandle() {
    Release();
}

void KeyedMutex::ReleaseHandle::Release() {
    if (!owner) {
        return;
    }
    std::shared_ptr<Impl> o = std::move(owner);
    std::shared_ptr<Entry> e = std::move(entry);
    owner.reset();
    entry.reset();
    o->release(*e, ticket);
}

////////////////////////////////////////// KeyedMutex //////////////////////////////////////////
KeyedMutex::KeyedMutex() : pImpl(std::make_shared<Impl>()) {}

KeyedMutex::~KeyedMutex() = default;

KeyedMutex::ReleaseHandle KeyedMutex::Acquire(const std::string& key, const std::string& holder) {
    std::unique_lock<std::mutex> lock(pImpl->mtx);
    std::shared_ptr<Entry>& slot = pImpl->entries[key];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    std::shared_ptr<Entry> entry = slot;
    uint64_t id = pImpl->nextTicket++;
    std::string label = holder.empty() ? key : holder;

    if (!entry->locked) {
        entry->locked = true;
        entry->holderTicket = id;
        entry->holder = std::move(label);
        entry->acquiredAt = std::chrono::steady_clock::now();
        return ReleaseHandle(pImpl, entry, id, key);
    }

    auto ticket = std::make_shared<Entry::Ticket>();
    ticket->id = id;
    ticket->holder = std::move(label);
    entry->waiters.push_back(ticket);
    ticket->cv.wait(lock, [&ticket] { return ticket->granted; });
    return ReleaseHandle(pImpl, entry, id, key);
}

bool KeyedMutex::IsLocked(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto entry = pImpl->findEntry(key);
    return entry && entry->locked;
}

std::size_t KeyedMutex::GetQueueLength(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto entry = pImpl->findEntry(key);
    return entry ? entry->waiters.size() : 0;
}

std::optional<std::string> KeyedMutex::GetLockHolder(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto entry = pImpl->findEntry(key);
    if (!entry || !entry->locked) {
        return std::nullopt;
    }
    return entry->holder;
}

std::optional<std::chrono::milliseconds> KeyedMutex::GetLockDuration(const std::string& key) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto entry = pImpl->findEntry(key);
    if (!entry || !entry->locked) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry->acquiredAt);
}

std::vector<std::string> KeyedMutex::GetKeys() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    std::vector<std::string> keys;
    keys.reserve(pImpl->entries.size());
    for (const auto& kv : pImpl->entries) {
        keys.push_back(kv.first);
    }
    return keys;
}

std::vector<MutexDiagnostics> KeyedMutex::GetDiagnostics() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto now = std::chrono::steady_clock::now();
    std::vector<MutexDiagnostics> out;
    out.reserve(pImpl->entries.size());
    for (const auto& [key, entry] : pImpl->entries) {
        MutexDiagnostics d;
        d.key = key;
        d.locked = entry->locked;
        d.queueLength = entry->waiters.size();
        if (entry->locked) {
            d.holder = entry->holder;
            d.duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry->acquiredAt);
        }
        out.push_back(std::move(d));
    }
    return out;
}

void KeyedMutex::Clear(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    pImpl->clearLocked(key);
}

void KeyedMutex::ClearAll() {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    std::vector<std::string> keys;
    keys.reserve(pImpl->entries.size());
    for (const auto& kv : pImpl->entries) {
        keys.push_back(kv.first);
    }
    for (const auto& k : keys) {
        pImpl->clearLocked(k);
    }
}

} // namespace sync
} // namespace mcplink
