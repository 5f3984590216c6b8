//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyedMutex.h
// Purpose: Per-key FIFO mutual exclusion with direct ownership handoff and diagnostics
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace mcplink {
namespace sync {

//==========================================================================================================
// MutexResult
// Purpose: Outcome of RunExclusiveSafe. On failure value is empty and error carries the exception text.
//==========================================================================================================
template <typename T>
struct MutexResult {
    bool success{false};
    std::optional<T> value;
    std::string error;
};

template <>
struct MutexResult<void> {
    bool success{false};
    std::string error;
};

// Snapshot of one key for GetDiagnostics().
struct MutexDiagnostics {
    std::string key;
    bool locked{false};
    std::optional<std::string> holder;
    std::size_t queueLength{0};
    std::optional<std::chrono::milliseconds> duration;
};

//==========================================================================================================
// KeyedMutex
// Purpose: Independent locks keyed by string. Waiters are served strictly in arrival order: a release
//          hands ownership to the oldest waiter inside the same critical section, so the lock is never
//          observed free between two holders.
// Notes:
//   Entries are created lazily and live until Clear(key)/ClearAll().
//==========================================================================================================
class KeyedMutex {
public:
    class Impl;
    struct Entry;

    //==========================================================================================================
    // ReleaseHandle
    // Purpose: Ownership of one acquisition. Release() is idempotent; destruction releases.
    //==========================================================================================================
    class ReleaseHandle {
    public:
        ReleaseHandle() = default;
        ReleaseHandle(std::shared_ptr<Impl> owner, std::shared_ptr<Entry> entry, uint64_t ticket, std::string key);
        ReleaseHandle(ReleaseHandle&& other) noexcept;
        ReleaseHandle& operator=(ReleaseHandle&& other) noexcept;
        ReleaseHandle(const ReleaseHandle&) = delete;
        ReleaseHandle& operator=(const ReleaseHandle&) = delete;
        ~ReleaseHandle();

        void Release();
        bool IsReleased() const { return owner == nullptr; }
        const std::string& Key() const { return key; }

    private:
        std::shared_ptr<Impl> owner;
        std::shared_ptr<Entry> entry;
        uint64_t ticket{0};
        std::string key;
    };

    KeyedMutex();
    ~KeyedMutex();
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    //==========================================================================================================
    // Acquire
    // Purpose: Blocks until the caller owns key. Never fails.
    // Args:
    //   key: Lock identity.
    //   holder: Diagnostic label reported by GetLockHolder (defaults to the key).
    //==========================================================================================================
    ReleaseHandle Acquire(const std::string& key, const std::string& holder = std::string());

    // Runs fn while holding key. The lock is released on every exit path; exceptions propagate.
    template <typename Fn>
    auto RunExclusive(const std::string& key, Fn&& fn) -> std::invoke_result_t<Fn&> {
        ReleaseHandle handle = Acquire(key);
        return std::invoke(fn);
    }

    //==========================================================================================================
    // RunExclusiveSafe
    // Purpose: Like RunExclusive but failures thrown by fn are returned as MutexResult{success=false}.
    //==========================================================================================================
    template <typename Fn>
    auto RunExclusiveSafe(const std::string& key, Fn&& fn) -> MutexResult<std::invoke_result_t<Fn&>> {
        using R = std::invoke_result_t<Fn&>;
        MutexResult<R> out;
        ReleaseHandle handle = Acquire(key);
        try {
            if constexpr (std::is_void_v<R>) {
                std::invoke(fn);
            } else {
                out.value.emplace(std::invoke(fn));
            }
            out.success = true;
        } catch (const std::exception& e) {
            out.error = e.what();
        } catch (...) {
            out.error = "Unknown error";
        }
        return out;
    }

    bool IsLocked(const std::string& key) const;
    std::size_t GetQueueLength(const std::string& key) const;
    std::optional<std::string> GetLockHolder(const std::string& key) const;
    std::optional<std::chrono::milliseconds> GetLockDuration(const std::string& key) const;
    std::vector<std::string> GetKeys() const;
    std::vector<MutexDiagnostics> GetDiagnostics() const;

    //==========================================================================================================
    // Clear / ClearAll
    // Purpose: Drop the entry for key. The current holder is force-released (its handle becomes a no-op)
    //          and already queued waiters keep being served in FIFO order on the dropped entry. The next
    //          Acquire for key starts a fresh entry.
    //==========================================================================================================
    void Clear(const std::string& key);
    void ClearAll();

private:
    std::shared_ptr<Impl> pImpl;
};

} // namespace sync
} // namespace mcplink
