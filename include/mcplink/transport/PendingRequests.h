//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequests.h
// Purpose: Table of in-flight JSON-RPC requests keyed by id, with optional per-request deadlines
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace transport {

//==========================================================================================================
// PendingRequests
// Purpose: Shared by every transport. Each entry's promise is fulfilled exactly once: by the matching
//          response, by a synthesized error response (timeout, close), or never if the table outlives it.
// Notes:
//   Promises are moved out under the lock and fulfilled outside it.
//==========================================================================================================
class PendingRequests {
public:
    using ResponsePtr = std::unique_ptr<JSONRPCResponse>;

    // timeout of zero means no deadline.
    std::future<ResponsePtr> Add(const std::string& key, std::chrono::milliseconds timeout);

    // Fulfils the entry matching response.id; returns false for an unknown id.
    bool Resolve(JSONRPCResponse&& response);

    // Fulfils one entry with an InternalError response carrying message.
    bool Fail(const std::string& key, const std::string& message);

    // Fulfils every entry with an InternalError response carrying message; returns how many.
    std::size_t FailAll(const std::string& message);

    // Fails the entries whose deadline has passed with "Request timeout"; returns how many.
    std::size_t ExpireOverdue();

    std::size_t Size() const;

private:
    struct Entry {
        std::promise<ResponsePtr> promise;
        std::chrono::steady_clock::time_point deadline;
        bool hasDeadline{false};
    };

    mutable std::mutex mtx;
    std::unordered_map<std::string, Entry> entries;
};

} // namespace transport
} // namespace mcplink
