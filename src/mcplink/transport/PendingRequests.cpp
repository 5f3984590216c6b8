//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequests.cpp
// Purpose: Table of in-flight JSON-RPC requests keyed by id, with optional per-request deadlines
//==========================================================================================================

#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "mcplink/transport/PendingRequests.h"

namespace mcplink {
namespace transport {

namespace {
PendingRequests::ResponsePtr errorResponse(const std::string& key, const std::string& message) {
    auto resp = std::make_unique<JSONRPCResponse>();
    if (key.empty()) {
        resp->id = nullptr;
    } else {
        resp->id = key;
    }
    resp->error = CreateErrorObject(JSONRPCErrorCodes::InternalError, message);
    return resp;
}
} // namespace

std::future<PendingRequests::ResponsePtr> PendingRequests::Add(const std::string& key,
                                                                std::chrono::milliseconds timeout) {
    Entry entry;
    auto fut = entry.promise.get_future();
    if (timeout.count() > 0) {
        entry.hasDeadline = true;
        entry.deadline = std::chrono::steady_clock::now() + timeout;
    }
    std::promise<ResponsePtr> displaced;
    bool hadDisplaced = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = entries.find(key);
        if (it != entries.end()) {
            displaced = std::move(it->second.promise);
            hadDisplaced = true;
            entries.erase(it);
        }
        entries.emplace(key, std::move(entry));
    }
    if (hadDisplaced) {
        LOG_WARN("PendingRequests: id {} reused while in flight", key);
        displaced.set_value(errorResponse(key, "Request id reused"));
    }
    return fut;
}

bool PendingRequests::Resolve(JSONRPCResponse&& response) {
    const std::string key = JSONRPCIdToString(response.id);
    std::promise<ResponsePtr> target;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = entries.find(key);
        if (it == entries.end()) {
            return false;
        }
        target = std::move(it->second.promise);
        entries.erase(it);
    }
    target.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
    return true;
}

bool PendingRequests::Fail(const std::string& key, const std::string& message) {
    std::promise<ResponsePtr> target;
    {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = entries.find(key);
        if (it == entries.end()) {
            return false;
        }
        target = std::move(it->second.promise);
        entries.erase(it);
    }
    target.set_value(errorResponse(key, message));
    return true;
}

std::size_t PendingRequests::FailAll(const std::string& message) {
    std::unordered_map<std::string, Entry> drained;
    {
        std::lock_guard<std::mutex> lock(mtx);
        drained.swap(entries);
    }
    for (auto& [key, entry] : drained) {
        entry.promise.set_value(errorResponse(key, message));
    }
    return drained.size();
}

std::size_t PendingRequests::ExpireOverdue() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<std::string, std::promise<ResponsePtr>>> expired;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto it = entries.begin(); it != entries.end();) {
            if (it->second.hasDeadline && it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second.promise));
                it = entries.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [key, promise] : expired) {
        LOG_WARN("Request {} timed out", key);
        promise.set_value(errorResponse(key, "Request timeout"));
    }
    return expired.size();
}

std::size_t PendingRequests::Size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

} // namespace transport
} // namespace mcplink
