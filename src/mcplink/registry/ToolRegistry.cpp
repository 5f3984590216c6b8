//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Unified registry of callable tools from every origin, with deep isolation of stored data
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "logging/Logger.h"
#include "mcplink/async/Task.h"
#include "mcplink/invariants/Invariants.h"
#include "mcplink/registry/ToolRegistry.h"

namespace mcplink {
namespace registry {

namespace {

const ToolSource kAllSources[] = {ToolSource::Primary, ToolSource::Plugin, ToolSource::Provider};

int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

ToolExecutionContext copyContext(const ToolExecutionContext& ctx) {
    ToolExecutionContext out;
    out.source = ctx.source;
    out.agentId = ctx.agentId;
    out.sessionId = ctx.sessionId;
    if (ctx.metadata.has_value()) {
        out.metadata = DeepCopyJSON(*ctx.metadata);
    }
    return out;
}

ToolExecutionResult copyResult(const ToolExecutionResult& r) {
    ToolExecutionResult out;
    out.success = r.success;
    out.output = r.output;
    out.error = r.error;
    if (r.data.has_value()) {
        out.data = DeepCopyJSON(*r.data);
    }
    return out;
}

ToolExecutionResult failure(std::string message) {
    ToolExecutionResult r;
    r.success = false;
    r.error = std::move(message);
    return r;
}

std::future<ToolExecutionResult> readyResult(ToolExecutionResult r) {
    std::promise<ToolExecutionResult> p;
    p.set_value(std::move(r));
    return p.get_future();
}

ToolExecutionResult failureFromException(const std::exception& e) {
    ToolExecutionResult r = failure(e.what());
    JSONValue::Object data;
    SetMember(data, "errorName", JSONValue(boost::core::demangle(typeid(e).name())));
    SetMember(data, "errorMessage", JSONValue(std::string(e.what())));
    r.data = JSONValue(std::move(data));
    return r;
}

// Executor failures, synchronous or through the future, become result values.
async::Task<ToolExecutionResult> runExecutor(ToolExecutor executor, JSONValue args, ToolExecutionContext ctx) {
    try {
        std::future<ToolExecutionResult> pending = executor(args, ctx);
        ToolExecutionResult r = co_await async::awaitFuture(std::move(pending));
        co_return copyResult(r);
    } catch (const std::exception& e) {
        LOG_DEBUG("Tool executor failed: {}", e.what());
        co_return failureFromException(e);
    } catch (...) {
        co_return failure("Unknown execution error");
    }
}

} // namespace

const char* toString(ToolSource source) {
    switch (source) {
        case ToolSource::Primary: return "primary";
        case ToolSource::Plugin: return "plugin";
        case ToolSource::Provider:
        default: return "provider";
    }
}

std::optional<ToolSource> toolSourceFromString(const std::string& s) {
    for (ToolSource src : kAllSources) {
        if (s == toString(src)) return src;
    }
    return std::nullopt;
}

ToolDefinition CopyToolDefinition(const ToolDefinition& def) {
    ToolDefinition out;
    out.name = def.name;
    out.description = def.description;
    out.inputSchema = DeepCopyJSON(def.inputSchema);
    if (def.outputSchema.has_value()) {
        out.outputSchema = DeepCopyJSON(*def.outputSchema);
    }
    return out;
}

JSONValue ToolDefinitionToJSON(const ToolDefinition& def) {
    JSONValue::Object o;
    SetMember(o, "name", JSONValue(def.name));
    SetMember(o, "description", JSONValue(def.description));
    SetMember(o, "inputSchema", DeepCopyJSON(def.inputSchema));
    if (def.outputSchema.has_value()) {
        SetMember(o, "outputSchema", DeepCopyJSON(*def.outputSchema));
    }
    return JSONValue(std::move(o));
}

////////////////////////////////////////// Impl //////////////////////////////////////////
class ToolRegistry::Impl {
public:
    mutable std::shared_mutex mtx;
    std::map<std::string, RegisteredTool> tools;
    std::map<ToolSource, std::set<std::string>> bySource;

    Impl() {
        for (ToolSource src : kAllSources) {
            bySource[src];
        }
    }

    // Caller holds mtx. A registered name lives in exactly one source index.
    void checkIndexedOnce(const std::string& name) const {
        std::vector<bool> present;
        std::vector<std::string> labels;
        for (const auto& [src, names] : bySource) {
            present.push_back(names.count(name) > 0);
            labels.push_back(toString(src));
        }
        invariants::AssertExactlyOne(present, labels, "Tool '" + name + "' must be indexed under exactly one source");
    }

    // Caller holds mtx.
    std::vector<ToolDefinition> copyDefinitions(const std::function<bool(const RegisteredTool&)>& keep) const {
        std::vector<ToolDefinition> out;
        for (const auto& kv : tools) {
            if (keep(kv.second)) {
                out.push_back(CopyToolDefinition(kv.second.definition));
            }
        }
        return out;
    }

    // Caller holds mtx.
    ToolRegistryStats statsLocked() const {
        ToolRegistryStats s;
        s.totalTools = tools.size();
        for (const auto& [src, names] : bySource) {
            s.bySource[toString(src)] = names.size();
        }
        for (const auto& kv : tools) {
            for (const auto& tag : kv.second.tags) {
                s.byTag[tag] += 1;
            }
        }
        return s;
    }
};

////////////////////////////////////////// ToolRegistry //////////////////////////////////////////
ToolRegistry::ToolRegistry() : pImpl(std::make_unique<Impl>()) {}

ToolRegistry::~ToolRegistry() = default;

void ToolRegistry::RegisterTool(ToolSource source, const ToolDefinition& definition, ToolExecutor executor,
                                const ToolRegistrationOptions& options) {
    FUNC_SCOPE();
    const std::string& name = definition.name;
    if (name.empty()) {
        throw ToolRegistrationError("Tool definition must have a non-empty name");
    }
    if (!executor) {
        throw ToolRegistrationError("Tool '" + name + "' has no executor");
    }

    RegisteredTool entry;
    entry.definition = CopyToolDefinition(definition);
    entry.executor = std::move(executor);
    entry.source = source;
    entry.registeredAt = nowEpochMs();
    entry.tags = options.tags;

    std::unique_lock<std::shared_mutex> lock(pImpl->mtx);
    auto existing = pImpl->tools.find(name);
    if (existing != pImpl->tools.end()) {
        if (!options.allowOverwrite) {
            throw ToolRegistrationError("Tool '" + name +
                                        "' is already registered. Use allowOverwrite to replace it.");
        }
        if (existing->second.source != source) {
            pImpl->bySource[existing->second.source].erase(name);
        }
        LOG_DEBUG("Overwriting tool '{}' ({} -> {})", name, toString(existing->second.source), toString(source));
        existing->second = std::move(entry);
    } else {
        pImpl->tools.emplace(name, std::move(entry));
    }
    pImpl->bySource[source].insert(name);
    pImpl->checkIndexedOnce(name);
}

bool ToolRegistry::UnregisterTool(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mtx);
    auto it = pImpl->tools.find(name);
    if (it == pImpl->tools.end()) {
        return false;
    }
    pImpl->bySource[it->second.source].erase(name);
    pImpl->tools.erase(it);
    return true;
}

std::optional<RegisteredTool> ToolRegistry::GetTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    auto it = pImpl->tools.find(name);
    if (it == pImpl->tools.end()) {
        return std::nullopt;
    }
    RegisteredTool copy;
    copy.definition = CopyToolDefinition(it->second.definition);
    copy.executor = it->second.executor;
    copy.source = it->second.source;
    copy.registeredAt = it->second.registeredAt;
    copy.tags = it->second.tags;
    return copy;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    return pImpl->tools.count(name) > 0;
}

std::vector<ToolDefinition> ToolRegistry::GetAllToolDefinitions() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    return pImpl->copyDefinitions([](const RegisteredTool&) { return true; });
}

std::vector<ToolDefinition> ToolRegistry::GetToolDefinitionsBySource(ToolSource source) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    return pImpl->copyDefinitions([source](const RegisteredTool& t) { return t.source == source; });
}

std::vector<ToolDefinition> ToolRegistry::GetToolDefinitionsByTag(const std::string& tag) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    return pImpl->copyDefinitions([&tag](const RegisteredTool& t) {
        return std::find(t.tags.begin(), t.tags.end(), tag) != t.tags.end();
    });
}

std::vector<std::string> ToolRegistry::GetToolNames() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    std::vector<std::string> names;
    names.reserve(pImpl->tools.size());
    for (const auto& kv : pImpl->tools) {
        names.push_back(kv.first);
    }
    return names;
}

std::vector<std::string> ToolRegistry::GetToolNamesBySource(ToolSource source) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    const auto& names = pImpl->bySource.at(source);
    return std::vector<std::string>(names.begin(), names.end());
}

std::future<ToolExecutionResult> ToolRegistry::ExecuteTool(const std::string& name, const JSONValue& args,
                                                           const ToolExecutionContext& context) {
    FUNC_SCOPE();
    ToolExecutor executor;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
        auto it = pImpl->tools.find(name);
        if (it == pImpl->tools.end()) {
            LOG_DEBUG("ExecuteTool: '{}' not registered", name);
            return readyResult(failure("Tool '" + name + "' not found in registry"));
        }
        executor = it->second.executor;
    }
    return runExecutor(std::move(executor), DeepCopyJSON(args), copyContext(context)).toFuture();
}

void ToolRegistry::Clear(std::optional<ToolSource> source) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mtx);
    if (!source.has_value()) {
        pImpl->tools.clear();
        for (auto& kv : pImpl->bySource) {
            kv.second.clear();
        }
        return;
    }
    auto& names = pImpl->bySource[*source];
    for (const auto& n : names) {
        pImpl->tools.erase(n);
    }
    names.clear();
}

ToolRegistryStats ToolRegistry::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    return pImpl->statsLocked();
}

JSONValue ToolRegistry::ExportDefinitions() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mtx);
    JSONValue::Array tools;
    for (const auto& [name, tool] : pImpl->tools) {
        JSONValue::Object entry;
        SetMember(entry, "name", JSONValue(name));
        SetMember(entry, "definition", ToolDefinitionToJSON(tool.definition));
        SetMember(entry, "source", JSONValue(toString(tool.source)));
        SetMember(entry, "registeredAt", JSONValue(tool.registeredAt));
        JSONValue::Array tags;
        for (const auto& t : tool.tags) {
            tags.push_back(std::make_shared<JSONValue>(t));
        }
        SetMember(entry, "tags", JSONValue(std::move(tags)));
        tools.push_back(std::make_shared<JSONValue>(std::move(entry)));
    }

    ToolRegistryStats s = pImpl->statsLocked();
    JSONValue::Object bySource;
    for (const auto& [k, v] : s.bySource) {
        SetMember(bySource, k, JSONValue(static_cast<int64_t>(v)));
    }
    JSONValue::Object byTag;
    for (const auto& [k, v] : s.byTag) {
        SetMember(byTag, k, JSONValue(static_cast<int64_t>(v)));
    }
    JSONValue::Object stats;
    SetMember(stats, "totalTools", JSONValue(static_cast<int64_t>(s.totalTools)));
    SetMember(stats, "bySource", JSONValue(std::move(bySource)));
    SetMember(stats, "byTag", JSONValue(std::move(byTag)));

    JSONValue::Object out;
    SetMember(out, "tools", JSONValue(std::move(tools)));
    SetMember(out, "stats", JSONValue(std::move(stats)));
    return JSONValue(std::move(out));
}

namespace {
std::mutex defaultMutex;
std::unique_ptr<ToolRegistry> defaultRegistry;
} // namespace

ToolRegistry& ToolRegistry::Default() {
    std::lock_guard<std::mutex> lock(defaultMutex);
    if (!defaultRegistry) {
        defaultRegistry = std::make_unique<ToolRegistry>();
    }
    return *defaultRegistry;
}

void ToolRegistry::ResetDefault() {
    std::lock_guard<std::mutex> lock(defaultMutex);
    if (defaultRegistry) {
        defaultRegistry->Clear();
        defaultRegistry.reset();
    }
}

////////////////////////////////////////// Batch registration //////////////////////////////////////////
BatchRegistrationResult RegisterTools(ToolRegistry& registry, ToolSource source,
                                      const std::vector<ToolRegistrationItem>& items) {
    FUNC_SCOPE();
    BatchRegistrationResult result;
    for (const auto& item : items) {
        try {
            registry.RegisterTool(source, item.definition, item.executor, item.options);
            result.registered.push_back(item.definition.name);
        } catch (const ToolRegistrationError& e) {
            LOG_WARN("Batch registration of '{}' failed: {}", item.definition.name, e.what());
            result.errors.push_back(ToolRegistrationFailure{item.definition.name, e.what()});
        }
    }
    return result;
}

} // namespace registry
} // namespace mcplink
