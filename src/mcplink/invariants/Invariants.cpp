//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Invariants.cpp
// Purpose: Runtime contract checks that raise InvariantViolationError with structured JSON context
//==========================================================================================================

#include "mcplink/invariants/Invariants.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_set>

namespace mcplink {
namespace invariants {

namespace {

JSONValue stringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue(std::move(arr));
}

JSONValue labelledConditions(const std::vector<bool>& conditions, const std::vector<std::string>& labels) {
    JSONValue::Array arr;
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        JSONValue::Object entry;
        if (i < labels.size()) {
            SetMember(entry, "label", JSONValue(labels[i]));
        } else {
            SetMember(entry, "label", JSONValue(nullptr));
        }
        SetMember(entry, "value", JSONValue(static_cast<bool>(conditions[i])));
        arr.push_back(std::make_shared<JSONValue>(std::move(entry)));
    }
    return JSONValue(std::move(arr));
}

int64_t countTrue(const std::vector<bool>& conditions) {
    return static_cast<int64_t>(std::count(conditions.begin(), conditions.end(), true));
}

bool hasNonNullMember(const JSONValue& v, const std::string& key) {
    const JSONValue* m = FindMember(v, key);
    return m != nullptr && !m->isNull();
}

} // namespace

void Invariant(bool condition, const std::string& message, const std::optional<JSONValue>& context) {
    if (condition) {
        return;
    }
    std::string full = "Invariant violation: " + message;
    if (context.has_value()) {
        full += "\nContext: " + serializeJSONValue(*context);
    }
    throw InvariantViolationError(full);
}

void AssertPositive(double value, const std::string& message) {
    JSONValue::Object ctx;
    SetMember(ctx, "value", JSONValue(value));
    Invariant(value > 0, message, JSONValue(std::move(ctx)));
}

void AssertNonNegative(double value, const std::string& message) {
    JSONValue::Object ctx;
    SetMember(ctx, "value", JSONValue(value));
    Invariant(value >= 0, message, JSONValue(std::move(ctx)));
}

void AssertNonEmptyString(const std::string& value, const std::string& message) {
    bool blank = std::all_of(value.begin(), value.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    JSONValue::Object ctx;
    SetMember(ctx, "value", JSONValue(value));
    SetMember(ctx, "length", JSONValue(static_cast<int64_t>(value.size())));
    Invariant(!blank, message, JSONValue(std::move(ctx)));
}

void AssertInRange(double value, double min, double max, const std::optional<std::string>& message) {
    std::string msg = message.value_or(std::format("Value must be between {} and {}", min, max));
    JSONValue::Object ctx;
    SetMember(ctx, "value", JSONValue(value));
    SetMember(ctx, "min", JSONValue(min));
    SetMember(ctx, "max", JSONValue(max));
    Invariant(value >= min && value <= max, msg, JSONValue(std::move(ctx)));
}

void AssertHasProperty(const JSONValue& obj, const std::string& key, const std::optional<std::string>& message) {
    std::vector<std::string> keys;
    if (obj.isObject()) {
        for (const auto& kv : std::get<JSONValue::Object>(obj.value)) {
            keys.push_back(kv.first);
        }
        std::sort(keys.begin(), keys.end());
    }
    JSONValue::Object ctx;
    SetMember(ctx, "key", JSONValue(key));
    SetMember(ctx, "objectKeys", stringArray(keys));
    Invariant(FindMember(obj, key) != nullptr,
              message.value_or("Object must have property \"" + key + "\""), JSONValue(std::move(ctx)));
}

void AssertValidConnectionState(const std::string& state, const std::vector<std::string>& validStates) {
    JSONValue::Object ctx;
    SetMember(ctx, "state", JSONValue(state));
    SetMember(ctx, "validStates", stringArray(validStates));
    bool ok = std::find(validStates.begin(), validStates.end(), state) != validStates.end();
    Invariant(ok, "Invalid connection state: \"" + state + "\"", JSONValue(std::move(ctx)));
}

bool IsValidServerName(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '_';
    });
}

void AssertValidServerName(const std::string& name) {
    bool charsOk = !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '-' || c == '_';
    });
    {
        JSONValue::Object ctx;
        SetMember(ctx, "name", JSONValue(name));
        SetMember(ctx, "pattern", JSONValue("^[a-z0-9-_]+$"));
        Invariant(charsOk, "Invalid server name format: \"" + name + "\"", JSONValue(std::move(ctx)));
    }
    JSONValue::Object ctx;
    SetMember(ctx, "name", JSONValue(name));
    SetMember(ctx, "length", JSONValue(static_cast<int64_t>(name.size())));
    Invariant(name.size() <= 64, "Server name length must be between 1 and 64 characters", JSONValue(std::move(ctx)));
}

void AssertMigrationSuccess(const MigrationResult& result, const std::optional<std::string>& context) {
    std::string msg = context.has_value() ? "Migration must succeed: " + *context : "Migration must succeed";
    JSONValue::Object ctx;
    SetMember(ctx, "error", result.error.has_value() ? JSONValue(*result.error) : JSONValue(nullptr));
    Invariant(result.success, msg, JSONValue(std::move(ctx)));
}

void AssertNoDuplicates(const std::vector<std::string>& names, const std::string& message) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& n : names) {
        if (!seen.insert(n).second) {
            duplicates.push_back(n);
        }
    }
    JSONValue::Object ctx;
    SetMember(ctx, "totalServers", JSONValue(static_cast<int64_t>(names.size())));
    SetMember(ctx, "uniqueServers", JSONValue(static_cast<int64_t>(seen.size())));
    SetMember(ctx, "duplicates", stringArray(duplicates));
    Invariant(duplicates.empty(), message, JSONValue(std::move(ctx)));
}

void AssertMutexLocked(bool isLocked, const std::string& key, const std::string& message) {
    JSONValue::Object ctx;
    SetMember(ctx, "key", JSONValue(key));
    Invariant(isLocked, message, JSONValue(std::move(ctx)));
}

void AssertMutexUnlocked(bool isLocked, const std::string& key, const std::string& message) {
    JSONValue::Object ctx;
    SetMember(ctx, "key", JSONValue(key));
    Invariant(!isLocked, message, JSONValue(std::move(ctx)));
}

void AssertNotDisposed(bool disposed, const std::string& resourceName, const std::optional<std::string>& message) {
    JSONValue::Object ctx;
    SetMember(ctx, "resourceName", JSONValue(resourceName));
    SetMember(ctx, "disposed", JSONValue(disposed));
    Invariant(!disposed, message.value_or("Resource \"" + resourceName + "\" must not be disposed"),
              JSONValue(std::move(ctx)));
}

void AssertExactlyOne(const std::vector<bool>& conditions, const std::vector<std::string>& labels,
                      const std::string& message) {
    int64_t trueCount = countTrue(conditions);
    JSONValue::Object ctx;
    SetMember(ctx, "trueCount", JSONValue(trueCount));
    SetMember(ctx, "conditions", labelledConditions(conditions, labels));
    Invariant(trueCount == 1, message, JSONValue(std::move(ctx)));
}

void AssertAtLeastOne(const std::vector<bool>& conditions, const std::vector<std::string>& labels,
                      const std::string& message) {
    int64_t trueCount = countTrue(conditions);
    JSONValue::Object ctx;
    SetMember(ctx, "trueCount", JSONValue(trueCount));
    SetMember(ctx, "conditions", labelledConditions(conditions, labels));
    Invariant(trueCount >= 1, message, JSONValue(std::move(ctx)));
}

void AssertConfigFormat(const JSONValue& config, ConfigFormat expected, const std::string& serverName) {
    bool hasCommand = hasNonNullMember(config, "command");
    bool hasTransport = hasNonNullMember(config, "transport");
    bool hasTransportType = false;
    if (const JSONValue* t = FindMember(config, "transport")) {
        hasTransportType = hasNonNullMember(*t, "type");
    }
    bool isLegacy = hasCommand && !hasTransport;
    bool isModern = hasTransportType && !hasCommand;

    JSONValue::Object ctx;
    SetMember(ctx, "config", DeepCopyJSON(config));
    SetMember(ctx, "serverName", JSONValue(serverName));
    if (expected == ConfigFormat::Legacy) {
        Invariant(isLegacy, "Config for \"" + serverName + "\" must be in legacy format", JSONValue(std::move(ctx)));
    } else {
        Invariant(isModern, "Config for \"" + serverName + "\" must be in modern format", JSONValue(std::move(ctx)));
    }
}

void AssertConfigHasFields(const JSONValue& config, const std::vector<std::string>& requiredFields,
                           const std::string& serverName) {
    for (const auto& field : requiredFields) {
        if (hasNonNullMember(config, field)) {
            continue;
        }
        JSONValue::Object ctx;
        SetMember(ctx, "config", DeepCopyJSON(config));
        SetMember(ctx, "serverName", JSONValue(serverName));
        SetMember(ctx, "missingField", JSONValue(field));
        SetMember(ctx, "requiredFields", stringArray(requiredFields));
        Invariant(false, "Config for \"" + serverName + "\" missing required field: " + field,
                  JSONValue(std::move(ctx)));
    }
}

} // namespace invariants
} // namespace mcplink
