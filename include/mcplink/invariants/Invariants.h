//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Invariants.h
// Purpose: Runtime contract checks that raise InvariantViolationError with structured JSON context
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace invariants {

//==========================================================================================================
// InvariantViolationError
// Purpose: Signals a logic defect. what() reads "Invariant violation: <message>" optionally followed by
//          "\nContext: <json>". Never caught inside the library.
//==========================================================================================================
class InvariantViolationError : public std::logic_error {
public:
    explicit InvariantViolationError(const std::string& message) : std::logic_error(message) {}
};

//==========================================================================================================
// Invariant
// Purpose: Core check; throws InvariantViolationError when condition is false, otherwise does nothing.
// Args:
//   condition: The condition that must hold.
//   message: Description of the violated contract.
//   context: Optional JSON object rendered into the error text.
//==========================================================================================================
void Invariant(bool condition, const std::string& message,
               const std::optional<JSONValue>& context = std::nullopt);

// Migration outcome checked by AssertMigrationSuccess.
struct MigrationResult {
    bool success{false};
    std::optional<JSONValue> value;
    std::optional<std::string> error;
};

enum class ConfigFormat { Legacy, Modern };

///////////////////////////////////////// Collections and values ///////////////////////////////////////////
template <typename Container>
void AssertNonEmpty(const Container& items, const std::string& message = "Array must not be empty") {
    JSONValue::Object ctx;
    SetMember(ctx, "arrayLength", JSONValue(static_cast<int64_t>(items.size())));
    Invariant(!items.empty(), message, JSONValue(std::move(ctx)));
}

template <typename T>
void AssertDefined(const std::optional<T>& value, const std::string& message = "Value must be defined") {
    JSONValue::Object ctx;
    SetMember(ctx, "value", JSONValue(nullptr));
    Invariant(value.has_value(), message, JSONValue(std::move(ctx)));
}

template <typename T>
void AssertDefined(const T* value, const std::string& message = "Value must be defined") {
    JSONValue::Object ctx;
    SetMember(ctx, "value", JSONValue(nullptr));
    Invariant(value != nullptr, message, JSONValue(std::move(ctx)));
}

void AssertPositive(double value, const std::string& message = "Number must be positive");
void AssertNonNegative(double value, const std::string& message = "Number must be non-negative");

// Whitespace-only strings count as empty.
void AssertNonEmptyString(const std::string& value, const std::string& message = "String must not be empty");

// Inclusive range. Default message: "Value must be between <min> and <max>".
void AssertInRange(double value, double min, double max,
                   const std::optional<std::string>& message = std::nullopt);

template <typename Map>
void AssertHasKey(const Map& map, const std::string& key,
                  const std::optional<std::string>& message = std::nullopt) {
    JSONValue::Object ctx;
    SetMember(ctx, "key", JSONValue(key));
    SetMember(ctx, "mapSize", JSONValue(static_cast<int64_t>(map.size())));
    Invariant(map.find(key) != map.end(), message.value_or("Map must contain key"), JSONValue(std::move(ctx)));
}

// obj must be a JSON object carrying key.
void AssertHasProperty(const JSONValue& obj, const std::string& key,
                       const std::optional<std::string>& message = std::nullopt);

///////////////////////////////////////// Domain checks ///////////////////////////////////////////
void AssertValidConnectionState(const std::string& state, const std::vector<std::string>& validStates);

// Non-throwing form of AssertValidServerName.
bool IsValidServerName(const std::string& name);

//==========================================================================================================
// AssertValidServerName
// Purpose: Provider names must match ^[a-z0-9_-]+$ (case-insensitive) and be 1 to 64 characters long.
//==========================================================================================================
void AssertValidServerName(const std::string& name);

void AssertMigrationSuccess(const MigrationResult& result, const std::optional<std::string>& context = std::nullopt);

// Context lists each repeated name once per extra occurrence.
void AssertNoDuplicates(const std::vector<std::string>& names,
                        const std::string& message = "Server names must be unique");

void AssertMutexLocked(bool isLocked, const std::string& key,
                       const std::string& message = "Mutex must be locked before operation");
void AssertMutexUnlocked(bool isLocked, const std::string& key,
                         const std::string& message = "Mutex must be unlocked before operation");

void AssertNotDisposed(bool disposed, const std::string& resourceName,
                       const std::optional<std::string>& message = std::nullopt);

void AssertExactlyOne(const std::vector<bool>& conditions, const std::vector<std::string>& labels,
                      const std::string& message = "Exactly one condition must be true");
void AssertAtLeastOne(const std::vector<bool>& conditions, const std::vector<std::string>& labels,
                      const std::string& message = "At least one condition must be true");

//==========================================================================================================
// AssertConfigFormat
// Purpose: Legacy configs carry a top-level "command" and no "transport"; modern configs carry
//          "transport.type". A config that is both or neither fails either expectation.
//==========================================================================================================
void AssertConfigFormat(const JSONValue& config, ConfigFormat expected, const std::string& serverName);

// Every field must be present and non-null.
void AssertConfigHasFields(const JSONValue& config, const std::vector<std::string>& requiredFields,
                           const std::string& serverName);

} // namespace invariants
} // namespace mcplink
