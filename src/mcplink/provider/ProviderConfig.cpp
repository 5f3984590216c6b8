//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderConfig.cpp
// Purpose: Tool provider configuration: JSON parsing, legacy normalization and validation
//==========================================================================================================

#include <algorithm>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/invariants/Invariants.h"
#include "mcplink/provider/ProviderConfig.h"

namespace mcplink {
namespace provider {

namespace {

// Invariant messages carry a JSON context block; configuration errors only need the first line.
std::string withoutContext(const std::string& what) {
    const auto pos = what.find("\nContext:");
    return pos == std::string::npos ? what : what.substr(0, pos);
}

std::string fieldError(const std::string& server, const std::string& field, const std::string& expected) {
    return "Config for \"" + server + "\": " + field + " must be " + expected;
}

std::vector<std::string> readStringArray(const JSONValue& v, const std::string& server, const std::string& field) {
    if (!v.isArray()) {
        throw ProviderConfigError(fieldError(server, field, "an array of strings"));
    }
    std::vector<std::string> out;
    for (const auto& item : std::get<JSONValue::Array>(v.value)) {
        if (!item || !item->isString()) {
            throw ProviderConfigError(fieldError(server, field, "an array of strings"));
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

std::map<std::string, std::string> readStringMap(const JSONValue& v, const std::string& server,
                                                 const std::string& field) {
    if (!v.isObject()) {
        throw ProviderConfigError(fieldError(server, field, "an object of strings"));
    }
    std::map<std::string, std::string> out;
    for (const auto& [k, item] : std::get<JSONValue::Object>(v.value)) {
        if (!item || !item->isString()) {
            throw ProviderConfigError(fieldError(server, field + "." + k, "a string"));
        }
        out[k] = std::get<std::string>(item->value);
    }
    return out;
}

std::optional<uint64_t> readMillis(const JSONValue& obj, const std::string& key, const std::string& alias,
                                   const std::string& server) {
    const JSONValue* v = FindMember(obj, key);
    std::string used = key;
    if (v == nullptr) {
        v = FindMember(obj, alias);
        used = alias;
    }
    if (v == nullptr || v->isNull()) {
        return std::nullopt;
    }
    if (!v->isNumber()) {
        throw ProviderConfigError(fieldError(server, used, "a number of milliseconds"));
    }
    const double ms = std::holds_alternative<int64_t>(v->value) ? static_cast<double>(std::get<int64_t>(v->value))
                                                                 : std::get<double>(v->value);
    invariants::AssertPositive(ms, "Config for \"" + server + "\": " + used + " must be positive");
    return static_cast<uint64_t>(ms);
}

transport::TransportConfig readTransport(const JSONValue& t, const std::string& server) {
    transport::TransportConfig out;
    auto typeName = GetStringMember(t, "type");
    if (!typeName.has_value()) {
        throw ProviderConfigError(fieldError(server, "transport.type", "a string"));
    }
    auto type = transport::transportTypeFromString(*typeName);
    if (!type.has_value()) {
        throw ProviderConfigError("Config for \"" + server + "\": unsupported transport type '" + *typeName +
                                  "' (expected stdio, http, sse or streamable_http)");
    }
    out.type = *type;

    if (out.type == transport::TransportType::Stdio) {
        invariants::AssertConfigHasFields(t, {"command"}, server);
        auto command = GetStringMember(t, "command");
        if (!command.has_value()) {
            throw ProviderConfigError(fieldError(server, "transport.command", "a string"));
        }
        invariants::AssertNonEmptyString(*command, "Config for \"" + server + "\": transport.command is empty");
        out.command = *command;
        if (const JSONValue* args = FindMember(t, "args")) {
            out.args = readStringArray(*args, server, "transport.args");
        }
        if (const JSONValue* env = FindMember(t, "env")) {
            out.env = readStringMap(*env, server, "transport.env");
        }
        if (const JSONValue* framing = FindMember(t, "framing")) {
            std::optional<transport::FramingMode> mode;
            if (framing->isString()) {
                mode = transport::framingModeFromString(std::get<std::string>(framing->value));
            }
            if (!mode.has_value()) {
                throw ProviderConfigError(fieldError(server, "transport.framing", "\"ndjson\" or \"content-length\""));
            }
            out.framing = *mode;
        }
    } else {
        invariants::AssertConfigHasFields(t, {"url"}, server);
        auto url = GetStringMember(t, "url");
        if (!url.has_value()) {
            throw ProviderConfigError(fieldError(server, "transport.url", "a string"));
        }
        out.url = *url;
        if (const JSONValue* headers = FindMember(t, "headers")) {
            out.headers = readStringMap(*headers, server, "transport.headers");
        }
    }
    return out;
}

ProviderConfig parseValidated(const std::string& name, const JSONValue& json) {
    if (!json.isObject()) {
        throw ProviderConfigError("Config for \"" + name + "\" must be an object");
    }
    if (!invariants::IsValidServerName(name)) {
        throw ProviderConfigError("Invalid server name: \"" + name + "\"");
    }

    ProviderConfig cfg;
    cfg.name = name;
    const bool hasTransport = FindMember(json, "transport") != nullptr;
    if (hasTransport) {
        invariants::AssertConfigFormat(json, invariants::ConfigFormat::Modern, name);
        cfg.transport = readTransport(*FindMember(json, "transport"), name);
    } else {
        invariants::AssertConfigFormat(json, invariants::ConfigFormat::Legacy, name);
        JSONValue::Object normalized;
        SetMember(normalized, "type", JSONValue("stdio"));
        for (const char* key : {"command", "args", "env", "framing"}) {
            if (const JSONValue* v = FindMember(json, key)) {
                SetMember(normalized, key, DeepCopyJSON(*v));
            }
        }
        cfg.transport = readTransport(JSONValue(std::move(normalized)), name);
        cfg.legacy = true;
        LOG_DEBUG("Provider '{}' uses a legacy stdio config; normalized", name);
    }

    const uint64_t fallback = DefaultProviderTimeoutMs();
    cfg.timeoutMs = readMillis(json, "timeoutMs", "timeout", name).value_or(fallback);
    cfg.initTimeoutMs = readMillis(json, "initTimeoutMs", "initTimeout", name).value_or(fallback);
    if (const JSONValue* quiet = FindMember(json, "quiet")) {
        if (!std::holds_alternative<bool>(quiet->value)) {
            throw ProviderConfigError(fieldError(name, "quiet", "a boolean"));
        }
        cfg.quiet = std::get<bool>(quiet->value);
    }
    cfg.transport.quiet = cfg.quiet;
    cfg.transport.requestTimeoutMs = cfg.timeoutMs;
    return cfg;
}

JSONValue stringMapToJSON(const std::map<std::string, std::string>& m) {
    JSONValue::Object obj;
    for (const auto& [k, v] : m) {
        SetMember(obj, k, JSONValue(v));
    }
    return JSONValue(std::move(obj));
}

} // namespace

uint64_t DefaultProviderTimeoutMs() {
    const uint64_t v = GetEnvUInt64OrDefault("MCPLINK_REQUEST_TIMEOUT_MS", kDefaultProviderTimeoutMs);
    return v > 0 ? v : kDefaultProviderTimeoutMs;
}

ProviderConfig ParseProviderConfig(const std::string& name, const JSONValue& json) {
    try {
        return parseValidated(name, json);
    } catch (const invariants::InvariantViolationError& e) {
        throw ProviderConfigError(withoutContext(e.what()));
    }
}

std::vector<ProviderConfig> ParseProviderConfigs(const JSONValue& document) {
    FUNC_SCOPE();
    std::vector<ProviderConfig> out;
    if (const JSONValue* servers = FindMember(document, "mcpServers")) {
        if (!servers->isObject()) {
            throw ProviderConfigError("mcpServers must be an object keyed by server name");
        }
        const auto& obj = std::get<JSONValue::Object>(servers->value);
        std::vector<std::string> names;
        names.reserve(obj.size());
        for (const auto& kv : obj) {
            names.push_back(kv.first);
        }
        std::sort(names.begin(), names.end());
        for (const auto& name : names) {
            const auto& entry = obj.at(name);
            if (!entry) {
                throw ProviderConfigError("Config for \"" + name + "\" must be an object");
            }
            out.push_back(ParseProviderConfig(name, *entry));
        }
        return out;
    }

    if (!document.isArray()) {
        throw ProviderConfigError("Provider configuration must be {\"mcpServers\": {...}} or an array");
    }
    std::vector<std::string> names;
    for (const auto& entry : std::get<JSONValue::Array>(document.value)) {
        if (!entry) {
            throw ProviderConfigError("Provider entry must be an object");
        }
        auto name = GetStringMember(*entry, "name");
        if (!name.has_value()) {
            throw ProviderConfigError("Provider entry is missing a string \"name\"");
        }
        names.push_back(*name);
        out.push_back(ParseProviderConfig(*name, *entry));
    }
    try {
        invariants::AssertNoDuplicates(names);
    } catch (const invariants::InvariantViolationError& e) {
        throw ProviderConfigError(withoutContext(e.what()));
    }
    return out;
}

std::vector<ProviderConfig> LoadProviderConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ProviderConfigError("Cannot open provider config file: " + path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    try {
        return ParseProviderConfigs(ParseJSON(contents.str()));
    } catch (const JSONParseError& e) {
        throw ProviderConfigError("Invalid JSON in " + path + ": " + e.what());
    }
}

JSONValue ToJSON(const ProviderConfig& config) {
    JSONValue::Object t;
    SetMember(t, "type", JSONValue(transport::toString(config.transport.type)));
    if (config.transport.type == transport::TransportType::Stdio) {
        SetMember(t, "command", JSONValue(config.transport.command));
        JSONValue::Array args;
        for (const auto& a : config.transport.args) {
            args.push_back(std::make_shared<JSONValue>(a));
        }
        SetMember(t, "args", JSONValue(std::move(args)));
        SetMember(t, "env", stringMapToJSON(config.transport.env));
        SetMember(t, "framing", JSONValue(transport::toString(config.transport.framing)));
    } else {
        SetMember(t, "url", JSONValue(config.transport.url));
        SetMember(t, "headers", stringMapToJSON(config.transport.headers));
    }

    JSONValue::Object obj;
    SetMember(obj, "name", JSONValue(config.name));
    SetMember(obj, "transport", JSONValue(std::move(t)));
    SetMember(obj, "timeoutMs", JSONValue(static_cast<int64_t>(config.timeoutMs)));
    SetMember(obj, "initTimeoutMs", JSONValue(static_cast<int64_t>(config.initTimeoutMs)));
    SetMember(obj, "quiet", JSONValue(config.quiet));
    return JSONValue(std::move(obj));
}

} // namespace provider
} // namespace mcplink
