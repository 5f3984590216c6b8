//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutputSchemaValidator.cpp
// Purpose: Validation of tool call output against a tool's declared outputSchema (JSON Schema subset)
//==========================================================================================================

#include "mcplink/validation/OutputSchemaValidator.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace mcplink {
namespace validation {

namespace {

const std::set<std::string>& knownTypes() {
    static const std::set<std::string> types{"object", "array", "string", "number", "integer", "boolean", "null"};
    return types;
}

std::string escapePointerToken(const std::string& token) {
    std::string out;
    for (char c : token) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out += c;
    }
    return out;
}

std::string displayPath(const std::string& pointer) {
    return pointer.empty() ? std::string("/") : pointer;
}

bool isNonNegativeInteger(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) {
        return std::get<int64_t>(v.value) >= 0;
    }
    if (std::holds_alternative<double>(v.value)) {
        double d = std::get<double>(v.value);
        return d >= 0 && std::floor(d) == d;
    }
    return false;
}

double asDouble(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) {
        return static_cast<double>(std::get<int64_t>(v.value));
    }
    return std::get<double>(v.value);
}

// Negative and NaN bounds count as 0; bounds beyond uint64_t saturate.
uint64_t asCount(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) {
        const int64_t i = std::get<int64_t>(v.value);
        return i < 0 ? 0 : static_cast<uint64_t>(i);
    }
    const double d = asDouble(v);
    if (!(d > 0.0)) {
        return 0;
    }
    if (d >= 18446744073709551616.0) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(d);
}

// Code points, not bytes.
std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool matchesType(const std::string& type, const JSONValue& v) {
    if (type == "object") return v.isObject();
    if (type == "array") return v.isArray();
    if (type == "string") return v.isString();
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "null") return v.isNull();
    if (type == "number") return v.isNumber();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (std::holds_alternative<double>(v.value)) {
            double d = std::get<double>(v.value);
            return std::isfinite(d) && std::floor(d) == d;
        }
    }
    return false;
}

std::vector<std::string> typeNames(const JSONValue& typeNode) {
    std::vector<std::string> out;
    if (typeNode.isString()) {
        out.push_back(std::get<std::string>(typeNode.value));
    } else if (typeNode.isArray()) {
        for (const auto& p : std::get<JSONValue::Array>(typeNode.value)) {
            if (p && p->isString()) out.push_back(std::get<std::string>(p->value));
        }
    }
    return out;
}

////////////////////////////////////////// Schema compilation //////////////////////////////////////////
// Structural check of the schema itself; appends one message per malformed keyword.
void checkSchema(const JSONValue& schema, const std::string& at, std::vector<std::string>& problems) {
    if (std::holds_alternative<bool>(schema.value)) {
        return;
    }
    if (!schema.isObject()) {
        problems.push_back(displayPath(at) + " schema must be an object or boolean");
        return;
    }
    auto nonNegative = [&](const char* keyword) {
        if (const JSONValue* n = FindMember(schema, keyword)) {
            if (!isNonNegativeInteger(*n)) {
                problems.push_back(displayPath(at) + " " + keyword + " must be a non-negative integer");
            }
        }
    };
    auto numeric = [&](const char* keyword) {
        if (const JSONValue* n = FindMember(schema, keyword)) {
            if (!n->isNumber()) {
                problems.push_back(displayPath(at) + " " + keyword + " must be a number");
            }
        }
    };

    if (const JSONValue* t = FindMember(schema, "type")) {
        bool shapeOk = t->isString() || t->isArray();
        if (t->isArray()) {
            for (const auto& p : std::get<JSONValue::Array>(t->value)) {
                if (!p || !p->isString()) shapeOk = false;
            }
        }
        if (!shapeOk) {
            problems.push_back(displayPath(at) + " type must be a string or an array of strings");
        } else {
            for (const auto& name : typeNames(*t)) {
                if (knownTypes().count(name) == 0) {
                    problems.push_back(displayPath(at) + " unknown type \"" + name + "\"");
                }
            }
        }
    }
    if (const JSONValue* props = FindMember(schema, "properties")) {
        if (!props->isObject()) {
            problems.push_back(displayPath(at) + " properties must be an object");
        } else {
            for (const auto& [name, sub] : std::get<JSONValue::Object>(props->value)) {
                if (sub) checkSchema(*sub, at + "/properties/" + escapePointerToken(name), problems);
            }
        }
    }
    if (const JSONValue* req = FindMember(schema, "required")) {
        bool ok = req->isArray();
        if (ok) {
            for (const auto& p : std::get<JSONValue::Array>(req->value)) {
                if (!p || !p->isString()) ok = false;
            }
        }
        if (!ok) problems.push_back(displayPath(at) + " required must be an array of strings");
    }
    if (const JSONValue* ap = FindMember(schema, "additionalProperties")) {
        checkSchema(*ap, at + "/additionalProperties", problems);
    }
    if (const JSONValue* items = FindMember(schema, "items")) {
        checkSchema(*items, at + "/items", problems);
    }
    if (const JSONValue* en = FindMember(schema, "enum")) {
        if (!en->isArray()) problems.push_back(displayPath(at) + " enum must be an array");
    }
    numeric("minimum");
    numeric("maximum");
    nonNegative("minLength");
    nonNegative("maxLength");
    nonNegative("minItems");
    nonNegative("maxItems");
}

////////////////////////////////////////// Evaluation //////////////////////////////////////////
void evaluate(const JSONValue& schema, const JSONValue& value, const std::string& at,
              std::vector<std::string>& errors) {
    if (std::holds_alternative<bool>(schema.value)) {
        if (!std::get<bool>(schema.value)) {
            errors.push_back(displayPath(at) + " boolean schema is false");
        }
        return;
    }

    if (const JSONValue* t = FindMember(schema, "type")) {
        auto names = typeNames(*t);
        bool any = std::any_of(names.begin(), names.end(),
                               [&](const std::string& n) { return matchesType(n, value); });
        if (!any) {
            std::string joined;
            for (std::size_t i = 0; i < names.size(); ++i) {
                if (i) joined += ",";
                joined += names[i];
            }
            errors.push_back(displayPath(at) + " must be " + joined);
            return;
        }
    }

    if (const JSONValue* en = FindMember(schema, "enum")) {
        const auto& options = std::get<JSONValue::Array>(en->value);
        bool found = std::any_of(options.begin(), options.end(),
                                 [&](const std::shared_ptr<JSONValue>& p) { return p && JSONEquals(*p, value); });
        if (!found) errors.push_back(displayPath(at) + " must be equal to one of the allowed values");
    }
    if (const JSONValue* c = FindMember(schema, "const")) {
        if (!JSONEquals(*c, value)) errors.push_back(displayPath(at) + " must be equal to constant");
    }

    if (value.isNumber()) {
        double d = asDouble(value);
        if (const JSONValue* mn = FindMember(schema, "minimum")) {
            if (d < asDouble(*mn)) errors.push_back(displayPath(at) + " must be >= " + serializeJSONValue(*mn));
        }
        if (const JSONValue* mx = FindMember(schema, "maximum")) {
            if (d > asDouble(*mx)) errors.push_back(displayPath(at) + " must be <= " + serializeJSONValue(*mx));
        }
    }

    if (value.isString()) {
        std::size_t len = utf8Length(std::get<std::string>(value.value));
        if (const JSONValue* mn = FindMember(schema, "minLength")) {
            if (len < asCount(*mn)) {
                errors.push_back(displayPath(at) + " must NOT have fewer than " + std::to_string(asCount(*mn)) + " characters");
            }
        }
        if (const JSONValue* mx = FindMember(schema, "maxLength")) {
            if (len > asCount(*mx)) {
                errors.push_back(displayPath(at) + " must NOT have more than " + std::to_string(asCount(*mx)) + " characters");
            }
        }
    }

    if (value.isObject()) {
        const auto& obj = std::get<JSONValue::Object>(value.value);
        if (const JSONValue* req = FindMember(schema, "required")) {
            for (const auto& p : std::get<JSONValue::Array>(req->value)) {
                const std::string& name = std::get<std::string>(p->value);
                if (obj.find(name) == obj.end()) {
                    errors.push_back(displayPath(at) + " must have required property '" + name + "'");
                }
            }
        }
        const JSONValue* props = FindMember(schema, "properties");
        const JSONValue* additional = FindMember(schema, "additionalProperties");
        // Sorted for stable error order.
        std::vector<std::string> keys;
        keys.reserve(obj.size());
        for (const auto& kv : obj) keys.push_back(kv.first);
        std::sort(keys.begin(), keys.end());
        for (const auto& key : keys) {
            const auto& child = obj.at(key);
            if (!child) continue;
            std::string childPath = at + "/" + escapePointerToken(key);
            const JSONValue* propSchema = props ? FindMember(*props, key) : nullptr;
            if (propSchema) {
                evaluate(*propSchema, *child, childPath, errors);
            } else if (additional) {
                if (std::holds_alternative<bool>(additional->value)) {
                    if (!std::get<bool>(additional->value)) {
                        errors.push_back(displayPath(at) + " must NOT have additional property '" + key + "'");
                    }
                } else {
                    evaluate(*additional, *child, childPath, errors);
                }
            }
        }
    }

    if (value.isArray()) {
        const auto& arr = std::get<JSONValue::Array>(value.value);
        if (const JSONValue* mn = FindMember(schema, "minItems")) {
            if (arr.size() < asCount(*mn)) {
                errors.push_back(displayPath(at) + " must NOT have fewer than " + std::to_string(asCount(*mn)) + " items");
            }
        }
        if (const JSONValue* mx = FindMember(schema, "maxItems")) {
            if (arr.size() > asCount(*mx)) {
                errors.push_back(displayPath(at) + " must NOT have more than " + std::to_string(asCount(*mx)) + " items");
            }
        }
        if (const JSONValue* items = FindMember(schema, "items")) {
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (arr[i]) evaluate(*items, *arr[i], at + "/" + std::to_string(i), errors);
            }
        }
    }
}

} // namespace

SchemaValidationResult OutputSchemaValidator::Validate(const std::optional<JSONValue>& schema,
                                                       const JSONValue& output) const {
    FUNC_SCOPE();
    SchemaValidationResult result;
    if (!schema.has_value() || schema->isNull()) {
        result.status = SchemaValidationStatus::NoSchema;
        return result;
    }
    result.schema = DeepCopyJSON(*schema);

    if (schema->isObject() && std::get<JSONValue::Object>(schema->value).empty()) {
        result.status = SchemaValidationStatus::Valid;
        return result;
    }

    std::vector<std::string> problems;
    checkSchema(*schema, std::string(), problems);
    if (!problems.empty()) {
        LOG_WARN("OutputSchemaValidator: schema compilation failed ({} problem(s))", problems.size());
        result.status = SchemaValidationStatus::Invalid;
        for (const auto& p : problems) {
            result.errors.push_back("Schema compilation failed: " + p);
        }
        return result;
    }

    evaluate(*schema, output, std::string(), result.errors);
    result.status = result.errors.empty() ? SchemaValidationStatus::Valid : SchemaValidationStatus::Invalid;
    return result;
}

SchemaValidationResult OutputSchemaValidator::ValidateContent(const std::optional<JSONValue>& schema,
                                                              const std::vector<JSONValue>& content) const {
    if (!schema.has_value() || schema->isNull()) {
        SchemaValidationResult none;
        none.status = SchemaValidationStatus::NoSchema;
        return none;
    }

    std::string text;
    for (const auto& item : content) {
        auto type = GetStringMember(item, "type");
        auto chunk = GetStringMember(item, "text");
        if (type.has_value() && *type == "text" && chunk.has_value()) {
            text += *chunk;
        }
    }
    if (text.empty()) {
        SchemaValidationResult ok;
        ok.status = SchemaValidationStatus::Valid;
        ok.schema = DeepCopyJSON(*schema);
        return ok;
    }

    if (auto parsed = TryParseJSON(text)) {
        return Validate(schema, *parsed);
    }
    return Validate(schema, JSONValue(text));
}

} // namespace validation
} // namespace mcplink
