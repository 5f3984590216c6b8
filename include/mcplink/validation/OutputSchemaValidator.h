//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OutputSchemaValidator.h
// Purpose: Validation of tool call output against a tool's declared outputSchema (JSON Schema subset)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace validation {

enum class SchemaValidationStatus {
    Valid,
    Invalid,
    NoSchema
};

// "valid" / "invalid" / "no-schema"
inline const char* toString(SchemaValidationStatus status) {
    switch (status) {
        case SchemaValidationStatus::Valid: return "valid";
        case SchemaValidationStatus::Invalid: return "invalid";
        case SchemaValidationStatus::NoSchema:
        default: return "no-schema";
    }
}

//==========================================================================================================
// SchemaValidationResult
// Fields:
//   errors: "<path> <message>" strings, path "/" for the root value. Empty unless Invalid.
//   schema: Deep copy of the schema used (absent for NoSchema).
//==========================================================================================================
struct SchemaValidationResult {
    SchemaValidationStatus status{SchemaValidationStatus::NoSchema};
    std::vector<std::string> errors;
    std::optional<JSONValue> schema;
};

//==========================================================================================================
// OutputSchemaValidator
// Purpose: Checks values against a JSON Schema subset. Supported keywords: type, properties, required,
//          additionalProperties, items, enum, const, minimum, maximum, minLength, maxLength, minItems,
//          maxItems. Other keywords (title, description, $schema, ...) are ignored.
// Notes:
//   A schema that cannot be compiled (unknown type name, malformed keyword) yields Invalid with a
//   "Schema compilation failed: ..." error. Never throws.
//==========================================================================================================
class OutputSchemaValidator {
public:
    //==========================================================================================================
    // Validate
    // Args:
    //   schema: Declared outputSchema; std::nullopt or JSON null means no schema.
    //   output: Value to check.
    // Returns:
    //   NoSchema, Valid (an empty schema {} accepts anything), or Invalid with errors.
    //==========================================================================================================
    SchemaValidationResult Validate(const std::optional<JSONValue>& schema, const JSONValue& output) const;

    //==========================================================================================================
    // ValidateContent
    // Purpose: Validates a tools/call content array. The text of every {type:"text"} item is concatenated
    //          in order; empty text is Valid. The text is parsed as JSON when possible, otherwise it is
    //          validated as a plain string.
    //==========================================================================================================
    SchemaValidationResult ValidateContent(const std::optional<JSONValue>& schema,
                                           const std::vector<JSONValue>& content) const;
};

} // namespace validation
} // namespace mcplink
