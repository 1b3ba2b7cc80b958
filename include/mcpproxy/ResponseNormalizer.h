//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseNormalizer.h
// Purpose: Turns raw backend reply text (plain JSON or SSE framing) into a JSON value
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpproxy/JSONRPCTypes.h"

namespace mcpproxy {

//==========================================================================================================
// IsSseBody
// Purpose: True when the text starts with "event:" or contains "data:" anywhere.
//==========================================================================================================
bool IsSseBody(const std::string& body);

//==========================================================================================================
// ExtractSseData
// Purpose: Payload of the first line that begins with "data: " (prefix stripped, trailing CR removed).
// Returns:
//   std::nullopt when no such line exists or its payload is empty.
//==========================================================================================================
std::optional<std::string> ExtractSseData(const std::string& body);

//==========================================================================================================
// RepairDoubleEscapes
// Purpose: Applies, in order, the literal substitutions \u0027 -> ', \u0060 -> `, \u0022 -> ",
//          \u003C -> <, \u003E -> >, and the two-character sequence \n -> newline.
//==========================================================================================================
std::string RepairDoubleEscapes(std::string text);

//==========================================================================================================
// RepairContentText
// Purpose: Runs RepairDoubleEscapes on every string "text" member of the elements of result.content.
//          No other field is touched.
//==========================================================================================================
void RepairContentText(JSONValue& reply);

//==========================================================================================================
// NormalizeHttpBody
// Purpose: Parses an HTTP backend body into JSON, SSE or plain, then repairs result.content[*].text.
// Args:
//   status: HTTP status code, used only in error descriptions.
//   body: Full response body.
// Throws:
//   errors::BackendError with kind EmptyBody, NoSseData or JsonParseError.
//==========================================================================================================
JSONValue NormalizeHttpBody(int status, const std::string& body);

//==========================================================================================================
// ParseBackendLine
// Purpose: Parses one newline-delimited reply from the process or socket backend.
// Throws:
//   errors::BackendError with kind EmptyBody or JsonParseError.
//==========================================================================================================
JSONValue ParseBackendLine(const std::string& line);

} // namespace mcpproxy
