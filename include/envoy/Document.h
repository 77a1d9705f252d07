// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <string>
#include <variant>
#include <ArduinoJson.h>

namespace Envoy::Document {

struct DecodeError {
    std::string Message;
    std::string Body; // kept for diagnostics only
};

using parse_result_t = std::variant<JsonDocument, DecodeError>;

// decodes the body of a /production.json response. only the members read
// by the extractor are retained. fails if the body is not well-formed JSON
// or if the top-level value is not an object.
parse_result_t parse(std::string const& body);

} // namespace Envoy::Document
