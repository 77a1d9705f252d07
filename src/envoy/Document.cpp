// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Document.h>

namespace Envoy::Document {

namespace {

JsonDocument const& getFilter()
{
    static JsonDocument const filter = [] {
        JsonDocument f;

        // the filter for the first array element applies to all elements
        auto production = f["production"][0].to<JsonObject>();
        production["type"] = true;
        production["wNow"] = true;
        production["whToday"] = true;
        production["whLastSevenDays"] = true;
        production["whLifetime"] = true;

        auto consumption = f["consumption"][0].to<JsonObject>();
        consumption["measurementType"] = true;
        consumption["wNow"] = true;
        consumption["whToday"] = true;

        return f;
    }();

    return filter;
}

} // namespace

parse_result_t parse(std::string const& body)
{
    JsonDocument doc;

    DeserializationError const error = deserializeJson(doc, body,
            DeserializationOption::Filter(getFilter()));
    if (error) {
        return DecodeError{ std::string("Unable to parse response as JSON: ") + error.c_str(), body };
    }

    if (!doc.is<JsonObject>()) {
        return DecodeError{ "Response is not a JSON object", body };
    }

    return doc;
}

} // namespace Envoy::Document
