// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <envoy/Fetcher.h>
#include <envoy/Preferences.h>
#include <envoy/Reading.h>
#include <envoy/Sink.h>

namespace Envoy {

static constexpr char const ProductionPath[] = "/production.json";

struct CycleReport {
    enum class Outcome : uint8_t {
        Published,
        ConfigurationIncomplete,
        FetchFailed,
        DecodeFailed,
        SinkUnavailable
    };

    Outcome Result = Outcome::ConfigurationIncomplete;

    // HTTP status or transport error code, set if a request was made
    int HttpStatus = 0;

    // reason for the failure. the raw response body if decoding failed.
    std::string Detail;

    // set if published, also if the sink was not available
    std::optional<Reading> Data;
    std::vector<std::string> MissingFields;
    std::vector<Event> Rejected;

    char const* outcomeName() const;
};

// one poll cycle: assemble the token, fetch, parse, extract, derive the
// grid flow and emit. cycles never overlap, a cycle requested while
// another one is in progress waits for it to finish.
class Pipeline {
public:
    Pipeline(Fetcher& fetcher, Sink& sink)
        : _fetcher(fetcher)
        , _sink(sink) { }

    CycleReport run(Preferences const& prefs);

private:
    Fetcher& _fetcher;
    Sink& _sink;
    std::mutex _cycleMutex;
};

} // namespace Envoy
