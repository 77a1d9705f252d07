// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Pipeline.h>
#include <envoy/Credential.h>
#include <envoy/Document.h>
#include <envoy/Emitter.h>
#include <envoy/Extractor.h>

namespace Envoy {

char const* CycleReport::outcomeName() const
{
    switch (Result) {
        case Outcome::Published:
            return "Published";
        case Outcome::ConfigurationIncomplete:
            return "ConfigurationIncomplete";
        case Outcome::FetchFailed:
            return "FetchFailed";
        case Outcome::DecodeFailed:
            return "DecodeFailed";
        case Outcome::SinkUnavailable:
            return "SinkUnavailable";
    }
    return "Unknown";
}

CycleReport Pipeline::run(Preferences const& prefs)
{
    std::lock_guard<std::mutex> lock(_cycleMutex);

    CycleReport report;

    auto token = Credential::assemble(prefs.TokenPart1, prefs.TokenPart2);

    if (prefs.Address.empty() || token.empty()) {
        report.Result = CycleReport::Outcome::ConfigurationIncomplete;
        report.Detail = prefs.Address.empty() ? "gateway address not set" : "access token not set";
        return report;
    }

    auto fetched = _fetcher.get("https://" + prefs.Address + ProductionPath, token);
    report.HttpStatus = fetched.Status;

    if (!fetched.ok()) {
        report.Result = CycleReport::Outcome::FetchFailed;
        report.Detail = fetched.ErrorText;
        return report;
    }

    auto parsed = Document::parse(fetched.Body);
    if (auto pError = std::get_if<Document::DecodeError>(&parsed)) {
        report.Result = CycleReport::Outcome::DecodeFailed;
        report.Detail = pError->Message + ", body: " + pError->Body;
        return report;
    }

    auto extracted = Extractor::extract(std::get<JsonDocument>(parsed));

    Reading reading;
    reading.Production = extracted.Production;
    reading.Consumption = extracted.Consumption;
    reading.Grid = GridFlow::fromNetPower(extracted.NetPowerW);

    report.MissingFields = std::move(extracted.MissingFields);
    report.Data = reading;

    if (!_sink.isAvailable()) {
        report.Result = CycleReport::Outcome::SinkUnavailable;
        return report;
    }

    report.Result = CycleReport::Outcome::Published;
    report.Rejected = Emitter::emit(reading, _sink);

    return report;
}

} // namespace Envoy
