// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Provider.h>
#include <MessageOutput.h>

namespace Envoy {

Provider::Provider(EnvoyConfig const& cfg)
    : _verboseLogging(cfg.VerboseLogging)
    , _fetcher(cfg.Timeout)
    , _sink(cfg.PublishLongTermEnergy, cfg.PublishConsumptionReport)
    , _pipeline(_fetcher, _sink)
    , _timer(cfg.PollingInterval * 1000)
    , _prefs{ cfg.Address, cfg.TokenPart1, cfg.TokenPart2 }
{
}

Provider::~Provider()
{
    _taskDone = false;

    std::unique_lock<std::mutex> lock(_pollingMutex);
    _stopPolling = true;
    lock.unlock();

    _cv.notify_all();

    if (_taskHandle != nullptr) {
        while (!_taskDone) { delay(10); }
        _taskHandle = nullptr;
    }
}

bool Provider::init()
{
    if (_timer.getInterval() == 0) {
        MessageOutput.printf("[Envoy::Provider] Invalid polling interval\r\n");
        return false;
    }

    if (_verboseLogging) {
        MessageOutput.printf("[Envoy::Provider] Polling %s every %" PRIu32 " s\r\n",
                _prefs.Address.c_str(), _timer.getInterval() / 1000);
    }

    return true;
}

void Provider::loop()
{
    if (_taskHandle != nullptr) { return; }

    std::unique_lock<std::mutex> lock(_pollingMutex);
    _stopPolling = false;
    lock.unlock();

    // TLS needs a lot of stack
    uint32_t constexpr stackSize = 8192;
    xTaskCreate(Provider::pollingLoopHelper, "Envoy:HTTPS",
            stackSize, this, 1/*prio*/, &_taskHandle);
}

void Provider::pollingLoopHelper(void* context)
{
    auto pInstance = static_cast<Provider*>(context);
    pInstance->pollingLoop();
    pInstance->_taskDone = true;
    vTaskDelete(nullptr);
}

void Provider::pollingLoop()
{
    std::unique_lock<std::mutex> lock(_pollingMutex);

    while (!_stopPolling) {
        auto sleepMs = _timer.millisUntilDue(millis());
        if (sleepMs > 0) {
            _cv.wait_for(lock, std::chrono::milliseconds(sleepMs),
                    [this] { return _stopPolling || _timer.isDue(millis()); }); // releases the mutex
            continue;
        }

        _timer.markPolled(millis());

        lock.unlock(); // polling can take quite some time
        runCycle("scheduled");
        lock.lock();
    }
}

void Provider::updatePreferences(Preferences const& prefs)
{
    std::lock_guard<std::mutex> lock(_pollingMutex);
    _prefs = prefs;
}

void Provider::trigger()
{
    std::unique_lock<std::mutex> lock(_pollingMutex);
    _timer.trigger();
    lock.unlock();

    _cv.notify_all();
}

CycleReport Provider::refresh()
{
    return runCycle("manual");
}

CycleReport Provider::runCycle(char const* reason)
{
    std::unique_lock<std::mutex> lock(_pollingMutex);
    auto prefs = _prefs;
    lock.unlock();

    auto report = _pipeline.run(prefs);

    if (report.Data) {
        std::lock_guard<std::mutex> readingLock(_readingMutex);
        _lastReading = report.Data;
        _lastUpdate = millis();
    }

    logCycleReport(report, reason);

    return report;
}

void Provider::logCycleReport(CycleReport const& report, char const* reason) const
{
    using Outcome = CycleReport::Outcome;

    switch (report.Result) {
        case Outcome::ConfigurationIncomplete:
            MessageOutput.printf("[Envoy::Provider] WARNING: skipping %s poll, %s\r\n",
                    reason, report.Detail.c_str());
            return;

        case Outcome::FetchFailed:
            MessageOutput.printf("[Envoy::Provider] ERROR: %s poll failed (FetchFailed, status %d): %s\r\n",
                    reason, report.HttpStatus, report.Detail.c_str());
            if (report.HttpStatus == 401) {
                MessageOutput.printf("[Envoy::Provider] The access token was rejected, it might have expired\r\n");
            }
            return;

        case Outcome::DecodeFailed:
            MessageOutput.printf("[Envoy::Provider] ERROR: %s poll failed (DecodeFailed): %s\r\n",
                    reason, report.Detail.c_str());
            return;

        case Outcome::SinkUnavailable:
            MessageOutput.printf("[Envoy::Provider] WARNING: %s poll succeeded, but MQTT "
                    "is not connected, reading not published\r\n", reason);
            break;

        case Outcome::Published:
            break;
    }

    auto const& r = *report.Data;
    MessageOutput.printf("[Envoy::Provider] Solar: %.0f W | Home: %.0f W | %s Grid: %.0f W\r\n",
            r.Production.PowerW, r.Consumption.PowerW,
            r.Grid.Exporting ? "Exporting to" : "Importing from", r.Grid.MagnitudeW);
    MessageOutput.printf("[Envoy::Provider] Today: Solar %.2f kWh | Home %.2f kWh | "
            "7-day: %.1f kWh | Lifetime: %.1f kWh\r\n",
            r.Production.EnergyTodayWh / 1000, r.Consumption.EnergyTodayWh / 1000,
            r.Production.EnergyLastSevenDaysWh / 1000, r.Production.EnergyLifetimeWh / 1000);

    for (auto const& event : report.Rejected) {
        MessageOutput.printf("[Envoy::Provider] WARNING: %s %s was not accepted by the sink\r\n",
                componentName(event.Target), attributeName(event.Kind));
    }

    if (!_verboseLogging) { return; }

    for (auto const& field : report.MissingFields) {
        MessageOutput.printf("[Envoy::Provider] %s not in response, using zero\r\n", field.c_str());
    }
}

std::optional<Reading> Provider::getLastReading() const
{
    std::lock_guard<std::mutex> lock(_readingMutex);
    return _lastReading;
}

uint32_t Provider::getLastUpdate() const
{
    std::lock_guard<std::mutex> lock(_readingMutex);
    return _lastUpdate;
}

} // namespace Envoy
