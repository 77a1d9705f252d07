// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdint.h>
#include <Arduino.h>
#include <Configuration.h>
#include <envoy/HttpFetcher.h>
#include <envoy/MqttSink.h>
#include <envoy/Pipeline.h>
#include <envoy/PollTimer.h>
#include <envoy/Preferences.h>

namespace Envoy {

// polls one gateway from a dedicated task: once when started, then
// periodically, and additionally whenever triggered.
class Provider {
public:
    explicit Provider(EnvoyConfig const& cfg);
    ~Provider();

    bool init();
    void loop();

    void updatePreferences(Preferences const& prefs);

    // runs one additional cycle on the polling task as soon as possible
    void trigger();

    // runs one cycle on the calling task. waits for a cycle in progress.
    CycleReport refresh();

    std::optional<Reading> getLastReading() const;
    uint32_t getLastUpdate() const;

private:
    static void pollingLoopHelper(void* context);
    std::atomic<bool> _taskDone;
    void pollingLoop();

    CycleReport runCycle(char const* reason);
    void logCycleReport(CycleReport const& report, char const* reason) const;

    bool const _verboseLogging;

    HttpFetcher _fetcher;
    MqttSink _sink;
    Pipeline _pipeline;

    PollTimer _timer;
    Preferences _prefs;

    std::optional<Reading> _lastReading;
    uint32_t _lastUpdate = 0;
    mutable std::mutex _readingMutex;

    TaskHandle_t _taskHandle = nullptr;
    bool _stopPolling = false;
    mutable std::mutex _pollingMutex;
    std::condition_variable _cv;
};

} // namespace Envoy
