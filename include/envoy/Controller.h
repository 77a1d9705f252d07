// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <TaskSchedulerDeclarations.h>
#include <Configuration.h>
#include <envoy/HassIntegration.h>
#include <envoy/Preferences.h>
#include <envoy/Provider.h>
#include <envoy/Settings.h>

namespace Envoy {

class Controller {
public:
    void init(Scheduler& scheduler);

    // to be called after the configuration was changed. restarts the
    // provider if required, otherwise triggers a single immediate poll if
    // the gateway address or the token changed.
    void updateSettings();

    // a manual poll is performed on the main loop as soon as possible
    void requestRefresh() { _refreshRequested = true; }

    bool isEnabled() const;
    std::optional<Reading> getLastReading() const;
    uint32_t getLastUpdate() const;

private:
    void loop();

    static ProviderSettings getProviderSettings(EnvoyConfig const& cfg);

    Task _loopTask;
    mutable std::mutex _mutex;

    // shared with a manual refresh in progress, which runs without holding
    // the mutex
    std::shared_ptr<Provider> _spProvider = nullptr;
    HassIntegration _hass;

    PreferenceWatcher _watcher;
    ProviderSettings _activeSettings;
    std::atomic<bool> _refreshRequested { false };
};

} // namespace Envoy

extern Envoy::Controller EnvoyGateway;
