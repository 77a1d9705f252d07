// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Controller.h>
#include <MessageOutput.h>

Envoy::Controller EnvoyGateway;

namespace Envoy {

void Controller::init(Scheduler& scheduler)
{
    scheduler.addTask(_loopTask);
    _loopTask.setCallback(std::bind(&Controller::loop, this));
    _loopTask.setIterations(TASK_FOREVER);
    _loopTask.enable();

    updateSettings();
}

ProviderSettings Controller::getProviderSettings(EnvoyConfig const& cfg)
{
    ProviderSettings res;
    res.VerboseLogging = cfg.VerboseLogging;
    res.PollingInterval = cfg.PollingInterval;
    res.Timeout = cfg.Timeout;
    res.PublishLongTermEnergy = cfg.PublishLongTermEnergy;
    res.PublishConsumptionReport = cfg.PublishConsumptionReport;
    return res;
}

void Controller::updateSettings()
{
    std::unique_lock<std::mutex> lock(_mutex);

    auto const& cfg = Configuration.get().Envoy;

    Preferences prefs{ cfg.Address, cfg.TokenPart1, cfg.TokenPart2 };
    bool prefsChanged = _watcher.observe(prefs);

    auto requested = getProviderSettings(cfg);
    auto action = planSettingsUpdate(_spProvider != nullptr, cfg.Enabled,
            _activeSettings, requested, prefsChanged);

    if (cfg.VerboseLogging) {
        MessageOutput.printf("[Envoy::Controller] Settings update: %s\r\n",
                settingsActionName(action));
    }

    switch (action) {
        case SettingsAction::None:
            return;

        case SettingsAction::Trigger:
            MessageOutput.printf("[Envoy::Controller] Preferences updated, triggering immediate poll\r\n");
            _spProvider->updatePreferences(prefs);
            _spProvider->trigger();
            return;

        case SettingsAction::Stop:
        case SettingsAction::Restart:
            break;
    }

    // waits for the polling task to exit, which may take a whole cycle
    auto spPrevious = std::move(_spProvider);
    lock.unlock();
    spPrevious = nullptr;
    lock.lock();

    if (action == SettingsAction::Stop) { return; }

    // a new provider polls right after it was started
    auto spProvider = std::make_shared<Provider>(cfg);
    if (!spProvider->init()) { return; }

    _spProvider = std::move(spProvider);
    _activeSettings = requested;
    _hass.forceUpdate();
}

bool Controller::isEnabled() const
{
    std::lock_guard<std::mutex> l(_mutex);
    return _spProvider != nullptr;
}

std::optional<Reading> Controller::getLastReading() const
{
    std::lock_guard<std::mutex> l(_mutex);
    if (!_spProvider) { return std::nullopt; }
    return _spProvider->getLastReading();
}

uint32_t Controller::getLastUpdate() const
{
    std::lock_guard<std::mutex> l(_mutex);
    if (!_spProvider) { return 0; }
    return _spProvider->getLastUpdate();
}

void Controller::loop()
{
    std::unique_lock<std::mutex> lock(_mutex);

    if (!_spProvider) {
        _refreshRequested = false;
        return;
    }

    _spProvider->loop();
    _hass.hassLoop();

    if (!_refreshRequested.exchange(false)) { return; }

    auto spProvider = _spProvider;
    lock.unlock();

    MessageOutput.printf("[Envoy::Controller] Manual refresh triggered\r\n");
    spProvider->refresh();
}

} // namespace Envoy
