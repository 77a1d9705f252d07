// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Settings.h>
#include <algorithm>

namespace Envoy {

uint32_t clampPollingInterval(uint32_t seconds)
{
    return std::clamp(seconds, MinPollingIntervalSeconds, MaxPollingIntervalSeconds);
}

uint32_t clampTimeout(uint32_t millis)
{
    return std::clamp(millis, MinTimeoutMillis, MaxTimeoutMillis);
}

char const* settingsActionName(SettingsAction action)
{
    switch (action) {
        case SettingsAction::None:
            return "None";
        case SettingsAction::Stop:
            return "Stop";
        case SettingsAction::Restart:
            return "Restart";
        case SettingsAction::Trigger:
            return "Trigger";
    }
    return "Unknown";
}

SettingsAction planSettingsUpdate(bool running, bool enabled,
        ProviderSettings const& active, ProviderSettings const& requested,
        bool preferencesChanged)
{
    if (!enabled) {
        return running ? SettingsAction::Stop : SettingsAction::None;
    }

    if (!running || active != requested) { return SettingsAction::Restart; }

    if (preferencesChanged) { return SettingsAction::Trigger; }

    return SettingsAction::None;
}

} // namespace Envoy
