// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <cstdint>

namespace Envoy {

static constexpr uint32_t MinPollingIntervalSeconds = 10;
static constexpr uint32_t MaxPollingIntervalSeconds = 24 * 60 * 60;
static constexpr uint32_t MinTimeoutMillis = 1000;
static constexpr uint32_t MaxTimeoutMillis = 60 * 1000;

uint32_t clampPollingInterval(uint32_t seconds);
uint32_t clampTimeout(uint32_t millis);

// settings a running provider cannot adopt without being restarted
struct ProviderSettings {
    bool VerboseLogging = false;
    uint32_t PollingInterval = 0;
    uint32_t Timeout = 0;
    bool PublishLongTermEnergy = false;
    bool PublishConsumptionReport = false;

    bool operator==(ProviderSettings const& other) const
    {
        return VerboseLogging == other.VerboseLogging
            && PollingInterval == other.PollingInterval
            && Timeout == other.Timeout
            && PublishLongTermEnergy == other.PublishLongTermEnergy
            && PublishConsumptionReport == other.PublishConsumptionReport;
    }

    bool operator!=(ProviderSettings const& other) const { return !(*this == other); }
};

enum class SettingsAction : uint8_t {
    None,
    Stop,
    Restart,
    Trigger
};

char const* settingsActionName(SettingsAction action);

// decides how to apply a saved configuration. a provider polls once when
// started, so a restart covers a simultaneous change of the address or the
// token and no additional poll is triggered in that case.
SettingsAction planSettingsUpdate(bool running, bool enabled,
        ProviderSettings const& active, ProviderSettings const& requested,
        bool preferencesChanged);

} // namespace Envoy
