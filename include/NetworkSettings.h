// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Arduino.h>
#include <TaskSchedulerDeclarations.h>
#include <WiFi.h>
#include <atomic>

class NetworkSettingsClass {
public:
    NetworkSettingsClass();
    void init(Scheduler& scheduler);
    void applyConfig();

    bool isConnected() const;
    String getHostname() const;

private:
    void loop();
    void onWiFiEvent(WiFiEvent_t event, WiFiEventInfo_t info);

    Task _loopTask;

    std::atomic<bool> _connected { false };
    uint32_t _lastConnectAttempt = 0;
};

extern NetworkSettingsClass NetworkSettings;
