// SPDX-License-Identifier: GPL-2.0-or-later
#include "NetworkSettings.h"
#include "Configuration.h"
#include "MessageOutput.h"
#include "Utils.h"
#include "defaults.h"
#include <envoy/DeviceName.h>

NetworkSettingsClass::NetworkSettingsClass()
    : _loopTask(TASK_SECOND, TASK_FOREVER, std::bind(&NetworkSettingsClass::loop, this))
{
}

void NetworkSettingsClass::init(Scheduler& scheduler)
{
    using std::placeholders::_1;
    using std::placeholders::_2;

    WiFi.onEvent(std::bind(&NetworkSettingsClass::onWiFiEvent, this, _1, _2));

    scheduler.addTask(_loopTask);
    _loopTask.enable();

    applyConfig();
}

void NetworkSettingsClass::onWiFiEvent(WiFiEvent_t event, WiFiEventInfo_t info)
{
    switch (event) {
        case ARDUINO_EVENT_WIFI_STA_GOT_IP:
            MessageOutput.printf("[NetworkSettings] WiFi connected, IP %s\r\n",
                    WiFi.localIP().toString().c_str());
            _connected = true;
            break;
        case ARDUINO_EVENT_WIFI_STA_DISCONNECTED:
            if (_connected) {
                MessageOutput.printf("[NetworkSettings] WiFi disconnected: %d\r\n",
                        info.wifi_sta_disconnected.reason);
            }
            _connected = false;
            break;
        default:
            break;
    }
}

void NetworkSettingsClass::applyConfig()
{
    auto const& config = Configuration.get();

    WiFi.mode(WIFI_STA);
    WiFi.setHostname(getHostname().c_str());

    if (strlen(config.WiFi.Ssid) == 0) {
        MessageOutput.println("[NetworkSettings] No WiFi SSID configured");
        return;
    }

    MessageOutput.printf("[NetworkSettings] Connecting to '%s'\r\n", config.WiFi.Ssid);
    WiFi.begin(config.WiFi.Ssid, config.WiFi.Password);
    _lastConnectAttempt = millis();
}

void NetworkSettingsClass::loop()
{
    if (_connected) { return; }

    auto const& config = Configuration.get();
    if (strlen(config.WiFi.Ssid) == 0) { return; }

    if ((millis() - _lastConnectAttempt) < (WIFI_RECONNECT_TIMEOUT * 1000)) { return; }

    MessageOutput.println("[NetworkSettings] Reconnecting WiFi");
    WiFi.disconnect();
    WiFi.begin(config.WiFi.Ssid, config.WiFi.Password);
    _lastConnectAttempt = millis();
}

bool NetworkSettingsClass::isConnected() const
{
    return _connected;
}

String NetworkSettingsClass::getHostname() const
{
    auto const& config = Configuration.get();

    if (strcmp(config.WiFi.Hostname, APP_HOSTNAME) != 0) {
        return String(config.WiFi.Hostname);
    }

    // the default hostname contains a placeholder for the chip id
    return String(Envoy::formatDeviceName(APP_HOSTNAME, Utils::getChipId()).c_str());
}

NetworkSettingsClass NetworkSettings;
