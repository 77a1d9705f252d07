// SPDX-License-Identifier: GPL-2.0-or-later
#include "Configuration.h"
#include "MessageOutput.h"
#include "MqttHandleEnvoy.h"
#include "MqttSettings.h"
#include "NetworkSettings.h"
#include "WebApi.h"
#include "defaults.h"
#include <envoy/Controller.h>
#include <Arduino.h>
#include <LittleFS.h>
#include <TaskScheduler.h>

Scheduler scheduler;

void setup()
{
    // Move all dynamic allocations >512byte to psram (if available)
    heap_caps_malloc_extmem_enable(512);

    // Initialize serial output
    Serial.begin(SERIAL_BAUDRATE);
    MessageOutput.init(scheduler);
    MessageOutput.println();
    MessageOutput.println("Starting EnvoyBridge");

    // Initialize file system
    MessageOutput.print("Initialize FS... ");
    if (!LittleFS.begin(false)) { // Do not format if mount failed
        MessageOutput.print("failed... trying to format...");
        if (LittleFS.begin(true)) {
            MessageOutput.print("success");
        } else {
            MessageOutput.print("failed");
        }
    } else {
        MessageOutput.println("done");
    }

    // Read configuration values
    Configuration.init(scheduler);
    MessageOutput.print("Reading configuration... ");
    if (!Configuration.read()) {
        MessageOutput.print("initializing... ");
        if (Configuration.write()) {
            MessageOutput.print("written... ");
        } else {
            MessageOutput.print("failed... ");
        }
    }
    MessageOutput.println("done");

    // Initialize WiFi
    MessageOutput.print("Initialize Network... ");
    NetworkSettings.init(scheduler);
    MessageOutput.println("done");
    NetworkSettings.applyConfig();

    // Initialize MqTT
    MessageOutput.print("Initialize MqTT... ");
    MqttSettings.init(scheduler);
    MqttHandleEnvoy.init();
    MessageOutput.println("done");

    // Initialize WebApi
    MessageOutput.print("Initialize WebApi... ");
    WebApi.init(scheduler);
    MessageOutput.println("done");

    EnvoyGateway.init(scheduler);
}

void loop()
{
    scheduler.execute();
}
