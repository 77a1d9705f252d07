// SPDX-License-Identifier: GPL-2.0-or-later
#include "Utils.h"
#include "MessageOutput.h"
#include "defaults.h"
#include <Esp.h>
#include <envoy/DeviceName.h>

uint32_t Utils::getChipId()
{
    uint32_t chipId = 0;
    for (uint8_t i = 0; i < 17; i += 8) {
        chipId |= ((ESP.getEfuseMac() >> (40 - i)) & 0xff) << i;
    }
    return chipId;
}

String Utils::getDefaultMqttClientId()
{
    return String(Envoy::formatDeviceName(APP_HOSTNAME, getChipId()).c_str());
}

bool Utils::checkJsonAlloc(const JsonDocument& doc, const char* function, const uint16_t line)
{
    if (doc.overflowed()) {
        MessageOutput.printf("Alloc failed: %s, %" PRIu16 "\r\n", function, line);
        return false;
    }

    return true;
}

void Utils::skipBom(File& f)
{
    // skip Byte Order Mask (BOM). valid JSON docs always start with '{' or '['.
    while (f.available() > 0) {
        int c = f.peek();
        if (c == '{' || c == '[') {
            break;
        }
        f.read();
    }
}
