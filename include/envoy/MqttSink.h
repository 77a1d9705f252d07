// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Arduino.h>
#include <envoy/Sink.h>

namespace Envoy {

// publishes events to <prefix>envoy/<component>/<attribute>
class MqttSink : public Sink {
public:
    MqttSink(bool publishLongTermEnergy, bool publishConsumptionReport)
        : _publishLongTermEnergy(publishLongTermEnergy)
        , _publishConsumptionReport(publishConsumptionReport) { }

    bool supports(Component target, Attribute kind) const final;
    bool isAvailable() const final;
    bool emit(Event const& event) final;

    static String getTopic(Component target, Attribute kind);

private:
    static String formatPayload(Event const& event);

    bool const _publishLongTermEnergy;
    bool const _publishConsumptionReport;
};

} // namespace Envoy
