#include <unity.h>
#include <envoy/Emitter.h>
#include "../stubs/RecordingSink.h"

using namespace Envoy;

static Reading sampleReading() {
    Reading r;
    r.Production.PowerW = 4500;
    r.Production.EnergyTodayWh = 12000;
    r.Production.EnergyLastSevenDaysWh = 70000;
    r.Production.EnergyLifetimeWh = 1500000;
    r.Consumption.PowerW = 1200;
    r.Consumption.EnergyTodayWh = 8000;
    r.Grid = GridFlow::fromNetPower(-3300);
    return r;
}

void setUp() {
}

void tearDown() {
}

void test_core_channels() {
    RecordingSink sink;
    auto rejected = Emitter::emit(sampleReading(), sink);

    TEST_ASSERT_TRUE(rejected.empty());
    TEST_ASSERT_EQUAL(6, sink.Events.size());

    TEST_ASSERT_EQUAL_FLOAT(4500, sink.number(Component::Production, Attribute::Power));
    TEST_ASSERT_EQUAL_FLOAT(12.0, sink.number(Component::Production, Attribute::Energy));
    TEST_ASSERT_EQUAL_FLOAT(1200, sink.number(Component::Consumption, Attribute::Power));
    TEST_ASSERT_EQUAL_FLOAT(8.0, sink.number(Component::Consumption, Attribute::Energy));
    TEST_ASSERT_EQUAL_FLOAT(3300, sink.number(Component::Grid, Attribute::Power));

    auto pExporting = sink.find(Component::Grid, Attribute::Exporting);
    TEST_ASSERT_NOT_NULL(pExporting);
    TEST_ASSERT_TRUE(std::get<bool>(pExporting->Value));

    TEST_ASSERT_EQUAL_STRING("kWh", sink.find(Component::Production, Attribute::Energy)->Unit);
    TEST_ASSERT_EQUAL_STRING("W", sink.find(Component::Grid, Attribute::Power)->Unit);
}

void test_undeclared_optional_channels_are_skipped() {
    RecordingSink sink;
    Emitter::emit(sampleReading(), sink);

    TEST_ASSERT_NULL(sink.find(Component::Production, Attribute::EnergyLastSevenDays));
    TEST_ASSERT_NULL(sink.find(Component::Production, Attribute::EnergyLifetime));
    TEST_ASSERT_NULL(sink.find(Component::Consumption, Attribute::Report));
}

void test_declared_optional_channels() {
    RecordingSink sink;
    sink.Optional.insert({ Component::Production, Attribute::EnergyLastSevenDays });
    sink.Optional.insert({ Component::Production, Attribute::EnergyLifetime });
    sink.Optional.insert({ Component::Consumption, Attribute::Report });

    auto rejected = Emitter::emit(sampleReading(), sink);

    TEST_ASSERT_TRUE(rejected.empty());
    TEST_ASSERT_EQUAL(9, sink.Events.size());
    TEST_ASSERT_EQUAL_FLOAT(70.0, sink.number(Component::Production, Attribute::EnergyLastSevenDays));
    TEST_ASSERT_EQUAL_FLOAT(1500.0, sink.number(Component::Production, Attribute::EnergyLifetime));

    auto const& report = std::get<ConsumptionReport>(
            sink.find(Component::Consumption, Attribute::Report)->Value);
    TEST_ASSERT_EQUAL_FLOAT(1200, report.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(8000, report.EnergyWh);
    TEST_ASSERT_EQUAL_FLOAT(0, report.DeltaEnergyWh);
    TEST_ASSERT_EQUAL_FLOAT(0, report.EnergySavedWh);
    TEST_ASSERT_EQUAL_FLOAT(0, report.PersistedEnergyWh);
}

void test_rejected_event_does_not_stop_others() {
    RecordingSink sink;
    sink.Rejecting.insert({ Component::Production, Attribute::Power });

    auto rejected = Emitter::emit(sampleReading(), sink);

    TEST_ASSERT_EQUAL(1, rejected.size());
    TEST_ASSERT_TRUE(rejected[0].Target == Component::Production);
    TEST_ASSERT_TRUE(rejected[0].Kind == Attribute::Power);

    TEST_ASSERT_EQUAL(5, sink.Events.size());
    TEST_ASSERT_NOT_NULL(sink.find(Component::Grid, Attribute::Exporting));
}

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_core_channels);
    RUN_TEST(test_undeclared_optional_channels_are_skipped);
    RUN_TEST(test_declared_optional_channels);
    RUN_TEST(test_rejected_event_does_not_stop_others);

    return UNITY_END();
}

int main(int argc, char **argv) {
    return runUnityTests();
}
