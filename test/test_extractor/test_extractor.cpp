#include <unity.h>
#include <algorithm>
#include <envoy/Document.h>
#include <envoy/Extractor.h>

using Envoy::Extractor::extract;

static JsonDocument load(char const* body) {
    auto res = Envoy::Document::parse(body);
    TEST_ASSERT_TRUE(std::holds_alternative<JsonDocument>(res));
    return std::get<JsonDocument>(res);
}

static bool isMissing(Envoy::Extractor::Result const& res, char const* field) {
    auto const& fields = res.MissingFields;
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

void setUp() {
}

void tearDown() {
}

void test_selects_eim_production() {
    auto res = extract(load(R"({"production":[
        {"type":"inverters","wNow":100,"whToday":1},
        {"type":"eim","wNow":4500,"whToday":12000,"whLastSevenDays":70000,"whLifetime":9000000},
        {"type":"eim","wNow":1}]})"));

    TEST_ASSERT_EQUAL_FLOAT(4500, res.Production.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(12000, res.Production.EnergyTodayWh);
    TEST_ASSERT_EQUAL_FLOAT(70000, res.Production.EnergyLastSevenDaysWh);
    TEST_ASSERT_EQUAL_FLOAT(9000000, res.Production.EnergyLifetimeWh);
    TEST_ASSERT_FALSE(isMissing(res, "eim"));
}

void test_no_eim_entry_yields_zeros() {
    auto res = extract(load(R"({"production":[{"type":"inverters","wNow":100}],"consumption":[]})"));

    TEST_ASSERT_EQUAL_FLOAT(0, res.Production.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(0, res.Production.EnergyTodayWh);
    TEST_ASSERT_TRUE(isMissing(res, "eim"));
}

void test_missing_arrays_are_empty() {
    auto res = extract(load("{}"));

    TEST_ASSERT_EQUAL_FLOAT(0, res.Production.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(0, res.Consumption.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(0, res.NetPowerW);
    TEST_ASSERT_TRUE(isMissing(res, "eim"));
    TEST_ASSERT_TRUE(isMissing(res, "total-consumption"));
    TEST_ASSERT_TRUE(isMissing(res, "net-consumption"));
}

void test_negative_values_are_floored() {
    auto res = extract(load(R"({
        "production":[{"type":"eim","wNow":-3.5,"whToday":-1}],
        "consumption":[{"measurementType":"total-consumption","wNow":-20,"whToday":-5}]})"));

    TEST_ASSERT_EQUAL_FLOAT(0, res.Production.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(0, res.Production.EnergyTodayWh);
    TEST_ASSERT_EQUAL_FLOAT(0, res.Consumption.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(0, res.Consumption.EnergyTodayWh);
}

void test_net_power_is_not_clamped() {
    auto res = extract(load(R"({"consumption":[{"measurementType":"net-consumption","wNow":-3300}]})"));

    TEST_ASSERT_EQUAL_FLOAT(-3300, res.NetPowerW);
}

void test_first_consumption_entry_wins() {
    auto res = extract(load(R"({"consumption":[
        {"measurementType":"total-consumption","wNow":1200,"whToday":8000},
        {"measurementType":"net-consumption","wNow":-3300},
        {"measurementType":"total-consumption","wNow":1},
        {"measurementType":"net-consumption","wNow":2}]})"));

    TEST_ASSERT_EQUAL_FLOAT(1200, res.Consumption.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(8000, res.Consumption.EnergyTodayWh);
    TEST_ASSERT_EQUAL_FLOAT(-3300, res.NetPowerW);
}

void test_unrecognized_measurement_types_are_ignored() {
    auto res = extract(load(R"({"consumption":[
        {"measurementType":"storage","wNow":777,"whToday":777},
        {"wNow":888},
        {"measurementType":"total-consumption","wNow":50,"whToday":60}]})"));

    TEST_ASSERT_EQUAL_FLOAT(50, res.Consumption.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(60, res.Consumption.EnergyTodayWh);
    TEST_ASSERT_TRUE(isMissing(res, "net-consumption"));
}

void test_non_numeric_fields_default_to_zero() {
    auto res = extract(load(R"({
        "production":[{"type":"eim","wNow":"n/a","whToday":100}],
        "consumption":[{"measurementType":"total-consumption","wNow":null}]})"));

    TEST_ASSERT_EQUAL_FLOAT(0, res.Production.PowerW);
    TEST_ASSERT_EQUAL_FLOAT(100, res.Production.EnergyTodayWh);
    TEST_ASSERT_TRUE(isMissing(res, "eim.wNow"));
    TEST_ASSERT_TRUE(isMissing(res, "eim.whLifetime"));
    TEST_ASSERT_FALSE(isMissing(res, "eim.whToday"));
    TEST_ASSERT_TRUE(isMissing(res, "total-consumption.wNow"));
    TEST_ASSERT_TRUE(isMissing(res, "total-consumption.whToday"));
}

void test_dropped_duplicates_do_not_report_missing_fields() {
    auto res = extract(load(R"({"consumption":[
        {"measurementType":"net-consumption","wNow":5},
        {"measurementType":"net-consumption"}]})"));

    TEST_ASSERT_FALSE(isMissing(res, "net-consumption.wNow"));
}

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_selects_eim_production);
    RUN_TEST(test_no_eim_entry_yields_zeros);
    RUN_TEST(test_missing_arrays_are_empty);
    RUN_TEST(test_negative_values_are_floored);
    RUN_TEST(test_net_power_is_not_clamped);
    RUN_TEST(test_first_consumption_entry_wins);
    RUN_TEST(test_unrecognized_measurement_types_are_ignored);
    RUN_TEST(test_non_numeric_fields_default_to_zero);
    RUN_TEST(test_dropped_duplicates_do_not_report_missing_fields);

    return UNITY_END();
}

int main(int argc, char **argv) {
    return runUnityTests();
}
