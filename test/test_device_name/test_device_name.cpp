#include <unity.h>
#include <envoy/DeviceName.h>

using Envoy::formatDeviceName;

void setUp() {
}

void tearDown() {
}

void test_keeps_all_digits() {
    TEST_ASSERT_EQUAL_STRING("EnvoyBridge-A1B2C3", formatDeviceName("EnvoyBridge-%06X", 0xA1B2C3).c_str());
}

void test_pads_short_ids() {
    TEST_ASSERT_EQUAL_STRING("EnvoyBridge-00002A", formatDeviceName("EnvoyBridge-%06X", 0x2A).c_str());
}

void test_distinct_chips_yield_distinct_names() {
    TEST_ASSERT_TRUE(formatDeviceName("EnvoyBridge-%06X", 0xA1B2C3) != formatDeviceName("EnvoyBridge-%06X", 0xA1BFFF));
}

void test_pattern_without_placeholder() {
    TEST_ASSERT_EQUAL_STRING("envoy", formatDeviceName("envoy", 0xA1B2C3).c_str());
}

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_keeps_all_digits);
    RUN_TEST(test_pads_short_ids);
    RUN_TEST(test_distinct_chips_yield_distinct_names);
    RUN_TEST(test_pattern_without_placeholder);

    return UNITY_END();
}

int main(int argc, char **argv) {
    return runUnityTests();
}
