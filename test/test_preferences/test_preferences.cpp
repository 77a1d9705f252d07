#include <unity.h>
#include <envoy/Preferences.h>

using Envoy::PreferenceWatcher;
using Envoy::Preferences;

static Preferences const initial{ "192.168.1.50", "eyJhbGciOi", "JIUzI1NiJ9" };

void setUp() {
}

void tearDown() {
}

void test_first_observation_is_not_a_change() {
    PreferenceWatcher watcher;
    TEST_ASSERT_FALSE(watcher.observe(initial));
}

void test_unchanged_values() {
    PreferenceWatcher watcher;
    watcher.observe(initial);

    TEST_ASSERT_FALSE(watcher.observe(initial));
    TEST_ASSERT_FALSE(watcher.observe(initial));
}

void test_each_field_is_watched() {
    PreferenceWatcher watcher;
    watcher.observe(initial);

    Preferences p = initial;
    p.Address = "envoy.local";
    TEST_ASSERT_TRUE(watcher.observe(p));

    p.TokenPart1 = "other";
    TEST_ASSERT_TRUE(watcher.observe(p));

    p.TokenPart2 = "other";
    TEST_ASSERT_TRUE(watcher.observe(p));
}

void test_simultaneous_changes_are_one_change() {
    PreferenceWatcher watcher;
    watcher.observe(initial);

    Preferences p{ "10.0.0.2", "a", "b" };
    TEST_ASSERT_TRUE(watcher.observe(p));
    TEST_ASSERT_FALSE(watcher.observe(p));
}

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_first_observation_is_not_a_change);
    RUN_TEST(test_unchanged_values);
    RUN_TEST(test_each_field_is_watched);
    RUN_TEST(test_simultaneous_changes_are_one_change);

    return UNITY_END();
}

int main(int argc, char **argv) {
    return runUnityTests();
}
