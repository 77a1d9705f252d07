#include <unity.h>
#include <envoy/Preferences.h>
#include <envoy/Settings.h>

using namespace Envoy;

static ProviderSettings const defaults{ false, 300, 10000, true, true };

static ProviderSettings withInterval(uint32_t seconds) {
    ProviderSettings s = defaults;
    s.PollingInterval = seconds;
    return s;
}

void setUp() {
}

void tearDown() {
}

void test_first_start() {
    TEST_ASSERT_TRUE(planSettingsUpdate(false, true, {}, defaults, false) == SettingsAction::Restart);
}

void test_disabled() {
    TEST_ASSERT_TRUE(planSettingsUpdate(true, false, defaults, defaults, false) == SettingsAction::Stop);
    TEST_ASSERT_TRUE(planSettingsUpdate(true, false, defaults, defaults, true) == SettingsAction::Stop);
    TEST_ASSERT_TRUE(planSettingsUpdate(false, false, defaults, defaults, true) == SettingsAction::None);
}

void test_unchanged_settings_do_nothing() {
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, defaults, false) == SettingsAction::None);
}

void test_address_change_triggers_poll() {
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, defaults, true) == SettingsAction::Trigger);
}

void test_interval_change_restarts() {
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, withInterval(60), false) == SettingsAction::Restart);
}

void test_each_provider_setting_restarts() {
    ProviderSettings s = defaults;
    s.VerboseLogging = true;
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, s, false) == SettingsAction::Restart);

    s = defaults;
    s.Timeout = 5000;
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, s, false) == SettingsAction::Restart);

    s = defaults;
    s.PublishLongTermEnergy = false;
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, s, false) == SettingsAction::Restart);

    s = defaults;
    s.PublishConsumptionReport = false;
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, defaults, s, false) == SettingsAction::Restart);
}

// a restarted provider polls once when started. the address change saved
// along with it must not cause a second poll.
void test_address_and_interval_change_poll_once() {
    PreferenceWatcher watcher;
    watcher.observe({ "192.168.1.50", "abc", "def" });

    bool prefsChanged = watcher.observe({ "192.168.1.51", "abc", "def" });
    TEST_ASSERT_TRUE(prefsChanged);

    auto action = planSettingsUpdate(true, true, defaults, withInterval(60), prefsChanged);
    TEST_ASSERT_TRUE(action == SettingsAction::Restart);
    TEST_ASSERT_EQUAL_STRING("Restart", settingsActionName(action));

    // saving the same values again afterwards changes nothing
    prefsChanged = watcher.observe({ "192.168.1.51", "abc", "def" });
    TEST_ASSERT_TRUE(planSettingsUpdate(true, true, withInterval(60), withInterval(60), prefsChanged) == SettingsAction::None);
}

void test_polling_interval_is_clamped() {
    TEST_ASSERT_EQUAL_UINT32(10, clampPollingInterval(0));
    TEST_ASSERT_EQUAL_UINT32(10, clampPollingInterval(9));
    TEST_ASSERT_EQUAL_UINT32(300, clampPollingInterval(300));
    TEST_ASSERT_EQUAL_UINT32(86400, clampPollingInterval(5000000));

    // the interval is used in milliseconds, which must not overflow
    TEST_ASSERT_EQUAL_UINT32(86400000, clampPollingInterval(5000000) * 1000);
}

void test_timeout_is_clamped() {
    TEST_ASSERT_EQUAL_UINT32(1000, clampTimeout(0));
    TEST_ASSERT_EQUAL_UINT32(10000, clampTimeout(10000));
    TEST_ASSERT_EQUAL_UINT32(60000, clampTimeout(600000));
}

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_first_start);
    RUN_TEST(test_disabled);
    RUN_TEST(test_unchanged_settings_do_nothing);
    RUN_TEST(test_address_change_triggers_poll);
    RUN_TEST(test_interval_change_restarts);
    RUN_TEST(test_each_provider_setting_restarts);
    RUN_TEST(test_address_and_interval_change_poll_once);
    RUN_TEST(test_polling_interval_is_clamped);
    RUN_TEST(test_timeout_is_clamped);

    return UNITY_END();
}

int main(int argc, char **argv) {
    return runUnityTests();
}
