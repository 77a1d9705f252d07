#include <unity.h>
#include <envoy/Credential.h>

using Envoy::Credential::assemble;

void setUp() {
}

void tearDown() {
}

void test_concatenates_parts() {
    TEST_ASSERT_EQUAL_STRING("abcdef", assemble("abc", "def").c_str());
}

void test_trims_outer_whitespace() {
    TEST_ASSERT_EQUAL_STRING("abcdef", assemble(" abc", "def ").c_str());
    TEST_ASSERT_EQUAL_STRING("abcdef", assemble("\t\nabc", "def\r\n").c_str());
}

void test_keeps_inner_whitespace() {
    TEST_ASSERT_EQUAL_STRING("abc def", assemble("abc ", "def").c_str());
}

void test_missing_part() {
    TEST_ASSERT_EQUAL_STRING("abc", assemble("abc", "").c_str());
    TEST_ASSERT_EQUAL_STRING("def", assemble("", "def").c_str());
}

void test_whitespace_only_is_empty() {
    TEST_ASSERT_TRUE(assemble("  ", "\t").empty());
    TEST_ASSERT_TRUE(assemble("", "").empty());
}

int runUnityTests() {
    UNITY_BEGIN();

    RUN_TEST(test_concatenates_parts);
    RUN_TEST(test_trims_outer_whitespace);
    RUN_TEST(test_keeps_inner_whitespace);
    RUN_TEST(test_missing_part);
    RUN_TEST(test_whitespace_only_is_empty);

    return UNITY_END();
}

int main(int argc, char **argv) {
    return runUnityTests();
}
