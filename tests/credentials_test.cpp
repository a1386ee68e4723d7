#include "test_harness.hpp"
#include <main/state/credentials.hpp>
#include <string>

static void test_empty_reports_first_missing()
{
    Credentials c;
    EXPECT_STREQ(c.firstMissing(), "ssid");
    EXPECT_STREQ(c.ssid(), "");
}

static void test_set_and_get()
{
    Credentials c;
    EXPECT_TRUE(c.set("ssid", "greenhouse"));
    EXPECT_TRUE(c.set("password", "hunter22"));
    EXPECT_TRUE(c.set("aio_username", "gardener"));
    EXPECT_STREQ(c.firstMissing(), "aio_key");
    EXPECT_TRUE(c.set("aio_key", "aio_abc123"));
    EXPECT_TRUE(c.firstMissing() == nullptr);

    EXPECT_STREQ(c.get("ssid"), "greenhouse");
    EXPECT_STREQ(c.password(), "hunter22");
    EXPECT_STREQ(c.aioUsername(), "gardener");
    EXPECT_STREQ(c.aioKey(), "aio_abc123");
}

static void test_override_replaces_value()
{
    Credentials c;
    EXPECT_TRUE(c.set("ssid", "default-net"));
    EXPECT_TRUE(c.set("ssid", "attic"));
    EXPECT_STREQ(c.ssid(), "attic");
}

static void test_rejects_bad_input()
{
    Credentials c;
    EXPECT_FALSE(c.set("token", "x"));
    EXPECT_FALSE(c.set(nullptr, "x"));
    EXPECT_FALSE(c.set("ssid", nullptr));
    EXPECT_TRUE(c.get("token") == nullptr);

    // SSIDs are at most 32 bytes
    const std::string max_ssid(32, 'a');
    const std::string long_ssid(33, 'a');
    EXPECT_TRUE(c.set("ssid", max_ssid.c_str()));
    EXPECT_FALSE(c.set("ssid", long_ssid.c_str()));
    EXPECT_STREQ(c.ssid(), max_ssid.c_str());
}

static void test_field_names()
{
    EXPECT_EQ_INT(Credentials::kFieldCount, 4);
    EXPECT_STREQ(Credentials::kFieldNames[0], "ssid");
    EXPECT_STREQ(Credentials::kFieldNames[3], "aio_key");
}

int main()
{
    test_empty_reports_first_missing();
    test_set_and_get();
    test_override_replaces_value();
    test_rejects_bad_input();
    test_field_names();
    return test_result("credentials_test");
}
