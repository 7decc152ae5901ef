#include <unity.h>

#include "MqttClient.hpp"

void test_refusals_warn_once_per_outage() {
    wsb::RefusalCounter refusals;
    TEST_ASSERT_TRUE(refusals.record());
    for (int i = 0; i < 250; ++i) {
        TEST_ASSERT_FALSE(refusals.record());
    }
    TEST_ASSERT_EQUAL_UINT(251, refusals.reset());

    // The next outage starts a new run.
    TEST_ASSERT_EQUAL_UINT(0, refusals.reset());
    TEST_ASSERT_TRUE(refusals.record());
    TEST_ASSERT_FALSE(refusals.record());
    TEST_ASSERT_EQUAL_UINT(2, refusals.reset());
}

void test_publish_before_open_is_refused() {
    wsb::MqttClient client;
    TEST_ASSERT_FALSE(client.publish("k1/state/p", "42.0", wsb::QoS::AtMostOnce, true));
}
