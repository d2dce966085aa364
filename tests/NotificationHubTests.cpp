// NotificationHubTests.cpp
// Listener fan-out, removal of dead listeners, bounded queues.

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <ArduinoJson.h>

#include "notification_hub.h"

using ::testing::_;
using ::testing::Return;

namespace {

class MockSink : public NotificationSink {
public:
    MOCK_METHOD(bool, deliver, (const std::string& message), (override));
};

} // namespace

TEST(NotificationHubTests, PublishWrapsTypeAndPayload) {
    NotificationHub hub;
    auto sink = std::make_shared<QueuedSink>();
    hub.addListener(sink);

    DeviceEvent event;
    event.ip = "10.0.0.5";
    event.apiType = "UIC";
    event.method = "VolumeLevel";
    event.data = "15";
    EXPECT_EQ(hub.publishEvent(event), 1);

    std::string message;
    ASSERT_TRUE(sink->poll(message, 0));
    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, message));
    EXPECT_STREQ(doc["type"].as<const char*>(), "event");
    EXPECT_STREQ(doc["payload"]["speaker_ip"].as<const char*>(), "10.0.0.5");
    EXPECT_STREQ(doc["payload"]["method"].as<const char*>(), "VolumeLevel");
    EXPECT_TRUE(doc["payload"]["success"].as<bool>());
}

TEST(NotificationHubTests, PropertyUpdateMessage) {
    NotificationHub hub;
    auto sink = std::make_shared<QueuedSink>();
    hub.addListener(sink);
    hub.publishPropertyUpdate("10.0.0.5", {{"volume", "12"}});

    std::string message;
    ASSERT_TRUE(sink->poll(message, 0));
    JsonDocument doc;
    ASSERT_FALSE(deserializeJson(doc, message));
    EXPECT_STREQ(doc["type"].as<const char*>(), "property_update");
    EXPECT_STREQ(doc["payload"]["ip"].as<const char*>(), "10.0.0.5");
    EXPECT_STREQ(doc["payload"]["properties"]["volume"].as<const char*>(), "12");
}

TEST(NotificationHubTests, FailedListenerRemovedOthersStillServed) {
    NotificationHub hub;
    auto dead = std::make_shared<MockSink>();
    auto alive = std::make_shared<MockSink>();
    EXPECT_CALL(*dead, deliver(_)).WillOnce(Return(false));
    EXPECT_CALL(*alive, deliver(_)).Times(2).WillRepeatedly(Return(true));
    hub.addListener(dead);
    hub.addListener(alive);

    JsonDocument payload;
    payload["n"] = 1;
    EXPECT_EQ(hub.publish("event", payload.as<JsonVariantConst>()), 1);
    EXPECT_EQ(hub.listenerCount(), 1u);

    // Dead listener is not called again
    EXPECT_EQ(hub.publish("event", payload.as<JsonVariantConst>()), 1);
}

TEST(NotificationHubTests, DuplicateListenerAddedOnce) {
    NotificationHub hub;
    auto sink = std::make_shared<QueuedSink>();
    hub.addListener(sink);
    hub.addListener(sink);
    EXPECT_EQ(hub.listenerCount(), 1u);
    hub.removeListener(sink);
    EXPECT_EQ(hub.listenerCount(), 0u);
}

//==============================================================================
// QueuedSink
//==============================================================================

TEST(QueuedSinkTests, DropsWhenFullWithoutBlocking) {
    QueuedSink sink(2);
    EXPECT_TRUE(sink.deliver("a"));
    EXPECT_TRUE(sink.deliver("b"));
    EXPECT_TRUE(sink.deliver("c"));
    EXPECT_EQ(sink.pending(), 2u);
    EXPECT_EQ(sink.dropped(), 1u);

    std::string message;
    ASSERT_TRUE(sink.poll(message, 0));
    EXPECT_EQ(message, "a");
}

TEST(QueuedSinkTests, PollTimesOutWhenEmpty) {
    QueuedSink sink;
    std::string message;
    EXPECT_FALSE(sink.poll(message, 10));
}

TEST(QueuedSinkTests, ClosedSinkRejectsDelivery) {
    NotificationHub hub;
    auto sink = std::make_shared<QueuedSink>();
    hub.addListener(sink);
    sink->close();

    JsonDocument payload;
    EXPECT_EQ(hub.publish("event", payload.as<JsonVariantConst>()), 0);
    EXPECT_EQ(hub.listenerCount(), 0u);
    EXPECT_TRUE(sink->isClosed());
}
