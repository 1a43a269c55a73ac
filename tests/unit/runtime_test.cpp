/**
 * runtime_test.cpp - component wiring and the consumer interface
 *
 * HTTP is disabled; transports are injected so no network is touched.
 */

#include "runtime/runtime.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "govee_fixtures.hpp"
#include "mocks/mock_cloud_transport.hpp"
#include "transport/fixture_transport.hpp"

using namespace skysync;
using namespace skysync::runtime;
using namespace skysync::tests;
using namespace testing;

namespace {

RuntimeConfig offline_config() {
    RuntimeConfig config;
    config.cloud.api_key = "abcd1234efgh5678";
    config.http.enabled = false;
    config.quota.daily_limit = 50;
    config.quota.poll_reserve = 5;
    return config;
}

std::unique_ptr<transport::FixtureTransport> recorded_home() {
    nlohmann::json lamp = {{"sku", "H6008"},
                           {"device", "lamp"},
                           {"deviceName", "Desk Lamp"},
                           {"capabilities", light_declarations()}};
    nlohmann::json sensor = {{"sku", "H5179"}, {"device", "sensor"}, {"capabilities", sensor_declarations()}};
    nlohmann::json states = {{"lamp", light_state(30)}, {"sensor", sensor_state(19.0, 55)}};

    auto fixture = std::make_unique<transport::FixtureTransport>();
    std::string error;
    EXPECT_TRUE(fixture->load({{"data", {{"cloud_devices", {lamp, sensor}}, {"cloud_states", states}}}}, error))
        << error;
    return fixture;
}

}  // namespace

TEST(RuntimeTest, InitializeDiscoversAndPrimesState) {
    Runtime runtime(offline_config(), recorded_home());
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    auto devices = runtime.list_devices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].device_id, "lamp");
    EXPECT_EQ(devices[0].name, "Desk Lamp");

    auto lamp = runtime.get_state("lamp");
    ASSERT_TRUE(lamp.has_value());
    EXPECT_FALSE(lamp->stale);
    EXPECT_EQ(std::get<int64_t>(lamp->find("brightness")->value), 30);

    EXPECT_FALSE(runtime.get_state("ghost").has_value());

    // One list call plus one fetch per device
    EXPECT_EQ(runtime.get_governor().snapshot().used, 3);
}

TEST(RuntimeTest, SendCommandNotifiesSubscribers) {
    Runtime runtime(offline_config(), recorded_home());
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    events::EventFilter filter;
    filter.device_id = "lamp";
    auto sub = runtime.subscribe_changes(filter);
    ASSERT_NE(sub, nullptr);

    auto result = runtime.send_command("lamp", "brightness", int64_t{80});
    ASSERT_TRUE(result.success) << result.error_message;

    auto evt = sub->pop(1000);
    ASSERT_TRUE(evt.has_value());
    const auto &change = std::get<events::CapabilityChangeEvent>(*evt);
    ASSERT_EQ(change.changes.size(), 1u);
    EXPECT_EQ(change.changes[0].instance, "brightness");
    EXPECT_EQ(std::get<int64_t>(change.changes[0].value), 80);

    EXPECT_EQ(std::get<int64_t>(runtime.get_state("lamp")->find("brightness")->value), 80);
}

TEST(RuntimeTest, FailedDiscoveryFailsInitialization) {
    auto mock = std::make_unique<NiceMock<MockCloudTransport>>();
    ON_CALL(*mock, name()).WillByDefault(Return("mock"));
    EXPECT_CALL(*mock, list_devices(_, _)).WillOnce(Invoke(FailWith(TransportErrorClass::FATAL, "HTTP 401")));

    Runtime runtime(offline_config(), std::move(mock));
    std::string error;
    EXPECT_FALSE(runtime.initialize(error));
    EXPECT_NE(error.find("HTTP 401"), std::string::npos);
}

TEST(RuntimeTest, AmbiguousCommandQueuesRefresh) {
    auto mock = std::make_unique<NiceMock<MockCloudTransport>>();
    ON_CALL(*mock, name()).WillByDefault(Return("mock"));
    EXPECT_CALL(*mock, list_devices(_, _))
        .WillOnce(Invoke([](std::vector<DeviceDescriptor> &devices, TransportError &) {
            devices = {light_descriptor("lamp")};
            return true;
        }));
    EXPECT_CALL(*mock, fetch_state(_, _, _))
        .WillOnce(Invoke([](const DeviceAddress &, nlohmann::json &payload, TransportError &) {
            payload = light_state(30);
            return true;
        }));
    EXPECT_CALL(*mock, send_command(_, _, _, _))
        .WillOnce(Invoke(FailWith(TransportErrorClass::AMBIGUOUS, "read timeout")));

    Runtime runtime(offline_config(), std::move(mock));
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    auto result = runtime.send_command("lamp", "powerSwitch", false);
    EXPECT_EQ(result.error_kind, control::ErrorKind::AMBIGUOUS_COMMAND_RESULT);
    EXPECT_TRUE(runtime.get_state("lamp")->stale);
    EXPECT_EQ(runtime.get_coordinator().stats().pending_refreshes, 1u);
}

TEST(RuntimeTest, DiagnosticsRedactTheApiKey) {
    Runtime runtime(offline_config(), recorded_home());
    std::string error;
    ASSERT_TRUE(runtime.initialize(error)) << error;

    auto diag = runtime.diagnostics();
    EXPECT_EQ(diag["config"]["cloud"]["api_key"], "abcd****5678");
    EXPECT_EQ(diag.dump().find("abcd1234efgh5678"), std::string::npos);
    EXPECT_EQ(diag["transport"], "fixture");
    EXPECT_EQ(diag["devices"].size(), 2u);
    EXPECT_EQ(diag["quota"]["quota"], 50);
}
