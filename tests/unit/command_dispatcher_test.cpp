/**
 * command_dispatcher_test.cpp - validate, gate, send, reconcile
 */

#include "control/command_dispatcher.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "govee_fixtures.hpp"
#include "mocks/mock_cloud_transport.hpp"

using namespace skysync;
using namespace skysync::control;
using namespace skysync::tests;
using namespace testing;
using capability::Capability;
using capability::CapabilityKind;
using capability::RgbColor;

class CommandDispatcherTest : public Test {
protected:
    void SetUp() override { build(100); }

    void build(int64_t daily_limit) {
        dispatcher.reset();
        governor::GovernorConfig quota;
        quota.daily_limit = daily_limit;
        quota.poll_reserve = 0;
        governor = std::make_unique<governor::RateGovernor>(quota);

        emitter = std::make_shared<events::EventEmitter>();
        registry = std::make_unique<registry::DeviceRegistry>();
        store = std::make_unique<state::StateStore>(emitter);
        transport = std::make_unique<StrictMock<MockCloudTransport>>();

        auto lamp = registry::build_device(light_descriptor("lamp"));
        registry->reconcile({lamp});
        store->register_device(lamp);
        store->merge("lamp", {Capability{"brightness", CapabilityKind::RANGE, int64_t{50}}},
                     state::MergeMode::FULL_REFRESH);

        dispatcher = std::make_unique<CommandDispatcher>(*registry, *store, *governor, *transport);
        dispatcher->set_refresh_requester([this](const std::string &id) { refresh_requests.push_back(id); });

        sub = store->subscribe();
    }

    static CommandRequest request(const std::string &instance, capability::CapabilityValue value,
                                  const std::string &device_id = "lamp") {
        CommandRequest req;
        req.device_id = device_id;
        req.instance = instance;
        req.value = std::move(value);
        return req;
    }

    size_t pending_change_events() {
        size_t count = 0;
        while (auto evt = sub->try_pop()) {
            if (std::holds_alternative<events::CapabilityChangeEvent>(*evt)) {
                ++count;
            }
        }
        return count;
    }

    static bool accept(const DeviceAddress &, const nlohmann::json &capability, nlohmann::json &ack,
                       TransportError &) {
        ack = {{"code", 200}, {"capability", capability}};
        ack["capability"]["state"] = {{"status", "success"}};
        return true;
    }

    std::unique_ptr<governor::RateGovernor> governor;
    std::shared_ptr<events::EventEmitter> emitter;
    std::unique_ptr<registry::DeviceRegistry> registry;
    std::unique_ptr<state::StateStore> store;
    std::unique_ptr<StrictMock<MockCloudTransport>> transport;
    std::unique_ptr<CommandDispatcher> dispatcher;
    std::unique_ptr<events::Subscription> sub;
    std::vector<std::string> refresh_requests;
};

// ============================================================================
// Success path
// ============================================================================

TEST_F(CommandDispatcherTest, BrightnessCommandUpdatesStoreWithOneEvent) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke([](const DeviceAddress &address, const nlohmann::json &capability, nlohmann::json &ack,
                            TransportError &error) {
            EXPECT_EQ(address.device_id, "lamp");
            EXPECT_EQ(address.sku, "H6008");
            EXPECT_EQ(capability["instance"], "brightness");
            EXPECT_EQ(capability["value"], 73);
            return accept(address, capability, ack, error);
        }));

    auto result = dispatcher->dispatch(request("brightness", int64_t{73}));

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.error_kind, ErrorKind::NONE);
    EXPECT_EQ(std::get<int64_t>(result.applied_value), 73);

    auto state = store->read("lamp");
    EXPECT_EQ(std::get<int64_t>(state->find("brightness")->value), 73);
    EXPECT_EQ(pending_change_events(), 1u);

    EXPECT_EQ(governor->snapshot().used, 1);
    EXPECT_EQ(dispatcher->commands_sent(), 1u);
}

TEST_F(CommandDispatcherTest, SameValueCommandEmitsNoChange) {
    EXPECT_CALL(*transport, send_command(_, _, _, _)).WillOnce(Invoke(accept));

    auto result = dispatcher->dispatch(request("brightness", int64_t{50}));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(pending_change_events(), 0u);
}

TEST_F(CommandDispatcherTest, AppliedValueIsStepAligned) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke([](const DeviceAddress &address, const nlohmann::json &capability, nlohmann::json &ack,
                            TransportError &error) {
            EXPECT_EQ(capability["value"], 4100);
            return accept(address, capability, ack, error);
        }));

    auto result = dispatcher->dispatch(request("colorTemperatureK", int64_t{4070}));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(std::get<int64_t>(result.applied_value), 4100);
    EXPECT_EQ(std::get<int64_t>(store->read("lamp")->find("colorTemperatureK")->value), 4100);
}

TEST_F(CommandDispatcherTest, ColorCommandSendsPackedRgb) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke([](const DeviceAddress &address, const nlohmann::json &capability, nlohmann::json &ack,
                            TransportError &error) {
            EXPECT_EQ(capability["type"], "devices.capabilities.color_setting");
            EXPECT_EQ(capability["value"], 0x00FF7F);
            return accept(address, capability, ack, error);
        }));

    auto result = dispatcher->dispatch(request("colorRgb", RgbColor{0x00, 0xFF, 0x7F}));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(std::get<RgbColor>(store->read("lamp")->find("colorRgb")->value), (RgbColor{0x00, 0xFF, 0x7F}));
}

// ============================================================================
// Validation happens before quota and network
// ============================================================================

TEST_F(CommandDispatcherTest, UnknownCapabilityCostsNothing) {
    // StrictMock: any transport call fails the test
    auto result = dispatcher->dispatch(request("turboMode", true));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::UNKNOWN_CAPABILITY);
    EXPECT_EQ(governor->snapshot().used, 0);
    EXPECT_EQ(dispatcher->commands_failed(), 1u);
}

TEST_F(CommandDispatcherTest, UnknownDeviceCostsNothing) {
    auto result = dispatcher->dispatch(request("brightness", int64_t{10}, "ghost"));
    EXPECT_EQ(result.error_kind, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(governor->snapshot().used, 0);
}

TEST_F(CommandDispatcherTest, DeviceRemovedFromStoreCostsNothing) {
    // Still in the registry, but the store dropped it before the command ran
    store->remove_device("lamp");

    auto result = dispatcher->dispatch(request("brightness", int64_t{10}));
    EXPECT_EQ(result.error_kind, ErrorKind::UNKNOWN_DEVICE);
    EXPECT_EQ(governor->snapshot().used, 0);
}

TEST_F(CommandDispatcherTest, InvalidValuesCostNothing) {
    EXPECT_EQ(dispatcher->dispatch(request("brightness", int64_t{0})).error_kind, ErrorKind::INVALID_COMMAND_VALUE);
    EXPECT_EQ(dispatcher->dispatch(request("brightness", std::string("max"))).error_kind,
              ErrorKind::INVALID_COMMAND_VALUE);
    EXPECT_EQ(dispatcher->dispatch(request("lightScene", std::string("Disco"))).error_kind,
              ErrorKind::INVALID_COMMAND_VALUE);
    EXPECT_EQ(dispatcher->dispatch(request("online", false)).error_kind, ErrorKind::INVALID_COMMAND_VALUE);
    EXPECT_EQ(governor->snapshot().used, 0);

    // Cached value untouched
    EXPECT_EQ(std::get<int64_t>(store->read("lamp")->find("brightness")->value), 50);
}

TEST_F(CommandDispatcherTest, ValidateOnlyReportsAppliedValue) {
    CommandResult result;
    EXPECT_TRUE(dispatcher->validate(request("colorTemperatureK", int64_t{2049}), result));
    EXPECT_EQ(std::get<int64_t>(result.applied_value), 2000);

    EXPECT_FALSE(dispatcher->validate(request("missing", int64_t{1}), result));
    EXPECT_EQ(result.error_kind, ErrorKind::UNKNOWN_CAPABILITY);
    EXPECT_EQ(governor->snapshot().used, 0);
}

// ============================================================================
// Quota
// ============================================================================

TEST_F(CommandDispatcherTest, ExhaustedQuotaRejectsWithRetryAfter) {
    build(1);
    ASSERT_TRUE(governor->try_acquire(governor::CallPriority::USER).granted);

    auto result = dispatcher->dispatch(request("brightness", int64_t{10}));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::QUOTA_EXHAUSTED);
    EXPECT_GT(result.retry_after.count(), 0);
    EXPECT_EQ(std::get<int64_t>(store->read("lamp")->find("brightness")->value), 50);
}

TEST_F(CommandDispatcherTest, ServerQuotaResponseClosesGate) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke(FailWith(TransportErrorClass::QUOTA_EXHAUSTED, "HTTP 429")));

    auto result = dispatcher->dispatch(request("brightness", int64_t{10}));
    EXPECT_EQ(result.error_kind, ErrorKind::QUOTA_EXHAUSTED);
    EXPECT_GT(result.retry_after.count(), 0);
    EXPECT_TRUE(governor->snapshot().exhausted_by_server);

    // Next command is refused locally
    auto second = dispatcher->dispatch(request("brightness", int64_t{20}));
    EXPECT_EQ(second.error_kind, ErrorKind::QUOTA_EXHAUSTED);
}

// ============================================================================
// Transport outcomes
// ============================================================================

TEST_F(CommandDispatcherTest, AmbiguousOutcomeMarksStaleAndSchedulesRefresh) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke(FailWith(TransportErrorClass::AMBIGUOUS, "read timeout")));

    auto result = dispatcher->dispatch(request("brightness", int64_t{90}));
    EXPECT_EQ(result.error_kind, ErrorKind::AMBIGUOUS_COMMAND_RESULT);

    auto state = store->read("lamp");
    EXPECT_TRUE(state->stale);
    // No optimistic write
    EXPECT_EQ(std::get<int64_t>(state->find("brightness")->value), 50);
    EXPECT_EQ(refresh_requests, (std::vector<std::string>{"lamp"}));
}

TEST_F(CommandDispatcherTest, RejectedCommandLeavesState) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke(FailWith(TransportErrorClass::REJECTED, "device offline")));

    auto result = dispatcher->dispatch(request("powerSwitch", false));
    EXPECT_EQ(result.error_kind, ErrorKind::COMMAND_REJECTED);
    EXPECT_NE(result.error_message.find("device offline"), std::string::npos);
    EXPECT_EQ(store->read("lamp")->find("powerSwitch"), nullptr);
    EXPECT_TRUE(refresh_requests.empty());
}

TEST_F(CommandDispatcherTest, TransportFailureIsReported) {
    EXPECT_CALL(*transport, send_command(_, _, _, _))
        .WillOnce(Invoke(FailWith(TransportErrorClass::FATAL, "HTTP 401 (invalid API key)")));

    auto result = dispatcher->dispatch(request("powerSwitch", true));
    EXPECT_EQ(result.error_kind, ErrorKind::TRANSPORT);
    EXPECT_EQ(governor->snapshot().used, 1);
    EXPECT_FALSE(store->read("lamp")->stale);
}

TEST_F(CommandDispatcherTest, ErrorKindNames) {
    EXPECT_STREQ(error_kind_to_string(ErrorKind::QUOTA_EXHAUSTED), "QUOTA_EXHAUSTED");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::AMBIGUOUS_COMMAND_RESULT), "AMBIGUOUS_COMMAND_RESULT");
}
