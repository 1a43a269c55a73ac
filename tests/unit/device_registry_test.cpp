/**
 * device_registry_test.cpp - inventory reconciliation and concurrent access
 */

#include "registry/device_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "govee_fixtures.hpp"

using namespace skysync;
using namespace skysync::registry;
using namespace skysync::tests;

TEST(DeviceRegistryTest, BuildDeviceParsesDeclarations) {
    auto device = build_device(light_descriptor("lamp-1"));

    EXPECT_EQ(device.device_id, "lamp-1");
    EXPECT_EQ(device.sku, "H6008");
    EXPECT_EQ(device.capabilities.size(), 7u);
    ASSERT_NE(device.find_capability("brightness"), nullptr);
    EXPECT_EQ(device.find_capability("nope"), nullptr);

    auto address = device.address();
    EXPECT_EQ(address.device_id, "lamp-1");
    EXPECT_EQ(address.sku, "H6008");
}

TEST(DeviceRegistryTest, BuildDeviceSkipsMalformedCapabilities) {
    auto desc = light_descriptor("lamp-1");
    desc.capabilities.push_back({{"type", "devices.capabilities.warp_drive"}, {"instance", "warp"}});

    auto device = build_device(desc);
    EXPECT_EQ(device.capabilities.size(), 7u);
    EXPECT_EQ(device.find_capability("warp"), nullptr);
}

TEST(DeviceRegistryTest, ReconcileReportsAddedRemovedChanged) {
    DeviceRegistry registry;

    auto first = registry.reconcile({build_device(light_descriptor("lamp-1")), build_device(sensor_descriptor("s-1"))});
    EXPECT_EQ(first.added, (std::vector<std::string>{"lamp-1", "s-1"}));
    EXPECT_TRUE(first.removed.empty());
    EXPECT_EQ(registry.device_count(), 2u);

    // Same list again is a no-op
    auto again = registry.reconcile({build_device(light_descriptor("lamp-1")), build_device(sensor_descriptor("s-1"))});
    EXPECT_TRUE(again.empty());

    // lamp-1 loses a capability, s-1 disappears, lamp-2 appears
    auto trimmed = light_descriptor("lamp-1");
    trimmed.capabilities.erase(trimmed.capabilities.begin() + 1);
    auto next = registry.reconcile({build_device(trimmed), build_device(light_descriptor("lamp-2"))});

    EXPECT_EQ(next.added, (std::vector<std::string>{"lamp-2"}));
    EXPECT_EQ(next.removed, (std::vector<std::string>{"s-1"}));
    EXPECT_EQ(next.changed, (std::vector<std::string>{"lamp-1"}));

    EXPECT_FALSE(registry.has_device("s-1"));
    auto lamp = registry.get_device_copy("lamp-1");
    ASSERT_TRUE(lamp.has_value());
    EXPECT_EQ(lamp->capabilities.size(), 6u);
}

TEST(DeviceRegistryTest, RenameIsNotADeclarationChange) {
    DeviceRegistry registry;
    registry.reconcile({build_device(light_descriptor("lamp-1", "Desk Lamp"))});

    auto result = registry.reconcile({build_device(light_descriptor("lamp-1", "Reading Lamp"))});
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(registry.get_device_copy("lamp-1")->name, "Reading Lamp");
}

TEST(DeviceRegistryTest, DuplicateIdsKeepFirstEntry) {
    DeviceRegistry registry;
    auto result = registry.reconcile(
        {build_device(light_descriptor("dup", "First")), build_device(light_descriptor("dup", "Second"))});

    EXPECT_EQ(result.added.size(), 1u);
    EXPECT_EQ(registry.device_count(), 1u);
    EXPECT_EQ(registry.get_device_copy("dup")->name, "First");
}

TEST(DeviceRegistryTest, GetAllDevicesKeepsListOrder) {
    DeviceRegistry registry;
    registry.reconcile({build_device(light_descriptor("c")), build_device(light_descriptor("a")),
                        build_device(light_descriptor("b"))});

    auto devices = registry.get_all_devices();
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].device_id, "c");
    EXPECT_EQ(devices[1].device_id, "a");
    EXPECT_EQ(devices[2].device_id, "b");
}

TEST(DeviceRegistryTest, ConcurrentReadsDuringReconcile) {
    DeviceRegistry registry;
    std::vector<Device> small{build_device(light_descriptor("lamp-1"))};
    std::vector<Device> large{build_device(light_descriptor("lamp-1")), build_device(light_descriptor("lamp-2")),
                              build_device(sensor_descriptor("s-1"))};
    registry.reconcile(small);

    std::atomic<bool> stop{false};
    std::atomic<int> inconsistent{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto devices = registry.get_all_devices();
                if (devices.size() != 1 && devices.size() != 3) {
                    inconsistent++;
                }
                auto lamp = registry.get_device_copy("lamp-1");
                if (!lamp || lamp->capabilities.size() != 7) {
                    inconsistent++;
                }
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        registry.reconcile(i % 2 == 0 ? large : small);
    }
    stop = true;
    for (auto &t : readers) {
        t.join();
    }

    EXPECT_EQ(inconsistent.load(), 0);
}
