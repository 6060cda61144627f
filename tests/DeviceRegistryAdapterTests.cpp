// Unit tests for the normalized registry view.

#include "EventSurface.h"
#include "fixtures/EventRecorder.h"
#include "fixtures/FakeControlPoint.h"
#include "registry/DeviceRegistryAdapter.h"

#include <gtest/gtest.h>

using fixtures::makeRenderer;

class DeviceRegistryAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_events.setCallbacks(m_recorder.callbacks());
    }

    fixtures::FakeControlPoint m_registry;
    EventSurface m_events;
    fixtures::EventRecorder m_recorder;
};

TEST_F(DeviceRegistryAdapterTest, ListsOnlyAVTransportDevicesInRegistryOrder)
{
    m_registry.addDevice(makeRenderer("uuid:tv-1", "Living Room TV"));
    m_registry.addDevice(makeRenderer("uuid:speaker", "Kitchen Speaker", "Sonos", false));
    m_registry.addDevice(makeRenderer("uuid:tv-2", "Bedroom TV", "LG Electronics"));

    DeviceRegistryAdapter adapter(m_registry, m_events);
    std::vector<RendererDevice> renderers = adapter.listRenderers();

    ASSERT_EQ(renderers.size(), 2u);
    EXPECT_EQ(renderers[0].id, "uuid:tv-1");
    EXPECT_EQ(renderers[1].id, "uuid:tv-2");
    for (const auto& device : renderers) {
        EXPECT_TRUE(device.supportsAVTransport);
        EXPECT_EQ(device.type, "MediaRenderer");
    }
}

TEST_F(DeviceRegistryAdapterTest, EmptyRegistryListsNothing)
{
    DeviceRegistryAdapter adapter(m_registry, m_events);
    EXPECT_TRUE(adapter.listRenderers().empty());
}

TEST_F(DeviceRegistryAdapterTest, NormalizeFillsUnknownVendorFields)
{
    RegistryEntry entry = makeRenderer("uuid:bare", "");
    entry.manufacturer.clear();
    entry.modelName.clear();

    RendererDevice device = DeviceRegistryAdapter::normalize(entry);
    EXPECT_EQ(device.id, "uuid:bare");
    EXPECT_EQ(device.name, "Unknown");
    EXPECT_EQ(device.manufacturer, "Unknown");
    EXPECT_EQ(device.modelName, "Unknown");
    EXPECT_EQ(device.avTransportControlURL, "http://192.168.1.50:9197/upnp/control/AVTransport1");
    EXPECT_EQ(device.avTransportServiceType, "urn:schemas-upnp-org:service:AVTransport:1");
}

TEST_F(DeviceRegistryAdapterTest, ServiceWithoutControlUrlIsNotCapable)
{
    RegistryEntry entry = makeRenderer("uuid:tv", "TV");
    for (auto& service : entry.services) {
        service.controlURL.clear();
    }
    EXPECT_FALSE(DeviceRegistryAdapter::normalize(entry).supportsAVTransport);
}

TEST_F(DeviceRegistryAdapterTest, ResolveReportsCapability)
{
    m_registry.addDevice(makeRenderer("uuid:speaker", "Kitchen Speaker", "Sonos", false));
    DeviceRegistryAdapter adapter(m_registry, m_events);

    RendererDevice device;
    ASSERT_TRUE(adapter.resolve("uuid:speaker", device));
    EXPECT_EQ(device.name, "Kitchen Speaker");
    EXPECT_FALSE(device.supportsAVTransport);

    EXPECT_FALSE(adapter.resolve("uuid:missing", device));
}

TEST_F(DeviceRegistryAdapterTest, ForwardsRegistryNotifications)
{
    DeviceRegistryAdapter adapter(m_registry, m_events);

    m_registry.addDevice(makeRenderer("uuid:tv-1", "Living Room TV"));
    m_registry.removeDevice("uuid:tv-1");

    ASSERT_EQ(m_recorder.found().size(), 1u);
    EXPECT_EQ(m_recorder.found()[0].name, "Living Room TV");
    ASSERT_EQ(m_recorder.lost().size(), 1u);
    EXPECT_EQ(m_recorder.lost()[0], "uuid:tv-1");
}

TEST_F(DeviceRegistryAdapterTest, StopsForwardingOnceDestroyed)
{
    {
        DeviceRegistryAdapter adapter(m_registry, m_events);
    }
    m_registry.addDevice(makeRenderer("uuid:tv-1", "Living Room TV"));
    EXPECT_TRUE(m_recorder.found().empty());
}

TEST_F(DeviceRegistryAdapterTest, FilterMatchesCaseInsensitivePartial)
{
    std::vector<RendererDevice> devices;
    devices.push_back(DeviceRegistryAdapter::normalize(makeRenderer("uuid:1", "[TV] Samsung Q80", "Samsung Electronics")));
    devices.push_back(DeviceRegistryAdapter::normalize(makeRenderer("uuid:2", "OLED55", "LG Electronics")));
    devices.push_back(DeviceRegistryAdapter::normalize(makeRenderer("uuid:3", "Frame", "Samsung Electronics")));

    DeviceFilter byManufacturer;
    byManufacturer.manufacturer = "samsung";
    std::vector<RendererDevice> samsung = DeviceRegistryAdapter::filterRenderers(devices, byManufacturer);
    ASSERT_EQ(samsung.size(), 2u);
    EXPECT_EQ(samsung[0].id, "uuid:1");
    EXPECT_EQ(samsung[1].id, "uuid:3");

    DeviceFilter both;
    both.manufacturer = "SAMSUNG";
    both.name = "q80";
    std::vector<RendererDevice> q80 = DeviceRegistryAdapter::filterRenderers(devices, both);
    ASSERT_EQ(q80.size(), 1u);
    EXPECT_EQ(q80[0].id, "uuid:1");

    EXPECT_EQ(DeviceRegistryAdapter::filterRenderers(devices, DeviceFilter()).size(), 3u);
}

TEST_F(DeviceRegistryAdapterTest, FindByBrandChecksNameAndManufacturer)
{
    std::vector<RendererDevice> devices;
    devices.push_back(DeviceRegistryAdapter::normalize(makeRenderer("uuid:1", "OLED55", "LG Electronics")));
    devices.push_back(DeviceRegistryAdapter::normalize(makeRenderer("uuid:2", "Bedroom", "Samsung Electronics")));

    RendererDevice device;
    ASSERT_TRUE(DeviceRegistryAdapter::findRendererByBrand(devices, "samsung", device));
    EXPECT_EQ(device.id, "uuid:2");

    ASSERT_TRUE(DeviceRegistryAdapter::findRendererByBrand(devices, "oled", device));
    EXPECT_EQ(device.id, "uuid:1");

    EXPECT_FALSE(DeviceRegistryAdapter::findRendererByBrand(devices, "Sony", device));
}
