// Unit tests for reading one device out of a UPnP device description.

#include "upnp/UPnPControlPoint.h"

#include <gtest/gtest.h>

#include <upnp/ixml.h>

namespace {

const char* const LOCATION = "http://192.168.1.60:49152/description.xml";

// A media server root device that embeds a renderer
const char* const NESTED_DESCRIPTION =
    "<?xml version=\"1.0\"?>"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
    "<specVersion><major>1</major><minor>0</minor></specVersion>"
    "<device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaServer:1</deviceType>"
    "<friendlyName>Home NAS</friendlyName>"
    "<manufacturer>Synology</manufacturer>"
    "<modelName>DS220</modelName>"
    "<UDN>uuid:nas-root</UDN>"
    "<serviceList>"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:ContentDirectory:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:ContentDirectory</serviceId>"
    "<controlURL>/cd/control</controlURL>"
    "</service>"
    "</serviceList>"
    "<deviceList>"
    "<device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
    "<friendlyName>NAS Audio Out</friendlyName>"
    "<manufacturer>Synology</manufacturer>"
    "<modelName>AudioStation</modelName>"
    "<UDN>uuid:nas-renderer</UDN>"
    "<serviceList>"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
    "<controlURL>/renderer/avt/control</controlURL>"
    "</service>"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:RenderingControl:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:RenderingControl</serviceId>"
    "<controlURL>/renderer/rc/control</controlURL>"
    "</service>"
    "</serviceList>"
    "</device>"
    "</deviceList>"
    "</device>"
    "</root>";

class ParsedDocument {
public:
    explicit ParsedDocument(const char* xml) : m_doc(ixmlParseBuffer(xml)) {}
    ~ParsedDocument() {
        if (m_doc) {
            ixmlDocument_free(m_doc);
        }
    }

    IXML_Document* get() const { return m_doc; }

private:
    IXML_Document* m_doc;
};

}  // namespace

TEST(UPnPDescription, EmbeddedDeviceReadsOnlyItsOwnElement)
{
    ParsedDocument doc(NESTED_DESCRIPTION);
    ASSERT_NE(doc.get(), nullptr);

    RegistryEntry entry;
    ASSERT_TRUE(UPnPControlPoint::parseDescription(doc.get(), "uuid:nas-renderer", LOCATION, entry));

    EXPECT_EQ(entry.udn, "uuid:nas-renderer");
    EXPECT_EQ(entry.friendlyName, "NAS Audio Out");
    EXPECT_EQ(entry.modelName, "AudioStation");
    EXPECT_EQ(entry.deviceType, "urn:schemas-upnp-org:device:MediaRenderer:1");
    EXPECT_EQ(entry.location, LOCATION);

    ASSERT_EQ(entry.services.size(), 2u);
    EXPECT_EQ(entry.services[0].serviceType, "urn:schemas-upnp-org:service:AVTransport:1");
    EXPECT_EQ(entry.services[0].controlURL, "http://192.168.1.60:49152/renderer/avt/control");
    EXPECT_EQ(entry.services[1].serviceId, "urn:upnp-org:serviceId:RenderingControl");
}

TEST(UPnPDescription, RootDeviceSkipsEmbeddedServices)
{
    ParsedDocument doc(NESTED_DESCRIPTION);
    ASSERT_NE(doc.get(), nullptr);

    RegistryEntry entry;
    ASSERT_TRUE(UPnPControlPoint::parseDescription(doc.get(), "uuid:nas-root", LOCATION, entry));

    EXPECT_EQ(entry.friendlyName, "Home NAS");
    EXPECT_EQ(entry.deviceType, "urn:schemas-upnp-org:device:MediaServer:1");

    // The embedded renderer's AVTransport must not leak into the root entry
    ASSERT_EQ(entry.services.size(), 1u);
    EXPECT_EQ(entry.services[0].serviceType, "urn:schemas-upnp-org:service:ContentDirectory:1");
}

TEST(UPnPDescription, UnknownUdnIsRejected)
{
    ParsedDocument doc(NESTED_DESCRIPTION);
    ASSERT_NE(doc.get(), nullptr);

    RegistryEntry entry;
    EXPECT_FALSE(UPnPControlPoint::parseDescription(doc.get(), "uuid:someone-else", LOCATION, entry));
}

TEST(UPnPDescription, UrlBaseWinsOverLocation)
{
    const char* xml =
        "<?xml version=\"1.0\"?>"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
        "<URLBase>http://192.168.1.50:9197/</URLBase>"
        "<device>"
        "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
        "<friendlyName>Living Room TV</friendlyName>"
        "<UDN>uuid:tv-1</UDN>"
        "<serviceList>"
        "<service>"
        "<serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>"
        "<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
        "<controlURL>upnp/control/AVTransport1</controlURL>"
        "</service>"
        "</serviceList>"
        "</device>"
        "</root>";

    ParsedDocument doc(xml);
    ASSERT_NE(doc.get(), nullptr);

    RegistryEntry entry;
    ASSERT_TRUE(UPnPControlPoint::parseDescription(doc.get(), "uuid:tv-1", LOCATION, entry));

    EXPECT_EQ(entry.manufacturer, "");
    ASSERT_EQ(entry.services.size(), 1u);
    EXPECT_EQ(entry.services[0].controlURL, "http://192.168.1.50:9197/upnp/control/AVTransport1");
}
