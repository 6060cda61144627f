// Unit tests for the DIDL-Lite metadata sent with SetAVTransportURI.

#include "cast/DidlLiteBuilder.h"

#include <gtest/gtest.h>

#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(DidlLiteBuilderTest, ProtocolInfoForHls)
{
    EXPECT_STREQ(DidlLiteBuilder::protocolInfoFor("http://h/live.m3u8"),
                 "http-get:*:application/vnd.apple.mpegurl:*");
    EXPECT_STREQ(DidlLiteBuilder::protocolInfoFor("http://h/live.m3u8?token=abc"),
                 "http-get:*:application/vnd.apple.mpegurl:*");
}

TEST(DidlLiteBuilderTest, ProtocolInfoForMp4)
{
    EXPECT_STREQ(DidlLiteBuilder::protocolInfoFor("http://h/movie.mp4"), "http-get:*:video/mp4:*");
}

TEST(DidlLiteBuilderTest, ProtocolInfoFallsBackToGenericVideo)
{
    EXPECT_STREQ(DidlLiteBuilder::protocolInfoFor("http://h/movie.mkv"), "http-get:*:video/*:*");
    EXPECT_STREQ(DidlLiteBuilder::protocolInfoFor("http://h/movie.mp4?x=1"), "http-get:*:video/*:*");
    EXPECT_STREQ(DidlLiteBuilder::protocolInfoFor("http://h/stream"), "http-get:*:video/*:*");
}

TEST(DidlLiteBuilderTest, BuildsVideoItem)
{
    const std::string didl = DidlLiteBuilder::build("http://192.168.1.10:8000/movie.mp4", "Holiday");

    EXPECT_EQ(didl.find("<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\""), 0u);
    EXPECT_TRUE(contains(didl, "xmlns:dc=\"http://purl.org/dc/elements/1.1/\""));
    EXPECT_TRUE(contains(didl, "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\""));
    EXPECT_TRUE(contains(didl, "xmlns:dlna=\"urn:schemas-dlna-org:metadata-1-0/\""));
    EXPECT_TRUE(contains(didl, "<item id=\"1\" parentID=\"0\" restricted=\"1\">"));
    EXPECT_TRUE(contains(didl, "<dc:title>Holiday</dc:title>"));
    EXPECT_TRUE(contains(didl, "<upnp:class>object.item.videoItem</upnp:class>"));
    EXPECT_TRUE(contains(didl,
        "<res protocolInfo=\"http-get:*:video/mp4:*\">http://192.168.1.10:8000/movie.mp4</res>"));
    EXPECT_TRUE(contains(didl, "</item></DIDL-Lite>"));
}

TEST(DidlLiteBuilderTest, EmptyTitleBecomesVideo)
{
    const std::string didl = DidlLiteBuilder::build("http://h/a.mp4", "");
    EXPECT_TRUE(contains(didl, "<dc:title>Video</dc:title>"));
}

TEST(DidlLiteBuilderTest, EscapesTitleAndUrl)
{
    const std::string didl = DidlLiteBuilder::build("http://h/a.mp4?x=1&y=2", "Tom & Jerry <\"Live\">");

    EXPECT_TRUE(contains(didl, "<dc:title>Tom &amp; Jerry &lt;&quot;Live&quot;&gt;</dc:title>"));
    EXPECT_TRUE(contains(didl, ">http://h/a.mp4?x=1&amp;y=2</res>"));
    EXPECT_FALSE(contains(didl, "Tom & Jerry"));
}

TEST(DidlLiteBuilderTest, EscapeXmlHandlesApostrophe)
{
    EXPECT_EQ(DidlLiteBuilder::escapeXml("It's"), "It&apos;s");
    EXPECT_EQ(DidlLiteBuilder::escapeXml("plain"), "plain");
}

TEST(DidlLiteBuilderTest, RepeatedBuildIsByteIdentical)
{
    const char* const urls[] = {
        "http://192.168.1.10:8000/live/index.m3u8?token=a&b=<c>",
        "https://cdn.example.com/films/Tom's \"cut\".mp4",
        "http://192.168.1.10:8000/stream?id=42&fmt=raw",
    };

    for (const char* url : urls) {
        const std::string first = DidlLiteBuilder::build(url, "Tom & Jerry <\"Live\">");
        const std::string second = DidlLiteBuilder::build(url, "Tom & Jerry <\"Live\">");
        EXPECT_EQ(first, second) << url;
    }
}
