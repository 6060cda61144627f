#ifndef DLNACAST_DIDL_LITE_BUILDER_H
#define DLNACAST_DIDL_LITE_BUILDER_H

#include <string>

/**
 * @brief Builds the DIDL-Lite item sent as CurrentURIMetaData
 *
 * Pure functions, no I/O. The protocolInfo is picked from the URL suffix
 * only; the media itself is never probed.
 */
class DidlLiteBuilder {
public:
    static constexpr const char* DEFAULT_TITLE = "Video";

    static constexpr const char* PROTOCOL_HLS = "http-get:*:application/vnd.apple.mpegurl:*";
    static constexpr const char* PROTOCOL_MP4 = "http-get:*:video/mp4:*";
    static constexpr const char* PROTOCOL_VIDEO = "http-get:*:video/*:*";

    /**
     * @brief Build the metadata document for a video item
     * @param url Media URL
     * @param title Item title ("Video" if empty)
     * @return DIDL-Lite XML
     */
    static std::string build(const std::string& url, const std::string& title);

    /**
     * @brief Select the res@protocolInfo for a URL
     *
     * .m3u8 (or .m3u8?query) -> HLS, .mp4 -> MP4, anything else -> video/ *
     */
    static const char* protocolInfoFor(const std::string& url);

    /**
     * @brief Escape & < > " ' for embedding in element text or attributes
     */
    static std::string escapeXml(const std::string& text);
};

#endif // DLNACAST_DIDL_LITE_BUILDER_H
