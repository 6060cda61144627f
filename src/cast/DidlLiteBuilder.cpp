#include "DidlLiteBuilder.h"

#include <sstream>

static bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

const char* DidlLiteBuilder::protocolInfoFor(const std::string& url) {
    if (endsWith(url, ".m3u8") || url.find(".m3u8?") != std::string::npos) {
        return PROTOCOL_HLS;
    }
    if (endsWith(url, ".mp4")) {
        return PROTOCOL_MP4;
    }
    return PROTOCOL_VIDEO;
}

std::string DidlLiteBuilder::escapeXml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());

    for (char c : text) {
        switch (c) {
            case '&':  escaped += "&amp;";  break;
            case '<':  escaped += "&lt;";   break;
            case '>':  escaped += "&gt;";   break;
            case '"':  escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default:   escaped += c;        break;
        }
    }
    return escaped;
}

std::string DidlLiteBuilder::build(const std::string& url, const std::string& title) {
    const std::string safeTitle = title.empty() ? DEFAULT_TITLE : title;

    std::stringstream ss;
    ss << "<DIDL-Lite xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" "
       << "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
       << "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\" "
       << "xmlns:dlna=\"urn:schemas-dlna-org:metadata-1-0/\">"
       << "<item id=\"1\" parentID=\"0\" restricted=\"1\">"
       << "<dc:title>" << escapeXml(safeTitle) << "</dc:title>"
       << "<upnp:class>object.item.videoItem</upnp:class>"
       << "<res protocolInfo=\"" << protocolInfoFor(url) << "\">" << escapeXml(url) << "</res>"
       << "</item>"
       << "</DIDL-Lite>";
    return ss.str();
}
