#include "streamux/protocol/MimeTypes.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace streamux {
namespace protocol {

std::string MimeTypeForPath(const std::string& path) {
    static const std::unordered_map<std::string, std::string> kMimeTypes = {
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".txt", "text/plain"},
        {".xml", "application/xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".ico", "image/x-icon"},
        {".pdf", "application/pdf"},
    };

    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "text/html";
    }

    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kMimeTypes.find(ext);
    return it != kMimeTypes.end() ? it->second : "text/html";
}

} // namespace protocol
} // namespace streamux
