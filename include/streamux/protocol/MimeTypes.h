#pragma once

#include <string>

namespace streamux {
namespace protocol {

// Content-Type for a resource path, chosen by its extension. Unknown or
// missing extensions map to text/html.
std::string MimeTypeForPath(const std::string& path);

} // namespace protocol
} // namespace streamux
