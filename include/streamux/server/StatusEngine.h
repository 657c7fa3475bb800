#pragma once

#include "streamux/protocol/HttpRequest.h"
#include "streamux/protocol/HttpResponse.h"
#include "streamux/server/ResourceStore.h"

#include <memory>
#include <string>

namespace streamux {
namespace server {

// Decides the status of a request against a ResourceStore. Checks run in a
// fixed order and the first match wins:
//   version != HTTP/1.1          -> 505
//   restricted path              -> 403
//   unresolvable path            -> 404
//   not modified since IMS date  -> 304
//   otherwise                    -> 200 (500 if the resource cannot be read)
class StatusEngine {
public:
    struct Options {
        std::string defaultFile = "test.html";
        bool gzip = false;
    };

    static const char kSupportedVersion[];

    StatusEngine(std::shared_ptr<const ResourceStore> store, Options options);

    protocol::HttpResponse Decide(const protocol::HttpRequest& req) const;

    // Status line, Date and Server headers, plus the canned HTML body for
    // error codes. detail is appended to a 500 body.
    static protocol::HttpResponse MakeResponse(protocol::HttpResponse::HttpStatusCode code,
                                               const std::string& detail = std::string());

private:
    // Request path mapped to a store name; "/" becomes the default file.
    std::string ResourceName(const std::string& path) const;
    bool NotModified(const protocol::HttpRequest& req, const std::string& name) const;
    void MaybeCompress(const protocol::HttpRequest& req, protocol::HttpResponse* resp) const;

    std::shared_ptr<const ResourceStore> store_;
    const Options options_;
};

} // namespace server
} // namespace streamux
