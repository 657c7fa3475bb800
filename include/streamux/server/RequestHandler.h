#pragma once

#include "streamux/protocol/HttpRequest.h"
#include "streamux/server/ResponseWriter.h"

namespace streamux {
namespace server {

// Produces the response for one request. Runs on a worker thread and may
// block; several calls run concurrently, also for the same connection.
class RequestHandler {
public:
    virtual ~RequestHandler() = default;
    virtual void Handle(const protocol::HttpRequest& req, ResponseWriter* writer) = 0;
};

} // namespace server
} // namespace streamux
