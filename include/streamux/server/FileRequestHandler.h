#pragma once

#include "streamux/server/RequestHandler.h"
#include "streamux/server/StatusEngine.h"

namespace streamux {
namespace server {

// Answers every request from the StatusEngine's decision.
class FileRequestHandler : public RequestHandler {
public:
    explicit FileRequestHandler(StatusEngine engine)
        : engine_(std::move(engine)) {}

    void Handle(const protocol::HttpRequest& req, ResponseWriter* writer) override;

private:
    const StatusEngine engine_;
};

} // namespace server
} // namespace streamux
