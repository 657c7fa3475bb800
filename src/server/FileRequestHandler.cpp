#include "streamux/server/FileRequestHandler.h"
#include "streamux/common/Logger.h"

namespace streamux {
namespace server {

void FileRequestHandler::Handle(const protocol::HttpRequest& req, ResponseWriter* writer) {
    const protocol::HttpResponse resp = engine_.Decide(req);
    LOG_INFO << req.method() << " " << req.path() << " " << req.version() << " -> "
             << static_cast<int>(resp.statusCode());
    if (!writer->WriteResponse(resp)) {
        LOG_WARN << "response to " << req.path() << " abandoned, connection gone";
    }
}

} // namespace server
} // namespace streamux
