#include "streamux/server/StatusEngine.h"
#include "streamux/protocol/Compression.h"
#include "streamux/protocol/HttpDate.h"
#include "streamux/protocol/MimeTypes.h"
#include "streamux/common/Logger.h"

namespace streamux {
namespace server {

using protocol::HttpRequest;
using protocol::HttpResponse;

const char StatusEngine::kSupportedVersion[] = "HTTP/1.1";

StatusEngine::StatusEngine(std::shared_ptr<const ResourceStore> store, Options options)
    : store_(std::move(store)),
      options_(std::move(options)) {
}

HttpResponse StatusEngine::MakeResponse(HttpResponse::HttpStatusCode code, const std::string& detail) {
    HttpResponse resp;
    resp.setStatusCode(code);
    resp.addHeader("Date", protocol::HttpDate::Now());
    resp.addHeader("Server", HttpResponse::kServerName);

    std::string body;
    switch (code) {
        case HttpResponse::k403Forbidden:
        case HttpResponse::k404NotFound:
        case HttpResponse::k505HttpVersionNotSupported:
            body = "<h1>" + std::to_string(static_cast<int>(code)) + " " +
                   HttpResponse::ReasonPhrase(code) + "</h1>";
            break;
        case HttpResponse::k500InternalServerError:
            body = "<h1>500 Internal Server Error</h1>";
            if (!detail.empty()) body += "<p>" + detail + "</p>";
            break;
        default:
            break;
    }
    if (!body.empty()) {
        resp.setContentType("text/html");
        resp.setBody(body);
    }
    return resp;
}

std::string StatusEngine::ResourceName(const std::string& path) const {
    if (path.empty() || path == "/") return options_.defaultFile;
    return path;
}

bool StatusEngine::NotModified(const HttpRequest& req, const std::string& name) const {
    if (!req.hasHeader("If-Modified-Since")) return false;
    const std::string ims = req.getHeader("If-Modified-Since");
    std::optional<time_t> since = protocol::HttpDate::Parse(ims);
    if (!since) {
        LOG_DEBUG << "StatusEngine: ignoring malformed If-Modified-Since '" << ims << "'";
        return false;
    }
    std::optional<time_t> mtime = store_->LastModified(name);
    return mtime && *mtime <= *since;
}

void StatusEngine::MaybeCompress(const HttpRequest& req, HttpResponse* resp) const {
    if (!options_.gzip || resp->body().empty()) return;
    const auto enc = protocol::Compression::Negotiate(req.getHeader("Accept-Encoding"));
    if (enc != protocol::Compression::Encoding::kGzip) return;

    std::string compressed;
    if (!protocol::Compression::Compress(enc, resp->body(), &compressed)) {
        LOG_WARN << "StatusEngine: gzip failed, sending identity body";
        return;
    }
    resp->addHeader("Content-Encoding", "gzip");
    resp->setBody(compressed);
}

HttpResponse StatusEngine::Decide(const HttpRequest& req) const {
    if (req.version() != kSupportedVersion) {
        LOG_DEBUG << "StatusEngine: " << req.path() << " -> 505 (version " << req.version() << ")";
        return MakeResponse(HttpResponse::k505HttpVersionNotSupported);
    }

    const std::string name = ResourceName(req.path());
    if (store_->IsRestricted(name)) {
        LOG_DEBUG << "StatusEngine: " << req.path() << " -> 403";
        return MakeResponse(HttpResponse::k403Forbidden);
    }
    if (!store_->Exists(name)) {
        LOG_DEBUG << "StatusEngine: " << req.path() << " -> 404";
        return MakeResponse(HttpResponse::k404NotFound);
    }
    if (NotModified(req, name)) {
        LOG_DEBUG << "StatusEngine: " << req.path() << " -> 304";
        return MakeResponse(HttpResponse::k304NotModified);
    }

    std::optional<std::string> content = store_->Read(name);
    if (!content) {
        LOG_WARN << "StatusEngine: " << req.path() << " exists but cannot be read";
        return MakeResponse(HttpResponse::k500InternalServerError, "cannot read " + name);
    }

    HttpResponse resp = MakeResponse(HttpResponse::k200Ok);
    resp.setContentType(protocol::MimeTypeForPath(name));
    if (std::optional<time_t> mtime = store_->LastModified(name)) {
        resp.addHeader("Last-Modified", protocol::HttpDate::Format(*mtime));
    }
    resp.setBody(*content);
    // Zero-length files still announce their length.
    if (content->empty()) {
        resp.addHeader("Content-Length", "0");
    }
    MaybeCompress(req, &resp);
    LOG_DEBUG << "StatusEngine: " << req.path() << " -> 200 (" << content->size() << " bytes)";
    return resp;
}

} // namespace server
} // namespace streamux
