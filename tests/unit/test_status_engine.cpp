#include "streamux/server/StatusEngine.h"
#include "streamux/server/ResourceStore.h"
#include "streamux/protocol/Compression.h"
#include "streamux/protocol/HttpDate.h"
#include "streamux/common/Logger.h"

#include <sys/stat.h>
#include <unistd.h>
#include <utime.h>

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>

using namespace streamux::server;
using namespace streamux::protocol;
using namespace streamux::common;

namespace {

const time_t kMtime = 1700000000;

std::string MakeRoot() {
    char tmpl[] = "/tmp/streamux_engine_XXXXXX";
    const char* dir = ::mkdtemp(tmpl);
    assert(dir != nullptr);
    return dir;
}

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    out.close();
    struct utimbuf times;
    times.actime = kMtime;
    times.modtime = kMtime;
    assert(::utime(path.c_str(), &times) == 0);
}

HttpRequest MakeRequest(const std::string& path, const std::string& version = "HTTP/1.1") {
    HttpRequest req;
    const std::string method = "GET";
    req.setMethod(method.data(), method.data() + method.size());
    req.setPath(path.data(), path.data() + path.size());
    req.setVersion(version.data(), version.data() + version.size());
    return req;
}

void AddHeader(HttpRequest* req, const std::string& line) {
    const char* begin = line.data();
    const char* colon = begin + line.find(':');
    req->addHeader(begin, colon, begin + line.size());
}

} // namespace

void testStatusOrder(const std::string& root) {
    auto store = std::make_shared<FileResourceStore>(root, std::set<std::string>{"private.html"});
    StatusEngine engine(store, StatusEngine::Options());

    HttpResponse resp = engine.Decide(MakeRequest("/test.html"));
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(resp.body() == "<html>hello</html>");
    assert(resp.getHeader("Content-Type") == "text/html");
    assert(resp.getHeader("Content-Length") == "18");
    assert(resp.getHeader("Last-Modified") == HttpDate::Format(kMtime));
    assert(resp.getHeader("Server") == HttpResponse::kServerName);
    assert(!resp.getHeader("Date").empty());

    // "/" maps to the default file
    assert(engine.Decide(MakeRequest("/")).body() == "<html>hello</html>");

    assert(engine.Decide(MakeRequest("/private.html")).statusCode() == HttpResponse::k403Forbidden);
    assert(engine.Decide(MakeRequest("//./private.html")).statusCode() == HttpResponse::k403Forbidden);
    assert(engine.Decide(MakeRequest("/missing.html")).statusCode() == HttpResponse::k404NotFound);
    assert(engine.Decide(MakeRequest("/../etc/passwd")).statusCode() == HttpResponse::k404NotFound);
    assert(engine.Decide(MakeRequest("/sub")).statusCode() == HttpResponse::k404NotFound);

    // Version is checked first, even for restricted or missing paths.
    assert(engine.Decide(MakeRequest("/private.html", "HTTP/1.0")).statusCode() ==
           HttpResponse::k505HttpVersionNotSupported);
    HttpResponse v = engine.Decide(MakeRequest("/missing.html", "HTTP/2.0"));
    assert(v.statusCode() == HttpResponse::k505HttpVersionNotSupported);
    assert(v.body() == "<h1>505 HTTP Version Not Supported</h1>");

    HttpResponse forbidden = engine.Decide(MakeRequest("/private.html"));
    assert(forbidden.body() == "<h1>403 Forbidden</h1>");
    LOG_INFO << "testStatusOrder PASS";
}

void testConditionalGet(const std::string& root) {
    auto store = std::make_shared<FileResourceStore>(root, std::set<std::string>{"private.html"});
    StatusEngine engine(store, StatusEngine::Options());

    HttpRequest same = MakeRequest("/test.html");
    AddHeader(&same, "If-Modified-Since: " + HttpDate::Format(kMtime));
    HttpResponse resp = engine.Decide(same);
    assert(resp.statusCode() == HttpResponse::k304NotModified);
    assert(resp.body().empty());
    assert(resp.getHeader("Content-Length").empty());

    HttpRequest later = MakeRequest("/test.html");
    AddHeader(&later, "if-modified-since: " + HttpDate::Format(kMtime + 3600));
    assert(engine.Decide(later).statusCode() == HttpResponse::k304NotModified);

    HttpRequest older = MakeRequest("/test.html");
    AddHeader(&older, "If-Modified-Since: " + HttpDate::Format(kMtime - 1));
    assert(engine.Decide(older).statusCode() == HttpResponse::k200Ok);

    HttpRequest garbage = MakeRequest("/test.html");
    AddHeader(&garbage, "If-Modified-Since: not a date");
    assert(engine.Decide(garbage).statusCode() == HttpResponse::k200Ok);

    // 403 wins over 304
    HttpRequest restricted = MakeRequest("/private.html");
    AddHeader(&restricted, "If-Modified-Since: " + HttpDate::Format(kMtime + 3600));
    assert(engine.Decide(restricted).statusCode() == HttpResponse::k403Forbidden);
    LOG_INFO << "testConditionalGet PASS";
}

void testEmptyAndTypedFiles(const std::string& root) {
    auto store = std::make_shared<FileResourceStore>(root, std::set<std::string>());
    StatusEngine engine(store, StatusEngine::Options());

    HttpResponse empty = engine.Decide(MakeRequest("/empty.txt"));
    assert(empty.statusCode() == HttpResponse::k200Ok);
    assert(empty.getHeader("Content-Length") == "0");
    assert(empty.getHeader("Content-Type") == "text/plain");
    assert(empty.toString().find("\r\n\r\n") == empty.toString().size() - 4);

    HttpResponse css = engine.Decide(MakeRequest("/sub/site.css"));
    assert(css.statusCode() == HttpResponse::k200Ok);
    assert(css.getHeader("Content-Type") == "text/css");

    // nothing restricted in this store
    assert(engine.Decide(MakeRequest("/private.html")).statusCode() == HttpResponse::k200Ok);
    LOG_INFO << "testEmptyAndTypedFiles PASS";
}

void testGzip(const std::string& root) {
    auto store = std::make_shared<FileResourceStore>(root, std::set<std::string>());
    StatusEngine::Options opts;
    opts.gzip = true;
    StatusEngine engine(store, opts);

    HttpRequest req = MakeRequest("/big.html");
    AddHeader(&req, "Accept-Encoding: deflate, gzip");
    HttpResponse resp = engine.Decide(req);
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(resp.getHeader("Content-Encoding") == "gzip");
    assert(resp.getHeader("Content-Length") == std::to_string(resp.body().size()));

    std::string plain;
    assert(Compression::Decompress(Compression::Encoding::kGzip, resp.body(), &plain));
    assert(plain == std::string(5000, 'z'));

    HttpResponse identity = engine.Decide(MakeRequest("/big.html"));
    assert(identity.getHeader("Content-Encoding").empty());
    assert(identity.body().size() == 5000);
    LOG_INFO << "testGzip PASS";
}

void testMakeResponse() {
    HttpResponse resp = StatusEngine::MakeResponse(HttpResponse::k500InternalServerError, "origin down");
    assert(resp.statusCode() == HttpResponse::k500InternalServerError);
    assert(resp.body().find("origin down") != std::string::npos);
    assert(resp.getHeader("Content-Type") == "text/html");
    LOG_INFO << "testMakeResponse PASS";
}

int main() {
    const std::string root = MakeRoot();
    WriteFile(root + "/test.html", "<html>hello</html>");
    WriteFile(root + "/private.html", "<html>secret</html>");
    WriteFile(root + "/empty.txt", "");
    WriteFile(root + "/big.html", std::string(5000, 'z'));
    assert(::mkdir((root + "/sub").c_str(), 0755) == 0);
    WriteFile(root + "/sub/site.css", "body {}");

    testStatusOrder(root);
    testConditionalGet(root);
    testEmptyAndTypedFiles(root);
    testGzip(root);
    testMakeResponse();

    ::unlink((root + "/sub/site.css").c_str());
    ::rmdir((root + "/sub").c_str());
    for (const char* name : {"test.html", "private.html", "empty.txt", "big.html"}) {
        ::unlink((root + "/" + name).c_str());
    }
    ::rmdir(root.c_str());
    LOG_INFO << "All StatusEngine tests passed";
    return 0;
}
