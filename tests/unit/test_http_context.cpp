#include "streamux/protocol/HttpContext.h"
#include "streamux/protocol/HttpResponse.h"
#include "streamux/network/Buffer.h"
#include "streamux/common/Logger.h"

#include <cassert>
#include <chrono>
#include <string>

using namespace streamux::protocol;
using namespace streamux::network;
using namespace streamux::common;

namespace {

std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

} // namespace

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Partial arrival
    buf.Append("GET /index.html?id=123 HTTP/1.1\r\nHost: ");
    assert(context.parseRequest(&buf, now()));
    assert(!context.gotAll());

    buf.Append("localhost\r\nuser-agent: curl/7.68.0\r\nAccept: */*\r\n\r\n");
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());

    const HttpRequest& req = context.request();
    assert(req.method() == "GET");
    assert(req.path() == "/index.html");
    assert(req.query() == "?id=123");
    assert(req.version() == "HTTP/1.1");
    assert(req.getHeader("Host") == "localhost");
    assert(req.getHeader("User-Agent") == "curl/7.68.0");
    assert(req.getHeader("user-agent") == "curl/7.68.0");
    assert(!req.multiplexed());
    assert(req.rawHead() ==
           "GET /index.html?id=123 HTTP/1.1\r\nHost: localhost\r\nuser-agent: curl/7.68.0\r\nAccept: */*\r\n");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "testParseRequest PASS";
}

void testStreamIdAnywhereInHead() {
    HttpContext context;
    Buffer buf;

    // Before the request line
    buf.Append("STREAM-ID: 7\r\nGET /a.html HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(context.request().multiplexed());
    assert(*context.request().streamId() == 7);
    assert(context.request().path() == "/a.html");
    assert(!context.request().hasHeader("Stream-Id"));
    assert(context.request().rawHead() == "GET /a.html HTTP/1.1\r\nHost: x\r\n");
    context.reset();

    // Among the headers, any casing
    buf.Append("GET /b.html HTTP/1.1\r\nHost: x\r\nstream-id:  42 \r\n\r\n");
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(*context.request().streamId() == 42);
    assert(context.request().rawHead().find("stream-id") == std::string::npos);
    context.reset();

    // Unparseable ids leave the request non-multiplexed
    buf.Append("GET /c.html HTTP/1.1\r\nSTREAM-ID: abc\r\n\r\n");
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(!context.request().multiplexed());
    LOG_INFO << "testStreamIdAnywhereInHead PASS";
}

void testPipelinedWithBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("\r\nPOST /echo HTTP/1.1\r\nContent-Length: 5\r\n\r\nhel");
    assert(context.parseRequest(&buf, now()));
    assert(!context.gotAll());

    buf.Append("loGET /next HTTP/1.1\r\n\r\n");
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(context.request().method() == "POST");
    assert(context.request().body() == "hello");
    context.reset();

    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(context.request().path() == "/next");
    assert(context.request().body().empty());
    LOG_INFO << "testPipelinedWithBody PASS";
}

void testMalformedIsConsumed() {
    HttpContext context;
    Buffer buf;

    buf.Append("GARBAGE\r\n\r\nGET /ok HTTP/1.1\r\n\r\n");
    assert(!context.parseRequest(&buf, now()));
    assert(!context.error().empty());
    context.reset();
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(context.request().path() == "/ok");
    context.reset();

    buf.Append("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n");
    assert(!context.parseRequest(&buf, now()));
    assert(buf.ReadableBytes() == 0);
    context.reset();

    buf.Append("GET / HTTP/1.1\r\nContent-Length: -1\r\n\r\n");
    assert(!context.parseRequest(&buf, now()));
    assert(buf.ReadableBytes() == 0);
    context.reset();

    // The body of a dropped message must not be read as the next request.
    const std::string bodyText = "GET /test.html HTTP/1.0\r\n\r\n";
    buf.Append("GET /x HTTP/1.1 extra\r\ncontent-length: " + std::to_string(bodyText.size()) + "\r\n\r\n" +
               bodyText);
    assert(!context.parseRequest(&buf, now()));
    context.reset();
    assert(context.parseRequest(&buf, now()));
    assert(!context.gotAll());
    assert(buf.ReadableBytes() == 0);

    // Same, with the body arriving in pieces after the head.
    buf.Append("GET / HTTP/1.1\r\nBroken\r\nContent-Length: 11\r\n\r\nGET ");
    assert(!context.parseRequest(&buf, now()));
    context.reset();
    assert(context.parseRequest(&buf, now()));
    assert(!context.gotAll());
    buf.Append("/a HTTP");
    assert(context.parseRequest(&buf, now()));
    assert(!context.gotAll());
    assert(buf.ReadableBytes() == 0);
    buf.Append("GET /after HTTP/1.1\r\n\r\n");
    assert(context.parseRequest(&buf, now()));
    assert(context.gotAll());
    assert(context.request().path() == "/after");
    LOG_INFO << "testMalformedIsConsumed PASS";
}

void testHeaderLimit() {
    HttpContext context(64);
    Buffer buf;
    buf.Append("GET / HTTP/1.1\r\nX-Long: " + std::string(100, 'a'));
    assert(!context.parseRequest(&buf, now()));
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "testHeaderLimit PASS";
}

void testResponseSerialization() {
    HttpResponse resp;
    resp.setStatusCode(HttpResponse::k404NotFound);
    resp.setContentType("text/html");
    resp.setBody("<h1>404 Not Found</h1>");

    const std::string out = resp.toString();
    assert(out.find("HTTP/1.1 404 Not Found\r\n") == 0);
    assert(out.find("Content-Length: 22\r\n") != std::string::npos);
    assert(out.find("Content-Type: text/html\r\n") != std::string::npos);
    assert(out.size() >= 22 && out.compare(out.size() - 22, 22, "<h1>404 Not Found</h1>") == 0);

    resp.setBody("");
    assert(resp.getHeader("Content-Length").empty());
    assert(std::string(HttpResponse::ReasonPhrase(HttpResponse::k505HttpVersionNotSupported)) ==
           "HTTP Version Not Supported");
    LOG_INFO << "testResponseSerialization PASS";
}

int main() {
    testParseRequest();
    testStreamIdAnywhereInHead();
    testPipelinedWithBody();
    testMalformedIsConsumed();
    testHeaderLimit();
    testResponseSerialization();
    LOG_INFO << "All HttpContext tests passed";
    return 0;
}
