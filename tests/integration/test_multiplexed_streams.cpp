#include "streamux/server/MultiplexServer.h"
#include "streamux/server/FileRequestHandler.h"
#include "streamux/server/StatusEngine.h"
#include "streamux/protocol/StreamFramer.h"
#include "streamux/network/EventLoop.h"
#include "streamux/network/InetAddress.h"
#include "streamux/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <string>
#include <thread>

using namespace streamux::server;
using namespace streamux::protocol;
using namespace streamux::network;
using namespace streamux::common;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static std::string recvUntilClose(int fd, int timeoutMs = 5000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static void sendAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, 0);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

static void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

static std::string bigBody() {
    std::string body;
    for (int i = 0; body.size() < 6000; ++i) {
        body += "<p>row " + std::to_string(i) + "</p>\n";
    }
    return body;
}

// Many streams over one connection: every response comes back complete under
// its own id, whatever order the workers finish in.
static void testManyStreams(uint16_t port) {
    const int kStreams = 24;
    std::map<uint64_t, std::string> expectedStatus;
    std::string wire;
    for (int i = 0; i < kStreams; ++i) {
        const uint64_t id = 100 + static_cast<uint64_t>(i);
        std::string path;
        switch (i % 4) {
            case 0: path = "/test.html"; expectedStatus[id] = "HTTP/1.1 200 OK\r\n"; break;
            case 1: path = "/big.html"; expectedStatus[id] = "HTTP/1.1 200 OK\r\n"; break;
            case 2: path = "/private.html"; expectedStatus[id] = "HTTP/1.1 403 Forbidden\r\n"; break;
            default: path = "/gone.html"; expectedStatus[id] = "HTTP/1.1 404 Not Found\r\n"; break;
        }
        // STREAM-ID placed before, inside and after the other header lines.
        if (i % 3 == 0) {
            wire += "STREAM-ID: " + std::to_string(id) + "\r\nGET " + path + " HTTP/1.1\r\nHost: t\r\n\r\n";
        } else if (i % 3 == 1) {
            wire += "GET " + path + " HTTP/1.1\r\nSTREAM-ID: " + std::to_string(id) + "\r\nHost: t\r\n\r\n";
        } else {
            wire += "GET " + path + " HTTP/1.1\r\nHost: t\r\nSTREAM-ID: " + std::to_string(id) + "\r\n\r\n";
        }
    }

    int fd = connectTo(port);
    sendAll(fd, wire);
    assert(::shutdown(fd, SHUT_WR) == 0);
    const std::string received = recvUntilClose(fd);
    ::close(fd);

    FrameDecoder decoder;
    decoder.Append(received);
    StreamReassembler reassembler;
    Frame frame;
    FrameDecoder::Result r;
    size_t frames = 0;
    while ((r = decoder.Next(&frame)) == FrameDecoder::Result::kFrame) {
        ++frames;
        assert(frame.payload.size() <= kMaxFramePayload);
        assert(expectedStatus.count(frame.streamId) == 1);
        assert(reassembler.Add(frame) != StreamReassembler::Result::kRejected);
    }
    assert(r == FrameDecoder::Result::kNeedMore);
    assert(decoder.bufferedBytes() == 0);
    assert(reassembler.completedCount() == static_cast<size_t>(kStreams));
    // big.html needs several frames
    assert(frames > static_cast<size_t>(kStreams));

    const std::string big = bigBody();
    for (const auto& kv : expectedStatus) {
        std::optional<std::string> resp = reassembler.Take(kv.first);
        assert(resp);
        assert(resp->find(kv.second) == 0);
        if ((kv.first - 100) % 4 == 1) {
            assert(resp->size() > big.size());
            assert(resp->compare(resp->size() - big.size(), big.size(), big) == 0);
        }
    }
    LOG_INFO << "testManyStreams PASS (" << frames << " frames)";
}

// Delimited framing: a response that fits in one payload is a single frame.
static void testDelimitedFormat(uint16_t port) {
    int fd = connectTo(port);
    sendAll(fd, "GET /test.html HTTP/1.1\r\nSTREAM-ID: 9\r\n\r\n");
    assert(::shutdown(fd, SHUT_WR) == 0);
    const std::string received = recvUntilClose(fd);
    ::close(fd);

    assert(received.find("9|1|HTTP/1.1 200 OK\r\n") == 0);
    Frame frame;
    assert(FrameCodec::Decode(FrameCodec::Format::kDelimited, received, &frame));
    assert(frame.streamId == 9 && frame.endFlag);
    assert(frame.payload.find("multiplexed page") != std::string::npos);
    LOG_INFO << "testDelimitedFormat PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);

    char tmpl[] = "/tmp/streamux_mux_XXXXXX";
    const std::string root = ::mkdtemp(tmpl);
    writeFile(root + "/test.html", "<html>multiplexed page</html>");
    writeFile(root + "/private.html", "<html>private</html>");
    writeFile(root + "/big.html", bigBody());

    EventLoop loop;
    auto store = std::make_shared<FileResourceStore>(root, std::set<std::string>{"private.html"});
    auto handler = std::make_shared<FileRequestHandler>(StatusEngine(store, StatusEngine::Options()));

    MultiplexServer::Options lengthOpts;
    lengthOpts.workers = 8;
    lengthOpts.ioThreads = 2;
    MultiplexServer lengthServer(&loop, InetAddress(0, true), "MuxLength", handler, lengthOpts);

    MultiplexServer::Options delimitedOpts;
    delimitedOpts.workers = 2;
    delimitedOpts.frameFormat = FrameCodec::Format::kDelimited;
    MultiplexServer delimitedServer(&loop, InetAddress(0, true), "MuxDelimited", handler, delimitedOpts);

    const uint16_t lengthPort = lengthServer.listenAddress().toPort();
    const uint16_t delimitedPort = delimitedServer.listenAddress().toPort();
    lengthServer.Start();
    delimitedServer.Start();

    std::thread client([&]() {
        testManyStreams(lengthPort);
        testDelimitedFormat(delimitedPort);
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();

    for (const char* name : {"test.html", "private.html", "big.html"}) {
        ::unlink((root + "/" + name).c_str());
    }
    ::rmdir(root.c_str());
    LOG_INFO << "All multiplexed stream tests passed";
    return 0;
}
