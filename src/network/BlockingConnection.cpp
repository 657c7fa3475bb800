#include "streamux/network/BlockingConnection.h"
#include "streamux/network/Socket.h"
#include "streamux/common/Logger.h"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace streamux {
namespace network {

namespace {

std::string ErrnoText(const char* what, int err) {
    return std::string(what) + ": " + std::strerror(err);
}

} // namespace

std::unique_ptr<BlockingConnection> BlockingConnection::Connect(const InetAddress& addr,
                                                                int timeoutMs,
                                                                std::string* error) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        *error = ErrnoText("socket", errno);
        return nullptr;
    }

    const int rc = ::connect(fd, addr.getSockAddr(), sizeof(struct sockaddr_in));
    if (rc != 0) {
        const int e = errno;
        if (e != EINPROGRESS) {
            ::close(fd);
            *error = ErrnoText(("connect " + addr.toIpPort()).c_str(), e);
            return nullptr;
        }

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        int r;
        do {
            r = ::poll(&pfd, 1, timeoutMs);
        } while (r < 0 && errno == EINTR);
        if (r == 0) {
            ::close(fd);
            *error = "connect " + addr.toIpPort() + ": timed out";
            return nullptr;
        }
        int soerr = 0;
        socklen_t sl = sizeof(soerr);
        if (r < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &sl) != 0 || soerr != 0) {
            const int err = (r < 0) ? errno : soerr;
            ::close(fd);
            *error = ErrnoText(("connect " + addr.toIpPort()).c_str(), err);
            return nullptr;
        }
    }

    LOG_DEBUG << "BlockingConnection connected to " << addr.toIpPort() << " fd=" << fd;
    return std::unique_ptr<BlockingConnection>(new BlockingConnection(fd, addr, timeoutMs));
}

BlockingConnection::BlockingConnection(int sockfd, const InetAddress& peerAddr, int timeoutMs)
    : socket_(new Socket(sockfd)),
      peerAddr_(peerAddr),
      timeoutMs_(timeoutMs) {
    socket_->SetTcpNoDelay(true);
}

BlockingConnection::~BlockingConnection() = default;

const char* BlockingConnection::StatusToString(Status s) {
    switch (s) {
        case Status::kOk: return "ok";
        case Status::kEof: return "eof";
        case Status::kTimeout: return "timeout";
        case Status::kError: return "error";
    }
    return "unknown";
}

BlockingConnection::Status BlockingConnection::WaitFor(short events) {
    pollfd pfd;
    pfd.fd = socket_->fd();
    pfd.events = events;
    pfd.revents = 0;
    int r;
    do {
        r = ::poll(&pfd, 1, timeoutMs_);
    } while (r < 0 && errno == EINTR);
    if (r == 0) {
        lastError_ = "upstream " + peerAddr_.toIpPort() + ": timed out";
        return Status::kTimeout;
    }
    if (r < 0) {
        lastError_ = ErrnoText("poll", errno);
        return Status::kError;
    }
    // POLLHUP/POLLERR are left to the following send()/recv() to report.
    return Status::kOk;
}

BlockingConnection::Status BlockingConnection::SendAll(const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        Status st = WaitFor(POLLOUT);
        if (st != Status::kOk) return st;
        const ssize_t n = ::send(socket_->fd(), data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        lastError_ = ErrnoText("send", errno);
        return Status::kError;
    }
    return Status::kOk;
}

BlockingConnection::Status BlockingConnection::Receive(std::string* out, size_t maxBytes) {
    std::vector<char> buf(maxBytes);
    while (true) {
        Status st = WaitFor(POLLIN);
        if (st != Status::kOk) return st;
        const ssize_t n = ::recv(socket_->fd(), buf.data(), buf.size(), 0);
        if (n > 0) {
            out->append(buf.data(), static_cast<size_t>(n));
            return Status::kOk;
        }
        if (n == 0) return Status::kEof;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
        lastError_ = ErrnoText("recv", errno);
        return Status::kError;
    }
}

} // namespace network
} // namespace streamux
