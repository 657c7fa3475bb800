#include "streamux/network/Acceptor.h"
#include "streamux/network/EventLoop.h"
#include "streamux/network/InetAddress.h"
#include "streamux/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

namespace streamux {
namespace network {

static int CreateNonblockingOrDie() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "Acceptor: socket() failed errno=" << errno;
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr)
    : loop_(loop),
      acceptSocket_(CreateNonblockingOrDie()),
      acceptChannel_(loop, acceptSocket_.fd()),
      listening_(false) {
    acceptSocket_.SetReuseAddr(true);
    acceptSocket_.BindAddress(listenAddr);

    acceptChannel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    acceptChannel_.DisableAll();
    acceptChannel_.Remove();
}

void Acceptor::Listen() {
    listening_ = true;
    acceptSocket_.Listen();
    acceptChannel_.EnableReading();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = acceptSocket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (newConnectionCallback_) {
            newConnectionCallback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    } else {
        const int savedErrno = errno;
        LOG_ERROR << "Acceptor::HandleRead accept failed errno=" << savedErrno;
        if (savedErrno == EMFILE) {
            LOG_ERROR << "sockfd reached limit";
        }
    }
}

} // namespace network
} // namespace streamux
