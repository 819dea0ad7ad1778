// src/Network/UDPSocket.cpp

#include "Network/UDPSocket.h"
#include "Utils/Logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {
constexpr size_t kMaxDatagram = 65507;
}

UDPSocket::UDPSocket() = default;

UDPSocket::~UDPSocket() {
    Close();
}

bool UDPSocket::Bind(uint16_t localPort, const SocketConfig& cfg) {
    m_cfg = cfg;
    m_sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (m_sock < 0) {
        Logger::Error("UDPSocket: socket() failed: %s", std::strerror(errno));
        return false;
    }

    if (!Configure(cfg)) {
        Close();
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(localPort);

    if (::bind(m_sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        Logger::Error("UDPSocket: bind to port %u failed: %s", localPort, std::strerror(errno));
        Close();
        return false;
    }
    return true;
}

bool UDPSocket::Configure(const SocketConfig& cfg) {
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(cfg.recvTimeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((cfg.recvTimeout.count() % 1000) * 1000);
    if (setsockopt(m_sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        Logger::Warn("UDPSocket: SO_RCVTIMEO not applied: %s", std::strerror(errno));
    }

    int rcv = static_cast<int>(cfg.recvBufferSize);
    int snd = static_cast<int>(cfg.sendBufferSize);
    setsockopt(m_sock, SOL_SOCKET, SO_RCVBUF, &rcv, sizeof(rcv));
    setsockopt(m_sock, SOL_SOCKET, SO_SNDBUF, &snd, sizeof(snd));

    int flags = fcntl(m_sock, F_GETFL, 0);
    if (flags < 0) return false;
    if (cfg.nonBlocking) flags |= O_NONBLOCK;
    else flags &= ~O_NONBLOCK;
    return fcntl(m_sock, F_SETFL, flags) == 0;
}

void UDPSocket::Close() {
    if (m_sock < 0) return;
    ::close(m_sock);
    m_sock = -1;
}

bool UDPSocket::IsOpen() const {
    return m_sock >= 0;
}

uint16_t UDPSocket::GetLocalPort() const {
    if (!IsOpen()) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(m_sock, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

bool UDPSocket::SendTo(const SocketAddress& to, const std::vector<uint8_t>& data) {
    if (!IsOpen()) return false;
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(to.port);
    if (inet_pton(AF_INET, to.ip.c_str(), &dest.sin_addr) != 1) {
        Logger::Warn("UDPSocket: bad address %s", to.ToString().c_str());
        return false;
    }

    ssize_t sent = sendto(m_sock, data.data(), data.size(), 0,
                          reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent != static_cast<ssize_t>(data.size())) {
        Logger::Debug("UDPSocket: sendto %s failed: %s", to.ToString().c_str(), std::strerror(errno));
        return false;
    }
    return true;
}

int UDPSocket::ReceiveFrom(SocketAddress& from, std::vector<uint8_t>& buffer) {
    if (!IsOpen()) return -1;
    buffer.resize(kMaxDatagram);
    sockaddr_in src{};
    socklen_t addrLen = sizeof(src);
    ssize_t len = recvfrom(m_sock, buffer.data(), buffer.size(), 0,
                           reinterpret_cast<sockaddr*>(&src), &addrLen);
    if (len < 0) {
        buffer.clear();
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
        return -1;
    }
    buffer.resize(static_cast<size_t>(len));

    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
    from.ip = ip;
    from.port = ntohs(src.sin_port);
    return static_cast<int>(len);
}
