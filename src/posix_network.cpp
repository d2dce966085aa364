/**
 * POSIX sockets for discovery - SSDP multicast, route probe, TCP port probe
 */

#include "posix_network.h"
#include "config.h"
#include "response_parser.h"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

ScopedSocket::~ScopedSocket() {
    if (fd >= 0) {
        ::close(fd);
    }
}

static sockaddr_in makeAddress(const std::string& ip, uint16_t port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, ip.c_str(), &addr.sin_addr);
    return addr;
}

static int millisUntil(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? (int)left : 0;
}

static bool waitFor(int fd, short events, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);
    return rc > 0 && (pfd.revents & events);
}

PosixDiscoveryNetwork::PosixDiscoveryNetwork() : userAgent(SSDP_USER_AGENT) {
}

std::string PosixDiscoveryNetwork::buildSearchRequest(const std::string& serviceType) const {
    std::string msg;
    msg += "M-SEARCH * HTTP/1.1\r\n";
    msg += std::string("HOST: ") + SSDP_MULTICAST_ADDR + ":" + std::to_string(SSDP_PORT) + "\r\n";
    msg += "MAN: \"ssdp:discover\"\r\n";
    msg += "MX: " + std::to_string(SSDP_MX) + "\r\n";
    msg += "ST: " + serviceType + "\r\n";
    msg += "USER-AGENT: " + userAgent + "\r\n";
    msg += "\r\n";
    return msg;
}

// ============================================================================
// SSDP
// ============================================================================
bool PosixDiscoveryNetwork::searchMulticast(const std::string& serviceType, int timeoutMs,
                                            std::vector<Datagram>& replies) {
    ScopedSocket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        DEBUG_ERROR("[DISCOVERY] socket() failed: %s", std::strerror(errno));
        return false;
    }

    int reuse = 1;
    if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        DEBUG_ERROR("[DISCOVERY] setsockopt(SO_REUSEADDR) failed: %s", std::strerror(errno));
        return false;
    }
    unsigned char ttl = SSDP_MULTICAST_TTL;
    if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        DEBUG_ERROR("[DISCOVERY] setsockopt(IP_MULTICAST_TTL) failed: %s", std::strerror(errno));
        return false;
    }

    std::string request = buildSearchRequest(serviceType);
    sockaddr_in group = makeAddress(SSDP_MULTICAST_ADDR, SSDP_PORT);
    if (::sendto(sock.get(), request.data(), request.size(), 0,
                 reinterpret_cast<const sockaddr*>(&group), sizeof(group)) < 0) {
        DEBUG_ERROR("[DISCOVERY] M-SEARCH send failed: %s", std::strerror(errno));
        return false;
    }
    DEBUG_VERBOSE("[DISCOVERY] Sent M-SEARCH ST=%s", serviceType.c_str());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    char buf[SSDP_RECV_BUFFER_SIZE + 1];

    for (;;) {
        int left = millisUntil(deadline);
        if (left <= 0) break;

        timeval tv;
        tv.tv_sec = left / 1000;
        tv.tv_usec = (left % 1000) * 1000;
        if (::setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            DEBUG_WARN("[DISCOVERY] setsockopt(SO_RCVTIMEO) failed: %s", std::strerror(errno));
            break;
        }

        sockaddr_in from;
        socklen_t fromLen = sizeof(from);
        ssize_t len = ::recvfrom(sock.get(), buf, SSDP_RECV_BUFFER_SIZE, 0,
                                 reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (len < 0) {
            if (errno == EINTR) continue;
            // EAGAIN / EWOULDBLOCK: window closed
            break;
        }

        char addrText[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &from.sin_addr, addrText, sizeof(addrText))) continue;

        Datagram reply;
        reply.payload.assign(buf, (size_t)len);
        reply.sourceIp = addrText;
        replies.push_back(reply);
    }
    return true;
}

// ============================================================================
// Local address
// ============================================================================
bool PosixDiscoveryNetwork::localIPv4(std::string& ip) {
    ScopedSocket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) return false;

    // UDP connect sends nothing; it only selects the outbound interface
    sockaddr_in probe = makeAddress(SCAN_ROUTE_PROBE_ADDR, SCAN_ROUTE_PROBE_PORT);
    if (::connect(sock.get(), reinterpret_cast<const sockaddr*>(&probe), sizeof(probe)) < 0) {
        DEBUG_WARN("[DISCOVERY] No route for local address lookup: %s", std::strerror(errno));
        return false;
    }

    sockaddr_in local;
    socklen_t localLen = sizeof(local);
    if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &localLen) < 0) {
        return false;
    }

    char addrText[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &local.sin_addr, addrText, sizeof(addrText))) return false;
    ip = addrText;
    DEBUG_VERBOSE("[DISCOVERY] Local address %s", ip.c_str());
    return true;
}

// ============================================================================
// TCP probe
// ============================================================================
ProbeResult PosixDiscoveryNetwork::probePort(const std::string& ip, uint16_t port, int timeoutMs,
                                             bool httpProbe, const std::vector<std::string>& keywords) {
    ScopedSocket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) return ProbeResult::Closed;

    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return ProbeResult::Closed;
    }

    sockaddr_in addr = makeAddress(ip, port);
    int rc = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (rc < 0) {
        if (errno != EINPROGRESS) return ProbeResult::Closed;
        if (!waitFor(sock.get(), POLLOUT, timeoutMs)) return ProbeResult::Closed;

        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0 || soError != 0) {
            return ProbeResult::Closed;
        }
    }

    if (!httpProbe) return ProbeResult::Open;

    std::string request = "GET / HTTP/1.1\r\nHost: " + ip + "\r\n\r\n";
    if (::send(sock.get(), request.data(), request.size(), MSG_NOSIGNAL) < 0) {
        return ProbeResult::Open;
    }
    if (!waitFor(sock.get(), POLLIN, timeoutMs)) {
        return ProbeResult::Open;
    }

    char buf[SSDP_RECV_BUFFER_SIZE];
    ssize_t len = ::recv(sock.get(), buf, sizeof(buf), 0);
    if (len <= 0) return ProbeResult::Open;

    std::string banner(buf, (size_t)len);
    for (const std::string& keyword : keywords) {
        if (containsNoCase(banner, keyword)) {
            DEBUG_VERBOSE("[DISCOVERY] %s:%u banner matched '%s'", ip.c_str(), port, keyword.c_str());
            return ProbeResult::Confirmed;
        }
    }
    return ProbeResult::Open;
}
