#ifndef POSIX_NETWORK_H
#define POSIX_NETWORK_H

#include <string>
#include <vector>
#include "wam_discovery.h"

// Closes the descriptor when it goes out of scope
class ScopedSocket {
private:
    int fd;

public:
    explicit ScopedSocket(int fd = -1) : fd(fd) {}
    ~ScopedSocket();

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }
};

class PosixDiscoveryNetwork : public DiscoveryNetwork {
private:
    std::string userAgent;

    std::string buildSearchRequest(const std::string& serviceType) const;

public:
    PosixDiscoveryNetwork();

    bool searchMulticast(const std::string& serviceType, int timeoutMs,
                         std::vector<Datagram>& replies) override;
    bool localIPv4(std::string& ip) override;
    ProbeResult probePort(const std::string& ip, uint16_t port, int timeoutMs,
                          bool httpProbe, const std::vector<std::string>& keywords) override;
};

#endif // POSIX_NETWORK_H
