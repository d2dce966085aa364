#ifndef WAM_DISCOVERY_H
#define WAM_DISCOVERY_H

#include <string>
#include <vector>
#include "response_parser.h"
#include "wam_types.h"

struct DiscoveryOptions {
    std::vector<std::string> serviceTypes;      // One M-SEARCH each, in order
    std::vector<uint16_t> scanPorts;            // Fallback TCP probe ports
    std::vector<uint16_t> httpPorts;            // Subset of scanPorts that get a GET /
    std::vector<std::string> bannerKeywords;    // Matched case-insensitively in the reply
    int scanMaxAddresses;
    int scanConnectTimeoutMs;
    int scanWorkers;
    ParserOptions parser;

    DiscoveryOptions();
};

// One received datagram
struct Datagram {
    std::string payload;
    std::string sourceIp;
};

enum class ProbeResult {
    Closed,         // Connect failed or timed out
    Open,           // TCP connect succeeded
    Confirmed       // Open and the HTTP reply carried a vendor keyword
};

/**
 * Network primitives used by a discovery round.
 * Every call is bounded by its timeout; none blocks indefinitely.
 */
class DiscoveryNetwork {
public:
    virtual ~DiscoveryNetwork() {}

    // Sends one M-SEARCH for serviceType and collects replies until timeoutMs
    // elapses. Returns false only when the socket could not be set up.
    virtual bool searchMulticast(const std::string& serviceType, int timeoutMs,
                                 std::vector<Datagram>& replies) = 0;

    // Address of the outbound IPv4 interface
    virtual bool localIPv4(std::string& ip) = 0;

    virtual ProbeResult probePort(const std::string& ip, uint16_t port, int timeoutMs,
                                  bool httpProbe, const std::vector<std::string>& keywords) = 0;
};

class DiscoveryEngine {
private:
    DiscoveryNetwork& network;
    DiscoveryOptions options;

    bool isHttpPort(uint16_t port) const;

public:
    DiscoveryEngine(DiscoveryNetwork& network, const DiscoveryOptions& options = DiscoveryOptions());

    // Multicast round, falling back to a port scan when nothing answers.
    // Results are unique on (ip, port) and sorted by ip.
    WamError discover(int timeoutSeconds, std::vector<DeviceDescriptor>& results);

    // Probes the local /24 (first scanMaxAddresses hosts) on the scan ports
    std::vector<DeviceDescriptor> fallbackScan();

    // Candidate hosts for a local address: same /24, .1 to .254, capped
    std::vector<std::string> scanCandidates(const std::string& localIp) const;

    const DiscoveryOptions& getOptions() const { return options; }
};

#endif // WAM_DISCOVERY_H
