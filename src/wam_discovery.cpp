/**
 * WAM Speaker Discovery - SSDP M-SEARCH with a port-scan fallback
 */

#include "wam_discovery.h"
#include "config.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

DiscoveryOptions::DiscoveryOptions()
    : serviceTypes{"urn:schemas-upnp-org:device:MediaRenderer:1",
                   "urn:samsung.com:device:WAMSpeaker:1",
                   "urn:schemas-upnp-org:service:WAM:1",
                   "ssdp:all"},
      scanPorts{7676, 8001, 8080, 15500, 19999, 52345, 55000, 55001},
      httpPorts{7676, 8001, 8080, 19999, 52345},
      bannerKeywords{"wam", "samsung", "allshare", "mongoose", "lighttpd"},
      scanMaxAddresses(SCAN_MAX_ADDRESSES),
      scanConnectTimeoutMs(SCAN_CONNECT_TIMEOUT_MS),
      scanWorkers(SCAN_WORKER_COUNT) {
}

DiscoveryEngine::DiscoveryEngine(DiscoveryNetwork& network, const DiscoveryOptions& options)
    : network(network), options(options) {
}

bool DiscoveryEngine::isHttpPort(uint16_t port) const {
    return std::find(options.httpPorts.begin(), options.httpPorts.end(), port) != options.httpPorts.end();
}

// ============================================================================
// Discovery
// ============================================================================
WamError DiscoveryEngine::discover(int timeoutSeconds, std::vector<DeviceDescriptor>& results) {
    if (timeoutSeconds <= 0) timeoutSeconds = DISCOVERY_TIMEOUT_SEC;
    DEBUG_INFO("[DISCOVERY] Starting discovery (%d service type(s), %ds window each)...",
               (int)options.serviceTypes.size(), timeoutSeconds);

    std::vector<DeviceDescriptor> found;
    std::set<std::pair<std::string, uint16_t>> seen;
    int socketFailures = 0;
    int rawReplies = 0;

    for (const std::string& serviceType : options.serviceTypes) {
        std::vector<Datagram> replies;
        if (!network.searchMulticast(serviceType, timeoutSeconds * 1000, replies)) {
            DEBUG_WARN("[DISCOVERY] M-SEARCH for %s could not be sent", serviceType.c_str());
            socketFailures++;
            continue;
        }

        for (const Datagram& reply : replies) {
            rawReplies++;
            DeviceDescriptor desc;
            if (!parseAdvertisement(reply.payload, reply.sourceIp, options.parser, desc)) {
                continue;
            }
            // First advertisement for an (ip, port) wins
            if (!seen.insert(std::make_pair(desc.ip, desc.port)).second) {
                DEBUG_VERBOSE("[DISCOVERY] Ignoring duplicate response from %s:%u", desc.ip.c_str(), desc.port);
                continue;
            }
            DEBUG_INFO("[DISCOVERY] Response #%d: %s:%u '%s'",
                       (int)found.size() + 1, desc.ip.c_str(), desc.port, desc.advertisedName.c_str());
            found.push_back(desc);
        }
    }

    if (!options.serviceTypes.empty() && socketFailures == (int)options.serviceTypes.size()) {
        DEBUG_ERROR("[DISCOVERY] No discovery socket could be opened");
        return WamError::make(WamErrorCode::DiscoverySocketError, "", "multicast socket setup failed");
    }

    DEBUG_INFO("[DISCOVERY] Multicast window closed. %d raw repl(ies), %d device(s)",
               rawReplies, (int)found.size());

    if (found.empty()) {
        DEBUG_INFO("[DISCOVERY] No speakers answered multicast, trying port scan");
        found = fallbackScan();
    }

    std::stable_sort(found.begin(), found.end(), [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
        return a.ip < b.ip;
    });

    DEBUG_INFO("[DISCOVERY] Discovered %d WAM speaker(s)", (int)found.size());
    results = found;
    return WamError::success();
}

// ============================================================================
// Fallback port scan
// ============================================================================
std::vector<std::string> DiscoveryEngine::scanCandidates(const std::string& localIp) const {
    std::vector<std::string> candidates;
    size_t lastDot = localIp.rfind('.');
    if (lastDot == std::string::npos) return candidates;

    std::string base = localIp.substr(0, lastDot + 1);
    for (int host = 1; host <= 254; host++) {
        if ((int)candidates.size() >= options.scanMaxAddresses) break;
        candidates.push_back(base + std::to_string(host));
    }
    return candidates;
}

std::vector<DeviceDescriptor> DiscoveryEngine::fallbackScan() {
    std::vector<DeviceDescriptor> found;

    std::string localIp;
    if (!network.localIPv4(localIp)) {
        DEBUG_WARN("[DISCOVERY] Local address unknown, skipping port scan");
        return found;
    }

    std::vector<std::string> hosts = scanCandidates(localIp);
    std::vector<std::pair<std::string, uint16_t>> jobs;
    for (const std::string& host : hosts) {
        for (uint16_t port : options.scanPorts) {
            jobs.push_back(std::make_pair(host, port));
        }
    }

    DEBUG_INFO("[DISCOVERY] Scanning %d host(s) near %s on %d port(s)",
               (int)hosts.size(), localIp.c_str(), (int)options.scanPorts.size());

    // Results land in job order so the scan is deterministic regardless of timing
    std::vector<ProbeResult> outcomes(jobs.size(), ProbeResult::Closed);
    std::atomic<size_t> nextJob(0);

    auto worker = [&]() {
        for (;;) {
            size_t index = nextJob.fetch_add(1);
            if (index >= jobs.size()) return;
            const std::string& ip = jobs[index].first;
            uint16_t port = jobs[index].second;
            outcomes[index] = network.probePort(ip, port, options.scanConnectTimeoutMs,
                                                isHttpPort(port), options.bannerKeywords);
        }
    };

    int workerCount = std::max(1, std::min(options.scanWorkers, (int)jobs.size()));
    std::vector<std::thread> workers;
    for (int i = 0; i < workerCount; i++) {
        workers.emplace_back(worker);
    }
    for (std::thread& t : workers) {
        t.join();
    }

    for (size_t i = 0; i < jobs.size(); i++) {
        if (outcomes[i] == ProbeResult::Closed) continue;

        DeviceDescriptor desc;
        desc.ip = jobs[i].first;
        desc.port = jobs[i].second;
        desc.advertisedName = "Samsung WAM Speaker at " + desc.ip;
        desc.advertisedModel = "WAM on port " + std::to_string(desc.port);
        DEBUG_INFO("[DISCOVERY] Port scan hit %s:%u%s", desc.ip.c_str(), desc.port,
                   outcomes[i] == ProbeResult::Confirmed ? " (banner match)" : "");
        found.push_back(desc);
    }

    DEBUG_INFO("[DISCOVERY] Port scan finished, %d candidate(s)", (int)found.size());
    return found;
}
