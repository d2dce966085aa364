/**
 * config.h - Centralized configuration constants
 * All magic numbers and configurable values in one place
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <spdlog/spdlog.h>
#include <fmt/printf.h>

// =============================================================================
// LOGGING & DEBUG
// =============================================================================

// Debug levels: 0=OFF, 1=ERRORS, 2=WARNINGS, 3=INFO, 4=VERBOSE
#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL             4       // spdlog level filters further at runtime
#endif

// Debug macros - printf-style, routed through spdlog's default logger
#if DEBUG_LEVEL >= 4
    #define DEBUG_VERBOSE(format, ...) spdlog::debug(fmt::sprintf(format, ##__VA_ARGS__))
#else
    #define DEBUG_VERBOSE(format, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 3
    #define DEBUG_INFO(format, ...) spdlog::info(fmt::sprintf(format, ##__VA_ARGS__))
#else
    #define DEBUG_INFO(format, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 2
    #define DEBUG_WARN(format, ...) spdlog::warn(fmt::sprintf(format, ##__VA_ARGS__))
#else
    #define DEBUG_WARN(format, ...) ((void)0)
#endif

#if DEBUG_LEVEL >= 1
    #define DEBUG_ERROR(format, ...) spdlog::error(fmt::sprintf(format, ##__VA_ARGS__))
#else
    #define DEBUG_ERROR(format, ...) ((void)0)
#endif

// =============================================================================
// SSDP DISCOVERY
// =============================================================================
#define SSDP_MULTICAST_ADDR     "239.255.255.250"
#define SSDP_PORT               1900
#define SSDP_MX                 3       // Max response delay requested from devices (seconds)
#define SSDP_MULTICAST_TTL      2       // Keep probes on the local segment
#define SSDP_RECV_BUFFER_SIZE   1024    // Larger datagrams are truncated
#define SSDP_USER_AGENT         "WamManager/1.0"
#define DISCOVERY_TIMEOUT_SEC   3       // Listen window per service type

// =============================================================================
// FALLBACK PORT SCAN
// =============================================================================
#define SCAN_MAX_ADDRESSES      50      // Hard cap on addresses probed per round
#define SCAN_CONNECT_TIMEOUT_MS 2000    // Per-attempt TCP connect / banner read timeout
#define SCAN_WORKER_COUNT       32      // Concurrent probe workers
#define SCAN_ROUTE_PROBE_ADDR   "8.8.8.8"  // Used only to learn the outbound interface address
#define SCAN_ROUTE_PROBE_PORT   80

// =============================================================================
// WAM DEVICE PROTOCOL
// =============================================================================
#define WAM_DEFAULT_API_PORT    55001   // Control port when nothing better is known
#define WAM_API_TYPE            "UIC"
#define WAM_API_TYPE_CPM        "CPM"
#define WAM_SETTLE_DELAY_MS     500     // Some firmware populates properties after the handshake
#define WAM_EQ_VALUE_COUNT      8       // preset index + 7 band values

// =============================================================================
// MANAGER TASKS & QUEUES
// =============================================================================
#define WAM_CMD_QUEUE_SIZE      10      // Command queue depth
#define WAM_NOTIFY_QUEUE_SIZE   20      // Per-listener notification queue depth
#define WAM_EVENT_HISTORY_MAX   1000    // Events kept for recentEvents()
#define WAM_EVENT_LIMIT_DEFAULT 100
#define WAM_CMD_POLL_MS         20      // Worker wait per queue check

#endif // CONFIG_H
