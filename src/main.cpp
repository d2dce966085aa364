/**
 * wam_discover - one discovery round, printed as JSON
 * Usage: wam_discover [timeout_seconds] [-v]
 */

#include "config.h"
#include "posix_network.h"
#include "wam_discovery.h"
#include "wam_json.h"
#include "command_table.h"
#include <ArduinoJson.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <cstring>
#include <iostream>

static void usage(const char* prog) {
    std::fprintf(stderr, "Usage: %s [timeout_seconds] [-v]\n", prog);
}

int main(int argc, char** argv) {
    int timeoutSeconds = DISCOVERY_TIMEOUT_SEC;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        long parsed = 0;
        if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage(argv[0]);
            return 0;
        } else if (parseInteger(argv[i], parsed) && parsed > 0 && parsed <= 60) {
            timeoutSeconds = (int)parsed;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    // Logs go to stderr so stdout stays valid JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("wam"));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    DEBUG_INFO("=== WAM DISCOVERY ===");

    PosixDiscoveryNetwork network;
    DiscoveryEngine engine(network);

    std::vector<DeviceDescriptor> found;
    WamError err = engine.discover(timeoutSeconds, found);

    JsonDocument doc;
    if (!err.ok()) {
        writeError(doc, err);
        serializeJsonPretty(doc, std::cout);
        std::cout << std::endl;
        return 1;
    }

    JsonArray speakers = doc["speakers"].to<JsonArray>();
    for (const DeviceDescriptor& desc : found) {
        writeDescriptor(speakers.add<JsonObject>(), desc);
    }
    serializeJsonPretty(doc, std::cout);
    std::cout << std::endl;
    return 0;
}
