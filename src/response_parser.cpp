/**
 * SSDP advertisement parsing
 * Validates a raw M-SEARCH response and pulls out port, name and model
 */

#include "response_parser.h"
#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

ParserOptions::ParserOptions()
    : indicators({"WAM", "SAMSUNG", "SPEAKER", "ALLSHARE", "MEDIARENDERER"}),
      knownPorts({55001, 55002, 7676, 8001, 8080, 19999, 52345}),
      defaultPort(WAM_DEFAULT_API_PORT) {
}

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimCopy(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(start, end - start);
}

bool containsNoCase(const std::string& haystack, const std::string& needle) {
    return toLowerAscii(haystack).find(toLowerAscii(needle)) != std::string::npos;
}

std::string placeholderName(const std::string& ip) {
    return "WAM Speaker at " + ip;
}

std::string placeholderModel() {
    return "Samsung WAM Speaker";
}

// ============================================================================
// Helpers
// ============================================================================
static std::vector<std::string> splitLines(const std::string& payload) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= payload.size()) {
        size_t end = payload.find('\n', start);
        if (end == std::string::npos) end = payload.size();
        std::string line = payload.substr(start, end - start);
        if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

// "NAME: value" -> lowercase name and trimmed value; false if the line has no colon
static bool splitHeader(const std::string& line, std::string& name, std::string& value) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    name = toLowerAscii(trimCopy(line.substr(0, colon)));
    value = trimCopy(line.substr(colon + 1));
    return true;
}

static bool parsePortDigits(const std::string& text, size_t pos, uint16_t& port) {
    size_t end = pos;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) end++;
    if (end == pos || end - pos > 5) return false;
    long value = std::strtol(text.substr(pos, end - pos).c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

// scheme://host:port/... -> port
static bool portFromLocation(const std::string& location, uint16_t& port) {
    size_t scheme = location.find("://");
    if (scheme == std::string::npos) return false;
    size_t hostStart = scheme + 3;
    size_t hostEnd = location.find_first_of(":/", hostStart);
    if (hostEnd == std::string::npos || hostEnd == hostStart) return false;
    if (location[hostEnd] != ':') return false;
    return parsePortDigits(location, hostEnd + 1, port);
}

static bool knownPortInText(const std::string& text, const std::vector<uint16_t>& ports, uint16_t& port) {
    for (uint16_t candidate : ports) {
        std::string token = ":" + std::to_string(candidate);
        size_t pos = text.find(token);
        while (pos != std::string::npos) {
            size_t after = pos + token.size();
            if (after >= text.size() || !std::isdigit(static_cast<unsigned char>(text[after]))) {
                port = candidate;
                return true;
            }
            pos = text.find(token, pos + 1);
        }
    }
    return false;
}

// ============================================================================
// Advertisement
// ============================================================================
bool parseAdvertisement(const std::string& payload, const std::string& sourceIp,
                        const ParserOptions& options, DeviceDescriptor& out) {
    std::string upper = payload;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    bool indicatorFound = false;
    for (const std::string& indicator : options.indicators) {
        std::string needle = indicator;
        std::transform(needle.begin(), needle.end(), needle.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper.find(needle) != std::string::npos) {
            indicatorFound = true;
            break;
        }
    }
    if (!indicatorFound) return false;

    DeviceDescriptor desc;
    desc.ip = sourceIp;
    desc.port = options.defaultPort;
    desc.advertisedName = placeholderName(sourceIp);
    desc.advertisedModel = placeholderModel();

    bool portFound = false;
    std::string name, value;
    for (const std::string& line : splitLines(payload)) {
        if (!splitHeader(line, name, value)) continue;

        if (name == "location") {
            // LOCATION host is ignored: the source address is authoritative
            uint16_t port = 0;
            if (!portFound && portFromLocation(value, port)) {
                desc.port = port;
                portFound = true;
            }
        } else if (name == "friendlyname") {
            if (!value.empty()) desc.advertisedName = value;
        } else if (name == "modelname" || name == "model") {
            if (!value.empty()) desc.advertisedModel = value;
        }
    }

    if (!portFound) {
        uint16_t port = 0;
        if (knownPortInText(payload, options.knownPorts, port)) {
            desc.port = port;
        }
    }

    DEBUG_VERBOSE("[DISCOVERY] Parsed advertisement from %s -> port %u, name '%s'",
                  sourceIp.c_str(), desc.port, desc.advertisedName.c_str());
    out = desc;
    return true;
}
