#ifndef RESPONSE_PARSER_H
#define RESPONSE_PARSER_H

#include <string>
#include <vector>
#include "wam_types.h"

struct ParserOptions {
    std::vector<std::string> indicators;     // Any one must appear (case-insensitive)
    std::vector<uint16_t> knownPorts;        // Scanned as ":<port>" when LOCATION has none
    uint16_t defaultPort;

    ParserOptions();
};

// Returns false ("not a match") when the payload carries no vendor indicator.
// The UDP source address is always used as the device ip.
bool parseAdvertisement(const std::string& payload, const std::string& sourceIp,
                        const ParserOptions& options, DeviceDescriptor& out);

std::string placeholderName(const std::string& ip);
std::string placeholderModel();

// Helpers shared with the fallback scan and the registry
std::string toLowerAscii(std::string text);
std::string trimCopy(const std::string& text);
bool containsNoCase(const std::string& haystack, const std::string& needle);

#endif // RESPONSE_PARSER_H
