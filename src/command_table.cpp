/**
 * Logical command table for WAM speakers
 * Maps UI-level command names to UIC protocol methods and argument encodings
 */

#include "command_table.h"
#include "config.h"
#include "response_parser.h"
#include <cerrno>
#include <cstdlib>

// ============================================================================
// Tables
// ============================================================================
static const std::vector<CommandSpec> kCommands = {
    // logical        api            method              encoding                   arg                             expected  power
    {"power",         WAM_API_TYPE,  "SetPower",         ArgEncoding::Single,       {"strValue",    "str", "on"},   "",       false},
    {"volume",        WAM_API_TYPE,  "SetVolume",        ArgEncoding::Single,       {"nVolume",     "dec", "10"},   "",       false},
    {"mute",          WAM_API_TYPE,  "SetMute",          ArgEncoding::Single,       {"strValue",    "str", "on"},   "",       false},
    {"play",          WAM_API_TYPE,  "Play",             ArgEncoding::None,         {"", "", ""},                   "",       false},
    {"pause",         WAM_API_TYPE,  "Pause",            ArgEncoding::None,         {"", "", ""},                   "",       false},
    {"stop",          WAM_API_TYPE,  "Stop",             ArgEncoding::None,         {"", "", ""},                   "",       false},
    {"next",          WAM_API_TYPE,  "Next",             ArgEncoding::None,         {"", "", ""},                   "",       false},
    {"prev",          WAM_API_TYPE,  "Prev",             ArgEncoding::None,         {"", "", ""},                   "",       false},
    {"set_input",     WAM_API_TYPE,  "SetInput",         ArgEncoding::Single,       {"strSource",   "str", "BT"},   "",       false},
    {"set_eq_preset", WAM_API_TYPE,  "Set7bandEQMode",   ArgEncoding::EqPresetName, {"presetindex", "dec", "0"},    "",       false},
    {"set_eq_values", WAM_API_TYPE,  "Set7bandEQValue",  ArgEncoding::EqValueList,  {"presetindex", "dec", ""},     "",       false},
};

static const std::vector<EqPreset> kEqPresets = {
    {"Normal", 0}, {"Flat", 1}, {"Jazz", 2}, {"Rock", 3}, {"Classical", 4},
    {"Bass Boost", 5}, {"Treble Boost", 6}, {"Movie", 7}, {"Voice", 8},
};

const std::vector<CommandSpec>& commandTable() {
    return kCommands;
}

const std::vector<EqPreset>& eqPresetTable() {
    return kEqPresets;
}

const CommandSpec* findCommand(const std::string& logicalName) {
    for (const CommandSpec& spec : kCommands) {
        if (logicalName == spec.logicalName) return &spec;
    }
    return nullptr;
}

int eqPresetIndex(const std::string& presetName, bool* found) {
    for (const EqPreset& preset : kEqPresets) {
        if (presetName == preset.name) {
            if (found) *found = true;
            return preset.index;
        }
    }
    if (found) *found = false;
    return 0;
}

bool parseInteger(const std::string& text, long& out) {
    std::string trimmed = trimCopy(text);
    if (trimmed.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(trimmed.c_str(), &end, 10);
    if (errno == ERANGE || end == trimmed.c_str() || *end != '\0') return false;
    out = value;
    return true;
}

// ============================================================================
// Call building
// ============================================================================
static WamError invalidArgument(const CommandSpec& spec, const std::string& detail) {
    return WamError::make(WamErrorCode::InvalidArgument, "",
                          std::string(spec.logicalName) + ": " + detail);
}

WamError buildApiCall(const CommandSpec& spec, const std::string& value, ApiCall& call) {
    ApiCall built;
    built.apiType = spec.apiType;
    built.method = spec.protocolMethod;
    built.expectedResponse = spec.expectedResponseTag;
    built.requiresPower = spec.requiresPower;

    switch (spec.encoding) {
        case ArgEncoding::None:
            break;

        case ArgEncoding::Single: {
            std::string raw = value.empty() ? std::string(spec.arg.defaultValue) : value;
            ApiArg arg = {spec.arg.name, raw, spec.arg.type};
            if (arg.type == "dec") {
                long number = 0;
                if (!parseInteger(raw, number)) {
                    return invalidArgument(spec, "'" + raw + "' is not an integer");
                }
                arg.value = std::to_string(number);
            }
            built.args.push_back(arg);
            break;
        }

        case ArgEncoding::EqPresetName: {
            bool matched = false;
            int index = eqPresetIndex(value, &matched);
            if (!matched) {
                DEBUG_WARN("[CMD] Unknown EQ preset '%s', using index 0", value.c_str());
            }
            built.args.push_back({spec.arg.name, std::to_string(index), "dec"});
            break;
        }

        case ArgEncoding::EqValueList: {
            std::vector<std::string> parts;
            size_t start = 0;
            while (true) {
                size_t comma = value.find(',', start);
                parts.push_back(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
                if (comma == std::string::npos) break;
                start = comma + 1;
            }
            if (parts.size() != WAM_EQ_VALUE_COUNT) {
                return invalidArgument(spec, "expected " + std::to_string(WAM_EQ_VALUE_COUNT) +
                                       " comma-separated integers, got " + std::to_string(parts.size()));
            }
            for (size_t i = 0; i < parts.size(); i++) {
                long number = 0;
                if (!parseInteger(parts[i], number)) {
                    return invalidArgument(spec, "'" + parts[i] + "' is not an integer");
                }
                std::string argName = (i == 0) ? "presetindex" : "eqvalue" + std::to_string(i);
                built.args.push_back({argName, std::to_string(number), "dec"});
            }
            break;
        }
    }

    call = built;
    return WamError::success();
}

WamError validateApiCall(const ApiCall& call) {
    if (trimCopy(call.method).empty()) {
        return WamError::make(WamErrorCode::InvalidArgument, "", "api call has no method");
    }
    if (call.apiType != WAM_API_TYPE && call.apiType != WAM_API_TYPE_CPM) {
        return WamError::make(WamErrorCode::InvalidArgument, "",
                              "unsupported api type '" + call.apiType + "' for " + call.method);
    }
    for (const ApiArg& arg : call.args) {
        if (trimCopy(arg.name).empty()) {
            return WamError::make(WamErrorCode::InvalidArgument, "", "unnamed argument for " + call.method);
        }
    }
    if (call.timeoutMultiple < 1) {
        return WamError::make(WamErrorCode::InvalidArgument, "",
                              "timeout multiple must be at least 1 for " + call.method);
    }
    return WamError::success();
}
