#ifndef COMMAND_TABLE_H
#define COMMAND_TABLE_H

#include <string>
#include <vector>
#include "wam_types.h"

// How the caller's single value string becomes protocol arguments
enum class ArgEncoding {
    None,           // No arguments
    Single,         // value (or default) -> one argument
    EqPresetName,   // preset name -> presetindex via kEqPresets
    EqValueList     // "p,b1,...,b7" -> presetindex + eqvalue1..7
};

struct ArgSpec {
    const char* name;
    const char* type;           // "str" or "dec"
    const char* defaultValue;
};

struct CommandSpec {
    const char* logicalName;
    const char* apiType;
    const char* protocolMethod;
    ArgEncoding encoding;
    ArgSpec arg;                // Used by ArgEncoding::Single
    const char* expectedResponseTag;
    bool requiresPower;
};

struct EqPreset {
    const char* name;
    int index;
};

const std::vector<CommandSpec>& commandTable();
const std::vector<EqPreset>& eqPresetTable();

// nullptr when the logical name is not in the table
const CommandSpec* findCommand(const std::string& logicalName);

// Unrecognized names resolve to 0 (Normal); found reports whether the name matched
int eqPresetIndex(const std::string& presetName, bool* found = nullptr);

// Substitutes value into spec's argument schema; InvalidArgument on bad input
WamError buildApiCall(const CommandSpec& spec, const std::string& value, ApiCall& call);

// Checks a caller-built call: non-empty method, UIC or CPM api type,
// named arguments and a timeout multiple of at least 1
WamError validateApiCall(const ApiCall& call);

// Strict base-10 integer parse (surrounding whitespace allowed)
bool parseInteger(const std::string& text, long& out);

#endif // COMMAND_TABLE_H
