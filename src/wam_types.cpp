#include "wam_types.h"

const char* wamErrorName(WamErrorCode code) {
    switch (code) {
        case WamErrorCode::Ok:                   return "Ok";
        case WamErrorCode::DiscoverySocketError: return "DiscoverySocketError";
        case WamErrorCode::ParseSkipped:         return "ParseSkipped";
        case WamErrorCode::ConnectionError:      return "ConnectionError";
        case WamErrorCode::NotFound:             return "NotFound";
        case WamErrorCode::DeviceNotConnected:   return "DeviceNotConnected";
        case WamErrorCode::UnknownCommand:       return "UnknownCommand";
        case WamErrorCode::InvalidArgument:      return "InvalidArgument";
        case WamErrorCode::GroupNotFound:        return "GroupNotFound";
        case WamErrorCode::CommandError:         return "CommandError";
    }
    return "Unknown";
}
