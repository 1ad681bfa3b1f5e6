#include "core/Error.hpp"

namespace gridconv::core {

std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OutOfRangeLatitude:       return "OutOfRangeLatitude";
        case ErrorCode::OutOfRangeLongitude:      return "OutOfRangeLongitude";
        case ErrorCode::UnsupportedPolarLatitude: return "UnsupportedPolarLatitude";
        case ErrorCode::InvalidZoneNumber:        return "InvalidZoneNumber";
        case ErrorCode::InvalidZoneLetter:        return "InvalidZoneLetter";
        case ErrorCode::MalformedGridReference:   return "MalformedGridReference";
        case ErrorCode::UnresolvableGridLetter:   return "UnresolvableGridLetter";
    }
    return "Unknown";
}

std::unexpected<ConversionError> makeError(ErrorCode code, std::string message) {
    return std::unexpected(ConversionError{code, std::move(message)});
}

std::unexpected<ConversionError> withContext(ConversionError error, std::string_view context) {
    std::string message;
    message.reserve(context.size() + 2 + error.message.size());
    message.append(context);
    message.append(": ");
    message.append(error.message);
    return std::unexpected(ConversionError{error.code, std::move(message)});
}

} // namespace gridconv::core
