#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace gridconv::core {

// 坐标转换错误类型
enum class ErrorCode {
    OutOfRangeLatitude,
    OutOfRangeLongitude,
    UnsupportedPolarLatitude,   // 80°S 以南或 84°N 以北（UPS 不支持）
    InvalidZoneNumber,          // 1..60 以外
    InvalidZoneLetter,          // A、B、Y、Z、I、O
    MalformedGridReference,
    UnresolvableGridLetter      // 100km 方格字母在字母表中找不到
};

struct ConversionError {
    ErrorCode code;
    std::string message;
};

template<typename T>
using Result = std::expected<T, ConversionError>;

[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

// 构造错误
[[nodiscard]] std::unexpected<ConversionError> makeError(ErrorCode code, std::string message);

// 为下层错误附加上下文，错误码保持不变
[[nodiscard]] std::unexpected<ConversionError> withContext(ConversionError error, std::string_view context);

} // namespace gridconv::core
