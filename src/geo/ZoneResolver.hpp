#pragma once

#include "../core/Types.hpp"
#include <optional>
#include <string_view>

namespace gridconv::geo {

// 纬度带字母，从 80°S（C）到 84°N（X），每带 8°，X 带 12°
inline constexpr std::string_view kBandLetters = "CDEFGHJKLMNPQRSTUVWX";

struct ZoneInfo {
    int number{0};
    char letter{'\0'};
};

// UTM 带号，包含挪威和斯瓦尔巴特群岛的例外
// 调用方负责先检查经纬度范围
[[nodiscard]] int resolveZoneNumber(double latitude, double longitude) noexcept;

// 纬度带字母；[-80, 84] 以外返回 nullopt
[[nodiscard]] std::optional<char> resolveBandLetter(double latitude) noexcept;

// 带号和纬度带字母
[[nodiscard]] std::optional<ZoneInfo> resolveZone(const core::GeodeticPoint& point) noexcept;

// 中央经线（度）
[[nodiscard]] constexpr int centralMeridian(int zoneNumber) noexcept {
    return (zoneNumber - 1) * 6 - 180 + 3;
}

[[nodiscard]] constexpr bool isValidZoneNumber(int zoneNumber) noexcept {
    return zoneNumber >= 1 && zoneNumber <= 60;
}

// 是否为合法的纬度带字母（C..X，不含 I、O）
[[nodiscard]] constexpr bool isBandLetter(char letter) noexcept {
    return kBandLetters.find(letter) != std::string_view::npos;
}

} // namespace gridconv::geo
