#include "geo/ZoneResolver.hpp"
#include <algorithm>
#include <cmath>

namespace gridconv::geo {

int resolveZoneNumber(double latitude, double longitude) noexcept {
    int zone = static_cast<int>(std::floor((longitude + 180.0) / 6.0)) + 1;

    // 经度 180 归入 60 带
    if (longitude == 180.0) {
        zone = 60;
    }

    // 挪威
    if (latitude >= 56.0 && latitude < 64.0 && longitude >= 3.0 && longitude < 12.0) {
        zone = 32;
    }

    // 斯瓦尔巴特群岛
    if (latitude >= 72.0 && latitude < 84.0) {
        if (longitude >= 0.0 && longitude < 9.0) {
            zone = 31;
        } else if (longitude >= 9.0 && longitude < 21.0) {
            zone = 33;
        } else if (longitude >= 21.0 && longitude < 33.0) {
            zone = 35;
        } else if (longitude >= 33.0 && longitude < 42.0) {
            zone = 37;
        }
    }

    return zone;
}

std::optional<char> resolveBandLetter(double latitude) noexcept {
    if (!(latitude >= -80.0 && latitude <= 84.0)) {
        return std::nullopt;
    }

    // X 带覆盖 72..84，包括 84
    const auto index = std::min(static_cast<int>(std::floor((latitude + 80.0) / 8.0)),
                                static_cast<int>(kBandLetters.size()) - 1);
    return kBandLetters[static_cast<std::size_t>(index)];
}

std::optional<ZoneInfo> resolveZone(const core::GeodeticPoint& point) noexcept {
    auto letter = resolveBandLetter(point.latitude);
    if (!letter) {
        return std::nullopt;
    }
    return ZoneInfo{resolveZoneNumber(point.latitude, point.longitude), *letter};
}

} // namespace gridconv::geo
