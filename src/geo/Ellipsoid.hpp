#pragma once
#ifndef _USE_MATH_DEFINES
#define _USE_MATH_DEFINES
#endif
#include <cmath>

namespace gridconv::geo {

// 参考椭球
struct Ellipsoid {
    double semiMajorAxis;   // a（米）
    double eccSquared;      // e²

    // 第二偏心率平方 e'²
    constexpr double eccPrimeSquared() const noexcept {
        return eccSquared / (1.0 - eccSquared);
    }
};

namespace datum {
    // WGS84 / GRS80
    inline constexpr Ellipsoid WGS84{6378137.0, 0.00669438};
}

// UTM 常量
namespace utm {
    inline constexpr double kScaleFactor = 0.9996;          // k0
    inline constexpr double kFalseEasting = 500000.0;
    inline constexpr double kFalseNorthing = 10000000.0;    // 南半球
    inline constexpr int kZoneCount = 60;
}

// 角度转弧度
constexpr double toRadians(double degrees) noexcept {
    return degrees * (M_PI / 180.0);
}

// 弧度转角度
constexpr double toDegrees(double radians) noexcept {
    return 180.0 * (radians / M_PI);
}

} // namespace gridconv::geo
