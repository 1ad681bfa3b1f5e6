#pragma once

#include "Ellipsoid.hpp"
#include "../core/Error.hpp"
#include "../core/Types.hpp"

namespace gridconv::geo {

// 平面坐标（米），未加带号信息
struct ProjectedXY {
    double easting{0.0};
    double northing{0.0};
};

// 椭球横轴墨卡托投影（UTM 参数，k0 = 0.9996）
// 级数截断到固定阶，不做迭代；非极区精度优于 1 米
class TransverseMercator {
public:
    constexpr explicit TransverseMercator(Ellipsoid model = datum::WGS84) noexcept
        : ellipsoid_(model) {}

    // 正算：经纬度 -> easting/northing，含假东偏移，南半球含假北偏移，结果截断到整米
    [[nodiscard]] ProjectedXY forward(double latitude, double longitude,
                                      int centralMeridianDeg) const noexcept;

    // 反算：easting/northing -> 经纬度（度）
    [[nodiscard]] core::GeodeticPoint inverse(double easting, double northing, bool southern,
                                              int centralMeridianDeg) const noexcept;

    const Ellipsoid& ellipsoid() const noexcept { return ellipsoid_; }

private:
    Ellipsoid ellipsoid_;

    // 子午线弧长 M
    double meridionalArc(double latRad) const noexcept;
};

// 经纬度 -> UTM（带号和纬度带由 ZoneResolver 决定）
// 点必须已通过范围检查
[[nodiscard]] core::UtmCoordinate projectToUtm(const core::GeodeticPoint& point);

// UTM -> 经纬度；带号不在 1..60 时返回 InvalidZoneNumber
// 半球只由 zoneLetter < 'N' 判断，字母本身不校验
[[nodiscard]] core::Result<core::GeodeticPoint> unprojectFromUtm(const core::UtmCoordinate& utm);

} // namespace gridconv::geo
