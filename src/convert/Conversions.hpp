#pragma once

#include "../core/Error.hpp"
#include "../core/Types.hpp"

namespace gridconv::convert {

// 经纬度范围检查：经度、纬度、极区（80°S 以南、84°N 以北不支持）依次检查
[[nodiscard]] core::Result<core::GeodeticPoint> validate(const core::GeodeticPoint& point);

// 经纬度 -> UTM
[[nodiscard]] core::Result<core::UtmCoordinate> toUtm(const core::GeodeticPoint& point);

// 经纬度 -> MGRS，precisionMeters 取 1/10/100/1000/10000
[[nodiscard]] core::Result<core::MgrsReference> toMgrs(const core::GeodeticPoint& point, int precisionMeters);

// UTM -> 经纬度
// 半球只看 zoneLetter 是否小于 'N'，字母与纬度不符时得到的是另一半球的点
[[nodiscard]] core::Result<core::GeodeticPoint> toLatLon(const core::UtmCoordinate& utm);

// UTM -> MGRS，不合法的精度按 1 米处理
[[nodiscard]] core::MgrsReference toMgrs(const core::UtmCoordinate& utm, int precisionMeters);

// MGRS -> UTM（西南角）+ 精度
[[nodiscard]] core::Result<core::DecodedUtm> toUtm(const core::MgrsReference& mgrs);

// MGRS -> 经纬度（西南角）+ 精度
[[nodiscard]] core::Result<core::DecodedGeodetic> toLatLon(const core::MgrsReference& mgrs);

} // namespace gridconv::convert
