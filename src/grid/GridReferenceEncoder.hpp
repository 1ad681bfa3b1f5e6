#pragma once

#include "../core/Types.hpp"
#include <string>

namespace gridconv::grid {

// 精度（米）-> 每组数字位数；1/10/100/1000/10000 之外一律按 1 米（5 位）处理
[[nodiscard]] constexpr int digitsForPrecision(int precisionMeters) noexcept {
    switch (precisionMeters) {
        case 1:     return 5;
        case 10:    return 4;
        case 100:   return 3;
        case 1000:  return 2;
        case 10000: return 1;
        default:    return 5;
    }
}

// 两字母 100km 方格标识
[[nodiscard]] std::string squareIdentifier(double easting, double northing, int zoneNumber);

// UTM -> MGRS，不会失败
// 数字组取方格内偏移的高位，低位直接舍去，不做四舍五入
[[nodiscard]] core::MgrsReference encodeGridReference(const core::UtmCoordinate& utm, int precisionMeters);

} // namespace gridconv::grid
