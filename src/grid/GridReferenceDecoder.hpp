#pragma once

#include "../core/Error.hpp"
#include "../core/Types.hpp"
#include <optional>
#include <string_view>

namespace gridconv::grid {

// 纬度带的最小 northing（米），用于消除行字母每 2,000,000 米循环一次带来的歧义
// 只对 C..X（不含 I、O）有定义
[[nodiscard]] std::optional<double> minimumNorthing(char bandLetter) noexcept;

// 方格列字母 -> 100km 整数倍的 easting
[[nodiscard]] core::Result<double> eastingFromLetter(char letter, int zoneSet);

// 方格行字母 -> 100km 整数倍的 northing（未做 2,000,000 米修正）
[[nodiscard]] core::Result<double> northingFromLetter(char letter, int zoneSet);

// MGRS -> UTM
// 结果是给定精度下最小方格的西南角，而不是中心
[[nodiscard]] core::Result<core::DecodedUtm> decodeGridReference(std::string_view reference);

} // namespace gridconv::grid
