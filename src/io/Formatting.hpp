#pragma once

#include "../core/Error.hpp"
#include "../core/Types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace gridconv::io {

// 坐标表示类型
enum class CoordinateKind {
    Geodetic,   // "ll"
    Utm,        // "utm"
    Mgrs        // "mgrs"
};

[[nodiscard]] std::string_view toString(CoordinateKind kind) noexcept;

// "ll" / "latlon" / "utm" / "mgrs" / "utmref"，大小写不敏感
[[nodiscard]] std::optional<CoordinateKind> parseCoordinateKind(std::string_view name) noexcept;

// 格式化：纬度 经度，6 位小数（约 0.11 米）
[[nodiscard]] std::string formatGeodetic(const core::GeodeticPoint& point);

// 格式化："32U 398973 5756497"
[[nodiscard]] std::string formatUtm(const core::UtmCoordinate& utm);

[[nodiscard]] std::string formatMgrs(const core::MgrsReference& mgrs);

// 解析 "51.95 7.53" 或 "51.95, 7.53"（纬度在前），不做范围检查
[[nodiscard]] std::optional<core::GeodeticPoint> parseGeodetic(std::string_view text);

// 解析 "32U 398973 5756497" 或 "32 U 398973 5756497"
[[nodiscard]] std::optional<core::UtmCoordinate> parseUtm(std::string_view text);

// 去掉空白并转大写，"32U LC 98973 56497" -> "32ULC9897356497"
[[nodiscard]] core::Result<core::MgrsReference> parseMgrs(std::string_view text);

// 判断一行文本是哪种坐标
[[nodiscard]] std::optional<CoordinateKind> detectKind(std::string_view text);

} // namespace gridconv::io
