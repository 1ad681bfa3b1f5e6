#pragma once

#include "../core/Error.hpp"
#include "../core/Types.hpp"
#include <ostream>
#include <nlohmann/json.hpp>

namespace gridconv::io {

[[nodiscard]] nlohmann::json toJson(const core::GeodeticPoint& point);
[[nodiscard]] nlohmann::json toJson(const core::UtmCoordinate& utm);
[[nodiscard]] nlohmann::json toJson(const core::MgrsReference& mgrs);
[[nodiscard]] nlohmann::json toJson(const core::DecodedUtm& decoded);
[[nodiscard]] nlohmann::json toJson(const core::DecodedGeodetic& decoded);
[[nodiscard]] nlohmann::json toJson(const core::ConversionError& error);

// 写出 JSON，indent < 0 时单行输出
void writeJson(std::ostream& stream, const nlohmann::json& document, int indent = 2);

} // namespace gridconv::io
