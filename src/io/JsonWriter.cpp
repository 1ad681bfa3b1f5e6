#include "io/JsonWriter.hpp"
#include "io/Formatting.hpp"
#include <string>

namespace gridconv::io {

nlohmann::json toJson(const core::GeodeticPoint& point) {
    nlohmann::json json;
    json["type"] = "ll";
    json["latitude"] = point.latitude;
    json["longitude"] = point.longitude;
    json["text"] = formatGeodetic(point);
    return json;
}

nlohmann::json toJson(const core::UtmCoordinate& utm) {
    nlohmann::json json;
    json["type"] = "utm";
    json["zoneNumber"] = utm.zoneNumber;
    json["zoneLetter"] = std::string(1, utm.zoneLetter);
    json["easting"] = utm.easting;
    json["northing"] = utm.northing;
    json["text"] = formatUtm(utm);
    return json;
}

nlohmann::json toJson(const core::MgrsReference& mgrs) {
    nlohmann::json json;
    json["type"] = "mgrs";
    json["text"] = formatMgrs(mgrs);
    return json;
}

nlohmann::json toJson(const core::DecodedUtm& decoded) {
    auto json = toJson(decoded.utm);
    json["precision"] = decoded.precisionMeters;
    return json;
}

nlohmann::json toJson(const core::DecodedGeodetic& decoded) {
    auto json = toJson(decoded.point);
    json["precision"] = decoded.precisionMeters;
    return json;
}

nlohmann::json toJson(const core::ConversionError& error) {
    return nlohmann::json{
        {"code", std::string(core::toString(error.code))},
        {"message", error.message}
    };
}

void writeJson(std::ostream& stream, const nlohmann::json& document, int indent) {
    stream << document.dump(indent) << '\n';
}

} // namespace gridconv::io
