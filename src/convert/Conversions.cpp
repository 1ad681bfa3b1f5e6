#include "convert/Conversions.hpp"
#include "geo/TransverseMercator.hpp"
#include "grid/GridReferenceDecoder.hpp"
#include "grid/GridReferenceEncoder.hpp"
#include <sstream>

namespace gridconv::convert {

namespace {
    std::string describeValue(std::string_view label, double value) {
        std::ostringstream oss;
        oss << label << value;
        return oss.str();
    }
}

core::Result<core::GeodeticPoint> validate(const core::GeodeticPoint& point) {
    // NaN 在比较中为 false，同样判为越界
    if (!(point.longitude >= -180.0 && point.longitude <= 180.0)) {
        return core::makeError(core::ErrorCode::OutOfRangeLongitude,
                               describeValue("invalid longitude, lon = ", point.longitude));
    }
    if (!(point.latitude >= -90.0 && point.latitude <= 90.0)) {
        return core::makeError(core::ErrorCode::OutOfRangeLatitude,
                               describeValue("invalid latitude, lat = ", point.latitude));
    }
    if (point.latitude < -80.0 || point.latitude > 84.0) {
        return core::makeError(core::ErrorCode::UnsupportedPolarLatitude,
                               describeValue("polar regions below 80°S and above 84°N not supported, lat = ",
                                             point.latitude));
    }
    return point;
}

core::Result<core::UtmCoordinate> toUtm(const core::GeodeticPoint& point) {
    auto valid = validate(point);
    if (!valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return geo::projectToUtm(*valid);
}

core::Result<core::MgrsReference> toMgrs(const core::GeodeticPoint& point, int precisionMeters) {
    auto utm = toUtm(point);
    if (!utm) {
        return std::unexpected(std::move(utm.error()));
    }
    return grid::encodeGridReference(*utm, precisionMeters);
}

core::Result<core::GeodeticPoint> toLatLon(const core::UtmCoordinate& utm) {
    return geo::unprojectFromUtm(utm);
}

core::MgrsReference toMgrs(const core::UtmCoordinate& utm, int precisionMeters) {
    return grid::encodeGridReference(utm, precisionMeters);
}

core::Result<core::DecodedUtm> toUtm(const core::MgrsReference& mgrs) {
    return grid::decodeGridReference(mgrs.str());
}

core::Result<core::DecodedGeodetic> toLatLon(const core::MgrsReference& mgrs) {
    auto decoded = toUtm(mgrs);
    if (!decoded) {
        return core::withContext(std::move(decoded.error()), "mgrs.toUtm");
    }

    auto point = geo::unprojectFromUtm(decoded->utm);
    if (!point) {
        return core::withContext(std::move(point.error()), "utm.toLatLon");
    }

    return core::DecodedGeodetic{*point, decoded->precisionMeters};
}

} // namespace gridconv::convert
