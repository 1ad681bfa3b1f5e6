#include "geo/TransverseMercator.hpp"
#include "geo/ZoneResolver.hpp"
#include <sstream>

namespace gridconv::geo {

double TransverseMercator::meridionalArc(double latRad) const noexcept {
    const double e2 = ellipsoid_.eccSquared;
    const double e4 = e2 * e2;
    const double e6 = e4 * e2;

    return ellipsoid_.semiMajorAxis *
           ((1.0 - e2 / 4.0 - 3.0 * e4 / 64.0 - 5.0 * e6 / 256.0) * latRad
            - (3.0 * e2 / 8.0 + 3.0 * e4 / 32.0 + 45.0 * e6 / 1024.0) * std::sin(2.0 * latRad)
            + (15.0 * e4 / 256.0 + 45.0 * e6 / 1024.0) * std::sin(4.0 * latRad)
            - (35.0 * e6 / 3072.0) * std::sin(6.0 * latRad));
}

ProjectedXY TransverseMercator::forward(double latitude, double longitude,
                                        int centralMeridianDeg) const noexcept {
    const double a = ellipsoid_.semiMajorAxis;
    const double e2 = ellipsoid_.eccSquared;
    const double ep2 = ellipsoid_.eccPrimeSquared();
    const double k0 = utm::kScaleFactor;

    const double latRad = toRadians(latitude);
    const double lonRad = toRadians(longitude);
    const double originRad = toRadians(static_cast<double>(centralMeridianDeg));

    const double sinLat = std::sin(latRad);
    const double cosLat = std::cos(latRad);
    const double tanLat = std::tan(latRad);

    const double N = a / std::sqrt(1.0 - e2 * sinLat * sinLat);
    const double T = tanLat * tanLat;
    const double C = ep2 * cosLat * cosLat;
    const double A = cosLat * (lonRad - originRad);
    const double M = meridionalArc(latRad);

    const double A2 = A * A;
    const double A3 = A2 * A;
    const double A4 = A3 * A;
    const double A5 = A4 * A;
    const double A6 = A5 * A;

    const double easting = k0 * N * (A + (1.0 - T + C) * A3 / 6.0
                                     + (5.0 - 18.0 * T + T * T + 72.0 * C - 58.0 * ep2) * A5 / 120.0)
                           + utm::kFalseEasting;

    double northing = k0 * (M + N * tanLat * (A2 / 2.0
                                              + (5.0 - T + 9.0 * C + 4.0 * C * C) * A4 / 24.0
                                              + (61.0 - 58.0 * T + T * T + 600.0 * C - 330.0 * ep2) * A6 / 720.0));
    if (latitude < 0.0) {
        northing += utm::kFalseNorthing;
    }

    return ProjectedXY{std::trunc(easting), std::trunc(northing)};
}

core::GeodeticPoint TransverseMercator::inverse(double easting, double northing, bool southern,
                                                int centralMeridianDeg) const noexcept {
    const double a = ellipsoid_.semiMajorAxis;
    const double e2 = ellipsoid_.eccSquared;
    const double ep2 = ellipsoid_.eccPrimeSquared();
    const double k0 = utm::kScaleFactor;
    const double e1 = (1.0 - std::sqrt(1.0 - e2)) / (1.0 + std::sqrt(1.0 - e2));

    const double x = easting - utm::kFalseEasting;
    double y = northing;
    if (southern) {
        y -= utm::kFalseNorthing;
    }

    // 底点纬度
    const double M = y / k0;
    const double mu = M / (a * (1.0 - e2 / 4.0 - 3.0 * e2 * e2 / 64.0 - 5.0 * e2 * e2 * e2 / 256.0));

    const double phi1 = mu
                        + (3.0 * e1 / 2.0 - 27.0 * e1 * e1 * e1 / 32.0) * std::sin(2.0 * mu)
                        + (21.0 * e1 * e1 / 16.0 - 55.0 * e1 * e1 * e1 * e1 / 32.0) * std::sin(4.0 * mu)
                        + (151.0 * e1 * e1 * e1 / 96.0) * std::sin(6.0 * mu);

    const double sinPhi1 = std::sin(phi1);
    const double cosPhi1 = std::cos(phi1);
    const double tanPhi1 = std::tan(phi1);

    const double N1 = a / std::sqrt(1.0 - e2 * sinPhi1 * sinPhi1);
    const double T1 = tanPhi1 * tanPhi1;
    const double C1 = ep2 * cosPhi1 * cosPhi1;
    const double R1 = a * (1.0 - e2) / std::pow(1.0 - e2 * sinPhi1 * sinPhi1, 1.5);
    const double D = x / (N1 * k0);

    const double D2 = D * D;
    const double D3 = D2 * D;
    const double D4 = D3 * D;
    const double D5 = D4 * D;
    const double D6 = D5 * D;

    const double latRad = phi1 - (N1 * tanPhi1 / R1)
                                     * (D2 / 2.0
                                        - (5.0 + 3.0 * T1 + 10.0 * C1 - 4.0 * C1 * C1 - 9.0 * ep2) * D4 / 24.0
                                        + (61.0 + 90.0 * T1 + 298.0 * C1 + 45.0 * T1 * T1 - 252.0 * ep2 - 3.0 * C1 * C1) * D6 / 720.0);

    const double lonRad = (D - (1.0 + 2.0 * T1 + C1) * D3 / 6.0
                           + (5.0 - 2.0 * C1 + 28.0 * T1 - 3.0 * C1 * C1 + 8.0 * ep2 + 24.0 * T1 * T1) * D5 / 120.0)
                          / cosPhi1;

    return core::GeodeticPoint{toDegrees(latRad),
                               static_cast<double>(centralMeridianDeg) + toDegrees(lonRad)};
}

core::UtmCoordinate projectToUtm(const core::GeodeticPoint& point) {
    const int zone = resolveZoneNumber(point.latitude, point.longitude);
    const char letter = resolveBandLetter(point.latitude).value_or('Z');

    const TransverseMercator projector;
    const auto xy = projector.forward(point.latitude, point.longitude, centralMeridian(zone));

    return core::UtmCoordinate{zone, letter, xy.easting, xy.northing};
}

core::Result<core::GeodeticPoint> unprojectFromUtm(const core::UtmCoordinate& utm) {
    if (!isValidZoneNumber(utm.zoneNumber)) {
        std::ostringstream oss;
        oss << "invalid zone number, zone number = " << utm.zoneNumber;
        return core::makeError(core::ErrorCode::InvalidZoneNumber, oss.str());
    }

    const TransverseMercator projector;
    return projector.inverse(utm.easting, utm.northing, utm.isSouthern(),
                             centralMeridian(utm.zoneNumber));
}

} // namespace gridconv::geo
