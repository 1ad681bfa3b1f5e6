#include "grid/GridReferenceEncoder.hpp"
#include "grid/LetterAlphabet.hpp"
#include <cmath>

namespace gridconv::grid {

namespace {
    // 取整米值的末 5 位，左侧补零
    std::string lastFiveDigits(double meters) {
        const auto whole = static_cast<long long>(std::trunc(meters));
        std::string digits = "00000" + std::to_string(whole < 0 ? -whole : whole);
        return digits.substr(digits.size() - 5);
    }
}

std::string squareIdentifier(double easting, double northing, int zoneNumber) {
    const int zoneSet = zoneSetFor(zoneNumber);
    const int column = static_cast<int>(std::floor(easting / 100000.0));
    const int row = static_cast<int>(std::floor(northing / 100000.0)) % kRowAlphabet.size();

    std::string id(2, ' ');
    id[0] = kColumnAlphabet.advance(columnOriginFor(zoneSet), column - 1);
    id[1] = kRowAlphabet.advance(rowOriginFor(zoneSet), row);
    return id;
}

core::MgrsReference encodeGridReference(const core::UtmCoordinate& utm, int precisionMeters) {
    const auto digits = static_cast<std::size_t>(digitsForPrecision(precisionMeters));

    std::string reference = std::to_string(utm.zoneNumber);
    reference.push_back(utm.zoneLetter);
    reference += squareIdentifier(utm.easting, utm.northing, utm.zoneNumber);
    reference += lastFiveDigits(utm.easting).substr(0, digits);
    reference += lastFiveDigits(utm.northing).substr(0, digits);

    return core::MgrsReference{std::move(reference)};
}

} // namespace gridconv::grid
