#include "grid/GridReferenceDecoder.hpp"
#include "grid/LetterAlphabet.hpp"
#include "geo/ZoneResolver.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <sstream>
#include <string>

namespace gridconv::grid {

namespace {
    // 与 geo::kBandLetters 一一对应
    constexpr std::array<double, 20> kMinNorthings = {
        1100000.0,  // C
        2000000.0,  // D
        2800000.0,  // E
        3700000.0,  // F
        4600000.0,  // G
        5500000.0,  // H
        6400000.0,  // J
        7300000.0,  // K
        8200000.0,  // L
        9100000.0,  // M
        0.0,        // N
        800000.0,   // P
        1700000.0,  // Q
        2600000.0,  // R
        3500000.0,  // S
        4400000.0,  // T
        5300000.0,  // U
        6200000.0,  // V
        7000000.0,  // W
        7900000.0   // X
    };

    constexpr double kSquareSize = 100000.0;
    constexpr double kRowCycle = 2000000.0;

    // 每组位数 -> 精度（米）
    constexpr std::array<int, 6> kPrecisionByDigits = {100000, 10000, 1000, 100, 10, 1};

    bool isReservedZoneLetter(char letter) noexcept {
        return letter == 'A' || letter == 'B' || letter == 'Y' || letter == 'Z' ||
               letter == 'I' || letter == 'O';
    }

    bool allDigits(std::string_view text) noexcept {
        return std::all_of(text.begin(), text.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::optional<int> parseDigits(std::string_view text) noexcept {
        int value = 0;
        if (text.empty() || !allDigits(text)) {
            return std::nullopt;
        }
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::string describe(std::string_view what, std::string_view reference) {
        std::string message{what};
        message += ", mgrs = ";
        message += reference;
        return message;
    }
}

std::optional<double> minimumNorthing(char bandLetter) noexcept {
    const auto index = geo::kBandLetters.find(bandLetter);
    if (index == std::string_view::npos) {
        return std::nullopt;
    }
    return kMinNorthings[index];
}

core::Result<double> eastingFromLetter(char letter, int zoneSet) {
    auto steps = kColumnAlphabet.stepsBetween(columnOriginFor(zoneSet), letter);
    if (!steps) {
        return core::makeError(core::ErrorCode::UnresolvableGridLetter,
                               std::string("bad column character: ") + letter);
    }
    // 列字母从 1 开始计数
    return (*steps + 1) * kSquareSize;
}

core::Result<double> northingFromLetter(char letter, int zoneSet) {
    auto steps = kRowAlphabet.stepsBetween(rowOriginFor(zoneSet), letter);
    if (!steps) {
        return core::makeError(core::ErrorCode::UnresolvableGridLetter,
                               std::string("bad row character: ") + letter);
    }
    return *steps * kSquareSize;
}

core::Result<core::DecodedUtm> decodeGridReference(std::string_view reference) {
    if (reference.empty()) {
        return core::makeError(core::ErrorCode::MalformedGridReference, "invalid empty mgrs string");
    }

    std::string mgrs{reference};
    std::transform(mgrs.begin(), mgrs.end(), mgrs.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    // 带号：字母之前最多 2 个字符
    std::size_t i = 0;
    while (i < mgrs.size() && !std::isupper(static_cast<unsigned char>(mgrs[i]))) {
        if (i >= 2) {
            return core::makeError(core::ErrorCode::MalformedGridReference,
                                   describe("bad zone number", mgrs));
        }
        ++i;
    }

    if (i == 0 || i == mgrs.size()) {
        return core::makeError(core::ErrorCode::MalformedGridReference,
                               describe("bad zone number", mgrs));
    }

    const auto parsedZone = parseDigits(std::string_view{mgrs.data(), i});
    if (!parsedZone) {
        return core::makeError(core::ErrorCode::MalformedGridReference,
                               describe("bad zone number", mgrs));
    }
    const int zoneNumber = *parsedZone;

    if (!geo::isValidZoneNumber(zoneNumber)) {
        std::ostringstream oss;
        oss << "invalid zone number, zone number = " << zoneNumber << ", mgrs = " << mgrs;
        return core::makeError(core::ErrorCode::InvalidZoneNumber, oss.str());
    }

    // 至少需要纬度带字母和两个方格字母
    if (i + 3 > mgrs.size()) {
        return core::makeError(core::ErrorCode::MalformedGridReference,
                               describe("bad conversion", mgrs));
    }

    const char zoneLetter = mgrs[i++];
    if (isReservedZoneLetter(zoneLetter)) {
        return core::makeError(core::ErrorCode::InvalidZoneLetter,
                               describe(std::string("zone letter ") + zoneLetter + " not handled", mgrs));
    }

    const char columnLetter = mgrs[i++];
    const char rowLetter = mgrs[i++];

    // 剩余部分是两组等长数字
    const std::size_t remainder = mgrs.size() - i;
    if (remainder % 2 != 0) {
        return core::makeError(core::ErrorCode::MalformedGridReference,
                               describe("uneven number of digits", mgrs));
    }

    const std::size_t sep = remainder / 2;
    if (sep >= kPrecisionByDigits.size()) {
        return core::makeError(core::ErrorCode::MalformedGridReference,
                               describe("too many digits", mgrs));
    }

    std::optional<int> eastingDigits = 0;
    std::optional<int> northingDigits = 0;
    if (sep > 0) {
        eastingDigits = parseDigits(std::string_view{mgrs.data() + i, sep});
        northingDigits = parseDigits(std::string_view{mgrs.data() + i + sep, sep});
    }
    if (!eastingDigits || !northingDigits) {
        return core::makeError(core::ErrorCode::MalformedGridReference,
                               describe("non-numeric digit group", mgrs));
    }

    const int zoneSet = zoneSetFor(zoneNumber);

    auto east100k = eastingFromLetter(columnLetter, zoneSet);
    if (!east100k) {
        return core::withContext(std::move(east100k.error()), describe("easting letter", mgrs));
    }

    auto north100k = northingFromLetter(rowLetter, zoneSet);
    if (!north100k) {
        return core::withContext(std::move(north100k.error()), describe("northing letter", mgrs));
    }

    // 行字母每 2,000,000 米循环，按纬度带最小 northing 补足
    const auto minNorthing = minimumNorthing(zoneLetter);
    if (!minNorthing) {
        return core::makeError(core::ErrorCode::InvalidZoneLetter,
                               describe(std::string("invalid zone letter: ") + zoneLetter, mgrs));
    }

    double northing100k = *north100k;
    while (northing100k < *minNorthing) {
        northing100k += kRowCycle;
    }

    const int precision = kPrecisionByDigits[sep];
    const double sepEasting = static_cast<double>(*eastingDigits) * precision;
    const double sepNorthing = static_cast<double>(*northingDigits) * precision;

    core::DecodedUtm decoded;
    decoded.utm = core::UtmCoordinate{zoneNumber, zoneLetter, *east100k + sepEasting, northing100k + sepNorthing};
    decoded.precisionMeters = precision;
    return decoded;
}

} // namespace gridconv::grid
