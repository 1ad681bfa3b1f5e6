#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/grid/GridReferenceEncoder.hpp"
#include "../src/grid/GridReferenceDecoder.hpp"
#include "../src/geo/TransverseMercator.hpp"
#include <string>

using namespace gridconv;
using namespace gridconv::grid;

TEST_CASE("Precision to digit count", "[encoder]") {
    REQUIRE(digitsForPrecision(1) == 5);
    REQUIRE(digitsForPrecision(10) == 4);
    REQUIRE(digitsForPrecision(100) == 3);
    REQUIRE(digitsForPrecision(1000) == 2);
    REQUIRE(digitsForPrecision(10000) == 1);

    // 不支持的精度按 1 米处理
    REQUIRE(digitsForPrecision(0) == 5);
    REQUIRE(digitsForPrecision(5) == 5);
    REQUIRE(digitsForPrecision(100000) == 5);
}

TEST_CASE("100km square identifier", "[encoder]") {
    REQUIRE(squareIdentifier(398973.0, 5756497.0, 32) == "LC");
    REQUIRE(squareIdentifier(611733.0, 7800614.0, 23) == "PU");
    REQUIRE(squareIdentifier(700373.0, 5704554.0, 31) == "GT");
    REQUIRE(squareIdentifier(593345.0, 4507672.0, 18) == "WL");
}

TEST_CASE("Encode UTM to MGRS", "[encoder]") {
    const core::UtmCoordinate utm{32, 'U', 398973.0, 5756497.0};

    SECTION("All precisions") {
        REQUIRE(encodeGridReference(utm, 1) == "32ULC9897356497");
        REQUIRE(encodeGridReference(utm, 10) == "32ULC98975649");
        REQUIRE(encodeGridReference(utm, 100) == "32ULC989564");
        REQUIRE(encodeGridReference(utm, 1000) == "32ULC9856");
        REQUIRE(encodeGridReference(utm, 10000) == "32ULC95");
    }

    SECTION("Coarser precision is a prefix of each digit group") {
        const auto fine = encodeGridReference(utm, 1).str();
        const auto fineEast = fine.substr(5, 5);
        const auto fineNorth = fine.substr(10, 5);

        for (int digits = 1; digits <= 5; ++digits) {
            const int precision = digits == 5 ? 1 : digits == 4 ? 10 : digits == 3 ? 100 : digits == 2 ? 1000 : 10000;
            const auto coarse = encodeGridReference(utm, precision).str();
            REQUIRE(coarse.size() == 5 + 2 * static_cast<std::size_t>(digits));
            REQUIRE(coarse.substr(0, 5) == "32ULC");
            REQUIRE(coarse.substr(5, digits) == fineEast.substr(0, digits));
            REQUIRE(coarse.substr(5 + digits, digits) == fineNorth.substr(0, digits));
        }
    }

    SECTION("Leading zeros are kept") {
        REQUIRE(encodeGridReference(core::UtmCoordinate{23, 'K', 611733.0, 7800614.0}, 1) == "23KPU1173300614");
        REQUIRE(encodeGridReference(core::UtmCoordinate{31, 'U', 700373.0, 5704554.0}, 1) == "31UGT0037304554");
    }

    SECTION("Unsupported precision falls back to 1 meter") {
        REQUIRE(encodeGridReference(utm, 7) == "32ULC9897356497");
    }
}

TEST_CASE("Minimum northing per band", "[decoder]") {
    REQUIRE(minimumNorthing('C') == 1100000.0);
    REQUIRE(minimumNorthing('M') == 9100000.0);
    REQUIRE(minimumNorthing('N') == 0.0);
    REQUIRE(minimumNorthing('U') == 5300000.0);
    REQUIRE(minimumNorthing('X') == 7900000.0);

    REQUIRE_FALSE(minimumNorthing('A').has_value());
    REQUIRE_FALSE(minimumNorthing('I').has_value());
    REQUIRE_FALSE(minimumNorthing('Z').has_value());
}

TEST_CASE("Square letters to 100km offsets", "[decoder]") {
    SECTION("Column letters") {
        REQUIRE(eastingFromLetter('A', 1).value() == 100000.0);
        REQUIRE(eastingFromLetter('H', 1).value() == 800000.0);
        REQUIRE(eastingFromLetter('J', 2).value() == 100000.0);
        REQUIRE(eastingFromLetter('L', 2).value() == 300000.0);
        REQUIRE(eastingFromLetter('S', 3).value() == 100000.0);
        REQUIRE(eastingFromLetter('A', 3).value() == 900000.0);
    }

    SECTION("Row letters") {
        REQUIRE(northingFromLetter('A', 1).value() == 0.0);
        REQUIRE(northingFromLetter('V', 1).value() == 1900000.0);
        REQUIRE(northingFromLetter('F', 2).value() == 0.0);
        REQUIRE(northingFromLetter('A', 2).value() == 1500000.0);
    }

    SECTION("Letters outside the alphabets") {
        auto column = eastingFromLetter('I', 1);
        REQUIRE_FALSE(column.has_value());
        REQUIRE(column.error().code == core::ErrorCode::UnresolvableGridLetter);
        REQUIRE(column.error().message == "bad column character: I");

        auto row = northingFromLetter('W', 1);
        REQUIRE_FALSE(row.has_value());
        REQUIRE(row.error().code == core::ErrorCode::UnresolvableGridLetter);
        REQUIRE(row.error().message == "bad row character: W");
    }
}

TEST_CASE("Decode MGRS to UTM", "[decoder]") {
    SECTION("Precision follows the digit count") {
        auto d10 = decodeGridReference("32ULC98975649");
        REQUIRE(d10.has_value());
        REQUIRE(d10->utm.zoneNumber == 32);
        REQUIRE(d10->utm.zoneLetter == 'U');
        REQUIRE(d10->utm.easting == 398970.0);
        REQUIRE(d10->utm.northing == 5756490.0);
        REQUIRE(d10->precisionMeters == 10);

        auto d100 = decodeGridReference("32ULC989564");
        REQUIRE(d100.has_value());
        REQUIRE(d100->utm.easting == 398900.0);
        REQUIRE(d100->utm.northing == 5756400.0);
        REQUIRE(d100->precisionMeters == 100);

        auto d1000 = decodeGridReference("32ULC9856");
        REQUIRE(d1000.has_value());
        REQUIRE(d1000->utm.easting == 398000.0);
        REQUIRE(d1000->utm.northing == 5756000.0);
        REQUIRE(d1000->precisionMeters == 1000);

        auto d10000 = decodeGridReference("32ULC95");
        REQUIRE(d10000.has_value());
        REQUIRE(d10000->utm.easting == 390000.0);
        REQUIRE(d10000->utm.northing == 5750000.0);
        REQUIRE(d10000->precisionMeters == 10000);
    }

    SECTION("Square only gives 100km precision") {
        auto d = decodeGridReference("32ULC");
        REQUIRE(d.has_value());
        REQUIRE(d->utm.easting == 300000.0);
        REQUIRE(d->utm.northing == 5700000.0);
        REQUIRE(d->precisionMeters == 100000);
    }

    SECTION("Other zones") {
        auto a = decodeGridReference("18TWL9334507672");
        REQUIRE(a.has_value());
        REQUIRE(a->utm.zoneNumber == 18);
        REQUIRE(a->utm.zoneLetter == 'T');
        REQUIRE(a->utm.easting == 593345.0);
        REQUIRE(a->utm.northing == 4507672.0);
        REQUIRE(a->precisionMeters == 1);

        auto b = decodeGridReference("10SGJ0683244683");
        REQUIRE(b.has_value());
        REQUIRE(b->utm.zoneNumber == 10);
        REQUIRE(b->utm.zoneLetter == 'S');
        REQUIRE(b->utm.easting == 706832.0);
        REQUIRE(b->utm.northing == 4344683.0);

        auto c = decodeGridReference("31UGT0037304554");
        REQUIRE(c.has_value());
        REQUIRE(c->utm.easting == 700373.0);
        REQUIRE(c->utm.northing == 5704554.0);

        auto d = decodeGridReference("23KPU1173300614");
        REQUIRE(d.has_value());
        REQUIRE(d->utm.easting == 611733.0);
        REQUIRE(d->utm.northing == 7800614.0);
    }

    SECTION("Lower case input") {
        auto d = decodeGridReference("32ulc989564");
        REQUIRE(d.has_value());
        REQUIRE(d->utm.zoneLetter == 'U');
        REQUIRE(d->utm.easting == 398900.0);
        REQUIRE(d->utm.northing == 5756400.0);
    }
}

TEST_CASE("Decode rejects malformed references", "[decoder]") {
    auto codeOf = [](std::string_view text) {
        auto d = decodeGridReference(text);
        REQUIRE_FALSE(d.has_value());
        return d.error().code;
    };

    SECTION("Empty") {
        auto d = decodeGridReference("");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().code == core::ErrorCode::MalformedGridReference);
        REQUIRE(d.error().message == "invalid empty mgrs string");
    }

    SECTION("Uneven digit groups") {
        auto d = decodeGridReference("32ULC9897356497CORRUPT");
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().code == core::ErrorCode::MalformedGridReference);
        REQUIRE(d.error().message == "uneven number of digits, mgrs = 32ULC9897356497CORRUPT");
    }

    SECTION("Zone number") {
        REQUIRE(codeOf("ULC1234") == core::ErrorCode::MalformedGridReference);
        REQUIRE(codeOf("123ULC1234") == core::ErrorCode::MalformedGridReference);
        REQUIRE(codeOf("32") == core::ErrorCode::MalformedGridReference);
        REQUIRE(codeOf("61ULC1234") == core::ErrorCode::InvalidZoneNumber);
        REQUIRE(codeOf("00ULC1234") == core::ErrorCode::InvalidZoneNumber);
    }

    SECTION("Too short for band and square letters") {
        REQUIRE(codeOf("32UL") == core::ErrorCode::MalformedGridReference);
    }

    SECTION("Reserved band letters") {
        REQUIRE(codeOf("32ALC1234") == core::ErrorCode::InvalidZoneLetter);
        REQUIRE(codeOf("32BLC1234") == core::ErrorCode::InvalidZoneLetter);
        REQUIRE(codeOf("32YLC1234") == core::ErrorCode::InvalidZoneLetter);
        REQUIRE(codeOf("32ZLC1234") == core::ErrorCode::InvalidZoneLetter);
        REQUIRE(codeOf("32ILC1234") == core::ErrorCode::InvalidZoneLetter);
        REQUIRE(codeOf("32OLC1234") == core::ErrorCode::InvalidZoneLetter);
    }

    SECTION("Digit groups") {
        REQUIRE(codeOf("32ULC123456789012") == core::ErrorCode::MalformedGridReference);
        REQUIRE(codeOf("32ULC98A564") == core::ErrorCode::MalformedGridReference);
    }

    SECTION("Square letters not in the alphabets") {
        auto column = decodeGridReference("32UIC1234");
        REQUIRE_FALSE(column.has_value());
        REQUIRE(column.error().code == core::ErrorCode::UnresolvableGridLetter);
        REQUIRE(column.error().message.find("bad column character: I") != std::string::npos);

        REQUIRE(codeOf("32ULW1234") == core::ErrorCode::UnresolvableGridLetter);
    }
}

TEST_CASE("Encode and decode stay within one precision cell", "[decoder]") {
    const core::GeodeticPoint points[] = {
        {51.95, 7.53},
        {-19.887495, -43.932663},
        {40.7128, -74.0060},
        {-33.8688, 151.2093},
        {35.6762, 139.6503},
        {1.3521, 103.8198},
        {-54.8019, -68.3030},
        {64.1466, -21.9426},
        {78.2232, 15.6267},
    };

    for (const auto& p : points) {
        const auto utm = geo::projectToUtm(p);

        for (int precision : core::kPrecisions) {
            const auto mgrs = encodeGridReference(utm, precision);
            auto decoded = decodeGridReference(mgrs.str());
            REQUIRE(decoded.has_value());

            // 解码结果是方格西南角
            REQUIRE(decoded->precisionMeters == precision);
            REQUIRE(decoded->utm.zoneNumber == utm.zoneNumber);
            REQUIRE(decoded->utm.zoneLetter == utm.zoneLetter);
            REQUIRE(decoded->utm.easting <= utm.easting);
            REQUIRE(utm.easting - decoded->utm.easting < precision);
            REQUIRE(decoded->utm.northing <= utm.northing);
            REQUIRE(utm.northing - decoded->utm.northing < precision);
        }
    }
}
