#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/io/Formatting.hpp"
#include "../src/io/JsonWriter.hpp"
#include <sstream>

using namespace gridconv;
using namespace gridconv::io;

TEST_CASE("Coordinate kind names", "[formatting]") {
    REQUIRE(toString(CoordinateKind::Geodetic) == "ll");
    REQUIRE(toString(CoordinateKind::Utm) == "utm");
    REQUIRE(toString(CoordinateKind::Mgrs) == "mgrs");

    REQUIRE(parseCoordinateKind("ll") == CoordinateKind::Geodetic);
    REQUIRE(parseCoordinateKind("LatLon") == CoordinateKind::Geodetic);
    REQUIRE(parseCoordinateKind("UTM") == CoordinateKind::Utm);
    REQUIRE(parseCoordinateKind("mgrs") == CoordinateKind::Mgrs);
    REQUIRE(parseCoordinateKind("utmref") == CoordinateKind::Mgrs);
    REQUIRE_FALSE(parseCoordinateKind("ups").has_value());
    REQUIRE_FALSE(parseCoordinateKind("").has_value());
}

TEST_CASE("Formatting coordinates", "[formatting]") {
    REQUIRE(formatGeodetic(core::GeodeticPoint{51.95, 7.53}) == "51.950000 7.530000");
    REQUIRE(formatGeodetic(core::GeodeticPoint{-19.88749831, -43.93266429}) == "-19.887498 -43.932664");
    REQUIRE(formatUtm(core::UtmCoordinate{32, 'U', 398973.0, 5756497.0}) == "32U 398973 5756497");
    REQUIRE(formatUtm(core::UtmCoordinate{9, 'K', 611733.0, 7800614.0}) == "9K 611733 7800614");
    REQUIRE(formatMgrs(core::MgrsReference{"32ULC9897356497"}) == "32ULC9897356497");
}

TEST_CASE("Parsing latitude/longitude", "[formatting]") {
    SECTION("Space or comma separated") {
        auto a = parseGeodetic("51.95 7.53");
        REQUIRE(a.has_value());
        REQUIRE(a->latitude == Catch::Approx(51.95));
        REQUIRE(a->longitude == Catch::Approx(7.53));

        auto b = parseGeodetic("  -19.887495, -43.932663 ");
        REQUIRE(b.has_value());
        REQUIRE(b->latitude == Catch::Approx(-19.887495));
        REQUIRE(b->longitude == Catch::Approx(-43.932663));
    }

    SECTION("No range check") {
        auto p = parseGeodetic("99.95 188.53");
        REQUIRE(p.has_value());
        REQUIRE(p->latitude == Catch::Approx(99.95));
    }

    SECTION("Rejects other shapes") {
        REQUIRE_FALSE(parseGeodetic("51.95").has_value());
        REQUIRE_FALSE(parseGeodetic("51.95 7.53 12").has_value());
        REQUIRE_FALSE(parseGeodetic("51.95N 7.53E").has_value());
        REQUIRE_FALSE(parseGeodetic("").has_value());
    }
}

TEST_CASE("Parsing UTM", "[formatting]") {
    SECTION("Zone and letter joined") {
        auto utm = parseUtm("32U 398973 5756497");
        REQUIRE(utm.has_value());
        REQUIRE(utm->zoneNumber == 32);
        REQUIRE(utm->zoneLetter == 'U');
        REQUIRE(utm->easting == 398973.0);
        REQUIRE(utm->northing == 5756497.0);
    }

    SECTION("Zone and letter separated, lower case letter") {
        auto utm = parseUtm("23 k 611733 7800614");
        REQUIRE(utm.has_value());
        REQUIRE(utm->zoneNumber == 23);
        REQUIRE(utm->zoneLetter == 'K');
        REQUIRE(utm->northing == 7800614.0);
    }

    SECTION("Rejects other shapes") {
        REQUIRE_FALSE(parseUtm("32U 398973").has_value());
        REQUIRE_FALSE(parseUtm("U 398973 5756497").has_value());
        REQUIRE_FALSE(parseUtm("32U x 5756497").has_value());
        REQUIRE_FALSE(parseUtm("51.95 7.53").has_value());
    }
}

TEST_CASE("Parsing MGRS", "[formatting]") {
    auto mgrs = parseMgrs("32U LC 98973 56497");
    REQUIRE(mgrs.has_value());
    REQUIRE(*mgrs == "32ULC9897356497");

    auto lower = parseMgrs("32ulc989564");
    REQUIRE(lower.has_value());
    REQUIRE(*lower == "32ULC989564");

    auto empty = parseMgrs("   ");
    REQUIRE_FALSE(empty.has_value());
    REQUIRE(empty.error().code == core::ErrorCode::MalformedGridReference);
}

TEST_CASE("Detecting coordinate kind", "[formatting]") {
    REQUIRE(detectKind("51.95 7.53") == CoordinateKind::Geodetic);
    REQUIRE(detectKind("-19.887495,-43.932663") == CoordinateKind::Geodetic);
    REQUIRE(detectKind("32U 398973 5756497") == CoordinateKind::Utm);
    REQUIRE(detectKind("32 U 398973 5756497") == CoordinateKind::Utm);
    REQUIRE(detectKind("32ULC9897356497") == CoordinateKind::Mgrs);
    REQUIRE(detectKind("32U LC 98973 56497") == CoordinateKind::Mgrs);
    REQUIRE_FALSE(detectKind("hello world").has_value());
    REQUIRE_FALSE(detectKind("").has_value());
}

TEST_CASE("JSON output", "[formatting][json]") {
    SECTION("Geodetic point") {
        auto json = toJson(core::GeodeticPoint{51.95, 7.53});
        REQUIRE(json["type"] == "ll");
        REQUIRE(json["latitude"].get<double>() == Catch::Approx(51.95));
        REQUIRE(json["longitude"].get<double>() == Catch::Approx(7.53));
        REQUIRE(json["text"] == "51.950000 7.530000");
    }

    SECTION("UTM coordinate") {
        auto json = toJson(core::UtmCoordinate{32, 'U', 398973.0, 5756497.0});
        REQUIRE(json["type"] == "utm");
        REQUIRE(json["zoneNumber"] == 32);
        REQUIRE(json["zoneLetter"] == "U");
        REQUIRE(json["easting"].get<double>() == 398973.0);
        REQUIRE(json["text"] == "32U 398973 5756497");
    }

    SECTION("Decoded MGRS keeps precision") {
        core::DecodedUtm decoded;
        decoded.utm = core::UtmCoordinate{32, 'U', 398900.0, 5756400.0};
        decoded.precisionMeters = 100;

        auto json = toJson(decoded);
        REQUIRE(json["type"] == "utm");
        REQUIRE(json["precision"] == 100);
    }

    SECTION("Error") {
        auto json = toJson(core::ConversionError{core::ErrorCode::InvalidZoneNumber, "invalid zone number, zone number = 132"});
        REQUIRE(json["code"] == "InvalidZoneNumber");
        REQUIRE(json["message"] == "invalid zone number, zone number = 132");
    }

    SECTION("Writer") {
        std::ostringstream out;
        writeJson(out, toJson(core::MgrsReference{"32ULC95"}), -1);
        REQUIRE(out.str() == "{\"text\":\"32ULC95\",\"type\":\"mgrs\"}\n");
    }
}
