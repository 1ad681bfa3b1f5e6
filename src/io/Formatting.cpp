#include "io/Formatting.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>
#include <fmt/format.h>

namespace gridconv::io {

namespace {
    // 按空白和逗号切分
    std::vector<std::string_view> tokenize(std::string_view text) {
        std::vector<std::string_view> tokens;
        std::size_t pos = 0;

        auto isSeparator = [](char c) {
            return c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c)) != 0;
        };

        while (pos < text.size()) {
            while (pos < text.size() && isSeparator(text[pos])) {
                ++pos;
            }
            const auto start = pos;
            while (pos < text.size() && !isSeparator(text[pos])) {
                ++pos;
            }
            if (pos > start) {
                tokens.push_back(text.substr(start, pos - start));
            }
        }

        return tokens;
    }

    std::optional<double> toDouble(std::string_view token) noexcept {
        if (!token.empty() && token.front() == '+') {
            token.remove_prefix(1);
        }
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::optional<int> toInt(std::string_view token) noexcept {
        int value = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
            return std::nullopt;
        }
        return value;
    }

    std::string lower(std::string_view text) {
        std::string result{text};
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
}

std::string_view toString(CoordinateKind kind) noexcept {
    switch (kind) {
        case CoordinateKind::Geodetic: return "ll";
        case CoordinateKind::Utm:      return "utm";
        case CoordinateKind::Mgrs:     return "mgrs";
    }
    return "unknown";
}

std::optional<CoordinateKind> parseCoordinateKind(std::string_view name) noexcept {
    const auto key = lower(name);
    if (key == "ll" || key == "latlon" || key == "geodetic") {
        return CoordinateKind::Geodetic;
    }
    if (key == "utm") {
        return CoordinateKind::Utm;
    }
    if (key == "mgrs" || key == "utmref") {
        return CoordinateKind::Mgrs;
    }
    return std::nullopt;
}

std::string formatGeodetic(const core::GeodeticPoint& point) {
    return fmt::format("{:.6f} {:.6f}", point.latitude, point.longitude);
}

std::string formatUtm(const core::UtmCoordinate& utm) {
    return fmt::format("{}{} {:.0f} {:.0f}", utm.zoneNumber, utm.zoneLetter, utm.easting, utm.northing);
}

std::string formatMgrs(const core::MgrsReference& mgrs) {
    return mgrs.str();
}

std::optional<core::GeodeticPoint> parseGeodetic(std::string_view text) {
    const auto tokens = tokenize(text);
    if (tokens.size() != 2) {
        return std::nullopt;
    }

    auto lat = toDouble(tokens[0]);
    auto lon = toDouble(tokens[1]);
    if (!lat || !lon) {
        return std::nullopt;
    }

    return core::GeodeticPoint{*lat, *lon};
}

std::optional<core::UtmCoordinate> parseUtm(std::string_view text) {
    const auto tokens = tokenize(text);

    std::string_view zoneToken;
    std::string_view letterToken;
    std::size_t next = 0;

    if (tokens.size() == 3) {
        // "32U"
        const auto& first = tokens[0];
        if (first.size() < 2) {
            return std::nullopt;
        }
        zoneToken = first.substr(0, first.size() - 1);
        letterToken = first.substr(first.size() - 1);
        next = 1;
    } else if (tokens.size() == 4) {
        // "32 U"
        zoneToken = tokens[0];
        letterToken = tokens[1];
        next = 2;
    } else {
        return std::nullopt;
    }

    auto zone = toInt(zoneToken);
    if (!zone || letterToken.size() != 1 ||
        !std::isalpha(static_cast<unsigned char>(letterToken.front()))) {
        return std::nullopt;
    }

    auto easting = toDouble(tokens[next]);
    auto northing = toDouble(tokens[next + 1]);
    if (!easting || !northing) {
        return std::nullopt;
    }

    const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letterToken.front())));
    return core::UtmCoordinate{*zone, letter, *easting, *northing};
}

core::Result<core::MgrsReference> parseMgrs(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());

    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }

    if (compact.empty()) {
        return core::makeError(core::ErrorCode::MalformedGridReference, "invalid empty mgrs string");
    }

    return core::MgrsReference{std::move(compact)};
}

std::optional<CoordinateKind> detectKind(std::string_view text) {
    if (parseGeodetic(text)) {
        return CoordinateKind::Geodetic;
    }
    if (parseUtm(text)) {
        return CoordinateKind::Utm;
    }

    // MGRS 以带号数字开头，并含有字母
    const auto tokens = tokenize(text);
    if (!tokens.empty() && std::isdigit(static_cast<unsigned char>(tokens.front().front())) &&
        std::any_of(text.begin(), text.end(), [](unsigned char c) { return std::isalpha(c) != 0; })) {
        return CoordinateKind::Mgrs;
    }

    return std::nullopt;
}

} // namespace gridconv::io
