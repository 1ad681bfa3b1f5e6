#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace gridconv::core {

// WGS84 大地坐标（度）
struct GeodeticPoint {
    double latitude{0.0};   // [-90, 90]
    double longitude{0.0};  // [-180, 180]

    constexpr GeodeticPoint() = default;
    constexpr GeodeticPoint(double lat, double lon)
        : latitude(lat), longitude(lon) {}
};

// UTM 投影坐标
// 注意：逆投影只通过 zoneLetter 是否小于 'N' 来判断南北半球，
// 字母与实际纬度不一致时会静默得到错误半球的结果。
struct UtmCoordinate {
    int zoneNumber{0};      // 1..60
    char zoneLetter{'N'};   // C..X，不含 I、O
    double easting{0.0};    // 米，截断到整米
    double northing{0.0};   // 米，南半球带 +10,000,000 偏移

    constexpr UtmCoordinate() = default;
    constexpr UtmCoordinate(int zone, char letter, double e, double n)
        : zoneNumber(zone), zoneLetter(letter), easting(e), northing(n) {}

    constexpr bool isSouthern() const noexcept { return zoneLetter < 'N'; }
};

// MGRS/UTMREF 网格参考字符串
class MgrsReference {
public:
    MgrsReference() = default;
    explicit MgrsReference(std::string value) : value_(std::move(value)) {}

    const std::string& str() const noexcept { return value_; }
    bool empty() const noexcept { return value_.empty(); }

    bool operator==(const MgrsReference& other) const noexcept = default;
    bool operator==(std::string_view other) const noexcept { return value_ == other; }

private:
    std::string value_;
};

// MGRS 解码结果：西南角坐标 + 精度（米）
struct DecodedUtm {
    UtmCoordinate utm;
    int precisionMeters{0};
};

struct DecodedGeodetic {
    GeodeticPoint point;
    int precisionMeters{0};
};

// 支持的精度（米）
inline constexpr int kPrecisions[] = {1, 10, 100, 1000, 10000};

} // namespace gridconv::core
