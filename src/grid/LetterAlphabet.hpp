#pragma once

#include <optional>
#include <string_view>

namespace gridconv::grid {

// 100km 方格字母表（不含 I、O），索引按长度取模回绕
class LetterAlphabet {
public:
    constexpr explicit LetterAlphabet(std::string_view letters) noexcept
        : letters_(letters) {}

    constexpr int size() const noexcept { return static_cast<int>(letters_.size()); }

    // 偏移量对应的字母，负数同样回绕
    [[nodiscard]] constexpr char at(int offset) const noexcept {
        const int n = size();
        return letters_[static_cast<std::size_t>(((offset % n) + n) % n)];
    }

    // 从 origin 前进 steps 个字母
    [[nodiscard]] char advance(char origin, int steps) const noexcept;

    // 从 origin 出发走到 target 所需的步数；回绕两次仍未找到返回 nullopt
    [[nodiscard]] std::optional<int> stepsBetween(char origin, char target) const noexcept;

    [[nodiscard]] constexpr bool contains(char letter) const noexcept {
        return letters_.find(letter) != std::string_view::npos;
    }

private:
    std::string_view letters_;
};

// 列字母 A..Z，24 个
inline constexpr LetterAlphabet kColumnAlphabet{"ABCDEFGHJKLMNPQRSTUVWXYZ"};

// 行字母 A..V，20 个
inline constexpr LetterAlphabet kRowAlphabet{"ABCDEFGHJKLMNPQRSTUV"};

// 六个带组的起始字母，按 (zoneNumber - 1) mod 6 索引
inline constexpr std::string_view kSetOriginColumnLetters = "AJSAJS";
inline constexpr std::string_view kSetOriginRowLetters = "AFAFAF";
inline constexpr int kZoneSetCount = 6;

// 带号所属的 100km 带组（1..6）
[[nodiscard]] constexpr int zoneSetFor(int zoneNumber) noexcept {
    return (((zoneNumber - 1) % kZoneSetCount) + kZoneSetCount) % kZoneSetCount + 1;
}

[[nodiscard]] constexpr char columnOriginFor(int zoneSet) noexcept {
    return kSetOriginColumnLetters[static_cast<std::size_t>(zoneSet - 1)];
}

[[nodiscard]] constexpr char rowOriginFor(int zoneSet) noexcept {
    return kSetOriginRowLetters[static_cast<std::size_t>(zoneSet - 1)];
}

} // namespace gridconv::grid
