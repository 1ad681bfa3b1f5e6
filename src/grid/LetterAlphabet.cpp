#include "grid/LetterAlphabet.hpp"

namespace gridconv::grid {

char LetterAlphabet::advance(char origin, int steps) const noexcept {
    const auto start = letters_.find(origin);
    if (start == std::string_view::npos) {
        return at(steps);
    }
    return at(static_cast<int>(start) + steps);
}

std::optional<int> LetterAlphabet::stepsBetween(char origin, char target) const noexcept {
    const auto start = letters_.find(origin);
    if (start == std::string_view::npos) {
        return std::nullopt;
    }

    const int n = size();
    int index = static_cast<int>(start);
    int steps = 0;
    int wraps = 0;

    while (letters_[static_cast<std::size_t>(index)] != target) {
        ++index;
        ++steps;
        if (index == n) {
            if (++wraps == 2) {
                return std::nullopt;
            }
            index = 0;
        }
    }

    return steps;
}

} // namespace gridconv::grid
