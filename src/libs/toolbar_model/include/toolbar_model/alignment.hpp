#pragma once

#include <toolbar_model/types.hpp>
#include <optional>
#include <string>

namespace toolbar_model {

// Bias based alignment: -1 is start/top, 0 is center, 1 is end/bottom.
// Always resolved left to right.
struct Alignment {
    float horizontal_bias = -1.0f;
    float vertical_bias = -1.0f;

    // Offset of a box of `size` inside `space`.
    IntOffset align(const IntSize& size, const IntSize& space) const;
};

inline bool operator==(const Alignment& a, const Alignment& b) {
    return a.horizontal_bias == b.horizontal_bias && a.vertical_bias == b.vertical_bias;
}
inline bool operator!=(const Alignment& a, const Alignment& b) { return !(a == b); }

namespace alignment {

inline constexpr Alignment top_start{-1.0f, -1.0f};
inline constexpr Alignment top_center{0.0f, -1.0f};
inline constexpr Alignment top_end{1.0f, -1.0f};
inline constexpr Alignment center_start{-1.0f, 0.0f};
inline constexpr Alignment center{0.0f, 0.0f};
inline constexpr Alignment center_end{1.0f, 0.0f};
inline constexpr Alignment bottom_start{-1.0f, 1.0f};
inline constexpr Alignment bottom_center{0.0f, 1.0f};
inline constexpr Alignment bottom_end{1.0f, 1.0f};

} // namespace alignment

// "top_start", "center", "bottom_end", ...
std::optional<Alignment> alignment_from_string(const std::string& name);

} // namespace toolbar_model
