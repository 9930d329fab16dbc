#include <toolbar_model/types.hpp>
#include <algorithm>
#include <cmath>

namespace toolbar_model {

int round_to_int(float value) {
    return static_cast<int>(std::floor(value + 0.5f));
}

IntOffset operator*(const IntOffset& offset, float factor) {
    return IntOffset{
        round_to_int(static_cast<float>(offset.x) * factor),
        round_to_int(static_cast<float>(offset.y) * factor)};
}

Constraints Constraints::fixed(int width, int height) {
    return Constraints{width, width, height, height};
}

Constraints Constraints::with_width(int min_w, int max_w) const {
    Constraints c = *this;
    c.min_width = min_w;
    c.max_width = max_w;
    return c;
}

Constraints Constraints::with_height(int min_h, int max_h) const {
    Constraints c = *this;
    c.min_height = min_h;
    c.max_height = max_h;
    return c;
}

int Constraints::constrain_width(int width) const {
    return std::clamp(width, min_width, std::max(min_width, max_width));
}

int Constraints::constrain_height(int height) const {
    return std::clamp(height, min_height, std::max(min_height, max_height));
}

IntSize Constraints::constrain(const IntSize& size) const {
    return IntSize{constrain_width(size.width), constrain_height(size.height)};
}

} // namespace toolbar_model
