#pragma once

#include <limits>

namespace toolbar_model {

// Marks an unbounded maximum in Constraints.
constexpr int kInfinity = std::numeric_limits<int>::max();

struct IntSize {
    int width = 0;
    int height = 0;
};

struct IntOffset {
    int x = 0;
    int y = 0;
};

inline bool operator==(const IntSize& a, const IntSize& b) {
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const IntSize& a, const IntSize& b) { return !(a == b); }

inline bool operator==(const IntOffset& a, const IntOffset& b) {
    return a.x == b.x && a.y == b.y;
}
inline bool operator!=(const IntOffset& a, const IntOffset& b) { return !(a == b); }

inline IntOffset operator+(const IntOffset& a, const IntOffset& b) {
    return IntOffset{a.x + b.x, a.y + b.y};
}
inline IntOffset operator-(const IntOffset& a, const IntOffset& b) {
    return IntOffset{a.x - b.x, a.y - b.y};
}

// Scales each axis, rounding half up.
IntOffset operator*(const IntOffset& offset, float factor);

int round_to_int(float value);

struct Constraints {
    int min_width = 0;
    int max_width = kInfinity;
    int min_height = 0;
    int max_height = kInfinity;

    static Constraints fixed(int width, int height);
    static Constraints unbounded() { return Constraints{}; }

    bool has_bounded_width() const { return max_width != kInfinity; }
    bool has_bounded_height() const { return max_height != kInfinity; }

    Constraints with_width(int min_w, int max_w) const;
    Constraints with_height(int min_h, int max_h) const;

    int constrain_width(int width) const;
    int constrain_height(int height) const;
    IntSize constrain(const IntSize& size) const;
};

} // namespace toolbar_model
