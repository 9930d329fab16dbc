#pragma once

#include <toolbar_model/alignment.hpp>
#include <variant>

namespace toolbar_model {

struct PlacementNone {};

// Interpolated between two alignments as collapse progress goes 0 -> 1.
struct Road {
    Alignment when_collapsed;
    Alignment when_expanded;
};

// Declared but not implemented yet: placed like Pin, at the origin.
struct Parallax {};

// Placed at the origin; there is no separate pinned position.
struct Pin {};

using PlacementStrategy = std::variant<PlacementNone, Road, Parallax, Pin>;

const char* strategy_name(const PlacementStrategy& strategy);

inline bool operator==(const PlacementNone&, const PlacementNone&) { return true; }
inline bool operator==(const Parallax&, const Parallax&) { return true; }
inline bool operator==(const Pin&, const Pin&) { return true; }
inline bool operator==(const Road& a, const Road& b) {
    return a.when_collapsed == b.when_collapsed && a.when_expanded == b.when_expanded;
}

} // namespace toolbar_model
