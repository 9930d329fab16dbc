#pragma once

#include <toolbar_layout/layout_node.hpp>
#include <toolbar_layout/toolbar_state.hpp>
#include <toolbar_model/placement_strategy.hpp>
#include <toolbar_model/types.hpp>
#include <memory>
#include <vector>

namespace toolbar_layout {

struct ChildPlacement {
    toolbar_model::IntSize size;
    toolbar_model::IntOffset offset;
    toolbar_model::PlacementStrategy strategy = toolbar_model::PlacementNone{};
    // Reported an unbounded extent on an unbounded axis; left out of the bounds.
    bool rejected = false;
};

struct MeasureResult {
    toolbar_model::IntSize size;
    std::vector<ChildPlacement> placements;
};

// Measures children with the height constraint relaxed, derives the
// toolbar's min/max/current height, publishes them to the state (notifying
// listeners on change) and computes each child's offset from its strategy.
class CollapsingToolbarMeasurePolicy {
public:
    explicit CollapsingToolbarMeasurePolicy(std::shared_ptr<const ToolbarStateSlot> state);

    MeasureResult measure(const std::vector<Measurable*>& measurables,
        const toolbar_model::Constraints& constraints) const;

private:
    std::shared_ptr<const ToolbarStateSlot> state_;
};

} // namespace toolbar_layout
