#include <toolbar_layout/measure_policy.hpp>
#include <toolbar_layout/log.hpp>
#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace toolbar_layout {

using toolbar_model::Constraints;
using toolbar_model::IntOffset;
using toolbar_model::IntSize;
using toolbar_model::kInfinity;

namespace {

struct MeasuredChild {
    IntSize size;
    toolbar_model::PlacementStrategy strategy = toolbar_model::PlacementNone{};
    bool rejected = false;
};

// A child measured with an unbounded height may answer kInfinity. Clamp it
// to the incoming maximum when there is one; otherwise drop it from the
// bounds so no infinity reaches the state.
int sanitize_extent(int extent, int incoming_max, std::size_t index, const char* axis, bool& rejected) {
    if (extent < kInfinity) return std::max(extent, 0);
    if (incoming_max != kInfinity) {
        layout_logger()->warn("Toolbar child #{} reported unbounded {}; clamped to {}", index, axis, incoming_max);
        return incoming_max;
    }
    layout_logger()->error("Toolbar child #{} reported unbounded {} with no bound to clamp to; "
        "excluded from toolbar bounds", index, axis);
    rejected = true;
    return 0;
}

} // namespace

CollapsingToolbarMeasurePolicy::CollapsingToolbarMeasurePolicy(std::shared_ptr<const ToolbarStateSlot> state)
    : state_(std::move(state))
{
    if (!state_) throw std::invalid_argument("CollapsingToolbarMeasurePolicy: null state slot");
}

MeasureResult CollapsingToolbarMeasurePolicy::measure(const std::vector<Measurable*>& measurables,
    const Constraints& constraints) const
{
    // Pass 1: measure without height constraints and aggregate.
    const Constraints child_constraints = constraints.with_height(0, kInfinity);

    std::vector<MeasuredChild> measured;
    measured.reserve(measurables.size());

    int width = 0;
    int height = 0;
    int min_height = std::numeric_limits<int>::max();
    int max_height = 0;
    bool any_measured = false;

    for (std::size_t i = 0; i < measurables.size(); ++i) {
        Measurable* m = measurables[i];
        MeasuredChild child;
        if (!m) {
            layout_logger()->error("Toolbar child #{} is null; skipped", i);
            child.rejected = true;
            measured.push_back(child);
            continue;
        }

        const IntSize raw = m->measure(child_constraints);
        child.size.width = sanitize_extent(raw.width, constraints.max_width, i, "width", child.rejected);
        child.size.height = sanitize_extent(raw.height, constraints.max_height, i, "height", child.rejected);
        child.strategy = m->parent_data().value_or(toolbar_model::PlacementNone{});

        if (!child.rejected) {
            width = std::max(child.size.width, width);
            height = std::max(child.size.height, height);
            min_height = std::min(min_height, child.size.height);
            max_height = std::max(max_height, child.size.height);
            any_measured = true;
        }
        measured.push_back(std::move(child));
    }

    if (!any_measured) min_height = 0;

    width = constraints.constrain_width(width);
    height = constraints.constrain_height(height);

    // Publish. Listeners see the new values as arguments while the state
    // still holds the previous ones.
    ToolbarState& state = state_->get();
    if (state.min_height != min_height || state.max_height != max_height) {
        layout_logger()->debug("Toolbar bounds changed: [{}, {}] -> [{}, {}]",
            state.min_height, state.max_height, min_height, max_height);
        if (state.on_height_change) state.on_height_change(min_height, max_height);
    }
    if (state.height != height) {
        layout_logger()->debug("Toolbar height changed: {} -> {}", state.height, height);
        if (state.on_visible_height_change) state.on_visible_height_change(height);
    }
    state.min_height = min_height;
    state.max_height = max_height;
    state.height = height;

    // Pass 2: place using the aggregate.
    const IntSize space{width, height};
    MeasureResult result;
    result.size = space;
    result.placements.reserve(measured.size());

    for (const auto& child : measured) {
        ChildPlacement placement;
        placement.size = child.size;
        placement.strategy = child.strategy;
        placement.rejected = child.rejected;
        if (child.rejected) {
            result.placements.push_back(std::move(placement));
            continue;
        }
        placement.offset = std::visit([&](const auto& strategy) {
            using T = std::decay_t<decltype(strategy)>;
            if constexpr (std::is_same_v<T, toolbar_model::Road>) {
                const IntOffset collapsed = strategy.when_collapsed.align(child.size, space);
                const IntOffset expanded = strategy.when_expanded.align(child.size, space);
                return collapsed + (expanded - collapsed) * state_->get().progress();
            } else {
                // Pin, None and the not yet implemented Parallax sit at the origin.
                return IntOffset{0, 0};
            }
        }, child.strategy);
        result.placements.push_back(std::move(placement));
    }

    return result;
}

} // namespace toolbar_layout
