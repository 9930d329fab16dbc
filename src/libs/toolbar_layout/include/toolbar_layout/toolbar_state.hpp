#pragma once

#include <functional>
#include <memory>

namespace toolbar_layout {

using HeightChangeListener = std::function<void(int min_height, int max_height)>;
using VisibleHeightChangeListener = std::function<void(int height)>;

// Sizing contract of a collapsing toolbar. Written by the measure policy on
// every pass; read by placement and by outside observers between passes.
struct ToolbarState {
    // Height when fully collapsed.
    int min_height = 0;
    // Height when fully expanded.
    int max_height = 0;
    // Current height. Not clamped here.
    int height = 0;

    HeightChangeListener on_height_change;
    VisibleHeightChangeListener on_visible_height_change;

    // (height - min_height) / (max_height - min_height), clamped to [0, 1].
    // 0 when there is no collapse range.
    float progress() const;
};

std::shared_ptr<ToolbarState> make_toolbar_state(HeightChangeListener listener = {});

// Always refers to the toolbar's latest state object, so the state can be
// swapped without rebuilding whoever holds the slot.
class ToolbarStateSlot {
public:
    explicit ToolbarStateSlot(std::shared_ptr<ToolbarState> state);

    void set(std::shared_ptr<ToolbarState> state);
    ToolbarState& get() const { return *state_; }
    const std::shared_ptr<ToolbarState>& shared() const { return state_; }

private:
    std::shared_ptr<ToolbarState> state_;
};

} // namespace toolbar_layout
