#include <toolbar_layout/toolbar_state.hpp>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace toolbar_layout {

float ToolbarState::progress() const {
    const int range = max_height - min_height;
    if (range <= 0) return 0.0f;
    const float p = static_cast<float>(height - min_height) / static_cast<float>(range);
    return std::clamp(p, 0.0f, 1.0f);
}

std::shared_ptr<ToolbarState> make_toolbar_state(HeightChangeListener listener) {
    auto state = std::make_shared<ToolbarState>();
    state->on_height_change = std::move(listener);
    return state;
}

ToolbarStateSlot::ToolbarStateSlot(std::shared_ptr<ToolbarState> state)
    : state_(std::move(state))
{
    if (!state_) throw std::invalid_argument("ToolbarStateSlot: null state");
}

void ToolbarStateSlot::set(std::shared_ptr<ToolbarState> state) {
    if (!state) throw std::invalid_argument("ToolbarStateSlot: null state");
    state_ = std::move(state);
}

} // namespace toolbar_layout
