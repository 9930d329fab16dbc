#include <toolbar_layout/state_registry.hpp>
#include <utility>

namespace toolbar_layout {

std::shared_ptr<ToolbarState> StateRegistry::toolbar_state(const std::string& key, HeightChangeListener listener) {
    auto it = states_.find(key);
    if (it != states_.end()) return it->second;
    auto state = make_toolbar_state(std::move(listener));
    states_.emplace(key, state);
    return state;
}

std::shared_ptr<ToolbarState> remember_toolbar_state(StateRegistry& registry,
    const std::string& key,
    HeightChangeListener listener)
{
    return registry.toolbar_state(key, std::move(listener));
}

} // namespace toolbar_layout
