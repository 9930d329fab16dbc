#pragma once

#include <toolbar_layout/toolbar_state.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

namespace toolbar_layout {

// Keeps toolbar states alive across rebuilds of the toolbars that use them,
// keyed by a stable container identity.
class StateRegistry {
public:
    // Returns the state stored under `key`, creating it on first use. The
    // listener is only consulted when the state is created.
    std::shared_ptr<ToolbarState> toolbar_state(const std::string& key, HeightChangeListener listener = {});

    bool contains(const std::string& key) const { return states_.count(key) != 0; }
    std::size_t size() const { return states_.size(); }
    void forget(const std::string& key) { states_.erase(key); }

private:
    std::unordered_map<std::string, std::shared_ptr<ToolbarState>> states_;
};

// Same state for the same key on every call, seeded with 0/0/0.
std::shared_ptr<ToolbarState> remember_toolbar_state(StateRegistry& registry,
    const std::string& key,
    HeightChangeListener listener = {});

} // namespace toolbar_layout
