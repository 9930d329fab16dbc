#pragma once

#include <toolbar_model/placement_strategy.hpp>
#include <toolbar_model/types.hpp>
#include <array>
#include <string>
#include <vector>

namespace toolbar_model {

// Declarative toolbar child, as read from a description file.
struct ChildDescription {
    std::string id;
    std::string label;
    // kInfinity fills the available space on that axis.
    int width = kInfinity;
    int height = 0;
    PlacementStrategy strategy = PlacementNone{};
    std::array<unsigned char, 3> color = {70, 70, 78};
};

struct ToolbarDescription {
    std::string name;
    // Width the toolbar is laid out with; 0 uses the host's width.
    int width = 0;
    std::vector<ChildDescription> children;
};

} // namespace toolbar_model
