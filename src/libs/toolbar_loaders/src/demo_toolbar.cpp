#include <toolbar_loaders/json_loader.hpp>
#include <toolbar_model/alignment.hpp>
#include <utility>

namespace toolbar_loaders {

toolbar_model::ToolbarDescription generate_demo_toolbar() {
    using namespace toolbar_model;

    ToolbarDescription out;
    out.name = "Profile header (demo)";
    out.width = 420;

    auto add_child = [&](const char* id, const char* label, int width, int height,
        PlacementStrategy strategy, std::array<unsigned char, 3> color)
    {
        ChildDescription c;
        c.id = id;
        c.label = label;
        c.width = width;
        c.height = height;
        c.strategy = strategy;
        c.color = color;
        out.children.push_back(std::move(c));
    };

    // The tallest child sets the expanded height, the shortest the collapsed one.
    add_child("cover", "", kInfinity, 240, Parallax{}, {38, 52, 74});
    add_child("app_bar", "", kInfinity, 56, Pin{}, {28, 34, 44});
    add_child("avatar", "avatar", 72, 72,
        Road{alignment::center_start, alignment::center}, {90, 140, 210});
    add_child("title", "Jane Doe", 140, 32,
        Road{alignment::center_start, alignment::bottom_center}, {60, 60, 68});
    add_child("action", "+", 40, 40,
        Road{alignment::center_end, alignment::top_end}, {200, 110, 60});

    return out;
}

} // namespace toolbar_loaders
