#pragma once

#include <toolbar_layout/collapsing_toolbar.hpp>
#include <toolbar_layout/state_registry.hpp>
#include <toolbar_model/toolbar_description.hpp>
#include <memory>
#include <optional>
#include <string>

namespace toolbar_canvas {

// Hosts one collapsing toolbar inside an ImGui child region. The mouse wheel
// over the region asks for a smaller or larger toolbar height; the toolbar
// itself only ever sees that height as a layout constraint.
class ToolbarCanvas {
public:
    ToolbarCanvas();
    ~ToolbarCanvas();

    void set_description(toolbar_model::ToolbarDescription description);
    const toolbar_model::ToolbarDescription& description() const { return description_; }

    // nullopt lets the toolbar take its expanded height.
    void set_target_height(std::optional<int> height) { target_height_ = height; }
    std::optional<int> target_height() const { return target_height_; }
    void scroll_by(float delta_pixels);

    const toolbar_layout::ToolbarState& state() const;
    float progress() const { return state().progress(); }
    int bounds_change_count() const { return bounds_change_count_; }
    int visible_height_change_count() const { return visible_height_change_count_; }

    // Re-invokes and lays out the toolbar for a region `region_width` wide.
    const toolbar_layout::MeasureResult& layout(float region_width);

    bool update_and_draw(float region_width, float region_height);

private:
    toolbar_model::ToolbarDescription description_;
    toolbar_layout::StateRegistry registry_;
    std::unique_ptr<toolbar_layout::CollapsingToolbar> toolbar_;
    toolbar_layout::ToolbarContent content_;
    std::optional<int> target_height_;
    int bounds_change_count_ = 0;
    int visible_height_change_count_ = 0;
    float zoom_ = 1.0f;

    std::shared_ptr<toolbar_layout::ToolbarState> retained_state();
    toolbar_layout::Modifier toolbar_modifier() const;
    void handle_input(float region_width, float region_height);
};

} // namespace toolbar_canvas
