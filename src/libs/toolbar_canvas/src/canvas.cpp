#include <toolbar_canvas/canvas.hpp>
#include <toolbar_layout/log.hpp>
#include <toolbar_loaders/toolbar_builder.hpp>
#include <toolbar_render/renderer.hpp>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace toolbar_canvas {

namespace {

const char* const state_key = "viewer.toolbar";
const float wheel_step = 24.0f;
const float region_padding = 16.0f;

} // namespace

ToolbarCanvas::ToolbarCanvas() = default;
ToolbarCanvas::~ToolbarCanvas() = default;

void ToolbarCanvas::set_description(toolbar_model::ToolbarDescription description) {
    description_ = std::move(description);
    content_ = toolbar_loaders::toolbar_content(description_);
    // New children mean new bounds; start from a fresh state.
    registry_.forget(state_key);
    target_height_.reset();
    toolbar_ = std::make_unique<toolbar_layout::CollapsingToolbar>(toolbar_modifier(), retained_state(), content_);
}

std::shared_ptr<toolbar_layout::ToolbarState> ToolbarCanvas::retained_state() {
    const bool created = !registry_.contains(state_key);
    auto state = toolbar_layout::remember_toolbar_state(registry_, state_key,
        [this](int min_height, int max_height) {
            ++bounds_change_count_;
            toolbar_layout::layout_logger()->info("Toolbar bounds now [{}, {}]", min_height, max_height);
            // Old target may be outside the new range.
            target_height_.reset();
        });
    if (created) {
        state->on_visible_height_change = [this](int height) {
            ++visible_height_change_count_;
            toolbar_layout::layout_logger()->debug("Toolbar visible height {}", height);
        };
    }
    return state;
}

toolbar_layout::Modifier ToolbarCanvas::toolbar_modifier() const {
    toolbar_layout::Modifier m;
    m = description_.width > 0 ? m.width(description_.width) : m.fill_max_width();
    if (target_height_) m = m.height(*target_height_);
    return m;
}

const toolbar_layout::ToolbarState& ToolbarCanvas::state() const {
    static const toolbar_layout::ToolbarState empty;
    return toolbar_ ? toolbar_->state() : empty;
}

void ToolbarCanvas::scroll_by(float delta_pixels) {
    if (!toolbar_) return;
    const auto& s = toolbar_->state();
    const int current = target_height_ ? *target_height_ : s.height;
    const int next = current + static_cast<int>(std::lround(delta_pixels));
    target_height_ = std::clamp(next, s.min_height, std::max(s.min_height, s.max_height));
}

const toolbar_layout::MeasureResult& ToolbarCanvas::layout(float region_width) {
    static const toolbar_layout::MeasureResult empty;
    if (!toolbar_) return empty;

    toolbar_->update(toolbar_modifier(), retained_state(), content_);

    toolbar_model::Constraints constraints;
    constraints.max_width = std::max(0, static_cast<int>(region_width / zoom_));
    return toolbar_->layout(constraints);
}

void ToolbarCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    // Wheel down collapses, wheel up expands.
    if (in_region && io.MouseWheel != 0.0f)
        scroll_by(io.MouseWheel * wheel_step);

    if (in_region && ImGui::IsMouseDoubleClicked(0))
        target_height_.reset();
}

bool ToolbarCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    handle_input(region_width, region_height);

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    const float avail = region_width - 2.0f * region_padding;
    const auto& placed = layout(avail);
    const float origin_x = region_min.x + region_padding;
    const float origin_y = region_min.y + region_padding;

    toolbar_render::render_toolbar(draw_list, description_, placed, origin_x, origin_y, zoom_);
    toolbar_render::render_progress_strip(draw_list,
        origin_x, origin_y + (float)placed.size.height * zoom_ + 6.0f,
        (float)placed.size.width * zoom_, progress());

    const auto& s = state();
    ImGui::SetCursorScreenPos(ImVec2(origin_x, origin_y + (float)placed.size.height * zoom_ + 16.0f));
    ImGui::Text("height %d  [%d, %d]  progress %.2f", s.height, s.min_height, s.max_height, progress());
    ImGui::TextDisabled("wheel: collapse/expand  double-click: reset");
    return true;
}

} // namespace toolbar_canvas
