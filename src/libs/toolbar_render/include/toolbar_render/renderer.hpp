#pragma once

#include <toolbar_layout/measure_policy.hpp>
#include <toolbar_model/toolbar_description.hpp>

struct ImDrawList;

namespace toolbar_render {

// Draws a laid-out toolbar. `placed` must come from a toolbar built from
// `description` (one placement per described child, same order).
void render_toolbar(ImDrawList* draw_list,
    const toolbar_model::ToolbarDescription& description,
    const toolbar_layout::MeasureResult& placed,
    float origin_x, float origin_y, float zoom);

// Collapsed/expanded bounds and progress as a strip under the toolbar.
void render_progress_strip(ImDrawList* draw_list,
    float x, float y, float width, float progress);

} // namespace toolbar_render
