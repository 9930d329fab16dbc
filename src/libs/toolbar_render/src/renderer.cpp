#include <toolbar_render/renderer.hpp>
#include "imgui.h"
#include <algorithm>
#include <cstddef>

namespace toolbar_render {

namespace {

ImVec2 toolbar_to_screen(float tx, float ty, float origin_x, float origin_y, float zoom) {
    return ImVec2(tx * zoom + origin_x, ty * zoom + origin_y);
}

} // namespace

void render_toolbar(ImDrawList* draw_list,
    const toolbar_model::ToolbarDescription& description,
    const toolbar_layout::MeasureResult& placed,
    float origin_x, float origin_y, float zoom)
{
    if (!draw_list) return;

    const unsigned int frame_fill = IM_COL32(20, 20, 24, 255);
    const unsigned int frame_border = IM_COL32(100, 100, 105, 255);
    const unsigned int child_border = IM_COL32(0, 0, 0, 90);
    const unsigned int text_color = IM_COL32(230, 230, 230, 255);
    const float line_thickness = 1.0f;

    const ImVec2 frame_min = toolbar_to_screen(0.0f, 0.0f, origin_x, origin_y, zoom);
    const ImVec2 frame_max = toolbar_to_screen(
        (float)placed.size.width, (float)placed.size.height, origin_x, origin_y, zoom);
    draw_list->AddRectFilled(frame_min, frame_max, frame_fill);
    draw_list->PushClipRect(frame_min, frame_max, true);

    const std::size_t count = std::min(description.children.size(), placed.placements.size());
    for (std::size_t i = 0; i < count; ++i) {
        const auto& child = description.children[i];
        const auto& p = placed.placements[i];
        if (p.rejected) continue;

        float x = (float)p.offset.x;
        float y = (float)p.offset.y;
        float w = (float)p.size.width;
        float h = (float)p.size.height;
        ImVec2 min_pt = toolbar_to_screen(x, y, origin_x, origin_y, zoom);
        ImVec2 max_pt = toolbar_to_screen(x + w, y + h, origin_x, origin_y, zoom);

        const unsigned int fill = IM_COL32(child.color[0], child.color[1], child.color[2], 255);
        draw_list->AddRectFilled(min_pt, max_pt, fill, 4.0f * zoom);
        draw_list->AddRect(min_pt, max_pt, child_border, 4.0f * zoom, 0, line_thickness);

        if (!child.label.empty()) {
            ImVec2 text_size = ImGui::CalcTextSize(child.label.c_str());
            float tx = min_pt.x + (max_pt.x - min_pt.x - text_size.x) * 0.5f;
            float ty = min_pt.y + (max_pt.y - min_pt.y - text_size.y) * 0.5f;
            draw_list->AddText(ImVec2(tx, ty), text_color, child.label.c_str());
        }
    }

    draw_list->PopClipRect();
    draw_list->AddRect(frame_min, frame_max, frame_border, 0.0f, 0, line_thickness);
}

void render_progress_strip(ImDrawList* draw_list,
    float x, float y, float width, float progress)
{
    if (!draw_list) return;

    const unsigned int track = IM_COL32(45, 45, 48, 255);
    const unsigned int fill = IM_COL32(90, 140, 210, 255);
    const float height = 4.0f;
    const float p = std::clamp(progress, 0.0f, 1.0f);

    draw_list->AddRectFilled(ImVec2(x, y), ImVec2(x + width, y + height), track);
    draw_list->AddRectFilled(ImVec2(x, y), ImVec2(x + width * p, y + height), fill);
}

} // namespace toolbar_render
