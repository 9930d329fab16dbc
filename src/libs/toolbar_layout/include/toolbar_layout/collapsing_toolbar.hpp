#pragma once

#include <toolbar_layout/layout_node.hpp>
#include <toolbar_layout/measure_policy.hpp>
#include <toolbar_layout/modifier.hpp>
#include <toolbar_layout/toolbar_state.hpp>
#include <toolbar_model/alignment.hpp>
#include <toolbar_model/types.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace toolbar_layout {

class CollapsingToolbar;

// Handed to a toolbar's content block. Declares children and the placement
// annotations that are only meaningful inside a collapsing toolbar.
class CollapsingToolbarScope {
public:
    // Moves between two alignments as the toolbar collapses.
    Modifier road(const Modifier& modifier,
        const toolbar_model::Alignment& when_collapsed,
        const toolbar_model::Alignment& when_expanded) const;
    Modifier parallax(const Modifier& modifier) const;
    Modifier pin(const Modifier& modifier) const;

    // Throws std::invalid_argument for a null child.
    LayoutNode& add(std::unique_ptr<LayoutNode> child);
    BoxNode& box(std::string id, toolbar_model::IntSize preferred, Modifier modifier = {});

private:
    friend class CollapsingToolbar;
    explicit CollapsingToolbarScope(std::vector<std::unique_ptr<LayoutNode>>& children);

    std::vector<std::unique_ptr<LayoutNode>>& children_;
};

using ToolbarContent = std::function<void(CollapsingToolbarScope&)>;

class CollapsingToolbar : public LayoutNode {
public:
    // Uses a fresh, unretained state.
    CollapsingToolbar(Modifier modifier, ToolbarContent content);
    CollapsingToolbar(Modifier modifier, std::shared_ptr<ToolbarState> state, ToolbarContent content);

    // Re-invokes the toolbar: swaps in `state`, rebuilds children from
    // `content`. The measure policy is kept.
    void update(Modifier modifier, std::shared_ptr<ToolbarState> state, ToolbarContent content);

    // Measures with `constraints` and places every child.
    const MeasureResult& layout(const toolbar_model::Constraints& constraints);

    ToolbarState& state() const { return state_slot_->get(); }
    const std::shared_ptr<ToolbarState>& shared_state() const { return state_slot_->shared(); }
    const CollapsingToolbarMeasurePolicy& measure_policy() const { return *policy_; }
    const std::vector<std::unique_ptr<LayoutNode>>& children() const { return children_; }
    const MeasureResult& last_result() const { return last_result_; }

protected:
    toolbar_model::IntSize measure_content(const toolbar_model::Constraints& constraints) override;

private:
    void rebuild_children(const ToolbarContent& content);

    std::shared_ptr<ToolbarStateSlot> state_slot_;
    std::unique_ptr<const CollapsingToolbarMeasurePolicy> policy_;
    std::vector<std::unique_ptr<LayoutNode>> children_;
    MeasureResult last_result_;
};

} // namespace toolbar_layout
