#include <toolbar_layout/collapsing_toolbar.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>

namespace toolbar_layout {

using toolbar_model::Constraints;
using toolbar_model::IntSize;

namespace {

class PlacementElement : public ModifierElement {
public:
    explicit PlacementElement(toolbar_model::PlacementStrategy strategy)
        : strategy_(std::move(strategy)) {}

    void modify_parent_data(std::optional<toolbar_model::PlacementStrategy>& parent_data) const override {
        parent_data = strategy_;
    }

private:
    toolbar_model::PlacementStrategy strategy_;
};

} // namespace

CollapsingToolbarScope::CollapsingToolbarScope(std::vector<std::unique_ptr<LayoutNode>>& children)
    : children_(children) {}

Modifier CollapsingToolbarScope::road(const Modifier& modifier,
    const toolbar_model::Alignment& when_collapsed,
    const toolbar_model::Alignment& when_expanded) const
{
    return modifier.then(std::make_shared<PlacementElement>(toolbar_model::Road{when_collapsed, when_expanded}));
}

Modifier CollapsingToolbarScope::parallax(const Modifier& modifier) const {
    return modifier.then(std::make_shared<PlacementElement>(toolbar_model::Parallax{}));
}

Modifier CollapsingToolbarScope::pin(const Modifier& modifier) const {
    return modifier.then(std::make_shared<PlacementElement>(toolbar_model::Pin{}));
}

LayoutNode& CollapsingToolbarScope::add(std::unique_ptr<LayoutNode> child) {
    if (!child) throw std::invalid_argument("CollapsingToolbarScope::add: null child");
    children_.push_back(std::move(child));
    return *children_.back();
}

BoxNode& CollapsingToolbarScope::box(std::string id, IntSize preferred, Modifier modifier) {
    auto node = std::make_unique<BoxNode>(std::move(id), preferred, std::move(modifier));
    BoxNode& ref = *node;
    children_.push_back(std::move(node));
    return ref;
}

CollapsingToolbar::CollapsingToolbar(Modifier modifier, ToolbarContent content)
    : CollapsingToolbar(std::move(modifier), make_toolbar_state(), std::move(content)) {}

CollapsingToolbar::CollapsingToolbar(Modifier modifier, std::shared_ptr<ToolbarState> state, ToolbarContent content)
    : LayoutNode(std::move(modifier)),
      state_slot_(std::make_shared<ToolbarStateSlot>(state ? std::move(state) : make_toolbar_state())),
      policy_(std::make_unique<const CollapsingToolbarMeasurePolicy>(state_slot_))
{
    rebuild_children(content);
}

void CollapsingToolbar::update(Modifier modifier, std::shared_ptr<ToolbarState> state, ToolbarContent content) {
    set_modifier(std::move(modifier));
    if (state) state_slot_->set(std::move(state));
    rebuild_children(content);
}

void CollapsingToolbar::rebuild_children(const ToolbarContent& content) {
    children_.clear();
    if (!content) return;
    CollapsingToolbarScope scope(children_);
    content(scope);
}

const MeasureResult& CollapsingToolbar::layout(const Constraints& constraints) {
    measure(constraints);
    return last_result_;
}

IntSize CollapsingToolbar::measure_content(const Constraints& constraints) {
    std::vector<Measurable*> measurables;
    measurables.reserve(children_.size());
    for (const auto& child : children_)
        measurables.push_back(child.get());

    last_result_ = policy_->measure(measurables, constraints);

    for (std::size_t i = 0; i < children_.size(); ++i)
        children_[i]->place(last_result_.placements[i].offset);

    return last_result_.size;
}

} // namespace toolbar_layout
