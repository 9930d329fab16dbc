#include <toolbar_layout/layout_node.hpp>
#include <utility>

namespace toolbar_layout {

using toolbar_model::Constraints;
using toolbar_model::IntSize;
using toolbar_model::kInfinity;

LayoutNode::LayoutNode(Modifier modifier)
    : modifier_(std::move(modifier)) {}

IntSize LayoutNode::measure(const Constraints& constraints) {
    measured_size_ = measure_content(modifier_.apply_constraints(constraints));
    return measured_size_;
}

std::optional<toolbar_model::PlacementStrategy> LayoutNode::parent_data() const {
    return modifier_.parent_data();
}

BoxNode::BoxNode(std::string id, IntSize preferred, Modifier modifier)
    : LayoutNode(std::move(modifier)), id_(std::move(id)), preferred_(preferred) {}

IntSize BoxNode::measure_content(const Constraints& constraints) {
    IntSize s;
    s.width = preferred_.width == kInfinity ? constraints.max_width : constraints.constrain_width(preferred_.width);
    s.height = preferred_.height == kInfinity ? constraints.max_height : constraints.constrain_height(preferred_.height);
    return s;
}

} // namespace toolbar_layout
