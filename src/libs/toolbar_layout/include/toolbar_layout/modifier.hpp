#pragma once

#include <toolbar_model/placement_strategy.hpp>
#include <toolbar_model/types.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace toolbar_layout {

// One link of a Modifier chain. Elements either narrow the constraints a
// node is measured with, or annotate the node for its parent layout.
class ModifierElement {
public:
    virtual ~ModifierElement() = default;

    virtual toolbar_model::Constraints modify_constraints(const toolbar_model::Constraints& constraints) const {
        return constraints;
    }

    virtual void modify_parent_data(std::optional<toolbar_model::PlacementStrategy>&) const {}
};

// Immutable, chainable list of modifier elements, applied in chain order.
class Modifier {
public:
    Modifier() = default;

    Modifier then(const Modifier& other) const;
    Modifier then(std::shared_ptr<const ModifierElement> element) const;

    Modifier size(int width, int height) const;
    Modifier width(int width) const;
    Modifier height(int height) const;
    Modifier fill_max_width() const;
    Modifier fill_max_height() const;

    toolbar_model::Constraints apply_constraints(const toolbar_model::Constraints& constraints) const;
    // Parent data left by the chain; later annotations overwrite earlier ones.
    std::optional<toolbar_model::PlacementStrategy> parent_data() const;

    bool empty() const { return elements_.empty(); }
    std::size_t element_count() const { return elements_.size(); }

private:
    std::vector<std::shared_ptr<const ModifierElement>> elements_;
};

} // namespace toolbar_layout
