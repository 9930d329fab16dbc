#include <toolbar_layout/modifier.hpp>
#include <utility>

namespace toolbar_layout {

using toolbar_model::Constraints;

namespace {

class SizeElement : public ModifierElement {
public:
    SizeElement(std::optional<int> width, std::optional<int> height)
        : width_(width), height_(height) {}

    Constraints modify_constraints(const Constraints& constraints) const override {
        Constraints c = constraints;
        if (width_) {
            const int w = constraints.constrain_width(*width_);
            c.min_width = w;
            c.max_width = w;
        }
        if (height_) {
            const int h = constraints.constrain_height(*height_);
            c.min_height = h;
            c.max_height = h;
        }
        return c;
    }

private:
    std::optional<int> width_;
    std::optional<int> height_;
};

// Only takes effect on a bounded axis.
class FillElement : public ModifierElement {
public:
    FillElement(bool width, bool height) : width_(width), height_(height) {}

    Constraints modify_constraints(const Constraints& constraints) const override {
        Constraints c = constraints;
        if (width_ && c.has_bounded_width()) c.min_width = c.max_width;
        if (height_ && c.has_bounded_height()) c.min_height = c.max_height;
        return c;
    }

private:
    bool width_;
    bool height_;
};

} // namespace

Modifier Modifier::then(const Modifier& other) const {
    Modifier out = *this;
    out.elements_.insert(out.elements_.end(), other.elements_.begin(), other.elements_.end());
    return out;
}

Modifier Modifier::then(std::shared_ptr<const ModifierElement> element) const {
    Modifier out = *this;
    if (element) out.elements_.push_back(std::move(element));
    return out;
}

Modifier Modifier::size(int width, int height) const {
    return then(std::make_shared<SizeElement>(width, height));
}

Modifier Modifier::width(int width) const {
    return then(std::make_shared<SizeElement>(width, std::nullopt));
}

Modifier Modifier::height(int height) const {
    return then(std::make_shared<SizeElement>(std::nullopt, height));
}

Modifier Modifier::fill_max_width() const {
    return then(std::make_shared<FillElement>(true, false));
}

Modifier Modifier::fill_max_height() const {
    return then(std::make_shared<FillElement>(false, true));
}

Constraints Modifier::apply_constraints(const Constraints& constraints) const {
    Constraints c = constraints;
    for (const auto& e : elements_)
        c = e->modify_constraints(c);
    return c;
}

std::optional<toolbar_model::PlacementStrategy> Modifier::parent_data() const {
    std::optional<toolbar_model::PlacementStrategy> data;
    for (const auto& e : elements_)
        e->modify_parent_data(data);
    return data;
}

} // namespace toolbar_layout
