#pragma once

#include <toolbar_layout/modifier.hpp>
#include <toolbar_model/placement_strategy.hpp>
#include <toolbar_model/types.hpp>
#include <optional>
#include <string>
#include <utility>

namespace toolbar_layout {

// A child as seen by a parent's measure policy.
class Measurable {
public:
    virtual ~Measurable() = default;

    virtual toolbar_model::IntSize measure(const toolbar_model::Constraints& constraints) = 0;
    virtual std::optional<toolbar_model::PlacementStrategy> parent_data() const = 0;
};

class LayoutNode : public Measurable {
public:
    explicit LayoutNode(Modifier modifier = {});

    // Applies the modifier chain, then measures the content. The result is
    // not coerced, so a node may report kInfinity.
    toolbar_model::IntSize measure(const toolbar_model::Constraints& constraints) override;
    std::optional<toolbar_model::PlacementStrategy> parent_data() const override;

    void place(const toolbar_model::IntOffset& position) { position_ = position; }

    const toolbar_model::IntOffset& position() const { return position_; }
    const toolbar_model::IntSize& measured_size() const { return measured_size_; }

    const Modifier& modifier() const { return modifier_; }
    void set_modifier(Modifier modifier) { modifier_ = std::move(modifier); }

protected:
    virtual toolbar_model::IntSize measure_content(const toolbar_model::Constraints& constraints) = 0;

private:
    Modifier modifier_;
    toolbar_model::IntSize measured_size_;
    toolbar_model::IntOffset position_;
};

// Leaf with a preferred size. A preferred dimension of kInfinity takes the
// maximum the constraints allow, which is itself kInfinity when unbounded.
class BoxNode : public LayoutNode {
public:
    BoxNode(std::string id, toolbar_model::IntSize preferred, Modifier modifier = {});

    const std::string& id() const { return id_; }
    const toolbar_model::IntSize& preferred() const { return preferred_; }

protected:
    toolbar_model::IntSize measure_content(const toolbar_model::Constraints& constraints) override;

private:
    std::string id_;
    toolbar_model::IntSize preferred_;
};

} // namespace toolbar_layout
