#include <gtest/gtest.h>

#include "fake_measurable.hpp"

#include <toolbar_layout/measure_policy.hpp>
#include <toolbar_layout/toolbar_state.hpp>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

using namespace toolbar_layout;
using namespace toolbar_model;

namespace {

struct PolicyFixture {
    std::shared_ptr<ToolbarState> state = make_toolbar_state();
    std::shared_ptr<ToolbarStateSlot> slot = std::make_shared<ToolbarStateSlot>(state);
    CollapsingToolbarMeasurePolicy policy{slot};

    MeasureResult measure(std::vector<FakeMeasurable*> children, const Constraints& constraints) {
        std::vector<Measurable*> measurables(children.begin(), children.end());
        return policy.measure(measurables, constraints);
    }
};

Constraints width_range(int min_w, int max_w) {
    return Constraints{min_w, max_w, 0, kInfinity};
}

} // namespace

TEST(MeasurePolicyTests, ChildrenAreMeasuredWithoutHeightConstraint)
{
    PolicyFixture f;
    FakeMeasurable a(100, 50);
    FakeMeasurable b(80, 20);

    f.measure({&a, &b}, Constraints{10, 300, 40, 100});

    for (const FakeMeasurable* child : {&a, &b}) {
        EXPECT_EQ(child->measure_calls, 1);
        EXPECT_EQ(child->last_constraints.min_width, 10);
        EXPECT_EQ(child->last_constraints.max_width, 300);
        EXPECT_EQ(child->last_constraints.min_height, 0);
        EXPECT_EQ(child->last_constraints.max_height, kInfinity);
    }
}

TEST(MeasurePolicyTests, SizeAndBoundsComeFromAllChildren)
{
    PolicyFixture f;
    FakeMeasurable a(100, 50, Pin{});
    FakeMeasurable b(250, 200, Parallax{});
    FakeMeasurable c(80, 120, Road{alignment::top_start, alignment::bottom_end});

    const MeasureResult r = f.measure({&a, &b, &c}, width_range(0, 300));

    EXPECT_EQ(r.size, (IntSize{250, 200}));
    EXPECT_EQ(f.state->min_height, 50);
    EXPECT_EQ(f.state->max_height, 200);
    EXPECT_EQ(f.state->height, 200);
    ASSERT_EQ(r.placements.size(), 3u);
    EXPECT_EQ(r.placements[0].size, (IntSize{100, 50}));
    EXPECT_EQ(r.placements[2].size, (IntSize{80, 120}));
}

TEST(MeasurePolicyTests, ContainerSizeIsClampedToIncomingConstraints)
{
    PolicyFixture f;
    FakeMeasurable tall(250, 200);
    FakeMeasurable short_child(100, 50);

    const MeasureResult r = f.measure({&tall, &short_child}, Constraints{0, 200, 0, 150});
    EXPECT_EQ(r.size, (IntSize{200, 150}));
    // Bounds are the raw child heights, not the clamped size.
    EXPECT_EQ(f.state->min_height, 50);
    EXPECT_EQ(f.state->max_height, 200);
    EXPECT_EQ(f.state->height, 150);
    EXPECT_FLOAT_EQ(f.state->progress(), 100.0f / 150.0f);

    PolicyFixture g;
    FakeMeasurable small(40, 30);
    const MeasureResult grown = g.measure({&small}, Constraints{120, 300, 60, 400});
    EXPECT_EQ(grown.size, (IntSize{120, 60}));
}

TEST(MeasurePolicyTests, SingleChildHasDefinedProgress)
{
    for (const PlacementStrategy& strategy : std::vector<PlacementStrategy>{
             PlacementNone{}, Road{alignment::top_start, alignment::bottom_end}, Parallax{}, Pin{}}) {
        PolicyFixture f;
        FakeMeasurable only(100, 100, strategy);

        const MeasureResult r = f.measure({&only}, width_range(0, 300));

        EXPECT_EQ(f.state->min_height, 100);
        EXPECT_EQ(f.state->max_height, 100);
        EXPECT_EQ(f.state->height, 100);
        EXPECT_FALSE(std::isnan(f.state->progress()));
        ASSERT_EQ(r.placements.size(), 1u);
        EXPECT_EQ(r.placements[0].offset, (IntOffset{0, 0})) << strategy_name(strategy);
    }
}

TEST(MeasurePolicyTests, ExternalHeightGivesHalfProgress)
{
    PolicyFixture f;
    FakeMeasurable a(300, 50);
    FakeMeasurable b(300, 200);

    f.measure({&a, &b}, width_range(0, 300));
    EXPECT_EQ(f.state->min_height, 50);
    EXPECT_EQ(f.state->max_height, 200);

    f.state->height = 125;
    EXPECT_FLOAT_EQ(f.state->progress(), 0.5f);
}

TEST(MeasurePolicyTests, RoadChildIsPlacedAtMidpoint)
{
    PolicyFixture f;
    FakeMeasurable background(300, 200);
    FakeMeasurable road(100, 50, Road{alignment::top_start, alignment::bottom_end});

    const MeasureResult r = f.measure({&background, &road}, Constraints{0, 300, 0, 125});

    ASSERT_EQ(r.size, (IntSize{300, 125}));
    ASSERT_FLOAT_EQ(f.state->progress(), 0.5f);
    // Collapsed (0, 0), expanded (200, 75): midpoint (100, 37.5) rounds to (100, 38).
    EXPECT_EQ(r.placements[1].offset, (IntOffset{100, 38}));
    EXPECT_EQ(r.placements[0].offset, (IntOffset{0, 0}));
}

TEST(MeasurePolicyTests, RoadChildMatchesAlignmentsAtTheEnds)
{
    const Road road{alignment::top_end, alignment::bottom_start};

    PolicyFixture collapsed;
    FakeMeasurable bg1(300, 200);
    FakeMeasurable child1(100, 50, road);
    const MeasureResult c = collapsed.measure({&bg1, &child1}, Constraints{0, 300, 0, 50});
    ASSERT_EQ(collapsed.state->progress(), 0.0f);
    EXPECT_EQ(c.placements[1].offset, alignment::top_end.align(IntSize{100, 50}, c.size));
    EXPECT_EQ(c.placements[1].offset, (IntOffset{200, 0}));

    PolicyFixture expanded;
    FakeMeasurable bg2(300, 200);
    FakeMeasurable child2(100, 50, road);
    const MeasureResult e = expanded.measure({&bg2, &child2}, width_range(0, 300));
    ASSERT_EQ(expanded.state->progress(), 1.0f);
    EXPECT_EQ(e.placements[1].offset, alignment::bottom_start.align(IntSize{100, 50}, e.size));
    EXPECT_EQ(e.placements[1].offset, (IntOffset{0, 150}));
}

TEST(MeasurePolicyTests, RoadChildUsesThisPassBounds)
{
    PolicyFixture f;
    // Stale values from an earlier toolbar must not leak into placement.
    f.state->min_height = 0;
    f.state->max_height = 1000;
    f.state->height = 900;

    FakeMeasurable bg(300, 200);
    FakeMeasurable road(100, 50, Road{alignment::top_start, alignment::bottom_end});
    const MeasureResult r = f.measure({&bg, &road}, Constraints{0, 300, 0, 50});

    EXPECT_EQ(r.placements[1].offset, (IntOffset{0, 0}));
}

TEST(MeasurePolicyTests, ParallaxAndPinStayAtOrigin)
{
    PolicyFixture f;
    FakeMeasurable bg(300, 200);
    FakeMeasurable parallax(100, 50, Parallax{});
    FakeMeasurable pin(100, 50, Pin{});
    FakeMeasurable plain(100, 50);

    const MeasureResult r = f.measure({&bg, &parallax, &pin, &plain}, Constraints{0, 300, 0, 125});

    ASSERT_FLOAT_EQ(f.state->progress(), 0.5f);
    for (const auto& p : r.placements)
        EXPECT_EQ(p.offset, (IntOffset{0, 0}));
    EXPECT_TRUE(std::holds_alternative<Parallax>(r.placements[1].strategy));
    EXPECT_TRUE(std::holds_alternative<Pin>(r.placements[2].strategy));
    EXPECT_TRUE(std::holds_alternative<PlacementNone>(r.placements[3].strategy));
}

TEST(MeasurePolicyTests, ListenersSeeNewValuesBeforeStateIsWritten)
{
    PolicyFixture f;
    std::vector<std::pair<int, int>> bounds_calls;
    std::vector<int> height_calls;
    f.state->on_height_change = [&](int min_h, int max_h) {
        bounds_calls.emplace_back(min_h, max_h);
        EXPECT_EQ(f.state->min_height, 0);
        EXPECT_EQ(f.state->max_height, 0);
    };
    f.state->on_visible_height_change = [&](int h) {
        height_calls.push_back(h);
        EXPECT_EQ(f.state->height, 0);
    };

    FakeMeasurable a(300, 50);
    FakeMeasurable b(300, 200);
    f.measure({&a, &b}, width_range(0, 300));

    ASSERT_EQ(bounds_calls.size(), 1u);
    EXPECT_EQ(bounds_calls[0], std::make_pair(50, 200));
    ASSERT_EQ(height_calls.size(), 1u);
    EXPECT_EQ(height_calls[0], 200);
}

TEST(MeasurePolicyTests, ListenersOnlyFireOnChange)
{
    PolicyFixture f;
    int bounds_calls = 0;
    std::vector<int> heights;
    f.state->on_height_change = [&](int, int) { ++bounds_calls; };
    f.state->on_visible_height_change = [&](int h) { heights.push_back(h); };

    FakeMeasurable a(300, 50);
    FakeMeasurable b(300, 200);

    f.measure({&a, &b}, width_range(0, 300));
    EXPECT_EQ(bounds_calls, 1);
    EXPECT_EQ(heights.size(), 1u);

    // Identical pass.
    f.measure({&a, &b}, width_range(0, 300));
    EXPECT_EQ(bounds_calls, 1);
    EXPECT_EQ(heights.size(), 1u);

    // Height only.
    f.measure({&a, &b}, Constraints{0, 300, 0, 125});
    EXPECT_EQ(bounds_calls, 1);
    ASSERT_EQ(heights.size(), 2u);
    EXPECT_EQ(heights.back(), 125);

    // Bounds only: height stays pinned at 125.
    a.size.height = 60;
    f.measure({&a, &b}, Constraints{0, 300, 0, 125});
    EXPECT_EQ(bounds_calls, 2);
    EXPECT_EQ(heights.size(), 2u);
    EXPECT_EQ(f.state->min_height, 60);

    // Both.
    b.size.height = 220;
    f.measure({&a, &b}, width_range(0, 300));
    EXPECT_EQ(bounds_calls, 3);
    ASSERT_EQ(heights.size(), 3u);
    EXPECT_EQ(heights.back(), 220);
}

TEST(MeasurePolicyTests, MissingListenersAreFine)
{
    PolicyFixture f;
    FakeMeasurable a(300, 50);
    EXPECT_NO_THROW(f.measure({&a}, width_range(0, 300)));
    EXPECT_EQ(f.state->height, 50);
}

TEST(MeasurePolicyTests, UnboundedChildIsClampedToBoundedIncomingHeight)
{
    PolicyFixture f;
    FakeMeasurable fill(300, kInfinity);
    FakeMeasurable bar(300, 50);

    const MeasureResult r = f.measure({&fill, &bar}, Constraints{0, 300, 0, 400});

    EXPECT_FALSE(r.placements[0].rejected);
    EXPECT_EQ(r.placements[0].size.height, 400);
    EXPECT_EQ(f.state->min_height, 50);
    EXPECT_EQ(f.state->max_height, 400);
    EXPECT_EQ(r.size, (IntSize{300, 400}));
}

TEST(MeasurePolicyTests, UnboundedChildIsRejectedWithoutIncomingBound)
{
    PolicyFixture f;
    FakeMeasurable fill(300, kInfinity, Road{alignment::top_start, alignment::bottom_end});
    FakeMeasurable bar(100, 50);

    const MeasureResult r = f.measure({&fill, &bar}, width_range(0, 300));

    ASSERT_EQ(r.placements.size(), 2u);
    EXPECT_TRUE(r.placements[0].rejected);
    EXPECT_EQ(r.placements[0].size.height, 0);
    EXPECT_EQ(r.placements[0].offset, (IntOffset{0, 0}));
    EXPECT_FALSE(r.placements[1].rejected);
    // Only the bar counts.
    EXPECT_EQ(f.state->min_height, 50);
    EXPECT_EQ(f.state->max_height, 50);
    EXPECT_EQ(f.state->height, 50);
    EXPECT_EQ(r.size, (IntSize{100, 50}));
}

TEST(MeasurePolicyTests, UnboundedWidthIsClampedToBoundedIncomingWidth)
{
    PolicyFixture f;
    FakeMeasurable wide(kInfinity, 80);
    FakeMeasurable icon(100, 40);

    const MeasureResult r = f.measure({&wide, &icon}, width_range(0, 300));

    EXPECT_FALSE(r.placements[0].rejected);
    EXPECT_EQ(r.placements[0].size, (IntSize{300, 80}));
    // Still counts toward the height bounds.
    EXPECT_EQ(f.state->min_height, 40);
    EXPECT_EQ(f.state->max_height, 80);
    EXPECT_EQ(r.size, (IntSize{300, 80}));
}

TEST(MeasurePolicyTests, UnboundedWidthIsRejectedWithoutIncomingBound)
{
    PolicyFixture f;
    FakeMeasurable wide(kInfinity, 80);
    FakeMeasurable icon(100, 40);

    const MeasureResult r = f.measure({&wide, &icon}, Constraints{});

    ASSERT_EQ(r.placements.size(), 2u);
    EXPECT_TRUE(r.placements[0].rejected);
    EXPECT_EQ(r.placements[0].size.width, 0);
    EXPECT_EQ(r.placements[0].offset, (IntOffset{0, 0}));
    EXPECT_EQ(f.state->min_height, 40);
    EXPECT_EQ(f.state->max_height, 40);
    EXPECT_EQ(r.size, (IntSize{100, 40}));
}

TEST(MeasurePolicyTests, EmptyToolbarIsFinite)
{
    PolicyFixture f;
    int bounds_calls = 0;
    f.state->on_height_change = [&](int, int) { ++bounds_calls; };

    const MeasureResult r = f.measure({}, Constraints{10, 300, 20, 400});

    EXPECT_EQ(r.size, (IntSize{10, 20}));
    EXPECT_TRUE(r.placements.empty());
    EXPECT_EQ(f.state->min_height, 0);
    EXPECT_EQ(f.state->max_height, 0);
    EXPECT_EQ(f.state->height, 20);
    EXPECT_EQ(f.state->progress(), 0.0f);
    EXPECT_EQ(bounds_calls, 0);
}

TEST(MeasurePolicyTests, AllPinnedChildrenStillDefineBounds)
{
    PolicyFixture f;
    FakeMeasurable a(200, 56, Pin{});
    FakeMeasurable b(200, 180, Pin{});

    const MeasureResult r = f.measure({&a, &b}, width_range(0, 300));
    EXPECT_EQ(f.state->min_height, 56);
    EXPECT_EQ(f.state->max_height, 180);
    EXPECT_EQ(r.size, (IntSize{200, 180}));
}

TEST(MeasurePolicyTests, ReadsWhicheverStateTheSlotHolds)
{
    PolicyFixture f;
    FakeMeasurable a(300, 80);
    f.measure({&a}, width_range(0, 300));
    EXPECT_EQ(f.state->height, 80);

    auto replacement = make_toolbar_state();
    f.slot->set(replacement);
    a.size.height = 90;
    f.measure({&a}, width_range(0, 300));

    EXPECT_EQ(replacement->height, 90);
    EXPECT_EQ(f.state->height, 80);
}

TEST(MeasurePolicyTests, NullSlotIsRejected)
{
    EXPECT_THROW(CollapsingToolbarMeasurePolicy(nullptr), std::invalid_argument);
}
