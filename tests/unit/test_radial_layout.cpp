#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <numbers>
#include <string>
#include <vector>
#include <wedge/radial_layout.hpp>

using namespace wedge;

namespace
{

constexpr float PI = std::numbers::pi_v<float>;

float total_width(const std::vector<Slice>& slices)
{
    float sum = 0.0f;
    for (const auto& s : slices)
        sum += s.width();
    return sum;
}

Point polar(Point center, float radius, float angle)
{
    return {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
}

TextWidthFn fixed_width(float w)
{
    return [w](std::string_view) { return w; };
}

}   // namespace

// ═══════════════════════════════════════════════════════════════════════════
// compute_geometry
// ═══════════════════════════════════════════════════════════════════════════

TEST(ChartGeometry, CenteredAndInsetByOutline)
{
    auto g = compute_geometry(200.0f, 100.0f, 1.0f);
    EXPECT_FLOAT_EQ(g.center.x, 100.0f);
    EXPECT_FLOAT_EQ(g.center.y, 50.0f);
    EXPECT_FLOAT_EQ(g.radius, 48.0f);
}

TEST(ChartGeometry, NeverNegative)
{
    auto g = compute_geometry(0.0f, 0.0f, 1.0f);
    EXPECT_FLOAT_EQ(g.radius, 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// compute_slices
// ═══════════════════════════════════════════════════════════════════════════

TEST(ComputeSlices, ProportionalAngles)
{
    ValueSet v{{"A", 50.0}, {"B", 30.0}, {"C", 20.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);

    ASSERT_EQ(slices.size(), 3u);
    EXPECT_EQ(slices[0].label, "A");
    EXPECT_EQ(slices[1].label, "B");
    EXPECT_EQ(slices[2].label, "C");

    EXPECT_FLOAT_EQ(slices[0].start_angle, 0.0f);
    EXPECT_NEAR(slices[0].end_angle, 2.0f * PI * 0.5f, 1e-5f);
    EXPECT_NEAR(slices[1].end_angle, 2.0f * PI * 0.8f, 1e-5f);
    EXPECT_FLOAT_EQ(slices[2].end_angle, TWO_PI);
}

TEST(ComputeSlices, ContiguousAndCoverFullTurn)
{
    ValueSet v{{"a", 3.0}, {"b", 17.0}, {"c", 0.4}, {"d", 41.0}, {"e", 9.0}, {"f", 12.5}};
    auto     slices = compute_slices(v, 0x112233, 0x445566);

    ASSERT_FALSE(slices.empty());
    EXPECT_FLOAT_EQ(slices.front().start_angle, 0.0f);
    EXPECT_FLOAT_EQ(slices.back().end_angle, TWO_PI);
    for (size_t i = 0; i < slices.size(); ++i)
    {
        EXPECT_GT(slices[i].width(), 0.0f);
        if (i > 0)
            EXPECT_FLOAT_EQ(slices[i].start_angle, slices[i - 1].end_angle);
    }
    EXPECT_NEAR(total_width(slices), TWO_PI, 1e-5f);
}

TEST(ComputeSlices, DropsNegligibleAgainstFullTotal)
{
    // total 1205: B is 0.41%, C is 16.6%
    ValueSet v{{"A", 1000.0}, {"B", 5.0}, {"C", 200.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);

    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[0].label, "A");
    EXPECT_EQ(slices[1].label, "C");

    // Shares are recomputed over the 1200 that survived.
    EXPECT_NEAR(slices[0].width(), TWO_PI * 1000.0f / 1200.0f, 1e-5f);
    EXPECT_NEAR(total_width(slices), TWO_PI, 1e-5f);
}

TEST(ComputeSlices, SurvivorsAndDroppedMatchThreshold)
{
    ValueSet v{{"big", 500.0}, {"edge", 6.0}, {"tiny", 2.0}, {"mid", 40.0}, {"zero", 0.0}};
    double   total  = v.total();
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);

    for (const auto& [label, value] : v)
    {
        bool kept = false;
        for (const auto& s : slices)
            kept = kept || s.label == label;
        if (kept)
            EXPECT_GE(value / total, NEGLIGIBLE_SHARE) << label;
        else
            EXPECT_LT(value / total, NEGLIGIBLE_SHARE) << label;
    }
    EXPECT_EQ(slices.size(), 3u);
}

TEST(ComputeSlices, ExactlyOnePercentSurvives)
{
    ValueSet v{{"A", 99.0}, {"B", 1.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[1].label, "B");
}

TEST(ComputeSlices, EmptyAndAllZeroProduceNothing)
{
    EXPECT_TRUE(compute_slices(ValueSet{}, 0x000000, 0xFFFFFF).empty());

    ValueSet zeros{{"A", 0.0}, {"B", 0.0}};
    EXPECT_TRUE(compute_slices(zeros, 0x000000, 0xFFFFFF).empty());
}

TEST(ComputeSlices, SingleValueIsFullTurn)
{
    ValueSet v{{"only", 4.2}};
    auto     slices = compute_slices(v, 0xABCDEF, 0x000000);
    ASSERT_EQ(slices.size(), 1u);
    EXPECT_FLOAT_EQ(slices[0].start_angle, 0.0f);
    EXPECT_FLOAT_EQ(slices[0].end_angle, TWO_PI);
    EXPECT_EQ(slices[0].color, 0xABCDEFu);
}

TEST(ComputeSlices, HugeValuesWhoseSumOverflows)
{
    ValueSet pair{{"A", 1e308}, {"B", 1e308}};
    ASSERT_TRUE(std::isinf(pair.total()));

    auto halves = compute_slices(pair, 0x000000, 0xFFFFFF);
    ASSERT_EQ(halves.size(), 2u);
    EXPECT_NEAR(halves[0].width(), PI, 1e-5f);
    EXPECT_FLOAT_EQ(halves[1].end_angle, TWO_PI);

    constexpr double big = std::numeric_limits<double>::max();
    ValueSet         three{{"A", big / 2}, {"B", big / 2}, {"C", big / 4}, {"sliver", big / 1000}};
    auto             slices = compute_slices(three, 0x000000, 0xFFFFFF);
    ASSERT_EQ(slices.size(), 3u);
    EXPECT_NEAR(slices[0].width(), TWO_PI * 0.4f, 1e-5f);
    EXPECT_NEAR(slices[1].width(), TWO_PI * 0.4f, 1e-5f);
    EXPECT_NEAR(slices[2].width(), TWO_PI * 0.2f, 1e-5f);
    EXPECT_NEAR(total_width(slices), TWO_PI, 1e-5f);
}

TEST(ComputeSlices, ColorRampsAcrossSurvivors)
{
    // "sliver" is dropped, so the ramp is split over two slices, not three.
    ValueSet v{{"A", 100.0}, {"sliver", 0.1}, {"B", 100.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);

    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[0].color, 0x000000u);
    EXPECT_EQ(slices[1].color, lerp_color(0x000000, 0xFFFFFF, 0.5f));
}

TEST(ComputeSlices, CustomThreshold)
{
    ValueSet v{{"A", 90.0}, {"B", 6.0}, {"C", 4.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF, 0.05);
    ASSERT_EQ(slices.size(), 2u);
    EXPECT_EQ(slices[1].label, "B");
}

// ═══════════════════════════════════════════════════════════════════════════
// boundary_table
// ═══════════════════════════════════════════════════════════════════════════

TEST(BoundaryTable, OnePerSliceAscending)
{
    ValueSet v{{"A", 5.0}, {"B", 1.0}, {"C", 3.0}, {"D", 8.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);
    auto     table  = boundary_table(slices);

    ASSERT_EQ(table.size(), slices.size());
    for (size_t i = 0; i < table.size(); ++i)
    {
        EXPECT_FLOAT_EQ(table[i], slices[i].end_angle);
        if (i > 0)
            EXPECT_GE(table[i], table[i - 1]);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// compute_label_placements
// ═══════════════════════════════════════════════════════════════════════════

TEST(LabelPlacements, NarrowSlicesAreNotInline)
{
    // A and B span 3.6 degrees each, C about 352.8
    ValueSet v{{"A", 1.0}, {"B", 1.0}, {"C", 98.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);
    auto     labels = compute_label_placements(slices, {100.0f, 100.0f}, 80.0f, fixed_width(0.0f));

    ASSERT_EQ(labels.size(), 3u);
    EXPECT_FALSE(labels[0].visible);
    EXPECT_FALSE(labels[1].visible);
    EXPECT_TRUE(labels[2].visible);
}

TEST(LabelPlacements, FifteenDegreesIsNotEnough)
{
    // 1/24 of a turn is exactly 15 degrees; the width must exceed it.
    std::vector<Slice> slices{{"edge", 0.0f, PI / 12.0f, 0}, {"wide", PI / 12.0f, TWO_PI, 0}};
    auto labels = compute_label_placements(slices, {0.0f, 0.0f}, 10.0f, fixed_width(0.0f));
    EXPECT_FALSE(labels[0].visible);
    EXPECT_TRUE(labels[1].visible);
}

TEST(LabelPlacements, HalfRadiusOnBisectorCenteredByWidth)
{
    ValueSet v{{"A", 1.0}, {"B", 1.0}};   // A: [0, pi), B: [pi, 2pi)
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);
    auto     labels = compute_label_placements(slices, {100.0f, 60.0f}, 40.0f, fixed_width(10.0f));

    ASSERT_EQ(labels.size(), 2u);
    // A bisects at pi/2 (straight down in screen space)
    EXPECT_NEAR(labels[0].x, 100.0f - 5.0f, 1e-4f);
    EXPECT_NEAR(labels[0].y, 60.0f + 20.0f, 1e-4f);
    // B bisects at 3pi/2 (straight up)
    EXPECT_NEAR(labels[1].x, 100.0f - 5.0f, 1e-4f);
    EXPECT_NEAR(labels[1].y, 60.0f - 20.0f, 1e-4f);
    EXPECT_EQ(labels[1].label, "B");
}

TEST(LabelPlacements, TextWidthIsMeasuredPerLabel)
{
    ValueSet v{{"short", 1.0}, {"much longer", 1.0}};
    auto     slices = compute_slices(v, 0x000000, 0xFFFFFF);
    auto     labels = compute_label_placements(
        slices,
        {0.0f, 0.0f},
        40.0f,
        [](std::string_view s) { return static_cast<float>(s.size()) * 2.0f; });

    EXPECT_NEAR(labels[0].x, -5.0f, 1e-4f);    // cos(pi/2) ~ 0, width 10
    EXPECT_NEAR(labels[1].x, -11.0f, 1e-4f);   // width 22
}

// ═══════════════════════════════════════════════════════════════════════════
// slice_at
// ═══════════════════════════════════════════════════════════════════════════

class SliceAtTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        slices_ = compute_slices(ValueSet{{"A", 50.0}, {"B", 30.0}, {"C", 20.0}}, 0x000000, 0xFFFFFF);
        table_  = boundary_table(slices_);
    }

    const Point        center_{100.0f, 100.0f};
    const float        radius_ = 80.0f;
    std::vector<Slice> slices_;
    SliceBoundaryTable table_;
};

TEST_F(SliceAtTest, BisectorAtHalfRadiusHitsEachSlice)
{
    ASSERT_EQ(slices_.size(), 3u);
    for (size_t i = 0; i < slices_.size(); ++i)
    {
        Point p   = polar(center_, radius_ * 0.5f, slices_[i].bisector());
        auto  idx = slice_index_at(table_, slices_, p, center_, radius_);
        ASSERT_TRUE(idx.has_value()) << i;
        EXPECT_EQ(*idx, i);

        const Slice* s = slice_at(table_, slices_, p, center_, radius_);
        ASSERT_NE(s, nullptr);
        EXPECT_EQ(s->label, slices_[i].label);
    }
}

TEST_F(SliceAtTest, UpperHalfOfScreenMapsToLaterSlices)
{
    // Straight up on screen is angle 3pi/2, which B covers with [pi, 1.6pi).
    Point up{center_.x, center_.y - 10.0f};
    auto  idx = slice_index_at(table_, slices_, up, center_, radius_);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(slices_[*idx].label, "B");

    // Just above the +x axis: angle close to 2pi, the last slice.
    Point above{center_.x + 30.0f, center_.y - 1.0f};
    idx = slice_index_at(table_, slices_, above, center_, radius_);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(slices_[*idx].label, "C");
}

TEST_F(SliceAtTest, OnOrOutsideRimIsNone)
{
    // Exactly on the rim along the axes
    EXPECT_EQ(slice_at(table_, slices_, {center_.x + radius_, center_.y}, center_, radius_), nullptr);
    EXPECT_EQ(slice_at(table_, slices_, {center_.x, center_.y - radius_}, center_, radius_), nullptr);
    EXPECT_EQ(slice_at(table_, slices_, {center_.x - radius_, center_.y}, center_, radius_), nullptr);

    for (int k = 0; k < 16; ++k)
    {
        float angle = static_cast<float>(k) * PI / 8.0f;
        for (float scale : {1.01f, 1.5f, 4.0f})
        {
            Point p = polar(center_, radius_ * scale, angle);
            EXPECT_FALSE(slice_index_at(table_, slices_, p, center_, radius_).has_value())
                << "k=" << k << " scale=" << scale;
        }
    }
}

TEST_F(SliceAtTest, CenterBelongsToFirstSlice)
{
    auto idx = slice_index_at(table_, slices_, center_, center_, radius_);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(*idx, 0u);
}

TEST_F(SliceAtTest, ZeroRadiusNeverHits)
{
    EXPECT_FALSE(slice_index_at(table_, slices_, center_, center_, 0.0f).has_value());
}

TEST_F(SliceAtTest, EmptyTableIsNone)
{
    SliceBoundaryTable empty;
    EXPECT_FALSE(slice_index_at(empty, {}, center_, center_, radius_).has_value());
}

TEST_F(SliceAtTest, TableLongerThanSlicesIsNone)
{
    // Lookups landing past the known slices report nothing.
    std::vector<Slice> first_only{slices_[0]};
    Point              p = polar(center_, radius_ * 0.5f, slices_[2].bisector());
    EXPECT_FALSE(slice_index_at(table_, first_only, p, center_, radius_).has_value());
}
