#include <gtest/gtest.h>

#include <initializer_list>
#include <utility>

#include "elemcore/combat/resistance_aggregator.hpp"

using namespace elemcore::combat;

namespace {

ResistanceProfile profileOf(std::initializer_list<std::pair<ElementType, float>> values) {
    ResistanceProfile profile;
    for (const auto& [element, value] : values) {
        profile.SetResistance(element, value);
    }
    return profile;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Aggregate
// ═══════════════════════════════════════════════════════════════════════════

TEST(ResistanceAggregatorTest, DiminishingReturns) {
    EXPECT_FLOAT_EQ(ResistanceAggregator::Diminish(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(ResistanceAggregator::Diminish(1.0f), 0.5f);
    EXPECT_FLOAT_EQ(ResistanceAggregator::Diminish(-1.0f), -0.5f);
    EXPECT_LT(ResistanceAggregator::Diminish(100.0f), 1.0f);
    EXPECT_GT(ResistanceAggregator::Diminish(-100.0f), -1.0f);
}

TEST(ResistanceAggregatorTest, TwoIceSourcesDiminish) {
    auto total = ResistanceAggregator::Aggregate(
        {profileOf({{ElementType::Ice, 0.6f}}), profileOf({{ElementType::Ice, 0.6f}})});
    EXPECT_NEAR(total.GetResistance(ElementType::Ice), 1.2f / 2.2f, 1e-5f);
    EXPECT_EQ(total.primaryElement, ElementType::Ice);
}

TEST(ResistanceAggregatorTest, AggregationIsOrderIndependent) {
    auto a = profileOf({{ElementType::Fire, 0.3f}, {ElementType::Water, -0.2f}});
    auto b = profileOf({{ElementType::Water, 0.5f}, {ElementType::Dark, 0.1f}});
    auto c = profileOf({{ElementType::Fire, 0.4f}});
    a.AddImmunity(ElementType::Poison);
    c.AddWeakness(ElementType::Holy);

    auto forward = ResistanceAggregator::Aggregate({a, b, c});
    auto backward = ResistanceAggregator::Aggregate({c, b, a});

    for (auto element : kAllElements) {
        EXPECT_FLOAT_EQ(forward.GetResistance(element), backward.GetResistance(element))
            << elementName(element);
        EXPECT_EQ(forward.IsImmune(element), backward.IsImmune(element));
        EXPECT_EQ(forward.IsWeak(element), backward.IsWeak(element));
    }
    EXPECT_TRUE(forward.IsImmune(ElementType::Poison));
    EXPECT_TRUE(forward.IsWeak(ElementType::Holy));
}

TEST(ResistanceAggregatorTest, PrimaryIsFirstSeenHighest) {
    auto total = ResistanceAggregator::Aggregate(
        {profileOf({{ElementType::Wind, 0.5f}, {ElementType::Earth, 0.5f}})});
    EXPECT_EQ(total.primaryElement, ElementType::Wind);

    auto negativeOnly = ResistanceAggregator::Aggregate({profileOf({{ElementType::Fire, -0.5f}})});
    EXPECT_EQ(negativeOnly.primaryElement, ElementType::None);
    EXPECT_FLOAT_EQ(negativeOnly.GetResistance(ElementType::Fire), -0.5f / 1.5f);
}

TEST(ResistanceAggregatorTest, EmptyInputIsNeutral) {
    auto total = ResistanceAggregator::Aggregate({});
    EXPECT_TRUE(total.resistances.empty());
    EXPECT_EQ(total.primaryElement, ElementType::None);
}

// ═══════════════════════════════════════════════════════════════════════════
// Source tables
// ═══════════════════════════════════════════════════════════════════════════

TEST(ResistanceAggregatorTest, SourcesContributeToTotal) {
    ResistanceAggregator aggregator;
    aggregator.RegisterEquipment("helm", profileOf({{ElementType::Fire, 0.5f}}));
    aggregator.RegisterPassive("thick_skin", profileOf({{ElementType::Fire, 0.5f}}));
    aggregator.AddTemporary("ward", profileOf({{ElementType::Water, 1.0f}}));

    auto total = aggregator.CalculateTotal();
    EXPECT_FLOAT_EQ(total.GetResistance(ElementType::Fire), 0.5f);
    EXPECT_FLOAT_EQ(total.GetResistance(ElementType::Water), 0.5f);
    EXPECT_EQ(total.primaryElement, ElementType::Fire);
}

TEST(ResistanceAggregatorTest, RegisterReplacesSameId) {
    ResistanceAggregator aggregator;
    aggregator.RegisterEquipment("helm", profileOf({{ElementType::Fire, 0.5f}}));
    aggregator.RegisterEquipment("helm", profileOf({{ElementType::Ice, 1.0f}}));

    ASSERT_EQ(aggregator.Equipment().size(), 1u);
    auto total = aggregator.CalculateTotal();
    EXPECT_FLOAT_EQ(total.GetResistance(ElementType::Fire), 0.0f);
    EXPECT_FLOAT_EQ(total.GetResistance(ElementType::Ice), 0.5f);
}

TEST(ResistanceAggregatorTest, RemovalAndVersioning) {
    ResistanceAggregator aggregator;
    auto v0 = aggregator.Version();

    aggregator.RegisterEquipment("helm", profileOf({{ElementType::Fire, 0.5f}}));
    aggregator.RegisterPassive("aura", profileOf({{ElementType::Light, 0.5f}}));
    aggregator.AddTemporary("ward", profileOf({{ElementType::Water, 0.5f}}));
    auto v1 = aggregator.Version();
    EXPECT_GT(v1, v0);

    EXPECT_FALSE(aggregator.RemoveEquipment("boots"));
    EXPECT_EQ(aggregator.Version(), v1);

    EXPECT_TRUE(aggregator.RemoveEquipment("helm"));
    EXPECT_TRUE(aggregator.RemovePassive("aura"));
    EXPECT_TRUE(aggregator.HasTemporary("ward"));
    aggregator.ClearTemporary();
    EXPECT_FALSE(aggregator.HasTemporary("ward"));
    EXPECT_GT(aggregator.Version(), v1);
    EXPECT_TRUE(aggregator.CalculateTotal().resistances.empty());
}
