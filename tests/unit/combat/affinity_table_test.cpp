#include <gtest/gtest.h>

#include <utility>

#include "elemcore/combat/affinity_override_table.hpp"
#include "elemcore/combat/affinity_table.hpp"
#include "elemcore/foundation/config_manager.hpp"

using namespace elemcore::combat;
using elemcore::foundation::ConfigManager;
using elemcore::foundation::ErrorCode;

// ═══════════════════════════════════════════════════════════════════════════
// AffinityTable
// ═══════════════════════════════════════════════════════════════════════════

TEST(AffinityTableTest, UnsetPairIsNeutral) {
    AffinityTable table;
    EXPECT_FLOAT_EQ(table.Get(ElementType::Fire, ElementType::Water), 1.0f);
    EXPECT_FALSE(table.Has(ElementType::Fire, ElementType::Water));
}

TEST(AffinityTableTest, SetThenGet) {
    AffinityTable table;
    table.Set(ElementType::Fire, ElementType::Water, 0.5f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Fire, ElementType::Water), 0.5f);
    EXPECT_TRUE(table.Has(ElementType::Fire, ElementType::Water));
    // Direction matters.
    EXPECT_FLOAT_EQ(table.Get(ElementType::Water, ElementType::Fire), 1.0f);
}

TEST(AffinityTableTest, SetWritesThroughToMatrix) {
    AffinityTable table;
    table.Set(ElementType::Fire, ElementType::Water, 0.5f);
    table.Set(ElementType::Water, ElementType::Fire, 1.5f);

    const auto& matrix = table.Matrix();
    ASSERT_EQ(matrix.supportedElements.size(), 2u);
    ASSERT_EQ(matrix.rows.size(), 2u);
    for (const auto& row : matrix.rows) {
        EXPECT_EQ(row.defenseAffinities.size(), matrix.supportedElements.size());
    }

    AffinityTable reloaded(matrix);
    EXPECT_FLOAT_EQ(reloaded.Get(ElementType::Fire, ElementType::Water), 0.5f);
    EXPECT_FLOAT_EQ(reloaded.Get(ElementType::Water, ElementType::Fire), 1.5f);
}

TEST(AffinityTableTest, MatrixConstructorBuildsLookup) {
    AffinityMatrix matrix;
    matrix.supportedElements = {ElementType::Light, ElementType::Dark};
    matrix.rows = {{ElementType::Light, {0.5f, 2.0f}}};

    AffinityTable table(matrix);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Light, ElementType::Dark), 2.0f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Light, ElementType::Light), 0.5f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Dark, ElementType::Light), 1.0f);
}

TEST(AffinityTableTest, MovedFromTableIsEmptyAndUsable) {
    auto source = AffinityTable::CreateDefault();
    EXPECT_FLOAT_EQ(source.Get(ElementType::Water, ElementType::Fire), 1.5f);

    AffinityTable moved(std::move(source));
    EXPECT_FLOAT_EQ(moved.Get(ElementType::Water, ElementType::Fire), 1.5f);

    EXPECT_FLOAT_EQ(source.Get(ElementType::Water, ElementType::Fire), kNeutralAffinity);
    EXPECT_TRUE(source.Matrix().rows.empty());
    source.Set(ElementType::Fire, ElementType::Ice, 2.0f);
    EXPECT_FLOAT_EQ(source.Get(ElementType::Fire, ElementType::Ice), 2.0f);

    AffinityTable assigned;
    assigned = std::move(moved);
    EXPECT_FLOAT_EQ(assigned.Get(ElementType::Water, ElementType::Fire), 1.5f);
    EXPECT_FALSE(moved.Has(ElementType::Water, ElementType::Fire));
}

TEST(AffinityTableTest, DefaultTableCoversAllElementsButNone) {
    auto table = AffinityTable::CreateDefault();
    EXPECT_EQ(table.Matrix().supportedElements.size(), kElementCount - 1);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Fire, ElementType::Water), 0.5f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Water, ElementType::Fire), 1.5f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Light, ElementType::Dark), 1.5f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Ice, ElementType::Ice), 0.5f);
    EXPECT_FLOAT_EQ(table.Get(ElementType::Poison, ElementType::Holy), 1.0f);
    EXPECT_FALSE(table.Has(ElementType::Fire, ElementType::None));
}

TEST(AffinityTableTest, LoadFromConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
affinity:
  elements: [Fire, Water, Ice]
  rows:
    Fire: [0.5, 0.5, 2.0]
    Water: [2.0, 0.5, 1.0]
)").hasValue());

    auto table = AffinityTable::LoadFromConfig(config, "affinity");
    ASSERT_TRUE(table.hasValue());
    EXPECT_FLOAT_EQ(table.value().Get(ElementType::Fire, ElementType::Ice), 2.0f);
    EXPECT_FLOAT_EQ(table.value().Get(ElementType::Water, ElementType::Fire), 2.0f);
    EXPECT_FLOAT_EQ(table.value().Get(ElementType::Ice, ElementType::Fire), 1.0f);
}

TEST(AffinityTableTest, LoadFromConfigRejectsUnknownElement) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("affinity:\n  elements: [Fire, Plasma]\n").hasValue());

    auto table = AffinityTable::LoadFromConfig(config, "affinity");
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::InvalidElement);
}

TEST(AffinityTableTest, LoadFromConfigRejectsShortRow) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
affinity:
  elements: [Fire, Water]
  rows:
    Fire: [0.5]
)").hasValue());

    auto table = AffinityTable::LoadFromConfig(config, "affinity");
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigInvalidValue);
}

TEST(AffinityTableTest, LoadFromConfigMissingElements) {
    ConfigManager config;
    auto table = AffinityTable::LoadFromConfig(config, "affinity");
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigKeyNotFound);
}

// ═══════════════════════════════════════════════════════════════════════════
// AffinityOverrideTable
// ═══════════════════════════════════════════════════════════════════════════

TEST(AffinityOverrideTableTest, OverrideReplacesOriginal) {
    AffinityOverrideTable overrides;
    EXPECT_FLOAT_EQ(overrides.GetModifiedAffinity(ElementType::Fire, ElementType::Water, 0.5f), 0.5f);

    overrides.AddOverride("oil_slick", ElementType::Fire, ElementType::Water, 2.0f);
    EXPECT_FLOAT_EQ(overrides.GetModifiedAffinity(ElementType::Fire, ElementType::Water, 0.5f), 2.0f);
    EXPECT_FALSE(overrides.GetOverride(ElementType::Water, ElementType::Fire).has_value());
}

TEST(AffinityOverrideTableTest, NewestOverrideWins) {
    AffinityOverrideTable overrides;
    overrides.AddOverride("a", ElementType::Fire, ElementType::Ice, 2.0f);
    overrides.AddOverride("b", ElementType::Fire, ElementType::Ice, 3.0f);
    EXPECT_FLOAT_EQ(*overrides.GetOverride(ElementType::Fire, ElementType::Ice), 3.0f);

    // Re-adding "a" makes it the newest.
    overrides.AddOverride("a", ElementType::Fire, ElementType::Ice, 4.0f);
    EXPECT_EQ(overrides.Size(), 2u);
    EXPECT_FLOAT_EQ(*overrides.GetOverride(ElementType::Fire, ElementType::Ice), 4.0f);

    overrides.RemoveOverride("a");
    EXPECT_FLOAT_EQ(*overrides.GetOverride(ElementType::Fire, ElementType::Ice), 3.0f);
}

TEST(AffinityOverrideTableTest, TimedOverridesExpireOnTick) {
    AffinityOverrideTable overrides;
    overrides.AddOverride("timed", ElementType::Wind, ElementType::Earth, 0.1f, 2.0f);
    overrides.AddOverride("permanent", ElementType::Dark, ElementType::Light, 0.1f);

    overrides.Tick(1.0f);
    EXPECT_TRUE(overrides.HasOverride("timed"));
    auto version = overrides.Version();

    overrides.Tick(1.0f);
    EXPECT_FALSE(overrides.HasOverride("timed"));
    EXPECT_TRUE(overrides.HasOverride("permanent"));
    EXPECT_GT(overrides.Version(), version);
}

TEST(AffinityOverrideTableTest, TickWithoutExpiryKeepsVersion) {
    AffinityOverrideTable overrides;
    overrides.AddOverride("permanent", ElementType::Dark, ElementType::Light, 0.1f);
    auto version = overrides.Version();
    overrides.Tick(5.0f);
    EXPECT_EQ(overrides.Version(), version);
}

TEST(AffinityOverrideTableTest, RemoveBySource) {
    AffinityOverrideTable overrides;
    overrides.AddOverride("x", ElementType::Fire, ElementType::Ice, 2.0f, std::nullopt, "storm");
    overrides.AddOverride("y", ElementType::Water, ElementType::Ice, 2.0f, std::nullopt, "storm");
    overrides.AddOverride("z", ElementType::Wind, ElementType::Ice, 2.0f, std::nullopt, "totem");

    EXPECT_EQ(overrides.RemoveOverridesBySource("storm"), 2u);
    EXPECT_EQ(overrides.Size(), 1u);
    EXPECT_TRUE(overrides.HasOverride("z"));
    EXPECT_EQ(overrides.RemoveOverridesBySource("storm"), 0u);

    overrides.Clear();
    EXPECT_EQ(overrides.Size(), 0u);
}
