#include <gtest/gtest.h>

#include "elemcore/combat/damage_result.hpp"
#include "elemcore/combat/element_database.hpp"
#include "elemcore/combat/engine_settings.hpp"
#include "elemcore/foundation/config_manager.hpp"

using namespace elemcore::combat;
using elemcore::foundation::ConfigManager;
using elemcore::foundation::ErrorCode;

// ═══════════════════════════════════════════════════════════════════════════
// ElementDatabase
// ═══════════════════════════════════════════════════════════════════════════

TEST(ElementDatabaseTest, DefinitionsByElementAndId) {
    ElementDatabase db;
    db.AddDefinition({ElementType::Fire, "fire", "Fire", ElementFlags::Magical, {}});
    db.AddDefinition({ElementType::Earth, "earth", "Earth",
                      ElementFlags::Physical | ElementFlags::Environmental, {}});

    ASSERT_NE(db.GetDefinition(ElementType::Fire), nullptr);
    EXPECT_EQ(db.GetDefinition(ElementType::Fire)->displayName, "Fire");
    ASSERT_NE(db.GetDefinition("earth"), nullptr);
    EXPECT_EQ(db.GetDefinition("earth")->element, ElementType::Earth);
    EXPECT_EQ(db.GetDefinition(ElementType::Ice), nullptr);
    EXPECT_EQ(db.GetDefinition("ice"), nullptr);
}

TEST(ElementDatabaseTest, AddDefinitionReplacesSameElement) {
    ElementDatabase db;
    db.AddDefinition({ElementType::Fire, "fire", "Fire", ElementFlags::Magical, {}});
    db.AddDefinition({ElementType::Fire, "fire", "Inferno", ElementFlags::Magical, {}});
    EXPECT_EQ(db.Definitions().size(), 1u);
    EXPECT_EQ(db.GetDefinition(ElementType::Fire)->displayName, "Inferno");
}

TEST(ElementDatabaseTest, ElementsByFlag) {
    ElementDatabase db;
    db.AddDefinition({ElementType::Fire, "fire", "Fire", ElementFlags::Magical, {}});
    db.AddDefinition({ElementType::Earth, "earth", "Earth",
                      ElementFlags::Physical | ElementFlags::Environmental, {}});
    db.AddDefinition({ElementType::Wind, "wind", "Wind",
                      ElementFlags::Magical | ElementFlags::Environmental, {}});

    auto environmental = db.GetElementsByFlag(ElementFlags::Environmental);
    ASSERT_EQ(environmental.size(), 2u);
    EXPECT_EQ(environmental[0]->element, ElementType::Earth);
    EXPECT_EQ(environmental[1]->element, ElementType::Wind);
    EXPECT_TRUE(db.GetElementsByFlag(ElementFlags::Healing).empty());
}

TEST(ElementDatabaseTest, EnvironmentsReplaceById) {
    ElementDatabase db;
    EnvironmentProfile volcano;
    volcano.id = "volcano";
    volcano.name = "Volcano";
    db.AddEnvironment(volcano);
    volcano.name = "Active Volcano";
    db.AddEnvironment(volcano);

    EXPECT_EQ(db.Environments().size(), 1u);
    ASSERT_NE(db.GetEnvironment("volcano"), nullptr);
    EXPECT_EQ(db.GetEnvironment("volcano")->name, "Active Volcano");
    EXPECT_EQ(db.GetEnvironment("glacier"), nullptr);
}

TEST(ElementDatabaseTest, DefaultUsesReferenceAffinities) {
    auto db = ElementDatabase::CreateDefault();
    EXPECT_FLOAT_EQ(db.Affinities().Get(ElementType::Water, ElementType::Fire), 1.5f);
    EXPECT_TRUE(db.Composition().Rules().empty());
    EXPECT_TRUE(db.Definitions().empty());
}

TEST(ElementalEffectTest, TriggerDefaultsToElementMatch) {
    ElementalEffect burn;
    burn.triggerElement = ElementType::Fire;
    EXPECT_TRUE(burn.ShouldApply(0.0f, ElementType::Fire));
    EXPECT_FALSE(burn.ShouldApply(100.0f, ElementType::Ice));

    burn.triggerPredicate = [](float damage, ElementType) { return damage >= 50.0f; };
    EXPECT_FALSE(burn.ShouldApply(10.0f, ElementType::Fire));
    EXPECT_TRUE(burn.ShouldApply(60.0f, ElementType::Ice));
}

TEST(EnvironmentProfileTest, LookupsDefaultToNeutral) {
    EnvironmentProfile env;
    env.damageModifiers.push_back({ElementType::Fire, 1.5f, 5.0f});
    env.globalResistances.emplace_back(ElementType::Water, 0.25f);

    EXPECT_FLOAT_EQ(env.GetDamageMultiplier(ElementType::Fire), 1.5f);
    EXPECT_FLOAT_EQ(env.GetPowerBonus(ElementType::Fire), 5.0f);
    EXPECT_FLOAT_EQ(env.GetResistance(ElementType::Water), 0.25f);
    EXPECT_FLOAT_EQ(env.GetDamageMultiplier(ElementType::Ice), 1.0f);
    EXPECT_FLOAT_EQ(env.GetPowerBonus(ElementType::Ice), 0.0f);
    EXPECT_FLOAT_EQ(env.GetResistance(ElementType::Ice), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// DamageResult
// ═══════════════════════════════════════════════════════════════════════════

TEST(DamageResultTest, BreakdownAccumulatesPerElement) {
    DamageResult result;
    result.AccumulateElementDamage(ElementType::Fire, 10.0f);
    result.AccumulateElementDamage(ElementType::Ice, 30.0f);
    result.AccumulateElementDamage(ElementType::Fire, 25.0f);

    EXPECT_FLOAT_EQ(result.GetElementDamage(ElementType::Fire), 35.0f);
    EXPECT_FLOAT_EQ(result.GetElementDamage(ElementType::Wind), 0.0f);
    EXPECT_EQ(result.GetDominantElement(), ElementType::Fire);
}

TEST(DamageResultTest, DominantElementTieKeepsFirst) {
    DamageResult result;
    EXPECT_EQ(result.GetDominantElement(), ElementType::None);
    result.AccumulateElementDamage(ElementType::Dark, 0.0f);
    result.AccumulateElementDamage(ElementType::Light, 0.0f);
    EXPECT_EQ(result.GetDominantElement(), ElementType::Dark);
}

TEST(DamageResultTest, UsageAndLog) {
    DamageResult result;
    result.resolvedParts = {{ElementType::Water, 10.0f}};
    EXPECT_TRUE(result.WasElementUsed(ElementType::Water));
    EXPECT_FALSE(result.WasElementUsed(ElementType::Fire));

    result.AddCalculationLog("Base", "raw total power 10");
    ASSERT_EQ(result.calculationLog.size(), 1u);
    EXPECT_EQ(result.calculationLog[0], "[Base] raw total power 10");
}

// ═══════════════════════════════════════════════════════════════════════════
// EngineSettings
// ═══════════════════════════════════════════════════════════════════════════

TEST(EngineSettingsTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    auto settings = EngineSettings::FromConfig(config);
    ASSERT_TRUE(settings.hasValue());
    EXPECT_FLOAT_EQ(settings.value().globalDamageMultiplier, 1.0f);
    EXPECT_TRUE(settings.value().enableComposition);
    EXPECT_TRUE(settings.value().enableEnvironmentalEffects);
    EXPECT_FLOAT_EQ(settings.value().varianceMin, 0.95f);
    EXPECT_FLOAT_EQ(settings.value().varianceMax, 1.05f);
    EXPECT_EQ(settings.value().maxCalculationsPerTick, 50);
}

TEST(EngineSettingsTest, ReadsElementalKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
elemental:
  global_damage_multiplier: 2.0
  enable_composition: false
  enable_environmental_effects: false
  variance_min: 1.0
  variance_max: 1.0
  max_calculations_per_tick: 5
)").hasValue());

    auto settings = EngineSettings::FromConfig(config);
    ASSERT_TRUE(settings.hasValue());
    EXPECT_FLOAT_EQ(settings.value().globalDamageMultiplier, 2.0f);
    EXPECT_FALSE(settings.value().enableComposition);
    EXPECT_FALSE(settings.value().enableEnvironmentalEffects);
    EXPECT_FLOAT_EQ(settings.value().varianceMin, 1.0f);
    EXPECT_EQ(settings.value().maxCalculationsPerTick, 5);
}

TEST(EngineSettingsTest, RejectsMistypedKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("elemental:\n  variance_min: low\n").hasValue());
    auto settings = EngineSettings::FromConfig(config);
    ASSERT_TRUE(settings.hasError());
    EXPECT_EQ(settings.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(EngineSettingsTest, RejectsInvalidValues) {
    for (const char* yaml : {"elemental:\n  global_damage_multiplier: -1\n",
                             "elemental:\n  variance_min: 1.2\n  variance_max: 0.8\n",
                             "elemental:\n  max_calculations_per_tick: 0\n"}) {
        ConfigManager config;
        ASSERT_TRUE(config.loadString(yaml).hasValue());
        auto settings = EngineSettings::FromConfig(config);
        ASSERT_TRUE(settings.hasError()) << yaml;
        EXPECT_EQ(settings.error().code(), ErrorCode::ConfigInvalidValue);
    }
}
