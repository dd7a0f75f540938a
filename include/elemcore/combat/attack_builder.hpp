#pragma once

/// @file attack_builder.hpp
/// @brief AttackBuilder: turns weapon and skill bonuses into an attack.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "elemcore/combat/attack.hpp"
#include "elemcore/combat/external_interfaces.hpp"
#include "elemcore/combat/modifier.hpp"

namespace elemcore::combat {

/// One registered bonus. Power = flatBonus + stat * percentageBonus.
struct ElementalBonus {
    ElementType element = ElementType::None;
    float flatBonus = 0.0f;
    float percentageBonus = 0.0f;
    std::optional<float> remainingDuration;  ///< nullopt = permanent.
    std::string ownerId;                     ///< Registering modifier; empty when added directly.

    [[nodiscard]] bool IsTemporary() const noexcept { return remainingDuration.has_value(); }

    bool operator==(const ElementalBonus&) const = default;
};

/// Per-attacker bonus tables and attack construction.
///
/// Weapon bonuses scale off Offense and skill bonuses off MagicPower.
/// Bonuses are bucketed by weapon or skill id; Build() only consults the
/// buckets named in the call.
class AttackBuilder {
public:
    using BonusTable = std::vector<std::pair<std::string, std::vector<ElementalBonus>>>;

    void RegisterWeaponBonus(std::string weaponId, ElementType element, float flatBonus,
                             float percentageBonus = 0.0f);

    /// @param duration Seconds until the bonus drops; nullopt for permanent.
    /// @param ownerId  Tag used by RemoveSkillBonusesFrom(); a bucket may mix
    ///                 the skill's own bonuses with those of modifiers.
    void RegisterSkillBonus(std::string skillId, ElementType element, float flatBonus,
                            float percentageBonus = 0.0f,
                            std::optional<float> duration = std::nullopt,
                            std::string ownerId = {});

    /// Remove the whole bucket. Returns false if unknown.
    bool RemoveWeaponBonuses(std::string_view weaponId);
    bool RemoveSkillBonuses(std::string_view skillId);

    /// Remove only the bonuses of skillId tagged with ownerId. The bucket
    /// is dropped once empty. Returns false if nothing matched.
    bool RemoveSkillBonusesFrom(std::string_view skillId, std::string_view ownerId);

    /// Build an attack for attacker. Bonuses whose computed power is not
    /// positive are dropped; with nothing left the attack is a single
    /// (None, Offense) pair.
    [[nodiscard]] ElementalAttack Build(foundation::EntityId attacker, const IStatAccessor& stats,
                                        std::optional<std::string_view> weaponId = std::nullopt,
                                        std::optional<std::string_view> skillId = std::nullopt) const;

    /// Decrement temporary bonuses and drop expired ones.
    void Tick(float deltaTime);

    /// Drop every temporary bonus.
    void ClearTemporary();

    [[nodiscard]] std::vector<ElementalBonus> GetWeaponBonuses(std::string_view weaponId) const;
    [[nodiscard]] std::vector<ElementalBonus> GetSkillBonuses(std::string_view skillId) const;

    [[nodiscard]] const BonusTable& WeaponBonuses() const noexcept { return weaponBonuses_; }
    [[nodiscard]] const BonusTable& SkillBonuses() const noexcept { return skillBonuses_; }

    /// New attack with each rule applied in order to matching pairs.
    ///
    /// A replacing rule turns the pair into the target element at
    /// percentage of its power; an additive rule keeps the pair and
    /// appends the converted amount.
    [[nodiscard]] static ElementalAttack ApplyConversions(
        const ElementalAttack& attack, const std::vector<ElementalConversionRule>& rules);

    /// Advances on every change to the bonus tables.
    [[nodiscard]] uint64_t Version() const noexcept { return version_; }

private:
    void addBonus(BonusTable& table, std::string id, ElementalBonus bonus);
    bool tickTable(BonusTable& table, float deltaTime);
    bool clearTemporary(BonusTable& table);

    BonusTable weaponBonuses_;
    BonusTable skillBonuses_;
    uint64_t version_ = 0;
};

}  // namespace elemcore::combat
