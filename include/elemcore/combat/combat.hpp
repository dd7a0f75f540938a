#pragma once

/// @file combat.hpp
/// @brief Aggregate header for the elemental combat layer.

#include "elemcore/combat/affinity_override_table.hpp"
#include "elemcore/combat/affinity_table.hpp"
#include "elemcore/combat/attack.hpp"
#include "elemcore/combat/attack_builder.hpp"
#include "elemcore/combat/composition_resolver.hpp"
#include "elemcore/combat/damage_result.hpp"
#include "elemcore/combat/element_database.hpp"
#include "elemcore/combat/element_types.hpp"
#include "elemcore/combat/elemental_combatant.hpp"
#include "elemcore/combat/elemental_world.hpp"
#include "elemcore/combat/engine_settings.hpp"
#include "elemcore/combat/environment_profile.hpp"
#include "elemcore/combat/external_interfaces.hpp"
#include "elemcore/combat/modifier.hpp"
#include "elemcore/combat/modifier_ledger.hpp"
#include "elemcore/combat/resistance_aggregator.hpp"
#include "elemcore/combat/resistance_profile.hpp"
#include "elemcore/combat/resolution_pipeline.hpp"
