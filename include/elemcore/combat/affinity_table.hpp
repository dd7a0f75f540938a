#pragma once

/// @file affinity_table.hpp
/// @brief AffinityTable: (attack element, defense element) -> multiplier.

#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "elemcore/combat/element_types.hpp"
#include "elemcore/foundation/config_manager.hpp"
#include "elemcore/foundation/engine_result.hpp"

namespace elemcore::combat {

/// Multiplier returned for pairs without an entry.
constexpr float kNeutralAffinity = 1.0f;

/// One attack element's row of the persisted matrix.
struct AffinityRow {
    ElementType attackElement = ElementType::None;
    /// One value per entry of AffinityMatrix::supportedElements.
    std::vector<float> defenseAffinities;

    bool operator==(const AffinityRow&) const = default;
};

/// Persisted representation of the affinity table.
struct AffinityMatrix {
    std::vector<ElementType> supportedElements;
    std::vector<AffinityRow> rows;

    bool operator==(const AffinityMatrix&) const = default;
};

/// Static elemental affinity lookup.
///
/// The authoritative data is the AffinityMatrix. A dense lookup cache is
/// built from it on first access and every Set() writes through to both,
/// so Matrix() always reflects the current values.
///
/// Reads are safe from several threads once the table has been read at
/// least once; Set() must be externally synchronized against readers.
class AffinityTable {
public:
    AffinityTable();
    explicit AffinityTable(AffinityMatrix matrix);

    /// Moves leave the source as an empty table.
    AffinityTable(AffinityTable&& other);
    AffinityTable& operator=(AffinityTable&& other);

    /// Affinity multiplier for the pair, kNeutralAffinity when unset.
    [[nodiscard]] float Get(ElementType attack, ElementType defense) const;

    /// Overwrite the pair's multiplier, extending the matrix if needed.
    void Set(ElementType attack, ElementType defense, float value);

    /// True if the pair has an explicit entry.
    [[nodiscard]] bool Has(ElementType attack, ElementType defense) const;

    [[nodiscard]] const AffinityMatrix& Matrix() const noexcept { return matrix_; }

    /// Reference matrix over every element except None.
    [[nodiscard]] static AffinityTable CreateDefault();

    /// Default relationship for one pair, used by CreateDefault().
    [[nodiscard]] static float DefaultAffinity(ElementType attack, ElementType defense);

    /// Load a matrix from configuration.
    ///
    /// Expects `<prefix>.elements` as a sequence of element names and
    /// `<prefix>.rows.<AttackElement>` as a sequence of numbers, one per
    /// supported element.
    static foundation::EngineResult<AffinityTable> LoadFromConfig(
        const foundation::ConfigManager& config, std::string_view prefix);

private:
    using Lookup = std::array<std::array<std::optional<float>, kElementCount>, kElementCount>;

    /// Build lookup_ from matrix_ exactly once.
    void ensureLookup() const;

    AffinityMatrix matrix_;
    mutable Lookup lookup_{};
    mutable std::unique_ptr<std::once_flag> lookupOnce_;
};

}  // namespace elemcore::combat
