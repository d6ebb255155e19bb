#pragma once

/// @file include/semdiff/randomizer.hpp
/// @brief SessionRandomizer: reproducible pole-flip patterns per session.
///
/// # Module: Deterministic Session Randomizer
///
/// ## Responsibility
/// Decide, for every scale item shown to a participant, whether its two poles
/// are presented swapped. Swapping counteracts primacy bias; recording the
/// decision lets the normaliser restore canonical polarity afterwards.
///
/// ## Algorithm
/// ```
/// h    = fold(h * 31 + code_unit)      wrapped to signed 32 bits
/// seed = |h|
/// s'   = (s * 1103515245 + 12345) mod 2^31,   draw = s' / 2^31
/// flip = draw > 0.5                           one draw per item, in order
/// ```
/// Code units are UTF-16 code units of the identifier, so identifiers that
/// leave the ASCII range hash the same way a browser-side client hashes them.
///
/// ## Guarantees
/// - Pure: same identifier and same item order give a bit-identical result
/// - Exact integer arithmetic; no floating-point state
/// - Any string is a valid seed; the empty string hashes to 0
///
/// ## NOT Responsible For
/// - Cluster seeding (see clustering.hpp, which takes an injected generator)

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff::randomizer {

// ─── SeededLcg ────────────────────────────────────────────────────────────────

/// Linear-congruential generator with the classic glibc constants.
///
/// State stays in [0, 2^31] and every call to next() returns a value in
/// [0, 1). Copyable; a copy continues the same sequence independently.
class SeededLcg {
public:
    explicit SeededLcg(std::uint64_t seed) noexcept : state_(seed) {}

    /// Advance the state and return state / 2^31.
    [[nodiscard]] double next() noexcept;

    [[nodiscard]] std::uint64_t state() const noexcept { return state_; }

private:
    std::uint64_t state_;
};

// ─── SessionRandomizer ────────────────────────────────────────────────────────

/// Derives flip patterns from opaque session identifiers.
///
/// All methods are static; SessionRandomizer holds no state.
class SessionRandomizer {
public:
    SessionRandomizer() = delete;

    /// Map every item id to its flip flag.
    ///
    /// # Arguments
    /// * `session_id` - Seed source, any string
    /// * `item_ids`   - Items in a stable order (configuration order). The
    ///                  i-th item consumes the i-th draw.
    /// * `enabled`    - When false every item maps to false and no draw is made
    ///
    /// Duplicate ids keep the flag of their first occurrence.
    [[nodiscard]] static std::map<std::string, bool>
    flip_pattern(std::string_view               session_id,
                 std::span<const std::string>   item_ids,
                 bool                           enabled);

    /// The first `count` flip decisions for `session_id`, by position.
    [[nodiscard]] static std::vector<bool>
    flip_sequence(std::string_view session_id, std::size_t count);

    /// Absolute value of the wrapped 32-bit polynomial hash.
    /// Returns a value in [0, 2^31]; 2^31 only for a hash of INT32_MIN.
    [[nodiscard]] static std::uint64_t seed_for(std::string_view session_id) noexcept;

    /// UTF-16 code units of a UTF-8 string. Bytes that do not start a valid
    /// UTF-8 sequence are passed through as single units.
    [[nodiscard]] static std::vector<std::uint16_t>
    utf16_units(std::string_view text);
};

}  // namespace semdiff::randomizer
