/// @file src/randomizer/session_randomizer.cpp
/// @brief SessionRandomizer and SeededLcg implementation.

#include "semdiff/randomizer.hpp"
#include "semdiff/constants.hpp"

#include <cstdint>

namespace semdiff::randomizer {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Decode one UTF-8 sequence starting at `i` and advance `i` past it.
/// A byte that does not start a complete sequence is returned as-is and
/// consumes exactly one byte.
std::uint32_t decode_utf8(std::string_view text, std::size_t& i) noexcept {
    const auto lead = static_cast<unsigned char>(text[i]);

    std::size_t   len = 0;
    std::uint32_t cp  = 0;
    if (lead < 0x80) {
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp  = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp  = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp  = lead & 0x07;
    }

    if (len == 0 || i + len > text.size()) {
        ++i;
        return lead;
    }
    for (std::size_t j = 1; j < len; ++j) {
        const auto cont = static_cast<unsigned char>(text[i + j]);
        if ((cont & 0xC0) != 0x80) {
            ++i;
            return lead;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    i += len;
    return cp;
}

/// Call `emit` with the UTF-16 code units of `cp`.
template <typename Emit>
void for_each_unit(std::uint32_t cp, Emit&& emit) {
    if (cp >= 0x10000) {
        cp -= 0x10000;
        emit(static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
        emit(static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FF)));
    } else {
        emit(static_cast<std::uint16_t>(cp));
    }
}

}  // namespace

// ─── SeededLcg ────────────────────────────────────────────────────────────────

double SeededLcg::next() noexcept {
    // state <= 2^31 and multiplier < 2^31, so the product fits in 64 bits.
    state_ = (state_ * constants::LCG_MULTIPLIER + constants::LCG_INCREMENT)
             % constants::LCG_MODULUS;
    return static_cast<double>(state_) / static_cast<double>(constants::LCG_MODULUS);
}

// ─── SessionRandomizer ────────────────────────────────────────────────────────

std::vector<std::uint16_t>
SessionRandomizer::utf16_units(std::string_view text) {
    std::vector<std::uint16_t> units;
    units.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        for_each_unit(decode_utf8(text, i),
                      [&units](std::uint16_t u) { units.push_back(u); });
    }
    return units;
}

std::uint64_t SessionRandomizer::seed_for(std::string_view session_id) noexcept {
    // Unsigned arithmetic wraps modulo 2^32; the result is then read back as
    // a signed 32-bit value.
    std::uint32_t hash = 0;
    std::size_t   i    = 0;
    while (i < session_id.size()) {
        for_each_unit(decode_utf8(session_id, i), [&hash](std::uint16_t u) noexcept {
            hash = hash * static_cast<std::uint32_t>(constants::HASH_MULTIPLIER) + u;
        });
    }

    const std::int64_t wide = static_cast<std::int32_t>(hash);
    return static_cast<std::uint64_t>(wide < 0 ? -wide : wide);
}

std::map<std::string, bool>
SessionRandomizer::flip_pattern(std::string_view             session_id,
                                std::span<const std::string> item_ids,
                                bool                         enabled) {
    std::map<std::string, bool> flips;

    if (!enabled) {
        for (const auto& id : item_ids) {
            flips.emplace(id, false);
        }
        return flips;
    }

    SeededLcg rng(seed_for(session_id));
    for (const auto& id : item_ids) {
        // Duplicates still consume a draw so positions stay aligned with
        // flip_sequence(); emplace keeps the first flag.
        const bool flip = rng.next() > constants::FLIP_THRESHOLD;
        flips.emplace(id, flip);
    }
    return flips;
}

std::vector<bool>
SessionRandomizer::flip_sequence(std::string_view session_id, std::size_t count) {
    std::vector<bool> out;
    out.reserve(count);
    SeededLcg rng(seed_for(session_id));
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(rng.next() > constants::FLIP_THRESHOLD);
    }
    return out;
}

}  // namespace semdiff::randomizer
