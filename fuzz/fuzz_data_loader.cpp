/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV DataLoader
 *
 * Build:
 *   cmake -DSEMDIFF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence
 *   2. Every parsed item has a non-empty id
 *   3. Every parsed session has a non-empty id and at least one response
 *   4. Every normalised value is finite
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "semdiff/data_loader.hpp"

using namespace semdiff;
using namespace semdiff::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    for (const auto& item : DataLoader::parse_items_string(input)) {
        assert(!item.id.empty());
    }

    const ScaleConfig scale{ScaleMode::Discrete, 7};
    for (const auto& session : DataLoader::parse_sessions_string(input, scale)) {
        assert(!session.id.empty());
        assert(!session.responses.empty());
        for (const auto& r : session.responses) {
            assert(!r.item_id.empty());
            assert(std::isfinite(r.normalized_value));
        }
    }
    return 0;
}
