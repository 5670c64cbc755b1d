#pragma once
#include <cstdint>
#include <vector>

namespace weft::layout {

// Split `remaining` cells by weight. Each entry gets floor(remaining * f / F);
// the cells lost to rounding go one at a time to non-zero entries in list
// order, earliest first. A zero total weight hands out nothing.
// The result always sums to `remaining` unless every factor is zero.
std::vector<int> distribute_by_factor(int remaining, const std::vector<std::uint32_t>& factors);

struct Distribution {
    std::vector<int> expands;
    std::vector<int> spacers;
    int remaining = 0;  // cells nobody claimed
};

// Expands take from the pool first; spacers split whatever they leave.
Distribution distribute_stack(int remaining,
                              const std::vector<std::uint32_t>& expand_factors,
                              const std::vector<std::uint32_t>& spacer_factors);

} // namespace weft::layout
