#include <weft/layout/space_distributor.h>

#include <algorithm>
#include <numeric>

namespace weft::layout {

std::vector<int> distribute_by_factor(int remaining, const std::vector<std::uint32_t>& factors) {
    std::vector<int> shares(factors.size(), 0);
    if (remaining <= 0) return shares;

    const std::uint64_t total = std::accumulate(factors.begin(), factors.end(), std::uint64_t{0});
    if (total == 0) return shares;

    std::int64_t assigned = 0;
    for (std::size_t i = 0; i < factors.size(); ++i) {
        // remaining < 2^31 and factor < 2^32, so the product fits in 64 bits.
        std::uint64_t raw = static_cast<std::uint64_t>(remaining) * factors[i] / total;
        shares[i] = static_cast<int>(raw);
        assigned += shares[i];
    }

    std::int64_t leftover = remaining - assigned;
    while (leftover > 0) {
        for (std::size_t i = 0; i < factors.size() && leftover > 0; ++i) {
            if (factors[i] == 0) continue;
            ++shares[i];
            --leftover;
        }
    }
    return shares;
}

Distribution distribute_stack(int remaining,
                              const std::vector<std::uint32_t>& expand_factors,
                              const std::vector<std::uint32_t>& spacer_factors) {
    Distribution d;
    int pool = std::max(0, remaining);

    d.expands = distribute_by_factor(pool, expand_factors);
    pool -= std::accumulate(d.expands.begin(), d.expands.end(), 0);

    d.spacers = distribute_by_factor(pool, spacer_factors);
    pool -= std::accumulate(d.spacers.begin(), d.spacers.end(), 0);

    d.remaining = pool;
    return d;
}

} // namespace weft::layout
