#ifndef DRAPE_CORE_BATCHER_H
#define DRAPE_CORE_BATCHER_H

#include "drape.h"
#include <span>
#include <string>
#include <vector>

namespace Drape::core {

    using BatchSet = std::vector<std::vector<u32>>;

    struct BitsetDyn {
        std::vector<u64> w;
        void ensure(usize bit) {
            const usize need = bit / 64 + 1;
            if (w.size() < need) w.resize(need, 0);
        }
        void set(usize bit) {
            ensure(bit);
            w[bit / 64] |= (u64(1) << (bit & 63));
        }
        [[nodiscard]] bool test(usize bit) const noexcept {
            const usize idx = bit / 64;
            if (idx >= w.size()) return false;
            return (w[idx] >> (bit & 63)) & 1ULL;
        }
    };

    // Greedy first-fit partition in constraint order. Each batch is particle disjoint.
    [[nodiscard]] BatchSet build_batches(std::span<const DistanceConstraint> constraints, usize particle_count);

    // Splits a constraint list into the contiguous runs described by CSR offsets.
    [[nodiscard]] bool batches_from_offsets(std::span<const u32> offsets, usize constraint_count, BatchSet& out);

    // Disjointness and completeness check. `why` receives the first violation.
    [[nodiscard]] bool validate_batches(const BatchSet& batches, std::span<const DistanceConstraint> constraints, usize particle_count, std::string* why = nullptr);

}

#endif
