#include "drape/core/batcher.h"

#include <cstdio>

namespace Drape::core {

    BatchSet build_batches(std::span<const DistanceConstraint> constraints, usize particle_count) {
        // used[p] holds the batches particle p already belongs to
        std::vector<BitsetDyn> used(particle_count);
        BatchSet batches;
        for (u32 c = 0; c < static_cast<u32>(constraints.size()); ++c) {
            const u32 i = constraints[c].index0, j = constraints[c].index1;
            if (i >= particle_count || j >= particle_count) continue;
            usize b = 0;
            for (;;) {
                if (!used[i].test(b) && !used[j].test(b)) break;
                ++b;
            }
            used[i].set(b);
            used[j].set(b);
            if (b == batches.size()) batches.emplace_back();
            batches[b].push_back(c);
        }
        return batches;
    }

    bool batches_from_offsets(std::span<const u32> offsets, usize constraint_count, BatchSet& out) {
        out.clear();
        if (offsets.size() < 2) return false;
        if (offsets.front() != 0 || offsets.back() != constraint_count) return false;
        out.reserve(offsets.size() - 1);
        for (usize b = 0; b + 1 < offsets.size(); ++b) {
            const u32 lo = offsets[b], hi = offsets[b + 1];
            if (hi < lo) {
                out.clear();
                return false;
            }
            auto& batch = out.emplace_back();
            batch.reserve(hi - lo);
            for (u32 c = lo; c < hi; ++c) batch.push_back(c);
        }
        return true;
    }

    bool validate_batches(const BatchSet& batches, std::span<const DistanceConstraint> constraints, usize particle_count, std::string* why) {
        auto fail = [&](const char* fmt, usize a, usize b) {
            if (why) {
                char buf[160];
                std::snprintf(buf, sizeof(buf), fmt, a, b);
                *why = buf;
            }
            return false;
        };

        std::vector<u32> seen(constraints.size(), 0);
        // stamp[p] == batch + 1 while particle p is claimed in that batch
        std::vector<usize> stamp(particle_count, 0);
        for (usize b = 0; b < batches.size(); ++b) {
            for (u32 c : batches[b]) {
                if (c >= constraints.size()) return fail("batch %zu references constraint %zu out of range", b, c);
                if (seen[c]++) return fail("constraint %zu appears twice (batch %zu)", c, b);
                const u32 i = constraints[c].index0, j = constraints[c].index1;
                if (i >= particle_count || j >= particle_count) return fail("constraint %zu has an endpoint out of range (batch %zu)", c, b);
                if (stamp[i] == b + 1) return fail("batch %zu shares particle %zu", b, i);
                stamp[i] = b + 1;
                if (stamp[j] == b + 1) return fail("batch %zu shares particle %zu", b, j);
                stamp[j] = b + 1;
            }
        }
        for (usize c = 0; c < seen.size(); ++c) {
            if (seen[c] == 0) return fail("constraint %zu missing from all %zu batches", c, batches.size());
        }
        return true;
    }

}
