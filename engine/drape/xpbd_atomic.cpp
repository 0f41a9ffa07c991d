#include "drape/core/codec.h"
#include "drape/solver.h"
#include "drape/xpbd_kernels.h"

#include <memory>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>

namespace Drape::detail {

    using core::AtomicPositionSlot;
    using core::CompressedPosition;

    // Non-batched strategy: every constraint is solved at once against positions held
    // in fixed point slots. Each endpoint commit is a compare-exchange against the exact
    // value the correction was computed from, so a neighbour's commit in between forces
    // a reload and a fresh solve rather than applying a stale delta.
    class AtomicSolver final : public ISolver {
    public:
        AtomicSolver(int threads, bool deterministic) : arena(threads > 0 ? threads : tbb::task_arena::automatic), serial(deterministic) {
            arena.initialize();
        }

        const char* name() const noexcept override { return "atomic"; }

        void prepare(model::ClothData& d) override {
            slots.resize(d.n_logical);
        }

        void substep(model::ClothData& d, f32 dt) noexcept override {
            const usize m = d.constraint_count();
            arena.execute([&] {
                tbb::static_partitioner part;
                tbb::parallel_for(tbb::blocked_range<usize>(0, d.n_logical, 256), [&](const tbb::blocked_range<usize>& r) {
                    kernels::integrate_range(d, r.begin(), r.end(), dt);
                }, part);
            });
            core::pack_positions(d.px.data(), d.py.data(), d.pz.data(), d.inv_mass.data(), d.n_logical, d.bounds, slots);

            const f32 inv_dt2 = 1.0f / (dt * dt);
            if (serial) {
                for (usize e = 0; e < m; ++e) solve(d, static_cast<u32>(e), inv_dt2);
            } else {
                arena.execute([&] {
                    tbb::parallel_for(tbb::blocked_range<usize>(0, m, 64), [&](const tbb::blocked_range<usize>& r) {
                        for (usize e = r.begin(); e != r.end(); ++e) solve(d, static_cast<u32>(e), inv_dt2);
                    });
                });
            }
            core::unpack_positions(slots, d.bounds, d.px.data(), d.py.data(), d.pz.data());
        }

        void finish(model::ClothData& d, f32 dt) noexcept override {
            kernels::finalize_range(d, 0, d.n_logical, dt);
        }

    private:
        tbb::task_arena arena;
        bool serial{true};
        core::PositionSlots slots;

        void solve(const model::ClothData& d, u32 e, f32 inv_dt2) noexcept {
            const u32 i = d.e_i[e], j = d.e_j[e];
            const f32 wi = d.inv_mass[i], wj = d.inv_mass[j];
            AtomicPositionSlot& si = slots.slots[i];
            AtomicPositionSlot& sj = slots.slots[j];

            // Endpoint i commits only against the snapshot the correction was computed
            // from; any interference reloads both endpoints and solves again.
            CompressedPosition snap_i = si.load();
            CompressedPosition snap_j = sj.load();
            kernels::Correction c;
            float3 b;
            for (;;) {
                const float3 a = snap_i.decode(d.bounds).position;
                b              = snap_j.decode(d.bounds).position;
                c              = kernels::distance_correction(a.x, a.y, a.z, b.x, b.y, b.z, wi + wj, d.rest_len[e], d.compliance[e], inv_dt2);
                if (!c.active) return;
                if (wi > 0.0f && !snap_i.pinned()) {
                    const CompressedPosition next = CompressedPosition::encode(float3{a.x + c.x * wi, a.y + c.y * wi, a.z + c.z * wi}, d.bounds, false);
                    CompressedPosition expected   = snap_i;
                    if (!si.compare_exchange(expected, next)) {
                        snap_i = expected;
                        snap_j = sj.load();
                        continue;
                    }
                    snap_i = next;
                }
                break;
            }
            if (wj <= 0.0f || snap_j.pinned()) return;

            CompressedPosition next = CompressedPosition::encode(float3{b.x - c.x * wj, b.y - c.y * wj, b.z - c.z * wj}, d.bounds, false);
            if (sj.compare_exchange(snap_j, next)) return;

            // j moved under us after i committed: close the remaining gap from j alone,
            // against the committed i and the latest j.
            const float3 a = snap_i.decode(d.bounds).position;
            for (;;) {
                if (snap_j.pinned()) return;
                b = snap_j.decode(d.bounds).position;
                c = kernels::distance_correction(a.x, a.y, a.z, b.x, b.y, b.z, wj, d.rest_len[e], d.compliance[e], inv_dt2);
                if (!c.active) return;
                next = CompressedPosition::encode(float3{b.x - c.x * wj, b.y - c.y * wj, b.z - c.z * wj}, d.bounds, false);
                if (sj.compare_exchange(snap_j, next)) return;
            }
        }
    };

    std::unique_ptr<ISolver> make_atomic(int threads, bool deterministic) {
        return std::make_unique<AtomicSolver>(threads, deterministic);
    }

}
