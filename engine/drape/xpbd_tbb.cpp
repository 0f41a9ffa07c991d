#include "drape/solver.h"
#include "drape/xpbd_kernels.h"

#include <memory>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>
#include <tbb/task_arena.h>

namespace Drape::detail {

    // Each parallel_for returns only after every chunk finished, which is the
    // barrier between integration, successive batches and finalization.
    class TbbSolver final : public ISolver {
    public:
        explicit TbbSolver(int threads) : arena(threads > 0 ? threads : tbb::task_arena::automatic) {
            arena.initialize();
        }

        const char* name() const noexcept override { return "tbb"; }

        void substep(model::ClothData& d, f32 dt) noexcept override {
            arena.execute([&] {
                integrate(d, dt);
                const f32 inv_dt2 = 1.0f / (dt * dt);
                for (const auto& b : d.batches) solve_batch(d, b, inv_dt2);
            });
        }

        void finish(model::ClothData& d, f32 dt) noexcept override {
            arena.execute([&] {
                tbb::static_partitioner part;
                tbb::parallel_for(tbb::blocked_range<usize>(0, d.n_logical, k_particle_grain), [&](const tbb::blocked_range<usize>& r) {
                    kernels::finalize_range(d, r.begin(), r.end(), dt);
                }, part);
            });
        }

    private:
        static constexpr usize k_particle_grain = 256;
        static constexpr usize k_constraint_grain = 128;

        tbb::task_arena arena;

        static void integrate(model::ClothData& d, f32 dt) noexcept {
            tbb::static_partitioner part;
            tbb::parallel_for(tbb::blocked_range<usize>(0, d.n_logical, k_particle_grain), [&](const tbb::blocked_range<usize>& r) {
                kernels::integrate_range(d, r.begin(), r.end(), dt);
            }, part);
        }

        static void solve_batch(model::ClothData& d, const model::pvec<u32>& batch, f32 inv_dt2) noexcept {
            if (batch.empty()) return;
            tbb::static_partitioner part;
            tbb::parallel_for(tbb::blocked_range<usize>(0, batch.size(), k_constraint_grain), [&](const tbb::blocked_range<usize>& r) {
                for (usize idx = r.begin(); idx != r.end(); ++idx) kernels::project_constraint(d, batch[idx], inv_dt2);
            }, part);
        }
    };

    std::unique_ptr<ISolver> make_tbb(int threads) {
        return std::make_unique<TbbSolver>(threads);
    }

}
