#include "drape/solver.h"
#include "drape/xpbd_kernels.h"

namespace Drape::detail {

    class NativeSolver final : public ISolver {
    public:
        const char* name() const noexcept override { return "native"; }

        void substep(model::ClothData& d, f32 dt) noexcept override {
            kernels::integrate_range(d, 0, d.n_logical, dt);
            const f32 inv_dt2 = 1.0f / (dt * dt);
            for (const auto& b : d.batches) {
                for (u32 e : b) kernels::project_constraint(d, e, inv_dt2);
            }
        }

        void finish(model::ClothData& d, f32 dt) noexcept override {
            kernels::finalize_range(d, 0, d.n_logical, dt);
        }
    };

    std::unique_ptr<ISolver> make_native() {
        return std::make_unique<NativeSolver>();
    }

}
