#ifndef DRAPE_SOLVER_H
#define DRAPE_SOLVER_H

#include "drape.h"
#include "drape/model/cloth_data.h"
#include <memory>
#include <string>

namespace Drape::detail {

    // One execution strategy for the integrate/solve/finalize loop. A solver is
    // shared by every cloth of a simulator; per-cloth state lives in ClothData.
    struct ISolver {
        virtual ~ISolver() = default;
        [[nodiscard]] virtual const char* name() const noexcept = 0;
        // Called after a cloth is (re)built.
        virtual void prepare(model::ClothData&) {}
        // Integrate, then one relaxation pass per batch in order.
        virtual void substep(model::ClothData& data, f32 dt) noexcept = 0;
        // Velocities from the last substep.
        virtual void finish(model::ClothData& data, f32 dt) noexcept = 0;
    };

    std::unique_ptr<ISolver> make_native();
    std::unique_ptr<ISolver> make_tbb(int threads);
#if defined(DRAPE_HAVE_SIMD)
    std::unique_ptr<ISolver> make_simd();
#endif
    std::unique_ptr<ISolver> make_atomic(int threads, bool deterministic);

    // Empty when the backend can run in this build; otherwise the reason it cannot.
    [[nodiscard]] std::string backend_unsupported_reason(ExecPolicy::Backend backend);

    // NoBackend with `reason` set when the execution resources cannot be created.
    [[nodiscard]] Status make_solver(const ExecPolicy& exec, std::unique_ptr<ISolver>& out, std::string& reason);

    [[nodiscard]] const char* to_string(ExecPolicy::Backend backend) noexcept;

}

#endif
