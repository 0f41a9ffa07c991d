#include "drape/core/scheduler.h"

#include <algorithm>
#include <cmath>

namespace Drape::core {

    // The count is taken against the f32 period the solver actually steps with, and
    // exactly count * dt is removed from the remainder, so the simulated time never
    // runs ahead of the accumulated input.
    SubstepPlan StepScheduler::advance(f32 dt) noexcept {
        SubstepPlan plan;
        if (std::isfinite(dt) && dt > 0.0f) remainder_ += double(dt);

        const f32 period = 1.0f / rate_;
        double count     = std::floor(remainder_ / double(period));
        if (count <= 0.0) return plan;

        f32 sub_dt = period;
        if (count > double(max_substeps_)) {
            count        = double(max_substeps_);
            sub_dt       = static_cast<f32>(remainder_ / count);
            plan.clamped = true;
            while (sub_dt > 0.0f && count * double(sub_dt) > remainder_) sub_dt = std::nextafter(sub_dt, 0.0f);
        } else {
            while (count > 0.0 && count * double(sub_dt) > remainder_) count -= 1.0;
            if (count <= 0.0) return plan;
        }

        plan.count    = static_cast<int>(count);
        plan.dt       = sub_dt;
        plan.consumed = count * double(sub_dt);
        remainder_ -= plan.consumed;
        return plan;
    }

    void StepScheduler::set_substeps_per_second(f32 rate) noexcept {
        if (std::isnan(rate)) rate = k_min_rate;
        rate_ = std::clamp(rate, k_min_rate, k_max_rate);
    }

    void StepScheduler::set_max_substeps_per_frame(int count) noexcept {
        max_substeps_ = std::clamp(count, k_min_substeps, k_max_substeps);
    }

}
