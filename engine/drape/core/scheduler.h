#ifndef DRAPE_CORE_SCHEDULER_H
#define DRAPE_CORE_SCHEDULER_H

#include "drape.h"

namespace Drape::core {

    struct SubstepPlan {
        int count{0};
        f32 dt{0.0f};
        double consumed{0.0};
        bool clamped{false};
    };

    // Turns elapsed time into a whole number of fixed-rate substeps and carries the
    // leftover to the next call. When the count would exceed the per-frame cap the
    // accumulated time is spread evenly over the capped count instead.
    class StepScheduler {
    public:
        static constexpr f32 k_min_rate     = 1.0f;
        static constexpr f32 k_max_rate     = 1000.0f;
        static constexpr int k_min_substeps = 1;
        static constexpr int k_max_substeps = 1000;

        StepScheduler() = default;
        StepScheduler(f32 substeps_per_second, int max_substeps_per_frame) noexcept {
            set_substeps_per_second(substeps_per_second);
            set_max_substeps_per_frame(max_substeps_per_frame);
        }

        SubstepPlan advance(f32 dt) noexcept;
        void reset() noexcept { remainder_ = 0.0; }

        void set_substeps_per_second(f32 rate) noexcept;
        void set_max_substeps_per_frame(int count) noexcept;
        [[nodiscard]] f32 substeps_per_second() const noexcept { return rate_; }
        [[nodiscard]] int max_substeps_per_frame() const noexcept { return max_substeps_; }
        [[nodiscard]] double remainder() const noexcept { return remainder_; }

    private:
        double remainder_{0.0};
        f32 rate_{600.0f};
        int max_substeps_{100};
    };

}

#endif
