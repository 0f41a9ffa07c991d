#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "drape/core/scheduler.h"

#include <cmath>
#include <limits>
#include <random>

using namespace Drape;
using namespace Drape::core;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("defaults_match_simulator_desc") {
    StepScheduler s;
    CHECK(s.substeps_per_second() == 600.0f);
    CHECK(s.max_substeps_per_frame() == 100);
    CHECK(s.remainder() == 0.0);
}

TEST_CASE("fixed_rate_substeps") {
    StepScheduler s(100.0f, 100);
    const auto plan = s.advance(0.01f);
    CHECK(plan.count == 1);
    CHECK_THAT(plan.dt, WithinRel(0.01f, 1e-6f));
    CHECK_FALSE(plan.clamped);

    const auto frame = s.advance(1.0f / 60.0f);
    CHECK(frame.count == 1);
    CHECK_THAT(s.remainder(), WithinAbs(1.0 / 60.0 - 0.01, 1e-6));
}

TEST_CASE("small_steps_accumulate") {
    StepScheduler s(100.0f, 100);
    CHECK(s.advance(0.004f).count == 0);
    CHECK(s.advance(0.004f).count == 0);
    CHECK(s.advance(0.004f).count == 1);
    CHECK_THAT(s.remainder(), WithinAbs(0.002, 1e-6));
}

TEST_CASE("negative_and_nan_dt_are_ignored") {
    StepScheduler s(100.0f, 100);
    CHECK(s.advance(-1.0f).count == 0);
    CHECK(s.advance(std::numeric_limits<f32>::quiet_NaN()).count == 0);
    CHECK(s.advance(std::numeric_limits<f32>::infinity()).count == 0);
    CHECK(s.remainder() == 0.0);
}

TEST_CASE("clamp_spreads_time_over_max_substeps") {
    StepScheduler s(1000.0f, 10);
    const auto plan = s.advance(0.5f);
    CHECK(plan.clamped);
    CHECK(plan.count == 10);
    CHECK_THAT(plan.dt, WithinRel(0.05f, 1e-5f));
    CHECK(plan.count * double(plan.dt) <= double(0.5f));
    CHECK(s.remainder() >= 0.0);
    CHECK_THAT(s.remainder(), WithinAbs(0.0, 1e-6));
}

TEST_CASE("rates_are_clamped_on_assignment") {
    StepScheduler s;
    s.set_substeps_per_second(0.0f);
    CHECK(s.substeps_per_second() == 1.0f);
    s.set_substeps_per_second(5000.0f);
    CHECK(s.substeps_per_second() == 1000.0f);
    s.set_substeps_per_second(std::numeric_limits<f32>::quiet_NaN());
    CHECK(s.substeps_per_second() == 1.0f);
    s.set_max_substeps_per_frame(0);
    CHECK(s.max_substeps_per_frame() == 1);
    s.set_max_substeps_per_frame(100000);
    CHECK(s.max_substeps_per_frame() == 1000);
}

TEST_CASE("reset_clears_remainder") {
    StepScheduler s(100.0f, 100);
    (void)s.advance(0.005f);
    REQUIRE(s.remainder() > 0.0);
    s.reset();
    CHECK(s.remainder() == 0.0);
}

TEST_CASE("time_is_conserved_on_fixed_rate_path") {
    StepScheduler s(240.0f, 1000);
    std::mt19937 rng(3);
    std::uniform_real_distribution<float> frame(0.0f, 0.05f);
    double input = 0.0, simulated = 0.0;
    const double step = 1.0 / 240.0;
    for (int k = 0; k < 2000; ++k) {
        const f32 dt = frame(rng);
        input += double(dt);
        const auto plan = s.advance(dt);
        REQUIRE_FALSE(plan.clamped);
        simulated += plan.count * double(plan.dt);
        CHECK(simulated <= input);
        CHECK(s.remainder() >= 0.0);
        CHECK(s.remainder() < step);
    }
    CHECK_THAT(simulated + s.remainder(), WithinAbs(input, 1e-6));
}

TEST_CASE("frames_just_under_one_period_never_overrun") {
    StepScheduler s(100.0f, 100);
    double input = 0.0, simulated = 0.0;
    int steps = 0;
    for (int k = 0; k < 100000; ++k) {
        input += double(0.0099995f);
        const auto plan = s.advance(0.0099995f);
        simulated += plan.count * double(plan.dt);
        steps += plan.count;
        REQUIRE(simulated <= input);
    }
    CHECK(steps < 100000);
    CHECK(s.remainder() >= 0.0);
    CHECK_THAT(simulated + s.remainder(), WithinAbs(input, 1e-6));
}

TEST_CASE("clamped_frames_never_overrun") {
    StepScheduler s(1000.0f, 3);
    double input = 0.0, simulated = 0.0;
    for (int k = 0; k < 1000; ++k) {
        input += double(0.0123f);
        const auto plan = s.advance(0.0123f);
        REQUIRE(plan.clamped);
        simulated += plan.count * double(plan.dt);
        REQUIRE(simulated <= input);
    }
    CHECK_THAT(simulated, WithinAbs(input, 1e-5));
}
