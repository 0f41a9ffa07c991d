#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "cloth_fixtures.h"
#include "drape/grid_cloth.h"
#include "drape/log.h"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace Drape;
using namespace drape_test;
using Catch::Matchers::WithinAbs;
using Backend = ExecPolicy::Backend;

namespace {
    // Routes library logging into a vector for the lifetime of the object.
    struct LogCapture {
        std::vector<std::pair<LogLevel, std::string>> lines;

        LogCapture() {
            set_log_sink([this](LogLevel level, std::string_view msg) { lines.emplace_back(level, std::string(msg)); });
        }
        ~LogCapture() { set_log_sink({}); }

        bool contains(LogLevel level, std::string_view needle) const {
            for (const auto& [l, msg] : lines) {
                if (l == level && msg.find(needle) != std::string::npos) return true;
            }
            return false;
        }
    };

    VectorCloth chain(u32 n) {
        VectorCloth c;
        c.label = "chain";
        for (u32 i = 0; i < n; ++i) c.parts.push_back(ClothParticle{{f32(i) * 0.1f, 0.0f, 0.0f}, i == 0 ? 0.0f : 1.0f});
        for (u32 i = 0; i + 1 < n; ++i) c.cons.push_back(DistanceConstraint{i, i + 1, 0.1f, 0.0f});
        return c;
    }

    GridClothDesc small_grid() {
        GridClothDesc g{};
        g.res_x = 8;
        g.res_y = 8;
        return g;
    }
}

TEST_CASE("simulate_requires_manual_mode") {
    Simulator sim(SimulatorDesc{});
    REQUIRE(sim.enabled());
    CHECK(sim.update_mode() == UpdateMode::Automatic);
    CHECK(sim.simulate(0.01f) == Status::WrongMode);
    CHECK(std::string(sim.last_error()).find("manual") != std::string::npos);
}

TEST_CASE("update_requires_automatic_mode") {
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    CHECK(sim.update(0.01f) == Status::WrongMode);
    sim.set_update_mode(UpdateMode::Automatic);
    CHECK(sim.update(0.01f) == Status::Ok);
}

TEST_CASE("automatic_update_runs_fixed_substeps") {
    GridCloth cloth(small_grid());
    Simulator sim(SimulatorDesc{});
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    REQUIRE(sim.update(1.0f / 60.0f) == Status::Ok);
    const auto t = sim.telemetry();
    CHECK(t.substeps == 10);
    CHECK_THAT(t.substep_dt, WithinAbs(1.0f / 600.0f, 1e-7f));
    CHECK(t.total_substeps == 10u);
    CHECK(t.step_ms >= 0.0);
}

TEST_CASE("null_and_unknown_cloths_are_rejected") {
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    CHECK(sim.register_cloth(nullptr) == Status::InvalidArgs);
    CHECK(sim.deregister_cloth(nullptr) == Status::InvalidArgs);
    CHECK(sim.notify_changed(nullptr, ChangeKind::Topology) == Status::InvalidArgs);

    auto stranger = pinned_pair(float3{1.0f, 0.0f, 0.0f});
    CHECK(sim.notify_changed(&stranger, ChangeKind::Gravity) == Status::InvalidArgs);
    CHECK(sim.reset_particles(&stranger) == Status::InvalidArgs);
    CHECK_FALSE(sim.last_error().empty());
    CHECK(sim.deregister_cloth(&stranger) == Status::Ok);
    CHECK(sim.view(&stranger).count == 0);
}

TEST_CASE("duplicate_registration_is_a_no_op") {
    auto cloth = pinned_pair(float3{1.0f, 0.0f, 0.0f});
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.cloth_count() == 1);
    CHECK(sim.view(&cloth).generation == 1u);
}

TEST_CASE("deregistered_cloth_is_no_longer_simulated") {
    GridCloth cloth(small_grid());
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    REQUIRE(sim.view(&cloth).count == 64);
    REQUIRE(sim.deregister_cloth(&cloth) == Status::Ok);
    CHECK(sim.cloth_count() == 0);
    CHECK(sim.view(&cloth).count == 0);
    CHECK(sim.simulate(1.0f / 60.0f) == Status::Ok);
}

TEST_CASE("disabled_simulator_does_not_advance") {
    GridCloth cloth(small_grid());
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    REQUIRE(sim.simulate(1.0f / 60.0f) == Status::Ok);

    sim.disable(false);
    CHECK_FALSE(sim.enabled());
    const auto v      = sim.view(&cloth);
    const u32 sample   = cloth.index(4, 7);
    const f32 y_before = v.pos_y[sample];
    CHECK(sim.simulate(1.0f / 60.0f) == Status::NotReady);
    CHECK(v.pos_y[sample] == y_before);
}

TEST_CASE("cloth_is_not_built_until_enabled") {
    GridCloth cloth(small_grid());
    SimulatorDesc desc    = manual_desc(Backend::Native, 600.0f);
    desc.enable_on_create = false;
    Simulator sim(desc);
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.view(&cloth).count == 0);
    CHECK(sim.simulate(0.1f) == Status::NotReady);
    REQUIRE(sim.enable() == Status::Ok);
    CHECK(sim.view(&cloth).count == 64);
}

TEST_CASE("enable_discards_accumulated_time") {
    Simulator sim(manual_desc(Backend::Native, 100.0f));
    REQUIRE(sim.simulate(0.005f) == Status::Ok);
    REQUIRE(sim.time_remainder() > 0.0);
    sim.disable(false);
    REQUIRE(sim.enable() == Status::Ok);
    CHECK(sim.time_remainder() == 0.0);
}

TEST_CASE("dispose_releases_and_enable_rebuilds") {
    GridCloth cloth(small_grid());
    Simulator sim(manual_desc(Backend::Tbb, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    const u64 gen = sim.view(&cloth).generation;
    sim.disable(true);
    CHECK(sim.view(&cloth).count == 0);
    REQUIRE(sim.enable() == Status::Ok);
    const auto v = sim.view(&cloth);
    CHECK(v.count == 64);
    CHECK(v.generation > gen);
    CHECK(sim.simulate(1.0f / 60.0f) == Status::Ok);
}

TEST_CASE("topology_change_rebuilds_on_next_step") {
    GridCloth cloth(small_grid());
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    const u64 rebuilds = sim.telemetry().rebuilds;
    CHECK(sim.view(&cloth).generation == 1u);

    GridClothDesc bigger = small_grid();
    bigger.res_x         = 10;
    cloth.rebuild(bigger);
    REQUIRE(sim.notify_changed(&cloth, ChangeKind::Topology) == Status::Ok);
    REQUIRE(sim.simulate(1.0f / 60.0f) == Status::Ok);

    const auto v = sim.view(&cloth);
    CHECK(v.generation == 2u);
    CHECK(v.count == 80);
    CHECK(v.constraint_count == cloth.constraints().size());
    CHECK(sim.telemetry().rebuilds == rebuilds + 1);
}

TEST_CASE("gravity_change_applies_without_rebuild") {
    auto cloth = pinned_pair(float3{1.0f, 0.0f, 0.0f});
    cloth.g    = float3{};
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    REQUIRE(sim.simulate(0.1f) == Status::Ok);
    const auto v = sim.view(&cloth);
    CHECK(v.pos_y[1] == 0.0f);

    cloth.g = float3{0.0f, 0.0f, -9.8f};
    REQUIRE(sim.notify_changed(&cloth, ChangeKind::Gravity) == Status::Ok);
    REQUIRE(sim.simulate(0.1f) == Status::Ok);
    CHECK(v.pos_z[1] < 0.0f);
    CHECK(v.pos_y[1] == 0.0f);
    CHECK(sim.view(&cloth).generation == 1u);
}

TEST_CASE("reset_particles_restores_rest_pose") {
    GridCloth cloth(small_grid());
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    for (int k = 0; k < 30; ++k) REQUIRE(sim.simulate(1.0f / 60.0f) == Status::Ok);
    const auto v    = sim.view(&cloth);
    const u32 sample = cloth.index(3, 7);
    REQUIRE(v.pos_y[sample] < -0.05f);

    REQUIRE(sim.reset_particles(&cloth) == Status::Ok);
    REQUIRE(sim.simulate(1.0f / 600.0f) == Status::Ok);
    const auto rest = cloth.particles();
    for (usize i = 0; i < v.count; ++i) {
        CHECK_THAT(v.pos_x[i], WithinAbs(rest[i].rest_position.x, 1e-3f));
        CHECK_THAT(v.pos_y[i], WithinAbs(rest[i].rest_position.y, 1e-3f));
        CHECK_THAT(v.pos_z[i], WithinAbs(rest[i].rest_position.z, 1e-3f));
    }
}

TEST_CASE("cloth_without_constraints_stays_unbuilt") {
    LogCapture log;
    VectorCloth cloth;
    cloth.parts = {ClothParticle{}, ClothParticle{}};
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.view(&cloth).count == 0);
    CHECK(log.contains(LogLevel::Error, "no valid constraints"));
    CHECK(sim.simulate(1.0f / 60.0f) == Status::Ok);
}

TEST_CASE("particle_limit_truncates_with_error") {
    LogCapture log;
    auto cloth                    = chain(5);
    SimulatorDesc desc            = manual_desc(Backend::Native, 600.0f);
    desc.max_particles_per_cloth  = 3;
    Simulator sim(desc);
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    const auto v = sim.view(&cloth);
    CHECK(v.count == 3);
    CHECK(v.constraint_count == 2);
    CHECK(log.contains(LogLevel::Error, "exceed the limit"));
    CHECK(log.contains(LogLevel::Error, "dropped with truncated particles"));
}

TEST_CASE("invalid_constraints_are_dropped_with_warning") {
    LogCapture log;
    auto cloth = chain(3);
    cloth.cons.push_back(DistanceConstraint{1, 1, 0.1f, 0.0f});
    cloth.cons.push_back(DistanceConstraint{0, 9, 0.1f, 0.0f});
    cloth.cons.push_back(DistanceConstraint{0, 2, -1.0f, 0.0f});
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.view(&cloth).constraint_count == 2);
    CHECK(log.contains(LogLevel::Warn, "3 invalid constraints"));
}

TEST_CASE("invalid_provided_batches_fall_back_to_greedy") {
    LogCapture log;
    auto cloth    = chain(3);
    cloth.offsets = {0, 2}; // both constraints share particle 1
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.view(&cloth).batch_count == 2);
    CHECK(log.contains(LogLevel::Warn, "provided batches rejected"));
}

TEST_CASE("valid_provided_batches_are_kept") {
    GridCloth cloth(small_grid());
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.view(&cloth).batch_count == cloth.group_count());
}

TEST_CASE("batch_limit_truncates_with_error") {
    LogCapture log;
    GridCloth cloth(small_grid());
    SimulatorDesc desc          = manual_desc(Backend::Native, 600.0f);
    desc.max_constraint_batches = 2;
    Simulator sim(desc);
    REQUIRE(sim.register_cloth(&cloth) == Status::Ok);
    CHECK(sim.view(&cloth).batch_count == 2);
    CHECK(log.contains(LogLevel::Error, "constraints will not be solved"));
    CHECK(sim.simulate(1.0f / 60.0f) == Status::Ok);
}

TEST_CASE("setters_clamp_scheduler_rates") {
    Simulator sim(manual_desc(Backend::Native, 600.0f));
    sim.set_substeps_per_second(0.0f);
    CHECK(sim.substeps_per_second() == 1.0f);
    sim.set_substeps_per_second(1e6f);
    CHECK(sim.substeps_per_second() == 1000.0f);
    sim.set_max_substeps_per_frame(-3);
    CHECK(sim.max_substeps_per_frame() == 1);
    sim.set_max_substeps_per_frame(5000);
    CHECK(sim.max_substeps_per_frame() == 1000);
}

TEST_CASE("frame_substeps_are_clamped") {
    Simulator sim(manual_desc(Backend::Native, 1000.0f));
    sim.set_max_substeps_per_frame(4);
    REQUIRE(sim.simulate(0.1f) == Status::Ok);
    const auto t = sim.telemetry();
    CHECK(t.substeps == 4);
    CHECK_THAT(t.substep_dt, WithinAbs(0.025f, 1e-6f));
}

TEST_CASE("negative_thread_count_is_unsupported") {
    SimulatorDesc desc = manual_desc(Backend::Tbb, 600.0f);
    desc.exec.threads  = -1;
    Simulator sim(desc);
    std::string why;
    CHECK_FALSE(sim.is_supported(&why));
    CHECK_FALSE(why.empty());
    CHECK_FALSE(sim.enabled());
    CHECK(sim.enable() == Status::Unsupported);
}

#if !defined(DRAPE_HAVE_SIMD)
TEST_CASE("simd_backend_unavailable_without_highway") {
    Simulator sim(manual_desc(Backend::Simd, 600.0f));
    CHECK_FALSE(sim.enabled());
    CHECK_FALSE(sim.is_supported());
    CHECK(sim.enable() == Status::Unsupported);
    CHECK(std::string(sim.last_error()).find("Highway") != std::string::npos);
}
#endif

TEST_CASE("instances_are_independent") {
    GridCloth a(small_grid());
    GridCloth b(small_grid());
    Simulator sa(manual_desc(Backend::Native, 600.0f));
    Simulator sb(manual_desc(Backend::Atomic, 300.0f));
    REQUIRE(sa.register_cloth(&a) == Status::Ok);
    REQUIRE(sb.register_cloth(&b) == Status::Ok);
    CHECK(sb.view(&a).count == 0);

    const u32 sample = b.index(4, 7);
    const f32 y_b   = sb.view(&b).pos_y[sample];
    for (int k = 0; k < 10; ++k) REQUIRE(sa.simulate(1.0f / 60.0f) == Status::Ok);
    CHECK(sb.view(&b).pos_y[sample] == y_b);
    CHECK(sa.view(&a).pos_y[sample] < y_b);
    CHECK(sb.telemetry().total_substeps == 0u);
}

TEST_CASE("handle_create_and_destroy") {
    SimulatorDesc desc = manual_desc(Backend::Native, 600.0f);
    auto created       = create(desc);
    REQUIRE(created.status == Status::Ok);
    Handle h = created.value;
    REQUIRE(h != nullptr);
    CHECK(h->enabled());
    auto cloth = pinned_pair(float3{1.0f, 0.0f, 0.0f});
    CHECK(h->register_cloth(&cloth) == Status::Ok);
    CHECK(h->simulate(0.01f) == Status::Ok);
    destroy(h);
    destroy(nullptr);
}

TEST_CASE("create_reports_why_it_failed") {
    SimulatorDesc desc = manual_desc(Backend::Tbb, 600.0f);
    desc.exec.threads  = -1;
    auto created       = create(desc);
    CHECK(created.status == Status::Unsupported);
    CHECK(created.value == nullptr);

    desc.enable_on_create = false;
    auto deferred         = create(desc);
    REQUIRE(deferred.status == Status::Ok);
    REQUIRE(deferred.value != nullptr);
    CHECK_FALSE(deferred.value->enabled());
    CHECK(deferred.value->enable() == Status::Unsupported);
    destroy(deferred.value);
}

TEST_CASE("status_names") {
    CHECK(std::string(to_string(Status::Ok)) == "ok");
    CHECK(std::string(to_string(Status::WrongMode)) == "wrong update mode");
}
