#include "drape.h"
#include "drape/aero.h"
#include "drape/core/arena.h"
#include "drape/core/scheduler.h"
#include "drape/log.h"
#include "drape/model/cloth_data.h"
#include "drape/solver.h"
#include "drape/validators.h"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Drape {

    struct Simulator::Impl {
        struct ClothState {
            ICloth* cloth;
            ChangeSet pending{ChangeSet::all()};
            bool built{false};
            u64 generation{0};
            model::ClothData data;

            ClothState(ICloth* c, std::pmr::memory_resource* mr) : cloth(c), data(mr) {}
        };

        SimulatorDesc desc;
        core::StepScheduler scheduler;
        UpdateMode mode;
        bool enabled{false};
        std::string last_error;
        core::aligned_resource mem64{64};
        std::unique_ptr<detail::ISolver> solver;
        std::vector<std::unique_ptr<ClothState>> cloths;
        TelemetryFrame telemetry{};

        explicit Impl(const SimulatorDesc& d) : desc(d), scheduler(d.substeps_per_second, d.max_substeps_per_frame), mode(d.update_mode) {}

        [[nodiscard]] BuildLimits limits() const noexcept {
            return BuildLimits{std::max<usize>(desc.max_particles_per_cloth, 1), std::max<usize>(desc.max_constraint_batches, 1)};
        }

        ClothState* find(const ICloth* cloth) noexcept {
            for (auto& s : cloths) {
                if (s->cloth == cloth) return s.get();
            }
            return nullptr;
        }

        void fail(Status s, std::string msg) {
            DRAPE_LOG_ERROR("%s (%s)", msg.c_str(), to_string(s));
            last_error = std::move(msg);
        }

        void apply_changes(ClothState& s) {
            const ChangeSet changes = s.pending;
            s.pending.clear();
            if (changes.contains(ChangeKind::Topology)) {
                s.built = build_cloth_data(*s.cloth, limits(), s.data) == Status::Ok;
                ++s.generation;
                ++telemetry.rebuilds;
                if (s.built && solver) solver->prepare(s.data);
                return;
            }
            if (!s.built) return;
            if (changes.contains(ChangeKind::Gravity) || changes.contains(ChangeKind::Aerodynamics)) {
                refresh_parameters(*s.cloth, s.data);
            }
            if (changes.contains(ChangeKind::ResetParticles)) {
                s.data.reset_to_rest();
                aero::compute_normals(s.data);
            }
        }

        void flush_changes() {
            for (auto& s : cloths) {
                if (!s->pending.empty()) apply_changes(*s);
            }
        }

        Status advance(f32 dt) {
            const core::SubstepPlan plan = scheduler.advance(dt);
            telemetry.substeps           = plan.count;
            telemetry.substep_dt         = plan.dt;
            if (plan.count <= 0) return Status::Ok;
            if (plan.clamped) DRAPE_LOG_DEBUG("substeps clamped to %d, substep dt %.6f", plan.count, double(plan.dt));

            const auto t0 = std::chrono::steady_clock::now();
            flush_changes();
            for (int step = 0; step < plan.count; ++step) {
                for (auto& s : cloths) {
                    if (!s->built) continue;
                    if (s->data.aero.enabled) aero::accumulate_wind(s->data, plan.dt);
                    solver->substep(s->data, plan.dt);
                }
            }
            for (auto& s : cloths) {
                if (!s->built) continue;
                solver->finish(s->data, plan.dt);
                aero::compute_normals(s->data);
            }
            const auto t1 = std::chrono::steady_clock::now();

            telemetry.total_substeps += static_cast<u64>(plan.count);
            telemetry.step_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
            return Status::Ok;
        }
    };

    Simulator::Simulator(const SimulatorDesc& desc) : impl_(std::make_unique<Impl>(desc)) {
        if (desc.enable_on_create && enable() != Status::Ok) {
            DRAPE_LOG_WARN("simulator created disabled: %s", impl_->last_error.c_str());
        }
    }

    Simulator::~Simulator() = default;

    bool Simulator::is_supported(std::string* reasons) const {
        std::string why = detail::backend_unsupported_reason(impl_->desc.exec.backend);
        if (impl_->desc.exec.threads < 0) {
            if (!why.empty()) why += "; ";
            why += "thread count must not be negative";
        }
        if (reasons) *reasons = why;
        return why.empty();
    }

    Status Simulator::enable() {
        Impl& m = *impl_;
        if (m.enabled) return Status::Ok;

        std::string why;
        if (!is_supported(&why)) {
            m.fail(Status::Unsupported, why);
            return Status::Unsupported;
        }
        if (!m.solver) {
            const Status s = detail::make_solver(m.desc.exec, m.solver, why);
            if (s != Status::Ok) {
                m.fail(s, why);
                return s;
            }
        }

        m.last_error.clear();
        m.scheduler.reset();
        m.enabled = true;
        for (auto& s : m.cloths) s->pending |= ChangeKind::Topology;
        m.flush_changes();
        DRAPE_LOG_INFO("simulator enabled (%s backend, %zu cloths)", m.solver->name(), m.cloths.size());
        return Status::Ok;
    }

    void Simulator::disable(bool dispose_resources) {
        Impl& m = *impl_;
        m.scheduler.reset();
        if (m.enabled) DRAPE_LOG_INFO("simulator disabled");
        m.enabled = false;
        if (!dispose_resources) return;
        m.solver.reset();
        for (auto& s : m.cloths) {
            s->data.release();
            s->built = false;
            s->pending |= ChangeKind::Topology;
        }
    }

    bool Simulator::enabled() const noexcept {
        return impl_->enabled;
    }

    Status Simulator::register_cloth(ICloth* cloth) {
        Impl& m = *impl_;
        if (!cloth) {
            m.fail(Status::InvalidArgs, "register_cloth: null cloth");
            return Status::InvalidArgs;
        }
        if (m.find(cloth)) return Status::Ok;
        m.cloths.push_back(std::make_unique<Impl::ClothState>(cloth, &m.mem64));
        DRAPE_LOG_DEBUG("registered cloth '%.*s'", static_cast<int>(cloth->name().size()), cloth->name().data());
        if (m.enabled) m.apply_changes(*m.cloths.back());
        return Status::Ok;
    }

    Status Simulator::deregister_cloth(ICloth* cloth) {
        Impl& m = *impl_;
        if (!cloth) {
            m.fail(Status::InvalidArgs, "deregister_cloth: null cloth");
            return Status::InvalidArgs;
        }
        auto it = std::find_if(m.cloths.begin(), m.cloths.end(), [&](const auto& s) { return s->cloth == cloth; });
        if (it != m.cloths.end()) m.cloths.erase(it);
        return Status::Ok;
    }

    Status Simulator::notify_changed(const ICloth* cloth, ChangeSet changes) {
        Impl& m = *impl_;
        if (!cloth) {
            m.fail(Status::InvalidArgs, "notify_changed: null cloth");
            return Status::InvalidArgs;
        }
        Impl::ClothState* s = m.find(cloth);
        if (!s) {
            m.fail(Status::InvalidArgs, "notify_changed: cloth '" + std::string(cloth->name()) + "' is not registered");
            return Status::InvalidArgs;
        }
        s->pending |= changes;
        return Status::Ok;
    }

    Status Simulator::reset_particles(const ICloth* cloth) {
        return notify_changed(cloth, ChangeKind::ResetParticles);
    }

    usize Simulator::cloth_count() const noexcept {
        return impl_->cloths.size();
    }

    void Simulator::set_update_mode(UpdateMode mode) noexcept {
        impl_->mode = mode;
    }

    UpdateMode Simulator::update_mode() const noexcept {
        return impl_->mode;
    }

    void Simulator::set_substeps_per_second(f32 rate) noexcept {
        impl_->scheduler.set_substeps_per_second(rate);
    }

    f32 Simulator::substeps_per_second() const noexcept {
        return impl_->scheduler.substeps_per_second();
    }

    void Simulator::set_max_substeps_per_frame(int count) noexcept {
        impl_->scheduler.set_max_substeps_per_frame(count);
    }

    int Simulator::max_substeps_per_frame() const noexcept {
        return impl_->scheduler.max_substeps_per_frame();
    }

    Status Simulator::simulate(f32 dt) {
        Impl& m = *impl_;
        if (m.mode != UpdateMode::Manual) {
            m.fail(Status::WrongMode, "simulate() requires manual update mode");
            return Status::WrongMode;
        }
        if (!m.enabled) return Status::NotReady;
        return m.advance(dt);
    }

    Status Simulator::update(f32 frame_dt) {
        Impl& m = *impl_;
        if (m.mode != UpdateMode::Automatic) {
            m.fail(Status::WrongMode, "update() requires automatic update mode");
            return Status::WrongMode;
        }
        if (!m.enabled) return Status::NotReady;
        return m.advance(frame_dt);
    }

    ClothView Simulator::view(const ICloth* cloth) noexcept {
        Impl::ClothState* s = impl_->find(cloth);
        if (!s || !s->built) return {};
        auto& d = s->data;
        ClothView v{};
        v.pos_x            = d.px.data();
        v.pos_y            = d.py.data();
        v.pos_z            = d.pz.data();
        v.prev_x           = d.prev_x.data();
        v.prev_y           = d.prev_y.data();
        v.prev_z           = d.prev_z.data();
        v.vel_x            = d.vx.data();
        v.vel_y            = d.vy.data();
        v.vel_z            = d.vz.data();
        v.nrm_x            = d.nx.data();
        v.nrm_y            = d.ny.data();
        v.nrm_z            = d.nz.data();
        v.count            = d.n_logical;
        v.constraint_count = d.constraint_count();
        v.batch_count      = d.batches.size();
        v.generation       = s->generation;
        return v;
    }

    TelemetryFrame Simulator::telemetry() const noexcept {
        return impl_->telemetry;
    }

    double Simulator::time_remainder() const noexcept {
        return impl_->scheduler.remainder();
    }

    std::string_view Simulator::last_error() const noexcept {
        return impl_->last_error;
    }

}
