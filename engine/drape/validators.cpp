#include "drape/validators.h"
#include "drape/aero.h"
#include "drape/core/batcher.h"
#include "drape/log.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace Drape {

    namespace {
        constexpr u32 k_dropped = std::numeric_limits<u32>::max();

        bool finite3(const float3& v) noexcept {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        bool valid_constraint(const DistanceConstraint& c, usize n) noexcept {
            if (c.index0 >= n || c.index1 >= n || c.index0 == c.index1) return false;
            if (!std::isfinite(c.rest_length) || c.rest_length < 0.0f) return false;
            if (!std::isfinite(c.compliance) || c.compliance < 0.0f) return false;
            return true;
        }

        Bounds sanitize_bounds(Bounds b) noexcept {
            if (!finite3(b.min) || !finite3(b.max)) {
                constexpr f32 inf = std::numeric_limits<f32>::infinity();
                return Bounds{{inf, inf, inf}, {-inf, -inf, -inf}};
            }
            return Bounds{{std::min(b.min.x, b.max.x), std::min(b.min.y, b.max.y), std::min(b.min.z, b.max.z)},
                          {std::max(b.min.x, b.max.x), std::max(b.min.y, b.max.y), std::max(b.min.z, b.max.z)}};
        }

        void expand(Bounds& b, const float3& p) noexcept {
            b.min.x = std::min(b.min.x, p.x);
            b.min.y = std::min(b.min.y, p.y);
            b.min.z = std::min(b.min.z, p.z);
            b.max.x = std::max(b.max.x, p.x);
            b.max.y = std::max(b.max.y, p.y);
            b.max.z = std::max(b.max.z, p.z);
        }

        // Pre-grouped batches survive only if they partition the kept constraints.
        bool remap_provided_batches(std::span<const u32> offsets, usize provided_count, const std::vector<u32>& remap, std::span<const DistanceConstraint> kept, usize n, core::BatchSet& out, std::string& why) {
            core::BatchSet provided;
            if (!core::batches_from_offsets(offsets, provided_count, provided)) {
                why = "batch offsets do not cover the constraint list";
                return false;
            }
            out.clear();
            for (const auto& b : provided) {
                std::vector<u32> mapped;
                mapped.reserve(b.size());
                for (u32 c : b) {
                    if (remap[c] != k_dropped) mapped.push_back(remap[c]);
                }
                if (!mapped.empty()) out.push_back(std::move(mapped));
            }
            return core::validate_batches(out, kept, n, &why);
        }
    }

    Status build_cloth_data(const ICloth& cloth, const BuildLimits& limits, model::ClothData& out) {
        const std::string name(cloth.name());
        const auto particles = cloth.particles();
        if (particles.empty()) {
            DRAPE_LOG_ERROR("cloth '%s': no particles, left unbuilt", name.c_str());
            out.release();
            return Status::ValidationFailed;
        }

        usize n = particles.size();
        if (n > limits.max_particles) {
            DRAPE_LOG_ERROR("cloth '%s': %zu particles exceed the limit of %zu, truncating", name.c_str(), n, limits.max_particles);
            n = limits.max_particles;
        }

        out.resize_particles(n);
        Bounds bounds = sanitize_bounds(cloth.bounds());
        usize bad_mass = 0, bad_pos = 0;
        for (usize i = 0; i < n; ++i) {
            float3 p = particles[i].rest_position;
            if (!finite3(p)) {
                p = float3{};
                ++bad_pos;
            }
            f32 w = particles[i].inverse_mass;
            if (!std::isfinite(w) || w < 0.0f) {
                w = 0.0f;
                ++bad_mass;
            }
            out.rest_x[i] = p.x;
            out.rest_y[i] = p.y;
            out.rest_z[i] = p.z;
            out.inv_mass[i] = w;
            expand(bounds, p);
        }
        if (bad_pos) DRAPE_LOG_WARN("cloth '%s': %zu non-finite rest positions replaced by the origin", name.c_str(), bad_pos);
        if (bad_mass) DRAPE_LOG_WARN("cloth '%s': %zu invalid inverse masses pinned", name.c_str(), bad_mass);
        out.bounds = bounds;
        out.reset_to_rest();
        const float3 extent = bounds.size();
        if (!(extent.x > 0.0f) || !(extent.y > 0.0f) || !(extent.z > 0.0f)) {
            DRAPE_LOG_WARN("cloth '%s': bounds have no extent on some axis, fixed point positions saturate there", name.c_str());
        }

        const auto constraints = cloth.constraints();
        std::vector<u32> remap(constraints.size(), k_dropped);
        std::vector<DistanceConstraint> kept;
        kept.reserve(constraints.size());
        usize truncated = 0, invalid = 0;
        for (usize c = 0; c < constraints.size(); ++c) {
            const auto& dc = constraints[c];
            if (n < particles.size() && valid_constraint(dc, particles.size()) && !valid_constraint(dc, n)) {
                ++truncated;
                continue;
            }
            if (!valid_constraint(dc, n)) {
                ++invalid;
                continue;
            }
            remap[c] = static_cast<u32>(kept.size());
            kept.push_back(dc);
        }
        if (truncated) DRAPE_LOG_ERROR("cloth '%s': %zu constraints dropped with truncated particles", name.c_str(), truncated);
        if (invalid) DRAPE_LOG_WARN("cloth '%s': %zu invalid constraints dropped", name.c_str(), invalid);
        if (kept.empty()) {
            DRAPE_LOG_ERROR("cloth '%s': no valid constraints, left unbuilt", name.c_str());
            out.release();
            return Status::ValidationFailed;
        }

        out.resize_constraints(kept.size());
        for (usize k = 0; k < kept.size(); ++k) {
            out.e_i[k]        = kept[k].index0;
            out.e_j[k]        = kept[k].index1;
            out.rest_len[k]   = kept[k].rest_length;
            out.compliance[k] = kept[k].compliance;
        }

        core::BatchSet batches;
        const auto offsets = cloth.batch_offsets();
        bool grouped       = false;
        if (!offsets.empty()) {
            std::string why;
            grouped = remap_provided_batches(offsets, constraints.size(), remap, kept, n, batches, why);
            if (!grouped) DRAPE_LOG_WARN("cloth '%s': provided batches rejected (%s), batching greedily", name.c_str(), why.c_str());
        }
        if (!grouped) batches = core::build_batches(kept, n);

        if (batches.size() > limits.max_batches) {
            usize lost = 0;
            for (usize b = limits.max_batches; b < batches.size(); ++b) lost += batches[b].size();
            DRAPE_LOG_ERROR("cloth '%s': %zu batches exceed the limit of %zu, %zu constraints will not be solved", name.c_str(), batches.size(), limits.max_batches, lost);
            batches.resize(limits.max_batches);
        }
        out.batches.clear();
        out.batches.reserve(batches.size());
        for (const auto& b : batches) {
            auto& dst = out.batches.emplace_back();
            dst.assign(b.begin(), b.end());
        }

        const auto indices = cloth.indices();
        if (indices.size() % 3 != 0) DRAPE_LOG_WARN("cloth '%s': index count %zu is not a multiple of 3", name.c_str(), indices.size());
        out.tris.clear();
        usize bad_tris = 0;
        for (usize t = 0; t + 2 < indices.size(); t += 3) {
            const u32 a = indices[t], b = indices[t + 1], c = indices[t + 2];
            if (a >= n || b >= n || c >= n || a == b || b == c || a == c) {
                ++bad_tris;
                continue;
            }
            out.tris.push_back(a);
            out.tris.push_back(b);
            out.tris.push_back(c);
        }
        if (bad_tris) DRAPE_LOG_WARN("cloth '%s': %zu degenerate or out of range triangles dropped", name.c_str(), bad_tris);
        aero::build_face_fan(out);

        refresh_parameters(cloth, out);
        aero::compute_normals(out);

        DRAPE_LOG_DEBUG("cloth '%s': %zu particles, %zu constraints, %zu batches%s", name.c_str(), n, kept.size(), out.batches.size(), grouped ? " (provided)" : "");
        return Status::Ok;
    }

    void refresh_parameters(const ICloth& cloth, model::ClothData& out) {
        const float3 g = cloth.gravity();
        out.gravity    = finite3(g) ? g : float3{0.0f, -9.81f, 0.0f};
        out.aero       = cloth.aero();
        if (!out.aero.enabled) aero::clear_wind(out);
        const f32 thickness  = cloth.thickness();
        out.max_displacement = std::isfinite(thickness) && thickness > 0.0f ? 0.2f * thickness : 0.0f;
    }

}
