#include "drape/aero.h"
#include "drape/core/vec.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace Drape::aero {

    namespace {
        float3 position(const model::ClothData& d, u32 i) noexcept { return {d.px[i], d.py[i], d.pz[i]}; }
    }

    void build_face_fan(model::ClothData& d) {
        const usize n = d.n_logical;
        const usize t = d.triangle_count();
        d.fan_offsets.assign(n + 1, 0);
        for (usize f = 0; f < t; ++f) {
            for (int k = 0; k < 3; ++k) ++d.fan_offsets[d.tris[f * 3 + k] + 1];
        }
        for (usize i = 0; i < n; ++i) d.fan_offsets[i + 1] += d.fan_offsets[i];
        d.fan_faces.assign(d.fan_offsets[n], 0);
        std::vector<u32> cursor(d.fan_offsets.begin(), d.fan_offsets.end() - 1);
        for (u32 f = 0; f < static_cast<u32>(t); ++f) {
            for (int k = 0; k < 3; ++k) d.fan_faces[cursor[d.tris[f * 3 + k]]++] = f;
        }
    }

    void compute_normals(model::ClothData& d) noexcept {
        const usize n = d.n_logical;
        if (d.fan_offsets.size() != n + 1) return;
        for (usize i = 0; i < n; ++i) {
            float3 acc{};
            for (u32 k = d.fan_offsets[i]; k < d.fan_offsets[i + 1]; ++k) {
                const u32 f = d.fan_faces[k];
                const float3 a = position(d, d.tris[f * 3 + 0]);
                const float3 b = position(d, d.tris[f * 3 + 1]);
                const float3 c = position(d, d.tris[f * 3 + 2]);
                // |cross| is twice the face area
                acc += cross(b - a, c - a);
            }
            const float3 nrm = normalize_or_zero(acc);
            d.nx[i]          = nrm.x;
            d.ny[i]          = nrm.y;
            d.nz[i]          = nrm.z;
        }
    }

    void clear_wind(model::ClothData& d) noexcept {
        std::fill(d.ax.begin(), d.ax.end(), 0.0f);
        std::fill(d.ay.begin(), d.ay.end(), 0.0f);
        std::fill(d.az.begin(), d.az.end(), 0.0f);
    }

    void accumulate_wind(model::ClothData& d, f32 dt) noexcept {
        clear_wind(d);
        if (!(dt > 0.0f)) return;
        const AeroParams& p = d.aero;
        const f32 inv_dt    = 1.0f / dt;
        const usize t       = d.triangle_count();
        for (usize f = 0; f < t; ++f) {
            const u32 ia = d.tris[f * 3 + 0], ib = d.tris[f * 3 + 1], ic = d.tris[f * 3 + 2];
            const float3 a = position(d, ia), b = position(d, ib), c = position(d, ic);

            const float3 va{(d.px[ia] - d.prev_x[ia]) * inv_dt, (d.py[ia] - d.prev_y[ia]) * inv_dt, (d.pz[ia] - d.prev_z[ia]) * inv_dt};
            const float3 vb{(d.px[ib] - d.prev_x[ib]) * inv_dt, (d.py[ib] - d.prev_y[ib]) * inv_dt, (d.pz[ib] - d.prev_z[ib]) * inv_dt};
            const float3 vc{(d.px[ic] - d.prev_x[ic]) * inv_dt, (d.py[ic] - d.prev_y[ic]) * inv_dt, (d.pz[ic] - d.prev_z[ic]) * inv_dt};
            const float3 v_rel = (va + vb + vc) * (1.0f / 3.0f) - p.wind_velocity;

            const f32 speed = length(v_rel);
            if (!(speed > 0.0f)) continue;
            const float3 v_hat = v_rel * (1.0f / speed);

            const float3 n2  = cross(b - a, c - a);
            const f32 twice_area = length(n2);
            if (!(twice_area > 0.0f)) continue;
            float3 n = n2 * (1.0f / twice_area);
            if (dot(n, v_hat) > 0.0f) n = -n;

            const f32 cos_theta = std::abs(dot(n, v_hat));
            const f32 q         = 0.5f * p.air_density * speed * speed * (0.5f * twice_area);
            float3 force        = v_hat * (-q * p.drag_coefficient * cos_theta);
            if (p.lift_coefficient != 0.0f) {
                force += normalize_or_zero(cross(cross(n, v_hat), v_hat)) * (q * p.lift_coefficient * cos_theta);
            }

            const float3 share = force * (1.0f / 3.0f);
            for (u32 i : {ia, ib, ic}) {
                const f32 w = d.inv_mass[i];
                if (!(w > 0.0f)) continue;
                d.ax[i] += share.x * w;
                d.ay[i] += share.y * w;
                d.az[i] += share.z * w;
            }
        }
    }

}
