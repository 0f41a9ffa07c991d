#ifndef DRAPE_XPBD_KERNELS_H
#define DRAPE_XPBD_KERNELS_H

#include "drape.h"
#include "drape/model/cloth_data.h"
#include <cmath>

// Scalar XPBD kernels shared by the Native, Tbb and Atomic backends.
namespace Drape::kernels {

    // Verlet step: p' = p + (p - prev) + a*dt^2. Pinned particles are not touched.
    inline void integrate_range(model::ClothData& d, usize begin, usize end, f32 dt) noexcept {
        const f32 dt2  = dt * dt;
        const f32 gx   = d.gravity.x, gy = d.gravity.y, gz = d.gravity.z;
        const f32 maxd = d.max_displacement;
        for (usize i = begin; i < end; ++i) {
            if (!(d.inv_mass[i] > 0.0f)) continue;
            f32 sx = (d.px[i] - d.prev_x[i]) + (gx + d.ax[i]) * dt2;
            f32 sy = (d.py[i] - d.prev_y[i]) + (gy + d.ay[i]) * dt2;
            f32 sz = (d.pz[i] - d.prev_z[i]) + (gz + d.az[i]) * dt2;
            if (maxd > 0.0f) {
                const f32 len2 = sx * sx + sy * sy + sz * sz;
                if (len2 > maxd * maxd) {
                    const f32 k = maxd / std::sqrt(len2);
                    sx *= k;
                    sy *= k;
                    sz *= k;
                }
            }
            d.prev_x[i] = d.px[i];
            d.prev_y[i] = d.py[i];
            d.prev_z[i] = d.pz[i];
            d.px[i] += sx;
            d.py[i] += sy;
            d.pz[i] += sz;
        }
    }

    struct Correction {
        f32 x{0.0f}, y{0.0f}, z{0.0f};
        bool active{false};
    };

    // XPBD distance projection. index0 moves by +c*w0 and index1 by -c*w1.
    // Coincident endpoints yield an inactive correction.
    inline Correction distance_correction(f32 x0, f32 y0, f32 z0, f32 x1, f32 y1, f32 z1, f32 w, f32 rest, f32 compliance, f32 inv_dt2) noexcept {
        Correction c;
        if (!(w > 0.0f)) return c;
        const f32 dx  = x0 - x1;
        const f32 dy  = y0 - y1;
        const f32 dz  = z0 - z1;
        const f32 len = std::sqrt(dx * dx + dy * dy + dz * dz);
        if (!(len > 0.0f)) return c;
        const f32 alpha   = compliance * inv_dt2;
        const f32 s       = -(len - rest) / (w + alpha);
        const f32 inv_len = 1.0f / len;
        c.x               = dx * inv_len * s;
        c.y               = dy * inv_len * s;
        c.z               = dz * inv_len * s;
        c.active          = true;
        return c;
    }

    inline void project_constraint(model::ClothData& d, u32 e, f32 inv_dt2) noexcept {
        const u32 i = d.e_i[e], j = d.e_j[e];
        const f32 wi = d.inv_mass[i], wj = d.inv_mass[j];
        const Correction c = distance_correction(d.px[i], d.py[i], d.pz[i], d.px[j], d.py[j], d.pz[j], wi + wj, d.rest_len[e], d.compliance[e], inv_dt2);
        if (!c.active) return;
        if (wi > 0.0f) {
            d.px[i] += c.x * wi;
            d.py[i] += c.y * wi;
            d.pz[i] += c.z * wi;
        }
        if (wj > 0.0f) {
            d.px[j] -= c.x * wj;
            d.py[j] -= c.y * wj;
            d.pz[j] -= c.z * wj;
        }
    }

    // Velocity from the last substep's displacement; pinned particles report zero.
    inline void finalize_range(model::ClothData& d, usize begin, usize end, f32 dt) noexcept {
        const f32 inv_dt = dt > 0.0f ? 1.0f / dt : 0.0f;
        for (usize i = begin; i < end; ++i) {
            if (d.inv_mass[i] > 0.0f) {
                d.vx[i] = (d.px[i] - d.prev_x[i]) * inv_dt;
                d.vy[i] = (d.py[i] - d.prev_y[i]) * inv_dt;
                d.vz[i] = (d.pz[i] - d.prev_z[i]) * inv_dt;
            } else {
                d.vx[i] = d.vy[i] = d.vz[i] = 0.0f;
            }
        }
    }

}

#endif
