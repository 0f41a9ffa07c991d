// Highway SIMD XPBD backend
#include "drape/solver.h"

#if defined(DRAPE_HAVE_SIMD)
#include <hwy/highway.h>

#include <cstdint>
#include <memory>

// Highway kernels live in the global hwy namespace (not inside Drape)
namespace hwy {
namespace HWY_NAMESPACE {

using Df   = HWY_FULL(float);
using Du32 = Rebind<uint32_t, Df>;
using Dsi  = Rebind<int32_t, Df>;

// p' = p + (p - prev) + (g + a)*dt^2 for im>0; pinned and tail lanes are not stored
static void HwyIntegrate(const float* HWY_RESTRICT gravity, // gx,gy,gz
                         float* HWY_RESTRICT px,
                         float* HWY_RESTRICT py,
                         float* HWY_RESTRICT pz,
                         float* HWY_RESTRICT prev_x,
                         float* HWY_RESTRICT prev_y,
                         float* HWY_RESTRICT prev_z,
                         const float* HWY_RESTRICT ax,
                         const float* HWY_RESTRICT ay,
                         const float* HWY_RESTRICT az,
                         const float* HWY_RESTRICT inv_mass,
                         float dt,
                         float max_disp,
                         size_t n) {
  const Df d;
  const auto gx   = Set(d, gravity[0]);
  const auto gy   = Set(d, gravity[1]);
  const auto gz   = Set(d, gravity[2]);
  const auto dt2  = Set(d, dt * dt);
  const auto zero = Zero(d);
  const auto vmax = Set(d, max_disp);
  const auto vmax2 = Set(d, max_disp * max_disp);
  const bool clamp = max_disp > 0.0f;

  for (size_t i = 0; i < n; i += Lanes(d)) {
    const auto m = FirstN(d, n - i);

    const auto px0 = MaskedLoad(m, d, px + i);
    const auto py0 = MaskedLoad(m, d, py + i);
    const auto pz0 = MaskedLoad(m, d, pz + i);
    const auto pxp = MaskedLoad(m, d, prev_x + i);
    const auto pyp = MaskedLoad(m, d, prev_y + i);
    const auto pzp = MaskedLoad(m, d, prev_z + i);
    const auto im  = MaskedLoad(m, d, inv_mass + i);
    const auto movable = And(m, Gt(im, zero));

    auto sx = MulAdd(gx + MaskedLoad(m, d, ax + i), dt2, px0 - pxp);
    auto sy = MulAdd(gy + MaskedLoad(m, d, ay + i), dt2, py0 - pyp);
    auto sz = MulAdd(gz + MaskedLoad(m, d, az + i), dt2, pz0 - pzp);

    if (clamp) {
      const auto len2 = MulAdd(sx, sx, MulAdd(sy, sy, sz * sz));
      const auto over = Gt(len2, vmax2);
      const auto k    = vmax / Sqrt(len2);
      sx = IfThenElse(over, sx * k, sx);
      sy = IfThenElse(over, sy * k, sy);
      sz = IfThenElse(over, sz * k, sz);
    }

    BlendedStore(px0, movable, d, prev_x + i);
    BlendedStore(py0, movable, d, prev_y + i);
    BlendedStore(pz0, movable, d, prev_z + i);
    BlendedStore(px0 + sx, movable, d, px + i);
    BlendedStore(py0 + sy, movable, d, py + i);
    BlendedStore(pz0 + sz, movable, d, pz + i);
  }
}

// v = (p - prev)/dt for im>0, else v = 0
static void HwyFinalize(const float* HWY_RESTRICT px,
                        const float* HWY_RESTRICT py,
                        const float* HWY_RESTRICT pz,
                        const float* HWY_RESTRICT prev_x,
                        const float* HWY_RESTRICT prev_y,
                        const float* HWY_RESTRICT prev_z,
                        const float* HWY_RESTRICT inv_mass,
                        float* HWY_RESTRICT vx,
                        float* HWY_RESTRICT vy,
                        float* HWY_RESTRICT vz,
                        float dt,
                        size_t n) {
  const Df d;
  const auto zero   = Zero(d);
  const auto inv_dt = Set(d, dt > 0.0f ? 1.0f / dt : 0.0f);

  for (size_t i = 0; i < n; i += Lanes(d)) {
    const auto m = FirstN(d, n - i);
    const auto movable = Gt(MaskedLoad(m, d, inv_mass + i), zero);

    const auto vx_new = (MaskedLoad(m, d, px + i) - MaskedLoad(m, d, prev_x + i)) * inv_dt;
    const auto vy_new = (MaskedLoad(m, d, py + i) - MaskedLoad(m, d, prev_y + i)) * inv_dt;
    const auto vz_new = (MaskedLoad(m, d, pz + i) - MaskedLoad(m, d, prev_z + i)) * inv_dt;

    BlendedStore(IfThenElse(movable, vx_new, zero), m, d, vx + i);
    BlendedStore(IfThenElse(movable, vy_new, zero), m, d, vy + i);
    BlendedStore(IfThenElse(movable, vz_new, zero), m, d, vz + i);
  }
}

// One XPBD pass over a particle-disjoint batch. Lanes never alias, so the
// gathered values are private to their lane until scattered back.
static void HwySolveBatch(const uint32_t* HWY_RESTRICT batch,
                          size_t batch_size,
                          const uint32_t* HWY_RESTRICT e_i,
                          const uint32_t* HWY_RESTRICT e_j,
                          const float* HWY_RESTRICT rest,
                          const float* HWY_RESTRICT compliance,
                          float* HWY_RESTRICT px,
                          float* HWY_RESTRICT py,
                          float* HWY_RESTRICT pz,
                          const float* HWY_RESTRICT inv_mass,
                          float inv_dt2) {
  const Df d;
  const Du32 du;
  const Dsi dsi;
  const auto zero  = Zero(d);
  const auto one   = Set(d, 1.0f);
  const auto vidt2 = Set(d, inv_dt2);

  for (size_t k = 0; k < batch_size; k += Lanes(d)) {
    const size_t rem = batch_size - k;
    const auto lane = FirstN(d, rem);
    const auto ve   = BitCast(dsi, MaskedLoad(FirstN(du, rem), du, batch + k));

    const auto vi = GatherIndex(dsi, reinterpret_cast<const int32_t*>(e_i), ve);
    const auto vj = GatherIndex(dsi, reinterpret_cast<const int32_t*>(e_j), ve);

    const auto pxi = GatherIndex(d, px, vi);
    const auto pyi = GatherIndex(d, py, vi);
    const auto pzi = GatherIndex(d, pz, vi);
    const auto pxj = GatherIndex(d, px, vj);
    const auto pyj = GatherIndex(d, py, vj);
    const auto pzj = GatherIndex(d, pz, vj);

    const auto wi   = GatherIndex(d, inv_mass, vi);
    const auto wj   = GatherIndex(d, inv_mass, vj);
    const auto wsum = wi + wj;

    const auto dx  = pxi - pxj;
    const auto dy  = pyi - pyj;
    const auto dz  = pzi - pzj;
    const auto len = Sqrt(MulAdd(dx, dx, MulAdd(dy, dy, dz * dz)));
    const auto ok  = And(lane, And(Gt(wsum, zero), Gt(len, zero)));

    const auto alpha   = GatherIndex(d, compliance, ve) * vidt2;
    const auto s       = Neg(len - GatherIndex(d, rest, ve)) / (wsum + alpha);
    const auto inv_len = one / len;
    const auto cx = dx * inv_len * s;
    const auto cy = dy * inv_len * s;
    const auto cz = dz * inv_len * s;

    const auto ok_i = And(ok, Gt(wi, zero));
    const auto ok_j = And(ok, Gt(wj, zero));
    MaskedScatterIndex(MulAdd(cx, wi, pxi), ok_i, d, px, vi);
    MaskedScatterIndex(MulAdd(cy, wi, pyi), ok_i, d, py, vi);
    MaskedScatterIndex(MulAdd(cz, wi, pzi), ok_i, d, pz, vi);
    MaskedScatterIndex(NegMulAdd(cx, wj, pxj), ok_j, d, px, vj);
    MaskedScatterIndex(NegMulAdd(cy, wj, pyj), ok_j, d, py, vj);
    MaskedScatterIndex(NegMulAdd(cz, wj, pzj), ok_j, d, pz, vj);
  }
}

}  // namespace HWY_NAMESPACE
}  // namespace hwy

namespace Drape::detail {

    class SimdSolver final : public ISolver {
    public:
        const char* name() const noexcept override { return "simd"; }

        void substep(model::ClothData& d, f32 dt) noexcept override {
            const float g[3] = {d.gravity.x, d.gravity.y, d.gravity.z};
            hwy::HWY_NAMESPACE::HwyIntegrate(g,
                d.px.data(), d.py.data(), d.pz.data(),
                d.prev_x.data(), d.prev_y.data(), d.prev_z.data(),
                d.ax.data(), d.ay.data(), d.az.data(),
                d.inv_mass.data(), dt, d.max_displacement, d.n_logical);

            const f32 inv_dt2 = 1.0f / (dt * dt);
            for (const auto& b : d.batches) {
                if (b.empty()) continue;
                hwy::HWY_NAMESPACE::HwySolveBatch(
                    b.data(), b.size(),
                    d.e_i.data(), d.e_j.data(), d.rest_len.data(), d.compliance.data(),
                    d.px.data(), d.py.data(), d.pz.data(),
                    d.inv_mass.data(), inv_dt2);
            }
        }

        void finish(model::ClothData& d, f32 dt) noexcept override {
            hwy::HWY_NAMESPACE::HwyFinalize(
                d.px.data(), d.py.data(), d.pz.data(),
                d.prev_x.data(), d.prev_y.data(), d.prev_z.data(),
                d.inv_mass.data(),
                d.vx.data(), d.vy.data(), d.vz.data(),
                dt, d.n_logical);
        }
    };

    std::unique_ptr<ISolver> make_simd() {
        return std::make_unique<SimdSolver>();
    }

}

#endif // DRAPE_HAVE_SIMD
