#include "drape/core/codec.h"

#include <cmath>

namespace Drape::core {

    namespace {
        u64 quantize(f32 v, f32 lo, f32 hi) noexcept {
            const double extent = double(hi) - double(lo);
            if (!(extent > 0.0) || !std::isfinite(extent)) return 0;
            double t = (double(v) - double(lo)) / extent;
            if (!(t == t)) t = 0.0;
            t = t < 0.0 ? 0.0 : (t > 1.0 ? 1.0 : t);
            return static_cast<u64>(std::llround(t * double(CompressedPosition::k_axis_max)));
        }

        f32 dequantize(u32 q, f32 lo, f32 hi) noexcept {
            const double extent = double(hi) - double(lo);
            if (!(extent > 0.0) || !std::isfinite(extent)) return lo;
            return static_cast<f32>(double(lo) + extent * (double(q) / double(CompressedPosition::k_axis_max)));
        }
    }

    CompressedPosition CompressedPosition::encode(float3 p, const Bounds& b, bool pinned) noexcept {
        const u64 qx = quantize(p.x, b.min.x, b.max.x);
        const u64 qy = quantize(p.y, b.min.y, b.max.y);
        const u64 qz = quantize(p.z, b.min.z, b.max.z);
        u64 bits     = qx | (qy << k_axis_bits) | (qz << (2 * k_axis_bits));
        if (pinned) bits |= (u64(1) << 63);
        return CompressedPosition{bits};
    }

    DecodedPosition CompressedPosition::decode(const Bounds& b) const noexcept {
        DecodedPosition out;
        out.position.x = dequantize(axis(0), b.min.x, b.max.x);
        out.position.y = dequantize(axis(1), b.min.y, b.max.y);
        out.position.z = dequantize(axis(2), b.min.z, b.max.z);
        out.pinned     = pinned();
        return out;
    }

    float3 CompressedPosition::quantization_step(const Bounds& b) noexcept {
        const float3 s  = b.size();
        const f32 denom = static_cast<f32>(k_axis_max);
        return float3{s.x > 0.0f ? s.x / denom : 0.0f, s.y > 0.0f ? s.y / denom : 0.0f, s.z > 0.0f ? s.z / denom : 0.0f};
    }

    void pack_positions(const f32* px, const f32* py, const f32* pz, const f32* inv_mass, usize n, const Bounds& bounds, PositionSlots& out) {
        out.resize(n);
        for (usize i = 0; i < n; ++i) {
            out.slots[i].store(CompressedPosition::encode(float3{px[i], py[i], pz[i]}, bounds, !(inv_mass[i] > 0.0f)));
        }
    }

    void unpack_positions(const PositionSlots& in, const Bounds& bounds, f32* px, f32* py, f32* pz) {
        for (usize i = 0; i < in.count; ++i) {
            const CompressedPosition c = in.slots[i].load();
            if (c.pinned()) continue;
            const DecodedPosition d = c.decode(bounds);
            px[i]                   = d.position.x;
            py[i]                   = d.position.y;
            pz[i]                   = d.position.z;
        }
    }

}
