#ifndef DRAPE_CORE_VEC_H
#define DRAPE_CORE_VEC_H

#include "drape.h"
#include <cmath>

namespace Drape {

    inline float3 operator+(float3 a, float3 b) noexcept { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    inline float3 operator-(float3 a, float3 b) noexcept { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    inline float3 operator-(float3 a) noexcept { return {-a.x, -a.y, -a.z}; }
    inline float3 operator*(float3 a, f32 s) noexcept { return {a.x * s, a.y * s, a.z * s}; }
    inline float3 operator*(f32 s, float3 a) noexcept { return a * s; }
    inline float3& operator+=(float3& a, float3 b) noexcept {
        a.x += b.x;
        a.y += b.y;
        a.z += b.z;
        return a;
    }

    inline f32 dot(float3 a, float3 b) noexcept { return a.x * b.x + a.y * b.y + a.z * b.z; }
    inline float3 cross(float3 a, float3 b) noexcept {
        return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
    }
    inline f32 length(float3 a) noexcept { return std::sqrt(dot(a, a)); }

    // Zero vector stays zero.
    inline float3 normalize_or_zero(float3 a) noexcept {
        const f32 len = length(a);
        return len > 0.0f ? a * (1.0f / len) : float3{};
    }

}

#endif
