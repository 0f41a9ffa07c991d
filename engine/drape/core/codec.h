#ifndef DRAPE_CORE_CODEC_H
#define DRAPE_CORE_CODEC_H

#include "drape.h"
#include <atomic>
#include <memory>
#include <span>

namespace Drape::core {

    struct DecodedPosition {
        float3 position{};
        bool pinned{false};
    };

    // 21-bit per axis fixed point position relative to a bounding box, plus a pin flag.
    // Values outside the box saturate to its faces.
    class CompressedPosition {
    public:
        static constexpr u32 k_axis_bits = 21;
        static constexpr u32 k_axis_max  = (1u << k_axis_bits) - 1u;

        constexpr CompressedPosition() noexcept = default;

        [[nodiscard]] static CompressedPosition encode(float3 p, const Bounds& bounds, bool pinned) noexcept;
        [[nodiscard]] DecodedPosition decode(const Bounds& bounds) const noexcept;

        [[nodiscard]] static constexpr CompressedPosition from_bits(u64 bits) noexcept { return CompressedPosition{bits}; }
        [[nodiscard]] constexpr u64 bits() const noexcept { return bits_; }
        [[nodiscard]] constexpr bool pinned() const noexcept { return (bits_ >> 63) != 0; }
        [[nodiscard]] constexpr u32 axis(u32 a) const noexcept {
            return static_cast<u32>((bits_ >> (a * k_axis_bits)) & k_axis_max);
        }

        // Largest round trip error per axis.
        [[nodiscard]] static float3 quantization_step(const Bounds& bounds) noexcept;

        friend constexpr bool operator==(CompressedPosition, CompressedPosition) noexcept = default;

    private:
        constexpr explicit CompressedPosition(u64 bits) noexcept : bits_(bits) {}
        u64 bits_{0};
    };

    // Lock free slot the non-batched solver commits positions through.
    class AtomicPositionSlot {
    public:
        AtomicPositionSlot() noexcept = default;
        AtomicPositionSlot(const AtomicPositionSlot&)            = delete;
        AtomicPositionSlot& operator=(const AtomicPositionSlot&) = delete;

        [[nodiscard]] CompressedPosition load() const noexcept {
            return CompressedPosition::from_bits(bits_.load(std::memory_order_acquire));
        }
        void store(CompressedPosition v) noexcept {
            bits_.store(v.bits(), std::memory_order_release);
        }
        // On failure `expected` receives the current value.
        bool compare_exchange(CompressedPosition& expected, CompressedPosition desired) noexcept {
            u64 e = expected.bits();
            if (bits_.compare_exchange_weak(e, desired.bits(), std::memory_order_acq_rel, std::memory_order_acquire)) return true;
            expected = CompressedPosition::from_bits(e);
            return false;
        }

    private:
        std::atomic<u64> bits_{0};
    };

    struct PositionSlots {
        std::unique_ptr<AtomicPositionSlot[]> slots;
        usize count{0};
        usize capacity{0};

        // Grows only; slots past `count` are left as they are.
        void resize(usize n) {
            if (n > capacity) {
                slots    = std::make_unique<AtomicPositionSlot[]>(n);
                capacity = n;
            }
            count = n;
        }
    };

    void pack_positions(const f32* px, const f32* py, const f32* pz, const f32* inv_mass, usize n, const Bounds& bounds, PositionSlots& out);
    // Writes back only particles whose slot is not pinned.
    void unpack_positions(const PositionSlots& in, const Bounds& bounds, f32* px, f32* py, f32* pz);

}

#endif
