#ifndef DRAPE_GRID_CLOTH_H
#define DRAPE_GRID_CLOTH_H

#include "drape.h"
#include <string>
#include <vector>

namespace Drape {

    struct GridClothDesc {
        enum class Pin { None, TopCorners, TopRow };
        enum ConstraintTypes : u32 { Stretch = 1u << 0, Shear = 1u << 1, Bending = 1u << 2, All = 7u };

        std::string name{"grid"};
        int res_x{32};
        int res_y{32};
        f32 spacing{0.05f};
        float3 origin{};
        Pin pin{Pin::TopRow};
        u32 constraint_types{All};
        // Softness in [0, 1]; compliance = softness^4.
        f32 stretch_softness{0.0f};
        f32 shear_softness{0.25f};
        f32 bending_softness{0.25f};
        bool pre_grouped{true};
        float3 gravity{0.0f, -9.81f, 0.0f};
        AeroParams aero{};
        f32 thickness{0.0f};
    };

    // Rectangular cloth in the XZ plane, particle id = y * res_x + x. Constraints are
    // generated in parity groups that are already particle disjoint, so they can be
    // handed over pre-grouped.
    class GridCloth final : public ICloth {
    public:
        explicit GridCloth(GridClothDesc desc);

        std::string_view name() const override { return desc_.name; }
        std::span<const ClothParticle> particles() const override { return particles_; }
        std::span<const DistanceConstraint> constraints() const override { return constraints_; }
        std::span<const u32> batch_offsets() const override;
        std::span<const u32> indices() const override { return indices_; }
        Bounds bounds() const override { return bounds_; }
        float3 gravity() const override { return desc_.gravity; }
        AeroParams aero() const override { return desc_.aero; }
        f32 thickness() const override { return desc_.thickness; }

        // Regenerates everything; report ChangeKind::Topology afterwards.
        void rebuild(GridClothDesc desc);
        void set_gravity(float3 g) noexcept { desc_.gravity = g; }
        void set_aero(const AeroParams& a) noexcept { desc_.aero = a; }
        void set_thickness(f32 t) noexcept { desc_.thickness = t; }

        [[nodiscard]] const GridClothDesc& desc() const noexcept { return desc_; }
        [[nodiscard]] u32 index(int x, int y) const noexcept { return static_cast<u32>(y * desc_.res_x + x); }
        [[nodiscard]] usize group_count() const noexcept { return offsets_.empty() ? 0 : offsets_.size() - 1; }

    private:
        GridClothDesc desc_;
        std::vector<ClothParticle> particles_;
        std::vector<DistanceConstraint> constraints_;
        std::vector<u32> offsets_;
        std::vector<u32> indices_;
        Bounds bounds_{};

        void generate();
    };

}

#endif
