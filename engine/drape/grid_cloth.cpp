#include "drape/grid_cloth.h"
#include "drape/core/vec.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace Drape {

    namespace {
        struct Group {
            u32 type;
            int dx0, dy0, dx1, dy1;
            bool (*accept)(int x, int y);
        };

        // Offsets (dx0, dy0) -> (dx1, dy1) from the anchor particle; the parity test
        // keeps the anchors of one group from sharing particles.
        constexpr Group k_groups[] = {
            {GridClothDesc::Stretch, 0, 0, 0, 1, [](int, int y) { return y % 2 == 0; }},
            {GridClothDesc::Stretch, 0, 0, 0, 1, [](int, int y) { return y % 2 == 1; }},
            {GridClothDesc::Stretch, 0, 0, 1, 0, [](int x, int) { return x % 2 == 0; }},
            {GridClothDesc::Stretch, 0, 0, 1, 0, [](int x, int) { return x % 2 == 1; }},
            {GridClothDesc::Shear, 0, 0, 1, 1, [](int x, int) { return x % 2 == 0; }},
            {GridClothDesc::Shear, 0, 0, 1, 1, [](int x, int) { return x % 2 == 1; }},
            {GridClothDesc::Shear, 0, 1, 1, 0, [](int x, int) { return x % 2 == 0; }},
            {GridClothDesc::Shear, 0, 1, 1, 0, [](int x, int) { return x % 2 == 1; }},
            {GridClothDesc::Bending, 0, 0, 0, 2, [](int, int y) { return y % 4 < 2; }},
            {GridClothDesc::Bending, 0, 0, 0, 2, [](int, int y) { return y % 4 >= 2; }},
            {GridClothDesc::Bending, 0, 0, 2, 0, [](int x, int) { return x % 4 < 2; }},
            {GridClothDesc::Bending, 0, 0, 2, 0, [](int x, int) { return x % 4 >= 2; }},
        };

        f32 softness_to_compliance(f32 s) noexcept {
            s = std::clamp(s, 0.0f, 1.0f);
            return s * s * s * s;
        }
    }

    GridCloth::GridCloth(GridClothDesc desc) : desc_(std::move(desc)) {
        generate();
    }

    std::span<const u32> GridCloth::batch_offsets() const {
        if (!desc_.pre_grouped) return {};
        return offsets_;
    }

    void GridCloth::rebuild(GridClothDesc desc) {
        desc_ = std::move(desc);
        generate();
    }

    void GridCloth::generate() {
        desc_.res_x = std::max(desc_.res_x, 2);
        desc_.res_y = std::max(desc_.res_y, 2);
        const int nx = desc_.res_x, ny = desc_.res_y;
        const f32 h  = desc_.spacing;

        particles_.assign(static_cast<usize>(nx) * ny, ClothParticle{});
        for (int y = 0; y < ny; ++y) {
            for (int x = 0; x < nx; ++x) {
                ClothParticle& p = particles_[index(x, y)];
                p.rest_position  = desc_.origin + float3{x * h, 0.0f, y * h};
                bool pinned      = false;
                if (y == 0) {
                    if (desc_.pin == GridClothDesc::Pin::TopRow) pinned = true;
                    if (desc_.pin == GridClothDesc::Pin::TopCorners) pinned = (x == 0 || x == nx - 1);
                }
                p.inverse_mass = pinned ? 0.0f : 1.0f;
            }
        }

        constraints_.clear();
        offsets_.assign(1, 0);
        for (const Group& g : k_groups) {
            if (!(desc_.constraint_types & g.type)) continue;
            f32 compliance = 0.0f;
            if (g.type == GridClothDesc::Stretch) compliance = softness_to_compliance(desc_.stretch_softness);
            if (g.type == GridClothDesc::Shear) compliance = softness_to_compliance(desc_.shear_softness);
            if (g.type == GridClothDesc::Bending) compliance = softness_to_compliance(desc_.bending_softness);
            for (int y = 0; y < ny; ++y) {
                for (int x = 0; x < nx; ++x) {
                    if (!g.accept(x, y)) continue;
                    const int x0 = x + g.dx0, y0 = y + g.dy0, x1 = x + g.dx1, y1 = y + g.dy1;
                    if (x0 >= nx || y0 >= ny || x1 >= nx || y1 >= ny) continue;
                    const u32 i = index(x0, y0), j = index(x1, y1);
                    const f32 rest = length(particles_[i].rest_position - particles_[j].rest_position);
                    constraints_.push_back(DistanceConstraint{i, j, rest, compliance});
                }
            }
            if (constraints_.size() != offsets_.back()) offsets_.push_back(static_cast<u32>(constraints_.size()));
        }

        indices_.clear();
        indices_.reserve(static_cast<usize>(nx - 1) * (ny - 1) * 6);
        for (int y = 0; y < ny - 1; ++y) {
            for (int x = 0; x < nx - 1; ++x) {
                const u32 a = index(x, y), b = index(x + 1, y), c = index(x, y + 1), d = index(x + 1, y + 1);
                // wound so the rest normal is +Y
                indices_.insert(indices_.end(), {a, d, b, a, c, d});
            }
        }

        // Rest box grown by the cloth's extent in every direction, so it holds any drape.
        const f32 reach = h * static_cast<f32>((nx - 1) + (ny - 1));
        const float3 lo = desc_.origin;
        const float3 hi = desc_.origin + float3{(nx - 1) * h, 0.0f, (ny - 1) * h};
        bounds_         = Bounds{lo - float3{reach, reach, reach}, hi + float3{reach, reach, reach}};
    }

}
