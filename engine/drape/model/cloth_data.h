#ifndef DRAPE_MODEL_CLOTH_DATA_H
#define DRAPE_MODEL_CLOTH_DATA_H

#include "drape.h"
#include "drape/core/arena.h"
#include <algorithm>
#include <memory_resource>

namespace Drape::model {

    using core::pvec;

    // Per-cloth simulation state. Particle streams are padded to a multiple of 8;
    // padding lanes have zero inverse mass and never move.
    class ClothData {
    public:
        explicit ClothData(std::pmr::memory_resource* mr)
            : px(mr), py(mr), pz(mr), prev_x(mr), prev_y(mr), prev_z(mr), vx(mr), vy(mr), vz(mr), ax(mr), ay(mr), az(mr), nx(mr), ny(mr), nz(mr), inv_mass(mr), rest_x(mr), rest_y(mr), rest_z(mr), e_i(mr), e_j(mr), rest_len(mr), compliance(mr), batches(mr), tris(mr), fan_offsets(mr), fan_faces(mr) {}

        void resize_particles(usize n) {
            n_logical        = n;
            const usize n_pad = core::pad8(n);
            for (auto* v : {&px, &py, &pz, &prev_x, &prev_y, &prev_z, &vx, &vy, &vz, &ax, &ay, &az, &nx, &ny, &nz, &inv_mass, &rest_x, &rest_y, &rest_z}) {
                v->assign(n_pad, 0.0f);
            }
        }
        void resize_constraints(usize m) {
            e_i.resize(m);
            e_j.resize(m);
            rest_len.resize(m);
            compliance.resize(m);
        }

        // Restarts every particle from its rest position with zero velocity.
        void reset_to_rest() noexcept {
            std::copy(rest_x.begin(), rest_x.end(), px.begin());
            std::copy(rest_y.begin(), rest_y.end(), py.begin());
            std::copy(rest_z.begin(), rest_z.end(), pz.begin());
            std::copy(rest_x.begin(), rest_x.end(), prev_x.begin());
            std::copy(rest_y.begin(), rest_y.end(), prev_y.begin());
            std::copy(rest_z.begin(), rest_z.end(), prev_z.begin());
            for (auto* v : {&vx, &vy, &vz, &ax, &ay, &az}) std::fill(v->begin(), v->end(), 0.0f);
        }

        [[nodiscard]] usize constraint_count() const noexcept { return e_i.size(); }
        [[nodiscard]] usize triangle_count() const noexcept { return tris.size() / 3; }

        void release() noexcept {
            for (auto* v : {&px, &py, &pz, &prev_x, &prev_y, &prev_z, &vx, &vy, &vz, &ax, &ay, &az, &nx, &ny, &nz, &inv_mass, &rest_x, &rest_y, &rest_z, &rest_len, &compliance}) {
                v->clear();
                v->shrink_to_fit();
            }
            for (auto* v : {&e_i, &e_j, &tris, &fan_offsets, &fan_faces}) {
                v->clear();
                v->shrink_to_fit();
            }
            batches.clear();
            batches.shrink_to_fit();
            n_logical = 0;
        }

        pvec<f32> px, py, pz;
        pvec<f32> prev_x, prev_y, prev_z;
        pvec<f32> vx, vy, vz;
        pvec<f32> ax, ay, az; // aerodynamic acceleration of the current substep
        pvec<f32> nx, ny, nz;
        pvec<f32> inv_mass;
        pvec<f32> rest_x, rest_y, rest_z;

        pvec<u32> e_i, e_j;
        pvec<f32> rest_len, compliance;
        pvec<pvec<u32>> batches;

        pvec<u32> tris;
        pvec<u32> fan_offsets, fan_faces;

        Bounds bounds{};
        float3 gravity{0.0f, -9.81f, 0.0f};
        AeroParams aero{};
        f32 max_displacement{0.0f}; // 0 disables the per-substep clamp
        usize n_logical{0};
    };

}

#endif
