#ifndef DRAPE_AERO_H
#define DRAPE_AERO_H

#include "drape.h"
#include "drape/model/cloth_data.h"

namespace Drape::aero {

    // CSR list of the triangles touching each particle, from ClothData::tris.
    void build_face_fan(model::ClothData& d);

    // Area weighted, normalized vertex normals. Particles without faces get (0,0,0).
    void compute_normals(model::ClothData& d) noexcept;

    // Per-substep wind drag and lift, written as acceleration into ax/ay/az.
    void accumulate_wind(model::ClothData& d, f32 dt) noexcept;

    void clear_wind(model::ClothData& d) noexcept;

}

#endif
