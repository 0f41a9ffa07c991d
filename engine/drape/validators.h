#ifndef DRAPE_VALIDATORS_H
#define DRAPE_VALIDATORS_H

#include "drape.h"
#include "drape/model/cloth_data.h"

namespace Drape {

    struct BuildLimits {
        usize max_particles{65536};
        usize max_batches{32};
    };

    // Reads a provider into simulation buffers. Recoverable problems (too many
    // particles or batches, bad constraints) are logged and clipped; a cloth with no
    // particles or no usable constraint returns ValidationFailed and `out` is left empty.
    [[nodiscard]] Status build_cloth_data(const ICloth& cloth, const BuildLimits& limits, model::ClothData& out);

    // Refreshes gravity, aerodynamics and the displacement clamp without a rebuild.
    void refresh_parameters(const ICloth& cloth, model::ClothData& out);

}

#endif
