#include "engine/drape/drape.h"
#include "engine/drape/grid_cloth.h"
#include <cstdio>
#include <cstring>

using namespace Drape;

static ExecPolicy::Backend parse_backend(const char* s) {
    if (std::strcmp(s, "tbb") == 0) return ExecPolicy::Backend::Tbb;
    if (std::strcmp(s, "simd") == 0) return ExecPolicy::Backend::Simd;
    if (std::strcmp(s, "atomic") == 0) return ExecPolicy::Backend::Atomic;
    return ExecPolicy::Backend::Native;
}

int main(int argc, char** argv) {
    SimulatorDesc desc{};
    if (argc > 1) desc.exec.backend = parse_backend(argv[1]);
    desc.update_mode = UpdateMode::Manual;

    GridClothDesc grid{};
    grid.name = "demo";
    grid.res_x = 32;
    grid.res_y = 32;
    grid.spacing = 0.05f;
    grid.pin = GridClothDesc::Pin::TopRow;
    GridCloth cloth(grid);

    auto created = create(desc);
    if (created.status != Status::Ok) {
        std::fprintf(stderr, "Fatal: %s\n", to_string(created.status));
        return 1;
    }
    Handle h = created.value;
    if (h->register_cloth(&cloth) != Status::Ok) {
        std::fprintf(stderr, "Fatal: %.*s\n", static_cast<int>(h->last_error().size()), h->last_error().data());
        destroy(h);
        return 1;
    }

    for (int i = 0; i < 240; ++i) {
        if (h->simulate(1.0f / 60.0f) != Status::Ok) break;
    }
    auto v = h->view(&cloth);
    if (v.count == 0) {
        std::fprintf(stderr, "Fatal: cloth was not built\n");
        destroy(h);
        return 1;
    }
    const u32 mid = cloth.index(32 / 2, 32 / 2);
    const auto t = h->telemetry();
    std::printf("pos %f %f %f\n", v.pos_x[mid], v.pos_y[mid], v.pos_z[mid]);
    std::printf("substeps %llu, last frame %d x %.5fs, %.3f ms\n", static_cast<unsigned long long>(t.total_substeps), t.substeps, double(t.substep_dt), t.step_ms);
    destroy(h);
    return 0;
}
