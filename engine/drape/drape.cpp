#include "drape.h"
#include "drape/log.h"
#include "drape/solver.h"

#include <exception>
#include <new>

namespace Drape {

    const char* to_string(Status s) noexcept {
        switch (s) {
        case Status::Ok: return "ok";
        case Status::InvalidArgs: return "invalid arguments";
        case Status::ValidationFailed: return "validation failed";
        case Status::NoBackend: return "no backend";
        case Status::Unsupported: return "unsupported";
        case Status::WrongMode: return "wrong update mode";
        case Status::NotReady: return "not ready";
        }
        return "unknown";
    }

    Result<Handle> create(const SimulatorDesc& desc) {
        SimulatorDesc deferred    = desc;
        deferred.enable_on_create = false;
        Handle h                  = new (std::nothrow) Simulator(deferred);
        if (!h) {
            DRAPE_LOG_ERROR("create: out of memory");
            return {Status::NoBackend, nullptr};
        }
        if (desc.enable_on_create) {
            const Status s = h->enable();
            if (s != Status::Ok) {
                delete h;
                return {s, nullptr};
            }
        }
        return {Status::Ok, h};
    }

    void destroy(Handle h) noexcept {
        delete h;
    }

    namespace detail {

        const char* to_string(ExecPolicy::Backend backend) noexcept {
            using Backend = ExecPolicy::Backend;
            switch (backend) {
            case Backend::Native: return "native";
            case Backend::Simd: return "simd";
            case Backend::Tbb: return "tbb";
            case Backend::Atomic: return "atomic";
            }
            return "unknown";
        }

        std::string backend_unsupported_reason(ExecPolicy::Backend backend) {
            if (backend == ExecPolicy::Backend::Simd) {
#if defined(DRAPE_HAVE_SIMD)
                return {};
#else
                return "simd backend requested but this build has no Highway support";
#endif
            }
            return {};
        }

        Status make_solver(const ExecPolicy& exec, std::unique_ptr<ISolver>& out, std::string& reason) {
            using Backend = ExecPolicy::Backend;
            try {
                switch (exec.backend) {
                case Backend::Native: out = make_native(); break;
                case Backend::Tbb: out = make_tbb(exec.threads); break;
                case Backend::Atomic: out = make_atomic(exec.threads, exec.deterministic); break;
                case Backend::Simd:
#if defined(DRAPE_HAVE_SIMD)
                    out = make_simd();
                    break;
#else
                    reason = backend_unsupported_reason(exec.backend);
                    return Status::Unsupported;
#endif
                }
            } catch (const std::exception& e) {
                out.reset();
                reason = std::string("failed to create ") + to_string(exec.backend) + " backend: " + e.what();
                return Status::NoBackend;
            }
            if (!out) {
                reason = std::string("failed to create ") + to_string(exec.backend) + " backend";
                return Status::NoBackend;
            }
            return Status::Ok;
        }

    }

}
