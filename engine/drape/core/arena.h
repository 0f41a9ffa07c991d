#ifndef DRAPE_CORE_ARENA_H
#define DRAPE_CORE_ARENA_H

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <memory_resource>
#include <new>
#include <vector>

namespace Drape::core {

    // Hands out blocks aligned to at least `alignment` bytes so SoA streams can be
    // read with std::assume_aligned and full SIMD loads.
    class aligned_resource final : public std::pmr::memory_resource {
    public:
        explicit aligned_resource(std::size_t alignment = 64) : align_(round_up_pow2(alignment)) {}

    private:
        std::size_t align_{};

        static std::size_t round_up_pow2(std::size_t a) {
            a = std::max(a, alignof(void*));
            std::size_t p = 1;
            while (p < a) p <<= 1U;
            return p;
        }

        void* do_allocate(std::size_t bytes, std::size_t alignment) override {
            const std::size_t req = round_up_pow2(std::max(align_, alignment));
            // aligned_alloc requires a size that is a multiple of the alignment
            const std::size_t sz = std::max(req, (bytes + req - 1) & ~(req - 1));
#if defined(_MSC_VER)
            void* p = _aligned_malloc(sz, req);
#else
            void* p = std::aligned_alloc(req, sz);
#endif
            if (!p) throw std::bad_alloc{};
            return p;
        }

        void do_deallocate(void* p, std::size_t, std::size_t) override {
#if defined(_MSC_VER)
            _aligned_free(p);
#else
            std::free(p);
#endif
        }

        [[nodiscard]] bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
            return this == &other;
        }
    };

    template <class T>
    using pvec = std::pmr::vector<T>;

    [[nodiscard]] inline std::size_t pad8(std::size_t n) noexcept { return (n + 7u) & ~std::size_t(7); }

}

#endif
