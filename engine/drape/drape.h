#ifndef DRAPE_H
#define DRAPE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace Drape {

    using u32   = std::uint32_t;
    using u64   = std::uint64_t;
    using f32   = float;
    using usize = std::size_t;

    struct float3 {
        f32 x{0.0f};
        f32 y{0.0f};
        f32 z{0.0f};
    };

    // Axis aligned box. Only the position codec depends on it.
    struct Bounds {
        float3 min{};
        float3 max{};

        [[nodiscard]] float3 size() const noexcept {
            return float3{max.x - min.x, max.y - min.y, max.z - min.z};
        }
    };

    enum class Status {
        Ok,
        InvalidArgs,
        ValidationFailed,
        NoBackend,
        Unsupported,
        WrongMode,
        NotReady
    };

    template <class T>
    struct [[nodiscard]] Result {
        Status status;
        T value;
    };

    [[nodiscard]] const char* to_string(Status s) noexcept;

    struct ClothParticle {
        float3 rest_position{};
        f32 inverse_mass{1.0f}; // 0 pins the particle
    };

    struct DistanceConstraint {
        u32 index0{0};
        u32 index1{0};
        f32 rest_length{0.0f};
        f32 compliance{0.0f}; // 0 is rigid, larger is softer
    };

    struct AeroParams {
        bool enabled{false};
        float3 wind_velocity{};
        f32 air_density{1.225f};
        f32 drag_coefficient{1.0f};
        f32 lift_coefficient{0.0f};
    };

    enum class ChangeKind : u32 {
        Topology       = 1u << 0,
        Gravity        = 1u << 1,
        Aerodynamics   = 1u << 2,
        ResetParticles = 1u << 3,
    };

    // Set of pending change kinds reported through Simulator::notify_changed.
    class ChangeSet {
    public:
        constexpr ChangeSet() noexcept = default;
        constexpr ChangeSet(ChangeKind kind) noexcept : bits_(static_cast<u32>(kind)) {}

        [[nodiscard]] static constexpr ChangeSet all() noexcept {
            return ChangeSet{ChangeKind::Topology} | ChangeKind::Gravity | ChangeKind::Aerodynamics | ChangeKind::ResetParticles;
        }

        [[nodiscard]] constexpr bool contains(ChangeKind kind) const noexcept {
            return (bits_ & static_cast<u32>(kind)) != 0;
        }
        [[nodiscard]] constexpr bool empty() const noexcept {
            return bits_ == 0;
        }
        constexpr void clear() noexcept {
            bits_ = 0;
        }

        constexpr ChangeSet& operator|=(ChangeSet other) noexcept {
            bits_ |= other.bits_;
            return *this;
        }
        friend constexpr ChangeSet operator|(ChangeSet a, ChangeSet b) noexcept {
            a |= b;
            return a;
        }
        friend constexpr bool operator==(ChangeSet, ChangeSet) noexcept = default;

    private:
        u32 bits_{0};
    };

    // Topology provider. Spans returned here must stay valid until the next
    // notify_changed for this cloth or until it is deregistered.
    class ICloth {
    public:
        virtual ~ICloth() = default;

        [[nodiscard]] virtual std::string_view name() const = 0;
        [[nodiscard]] virtual std::span<const ClothParticle> particles() const = 0;
        [[nodiscard]] virtual std::span<const DistanceConstraint> constraints() const = 0;
        // Optional pre-grouped batches: offsets into constraints(), size = batch count + 1.
        [[nodiscard]] virtual std::span<const u32> batch_offsets() const { return {}; }
        // Optional triangle list used for normals and aerodynamics.
        [[nodiscard]] virtual std::span<const u32> indices() const { return {}; }
        [[nodiscard]] virtual Bounds bounds() const = 0;
        [[nodiscard]] virtual float3 gravity() const { return float3{0.0f, -9.81f, 0.0f}; }
        [[nodiscard]] virtual AeroParams aero() const { return {}; }
        [[nodiscard]] virtual f32 thickness() const { return 0.0f; }
    };

    struct ExecPolicy {
        enum class Backend { Native, Simd, Tbb, Atomic };
        Backend backend{Backend::Native};
        int threads{0};
        bool deterministic{true}; // Atomic backend: false lets constraints commit concurrently
    };

    enum class UpdateMode { Automatic, Manual };

    struct SimulatorDesc {
        ExecPolicy exec{};
        UpdateMode update_mode{UpdateMode::Automatic};
        f32 substeps_per_second{600.0f};
        int max_substeps_per_frame{100};
        usize max_particles_per_cloth{65536};
        usize max_constraint_batches{32};
        bool enable_on_create{true};
    };

    struct ClothView {
        f32* pos_x{};
        f32* pos_y{};
        f32* pos_z{};
        const f32* prev_x{};
        const f32* prev_y{};
        const f32* prev_z{};
        f32* vel_x{};
        f32* vel_y{};
        f32* vel_z{};
        const f32* nrm_x{};
        const f32* nrm_y{};
        const f32* nrm_z{};
        usize count{};
        usize constraint_count{};
        usize batch_count{};
        u64 generation{};
    };

    struct TelemetryFrame {
        int substeps{0};
        f32 substep_dt{0.0f};
        u64 total_substeps{0};
        u64 rebuilds{0};
        double step_ms{0.0};
    };

    class Simulator {
    public:
        explicit Simulator(const SimulatorDesc& desc);
        ~Simulator();
        Simulator(const Simulator&)            = delete;
        Simulator& operator=(const Simulator&) = delete;

        Status enable();
        void disable(bool dispose_resources);
        [[nodiscard]] bool enabled() const noexcept;
        [[nodiscard]] bool is_supported(std::string* reasons = nullptr) const;

        Status register_cloth(ICloth* cloth);
        Status deregister_cloth(ICloth* cloth);
        Status notify_changed(const ICloth* cloth, ChangeSet changes);
        Status reset_particles(const ICloth* cloth);
        [[nodiscard]] usize cloth_count() const noexcept;

        void set_update_mode(UpdateMode mode) noexcept;
        [[nodiscard]] UpdateMode update_mode() const noexcept;
        void set_substeps_per_second(f32 rate) noexcept;
        [[nodiscard]] f32 substeps_per_second() const noexcept;
        void set_max_substeps_per_frame(int count) noexcept;
        [[nodiscard]] int max_substeps_per_frame() const noexcept;

        // Manual mode only.
        Status simulate(f32 dt);
        // Per-frame tick, automatic mode only. The simulator keeps no clock of its
        // own; the host passes the delta of its frame loop.
        Status update(f32 frame_dt);

        [[nodiscard]] ClothView view(const ICloth* cloth) noexcept;
        [[nodiscard]] TelemetryFrame telemetry() const noexcept;
        [[nodiscard]] double time_remainder() const noexcept;
        [[nodiscard]] std::string_view last_error() const noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

    // Fails with the enable() status and a null handle when the simulator was asked
    // to start enabled and could not be.
    using Handle = Simulator*;
    [[nodiscard]] Result<Handle> create(const SimulatorDesc& desc);
    void destroy(Handle h) noexcept;

}

#endif
