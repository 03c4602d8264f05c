/// @file backend.hpp
/// @brief Native audio backend abstraction for sonance_audio
///
/// The backend is the imperative, state-mutating native audio API: devices,
/// rendering contexts, buffers, emitters and the listener. Every call reports
/// failure through a NativeError; the higher layers decide which failures are
/// surfaced and which are swallowed.

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <sonance/core/error.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sonance_audio {

/// Result of a native call
template<typename T>
using NativeResult = sonance_core::Result<T, sonance_core::NativeError>;

// =============================================================================
// Audio Backend Interface
// =============================================================================

/// Native audio backend interface
class IAudioBackend {
public:
    virtual ~IAudioBackend() = default;

    /// Get backend information
    [[nodiscard]] virtual AudioBackendInfo info() const = 0;

    // =========================================================================
    // Device and Context
    // =========================================================================

    /// Open an output device (empty name selects the default device)
    [[nodiscard]] virtual NativeResult<DeviceId> open_device(const DeviceConfig& config) = 0;

    /// Close a device. Contexts still alive on it are destroyed first.
    virtual void close_device(DeviceId device) = 0;

    /// Create a rendering context on an open device
    [[nodiscard]] virtual NativeResult<ContextId> create_context(DeviceId device) = 0;

    /// Destroy a context together with the emitters created in it
    virtual void destroy_context(ContextId context) = 0;

    /// Make a context current for buffer, source and listener calls
    [[nodiscard]] virtual NativeResult<void> make_context_current(ContextId context) = 0;

    /// Get the current context (null if none)
    [[nodiscard]] virtual ContextId current_context() const = 0;

    // =========================================================================
    // Buffer Management
    // =========================================================================

    /// Create an empty buffer on the device of the current context
    [[nodiscard]] virtual NativeResult<BufferId> create_buffer() = 0;

    /// Upload PCM data into a buffer
    [[nodiscard]] virtual NativeResult<void> buffer_data(BufferId buffer, const BufferData& data) = 0;

    /// Destroy a buffer (no-op for unknown handles)
    virtual void destroy_buffer(BufferId buffer) = 0;

    // =========================================================================
    // Source Management
    // =========================================================================

    /// Create an emitter in the current context
    [[nodiscard]] virtual NativeResult<SourceId> create_source() = 0;

    /// Destroy an emitter (no-op for unknown handles)
    virtual void destroy_source(SourceId source) = 0;

    /// Attach a buffer to an emitter
    [[nodiscard]] virtual NativeResult<void> set_source_buffer(SourceId source, BufferId buffer) = 0;

    /// Get the buffer attached to an emitter
    [[nodiscard]] virtual NativeResult<BufferId> source_buffer(SourceId source) const = 0;

    [[nodiscard]] virtual NativeResult<void> set_source_param(SourceId source, SourceParam param, float value) = 0;
    [[nodiscard]] virtual NativeResult<float> source_param(SourceId source, SourceParam param) const = 0;

    [[nodiscard]] virtual NativeResult<void> set_source_flag(SourceId source, SourceFlag flag, bool value) = 0;
    [[nodiscard]] virtual NativeResult<bool> source_flag(SourceId source, SourceFlag flag) const = 0;

    [[nodiscard]] virtual NativeResult<void> set_source_position(SourceId source, const Vec3& position) = 0;
    [[nodiscard]] virtual NativeResult<Vec3> source_position(SourceId source) const = 0;

    /// Start playback (restarts a playing emitter from the beginning)
    [[nodiscard]] virtual NativeResult<void> play_source(SourceId source) = 0;

    /// Stop playback and rewind
    [[nodiscard]] virtual NativeResult<void> stop_source(SourceId source) = 0;

    /// Get playback state
    [[nodiscard]] virtual NativeResult<SourceState> source_state(SourceId source) const = 0;

    // =========================================================================
    // Listener (of the current context)
    // =========================================================================

    [[nodiscard]] virtual NativeResult<void> set_listener_position(const Vec3& position) = 0;
    [[nodiscard]] virtual NativeResult<Vec3> listener_position() const = 0;

    [[nodiscard]] virtual NativeResult<void> set_listener_orientation(const Orientation& orientation) = 0;
    [[nodiscard]] virtual NativeResult<Orientation> listener_orientation() const = 0;
};

/// Create a backend by name ("miniaudio" or "null")
[[nodiscard]] sonance_core::Result<BackendPtr> create_backend(const std::string& name);

// =============================================================================
// Validation
// =============================================================================

/// Check a source parameter value the way the device does
[[nodiscard]] NativeResult<void> validate_source_param(SourceParam param, float value);

/// Check a position (all components must be finite)
[[nodiscard]] NativeResult<void> validate_position(const Vec3& position);

/// Initial value of a source parameter on a fresh emitter
[[nodiscard]] float default_source_param(SourceParam param);

/// Distance attenuation curve of a spatialized emitter
enum class DistanceModel : std::uint8_t {
    None,     ///< Panned, never attenuated by distance
    Inverse,  ///< reference / (reference + rolloff * (d - reference))
};

/// Curve for a reference distance. A reference distance of zero or less
/// turns distance attenuation off; the emitter is still panned.
[[nodiscard]] DistanceModel distance_model_for(float reference_distance);

// =============================================================================
// Null Audio Backend
// =============================================================================

/// In-memory backend (silent). Keeps every piece of native state so it can
/// be read back, and can be told to fail specific calls.
class NullAudioBackend : public IAudioBackend {
public:
    /// Native failures to inject
    struct Faults {
        std::optional<sonance_core::NativeError> create_context;
        std::optional<sonance_core::NativeError> make_current;
        std::optional<sonance_core::NativeError> create_buffer;
        std::optional<sonance_core::NativeError> buffer_data;
        std::uint32_t buffer_data_allowed = 0;  ///< Uploads that succeed before buffer_data applies
        std::optional<sonance_core::NativeError> create_source;
        std::optional<sonance_core::NativeError> set_source_buffer;
        std::optional<sonance_core::NativeError> source_setters;
        std::optional<sonance_core::NativeError> source_queries;
        std::optional<sonance_core::NativeError> listener;
        std::uint32_t max_sources = 256;
    };

    /// Stored buffer contents
    struct BufferRecord {
        DeviceId device;
        bool has_data = false;
        ChannelLayout layout = ChannelLayout::Mono;
        std::uint32_t sample_rate = 0;
        std::vector<std::int16_t> samples;

        [[nodiscard]] std::size_t frame_count() const {
            return samples.size() / channel_count(layout);
        }
    };

    /// Create a backend exposing the given output devices
    explicit NullAudioBackend(std::vector<std::string> devices = {"Null Output"});
    ~NullAudioBackend() override;

    [[nodiscard]] AudioBackendInfo info() const override;

    [[nodiscard]] NativeResult<DeviceId> open_device(const DeviceConfig& config) override;
    void close_device(DeviceId device) override;
    [[nodiscard]] NativeResult<ContextId> create_context(DeviceId device) override;
    void destroy_context(ContextId context) override;
    [[nodiscard]] NativeResult<void> make_context_current(ContextId context) override;
    [[nodiscard]] ContextId current_context() const override { return m_current; }

    [[nodiscard]] NativeResult<BufferId> create_buffer() override;
    [[nodiscard]] NativeResult<void> buffer_data(BufferId buffer, const BufferData& data) override;
    void destroy_buffer(BufferId buffer) override;

    [[nodiscard]] NativeResult<SourceId> create_source() override;
    void destroy_source(SourceId source) override;
    [[nodiscard]] NativeResult<void> set_source_buffer(SourceId source, BufferId buffer) override;
    [[nodiscard]] NativeResult<BufferId> source_buffer(SourceId source) const override;
    [[nodiscard]] NativeResult<void> set_source_param(SourceId source, SourceParam param, float value) override;
    [[nodiscard]] NativeResult<float> source_param(SourceId source, SourceParam param) const override;
    [[nodiscard]] NativeResult<void> set_source_flag(SourceId source, SourceFlag flag, bool value) override;
    [[nodiscard]] NativeResult<bool> source_flag(SourceId source, SourceFlag flag) const override;
    [[nodiscard]] NativeResult<void> set_source_position(SourceId source, const Vec3& position) override;
    [[nodiscard]] NativeResult<Vec3> source_position(SourceId source) const override;
    [[nodiscard]] NativeResult<void> play_source(SourceId source) override;
    [[nodiscard]] NativeResult<void> stop_source(SourceId source) override;
    [[nodiscard]] NativeResult<SourceState> source_state(SourceId source) const override;

    [[nodiscard]] NativeResult<void> set_listener_position(const Vec3& position) override;
    [[nodiscard]] NativeResult<Vec3> listener_position() const override;
    [[nodiscard]] NativeResult<void> set_listener_orientation(const Orientation& orientation) override;
    [[nodiscard]] NativeResult<Orientation> listener_orientation() const override;

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Failure injection
    [[nodiscard]] Faults& faults() { return m_faults; }

    /// Get stored buffer (null if unknown)
    [[nodiscard]] const BufferRecord* find_buffer(BufferId buffer) const;

    [[nodiscard]] std::size_t buffer_count() const { return m_buffers.size(); }
    [[nodiscard]] std::size_t source_count() const { return m_sources.size(); }
    [[nodiscard]] std::size_t context_count() const { return m_contexts.size(); }
    [[nodiscard]] std::size_t device_count() const { return m_devices.size(); }

    /// Number of buffer, source and listener calls made so far
    [[nodiscard]] std::uint64_t native_call_count() const { return m_native_calls; }

    /// Ordered record of context and device releases
    [[nodiscard]] const std::vector<std::string>& teardown_log() const { return m_teardown_log; }

    /// Contexts that close_device had to destroy because they were still alive
    [[nodiscard]] std::size_t implicit_context_teardowns() const { return m_implicit_context_teardowns; }

private:
    struct DeviceRecord {
        std::string name;
    };

    struct ListenerRecord {
        Vec3 position = sonance_math::vec3::ZERO;
        Orientation orientation;
    };

    struct ContextRecord {
        DeviceId device;
        ListenerRecord listener;
    };

    struct SourceRecord {
        ContextId context;
        BufferId buffer;
        std::array<float, 6> params{};
        bool looping = false;
        bool relative = false;
        Vec3 position = sonance_math::vec3::ZERO;
        SourceState state = SourceState::Initial;
    };

    /// Count a native call and resolve an emitter of the current context
    [[nodiscard]] NativeResult<SourceRecord*> lookup_source(SourceId source) const;
    [[nodiscard]] NativeResult<ContextRecord*> lookup_current() const;

    std::vector<std::string> m_available_devices;
    Faults m_faults;

    std::unordered_map<DeviceId, DeviceRecord> m_devices;
    mutable std::unordered_map<ContextId, ContextRecord> m_contexts;
    std::unordered_map<BufferId, BufferRecord> m_buffers;
    mutable std::unordered_map<SourceId, SourceRecord> m_sources;

    ContextId m_current;
    std::uint32_t m_next_device_id = 1;
    std::uint32_t m_next_context_id = 1;
    std::uint32_t m_next_buffer_id = 1;
    std::uint32_t m_next_source_id = 1;
    std::uint32_t m_buffer_uploads = 0;

    mutable std::uint64_t m_native_calls = 0;
    std::vector<std::string> m_teardown_log;
    std::size_t m_implicit_context_teardowns = 0;
};

// =============================================================================
// Miniaudio Backend
// =============================================================================

/// Backend on top of the miniaudio engine: one ma_context/ma_device pair per
/// device, one ma_engine per rendering context, one ma_sound per emitter.
class MiniaudioBackend : public IAudioBackend {
public:
    MiniaudioBackend();
    ~MiniaudioBackend() override;

    MiniaudioBackend(const MiniaudioBackend&) = delete;
    MiniaudioBackend& operator=(const MiniaudioBackend&) = delete;

    [[nodiscard]] AudioBackendInfo info() const override;

    [[nodiscard]] NativeResult<DeviceId> open_device(const DeviceConfig& config) override;
    void close_device(DeviceId device) override;
    [[nodiscard]] NativeResult<ContextId> create_context(DeviceId device) override;
    void destroy_context(ContextId context) override;
    [[nodiscard]] NativeResult<void> make_context_current(ContextId context) override;
    [[nodiscard]] ContextId current_context() const override;

    [[nodiscard]] NativeResult<BufferId> create_buffer() override;
    [[nodiscard]] NativeResult<void> buffer_data(BufferId buffer, const BufferData& data) override;
    void destroy_buffer(BufferId buffer) override;

    [[nodiscard]] NativeResult<SourceId> create_source() override;
    void destroy_source(SourceId source) override;
    [[nodiscard]] NativeResult<void> set_source_buffer(SourceId source, BufferId buffer) override;
    [[nodiscard]] NativeResult<BufferId> source_buffer(SourceId source) const override;
    [[nodiscard]] NativeResult<void> set_source_param(SourceId source, SourceParam param, float value) override;
    [[nodiscard]] NativeResult<float> source_param(SourceId source, SourceParam param) const override;
    [[nodiscard]] NativeResult<void> set_source_flag(SourceId source, SourceFlag flag, bool value) override;
    [[nodiscard]] NativeResult<bool> source_flag(SourceId source, SourceFlag flag) const override;
    [[nodiscard]] NativeResult<void> set_source_position(SourceId source, const Vec3& position) override;
    [[nodiscard]] NativeResult<Vec3> source_position(SourceId source) const override;
    [[nodiscard]] NativeResult<void> play_source(SourceId source) override;
    [[nodiscard]] NativeResult<void> stop_source(SourceId source) override;
    [[nodiscard]] NativeResult<SourceState> source_state(SourceId source) const override;

    [[nodiscard]] NativeResult<void> set_listener_position(const Vec3& position) override;
    [[nodiscard]] NativeResult<Vec3> listener_position() const override;
    [[nodiscard]] NativeResult<void> set_listener_orientation(const Orientation& orientation) override;
    [[nodiscard]] NativeResult<Orientation> listener_orientation() const override;

    struct Impl;

private:
    std::unique_ptr<Impl> m_impl;
};

} // namespace sonance_audio
