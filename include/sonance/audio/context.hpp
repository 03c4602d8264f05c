/// @file context.hpp
/// @brief Device/context ownership for sonance_audio

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "backend.hpp"
#include "config.hpp"

#include <sonance/core/error.hpp>

namespace sonance_audio {

// =============================================================================
// Context Reference
// =============================================================================

/// Non-owning reference to a rendering context, held by assets, sources and
/// listener views. Keeps the backend alive; the context itself may already be
/// gone, in which case every call through it fails with InvalidOperation.
class ContextRef {
public:
    ContextRef() = default;
    ContextRef(BackendPtr backend, ContextId id)
        : m_backend(std::move(backend)), m_id(id) {}

    /// Make the referenced context current if another one is
    [[nodiscard]] NativeResult<void> activate() const;

    [[nodiscard]] IAudioBackend& backend() const { return *m_backend; }
    [[nodiscard]] const BackendPtr& backend_ptr() const { return m_backend; }
    [[nodiscard]] ContextId id() const { return m_id; }

    explicit operator bool() const { return m_backend != nullptr && static_cast<bool>(m_id); }

private:
    BackendPtr m_backend;
    ContextId m_id;
};

// =============================================================================
// Context
// =============================================================================

/// Owns one output device and one rendering context on it.
///
/// Opening a context makes it current. Operations issued through a context
/// (and through the assets, sources and listener created from it) re-activate
/// it first, so several contexts can be used side by side. Dropping the
/// context destroys the rendering context, then closes the device.
class Context {
public:
    /// Open a context on the backend named in the configuration
    static sonance_core::Result<Context> open(const AudioConfig& config = {});

    /// Open a context on an existing backend
    static sonance_core::Result<Context> open(BackendPtr backend, const AudioConfig& config = {});

    Context(Context&&) noexcept = default;
    /// Releases the held context before the held device
    Context& operator=(Context&& other) noexcept;
    ~Context() = default;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // =========================================================================
    // Current Context
    // =========================================================================

    /// Make this context current
    sonance_core::Result<void> make_current();

    /// Check if this context is the current one
    [[nodiscard]] bool is_current() const;

    /// Reference for objects created from this context
    [[nodiscard]] ContextRef ref() const { return ContextRef(m_backend, m_context.id()); }

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] const AudioConfig& config() const { return m_config; }
    [[nodiscard]] IAudioBackend& backend() const { return *m_backend; }
    [[nodiscard]] const BackendPtr& backend_ptr() const { return m_backend; }
    [[nodiscard]] ContextId id() const { return m_context.id(); }
    [[nodiscard]] DeviceId device() const { return m_device.id(); }

    /// Backend name, version and the opened device
    [[nodiscard]] AudioBackendInfo backend_info() const;

    // =========================================================================
    // Listener
    // =========================================================================

    /// View of this context's listener
    [[nodiscard]] Listener listener() const;

    /// Best-effort: failures are logged and counted, never returned
    void set_listener_position(const Vec3& position);
    void set_listener_orientation(const Vec3& at, const Vec3& up);
    void set_listener_transform(const Vec3& position, const Vec3& at, const Vec3& up);

    /// Orientation derived from a camera rotation (-Z forward, +Y up)
    void set_listener_transform(const Vec3& position, const Quat& rotation);

    [[nodiscard]] sonance_core::Result<Vec3> listener_position() const;
    [[nodiscard]] sonance_core::Result<Orientation> listener_orientation() const;

private:
    /// Closes the device on destruction
    class DeviceGuard {
    public:
        DeviceGuard() = default;
        DeviceGuard(BackendPtr backend, DeviceId id) : m_backend(std::move(backend)), m_id(id) {}
        DeviceGuard(DeviceGuard&& other) noexcept;
        DeviceGuard& operator=(DeviceGuard&& other) noexcept;
        ~DeviceGuard();

        [[nodiscard]] DeviceId id() const { return m_id; }

    private:
        void release();

        BackendPtr m_backend;
        DeviceId m_id;
    };

    /// Destroys the rendering context on destruction
    class ContextGuard {
    public:
        ContextGuard() = default;
        ContextGuard(BackendPtr backend, ContextId id) : m_backend(std::move(backend)), m_id(id) {}
        ContextGuard(ContextGuard&& other) noexcept;
        ContextGuard& operator=(ContextGuard&& other) noexcept;
        ~ContextGuard();

        [[nodiscard]] ContextId id() const { return m_id; }

    private:
        void release();

        BackendPtr m_backend;
        ContextId m_id;
    };

    Context(BackendPtr backend, DeviceGuard device, ContextGuard context, AudioConfig config);

    // Declaration order is teardown order in reverse: context, then device
    BackendPtr m_backend;
    DeviceGuard m_device;
    ContextGuard m_context;
    AudioConfig m_config;
};

} // namespace sonance_audio
