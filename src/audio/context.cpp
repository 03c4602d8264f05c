/// @file context.cpp
/// @brief Device/context ownership implementation for sonance_audio

#include <sonance/audio/context.hpp>
#include <sonance/audio/listener.hpp>
#include <sonance/core/log.hpp>

namespace sonance_audio {

using sonance_core::AudioError;
using sonance_core::Error;
using sonance_core::Result;

// =============================================================================
// ContextRef
// =============================================================================

NativeResult<void> ContextRef::activate() const {
    if (!m_backend || !m_id) {
        return sonance_core::NativeError::invalid_operation("no context");
    }
    if (m_backend->current_context() == m_id) {
        return {};
    }
    return m_backend->make_context_current(m_id);
}

// =============================================================================
// Guards
// =============================================================================

Context::DeviceGuard::DeviceGuard(DeviceGuard&& other) noexcept
    : m_backend(std::move(other.m_backend)), m_id(other.m_id) {
    other.m_id = DeviceId{};
}

Context::DeviceGuard& Context::DeviceGuard::operator=(DeviceGuard&& other) noexcept {
    if (this != &other) {
        release();
        m_backend = std::move(other.m_backend);
        m_id = other.m_id;
        other.m_id = DeviceId{};
    }
    return *this;
}

Context::DeviceGuard::~DeviceGuard() {
    release();
}

void Context::DeviceGuard::release() {
    if (m_backend && m_id) {
        m_backend->close_device(m_id);
        sonance_core::audio_logger()->debug("Closed audio device {}", m_id.value);
    }
    m_id = DeviceId{};
}

Context::ContextGuard::ContextGuard(ContextGuard&& other) noexcept
    : m_backend(std::move(other.m_backend)), m_id(other.m_id) {
    other.m_id = ContextId{};
}

Context::ContextGuard& Context::ContextGuard::operator=(ContextGuard&& other) noexcept {
    if (this != &other) {
        release();
        m_backend = std::move(other.m_backend);
        m_id = other.m_id;
        other.m_id = ContextId{};
    }
    return *this;
}

Context::ContextGuard::~ContextGuard() {
    release();
}

void Context::ContextGuard::release() {
    if (m_backend && m_id) {
        m_backend->destroy_context(m_id);
        sonance_core::audio_logger()->debug("Destroyed audio context {}", m_id.value);
    }
    m_id = ContextId{};
}

// =============================================================================
// Context
// =============================================================================

Context::Context(BackendPtr backend, DeviceGuard device, ContextGuard context, AudioConfig config)
    : m_backend(std::move(backend))
    , m_device(std::move(device))
    , m_context(std::move(context))
    , m_config(std::move(config)) {
}

Context& Context::operator=(Context&& other) noexcept {
    if (this != &other) {
        // Each guard releases what it held before taking over
        m_context = std::move(other.m_context);
        m_device = std::move(other.m_device);
        m_backend = std::move(other.m_backend);
        m_config = std::move(other.m_config);
    }
    return *this;
}

Result<Context> Context::open(const AudioConfig& config) {
    auto backend = create_backend(config.device.backend);
    if (!backend) {
        return backend.error();
    }
    return open(std::move(backend).value(), config);
}

Result<Context> Context::open(BackendPtr backend, const AudioConfig& config) {
    if (!backend) {
        return Error(AudioError::device_unavailable());
    }

    auto device = backend->open_device(config.device);
    if (!device) {
        return Error(AudioError::device_unavailable(device.error()));
    }
    DeviceGuard device_guard(backend, device.value());

    auto context = backend->create_context(device.value());
    if (!context) {
        return Error(AudioError::context_creation_failed(context.error()));
    }
    ContextGuard context_guard(backend, context.value());

    auto current = backend->make_context_current(context.value());
    if (!current) {
        return Error(AudioError::context_creation_failed(current.error()));
    }

    const AudioBackendInfo info = backend->info();
    sonance_core::audio_logger()->info("Opened audio device '{}' on {} {}",
        info.device_name, info.name, info.version);

    return Context(std::move(backend), std::move(device_guard), std::move(context_guard), config);
}

Result<void> Context::make_current() {
    auto result = ref().activate();
    if (!result) {
        return Error(sonance_core::ErrorCode::InvalidState,
                     "Failed to make audio context current: " + result.error().message);
    }
    return {};
}

bool Context::is_current() const {
    return m_backend && m_context.id() && m_backend->current_context() == m_context.id();
}

AudioBackendInfo Context::backend_info() const {
    return m_backend->info();
}

// =============================================================================
// Listener
// =============================================================================

Listener Context::listener() const {
    return Listener(ref());
}

void Context::set_listener_position(const Vec3& position) {
    listener().set_position(position);
}

void Context::set_listener_orientation(const Vec3& at, const Vec3& up) {
    listener().set_orientation(at, up);
}

void Context::set_listener_transform(const Vec3& position, const Vec3& at, const Vec3& up) {
    listener().set_transform(position, at, up);
}

void Context::set_listener_transform(const Vec3& position, const Quat& rotation) {
    listener().set_transform(position, rotation);
}

Result<Vec3> Context::listener_position() const {
    return listener().position();
}

Result<Orientation> Context::listener_orientation() const {
    return listener().orientation();
}

} // namespace sonance_audio
