/// @file listener.cpp
/// @brief Audio listener implementation for sonance_audio

#include <sonance/audio/listener.hpp>

namespace sonance_audio {

using sonance_core::AudioError;
using sonance_core::Error;
using sonance_core::Result;

namespace {

Result<void> as_listener_update(NativeResult<void> result) {
    if (!result) {
        return Error(AudioError::listener_update_failed(result.error()));
    }
    return {};
}

template<typename T>
Result<T> as_listener_query(NativeResult<T> result, const char* what) {
    if (!result) {
        return Error(AudioError::query_failed(what, result.error()));
    }
    return std::move(result).value();
}

} // anonymous namespace

// =============================================================================
// Listener Implementation
// =============================================================================

void Listener::set_position(const Vec3& position) {
    auto result = m_context.activate();
    if (result) {
        result = m_context.backend().set_listener_position(position);
    }
    sonance_core::discard_nonfatal(as_listener_update(std::move(result)), "listener position update");
}

void Listener::set_orientation(const Vec3& at, const Vec3& up) {
    auto result = m_context.activate();
    if (result) {
        result = m_context.backend().set_listener_orientation(Orientation{at, up});
    }
    sonance_core::discard_nonfatal(as_listener_update(std::move(result)), "listener orientation update");
}

void Listener::set_transform(const Vec3& position, const Vec3& at, const Vec3& up) {
    set_position(position);
    set_orientation(at, up);
}

void Listener::set_transform(const Vec3& position, const Quat& rotation) {
    set_transform(position, sonance_math::forward_of(rotation), sonance_math::up_of(rotation));
}

Result<Vec3> Listener::position() const {
    auto active = m_context.activate();
    if (!active) {
        return Error(AudioError::query_failed("listener position", active.error()));
    }
    return as_listener_query(m_context.backend().listener_position(), "listener position");
}

Result<Orientation> Listener::orientation() const {
    auto active = m_context.activate();
    if (!active) {
        return Error(AudioError::query_failed("listener orientation", active.error()));
    }
    return as_listener_query(m_context.backend().listener_orientation(), "listener orientation");
}

} // namespace sonance_audio
