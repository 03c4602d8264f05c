/// @file listener.hpp
/// @brief Audio listener (the "ear" in 3D audio) for sonance_audio

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "context.hpp"

#include <sonance/core/error.hpp>

namespace sonance_audio {

/// View of the listener of one context.
///
/// Setters are steady-state updates: a native failure is logged as a
/// ListenerUpdateFailed warning, counted in the error statistics, and
/// otherwise ignored. Vectors are passed through without normalization.
class Listener {
public:
    explicit Listener(ContextRef context) : m_context(std::move(context)) {}

    // =========================================================================
    // Position and Orientation
    // =========================================================================

    void set_position(const Vec3& position);

    /// Set orientation ("at" and "up" vectors)
    void set_orientation(const Vec3& at, const Vec3& up);

    void set_transform(const Vec3& position, const Vec3& at, const Vec3& up);

    /// Set position and derive orientation from a rotation
    void set_transform(const Vec3& position, const Quat& rotation);

    [[nodiscard]] sonance_core::Result<Vec3> position() const;
    [[nodiscard]] sonance_core::Result<Orientation> orientation() const;

private:
    ContextRef m_context;
};

} // namespace sonance_audio
