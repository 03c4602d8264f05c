/// @file sound_source.hpp
/// @brief Playable emitters bound to a sound asset

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "context.hpp"

#include <sonance/core/error.hpp>

#include <variant>

namespace sonance_audio {

// =============================================================================
// Playback Interface
// =============================================================================

/// Playback controls shared by every source kind.
///
/// Looping, volume and transport changes are steady-state updates: native
/// failures are logged and counted, never returned.
class IPlayback {
public:
    virtual ~IPlayback() = default;

    [[nodiscard]] virtual SourceKind kind() const = 0;
    [[nodiscard]] virtual SourceId id() const = 0;

    /// Buffer the emitter plays
    [[nodiscard]] virtual BufferId buffer() const = 0;

    /// Start playback (a playing source restarts from the beginning)
    virtual void play() = 0;

    /// Stop playback and rewind
    virtual void stop() = 0;

    [[nodiscard]] virtual sonance_core::Result<SourceState> state() const = 0;

    virtual void set_looping(bool looping) = 0;

    /// Native loop flag (last accepted value if the device cannot be queried)
    [[nodiscard]] virtual bool is_looping() const = 0;

    /// Set gain and max gain together
    virtual void set_volume(float volume) = 0;

    [[nodiscard]] virtual sonance_core::Result<float> volume() const = 0;
};

// =============================================================================
// Emitter
// =============================================================================

/// Owns one native emitter and implements the shared playback controls
class Emitter : public IPlayback {
public:
    Emitter(const Emitter&) = delete;
    Emitter& operator=(const Emitter&) = delete;

    [[nodiscard]] SourceId id() const override { return m_id; }
    [[nodiscard]] BufferId buffer() const override { return m_buffer; }

    void play() override;
    void stop() override;
    [[nodiscard]] sonance_core::Result<SourceState> state() const override;
    void set_looping(bool looping) override;
    [[nodiscard]] bool is_looping() const override;
    void set_volume(float volume) override;
    [[nodiscard]] sonance_core::Result<float> volume() const override;

protected:
    Emitter(ContextRef context, SourceId id, BufferId buffer);
    Emitter(Emitter&& other) noexcept;
    Emitter& operator=(Emitter&& other) noexcept;
    ~Emitter() override;

    /// Allocate a native emitter and bind a buffer to it
    static sonance_core::Result<SourceId> allocate(const ContextRef& context, BufferId buffer);

    /// Apply a parameter during construction (failure aborts construction)
    [[nodiscard]] sonance_core::Result<void> configure(SourceParam param, float value);
    [[nodiscard]] sonance_core::Result<void> configure(SourceFlag flag, bool value);

    /// Best-effort parameter update
    void update_param(SourceParam param, float value, const char* what);

    /// Read back a parameter (QueryFailed on native failure)
    [[nodiscard]] sonance_core::Result<float> query_param(SourceParam param, const char* what) const;

    [[nodiscard]] const ContextRef& context() const { return m_context; }

private:
    void release();

    ContextRef m_context;
    SourceId m_id;
    BufferId m_buffer;
    bool m_looping = false;
};

// =============================================================================
// SimpleSource
// =============================================================================

/// Listener-relative emitter playing the full-channel buffer.
/// Never attenuated or panned.
class SimpleSource : public Emitter {
public:
    static sonance_core::Result<SimpleSource> create(const Context& context, const SoundAsset& asset);

    SimpleSource(SimpleSource&&) noexcept = default;
    SimpleSource& operator=(SimpleSource&&) noexcept = default;

    [[nodiscard]] SourceKind kind() const override { return SourceKind::Simple; }

private:
    using Emitter::Emitter;
};

// =============================================================================
// PositionalSource
// =============================================================================

/// Spatialized emitter playing the asset's mono buffer (or its only buffer
/// when the asset is mono)
class PositionalSource : public Emitter {
public:
    /// Attenuation starts from the context's positional defaults
    static sonance_core::Result<PositionalSource> create(const Context& context, const SoundAsset& asset);

    PositionalSource(PositionalSource&&) noexcept = default;
    PositionalSource& operator=(PositionalSource&&) noexcept = default;

    [[nodiscard]] SourceKind kind() const override { return SourceKind::Positional; }

    // =========================================================================
    // Position
    // =========================================================================

    /// Move the emitter (PositionSetFailed if the device rejects the value)
    sonance_core::Result<void> update(const Vec3& position);

    [[nodiscard]] sonance_core::Result<Vec3> position() const;

    // =========================================================================
    // Attenuation (setters are best-effort)
    // =========================================================================

    void set_max_distance(float distance);
    [[nodiscard]] sonance_core::Result<float> max_distance() const;

    void set_reference_distance(float distance);
    [[nodiscard]] sonance_core::Result<float> reference_distance() const;

    void set_rolloff_factor(float factor);
    [[nodiscard]] sonance_core::Result<float> rolloff_factor() const;

    void set_min_gain(float gain);
    [[nodiscard]] sonance_core::Result<float> min_gain() const;

private:
    using Emitter::Emitter;
};

// =============================================================================
// SoundSource
// =============================================================================

/// Source of either kind behind one type.
///
/// Spatial operations on a Simple source fail with WrongSourceKind and make
/// no native call.
class SoundSource {
public:
    static sonance_core::Result<SoundSource> create(const Context& context, const SoundAsset& asset, SourceKind kind);

    SoundSource(SimpleSource source) : m_source(std::move(source)) {}
    SoundSource(PositionalSource source) : m_source(std::move(source)) {}

    // =========================================================================
    // Playback
    // =========================================================================

    [[nodiscard]] SourceKind kind() const { return playback().kind(); }
    [[nodiscard]] SourceId id() const { return playback().id(); }
    [[nodiscard]] BufferId buffer() const { return playback().buffer(); }

    void play() { playback().play(); }
    void stop() { playback().stop(); }
    [[nodiscard]] sonance_core::Result<SourceState> state() const { return playback().state(); }

    void set_looping(bool looping) { playback().set_looping(looping); }
    [[nodiscard]] bool is_looping() const { return playback().is_looping(); }

    void set_volume(float volume) { playback().set_volume(volume); }
    [[nodiscard]] sonance_core::Result<float> volume() const { return playback().volume(); }

    // =========================================================================
    // Spatial (Positional only)
    // =========================================================================

    sonance_core::Result<void> update(const Vec3& position);
    [[nodiscard]] sonance_core::Result<Vec3> position() const;

    sonance_core::Result<void> set_max_distance(float distance);
    [[nodiscard]] sonance_core::Result<float> max_distance() const;

    sonance_core::Result<void> set_reference_distance(float distance);
    [[nodiscard]] sonance_core::Result<float> reference_distance() const;

    sonance_core::Result<void> set_rolloff_factor(float factor);
    [[nodiscard]] sonance_core::Result<float> rolloff_factor() const;

    sonance_core::Result<void> set_min_gain(float gain);
    [[nodiscard]] sonance_core::Result<float> min_gain() const;

    // =========================================================================
    // Access
    // =========================================================================

    [[nodiscard]] IPlayback& playback();
    [[nodiscard]] const IPlayback& playback() const;

    [[nodiscard]] SimpleSource* as_simple() { return std::get_if<SimpleSource>(&m_source); }
    [[nodiscard]] const SimpleSource* as_simple() const { return std::get_if<SimpleSource>(&m_source); }
    [[nodiscard]] PositionalSource* as_positional() { return std::get_if<PositionalSource>(&m_source); }
    [[nodiscard]] const PositionalSource* as_positional() const { return std::get_if<PositionalSource>(&m_source); }

private:
    /// The one kind check behind every spatial operation
    [[nodiscard]] sonance_core::Result<const PositionalSource*> positional(const char* operation) const;
    [[nodiscard]] sonance_core::Result<PositionalSource*> positional(const char* operation);

    std::variant<SimpleSource, PositionalSource> m_source;
};

} // namespace sonance_audio
