/// @file sound_source.cpp
/// @brief Emitter state machine for sonance_audio

#include <sonance/audio/sound_source.hpp>
#include <sonance/audio/sound_asset.hpp>
#include <sonance/core/log.hpp>

#include <utility>

namespace sonance_audio {

using sonance_core::AudioError;
using sonance_core::Error;
using sonance_core::ErrorCode;
using sonance_core::NativeError;
using sonance_core::NativeErrorCode;
using sonance_core::Result;

namespace {

/// Run a backend call with the owning context current
template<typename F>
auto in_context(const ContextRef& context, F&& call) -> decltype(call(context.backend())) {
    auto active = context.activate();
    if (!active) {
        return active.error();
    }
    return call(context.backend());
}

/// Log and count a failed steady-state update
void best_effort(const NativeResult<void>& result, const char* what) {
    if (result) {
        return;
    }
    const NativeError& native = result.error();
    const ErrorCode code = native.code == NativeErrorCode::InvalidValue ? ErrorCode::InvalidArgument
                                                                        : ErrorCode::InvalidState;
    sonance_core::discard_nonfatal(Result<void>(Error(code, native.message)), what);
}

template<typename T>
Result<T> query(NativeResult<T> result, const char* what) {
    if (!result) {
        return Error(AudioError::query_failed(what, result.error()));
    }
    return std::move(result).value();
}

} // anonymous namespace

// =============================================================================
// Emitter
// =============================================================================

Emitter::Emitter(ContextRef context, SourceId id, BufferId buffer)
    : m_context(std::move(context)), m_id(id), m_buffer(buffer) {
}

Emitter::Emitter(Emitter&& other) noexcept
    : m_context(std::move(other.m_context))
    , m_id(other.m_id)
    , m_buffer(other.m_buffer)
    , m_looping(other.m_looping) {
    other.m_id = SourceId{};
}

Emitter& Emitter::operator=(Emitter&& other) noexcept {
    if (this != &other) {
        release();
        m_context = std::move(other.m_context);
        m_id = other.m_id;
        m_buffer = other.m_buffer;
        m_looping = other.m_looping;
        other.m_id = SourceId{};
    }
    return *this;
}

Emitter::~Emitter() {
    release();
}

void Emitter::release() {
    if (!m_id) {
        return;
    }
    if (m_context.activate()) {
        m_context.backend().destroy_source(m_id);
    } else {
        sonance_core::audio_logger()->debug("Source {} outlived its context, nothing to release", m_id.value);
    }
    m_id = SourceId{};
}

Result<SourceId> Emitter::allocate(const ContextRef& context, BufferId buffer) {
    auto active = context.activate();
    if (!active) {
        return Error(AudioError::source_creation_failed(active.error()));
    }

    auto id = context.backend().create_source();
    if (!id) {
        return Error(AudioError::source_creation_failed(id.error()));
    }

    auto bound = context.backend().set_source_buffer(id.value(), buffer);
    if (!bound) {
        context.backend().destroy_source(id.value());
        return Error(AudioError::source_creation_failed(bound.error()));
    }

    return id.value();
}

Result<void> Emitter::configure(SourceParam param, float value) {
    auto result = in_context(m_context, [&](IAudioBackend& backend) {
        return backend.set_source_param(m_id, param, value);
    });
    if (!result) {
        return Error(AudioError::source_creation_failed(result.error()));
    }
    return {};
}

Result<void> Emitter::configure(SourceFlag flag, bool value) {
    auto result = in_context(m_context, [&](IAudioBackend& backend) {
        return backend.set_source_flag(m_id, flag, value);
    });
    if (!result) {
        return Error(AudioError::source_creation_failed(result.error()));
    }
    return {};
}

void Emitter::update_param(SourceParam param, float value, const char* what) {
    best_effort(in_context(m_context, [&](IAudioBackend& backend) {
        return backend.set_source_param(m_id, param, value);
    }), what);
}

Result<float> Emitter::query_param(SourceParam param, const char* what) const {
    return query(in_context(m_context, [&](IAudioBackend& backend) {
        return backend.source_param(m_id, param);
    }), what);
}

void Emitter::play() {
    best_effort(in_context(m_context, [&](IAudioBackend& backend) {
        return backend.play_source(m_id);
    }), "play");
}

void Emitter::stop() {
    best_effort(in_context(m_context, [&](IAudioBackend& backend) {
        return backend.stop_source(m_id);
    }), "stop");
}

Result<SourceState> Emitter::state() const {
    return query(in_context(m_context, [&](IAudioBackend& backend) {
        return backend.source_state(m_id);
    }), "playback state");
}

void Emitter::set_looping(bool looping) {
    auto result = in_context(m_context, [&](IAudioBackend& backend) {
        return backend.set_source_flag(m_id, SourceFlag::Looping, looping);
    });
    if (result) {
        m_looping = looping;
    }
    best_effort(result, "set_looping");
}

bool Emitter::is_looping() const {
    auto result = query(in_context(m_context, [&](IAudioBackend& backend) {
        return backend.source_flag(m_id, SourceFlag::Looping);
    }), "loop flag");
    if (!result) {
        sonance_core::discard_nonfatal(Result<void>(result.error()), "is_looping");
        return m_looping;
    }
    return result.value();
}

void Emitter::set_volume(float volume) {
    update_param(SourceParam::Gain, volume, "set_volume (gain)");
    update_param(SourceParam::MaxGain, volume, "set_volume (max gain)");
}

Result<float> Emitter::volume() const {
    return query_param(SourceParam::Gain, "volume");
}

// =============================================================================
// SimpleSource
// =============================================================================

Result<SimpleSource> SimpleSource::create(const Context& context, const SoundAsset& asset) {
    const ContextRef ref = context.ref();
    const BufferId buffer = asset.primary_buffer().id();

    auto id = allocate(ref, buffer);
    if (!id) {
        return id.error();
    }
    SimpleSource source(ref, id.value(), buffer);

    if (auto r = source.configure(SourceFlag::Relative, true); !r) {
        return r.error();
    }

    return source;
}

// =============================================================================
// PositionalSource
// =============================================================================

Result<PositionalSource> PositionalSource::create(const Context& context, const SoundAsset& asset) {
    const ContextRef ref = context.ref();
    const BufferId buffer = asset.spatial_buffer().id();
    const AttenuationSettings& defaults = context.config().positional;

    auto id = allocate(ref, buffer);
    if (!id) {
        return id.error();
    }
    PositionalSource source(ref, id.value(), buffer);

    if (auto r = source.configure(SourceFlag::Relative, false); !r) return r.error();
    if (auto r = source.configure(SourceParam::ReferenceDistance, defaults.reference_distance); !r) return r.error();
    if (auto r = source.configure(SourceParam::RolloffFactor, defaults.rolloff_factor); !r) return r.error();
    if (auto r = source.configure(SourceParam::MinGain, defaults.min_gain); !r) return r.error();
    if (auto r = source.configure(SourceParam::MaxDistance, defaults.max_distance); !r) return r.error();

    return source;
}

Result<void> PositionalSource::update(const Vec3& position) {
    auto result = in_context(context(), [&](IAudioBackend& backend) {
        return backend.set_source_position(id(), position);
    });
    if (!result) {
        return Error(AudioError::position_set_failed(result.error()));
    }
    return {};
}

Result<Vec3> PositionalSource::position() const {
    return query(in_context(context(), [&](IAudioBackend& backend) {
        return backend.source_position(id());
    }), "position");
}

void PositionalSource::set_max_distance(float distance) {
    update_param(SourceParam::MaxDistance, distance, "set_max_distance");
}

Result<float> PositionalSource::max_distance() const {
    return query_param(SourceParam::MaxDistance, "max distance");
}

void PositionalSource::set_reference_distance(float distance) {
    update_param(SourceParam::ReferenceDistance, distance, "set_reference_distance");
}

Result<float> PositionalSource::reference_distance() const {
    return query_param(SourceParam::ReferenceDistance, "reference distance");
}

void PositionalSource::set_rolloff_factor(float factor) {
    update_param(SourceParam::RolloffFactor, factor, "set_rolloff_factor");
}

Result<float> PositionalSource::rolloff_factor() const {
    return query_param(SourceParam::RolloffFactor, "rolloff factor");
}

void PositionalSource::set_min_gain(float gain) {
    update_param(SourceParam::MinGain, gain, "set_min_gain");
}

Result<float> PositionalSource::min_gain() const {
    return query_param(SourceParam::MinGain, "min gain");
}

// =============================================================================
// SoundSource
// =============================================================================

Result<SoundSource> SoundSource::create(const Context& context, const SoundAsset& asset, SourceKind kind) {
    switch (kind) {
        case SourceKind::Simple: {
            auto source = SimpleSource::create(context, asset);
            if (!source) {
                return source.error();
            }
            return SoundSource(std::move(source).value());
        }
        case SourceKind::Positional: {
            auto source = PositionalSource::create(context, asset);
            if (!source) {
                return source.error();
            }
            return SoundSource(std::move(source).value());
        }
    }
    return Error(ErrorCode::InvalidArgument, "Unknown source kind");
}

IPlayback& SoundSource::playback() {
    return std::visit([](auto& source) -> IPlayback& { return source; }, m_source);
}

const IPlayback& SoundSource::playback() const {
    return std::visit([](const auto& source) -> const IPlayback& { return source; }, m_source);
}

Result<const PositionalSource*> SoundSource::positional(const char* operation) const {
    if (const auto* source = std::get_if<PositionalSource>(&m_source)) {
        return source;
    }
    return Error(AudioError::wrong_source_kind(operation));
}

Result<PositionalSource*> SoundSource::positional(const char* operation) {
    auto source = std::as_const(*this).positional(operation);
    if (!source) {
        return source.error();
    }
    return const_cast<PositionalSource*>(source.value());
}

Result<void> SoundSource::update(const Vec3& position) {
    auto source = positional("update");
    if (!source) {
        return source.error();
    }
    return source.value()->update(position);
}

Result<Vec3> SoundSource::position() const {
    auto source = positional("position");
    if (!source) {
        return source.error();
    }
    return source.value()->position();
}

Result<void> SoundSource::set_max_distance(float distance) {
    auto source = positional("set_max_distance");
    if (!source) {
        return source.error();
    }
    source.value()->set_max_distance(distance);
    return {};
}

Result<float> SoundSource::max_distance() const {
    auto source = positional("max_distance");
    if (!source) {
        return source.error();
    }
    return source.value()->max_distance();
}

Result<void> SoundSource::set_reference_distance(float distance) {
    auto source = positional("set_reference_distance");
    if (!source) {
        return source.error();
    }
    source.value()->set_reference_distance(distance);
    return {};
}

Result<float> SoundSource::reference_distance() const {
    auto source = positional("reference_distance");
    if (!source) {
        return source.error();
    }
    return source.value()->reference_distance();
}

Result<void> SoundSource::set_rolloff_factor(float factor) {
    auto source = positional("set_rolloff_factor");
    if (!source) {
        return source.error();
    }
    source.value()->set_rolloff_factor(factor);
    return {};
}

Result<float> SoundSource::rolloff_factor() const {
    auto source = positional("rolloff_factor");
    if (!source) {
        return source.error();
    }
    return source.value()->rolloff_factor();
}

Result<void> SoundSource::set_min_gain(float gain) {
    auto source = positional("set_min_gain");
    if (!source) {
        return source.error();
    }
    source.value()->set_min_gain(gain);
    return {};
}

Result<float> SoundSource::min_gain() const {
    auto source = positional("min_gain");
    if (!source) {
        return source.error();
    }
    return source.value()->min_gain();
}

} // namespace sonance_audio
