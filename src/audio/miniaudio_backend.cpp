/// @file miniaudio_backend.cpp
/// @brief Miniaudio-based audio backend implementation for sonance_audio
///
/// Mapping onto the miniaudio high level API:
/// - Device: ma_context + ma_device (f32 output, rendered by the engine)
/// - Rendering context: ma_engine driving an existing device (one per device)
/// - Buffer: s16 PCM held by the backend, read through ma_audio_buffer_ref
/// - Emitter: ma_sound over its own ma_audio_buffer_ref
/// - Listener: engine listener 0
///
/// Relative emitters are played with ma_positioning_relative and
/// spatialization disabled, so they are never attenuated or panned.
/// Positional emitters use the inverse distance curve, or no distance curve
/// at all while their reference distance is zero.

// Fix Windows header macro conflicts BEFORE including miniaudio
#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
#endif

// Enable miniaudio implementation in this translation unit
#define MINIAUDIO_IMPLEMENTATION

// Disable features we don't need to reduce compile time
#ifndef MA_NO_ENCODING
    #define MA_NO_ENCODING
#endif
#ifndef MA_NO_GENERATION
    #define MA_NO_GENERATION
#endif

#include <miniaudio.h>

#include <sonance/audio/backend.hpp>
#include <sonance/core/log.hpp>

#include <cstring>
#include <vector>

namespace sonance_audio {

using sonance_core::NativeError;

namespace {

/// Convert a miniaudio result code into a native error
NativeError to_native_error(ma_result result, const std::string& what) {
    std::string message = what + ": " + ma_result_description(result);
    switch (result) {
        case MA_OUT_OF_MEMORY:
            return NativeError{sonance_core::NativeErrorCode::OutOfMemory, message};
        case MA_INVALID_ARGS:
            return NativeError{sonance_core::NativeErrorCode::InvalidValue, message};
        case MA_INVALID_OPERATION:
            return NativeError{sonance_core::NativeErrorCode::InvalidOperation, message};
        case MA_NO_BACKEND:
        case MA_NO_DEVICE:
        case MA_DOES_NOT_EXIST:
        case MA_DEVICE_NOT_INITIALIZED:
            return NativeError{sonance_core::NativeErrorCode::NoDevice, message};
        default:
            return NativeError{sonance_core::NativeErrorCode::BackendFailure, message};
    }
}

ma_vec3f to_ma(const Vec3& v) {
    ma_vec3f out;
    out.x = v.x;
    out.y = v.y;
    out.z = v.z;
    return out;
}

Vec3 from_ma(const ma_vec3f& v) {
    return Vec3(v.x, v.y, v.z);
}

// Audio callback: pull mixed audio from the engine bound to this device
void miniaudio_data_callback(ma_device* pDevice, void* pOutput, const void* /*pInput*/, ma_uint32 frameCount) {
    auto* engine = static_cast<ma_engine*>(pDevice->pUserData);
    if (!engine) {
        std::memset(pOutput, 0, frameCount * ma_get_bytes_per_frame(pDevice->playback.format, pDevice->playback.channels));
        return;
    }
    ma_engine_read_pcm_frames(engine, pOutput, frameCount, nullptr);
}

} // anonymous namespace

// =============================================================================
// Internal State
// =============================================================================

struct MiniaudioDeviceState {
    ma_context context{};
    ma_device device{};
    bool context_initialized = false;
    bool device_initialized = false;
    ContextId engine_owner;

    ~MiniaudioDeviceState() {
        if (device_initialized) {
            ma_device_uninit(&device);
        }
        if (context_initialized) {
            ma_context_uninit(&context);
        }
    }
};

struct MiniaudioContextState {
    DeviceId device;
    ma_engine engine{};
};

struct MiniaudioBufferState {
    DeviceId device;
    bool has_data = false;
    ChannelLayout layout = ChannelLayout::Mono;
    std::uint32_t sample_rate = 0;
    std::vector<std::int16_t> samples;
};

struct MiniaudioSourceState {
    ContextId context;
    BufferId buffer;

    ma_audio_buffer_ref ref{};
    ma_sound sound{};
    bool sound_initialized = false;
    bool started = false;

    std::array<float, 6> params{};
    bool looping = false;
    bool relative = false;
    Vec3 position = sonance_math::vec3::ZERO;

    void release_sound() {
        if (sound_initialized) {
            ma_sound_uninit(&sound);
            ma_audio_buffer_ref_uninit(&ref);
            sound_initialized = false;
        }
        started = false;
    }

    ~MiniaudioSourceState() { release_sound(); }
};

struct MiniaudioBackend::Impl {
    std::unordered_map<DeviceId, std::unique_ptr<MiniaudioDeviceState>> devices;
    std::unordered_map<ContextId, std::unique_ptr<MiniaudioContextState>> contexts;
    std::unordered_map<BufferId, MiniaudioBufferState> buffers;
    std::unordered_map<SourceId, std::unique_ptr<MiniaudioSourceState>> sources;

    ContextId current;
    std::uint32_t next_device_id = 1;
    std::uint32_t next_context_id = 1;
    std::uint32_t next_buffer_id = 1;
    std::uint32_t next_source_id = 1;

    NativeResult<MiniaudioContextState*> lookup_current() {
        if (!current) {
            return NativeError::invalid_operation("no current context");
        }
        auto it = contexts.find(current);
        if (it == contexts.end()) {
            return NativeError::invalid_operation("current context was destroyed");
        }
        return it->second.get();
    }

    NativeResult<MiniaudioSourceState*> lookup_source(SourceId source) {
        auto ctx = lookup_current();
        if (!ctx) {
            return ctx.error();
        }
        auto it = sources.find(source);
        if (it == sources.end()) {
            return NativeError::invalid_name("unknown source");
        }
        if (it->second->context != current) {
            return NativeError::invalid_operation("source belongs to another context");
        }
        return it->second.get();
    }

    /// Push a cached parameter into the bound ma_sound
    static void apply_param(MiniaudioSourceState& src, SourceParam param) {
        if (!src.sound_initialized) {
            return;
        }
        float value = src.params[static_cast<std::size_t>(param)];
        switch (param) {
            case SourceParam::Gain: ma_sound_set_volume(&src.sound, value); break;
            case SourceParam::MaxGain: ma_sound_set_max_gain(&src.sound, value); break;
            case SourceParam::MinGain: ma_sound_set_min_gain(&src.sound, value); break;
            case SourceParam::MaxDistance: ma_sound_set_max_distance(&src.sound, value); break;
            case SourceParam::ReferenceDistance:
                ma_sound_set_min_distance(&src.sound, value);
                apply_distance_model(src, value);
                break;
            case SourceParam::RolloffFactor: ma_sound_set_rolloff(&src.sound, value); break;
        }
    }

    /// The inverse curve is silent past a zero reference distance
    static void apply_distance_model(MiniaudioSourceState& src, float reference_distance) {
        switch (distance_model_for(reference_distance)) {
            case DistanceModel::None: ma_sound_set_attenuation_model(&src.sound, ma_attenuation_model_none); break;
            case DistanceModel::Inverse: ma_sound_set_attenuation_model(&src.sound, ma_attenuation_model_inverse); break;
        }
    }

    static void apply_relative(MiniaudioSourceState& src) {
        if (!src.sound_initialized) {
            return;
        }
        ma_sound_set_positioning(&src.sound, src.relative ? ma_positioning_relative : ma_positioning_absolute);
        ma_sound_set_spatialization_enabled(&src.sound, src.relative ? MA_FALSE : MA_TRUE);
    }

    static void apply_all(MiniaudioSourceState& src) {
        for (std::size_t i = 0; i < src.params.size(); ++i) {
            apply_param(src, static_cast<SourceParam>(i));
        }
        ma_sound_set_looping(&src.sound, src.looping ? MA_TRUE : MA_FALSE);
        ma_sound_set_position(&src.sound, src.position.x, src.position.y, src.position.z);
        apply_relative(src);
    }

    void release_buffer_users(BufferId buffer) {
        for (auto& [id, src] : sources) {
            if (src->buffer == buffer) {
                src->release_sound();
                src->buffer = BufferId{};
            }
        }
    }

    void destroy_context(ContextId context) {
        auto it = contexts.find(context);
        if (it == contexts.end()) {
            return;
        }

        for (auto src = sources.begin(); src != sources.end();) {
            if (src->second->context == context) {
                src = sources.erase(src);
            } else {
                ++src;
            }
        }

        auto dev = devices.find(it->second->device);
        if (dev != devices.end()) {
            ma_device_stop(&dev->second->device);
            ma_engine_uninit(&it->second->engine);
            dev->second->device.pUserData = nullptr;
            dev->second->engine_owner = ContextId{};
        } else {
            ma_engine_uninit(&it->second->engine);
        }

        if (current == context) {
            current = ContextId{};
        }
        contexts.erase(it);
    }
};

// =============================================================================
// MiniaudioBackend Public Interface
// =============================================================================

MiniaudioBackend::MiniaudioBackend()
    : m_impl(std::make_unique<Impl>()) {
}

MiniaudioBackend::~MiniaudioBackend() {
    while (!m_impl->devices.empty()) {
        close_device(m_impl->devices.begin()->first);
    }
}

AudioBackendInfo MiniaudioBackend::info() const {
    AudioBackendInfo info;
    info.name = "miniaudio";
    info.version = MA_VERSION_STRING;
    if (!m_impl->devices.empty()) {
        const ma_device& device = m_impl->devices.begin()->second->device;
        info.device_name = device.playback.name;
        info.sample_rate = device.sampleRate;
        info.channels = device.playback.channels;
    }
    return info;
}

// -----------------------------------------------------------------------------
// Device and Context
// -----------------------------------------------------------------------------

NativeResult<DeviceId> MiniaudioBackend::open_device(const DeviceConfig& config) {
    auto state = std::make_unique<MiniaudioDeviceState>();

    ma_result result = ma_context_init(nullptr, 0, nullptr, &state->context);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_context_init");
    }
    state->context_initialized = true;

    ma_device_config device_config = ma_device_config_init(ma_device_type_playback);
    device_config.playback.format = ma_format_f32;
    device_config.playback.channels = config.channels;
    device_config.sampleRate = config.sample_rate;
    device_config.dataCallback = miniaudio_data_callback;
    device_config.pUserData = nullptr;

    ma_device_id selected{};
    if (!config.name.empty()) {
        ma_device_info* playback_infos = nullptr;
        ma_uint32 playback_count = 0;
        result = ma_context_get_devices(&state->context, &playback_infos, &playback_count, nullptr, nullptr);
        if (result != MA_SUCCESS) {
            return to_native_error(result, "ma_context_get_devices");
        }

        bool found = false;
        for (ma_uint32 i = 0; i < playback_count; ++i) {
            if (config.name == playback_infos[i].name) {
                selected = playback_infos[i].id;
                found = true;
                break;
            }
        }
        if (!found) {
            return NativeError::no_device("'" + config.name + "' not found");
        }
        device_config.playback.pDeviceID = &selected;
    }

    result = ma_device_init(&state->context, &device_config, &state->device);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_device_init");
    }
    state->device_initialized = true;

    sonance_core::audio_logger()->debug("miniaudio device '{}' ({} Hz, {} channels)",
        state->device.playback.name, state->device.sampleRate, state->device.playback.channels);

    DeviceId id{m_impl->next_device_id++};
    m_impl->devices[id] = std::move(state);
    return id;
}

void MiniaudioBackend::close_device(DeviceId device) {
    auto it = m_impl->devices.find(device);
    if (it == m_impl->devices.end()) {
        return;
    }

    if (it->second->engine_owner) {
        m_impl->destroy_context(it->second->engine_owner);
    }

    for (auto buf = m_impl->buffers.begin(); buf != m_impl->buffers.end();) {
        if (buf->second.device == device) {
            buf = m_impl->buffers.erase(buf);
        } else {
            ++buf;
        }
    }

    m_impl->devices.erase(it);
}

NativeResult<ContextId> MiniaudioBackend::create_context(DeviceId device) {
    auto it = m_impl->devices.find(device);
    if (it == m_impl->devices.end()) {
        return NativeError::invalid_name("unknown device");
    }
    MiniaudioDeviceState& dev = *it->second;
    if (dev.engine_owner) {
        return NativeError::invalid_operation("device already drives a context");
    }

    auto ctx = std::make_unique<MiniaudioContextState>();
    ctx->device = device;

    ma_engine_config engine_config = ma_engine_config_init();
    engine_config.pDevice = &dev.device;
    engine_config.listenerCount = 1;
    engine_config.noAutoStart = MA_TRUE;

    ma_result result = ma_engine_init(&engine_config, &ctx->engine);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_engine_init");
    }

    dev.device.pUserData = &ctx->engine;
    result = ma_device_start(&dev.device);
    if (result != MA_SUCCESS) {
        dev.device.pUserData = nullptr;
        ma_engine_uninit(&ctx->engine);
        return to_native_error(result, "ma_device_start");
    }

    ContextId id{m_impl->next_context_id++};
    dev.engine_owner = id;
    m_impl->contexts[id] = std::move(ctx);
    return id;
}

void MiniaudioBackend::destroy_context(ContextId context) {
    m_impl->destroy_context(context);
}

NativeResult<void> MiniaudioBackend::make_context_current(ContextId context) {
    if (context && m_impl->contexts.find(context) == m_impl->contexts.end()) {
        return NativeError::invalid_name("unknown context");
    }
    m_impl->current = context;
    return {};
}

ContextId MiniaudioBackend::current_context() const {
    return m_impl->current;
}

// -----------------------------------------------------------------------------
// Buffers
// -----------------------------------------------------------------------------

NativeResult<BufferId> MiniaudioBackend::create_buffer() {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }

    BufferId id{m_impl->next_buffer_id++};
    MiniaudioBufferState state;
    state.device = ctx.value()->device;
    m_impl->buffers[id] = std::move(state);
    return id;
}

NativeResult<void> MiniaudioBackend::buffer_data(BufferId buffer, const BufferData& data) {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }

    auto it = m_impl->buffers.find(buffer);
    if (it == m_impl->buffers.end()) {
        return NativeError::invalid_name("unknown buffer");
    }
    if (data.sample_rate == 0 || data.samples.size() % channel_count(data.layout) != 0) {
        return NativeError::invalid_value("malformed PCM block");
    }

    // Emitters reading the old contents must let go first
    m_impl->release_buffer_users(buffer);

    try {
        it->second.samples.assign(data.samples.begin(), data.samples.end());
    } catch (const std::bad_alloc&) {
        return NativeError::out_of_memory("buffer upload");
    }
    it->second.has_data = true;
    it->second.layout = data.layout;
    it->second.sample_rate = data.sample_rate;
    return {};
}

void MiniaudioBackend::destroy_buffer(BufferId buffer) {
    if (m_impl->buffers.erase(buffer) > 0) {
        m_impl->release_buffer_users(buffer);
    }
}

// -----------------------------------------------------------------------------
// Sources
// -----------------------------------------------------------------------------

NativeResult<SourceId> MiniaudioBackend::create_source() {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }

    auto state = std::make_unique<MiniaudioSourceState>();
    state->context = m_impl->current;
    for (std::size_t i = 0; i < state->params.size(); ++i) {
        state->params[i] = default_source_param(static_cast<SourceParam>(i));
    }

    SourceId id{m_impl->next_source_id++};
    m_impl->sources[id] = std::move(state);
    return id;
}

void MiniaudioBackend::destroy_source(SourceId source) {
    m_impl->sources.erase(source);
}

NativeResult<void> MiniaudioBackend::set_source_buffer(SourceId source, BufferId buffer) {
    auto src_result = m_impl->lookup_source(source);
    if (!src_result) {
        return src_result.error();
    }
    MiniaudioSourceState& src = *src_result.value();

    const MiniaudioBufferState* data = nullptr;
    if (buffer) {
        auto it = m_impl->buffers.find(buffer);
        if (it == m_impl->buffers.end()) {
            return NativeError::invalid_name("unknown buffer");
        }
        if (!it->second.has_data) {
            return NativeError::invalid_operation("buffer has no data");
        }
        data = &it->second;
    }
    if (src.sound_initialized && ma_sound_is_playing(&src.sound)) {
        return NativeError::invalid_operation("cannot rebind a playing source");
    }

    src.release_sound();
    src.buffer = BufferId{};
    if (!data) {
        return {};
    }

    const ma_uint32 channels = channel_count(data->layout);
    ma_result result = ma_audio_buffer_ref_init(ma_format_s16, channels, data->samples.data(),
                                                data->samples.size() / channels, &src.ref);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_audio_buffer_ref_init");
    }
    src.ref.sampleRate = data->sample_rate;

    MiniaudioContextState& ctx = *m_impl->contexts.at(src.context);
    result = ma_sound_init_from_data_source(&ctx.engine, &src.ref, 0, nullptr, &src.sound);
    if (result != MA_SUCCESS) {
        ma_audio_buffer_ref_uninit(&src.ref);
        return to_native_error(result, "ma_sound_init_from_data_source");
    }
    src.sound_initialized = true;
    src.buffer = buffer;
    Impl::apply_all(src);
    return {};
}

NativeResult<BufferId> MiniaudioBackend::source_buffer(SourceId source) const {
    auto src = m_impl->lookup_source(source);
    if (!src) {
        return src.error();
    }
    return src.value()->buffer;
}

NativeResult<void> MiniaudioBackend::set_source_param(SourceId source, SourceParam param, float value) {
    auto src = m_impl->lookup_source(source);
    if (!src) {
        return src.error();
    }
    auto valid = validate_source_param(param, value);
    if (!valid) {
        return valid.error();
    }

    src.value()->params[static_cast<std::size_t>(param)] = value;
    Impl::apply_param(*src.value(), param);
    return {};
}

NativeResult<float> MiniaudioBackend::source_param(SourceId source, SourceParam param) const {
    auto src_result = m_impl->lookup_source(source);
    if (!src_result) {
        return src_result.error();
    }
    MiniaudioSourceState& src = *src_result.value();
    if (!src.sound_initialized) {
        return src.params[static_cast<std::size_t>(param)];
    }

    switch (param) {
        case SourceParam::Gain: return ma_sound_get_volume(&src.sound);
        case SourceParam::MaxGain: return ma_sound_get_max_gain(&src.sound);
        case SourceParam::MinGain: return ma_sound_get_min_gain(&src.sound);
        case SourceParam::MaxDistance: return ma_sound_get_max_distance(&src.sound);
        case SourceParam::ReferenceDistance: return ma_sound_get_min_distance(&src.sound);
        case SourceParam::RolloffFactor: return ma_sound_get_rolloff(&src.sound);
    }
    return NativeError::invalid_enum(to_string(param));
}

NativeResult<void> MiniaudioBackend::set_source_flag(SourceId source, SourceFlag flag, bool value) {
    auto src_result = m_impl->lookup_source(source);
    if (!src_result) {
        return src_result.error();
    }
    MiniaudioSourceState& src = *src_result.value();

    switch (flag) {
        case SourceFlag::Looping:
            src.looping = value;
            if (src.sound_initialized) {
                ma_sound_set_looping(&src.sound, value ? MA_TRUE : MA_FALSE);
            }
            break;
        case SourceFlag::Relative:
            src.relative = value;
            Impl::apply_relative(src);
            break;
    }
    return {};
}

NativeResult<bool> MiniaudioBackend::source_flag(SourceId source, SourceFlag flag) const {
    auto src_result = m_impl->lookup_source(source);
    if (!src_result) {
        return src_result.error();
    }
    MiniaudioSourceState& src = *src_result.value();

    switch (flag) {
        case SourceFlag::Looping:
            return src.sound_initialized ? ma_sound_is_looping(&src.sound) == MA_TRUE : src.looping;
        case SourceFlag::Relative:
            return src.relative;
    }
    return NativeError::invalid_enum(to_string(flag));
}

NativeResult<void> MiniaudioBackend::set_source_position(SourceId source, const Vec3& position) {
    auto src = m_impl->lookup_source(source);
    if (!src) {
        return src.error();
    }
    auto valid = validate_position(position);
    if (!valid) {
        return valid.error();
    }

    src.value()->position = position;
    if (src.value()->sound_initialized) {
        ma_sound_set_position(&src.value()->sound, position.x, position.y, position.z);
    }
    return {};
}

NativeResult<Vec3> MiniaudioBackend::source_position(SourceId source) const {
    auto src = m_impl->lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (src.value()->sound_initialized) {
        return from_ma(ma_sound_get_position(&src.value()->sound));
    }
    return src.value()->position;
}

NativeResult<void> MiniaudioBackend::play_source(SourceId source) {
    auto src_result = m_impl->lookup_source(source);
    if (!src_result) {
        return src_result.error();
    }
    MiniaudioSourceState& src = *src_result.value();
    if (!src.sound_initialized) {
        return NativeError::invalid_operation("source has no buffer");
    }

    ma_result result = MA_SUCCESS;
    if (ma_sound_is_playing(&src.sound) || ma_sound_at_end(&src.sound)) {
        result = ma_sound_seek_to_pcm_frame(&src.sound, 0);
        if (result != MA_SUCCESS) {
            return to_native_error(result, "ma_sound_seek_to_pcm_frame");
        }
    }
    result = ma_sound_start(&src.sound);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_sound_start");
    }
    src.started = true;
    return {};
}

NativeResult<void> MiniaudioBackend::stop_source(SourceId source) {
    auto src_result = m_impl->lookup_source(source);
    if (!src_result) {
        return src_result.error();
    }
    MiniaudioSourceState& src = *src_result.value();
    if (!src.sound_initialized) {
        return {};
    }

    ma_result result = ma_sound_stop(&src.sound);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_sound_stop");
    }
    result = ma_sound_seek_to_pcm_frame(&src.sound, 0);
    if (result != MA_SUCCESS) {
        return to_native_error(result, "ma_sound_seek_to_pcm_frame");
    }
    return {};
}

NativeResult<SourceState> MiniaudioBackend::source_state(SourceId source) const {
    auto src = m_impl->lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (!src.value()->sound_initialized || !src.value()->started) {
        return SourceState::Initial;
    }
    return ma_sound_is_playing(&src.value()->sound) ? SourceState::Playing : SourceState::Stopped;
}

// -----------------------------------------------------------------------------
// Listener
// -----------------------------------------------------------------------------

NativeResult<void> MiniaudioBackend::set_listener_position(const Vec3& position) {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    auto valid = validate_position(position);
    if (!valid) {
        return valid.error();
    }
    ma_engine_listener_set_position(&ctx.value()->engine, 0, position.x, position.y, position.z);
    return {};
}

NativeResult<Vec3> MiniaudioBackend::listener_position() const {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    return from_ma(ma_engine_listener_get_position(&ctx.value()->engine, 0));
}

NativeResult<void> MiniaudioBackend::set_listener_orientation(const Orientation& orientation) {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    const ma_vec3f at = to_ma(orientation.at);
    const ma_vec3f up = to_ma(orientation.up);
    ma_engine_listener_set_direction(&ctx.value()->engine, 0, at.x, at.y, at.z);
    ma_engine_listener_set_world_up(&ctx.value()->engine, 0, up.x, up.y, up.z);
    return {};
}

NativeResult<Orientation> MiniaudioBackend::listener_orientation() const {
    auto ctx = m_impl->lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    Orientation orientation;
    orientation.at = from_ma(ma_engine_listener_get_direction(&ctx.value()->engine, 0));
    orientation.up = from_ma(ma_engine_listener_get_world_up(&ctx.value()->engine, 0));
    return orientation;
}

} // namespace sonance_audio
