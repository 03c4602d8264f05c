/// @file backend.cpp
/// @brief Audio backend implementations for sonance_audio

#include <sonance/audio/backend.hpp>
#include <sonance/core/log.hpp>

#include <cmath>
#include <limits>

namespace sonance_audio {

using sonance_core::NativeError;

// =============================================================================
// Validation
// =============================================================================

NativeResult<void> validate_source_param(SourceParam param, float value) {
    if (!std::isfinite(value) || value < 0.0f) {
        return NativeError::invalid_value(std::string(to_string(param)) + " = " + std::to_string(value));
    }
    return {};
}

NativeResult<void> validate_position(const Vec3& position) {
    if (!sonance_math::is_finite(position)) {
        return NativeError::invalid_value("non-finite position component");
    }
    return {};
}

float default_source_param(SourceParam param) {
    switch (param) {
        case SourceParam::Gain: return 1.0f;
        case SourceParam::MaxGain: return 1.0f;
        case SourceParam::MinGain: return 0.0f;
        case SourceParam::MaxDistance: return std::numeric_limits<float>::max();
        case SourceParam::ReferenceDistance: return 1.0f;
        case SourceParam::RolloffFactor: return 1.0f;
    }
    return 0.0f;
}

DistanceModel distance_model_for(float reference_distance) {
    return reference_distance > 0.0f ? DistanceModel::Inverse : DistanceModel::None;
}

// =============================================================================
// Backend Factory
// =============================================================================

sonance_core::Result<BackendPtr> create_backend(const std::string& name) {
    if (name == "miniaudio") {
        return BackendPtr(std::make_shared<MiniaudioBackend>());
    }
    if (name == "null") {
        return BackendPtr(std::make_shared<NullAudioBackend>());
    }
    return sonance_core::Error(sonance_core::ErrorCode::InvalidArgument,
                               "Unknown audio backend: '" + name + "'");
}

// =============================================================================
// NullAudioBackend Implementation
// =============================================================================

NullAudioBackend::NullAudioBackend(std::vector<std::string> devices)
    : m_available_devices(std::move(devices)) {}

NullAudioBackend::~NullAudioBackend() {
    while (!m_devices.empty()) {
        close_device(m_devices.begin()->first);
    }
}

AudioBackendInfo NullAudioBackend::info() const {
    AudioBackendInfo info;
    info.name = "Null Audio";
    info.version = "1.0.0";
    if (!m_devices.empty()) {
        info.device_name = m_devices.begin()->second.name;
        info.sample_rate = 44100;
        info.channels = 2;
    }
    return info;
}

NativeResult<DeviceId> NullAudioBackend::open_device(const DeviceConfig& config) {
    if (m_available_devices.empty()) {
        return NativeError::no_device("no output device present");
    }

    std::string name = m_available_devices.front();
    if (!config.name.empty()) {
        bool found = false;
        for (const auto& candidate : m_available_devices) {
            if (candidate == config.name) {
                found = true;
                break;
            }
        }
        if (!found) {
            return NativeError::no_device("'" + config.name + "' not found");
        }
        name = config.name;
    }

    DeviceId id{m_next_device_id++};
    m_devices[id] = DeviceRecord{name};
    return id;
}

void NullAudioBackend::close_device(DeviceId device) {
    if (m_devices.find(device) == m_devices.end()) {
        return;
    }

    std::vector<ContextId> contexts;
    for (const auto& [id, ctx] : m_contexts) {
        if (ctx.device == device) {
            contexts.push_back(id);
        }
    }
    m_implicit_context_teardowns += contexts.size();
    for (ContextId id : contexts) {
        destroy_context(id);
    }

    for (auto it = m_buffers.begin(); it != m_buffers.end();) {
        if (it->second.device == device) {
            it = m_buffers.erase(it);
        } else {
            ++it;
        }
    }

    m_devices.erase(device);
    m_teardown_log.emplace_back("close_device");
}

NativeResult<ContextId> NullAudioBackend::create_context(DeviceId device) {
    if (m_devices.find(device) == m_devices.end()) {
        return NativeError::invalid_name("unknown device");
    }
    if (m_faults.create_context) {
        return *m_faults.create_context;
    }

    ContextId id{m_next_context_id++};
    m_contexts[id] = ContextRecord{device, ListenerRecord{}};
    return id;
}

void NullAudioBackend::destroy_context(ContextId context) {
    if (m_contexts.find(context) == m_contexts.end()) {
        return;
    }

    for (auto it = m_sources.begin(); it != m_sources.end();) {
        if (it->second.context == context) {
            it = m_sources.erase(it);
        } else {
            ++it;
        }
    }

    if (m_current == context) {
        m_current = ContextId{};
    }
    m_contexts.erase(context);
    m_teardown_log.emplace_back("destroy_context");
}

NativeResult<void> NullAudioBackend::make_context_current(ContextId context) {
    if (m_faults.make_current) {
        return *m_faults.make_current;
    }
    if (context && m_contexts.find(context) == m_contexts.end()) {
        return NativeError::invalid_name("unknown context");
    }
    m_current = context;
    return {};
}

// -----------------------------------------------------------------------------
// Buffers
// -----------------------------------------------------------------------------

NativeResult<BufferId> NullAudioBackend::create_buffer() {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    if (m_faults.create_buffer) {
        return *m_faults.create_buffer;
    }

    BufferId id{m_next_buffer_id++};
    BufferRecord record;
    record.device = ctx.value()->device;
    m_buffers[id] = std::move(record);
    return id;
}

NativeResult<void> NullAudioBackend::buffer_data(BufferId buffer, const BufferData& data) {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }

    auto it = m_buffers.find(buffer);
    if (it == m_buffers.end()) {
        return NativeError::invalid_name("unknown buffer");
    }
    if (m_faults.buffer_data && m_buffer_uploads >= m_faults.buffer_data_allowed) {
        return *m_faults.buffer_data;
    }
    if (data.sample_rate == 0 || data.samples.size() % channel_count(data.layout) != 0) {
        return NativeError::invalid_value("malformed PCM block");
    }

    it->second.has_data = true;
    it->second.layout = data.layout;
    it->second.sample_rate = data.sample_rate;
    it->second.samples.assign(data.samples.begin(), data.samples.end());
    ++m_buffer_uploads;
    return {};
}

void NullAudioBackend::destroy_buffer(BufferId buffer) {
    m_buffers.erase(buffer);
}

const NullAudioBackend::BufferRecord* NullAudioBackend::find_buffer(BufferId buffer) const {
    auto it = m_buffers.find(buffer);
    return it != m_buffers.end() ? &it->second : nullptr;
}

// -----------------------------------------------------------------------------
// Sources
// -----------------------------------------------------------------------------

NativeResult<NullAudioBackend::ContextRecord*> NullAudioBackend::lookup_current() const {
    ++m_native_calls;
    if (!m_current) {
        return NativeError::invalid_operation("no current context");
    }
    auto it = m_contexts.find(m_current);
    if (it == m_contexts.end()) {
        return NativeError::invalid_operation("current context was destroyed");
    }
    return &it->second;
}

NativeResult<NullAudioBackend::SourceRecord*> NullAudioBackend::lookup_source(SourceId source) const {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    auto it = m_sources.find(source);
    if (it == m_sources.end()) {
        return NativeError::invalid_name("unknown source");
    }
    if (it->second.context != m_current) {
        return NativeError::invalid_operation("source belongs to another context");
    }
    return &it->second;
}

NativeResult<SourceId> NullAudioBackend::create_source() {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    if (m_faults.create_source) {
        return *m_faults.create_source;
    }
    if (m_sources.size() >= m_faults.max_sources) {
        return NativeError::out_of_memory("source limit reached");
    }

    SourceRecord record;
    record.context = m_current;
    for (std::size_t i = 0; i < record.params.size(); ++i) {
        record.params[i] = default_source_param(static_cast<SourceParam>(i));
    }

    SourceId id{m_next_source_id++};
    m_sources[id] = record;
    return id;
}

void NullAudioBackend::destroy_source(SourceId source) {
    m_sources.erase(source);
}

NativeResult<void> NullAudioBackend::set_source_buffer(SourceId source, BufferId buffer) {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.set_source_buffer) {
        return *m_faults.set_source_buffer;
    }
    if (buffer && m_buffers.find(buffer) == m_buffers.end()) {
        return NativeError::invalid_name("unknown buffer");
    }
    if (src.value()->state == SourceState::Playing) {
        return NativeError::invalid_operation("cannot rebind a playing source");
    }

    src.value()->buffer = buffer;
    src.value()->state = SourceState::Initial;
    return {};
}

NativeResult<BufferId> NullAudioBackend::source_buffer(SourceId source) const {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_queries) {
        return *m_faults.source_queries;
    }
    return src.value()->buffer;
}

NativeResult<void> NullAudioBackend::set_source_param(SourceId source, SourceParam param, float value) {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_setters) {
        return *m_faults.source_setters;
    }
    auto valid = validate_source_param(param, value);
    if (!valid) {
        return valid.error();
    }

    src.value()->params[static_cast<std::size_t>(param)] = value;
    return {};
}

NativeResult<float> NullAudioBackend::source_param(SourceId source, SourceParam param) const {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_queries) {
        return *m_faults.source_queries;
    }
    return src.value()->params[static_cast<std::size_t>(param)];
}

NativeResult<void> NullAudioBackend::set_source_flag(SourceId source, SourceFlag flag, bool value) {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_setters) {
        return *m_faults.source_setters;
    }

    switch (flag) {
        case SourceFlag::Looping: src.value()->looping = value; break;
        case SourceFlag::Relative: src.value()->relative = value; break;
    }
    return {};
}

NativeResult<bool> NullAudioBackend::source_flag(SourceId source, SourceFlag flag) const {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_queries) {
        return *m_faults.source_queries;
    }

    switch (flag) {
        case SourceFlag::Looping: return src.value()->looping;
        case SourceFlag::Relative: return src.value()->relative;
    }
    return NativeError::invalid_enum(to_string(flag));
}

NativeResult<void> NullAudioBackend::set_source_position(SourceId source, const Vec3& position) {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_setters) {
        return *m_faults.source_setters;
    }
    auto valid = validate_position(position);
    if (!valid) {
        return valid.error();
    }

    src.value()->position = position;
    return {};
}

NativeResult<Vec3> NullAudioBackend::source_position(SourceId source) const {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_queries) {
        return *m_faults.source_queries;
    }
    return src.value()->position;
}

NativeResult<void> NullAudioBackend::play_source(SourceId source) {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_setters) {
        return *m_faults.source_setters;
    }
    if (!src.value()->buffer) {
        return NativeError::invalid_operation("source has no buffer");
    }

    src.value()->state = SourceState::Playing;
    return {};
}

NativeResult<void> NullAudioBackend::stop_source(SourceId source) {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_setters) {
        return *m_faults.source_setters;
    }

    if (src.value()->state != SourceState::Initial) {
        src.value()->state = SourceState::Stopped;
    }
    return {};
}

NativeResult<SourceState> NullAudioBackend::source_state(SourceId source) const {
    auto src = lookup_source(source);
    if (!src) {
        return src.error();
    }
    if (m_faults.source_queries) {
        return *m_faults.source_queries;
    }
    return src.value()->state;
}

// -----------------------------------------------------------------------------
// Listener
// -----------------------------------------------------------------------------

NativeResult<void> NullAudioBackend::set_listener_position(const Vec3& position) {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    if (m_faults.listener) {
        return *m_faults.listener;
    }
    auto valid = validate_position(position);
    if (!valid) {
        return valid.error();
    }
    ctx.value()->listener.position = position;
    return {};
}

NativeResult<Vec3> NullAudioBackend::listener_position() const {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    return ctx.value()->listener.position;
}

NativeResult<void> NullAudioBackend::set_listener_orientation(const Orientation& orientation) {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    if (m_faults.listener) {
        return *m_faults.listener;
    }
    ctx.value()->listener.orientation = orientation;
    return {};
}

NativeResult<Orientation> NullAudioBackend::listener_orientation() const {
    auto ctx = lookup_current();
    if (!ctx) {
        return ctx.error();
    }
    return ctx.value()->listener.orientation;
}

} // namespace sonance_audio
