/// @file sound_asset.cpp
/// @brief Decode pipeline: file -> s16 PCM -> one or two device buffers

#include <sonance/audio/sound_asset.hpp>
#include <sonance/audio/decoder.hpp>
#include <sonance/audio/pcm.hpp>
#include <sonance/core/log.hpp>

namespace sonance_audio {

using sonance_core::AudioError;
using sonance_core::Error;
using sonance_core::Result;

// =============================================================================
// DeviceBuffer
// =============================================================================

DeviceBuffer::DeviceBuffer(ContextRef context, BufferId id, const BufferData& data)
    : m_context(std::move(context))
    , m_id(id)
    , m_layout(data.layout)
    , m_sample_rate(data.sample_rate)
    , m_frame_count(data.frame_count()) {
}

DeviceBuffer::DeviceBuffer(DeviceBuffer&& other) noexcept
    : m_context(std::move(other.m_context))
    , m_id(other.m_id)
    , m_layout(other.m_layout)
    , m_sample_rate(other.m_sample_rate)
    , m_frame_count(other.m_frame_count) {
    other.m_id = BufferId{};
}

DeviceBuffer& DeviceBuffer::operator=(DeviceBuffer&& other) noexcept {
    if (this != &other) {
        release();
        m_context = std::move(other.m_context);
        m_id = other.m_id;
        m_layout = other.m_layout;
        m_sample_rate = other.m_sample_rate;
        m_frame_count = other.m_frame_count;
        other.m_id = BufferId{};
    }
    return *this;
}

DeviceBuffer::~DeviceBuffer() {
    release();
}

void DeviceBuffer::release() {
    if (m_id && m_context.backend_ptr()) {
        m_context.backend().destroy_buffer(m_id);
    }
    m_id = BufferId{};
}

Result<DeviceBuffer> DeviceBuffer::upload(const ContextRef& context, const BufferData& data) {
    auto active = context.activate();
    if (!active) {
        return Error(AudioError::buffer_upload_failed(active.error()));
    }

    auto id = context.backend().create_buffer();
    if (!id) {
        return Error(AudioError::buffer_upload_failed(id.error()));
    }

    // Owned from here on, so a failed upload releases the allocation
    DeviceBuffer buffer(context, id.value(), data);

    auto uploaded = context.backend().buffer_data(id.value(), data);
    if (!uploaded) {
        return Error(AudioError::buffer_upload_failed(uploaded.error()));
    }

    return buffer;
}

// =============================================================================
// SoundAsset
// =============================================================================

SoundAsset::SoundAsset(ContextRef context, std::string name, DeviceBuffer primary, std::optional<DeviceBuffer> mono)
    : m_context(std::move(context))
    , m_name(std::move(name))
    , m_primary(std::move(primary))
    , m_mono(std::move(mono)) {
}

Result<SoundAsset> SoundAsset::decode(const Context& context, const std::filesystem::path& path) {
    return decode(context, path, context.config().decode);
}

Result<SoundAsset> SoundAsset::decode(const Context& context,
                                      const std::filesystem::path& path,
                                      const DecodeOptions& options) {
    auto decoder = Decoder::open_file(path);
    if (!decoder) {
        return decoder.error();
    }
    return from_decoder(context, decoder.value(), options);
}

Result<SoundAsset> SoundAsset::decode_memory(const Context& context,
                                             std::span<const std::byte> data,
                                             const std::string& name,
                                             const DecodeOptions& options) {
    auto decoder = Decoder::open_memory(data, name);
    if (!decoder) {
        return decoder.error();
    }
    return from_decoder(context, decoder.value(), options);
}

Result<SoundAsset> SoundAsset::from_decoder(const Context& context,
                                            Decoder& decoder,
                                            const DecodeOptions& options) {
    const AudioFileInfo& info = decoder.info();
    const std::string& name = decoder.name();

    // Checked before any device buffer exists
    auto layout = layout_for_channels(info.channels);
    if (!layout) {
        return Error(AudioError::unsupported_channel_layout(name, info.channels));
    }

    if (options.strict_mono16) {
        if (*layout != ChannelLayout::Mono) {
            return Error(AudioError::not_mono(name, info.channels));
        }
        if (info.file_format == AudioFileFormat::WAV && info.bits_per_sample != 16) {
            return Error(AudioError::not_sixteen_bit(name, info.bits_per_sample));
        }
    }

    auto samples = decoder.read_all_s16();
    if (!samples) {
        return samples.error();
    }
    const std::vector<std::int16_t>& pcm = samples.value();

    const ContextRef ref = context.ref();

    BufferData primary_data;
    primary_data.layout = *layout;
    primary_data.sample_rate = info.sample_rate;
    primary_data.samples = pcm;

    auto primary = DeviceBuffer::upload(ref, primary_data);
    if (!primary) {
        return primary.error();
    }

    std::optional<DeviceBuffer> mono;
    if (*layout == ChannelLayout::Stereo) {
        // Spatialization takes mono input: keep channel 0 verbatim
        const std::vector<std::int16_t> left = extract_channel(pcm, info.channels, 0);

        BufferData mono_data;
        mono_data.layout = ChannelLayout::Mono;
        mono_data.sample_rate = info.sample_rate;
        mono_data.samples = left;

        auto uploaded = DeviceBuffer::upload(ref, mono_data);
        if (!uploaded) {
            return uploaded.error();
        }
        mono = std::move(uploaded).value();
    }

    sonance_core::audio_logger()->info("Loaded sound '{}' ({}, {} Hz, {} frames{})",
        name, to_string(*layout), info.sample_rate, primary.value().frame_count(),
        mono ? ", mono copy for spatialization" : "");

    return SoundAsset(ref, name, std::move(primary).value(), std::move(mono));
}

float SoundAsset::duration() const {
    return duration_seconds(m_primary.frame_count(), m_primary.sample_rate());
}

} // namespace sonance_audio
