/// @file decoder.cpp
/// @brief WAV/MP3 decoding through the miniaudio decoder

#include <sonance/audio/decoder.hpp>
#include <sonance/core/log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace sonance_audio {

using sonance_core::AudioError;
using sonance_core::Error;
using sonance_core::NativeError;
using sonance_core::Result;

namespace {

constexpr ma_uint64 k_read_chunk_frames = 4096;

Error load_failed(const std::string& name, NativeError err) {
    return Error(AudioError::asset_load_failed(name, std::move(err)));
}

NativeError decode_error(ma_result result, const char* what) {
    return NativeError::invalid_data(std::string(what) + ": " + ma_result_description(result));
}

ma_encoding_format to_encoding(AudioFileFormat format) {
    switch (format) {
        case AudioFileFormat::WAV: return ma_encoding_format_wav;
        case AudioFileFormat::MP3: return ma_encoding_format_mp3;
        case AudioFileFormat::Unknown: break;
    }
    return ma_encoding_format_unknown;
}

} // anonymous namespace

// =============================================================================
// Audio File Detection
// =============================================================================

AudioFileFormat detect_audio_format(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".wav" || ext == ".wave") return AudioFileFormat::WAV;
    if (ext == ".mp3") return AudioFileFormat::MP3;

    return AudioFileFormat::Unknown;
}

AudioFileFormat detect_audio_format(std::span<const std::byte> data) {
    if (data.size() < 4) return AudioFileFormat::Unknown;

    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());

    // WAV: "RIFF" + size + "WAVE"
    if (data.size() >= 12 &&
        bytes[0] == 'R' && bytes[1] == 'I' && bytes[2] == 'F' && bytes[3] == 'F' &&
        bytes[8] == 'W' && bytes[9] == 'A' && bytes[10] == 'V' && bytes[11] == 'E') {
        return AudioFileFormat::WAV;
    }

    // MP3: ID3 tag or frame sync
    if ((bytes[0] == 'I' && bytes[1] == 'D' && bytes[2] == '3') ||
        (bytes[0] == 0xFF && (bytes[1] & 0xE0) == 0xE0)) {
        return AudioFileFormat::MP3;
    }

    return AudioFileFormat::Unknown;
}

// =============================================================================
// Decoder Implementation
// =============================================================================

struct Decoder::Impl {
    std::string name;
    std::vector<std::byte> bytes;
    ma_decoder decoder{};
    bool initialized = false;
    ma_format native_format = ma_format_unknown;
    AudioFileInfo info;

    ~Impl() {
        if (initialized) {
            ma_decoder_uninit(&decoder);
        }
    }
};

Decoder::Decoder(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}
Decoder::Decoder(Decoder&& other) noexcept = default;
Decoder& Decoder::operator=(Decoder&& other) noexcept = default;
Decoder::~Decoder() = default;

const AudioFileInfo& Decoder::info() const {
    return m_impl->info;
}

const std::string& Decoder::name() const {
    return m_impl->name;
}

Result<Decoder> Decoder::open_file(const std::filesystem::path& path) {
    const std::string name = path.string();

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return load_failed(name, NativeError::io_error("cannot open file"));
    }

    const auto size = static_cast<std::size_t>(file.tellg());
    file.seekg(0);

    std::vector<std::byte> bytes(size);
    if (!file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size))) {
        return load_failed(name, NativeError::io_error("short read"));
    }

    return open_memory(bytes, name);
}

Result<Decoder> Decoder::open_memory(std::span<const std::byte> data, const std::string& name) {
    AudioFileFormat format = detect_audio_format(data);
    if (format == AudioFileFormat::Unknown) {
        format = detect_audio_format(std::filesystem::path(name));
    }
    if (format == AudioFileFormat::Unknown) {
        return load_failed(name, NativeError::invalid_data("unrecognized audio format"));
    }

    auto impl = std::make_unique<Impl>();
    impl->name = name;
    impl->bytes.assign(data.begin(), data.end());

    // Native output format, so the source sample width stays observable
    ma_decoder_config config = ma_decoder_config_init(ma_format_unknown, 0, 0);
    config.encodingFormat = to_encoding(format);

    ma_result result = ma_decoder_init_memory(impl->bytes.data(), impl->bytes.size(), &config, &impl->decoder);
    if (result != MA_SUCCESS) {
        return load_failed(name, decode_error(result, "ma_decoder_init_memory"));
    }
    impl->initialized = true;

    ma_uint32 channels = 0;
    ma_uint32 sample_rate = 0;
    result = ma_decoder_get_data_format(&impl->decoder, &impl->native_format, &channels, &sample_rate, nullptr, 0);
    if (result != MA_SUCCESS) {
        return load_failed(name, decode_error(result, "ma_decoder_get_data_format"));
    }

    ma_uint64 length = 0;
    if (ma_decoder_get_length_in_pcm_frames(&impl->decoder, &length) != MA_SUCCESS) {
        length = 0;
    }

    impl->info.file_format = format;
    impl->info.sample_rate = sample_rate;
    impl->info.channels = channels;
    impl->info.bits_per_sample = ma_get_bytes_per_sample(impl->native_format) * 8;
    impl->info.frame_count = length;
    impl->info.file_size = impl->bytes.size();

    return Decoder(std::move(impl));
}

Result<std::vector<std::int16_t>> Decoder::read_all_s16() {
    Impl& impl = *m_impl;
    const ma_uint32 channels = impl.info.channels;
    const ma_uint32 bytes_per_frame = ma_get_bytes_per_frame(impl.native_format, channels);
    if (bytes_per_frame == 0) {
        return load_failed(impl.name, NativeError::invalid_data("unsupported sample format"));
    }

    std::vector<std::uint8_t> raw;
    if (impl.info.frame_count > 0) {
        raw.reserve(static_cast<std::size_t>(impl.info.frame_count) * bytes_per_frame);
    }

    std::vector<std::uint8_t> chunk(static_cast<std::size_t>(k_read_chunk_frames) * bytes_per_frame);
    for (;;) {
        ma_uint64 frames_read = 0;
        ma_result result = ma_decoder_read_pcm_frames(&impl.decoder, chunk.data(), k_read_chunk_frames, &frames_read);
        if (result != MA_SUCCESS && result != MA_AT_END) {
            return load_failed(impl.name, decode_error(result, "ma_decoder_read_pcm_frames"));
        }

        raw.insert(raw.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(frames_read * bytes_per_frame));
        if (result == MA_AT_END || frames_read < k_read_chunk_frames) {
            break;
        }
    }

    const ma_uint64 frames = raw.size() / bytes_per_frame;
    std::vector<std::int16_t> samples(static_cast<std::size_t>(frames * channels));
    if (!samples.empty()) {
        ma_pcm_convert(samples.data(), ma_format_s16, raw.data(), impl.native_format,
                       frames * channels, ma_dither_mode_none);
    }

    sonance_core::audio_logger()->debug("Decoded '{}': {} frames, {} channels, {} Hz, {}-bit {}",
        impl.name, frames, channels, impl.info.sample_rate, impl.info.bits_per_sample,
        to_string(impl.info.file_format));

    return samples;
}

// =============================================================================
// Convenience
// =============================================================================

namespace {

Result<DecodedAudio> decode_all(Result<Decoder> opened) {
    if (!opened) {
        return opened.error();
    }

    Decoder& decoder = opened.value();
    auto samples = decoder.read_all_s16();
    if (!samples) {
        return samples.error();
    }

    DecodedAudio out;
    out.file_format = decoder.info().file_format;
    out.native_bits_per_sample = decoder.info().bits_per_sample;
    out.channels = decoder.info().channels;
    out.sample_rate = decoder.info().sample_rate;
    out.samples = std::move(samples).value();
    return out;
}

} // anonymous namespace

Result<DecodedAudio> decode_file(const std::filesystem::path& path) {
    return decode_all(Decoder::open_file(path));
}

Result<DecodedAudio> decode_memory(std::span<const std::byte> data, const std::string& name) {
    return decode_all(Decoder::open_memory(data, name));
}

} // namespace sonance_audio
