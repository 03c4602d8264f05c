// Shared fixtures for sonance_audio tests: in-memory WAV files and a
// context on the null backend.

#pragma once

#include <sonance/audio/audio.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sonance_test {

/// Deterministic 16-bit test signal
inline std::int16_t fixture_sample(std::uint32_t frame, std::uint32_t channel) {
    return static_cast<std::int16_t>(static_cast<int>((frame * 37u + channel * 4001u) % 16000u) - 8000);
}

namespace detail {

inline void put_u16(std::vector<std::byte>& out, std::uint16_t v) {
    out.push_back(static_cast<std::byte>(v & 0xFF));
    out.push_back(static_cast<std::byte>((v >> 8) & 0xFF));
}

inline void put_u32(std::vector<std::byte>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFF));
    }
}

inline void put_tag(std::vector<std::byte>& out, const char* tag) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::byte>(tag[i]));
    }
}

} // namespace detail

/// Build a PCM WAV file (8, 16 or 24 bits per sample)
inline std::vector<std::byte> make_wav(std::uint16_t channels, std::uint32_t sample_rate,
                                       std::uint16_t bits, std::uint32_t frames) {
    const std::uint16_t bytes_per_sample = bits / 8;
    const std::uint16_t block_align = static_cast<std::uint16_t>(channels * bytes_per_sample);
    const std::uint32_t data_size = frames * block_align;

    std::vector<std::byte> out;
    detail::put_tag(out, "RIFF");
    detail::put_u32(out, 36 + data_size);
    detail::put_tag(out, "WAVE");

    detail::put_tag(out, "fmt ");
    detail::put_u32(out, 16);
    detail::put_u16(out, 1);  // PCM
    detail::put_u16(out, channels);
    detail::put_u32(out, sample_rate);
    detail::put_u32(out, sample_rate * block_align);
    detail::put_u16(out, block_align);
    detail::put_u16(out, bits);

    detail::put_tag(out, "data");
    detail::put_u32(out, data_size);

    for (std::uint32_t f = 0; f < frames; ++f) {
        for (std::uint16_t c = 0; c < channels; ++c) {
            const std::int16_t s = fixture_sample(f, c);
            switch (bits) {
                case 8:
                    out.push_back(static_cast<std::byte>(static_cast<std::uint8_t>((s >> 8) + 128)));
                    break;
                case 16:
                    detail::put_u16(out, static_cast<std::uint16_t>(s));
                    break;
                case 24:
                    out.push_back(std::byte{0});
                    detail::put_u16(out, static_cast<std::uint16_t>(s));
                    break;
                default:
                    break;
            }
        }
    }

    return out;
}

/// 16-bit WAV
inline std::vector<std::byte> make_wav_s16(std::uint16_t channels, std::uint32_t sample_rate, std::uint32_t frames) {
    return make_wav(channels, sample_rate, 16, frames);
}

/// Silent MPEG-1 Layer III stream: 128 kbps, 44.1 kHz, mono or stereo.
/// Every frame is a header followed by zeroed side info and main data.
inline std::vector<std::byte> make_mp3(std::uint16_t channels, std::uint32_t frames) {
    constexpr std::size_t k_frame_bytes = 417;  // 144 * 128000 / 44100, no padding
    const std::uint8_t mode = channels == 1 ? 0xC4 : 0x04;  // mono / stereo, original

    std::vector<std::byte> out;
    out.reserve(frames * k_frame_bytes);
    for (std::uint32_t f = 0; f < frames; ++f) {
        out.push_back(std::byte{0xFF});
        out.push_back(std::byte{0xFB});
        out.push_back(std::byte{0x90});
        out.push_back(static_cast<std::byte>(mode));
        out.resize(out.size() + k_frame_bytes - 4, std::byte{0});
    }
    return out;
}

/// Samples per channel in one MPEG-1 Layer III frame
inline constexpr std::uint32_t k_mp3_frame_samples = 1152;

/// Null backend plus a context opened on it
struct NullContext {
    std::shared_ptr<sonance_audio::NullAudioBackend> backend;
    sonance_audio::Context context;

    static NullContext open(const sonance_audio::AudioConfig& config = {}) {
        auto backend = std::make_shared<sonance_audio::NullAudioBackend>();
        auto context = sonance_audio::Context::open(backend, config);
        return NullContext{backend, std::move(context).value()};
    }
};

} // namespace sonance_test
