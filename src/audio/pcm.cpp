/// @file pcm.cpp
/// @brief Interleaved PCM helpers for sonance_audio

#include <sonance/audio/pcm.hpp>

namespace sonance_audio {

std::size_t frame_count(std::span<const std::int16_t> interleaved, std::uint32_t channels) {
    if (channels == 0) {
        return 0;
    }
    return interleaved.size() / channels;
}

std::vector<std::int16_t> extract_channel(
    std::span<const std::int16_t> interleaved,
    std::uint32_t channels,
    std::uint32_t index)
{
    std::vector<std::int16_t> out;
    if (channels == 0 || index >= channels) {
        return out;
    }

    const std::size_t frames = frame_count(interleaved, channels);
    out.reserve(frames);
    for (std::size_t i = 0; i < frames; ++i) {
        out.push_back(interleaved[i * channels + index]);
    }
    return out;
}

float duration_seconds(std::uint64_t frames, std::uint32_t sample_rate) {
    if (sample_rate == 0) {
        return 0.0f;
    }
    return static_cast<float>(static_cast<double>(frames) / static_cast<double>(sample_rate));
}

} // namespace sonance_audio
