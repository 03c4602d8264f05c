/// @file pcm.hpp
/// @brief Interleaved PCM helpers for sonance_audio

#pragma once

#include "types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace sonance_audio {

/// Number of whole frames in an interleaved block
[[nodiscard]] std::size_t frame_count(std::span<const std::int16_t> interleaved, std::uint32_t channels);

/// Copy one channel out of an interleaved block.
/// The samples are taken verbatim; this is the downmix used for spatial
/// playback of stereo material (channel 0 only, no averaging).
[[nodiscard]] std::vector<std::int16_t> extract_channel(
    std::span<const std::int16_t> interleaved,
    std::uint32_t channels,
    std::uint32_t index);

/// Playback length of a block in seconds
[[nodiscard]] float duration_seconds(std::uint64_t frames, std::uint32_t sample_rate);

} // namespace sonance_audio
