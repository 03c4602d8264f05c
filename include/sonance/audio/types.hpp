/// @file types.hpp
/// @brief Core type definitions for sonance_audio

#pragma once

#include "fwd.hpp"

#include <sonance/math/types.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>

namespace sonance_audio {

using sonance_math::Vec3;
using sonance_math::Quat;

// =============================================================================
// Channel Layout
// =============================================================================

/// Channel layout of a device buffer
enum class ChannelLayout : std::uint8_t {
    Mono,       ///< 1 channel
    Stereo      ///< 2 interleaved channels (left, right)
};

/// Get number of channels for layout
[[nodiscard]] std::uint32_t channel_count(ChannelLayout layout);

/// Get layout for a channel count (only 1 and 2 are supported)
[[nodiscard]] std::optional<ChannelLayout> layout_for_channels(std::uint32_t channels);

/// Convert layout to string
const char* to_string(ChannelLayout layout);

// =============================================================================
// Sources
// =============================================================================

/// Emitter type
enum class SourceKind : std::uint8_t {
    Simple,     ///< Listener-relative, never attenuated or panned
    Positional  ///< Spatialized relative to the listener
};

/// Convert kind to string
const char* to_string(SourceKind kind);

/// Emitter playback state as reported by the native layer
enum class SourceState : std::uint8_t {
    Initial,    ///< Source has not been played yet
    Playing,    ///< Source is currently playing
    Paused,     ///< Source is paused
    Stopped     ///< Source has stopped
};

/// Convert state to string
const char* to_string(SourceState state);

/// Float parameters of a native emitter
enum class SourceParam : std::uint8_t {
    Gain,
    MaxGain,
    MinGain,
    MaxDistance,
    ReferenceDistance,
    RolloffFactor
};

/// Convert parameter to string
const char* to_string(SourceParam param);

/// Boolean flags of a native emitter
enum class SourceFlag : std::uint8_t {
    Looping,
    Relative    ///< Position is relative to the listener
};

/// Convert flag to string
const char* to_string(SourceFlag flag);

// =============================================================================
// Listener
// =============================================================================

/// Listener orientation ("at" and "up" vectors, passed through uninterpreted)
struct Orientation {
    Vec3 at = sonance_math::vec3::FORWARD;
    Vec3 up = sonance_math::vec3::UP;
};

// =============================================================================
// Buffer Upload
// =============================================================================

/// Interleaved signed 16-bit PCM handed to the device
struct BufferData {
    ChannelLayout layout = ChannelLayout::Mono;
    std::uint32_t sample_rate = 44100;
    std::span<const std::int16_t> samples;

    /// Number of frames (samples per channel)
    [[nodiscard]] std::size_t frame_count() const {
        return samples.size() / channel_count(layout);
    }
};

// =============================================================================
// Files
// =============================================================================

/// Supported audio file formats
enum class AudioFileFormat : std::uint8_t {
    Unknown,
    WAV,
    MP3
};

/// Convert file format to string
const char* to_string(AudioFileFormat format);

/// Audio file information
struct AudioFileInfo {
    AudioFileFormat file_format = AudioFileFormat::Unknown;
    std::uint32_t sample_rate = 0;
    std::uint32_t channels = 0;
    std::uint32_t bits_per_sample = 0;  ///< Native sample width before normalization
    std::uint64_t frame_count = 0;      ///< 0 when the container does not report it
    std::uint64_t file_size = 0;
};

// =============================================================================
// Configuration Blocks
// =============================================================================

/// Output device selection
struct DeviceConfig {
    std::string backend = "miniaudio";  ///< "miniaudio" or "null"
    std::string name;                   ///< Empty selects the default device
    std::uint32_t sample_rate = 0;      ///< 0 uses the device native rate
    std::uint32_t channels = 2;
};

/// Decode pipeline options
struct DecodeOptions {
    /// Legacy mode: accept only 16-bit mono input
    bool strict_mono16 = false;
};

/// Distance attenuation defaults applied to new positional sources
struct AttenuationSettings {
    float reference_distance = 0.0f;
    float max_distance = std::numeric_limits<float>::max();
    float rolloff_factor = 1.0f;
    float min_gain = 0.0f;
};

// =============================================================================
// Backend Information
// =============================================================================

/// Information about an audio backend
struct AudioBackendInfo {
    std::string name;
    std::string version;
    std::string device_name;
    std::uint32_t sample_rate = 0;
    std::uint32_t channels = 0;
};

} // namespace sonance_audio
