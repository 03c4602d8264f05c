/// @file types.cpp
/// @brief Core type implementations for sonance_audio

#include <sonance/audio/types.hpp>

namespace sonance_audio {

// =============================================================================
// Channel Layout
// =============================================================================

std::uint32_t channel_count(ChannelLayout layout) {
    switch (layout) {
        case ChannelLayout::Mono: return 1;
        case ChannelLayout::Stereo: return 2;
    }
    return 1;
}

std::optional<ChannelLayout> layout_for_channels(std::uint32_t channels) {
    switch (channels) {
        case 1: return ChannelLayout::Mono;
        case 2: return ChannelLayout::Stereo;
        default: return std::nullopt;
    }
}

const char* to_string(ChannelLayout layout) {
    switch (layout) {
        case ChannelLayout::Mono: return "Mono";
        case ChannelLayout::Stereo: return "Stereo";
    }
    return "Unknown";
}

// =============================================================================
// String Conversions
// =============================================================================

const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::Simple: return "Simple";
        case SourceKind::Positional: return "Positional";
    }
    return "Unknown";
}

const char* to_string(SourceState state) {
    switch (state) {
        case SourceState::Initial: return "Initial";
        case SourceState::Playing: return "Playing";
        case SourceState::Paused: return "Paused";
        case SourceState::Stopped: return "Stopped";
    }
    return "Unknown";
}

const char* to_string(SourceParam param) {
    switch (param) {
        case SourceParam::Gain: return "Gain";
        case SourceParam::MaxGain: return "MaxGain";
        case SourceParam::MinGain: return "MinGain";
        case SourceParam::MaxDistance: return "MaxDistance";
        case SourceParam::ReferenceDistance: return "ReferenceDistance";
        case SourceParam::RolloffFactor: return "RolloffFactor";
    }
    return "Unknown";
}

const char* to_string(SourceFlag flag) {
    switch (flag) {
        case SourceFlag::Looping: return "Looping";
        case SourceFlag::Relative: return "Relative";
    }
    return "Unknown";
}

const char* to_string(AudioFileFormat format) {
    switch (format) {
        case AudioFileFormat::Unknown: return "Unknown";
        case AudioFileFormat::WAV: return "WAV";
        case AudioFileFormat::MP3: return "MP3";
    }
    return "Unknown";
}

} // namespace sonance_audio
