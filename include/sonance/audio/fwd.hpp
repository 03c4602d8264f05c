/// @file fwd.hpp
/// @brief Forward declarations for sonance_audio

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace sonance_audio {

// =============================================================================
// Handle Types
// =============================================================================

/// Native audio device handle
struct DeviceId {
    std::uint32_t value = 0;
    bool operator==(const DeviceId& other) const { return value == other.value; }
    bool operator!=(const DeviceId& other) const { return value != other.value; }
    explicit operator bool() const { return value != 0; }
};

/// Native rendering context handle
struct ContextId {
    std::uint32_t value = 0;
    bool operator==(const ContextId& other) const { return value == other.value; }
    bool operator!=(const ContextId& other) const { return value != other.value; }
    explicit operator bool() const { return value != 0; }
};

/// Native audio buffer handle
struct BufferId {
    std::uint32_t value = 0;
    bool operator==(const BufferId& other) const { return value == other.value; }
    bool operator!=(const BufferId& other) const { return value != other.value; }
    explicit operator bool() const { return value != 0; }
};

/// Native emitter handle
struct SourceId {
    std::uint32_t value = 0;
    bool operator==(const SourceId& other) const { return value == other.value; }
    bool operator!=(const SourceId& other) const { return value != other.value; }
    explicit operator bool() const { return value != 0; }
};

// =============================================================================
// Enumerations
// =============================================================================

enum class ChannelLayout : std::uint8_t;
enum class SourceKind : std::uint8_t;
enum class SourceState : std::uint8_t;
enum class SourceParam : std::uint8_t;
enum class SourceFlag : std::uint8_t;
enum class AudioFileFormat : std::uint8_t;

// =============================================================================
// Core Types
// =============================================================================

struct Orientation;
struct BufferData;
struct DeviceConfig;
struct DecodeOptions;
struct AttenuationSettings;
struct AudioBackendInfo;
struct AudioConfig;
struct AudioFileInfo;

// =============================================================================
// Classes
// =============================================================================

// Backend
class IAudioBackend;
class NullAudioBackend;
class MiniaudioBackend;

// Decoding
class Decoder;

// Context
class Context;
class ContextRef;
class Listener;

// Assets
class DeviceBuffer;
class SoundAsset;

// Sources
class IPlayback;
class Emitter;
class SimpleSource;
class PositionalSource;
class SoundSource;

// =============================================================================
// Smart Pointers
// =============================================================================

using BackendPtr = std::shared_ptr<IAudioBackend>;

} // namespace sonance_audio

// Hash specializations for use in unordered containers
namespace std {
    template<> struct hash<sonance_audio::DeviceId> {
        std::size_t operator()(const sonance_audio::DeviceId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };

    template<> struct hash<sonance_audio::ContextId> {
        std::size_t operator()(const sonance_audio::ContextId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };

    template<> struct hash<sonance_audio::BufferId> {
        std::size_t operator()(const sonance_audio::BufferId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };

    template<> struct hash<sonance_audio::SourceId> {
        std::size_t operator()(const sonance_audio::SourceId& id) const noexcept {
            return std::hash<std::uint32_t>{}(id.value);
        }
    };
}
