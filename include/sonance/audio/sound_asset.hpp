/// @file sound_asset.hpp
/// @brief Decoded sound resident in device buffers

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "context.hpp"

#include <sonance/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace sonance_audio {

// =============================================================================
// DeviceBuffer
// =============================================================================

/// Owned device buffer (released on destruction)
class DeviceBuffer {
public:
    /// Allocate a buffer in the context and upload PCM into it
    static sonance_core::Result<DeviceBuffer> upload(const ContextRef& context, const BufferData& data);

    DeviceBuffer(DeviceBuffer&& other) noexcept;
    DeviceBuffer& operator=(DeviceBuffer&& other) noexcept;
    ~DeviceBuffer();

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;

    [[nodiscard]] BufferId id() const { return m_id; }
    [[nodiscard]] ChannelLayout layout() const { return m_layout; }
    [[nodiscard]] std::uint32_t sample_rate() const { return m_sample_rate; }
    [[nodiscard]] std::size_t frame_count() const { return m_frame_count; }
    [[nodiscard]] std::size_t sample_count() const { return m_frame_count * channel_count(m_layout); }

private:
    DeviceBuffer(ContextRef context, BufferId id, const BufferData& data);
    void release();

    ContextRef m_context;
    BufferId m_id;
    ChannelLayout m_layout = ChannelLayout::Mono;
    std::uint32_t m_sample_rate = 0;
    std::size_t m_frame_count = 0;
};

// =============================================================================
// SoundAsset
// =============================================================================

/// A decoded sound held in one or two device buffers.
///
/// The primary buffer carries the full-channel mix. Stereo input also gets a
/// mono buffer holding channel 0, which is what positional sources play since
/// spatialization only accepts mono input. Immutable after construction.
///
/// Sources created from an asset must be destroyed before the asset.
class SoundAsset {
public:
    /// Decode a WAV or MP3 file with the context's decode options
    static sonance_core::Result<SoundAsset> decode(const Context& context, const std::filesystem::path& path);

    static sonance_core::Result<SoundAsset> decode(const Context& context,
                                                   const std::filesystem::path& path,
                                                   const DecodeOptions& options);

    /// Decode an encoded file already in memory
    static sonance_core::Result<SoundAsset> decode_memory(const Context& context,
                                                          std::span<const std::byte> data,
                                                          const std::string& name,
                                                          const DecodeOptions& options = {});

    SoundAsset(SoundAsset&&) noexcept = default;
    SoundAsset& operator=(SoundAsset&&) noexcept = default;

    // =========================================================================
    // Buffers
    // =========================================================================

    /// Full-channel buffer
    [[nodiscard]] const DeviceBuffer& primary_buffer() const { return m_primary; }

    /// Channel 0 of a stereo input (absent for mono input)
    [[nodiscard]] const DeviceBuffer* mono_buffer() const { return m_mono ? &*m_mono : nullptr; }

    /// Buffer a positional source binds: the mono buffer if present, else the primary
    [[nodiscard]] const DeviceBuffer& spatial_buffer() const { return m_mono ? *m_mono : m_primary; }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ChannelLayout layout() const { return m_primary.layout(); }
    [[nodiscard]] std::uint32_t channels() const { return channel_count(m_primary.layout()); }
    [[nodiscard]] std::uint32_t sample_rate() const { return m_primary.sample_rate(); }
    [[nodiscard]] std::size_t frame_count() const { return m_primary.frame_count(); }

    /// Duration in seconds
    [[nodiscard]] float duration() const;

    /// Context the buffers live in
    [[nodiscard]] const ContextRef& context() const { return m_context; }

private:
    SoundAsset(ContextRef context, std::string name, DeviceBuffer primary, std::optional<DeviceBuffer> mono);

    static sonance_core::Result<SoundAsset> from_decoder(const Context& context,
                                                         Decoder& decoder,
                                                         const DecodeOptions& options);

    ContextRef m_context;
    std::string m_name;
    DeviceBuffer m_primary;
    std::optional<DeviceBuffer> m_mono;
};

} // namespace sonance_audio
