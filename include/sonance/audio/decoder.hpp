/// @file decoder.hpp
/// @brief WAV/MP3 decoding to interleaved signed 16-bit PCM

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <sonance/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace sonance_audio {

// =============================================================================
// Format Detection
// =============================================================================

/// Detect audio file format from the path extension
AudioFileFormat detect_audio_format(const std::filesystem::path& path);

/// Detect audio file format from the leading bytes
AudioFileFormat detect_audio_format(std::span<const std::byte> data);

// =============================================================================
// Decoder
// =============================================================================

/// Fully decoded audio
struct DecodedAudio {
    AudioFileFormat file_format = AudioFileFormat::Unknown;
    std::uint32_t native_bits_per_sample = 0;
    std::uint32_t channels = 0;
    std::uint32_t sample_rate = 0;
    std::vector<std::int16_t> samples;  ///< Interleaved

    [[nodiscard]] std::size_t frame_count() const {
        return channels == 0 ? 0 : samples.size() / channels;
    }
};

/// Decoder over an in-memory WAV or MP3 file.
///
/// The header is parsed on open, so info() can be inspected before any
/// sample is decoded. Failures are reported as AssetLoadFailed.
class Decoder {
public:
    /// Read a file into memory and open it
    static sonance_core::Result<Decoder> open_file(const std::filesystem::path& path);

    /// Open an encoded file already in memory (the bytes are copied)
    static sonance_core::Result<Decoder> open_memory(std::span<const std::byte> data,
                                                     const std::string& name = "<memory>");

    Decoder(Decoder&& other) noexcept;
    Decoder& operator=(Decoder&& other) noexcept;
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /// File information (native sample width, channels, rate)
    [[nodiscard]] const AudioFileInfo& info() const;

    /// Name used in error messages (the path for files)
    [[nodiscard]] const std::string& name() const;

    /// Decode every remaining frame as interleaved s16
    sonance_core::Result<std::vector<std::int16_t>> read_all_s16();

private:
    struct Impl;
    explicit Decoder(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

/// Decode a whole file
sonance_core::Result<DecodedAudio> decode_file(const std::filesystem::path& path);

/// Decode a whole in-memory file
sonance_core::Result<DecodedAudio> decode_memory(std::span<const std::byte> data,
                                                 const std::string& name = "<memory>");

} // namespace sonance_audio
