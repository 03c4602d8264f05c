/// @file config.hpp
/// @brief Audio configuration (audio.toml) for sonance_audio

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <sonance/core/error.hpp>

#include <filesystem>
#include <string>

namespace sonance_audio {

/// [logging] section
struct LoggingConfig {
    std::string level = "info";
    std::string directory;          ///< Rotating log files are written here when set
};

/// Complete library configuration
struct AudioConfig {
    DeviceConfig device;
    DecodeOptions decode;
    AttenuationSettings positional; ///< Applied to every new positional source
    LoggingConfig logging;
};

/// Load configuration from a TOML file
sonance_core::Result<AudioConfig> load_audio_config(const std::filesystem::path& path);

/// Parse configuration from TOML text
sonance_core::Result<AudioConfig> parse_audio_config(const std::string& content,
                                                     const std::string& source_name = "audio.toml");

/// Apply the [logging] section to the spdlog loggers
sonance_core::Result<void> apply_logging_config(const LoggingConfig& config);

} // namespace sonance_audio
