/// @file config.cpp
/// @brief Audio configuration (audio.toml) parsing implementation

#include <sonance/audio/config.hpp>
#include <sonance/core/log.hpp>

#include <toml++/toml.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

namespace sonance_audio {

using sonance_core::Error;
using sonance_core::ErrorCode;
using sonance_core::Result;

namespace {

Error invalid(const std::string& section, const std::string& key, const std::string& why) {
    return Error(ErrorCode::InvalidArgument, "[" + section + "] " + key + ": " + why);
}

Result<void> read_string(const toml::table& tbl, const std::string& section, const char* key, std::string& out) {
    const auto node = tbl[key];
    if (!node) {
        return {};
    }
    auto value = node.value<std::string>();
    if (!value) {
        return invalid(section, key, "expected a string");
    }
    out = *value;
    return {};
}

Result<void> read_uint(const toml::table& tbl, const std::string& section, const char* key, std::uint32_t& out) {
    const auto node = tbl[key];
    if (!node) {
        return {};
    }
    auto value = node.value<std::int64_t>();
    if (!value || *value < 0 || *value > 0xFFFFFFFFll) {
        return invalid(section, key, "expected a non-negative integer");
    }
    out = static_cast<std::uint32_t>(*value);
    return {};
}

Result<void> read_distance(const toml::table& tbl, const std::string& section, const char* key, float& out) {
    const auto node = tbl[key];
    if (!node) {
        return {};
    }
    auto value = node.value<double>();
    if (!value || !std::isfinite(*value) || *value < 0.0) {
        return invalid(section, key, "expected a finite non-negative number");
    }
    out = static_cast<float>(*value);
    return {};
}

Result<void> parse_device(const toml::table& tbl, DeviceConfig& device) {
    if (auto r = read_string(tbl, "device", "backend", device.backend); !r) return r;
    if (device.backend != "miniaudio" && device.backend != "null") {
        return invalid("device", "backend", "unknown backend '" + device.backend + "'");
    }
    if (auto r = read_string(tbl, "device", "name", device.name); !r) return r;
    if (auto r = read_uint(tbl, "device", "sample_rate", device.sample_rate); !r) return r;
    if (auto r = read_uint(tbl, "device", "channels", device.channels); !r) return r;
    if (device.channels < 1 || device.channels > 2) {
        return invalid("device", "channels", "must be 1 or 2");
    }
    return {};
}

Result<void> parse_decode(const toml::table& tbl, DecodeOptions& decode) {
    const auto node = tbl["strict_mono16"];
    if (!node) {
        return {};
    }
    auto value = node.value<bool>();
    if (!value) {
        return invalid("decode", "strict_mono16", "expected a boolean");
    }
    decode.strict_mono16 = *value;
    return {};
}

Result<void> parse_positional(const toml::table& tbl, AttenuationSettings& positional) {
    if (auto r = read_distance(tbl, "positional", "max_distance", positional.max_distance); !r) return r;
    if (auto r = read_distance(tbl, "positional", "reference_distance", positional.reference_distance); !r) return r;
    if (auto r = read_distance(tbl, "positional", "rolloff_factor", positional.rolloff_factor); !r) return r;
    if (auto r = read_distance(tbl, "positional", "min_gain", positional.min_gain); !r) return r;
    return {};
}

Result<void> parse_logging(const toml::table& tbl, LoggingConfig& logging) {
    if (auto r = read_string(tbl, "logging", "level", logging.level); !r) return r;
    if (!sonance_core::parse_log_level(logging.level)) {
        return invalid("logging", "level", "unknown level '" + logging.level + "'");
    }
    if (auto r = read_string(tbl, "logging", "directory", logging.directory); !r) return r;
    return {};
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

Result<AudioConfig> load_audio_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::IOError, "Failed to open audio config: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_audio_config(buffer.str(), path.string());
}

Result<AudioConfig> parse_audio_config(const std::string& content, const std::string& source_name) {
    AudioConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        // [device]
        if (auto device = tbl["device"].as_table()) {
            if (auto r = parse_device(*device, config.device); !r) return r.error();
        }

        // [decode]
        if (auto decode = tbl["decode"].as_table()) {
            if (auto r = parse_decode(*decode, config.decode); !r) return r.error();
        }

        // [positional]
        if (auto positional = tbl["positional"].as_table()) {
            if (auto r = parse_positional(*positional, config.positional); !r) return r.error();
        }

        // [logging]
        if (auto logging = tbl["logging"].as_table()) {
            if (auto r = parse_logging(*logging, config.logging); !r) return r.error();
        }

    } catch (const toml::parse_error& err) {
        return Error(ErrorCode::ParseError, "TOML parse error: " + std::string(err.what()));
    }

    return config;
}

// =============================================================================
// Logging
// =============================================================================

Result<void> apply_logging_config(const LoggingConfig& config) {
    auto level = sonance_core::parse_log_level(config.level);
    if (!level) {
        return Error(ErrorCode::InvalidArgument, "Unknown log level: '" + config.level + "'");
    }

    sonance_core::LogConfig log_config;
    log_config.level = *level;
    log_config.file_enabled = !config.directory.empty();
    log_config.log_directory = config.directory;
    sonance_core::configure_logging(log_config);
    return {};
}

} // namespace sonance_audio
