/// @file main.cpp
/// @brief Orbit Demo
///
/// Plays a sound file through a positional and a simple source while the
/// listener circles the origin. The positional source pans and fades as the
/// listener moves; the simple source stays fixed in the head.

#include <sonance/audio/audio.hpp>
#include <sonance/core/log.hpp>

#include <glm/gtc/constants.hpp>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <thread>

namespace {

constexpr float k_orbit_radius = 4.0f;
constexpr float k_orbit_period_seconds = 4.0f;
constexpr int k_run_seconds = 8;
constexpr auto k_tick = std::chrono::milliseconds(16);

/// Load audio.toml from the working directory if there is one
sonance_audio::AudioConfig load_config() {
    const std::filesystem::path path = "audio.toml";
    if (!std::filesystem::exists(path)) {
        return {};
    }

    auto config = sonance_audio::load_audio_config(path);
    if (!config) {
        SONANCE_LOG_WARN("Ignoring {}: {}", path.string(), config.error().message());
        return {};
    }
    return std::move(config).value();
}

/// Listener transform on a horizontal circle, facing the origin
void place_listener(sonance_audio::Context& context, float seconds) {
    const float angle = glm::two_pi<float>() * seconds / k_orbit_period_seconds;
    const sonance_audio::Vec3 position(k_orbit_radius * std::sin(angle), 0.0f, k_orbit_radius * std::cos(angle));

    // Yaw so that -Z points back at the origin
    const sonance_audio::Quat facing = glm::angleAxis(angle, sonance_audio::Vec3(0.0f, 1.0f, 0.0f));
    context.set_listener_transform(position, facing);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    sonance_core::init_logging();

    if (argc < 2) {
        SONANCE_LOG_ERROR("Usage: {} <sound file (.wav or .mp3)>", argv[0]);
        return EXIT_FAILURE;
    }
    const std::filesystem::path sound_path = argv[1];

    sonance_audio::AudioConfig config = load_config();
    if (auto logging = sonance_audio::apply_logging_config(config.logging); !logging) {
        SONANCE_LOG_WARN("Logging config: {}", logging.error().message());
    }

    SONANCE_LOG_INFO("=== Orbit Demo ===");

    auto context = sonance_audio::Context::open(config);
    if (!context) {
        SONANCE_LOG_ERROR("Failed to open audio: {}", sonance_core::build_error_chain(context.error()));
        return EXIT_FAILURE;
    }
    sonance_audio::Context& ctx = context.value();

    const auto info = ctx.backend_info();
    SONANCE_LOG_INFO("Output: {} ({} Hz, {} channels)", info.device_name, info.sample_rate, info.channels);

    auto asset = sonance_audio::SoundAsset::decode(ctx, sound_path);
    if (!asset) {
        SONANCE_LOG_ERROR("Failed to load sound: {}", sonance_core::build_error_chain(asset.error()));
        return EXIT_FAILURE;
    }
    SONANCE_LOG_INFO("Loaded '{}': {} channel(s), {} Hz, {:.2f} s",
        asset.value().name(), asset.value().channels(), asset.value().sample_rate(), asset.value().duration());

    {
        auto positional = sonance_audio::SoundSource::create(ctx, asset.value(), sonance_audio::SourceKind::Positional);
        if (!positional) {
            SONANCE_LOG_ERROR("Failed to create positional source: {}", positional.error().message());
            return EXIT_FAILURE;
        }

        auto simple = sonance_audio::SoundSource::create(ctx, asset.value(), sonance_audio::SourceKind::Simple);
        if (!simple) {
            SONANCE_LOG_ERROR("Failed to create simple source: {}", simple.error().message());
            return EXIT_FAILURE;
        }

        sonance_audio::SoundSource& emitter = positional.value();
        sonance_audio::SoundSource& ambience = simple.value();

        if (auto r = emitter.update(sonance_audio::Vec3(0.0f)); !r) {
            SONANCE_LOG_WARN("Could not place emitter: {}", r.error().message());
        }
        if (auto r = emitter.set_max_distance(20.0f); !r) {
            SONANCE_LOG_WARN("{}", r.error().message());
        }
        emitter.set_looping(true);
        ambience.set_looping(true);
        ambience.set_volume(0.25f);

        emitter.play();
        ambience.play();

        SONANCE_LOG_INFO("Orbiting for {} seconds...", k_run_seconds);

        const auto start = std::chrono::steady_clock::now();
        const auto end = start + std::chrono::seconds(k_run_seconds);
        int tick = 0;
        for (auto now = start; now < end; now = std::chrono::steady_clock::now()) {
            const float seconds = std::chrono::duration<float>(now - start).count();
            place_listener(ctx, seconds);

            if (++tick % 60 == 0) {
                auto where = ctx.listener_position();
                if (where) {
                    SONANCE_LOG_DEBUG("Listener at ({:.2f}, {:.2f}, {:.2f})",
                        where.value().x, where.value().y, where.value().z);
                }
            }

            std::this_thread::sleep_for(k_tick);
        }

        emitter.stop();
        ambience.stop();
    }

    const auto errors = sonance_core::debug::total_error_count();
    if (errors > 0) {
        SONANCE_LOG_INFO("{}", sonance_core::debug::error_stats_summary());
    }

    SONANCE_LOG_INFO("Shutting down...");
    sonance_core::flush_all_loggers();
    return EXIT_SUCCESS;
}
