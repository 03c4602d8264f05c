// sonance_audio sound source tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <sonance/audio/sound_source.hpp>
#include <sonance/audio/sound_asset.hpp>

#include "audio_fixtures.hpp"

#include <cmath>
#include <limits>

using namespace sonance_audio;
using sonance_core::AudioError;
using sonance_core::NativeError;
using sonance_test::NullContext;

namespace {

SoundAsset load(const NullContext& ctx, std::uint16_t channels) {
    auto wav = sonance_test::make_wav_s16(channels, 44100, 64);
    return SoundAsset::decode_memory(ctx.context, wav, "fixture.wav").value();
}

} // anonymous namespace

// =============================================================================
// Creation
// =============================================================================

TEST_CASE("Simple source plays the full mix relative to the listener", "[audio][source]") {
    auto ctx = NullContext::open();
    SoundAsset asset = load(ctx, 2);

    auto source = SoundSource::create(ctx.context, asset, SourceKind::Simple);
    REQUIRE(source.is_ok());
    REQUIRE(source.value().kind() == SourceKind::Simple);
    REQUIRE(source.value().buffer() == asset.primary_buffer().id());
    REQUIRE(source.value().as_simple() != nullptr);
    REQUIRE(source.value().as_positional() == nullptr);

    auto& backend = *ctx.backend;
    REQUIRE(backend.source_buffer(source.value().id()).value() == asset.primary_buffer().id());
    REQUIRE(backend.source_flag(source.value().id(), SourceFlag::Relative).value());
}

TEST_CASE("Positional source plays the mono buffer", "[audio][source]") {
    auto ctx = NullContext::open();

    SECTION("stereo asset") {
        SoundAsset asset = load(ctx, 2);
        auto source = PositionalSource::create(ctx.context, asset);
        REQUIRE(source.is_ok());
        REQUIRE(source.value().buffer() == asset.mono_buffer()->id());

        const auto* bound = ctx.backend->find_buffer(source.value().buffer());
        REQUIRE(bound->layout == ChannelLayout::Mono);
        REQUIRE_FALSE(ctx.backend->source_flag(source.value().id(), SourceFlag::Relative).value());
    }

    SECTION("mono asset") {
        SoundAsset asset = load(ctx, 1);
        auto source = PositionalSource::create(ctx.context, asset);
        REQUIRE(source.is_ok());
        REQUIRE(source.value().buffer() == asset.primary_buffer().id());
    }
}

TEST_CASE("Positional source attenuation defaults", "[audio][source]") {
    SECTION("library defaults") {
        auto ctx = NullContext::open();
        SoundAsset asset = load(ctx, 1);
        auto source = PositionalSource::create(ctx.context, asset).value();

        REQUIRE(source.reference_distance().value() == 0.0f);
        REQUIRE(source.rolloff_factor().value() == 1.0f);
        REQUIRE(source.min_gain().value() == 0.0f);
        REQUIRE(source.max_distance().value() == std::numeric_limits<float>::max());
    }

    SECTION("zero reference distance disables distance attenuation") {
        auto ctx = NullContext::open();
        SoundAsset asset = load(ctx, 1);
        auto source = PositionalSource::create(ctx.context, asset).value();

        auto reference = ctx.backend->source_param(source.id(), SourceParam::ReferenceDistance);
        REQUIRE(distance_model_for(reference.value()) == DistanceModel::None);

        source.set_reference_distance(1.0f);
        reference = ctx.backend->source_param(source.id(), SourceParam::ReferenceDistance);
        REQUIRE(distance_model_for(reference.value()) == DistanceModel::Inverse);
    }

    SECTION("configured defaults") {
        AudioConfig config;
        config.positional.reference_distance = 2.0f;
        config.positional.max_distance = 40.0f;
        config.positional.rolloff_factor = 0.5f;
        auto ctx = NullContext::open(config);
        SoundAsset asset = load(ctx, 1);
        auto source = PositionalSource::create(ctx.context, asset).value();

        REQUIRE(source.reference_distance().value() == 2.0f);
        REQUIRE(source.max_distance().value() == 40.0f);
        REQUIRE(source.rolloff_factor().value() == 0.5f);
    }
}

TEST_CASE("Source creation failures", "[audio][source]") {
    auto ctx = NullContext::open();
    SoundAsset asset = load(ctx, 2);

    SECTION("emitter allocation fails") {
        ctx.backend->faults().create_source = NativeError::out_of_memory("emitters");
        auto source = SoundSource::create(ctx.context, asset, SourceKind::Positional);
        REQUIRE(source.is_err());
        REQUIRE(source.error().is_audio(AudioError::Kind::SourceCreationFailed));
    }

    SECTION("binding fails and the emitter is released") {
        ctx.backend->faults().set_source_buffer = NativeError::invalid_operation("bind");
        auto source = SoundSource::create(ctx.context, asset, SourceKind::Simple);
        REQUIRE(source.is_err());
        REQUIRE(source.error().is_audio(AudioError::Kind::SourceCreationFailed));
        REQUIRE(ctx.backend->source_count() == 0);
    }

    SECTION("configuration fails and the emitter is released") {
        ctx.backend->faults().source_setters = NativeError::invalid_operation("locked");
        auto source = SoundSource::create(ctx.context, asset, SourceKind::Positional);
        REQUIRE(source.is_err());
        REQUIRE(source.error().is_audio(AudioError::Kind::SourceCreationFailed));
        REQUIRE(ctx.backend->source_count() == 0);
    }
}

// =============================================================================
// Playback
// =============================================================================

TEST_CASE("Source playback controls", "[audio][source]") {
    auto ctx = NullContext::open();
    SoundAsset asset = load(ctx, 2);
    auto kind = GENERATE(SourceKind::Simple, SourceKind::Positional);
    SoundSource source = SoundSource::create(ctx.context, asset, kind).value();

    SECTION("play and stop") {
        REQUIRE(source.state().value() == SourceState::Initial);
        source.play();
        REQUIRE(source.state().value() == SourceState::Playing);
        source.play();
        REQUIRE(source.state().value() == SourceState::Playing);
        source.stop();
        REQUIRE(source.state().value() == SourceState::Stopped);
    }

    SECTION("looping") {
        REQUIRE_FALSE(source.is_looping());
        source.set_looping(true);
        REQUIRE(source.is_looping());
        source.set_looping(false);
        REQUIRE_FALSE(source.is_looping());
    }

    SECTION("volume sets gain and max gain") {
        for (float volume : {0.0f, 0.25f, 1.0f}) {
            source.set_volume(volume);
            REQUIRE(source.volume().value() == volume);
            REQUIRE(ctx.backend->source_param(source.id(), SourceParam::MaxGain).value() == volume);
        }
    }

    SECTION("rejected volume keeps the previous value") {
        sonance_core::debug::reset_error_stats();
        source.set_volume(0.5f);
        source.set_volume(-1.0f);
        REQUIRE(source.volume().value() == 0.5f);
        REQUIRE(sonance_core::debug::total_error_count() == 2);
        sonance_core::debug::reset_error_stats();
    }

    SECTION("queries fail when the device cannot answer") {
        source.set_looping(true);
        ctx.backend->faults().source_queries = NativeError::backend_failure("driver");

        auto state = source.state();
        REQUIRE(state.is_err());
        REQUIRE(state.error().is_audio(AudioError::Kind::QueryFailed));
        REQUIRE(source.volume().error().is_audio(AudioError::Kind::QueryFailed));
        REQUIRE(source.is_looping());
    }
}

// =============================================================================
// Spatial Operations
// =============================================================================

TEST_CASE("Positional source position", "[audio][source]") {
    auto ctx = NullContext::open();
    SoundAsset asset = load(ctx, 2);
    SoundSource source = SoundSource::create(ctx.context, asset, SourceKind::Positional).value();

    REQUIRE(source.update(Vec3(1.0f, 2.0f, 3.0f)).is_ok());
    REQUIRE(source.position().value() == Vec3(1.0f, 2.0f, 3.0f));

    auto rejected = source.update(Vec3(std::nanf(""), 0.0f, 0.0f));
    REQUIRE(rejected.is_err());
    REQUIRE(rejected.error().is_audio(AudioError::Kind::PositionSetFailed));
    REQUIRE(source.position().value() == Vec3(1.0f, 2.0f, 3.0f));

    REQUIRE(source.set_max_distance(30.0f).is_ok());
    REQUIRE(source.max_distance().value() == 30.0f);
    REQUIRE(source.set_reference_distance(5.0f).is_ok());
    REQUIRE(source.reference_distance().value() == 5.0f);
    REQUIRE(source.set_rolloff_factor(2.0f).is_ok());
    REQUIRE(source.rolloff_factor().value() == 2.0f);
    REQUIRE(source.set_min_gain(0.1f).is_ok());
    REQUIRE(source.min_gain().value() == 0.1f);
}

TEST_CASE("Spatial operations on a simple source", "[audio][source]") {
    auto ctx = NullContext::open();
    SoundAsset asset = load(ctx, 2);
    SoundSource source = SoundSource::create(ctx.context, asset, SourceKind::Simple).value();
    source.set_volume(0.75f);

    const auto calls = ctx.backend->native_call_count();

    auto update = source.update(Vec3(1.0f, 0.0f, 0.0f));
    REQUIRE(update.error().is_audio(AudioError::Kind::WrongSourceKind));
    REQUIRE(source.set_max_distance(30.0f).error().is_audio(AudioError::Kind::WrongSourceKind));
    REQUIRE(source.set_reference_distance(1.0f).error().is_audio(AudioError::Kind::WrongSourceKind));
    REQUIRE(source.set_rolloff_factor(1.0f).error().is_audio(AudioError::Kind::WrongSourceKind));
    REQUIRE(source.set_min_gain(0.0f).error().is_audio(AudioError::Kind::WrongSourceKind));
    REQUIRE(source.position().error().is_audio(AudioError::Kind::WrongSourceKind));
    REQUIRE(source.max_distance().error().is_audio(AudioError::Kind::WrongSourceKind));

    REQUIRE(ctx.backend->native_call_count() == calls);

    REQUIRE(source.volume().value() == 0.75f);
    REQUIRE(ctx.backend->source_param(source.id(), SourceParam::MaxDistance).value() ==
            std::numeric_limits<float>::max());
    REQUIRE(ctx.backend->source_position(source.id()).value() == sonance_math::vec3::ZERO);
}

// =============================================================================
// Lifetime
// =============================================================================

TEST_CASE("Source lifetime", "[audio][source]") {
    auto ctx = NullContext::open();
    SoundAsset asset = load(ctx, 1);

    SECTION("dropping a source releases the emitter") {
        {
            auto source = SoundSource::create(ctx.context, asset, SourceKind::Simple);
            REQUIRE(source.is_ok());
            REQUIRE(ctx.backend->source_count() == 1);
        }
        REQUIRE(ctx.backend->source_count() == 0);
    }

    SECTION("moved sources release once") {
        SoundSource first = SoundSource::create(ctx.context, asset, SourceKind::Positional).value();
        SoundSource second = std::move(first);
        REQUIRE(ctx.backend->source_count() == 1);
        second.play();
        REQUIRE(second.state().value() == SourceState::Playing);
    }

    SECTION("a source outliving its context is released without a native call") {
        auto source = SoundSource::create(ctx.context, asset, SourceKind::Positional);
        REQUIRE(source.is_ok());

        ctx.context = std::move(NullContext::open().context);
        REQUIRE(ctx.backend->source_count() == 0);

        auto state = source.value().state();
        REQUIRE(state.is_err());
        REQUIRE(state.error().is_audio(AudioError::Kind::QueryFailed));
    }

    SECTION("sources of two contexts on one backend") {
        Context other = Context::open(ctx.backend).value();
        auto wav = sonance_test::make_wav_s16(1, 44100, 64);
        SoundAsset other_asset = SoundAsset::decode_memory(other, wav, "other.wav").value();

        SoundSource here = SoundSource::create(ctx.context, asset, SourceKind::Simple).value();
        SoundSource there = SoundSource::create(other, other_asset, SourceKind::Simple).value();
        REQUIRE(other.is_current());

        here.play();
        there.play();
        REQUIRE(here.state().value() == SourceState::Playing);
        REQUIRE(there.state().value() == SourceState::Playing);
        REQUIRE(ctx.backend->source_count() == 2);
    }
}
