// sonance_audio null backend tests

#include <catch2/catch_test_macros.hpp>
#include <sonance/audio/backend.hpp>

#include <cmath>
#include <limits>

using namespace sonance_audio;
using sonance_core::ErrorCode;
using sonance_core::NativeError;
using sonance_core::NativeErrorCode;

namespace {

struct Opened {
    NullAudioBackend backend;
    DeviceId device;
    ContextId context;

    Opened() {
        device = backend.open_device(DeviceConfig{}).value();
        context = backend.create_context(device).value();
        REQUIRE(backend.make_context_current(context).is_ok());
    }
};

} // anonymous namespace

// =============================================================================
// Validation
// =============================================================================

TEST_CASE("Source parameter validation", "[audio][backend]") {
    REQUIRE(validate_source_param(SourceParam::Gain, 0.0f).is_ok());
    REQUIRE(validate_source_param(SourceParam::MaxDistance, std::numeric_limits<float>::max()).is_ok());

    auto negative = validate_source_param(SourceParam::RolloffFactor, -1.0f);
    REQUIRE(negative.is_err());
    REQUIRE(negative.error().code == NativeErrorCode::InvalidValue);

    REQUIRE(validate_source_param(SourceParam::Gain, std::nanf("")).is_err());
    REQUIRE(validate_source_param(SourceParam::Gain, std::numeric_limits<float>::infinity()).is_err());

    REQUIRE(validate_position(Vec3(1.0f, -2.0f, 3.0f)).is_ok());
    REQUIRE(validate_position(Vec3(0.0f, std::nanf(""), 0.0f)).is_err());
}

TEST_CASE("Distance model follows the reference distance", "[audio][backend]") {
    REQUIRE(distance_model_for(0.0f) == DistanceModel::None);
    REQUIRE(distance_model_for(-1.0f) == DistanceModel::None);
    REQUIRE(distance_model_for(0.001f) == DistanceModel::Inverse);
    REQUIRE(distance_model_for(1.0f) == DistanceModel::Inverse);
    REQUIRE(distance_model_for(std::numeric_limits<float>::max()) == DistanceModel::Inverse);
}

TEST_CASE("Backend factory", "[audio][backend]") {
    auto null_backend = create_backend("null");
    REQUIRE(null_backend.is_ok());
    REQUIRE(null_backend.value()->info().name == "Null Audio");

    auto bogus = create_backend("bogus");
    REQUIRE(bogus.is_err());
    REQUIRE(bogus.error().code() == ErrorCode::InvalidArgument);
}

// =============================================================================
// Devices and Contexts
// =============================================================================

TEST_CASE("Null backend devices", "[audio][backend]") {
    SECTION("default device") {
        NullAudioBackend backend;
        auto device = backend.open_device(DeviceConfig{});
        REQUIRE(device.is_ok());
        REQUIRE(backend.info().device_name == "Null Output");
        REQUIRE(backend.info().sample_rate == 44100);
    }

    SECTION("named device") {
        NullAudioBackend backend({"Speakers", "Headphones"});
        DeviceConfig config;
        config.name = "Headphones";
        REQUIRE(backend.open_device(config).is_ok());
        REQUIRE(backend.info().device_name == "Headphones");

        config.name = "Nowhere";
        auto missing = backend.open_device(config);
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code == NativeErrorCode::NoDevice);
    }

    SECTION("no device present") {
        NullAudioBackend backend(std::vector<std::string>{});
        auto device = backend.open_device(DeviceConfig{});
        REQUIRE(device.is_err());
        REQUIRE(device.error().code == NativeErrorCode::NoDevice);
    }
}

TEST_CASE("Null backend context lifecycle", "[audio][backend]") {
    Opened o;
    REQUIRE(o.backend.current_context() == o.context);
    REQUIRE(o.backend.context_count() == 1);

    SECTION("calls without a current context fail") {
        REQUIRE(o.backend.make_context_current(ContextId{}).is_ok());
        auto buffer = o.backend.create_buffer();
        REQUIRE(buffer.is_err());
        REQUIRE(buffer.error().code == NativeErrorCode::InvalidOperation);
    }

    SECTION("closing the device destroys its context first") {
        auto buffer = o.backend.create_buffer();
        REQUIRE(buffer.is_ok());

        o.backend.close_device(o.device);
        REQUIRE(o.backend.context_count() == 0);
        REQUIRE(o.backend.buffer_count() == 0);
        REQUIRE_FALSE(o.backend.current_context());
        REQUIRE(o.backend.teardown_log() == std::vector<std::string>{"destroy_context", "close_device"});
        REQUIRE(o.backend.implicit_context_teardowns() == 1);
    }

    SECTION("unknown context cannot be made current") {
        auto result = o.backend.make_context_current(ContextId{99});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == NativeErrorCode::InvalidName);
    }
}

// =============================================================================
// Buffers
// =============================================================================

TEST_CASE("Null backend buffers", "[audio][backend]") {
    Opened o;
    const std::vector<std::int16_t> pcm{1, 2, 3, 4};

    auto buffer = o.backend.create_buffer();
    REQUIRE(buffer.is_ok());

    SECTION("upload stores PCM") {
        BufferData data{ChannelLayout::Stereo, 22050, pcm};
        REQUIRE(o.backend.buffer_data(buffer.value(), data).is_ok());

        const auto* record = o.backend.find_buffer(buffer.value());
        REQUIRE(record != nullptr);
        REQUIRE(record->has_data);
        REQUIRE(record->layout == ChannelLayout::Stereo);
        REQUIRE(record->sample_rate == 22050);
        REQUIRE(record->frame_count() == 2);
        REQUIRE(record->samples == pcm);
    }

    SECTION("malformed upload") {
        const std::vector<std::int16_t> odd{1, 2, 3};
        BufferData data{ChannelLayout::Stereo, 22050, odd};
        auto result = o.backend.buffer_data(buffer.value(), data);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == NativeErrorCode::InvalidValue);
    }

    SECTION("upload fault after allowed uploads") {
        o.backend.faults().buffer_data = NativeError::out_of_memory("pcm");
        o.backend.faults().buffer_data_allowed = 1;

        BufferData data{ChannelLayout::Mono, 8000, pcm};
        REQUIRE(o.backend.buffer_data(buffer.value(), data).is_ok());

        auto second = o.backend.buffer_data(buffer.value(), data);
        REQUIRE(second.is_err());
        REQUIRE(second.error().code == NativeErrorCode::OutOfMemory);
    }

    SECTION("destroy is idempotent") {
        o.backend.destroy_buffer(buffer.value());
        o.backend.destroy_buffer(buffer.value());
        REQUIRE(o.backend.buffer_count() == 0);
    }
}

// =============================================================================
// Sources
// =============================================================================

TEST_CASE("Null backend sources", "[audio][backend]") {
    Opened o;
    const std::vector<std::int16_t> pcm{1, 2, 3, 4};
    BufferId buffer = o.backend.create_buffer().value();
    REQUIRE(o.backend.buffer_data(buffer, BufferData{ChannelLayout::Mono, 8000, pcm}).is_ok());

    SourceId source = o.backend.create_source().value();

    SECTION("fresh emitters carry default parameters") {
        REQUIRE(o.backend.source_param(source, SourceParam::Gain).value() == 1.0f);
        REQUIRE(o.backend.source_param(source, SourceParam::MaxGain).value() == 1.0f);
        REQUIRE(o.backend.source_param(source, SourceParam::MinGain).value() == 0.0f);
        REQUIRE(o.backend.source_param(source, SourceParam::ReferenceDistance).value() == 1.0f);
        REQUIRE(o.backend.source_param(source, SourceParam::MaxDistance).value() ==
                std::numeric_limits<float>::max());
        REQUIRE_FALSE(o.backend.source_flag(source, SourceFlag::Looping).value());
        REQUIRE(o.backend.source_state(source).value() == SourceState::Initial);
    }

    SECTION("rejected values leave the parameter unchanged") {
        auto result = o.backend.set_source_param(source, SourceParam::Gain, std::nanf(""));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == NativeErrorCode::InvalidValue);
        REQUIRE(o.backend.source_param(source, SourceParam::Gain).value() == 1.0f);
    }

    SECTION("playback state") {
        REQUIRE(o.backend.play_source(source).error().code == NativeErrorCode::InvalidOperation);

        REQUIRE(o.backend.set_source_buffer(source, buffer).is_ok());
        REQUIRE(o.backend.stop_source(source).is_ok());
        REQUIRE(o.backend.source_state(source).value() == SourceState::Initial);

        REQUIRE(o.backend.play_source(source).is_ok());
        REQUIRE(o.backend.source_state(source).value() == SourceState::Playing);

        auto rebind = o.backend.set_source_buffer(source, buffer);
        REQUIRE(rebind.error().code == NativeErrorCode::InvalidOperation);

        REQUIRE(o.backend.stop_source(source).is_ok());
        REQUIRE(o.backend.source_state(source).value() == SourceState::Stopped);
    }

    SECTION("emitters belong to their context") {
        ContextId other = o.backend.create_context(o.device).value();
        REQUIRE(o.backend.make_context_current(other).is_ok());

        auto result = o.backend.source_param(source, SourceParam::Gain);
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == NativeErrorCode::InvalidOperation);
    }

    SECTION("source limit") {
        o.backend.faults().max_sources = 1;
        auto second = o.backend.create_source();
        REQUIRE(second.is_err());
        REQUIRE(second.error().code == NativeErrorCode::OutOfMemory);
    }

    SECTION("every source call is counted") {
        const auto before = o.backend.native_call_count();
        (void)o.backend.source_param(source, SourceParam::Gain);
        (void)o.backend.set_source_position(source, Vec3(1.0f));
        REQUIRE(o.backend.native_call_count() == before + 2);
    }

    SECTION("destroying the context drops its emitters") {
        o.backend.destroy_context(o.context);
        REQUIRE(o.backend.source_count() == 0);
    }
}

// =============================================================================
// Listener
// =============================================================================

TEST_CASE("Null backend listener", "[audio][backend]") {
    Opened o;

    REQUIRE(o.backend.listener_position().value() == sonance_math::vec3::ZERO);
    REQUIRE(o.backend.set_listener_position(Vec3(4.0f, 5.0f, 6.0f)).is_ok());
    REQUIRE(o.backend.listener_position().value() == Vec3(4.0f, 5.0f, 6.0f));

    Orientation orientation{Vec3(1.0f, 0.0f, 0.0f), Vec3(0.0f, 0.0f, 1.0f)};
    REQUIRE(o.backend.set_listener_orientation(orientation).is_ok());
    REQUIRE(o.backend.listener_orientation().value().at == orientation.at);
    REQUIRE(o.backend.listener_orientation().value().up == orientation.up);

    o.backend.faults().listener = NativeError::invalid_operation("listener locked");
    REQUIRE(o.backend.set_listener_position(Vec3(0.0f)).is_err());
    REQUIRE(o.backend.listener_position().value() == Vec3(4.0f, 5.0f, 6.0f));
}
