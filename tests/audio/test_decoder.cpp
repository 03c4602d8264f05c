// sonance_audio decoder tests

#include <catch2/catch_test_macros.hpp>
#include <sonance/audio/decoder.hpp>

#include "audio_fixtures.hpp"

#include <filesystem>
#include <fstream>

using namespace sonance_audio;
using sonance_core::AudioError;
using sonance_core::ErrorCode;
using sonance_core::NativeErrorCode;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::vector<std::byte>& bytes) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path;
}

} // anonymous namespace

TEST_CASE("Audio format detection", "[audio][decoder]") {
    SECTION("by extension") {
        REQUIRE(detect_audio_format(std::filesystem::path("a.wav")) == AudioFileFormat::WAV);
        REQUIRE(detect_audio_format(std::filesystem::path("B.WAV")) == AudioFileFormat::WAV);
        REQUIRE(detect_audio_format(std::filesystem::path("song.mp3")) == AudioFileFormat::MP3);
        REQUIRE(detect_audio_format(std::filesystem::path("song.ogg")) == AudioFileFormat::Unknown);
    }

    SECTION("by content") {
        auto wav = sonance_test::make_wav_s16(1, 8000, 4);
        REQUIRE(detect_audio_format(std::span<const std::byte>(wav)) == AudioFileFormat::WAV);

        std::vector<std::byte> id3{std::byte{'I'}, std::byte{'D'}, std::byte{'3'}, std::byte{4}, std::byte{0}};
        REQUIRE(detect_audio_format(std::span<const std::byte>(id3)) == AudioFileFormat::MP3);

        std::vector<std::byte> sync{std::byte{0xFF}, std::byte{0xFB}, std::byte{0x90}, std::byte{0x00}};
        REQUIRE(detect_audio_format(std::span<const std::byte>(sync)) == AudioFileFormat::MP3);

        std::vector<std::byte> junk{std::byte{1}, std::byte{2}, std::byte{3}, std::byte{4}};
        REQUIRE(detect_audio_format(std::span<const std::byte>(junk)) == AudioFileFormat::Unknown);
    }
}

TEST_CASE("Decoder reads header before decoding", "[audio][decoder]") {
    auto wav = sonance_test::make_wav(2, 22050, 24, 50);
    auto decoder = Decoder::open_memory(wav, "tone.wav");
    REQUIRE(decoder.is_ok());

    const AudioFileInfo& info = decoder.value().info();
    REQUIRE(info.file_format == AudioFileFormat::WAV);
    REQUIRE(info.channels == 2);
    REQUIRE(info.sample_rate == 22050);
    REQUIRE(info.bits_per_sample == 24);
    REQUIRE(info.frame_count == 50);
    REQUIRE(decoder.value().name() == "tone.wav");
}

TEST_CASE("Decoder normalizes to 16-bit", "[audio][decoder]") {
    SECTION("16-bit stereo is reproduced exactly") {
        auto wav = sonance_test::make_wav_s16(2, 44100, 100);
        auto decoded = decode_memory(wav, "stereo.wav");
        REQUIRE(decoded.is_ok());

        const DecodedAudio& audio = decoded.value();
        REQUIRE(audio.channels == 2);
        REQUIRE(audio.sample_rate == 44100);
        REQUIRE(audio.native_bits_per_sample == 16);
        REQUIRE(audio.frame_count() == 100);
        REQUIRE(audio.samples.size() == 200);
        for (std::uint32_t f = 0; f < 100; ++f) {
            REQUIRE(audio.samples[f * 2] == sonance_test::fixture_sample(f, 0));
            REQUIRE(audio.samples[f * 2 + 1] == sonance_test::fixture_sample(f, 1));
        }
    }

    SECTION("24-bit input keeps the top 16 bits") {
        auto wav = sonance_test::make_wav(1, 48000, 24, 10);
        auto decoded = decode_memory(wav, "wide.wav");
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().native_bits_per_sample == 24);
        REQUIRE(decoded.value().samples.size() == 10);
        REQUIRE(decoded.value().samples[3] == sonance_test::fixture_sample(3, 0));
    }

    SECTION("8-bit input") {
        auto wav = sonance_test::make_wav(1, 8000, 8, 64);
        auto decoded = decode_memory(wav, "narrow.wav");
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().native_bits_per_sample == 8);
        REQUIRE(decoded.value().frame_count() == 64);
    }
}

TEST_CASE("Decoder reads MP3 streams", "[audio][decoder]") {
    SECTION("mono") {
        auto mp3 = sonance_test::make_mp3(1, 8);
        REQUIRE(detect_audio_format(mp3) == AudioFileFormat::MP3);

        auto decoded = decode_memory(mp3, "silence.mp3");
        REQUIRE(decoded.is_ok());

        const DecodedAudio& audio = decoded.value();
        REQUIRE(audio.file_format == AudioFileFormat::MP3);
        REQUIRE(audio.channels == 1);
        REQUIRE(audio.sample_rate == 44100);
        REQUIRE(audio.frame_count() > 0);
        REQUIRE(audio.frame_count() <= 8 * sonance_test::k_mp3_frame_samples);
        for (std::int16_t sample : audio.samples) {
            REQUIRE(sample == 0);
        }
    }

    SECTION("stereo") {
        auto mp3 = sonance_test::make_mp3(2, 8);
        auto decoded = decode_memory(mp3, "silence.mp3");
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().channels == 2);
        REQUIRE(decoded.value().sample_rate == 44100);
        REQUIRE(decoded.value().samples.size() == decoded.value().frame_count() * 2);
    }
}

TEST_CASE("Decoder failures", "[audio][decoder]") {
    SECTION("missing file is an I/O failure") {
        auto decoded = decode_file("/nonexistent/sonance/missing.wav");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().is_audio(AudioError::Kind::AssetLoadFailed));
        REQUIRE(decoded.error().code() == ErrorCode::IOError);
        REQUIRE(decoded.error().native()->code == NativeErrorCode::IOError);
    }

    SECTION("unrecognized content") {
        std::vector<std::byte> junk(64, std::byte{0x42});
        auto decoded = decode_memory(junk, "noise.bin");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().is_audio(AudioError::Kind::AssetLoadFailed));
        REQUIRE(decoded.error().code() == ErrorCode::ParseError);
    }

    SECTION("truncated WAV header") {
        auto wav = sonance_test::make_wav_s16(1, 8000, 4);
        wav.resize(12);
        auto decoded = decode_memory(wav, "cut.wav");
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.error().is_audio(AudioError::Kind::AssetLoadFailed));
        REQUIRE(decoded.error().native()->code == NativeErrorCode::InvalidData);
    }
}

TEST_CASE("Decoder reads files from disk", "[audio][decoder]") {
    auto path = write_temp("sonance_decoder_test.wav", sonance_test::make_wav_s16(1, 16000, 32));

    auto decoded = decode_file(path);
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.value().file_format == AudioFileFormat::WAV);
    REQUIRE(decoded.value().frame_count() == 32);

    std::filesystem::remove(path);
}
