/// @file audio.hpp
/// @brief Main include header for sonance_audio
///
/// sonance_audio plays decoded sounds through a 3D-aware native engine:
/// - One Context per output device, with its listener
/// - WAV/MP3 decoding into one or two device buffers (stereo input also
///   yields a mono copy for spatialization)
/// - Simple (listener-relative) and Positional (spatialized) sources
/// - Miniaudio backend, plus an in-memory null backend for headless use
///
/// ## Quick Start
///
/// ```cpp
/// #include <sonance/audio/audio.hpp>
///
/// auto context = sonance_audio::Context::open();
/// if (!context) {
///     // DeviceUnavailable or ContextCreationFailed
/// }
///
/// auto asset = sonance_audio::SoundAsset::decode(*context, "sounds/engine.wav");
/// auto source = sonance_audio::SoundSource::create(*context, *asset,
///                                                  sonance_audio::SourceKind::Positional);
/// source->set_looping(true);
/// source->set_max_distance(30.0f);
/// source->play();
///
/// // Every frame
/// context->set_listener_transform(camera_position, camera_rotation);
/// if (auto r = source->update(emitter_position); !r) {
///     // PositionSetFailed
/// }
/// ```
///
/// Sources must be destroyed before the asset they play.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "backend.hpp"
#include "config.hpp"
#include "pcm.hpp"
#include "decoder.hpp"
#include "context.hpp"
#include "listener.hpp"
#include "sound_asset.hpp"
#include "sound_source.hpp"
