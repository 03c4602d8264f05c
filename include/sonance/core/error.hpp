#pragma once

/// @file error.hpp
/// @brief Error handling types for sonance_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace sonance_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    OutOfMemory,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Native Errors
// =============================================================================

/// Error codes reported by the native audio layer (device driver or decoder)
enum class NativeErrorCode : std::uint8_t {
    None = 0,
    InvalidName,        // Unknown device, buffer or source handle
    InvalidEnum,        // Unknown parameter
    InvalidValue,       // Parameter value out of range
    InvalidOperation,   // Call not valid in the current state (e.g. no current context)
    OutOfMemory,        // Resource exhaustion
    NoDevice,           // No output device available
    IOError,            // File could not be opened or read
    InvalidData,        // Data could not be parsed
    BackendFailure,     // Any other driver failure
};

/// Get native error code name
[[nodiscard]] inline const char* native_error_code_name(NativeErrorCode code) {
    switch (code) {
        case NativeErrorCode::None: return "None";
        case NativeErrorCode::InvalidName: return "InvalidName";
        case NativeErrorCode::InvalidEnum: return "InvalidEnum";
        case NativeErrorCode::InvalidValue: return "InvalidValue";
        case NativeErrorCode::InvalidOperation: return "InvalidOperation";
        case NativeErrorCode::OutOfMemory: return "OutOfMemory";
        case NativeErrorCode::NoDevice: return "NoDevice";
        case NativeErrorCode::IOError: return "IOError";
        case NativeErrorCode::InvalidData: return "InvalidData";
        case NativeErrorCode::BackendFailure: return "BackendFailure";
        default: return "Unknown";
    }
}

/// Error returned by a native audio call
struct NativeError {
    NativeErrorCode code = NativeErrorCode::None;
    std::string message;

    [[nodiscard]] static NativeError invalid_name(const std::string& what) {
        return NativeError{NativeErrorCode::InvalidName, "Invalid name: " + what};
    }

    [[nodiscard]] static NativeError invalid_enum(const std::string& what) {
        return NativeError{NativeErrorCode::InvalidEnum, "Invalid enum: " + what};
    }

    [[nodiscard]] static NativeError invalid_value(const std::string& what) {
        return NativeError{NativeErrorCode::InvalidValue, "Invalid value: " + what};
    }

    [[nodiscard]] static NativeError invalid_operation(const std::string& what) {
        return NativeError{NativeErrorCode::InvalidOperation, "Invalid operation: " + what};
    }

    [[nodiscard]] static NativeError out_of_memory(const std::string& what) {
        return NativeError{NativeErrorCode::OutOfMemory, "Out of memory: " + what};
    }

    [[nodiscard]] static NativeError no_device(const std::string& what) {
        return NativeError{NativeErrorCode::NoDevice, "No device: " + what};
    }

    [[nodiscard]] static NativeError io_error(const std::string& what) {
        return NativeError{NativeErrorCode::IOError, "I/O error: " + what};
    }

    [[nodiscard]] static NativeError invalid_data(const std::string& what) {
        return NativeError{NativeErrorCode::InvalidData, "Invalid data: " + what};
    }

    [[nodiscard]] static NativeError backend_failure(const std::string& what) {
        return NativeError{NativeErrorCode::BackendFailure, what};
    }
};

// =============================================================================
// Error Kinds
// =============================================================================

/// Audio errors
struct AudioError {
    enum class Kind : std::uint8_t {
        DeviceUnavailable,          // No output device could be opened
        ContextCreationFailed,      // Device opened, rendering context not created
        AssetLoadFailed,            // File missing, unreadable or undecodable
        UnsupportedChannelLayout,   // Channel count is neither 1 nor 2
        NotMono,                    // Strict mode: input must be mono
        NotSixteenBit,              // Strict mode: input must be 16-bit
        BufferUploadFailed,         // Device buffer allocation or upload failed
        SourceCreationFailed,       // Emitter allocation or binding failed
        WrongSourceKind,            // Spatial operation on a non-positional source
        PositionSetFailed,          // Device rejected a position update
        ListenerUpdateFailed,       // Device rejected a listener update
        QueryFailed,                // Device parameter could not be read back
    };

    Kind kind;
    std::string message;
    std::optional<NativeError> native;
    std::string path;               // For AssetLoadFailed
    std::uint32_t channels = 0;     // For UnsupportedChannelLayout / NotMono

    /// Factory methods
    [[nodiscard]] static AudioError device_unavailable(std::optional<NativeError> err = std::nullopt) {
        std::string msg = "No audio output device could be opened";
        if (err) msg += ": " + err->message;
        return AudioError{Kind::DeviceUnavailable, msg, std::move(err), {}, 0};
    }

    [[nodiscard]] static AudioError context_creation_failed(NativeError err) {
        std::string msg = "Failed to create audio context: " + err.message;
        return AudioError{Kind::ContextCreationFailed, msg, std::move(err), {}, 0};
    }

    [[nodiscard]] static AudioError asset_load_failed(const std::string& path, NativeError err) {
        std::string msg = "Failed to load sound asset '" + path + "': " + err.message;
        return AudioError{Kind::AssetLoadFailed, msg, std::move(err), path, 0};
    }

    [[nodiscard]] static AudioError unsupported_channel_layout(const std::string& path, std::uint32_t channel_count) {
        return AudioError{Kind::UnsupportedChannelLayout,
            "Unsupported channel count " + std::to_string(channel_count) + " in '" + path + "' (expected 1 or 2)",
            std::nullopt, path, channel_count};
    }

    [[nodiscard]] static AudioError not_mono(const std::string& path, std::uint32_t channel_count) {
        return AudioError{Kind::NotMono,
            "Sound asset '" + path + "' must be mono, found " + std::to_string(channel_count) + " channels",
            std::nullopt, path, channel_count};
    }

    [[nodiscard]] static AudioError not_sixteen_bit(const std::string& path, std::uint32_t bits) {
        return AudioError{Kind::NotSixteenBit,
            "Sound asset '" + path + "' must be 16-bit, found " + std::to_string(bits) + "-bit",
            std::nullopt, path, 0};
    }

    [[nodiscard]] static AudioError buffer_upload_failed(NativeError err) {
        std::string msg = "Failed to create audio buffer: " + err.message;
        return AudioError{Kind::BufferUploadFailed, msg, std::move(err), {}, 0};
    }

    [[nodiscard]] static AudioError source_creation_failed(NativeError err) {
        std::string msg = "Failed to create audio source: " + err.message;
        return AudioError{Kind::SourceCreationFailed, msg, std::move(err), {}, 0};
    }

    [[nodiscard]] static AudioError wrong_source_kind(const std::string& operation) {
        return AudioError{Kind::WrongSourceKind,
            "'" + operation + "' requires a positional source", std::nullopt, {}, 0};
    }

    [[nodiscard]] static AudioError position_set_failed(NativeError err) {
        std::string msg = "Failed to set source position: " + err.message;
        return AudioError{Kind::PositionSetFailed, msg, std::move(err), {}, 0};
    }

    [[nodiscard]] static AudioError listener_update_failed(NativeError err) {
        std::string msg = "Failed to update listener: " + err.message;
        return AudioError{Kind::ListenerUpdateFailed, msg, std::move(err), {}, 0};
    }

    [[nodiscard]] static AudioError query_failed(const std::string& what, NativeError err) {
        std::string msg = "Failed to query " + what + ": " + err.message;
        return AudioError{Kind::QueryFailed, msg, std::move(err), {}, 0};
    }
};

/// Get audio error kind name
[[nodiscard]] inline const char* audio_error_kind_name(AudioError::Kind kind) {
    switch (kind) {
        case AudioError::Kind::DeviceUnavailable: return "DeviceUnavailable";
        case AudioError::Kind::ContextCreationFailed: return "ContextCreationFailed";
        case AudioError::Kind::AssetLoadFailed: return "AssetLoadFailed";
        case AudioError::Kind::UnsupportedChannelLayout: return "UnsupportedChannelLayout";
        case AudioError::Kind::NotMono: return "NotMono";
        case AudioError::Kind::NotSixteenBit: return "NotSixteenBit";
        case AudioError::Kind::BufferUploadFailed: return "BufferUploadFailed";
        case AudioError::Kind::SourceCreationFailed: return "SourceCreationFailed";
        case AudioError::Kind::WrongSourceKind: return "WrongSourceKind";
        case AudioError::Kind::PositionSetFailed: return "PositionSetFailed";
        case AudioError::Kind::ListenerUpdateFailed: return "ListenerUpdateFailed";
        case AudioError::Kind::QueryFailed: return "QueryFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        AudioError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(AudioError err) : m_code(to_error_code(err)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Check for a specific audio error kind
    [[nodiscard]] bool is_audio(AudioError::Kind kind) const {
        const auto* audio = as<AudioError>();
        return audio != nullptr && audio->kind == kind;
    }

    /// Get the native error carried by an audio error, if any
    [[nodiscard]] const NativeError* native() const {
        const auto* audio = as<AudioError>();
        return (audio != nullptr && audio->native) ? &*audio->native : nullptr;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// Get all context values
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(const AudioError& err) {
        const NativeErrorCode native = err.native ? err.native->code : NativeErrorCode::None;
        switch (err.kind) {
            case AudioError::Kind::DeviceUnavailable: return ErrorCode::NotFound;
            case AudioError::Kind::ContextCreationFailed: return ErrorCode::InvalidState;
            case AudioError::Kind::AssetLoadFailed:
                return native == NativeErrorCode::IOError ? ErrorCode::IOError : ErrorCode::ParseError;
            case AudioError::Kind::UnsupportedChannelLayout: return ErrorCode::NotSupported;
            case AudioError::Kind::NotMono: return ErrorCode::NotSupported;
            case AudioError::Kind::NotSixteenBit: return ErrorCode::NotSupported;
            case AudioError::Kind::BufferUploadFailed:
                return native == NativeErrorCode::OutOfMemory ? ErrorCode::OutOfMemory : ErrorCode::InvalidArgument;
            case AudioError::Kind::SourceCreationFailed:
                return native == NativeErrorCode::OutOfMemory ? ErrorCode::OutOfMemory : ErrorCode::InvalidState;
            case AudioError::Kind::WrongSourceKind: return ErrorCode::InvalidState;
            case AudioError::Kind::PositionSetFailed: return ErrorCode::InvalidArgument;
            case AudioError::Kind::ListenerUpdateFailed: return ErrorCode::InvalidState;
            case AudioError::Kind::QueryFailed: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Map error value
    template<typename F>
    auto map_err(F&& func) -> Result<T, decltype(func(std::declval<E>()))> {
        using U = decltype(func(std::declval<E>()));
        if (m_value.has_value()) {
            return Result<T, U>(std::move(*m_value));
        }
        return Result<T, U>(func(std::move(m_error)));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Non-fatal Failures
// =============================================================================

namespace detail {

/// Log and record a swallowed failure (implemented in error.cpp)
void report_nonfatal(const Error& error, const char* what);

} // namespace detail

/// Discard the failure of a steady-state update that must never abort the caller.
/// The failure is logged as a warning and counted in the error statistics.
inline void discard_nonfatal(const Result<void>& result, const char* what) {
    if (result.is_err()) {
        detail::report_nonfatal(result.error(), what);
    }
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of recorded errors of one audio kind
std::uint64_t audio_error_count(AudioError::Kind kind);

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace sonance_core
