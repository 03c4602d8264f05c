/// @file error.cpp
/// @brief Error handling implementation for sonance_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics and the non-fatal failure sink

#include <sonance/core/error.hpp>
#include <sonance/core/log.hpp>

#include <array>
#include <atomic>
#include <sstream>
#include <vector>

namespace sonance_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format audio error with full context
std::string format_audio_error(const AudioError& err) {
    std::ostringstream oss;
    oss << "[AudioError:" << audio_error_kind_name(err.kind) << "] " << err.message;

    if (err.native) {
        oss << " (native: " << native_error_code_name(err.native->code) << ")";
    }
    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, AudioError>) {
            oss << detail::format_audio_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<float, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::string, Error>;
template class Result<void, NativeError>;
template class Result<float, NativeError>;
template class Result<bool, NativeError>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

namespace {

constexpr std::size_t k_audio_kind_count =
    static_cast<std::size_t>(AudioError::Kind::QueryFailed) + 1;

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
    std::array<std::atomic<std::uint64_t>, k_audio_kind_count> audio_errors{};
};

ErrorStats s_error_stats;

} // anonymous namespace

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (const auto* audio = error.as<AudioError>()) {
        s_error_stats.audio_errors[static_cast<std::size_t>(audio->kind)]
            .fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t audio_error_count(AudioError::Kind kind) {
    return s_error_stats.audio_errors[static_cast<std::size_t>(kind)]
        .load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
    for (auto& counter : s_error_stats.audio_errors) {
        counter.store(0, std::memory_order_relaxed);
    }
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";

    for (std::size_t i = 0; i < k_audio_kind_count; ++i) {
        auto count = s_error_stats.audio_errors[i].load();
        if (count > 0) {
            oss << "  " << audio_error_kind_name(static_cast<AudioError::Kind>(i))
                << ": " << count << "\n";
        }
    }
    return oss.str();
}

} // namespace debug

// =============================================================================
// Non-fatal Failures
// =============================================================================

namespace detail {

void report_nonfatal(const Error& error, const char* what) {
    debug::record_error(error);
    core_logger()->warn("{} failed (ignored): {}", what, error.message());
}

} // namespace detail

} // namespace sonance_core
