#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for sonance_core module

#include <cstdint>

namespace sonance_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
enum class NativeErrorCode : std::uint8_t;
struct NativeError;
struct AudioError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace sonance_core
