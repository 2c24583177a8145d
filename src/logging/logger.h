#pragma once

// ==============================================================================
// Logger - Process-wide Diagnostic Log
// ==============================================================================
// Single named spdlog logger ("voiceshaper") on a coloured stderr sink.
// Created lazily on first use; safe to call from any thread.
// ==============================================================================

#include <spdlog/spdlog.h>

#include <memory>

namespace VoiceShaper::Log {

/// Name under which the logger is registered with spdlog
inline constexpr const char* kLoggerName = "voiceshaper";

/// Shared logger instance
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Adjust verbosity (default: info)
void setLevel(spdlog::level::level_enum level);

} // namespace VoiceShaper::Log
