#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Logging setup for the chainboard process.
//
// Applies the AppConfig logging fields to the global Logger: level,
// category mask, console output and an optional log file (rotated when it
// grows past MAX_LOG_FILE_SIZE).
// ---------------------------------------------------------------------------

#ifndef CHAINBOARD_APP_LOGGING_INIT_H
#define CHAINBOARD_APP_LOGGING_INIT_H

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace app {

struct AppConfig;

/// Configure the Logger from @p config and write the startup banner.
/// Fails with STORAGE_ERROR if the log file cannot be opened.
[[nodiscard]] core::Result<void> init_logging(const AppConfig& config);

inline constexpr uint64_t MAX_LOG_FILE_SIZE = 50 * 1024 * 1024;  // 50 MB

/// Rename @p log_path to "<log_path>.1" once it reaches @p max_size,
/// replacing an older rotated file. Returns true if it rotated.
bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size = MAX_LOG_FILE_SIZE);

/// Replace the enabled category set with @p categories.
void set_log_categories(uint32_t categories);

/// Multi-line banner: client name, build, boards, endpoints, gas policy.
[[nodiscard]] std::string get_startup_banner(const AppConfig& config);

} // namespace app

#endif // CHAINBOARD_APP_LOGGING_INIT_H
