#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// AppConfig -- everything the chainboard process needs to start.
//
// Built from a core::Config holding command-line values over file values
// (chainboard.conf, or a .env file), with secrets and endpoints falling
// back to environment variables. Startup errors are reported here; once
// an AppConfig exists every board can be wired up.
// ---------------------------------------------------------------------------

#ifndef CHAINBOARD_APP_CONFIG_H
#define CHAINBOARD_APP_CONFIG_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "core/types.h"
#include "eth/address.h"
#include "publish/gas_price.h"
#include "rpc/http.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace app {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 3;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "";

/// e.g. "0.3.0"
std::string get_version_string();

/// e.g. "chainboard v0.3.0"
std::string get_client_name();

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

inline constexpr std::string_view DEFAULT_CONF_FILE = "chainboard.conf";
inline constexpr std::string_view DEFAULT_ENV_FILE = ".env";
inline constexpr std::string_view DEFAULT_WRITE_KEY =
    "0xfc77a78c81db9794340a10dbcb0632f44d2d889f2cac2911b039a50f90ead7d0";
inline constexpr std::string_view DEFAULT_SOURCE_PATTERN = "board{id}.txt";
inline constexpr std::string_view DEFAULT_STATE_PATTERN = "board{id}.state";

struct BoardConfig {
    std::string           id;
    std::string           private_key_hex;
    core::Bytes32         token_id;
    std::filesystem::path source_path;
    std::filesystem::path state_path;    // empty: in-memory only
};

struct AppConfig {
    std::vector<BoardConfig> boards;
    eth::Address             contract;
    std::vector<rpc::Url>    rpc_urls;
    core::Bytes32            write_key;

    std::filesystem::path template_path = "template.html";
    std::filesystem::path fee_file = "fee.txt";

    publish::GasPricePolicy gas;
    uint64_t gas_limit = 29'504'000;

    std::chrono::milliseconds receipt_timeout{60'000};
    std::chrono::milliseconds receipt_poll{1'000};
    std::chrono::milliseconds probe_timeout{5'000};
    std::chrono::milliseconds request_timeout{30'000};   // per JSON-RPC call
    std::chrono::milliseconds poll_interval{60'000};

    core::LogLevel        log_level = core::LogLevel::INFO;
    uint32_t              log_categories =
        static_cast<uint32_t>(core::LogCategory::ALL);
    std::filesystem::path log_file;      // empty: console only
    bool                  print_to_console = true;
};

/// Build an AppConfig from already-loaded values. Missing required values
/// yield CONFIG_MISSING, unusable ones CONFIG_ERROR.
core::Result<AppConfig> load_app_config(const core::Config& raw);

/// Replace "{id}" in @p pattern with @p board_id.
std::string expand_board_pattern(std::string_view pattern,
                                 std::string_view board_id);

/// Parse the command line, handle -help / -version (exits), load the
/// config file and build the AppConfig.
core::Result<AppConfig> parse_args(int argc, const char* const argv[]);

void print_usage();
void print_version();

} // namespace app

#endif // CHAINBOARD_APP_CONFIG_H
