// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "app/logging_init.h"
#include "app/config.h"

#include "core/fs.h"
#include "core/logging.h"
#include "core/time.h"
#include "eth/units.h"

#include <sstream>
#include <system_error>

namespace app {

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const AppConfig& config) {
    auto& logger = core::Logger::instance();

    logger.set_level(config.log_level);
    if (config.log_categories !=
        static_cast<uint32_t>(core::LogCategory::ALL)) {
        set_log_categories(config.log_categories);
    }
    logger.set_print_to_console(config.print_to_console);

    if (!config.log_file.empty()) {
        if (config.log_file.has_parent_path()) {
            core::fs::ensure_directory(config.log_file.parent_path());
        }
        rotate_log_file(config.log_file, MAX_LOG_FILE_SIZE);

        if (!logger.set_log_file(config.log_file)) {
            return core::make_error(core::ErrorCode::STORAGE_ERROR,
                                    "cannot open log file '" +
                                    config.log_file.string() + "'");
        }
        logger.set_print_to_file(true);
    }

    LOG_INFO(core::LogCategory::NONE, get_startup_banner(config));
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// rotate_log_file
// ---------------------------------------------------------------------------

bool rotate_log_file(const std::filesystem::path& log_path,
                     uint64_t max_size) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(log_path, ec);
    if (ec || size < max_size) {
        return false;
    }

    std::filesystem::path rotated_path =
        log_path.parent_path() / (log_path.filename().string() + ".1");

    if (std::filesystem::exists(rotated_path, ec)) {
        std::filesystem::remove(rotated_path, ec);
        if (ec) {
            LOG_WARN(core::LogCategory::NONE,
                     "failed to remove old rotated log: " +
                     rotated_path.string());
        }
    }

    if (!core::fs::rename_safe(log_path, rotated_path)) {
        LOG_WARN(core::LogCategory::NONE,
                 "failed to rotate log file: " + log_path.string());
        return false;
    }

    LOG_INFO(core::LogCategory::NONE,
             "rotated log file: " + log_path.string() + " -> " +
             rotated_path.string() + " (was " +
             std::to_string(size / (1024 * 1024)) + " MB)");
    return true;
}

void set_log_categories(uint32_t categories) {
    auto& logger = core::Logger::instance();
    logger.disable_category(core::LogCategory::ALL);
    logger.enable_category(static_cast<core::LogCategory>(categories));
}

// ---------------------------------------------------------------------------
// get_startup_banner
// ---------------------------------------------------------------------------

std::string get_startup_banner(const AppConfig& config) {
    std::ostringstream ss;

    ss << "\n"
       << "============================================================\n"
       << "  " << get_client_name() << "\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Compiler: "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "Unknown"
#endif
       << " | C++ " << __cplusplus << "\n"
       << "  Contract: " << config.contract.to_checksum_hex() << "\n";

    for (const auto& url : config.rpc_urls) {
        ss << "  Endpoint: " << url.redacted() << "\n";
    }
    for (const auto& board : config.boards) {
        ss << "  Board " << board.id << ": " << board.source_path.string()
           << " -> token " << eth::uint256_to_decimal(board.token_id);
        if (!board.state_path.empty()) {
            ss << " (state " << board.state_path.string() << ")";
        }
        ss << "\n";
    }

    ss << "  Gas price: " << eth::format_gwei(config.gas.base) << " .. "
       << eth::format_gwei(config.gas.max) << " gwei, step "
       << eth::format_gwei(config.gas.step) << " gwei\n"
       << "  Fee ledger: " << config.fee_file.string() << "\n"
       << "  Poll interval: " << config.poll_interval.count() / 1000
       << " s\n"
       << "  Log level: " << core::log_level_string(config.log_level) << "\n"
       << "  Started: " << core::format_iso8601(core::get_time()) << "\n"
       << "============================================================\n";

    return ss.str();
}

} // namespace app
