// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "app/config.h"

#include "core/fs.h"
#include "eth/units.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <set>
#include <sstream>

namespace app {

// ---------------------------------------------------------------------------
// Version helpers
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "chainboard v" + get_version_string();
}

std::string expand_board_pattern(std::string_view pattern,
                                 std::string_view board_id) {
    static constexpr std::string_view PLACEHOLDER = "{id}";
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = pattern.find(PLACEHOLDER, pos);
        if (hit == std::string_view::npos) {
            out.append(pattern.substr(pos));
            break;
        }
        out.append(pattern.substr(pos, hit - pos));
        out.append(board_id);
        pos = hit + PLACEHOLDER.size();
    }
    return out;
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------
namespace {

bool valid_board_id(std::string_view id) {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
               c == '-' || c == '.';
    });
}

bool has_placeholder(std::string_view pattern) {
    return pattern.find("{id}") != std::string_view::npos;
}

// Ceiling for every duration setting (one year). Keeps now() + duration
// inside steady_clock's nanosecond range.
constexpr uint64_t MAX_DURATION_MS = 365ULL * 24 * 60 * 60 * 1000;

core::Result<std::chrono::milliseconds> positive_duration(
    const core::Config& raw, std::string_view key, uint64_t default_val,
    uint64_t ms_per_unit) {
    uint64_t value = raw.get_uint(key, default_val);
    if (value == 0) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                std::string{key} + " must be positive");
    }
    if (value > MAX_DURATION_MS / ms_per_unit) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                std::string{key} + " is out of range: " +
                                    std::to_string(value));
    }
    return std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(value * ms_per_unit));
}

std::vector<std::string> collect_board_ids(const core::Config& raw) {
    std::vector<std::string> ids;
    for (const auto& entry : raw.get_list("board")) {
        for (auto& id : core::split_list(entry)) {
            ids.push_back(std::move(id));
        }
    }
    return ids;
}

core::Result<std::vector<rpc::Url>> collect_rpc_urls(const core::Config& raw) {
    std::vector<std::string> texts;
    if (auto joined = raw.get_with_env("rpcurls", "RPC_URLS")) {
        texts = core::split_list(*joined);
    }
    for (const auto& entry : raw.get_list("rpcurl")) {
        if (!entry.empty()) texts.push_back(entry);
    }
    if (texts.empty()) {
        return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                "no RPC endpoints (rpcurls / RPC_URLS)");
    }

    std::vector<rpc::Url> urls;
    for (const auto& text : texts) {
        auto url = rpc::Url::parse(text);
        if (!url.ok()) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "invalid RPC URL: " +
                                    url.error().message());
        }
        urls.push_back(std::move(url).value());
    }
    return urls;
}

/// Token id of a board: explicit value, else the board id itself.
core::Result<core::Bytes32> resolve_token_id(const core::Config& raw,
                                             const std::string& board_id) {
    auto fallback = eth::parse_uint256(board_id);
    auto text = raw.get_with_env("tokenid" + board_id, "TOKEN_ID" + board_id);

    if (text.has_value()) {
        if (auto parsed = eth::parse_uint256(*text)) return *parsed;
        LOG_ERROR(core::LogCategory::CONFIG,
                  "invalid token id '" + *text + "' for board " + board_id +
                  ", using the board id");
    } else {
        LOG_WARN(core::LogCategory::CONFIG,
                 "TOKEN_ID" + board_id + " not set, using the board id");
    }

    if (!fallback.has_value()) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "board " + board_id +
                                " needs a numeric token id");
    }
    return *fallback;
}

void apply_logging(const core::Config& raw, AppConfig& config) {
    if (auto lvl = raw.get("loglevel")) {
        if (auto parsed = core::parse_log_level(*lvl)) {
            config.log_level = *parsed;
        } else {
            LOG_ERROR(core::LogCategory::CONFIG,
                      "unknown log level '" + *lvl + "', using info");
        }
    }

    // -debug enables debug output, optionally narrowed to categories.
    auto debug = raw.get_list("debug");
    if (!debug.empty()) {
        uint32_t mask = 0;
        for (const auto& entry : debug) {
            for (const auto& name : core::split_list(entry)) {
                auto cat = core::parse_log_category(name);
                if (!cat.has_value()) {
                    LOG_ERROR(core::LogCategory::CONFIG,
                              "unknown log category '" + name + "'");
                    continue;
                }
                mask |= static_cast<uint32_t>(*cat);
            }
        }
        if (mask != 0) config.log_categories = mask;
        if (config.log_level > core::LogLevel::DEBUG) {
            config.log_level = core::LogLevel::DEBUG;
        }
    }

    config.log_file = raw.get_or("logfile", "");
    config.print_to_console = raw.get_bool("printtoconsole", true);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// load_app_config
// ---------------------------------------------------------------------------

core::Result<AppConfig> load_app_config(const core::Config& raw) {
    AppConfig config;
    apply_logging(raw, config);

    auto contract_text = raw.get_with_env("contract", "CONTRACT_ADDRESS");
    if (!contract_text.has_value()) {
        return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                "contract address (contract / "
                                "CONTRACT_ADDRESS) is required");
    }
    auto contract = eth::Address::parse(*contract_text);
    if (!contract.ok()) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "invalid contract address: " +
                                contract.error().message());
    }
    config.contract = contract.value();

    CHAINBOARD_TRY_ASSIGN(urls, collect_rpc_urls(raw));
    config.rpc_urls = std::move(urls);

    auto write_key = core::Bytes32::from_hex(
        raw.get_or("writekey", DEFAULT_WRITE_KEY));
    if (!write_key.has_value()) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "writekey must be 32 bytes of hex");
    }
    config.write_key = *write_key;

    config.template_path = raw.get_or("template", "template.html");
    config.fee_file = raw.get_or("feefile", "fee.txt");
    if (config.fee_file.empty()) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "feefile must not be empty");
    }

    config.gas.base = raw.get_uint("gaspricebase", config.gas.base);
    config.gas.max = raw.get_uint("gaspricemax", config.gas.max);
    config.gas.step = raw.get_uint("gaspricestep", config.gas.step);
    config.gas_limit = raw.get_uint("gaslimit", config.gas_limit);
    if (config.gas_limit == 0) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "gaslimit must be positive");
    }

    CHAINBOARD_TRY_ASSIGN(receipt_timeout,
                          positive_duration(raw, "receipttimeout", 60, 1000));
    CHAINBOARD_TRY_ASSIGN(receipt_poll,
                          positive_duration(raw, "receiptpoll", 1000, 1));
    CHAINBOARD_TRY_ASSIGN(probe_timeout,
                          positive_duration(raw, "probetimeout", 5000, 1));
    CHAINBOARD_TRY_ASSIGN(request_timeout,
                          positive_duration(raw, "rpctimeout", 30, 1000));
    CHAINBOARD_TRY_ASSIGN(poll_interval,
                          positive_duration(raw, "pollinterval", 60, 1000));
    config.receipt_timeout = receipt_timeout;
    config.receipt_poll = receipt_poll;
    config.probe_timeout = probe_timeout;
    config.request_timeout = request_timeout;
    config.poll_interval = poll_interval;

    // -- boards --------------------------------------------------------------

    auto ids = collect_board_ids(raw);
    if (ids.empty()) {
        return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                "at least one board is required (-board=<id>)");
    }

    const std::string source_pattern =
        raw.get_or("sourcepattern", DEFAULT_SOURCE_PATTERN);
    // Absent: per-board file beside the ledger. Present but empty: no file.
    auto state_pattern = raw.get("statefile");
    const bool shared_names = ids.size() > 1;
    if (shared_names && !has_placeholder(source_pattern)) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "sourcepattern needs {id} with several boards");
    }
    if (shared_names && state_pattern.has_value() && !state_pattern->empty() &&
        !has_placeholder(*state_pattern)) {
        return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                "statefile needs {id} with several boards");
    }

    std::set<std::string> seen;
    for (const auto& id : ids) {
        if (!valid_board_id(id)) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "invalid board id '" + id + "'");
        }
        if (!seen.insert(id).second) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "board " + id + " listed twice");
        }

        BoardConfig board;
        board.id = id;

        auto key = raw.get_with_env("privkey" + id, "PRIVATE_KEY" + id);
        if (!key.has_value()) {
            return core::make_error(core::ErrorCode::CONFIG_MISSING,
                                    "PRIVATE_KEY" + id + " is not set");
        }
        board.private_key_hex = *key;

        CHAINBOARD_TRY_ASSIGN(token_id, resolve_token_id(raw, id));
        board.token_id = token_id;

        board.source_path = expand_board_pattern(source_pattern, id);
        if (!state_pattern.has_value()) {
            board.state_path = config.fee_file.parent_path() /
                expand_board_pattern(DEFAULT_STATE_PATTERN, id);
        } else if (!state_pattern->empty()) {
            board.state_path = expand_board_pattern(*state_pattern, id);
        }

        config.boards.push_back(std::move(board));
    }

    return config;
}

// ---------------------------------------------------------------------------
// parse_args
// ---------------------------------------------------------------------------

core::Result<AppConfig> parse_args(int argc, const char* const argv[]) {
    core::Config raw;
    raw.parse_args(argc, argv);

    if (raw.has("help") || raw.has("h") || raw.has("?")) {
        print_usage();
        std::exit(0);
    }
    if (raw.has("version")) {
        print_version();
        std::exit(0);
    }

    // -conf=<path> must exist; the defaults are optional.
    if (auto conf = raw.get("conf"); conf.has_value() && !conf->empty()) {
        if (!raw.parse_file(*conf)) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "cannot read config file '" + *conf + "'");
        }
    } else if (core::fs::file_exists(std::string{DEFAULT_CONF_FILE})) {
        raw.parse_file(std::string{DEFAULT_CONF_FILE});
    } else if (core::fs::file_exists(std::string{DEFAULT_ENV_FILE})) {
        raw.parse_file(std::string{DEFAULT_ENV_FILE});
    }

    return load_app_config(raw);
}

// ---------------------------------------------------------------------------
// print_usage / print_version
// ---------------------------------------------------------------------------

void print_usage() {
    std::cout
        << get_client_name() << "\n\n"
        << "Usage: chainboard [options]\n\n"
        << "Publishes board<id>.txt snapshots to a storeString contract.\n\n"
        << "Options:\n"
        << "  -help, -h, -?            Print this help message and exit\n"
        << "  -version                 Print version and exit\n"
        << "  -conf=<file>             Config file (default: chainboard.conf,"
           " then .env)\n"
        << "\nBoards:\n"
        << "  -board=<id>              Board to publish (repeatable or"
           " comma list)\n"
        << "  -privkey<id>=<hex>       Signing key (env PRIVATE_KEY<id>)\n"
        << "  -tokenid<id>=<n>         Token id (env TOKEN_ID<id>,"
           " default: board id)\n"
        << "  -sourcepattern=<path>    Source file (default: board{id}.txt)\n"
        << "  -template=<file>         Document template"
           " (default: template.html)\n"
        << "  -statefile=<path>        Publish state (default: board{id}.state"
           " beside the fee file; empty: memory)\n"
        << "\nChain:\n"
        << "  -contract=<addr>         Contract address"
           " (env CONTRACT_ADDRESS)\n"
        << "  -rpcurls=<a,b>           RPC endpoints in order (env RPC_URLS)\n"
        << "  -rpcurl=<url>            Additional RPC endpoint (repeatable)\n"
        << "  -writekey=<hex32>        Storage key passed to storeString\n"
        << "  -gaspricebase=<wei>      Base gas price (default: 1300000)\n"
        << "  -gaspricemax=<wei>       Gas price cap (default: 3000000)\n"
        << "  -gaspricestep=<wei>      Escalation step (default: 300000)\n"
        << "  -gaslimit=<n>            Gas limit (default: 29504000)\n"
        << "  -receipttimeout=<s>      Receipt wait per endpoint (default: 60)\n"
        << "  -receiptpoll=<ms>        Receipt poll interval (default: 1000)\n"
        << "  -probetimeout=<ms>       Liveness probe timeout (default: 5000)\n"
        << "  -rpctimeout=<s>          JSON-RPC call timeout (default: 30)\n"
        << "  -pollinterval=<s>        Source poll interval (default: 60)\n"
        << "  -feefile=<file>          Shared fee ledger (default: fee.txt)\n"
        << "\nLogging:\n"
        << "  -loglevel=<level>        trace|debug|info|warn|error|off\n"
        << "  -debug[=<cat,...>]       Debug output (source, publish, gas,"
           " fees, rpc, http, tx, config, lock)\n"
        << "  -logfile=<file>          Also log to this file\n"
        << "  -printtoconsole=<0|1>    Log to stdout (default: 1)\n"
        << std::endl;
}

void print_version() {
    std::cout << get_client_name() << "\n"
              << "Copyright (c) 2024-2026 The Chainboard Developers\n"
              << "Distributed under the MIT software license.\n"
              << std::endl;
}

} // namespace app
