// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for configuration loading and application wiring.

#include "test_framework.h"

#include "app/app.h"
#include "app/config.h"
#include "core/config.h"
#include "core/signal.h"
#include "eth/units.h"

#include <string>
#include <vector>

namespace {

const char* const CONTRACT = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
const char* const KEY_ONE =
    "0x0000000000000000000000000000000000000000000000000000000000000001";

core::Config make_config(const std::vector<std::string>& args) {
    std::vector<const char*> argv = {"chainboard"};
    for (const auto& a : args) argv.push_back(a.c_str());
    core::Config cfg;
    cfg.parse_args(static_cast<int>(argv.size()), argv.data());
    return cfg;
}

std::vector<std::string> minimal_args() {
    return {
        std::string("-contract=") + CONTRACT,
        "-rpcurls=http://127.0.0.1:8545, https://rpc.example.org/v1/secret",
        "-board=1",
        std::string("-privkey1=") + KEY_ONE,
        "-tokenid1=42",
    };
}

} // anonymous namespace

// ============================================================================
// load_app_config
// ============================================================================

TEST_CASE(AppConfig, defaults) {
    auto cfg = app::load_app_config(make_config(minimal_args()));
    CHECK_OK(cfg);
    const auto& c = cfg.value();

    CHECK_EQ(c.contract.to_checksum_hex(), CONTRACT);
    CHECK_EQ(c.rpc_urls.size(), 2u);
    CHECK_EQ(c.rpc_urls[1].redacted(), "https://rpc.example.org:443");
    CHECK_EQ(c.gas.base, 1'300'000u);
    CHECK_EQ(c.gas.max, 3'000'000u);
    CHECK_EQ(c.gas.step, 300'000u);
    CHECK_EQ(c.gas_limit, 29'504'000u);
    CHECK(c.poll_interval == std::chrono::seconds(60));
    CHECK(c.receipt_timeout == std::chrono::seconds(60));
    CHECK(c.request_timeout == std::chrono::seconds(30));
    CHECK_EQ(c.fee_file.string(), "fee.txt");
    CHECK_EQ(c.template_path.string(), "template.html");

    CHECK_EQ(c.boards.size(), 1u);
    const auto& board = c.boards[0];
    CHECK_EQ(board.id, "1");
    CHECK_EQ(board.source_path.string(), "board1.txt");
    CHECK_EQ(board.state_path.string(), "board1.state");
    CHECK(board.token_id == eth::uint256_from_u64(42));
    CHECK_EQ(board.private_key_hex, KEY_ONE);
}

TEST_CASE(AppConfig, state_file_beside_ledger) {
    auto args = minimal_args();
    args.push_back("-feefile=/var/lib/chainboard/fee.txt");
    auto cfg = app::load_app_config(make_config(args));
    CHECK_OK(cfg);
    CHECK_EQ(cfg.value().boards[0].state_path.string(),
             "/var/lib/chainboard/board1.state");

    args.push_back("-statefile=");
    auto memory = app::load_app_config(make_config(args));
    CHECK_OK(memory);
    CHECK(memory.value().boards[0].state_path.empty());
}

TEST_CASE(AppConfig, overrides) {
    auto args = minimal_args();
    args.push_back("-gaspricebase=1000");
    args.push_back("-gaspricemax=5000");
    args.push_back("-gaspricestep=500");
    args.push_back("-pollinterval=5");
    args.push_back("-receiptpoll=250");
    args.push_back("-sourcepattern=data/{id}/board.txt");
    auto cfg = app::load_app_config(make_config(args));
    CHECK_OK(cfg);
    CHECK_EQ(cfg.value().gas.base, 1000u);
    CHECK_EQ(cfg.value().gas.max, 5000u);
    CHECK(cfg.value().poll_interval == std::chrono::seconds(5));
    CHECK(cfg.value().receipt_poll == std::chrono::milliseconds(250));
    CHECK_EQ(cfg.value().boards[0].source_path.string(), "data/1/board.txt");
}

TEST_CASE(AppConfig, required_settings) {
    auto drop = [](const std::string& prefix) {
        std::vector<std::string> out;
        for (const auto& a : minimal_args()) {
            if (a.rfind(prefix, 0) != 0) out.push_back(a);
        }
        return out;
    };

    auto no_contract = app::load_app_config(make_config(drop("-contract")));
    CHECK_ERR(no_contract);
    CHECK(no_contract.error().code() == core::ErrorCode::CONFIG_MISSING);

    auto no_urls = app::load_app_config(make_config(drop("-rpcurls")));
    CHECK_ERR(no_urls);
    CHECK(no_urls.error().code() == core::ErrorCode::CONFIG_MISSING);

    auto no_key = app::load_app_config(make_config(drop("-privkey1")));
    CHECK_ERR(no_key);
    CHECK(no_key.error().code() == core::ErrorCode::CONFIG_MISSING);

    auto no_board = app::load_app_config(make_config(drop("-board")));
    CHECK_ERR(no_board);
    CHECK(no_board.error().code() == core::ErrorCode::CONFIG_MISSING);
}

TEST_CASE(AppConfig, rejects_bad_values) {
    auto with = [](const std::string& extra) {
        auto args = minimal_args();
        args.push_back(extra);
        return app::load_app_config(make_config(args));
    };
    CHECK_ERR(with("-contract=0x1234"));
    CHECK_ERR(with("-rpcurl=not a url"));
    CHECK_ERR(with("-writekey=0xabcd"));
    CHECK_ERR(with("-gaslimit=0"));
    CHECK_ERR(with("-pollinterval=0"));
    CHECK_ERR(with("-board=1"));          // listed twice
    CHECK_ERR(with("-board=b/1"));
}

TEST_CASE(AppConfig, durations_are_bounded) {
    auto with = [](const std::string& extra) {
        auto args = minimal_args();
        args.push_back(extra);
        return app::load_app_config(make_config(args));
    };

    auto wrapped = with("-pollinterval=18446744073709551615");
    CHECK_ERR(wrapped);
    CHECK(wrapped.error().code() == core::ErrorCode::CONFIG_ERROR);
    CHECK_ERR(with("-receipttimeout=9223372036854776"));
    CHECK_ERR(with("-receiptpoll=31536000001"));

    auto year = with("-pollinterval=31536000");
    CHECK_OK(year);
    CHECK(year.value().poll_interval == std::chrono::hours(24 * 365));
}

TEST_CASE(AppConfig, token_id_falls_back_to_board_id) {
    std::vector<std::string> args = {
        std::string("-contract=") + CONTRACT,
        "-rpcurls=http://127.0.0.1:8545",
        "-board=7",
        std::string("-privkey7=") + KEY_ONE,
    };
    auto cfg = app::load_app_config(make_config(args));
    CHECK_OK(cfg);
    CHECK(cfg.value().boards[0].token_id == eth::uint256_from_u64(7));

    args.push_back("-tokenid7=twelve");
    auto invalid = app::load_app_config(make_config(args));
    CHECK_OK(invalid);
    CHECK(invalid.value().boards[0].token_id == eth::uint256_from_u64(7));

    std::vector<std::string> named = {
        std::string("-contract=") + CONTRACT,
        "-rpcurls=http://127.0.0.1:8545",
        "-board=main",
        std::string("-privkeymain=") + KEY_ONE,
    };
    CHECK_ERR(app::load_app_config(make_config(named)));
}

TEST_CASE(AppConfig, several_boards_need_placeholders) {
    std::vector<std::string> args = {
        std::string("-contract=") + CONTRACT,
        "-rpcurls=http://127.0.0.1:8545",
        "-board=1,2",
        std::string("-privkey1=") + KEY_ONE,
        std::string("-privkey2=") + KEY_ONE,
    };
    auto cfg = app::load_app_config(make_config(args));
    CHECK_OK(cfg);
    CHECK_EQ(cfg.value().boards.size(), 2u);
    CHECK_EQ(cfg.value().boards[1].source_path.string(), "board2.txt");

    auto fixed_source = args;
    fixed_source.push_back("-sourcepattern=board.txt");
    CHECK_ERR(app::load_app_config(make_config(fixed_source)));

    auto fixed_state = args;
    fixed_state.push_back("-statefile=state.txt");
    CHECK_ERR(app::load_app_config(make_config(fixed_state)));
}

TEST_CASE(AppConfig, pattern_and_version) {
    CHECK_EQ(app::expand_board_pattern("board{id}.txt", "3"), "board3.txt");
    CHECK_EQ(app::expand_board_pattern("{id}/{id}.state", "x"), "x/x.state");
    CHECK_EQ(app::expand_board_pattern("fixed", "3"), "fixed");
    CHECK_EQ(app::get_client_name(), "chainboard v" + app::get_version_string());
}

// ============================================================================
// App
// ============================================================================

namespace {

app::AppConfig app_config(const test::TempDir& dir, const std::string& key) {
    std::vector<std::string> args = {
        std::string("-contract=") + CONTRACT,
        "-rpcurls=http://127.0.0.1:1",
        "-board=1",
        "-privkey1=" + key,
        "-feefile=" + (dir / "fee.txt").string(),
        "-template=" + (dir / "template.html").string(),
        "-sourcepattern=" + (dir / "board{id}.txt").string(),
        "-printtoconsole=0",
    };
    return app::load_app_config(make_config(args)).value();
}

} // anonymous namespace

TEST_CASE(App, init_builds_one_worker_per_board) {
    test::TempDir dir;
    {
        app::App application(app_config(dir, KEY_ONE));
        CHECK_OK(application.init());
        CHECK_EQ(application.worker_count(), 1u);
        CHECK_EQ(application.worker(0).options().board_id, "1");
        CHECK(application.worker(0).run_cycle() ==
              publish::CycleOutcome::WAITING_FOR_SOURCE);
        CHECK_ERR(application.init());
        application.shutdown();
    }
    core::reset_shutdown();
}

TEST_CASE(App, invalid_key_fails_init) {
    test::TempDir dir;
    {
        app::App application(app_config(dir, std::string(64, '0')));
        auto r = application.init();
        CHECK_ERR(r);
        CHECK(r.error().code() == core::ErrorCode::CRYPTO_KEY_FAIL);
        CHECK(r.error().message().find(std::string(64, '0')) == std::string::npos);
        CHECK_EQ(application.worker_count(), 0u);
    }
    core::reset_shutdown();
}
