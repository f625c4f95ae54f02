// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for RLP, ABI, addresses, units, legacy transactions and the
// Ethereum JSON-RPC endpoint.

#include "test_framework.h"
#include "mock_http_server.h"

#include "core/hex.h"
#include "crypto/keccak.h"
#include "crypto/secp256k1.h"
#include "eth/abi.h"
#include "eth/address.h"
#include "eth/client.h"
#include "eth/endpoint.h"
#include "eth/rlp.h"
#include "eth/transaction.h"
#include "eth/units.h"
#include "rpc/request.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::string hex(const std::vector<uint8_t>& bytes) {
    return core::to_hex(bytes);
}

const char* const UINT256_MAX_DEC =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";

} // anonymous namespace

// ============================================================================
// RLP
// ============================================================================

TEST_CASE(Rlp, strings) {
    CHECK_EQ(hex(eth::rlp::encode_string("dog")), "83646f67");
    CHECK_EQ(hex(eth::rlp::encode_string("")), "80");
    CHECK_EQ(hex(eth::rlp::encode_bytes(std::vector<uint8_t>{0x7f})), "7f");
    CHECK_EQ(hex(eth::rlp::encode_bytes(std::vector<uint8_t>{0x80})), "8180");

    std::string lorem = "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
    auto long_str = eth::rlp::encode_string(lorem);
    CHECK_EQ(long_str.size(), lorem.size() + 2);
    CHECK_EQ(long_str[0], 0xb8);
    CHECK_EQ(long_str[1], 56);
}

TEST_CASE(Rlp, integers) {
    CHECK_EQ(hex(eth::rlp::encode_uint(0)), "80");
    CHECK_EQ(hex(eth::rlp::encode_uint(15)), "0f");
    CHECK_EQ(hex(eth::rlp::encode_uint(127)), "7f");
    CHECK_EQ(hex(eth::rlp::encode_uint(128)), "8180");
    CHECK_EQ(hex(eth::rlp::encode_uint(1024)), "820400");

    // Leading zero bytes are stripped from big-endian input.
    std::vector<uint8_t> be = {0x00, 0x00, 0x04, 0x00};
    CHECK_EQ(hex(eth::rlp::encode_uint_be(be)), "820400");
    CHECK_EQ(hex(eth::rlp::encode_uint_be(std::vector<uint8_t>{0, 0})), "80");
}

TEST_CASE(Rlp, lists) {
    CHECK_EQ(hex(eth::rlp::encode_list({})), "c0");
    CHECK_EQ(hex(eth::rlp::encode_list({eth::rlp::encode_string("cat"),
                                        eth::rlp::encode_string("dog")})),
             "c88363617483646f67");

    // [ [], [[]], [ [], [[]] ] ]
    auto empty = eth::rlp::encode_list({});
    auto one = eth::rlp::encode_list({empty});
    auto two = eth::rlp::encode_list({empty, one});
    CHECK_EQ(hex(eth::rlp::encode_list({empty, one, two})), "c7c0c1c0c3c0c1c0");

    std::vector<eth::rlp::Bytes> many(20, eth::rlp::encode_string("abc"));
    auto long_list = eth::rlp::encode_list(many);
    CHECK_EQ(long_list[0], 0xf8);
    CHECK_EQ(long_list[1], 80);
    CHECK_EQ(long_list.size(), 82u);
}

// ============================================================================
// ABI
// ============================================================================

TEST_CASE(Abi, selectors) {
    CHECK_EQ(core::to_hex(eth::abi::selector("transfer(address,uint256)")),
             "a9059cbb");
    CHECK_EQ(core::to_hex(eth::abi::selector(eth::abi::STORE_STRING_SIGNATURE)),
             "6f711443");
}

TEST_CASE(Abi, store_string_layout) {
    auto token = eth::uint256_from_u64(7);
    auto key = core::Bytes32::from_hex(std::string(62, '0') + "ff").value();
    auto data = eth::abi::encode_store_string(token, key, "hi");

    CHECK_EQ(data.size(), 4u + 5 * 32);
    std::string h = hex(data);
    CHECK_EQ(h.substr(0, 8), "6f711443");
    CHECK_EQ(h.substr(8, 64), std::string(63, '0') + "7");
    CHECK_EQ(h.substr(72, 64), std::string(62, '0') + "ff");
    CHECK_EQ(h.substr(136, 64), std::string(62, '0') + "60");
    CHECK_EQ(h.substr(200, 64), std::string(63, '0') + "2");
    CHECK_EQ(h.substr(264, 64), "6869" + std::string(60, '0'));
}

TEST_CASE(Abi, store_string_padding) {
    core::Bytes32 zero;
    CHECK_EQ(eth::abi::encode_store_string(zero, zero, "").size(), 4u + 4 * 32);
    CHECK_EQ(eth::abi::encode_store_string(zero, zero, std::string(32, 'x')).size(),
             4u + 5 * 32);
    CHECK_EQ(eth::abi::encode_store_string(zero, zero, std::string(33, 'x')).size(),
             4u + 6 * 32);
}

// ============================================================================
// Address
// ============================================================================

TEST_CASE(Address, from_private_key_one) {
    auto key = crypto::ECKey::from_hex(std::string(63, '0') + "1");
    CHECK_OK(key);
    auto addr = eth::Address::from_pubkey(key.value().pubkey_uncompressed());
    CHECK_EQ(addr.to_hex(), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    CHECK_EQ(addr.to_checksum_hex(), "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
}

TEST_CASE(Address, eip55_checksums) {
    const char* vectors[] = {
        "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
        "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
        "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
        "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb",
    };
    for (const char* v : vectors) {
        auto addr = eth::Address::parse(v);
        CHECK_OK(addr);
        CHECK_EQ(addr.value().to_checksum_hex(), std::string(v));
        CHECK(eth::Address::has_valid_checksum(v));
    }
    CHECK(!eth::Address::has_valid_checksum(
        "0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    CHECK(eth::Address::has_valid_checksum(
        "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
}

TEST_CASE(Address, parse_errors) {
    CHECK_ERR(eth::Address::parse("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    CHECK_ERR(eth::Address::parse("0x5aaeb6053f3e94c9b9a09f33669435e7ef1bea"));
    CHECK_ERR(eth::Address::parse("0xzzaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    // Mixed case with a wrong checksum is still accepted.
    CHECK_OK(eth::Address::parse("0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
}

// ============================================================================
// Units
// ============================================================================

TEST_CASE(Units, quantities) {
    CHECK_EQ(eth::to_quantity(0), "0x0");
    CHECK_EQ(eth::to_quantity(436), "0x1b4");
    CHECK_EQ(eth::parse_quantity("0x1b4").value(), 436u);
    CHECK_EQ(eth::parse_quantity("0x0").value(), 0u);
    CHECK_EQ(eth::parse_quantity("0xffffffffffffffff").value(), UINT64_MAX);
    CHECK_ERR(eth::parse_quantity("0x"));
    CHECK_ERR(eth::parse_quantity("436"));
    CHECK_ERR(eth::parse_quantity("0xg1"));

    auto overflow = eth::parse_quantity("0x10000000000000000");
    CHECK_ERR(overflow);
    CHECK(overflow.error().code() == core::ErrorCode::PARSE_OVERFLOW);
}

TEST_CASE(Units, gwei_formatting) {
    CHECK_EQ(eth::format_gwei(1'300'000), "0.0013");
    CHECK_EQ(eth::format_gwei(20'000'000'000), "20");
    CHECK_EQ(eth::format_gwei(1), "0.000000001");
    CHECK_EQ(eth::format_gwei(1'500'000'000), "1.5");
}

TEST_CASE(Units, wei_to_fee_rounds_half_up) {
    // One fee unit is 1e8 wei.
    CHECK_EQ(eth::wei_to_fee(100'000'000).units(), 1);
    CHECK_EQ(eth::wei_to_fee(149'999'999).units(), 1);
    CHECK_EQ(eth::wei_to_fee(150'000'000).units(), 2);
    CHECK_EQ(eth::wei_to_fee(49'999'999).units(), 0);
    CHECK_EQ(eth::wei_to_fee(0).units(), 0);
}

TEST_CASE(Units, uint256_decimal_and_hex) {
    CHECK(eth::parse_uint256("1") == eth::uint256_from_u64(1));
    CHECK(eth::parse_uint256("0x10") == eth::uint256_from_u64(16));
    CHECK(eth::parse_uint256("18446744073709551615") ==
          eth::uint256_from_u64(UINT64_MAX));

    auto max = eth::parse_uint256(UINT256_MAX_DEC);
    CHECK(max.has_value());
    CHECK_EQ(max->to_hex(), std::string(64, 'f'));
    CHECK_EQ(eth::uint256_to_decimal(*max), UINT256_MAX_DEC);

    std::string too_big = UINT256_MAX_DEC;
    too_big.back() = '6';
    CHECK(!eth::parse_uint256(too_big).has_value());
    CHECK(!eth::parse_uint256("").has_value());
    CHECK(!eth::parse_uint256("-1").has_value());
    CHECK(!eth::parse_uint256("12a").has_value());
    CHECK(!eth::parse_uint256("0x").has_value());

    CHECK_EQ(eth::uint256_to_decimal(core::Bytes32{}), "0");
    CHECK_EQ(eth::uint256_to_decimal(eth::uint256_from_u64(1234567890123)),
             "1234567890123");
}

// ============================================================================
// LegacyTransaction
// ============================================================================

namespace {

eth::LegacyTransaction eip155_example() {
    eth::LegacyTransaction tx;
    tx.nonce = 9;
    tx.gas_price = 20'000'000'000;
    tx.gas_limit = 21000;
    tx.to = eth::Address::parse("0x3535353535353535353535353535353535353535").value();
    tx.value = 1'000'000'000'000'000'000ULL;
    tx.chain_id = 1;
    return tx;
}

} // anonymous namespace

TEST_CASE(Transaction, eip155_signing_hash) {
    auto tx = eip155_example();
    CHECK_EQ(tx.signing_hash().to_hex(),
             "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53");
    CHECK(!tx.is_signed());
    CHECK_EQ(hex(tx.raw()),
             "ec098504a817c800825208943535353535353535353535353535353535353535"
             "880de0b6b3a764000080018080");
}

TEST_CASE(Transaction, sign_and_recover) {
    auto tx = eip155_example();
    std::string secret;
    for (int i = 0; i < 32; ++i) secret += "46";
    auto signer = crypto::ECKey::from_hex(secret);
    CHECK_OK(signer);

    CHECK_OK(tx.sign(signer.value()));
    CHECK(tx.is_signed());
    CHECK(tx.v() == 37 || tx.v() == 38);

    auto sender = tx.recover_sender();
    CHECK_OK(sender);
    CHECK_EQ(sender.value().to_hex(), "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");

    auto raw = tx.raw();
    CHECK_EQ(raw[0], 0xf8);
    CHECK(tx.hash() == crypto::keccak256(raw));
}

TEST_CASE(Transaction, chain_id_changes_v_and_hash) {
    std::string secret;
    for (int i = 0; i < 32; ++i) secret += "46";
    auto signer = crypto::ECKey::from_hex(secret);
    CHECK_OK(signer);

    auto mainnet = eip155_example();
    auto other = eip155_example();
    other.chain_id = 11155111;
    CHECK(mainnet.signing_hash() != other.signing_hash());

    CHECK_OK(other.sign(signer.value()));
    CHECK(other.v() == 11155111ULL * 2 + 35 || other.v() == 11155111ULL * 2 + 36);
    CHECK_EQ(other.recover_sender().value().to_hex(),
             "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");
}

TEST_CASE(Transaction, unsigned_recover_fails) {
    auto tx = eip155_example();
    CHECK_ERR(tx.recover_sender());
}

// ============================================================================
// Receipt parsing
// ============================================================================

TEST_CASE(Receipt, parse_fields) {
    auto obj = rpc::parse_json(
        R"({"transactionHash":"0x)" + std::string(64, 'a') + R"(",)"
        R"("status":"0x1","gasUsed":"0x5208","blockNumber":"0x10",)"
        R"("effectiveGasPrice":"0x13d620"})");
    auto r = eth::parse_receipt(obj);
    CHECK_OK(r);
    CHECK(r.value().success);
    CHECK_EQ(r.value().gas_used, 21000u);
    CHECK_EQ(r.value().block_number, 16u);
    CHECK(r.value().effective_gas_price == std::optional<uint64_t>(1'300'000));

    auto failed = rpc::parse_json(
        R"({"transactionHash":"0x)" + std::string(64, 'b') + R"(",)"
        R"("status":"0x0","gasUsed":"0x1"})");
    auto f = eth::parse_receipt(failed);
    CHECK_OK(f);
    CHECK(!f.value().success);
    CHECK(!f.value().effective_gas_price.has_value());

    CHECK_ERR(eth::parse_receipt(rpc::parse_json(R"({"status":"0x1"})")));
    CHECK_ERR(eth::parse_receipt(rpc::parse_json("[]")));
}

// ============================================================================
// EthEndpoint against a scripted node
// ============================================================================

namespace {

struct MockNode {
    enum class SendMode { OK, REJECT };
    enum class ReceiptMode { SUCCESS, REVERTED, NEVER };

    SendMode send_mode = SendMode::OK;
    ReceiptMode receipt_mode = ReceiptMode::SUCCESS;
    int pending_polls = 0;              // null receipts before the real one
    std::atomic<int> receipt_polls{0};
    std::string last_raw;               // hex of the last raw transaction
    std::string last_nonce_tag;

    std::string handle(const std::string& body) {
        const auto req = rpc::parse_json(body);
        const std::string method = req["method"].get_string();
        const std::string id = std::to_string(req["id"].get_int());
        const rpc::JsonValue& params = req["params"];

        auto result = [&](const std::string& json) {
            return test::MockHttpServer::json_response(
                R"({"jsonrpc":"2.0","id":)" + id + R"(,"result":)" + json + "}");
        };

        if (method == "web3_clientVersion") return result(R"("Geth/mock")");
        if (method == "eth_chainId") return result(R"("0x1")");
        if (method == "eth_getTransactionCount") {
            last_nonce_tag = params[1].get_string();
            return result(R"("0x5")");
        }
        if (method == "eth_sendRawTransaction") {
            last_raw = params[0].get_string();
            if (send_mode == SendMode::REJECT) {
                return test::MockHttpServer::json_response(
                    R"({"jsonrpc":"2.0","id":)" + id +
                    R"(,"error":{"code":-32000,"message":"replacement transaction underpriced"}})");
            }
            auto bytes = core::from_hex(last_raw).value();
            return result("\"" + crypto::keccak256(bytes).to_hex_prefixed() + "\"");
        }
        if (method == "eth_getTransactionReceipt") {
            int poll = receipt_polls.fetch_add(1);
            if (receipt_mode == ReceiptMode::NEVER || poll < pending_polls) {
                return result("null");
            }
            const char* status =
                receipt_mode == ReceiptMode::SUCCESS ? "0x1" : "0x0";
            return result(R"({"transactionHash":")" + params[0].get_string() +
                          R"(","status":")" + status +
                          R"(","gasUsed":"0x7530","blockNumber":"0x2a"})");
        }
        return result("null");
    }
};

eth::EndpointTimeouts fast_timeouts() {
    eth::EndpointTimeouts t;
    t.probe = 1000ms;
    t.request = 2000ms;
    t.receipt = 3000ms;
    t.receipt_poll = 5ms;
    return t;
}

publish::WriteRequest sample_request() {
    publish::WriteRequest req;
    req.token_id = eth::uint256_from_u64(3);
    req.key = core::Bytes32::from_hex(std::string(64, '1')).value();
    req.document = "<html>board 3</html>";
    req.gas_price = 1'600'000;
    req.gas_limit = 29'504'000;
    return req;
}

crypto::ECKey test_key() {
    return crypto::ECKey::from_hex(std::string(62, '0') + "2a").value();
}

eth::Address test_contract() {
    return eth::Address::parse("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed").value();
}

} // anonymous namespace

TEST_CASE(EthEndpoint, probe_and_name) {
    MockNode node;
    test::MockHttpServer server([&node](const std::string& b) { return node.handle(b); });
    auto key = test_key();
    eth::EthEndpoint ep(rpc::Url::parse(server.url("/key/secret")).value(), key,
                        test_contract(), fast_timeouts());
    CHECK(ep.is_reachable());
    CHECK_EQ(ep.name(), "http://127.0.0.1:" + std::to_string(server.port()));
}

TEST_CASE(EthEndpoint, unreachable_node) {
    uint16_t port = 0;
    {
        test::MockHttpServer gone([](const std::string&) { return ""; });
        port = gone.port();
    }
    auto key = test_key();
    eth::EthEndpoint ep(rpc::Url::parse("http://127.0.0.1:" + std::to_string(port)).value(),
                        key, test_contract(), fast_timeouts());
    CHECK(!ep.is_reachable());
    auto r = ep.submit(sample_request());
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::NETWORK_REFUSED);
}

TEST_CASE(EthEndpoint, accepted_after_pending_receipts) {
    MockNode node;
    node.pending_polls = 2;
    test::MockHttpServer server([&node](const std::string& b) { return node.handle(b); });
    auto key = test_key();
    eth::EthEndpoint ep(rpc::Url::parse(server.url()).value(), key,
                        test_contract(), fast_timeouts());

    auto request = sample_request();
    auto r = ep.submit(request);
    CHECK_OK(r);
    CHECK(r.value().is_accepted());
    CHECK_EQ(r.value().gas_used, 30000u);
    CHECK_EQ(node.last_nonce_tag, "latest");
    CHECK_EQ(node.receipt_polls.load(), 3);

    // The raw transaction carries the storeString call data verbatim.
    auto calldata = core::to_hex(eth::abi::encode_store_string(
        request.token_id, request.key, request.document));
    CHECK(node.last_raw.find(calldata) != std::string::npos);
    auto raw = core::from_hex(node.last_raw).value();
    CHECK_EQ(r.value().tx_hash, crypto::keccak256(raw).to_hex_prefixed());
}

TEST_CASE(EthEndpoint, reverted_receipt_is_rejected) {
    MockNode node;
    node.receipt_mode = MockNode::ReceiptMode::REVERTED;
    test::MockHttpServer server([&node](const std::string& b) { return node.handle(b); });
    auto key = test_key();
    eth::EthEndpoint ep(rpc::Url::parse(server.url()).value(), key,
                        test_contract(), fast_timeouts());
    auto r = ep.submit(sample_request());
    CHECK_OK(r);
    CHECK(!r.value().is_accepted());
    CHECK(!r.value().tx_hash.empty());
}

TEST_CASE(EthEndpoint, node_refusal_is_rejected) {
    MockNode node;
    node.send_mode = MockNode::SendMode::REJECT;
    test::MockHttpServer server([&node](const std::string& b) { return node.handle(b); });
    auto key = test_key();
    eth::EthEndpoint ep(rpc::Url::parse(server.url()).value(), key,
                        test_contract(), fast_timeouts());
    auto r = ep.submit(sample_request());
    CHECK_OK(r);
    CHECK(!r.value().is_accepted());
    CHECK(r.value().detail.find("underpriced") != std::string::npos);
    CHECK_EQ(node.receipt_polls.load(), 0);
}

TEST_CASE(EthEndpoint, receipt_timeout) {
    MockNode node;
    node.receipt_mode = MockNode::ReceiptMode::NEVER;
    test::MockHttpServer server([&node](const std::string& b) { return node.handle(b); });
    auto key = test_key();
    auto timeouts = fast_timeouts();
    timeouts.receipt = 100ms;
    eth::EthEndpoint ep(rpc::Url::parse(server.url()).value(), key,
                        test_contract(), timeouts);
    auto r = ep.submit(sample_request());
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::NETWORK_TIMEOUT);
    CHECK(node.receipt_polls.load() >= 1);
}
