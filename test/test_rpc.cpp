// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the JSON, HTTP and JSON-RPC client layer.

#include "test_framework.h"
#include "mock_http_server.h"

#include "core/error.h"
#include "rpc/client.h"
#include "rpc/http.h"
#include "rpc/request.h"

#include <chrono>
#include <string>

using namespace std::chrono_literals;

// ============================================================================
// JSON parsing
// ============================================================================

TEST_CASE(Json, parse_scalars_and_containers) {
    const auto v = rpc::parse_json(
        R"({"a": 1, "b": [true, null, -2.5], "c": "x", "d": {}})");
    CHECK(v.is_object());
    CHECK_EQ(v["a"].get_int(), 1);
    CHECK(v["b"].is_array());
    CHECK_EQ(v["b"].size(), 3u);
    CHECK(v["b"][0].get_bool());
    CHECK(v["b"][1].is_null());
    CHECK_NEAR(v["b"][2].get_double(), -2.5, 1e-12);
    CHECK_EQ(v["c"].get_string(), "x");
    CHECK(v["d"].is_object());
    CHECK(v["missing"].is_null());
}

TEST_CASE(Json, large_integers_become_doubles) {
    const auto v = rpc::parse_json("[9223372036854775807, 18446744073709551616]");
    CHECK(v[0].is_int());
    CHECK(v[1].is_double());
}

TEST_CASE(Json, unicode_escapes) {
    const auto v = rpc::parse_json(R"(["caf\u00e9", "\ud83d\ude00", "a\nb"])");
    CHECK_EQ(v[0].get_string(), "caf\xc3\xa9");
    CHECK_EQ(v[1].get_string(), "\xf0\x9f\x98\x80");
    CHECK_EQ(v[2].get_string(), "a\nb");
}

TEST_CASE(Json, malformed_input_is_reported) {
    CHECK_ERR(rpc::try_parse_json(""));
    CHECK_ERR(rpc::try_parse_json("{\"a\":}"));
    CHECK_ERR(rpc::try_parse_json("[1,2"));
    CHECK_ERR(rpc::try_parse_json("{} extra"));
    CHECK_ERR(rpc::try_parse_json(R"(["\ud83d"])"));
    CHECK_ERR(rpc::try_parse_json(std::string(200, '[') + std::string(200, ']')));

    auto err = rpc::try_parse_json("nope");
    CHECK(err.error().code() == core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Json, serialize_compact_and_escaped) {
    rpc::JsonValue obj;
    obj["z"] = 1;
    obj["a"] = "q\"\\\x01";
    rpc::JsonValue arr;
    arr.push_back(true);
    arr.push_back(nullptr);
    obj["m"] = arr;
    CHECK_EQ(rpc::json_serialize(obj),
             R"({"a":"q\"\\\u0001","m":[true,null],"z":1})");

    // UTF-8 passes through unescaped.
    CHECK_EQ(rpc::json_serialize(rpc::JsonValue("\xc3\xa9")), "\"\xc3\xa9\"");
}

TEST_CASE(Json, ascii_escaping_mode) {
    std::string utf8;
    rpc::append_json_string(utf8, "del\x7f\xc3\xa9");
    CHECK_EQ(utf8, "\"del\x7f\xc3\xa9\"");

    std::string ascii;
    rpc::append_json_string(ascii, "del\x7f\xc3\xa9\xf0\x9f\x98\x80\xff",
                            rpc::JsonEscape::ASCII);
    CHECK_EQ(ascii, R"("del\u007f\u00e9\ud83d\ude00\ufffd")");
}

TEST_CASE(Json, serialize_then_parse_is_stable) {
    auto v = rpc::parse_json(R"({"k":[1,"two",{"three":3.5}],"n":null})");
    CHECK(rpc::parse_json(rpc::json_serialize(v)) == v);
}

// ============================================================================
// JSON-RPC envelopes
// ============================================================================

TEST_CASE(JsonRpc, request_envelope) {
    rpc::RpcRequest req;
    req.method = "eth_chainId";
    req.id = 7;
    CHECK_EQ(req.serialize(),
             R"({"id":7,"jsonrpc":"2.0","method":"eth_chainId","params":[]})");
}

TEST_CASE(JsonRpc, response_result_and_error) {
    auto ok = rpc::RpcResponse::from_json(
        rpc::parse_json(R"({"jsonrpc":"2.0","id":3,"result":"0x1"})"));
    CHECK_OK(ok);
    CHECK(!ok.value().is_error());
    CHECK_EQ(ok.value().id, 3);
    CHECK_EQ(ok.value().result.get_string(), "0x1");

    auto err = rpc::RpcResponse::from_json(rpc::parse_json(
        R"({"jsonrpc":"2.0","id":4,"error":{"code":-32000,"message":"nonce too low"}})"));
    CHECK_OK(err);
    CHECK(err.value().is_error());
    CHECK_EQ(err.value().error_text(), "-32000: nonce too low");

    CHECK_ERR(rpc::RpcResponse::from_json(rpc::parse_json(R"({"id":1})")));
    CHECK_ERR(rpc::RpcResponse::from_json(rpc::parse_json("[]")));
}

// ============================================================================
// Url
// ============================================================================

TEST_CASE(Url, defaults_and_ports) {
    auto a = rpc::Url::parse("https://rpc.example.org/v3/secret?x=1#frag");
    CHECK_OK(a);
    CHECK(a.value().tls());
    CHECK_EQ(a.value().host, "rpc.example.org");
    CHECK_EQ(a.value().port, 443);
    CHECK_EQ(a.value().target, "/v3/secret?x=1");
    CHECK_EQ(a.value().host_header(), "rpc.example.org");
    CHECK_EQ(a.value().redacted(), "https://rpc.example.org:443");

    auto b = rpc::Url::parse("HTTP://127.0.0.1:8545");
    CHECK_OK(b);
    CHECK(!b.value().tls());
    CHECK_EQ(b.value().port, 8545);
    CHECK_EQ(b.value().target, "/");
    CHECK_EQ(b.value().host_header(), "127.0.0.1:8545");
}

TEST_CASE(Url, ipv6_literals) {
    auto a = rpc::Url::parse("http://[::1]:8545/");
    CHECK_OK(a);
    CHECK_EQ(a.value().host, "::1");
    CHECK_EQ(a.value().port, 8545);
    CHECK_EQ(a.value().host_header(), "[::1]:8545");

    auto b = rpc::Url::parse("https://[2001:db8::1]");
    CHECK_OK(b);
    CHECK_EQ(b.value().port, 443);
}

TEST_CASE(Url, rejects_bad_urls) {
    CHECK_ERR(rpc::Url::parse("localhost:8545"));
    CHECK_ERR(rpc::Url::parse("ws://localhost"));
    CHECK_ERR(rpc::Url::parse("http://"));
    CHECK_ERR(rpc::Url::parse("http://host:0"));
    CHECK_ERR(rpc::Url::parse("http://host:70000"));
    CHECK_ERR(rpc::Url::parse("http://host:80x"));
    CHECK_ERR(rpc::Url::parse("http://user:pw@host/"));
    CHECK_ERR(rpc::Url::parse("http://[::1"));
}

// ============================================================================
// HTTP response parsing
// ============================================================================

TEST_CASE(Http, content_length_body) {
    std::string raw =
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
        "Content-Length: 5\r\n\r\nhello trailing";
    CHECK(rpc::http_response_complete(raw));
    auto resp = rpc::parse_http_response(raw);
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 200);
    CHECK(resp.value().is_success());
    CHECK_EQ(resp.value().body, "hello");
    CHECK_EQ(resp.value().headers.at("content-type"), "application/json");
}

TEST_CASE(Http, chunked_body) {
    std::string raw =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\n{\"a\"\r\n"
        "3;ext=1\r\n:1}\r\n"
        "0\r\n\r\n";
    CHECK(rpc::http_response_complete(raw));
    auto resp = rpc::parse_http_response(raw);
    CHECK_OK(resp);
    CHECK_EQ(resp.value().body, "{\"a\":1}");
}

TEST_CASE(Http, incomplete_responses) {
    CHECK(!rpc::http_response_complete("HTTP/1.1 200 OK\r\nContent-Len"));
    CHECK(!rpc::http_response_complete(
        "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"));
    CHECK(!rpc::http_response_complete(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nab"));

    auto truncated = rpc::parse_http_response(
        "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
    CHECK_ERR(truncated);
    CHECK(truncated.error().code() == core::ErrorCode::NETWORK_CLOSED);

    CHECK_ERR(rpc::parse_http_response("garbage\r\n\r\n"));
}

TEST_CASE(Http, unframed_body_runs_to_end) {
    auto resp = rpc::parse_http_response(
        "HTTP/1.0 503 Service Unavailable\r\nServer: x\r\n\r\nbusy");
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 503);
    CHECK(!resp.value().is_success());
    CHECK_EQ(resp.value().body, "busy");
}

// ============================================================================
// HttpClient / JsonRpcClient over loopback
// ============================================================================

namespace {

/// Answers every call with @p result, echoing the request id.
std::string echo_result(const std::string& body, const std::string& result) {
    auto req = rpc::parse_json(body);
    return test::MockHttpServer::json_response(
        R"({"jsonrpc":"2.0","id":)" + std::to_string(req["id"].get_int()) +
        R"(,"result":)" + result + "}");
}

} // anonymous namespace

TEST_CASE(HttpClient, posts_and_reads_response) {
    test::MockHttpServer server([](const std::string& body) {
        return test::MockHttpServer::json_response("{\"echo\":" +
                                                   std::to_string(body.size()) +
                                                   "}");
    });
    auto url = rpc::Url::parse(server.url("/rpc"));
    CHECK_OK(url);

    rpc::HttpClient client;
    auto resp = client.post(url.value(), "12345", 2000ms);
    CHECK_OK(resp);
    CHECK_EQ(resp.value().status, 200);
    CHECK_EQ(resp.value().body, "{\"echo\":5}");
    CHECK_EQ(server.requests().size(), 1u);
    CHECK_EQ(server.requests()[0], "12345");
}

TEST_CASE(HttpClient, refused_connection) {
    uint16_t port = 0;
    {
        test::MockHttpServer server([](const std::string&) { return ""; });
        port = server.port();
    }
    auto url = rpc::Url::parse("http://127.0.0.1:" + std::to_string(port));
    rpc::HttpClient client;
    auto resp = client.post(url.value(), "{}", 1000ms);
    CHECK_ERR(resp);
    CHECK(resp.error().code() == core::ErrorCode::NETWORK_REFUSED);
}

TEST_CASE(HttpClient, silent_server_times_out) {
    test::MockHttpServer server([](const std::string&) { return ""; });
    auto url = rpc::Url::parse(server.url());
    rpc::HttpClient client;
    auto resp = client.post(url.value(), "{}", 200ms);
    CHECK_ERR(resp);
    CHECK(resp.error().code() == core::ErrorCode::NETWORK_TIMEOUT);
}

TEST_CASE(JsonRpcClient, returns_result_with_matching_id) {
    test::MockHttpServer server([](const std::string& body) {
        return echo_result(body, "\"0x2a\"");
    });
    rpc::JsonRpcClient client(rpc::Url::parse(server.url()).value());

    auto first = client.call("eth_chainId", rpc::JsonValue::Array{}, 2000ms);
    CHECK_OK(first);
    CHECK_EQ(first.value().get_string(), "0x2a");
    auto second = client.call("eth_chainId", rpc::JsonValue::Array{}, 2000ms);
    CHECK_OK(second);

    auto reqs = server.requests();
    CHECK_EQ(reqs.size(), 2u);
    CHECK_EQ(rpc::parse_json(reqs[0])["id"].get_int(), 1);
    CHECK_EQ(rpc::parse_json(reqs[1])["id"].get_int(), 2);
    CHECK_EQ(rpc::parse_json(reqs[0])["method"].get_string(), "eth_chainId");
}

TEST_CASE(JsonRpcClient, remote_error) {
    test::MockHttpServer server([](const std::string& body) {
        auto id = rpc::parse_json(body)["id"].get_int();
        return test::MockHttpServer::json_response(
            R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
            R"(,"error":{"code":-32000,"message":"underpriced"}})");
    });
    rpc::JsonRpcClient client(rpc::Url::parse(server.url()).value());
    auto r = client.call("eth_sendRawTransaction", rpc::JsonValue::Array{}, 2000ms);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::RPC_REMOTE_ERROR);
    CHECK(r.error().message().find("underpriced") != std::string::npos);
}

TEST_CASE(JsonRpcClient, http_error_status) {
    test::MockHttpServer server([](const std::string&) {
        return test::MockHttpServer::json_response("rate limited", 429);
    });
    rpc::JsonRpcClient client(rpc::Url::parse(server.url()).value());
    auto r = client.call("eth_chainId", rpc::JsonValue::Array{}, 2000ms);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::NETWORK_ERROR);
}

TEST_CASE(JsonRpcClient, bad_body_and_id_mismatch) {
    test::MockHttpServer garbage([](const std::string&) {
        return test::MockHttpServer::json_response("<html>");
    });
    rpc::JsonRpcClient a(rpc::Url::parse(garbage.url()).value());
    auto r1 = a.call("eth_chainId", rpc::JsonValue::Array{}, 2000ms);
    CHECK_ERR(r1);
    CHECK(r1.error().code() == core::ErrorCode::RPC_BAD_RESPONSE);

    test::MockHttpServer wrong_id([](const std::string&) {
        return test::MockHttpServer::json_response(
            R"({"jsonrpc":"2.0","id":99,"result":"0x1"})");
    });
    rpc::JsonRpcClient b(rpc::Url::parse(wrong_id.url()).value());
    auto r2 = b.call("eth_chainId", rpc::JsonValue::Array{}, 2000ms);
    CHECK_ERR(r2);
    CHECK(r2.error().code() == core::ErrorCode::RPC_BAD_RESPONSE);
}
