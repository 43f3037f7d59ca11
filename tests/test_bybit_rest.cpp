#include <cassert>
#include <exception>
#include <iostream>
#include <string>

#include "exec/bybit_rest.hpp"

using namespace exec;
using json = nlohmann::json;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "[PASS]\n"; \
} while(0)

// ExchangeError code; -998 for any other exception, -999 when nothing was thrown
static int reply_error(const std::string& body){
    try { parse_reply(body, "GET /v5/test"); }
    catch (const ExchangeError& e) { return e.code(); }
    catch (const std::exception&) { return -998; }
    return -999;
}

TEST(test_reply_ok_and_retcode) {
    const auto j = parse_reply(R"({"retCode":0,"retMsg":"OK","result":{}})", "GET /v5/test");
    assert(j["retCode"]==0);
    assert(reply_error(R"({"retCode":10001,"retMsg":"params error"})")==10001);
    assert(reply_error(R"({"retMsg":"no code"})")==-1);
}

TEST(test_malformed_replies_are_exchange_errors) {
    assert(reply_error("null")==0);
    assert(reply_error("[]")==0);
    assert(reply_error("42")==0);
    assert(reply_error("{ truncated")==0);
    assert(reply_error(R"({"retCode":"0"})")==-1);   // wrong-typed code
    assert(reply_error("")==-1);
}

TEST(test_klines_oldest_first) {
    const auto j = json::parse(R"({"retCode":0,"result":{"list":[
        ["2000","101","103","100","102","5"],
        ["1000","100","102","99","101","4"],
        ["bad"],
        null
    ]}})");
    const auto c = parse_klines(j);
    assert(c.size()==2);
    assert(c[0].open_time_ms==1000 && c[0].close==101.0 && c[0].volume==4.0);
    assert(c[1].open_time_ms==2000 && c[1].high==103.0);

    assert(parse_klines(json::parse(R"({"retCode":0,"result":null})")).empty());
    assert(parse_klines(json::parse(R"({"retCode":0,"result":{"list":{}}})")).empty());
}

TEST(test_positions_parse_and_reject_bad_entries) {
    const auto j = json::parse(R"({"retCode":0,"result":{"list":[
        {"symbol":"BTCUSDT","side":"Buy","size":"0.002","avgPrice":"50000","unrealisedPnl":"1.5","takeProfit":"52000","stopLoss":""},
        {"symbol":"ETHUSDT","side":"Sell","size":"0.5","avgPrice":"2000","unrealisedPnl":"-3"},
        {"symbol":"SOLUSDT","side":"Buy","size":"0"},
        17
    ]}})");
    const auto v = parse_positions(j);
    assert(v.size()==2);
    assert(v[0].symbol=="BTCUSDT" && v[0].side==core::Side::Long && v[0].size==0.002);
    assert(v[0].take_profit && *v[0].take_profit==52000.0 && !v[0].stop_loss);
    assert(v[1].side==core::Side::Short && v[1].unrealized_pnl==-3.0);

    const auto bad = json::parse(R"({"retCode":0,"result":{"list":[{"symbol":7,"side":"Buy","size":"1"}]}})");
    bool threw = false;
    try { parse_positions(bad); } catch (const ExchangeError&) { threw = true; }
    assert(threw);
}

int main() {
    std::cout << "=== Bybit Reply Tests ===\n";
    RUN_TEST(test_reply_ok_and_retcode);
    RUN_TEST(test_malformed_replies_are_exchange_errors);
    RUN_TEST(test_klines_oldest_first);
    RUN_TEST(test_positions_parse_and_reject_bad_entries);
    std::cout << "\nAll bybit reply tests PASSED!\n";
    return 0;
}
