#include "exec/bybit_rest.hpp"
#include <cpr/cpr.h>
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <algorithm>

using json = nlohmann::json;

namespace exec {

namespace {

// Bybit codes
constexpr int kLeverageNotModified = 110043;

inline std::int64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Bybit sends numbers as strings; empty string reads as 0
double to_d(const json& j, const char* k){
    if (!j.contains(k)) return 0.0;
    if (j[k].is_string()){
        const auto& s = j[k].get_ref<const std::string&>();
        return s.empty() ? 0.0 : std::strtod(s.c_str(), nullptr);
    }
    if (j[k].is_number()) return j[k].get<double>();
    return 0.0;
}

std::string to_s(const json& j, const char* k, const std::string& fallback={}){
    if (!j.contains(k) || !j[k].is_string()) return fallback;
    return j[k].get<std::string>();
}

double to_d(const json& v){
    if (v.is_string()) return std::strtod(v.get_ref<const std::string&>().c_str(), nullptr);
    if (v.is_number()) return v.get<double>();
    return 0.0;
}

// result.list, or an empty array when the reply has none
const json& result_list(const json& j){
    static const json empty = json::array();
    if (!j.contains("result") || !j["result"].is_object()) return empty;
    const auto& r = j["result"];
    if (!r.contains("list") || !r["list"].is_array()) return empty;
    return r["list"];
}

// transport + HTTP status check shared by GET and POST, then parse_reply
json unwrap(const cpr::Response& r, const std::string& method, const std::string& path){
    if (r.error.code != cpr::ErrorCode::OK){
        spdlog::warn("{} {} : transport error {}", method, path, r.error.message);
        throw ExchangeError(fmt::format("{} {}: {}", method, path, r.error.message));
    }
    if (r.status_code>=400){
        spdlog::warn("{} {} : {} {}", method, path, r.status_code, r.text);
        throw ExchangeError(fmt::format("{} {}: HTTP {}", method, path, r.status_code));
    }
    return parse_reply(r.text, method + " " + path);
}

const json& first_in_list(const json& j, const std::string& what){
    const auto& list = result_list(j);
    if (list.empty() || !list[0].is_object()) throw ExchangeError("empty result list for " + what);
    return list[0];
}

} // namespace

json parse_reply(const std::string& body, const std::string& what){
    json j;
    try { j = json::parse(body.empty() ? "{}" : body); }
    catch (const json::exception& e){
        throw ExchangeError(fmt::format("{}: bad json ({})", what, e.what()));
    }
    if (!j.is_object()) throw ExchangeError(fmt::format("{}: reply is not an object", what));
    const int code = (j.contains("retCode") && j["retCode"].is_number_integer()) ? j["retCode"].get<int>() : -1;
    if (code!=0){
        const std::string msg = to_s(j, "retMsg", "unknown error");
        throw ExchangeError(fmt::format("{}: {} (retCode {})", what, msg, code), code);
    }
    return j;
}

core::Candles parse_klines(const json& reply){
    core::Candles out;
    for (auto& k : result_list(reply)){
        if (!k.is_array() || k.size()<6) continue;
        core::Bar b;
        b.open_time_ms = static_cast<std::int64_t>(to_d(k[0]));
        b.open   = to_d(k[1]);
        b.high   = to_d(k[2]);
        b.low    = to_d(k[3]);
        b.close  = to_d(k[4]);
        b.volume = to_d(k[5]);
        out.push_back(b);
    }
    // newest first on the wire
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<Position> parse_positions(const json& reply){
    std::vector<Position> v;
    for (auto& p : result_list(reply)){
        if (!p.is_object()) continue;
        Position pos;
        pos.size = to_d(p, "size");
        if (pos.size<=0.0) continue;
        pos.symbol = to_s(p, "symbol");
        if (pos.symbol.empty()) throw ExchangeError("position entry without symbol");
        pos.side = to_s(p, "side")=="Sell" ? core::Side::Short : core::Side::Long;
        pos.entry_price = to_d(p, "avgPrice");
        pos.unrealized_pnl = to_d(p, "unrealisedPnl");
        pos.created_ms = static_cast<std::int64_t>(to_d(p, "createdTime"));
        if (const double tp = to_d(p, "takeProfit"); tp>0.0) pos.take_profit = tp;
        if (const double sl = to_d(p, "stopLoss"); sl>0.0) pos.stop_loss = sl;
        v.push_back(pos);
    }
    return v;
}

BybitRest::BybitRest(ApiConfig cfg) : cfg_(std::move(cfg)) {}

std::string BybitRest::rest_base() const {
    if (cfg_.demo) return "https://api-demo.bybit.com";
    return cfg_.testnet ? "https://api-testnet.bybit.com" : "https://api.bybit.com";
}

std::string BybitRest::sign(const std::string& ts, const std::string& payload) const {
    const std::string msg = ts + cfg_.api_key + std::to_string(cfg_.recv_window) + payload;
    unsigned int len = 0;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(),
         reinterpret_cast<const unsigned char*>(cfg_.api_secret.data()),
         static_cast<int>(cfg_.api_secret.size()),
         reinterpret_cast<const unsigned char*>(msg.data()),
         msg.size(),
         md, &len);
    std::ostringstream oss;
    for (unsigned int i=0;i<len;++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    return oss.str();
}

json BybitRest::http_get(const std::string& path, const std::string& query, bool signed_req){
    const std::string url = rest_base() + path + (query.empty() ? "" : "?" + query);
    cpr::Header hdr;
    if (signed_req){
        const std::string ts = std::to_string(now_ms());
        hdr = cpr::Header{{"X-BAPI-API-KEY", cfg_.api_key},
                          {"X-BAPI-TIMESTAMP", ts},
                          {"X-BAPI-RECV-WINDOW", std::to_string(cfg_.recv_window)},
                          {"X-BAPI-SIGN", sign(ts, query)}};
    }
    auto r = cpr::Get(cpr::Url{url}, hdr, cpr::Timeout{cfg_.timeout_ms}, cpr::VerifySsl{true});
    return unwrap(r, "GET", path);
}

json BybitRest::http_post(const std::string& path, const json& body){
    const std::string payload = body.dump();
    const std::string ts = std::to_string(now_ms());
    cpr::Header hdr{{"X-BAPI-API-KEY", cfg_.api_key},
                    {"X-BAPI-TIMESTAMP", ts},
                    {"X-BAPI-RECV-WINDOW", std::to_string(cfg_.recv_window)},
                    {"X-BAPI-SIGN", sign(ts, payload)},
                    {"Content-Type", "application/json"}};
    auto r = cpr::Post(cpr::Url{rest_base() + path}, hdr, cpr::Body{payload},
                       cpr::Timeout{cfg_.timeout_ms}, cpr::VerifySsl{true});
    return unwrap(r, "POST", path);
}

std::int64_t BybitRest::server_time_ms(){
    auto j = http_get("/v5/market/time", "");
    return static_cast<std::int64_t>(to_d(j, "time"));
}

core::Candles BybitRest::get_candles(const std::string& symbol, core::Timeframe tf, int limit){
    const std::string q = fmt::format("category=linear&symbol={}&interval={}&limit={}", symbol, core::to_interval(tf), limit);
    return parse_klines(http_get("/v5/market/kline", q));
}

std::vector<Position> BybitRest::get_open_positions(){
    auto v = parse_positions(http_get("/v5/position/list", "category=linear&settleCoin=USDT", true));
    spdlog::debug("position/list: {} open", v.size());
    return v;
}

double BybitRest::get_current_price(const std::string& symbol){
    auto j = http_get("/v5/market/tickers", "category=linear&symbol=" + symbol);
    const double px = to_d(first_in_list(j, symbol), "lastPrice");
    if (px<=0.0) throw ExchangeError("no last price for " + symbol);
    return px;
}

LotConstraints BybitRest::get_lot_constraints(const std::string& symbol){
    {
        std::lock_guard<std::mutex> lk(lot_mu_);
        auto it = lot_cache_.find(symbol);
        if (it!=lot_cache_.end()) return it->second;
    }
    auto j = http_get("/v5/market/instruments-info", "category=linear&symbol=" + symbol);
    const auto& info = first_in_list(j, symbol);
    if (!info.contains("lotSizeFilter") || !info["lotSizeFilter"].is_object()) throw ExchangeError("no lotSizeFilter for " + symbol);
    const auto& f = info["lotSizeFilter"];
    LotConstraints lc;
    lc.qty_step = to_d(f, "qtyStep");
    lc.min_order_qty = to_d(f, "minOrderQty");
    lc.min_notional = to_d(f, "minNotionalValue");
    if (lc.qty_step<=0.0) throw ExchangeError("bad qtyStep for " + symbol);
    std::lock_guard<std::mutex> lk(lot_mu_);
    lot_cache_[symbol] = lc;
    return lc;
}

OrderResult BybitRest::submit_order(const OrderRequest& req){
    json body = {
        {"category", "linear"},
        {"symbol", req.symbol},
        {"side", core::to_string(req.side)},
        {"orderType", req.order_type},
        {"qty", fmt::format("{}", req.qty)},
        {"timeInForce", req.order_type=="Market" ? "IOC" : "GTC"},
        {"positionIdx", cfg_.hedge_mode ? (req.position==core::Side::Long ? 1 : 2) : 0}
    };
    if (req.reduce_only) body["reduceOnly"] = true;
    if (req.take_profit || req.stop_loss){
        body["tpslMode"] = "Full";
        if (req.take_profit){ body["takeProfit"] = fmt::format("{}", *req.take_profit); body["tpOrderType"] = "Market"; }
        if (req.stop_loss){ body["stopLoss"] = fmt::format("{}", *req.stop_loss); body["slOrderType"] = "Market"; }
    }

    try {
        auto j = http_post("/v5/order/create", body);
        OrderResult out;
        if (j.contains("result")) out.order_id = to_s(j["result"], "orderId");
        if (out.order_id.empty()) return OrderResult::fail("no orderId in response", -1);
        out.success = true;
        out.qty = req.qty;
        spdlog::info("order/create {} {} {} -> {}", req.symbol, core::to_string(req.side), req.qty, out.order_id);
        return out;
    } catch (const ExchangeError& e){
        spdlog::error("order/create {} {} {} failed: {}", req.symbol, core::to_string(req.side), req.qty, e.what());
        return OrderResult::fail(e.what(), e.code());
    } catch (const json::exception& e){
        spdlog::error("order/create {} {} {}: bad request body: {}", req.symbol, core::to_string(req.side), req.qty, e.what());
        return OrderResult::fail(e.what(), -1);
    }
}

double BybitRest::get_balance(){
    auto j = http_get("/v5/account/wallet-balance", "accountType=UNIFIED", true);
    const auto& acct = first_in_list(j, "wallet");
    if (acct.contains("coin") && acct["coin"].is_array()){
        for (auto& c : acct["coin"]){
            if (to_s(c, "coin")=="USDT") return to_d(c, "walletBalance");
        }
    }
    spdlog::warn("wallet-balance: no USDT coin entry");
    return 0.0;
}

bool BybitRest::set_leverage(const std::string& symbol, int leverage){
    const std::string lev = std::to_string(leverage);
    json body = {{"category", "linear"}, {"symbol", symbol}, {"buyLeverage", lev}, {"sellLeverage", lev}};
    try {
        http_post("/v5/position/set-leverage", body);
        return true;
    } catch (const ExchangeError& e){
        if (e.code()==kLeverageNotModified) return true;
        spdlog::warn("set-leverage {} x{}: {}", symbol, leverage, e.what());
        return false;
    }
}

} // namespace exec
