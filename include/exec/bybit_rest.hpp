#pragma once
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "exec/exchange_gateway.hpp"

namespace exec {

// --- Connection config
struct ApiConfig {
    std::string api_key;
    std::string api_secret;
    bool testnet{true};
    bool demo{false};        // demo trading host; wins over testnet
    bool hedge_mode{false};  // positionIdx 1/2 instead of one-way 0
    int timeout_ms{5000};
    int recv_window{5000};
};

// Reply parsing. Malformed or wrong-typed payloads throw ExchangeError.
nlohmann::json parse_reply(const std::string& body, const std::string& what);
core::Candles parse_klines(const nlohmann::json& reply);
std::vector<Position> parse_positions(const nlohmann::json& reply);

// Bybit v5 REST, linear USDT perpetuals
class BybitRest final : public ExchangeGateway {
public:
    explicit BybitRest(ApiConfig cfg);

    core::Candles get_candles(const std::string& symbol, core::Timeframe tf, int limit) override;
    std::vector<Position> get_open_positions() override;
    double get_current_price(const std::string& symbol) override;
    LotConstraints get_lot_constraints(const std::string& symbol) override;
    OrderResult submit_order(const OrderRequest& req) override;
    double get_balance() override;
    bool set_leverage(const std::string& symbol, int leverage) override;

    // GET /v5/market/time
    std::int64_t server_time_ms();

    std::string rest_base() const;

private:
    // HMAC-SHA256 over timestamp + api_key + recv_window + payload, hex encoded
    std::string sign(const std::string& ts, const std::string& payload) const;

    // Both throw ExchangeError on transport failure, HTTP error or retCode != 0
    nlohmann::json http_get(const std::string& path, const std::string& query, bool signed_req=false);
    nlohmann::json http_post(const std::string& path, const nlohmann::json& body);

    ApiConfig cfg_;
    std::mutex lot_mu_;
    std::map<std::string, LotConstraints> lot_cache_;
};

} // namespace exec
