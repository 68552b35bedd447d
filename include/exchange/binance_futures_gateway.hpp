#ifndef BINANCE_FUTURES_GATEWAY_HPP
#define BINANCE_FUTURES_GATEWAY_HPP

#include "exchange/i_exchange_gateway.hpp"
#include <string>
#include <mutex>
#include <chrono>
#include <unordered_map>

/**
 * Binance USD-M futures REST client (libcurl + HMAC-SHA256), with a simple
 * rate limiter: a request-weight token bucket plus an orders-per-second cap.
 *
 * Constructed without keys it can only serve public endpoints (depth,
 * exchangeInfo); PaperGateway uses it that way.
 */
class BinanceFuturesGateway : public IExchangeGateway {
public:
    BinanceFuturesGateway(const std::string& apiKey,
                          const std::string& secretKey,
                          const std::string& baseUrl = "https://fapi.binance.com");
    ~BinanceFuturesGateway() override;

    bool getOrderBookSnapshot(const std::string& symbol,
                              int depth,
                              DepthSnapshot& out,
                              std::string* failReason = nullptr) override;

    OrderResult createOrder(const OrderRequest& request) override;
    OrderResult cancelOrder(const std::string& symbol, long long orderId) override;
    OrderResult cancelAllOpenOrders(const std::string& symbol) override;

    bool getAccountBalance(const std::string& asset,
                           double& out,
                           std::string* failReason = nullptr) override;

    bool getOpenPositions(std::vector<ExchangePosition>& out,
                          std::string* failReason = nullptr) override;

    bool getSymbolRules(const std::string& symbol,
                        SymbolRules& out,
                        std::string* failReason = nullptr) override;

    // account setup, once per traded symbol
    bool setLeverage(const std::string& symbol, int leverage, std::string* failReason = nullptr);
    bool setMarginType(const std::string& symbol, const std::string& marginType,
                       std::string* failReason = nullptr);

    // user data stream listen key
    bool createListenKey(std::string& listenKey, std::string* failReason = nullptr);
    bool keepAliveListenKey(std::string* failReason = nullptr);
    bool closeListenKey();

    // (re)load the exchangeInfo rule cache
    bool loadExchangeInfo(std::string* failReason = nullptr);

    bool hasCredentials() const { return !apiKey_.empty() && !secretKey_.empty(); }

    void setMaxRequestsPerMinute(int rpm) { maxRequestsPerMinute_ = rpm; }
    void setMaxOrdersPerSecond(int ops)   { maxOrdersPerSec_     = ops; }

    // lower-case hex HMAC-SHA256, safe to call from several threads at once
    static std::string hmacSha256Hex(const std::string& key, const std::string& data);

private:
    struct HttpResponse {
        long status{0};
        std::string body;
        std::string transportError; // non-empty => request never completed
    };

    std::string signQueryString(const std::string& query) const;
    std::string signedQuery(const std::string& params) const;

    HttpResponse httpRequest(const std::string& method,
                             const std::string& endpoint,
                             const std::string& queryString,
                             bool withApiKey);

    // body/status => OrderResult with error classification
    OrderResult toOrderResult(const HttpResponse& resp) const;
    // for query endpoints: true if usable, otherwise fills failReason
    bool checkResponse(const HttpResponse& resp, const char* what, std::string* failReason) const;

    SymbolRules rulesFor(const std::string& symbol);

    void throttleRequest(bool isOrder, int weight = 1);
    void refillRequestTokens();
    void resetOrderCounterIfNewSecond();

private:
    std::string apiKey_;
    std::string secretKey_;
    std::string baseUrl_;

    std::mutex rulesMutex_;
    std::unordered_map<std::string, SymbolRules> rules_;
    bool rulesLoaded_{false};

    std::mutex listenKeyMutex_;
    std::string listenKey_;

    // 2400 weight/min on futures; stay well below it
    int maxRequestsPerMinute_{1200};
    int maxOrdersPerSec_{10};

    std::mutex throttleMutex_;
    double requestTokens_{0.0};
    std::chrono::steady_clock::time_point lastRefillRequests_;
    int orderCountInCurrentSec_{0};
    std::chrono::steady_clock::time_point currentSecStart_;
};

#endif // BINANCE_FUTURES_GATEWAY_HPP
