#include "exchange/binance_futures_gateway.hpp"
#include "exchange/binance_parser.hpp"
#include "core/trade_math.hpp"

#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <curl/curl.h>

#include <chrono>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <thread>
#include <algorithm>


static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static long long nowMs() {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Binance only accepts these depth limits
static int snapshotLimit(int depth) {
    static const int allowed[] = {5, 10, 20, 50, 100, 500, 1000};
    for (int a : allowed) {
        if (depth <= a) return a;
    }
    return 1000;
}

// request weight of GET /fapi/v1/depth
static int depthWeight(int limit) {
    if (limit <= 50)  return 2;
    if (limit <= 100) return 5;
    if (limit <= 500) return 10;
    return 20;
}

BinanceFuturesGateway::BinanceFuturesGateway(const std::string& apiKey,
                                             const std::string& secretKey,
                                             const std::string& baseUrl)
    : apiKey_(apiKey)
    , secretKey_(secretKey)
    , baseUrl_(baseUrl)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);

    lastRefillRequests_ = std::chrono::steady_clock::now();
    requestTokens_      = (double)maxRequestsPerMinute_;

    currentSecStart_ = std::chrono::steady_clock::now();
    orderCountInCurrentSec_ = 0;
}

BinanceFuturesGateway::~BinanceFuturesGateway() {
    closeListenKey();
}

//------------------------------------------
// Market data
//------------------------------------------
bool BinanceFuturesGateway::getOrderBookSnapshot(const std::string& symbol,
                                                 int depth,
                                                 DepthSnapshot& out,
                                                 std::string* failReason)
{
    int limit = snapshotLimit(depth);
    throttleRequest(/*isOrder=*/false, depthWeight(limit));

    std::string qs = "symbol=" + symbol + "&limit=" + std::to_string(limit);
    HttpResponse resp = httpRequest("GET", "/fapi/v1/depth", qs, /*withApiKey=*/false);
    if (!checkResponse(resp, "depth", failReason)) {
        return false;
    }
    if (!BinanceParser::parseDepthSnapshot(resp.body, out)) {
        if (failReason) *failReason = "unparsable depth snapshot";
        return false;
    }
    return true;
}

bool BinanceFuturesGateway::loadExchangeInfo(std::string* failReason) {
    throttleRequest(/*isOrder=*/false, 1);
    HttpResponse resp = httpRequest("GET", "/fapi/v1/exchangeInfo", "", false);
    if (!checkResponse(resp, "exchangeInfo", failReason)) {
        return false;
    }

    std::unordered_map<std::string, SymbolRules> parsed;
    if (!BinanceParser::parseExchangeInfo(resp.body, parsed)) {
        if (failReason) *failReason = "unparsable exchangeInfo";
        return false;
    }

    std::lock_guard<std::mutex> lk(rulesMutex_);
    rules_.swap(parsed);
    rulesLoaded_ = true;
    std::cout << "[REST] exchangeInfo: " << rules_.size() << " trading symbols\n";
    return true;
}

bool BinanceFuturesGateway::getSymbolRules(const std::string& symbol,
                                           SymbolRules& out,
                                           std::string* failReason)
{
    bool loaded;
    {
        std::lock_guard<std::mutex> lk(rulesMutex_);
        loaded = rulesLoaded_;
    }
    if (!loaded && !loadExchangeInfo(failReason)) {
        return false;
    }

    std::lock_guard<std::mutex> lk(rulesMutex_);
    auto it = rules_.find(symbol);
    if (it == rules_.end()) {
        if (failReason) *failReason = "symbol " + symbol + " not trading";
        return false;
    }
    out = it->second;
    return true;
}

SymbolRules BinanceFuturesGateway::rulesFor(const std::string& symbol) {
    SymbolRules r;
    r.symbol = symbol;
    std::string reason;
    if (!getSymbolRules(symbol, r, &reason)) {
        std::cerr << "[REST][" << symbol << "] no symbol rules (" << reason
                  << "), sending 8 decimals\n";
    }
    return r;
}

//------------------------------------------
// Orders
//------------------------------------------
OrderResult BinanceFuturesGateway::createOrder(const OrderRequest& request) {
    SymbolRules rules = rulesFor(request.symbol);

    std::ostringstream qs;
    qs << "symbol=" << request.symbol
       << "&side=" << toString(request.side)
       << "&type=" << toString(request.type)
       << "&quantity=" << TradeMath::formatDecimal(request.quantity, rules.quantityPrecision);

    if (request.type == OrderType::LIMIT) {
        qs << "&price=" << TradeMath::formatDecimal(request.price, rules.pricePrecision)
           << "&timeInForce=GTC";
    }
    if (request.type == OrderType::STOP_MARKET || request.type == OrderType::TAKE_PROFIT_MARKET) {
        qs << "&stopPrice=" << TradeMath::formatDecimal(request.stopPrice, rules.pricePrecision)
           << "&workingType=MARK_PRICE";
    }
    if (request.reduceOnly) {
        qs << "&reduceOnly=true";
    }
    if (!request.clientOrderId.empty()) {
        qs << "&newClientOrderId=" << request.clientOrderId;
    }

    throttleRequest(/*isOrder=*/true);
    HttpResponse resp = httpRequest("POST", "/fapi/v1/order", signedQuery(qs.str()), true);
    OrderResult res = toOrderResult(resp);

    if (res.success) {
        std::cout << "[REST][" << request.symbol << "] " << toString(request.type) << " "
                  << toString(request.side) << " qty=" << request.quantity
                  << (request.reduceOnly ? " reduceOnly" : "")
                  << " => orderId=" << res.orderId << " " << res.status << "\n";
    } else {
        std::cerr << "[REST][" << request.symbol << "] " << toString(request.type) << " "
                  << toString(request.side) << " failed: " << res.message << "\n";
    }
    return res;
}

OrderResult BinanceFuturesGateway::cancelOrder(const std::string& symbol, long long orderId) {
    std::string params = "symbol=" + symbol + "&orderId=" + std::to_string(orderId);
    throttleRequest(/*isOrder=*/false);
    HttpResponse resp = httpRequest("DELETE", "/fapi/v1/order", signedQuery(params), true);
    OrderResult res = toOrderResult(resp);
    if (res.success && res.orderId == 0) {
        res.orderId = orderId;
    }
    return res;
}

OrderResult BinanceFuturesGateway::cancelAllOpenOrders(const std::string& symbol) {
    throttleRequest(/*isOrder=*/false);
    HttpResponse resp = httpRequest("DELETE", "/fapi/v1/allOpenOrders",
                                    signedQuery("symbol=" + symbol), true);
    return toOrderResult(resp);
}

//------------------------------------------
// Account
//------------------------------------------
bool BinanceFuturesGateway::getAccountBalance(const std::string& asset,
                                              double& out,
                                              std::string* failReason)
{
    throttleRequest(/*isOrder=*/false, 5);
    HttpResponse resp = httpRequest("GET", "/fapi/v2/balance", signedQuery(""), true);
    if (!checkResponse(resp, "balance", failReason)) {
        return false;
    }
    if (!BinanceParser::parseAvailableBalance(resp.body, asset, out)) {
        if (failReason) *failReason = "unparsable balance";
        return false;
    }
    return true;
}

bool BinanceFuturesGateway::getOpenPositions(std::vector<ExchangePosition>& out,
                                             std::string* failReason)
{
    throttleRequest(/*isOrder=*/false, 5);
    HttpResponse resp = httpRequest("GET", "/fapi/v2/positionRisk", signedQuery(""), true);
    if (!checkResponse(resp, "positionRisk", failReason)) {
        return false;
    }
    if (!BinanceParser::parsePositionRisk(resp.body, out)) {
        if (failReason) *failReason = "unparsable positionRisk";
        return false;
    }
    return true;
}

bool BinanceFuturesGateway::setLeverage(const std::string& symbol, int leverage,
                                        std::string* failReason)
{
    throttleRequest(/*isOrder=*/false);
    std::string params = "symbol=" + symbol + "&leverage=" + std::to_string(leverage);
    HttpResponse resp = httpRequest("POST", "/fapi/v1/leverage", signedQuery(params), true);
    if (!checkResponse(resp, "leverage", failReason)) {
        return false;
    }
    std::cout << "[REST][" << symbol << "] leverage set to " << leverage << "x\n";
    return true;
}

bool BinanceFuturesGateway::setMarginType(const std::string& symbol,
                                          const std::string& marginType,
                                          std::string* failReason)
{
    throttleRequest(/*isOrder=*/false);
    std::string params = "symbol=" + symbol + "&marginType=" + marginType;
    HttpResponse resp = httpRequest("POST", "/fapi/v1/marginType", signedQuery(params), true);

    int code = 0;
    std::string msg;
    if (resp.transportError.empty() && BinanceParser::parseError(resp.body, code, msg) && code == -4046) {
        // "No need to change margin type."
        return true;
    }
    if (!checkResponse(resp, "marginType", failReason)) {
        return false;
    }
    std::cout << "[REST][" << symbol << "] margin type " << marginType << "\n";
    return true;
}

//------------------------------------------
// Listen key
//------------------------------------------
bool BinanceFuturesGateway::createListenKey(std::string& listenKey, std::string* failReason) {
    throttleRequest(/*isOrder=*/false);
    HttpResponse resp = httpRequest("POST", "/fapi/v1/listenKey", "", true);
    if (!checkResponse(resp, "listenKey", failReason)) {
        return false;
    }
    if (!BinanceParser::parseListenKey(resp.body, listenKey)) {
        if (failReason) *failReason = "no listenKey in response";
        return false;
    }
    std::lock_guard<std::mutex> lk(listenKeyMutex_);
    listenKey_ = listenKey;
    return true;
}

bool BinanceFuturesGateway::keepAliveListenKey(std::string* failReason) {
    throttleRequest(/*isOrder=*/false);
    HttpResponse resp = httpRequest("PUT", "/fapi/v1/listenKey", "", true);
    return checkResponse(resp, "listenKey keepalive", failReason);
}

bool BinanceFuturesGateway::closeListenKey() {
    {
        std::lock_guard<std::mutex> lk(listenKeyMutex_);
        if (listenKey_.empty()) return true;
        listenKey_.clear();
    }
    HttpResponse resp = httpRequest("DELETE", "/fapi/v1/listenKey", "", true);
    return checkResponse(resp, "listenKey close", nullptr);
}

//------------------------------------------
// HTTP plumbing
//------------------------------------------
std::string BinanceFuturesGateway::hmacSha256Hex(const std::string& key, const std::string& data) {
    // HMAC() with a NULL output buffer returns OpenSSL's static array; callers sign from many threads
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (!HMAC(EVP_sha256(),
              key.c_str(), (int)key.size(),
              (const unsigned char*)data.c_str(), data.size(),
              md, &mdLen)) {
        return std::string();
    }

    std::ostringstream hex_stream;
    for (unsigned int i = 0; i < mdLen; i++) {
        hex_stream << std::hex << std::setw(2) << std::setfill('0')
                   << (int)md[i];
    }
    return hex_stream.str();
}

std::string BinanceFuturesGateway::signQueryString(const std::string& query) const {
    return hmacSha256Hex(secretKey_, query);
}

std::string BinanceFuturesGateway::signedQuery(const std::string& params) const {
    std::string query = params;
    if (!query.empty()) query += "&";
    query += "recvWindow=5000&timestamp=" + std::to_string(nowMs());
    return query + "&signature=" + signQueryString(query);
}

BinanceFuturesGateway::HttpResponse
BinanceFuturesGateway::httpRequest(const std::string& method,
                                   const std::string& endpoint,
                                   const std::string& queryString,
                                   bool withApiKey)
{
    HttpResponse resp;

    // futures endpoints take every parameter in the query string
    std::string url = baseUrl_ + endpoint;
    if (!queryString.empty()) {
        url += "?" + queryString;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        resp.transportError = "curl_easy_init failed";
        return resp;
    }

    struct curl_slist* chunk = nullptr;
    if (withApiKey) {
        chunk = curl_slist_append(chunk, ("X-MBX-APIKEY: " + apiKey_).c_str());
    }
    chunk = curl_slist_append(chunk, "Content-Type: application/x-www-form-urlencoded");

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, chunk);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
    } else if (method == "PUT" || method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode ret = curl_easy_perform(curl);
    if (ret != CURLE_OK) {
        resp.transportError = curl_easy_strerror(ret);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    }

    curl_slist_free_all(chunk);
    curl_easy_cleanup(curl);
    return resp;
}

OrderResult BinanceFuturesGateway::toOrderResult(const HttpResponse& resp) const {
    if (!resp.transportError.empty()) {
        OrderResult res;
        res.error   = ExchangeErrorKind::Transient;
        res.message = "transport: " + resp.transportError;
        return res;
    }
    if (resp.status == 429 || resp.status == 418 || resp.status >= 500) {
        OrderResult res;
        res.error   = ExchangeErrorKind::Transient;
        res.message = "HTTP " + std::to_string(resp.status) + ": " + resp.body;
        return res;
    }
    return BinanceParser::parseOrderResponse(resp.body);
}

bool BinanceFuturesGateway::checkResponse(const HttpResponse& resp,
                                          const char* what,
                                          std::string* failReason) const
{
    std::string reason;
    int code = 0;
    std::string msg;

    if (!resp.transportError.empty()) {
        reason = "transport: " + resp.transportError;
    } else if (resp.body.empty()) {
        reason = "empty response, HTTP " + std::to_string(resp.status);
    } else if (BinanceParser::parseError(resp.body, code, msg)) {
        reason = "Binance error code=" + std::to_string(code) + " msg=" + msg;
    } else if (resp.status >= 400) {
        reason = "HTTP " + std::to_string(resp.status);
    } else {
        return true;
    }

    std::cerr << "[REST] " << what << " failed: " << reason << "\n";
    if (failReason) *failReason = reason;
    return false;
}

/**
 * throttleRequest => main rate-limiting logic:
 *  - token bucket on request weight
 *  - short-burst cap on new orders per second
 */
void BinanceFuturesGateway::throttleRequest(bool isOrder, int weight)
{
    std::lock_guard<std::mutex> lg(throttleMutex_);

    refillRequestTokens();

    if (isOrder) {
        resetOrderCounterIfNewSecond();
        while (orderCountInCurrentSec_ >= maxOrdersPerSec_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            resetOrderCounterIfNewSecond();
        }
        orderCountInCurrentSec_ += 1;
    }

    double need = std::min((double)std::max(weight, 1), (double)maxRequestsPerMinute_);
    while (requestTokens_ < need) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        refillRequestTokens();
    }
    requestTokens_ -= need;
}

void BinanceFuturesGateway::refillRequestTokens()
{
    auto now = std::chrono::steady_clock::now();
    double secondsElapsed = std::chrono::duration<double>(now - lastRefillRequests_).count();

    double tokensPerSecond = (double)maxRequestsPerMinute_ / 60.0;
    double tokensToAdd     = tokensPerSecond * secondsElapsed;

    if (tokensToAdd >= 1.0) {
        requestTokens_ = std::min(
            (double)maxRequestsPerMinute_,
            requestTokens_ + tokensToAdd
        );
        lastRefillRequests_ = now;
    }
}

void BinanceFuturesGateway::resetOrderCounterIfNewSecond()
{
    auto now = std::chrono::steady_clock::now();
    double msElapsed = std::chrono::duration<double, std::milli>(now - currentSecStart_).count();
    if (msElapsed >= 1000.0) {
        currentSecStart_ = now;
        orderCountInCurrentSec_ = 0;
    }
}
