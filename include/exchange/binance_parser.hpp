#ifndef BINANCE_PARSER_HPP
#define BINANCE_PARSER_HPP

#include <string>
#include <vector>
#include <unordered_map>

#include "core/orderbook.hpp"
#include "exchange/i_exchange_gateway.hpp"

/**
 * Binance USD-M futures payloads => domain types. Every function returns
 * false on malformed input (the payload is dropped by the caller) and never
 * throws.
 */
namespace BinanceParser {
    // {"stream":"btcusdt@depth@100ms","data":{...}} => upper-case symbol + diff
    bool parseCombinedDepthMessage(const std::string& payload,
                                   std::string& symbol,
                                   DepthUpdate& out);

    // GET /fapi/v1/depth body
    bool parseDepthSnapshot(const std::string& body, DepthSnapshot& out);

    /**
     * User data stream event. Returns false for anything but a well-formed
     * ORDER_TRADE_UPDATE; `eventType` receives the "e" field either way.
     */
    bool parseOrderTradeUpdate(const std::string& payload,
                               OrderUpdateEvent& out,
                               std::string* eventType = nullptr);

    // GET /fapi/v1/exchangeInfo => rules per symbol (TRADING symbols only)
    bool parseExchangeInfo(const std::string& body,
                           std::unordered_map<std::string, SymbolRules>& out);

    // GET /fapi/v2/balance => availableBalance of `asset`
    bool parseAvailableBalance(const std::string& body, const std::string& asset, double& out);

    // GET /fapi/v2/positionRisk => non-zero positions only
    bool parsePositionRisk(const std::string& body, std::vector<ExchangePosition>& out);

    // POST/DELETE /fapi/v1/order responses, error bodies included
    OrderResult parseOrderResponse(const std::string& body);

    // {"code":-2011,"msg":"..."}; false if the body is not an error object
    bool parseError(const std::string& body, int& code, std::string& message);

    ExchangeErrorKind classifyErrorCode(int code);

    // POST /fapi/v1/listenKey
    bool parseListenKey(const std::string& body, std::string& listenKey);
}

#endif // BINANCE_PARSER_HPP
