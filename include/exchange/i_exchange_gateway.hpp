#ifndef I_EXCHANGE_GATEWAY_HPP
#define I_EXCHANGE_GATEWAY_HPP

#include <string>
#include <vector>
#include "core/orderbook.hpp"
#include "core/trade_types.hpp"

enum class ExchangeErrorKind {
    None,
    Transient,           // transport failure, 5xx, rate limit => retry later
    Rejected,            // invalid params, insufficient margin, ...
    OrderNotFound,       // Binance -2011 "Unknown order sent"
    ReduceOnlyRejected,  // Binance -2022, the position is already gone
    ParseError
};

const char* toString(ExchangeErrorKind kind);

struct OrderRequest {
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    OrderType type{OrderType::MARKET};
    double quantity{0.0};
    double price{0.0};      // LIMIT only
    double stopPrice{0.0};  // STOP_MARKET / TAKE_PROFIT_MARKET only
    bool reduceOnly{false};
    std::string clientOrderId; // empty => exchange assigns
};

struct OrderResult {
    bool success{false};
    long long orderId{0};
    std::string clientOrderId;
    std::string status;      // NEW, FILLED, CANCELED, ...
    ExchangeErrorKind error{ExchangeErrorKind::None};
    int code{0};             // venue error code
    std::string message;
};

struct ExchangePosition {
    std::string symbol;
    PositionSide side{PositionSide::Long};
    double quantity{0.0};    // absolute size
    double entryPrice{0.0};
    int leverage{0};
};

struct SymbolRules {
    std::string symbol;
    double priceTick{0.0};
    double quantityStep{0.0};
    int pricePrecision{8};
    int quantityPrecision{8};
};

enum class OrderStatus {
    NEW,
    PARTIALLY_FILLED,
    FILLED,
    CANCELED,
    EXPIRED,
    REJECTED,
    UNKNOWN
};

OrderStatus parseOrderStatus(const std::string& text);
const char* toString(OrderStatus status);

// ORDER_TRADE_UPDATE from the user data stream
struct OrderUpdateEvent {
    std::string symbol;
    long long orderId{0};
    std::string clientOrderId;
    OrderStatus status{OrderStatus::UNKNOWN};
    std::string orderType;   // original order type, e.g. LIMIT, STOP_MARKET
    OrderSide side{OrderSide::BUY};
    double avgFillPrice{0.0};
    double filledQuantity{0.0};
    bool reduceOnly{false};
    long long eventTimeMs{0};
};

/**
 * REST side of the exchange. Implementations must be callable from several
 * threads at once (bracket orders are submitted concurrently).
 *
 * Nothing here throws: order calls report through OrderResult, queries
 * return false and fill `failReason`.
 */
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual bool getOrderBookSnapshot(const std::string& symbol,
                                      int depth,
                                      DepthSnapshot& out,
                                      std::string* failReason = nullptr) = 0;

    virtual OrderResult createOrder(const OrderRequest& request) = 0;

    virtual OrderResult cancelOrder(const std::string& symbol, long long orderId) = 0;

    virtual OrderResult cancelAllOpenOrders(const std::string& symbol) = 0;

    virtual bool getAccountBalance(const std::string& asset,
                                   double& out,
                                   std::string* failReason = nullptr) = 0;

    virtual bool getOpenPositions(std::vector<ExchangePosition>& out,
                                  std::string* failReason = nullptr) = 0;

    virtual bool getSymbolRules(const std::string& symbol,
                                SymbolRules& out,
                                std::string* failReason = nullptr) = 0;
};

#endif // I_EXCHANGE_GATEWAY_HPP
