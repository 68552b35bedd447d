#ifndef TRADE_TYPES_HPP
#define TRADE_TYPES_HPP

#include <string>

enum class OrderSide { BUY, SELL };

enum class PositionSide { Long, Short };

enum class OrderType {
    MARKET,
    LIMIT,
    STOP_MARKET,
    TAKE_PROFIT_MARKET
};

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline const char* toString(PositionSide side) {
    return side == PositionSide::Long ? "Long" : "Short";
}

inline const char* toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET:             return "MARKET";
        case OrderType::LIMIT:              return "LIMIT";
        case OrderType::STOP_MARKET:        return "STOP_MARKET";
        case OrderType::TAKE_PROFIT_MARKET: return "TAKE_PROFIT_MARKET";
    }
    return "MARKET";
}

// side of the order that opens a position
inline OrderSide entrySide(PositionSide side) {
    return side == PositionSide::Long ? OrderSide::BUY : OrderSide::SELL;
}

// side of the order that reduces / closes a position
inline OrderSide exitSide(PositionSide side) {
    return side == PositionSide::Long ? OrderSide::SELL : OrderSide::BUY;
}

bool parsePositionSide(const std::string& text, PositionSide& out);
bool parseOrderType(const std::string& text, OrderType& out);

#endif // TRADE_TYPES_HPP
