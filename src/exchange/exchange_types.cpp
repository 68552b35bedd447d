#include "exchange/i_exchange_gateway.hpp"

const char* toString(ExchangeErrorKind kind) {
    switch (kind) {
        case ExchangeErrorKind::None:               return "None";
        case ExchangeErrorKind::Transient:          return "Transient";
        case ExchangeErrorKind::Rejected:           return "Rejected";
        case ExchangeErrorKind::OrderNotFound:      return "OrderNotFound";
        case ExchangeErrorKind::ReduceOnlyRejected: return "ReduceOnlyRejected";
        case ExchangeErrorKind::ParseError:         return "ParseError";
    }
    return "None";
}

OrderStatus parseOrderStatus(const std::string& text) {
    if (text == "NEW")              return OrderStatus::NEW;
    if (text == "PARTIALLY_FILLED") return OrderStatus::PARTIALLY_FILLED;
    if (text == "FILLED")           return OrderStatus::FILLED;
    if (text == "CANCELED")         return OrderStatus::CANCELED;
    if (text == "EXPIRED")          return OrderStatus::EXPIRED;
    if (text == "REJECTED")         return OrderStatus::REJECTED;
    return OrderStatus::UNKNOWN;
}

const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::NEW:              return "NEW";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED:           return "FILLED";
        case OrderStatus::CANCELED:         return "CANCELED";
        case OrderStatus::EXPIRED:          return "EXPIRED";
        case OrderStatus::REJECTED:         return "REJECTED";
        case OrderStatus::UNKNOWN:          return "UNKNOWN";
    }
    return "UNKNOWN";
}
