// src/core/trade_math.cpp

#include "core/trade_math.hpp"
#include "core/trade_types.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

// absorbs binary noise such as 0.3/0.1 = 2.9999999999999996
static const double STEP_EPSILON = 1e-9;

double TradeMath::floorToStep(double value, double step) {
    if (step <= 0.0) return value;
    double units = std::floor(value / step + STEP_EPSILON);
    if (units <= 0.0) return 0.0;
    return units * step;
}

double TradeMath::roundToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    return std::round(price / tick) * tick;
}

std::string TradeMath::formatDecimal(double value, int precision) {
    if (precision < 0) precision = 0;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string out = ss.str();
    if (out.find('.') != std::string::npos) {
        while (!out.empty() && out.back() == '0') out.pop_back();
        if (!out.empty() && out.back() == '.') out.pop_back();
    }
    if (out == "-0") out = "0";
    return out;
}

double TradeMath::computeOrderQuantity(double balance,
                                       double riskPerTradePct,
                                       int leverage,
                                       double price,
                                       double quantityStep)
{
    if (balance <= 0.0 || riskPerTradePct <= 0.0 || leverage <= 0 || price <= 0.0) {
        return 0.0;
    }
    double margin   = balance * (riskPerTradePct / 100.0);
    double notional = margin * leverage;
    return floorToStep(notional / price, quantityStep);
}

bool parsePositionSide(const std::string& text, PositionSide& out) {
    if (text == "Long" || text == "LONG") {
        out = PositionSide::Long;
        return true;
    }
    if (text == "Short" || text == "SHORT") {
        out = PositionSide::Short;
        return true;
    }
    return false;
}

bool parseOrderType(const std::string& text, OrderType& out) {
    if (text == "MARKET")             { out = OrderType::MARKET; return true; }
    if (text == "LIMIT")              { out = OrderType::LIMIT; return true; }
    if (text == "STOP_MARKET")        { out = OrderType::STOP_MARKET; return true; }
    if (text == "TAKE_PROFIT_MARKET") { out = OrderType::TAKE_PROFIT_MARKET; return true; }
    return false;
}
