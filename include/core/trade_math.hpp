#ifndef TRADE_MATH_HPP
#define TRADE_MATH_HPP

#include <string>

namespace TradeMath {
    // Round down to a multiple of `step` (exchange LOT_SIZE). step<=0 => unchanged.
    double floorToStep(double value, double step);

    // Round to the nearest multiple of `tick` (exchange PRICE_FILTER).
    double roundToTick(double price, double tick);

    // Fixed-point text for REST parameters, trailing zeros stripped.
    std::string formatDecimal(double value, int precision);

    /**
     * Entry size from capital: margin = balance * riskPct/100,
     * notional = margin * leverage, qty = notional / price, floored to step.
     * Returns 0.0 when any input is non-positive.
     */
    double computeOrderQuantity(double balance,
                                double riskPerTradePct,
                                int leverage,
                                double price,
                                double quantityStep);
}

#endif // TRADE_MATH_HPP
