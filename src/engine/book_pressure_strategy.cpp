#include "engine/book_pressure_strategy.hpp"
#include "core/position_store.hpp"
#include "core/trade_math.hpp"
#include <iostream>
#include <algorithm>

BookPressureParams parseBookPressureParams(const nlohmann::json& p) {
    BookPressureParams out;
    if (!p.is_object()) return out;
    out.maxSpreadBps         = p.value("maxSpreadBps", out.maxSpreadBps);
    out.imbalanceLevels      = p.value("imbalanceLevels", out.imbalanceLevels);
    out.imbalanceRatio       = p.value("imbalanceRatio", out.imbalanceRatio);
    out.stopLossPct          = p.value("stopLossPct", out.stopLossPct);
    out.tpMinSearchPct       = p.value("tpMinSearchPct", out.tpMinSearchPct);
    out.tpMaxSearchPct       = p.value("tpMaxSearchPct", out.tpMaxSearchPct);
    out.breakEvenEnabled     = p.value("breakEvenEnabled", out.breakEvenEnabled);
    out.trailingDistancePct  = p.value("trailingDistancePct", out.trailingDistancePct);
    out.trailingStepPct      = p.value("trailingStepPct", out.trailingStepPct);
    out.pressureRangePct     = p.value("pressureRangePct", out.pressureRangePct);
    out.preemptiveCloseRatio = p.value("preemptiveCloseRatio", out.preemptiveCloseRatio);
    if (out.imbalanceLevels < 1) out.imbalanceLevels = 1;
    if (out.tpMaxSearchPct < out.tpMinSearchPct) out.tpMaxSearchPct = out.tpMinSearchPct;
    return out;
}

static double sumTop(const std::vector<OrderBookLevel>& side, int levels) {
    double total = 0.0;
    int n = 0;
    for (const auto& lvl : side) {
        if (n++ >= levels) break;
        total += lvl.quantity;
    }
    return total;
}

BookPressureStrategy::BookPressureStrategy(const StrategyConfig& config)
    : config_(config)
    , params_(parseBookPressureParams(config.params))
{
    std::cout << "[STRAT][" << config_.id << "] BookPressure on " << config_.symbol
              << " spread<=" << params_.maxSpreadBps << "bps"
              << " imbalance>=" << params_.imbalanceRatio << " over " << params_.imbalanceLevels
              << " levels, SL " << params_.stopLossPct << "%\n";
}

std::optional<EntrySignal> BookPressureStrategy::checkSignal(const MarketView& view) {
    const auto& bids = view.book.bids;
    const auto& asks = view.book.asks;
    if (bids.empty() || asks.empty()) {
        return std::nullopt;
    }

    double bestBid = bids.front().price;
    double bestAsk = asks.front().price;
    if (bestBid <= 0.0) return std::nullopt;

    double spreadBps = (bestAsk - bestBid) / bestBid * 10000.0;
    if (spreadBps > params_.maxSpreadBps) {
        return std::nullopt;
    }

    double bidVol = sumTop(bids, params_.imbalanceLevels);
    double askVol = sumTop(asks, params_.imbalanceLevels);

    if (askVol > 0.0 && bidVol / askVol >= params_.imbalanceRatio) {
        std::cout << "[STRAT][" << config_.id << "] LONG signal: bid volume " << bidVol
                  << " vs ask " << askVol << "\n";
        return EntrySignal{PositionSide::Long, bestBid};
    }
    if (bidVol > 0.0 && askVol / bidVol >= params_.imbalanceRatio) {
        std::cout << "[STRAT][" << config_.id << "] SHORT signal: ask volume " << askVol
                  << " vs bid " << bidVol << "\n";
        return EntrySignal{PositionSide::Short, bestAsk};
    }
    return std::nullopt;
}

std::optional<BracketLevels> BookPressureStrategy::calculateStopLossTakeProfit(double entryPrice,
                                                                               PositionSide side,
                                                                               const MarketView& view,
                                                                               double priceTick)
{
    if (entryPrice <= 0.0) return std::nullopt;

    BracketLevels out;
    if (side == PositionSide::Long) {
        out.stopLoss = entryPrice * (1.0 - params_.stopLossPct / 100.0);

        double minTp = entryPrice * (1.0 + params_.tpMinSearchPct / 100.0);
        double maxTp = entryPrice * (1.0 + params_.tpMaxSearchPct / 100.0);
        out.takeProfit = maxTp;
        double bestQty = 0.0;
        for (const auto& lvl : view.book.asks) {
            if (lvl.price < minTp) continue;
            if (lvl.price > maxTp) break;
            if (lvl.quantity > bestQty) {
                bestQty = lvl.quantity;
                out.takeProfit = lvl.price;
            }
        }
    } else {
        out.stopLoss = entryPrice * (1.0 + params_.stopLossPct / 100.0);

        double maxTp = entryPrice * (1.0 - params_.tpMinSearchPct / 100.0);
        double minTp = entryPrice * (1.0 - params_.tpMaxSearchPct / 100.0);
        out.takeProfit = minTp;
        double bestQty = 0.0;
        for (const auto& lvl : view.book.bids) {
            if (lvl.price > maxTp) continue;
            if (lvl.price < minTp) break;
            if (lvl.quantity > bestQty) {
                bestQty = lvl.quantity;
                out.takeProfit = lvl.price;
            }
        }
    }

    out.stopLoss   = TradeMath::roundToTick(out.stopLoss, priceTick);
    out.takeProfit = TradeMath::roundToTick(out.takeProfit, priceTick);

    // a tiny percentage can round onto the entry itself
    double tick = priceTick > 0.0 ? priceTick : 0.0;
    if (side == PositionSide::Long) {
        if (out.stopLoss >= entryPrice)   out.stopLoss   = entryPrice - tick;
        if (out.takeProfit <= entryPrice) out.takeProfit = entryPrice + tick;
    } else {
        if (out.stopLoss <= entryPrice)   out.stopLoss   = entryPrice + tick;
        if (out.takeProfit >= entryPrice) out.takeProfit = entryPrice - tick;
    }
    if (out.stopLoss <= 0.0 || out.takeProfit <= 0.0) {
        return std::nullopt;
    }
    return out;
}

std::optional<AdjustmentCommand> BookPressureStrategy::analyzeAndAdjust(const Position& position,
                                                                        const MarketView& view)
{
    const auto& bids = view.book.bids;
    const auto& asks = view.book.asks;
    if (bids.empty() || asks.empty()) {
        return std::nullopt;
    }

    bool isLong = position.side == PositionSide::Long;
    double price = isLong ? bids.front().price : asks.front().price;
    double entry = position.entryPrice;
    double initialSl = position.initialStopLoss > 0.0 ? position.initialStopLoss : position.stopLoss;
    double risk = isLong ? entry - initialSl : initialSl - entry;
    double tick = view.priceTick;

    // 1) break-even once price ran one initial risk
    if (params_.breakEvenEnabled && risk > 0.0) {
        bool stopBehindEntry = isLong ? position.stopLoss < entry : position.stopLoss > entry;
        double gain = isLong ? price - entry : entry - price;
        if (stopBehindEntry && gain >= risk) {
            AdjustmentCommand cmd;
            cmd.kind     = AdjustmentKind::ADJUST;
            cmd.stopLoss = TradeMath::roundToTick(entry, tick);
            cmd.takeProfit = position.takeProfit;
            cmd.reason   = "break-even";
            return cmd;
        }
    }

    // 2) trailing stop, only beyond entry and only by a meaningful step
    double minStep = price * params_.trailingStepPct / 100.0;
    if (isLong) {
        double newSl = TradeMath::roundToTick(price * (1.0 - params_.trailingDistancePct / 100.0), tick);
        if (newSl > entry && newSl - position.stopLoss >= minStep && newSl > position.stopLoss) {
            AdjustmentCommand cmd;
            cmd.kind       = AdjustmentKind::ADJUST;
            cmd.stopLoss   = newSl;
            cmd.takeProfit = std::max(position.takeProfit,
                TradeMath::roundToTick(price * (1.0 + params_.tpMaxSearchPct / 100.0), tick));
            cmd.reason     = "trailing";
            return cmd;
        }
    } else {
        double newSl = TradeMath::roundToTick(price * (1.0 + params_.trailingDistancePct / 100.0), tick);
        if (newSl < entry && position.stopLoss - newSl >= minStep && newSl < position.stopLoss) {
            AdjustmentCommand cmd;
            cmd.kind       = AdjustmentKind::ADJUST;
            cmd.stopLoss   = newSl;
            cmd.takeProfit = std::min(position.takeProfit,
                TradeMath::roundToTick(price * (1.0 - params_.tpMaxSearchPct / 100.0), tick));
            cmd.reason     = "trailing";
            return cmd;
        }
    }

    // 3) opposing pressure close to the price
    double range = price * params_.pressureRangePct / 100.0;
    double askVol = 0.0;
    double bidVol = 0.0;
    for (const auto& lvl : asks) {
        if (lvl.price >= price + range) break;
        askVol += lvl.quantity;
    }
    for (const auto& lvl : bids) {
        if (lvl.price <= price - range) break;
        bidVol += lvl.quantity;
    }

    double against = isLong ? askVol : bidVol;
    double with    = isLong ? bidVol : askVol;
    if (with > 0.0 && against / with > params_.preemptiveCloseRatio) {
        AdjustmentCommand cmd;
        cmd.kind   = AdjustmentKind::CLOSE;
        cmd.reason = isLong ? "ask pressure" : "bid pressure";
        std::cerr << "[STRAT][" << config_.id << "] pre-emptive close: "
                  << cmd.reason << " " << against << " vs " << with << "\n";
        return cmd;
    }
    return std::nullopt;
}
