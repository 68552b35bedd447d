#ifndef SCRIPTED_STRATEGY_HPP
#define SCRIPTED_STRATEGY_HPP

#include <atomic>
#include "engine/strategy.hpp"

// Strategy whose answers are set by the test.
class ScriptedStrategy : public IStrategy {
public:
    ScriptedStrategy(const std::string& id, const std::string& symbol)
        : id_(id), symbol_(symbol) {}

    const std::string& id() const override { return id_; }
    const std::string& symbol() const override { return symbol_; }
    OrderType entryOrderType() const override { return entryType; }
    int entryOffsetTicks() const override { return offsetTicks; }

    std::optional<EntrySignal> checkSignal(const MarketView&) override {
        ++signalChecks;
        return signal;
    }

    std::optional<BracketLevels> calculateStopLossTakeProfit(double entryPrice,
                                                             PositionSide side,
                                                             const MarketView&,
                                                             double) override {
        if (!levelsEnabled) return std::nullopt;
        BracketLevels l;
        if (side == PositionSide::Long) {
            l.stopLoss   = entryPrice * (1.0 - stopPct);
            l.takeProfit = entryPrice * (1.0 + takePct);
        } else {
            l.stopLoss   = entryPrice * (1.0 + stopPct);
            l.takeProfit = entryPrice * (1.0 - takePct);
        }
        return l;
    }

    std::optional<AdjustmentCommand> analyzeAndAdjust(const Position&, const MarketView&) override {
        ++adjustChecks;
        return adjustment;
    }

    OrderType entryType{OrderType::LIMIT};
    int offsetTicks{0};
    std::optional<EntrySignal> signal;
    std::optional<AdjustmentCommand> adjustment;
    bool levelsEnabled{true};
    double stopPct{0.02};
    double takePct{0.03};
    std::atomic<int> signalChecks{0};
    std::atomic<int> adjustChecks{0};

private:
    std::string id_;
    std::string symbol_;
};

#endif // SCRIPTED_STRATEGY_HPP
