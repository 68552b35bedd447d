#ifndef BOOK_PRESSURE_STRATEGY_HPP
#define BOOK_PRESSURE_STRATEGY_HPP

#include "engine/strategy.hpp"

struct BookPressureParams {
    double maxSpreadBps{5.0};          // no entry on a wider spread
    int imbalanceLevels{10};           // top-N levels summed per side
    double imbalanceRatio{3.0};        // bid/ask (or ask/bid) volume to enter
    double stopLossPct{1.5};
    double tpMinSearchPct{1.0};        // TP = biggest level in [min,max], else max
    double tpMaxSearchPct{3.0};
    bool breakEvenEnabled{true};
    double trailingDistancePct{1.0};
    double trailingStepPct{0.2};       // minimum SL improvement worth an ADJUST
    double pressureRangePct{0.5};      // depth window for the pre-emptive close
    double preemptiveCloseRatio{2.0};
};

BookPressureParams parseBookPressureParams(const nlohmann::json& params);

/**
 * Enters with a lopsided top of book, protects with percentage brackets,
 * then moves the stop to break-even, trails it and closes early when the
 * depth turns against the position.
 */
class BookPressureStrategy : public IStrategy {
public:
    explicit BookPressureStrategy(const StrategyConfig& config);

    const std::string& id() const override { return config_.id; }
    const std::string& symbol() const override { return config_.symbol; }
    OrderType entryOrderType() const override { return config_.entryOrderType; }
    int entryOffsetTicks() const override { return config_.entryOffsetTicks; }

    std::optional<EntrySignal> checkSignal(const MarketView& view) override;

    std::optional<BracketLevels> calculateStopLossTakeProfit(double entryPrice,
                                                             PositionSide side,
                                                             const MarketView& view,
                                                             double priceTick) override;

    std::optional<AdjustmentCommand> analyzeAndAdjust(const Position& position,
                                                      const MarketView& view) override;

    const BookPressureParams& params() const { return params_; }

private:
    StrategyConfig config_;
    BookPressureParams params_;
};

#endif // BOOK_PRESSURE_STRATEGY_HPP
