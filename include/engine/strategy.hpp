#ifndef STRATEGY_HPP
#define STRATEGY_HPP

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <unordered_map>
#include <vector>

#include "core/orderbook.hpp"
#include "core/trade_types.hpp"
#include "core/bot_config.hpp"

struct Position;

// What a strategy sees of the market: a copy of the synced book.
struct MarketView {
    std::string symbol;
    OrderBookData book;
    double priceTick{0.0};
};

struct EntrySignal {
    PositionSide side{PositionSide::Long};
    double referencePrice{0.0};
};

struct BracketLevels {
    double stopLoss{0.0};
    double takeProfit{0.0};
};

enum class AdjustmentKind { ADJUST, CLOSE };

struct AdjustmentCommand {
    AdjustmentKind kind{AdjustmentKind::ADJUST};
    std::optional<double> stopLoss;
    std::optional<double> takeProfit;
    std::string reason;
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& symbol() const = 0;
    virtual OrderType entryOrderType() const = 0;
    virtual int entryOffsetTicks() const = 0;

    virtual std::optional<EntrySignal> checkSignal(const MarketView& view) = 0;

    virtual std::optional<BracketLevels> calculateStopLossTakeProfit(double entryPrice,
                                                                     PositionSide side,
                                                                     const MarketView& view,
                                                                     double priceTick) = 0;

    virtual std::optional<AdjustmentCommand> analyzeAndAdjust(const Position& position,
                                                              const MarketView& view) = 0;
};

/**
 * Strategy name (the "name" key of a strategies[] config entry) => factory.
 */
class StrategyRegistry {
public:
    using Factory = std::function<std::unique_ptr<IStrategy>(const StrategyConfig&)>;

    // false if `name` is already taken
    bool registerFactory(const std::string& name, Factory factory);

    // nullptr for an unknown name
    std::unique_ptr<IStrategy> create(const StrategyConfig& config) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, Factory> factories_;
};

void registerBuiltinStrategies(StrategyRegistry& registry);

#endif // STRATEGY_HPP
