#ifndef POSITION_STORE_HPP
#define POSITION_STORE_HPP

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <limits>

#include "core/trade_types.hpp"

struct ExchangePosition;

struct Position {
    std::string symbol;
    PositionSide side{PositionSide::Long};
    double quantity{0.0};
    double entryPrice{0.0};
    double stopLoss{0.0};
    double takeProfit{0.0};
    double initialStopLoss{0.0};     // SL as placed at entry; break-even logic needs it
    long long stopLossOrderId{0};    // 0 => none
    long long takeProfitOrderId{0};
    std::string strategyId;
    long long openedAtMs{0};         // wall clock; set by the store when left 0
};

struct ReconcileReport {
    std::vector<std::string> removedStale;     // tracked locally, flat on the exchange
    std::vector<std::string> untracked;        // open on the exchange, not ours
    std::vector<std::string> sideMismatch;     // removed
    std::vector<std::string> quantityCorrected;
    std::vector<std::string> skippedInFlight;  // changed after the exchange data was taken
};

/**
 * Open positions opened by the bot, one per symbol, persisted to a JSON file
 * after every mutation. All methods are thread-safe.
 */
class PositionStore {
public:
    explicit PositionStore(const std::string& stateFile);

    // replaces the in-memory map; missing file => empty, returns false on parse error
    bool load();
    bool save() const;

    std::optional<Position> get(const std::string& symbol) const;
    std::vector<Position> all() const;
    size_t count() const;
    bool has(const std::string& symbol) const;

    // false (and no change) if quantity <= 0 or a bracket id is missing
    bool set(const Position& position);

    std::optional<Position> close(const std::string& symbol);

    /**
     * Replace bracket ids / levels of an existing position. Fields left empty
     * keep their value. False if the symbol has no position.
     */
    bool updateBracketOrders(const std::string& symbol,
                             std::optional<long long> stopLossOrderId,
                             std::optional<long long> takeProfitOrderId,
                             std::optional<double> stopLoss = std::nullopt,
                             std::optional<double> takeProfit = std::nullopt);

    /**
     * Align local records with what the exchange reports as open.
     * Records opened at or after `fetchStartedMs` postdate the exchange data
     * and are left untouched.
     */
    ReconcileReport reconcile(const std::vector<ExchangePosition>& exchangePositions,
                              long long fetchStartedMs = std::numeric_limits<long long>::max());

    // Same, for one symbol. `remote` null => flat on the exchange.
    void reconcileSymbol(const std::string& symbol,
                         const ExchangePosition* remote,
                         long long fetchStartedMs,
                         ReconcileReport& report);

    std::vector<std::string> symbols() const;

    // Exchange state unknown: trust nothing.
    void clearAll();

    const std::string& stateFile() const { return stateFile_; }

private:
    bool saveLocked() const;
    // true if the record was changed or removed
    bool reconcileLocked(const std::string& symbol, const ExchangePosition* remote,
                         long long fetchStartedMs, ReconcileReport& report);

private:
    std::string stateFile_;
    std::map<std::string, Position> positions_;
    mutable std::mutex mutex_;
};

#endif // POSITION_STORE_HPP
