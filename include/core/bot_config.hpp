#ifndef BOT_CONFIG_HPP
#define BOT_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/trade_types.hpp"

struct StrategyConfig {
    std::string id;
    std::string name;          // registry key, e.g. "BookPressure"
    std::string symbol;
    bool enabled{true};
    OrderType entryOrderType{OrderType::LIMIT};
    int entryOffsetTicks{0};
    nlohmann::json params = nlohmann::json::object();
};

struct BotConfig {
    bool dryRun{true};
    std::string restBaseUrl{"https://fapi.binance.com"};
    std::string wsBaseUrl{"wss://fstream.binance.com"};
    std::string quoteAsset{"USDT"};
    int leverage{5};
    std::string marginType{"ISOLATED"};
    double riskPerTradePct{1.0};
    int maxActiveTrades{3};
    std::string stateFile{"state/positions.json"};
    double reconcileIntervalSec{60.0};
    int snapshotDepth{1000};
    int bookBufferCapacity{1000};
    bool enforceSequence{true};
    double staleBookSec{30.0};
    double refreshIntervalSec{5.0};
    double pendingEntryTimeoutSec{300.0};
    double paperStartingBalance{1000.0};
    std::vector<StrategyConfig> strategies;
};

// Read the JSON file at `path`; an unreadable file yields an empty object.
nlohmann::json loadConfig(const std::string& path);

// Missing keys keep their defaults, malformed strategy entries are skipped.
BotConfig parseBotConfig(const nlohmann::json& cfg);

void printConfig(const BotConfig& config);

#endif // BOT_CONFIG_HPP
