#include "core/bot_config.hpp"
#include <iostream>
#include <fstream>

nlohmann::json loadConfig(const std::string& path) {
    nlohmann::json j = nlohmann::json::object();
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[CONFIG] Could not open " << path
                  << ", using defaults.\n";
        return j;
    }
    try {
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[CONFIG] Parse error in " << path << ": " << e.what()
                  << ", using defaults.\n";
        return nlohmann::json::object();
    }
    if (!j.is_object()) {
        std::cerr << "[CONFIG] " << path << " is not a JSON object, using defaults.\n";
        return nlohmann::json::object();
    }
    return j;
}

static bool parseStrategy(const nlohmann::json& s, StrategyConfig& out) {
    if (!s.is_object()) return false;
    out.id     = s.value("id", std::string());
    out.name   = s.value("name", std::string());
    out.symbol = s.value("symbol", std::string());
    if (out.name.empty() || out.symbol.empty()) {
        return false;
    }
    if (out.id.empty()) {
        out.id = out.name + "_" + out.symbol;
    }
    out.enabled = s.value("enabled", true);

    std::string type = s.value("entryOrderType", std::string("LIMIT"));
    if (!parseOrderType(type, out.entryOrderType) ||
        (out.entryOrderType != OrderType::LIMIT && out.entryOrderType != OrderType::MARKET)) {
        std::cerr << "[CONFIG] strategy " << out.id << ": entryOrderType " << type
                  << " not supported, using LIMIT\n";
        out.entryOrderType = OrderType::LIMIT;
    }
    out.entryOffsetTicks = s.value("entryOffsetTicks", 0);
    if (s.contains("params") && s["params"].is_object()) {
        out.params = s["params"];
    }
    return true;
}

BotConfig parseBotConfig(const nlohmann::json& cfg) {
    BotConfig c;
    try {
        c.dryRun                 = cfg.value("dryRun", c.dryRun);
        c.restBaseUrl            = cfg.value("restBaseUrl", c.restBaseUrl);
        c.wsBaseUrl              = cfg.value("wsBaseUrl", c.wsBaseUrl);
        c.quoteAsset             = cfg.value("quoteAsset", c.quoteAsset);
        c.leverage               = cfg.value("leverage", c.leverage);
        c.marginType             = cfg.value("marginType", c.marginType);
        c.riskPerTradePct        = cfg.value("riskPerTradePct", c.riskPerTradePct);
        c.maxActiveTrades        = cfg.value("maxActiveTrades", c.maxActiveTrades);
        c.stateFile              = cfg.value("stateFile", c.stateFile);
        c.reconcileIntervalSec   = cfg.value("reconcileIntervalSec", c.reconcileIntervalSec);
        c.snapshotDepth          = cfg.value("snapshotDepth", c.snapshotDepth);
        c.bookBufferCapacity     = cfg.value("bookBufferCapacity", c.bookBufferCapacity);
        c.enforceSequence        = cfg.value("enforceSequence", c.enforceSequence);
        c.staleBookSec           = cfg.value("staleBookSec", c.staleBookSec);
        c.refreshIntervalSec     = cfg.value("refreshIntervalSec", c.refreshIntervalSec);
        c.pendingEntryTimeoutSec = cfg.value("pendingEntryTimeoutSec", c.pendingEntryTimeoutSec);
        c.paperStartingBalance   = cfg.value("paperStartingBalance", c.paperStartingBalance);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[CONFIG] Wrong value type: " << e.what() << "\n";
    }

    if (c.leverage < 1) c.leverage = 1;
    if (c.maxActiveTrades < 1) c.maxActiveTrades = 1;
    if (c.bookBufferCapacity < 1) c.bookBufferCapacity = 1;

    if (cfg.contains("strategies") && cfg["strategies"].is_array()) {
        for (const auto& s : cfg["strategies"]) {
            StrategyConfig sc;
            try {
                if (parseStrategy(s, sc)) {
                    c.strategies.push_back(sc);
                } else {
                    std::cerr << "[CONFIG] Skipping strategy entry without name/symbol\n";
                }
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[CONFIG] Skipping malformed strategy entry: " << e.what() << "\n";
            }
        }
    }
    return c;
}

void printConfig(const BotConfig& c) {
    std::cout << "[CONFIG] dryRun=" << (c.dryRun ? "true" : "false")
              << " rest=" << c.restBaseUrl
              << " ws=" << c.wsBaseUrl
              << " leverage=" << c.leverage
              << " margin=" << c.marginType
              << " risk%=" << c.riskPerTradePct
              << " maxActive=" << c.maxActiveTrades
              << " state=" << c.stateFile << "\n";
    for (const auto& s : c.strategies) {
        std::cout << "[CONFIG]   strategy " << s.id << " (" << s.name << ") on " << s.symbol
                  << (s.enabled ? "" : " [disabled]")
                  << " entry=" << toString(s.entryOrderType)
                  << " offsetTicks=" << s.entryOffsetTicks << "\n";
    }
}
