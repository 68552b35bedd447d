#include <iostream>
#include <thread>
#include <atomic>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <chrono>

#include "core/bot_config.hpp"
#include "core/orderbook_manager.hpp"
#include "core/pending_symbols.hpp"
#include "core/position_store.hpp"
#include "exchange/binance_futures_gateway.hpp"
#include "exchange/paper_gateway.hpp"
#include "exchange/binance_depth_stream.hpp"
#include "exchange/binance_user_stream.hpp"
#include "engine/strategy.hpp"
#include "engine/lifecycle_coordinator.hpp"
#include "engine/trade_monitor.hpp"
#include "engine/reconciliation_loop.hpp"

static std::atomic<bool> g_running{true};

static void onSignal(int) {
    g_running = false;
}

static std::string envOrEmpty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

static void printDashboard(const PositionStore& store,
                           const OrderLifecycleCoordinator& coordinator,
                           const PaperGateway* paper)
{
    std::cout << "\n======== DASHBOARD ========\n";
    std::cout << " Open positions:        " << store.count() << "\n";
    for (const auto& p : store.all()) {
        std::cout << "   " << p.symbol << " " << toString(p.side) << " qty=" << p.quantity
                  << " entry=" << p.entryPrice << " SL=" << p.stopLoss
                  << " TP=" << p.takeProfit << "\n";
    }
    std::cout << " Pending entries:       " << coordinator.pendingEntryCount() << "\n";
    std::cout << " Consistency incidents: " << coordinator.consistencyViolations() << "\n";
    if (paper) {
        std::cout << " Paper balance:         " << paper->walletBalance()
                  << " (realized " << paper->realizedPnl() << ")\n";
    }
    std::cout << "==========================\n";
}

int main(int argc, char** argv) {
    std::string configPath = "config/bot_config.json";
    bool forceLive = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--live") {
            forceLive = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            std::cerr << "usage: " << argv[0] << " [--config <path>] [--live]\n";
            return 1;
        }
    }

    // 1) Config and persisted positions
    BotConfig cfg = parseBotConfig(loadConfig(configPath));
    if (forceLive) cfg.dryRun = false;
    printConfig(cfg);

    PositionStore store(cfg.stateFile);
    store.load();

    // 2) Gateways
    std::string apiKey    = envOrEmpty("BINANCE_API_KEY");
    std::string secretKey = envOrEmpty("BINANCE_API_SECRET");
    if (!cfg.dryRun && (apiKey.empty() || secretKey.empty())) {
        std::cerr << "[MAIN] Live mode needs BINANCE_API_KEY and BINANCE_API_SECRET.\n";
        return 1;
    }
    if (cfg.dryRun) {
        apiKey.clear();
        secretKey.clear();
    }
    BinanceFuturesGateway rest(apiKey, secretKey, cfg.restBaseUrl);

    BookFeedSettings feed;
    feed.snapshotDepth      = cfg.snapshotDepth;
    feed.bufferCapacity     = (size_t)cfg.bookBufferCapacity;
    feed.enforceSequence    = cfg.enforceSequence;
    feed.staleBookSec       = cfg.staleBookSec;
    feed.refreshIntervalSec = cfg.refreshIntervalSec;
    OrderBookManager books(&rest, feed);

    auto bookProvider = [&books](const std::string& symbol) { return books.getOrderBook(symbol); };

    std::unique_ptr<PaperGateway> paper;
    IExchangeGateway* gateway = &rest;
    if (cfg.dryRun) {
        paper = std::make_unique<PaperGateway>(&rest, bookProvider, cfg.paperStartingBalance,
                                               cfg.quoteAsset, cfg.leverage);
        gateway = paper.get();
        books.setUpdateListener([&paper](const std::string& symbol) { paper->onBookUpdate(symbol); });
        std::cout << "[MAIN] DRY RUN: orders fill against the local books.\n";
    } else {
        std::cout << "[MAIN] LIVE trading on " << cfg.restBaseUrl << "\n";
    }

    PendingSymbolTable pending;
    CoordinatorSettings cs;
    cs.quoteAsset             = cfg.quoteAsset;
    cs.leverage               = cfg.leverage;
    cs.riskPerTradePct        = cfg.riskPerTradePct;
    cs.maxActiveTrades        = (size_t)cfg.maxActiveTrades;
    cs.pendingEntryTimeoutSec = cfg.pendingEntryTimeoutSec;
    OrderLifecycleCoordinator coordinator(gateway, &store, &pending, bookProvider, cs);

    // 3) Symbol rules (+ leverage / margin type when live)
    std::string reason;
    if (!rest.loadExchangeInfo(&reason)) {
        std::cerr << "[MAIN] exchangeInfo failed: " << reason << "\n";
        return 1;
    }

    StrategyRegistry registry;
    registerBuiltinStrategies(registry);

    std::vector<std::unique_ptr<IStrategy>> strategies;
    TradeMonitor monitor(&books, &coordinator);

    for (const auto& sc : cfg.strategies) {
        if (!sc.enabled) continue;

        SymbolRules rules;
        if (!rest.getSymbolRules(sc.symbol, rules, &reason)) {
            std::cerr << "[MAIN] " << sc.symbol << " skipped: " << reason << "\n";
            continue;
        }
        if (!cfg.dryRun && !coordinator.hasSymbolRules(sc.symbol)) {
            if (!rest.setLeverage(sc.symbol, cfg.leverage, &reason) ||
                !rest.setMarginType(sc.symbol, cfg.marginType, &reason)) {
                std::cerr << "[MAIN] " << sc.symbol << " setup failed, skipped: " << reason << "\n";
                continue;
            }
        }

        // 4) Strategies
        std::unique_ptr<IStrategy> strategy = registry.create(sc);
        if (!strategy) continue;

        coordinator.setSymbolRules(rules);
        coordinator.registerStrategy(strategy.get());
        books.addSymbol(sc.symbol);
        monitor.addStrategy(strategy.get(), rules.priceTick);
        strategies.push_back(std::move(strategy));
    }

    if (strategies.empty()) {
        std::cerr << "[MAIN] No tradable strategy configured.\n";
        return 1;
    }

    // 5) Reconcile once before anything trades
    ReconciliationLoop recon(gateway, &store, &coordinator, cfg.reconcileIntervalSec);
    recon.runOnce();

    // 6) Threads
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    books.start();
    BinanceDepthStream depth(cfg.wsBaseUrl, &books);
    depth.start();

    auto onOrderUpdate = [&coordinator](const OrderUpdateEvent& ev) { coordinator.onOrderUpdate(ev); };

    std::unique_ptr<BinanceUserStream> userStream;
    if (paper) {
        paper->setOrderUpdateHandler(onOrderUpdate);
        paper->start();
    } else {
        userStream = std::make_unique<BinanceUserStream>(&rest, cfg.wsBaseUrl);
        userStream->setOrderUpdateHandler(onOrderUpdate);
        userStream->setReconnectHandler([&recon]() { recon.requestImmediate(); });
        userStream->start();
    }

    monitor.start();
    recon.start();

    std::cout << "[MAIN] Bot running with " << strategies.size()
              << " strategies. Press Ctrl+C to quit.\n";

    // 7) Dashboard
    auto lastDashboard = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (now - lastDashboard >= std::chrono::seconds(30)) {
            printDashboard(store, coordinator, paper.get());
            lastDashboard = now;
        }
    }

    std::cout << "[MAIN] Shutting down...\n";
    recon.stop();
    monitor.stop();
    if (userStream) userStream->stop();
    if (paper) paper->stop();
    depth.stop();
    books.stop();
    store.save();
    printDashboard(store, coordinator, paper.get());
    return 0;
}
