#include "core/position_store.hpp"
#include "exchange/i_exchange_gateway.hpp"

#include <iostream>
#include <fstream>
#include <cstdio>
#include <cmath>
#include <set>
#include <chrono>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

static const double QTY_EPSILON = 1e-12;

static json toJson(const Position& p) {
    json j;
    j["side"]                = toString(p.side);
    j["quantity"]            = p.quantity;
    j["entry_price"]         = p.entryPrice;
    j["stop_loss"]           = p.stopLoss;
    j["take_profit"]         = p.takeProfit;
    j["initial_stop_loss"]   = p.initialStopLoss;
    j["sl_order_id"]         = p.stopLossOrderId;
    j["tp_order_id"]         = p.takeProfitOrderId;
    j["strategy_id"]         = p.strategyId;
    j["opened_at_ms"]        = p.openedAtMs;
    return j;
}

PositionStore::PositionStore(const std::string& stateFile)
    : stateFile_(stateFile)
{
}

bool PositionStore::load() {
    std::lock_guard<std::mutex> lk(mutex_);
    positions_.clear();

    std::ifstream ifs(stateFile_);
    if (!ifs.is_open()) {
        std::cout << "[STORE] No state file " << stateFile_ << ", starting empty.\n";
        return true;
    }

    try {
        json j;
        ifs >> j;
        if (!j.is_object()) {
            std::cerr << "[STORE] " << stateFile_ << " is not an object, starting empty.\n";
            return false;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const json& rec = it.value();
            if (!rec.is_object()) continue;

            Position p;
            p.symbol = it.key();
            if (!parsePositionSide(rec.value("side", std::string()), p.side)) {
                std::cerr << "[STORE] Skipping " << p.symbol << ": unknown side.\n";
                continue;
            }
            p.quantity   = rec.value("quantity", 0.0);
            if (p.quantity <= 0.0) {
                continue;
            }
            p.entryPrice = rec.value("entry_price", 0.0);
            p.stopLoss   = rec.value("stop_loss", 0.0);
            p.takeProfit = rec.value("take_profit", 0.0);
            p.initialStopLoss = rec.value("initial_stop_loss", p.stopLoss);
            // ids may have been written as null
            if (rec.contains("sl_order_id") && rec["sl_order_id"].is_number()) {
                p.stopLossOrderId = rec["sl_order_id"].get<long long>();
            }
            if (rec.contains("tp_order_id") && rec["tp_order_id"].is_number()) {
                p.takeProfitOrderId = rec["tp_order_id"].get<long long>();
            }
            p.strategyId = rec.value("strategy_id", std::string());
            p.openedAtMs = rec.value("opened_at_ms", 0LL);
            positions_[p.symbol] = p;
        }

        std::cout << "[STORE] Loaded " << positions_.size() << " open positions from "
                  << stateFile_ << "\n";
        return true;

    } catch (const json::exception& e) {
        std::cerr << "[STORE] JSON parse error in " << stateFile_ << ": " << e.what()
                  << ". Starting empty.\n";
        positions_.clear();
        return false;
    }
}

bool PositionStore::save() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return saveLocked();
}

bool PositionStore::saveLocked() const {
    json j = json::object();
    for (const auto& kv : positions_) {
        j[kv.first] = toJson(kv.second);
    }

    std::string tmp = stateFile_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[STORE] Could not open " << tmp << " for saving.\n";
            return false;
        }
        ofs << j.dump(4);
        ofs.flush();
        if (!ofs) {
            std::cerr << "[STORE] Write to " << tmp << " failed.\n";
            return false;
        }
    }

    if (std::rename(tmp.c_str(), stateFile_.c_str()) != 0) {
        std::cerr << "[STORE] Could not replace " << stateFile_ << " with " << tmp << "\n";
        return false;
    }
    return true;
}

std::optional<Position> PositionStore::get(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Position> PositionStore::all() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& kv : positions_) out.push_back(kv.second);
    return out;
}

size_t PositionStore::count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return positions_.size();
}

bool PositionStore::has(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return positions_.count(symbol) > 0;
}

bool PositionStore::set(const Position& position) {
    if (position.quantity <= 0.0) {
        std::cerr << "[STORE][" << position.symbol << "] refusing position with quantity "
                  << position.quantity << "\n";
        return false;
    }
    if (position.stopLossOrderId == 0 || position.takeProfitOrderId == 0) {
        std::cerr << "[STORE][" << position.symbol
                  << "] refusing position without both bracket orders\n";
        return false;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    Position& stored = positions_[position.symbol];
    stored = position;
    if (stored.openedAtMs == 0) {
        stored.openedAtMs = (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
    std::cout << "[STORE][" << position.symbol << "] " << toString(position.side)
              << " qty=" << position.quantity << " entry=" << position.entryPrice
              << " SL=" << position.stopLoss << " TP=" << position.takeProfit << "\n";
    saveLocked();
    return true;
}

std::optional<Position> PositionStore::close(const std::string& symbol) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    Position closed = it->second;
    positions_.erase(it);
    std::cout << "[STORE][" << symbol << "] closed\n";
    saveLocked();
    return closed;
}

bool PositionStore::updateBracketOrders(const std::string& symbol,
                                        std::optional<long long> stopLossOrderId,
                                        std::optional<long long> takeProfitOrderId,
                                        std::optional<double> stopLoss,
                                        std::optional<double> takeProfit)
{
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        std::cerr << "[STORE][" << symbol << "] bracket update for unknown position\n";
        return false;
    }
    Position& p = it->second;
    if (stopLossOrderId)   p.stopLossOrderId   = *stopLossOrderId;
    if (takeProfitOrderId) p.takeProfitOrderId = *takeProfitOrderId;
    if (stopLoss)          p.stopLoss          = *stopLoss;
    if (takeProfit)        p.takeProfit        = *takeProfit;
    saveLocked();
    return true;
}

ReconcileReport PositionStore::reconcile(const std::vector<ExchangePosition>& exchangePositions,
                                        long long fetchStartedMs)
{
    ReconcileReport report;
    std::map<std::string, const ExchangePosition*> remote;
    for (const auto& ep : exchangePositions) {
        remote[ep.symbol] = &ep;
    }

    std::lock_guard<std::mutex> lk(mutex_);

    std::set<std::string> symbols;
    for (const auto& kv : positions_) symbols.insert(kv.first);
    for (const auto& kv : remote)     symbols.insert(kv.first);

    for (const auto& symbol : symbols) {
        auto r = remote.find(symbol);
        reconcileLocked(symbol, r == remote.end() ? nullptr : r->second, fetchStartedMs, report);
    }
    saveLocked();
    return report;
}

void PositionStore::reconcileSymbol(const std::string& symbol,
                                    const ExchangePosition* remote,
                                    long long fetchStartedMs,
                                    ReconcileReport& report)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (reconcileLocked(symbol, remote, fetchStartedMs, report)) {
        saveLocked();
    }
}

bool PositionStore::reconcileLocked(const std::string& symbol,
                                    const ExchangePosition* remote,
                                    long long fetchStartedMs,
                                    ReconcileReport& report)
{
    if (remote && remote->quantity <= QTY_EPSILON) {
        remote = nullptr;
    }

    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        if (remote) {
            std::cerr << "[RECON][" << symbol
                      << "] untracked exchange position, not managed by the bot\n";
            report.untracked.push_back(symbol);
        }
        return false;
    }

    Position& local = it->second;
    if (local.openedAtMs >= fetchStartedMs) {
        std::cout << "[RECON][" << symbol << "] opened after the positions were fetched, skipped\n";
        report.skippedInFlight.push_back(symbol);
        return false;
    }

    if (!remote) {
        std::cerr << "[RECON][" << symbol
                  << "] tracked locally but flat on the exchange => removing\n";
        report.removedStale.push_back(symbol);
        positions_.erase(it);
        return true;
    }

    if (remote->side != local.side) {
        std::cerr << "[RECON][" << symbol << "] side mismatch: local "
                  << toString(local.side) << ", exchange " << toString(remote->side)
                  << " => removing\n";
        report.sideMismatch.push_back(symbol);
        positions_.erase(it);
        return true;
    }

    if (std::fabs(remote->quantity - local.quantity) > QTY_EPSILON) {
        std::cerr << "[RECON][" << symbol << "] quantity " << local.quantity
                  << " => " << remote->quantity << "\n";
        local.quantity = remote->quantity;
        report.quantityCorrected.push_back(symbol);
        return true;
    }
    return false;
}

std::vector<std::string> PositionStore::symbols() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> out;
    for (const auto& kv : positions_) out.push_back(kv.first);
    return out;
}

void PositionStore::clearAll() {
    std::lock_guard<std::mutex> lk(mutex_);
    positions_.clear();
    saveLocked();
}
