#ifndef FAKE_GATEWAY_HPP
#define FAKE_GATEWAY_HPP

#include <map>
#include <atomic>
#include <set>
#include <deque>
#include <mutex>
#include <vector>
#include <string>

#include "exchange/i_exchange_gateway.hpp"

// Scriptable in-memory exchange. Every call is recorded; order results can
// be queued per order type, otherwise orders are accepted with increasing ids.
class FakeGateway : public IExchangeGateway {
public:
    bool getOrderBookSnapshot(const std::string& symbol, int, DepthSnapshot& out,
                              std::string* failReason = nullptr) override {
        std::lock_guard<std::mutex> lk(mutex);
        ++snapshotCalls;
        auto it = snapshots.find(symbol);
        if (!snapshotOk || it == snapshots.end()) {
            if (failReason) *failReason = "snapshot unavailable";
            return false;
        }
        out = it->second;
        return true;
    }

    OrderResult createOrder(const OrderRequest& request) override {
        std::lock_guard<std::mutex> lk(mutex);
        created.push_back(request);
        auto& queue = scripted[request.type];
        if (!queue.empty()) {
            OrderResult r = queue.front();
            queue.pop_front();
            if (r.success && r.orderId == 0) r.orderId = nextOrderId++;
            r.clientOrderId = request.clientOrderId;
            return r;
        }
        OrderResult r;
        r.success = true;
        r.orderId = nextOrderId++;
        r.clientOrderId = request.clientOrderId;
        r.status = "NEW";
        return r;
    }

    OrderResult cancelOrder(const std::string&, long long orderId) override {
        std::lock_guard<std::mutex> lk(mutex);
        cancelled.push_back(orderId);
        if (unknownOrders.count(orderId)) {
            return failure(ExchangeErrorKind::OrderNotFound, -2011, "Unknown order sent.");
        }
        if (failingCancels.count(orderId)) {
            return failure(ExchangeErrorKind::Transient, -1001, "Internal error");
        }
        OrderResult r;
        r.success = true;
        r.orderId = orderId;
        r.status = "CANCELED";
        return r;
    }

    OrderResult cancelAllOpenOrders(const std::string& symbol) override {
        std::lock_guard<std::mutex> lk(mutex);
        cancelAllCalls.push_back(symbol);
        OrderResult r;
        r.success = true;
        return r;
    }

    bool getAccountBalance(const std::string&, double& out,
                           std::string* failReason = nullptr) override {
        std::lock_guard<std::mutex> lk(mutex);
        if (!balanceOk) {
            if (failReason) *failReason = "balance unavailable";
            return false;
        }
        out = balance;
        return true;
    }

    bool getOpenPositions(std::vector<ExchangePosition>& out,
                          std::string* failReason = nullptr) override {
        std::lock_guard<std::mutex> lk(mutex);
        if (!positionsOk) {
            if (failReason) *failReason = "connection refused";
            return false;
        }
        out = positions;
        return true;
    }

    bool getSymbolRules(const std::string& symbol, SymbolRules& out,
                        std::string* failReason = nullptr) override {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = rules.find(symbol);
        if (it == rules.end()) {
            if (failReason) *failReason = "unknown symbol";
            return false;
        }
        out = it->second;
        return true;
    }

    static OrderResult failure(ExchangeErrorKind kind, int code, const std::string& msg) {
        OrderResult r;
        r.success = false;
        r.error = kind;
        r.code = code;
        r.message = msg;
        return r;
    }

    void queueResult(OrderType type, const OrderResult& result) {
        std::lock_guard<std::mutex> lk(mutex);
        scripted[type].push_back(result);
    }

    std::vector<OrderRequest> createdOfType(OrderType type) {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<OrderRequest> out;
        for (const auto& r : created) {
            if (r.type == type) out.push_back(r);
        }
        return out;
    }

    bool wasCancelled(long long orderId) {
        std::lock_guard<std::mutex> lk(mutex);
        for (long long id : cancelled) {
            if (id == orderId) return true;
        }
        return false;
    }

    std::mutex mutex;

    std::vector<OrderRequest> created;
    std::vector<long long> cancelled;
    std::vector<std::string> cancelAllCalls;
    std::map<OrderType, std::deque<OrderResult>> scripted;
    std::set<long long> unknownOrders;
    std::set<long long> failingCancels;
    long long nextOrderId{1};

    double balance{1000.0};
    bool balanceOk{true};

    std::vector<ExchangePosition> positions;
    bool positionsOk{true};

    std::map<std::string, DepthSnapshot> snapshots;
    bool snapshotOk{true};
    std::atomic<int> snapshotCalls{0};

    std::map<std::string, SymbolRules> rules;
};

#endif // FAKE_GATEWAY_HPP
