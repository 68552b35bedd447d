#include "engine/reconciliation_loop.hpp"
#include "engine/lifecycle_coordinator.hpp"
#include "exchange/i_exchange_gateway.hpp"

#include <iostream>
#include <chrono>

static long long nowMs() {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

ReconciliationLoop::ReconciliationLoop(IExchangeGateway* gateway,
                                       PositionStore* store,
                                       OrderLifecycleCoordinator* coordinator,
                                       double intervalSec)
    : gateway_(gateway)
    , store_(store)
    , coordinator_(coordinator)
    , intervalSec_(intervalSec > 0.0 ? intervalSec : 60.0)
{
}

ReconciliationLoop::~ReconciliationLoop() {
    stop();
}

bool ReconciliationLoop::runOnce(ReconcileReport* report) {
    ++passes_;
    bool ok = true;

    // anything opened from here on is newer than the list we are about to get
    long long fetchStartedMs = nowMs();

    std::vector<ExchangePosition> positions;
    std::string reason;
    if (gateway_->getOpenPositions(positions, &reason)) {
        ReconcileReport r = coordinator_
            ? coordinator_->reconcilePositions(positions, fetchStartedMs)
            : store_->reconcile(positions, fetchStartedMs);
        if (report) *report = r;
    } else {
        // without exchange truth nothing tracked locally can be trusted
        std::cerr << "[RECON] Could not fetch positions (" << reason
                  << ") => clearing " << store_->count() << " tracked positions\n";
        store_->clearAll();
        ok = false;
    }

    if (coordinator_) {
        coordinator_->expireStalePendingEntries(std::chrono::steady_clock::now());
    }
    return ok;
}

void ReconciliationLoop::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { loop(); });
}

void ReconciliationLoop::stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void ReconciliationLoop::requestImmediate() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        wakeRequested_ = true;
    }
    cv_.notify_all();
}

void ReconciliationLoop::loop() {
    auto interval = std::chrono::milliseconds((long long)(intervalSec_ * 1000.0));
    while (running_) {
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait_for(lk, interval, [this] { return !running_ || wakeRequested_; });
            wakeRequested_ = false;
        }
        if (!running_) break;

        try {
            runOnce();
        } catch (const std::exception& e) {
            std::cerr << "[RECON] pass failed: " << e.what() << "\n";
        }
    }
}
