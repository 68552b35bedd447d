#ifndef RECONCILIATION_LOOP_HPP
#define RECONCILIATION_LOOP_HPP

#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>

#include "core/position_store.hpp"

class IExchangeGateway;
class OrderLifecycleCoordinator;

/**
 * Periodically aligns the PositionStore with the exchange's open positions
 * and expires entry orders that never filled.
 */
class ReconciliationLoop {
public:
    ReconciliationLoop(IExchangeGateway* gateway,
                       PositionStore* store,
                       OrderLifecycleCoordinator* coordinator,
                       double intervalSec);
    ~ReconciliationLoop();

    // One pass on the calling thread. False if positions could not be fetched.
    bool runOnce(ReconcileReport* report = nullptr);

    void start();
    void stop();

    // Wake the loop now (e.g. after a user stream reconnect).
    void requestImmediate();

    size_t passes() const { return passes_; }

private:
    void loop();

private:
    IExchangeGateway* gateway_;
    PositionStore* store_;
    OrderLifecycleCoordinator* coordinator_;
    double intervalSec_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool wakeRequested_{false};
    std::atomic<size_t> passes_{0};
};

#endif // RECONCILIATION_LOOP_HPP
