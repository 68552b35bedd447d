#include "core/orderbook_manager.hpp"
#include "exchange/i_exchange_gateway.hpp"
#include <iostream>
#include <algorithm>

static const int MAX_RESYNC_BACKOFF_SEC = 30;

OrderBookManager::OrderBookManager(IExchangeGateway* gateway, const BookFeedSettings& settings)
    : gateway_(gateway)
    , settings_(settings)
{
}

OrderBookManager::~OrderBookManager() {
    stop();
}

void OrderBookManager::addSymbol(const std::string& symbol) {
    std::lock_guard<std::mutex> lk(booksMutex_);
    if (books_.count(symbol)) return;
    books_[symbol] = std::make_unique<SymbolBook>(symbol,
                                                  settings_.bufferCapacity,
                                                  settings_.enforceSequence);
}

std::vector<std::string> OrderBookManager::symbols() const {
    std::lock_guard<std::mutex> lk(booksMutex_);
    std::vector<std::string> out;
    out.reserve(books_.size());
    for (auto& kv : books_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

OrderBookManager::SymbolBook* OrderBookManager::find(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(booksMutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) return nullptr;
    return it->second.get();
}

void OrderBookManager::setUpdateListener(std::function<void(const std::string&)> listener) {
    updateListener_ = std::move(listener);
}

void OrderBookManager::start() {
    if (running_.exchange(true)) return;
    resyncThread_  = std::thread([this]() { resyncWorkerLoop(); });
    refreshThread_ = std::thread([this]() { refreshLoop(); });
    std::cout << "[BOOK] Manager started for " << symbols().size() << " symbols.\n";
}

void OrderBookManager::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lk(resyncMutex_);
        resyncCv_.notify_all();
    }
    {
        std::lock_guard<std::mutex> lk(sleepMutex_);
        sleepCv_.notify_all();
    }
    if (resyncThread_.joinable())  resyncThread_.join();
    if (refreshThread_.joinable()) refreshThread_.join();

    std::lock_guard<std::mutex> lk(booksMutex_);
    for (auto& kv : books_) {
        kv.second->signal.shutdown();
    }
}

DiffResult OrderBookManager::onDepthUpdate(const std::string& symbol, const DepthUpdate& update) {
    SymbolBook* book = find(symbol);
    if (!book) {
        return DiffResult::Stale;
    }

    DiffResult res;
    {
        std::lock_guard<std::mutex> lk(book->mutex);
        res = book->sync.applyDiff(update);
        book->lastMsgTime  = std::chrono::steady_clock::now();
        book->everReceived = true;
    }

    if (res == DiffResult::Applied) {
        book->signal.notify();
        if (updateListener_) {
            updateListener_(symbol);
        }
    } else if (res == DiffResult::ResyncRequired) {
        requestResync(symbol);
    }
    return res;
}

void OrderBookManager::requestResync(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lk(resyncMutex_);
        if (!resyncQueued_.insert(symbol).second) {
            return; // already queued
        }
        resyncQueue_.push_back(symbol);
    }
    resyncCv_.notify_one();
}

void OrderBookManager::resetSymbols(const std::vector<std::string>& syms) {
    size_t n = 0;
    for (const auto& symbol : syms) {
        SymbolBook* book = find(symbol);
        if (!book) continue;
        std::lock_guard<std::mutex> lk(book->mutex);
        book->sync.reset();
        ++n;
    }
    // the next diff per symbol re-requests a snapshot
    std::cout << "[BOOK] Reset " << n << " books after stream (re)connect.\n";
}

void OrderBookManager::resetAll() {
    resetSymbols(symbols());
}

bool OrderBookManager::resyncNow(const std::string& symbol) {
    SymbolBook* book = find(symbol);
    if (!book || !gateway_) {
        return false;
    }

    DepthSnapshot snap;
    std::string reason;
    if (!gateway_->getOrderBookSnapshot(symbol, settings_.snapshotDepth, snap, &reason)) {
        std::cerr << "[BOOK][" << symbol << "] snapshot fetch failed: " << reason << "\n";
        return false;
    }

    bool ok;
    {
        std::lock_guard<std::mutex> lk(book->mutex);
        ok = book->sync.applySnapshot(snap);
    }
    if (ok) {
        std::cout << "[BOOK][" << symbol << "] synchronized at id=" << snap.lastUpdateId << "\n";
        book->signal.notify();
    }
    return ok;
}

bool OrderBookManager::takeReadyResyncLocked(std::string& symbol) {
    auto now = std::chrono::steady_clock::now();
    for (auto it = resyncQueue_.begin(); it != resyncQueue_.end(); ++it) {
        auto nb = resyncNotBefore_.find(*it);
        if (nb != resyncNotBefore_.end() && nb->second > now) {
            continue; // still backing off
        }
        symbol = *it;
        resyncQueue_.erase(it);
        resyncQueued_.erase(symbol);
        resyncNotBefore_.erase(symbol);
        return true;
    }
    return false;
}

std::optional<std::chrono::steady_clock::time_point> OrderBookManager::nextResyncDueLocked() const {
    std::optional<std::chrono::steady_clock::time_point> next;
    for (const auto& symbol : resyncQueue_) {
        auto nb = resyncNotBefore_.find(symbol);
        if (nb == resyncNotBefore_.end()) continue;
        if (!next || nb->second < *next) next = nb->second;
    }
    return next;
}

void OrderBookManager::resyncWorkerLoop() {
    std::unordered_map<std::string, int> backoff;

    while (running_) {
        std::string symbol;
        {
            std::unique_lock<std::mutex> lk(resyncMutex_);
            while (running_ && !takeReadyResyncLocked(symbol)) {
                auto due = nextResyncDueLocked();
                if (due) {
                    resyncCv_.wait_until(lk, *due);
                } else {
                    resyncCv_.wait(lk);
                }
            }
            if (!running_) break;
        }

        bool ok = false;
        try {
            ok = resyncNow(symbol);
        } catch (const std::exception& e) {
            std::cerr << "[BOOK][" << symbol << "] resync error: " << e.what() << "\n";
        }

        if (ok) {
            backoff.erase(symbol);
            continue;
        }

        // retry later without holding up the other symbols
        int wait = backoff.count(symbol) ? backoff[symbol] : 1;
        backoff[symbol] = std::min(wait * 2, MAX_RESYNC_BACKOFF_SEC);
        {
            std::lock_guard<std::mutex> lk(resyncMutex_);
            resyncNotBefore_[symbol] = std::chrono::steady_clock::now() + std::chrono::seconds(wait);
        }
        requestResync(symbol);
    }
}

void OrderBookManager::refreshLoop() {
    auto interval = std::chrono::milliseconds((long long)(settings_.refreshIntervalSec * 1000.0));
    if (interval.count() <= 0) interval = std::chrono::milliseconds(1000);

    while (running_) {
        {
            std::unique_lock<std::mutex> lk(sleepMutex_);
            sleepCv_.wait_for(lk, interval, [this] { return !running_; });
        }
        if (!running_) break;

        for (const auto& symbol : symbols()) {
            SymbolBook* book = find(symbol);
            if (!book) continue;

            bool needResync = false;
            {
                std::lock_guard<std::mutex> lk(book->mutex);
                auto now = std::chrono::steady_clock::now();
                double quietSec = book->everReceived
                    ? std::chrono::duration<double>(now - book->lastMsgTime).count()
                    : 0.0;

                if (book->sync.state() == BookState::Synced && quietSec > settings_.staleBookSec) {
                    std::cerr << "[BOOK][" << symbol << "] no depth for " << quietSec
                              << "s => resync\n";
                    book->sync.reset();
                    needResync = true;
                } else if (book->sync.state() == BookState::Buffering) {
                    // covers a lost resync request
                    needResync = true;
                }
            }
            if (needResync) {
                requestResync(symbol);
            }
        }
    }
}

OrderBookData OrderBookManager::getOrderBook(const std::string& symbol, size_t maxLevels) const {
    SymbolBook* book = find(symbol);
    if (!book) return OrderBookData{};
    std::lock_guard<std::mutex> lk(book->mutex);
    if (book->sync.state() != BookState::Synced) {
        return OrderBookData{};
    }
    return book->sync.getDepth(maxLevels);
}

bool OrderBookManager::isSynced(const std::string& symbol) const {
    return state(symbol) == BookState::Synced;
}

BookState OrderBookManager::state(const std::string& symbol) const {
    SymbolBook* book = find(symbol);
    if (!book) return BookState::Uninitialized;
    std::lock_guard<std::mutex> lk(book->mutex);
    return book->sync.state();
}

bool OrderBookManager::isStale(const std::string& symbol, double maxStaleMs) const {
    SymbolBook* book = find(symbol);
    if (!book) return true;
    std::lock_guard<std::mutex> lk(book->mutex);
    if (!book->everReceived) {
        return true;
    }
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double, std::milli>(now - book->lastMsgTime).count();
    return elapsed > maxStaleMs;
}

bool OrderBookManager::waitForUpdate(const std::string& symbol,
                                     uint64_t& lastSeen,
                                     std::chrono::milliseconds timeout)
{
    SymbolBook* book = find(symbol);
    if (!book) return false;
    return book->signal.waitFor(lastSeen, timeout);
}

uint64_t OrderBookManager::updateGeneration(const std::string& symbol) const {
    SymbolBook* book = find(symbol);
    return book ? book->signal.generation() : 0;
}
