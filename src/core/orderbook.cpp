#include "core/orderbook.hpp"
#include <algorithm>
#include <iostream>

const char* toString(BookState state) {
    switch (state) {
        case BookState::Uninitialized: return "Uninitialized";
        case BookState::Buffering:     return "Buffering";
        case BookState::Synced:        return "Synced";
    }
    return "Uninitialized";
}

OrderBookSynchronizer::OrderBookSynchronizer(const std::string& symbol,
                                             size_t bufferCapacity,
                                             bool enforceSequence)
    : symbol_(symbol)
    , bufferCapacity_(bufferCapacity == 0 ? 1 : bufferCapacity)
    , enforceSequence_(enforceSequence)
{
}

void OrderBookSynchronizer::reset() {
    bids_.clear();
    asks_.clear();
    buffer_.clear();
    lastAppliedId_ = 0;
    awaitingFirstEvent_ = false;
    state_ = BookState::Uninitialized;
}

bool OrderBookSynchronizer::applySnapshot(const DepthSnapshot& snapshot) {
    bids_.clear();
    asks_.clear();
    for (const auto& lvl : snapshot.bids) {
        if (lvl.quantity > 0.0) bids_[lvl.price] = lvl.quantity;
    }
    for (const auto& lvl : snapshot.asks) {
        if (lvl.quantity > 0.0) asks_[lvl.price] = lvl.quantity;
    }
    lastAppliedId_      = snapshot.lastUpdateId;
    awaitingFirstEvent_ = true;
    state_              = BookState::Synced;

    std::cout << "[BOOK][" << symbol_ << "] snapshot lastUpdateId=" << lastAppliedId_
              << " bids=" << bids_.size() << " asks=" << asks_.size()
              << ", replaying " << buffer_.size() << " buffered diffs\n";

    // move the buffer out: applyLive must not see it
    std::deque<DepthUpdate> pending;
    pending.swap(buffer_);

    for (const auto& ev : pending) {
        if (applyLive(ev) == DiffResult::ResyncRequired) {
            std::cerr << "[BOOK][" << symbol_ << "] buffered diff U=" << ev.firstId
                      << " u=" << ev.lastId << " does not follow snapshot => resync\n";
            reset();
            return false;
        }
    }
    return true;
}

DiffResult OrderBookSynchronizer::applyDiff(const DepthUpdate& update) {
    if (state_ != BookState::Synced) {
        if (buffer_.size() >= bufferCapacity_) {
            std::cerr << "[BOOK][" << symbol_ << "] pre-sync buffer full ("
                      << bufferCapacity_ << ") => dropping buffer, resync\n";
            reset();
            buffer_.push_back(update);
            state_ = BookState::Buffering;
            return DiffResult::ResyncRequired;
        }
        buffer_.push_back(update);
        if (state_ == BookState::Uninitialized) {
            state_ = BookState::Buffering;
            return DiffResult::ResyncRequired;
        }
        return DiffResult::Buffered;
    }

    DiffResult res = applyLive(update);
    if (res == DiffResult::ResyncRequired) {
        reset();
        // keep the event that revealed the gap: the next snapshot may cover it
        buffer_.push_back(update);
        state_ = BookState::Buffering;
    }
    return res;
}

DiffResult OrderBookSynchronizer::applyLive(const DepthUpdate& update) {
    if (update.lastId <= lastAppliedId_) {
        return DiffResult::Stale;
    }

    if (awaitingFirstEvent_) {
        // the first event after a snapshot may straddle the snapshot id
        if (enforceSequence_ && update.firstId > lastAppliedId_ + 1) {
            return DiffResult::ResyncRequired;
        }
        awaitingFirstEvent_ = false;
    } else if (enforceSequence_ && hasGap(update)) {
        std::cerr << "[BOOK][" << symbol_ << "] sequence gap: lastApplied=" << lastAppliedId_
                  << " U=" << update.firstId << " u=" << update.lastId
                  << " pu=" << update.prevLastId << "\n";
        return DiffResult::ResyncRequired;
    }

    applyLevels(update);
    lastAppliedId_ = update.lastId;

    if (isCrossed()) {
        std::cerr << "[BOOK][" << symbol_ << "] crossed book after u=" << update.lastId
                  << " bid=" << bids_.begin()->first
                  << " ask=" << asks_.begin()->first << " => resync\n";
        return DiffResult::ResyncRequired;
    }
    return DiffResult::Applied;
}

bool OrderBookSynchronizer::hasGap(const DepthUpdate& update) const {
    if (update.prevLastId >= 0) {
        return update.prevLastId != lastAppliedId_;
    }
    return update.firstId > lastAppliedId_ + 1;
}

void OrderBookSynchronizer::applyLevels(const DepthUpdate& update) {
    for (const auto& lvl : update.bidUpdates) {
        if (lvl.quantity == 0.0) {
            bids_.erase(lvl.price);
        } else if (lvl.quantity > 0.0) {
            bids_[lvl.price] = lvl.quantity;
        }
    }
    for (const auto& lvl : update.askUpdates) {
        if (lvl.quantity == 0.0) {
            asks_.erase(lvl.price);
        } else if (lvl.quantity > 0.0) {
            asks_[lvl.price] = lvl.quantity;
        }
    }
}

bool OrderBookSynchronizer::isCrossed() const {
    if (bids_.empty() || asks_.empty()) return false;
    return bids_.begin()->first >= asks_.begin()->first;
}

std::optional<OrderBookLevel> OrderBookSynchronizer::getBestBid() const {
    if (bids_.empty()) return std::nullopt;
    return OrderBookLevel{bids_.begin()->first, bids_.begin()->second};
}

std::optional<OrderBookLevel> OrderBookSynchronizer::getBestAsk() const {
    if (asks_.empty()) return std::nullopt;
    return OrderBookLevel{asks_.begin()->first, asks_.begin()->second};
}

OrderBookData OrderBookSynchronizer::getDepth(size_t maxLevels) const {
    OrderBookData out;
    out.lastUpdateId = lastAppliedId_;

    size_t nb = (maxLevels == 0 ? bids_.size() : std::min(maxLevels, bids_.size()));
    size_t na = (maxLevels == 0 ? asks_.size() : std::min(maxLevels, asks_.size()));
    out.bids.reserve(nb);
    out.asks.reserve(na);

    for (const auto& kv : bids_) {
        if (out.bids.size() >= nb) break;
        out.bids.push_back({kv.first, kv.second});
    }
    for (const auto& kv : asks_) {
        if (out.asks.size() >= na) break;
        out.asks.push_back({kv.first, kv.second});
    }
    return out;
}
