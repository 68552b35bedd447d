#ifndef ORDERBOOK_HPP
#define ORDERBOOK_HPP

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <optional>
#include <functional>
#include <cstddef>

struct OrderBookLevel {
    double price;
    double quantity;
};

// Copy of a book handed to strategies and the coordinator.
struct OrderBookData {
    std::vector<OrderBookLevel> bids; // sorted descending
    std::vector<OrderBookLevel> asks; // sorted ascending
    long long lastUpdateId{0};
};

// REST depth snapshot
struct DepthSnapshot {
    long long lastUpdateId{0};
    std::vector<OrderBookLevel> bids;
    std::vector<OrderBookLevel> asks;
};

// One diff event from the depth stream
struct DepthUpdate {
    long long firstId{0};      // U
    long long lastId{0};       // u
    long long prevLastId{-1};  // pu, -1 when the venue does not send it
    std::vector<OrderBookLevel> bidUpdates;
    std::vector<OrderBookLevel> askUpdates;
};

enum class BookState { Uninitialized, Buffering, Synced };

enum class DiffResult {
    Applied,        // book changed
    Buffered,       // held until the snapshot arrives
    Stale,          // already covered by lastAppliedId
    ResyncRequired  // a (fresh) snapshot must be fetched
};

const char* toString(BookState state);

/**
 * Local replica of one symbol's depth, built from a REST snapshot plus the
 * sequenced diff stream.
 *
 * Not thread-safe: the owner (OrderBookManager) serializes access.
 */
class OrderBookSynchronizer {
public:
    explicit OrderBookSynchronizer(const std::string& symbol,
                                   size_t bufferCapacity = 1000,
                                   bool enforceSequence = true);

    /**
     * Replace both sides with the snapshot, then replay buffered diffs.
     * @return false if the buffered diffs cannot be stitched onto the snapshot
     *         (the book is reset and a newer snapshot is needed).
     */
    bool applySnapshot(const DepthSnapshot& snapshot);

    DiffResult applyDiff(const DepthUpdate& update);

    std::optional<OrderBookLevel> getBestBid() const;
    std::optional<OrderBookLevel> getBestAsk() const;

    // maxLevels == 0 => every level
    OrderBookData getDepth(size_t maxLevels = 0) const;

    BookState state() const { return state_; }
    long long lastAppliedId() const { return lastAppliedId_; }
    size_t bufferedCount() const { return buffer_.size(); }
    const std::string& symbol() const { return symbol_; }

    // Back to Uninitialized: clears both sides and the buffer.
    void reset();

private:
    DiffResult applyLive(const DepthUpdate& update);
    bool hasGap(const DepthUpdate& update) const;
    void applyLevels(const DepthUpdate& update);
    bool isCrossed() const;

private:
    std::string symbol_;
    size_t bufferCapacity_;
    bool enforceSequence_;

    std::map<double, double, std::greater<double>> bids_;
    std::map<double, double> asks_;

    long long lastAppliedId_{0};
    BookState state_{BookState::Uninitialized};
    bool awaitingFirstEvent_{false};

    std::deque<DepthUpdate> buffer_;
};

#endif // ORDERBOOK_HPP
