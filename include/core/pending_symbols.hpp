#ifndef PENDING_SYMBOLS_HPP
#define PENDING_SYMBOLS_HPP

#include <string>
#include <set>
#include <vector>
#include <mutex>

/**
 * Symbols with an entry order in flight. A symbol stays marked from the
 * moment an entry is decided until its brackets are placed or the entry is
 * abandoned, so two strategies can never open the same symbol twice.
 */
class PendingSymbolTable {
public:
    /**
     * Atomically mark `symbol`. Fails if it is already marked, or if
     * openPositions + marked symbols already reach maxActive.
     */
    bool tryAcquire(const std::string& symbol, size_t openPositions, size_t maxActive);

    void release(const std::string& symbol);

    bool contains(const std::string& symbol) const;
    size_t size() const;
    std::vector<std::string> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> symbols_;
};

#endif // PENDING_SYMBOLS_HPP
